// vnm_flatland renderer tests (render sequence, toggles, lazy allocation)

#include "test_fakes.h"

#include <vnm_flatland/core/flatlander.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fl = vnm::flatland;

namespace {

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " (line " << __LINE__ << ")" << std::endl; \
            return false; \
        } \
    } while (0)

#define RUN_TEST(test_fn) \
    do { \
        std::cout << "Running " << #test_fn << "... "; \
        if (test_fn()) { \
            std::cout << "OK" << std::endl; \
            ++passed; \
        } else { \
            std::cout << "FAIL" << std::endl; \
            ++failed; \
        } \
    } while (0)

const fl::color_t k_white{255, 255, 255, 255};

struct rig_t
{
    std::shared_ptr<fakes::gpu_log_t>    gpu    = std::make_shared<fakes::gpu_log_t>();
    std::shared_ptr<fakes::render_log_t> render = std::make_shared<fakes::render_log_t>();
    std::vector<std::string>             errors;
    std::unique_ptr<fl::Flatlander>      flatlander;
};

// Builds a Flatlander wired to recording fakes.
std::unique_ptr<rig_t> make_rig(bool has_view_projection = true, bool base_instance = true)
{
    auto rig = std::make_unique<rig_t>();

    fl::Flatlander::collaborators_t collaborators;
    collaborators.program  = std::make_unique<fakes::Recording_program>(rig->render, has_view_projection);
    collaborators.target   = std::make_unique<fakes::Recording_target>(rig->render);
    collaborators.dispatch = std::make_unique<fakes::Recording_dispatch>(rig->render, base_instance);
    collaborators.buffer_factory = fakes::recording_factory(rig->gpu);

    auto config = fl::Flatland_config::make_default();
    rig_t* raw = rig.get();
    config.log_error = [raw](const std::string& msg) { raw->errors.push_back(msg); };

    rig->flatlander = std::make_unique<fl::Flatlander>(std::move(collaborators), std::move(config));
    return rig;
}

std::vector<fl::vertex_t> quad_vertices()
{
    return {{{0.0f, 0.0f}}, {{1.0f, 0.0f}}, {{1.0f, 1.0f}}, {{0.0f, 1.0f}}};
}

std::vector<fl::index_t> quad_indices()
{
    return {0, 1, 2, 0, 2, 3};
}

bool test_render_without_content_is_noop()
{
    auto rig = make_rig();
    rig->flatlander->render(glm::mat4(1.0f));

    TEST_ASSERT(rig->render->calls.empty(), "no render state should be touched");
    TEST_ASSERT(rig->gpu->backends_created == 0, "no buffers should be allocated");
    TEST_ASSERT(!rig->flatlander->stage().has_buffers(), "stage should have no buffers");
    return true;
}

bool test_render_sequence()
{
    auto rig = make_rig();
    fl::Alphabet a = rig->flatlander->create_alphabet();
    a.add_entry(1, quad_vertices(), quad_indices());
    fl::Flatland_group g(glm::mat4(1.0f), k_white, a, {{0, 10, 20}});

    const glm::mat4 vp(5.0f);
    rig->flatlander->render(vp);

    const std::vector<std::string> expected = {
        "set_used", "set_uniform_3", "blend", "cw", "draw", "ccw"
    };
    TEST_ASSERT(rig->render->calls == expected, "render call order mismatch");
    TEST_ASSERT(rig->render->matrices.size() == 1 && rig->render->matrices[0] == vp,
        "view projection should be uploaded");
    TEST_ASSERT(rig->gpu->binds == 1 && rig->gpu->unbinds == 1, "buffers should be bound for the draw");
    TEST_ASSERT(rig->render->drawn_command_counts.size() == 1
        && rig->render->drawn_command_counts[0] == 1, "dispatch should see one command");
    return true;
}

bool test_wireframe_restores_fill()
{
    auto rig = make_rig();
    fl::Alphabet a = rig->flatlander->create_alphabet();
    a.add_entry(1, quad_vertices(), quad_indices());
    fl::Flatland_group g(glm::mat4(1.0f), k_white, a, {{0, 0, 0}});

    rig->flatlander->toggle_wireframe();
    TEST_ASSERT(rig->flatlander->wireframe(), "wireframe should be on");
    rig->flatlander->render(glm::mat4(1.0f));

    const std::vector<std::string> expected = {
        "set_used", "set_uniform_3", "blend", "cw", "line", "draw", "fill", "ccw"
    };
    TEST_ASSERT(rig->render->calls == expected, "wireframe call order mismatch");
    return true;
}

bool test_disabled_render_has_no_side_effects()
{
    auto rig = make_rig();
    fl::Alphabet a = rig->flatlander->create_alphabet();
    a.add_entry(1, quad_vertices(), quad_indices());
    fl::Flatland_group g(glm::mat4(1.0f), k_white, a, {{0, 0, 0}});

    rig->flatlander->toggle();
    TEST_ASSERT(!rig->flatlander->draw_enabled(), "drawing should be disabled");
    rig->flatlander->render(glm::mat4(1.0f));

    TEST_ASSERT(rig->render->calls.empty(), "disabled render must not touch render state");
    TEST_ASSERT(rig->gpu->backends_created == 0, "disabled render must not allocate");
    TEST_ASSERT(rig->gpu->total_uploads() == 0, "disabled render must not upload");

    const auto& flatland = rig->flatlander->flatland();
    TEST_ASSERT(flatland->alphabets_invalidated() && flatland->groups_invalidated()
        && flatland->draw_invalidated(), "pending changes should stay pending");

    rig->flatlander->toggle();
    rig->flatlander->render(glm::mat4(1.0f));
    TEST_ASSERT(rig->render->count("draw") == 1, "re-enabled render should draw");
    TEST_ASSERT(rig->flatlander->stage().command_count() == 1, "pending changes should be resolved");
    return true;
}

bool test_toggles_are_involutions()
{
    auto rig = make_rig();
    fl::Flatlander& flatlander = *rig->flatlander;

    TEST_ASSERT(flatlander.draw_enabled() && !flatlander.wireframe(), "initial state mismatch");

    flatlander.toggle();
    flatlander.toggle();
    TEST_ASSERT(flatlander.draw_enabled(), "two toggles should restore drawing");

    flatlander.toggle_wireframe();
    flatlander.toggle_wireframe();
    TEST_ASSERT(!flatlander.wireframe(), "two wireframe toggles should restore fill");

    TEST_ASSERT(rig->render->calls.empty(), "toggles must not touch render state");
    return true;
}

bool test_missing_uniform_is_skipped()
{
    auto rig = make_rig(false);
    fl::Alphabet a = rig->flatlander->create_alphabet();
    a.add_entry(1, quad_vertices(), quad_indices());
    fl::Flatland_group g(glm::mat4(1.0f), k_white, a, {{0, 0, 0}});

    rig->flatlander->render(glm::mat4(1.0f));
    TEST_ASSERT(rig->render->matrices.empty(), "no uniform should be set");
    TEST_ASSERT(rig->render->count("draw") == 1, "drawing should go on without the uniform");
    return true;
}

bool test_dispatch_sees_current_command_count()
{
    auto rig = make_rig();
    fl::Alphabet a = rig->flatlander->create_alphabet();
    a.add_entry(1, quad_vertices(), quad_indices());

    std::vector<fl::Flatland_group> groups;
    for (int i = 0; i < 3; ++i) {
        groups.emplace_back(glm::mat4(1.0f), k_white, a, std::vector<fl::Flatland_item>{{0, i, 0}});
    }
    rig->flatlander->render(glm::mat4(1.0f));

    groups.erase(groups.begin());
    rig->flatlander->render(glm::mat4(1.0f));

    const auto& counts = rig->render->drawn_command_counts;
    TEST_ASSERT(counts.size() == 2, "two frames should be drawn");
    TEST_ASSERT(counts[0] == 3, "three groups should give three commands");
    TEST_ASSERT(counts[1] == 2, "deleted group should drop its command");
    return true;
}

bool test_stage_follows_dispatch_base_instance()
{
    auto with = make_rig(true, true);
    auto without = make_rig(true, false);
    TEST_ASSERT(with->flatlander->stage().uses_base_instance(), "stage should use base instance");
    TEST_ASSERT(!without->flatlander->stage().uses_base_instance(), "stage should not use base instance");
    return true;
}

bool test_contract_violations_are_logged()
{
    auto rig = make_rig();
    fl::Alphabet a = rig->flatlander->create_alphabet();
    a.add_entry(1, quad_vertices(), quad_indices());

    TEST_ASSERT(!a.add_entry(1, quad_vertices(), quad_indices()), "duplicate id should be rejected");
    TEST_ASSERT(rig->errors.size() == 1, "configured error callback should be used");
    return true;
}

bool test_handles_outlive_renderer()
{
    auto rig = make_rig();
    fl::Alphabet a = rig->flatlander->create_alphabet();
    fl::Flatland_group g(glm::mat4(1.0f), k_white, a, {});

    rig->flatlander.reset();

    TEST_ASSERT(a.ref_count() == 2, "registry should outlive the renderer");
    g.release();
    TEST_ASSERT(a.ref_count() == 1, "group release should still work");
    return true;
}

std::vector<fl::vertex_t> triangle_vertices()
{
    return {{{0.0f, 0.0f}}, {{1.0f, 0.0f}}, {{0.0f, 1.0f}}};
}

bool test_failed_index_upload_skips_draw()
{
    auto rig = make_rig();
    fl::Alphabet x = rig->flatlander->create_alphabet();
    x.add_entry(1, triangle_vertices(), {0, 1, 2});
    fl::Alphabet a = rig->flatlander->create_alphabet();
    a.add_entry(1, quad_vertices(), quad_indices());
    fl::Flatland_group g(glm::mat4(1.0f), k_white, a, {{0, 0, 0}});

    rig->flatlander->render(glm::mat4(1.0f));
    TEST_ASSERT(rig->render->count("draw") == 1, "first frame should draw");
    TEST_ASSERT(rig->flatlander->stage().commands()[0].base_vertex == 3,
        "group's alphabet should start after the first one");

    // Moves the group's alphabet to vertex 0; vertices upload, indices fail.
    x.release();
    a.add_entry(2, triangle_vertices(), {0, 1, 2});
    rig->gpu->fail_next_indices = true;
    rig->render->calls.clear();
    const int binds = rig->gpu->binds;

    rig->flatlander->render(glm::mat4(1.0f));
    TEST_ASSERT(rig->render->calls.empty(), "frame with a failed upload must not draw");
    TEST_ASSERT(rig->gpu->binds == binds, "frame with a failed upload must not bind");
    TEST_ASSERT(rig->flatlander->flatland()->alphabets_invalidated(), "geometry should stay dirty");

    rig->flatlander->render(glm::mat4(1.0f));
    TEST_ASSERT(rig->render->count("draw") == 1, "retry frame should draw");
    TEST_ASSERT(rig->flatlander->stage().commands()[0].base_vertex == 0,
        "commands should follow the new layout");
    return true;
}

bool test_failed_instance_upload_skips_draw()
{
    auto rig = make_rig();
    fl::Alphabet a = rig->flatlander->create_alphabet();
    a.add_entry(1, quad_vertices(), quad_indices());
    fl::Flatland_group g(glm::mat4(1.0f), k_white, a, {{0, 0, 0}});
    rig->flatlander->render(glm::mat4(1.0f));

    g.update_items({{0, 0, 0}, {0, 8, 0}});
    rig->gpu->fail_next_instances = true;
    rig->render->calls.clear();

    rig->flatlander->render(glm::mat4(1.0f));
    TEST_ASSERT(rig->render->calls.empty(), "stale commands must not be drawn");

    rig->flatlander->render(glm::mat4(1.0f));
    TEST_ASSERT(rig->render->count("draw") == 1, "retry frame should draw");
    TEST_ASSERT(rig->flatlander->stage().commands()[0].instance_count == 2,
        "retry should draw the new items");
    return true;
}

bool test_failed_command_upload_skips_draw()
{
    auto rig = make_rig();
    fl::Alphabet a = rig->flatlander->create_alphabet();
    a.add_entry(1, quad_vertices(), quad_indices());
    fl::Flatland_group g(glm::mat4(1.0f), k_white, a, {{0, 0, 0}});

    rig->gpu->fail_next_commands = true;
    rig->flatlander->render(glm::mat4(1.0f));
    TEST_ASSERT(rig->render->calls.empty(), "no draw without uploaded commands");

    rig->flatlander->render(glm::mat4(1.0f));
    TEST_ASSERT(rig->render->count("draw") == 1, "retry frame should draw");
    return true;
}

} // namespace

int main()
{
    std::cout << "Flatlander tests" << std::endl;

    int passed = 0;
    int failed = 0;

    RUN_TEST(test_render_without_content_is_noop);
    RUN_TEST(test_render_sequence);
    RUN_TEST(test_wireframe_restores_fill);
    RUN_TEST(test_disabled_render_has_no_side_effects);
    RUN_TEST(test_toggles_are_involutions);
    RUN_TEST(test_missing_uniform_is_skipped);
    RUN_TEST(test_dispatch_sees_current_command_count);
    RUN_TEST(test_stage_follows_dispatch_base_instance);
    RUN_TEST(test_contract_violations_are_logged);
    RUN_TEST(test_handles_outlive_renderer);
    RUN_TEST(test_failed_index_upload_skips_draw);
    RUN_TEST(test_failed_instance_upload_skips_draw);
    RUN_TEST(test_failed_command_upload_skips_draw);

    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;
    return failed > 0 ? 1 : 0;
}

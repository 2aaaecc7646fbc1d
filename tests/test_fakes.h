#pragma once
// Recording fakes for the render interfaces, shared by the tests.

#include <vnm_flatland/core/buffer_stage.h>
#include <vnm_flatland/core/render_interfaces.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fakes {

namespace fl = vnm::flatland;

// Everything the GPU side was asked to do. Shared between the test and the
// backend, since the Buffer_stage owns the backend.
struct gpu_log_t
{
    int backends_created = 0;

    int vertex_uploads   = 0;
    int index_uploads    = 0;
    int instance_uploads = 0;
    int command_uploads  = 0;

    std::vector<fl::vertex_t>            vertices;
    std::vector<fl::index_t>             indices;
    std::vector<fl::item_instance_t>     instances;
    std::vector<fl::draw_indirect_cmd_t> commands;

    int binds   = 0;
    int unbinds = 0;
    std::vector<std::size_t> instance_offsets;

    // Draw-time calls in order: "offset N", "draw N", "multi N".
    std::vector<std::string> draw_calls;

    // Set to make the next upload of that kind fail once.
    bool fail_next_vertices  = false;
    bool fail_next_indices   = false;
    bool fail_next_instances = false;
    bool fail_next_commands  = false;

    [[nodiscard]] int total_uploads() const
    {
        return vertex_uploads + index_uploads + instance_uploads + command_uploads;
    }
};

class Recording_backend final : public fl::Gpu_buffer_backend
{
public:
    explicit Recording_backend(std::shared_ptr<gpu_log_t> log)
        : m_log(std::move(log))
    {
        ++m_log->backends_created;
    }

    bool upload_vertices(const std::vector<fl::vertex_t>& vertices) override
    {
        if (m_log->fail_next_vertices) {
            m_log->fail_next_vertices = false;
            return false;
        }
        ++m_log->vertex_uploads;
        m_log->vertices = vertices;
        return true;
    }

    bool upload_indices(const std::vector<fl::index_t>& indices) override
    {
        if (m_log->fail_next_indices) {
            m_log->fail_next_indices = false;
            return false;
        }
        ++m_log->index_uploads;
        m_log->indices = indices;
        return true;
    }

    bool upload_instances(const std::vector<fl::item_instance_t>& instances) override
    {
        if (m_log->fail_next_instances) {
            m_log->fail_next_instances = false;
            return false;
        }
        ++m_log->instance_uploads;
        m_log->instances = instances;
        return true;
    }

    bool upload_draw_commands(const std::vector<fl::draw_indirect_cmd_t>& commands) override
    {
        if (m_log->fail_next_commands) {
            m_log->fail_next_commands = false;
            return false;
        }
        ++m_log->command_uploads;
        m_log->commands = commands;
        return true;
    }

    void bind() override { ++m_log->binds; }
    void unbind() override { ++m_log->unbinds; }

    void bind_instance_offset(std::size_t first_instance) override
    {
        m_log->instance_offsets.push_back(first_instance);
        m_log->draw_calls.push_back("offset " + std::to_string(first_instance));
    }

    void multi_draw_indirect(std::size_t command_count) override
    {
        m_log->draw_calls.push_back("multi " + std::to_string(command_count));
    }

    void draw_indirect(std::size_t command_index) override
    {
        m_log->draw_calls.push_back("draw " + std::to_string(command_index));
    }

private:
    std::shared_ptr<gpu_log_t> m_log;
};

inline fl::Buffer_stage::Backend_factory recording_factory(const std::shared_ptr<gpu_log_t>& log)
{
    return [log]() -> std::unique_ptr<fl::Gpu_buffer_backend> {
        return std::make_unique<Recording_backend>(log);
    };
}

// Ordered record of every render-state call.
struct render_log_t
{
    std::vector<std::string> calls;
    std::vector<glm::mat4>   matrices;
    std::vector<std::size_t> drawn_command_counts;

    [[nodiscard]] int count(const std::string& call) const
    {
        int n = 0;
        for (const auto& c : calls) {
            if (c == call) {
                ++n;
            }
        }
        return n;
    }
};

class Recording_program final : public fl::Shader_program
{
public:
    Recording_program(std::shared_ptr<render_log_t> log, bool has_view_projection)
        : m_log(std::move(log))
        , m_has_view_projection(has_view_projection)
    {
    }

    void set_used() override { m_log->calls.push_back("set_used"); }

    std::optional<int> get_uniform_location(const char* name) const override
    {
        if (m_has_view_projection && std::string(name) == "ViewProjection") {
            return 3;
        }
        return std::nullopt;
    }

    void set_uniform_matrix_4fv(int location, const glm::mat4& matrix) override
    {
        m_log->calls.push_back("set_uniform_" + std::to_string(location));
        m_log->matrices.push_back(matrix);
    }

private:
    std::shared_ptr<render_log_t> m_log;
    bool m_has_view_projection = true;
};

class Recording_target final : public fl::Render_target
{
public:
    explicit Recording_target(std::shared_ptr<render_log_t> log)
        : m_log(std::move(log))
    {
    }

    void set_default_blend_func() override { m_log->calls.push_back("blend"); }
    void front_face_cw() override { m_log->calls.push_back("cw"); }
    void front_face_ccw() override { m_log->calls.push_back("ccw"); }
    void polygon_mode_line() override { m_log->calls.push_back("line"); }
    void polygon_mode_fill() override { m_log->calls.push_back("fill"); }

private:
    std::shared_ptr<render_log_t> m_log;
};

class Recording_dispatch final : public fl::Draw_dispatch
{
public:
    Recording_dispatch(std::shared_ptr<render_log_t> log, bool base_instance)
        : m_log(std::move(log))
        , m_base_instance(base_instance)
    {
    }

    bool uses_base_instance() const noexcept override { return m_base_instance; }

    void draw(fl::Buffer_stage& stage) override
    {
        m_log->calls.push_back("draw");
        m_log->drawn_command_counts.push_back(stage.command_count());
    }

private:
    std::shared_ptr<render_log_t> m_log;
    bool m_base_instance = true;
};

} // namespace fakes

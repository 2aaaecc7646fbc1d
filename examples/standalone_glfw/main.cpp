#include <vnm_flatland/core/asset_loader.h>
#include <vnm_flatland/core/flatlander.h>
#include <vnm_flatland/core/handles.h>
#include <vnm_flatland/gl/gl_flatlander.h>
#include <vnm_flatland/gl/gl_program.h>

#include <glatter/glatter.h>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <GLFW/glfw3.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <vector>

namespace fl = vnm::flatland;

namespace {

enum Shape_id : std::uint32_t
{
    SHAPE_SQUARE   = 1,
    SHAPE_TRIANGLE = 2,
    SHAPE_DIAMOND  = 3,
    SHAPE_BAR      = 4
};

// Tiles are 16x16 pixels, y down.
void add_shapes(fl::Alphabet& alphabet)
{
    alphabet.add_entry(SHAPE_SQUARE,
        {{{0.f, 0.f}}, {{16.f, 0.f}}, {{16.f, 16.f}}, {{0.f, 16.f}}},
        {0, 1, 2, 0, 2, 3});
    alphabet.add_entry(SHAPE_TRIANGLE,
        {{{8.f, 0.f}}, {{16.f, 16.f}}, {{0.f, 16.f}}},
        {0, 1, 2});
    alphabet.add_entry(SHAPE_DIAMOND,
        {{{8.f, 0.f}}, {{16.f, 8.f}}, {{8.f, 16.f}}, {{0.f, 8.f}}},
        {0, 1, 2, 0, 2, 3});
    alphabet.add_entry(SHAPE_BAR,
        {{{0.f, 6.f}}, {{16.f, 6.f}}, {{16.f, 10.f}}, {{0.f, 10.f}}},
        {0, 1, 2, 0, 2, 3});
}

// A row of `count` tiles cycling through the alphabet's entries.
std::vector<fl::Flatland_item> make_row(const fl::Alphabet& alphabet, int count, int y)
{
    const Shape_id cycle[] = {SHAPE_SQUARE, SHAPE_TRIANGLE, SHAPE_DIAMOND, SHAPE_BAR};

    std::vector<fl::Flatland_item> items;
    items.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        const auto entry = alphabet.get_entry_index(cycle[i % 4]);
        if (entry) {
            items.push_back({*entry, i * 20, y});
        }
    }
    return items;
}

void key_callback(GLFWwindow* window, int key, int /*scancode*/, int action, int /*mods*/)
{
    if (action != GLFW_PRESS) {
        return;
    }

    auto* flatlander = static_cast<fl::Flatlander*>(glfwGetWindowUserPointer(window));
    if (!flatlander) {
        return;
    }

    switch (key) {
        case GLFW_KEY_SPACE:  flatlander->toggle();           break;
        case GLFW_KEY_W:      flatlander->toggle_wireframe(); break;
        case GLFW_KEY_ESCAPE: glfwSetWindowShouldClose(window, GLFW_TRUE); break;
        default: break;
    }
}

void glfw_error_callback(int code, const char* desc)
{
    std::cerr << "GLFW error " << code << ": " << (desc ? desc : "(null)") << "\n";
}

} // anonymous namespace

int main()
{
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) {
        return EXIT_FAILURE;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif

    GLFWwindow* window = glfwCreateWindow(1200, 720, "vnm_flatland (GLFW)", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return EXIT_FAILURE;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    if (!fl::init_gl()) {
        std::cerr << "Failed to initialize glatter\n";
        glfwDestroyWindow(window);
        glfwTerminate();
        return EXIT_FAILURE;
    }

    auto config = fl::Flatland_config::make_default();
    config.log_debug = [](const std::string& msg) { std::cout << "flatland: " << msg << "\n"; };
    config.log_error = [](const std::string& msg) { std::cerr << "flatland error: " << msg << "\n"; };

    fl::Asset_loader& asset_loader = fl::default_asset_loader();
    asset_loader.set_log_callback(config.log_error);

    std::unique_ptr<fl::Flatlander> flatlander = fl::create_flatlander(asset_loader, config);
    if (!flatlander) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return EXIT_FAILURE;
    }

    glfwSetWindowUserPointer(window, flatlander.get());
    glfwSetKeyCallback(window, key_callback);

    fl::Alphabet shapes = flatlander->create_alphabet();
    add_shapes(shapes);

    std::vector<fl::Flatland_group> rows;
    const fl::color_t palette[] = {
        {230, 90, 70, 255},
        {90, 200, 120, 255},
        {80, 140, 230, 200},
        {240, 200, 60, 255}
    };
    for (int r = 0; r < 4; ++r) {
        const glm::mat4 transform = glm::translate(glm::mat4(1.0f), glm::vec3(40.f, 40.f + r * 60.f, 0.f));
        rows.emplace_back(transform, palette[r], shapes, make_row(shapes, 24 + r * 4, 0));
    }

    // The spinner changes only its transform each frame.
    fl::Flatland_group spinner(glm::mat4(1.0f), {255, 255, 255, 255}, shapes, make_row(shapes, 4, 0));

    std::cout << "space: toggle drawing, w: toggle wireframe, esc: quit\n";

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        int fb_w = 0;
        int fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);
        if (fb_w <= 0 || fb_h <= 0) {
            continue;
        }

        glViewport(0, 0, fb_w, fb_h);
        glClearColor(0.08f, 0.09f, 0.11f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        glEnable(GL_BLEND);

        const float t = static_cast<float>(glfwGetTime());
        glm::mat4 spin = glm::translate(glm::mat4(1.0f), glm::vec3(fb_w * 0.5f, fb_h * 0.7f, 0.f));
        spin = glm::rotate(spin, t, glm::vec3(0.f, 0.f, 1.f));
        spin = glm::translate(spin, glm::vec3(-38.f, -8.f, 0.f));
        spinner.update_transform(spin);

        flatlander->render(glm::ortho(0.f, float(fb_w), float(fb_h), 0.f, -1.f, 1.f));

        glfwSwapBuffers(window);
    }

    // The Flatlander owns the GL buffers and must go while the context is current.
    spinner.release();
    rows.clear();
    shapes.release();
    flatlander.reset();

    glfwDestroyWindow(window);
    glfwTerminate();
    return EXIT_SUCCESS;
}

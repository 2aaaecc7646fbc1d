#include <vnm_flatland/gl/gl_flatlander.h>
#include <vnm_flatland/gl/draw_dispatch.h>
#include <vnm_flatland/gl/gl_buffers.h>
#include <vnm_flatland/gl/gl_program.h>
#include <vnm_flatland/gl/gl_render_target.h>

#include <string>
#include <utility>

namespace vnm::flatland {

std::unique_ptr<Flatlander> create_flatlander(
    const Asset_loader& asset_loader,
    const Flatland_config& config)
{
    auto sources = asset_loader.load_shader(config.shader_base_name);
    if (!sources) {
        if (config.log_error) {
            config.log_error("Failed to load " + config.shader_base_name + " shader sources");
        }
        return nullptr;
    }

    auto program = create_gl_program(sources->vertex, sources->fragment, config.log_error);
    if (!program) {
        return nullptr;
    }

    const gl_draw_capabilities_t caps = query_draw_capabilities();
    if (config.log_debug) {
        config.log_debug(std::string("flatland: multi-draw-indirect ")
            + (caps.multi_draw_indirect && !config.force_draw_loop ? "enabled" : "disabled")
            + ", base instance " + (caps.base_instance ? "available" : "unavailable"));
    }

    Flatlander::collaborators_t collaborators;
    collaborators.program  = std::move(program);
    collaborators.target   = std::make_unique<GL_render_target>();
    collaborators.dispatch = make_draw_dispatch(caps, config.force_draw_loop);

    const std::size_t instance_capacity = config.initial_instance_capacity;
    collaborators.buffer_factory = [instance_capacity]() -> std::unique_ptr<Gpu_buffer_backend> {
        return std::make_unique<GL_buffers>(instance_capacity);
    };

    return std::make_unique<Flatlander>(std::move(collaborators), config);
}

} // namespace vnm::flatland

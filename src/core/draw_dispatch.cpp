#include <vnm_flatland/core/draw_dispatch.h>
#include <vnm_flatland/core/buffer_stage.h>

namespace vnm::flatland {

void Multi_draw_indirect_dispatch::draw(Buffer_stage& stage)
{
    Gpu_buffer_backend* buffers = stage.buffers();
    const std::size_t count = stage.command_count();
    if (!buffers || count == 0) {
        return;
    }
    buffers->multi_draw_indirect(count);
}

void Draw_indirect_loop_dispatch::draw(Buffer_stage& stage)
{
    Gpu_buffer_backend* buffers = stage.buffers();
    if (!buffers) {
        return;
    }

    const auto& commands = stage.commands();
    const auto& first_instances = stage.command_first_instances();

    bool offset_moved = false;
    for (std::size_t i = 0; i < commands.size(); ++i) {
        if (commands[i].instance_count == 0) {
            continue;
        }
        if (!m_base_instance) {
            buffers->bind_instance_offset(first_instances[i]);
            offset_moved = true;
        }
        buffers->draw_indirect(i);
    }

    if (offset_moved) {
        buffers->bind_instance_offset(0);
    }
}

} // namespace vnm::flatland

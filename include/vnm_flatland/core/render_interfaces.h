#pragma once

// VNM Flatland Library - Render Interfaces
// Seams between the GL-free core and the OpenGL layer.

#include "types.h"

#include <cstddef>
#include <optional>
#include <vector>

#include <glm/mat4x4.hpp>

namespace vnm::flatland {

class Buffer_stage;

// -----------------------------------------------------------------------------
// Shader_program
// -----------------------------------------------------------------------------
class Shader_program
{
public:
    virtual ~Shader_program() = default;

    virtual void set_used() = 0;
    // nullopt if the program has no active uniform of that name
    [[nodiscard]] virtual std::optional<int> get_uniform_location(const char* name) const = 0;
    virtual void set_uniform_matrix_4fv(int location, const glm::mat4& matrix) = 0;
};

// -----------------------------------------------------------------------------
// Render_target
// -----------------------------------------------------------------------------
// Fixed-function state applied around the flatland draw call.
class Render_target
{
public:
    virtual ~Render_target() = default;

    virtual void set_default_blend_func() = 0;
    virtual void front_face_cw() = 0;
    virtual void front_face_ccw() = 0;
    virtual void polygon_mode_line() = 0;
    virtual void polygon_mode_fill() = 0;
};

// -----------------------------------------------------------------------------
// Gpu_buffer_backend
// -----------------------------------------------------------------------------
// GPU storage for the four flatland buffers. Uploads replace the whole
// content and return false if the driver rejected the allocation.
class Gpu_buffer_backend
{
public:
    virtual ~Gpu_buffer_backend() = default;

    virtual bool upload_vertices(const std::vector<vertex_t>& vertices) = 0;
    virtual bool upload_indices(const std::vector<index_t>& indices) = 0;
    virtual bool upload_instances(const std::vector<item_instance_t>& instances) = 0;
    virtual bool upload_draw_commands(const std::vector<draw_indirect_cmd_t>& commands) = 0;

    // Binds vertex/index/instance state and the indirect command buffer.
    virtual void bind() = 0;
    virtual void unbind() = 0;

    // Points the per-instance attributes at record `first_instance`.
    // Used where indirect commands cannot carry a base instance.
    virtual void bind_instance_offset(std::size_t first_instance) = 0;

    // Indirect draws reading the bound command buffer; require bind().
    // Draws commands [0, command_count) in one call.
    virtual void multi_draw_indirect(std::size_t command_count) = 0;
    // Draws the single command at `command_index`.
    virtual void draw_indirect(std::size_t command_index) = 0;
};

// -----------------------------------------------------------------------------
// Draw_dispatch
// -----------------------------------------------------------------------------
// Issues the draw for all commands of a resolved, bound Buffer_stage.
// Selected once when the renderer is created.
class Draw_dispatch
{
public:
    virtual ~Draw_dispatch() = default;

    // Whether commands may carry a non-zero base_instance.
    [[nodiscard]] virtual bool uses_base_instance() const noexcept = 0;

    virtual void draw(Buffer_stage& stage) = 0;
};

} // namespace vnm::flatland

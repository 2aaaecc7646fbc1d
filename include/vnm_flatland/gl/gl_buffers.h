#pragma once

// VNM Flatland Library - GL Buffers
// OpenGL storage for the flatland vertex, index, instance and indirect buffers.

#include <vnm_flatland/core/render_interfaces.h>

#include <cstddef>
#include <vector>

using GLuint = unsigned int;
using GLenum = unsigned int;

namespace vnm::flatland {

// -----------------------------------------------------------------------------
// GL_buffers
// -----------------------------------------------------------------------------
// One VAO with the vertex and instance attribute layouts and the element
// buffer attached, plus the GL_DRAW_INDIRECT_BUFFER holding the commands.
// Buffers grow on demand and are rewritten in place when the data fits.
class GL_buffers final : public Gpu_buffer_backend
{
public:
    explicit GL_buffers(std::size_t initial_instance_capacity);
    ~GL_buffers() override;

    // Non-copyable (owns GL resources)
    GL_buffers(const GL_buffers&) = delete;
    GL_buffers& operator=(const GL_buffers&) = delete;

    bool upload_vertices(const std::vector<vertex_t>& vertices) override;
    bool upload_indices(const std::vector<index_t>& indices) override;
    bool upload_instances(const std::vector<item_instance_t>& instances) override;
    bool upload_draw_commands(const std::vector<draw_indirect_cmd_t>& commands) override;

    void bind() override;
    void unbind() override;
    void bind_instance_offset(std::size_t first_instance) override;

    void multi_draw_indirect(std::size_t command_count) override;
    void draw_indirect(std::size_t command_index) override;

private:
    struct buffer_t
    {
        GLuint id             = 0;
        std::size_t capacity_bytes = 0;
    };

    static bool upload(GLenum target, buffer_t& buffer, const void* data, std::size_t bytes);

    GLuint   m_vao = 0;
    buffer_t m_vertices;
    buffer_t m_indices;
    buffer_t m_instances;
    buffer_t m_indirect;
};

} // namespace vnm::flatland

#include <vnm_flatland/gl/gl_buffers.h>
#include <vnm_flatland/gl/gl_error.h>
#include <vnm_flatland/gl/vertex_layout.h>

#include <glatter/glatter.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>

namespace vnm::flatland {

static_assert(GL_NO_ERROR == k_gl_no_error && GL_OUT_OF_MEMORY == k_gl_out_of_memory,
    "gl_error.h codes must match the GL headers");

GL_buffers::GL_buffers(std::size_t initial_instance_capacity)
{
    glGenVertexArrays(1, &m_vao);
    glGenBuffers(1, &m_vertices.id);
    glGenBuffers(1, &m_indices.id);
    glGenBuffers(1, &m_instances.id);
    glGenBuffers(1, &m_indirect.id);

    glBindVertexArray(m_vao);

    glBindBuffer(GL_ARRAY_BUFFER, m_vertices.id);
    setup_vertex_attributes_for_layout(flatland_vertex_layout());

    glBindBuffer(GL_ARRAY_BUFFER, m_instances.id);
    const auto initial_bytes = static_cast<GLsizeiptr>(initial_instance_capacity * sizeof(item_instance_t));
    glBufferData(GL_ARRAY_BUFFER, initial_bytes, nullptr, GL_DYNAMIC_DRAW);
    m_instances.capacity_bytes = static_cast<std::size_t>(initial_bytes);
    setup_vertex_attributes_for_layout(item_instance_layout());

    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, m_indices.id);

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}

GL_buffers::~GL_buffers()
{
    for (buffer_t* buffer : {&m_vertices, &m_indices, &m_instances, &m_indirect}) {
        if (buffer->id != 0) {
            glDeleteBuffers(1, &buffer->id);
        }
        *buffer = {};
    }
    if (m_vao != 0) {
        glDeleteVertexArrays(1, &m_vao);
        m_vao = 0;
    }
}

bool GL_buffers::upload(GLenum target, buffer_t& buffer, const void* data, std::size_t bytes)
{
    glBindBuffer(target, buffer.id);

    if (bytes > buffer.capacity_bytes) {
        const bool out_of_memory = allocation_out_of_memory(
            [] { return static_cast<unsigned int>(glGetError()); },
            [&] { glBufferData(target, static_cast<GLsizeiptr>(bytes), data, GL_DYNAMIC_DRAW); });
        if (out_of_memory) {
            buffer.capacity_bytes = 0;
            return false;
        }
        buffer.capacity_bytes = bytes;
    }
    else if (bytes > 0) {
        glBufferSubData(target, 0, static_cast<GLsizeiptr>(bytes), data);
    }
    return true;
}

bool GL_buffers::upload_vertices(const std::vector<vertex_t>& vertices)
{
    const bool ok = upload(GL_ARRAY_BUFFER, m_vertices, vertices.data(), vertices.size() * sizeof(vertex_t));
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    return ok;
}

bool GL_buffers::upload_indices(const std::vector<index_t>& indices)
{
    // The element binding is VAO state
    glBindVertexArray(m_vao);
    const bool ok = upload(GL_ELEMENT_ARRAY_BUFFER, m_indices, indices.data(), indices.size() * sizeof(index_t));
    glBindVertexArray(0);
    return ok;
}

bool GL_buffers::upload_instances(const std::vector<item_instance_t>& instances)
{
    const bool ok = upload(GL_ARRAY_BUFFER, m_instances, instances.data(),
        instances.size() * sizeof(item_instance_t));
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    return ok;
}

bool GL_buffers::upload_draw_commands(const std::vector<draw_indirect_cmd_t>& commands)
{
    const bool ok = upload(GL_DRAW_INDIRECT_BUFFER, m_indirect, commands.data(),
        commands.size() * sizeof(draw_indirect_cmd_t));
    glBindBuffer(GL_DRAW_INDIRECT_BUFFER, 0);
    return ok;
}

void GL_buffers::bind()
{
    glBindVertexArray(m_vao);
    glBindBuffer(GL_DRAW_INDIRECT_BUFFER, m_indirect.id);
}

void GL_buffers::unbind()
{
    glBindBuffer(GL_DRAW_INDIRECT_BUFFER, 0);
    glBindVertexArray(0);
}

void GL_buffers::bind_instance_offset(std::size_t first_instance)
{
    const Vertex_layout& layout = item_instance_layout();
    glBindBuffer(GL_ARRAY_BUFFER, m_instances.id);
    setup_vertex_attributes_for_layout(layout, first_instance * layout.stride);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
}

void GL_buffers::multi_draw_indirect(std::size_t command_count)
{
    glMultiDrawElementsIndirect(
        GL_TRIANGLES,
        GL_UNSIGNED_SHORT,
        nullptr,
        static_cast<GLsizei>(command_count),
        static_cast<GLsizei>(sizeof(draw_indirect_cmd_t)));
}

void GL_buffers::draw_indirect(std::size_t command_index)
{
    // Offset of the record in the bound GL_DRAW_INDIRECT_BUFFER
    const auto offset = static_cast<std::uintptr_t>(command_index * sizeof(draw_indirect_cmd_t));
    glDrawElementsIndirect(GL_TRIANGLES, GL_UNSIGNED_SHORT, reinterpret_cast<const void*>(offset));
}

} // namespace vnm::flatland

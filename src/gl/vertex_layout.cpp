#include <vnm_flatland/gl/vertex_layout.h>
#include <vnm_flatland/core/constants.h>
#include <vnm_flatland/core/types.h>

#include <glatter/glatter.h>

#include <cstddef>
#include <cstdint>

namespace vnm::flatland {
namespace {

void* offset_ptr(std::size_t offset)
{
    return reinterpret_cast<void*>(static_cast<std::uintptr_t>(offset));
}

Vertex_layout make_vertex_layout()
{
    Vertex_layout layout;
    layout.stride = sizeof(vertex_t);
    layout.divisor = 0;
    layout.attributes = {
        {constants::k_attrib_position, Vertex_attrib_type::FLOAT32, 2, offsetof(vertex_t, position), false}
    };
    return layout;
}

Vertex_layout make_instance_layout()
{
    Vertex_layout layout;
    layout.stride = sizeof(item_instance_t);
    layout.divisor = 1;

    // mat4 occupies four consecutive vec4 locations
    const std::size_t transform = offsetof(item_instance_t, transform);
    for (int column = 0; column < 4; ++column) {
        layout.attributes.push_back({
            constants::k_attrib_transform + column,
            Vertex_attrib_type::FLOAT32,
            4,
            transform + static_cast<std::size_t>(column) * 4 * sizeof(float),
            false});
    }

    layout.attributes.push_back({constants::k_attrib_color, Vertex_attrib_type::UINT8, 4,
        offsetof(item_instance_t, color), true});
    layout.attributes.push_back({constants::k_attrib_offset, Vertex_attrib_type::FLOAT32, 2,
        offsetof(item_instance_t, offset), false});
    layout.attributes.push_back({constants::k_attrib_vertex_range, Vertex_attrib_type::UINT32, 2,
        offsetof(item_instance_t, vertex_range), false});
    return layout;
}

} // anonymous namespace

const Vertex_layout& flatland_vertex_layout()
{
    static const Vertex_layout layout = make_vertex_layout();
    return layout;
}

const Vertex_layout& item_instance_layout()
{
    static const Vertex_layout layout = make_instance_layout();
    return layout;
}

void setup_vertex_attributes_for_layout(const Vertex_layout& layout, std::size_t base_offset)
{
    const GLsizei stride = static_cast<GLsizei>(layout.stride);
    for (const auto& attr : layout.attributes) {
        const GLint components = static_cast<GLint>(attr.components);
        const auto offset = offset_ptr(base_offset + attr.offset);
        const auto location = static_cast<GLuint>(attr.location);

        switch (attr.type) {
            case Vertex_attrib_type::FLOAT32:
                glVertexAttribPointer(location, components, GL_FLOAT,
                    attr.normalized ? GL_TRUE : GL_FALSE, stride, offset);
                break;
            case Vertex_attrib_type::UINT8:
                if (attr.normalized) {
                    glVertexAttribPointer(location, components, GL_UNSIGNED_BYTE, GL_TRUE, stride, offset);
                }
                else {
                    glVertexAttribIPointer(location, components, GL_UNSIGNED_BYTE, stride, offset);
                }
                break;
            case Vertex_attrib_type::UINT32:
                glVertexAttribIPointer(location, components, GL_UNSIGNED_INT, stride, offset);
                break;
            default:
                continue;
        }
        glEnableVertexAttribArray(location);
        glVertexAttribDivisor(location, layout.divisor);
    }
}

} // namespace vnm::flatland

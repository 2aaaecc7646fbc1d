#pragma once

// VNM Flatland Library - Vertex Layout Utilities
// Describes the vertex and instance attribute layouts fed to the flatland shader.

#include <cstddef>
#include <cstdint>
#include <vector>

namespace vnm::flatland {

enum class Vertex_attrib_type
{
    FLOAT32,
    UINT32,
    UINT8
};

struct vertex_attribute_t
{
    int location = 0;
    Vertex_attrib_type type = Vertex_attrib_type::FLOAT32;
    int components = 1;
    std::size_t offset = 0;
    bool normalized = false;
};

struct Vertex_layout
{
    std::size_t stride = 0;
    // 0 = per vertex, 1 = per instance
    unsigned int divisor = 0;
    std::vector<vertex_attribute_t> attributes;
};

// Layout of vertex_t in the shared vertex buffer.
const Vertex_layout& flatland_vertex_layout();

// Layout of item_instance_t in the instance buffer.
const Vertex_layout& item_instance_layout();

// Points the attributes of `layout` at the currently bound GL_ARRAY_BUFFER,
// starting `base_offset` bytes in.
void setup_vertex_attributes_for_layout(const Vertex_layout& layout, std::size_t base_offset = 0);

} // namespace vnm::flatland

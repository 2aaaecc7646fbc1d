#pragma once

// VNM Flatland Library - Core Constants
// Limits and GL layout constants used by the core library.

#include <cstddef>

namespace vnm::flatland::constants {

// Alphabet geometry
// Indices are 16-bit and alphabet-relative, so one alphabet addresses at most
// this many vertices.
constexpr std::size_t k_max_alphabet_vertices = 65536;

// Vertex attribute locations (must match shaders/flatland.vert)
constexpr int k_attrib_position     = 0;
constexpr int k_attrib_transform    = 1;  // occupies 1..4
constexpr int k_attrib_color        = 5;
constexpr int k_attrib_offset       = 6;
constexpr int k_attrib_vertex_range = 7;

// GL version providing glMultiDrawElementsIndirect
constexpr int k_multi_draw_indirect_major = 4;
constexpr int k_multi_draw_indirect_minor = 3;

// GL version providing baseInstance in indirect commands
constexpr int k_base_instance_major = 4;
constexpr int k_base_instance_minor = 2;

} // namespace vnm::flatland::constants

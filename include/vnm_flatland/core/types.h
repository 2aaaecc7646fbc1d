#pragma once
// VNM Flatland Library - Core Types
// GL-free types shared by the registry, the buffer stage and the renderer.
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

#include <glm/gtc/type_precision.hpp>
#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>

namespace vnm::flatland {

// -----------------------------------------------------------------------------
// Byte Buffer - used for asset data (shader sources)
// -----------------------------------------------------------------------------
using ByteBuffer = std::string;
using ByteView = std::string_view;

// -----------------------------------------------------------------------------
// slot_id_t: index into a Slot_table plus the generation it was issued for
// -----------------------------------------------------------------------------
// A slot id stays valid until its slot is freed. Freeing advances the slot's
// generation, so an id kept past that point never resolves to a later occupant.
struct slot_id_t
{
    std::uint32_t index      = 0;
    std::uint32_t generation = 0;

    [[nodiscard]] constexpr bool operator==(const slot_id_t& other) const noexcept
    {
        return index == other.index && generation == other.generation;
    }

    [[nodiscard]] constexpr bool operator!=(const slot_id_t& other) const noexcept
    {
        return !(*this == other);
    }
};

// -----------------------------------------------------------------------------
// Geometry
// -----------------------------------------------------------------------------
// One tessellated glyph/sprite vertex, in glyph-local units.
struct vertex_t
{
    glm::vec2 position{0.0f, 0.0f};
};

// Index element type for alphabet geometry.
using index_t = std::uint16_t;

// Vertex and index range of one alphabet entry, relative to the start of its
// alphabet's region. Indices stored for the entry are already rebased by
// vertex_offset, so they address the alphabet region directly.
struct entry_range_t
{
    std::uint32_t vertex_offset = 0;
    std::uint32_t vertex_count  = 0;
    std::uint32_t index_offset  = 0;
    std::uint32_t index_count   = 0;
};

// -----------------------------------------------------------------------------
// Flatland_item: one placement of an alphabet entry within a group
// -----------------------------------------------------------------------------
struct Flatland_item
{
    std::size_t   alphabet_entry_index = 0;
    std::int32_t  x_offset = 0;
    std::int32_t  y_offset = 0;
};

using color_t = glm::u8vec4;

// -----------------------------------------------------------------------------
// item_instance_t: per-item record in the instance buffer
// -----------------------------------------------------------------------------
// Items of one group are stored contiguously, groups in slot order.
// vertex_range holds the absolute [first, first + count) vertex range of the
// item's entry in the shared vertex buffer; the vertex shader collapses every
// vertex outside that range.
struct item_instance_t
{
    glm::mat4  transform{1.0f};
    color_t    color{255, 255, 255, 255};
    glm::vec2  offset{0.0f, 0.0f};
    glm::uvec2 vertex_range{0u, 0u};
};

// -----------------------------------------------------------------------------
// draw_indirect_cmd_t: DrawElementsIndirectCommand
// -----------------------------------------------------------------------------
// Read by the driver directly from the indirect buffer; field order and size
// must not change.
struct draw_indirect_cmd_t
{
    std::uint32_t count          = 0;
    std::uint32_t instance_count = 0;
    std::uint32_t first_index    = 0;
    std::int32_t  base_vertex    = 0;
    std::uint32_t base_instance  = 0;
};

static_assert(sizeof(draw_indirect_cmd_t) == 5 * sizeof(std::uint32_t),
    "draw_indirect_cmd_t must match DrawElementsIndirectCommand");
static_assert(std::is_standard_layout_v<draw_indirect_cmd_t>,
    "draw_indirect_cmd_t must be standard layout");
static_assert(offsetof(draw_indirect_cmd_t, count)          == 0,  "count at byte 0");
static_assert(offsetof(draw_indirect_cmd_t, instance_count) == 4,  "instance_count at byte 4");
static_assert(offsetof(draw_indirect_cmd_t, first_index)    == 8,  "first_index at byte 8");
static_assert(offsetof(draw_indirect_cmd_t, base_vertex)    == 12, "base_vertex at byte 12");
static_assert(offsetof(draw_indirect_cmd_t, base_instance)  == 16, "base_instance at byte 16");
static_assert(std::is_trivially_copyable_v<item_instance_t>,
    "item_instance_t is uploaded as raw bytes");
static_assert(sizeof(index_t) == 2, "indices are 16-bit");

} // namespace vnm::flatland

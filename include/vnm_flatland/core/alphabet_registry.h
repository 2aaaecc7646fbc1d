#pragma once

// VNM Flatland Library - Alphabet Registry
// Reference-counted storage of glyph/sprite geometry.

#include "flatland_config.h"
#include "slot_table.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vnm::flatland {

struct alphabet_entry_t
{
    std::uint32_t id = 0;
    entry_range_t range;
};

// Geometry of one alphabet. Vertices and indices of all entries are stored
// back to back; indices are relative to the start of `vertices`.
struct alphabet_t
{
    std::uint32_t                 ref_count = 1;
    std::vector<alphabet_entry_t> entries;
    std::unordered_map<std::uint32_t, std::size_t> entry_by_id;
    std::vector<vertex_t>         vertices;
    std::vector<index_t>          indices;
};

// -----------------------------------------------------------------------------
// Alphabet_registry
// -----------------------------------------------------------------------------
// A slot lives while its reference count is above zero. Releasing the last
// reference frees the slot immediately; the GPU copy of its geometry is
// reclaimed by the next geometry upload.
class Alphabet_registry
{
public:
    Alphabet_registry() = default;

    void set_log_callback(Log_callback callback);

    // New alphabet with reference count 1 and no entries.
    slot_id_t create_alphabet();

    // Return false if the slot is not live.
    bool inc(slot_id_t slot);
    bool dec(slot_id_t slot);

    // 0 for freed or stale slots.
    [[nodiscard]] std::uint32_t ref_count(slot_id_t slot) const;

    // Appends an entry and marks geometry dirty. Indices address `vertices`
    // (0-based) and must describe whole triangles.
    // Returns the entry index, or nullopt if the slot is not live, the id is
    // already taken, or the geometry is malformed.
    std::optional<std::size_t> add_entry(
        slot_id_t slot,
        std::uint32_t id,
        std::vector<vertex_t> vertices,
        std::vector<index_t> indices);

    [[nodiscard]] std::optional<std::size_t> get_entry_index(slot_id_t slot, std::uint32_t id) const;

    [[nodiscard]] const alphabet_t* find(slot_id_t slot) const { return m_alphabets.get(slot); }
    [[nodiscard]] std::size_t size() const noexcept { return m_alphabets.size(); }

    // Visits live alphabets in slot order: f(slot_id_t, const alphabet_t&).
    template <typename F>
    void for_each(F&& f) const { m_alphabets.for_each(std::forward<F>(f)); }

    [[nodiscard]] bool geometry_dirty() const noexcept { return m_geometry_dirty; }
    void clear_geometry_dirty() noexcept { m_geometry_dirty = false; }

private:
    void log_error(const std::string& message) const;

    Slot_table<alphabet_t> m_alphabets;
    bool                   m_geometry_dirty = false;
    Log_callback           m_log_error;
};

} // namespace vnm::flatland

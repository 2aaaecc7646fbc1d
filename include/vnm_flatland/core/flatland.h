#pragma once

// VNM Flatland Library - Flatland Registry
// The registry shared by handles and the renderer.

#include "alphabet_registry.h"
#include "flatland_config.h"
#include "group_registry.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace vnm::flatland {

// -----------------------------------------------------------------------------
// Flatland
// -----------------------------------------------------------------------------
// Aggregates the alphabet and group registries and their three dirty
// channels. Owned through std::shared_ptr by the renderer and every handle.
// Single-threaded: callers must not re-enter a mutation while another one on
// the same Flatland is in progress.
class Flatland
{
public:
    Flatland() = default;

    Flatland(const Flatland&) = delete;
    Flatland& operator=(const Flatland&) = delete;

    void set_log_callback(Log_callback callback);

    // --- Alphabets ---
    slot_id_t create_alphabet() { return m_alphabets.create_alphabet(); }
    bool inc_alphabet(slot_id_t slot) { return m_alphabets.inc(slot); }
    bool dec_alphabet(slot_id_t slot) { return m_alphabets.dec(slot); }

    std::optional<std::size_t> add_alphabet_entry(
        slot_id_t slot,
        std::uint32_t id,
        std::vector<vertex_t> vertices,
        std::vector<index_t> indices);

    [[nodiscard]] std::optional<std::size_t> get_alphabet_entry_index(slot_id_t slot, std::uint32_t id) const
    {
        return m_alphabets.get_entry_index(slot, id);
    }

    // --- Groups ---
    // Returns nullopt if `alphabet` is not live.
    std::optional<slot_id_t> create_group(
        const glm::mat4& transform,
        color_t color,
        slot_id_t alphabet,
        std::vector<Flatland_item> items);

    bool update_items(slot_id_t group, std::vector<Flatland_item> items);
    bool update_transform(slot_id_t group, const glm::mat4& transform);
    bool update_color(slot_id_t group, color_t color);
    bool delete_group(slot_id_t group);

    // --- Access ---
    [[nodiscard]] const Alphabet_registry& alphabets() const noexcept { return m_alphabets; }
    [[nodiscard]] const Group_registry& groups() const noexcept { return m_groups; }

    // --- Dirty channels ---
    [[nodiscard]] bool alphabets_invalidated() const noexcept { return m_alphabets.geometry_dirty(); }
    [[nodiscard]] bool groups_invalidated() const noexcept { return m_groups.instances_dirty(); }
    [[nodiscard]] bool draw_invalidated() const noexcept { return m_groups.commands_dirty(); }

    void clear_alphabets_invalidated() noexcept { m_alphabets.clear_geometry_dirty(); }
    void clear_groups_invalidated() noexcept { m_groups.clear_instances_dirty(); }
    void clear_draw_invalidated() noexcept { m_groups.clear_commands_dirty(); }

    // Called after the shared geometry buffers were rewritten: every group's
    // offsets into them must be regenerated.
    void invalidate_groups() noexcept { m_groups.invalidate_all(); }

private:
    Alphabet_registry m_alphabets;
    Group_registry    m_groups;
    Log_callback      m_log_error;
};

} // namespace vnm::flatland

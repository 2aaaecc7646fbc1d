#pragma once

// VNM Flatland Library - Group Registry
// Drawable groups of positioned alphabet entries.

#include "flatland_config.h"
#include "slot_table.h"
#include "types.h"

#include <cstddef>
#include <utility>
#include <vector>

#include <glm/mat4x4.hpp>

namespace vnm::flatland {

struct group_t
{
    glm::mat4                  transform{1.0f};
    color_t                    color{255, 255, 255, 255};
    slot_id_t                  alphabet;
    std::vector<Flatland_item> items;
};

// -----------------------------------------------------------------------------
// Group_registry
// -----------------------------------------------------------------------------
// Feeds two dirty channels:
// - instances: per-item data (transform, color, offsets, entry ranges)
// - commands:  one indirect command per live group
// Item changes touch both, since the item list determines the command's
// index range and instance count.
class Group_registry
{
public:
    Group_registry() = default;

    void set_log_callback(Log_callback callback);

    slot_id_t create_group(
        const glm::mat4& transform,
        color_t color,
        slot_id_t alphabet,
        std::vector<Flatland_item> items);

    // Return false if the group is not live.
    bool update_items(slot_id_t slot, std::vector<Flatland_item> items);
    bool update_transform(slot_id_t slot, const glm::mat4& transform);
    bool update_color(slot_id_t slot, color_t color);
    bool delete_group(slot_id_t slot);

    [[nodiscard]] const group_t* find(slot_id_t slot) const { return m_groups.get(slot); }
    [[nodiscard]] std::size_t size() const noexcept { return m_groups.size(); }

    // Visits live groups in slot order: f(slot_id_t, const group_t&).
    template <typename F>
    void for_each(F&& f) const { m_groups.for_each(std::forward<F>(f)); }

    [[nodiscard]] bool instances_dirty() const noexcept { return m_instances_dirty; }
    [[nodiscard]] bool commands_dirty() const noexcept { return m_commands_dirty; }
    void clear_instances_dirty() noexcept { m_instances_dirty = false; }
    void clear_commands_dirty() noexcept { m_commands_dirty = false; }

    // Marks both channels dirty; used when the geometry layout they reference
    // has moved.
    void invalidate_all() noexcept
    {
        m_instances_dirty = true;
        m_commands_dirty  = true;
    }

private:
    group_t* live_group(slot_id_t slot, const char* operation);

    Slot_table<group_t> m_groups;
    bool                m_instances_dirty = false;
    bool                m_commands_dirty  = false;
    Log_callback        m_log_error;
};

} // namespace vnm::flatland

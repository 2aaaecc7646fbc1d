#include <vnm_flatland/core/group_registry.h>

#include <string>
#include <utility>

namespace vnm::flatland {

void Group_registry::set_log_callback(Log_callback callback)
{
    m_log_error = std::move(callback);
}

group_t* Group_registry::live_group(slot_id_t slot, const char* operation)
{
    group_t* group = m_groups.get(slot);
    if (!group && m_log_error) {
        m_log_error(std::string(operation) + ": group slot " + std::to_string(slot.index)
            + " is not live");
    }
    return group;
}

slot_id_t Group_registry::create_group(
    const glm::mat4& transform,
    color_t color,
    slot_id_t alphabet,
    std::vector<Flatland_item> items)
{
    group_t group;
    group.transform = transform;
    group.color     = color;
    group.alphabet  = alphabet;
    group.items     = std::move(items);

    const slot_id_t slot = m_groups.insert(std::move(group));
    m_instances_dirty = true;
    m_commands_dirty  = true;
    return slot;
}

bool Group_registry::update_items(slot_id_t slot, std::vector<Flatland_item> items)
{
    group_t* group = live_group(slot, "update_items");
    if (!group) {
        return false;
    }
    group->items = std::move(items);
    m_instances_dirty = true;
    m_commands_dirty  = true;
    return true;
}

bool Group_registry::update_transform(slot_id_t slot, const glm::mat4& transform)
{
    group_t* group = live_group(slot, "update_transform");
    if (!group) {
        return false;
    }
    group->transform = transform;
    m_instances_dirty = true;
    return true;
}

bool Group_registry::update_color(slot_id_t slot, color_t color)
{
    group_t* group = live_group(slot, "update_color");
    if (!group) {
        return false;
    }
    group->color = color;
    m_instances_dirty = true;
    return true;
}

bool Group_registry::delete_group(slot_id_t slot)
{
    if (!m_groups.erase(slot)) {
        if (m_log_error) {
            m_log_error("delete_group: group slot " + std::to_string(slot.index) + " is not live");
        }
        return false;
    }
    m_commands_dirty = true;
    return true;
}

} // namespace vnm::flatland

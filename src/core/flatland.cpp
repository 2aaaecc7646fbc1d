#include <vnm_flatland/core/flatland.h>

#include <string>
#include <utility>

namespace vnm::flatland {

void Flatland::set_log_callback(Log_callback callback)
{
    m_alphabets.set_log_callback(callback);
    m_groups.set_log_callback(callback);
    m_log_error = std::move(callback);
}

std::optional<std::size_t> Flatland::add_alphabet_entry(
    slot_id_t slot,
    std::uint32_t id,
    std::vector<vertex_t> vertices,
    std::vector<index_t> indices)
{
    return m_alphabets.add_entry(slot, id, std::move(vertices), std::move(indices));
}

std::optional<slot_id_t> Flatland::create_group(
    const glm::mat4& transform,
    color_t color,
    slot_id_t alphabet,
    std::vector<Flatland_item> items)
{
    if (m_alphabets.ref_count(alphabet) == 0) {
        if (m_log_error) {
            m_log_error("create_group: alphabet slot " + std::to_string(alphabet.index)
                + " is not live");
        }
        return std::nullopt;
    }
    return m_groups.create_group(transform, color, alphabet, std::move(items));
}

bool Flatland::update_items(slot_id_t group, std::vector<Flatland_item> items)
{
    return m_groups.update_items(group, std::move(items));
}

bool Flatland::update_transform(slot_id_t group, const glm::mat4& transform)
{
    return m_groups.update_transform(group, transform);
}

bool Flatland::update_color(slot_id_t group, color_t color)
{
    return m_groups.update_color(group, color);
}

bool Flatland::delete_group(slot_id_t group)
{
    return m_groups.delete_group(group);
}

} // namespace vnm::flatland

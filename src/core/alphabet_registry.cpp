#include <vnm_flatland/core/alphabet_registry.h>
#include <vnm_flatland/core/constants.h>

#include <string>
#include <utility>

namespace vnm::flatland {

void Alphabet_registry::set_log_callback(Log_callback callback)
{
    m_log_error = std::move(callback);
}

void Alphabet_registry::log_error(const std::string& message) const
{
    if (m_log_error) {
        m_log_error(message);
    }
}

slot_id_t Alphabet_registry::create_alphabet()
{
    return m_alphabets.insert(alphabet_t{});
}

bool Alphabet_registry::inc(slot_id_t slot)
{
    alphabet_t* alphabet = m_alphabets.get(slot);
    if (!alphabet) {
        log_error("alphabet inc: slot " + std::to_string(slot.index) + " is not live");
        return false;
    }
    ++alphabet->ref_count;
    return true;
}

bool Alphabet_registry::dec(slot_id_t slot)
{
    alphabet_t* alphabet = m_alphabets.get(slot);
    if (!alphabet) {
        log_error("alphabet dec: slot " + std::to_string(slot.index) + " is not live");
        return false;
    }

    if (--alphabet->ref_count == 0) {
        m_alphabets.erase(slot);
    }
    return true;
}

std::uint32_t Alphabet_registry::ref_count(slot_id_t slot) const
{
    const alphabet_t* alphabet = m_alphabets.get(slot);
    return alphabet ? alphabet->ref_count : 0;
}

std::optional<std::size_t> Alphabet_registry::add_entry(
    slot_id_t slot,
    std::uint32_t id,
    std::vector<vertex_t> vertices,
    std::vector<index_t> indices)
{
    alphabet_t* alphabet = m_alphabets.get(slot);
    if (!alphabet) {
        log_error("add_entry: alphabet slot " + std::to_string(slot.index) + " is not live");
        return std::nullopt;
    }

    if (alphabet->entry_by_id.find(id) != alphabet->entry_by_id.end()) {
        log_error("add_entry: entry id " + std::to_string(id) + " already exists");
        return std::nullopt;
    }

    if (indices.size() % 3 != 0) {
        log_error("add_entry: index count " + std::to_string(indices.size())
            + " is not a multiple of 3");
        return std::nullopt;
    }

    for (const index_t index : indices) {
        if (index >= vertices.size()) {
            log_error("add_entry: index " + std::to_string(index) + " out of range for entry "
                + std::to_string(id));
            return std::nullopt;
        }
    }

    const std::size_t vertex_offset = alphabet->vertices.size();
    if (vertex_offset + vertices.size() > constants::k_max_alphabet_vertices) {
        log_error("add_entry: alphabet vertex capacity exceeded by entry " + std::to_string(id));
        return std::nullopt;
    }

    alphabet_entry_t entry;
    entry.id = id;
    entry.range.vertex_offset = static_cast<std::uint32_t>(vertex_offset);
    entry.range.vertex_count  = static_cast<std::uint32_t>(vertices.size());
    entry.range.index_offset  = static_cast<std::uint32_t>(alphabet->indices.size());
    entry.range.index_count   = static_cast<std::uint32_t>(indices.size());

    alphabet->vertices.insert(alphabet->vertices.end(), vertices.begin(), vertices.end());
    alphabet->indices.reserve(alphabet->indices.size() + indices.size());
    for (const index_t index : indices) {
        alphabet->indices.push_back(static_cast<index_t>(index + vertex_offset));
    }

    const std::size_t entry_index = alphabet->entries.size();
    alphabet->entries.push_back(entry);
    alphabet->entry_by_id.emplace(id, entry_index);

    m_geometry_dirty = true;
    return entry_index;
}

std::optional<std::size_t> Alphabet_registry::get_entry_index(slot_id_t slot, std::uint32_t id) const
{
    const alphabet_t* alphabet = m_alphabets.get(slot);
    if (!alphabet) {
        return std::nullopt;
    }

    const auto it = alphabet->entry_by_id.find(id);
    if (it == alphabet->entry_by_id.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace vnm::flatland

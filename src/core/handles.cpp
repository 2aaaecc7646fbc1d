#include <vnm_flatland/core/handles.h>

#include <utility>

namespace vnm::flatland {

// -----------------------------------------------------------------------------
// Alphabet
// -----------------------------------------------------------------------------

Alphabet::Alphabet(std::shared_ptr<Flatland> flatland, slot_id_t slot)
    : m_flatland(std::move(flatland))
    , m_slot(slot)
{
}

Alphabet::Alphabet(const Alphabet& other)
    : m_flatland(other.m_flatland)
    , m_slot(other.m_slot)
{
    if (m_flatland && !m_flatland->inc_alphabet(m_slot)) {
        m_flatland.reset();
    }
}

Alphabet& Alphabet::operator=(const Alphabet& other)
{
    if (this != &other) {
        Alphabet copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Alphabet::Alphabet(Alphabet&& other) noexcept
    : m_flatland(std::move(other.m_flatland))
    , m_slot(other.m_slot)
{
    other.m_flatland.reset();
}

Alphabet& Alphabet::operator=(Alphabet&& other) noexcept
{
    if (this != &other) {
        release();
        m_flatland = std::move(other.m_flatland);
        m_slot = other.m_slot;
        other.m_flatland.reset();
    }
    return *this;
}

Alphabet::~Alphabet()
{
    release();
}

void Alphabet::release()
{
    if (m_flatland) {
        m_flatland->dec_alphabet(m_slot);
        m_flatland.reset();
    }
}

std::uint32_t Alphabet::ref_count() const
{
    return m_flatland ? m_flatland->alphabets().ref_count(m_slot) : 0;
}

std::size_t Alphabet::entry_count() const
{
    if (!m_flatland) {
        return 0;
    }
    const alphabet_t* alphabet = m_flatland->alphabets().find(m_slot);
    return alphabet ? alphabet->entries.size() : 0;
}

std::optional<std::size_t> Alphabet::get_entry_index(std::uint32_t id) const
{
    if (!m_flatland) {
        return std::nullopt;
    }
    return m_flatland->get_alphabet_entry_index(m_slot, id);
}

std::optional<std::size_t> Alphabet::add_entry(
    std::uint32_t id,
    std::vector<vertex_t> vertices,
    std::vector<index_t> indices)
{
    if (!m_flatland) {
        return std::nullopt;
    }
    return m_flatland->add_alphabet_entry(m_slot, id, std::move(vertices), std::move(indices));
}

Alphabet create_alphabet(const std::shared_ptr<Flatland>& flatland)
{
    if (!flatland) {
        return {};
    }
    return Alphabet(flatland, flatland->create_alphabet());
}

// -----------------------------------------------------------------------------
// Flatland_group
// -----------------------------------------------------------------------------

Flatland_group::Flatland_group(
    const glm::mat4& transform,
    color_t color,
    const Alphabet& alphabet,
    std::vector<Flatland_item> items)
{
    if (!alphabet.is_valid()) {
        return;
    }

    const auto slot = alphabet.flatland()->create_group(transform, color, alphabet.slot(), std::move(items));
    if (!slot) {
        return;
    }

    m_alphabet = alphabet;
    m_group_slot = *slot;
}

Flatland_group::Flatland_group(Flatland_group&& other) noexcept
    : m_alphabet(std::move(other.m_alphabet))
    , m_group_slot(other.m_group_slot)
{
}

Flatland_group& Flatland_group::operator=(Flatland_group&& other) noexcept
{
    if (this != &other) {
        release();
        m_alphabet = std::move(other.m_alphabet);
        m_group_slot = other.m_group_slot;
    }
    return *this;
}

Flatland_group::~Flatland_group()
{
    release();
}

void Flatland_group::release()
{
    if (!m_alphabet.is_valid()) {
        return;
    }
    m_alphabet.flatland()->delete_group(m_group_slot);
    m_alphabet.release();
}

bool Flatland_group::update_items(std::vector<Flatland_item> items)
{
    if (!is_valid()) {
        return false;
    }
    return m_alphabet.flatland()->update_items(m_group_slot, std::move(items));
}

bool Flatland_group::update_transform(const glm::mat4& transform)
{
    if (!is_valid()) {
        return false;
    }
    return m_alphabet.flatland()->update_transform(m_group_slot, transform);
}

bool Flatland_group::update_color(color_t color)
{
    if (!is_valid()) {
        return false;
    }
    return m_alphabet.flatland()->update_color(m_group_slot, color);
}

} // namespace vnm::flatland

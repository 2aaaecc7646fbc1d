#pragma once

// VNM Flatland Library - Handles
// Value handles granting access to alphabet and group slots.

#include "flatland.h"
#include "types.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <glm/mat4x4.hpp>

namespace vnm::flatland {

// -----------------------------------------------------------------------------
// Alphabet
// -----------------------------------------------------------------------------
// Reference-counted handle to one alphabet slot. Every live Alphabet holds
// exactly one reference: copying increments the slot's reference count,
// destruction or release() decrements it. A moved-from or released handle is
// empty and holds nothing.
class Alphabet
{
public:
    Alphabet() = default;

    // Takes over one reference already counted for `slot`.
    Alphabet(std::shared_ptr<Flatland> flatland, slot_id_t slot);

    Alphabet(const Alphabet& other);
    Alphabet& operator=(const Alphabet& other);
    Alphabet(Alphabet&& other) noexcept;
    Alphabet& operator=(Alphabet&& other) noexcept;
    ~Alphabet();

    // Drops this handle's reference. Idempotent.
    void release();

    [[nodiscard]] bool is_valid() const noexcept { return static_cast<bool>(m_flatland); }
    [[nodiscard]] slot_id_t slot() const noexcept { return m_slot; }
    [[nodiscard]] const std::shared_ptr<Flatland>& flatland() const noexcept { return m_flatland; }

    [[nodiscard]] std::uint32_t ref_count() const;
    [[nodiscard]] std::size_t entry_count() const;

    [[nodiscard]] std::optional<std::size_t> get_entry_index(std::uint32_t id) const;

    // Returns the new entry's index; nullopt on an empty handle, a duplicate
    // id or malformed geometry.
    std::optional<std::size_t> add_entry(
        std::uint32_t id,
        std::vector<vertex_t> vertices,
        std::vector<index_t> indices);

private:
    std::shared_ptr<Flatland> m_flatland;
    slot_id_t                 m_slot;
};

// Creates an alphabet in `flatland` and returns its first handle.
[[nodiscard]] Alphabet create_alphabet(const std::shared_ptr<Flatland>& flatland);

// -----------------------------------------------------------------------------
// Flatland_group
// -----------------------------------------------------------------------------
// Sole owner of one group slot. Keeps its own Alphabet copy, so the alphabet
// outlives the group even if the caller drops its handles first.
// Destruction or release() deletes the group exactly once.
class Flatland_group
{
public:
    Flatland_group() = default;

    // The group is empty (is_valid() == false) if `alphabet` is empty.
    Flatland_group(
        const glm::mat4& transform,
        color_t color,
        const Alphabet& alphabet,
        std::vector<Flatland_item> items);

    Flatland_group(const Flatland_group&) = delete;
    Flatland_group& operator=(const Flatland_group&) = delete;
    Flatland_group(Flatland_group&& other) noexcept;
    Flatland_group& operator=(Flatland_group&& other) noexcept;
    ~Flatland_group();

    // Deletes the group and drops its alphabet reference. Idempotent.
    void release();

    [[nodiscard]] bool is_valid() const noexcept { return m_alphabet.is_valid(); }
    [[nodiscard]] slot_id_t slot() const noexcept { return m_group_slot; }
    [[nodiscard]] const Alphabet& alphabet() const noexcept { return m_alphabet; }

    bool update_items(std::vector<Flatland_item> items);
    bool update_transform(const glm::mat4& transform);
    bool update_color(color_t color);

private:
    Alphabet  m_alphabet;
    slot_id_t m_group_slot;
};

} // namespace vnm::flatland

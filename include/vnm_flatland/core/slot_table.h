#pragma once
// VNM Flatland Library - Slot Table
// Reusable-slot storage with generation tags.

#include "types.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace vnm::flatland {

// -----------------------------------------------------------------------------
// Slot_table
// -----------------------------------------------------------------------------
// Stores values in a vector of slots. Freed slots are pushed onto a free list
// and handed out again (most recently freed first) by the next insert.
// Every free advances the slot's generation; lookups compare generations, so a
// slot_id_t that outlived its value resolves to nothing.
template <typename T>
class Slot_table
{
public:
    Slot_table() = default;

    slot_id_t insert(T value)
    {
        if (!m_free.empty()) {
            const std::uint32_t index = m_free.back();
            m_free.pop_back();
            slot_t& slot = m_slots[index];
            slot.value.emplace(std::move(value));
            ++m_live;
            return {index, slot.generation};
        }

        const auto index = static_cast<std::uint32_t>(m_slots.size());
        m_slots.push_back(slot_t{std::optional<T>(std::move(value)), 0});
        ++m_live;
        return {index, 0};
    }

    // Returns false if the id is stale or already freed.
    bool erase(slot_id_t id)
    {
        slot_t* slot = live_slot(id);
        if (!slot) {
            return false;
        }
        slot->value.reset();
        ++slot->generation;
        m_free.push_back(id.index);
        --m_live;
        return true;
    }

    [[nodiscard]] T* get(slot_id_t id)
    {
        slot_t* slot = live_slot(id);
        return slot ? &*slot->value : nullptr;
    }

    [[nodiscard]] const T* get(slot_id_t id) const
    {
        const slot_t* slot = live_slot(id);
        return slot ? &*slot->value : nullptr;
    }

    [[nodiscard]] bool contains(slot_id_t id) const { return live_slot(id) != nullptr; }

    // Number of occupied slots.
    [[nodiscard]] std::size_t size() const noexcept { return m_live; }
    [[nodiscard]] bool empty() const noexcept { return m_live == 0; }

    // Number of slots ever allocated, free or occupied.
    [[nodiscard]] std::size_t slot_count() const noexcept { return m_slots.size(); }

    // Visits occupied slots in index order: f(slot_id_t, const T&).
    template <typename F>
    void for_each(F&& f) const
    {
        for (std::size_t i = 0; i < m_slots.size(); ++i) {
            const slot_t& slot = m_slots[i];
            if (slot.value) {
                f(slot_id_t{static_cast<std::uint32_t>(i), slot.generation}, *slot.value);
            }
        }
    }

private:
    struct slot_t
    {
        std::optional<T> value;
        std::uint32_t    generation = 0;
    };

    slot_t* live_slot(slot_id_t id)
    {
        if (id.index >= m_slots.size()) {
            return nullptr;
        }
        slot_t& slot = m_slots[id.index];
        if (!slot.value || slot.generation != id.generation) {
            return nullptr;
        }
        return &slot;
    }

    const slot_t* live_slot(slot_id_t id) const
    {
        return const_cast<Slot_table*>(this)->live_slot(id);
    }

    std::vector<slot_t>        m_slots;
    std::vector<std::uint32_t> m_free;
    std::size_t                m_live = 0;
};

} // namespace vnm::flatland

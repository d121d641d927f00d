/// @file OrderedHashMap.hpp
/// @brief Insertion-ordered hash map: dense entry array plus an open-addressing index table.
///
/// Entries live in a `Vector` in insertion order, so every entry has a stable ordinal position.
/// The slot table stores `position + 1` (0 marks an empty slot) and is probed linearly.
/// Insert-only: nothing is ever removed, so positions never change once assigned.
#pragma once

#include <Strata/Config.hpp>
#include <Strata/Containers/HashMap.hpp>
#include <Strata/Containers/Vector.hpp>
#include <Strata/Memory/AllocatorConcept.hpp>
#include <Strata/Memory/SystemAllocator.hpp>
#include <Strata/Primitives.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Strata::Containers
{
    template<typename Key,
             typename Value,
             typename Hash                          = std::hash<Key>,
             typename KeyEqual                      = std::equal_to<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class OrderedHashMap
    {
    public:
        using key_type    = Key;
        using mapped_type = Value;
        using size_type   = std::size_t;

        static constexpr double    kMaxLoadFactor = 0.75;
        static constexpr size_type kInitialSlots  = STRATA_ORDERED_MAP_INITIAL_SLOTS;

        static_assert(std::is_nothrow_move_constructible_v<Key> && std::is_nothrow_move_constructible_v<Value>,
                      "OrderedHashMap requires nothrow move constructible Key and Value (entry relocation).");

        struct Entry
        {
            std::size_t                 hash;
            Key                         key;
            [[no_unique_address]] Value value;
        };

        /// @brief Result of `TryEmplaceFull`: the entry's position, its stored value, and whether it is new.
        struct EmplaceResult
        {
            UIntSize index;
            Value*   value;
            bool     inserted;
        };

        OrderedHashMap() = default;

        explicit OrderedHashMap(const Hash& hash, const KeyEqual& equal = KeyEqual {},
                                const AllocatorType& allocator = AllocatorType {})
            : m_hash(hash), m_equal(equal), m_entries(0, allocator), m_slots(0, allocator)
        {
        }

        OrderedHashMap(const OrderedHashMap&)            = delete;
        OrderedHashMap& operator=(const OrderedHashMap&) = delete;
        OrderedHashMap(OrderedHashMap&&) noexcept        = default;
        OrderedHashMap& operator=(OrderedHashMap&&) noexcept = default;
        ~OrderedHashMap()                                = default;

        //--------------------------------------------------------------------------
        // Core ops
        //--------------------------------------------------------------------------

        /// @brief Insert `key -> value` at the end unless `key` is present; the argument is not
        ///        consumed when it is.
        template<class K, class V>
        EmplaceResult TryEmplaceFull(K&& key, V&& value)
        {
            const auto h = static_cast<std::size_t>(m_hash(key));
            if (const auto found = FindIndex_(key, h))
                return {*found, &m_entries[*found].value, false};

            if (m_slots.Size() == 0 ||
                static_cast<double>(m_entries.Size() + 1) > static_cast<double>(m_slots.Size()) * kMaxLoadFactor)
                Rebuild_(m_slots.Size() ? m_slots.Size() * 2 : kInitialSlots);

            const UIntSize index = m_entries.Size();
            m_entries.EmplaceBack(Entry {h, Key(std::forward<K>(key)), Value(std::forward<V>(value))});
            m_slots[FindEmptySlot_(h)] = index + 1;
            return {index, &m_entries[index].value, true};
        }

        template<class K, class V>
        std::pair<Value*, bool> TryEmplace(K&& key, V&& value)
        {
            auto result = TryEmplaceFull(std::forward<K>(key), std::forward<V>(value));
            return {result.value, result.inserted};
        }

        /// @brief Position of `key`, if present.
        template<class K>
        [[nodiscard]] std::optional<UIntSize> GetIndex(const K& key) const
        {
            if (m_entries.Empty())
                return std::nullopt;
            return FindIndex_(key, static_cast<std::size_t>(m_hash(key)));
        }

        template<class K>
        [[nodiscard]] const Value* GetPtr(const K& key) const
        {
            const auto index = GetIndex(key);
            return index ? &m_entries[*index].value : nullptr;
        }

        template<class K>
        [[nodiscard]] Value* GetPtr(const K& key)
        {
            const auto index = GetIndex(key);
            return index ? &m_entries[*index].value : nullptr;
        }

        template<class K>
        [[nodiscard]] const Value& Get(const K& key) const
        {
            const Value* p = GetPtr(key);
            if (!p)
                throw std::out_of_range("Key not found in ordered hashmap");
            return *p;
        }

        template<class K>
        [[nodiscard]] bool Contains(const K& key) const
        {
            return GetIndex(key).has_value();
        }

        [[nodiscard]] const Key& KeyAt(UIntSize index) const { return m_entries.At(index).key; }
        [[nodiscard]] const Value& ValueAt(UIntSize index) const { return m_entries.At(index).value; }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        [[nodiscard]] UIntSize Size() const noexcept { return m_entries.Size(); }
        [[nodiscard]] bool     Empty() const noexcept { return m_entries.Empty(); }

        void Reserve(UIntSize count)
        {
            m_entries.Reserve(count);
            size_type slots = detail::NextPow2(static_cast<size_type>(static_cast<double>(count) / kMaxLoadFactor) + 1);
            if (slots < kInitialSlots)
                slots = kInitialSlots;
            if (slots > m_slots.Size())
                Rebuild_(slots);
        }

        //--------------------------------------------------------------------------
        // Iteration (insertion order)
        //--------------------------------------------------------------------------

        [[nodiscard]] const Entry* begin() const noexcept { return m_entries.begin(); }
        [[nodiscard]] const Entry* end() const noexcept { return m_entries.end(); }

        template<class Fn>
        void ForEachEntry(Fn&& fn) const
        {
            for (const Entry& entry : m_entries)
                fn(entry.key, entry.value);
        }

    private:
        template<class K>
        [[nodiscard]] std::optional<UIntSize> FindIndex_(const K& key, std::size_t h) const
        {
            const size_type capacity = m_slots.Size();
            if (capacity == 0)
                return std::nullopt;
            const size_type mask = capacity - 1;
            for (size_type slot = h & mask;; slot = (slot + 1) & mask)
            {
                const UIntSize stored = m_slots[slot];
                if (stored == 0)
                    return std::nullopt;
                const Entry& entry = m_entries[stored - 1];
                if (entry.hash == h && m_equal(entry.key, key))
                    return stored - 1;
            }
        }

        [[nodiscard]] size_type FindEmptySlot_(std::size_t h) const noexcept
        {
            const size_type mask = m_slots.Size() - 1;
            size_type       slot = h & mask;
            while (m_slots[slot] != 0)
                slot = (slot + 1) & mask;
            return slot;
        }

        // Entries keep their positions; only the slot table is rebuilt.
        void Rebuild_(size_type slotCount)
        {
            Vector<UIntSize, AllocatorType> slots(slotCount, m_slots.Allocator());
            for (size_type i = 0; i < slotCount; ++i)
                slots.PushBack(0);
            m_slots = std::move(slots);
            for (UIntSize i = 0; i < m_entries.Size(); ++i)
                m_slots[FindEmptySlot_(m_entries[i].hash)] = i + 1;
        }

        [[no_unique_address]] Hash     m_hash {};
        [[no_unique_address]] KeyEqual m_equal {};
        Vector<Entry, AllocatorType>    m_entries {};
        Vector<UIntSize, AllocatorType> m_slots {};
    };
}// namespace Strata::Containers

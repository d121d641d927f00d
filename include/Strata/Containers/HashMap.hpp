/// @file HashMap.hpp
/// @brief Insert-only flat hash map: the default backing store of `AppendOnlyMap`.
///
/// - Open addressing with linear probing over a power-of-two table (at least
///   `STRATA_FLAT_MAP_INITIAL_CAPACITY` slots, load factor at most 3/4).
/// - A tag array marks occupied slots and caches a fragment of each hash; entries live in a
///   parallel, uninitialized array and are constructed in place.
/// - Nothing is erased or overwritten. `TryEmplace` on a present key leaves both arguments intact.
/// - Growth relocates every entry, so `Key` and `Value` must be nothrow-move-constructible, and
///   pointers into the table do not survive an insertion.
#pragma once

#include <Strata/Config.hpp>
#include <Strata/Defines.hpp>
#include <Strata/Memory/AllocatorConcept.hpp>
#include <Strata/Memory/SystemAllocator.hpp>
#include <Strata/Primitives.hpp>

#include <algorithm>
#include <bit>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Strata::Containers
{
    namespace detail
    {
        constexpr std::size_t NextPow2(std::size_t value) noexcept
        {
            return value <= 1 ? 1 : std::bit_ceil(value);
        }

        /// @brief Satisfied when `K` can be hashed and compared against stored `Key`s directly.
        template<class Hash, class KeyEqual, class K, class Key>
        concept HeterogeneousLookup = requires(const Hash& h, const KeyEqual& eq, const K& k, const Key& kk) {
            h(k);
            eq(k, kk);
            eq(kk, k);
        };
    }// namespace detail

    template<typename Key,
             typename Value,
             typename Hash                          = std::hash<Key>,
             typename KeyEqual                      = std::equal_to<Key>,
             Memory::AllocatorConcept AllocatorType = Memory::SystemAllocator>
    class FlatHashMap
    {
    public:
        using key_type       = Key;
        using mapped_type    = Value;
        using hash_type      = Hash;
        using key_equal      = KeyEqual;
        using allocator_type = AllocatorType;
        using size_type      = std::size_t;

        static constexpr size_type kInitialCapacity = STRATA_FLAT_MAP_INITIAL_CAPACITY;

        static_assert(std::is_nothrow_move_constructible_v<Key> && std::is_nothrow_move_constructible_v<Value>,
                      "FlatHashMap relocates entries on growth; Key and Value must be nothrow move constructible.");

        struct Entry
        {
            Key                         key;
            [[no_unique_address]] Value value;
        };

        FlatHashMap() { Allocate_(kInitialCapacity); }

        explicit FlatHashMap(size_type initialCapacity,
                             const Hash& hash               = Hash {},
                             const KeyEqual& equal          = KeyEqual {},
                             const AllocatorType& allocator = AllocatorType {})
            : m_hash(hash), m_equal(equal), m_allocator(allocator)
        {
            Allocate_(std::max(detail::NextPow2(initialCapacity), kInitialCapacity));
        }

        FlatHashMap(const FlatHashMap&)            = delete;
        FlatHashMap& operator=(const FlatHashMap&) = delete;

        FlatHashMap(FlatHashMap&& other) noexcept
            : m_hash(std::move(other.m_hash)),
              m_equal(std::move(other.m_equal)),
              m_allocator(std::move(other.m_allocator)),
              m_tags(std::exchange(other.m_tags, nullptr)),
              m_entries(std::exchange(other.m_entries, nullptr)),
              m_capacity(std::exchange(other.m_capacity, 0)),
              m_size(std::exchange(other.m_size, 0))
        {
        }

        FlatHashMap& operator=(FlatHashMap&& other) noexcept
        {
            if (this != &other)
            {
                Release_();
                m_hash      = std::move(other.m_hash);
                m_equal     = std::move(other.m_equal);
                m_allocator = std::move(other.m_allocator);
                m_tags      = std::exchange(other.m_tags, nullptr);
                m_entries   = std::exchange(other.m_entries, nullptr);
                m_capacity  = std::exchange(other.m_capacity, 0);
                m_size      = std::exchange(other.m_size, 0);
            }
            return *this;
        }

        ~FlatHashMap() { Release_(); }

        //--------------------------------------------------------------------------
        // Insertion
        //--------------------------------------------------------------------------

        /// @brief Insert `key -> value` unless `key` is already present.
        /// @return The stored value for `key` and whether this call inserted it.
        template<class K, class V>
        std::pair<Value*, bool> TryEmplace(K&& key, V&& value)
        {
            const std::size_t hash = m_hash(std::as_const(key));
            if (Entry* existing = Find_(key, hash))
                return {&existing->value, false};

            if ((m_size + 1) * 4 > m_capacity * 3)
                Rehash(m_capacity * 2);

            const size_type slot = FreeSlot_(hash);
            Entry* entry = std::construct_at(m_entries + slot, Entry {Key(std::forward<K>(key)), Value(std::forward<V>(value))});
            m_tags[slot] = TagOf_(hash);
            ++m_size;
            return {&entry->value, true};
        }

        //--------------------------------------------------------------------------
        // Lookup
        //--------------------------------------------------------------------------

        [[nodiscard]] Value* GetPtr(const Key& key) { return ValueOf_(Find_(key, m_hash(key))); }
        [[nodiscard]] const Value* GetPtr(const Key& key) const { return ValueOf_(Find_(key, m_hash(key))); }

        template<class K>
            requires detail::HeterogeneousLookup<Hash, KeyEqual, K, Key>
        [[nodiscard]] Value* GetPtr(const K& key)
        {
            return ValueOf_(Find_(key, m_hash(key)));
        }

        template<class K>
            requires detail::HeterogeneousLookup<Hash, KeyEqual, K, Key>
        [[nodiscard]] const Value* GetPtr(const K& key) const
        {
            return ValueOf_(Find_(key, m_hash(key)));
        }

        /// @throws std::out_of_range if `key` is absent.
        template<class K>
        [[nodiscard]] const Value& Get(const K& key) const
        {
            const Value* value = GetPtr(key);
            if (!value)
                throw std::out_of_range("FlatHashMap::Get: key not found");
            return *value;
        }

        template<class K>
        [[nodiscard]] bool Contains(const K& key) const
        {
            return GetPtr(key) != nullptr;
        }

        //--------------------------------------------------------------------------
        // Capacity
        //--------------------------------------------------------------------------

        [[nodiscard]] STRATA_ALWAYS_INLINE UIntSize Size() const noexcept { return m_size; }
        [[nodiscard]] STRATA_ALWAYS_INLINE UIntSize Capacity() const noexcept { return m_capacity; }
        [[nodiscard]] STRATA_ALWAYS_INLINE bool Empty() const noexcept { return m_size == 0; }

        /// @brief Make room for `count` entries without further growth.
        void Reserve(UIntSize count)
        {
            const size_type needed = detail::NextPow2((count * 4 + 2) / 3 + 1);
            if (needed > m_capacity)
                Rehash(needed);
        }

        /// @brief Move every entry into a table of at least `slotCount` slots. Never shrinks.
        void Rehash(UIntSize slotCount)
        {
            size_type capacity = std::max(detail::NextPow2(slotCount), kInitialCapacity);
            while (m_size * 4 > capacity * 3)
                capacity *= 2;
            if (capacity <= m_capacity)
                return;

            UIntSize* oldTags     = m_tags;
            Entry*    oldEntries  = m_entries;
            size_type oldCapacity = m_capacity;
            Allocate_(capacity);

            for (size_type i = 0; i < oldCapacity; ++i)
            {
                if (oldTags[i] == 0)
                    continue;
                const size_type slot = FreeSlot_(oldTags[i]);
                std::construct_at(m_entries + slot, std::move(oldEntries[i]));
                std::destroy_at(oldEntries + i);
                m_tags[slot] = oldTags[i];
            }
            Deallocate_(oldTags, oldEntries, oldCapacity);
        }

        //--------------------------------------------------------------------------
        // Iteration (table order)
        //--------------------------------------------------------------------------

        class ConstIterator
        {
        public:
            using difference_type   = std::ptrdiff_t;
            using value_type        = Entry;
            using reference         = const Entry&;
            using pointer           = const Entry*;
            using iterator_category = std::forward_iterator_tag;

            ConstIterator() = default;
            ConstIterator(const FlatHashMap* map, size_type slot) : m_map(map), m_slot(slot) { SkipEmpty_(); }

            reference operator*() const { return m_map->m_entries[m_slot]; }
            pointer   operator->() const { return m_map->m_entries + m_slot; }

            ConstIterator& operator++()
            {
                ++m_slot;
                SkipEmpty_();
                return *this;
            }

            ConstIterator operator++(int)
            {
                ConstIterator copy = *this;
                ++*this;
                return copy;
            }

            bool operator==(const ConstIterator& other) const { return m_map == other.m_map && m_slot == other.m_slot; }
            bool operator!=(const ConstIterator& other) const { return !(*this == other); }

        private:
            void SkipEmpty_()
            {
                while (m_map && m_slot < m_map->m_capacity && m_map->m_tags[m_slot] == 0)
                    ++m_slot;
            }

            const FlatHashMap* m_map {nullptr};
            size_type          m_slot {0};
        };

        [[nodiscard]] ConstIterator begin() const { return ConstIterator(this, 0); }
        [[nodiscard]] ConstIterator end() const { return ConstIterator(this, m_capacity); }

        /// @brief Visit every entry as `fn(const Key&, const Value&)`.
        template<class Fn>
        void ForEachEntry(Fn&& fn) const
        {
            for (const Entry& entry : *this)
                fn(entry.key, entry.value);
        }

    private:
        // Zero marks an empty slot, so the top bit of every stored tag is forced on. Capacities stay
        // below that bit, so `tag & mask` is the entry's home slot and `Rehash` can place by tag.
        static constexpr UIntSize kOccupiedBit = UIntSize {1} << (sizeof(UIntSize) * 8 - 1);

        [[nodiscard]] static constexpr UIntSize TagOf_(std::size_t hash) noexcept { return hash | kOccupiedBit; }

        [[nodiscard]] static Value* ValueOf_(const Entry* entry) noexcept
        {
            return entry ? const_cast<Value*>(&entry->value) : nullptr;
        }

        template<class K>
        [[nodiscard]] Entry* Find_(const K& key, std::size_t hash) const
        {
            if (m_capacity == 0)
                return nullptr;
            const UIntSize  tag  = TagOf_(hash);
            const size_type mask = m_capacity - 1;
            for (size_type slot = hash & mask;; slot = (slot + 1) & mask)
            {
                if (m_tags[slot] == 0)
                    return nullptr;
                if (m_tags[slot] == tag && m_equal(m_entries[slot].key, key))
                    return m_entries + slot;
            }
        }

        // The load factor leaves free slots, so the probe terminates.
        [[nodiscard]] size_type FreeSlot_(std::size_t hash) const noexcept
        {
            const size_type mask = m_capacity - 1;
            size_type       slot = hash & mask;
            while (m_tags[slot] != 0)
                slot = (slot + 1) & mask;
            return slot;
        }

        void Allocate_(size_type capacity)
        {
            if (capacity >= kOccupiedBit || capacity > static_cast<size_type>(-1) / (sizeof(Entry) + sizeof(UIntSize)))
                throw std::bad_alloc {};
            void* tags = m_allocator.Allocate(capacity * sizeof(UIntSize), alignof(UIntSize));
            if (!tags)
                throw std::bad_alloc {};
            void* entries = m_allocator.Allocate(capacity * sizeof(Entry), alignof(Entry));
            if (!entries)
            {
                m_allocator.Deallocate(tags, capacity * sizeof(UIntSize), alignof(UIntSize));
                throw std::bad_alloc {};
            }
            m_tags = static_cast<UIntSize*>(tags);
            std::uninitialized_fill_n(m_tags, capacity, UIntSize {0});
            m_entries  = static_cast<Entry*>(entries);
            m_capacity = capacity;
        }

        void Deallocate_(UIntSize* tags, Entry* entries, size_type capacity) noexcept
        {
            if (!tags)
                return;
            m_allocator.Deallocate(entries, capacity * sizeof(Entry), alignof(Entry));
            m_allocator.Deallocate(tags, capacity * sizeof(UIntSize), alignof(UIntSize));
        }

        void Release_() noexcept
        {
            if (!m_tags)
                return;
            for (size_type i = 0; i < m_capacity; ++i)
            {
                if (m_tags[i] != 0)
                    std::destroy_at(m_entries + i);
            }
            Deallocate_(m_tags, m_entries, m_capacity);
            m_tags     = nullptr;
            m_entries  = nullptr;
            m_capacity = 0;
            m_size     = 0;
        }

        [[no_unique_address]] Hash          m_hash {};
        [[no_unique_address]] KeyEqual      m_equal {};
        [[no_unique_address]] AllocatorType m_allocator {};

        UIntSize* m_tags {nullptr};
        Entry*    m_entries {nullptr};
        size_type m_capacity {0};
        size_type m_size {0};
    };
}// namespace Strata::Containers

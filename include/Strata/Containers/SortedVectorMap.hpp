/// @file SortedVectorMap.hpp
/// @brief Insert-only map kept as a key-sorted contiguous array; lookups are binary searches.
#pragma once

#include <Strata/Containers/Vector.hpp>
#include <Strata/Primitives.hpp>

#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Strata::Containers
{
    /// @brief Entries sorted by `Compare`; insertion shifts later entries right.
    /// @tparam Compare Strict weak ordering. The transparent default allows probing with any
    ///         type comparable to `Key`.
    template<typename Key, typename Value, typename Compare = std::less<>>
    class SortedVectorMap
    {
    public:
        using key_type    = Key;
        using mapped_type = Value;

        static_assert(std::is_nothrow_move_constructible_v<Key> && std::is_nothrow_move_constructible_v<Value>,
                      "SortedVectorMap requires nothrow move constructible Key and Value (entry shifting).");

        struct Entry
        {
            Key   key;
            Value value;
        };

        SortedVectorMap() = default;
        explicit SortedVectorMap(const Compare& compare) : m_compare(compare) {}

        SortedVectorMap(const SortedVectorMap&)                = delete;
        SortedVectorMap& operator=(const SortedVectorMap&)     = delete;
        SortedVectorMap(SortedVectorMap&&) noexcept            = default;
        SortedVectorMap& operator=(SortedVectorMap&&) noexcept = default;

        template<class K, class V>
        std::pair<Value*, bool> TryEmplace(K&& key, V&& value)
        {
            const UIntSize pos = LowerBound_(key);
            if (pos < m_entries.Size() && !m_compare(key, m_entries[pos].key))
                return {&m_entries[pos].value, false};
            Entry& entry = m_entries.EmplaceAt(pos, Entry {Key(std::forward<K>(key)), Value(std::forward<V>(value))});
            return {&entry.value, true};
        }

        template<class K>
        [[nodiscard]] const Value* GetPtr(const K& key) const
        {
            const UIntSize pos = LowerBound_(key);
            if (pos < m_entries.Size() && !m_compare(key, m_entries[pos].key))
                return &m_entries[pos].value;
            return nullptr;
        }

        template<class K>
        [[nodiscard]] Value* GetPtr(const K& key)
        {
            return const_cast<Value*>(std::as_const(*this).GetPtr(key));
        }

        template<class K>
        [[nodiscard]] const Value& Get(const K& key) const
        {
            const Value* p = GetPtr(key);
            if (!p)
                throw std::out_of_range("Key not found in sorted map");
            return *p;
        }

        template<class K>
        [[nodiscard]] bool Contains(const K& key) const
        {
            return GetPtr(key) != nullptr;
        }

        [[nodiscard]] UIntSize Size() const noexcept { return m_entries.Size(); }
        [[nodiscard]] bool     Empty() const noexcept { return m_entries.Empty(); }
        void                   Reserve(UIntSize count) { m_entries.Reserve(count); }

        [[nodiscard]] const Entry* begin() const noexcept { return m_entries.begin(); }
        [[nodiscard]] const Entry* end() const noexcept { return m_entries.end(); }

        /// @brief Visit every entry in ascending key order.
        template<class Fn>
        void ForEachEntry(Fn&& fn) const
        {
            for (const Entry& entry : m_entries)
                fn(entry.key, entry.value);
        }

    private:
        template<class K>
        [[nodiscard]] UIntSize LowerBound_(const K& key) const
        {
            UIntSize lo = 0;
            UIntSize hi = m_entries.Size();
            while (lo < hi)
            {
                const UIntSize mid = lo + (hi - lo) / 2;
                if (m_compare(m_entries[mid].key, key))
                    lo = mid + 1;
                else
                    hi = mid;
            }
            return lo;
        }

        [[no_unique_address]] Compare m_compare {};
        Vector<Entry>                 m_entries {};
    };
}// namespace Strata::Containers

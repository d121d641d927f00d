/// @file StringInterner.hpp
/// @brief String interning table built on `AppendOnlyIndexSet`.
#pragma once

#include <Strata/Containers/AppendOnlyIndexSet.hpp>
#include <Strata/Hashing/FNV.hpp>
#include <Strata/Memory/SmartPointers.hpp>
#include <Strata/Primitives.hpp>

#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Strata::Utilities
{
    /// @brief Maps every distinct string to a dense id and a view that stays valid for the
    ///        interner's lifetime.
    ///
    /// Each string is copied once into its own heap block, so views survive any amount of later
    /// interning. Interning works through a `const` interner. Not thread-safe.
    class StringInterner
    {
    public:
        struct Statistics
        {
            UInt64 lookups {0};
            UInt64 lookupHits {0};
            UInt64 inserted {0};
            UInt64 totalBytesStored {0};
        };

        using IdType = UInt32;

        static constexpr IdType INVALID_ID = std::numeric_limits<IdType>::max();

        StringInterner()                                 = default;
        StringInterner(StringInterner&&)                 = default;
        StringInterner& operator=(StringInterner&&)      = default;
        StringInterner(const StringInterner&)            = delete;
        StringInterner& operator=(const StringInterner&) = delete;

        /// @brief Number of distinct strings stored.
        [[nodiscard]] UIntSize Size() const { return m_strings.Size(); }

        [[nodiscard]] bool Empty() const { return m_strings.Empty(); }

        /// @brief Total bytes copied from caller strings (excludes bookkeeping).
        [[nodiscard]] UInt64 TotalStoredBytes() const noexcept { return m_totalBytes; }

        [[nodiscard]] Statistics GetStatistics() const noexcept
        {
            Statistics stats       = m_stats;
            stats.totalBytesStored = m_totalBytes;
            return stats;
        }

        void ResetStatistics() noexcept { m_stats = {}; }

        /// @brief Insert the string if missing and return its identifier.
        /// @throws std::length_error once every id is taken.
        [[nodiscard]] IdType InsertOrGet(std::string_view value) const
        {
            ++m_stats.lookups;
            if (const auto found = m_strings.GetFull(value))
            {
                ++m_stats.lookupHits;
                return static_cast<IdType>(found->index);
            }
            if (m_strings.Size() >= INVALID_ID)
                throw std::length_error("StringInterner: id space exhausted");
            const auto stored = m_strings.InsertFull(Memory::MakeScoped<std::string>(value));
            ++m_stats.inserted;
            m_totalBytes += value.size();
            return static_cast<IdType>(stored.index);
        }

        /// @brief Return the identifier for the string if present.
        [[nodiscard]] bool TryGetId(std::string_view value, IdType& out) const
        {
            ++m_stats.lookups;
            const auto found = m_strings.GetFull(value);
            if (!found)
                return false;
            ++m_stats.lookupHits;
            out = static_cast<IdType>(found->index);
            return true;
        }

        /// @brief Intern the string and return a view that lives as long as the interner.
        [[nodiscard]] std::string_view Intern(std::string_view value) const
        {
            return View(InsertOrGet(value));
        }

        /// @brief Retrieve a previously interned string by id; empty for unknown ids.
        [[nodiscard]] std::string_view View(IdType id) const
        {
            if (id == INVALID_ID)
                return {};
            const std::string* stored = m_strings.GetIndex(id);
            return stored ? std::string_view(*stored) : std::string_view {};
        }

    private:
        Containers::AppendOnlyIndexSet<Memory::Scoped<std::string>, Hashing::FNV1aStringHash> m_strings;

        mutable Statistics m_stats {};
        mutable UInt64     m_totalBytes {0};
    };
}// namespace Strata::Utilities

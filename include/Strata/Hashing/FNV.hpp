/// @file FNV.hpp
/// @brief FNV-1a hashing of byte strings, plus a transparent hasher for string-keyed containers.
#pragma once

#include <Strata/Primitives.hpp>

#include <string_view>

namespace Strata::Hashing
{
    inline constexpr UInt64 kFnv64OffsetBasis = 0xcbf29ce484222325ull;
    inline constexpr UInt64 kFnv64Prime       = 0x100000001b3ull;

    /// @brief 64-bit FNV-1a over the bytes of `text`. Usable in constant expressions.
    constexpr UInt64 FNV1a64(std::string_view text) noexcept
    {
        UInt64 hash = kFnv64OffsetBasis;
        for (const char c : text)
        {
            hash ^= static_cast<UInt8>(c);
            hash *= kFnv64Prime;
        }
        return hash;
    }

    /// @brief Hasher for `std::string` keys that also accepts views and literals.
    ///
    /// Every argument passes through `std::string_view`, so a stored string and a borrowed view of
    /// the same characters hash identically. Marked transparent for heterogeneous lookup.
    struct FNV1aStringHash
    {
        using is_transparent = void;

        [[nodiscard]] constexpr UIntSize operator()(std::string_view text) const noexcept
        {
            return static_cast<UIntSize>(FNV1a64(text));
        }
    };
}// namespace Strata::Hashing

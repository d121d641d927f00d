/// @file Primitives.hpp
/// @brief Fixed-width integer aliases shared by every Strata header.
#pragma once

#include <cstddef>
#include <cstdint>

namespace Strata
{
    using UInt8  = std::uint8_t;
    using UInt32 = std::uint32_t;
    using UInt64 = std::uint64_t;

    /// @brief Element counts, byte sizes and container positions.
    using UIntSize = std::size_t;
}// namespace Strata

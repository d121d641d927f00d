/// @file Diagnostics.hpp
/// @brief Minimal diagnostics channel for library-level events (gate poisoning, rejected re-entry).
///
/// Messages are written as `[Component] message` lines to `std::cerr` unless a sink is installed.
/// Verbosity is fixed at compile time through `STRATA_DIAGNOSTICS_LEVEL`.
#pragma once

#include <Strata/Config.hpp>
#include <Strata/Defines.hpp>
#include <Strata/Primitives.hpp>

#include <string_view>

namespace Strata::Diagnostics
{
    enum class Severity : UInt8
    {
        Error   = 1,
        Warning = 2,
    };

    /// @brief Receives every message that passes the compile-time level filter.
    using Sink = void (*)(Severity severity, std::string_view component, std::string_view message);

    /// @brief Install a sink. Passing `nullptr` restores the default `std::cerr` sink.
    /// @return The previously installed sink (`nullptr` when the default was active).
    STRATA_API Sink SetSink(Sink sink) noexcept;

    /// @brief Unfiltered write to the active sink.
    STRATA_API void Write(Severity severity, std::string_view component, std::string_view message) noexcept;

    [[nodiscard]] constexpr bool IsEnabled(Severity severity) noexcept
    {
        return static_cast<int>(severity) <= STRATA_DIAGNOSTICS_LEVEL;
    }

    inline void Log(Severity severity, std::string_view component, std::string_view message) noexcept
    {
        if (!IsEnabled(severity))
            return;
        Write(severity, component, message);
    }
}// namespace Strata::Diagnostics

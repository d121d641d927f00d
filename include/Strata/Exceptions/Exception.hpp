/// @file Exception.hpp
/// @brief Root of the Strata exception hierarchy.
#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <version>

#if defined(__cpp_lib_stacktrace)
#include <stacktrace>
#endif

namespace Strata::Exceptions
{
    /// @brief Base for the errors Strata raises itself.
    ///
    /// Argument and bounds errors use the standard exception types; this hierarchy covers failures
    /// that are specific to append-only containers (re-entrancy, poisoning). Derives from
    /// `std::runtime_error`, so `what()` and `GetMessage()` return the same text.
    class Exception : public std::runtime_error
    {
    public:
        explicit Exception(const char* message) : std::runtime_error(message) {}
        explicit Exception(const std::string& message) : std::runtime_error(message) {}

        [[nodiscard]] const char* GetMessage() const noexcept { return what(); }

#if defined(__cpp_lib_stacktrace)
        /// @brief Stack trace, captured on the first call rather than at the throw site.
        [[nodiscard]] const std::stacktrace& GetStacktrace() const
        {
            if (!m_stacktrace)
                m_stacktrace = std::stacktrace::current();
            return *m_stacktrace;
        }

    private:
        mutable std::optional<std::stacktrace> m_stacktrace;
#endif
    };
}// namespace Strata::Exceptions

#pragma once

/// @file ReentrancyException.hpp
/// @brief Declares the ReentrancyException class.

#include <Strata/Defines.hpp>
#include <Strata/Exceptions/Exception.hpp>

namespace Strata::Exceptions
{
    /// @class ReentrancyException
    /// @brief Thrown when a container is mutated while another mutation of the same container is in progress.
    ///
    /// @details
    /// This signals a programming error, typically a producer, hash or equality function that inserts
    /// into the container it is being called from. The offending call is aborted; the container is
    /// left exactly as it was before the nested call.
    class ReentrancyException : public Exception
    {
    public:
        /// @param container Name of the container type that rejected the call (static storage).
        STRATA_API explicit ReentrancyException(const char* container);

        /// @brief Name of the container type that rejected the call.
        [[nodiscard]] const char* GetContainer() const noexcept { return m_container; }

    private:
        const char* m_container;
    };
}// namespace Strata::Exceptions

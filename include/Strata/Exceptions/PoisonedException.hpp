#pragma once

/// @file PoisonedException.hpp
/// @brief Declares the PoisonedException class.

#include <Strata/Defines.hpp>
#include <Strata/Exceptions/Exception.hpp>

namespace Strata::Exceptions
{
    /// @class PoisonedException
    /// @brief Thrown by a synchronized container whose lock was abandoned by a failed mutation.
    ///
    /// @details
    /// Once a mutation exits by exception while holding the container lock, the backing store may
    /// be inconsistent. Every later mutation of that container throws this exception; lookups of
    /// entries that were already published keep working. The state is permanent.
    class PoisonedException : public Exception
    {
    public:
        /// @param container Name of the container type that is poisoned (static storage).
        STRATA_API explicit PoisonedException(const char* container);

        /// @brief Name of the poisoned container type.
        [[nodiscard]] const char* GetContainer() const noexcept { return m_container; }

    private:
        const char* m_container;
    };
}// namespace Strata::Exceptions

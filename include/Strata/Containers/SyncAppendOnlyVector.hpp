/// @file SyncAppendOnlyVector.hpp
/// @brief Append-only vector that may be shared between threads.
///
/// Concurrent `Insert` calls are totally ordered by the lock; each caller receives the index its
/// element was actually stored at. Lookups hold the shared lock only while reading the handle.
#pragma once

#include <Strata/Containers/AppendOnlyVector.hpp>
#include <Strata/Containers/MutationGate.hpp>

namespace Strata::Containers
{
    /// @brief Thread-safe append-only vector. Neither copyable nor movable.
    template<Memory::StableTargetConcept Handle>
    using SyncAppendOnlyVector = BasicAppendOnlyVector<Handle, LockedGate>;
}// namespace Strata::Containers

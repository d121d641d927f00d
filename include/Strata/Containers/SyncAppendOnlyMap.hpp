/// @file SyncAppendOnlyMap.hpp
/// @brief Append-only map that may be shared between threads.
///
/// Same contract as `AppendOnlyMap`; mutations are serialized by a readers-writer lock. Lookups
/// hold the shared side only while probing the table; a returned reference is read without any
/// lock. A mutation that exits by exception poisons the map: every later insertion throws
/// `Exceptions::PoisonedException`, while lookups of published entries keep working.
#pragma once

#include <Strata/Containers/AppendOnlyMap.hpp>
#include <Strata/Containers/BackingStore.hpp>
#include <Strata/Containers/MutationGate.hpp>

namespace Strata::Containers
{
    /// @brief Thread-safe append-only map. Neither copyable nor movable.
    template<class Key, Memory::StableTargetConcept Handle, class Storage = UnorderedStorage<>>
    using SyncAppendOnlyMap = BasicAppendOnlyMap<Key, Handle, Storage, LockedGate>;
}// namespace Strata::Containers

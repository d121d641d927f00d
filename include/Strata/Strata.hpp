/// @file Strata.hpp
/// @brief Umbrella header for the whole library.
#pragma once

#include <Strata/Config.hpp>
#include <Strata/Containers/AppendOnlyIndexSet.hpp>
#include <Strata/Containers/AppendOnlyMap.hpp>
#include <Strata/Containers/AppendOnlyVector.hpp>
#include <Strata/Containers/BackingStore.hpp>
#include <Strata/Containers/HashMap.hpp>
#include <Strata/Containers/MutationGate.hpp>
#include <Strata/Containers/OrderedHashMap.hpp>
#include <Strata/Containers/SortedVectorMap.hpp>
#include <Strata/Containers/SyncAppendOnlyMap.hpp>
#include <Strata/Containers/SyncAppendOnlyVector.hpp>
#include <Strata/Containers/Vector.hpp>
#include <Strata/Defines.hpp>
#include <Strata/Diagnostics.hpp>
#include <Strata/Exceptions/Exception.hpp>
#include <Strata/Exceptions/PoisonedException.hpp>
#include <Strata/Exceptions/ReentrancyException.hpp>
#include <Strata/Hashing/FNV.hpp>
#include <Strata/Memory/AllocatorConcept.hpp>
#include <Strata/Memory/CountingAllocator.hpp>
#include <Strata/Memory/SmartPointers.hpp>
#include <Strata/Memory/StableTarget.hpp>
#include <Strata/Memory/SystemAllocator.hpp>
#include <Strata/Primitives.hpp>
#include <Strata/Sync/SharedMutex.hpp>
#include <Strata/Utilities/StringInterner.hpp>

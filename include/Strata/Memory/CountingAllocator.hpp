/// @file CountingAllocator.hpp
/// @brief Allocator adaptor that reports every block it hands out to a shared ledger.
///
/// Copies of a `CountingAllocator` report into the same `AllocationLedger`, so all handles stored
/// in one container can be audited together: after the container is destroyed, `live` returns to
/// the value it had before the first insertion.
#pragma once

#include <atomic>
#include <utility>

#include <Strata/Memory/AllocatorConcept.hpp>
#include <Strata/Memory/SystemAllocator.hpp>
#include <Strata/Primitives.hpp>

namespace Strata::Memory
{
    /// @brief Counters shared by every copy of a `CountingAllocator`. Must outlive them.
    struct AllocationLedger
    {
        std::atomic<UIntSize> live {0};
        std::atomic<UIntSize> liveBytes {0};
        std::atomic<UIntSize> total {0};
        std::atomic<UIntSize> failed {0};
    };

    template<AllocatorConcept Inner = SystemAllocator>
    class CountingAllocator
    {
    public:
        explicit CountingAllocator(AllocationLedger& ledger, Inner inner = Inner {}) noexcept
            : m_ledger(&ledger), m_inner(std::move(inner))
        {
        }

        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment) noexcept
        {
            void* block = m_inner.Allocate(size, alignment);
            if (block == nullptr)
            {
                m_ledger->failed.fetch_add(1, std::memory_order_relaxed);
                return nullptr;
            }
            m_ledger->live.fetch_add(1, std::memory_order_relaxed);
            m_ledger->liveBytes.fetch_add(size, std::memory_order_relaxed);
            m_ledger->total.fetch_add(1, std::memory_order_relaxed);
            return block;
        }

        void Deallocate(void* block, UIntSize size, UIntSize alignment) noexcept
        {
            if (block != nullptr)
            {
                m_ledger->live.fetch_sub(1, std::memory_order_relaxed);
                m_ledger->liveBytes.fetch_sub(size, std::memory_order_relaxed);
            }
            m_inner.Deallocate(block, size, alignment);
        }

        [[nodiscard]] const AllocationLedger& Ledger() const noexcept { return *m_ledger; }

        [[nodiscard]] bool operator==(const CountingAllocator& other) const noexcept
        {
            return m_ledger == other.m_ledger;
        }

    private:
        AllocationLedger*           m_ledger;
        [[no_unique_address]] Inner m_inner;
    };
}// namespace Strata::Memory

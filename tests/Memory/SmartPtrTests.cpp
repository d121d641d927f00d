/// @file SmartPtrTests.cpp
/// @brief Tests for the Scoped and Shared handles and their allocator plumbing.

#include <Strata/Memory/CountingAllocator.hpp>
#include <Strata/Memory/SmartPointers.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using Strata::Memory::AllocationLedger;
using Strata::Memory::CountingAllocator;

namespace
{
    struct Tracked
    {
        static inline int alive = 0;

        explicit Tracked(int v) : value(v) { ++alive; }
        Tracked(const Tracked&)            = delete;
        Tracked& operator=(const Tracked&) = delete;
        ~Tracked() { --alive; }

        int value;
    };

    struct ThrowingTracked
    {
        explicit ThrowingTracked(int) { throw std::runtime_error("construction failed"); }
    };

    struct alignas(64) OverAligned
    {
        int value {0};
    };
}// namespace

TEST_CASE("Scoped owns its object until destroyed", "[Memory][SmartPointers]")
{
    AllocationLedger ledger;
    {
        auto scoped = Strata::Memory::MakeScoped<Tracked>(CountingAllocator<>(ledger), 42);
        REQUIRE(scoped);
        CHECK(scoped->value == 42);
        CHECK(Tracked::alive == 1);
        CHECK(ledger.live.load() == 1U);
        CHECK(ledger.liveBytes.load() == sizeof(Tracked));
    }
    CHECK(Tracked::alive == 0);
    CHECK(ledger.live.load() == 0U);
    CHECK(ledger.total.load() == 1U);
}

TEST_CASE("Scoped move transfers the pointer, not the object", "[Memory][SmartPointers]")
{
    auto   scoped  = Strata::Memory::MakeScoped<Tracked>(5);
    Tracked* address = scoped.Get();

    auto moved = std::move(scoped);
    CHECK(scoped == nullptr);
    CHECK(moved.Get() == address);

    Strata::Memory::Scoped<Tracked> assigned;
    assigned = std::move(moved);
    CHECK(assigned.Get() == address);
    CHECK(Tracked::alive == 1);

    Tracked* raw = assigned.Release();
    CHECK_FALSE(assigned);
    Strata::Memory::DeleteObject(assigned.Allocator(), raw);
    CHECK(Tracked::alive == 0);
}

TEST_CASE("Scoped Reset destroys the object", "[Memory][SmartPointers]")
{
    auto scoped = Strata::Memory::MakeScoped<Tracked>(3);
    scoped.Reset();
    CHECK(scoped == nullptr);
    CHECK(Tracked::alive == 0);
    scoped.Reset();
}

TEST_CASE("Failed construction returns the block", "[Memory][SmartPointers]")
{
    AllocationLedger ledger;

    CHECK_THROWS_AS(Strata::Memory::MakeScoped<ThrowingTracked>(CountingAllocator<>(ledger), 1), std::runtime_error);
    CHECK(ledger.total.load() == 1U);
    CHECK(ledger.live.load() == 0U);

    CHECK_THROWS_AS(Strata::Memory::MakeShared<ThrowingTracked>(CountingAllocator<>(ledger), 1), std::runtime_error);
    CHECK(ledger.total.load() == 2U);
    CHECK(ledger.live.load() == 0U);
}

TEST_CASE("Shared counts owners and frees with the last one", "[Memory][SmartPointers]")
{
    AllocationLedger ledger;
    {
        auto shared = Strata::Memory::MakeShared<Tracked>(CountingAllocator<>(ledger), 7);
        CHECK(shared.UseCount() == 1U);
        CHECK(ledger.live.load() == 1U);

        {
            auto copy = shared;
            CHECK(shared.UseCount() == 2U);
            CHECK(copy.Get() == shared.Get());
        }
        CHECK(shared.UseCount() == 1U);

        auto moved = std::move(shared);
        CHECK_FALSE(shared);
        CHECK(moved.UseCount() == 1U);
        CHECK(Tracked::alive == 1);

        moved.Reset();
        CHECK(moved.UseCount() == 0U);
        CHECK(Tracked::alive == 0);
    }
    CHECK(ledger.live.load() == 0U);
    CHECK(ledger.liveBytes.load() == 0U);
}

TEST_CASE("Shared copies released from several threads", "[Memory][SmartPointers]")
{
    AllocationLedger ledger;
    {
        auto                     shared = Strata::Memory::MakeShared<Tracked>(CountingAllocator<>(ledger), 1);
        std::vector<std::thread> threads;
        for (int t = 0; t < 4; ++t)
        {
            threads.emplace_back([copy = shared]() mutable {
                for (int i = 0; i < 1000; ++i)
                {
                    auto again = copy;
                    (void) again;
                }
            });
        }
        for (auto& thread : threads)
            thread.join();
        CHECK(shared.UseCount() == 1U);
    }
    CHECK(Tracked::alive == 0);
    CHECK(ledger.live.load() == 0U);
}

TEST_CASE("Handles honour over-aligned types", "[Memory][SmartPointers]")
{
    auto scoped = Strata::Memory::MakeScoped<OverAligned>();
    auto shared = Strata::Memory::MakeShared<OverAligned>();
    CHECK(reinterpret_cast<std::uintptr_t>(scoped.Get()) % alignof(OverAligned) == 0U);
    CHECK(reinterpret_cast<std::uintptr_t>(shared.Get()) % alignof(OverAligned) == 0U);
}

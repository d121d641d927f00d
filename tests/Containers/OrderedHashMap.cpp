/// @file OrderedHashMap.cpp
/// @brief Tests for Strata::Containers::OrderedHashMap.

#include <Strata/Containers/OrderedHashMap.hpp>
#include <Strata/Memory/CountingAllocator.hpp>
#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <stdexcept>
#include <string>

using Strata::Containers::OrderedHashMap;

TEST_CASE("OrderedHashMap assigns positions in insertion order", "[Containers][OrderedHashMap]")
{
    OrderedHashMap<std::string, int> map;
    const auto first  = map.TryEmplaceFull(std::string("zeta"), 1);
    const auto second = map.TryEmplaceFull(std::string("alpha"), 2);
    const auto third  = map.TryEmplaceFull(std::string("mid"), 3);

    CHECK(first.index == 0U);
    CHECK(second.index == 1U);
    CHECK(third.index == 2U);
    CHECK(first.inserted);
    CHECK(map.KeyAt(1) == "alpha");
    CHECK(map.ValueAt(2) == 3);
    CHECK_THROWS_AS(map.KeyAt(3), std::out_of_range);
}

TEST_CASE("OrderedHashMap keeps the first value and its position", "[Containers][OrderedHashMap]")
{
    OrderedHashMap<std::string, int> map;
    map.TryEmplace(std::string("a"), 1);
    map.TryEmplace(std::string("b"), 2);
    const auto again = map.TryEmplaceFull(std::string("a"), 10);

    CHECK_FALSE(again.inserted);
    CHECK(again.index == 0U);
    CHECK(*again.value == 1);
    CHECK(map.Size() == 2U);
}

TEST_CASE("OrderedHashMap lookup by key", "[Containers][OrderedHashMap]")
{
    OrderedHashMap<int, int> map;
    CHECK_FALSE(map.GetIndex(5).has_value());
    CHECK(map.GetPtr(5) == nullptr);

    map.TryEmplace(5, 50);
    REQUIRE(map.GetIndex(5).has_value());
    CHECK(*map.GetIndex(5) == 0U);
    CHECK(map.Get(5) == 50);
    CHECK(map.Contains(5));
    CHECK_THROWS_AS(map.Get(6), std::out_of_range);
}

TEST_CASE("OrderedHashMap iteration follows insertion order across growth", "[Containers][OrderedHashMap]")
{
    OrderedHashMap<int, int> map;
    for (int i = 999; i >= 0; --i)
        map.TryEmplace(i, i * 3);

    REQUIRE(map.Size() == 1000U);
    int expected = 999;
    for (const auto& entry : map)
    {
        CHECK(entry.key == expected);
        CHECK(entry.value == expected * 3);
        --expected;
    }
    CHECK(*map.GetIndex(0) == 999U);
}

TEST_CASE("OrderedHashMap reserve keeps existing positions", "[Containers][OrderedHashMap]")
{
    OrderedHashMap<int, int> map;
    map.TryEmplace(7, 1);
    map.TryEmplace(3, 2);
    map.Reserve(4096);

    CHECK(*map.GetIndex(7) == 0U);
    CHECK(*map.GetIndex(3) == 1U);
    CHECK(map.Get(3) == 2);
}

TEST_CASE("OrderedHashMap draws every table from its own allocator", "[Containers][OrderedHashMap]")
{
    using Strata::Memory::AllocationLedger;
    using Strata::Memory::CountingAllocator;
    using CountedMap = OrderedHashMap<int, int, std::hash<int>, std::equal_to<int>, CountingAllocator<>>;

    AllocationLedger ledger;
    {
        CountedMap map(std::hash<int> {}, std::equal_to<int> {}, CountingAllocator<>(ledger));
        for (int i = 0; i < 500; ++i)
            map.TryEmplace(i, i * 2);
        map.Reserve(4096);

        CHECK(map.Get(499) == 998);
        CHECK(ledger.live.load() == 2U);
        CHECK(ledger.total.load() > 2U);
    }
    CHECK(ledger.live.load() == 0U);
    CHECK(ledger.liveBytes.load() == 0U);
}

/// @file AppendOnlyMap.cpp
/// @brief Tests for Strata::Containers::AppendOnlyMap.

#include <Strata/Containers/AppendOnlyMap.hpp>
#include <Strata/Exceptions/ReentrancyException.hpp>
#include <Strata/Memory/SmartPointers.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using Strata::Containers::AppendOnlyMap;
using Strata::Containers::InsertionOrderedStorage;
using Strata::Containers::SortedStorage;
using Strata::Memory::MakeScoped;
using Strata::Memory::Scoped;

namespace
{
    struct Tracked
    {
        static inline int constructed = 0;
        static inline int destroyed   = 0;

        explicit Tracked(int v) : value(v) { ++constructed; }
        Tracked(const Tracked&)            = delete;
        Tracked& operator=(const Tracked&) = delete;
        ~Tracked() { ++destroyed; }

        int value;

        static void Reset()
        {
            constructed = 0;
            destroyed   = 0;
        }
    };

    using StringMap = AppendOnlyMap<std::string, Scoped<std::string>>;
}// namespace

TEST_CASE("AppendOnlyMap references survive growth", "[Containers][AppendOnlyMap]")
{
    const StringMap map;
    const std::string& apple = map.Insert("a", MakeScoped<std::string>("apple"));
    map.Insert("b", MakeScoped<std::string>("banana"));

    for (int i = 0; i < 10000; ++i)
        map.Insert("key" + std::to_string(i), MakeScoped<std::string>("value" + std::to_string(i)));

    CHECK(map.Size() == 10002U);
    CHECK(apple == "apple");
    CHECK(&map.Get(std::string("a")) == &apple);
    CHECK(map.Get(std::string("key9999")) == "value9999");
}

TEST_CASE("AppendOnlyMap finds every key at its first address after growth", "[Containers][AppendOnlyMap]")
{
    constexpr int                         kCount = 2000;
    const AppendOnlyMap<int, Scoped<int>> map;
    std::vector<const int*>               addresses;
    addresses.reserve(kCount);

    for (int key = 0; key < kCount; ++key)
        addresses.push_back(&map.Insert(key, MakeScoped<int>(key)));

    REQUIRE(map.Size() == static_cast<Strata::UIntSize>(kCount));
    int misplaced = 0;
    for (int key = 0; key < kCount; ++key)
    {
        const int* found = map.GetPtr(key);
        if (found != addresses[static_cast<std::size_t>(key)])
            ++misplaced;
    }
    CHECK(misplaced == 0);

    for (int key : {0, 1, 16, 1024, kCount - 1})
    {
        const int& stored = map.Insert(key, MakeScoped<int>(-1));
        CHECK(&stored == addresses[static_cast<std::size_t>(key)]);
        CHECK(stored == key);
    }
    CHECK(map.Size() == static_cast<Strata::UIntSize>(kCount));
}

TEST_CASE("AppendOnlyMap keys sharing low hash bits stay reachable", "[Containers][AppendOnlyMap]")
{
    const AppendOnlyMap<int, Scoped<int>> map;
    for (int i = 0; i < 200; ++i)
        map.Insert(i * 16, MakeScoped<int>(i));

    int missing = 0;
    for (int i = 0; i < 200; ++i)
    {
        if (!map.Contains(i * 16) || map.Get(i * 16) != i)
            ++missing;
    }
    CHECK(missing == 0);
    CHECK(map.Size() == 200U);
}

TEST_CASE("AppendOnlyMap keeps the first value for a key", "[Containers][AppendOnlyMap]")
{
    const StringMap map;
    const std::string& first  = map.Insert("k", MakeScoped<std::string>("first"));
    const std::string& second = map.Insert("k", MakeScoped<std::string>("second"));

    CHECK(&first == &second);
    CHECK(second == "first");
    CHECK(map.Size() == 1U);
}

TEST_CASE("AppendOnlyMap lookup of missing keys", "[Containers][AppendOnlyMap]")
{
    const StringMap map;
    CHECK(map.Empty());
    CHECK(map.GetPtr(std::string("missing")) == nullptr);
    CHECK_FALSE(map.Contains(std::string("missing")));
    CHECK_THROWS_AS(map.Get(std::string("missing")), std::out_of_range);
}

TEST_CASE("AppendOnlyMap rejects handles without a target", "[Containers][AppendOnlyMap]")
{
    const StringMap map;
    CHECK_THROWS_AS(map.Insert("empty", Scoped<std::string> {}), std::invalid_argument);
    CHECK(map.Empty());

    const AppendOnlyMap<int, std::unique_ptr<int>> uniqueMap;
    CHECK_THROWS_AS(uniqueMap.Insert(1, nullptr), std::invalid_argument);
    CHECK(uniqueMap.Empty());
}

TEST_CASE("AppendOnlyMap GetOrInsertWith calls the producer at most once", "[Containers][AppendOnlyMap]")
{
    const StringMap map;
    int calls = 0;
    auto producer = [&calls] {
        ++calls;
        return MakeScoped<std::string>("made");
    };

    const std::string& made = map.GetOrInsertWith("x", producer);
    const std::string& again = map.GetOrInsertWith("x", producer);
    CHECK(calls == 1);
    CHECK(&made == &again);

    map.Insert("y", MakeScoped<std::string>("present"));
    CHECK(map.GetOrInsertWith("y", producer) == "present");
    CHECK(calls == 1);

    const std::string& fromKey = map.GetOrInsertWith("z", [](const std::string& key) { return MakeScoped<std::string>(key + key); });
    CHECK(fromKey == "zz");
}

TEST_CASE("AppendOnlyMap producer that inserts into the same map is rejected", "[Containers][AppendOnlyMap]")
{
    const StringMap map;
    CHECK_THROWS_AS(map.GetOrInsertWith("outer",
                                        [&map] {
                                            map.Insert("inner", MakeScoped<std::string>("inner"));
                                            return MakeScoped<std::string>("outer");
                                        }),
                    Strata::Exceptions::ReentrancyException);

    CHECK(map.Empty());
    map.Insert("after", MakeScoped<std::string>("usable"));
    CHECK(map.Get(std::string("after")) == "usable");
}

TEST_CASE("AppendOnlyMap producer may read the map", "[Containers][AppendOnlyMap]")
{
    const StringMap map;
    map.Insert("base", MakeScoped<std::string>("base"));
    const std::string& derived = map.GetOrInsertWith("derived", [&map] {
        return MakeScoped<std::string>(map.Get(std::string("base")) + "+");
    });
    CHECK(derived == "base+");
}

TEST_CASE("AppendOnlyMap ForEach rejects insertion from the callback", "[Containers][AppendOnlyMap]")
{
    const StringMap map;
    map.Insert("a", MakeScoped<std::string>("1"));

    CHECK_THROWS_AS(map.ForEach([&map](const std::string&, const std::string&) {
        map.Insert("b", MakeScoped<std::string>("2"));
    }),
                    Strata::Exceptions::ReentrancyException);
    CHECK(map.Size() == 1U);

    int visited = 0;
    map.ForEach([&visited](const std::string& key, const std::string& value) {
        CHECK(key == "a");
        CHECK(value == "1");
        ++visited;
    });
    CHECK(visited == 1);
}

TEST_CASE("AppendOnlyMap entries rebuild an equal map", "[Containers][AppendOnlyMap]")
{
    const AppendOnlyMap<int, Strata::Memory::Shared<int>> source;
    for (int i = 0; i < 64; ++i)
        source.Insert(i, Strata::Memory::MakeShared<int>(i * i));

    const AppendOnlyMap<int, Strata::Memory::Shared<int>> copy;
    for (const auto& entry : source.Entries())
        copy.Insert(entry.key, Strata::Memory::MakeShared<int>(*entry.value));

    CHECK(copy == source);
    copy.Insert(100, Strata::Memory::MakeShared<int>(1));
    CHECK_FALSE(copy == source);

    const auto keys = source.Keys();
    CHECK(keys.Size() == 64U);
}

TEST_CASE("AppendOnlyMap initializer list and Extend", "[Containers][AppendOnlyMap]")
{
    const AppendOnlyMap<std::string, std::shared_ptr<int>> map {
            {"one", std::make_shared<int>(1)},
            {"two", std::make_shared<int>(2)},
    };
    CHECK(map.Size() == 2U);

    std::vector<std::pair<std::string, std::shared_ptr<int>>> more;
    more.emplace_back("two", std::make_shared<int>(22));
    more.emplace_back("three", std::make_shared<int>(3));
    map.Extend(std::move(more));

    CHECK(map.Size() == 3U);
    CHECK(map.Get(std::string("two")) == 2);
    CHECK(map.Get(std::string("three")) == 3);
}

TEST_CASE("AppendOnlyMap with insertion-ordered storage", "[Containers][AppendOnlyMap]")
{
    const AppendOnlyMap<std::string, Scoped<int>, InsertionOrderedStorage<>> map;
    const auto zeta  = map.InsertFull("zeta", MakeScoped<int>(26));
    const auto alpha = map.InsertFull("alpha", MakeScoped<int>(1));
    const auto again = map.InsertFull("zeta", MakeScoped<int>(0));

    CHECK(zeta.index == 0U);
    CHECK(alpha.index == 1U);
    CHECK(again.index == 0U);
    CHECK(&again.value == &zeta.value);
    CHECK(again.value == 26);

    const auto found = map.GetFull(std::string("alpha"));
    REQUIRE(found.has_value());
    CHECK(found->index == 1U);
    CHECK(found->value == 1);
    CHECK_FALSE(map.GetFull(std::string("missing")).has_value());

    REQUIRE(map.GetIndex(1) != nullptr);
    CHECK(*map.GetIndex(1) == 1);
    CHECK(map.GetIndex(2) == nullptr);

    const auto keys = map.Keys();
    REQUIRE(keys.Size() == 2U);
    CHECK(keys[0] == "zeta");
    CHECK(keys[1] == "alpha");
}

TEST_CASE("AppendOnlyMap with sorted storage visits keys in order", "[Containers][AppendOnlyMap]")
{
    const AppendOnlyMap<int, Scoped<int>, SortedStorage<>> map;
    const int& fifty = map.Insert(50, MakeScoped<int>(500));
    for (int i = 99; i >= 0; --i)
        map.Insert(i, MakeScoped<int>(i * 10));

    CHECK(map.Size() == 100U);
    CHECK(fifty == 500);

    int expected = 0;
    map.ForEach([&expected](const int& key, const int&) {
        CHECK(key == expected);
        ++expected;
    });
    CHECK(expected == 100);
}

TEST_CASE("AppendOnlyMap destroys each target exactly once", "[Containers][AppendOnlyMap]")
{
    Tracked::Reset();
    {
        const AppendOnlyMap<int, Scoped<Tracked>> map;
        for (int i = 0; i < 100; ++i)
            map.Insert(i, MakeScoped<Tracked>(i));

        // Rejected duplicate handle is released straight away.
        map.Insert(5, MakeScoped<Tracked>(-5));
        CHECK(Tracked::destroyed == 1);
        CHECK(map.Get(5).value == 5);
    }
    CHECK(Tracked::constructed == 101);
    CHECK(Tracked::destroyed == 101);
}

TEST_CASE("AppendOnlyMap moves and gives up its store", "[Containers][AppendOnlyMap]")
{
    StringMap map;
    const std::string& value = map.Insert("k", MakeScoped<std::string>("v"));

    StringMap moved(std::move(map));
    CHECK(&moved.Get(std::string("k")) == &value);

    auto store = std::move(moved).IntoStore();
    CHECK(store.Size() == 1U);
    CHECK(store.GetPtr(std::string("k"))->Get() == &value);
}

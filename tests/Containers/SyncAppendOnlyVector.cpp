/// @file SyncAppendOnlyVectorTest.cpp
/// @brief Tests for Strata::Containers::SyncAppendOnlyVector using Catch2.

#include <Strata/Containers/SyncAppendOnlyVector.hpp>
#include <Strata/Memory/SmartPointers.hpp>
#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using Strata::Containers::SyncAppendOnlyVector;
using Strata::Memory::MakeScoped;
using Strata::Memory::Scoped;

TEST_CASE("SyncAppendOnlyVector concurrent inserts get dense unique indices", "[Containers][SyncAppendOnlyVector]")
{
    constexpr int kThreads   = 8;
    constexpr int kPerThread = 1000;

    const SyncAppendOnlyVector<Scoped<int>> vector;
    std::vector<Strata::UIntSize>           indices;
    std::mutex                              indicesMutex;
    std::vector<std::thread>                threads;

    for (int t = 0; t < kThreads; ++t)
    {
        threads.emplace_back([&, t] {
            std::vector<Strata::UIntSize> local;
            for (int i = 0; i < kPerThread; ++i)
            {
                const int  value    = t * kPerThread + i;
                const auto inserted = vector.Insert(MakeScoped<int>(value));
                if (inserted.value == value && vector.GetPtr(inserted.index) == &inserted.value)
                    local.push_back(inserted.index);
            }
            std::lock_guard<std::mutex> lock(indicesMutex);
            indices.insert(indices.end(), local.begin(), local.end());
        });
    }
    for (auto& thread : threads)
        thread.join();

    constexpr auto total = static_cast<Strata::UIntSize>(kThreads * kPerThread);
    REQUIRE(indices.size() == total);
    CHECK(vector.Size() == total);

    std::vector<bool> seen(total, false);
    for (const auto index : indices)
    {
        REQUIRE(index < total);
        CHECK_FALSE(seen[index]);
        seen[index] = true;
    }
}

TEST_CASE("SyncAppendOnlyVector readers run alongside a writer", "[Containers][SyncAppendOnlyVector]")
{
    const SyncAppendOnlyVector<Scoped<int>> vector;
    vector.PushBack(MakeScoped<int>(0));
    const int& first = vector.At(0);

    std::thread writer([&] {
        for (int i = 1; i < 2000; ++i)
            vector.PushBack(MakeScoped<int>(i));
    });
    std::atomic<int> mismatches {0};
    std::thread      reader([&] {
        for (int i = 0; i < 2000; ++i)
        {
            const Strata::UIntSize size = vector.Size();
            const int*             last = vector.GetPtr(size - 1);
            if (!last || *last != static_cast<int>(size - 1))
                mismatches.fetch_add(1, std::memory_order_relaxed);
        }
    });
    writer.join();
    reader.join();

    CHECK(mismatches.load() == 0);
    CHECK(vector.Size() == 2000U);
    CHECK(&vector.At(0) == &first);
    CHECK(*vector.Last() == 1999);
    CHECK_FALSE(vector.IsPoisoned());
}

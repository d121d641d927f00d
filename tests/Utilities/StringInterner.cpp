/// @file StringInterner.cpp
/// @brief Tests for Strata::Utilities::StringInterner.

#include <Strata/Utilities/StringInterner.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>
#include <string_view>

using Strata::Utilities::StringInterner;

TEST_CASE("Interning the same text twice yields one entry", "[Utilities][StringInterner]")
{
    const StringInterner interner;

    const auto first  = interner.InsertOrGet("alpha");
    const auto second = interner.InsertOrGet(std::string("alpha"));
    CHECK(first != StringInterner::INVALID_ID);
    CHECK(first == second);
    CHECK(interner.Size() == 1U);

    const std::string_view view = interner.View(first);
    CHECK(view == "alpha");
    CHECK(interner.Intern("alpha").data() == view.data());

    const auto stats = interner.GetStatistics();
    CHECK(stats.lookups == 3U);
    CHECK(stats.lookupHits == 2U);
    CHECK(stats.inserted == 1U);
    CHECK(stats.totalBytesStored == 5U);
}

TEST_CASE("Lookups without insertion", "[Utilities][StringInterner]")
{
    StringInterner         interner;
    StringInterner::IdType id = StringInterner::INVALID_ID;

    SECTION("unknown text is reported as missing")
    {
        CHECK_FALSE(interner.TryGetId("beta", id));
        CHECK(id == StringInterner::INVALID_ID);
        CHECK(interner.Empty());
    }

    SECTION("known text resolves to its id")
    {
        const auto inserted = interner.InsertOrGet("beta");
        REQUIRE(interner.TryGetId("beta", id));
        CHECK(id == inserted);
    }

    SECTION("unknown ids view as empty")
    {
        const auto inserted = interner.InsertOrGet("beta");
        CHECK(interner.View(StringInterner::INVALID_ID).empty());
        CHECK(interner.View(inserted + 1).empty());
    }
}

TEST_CASE("ResetStatistics keeps the byte total", "[Utilities][StringInterner]")
{
    StringInterner interner;
    (void) interner.InsertOrGet("gamma");
    (void) interner.InsertOrGet("gamma");

    interner.ResetStatistics();
    const auto stats = interner.GetStatistics();
    CHECK(stats.lookups == 0U);
    CHECK(stats.lookupHits == 0U);
    CHECK(stats.inserted == 0U);
    CHECK(stats.totalBytesStored == 5U);
}

TEST_CASE("Ids are dense and follow first appearance", "[Utilities][StringInterner]")
{
    StringInterner interner;
    for (std::string_view word : {"zero", "one", "zero", "two", "one"})
        (void) interner.InsertOrGet(word);

    CHECK(interner.Size() == 3U);
    CHECK(interner.View(0) == "zero");
    CHECK(interner.View(1) == "one");
    CHECK(interner.View(2) == "two");
}

TEST_CASE("The empty string is an ordinary entry", "[Utilities][StringInterner]")
{
    StringInterner interner;
    const auto     id = interner.InsertOrGet("");

    StringInterner::IdType found = StringInterner::INVALID_ID;
    REQUIRE(interner.TryGetId("", found));
    CHECK(found == id);
    CHECK(interner.View(id).empty());
    CHECK(interner.TotalStoredBytes() == 0U);
}

TEST_CASE("Views outlive any amount of later interning", "[Utilities][StringInterner]")
{
    StringInterner interner;

    const std::string      heapText(6000, 'a');
    const std::string_view heapView  = interner.Intern(heapText);
    const std::string_view shortView = interner.Intern("sso");

    for (int i = 0; i < 5000; ++i)
        (void) interner.InsertOrGet("symbol" + std::to_string(i));

    REQUIRE(interner.Size() == 5002U);
    CHECK(heapView.data() == interner.View(0).data());
    CHECK(heapView.size() == heapText.size());
    CHECK(shortView.data() == interner.View(1).data());
    CHECK(shortView == "sso");
    CHECK(interner.TotalStoredBytes() == interner.GetStatistics().totalBytesStored);
    CHECK(interner.TotalStoredBytes() > heapText.size() + 3);
}

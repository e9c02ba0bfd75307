#include <gtest/gtest.h>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

import Core;

using namespace Core::Hash;

// -----------------------------------------------------------------------------
// HashString
// -----------------------------------------------------------------------------

TEST(CoreHash, HashString_EmptyString)
{
    // FNV-1a offset basis
    EXPECT_EQ(HashString(""), 2166136261u);
}

TEST(CoreHash, HashString_CaseSensitive)
{
    EXPECT_NE(HashString("visible"), HashString("VISIBLE"));
    EXPECT_NE(HashString("visible"), HashString("Visible"));
}

TEST(CoreHash, HashString_Constexpr)
{
    constexpr uint32_t hash = HashString("hide-complete");
    static_assert(hash != 0);
    EXPECT_EQ(hash, HashString(std::string_view("hide-complete")));
}

// -----------------------------------------------------------------------------
// StringID
// -----------------------------------------------------------------------------

TEST(CoreHash, StringID_DefaultIsInvalid)
{
    StringID id;
    EXPECT_EQ(id.Value, 0u);
    EXPECT_FALSE(id.IsValid());
}

TEST(CoreHash, StringID_LiteralMatchesCharPtr)
{
    StringID fromLiteral = "modal"_id;
    StringID fromPtr("modal");

    EXPECT_TRUE(fromLiteral == fromPtr);
    EXPECT_TRUE(fromLiteral.IsValid());
}

TEST(CoreHash, StringID_StateNamesAreDistinct)
{
    EXPECT_FALSE("visible"_id == "modal"_id);
    EXPECT_FALSE("visible"_id == "hide-complete"_id);
    EXPECT_FALSE("modal"_id == "hide-complete"_id);
}

TEST(CoreHash, StringID_Name_ForLogging)
{
    StringID id("visible");
    EXPECT_NE(id.Name(), nullptr);
#ifndef NDEBUG
    EXPECT_STREQ(id.Name(), "visible");
#endif
}

TEST(CoreHash, StringID_UnorderedContainers)
{
    std::unordered_set<StringID> states;
    states.insert("visible"_id);
    states.insert("modal"_id);
    states.insert("visible"_id);
    EXPECT_EQ(states.size(), 2u);

    std::unordered_map<StringID, int> counts;
    counts["opened"_id] += 1;
    counts["opened"_id] += 1;
    counts["dismissed"_id] += 1;
    EXPECT_EQ(counts["opened"_id], 2);
    EXPECT_EQ(counts["dismissed"_id], 1);
}

// -----------------------------------------------------------------------------
// Error codes
// -----------------------------------------------------------------------------

TEST(CoreError, ResultHelpers)
{
    Core::Result ok = Core::Ok();
    EXPECT_TRUE(ok.has_value());

    Core::Result failed = Core::Err(Core::ErrorCode::AnchorUnavailable);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error(), Core::ErrorCode::AnchorUnavailable);
}

TEST(CoreError, ErrorCodeToString)
{
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::NotInitialized), "NotInitialized");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::AnchorUnavailable), "AnchorUnavailable");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::InvalidArgument), "InvalidArgument");
    EXPECT_EQ(Core::ErrorCodeToString(static_cast<Core::ErrorCode>(4242)), "Unknown");
}

#include <gtest/gtest.h>

#include "filelink/stream/range_resolver.h"

using filelink::core::ErrorCode;
using filelink::stream::ContentRangeValue;
using filelink::stream::ResolveRange;
using filelink::stream::ServingWindow;
using filelink::stream::UnsatisfiedContentRangeValue;

TEST(RangeResolver, NoHeaderServesWholeObject) {
    auto result = ResolveRange("", 1000);
    ASSERT_TRUE(result.ok());
    EXPECT_FALSE(result.value().partial);
    EXPECT_EQ(result.value().window.start, 0u);
    EXPECT_EQ(result.value().window.end, 1000u);
}

TEST(RangeResolver, ClosedRange) {
    auto result = ResolveRange("bytes=100-199", 1000);
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().partial);
    EXPECT_EQ(result.value().window.start, 100u);
    EXPECT_EQ(result.value().window.end, 200u);
    EXPECT_EQ(result.value().window.length(), 100u);
    EXPECT_EQ(ContentRangeValue(result.value().window, 1000), "bytes 100-199/1000");
}

TEST(RangeResolver, OpenEndedRangeRunsToEnd) {
    auto result = ResolveRange("bytes=900-", 1000);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().window.start, 900u);
    EXPECT_EQ(result.value().window.end, 1000u);
}

TEST(RangeResolver, EndPastObjectIsClamped) {
    auto result = ResolveRange("bytes=10-5000", 1000);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().window.end, 1000u);
    EXPECT_EQ(ContentRangeValue(result.value().window, 1000), "bytes 10-999/1000");
}

TEST(RangeResolver, SingleByteRange) {
    auto result = ResolveRange("bytes=0-0", 1000);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().window.length(), 1u);
}

TEST(RangeResolver, SuffixRange) {
    auto result = ResolveRange("bytes=-100", 1000);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().window.start, 900u);
    EXPECT_EQ(result.value().window.end, 1000u);

    auto whole = ResolveRange("bytes=-5000", 1000);
    ASSERT_TRUE(whole.ok());
    EXPECT_EQ(whole.value().window.start, 0u);
}

TEST(RangeResolver, UnitIsCaseInsensitive) {
    auto result = ResolveRange("Bytes=1-2", 10);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().window.start, 1u);
}

TEST(RangeResolver, StartAtOrPastSizeIsUnsatisfiable) {
    auto at_size = ResolveRange("bytes=1000-", 1000);
    ASSERT_FALSE(at_size.ok());
    EXPECT_EQ(at_size.error().code, ErrorCode::kRangeNotSatisfiable);

    auto past = ResolveRange("bytes=2000-2100", 1000);
    ASSERT_FALSE(past.ok());
    EXPECT_EQ(past.error().code, ErrorCode::kRangeNotSatisfiable);
}

TEST(RangeResolver, MalformedHeadersAreUnsatisfiable) {
    for (const char* header : {"bytes=5-1", "bytes=abc-", "items=0-1", "bytes=", "bytes=-0",
                               "bytes=0-1,5-6", "bytes 0-1", "bytes=1"}) {
        auto result = ResolveRange(header, 1000);
        ASSERT_FALSE(result.ok()) << header;
        EXPECT_EQ(result.error().code, ErrorCode::kRangeNotSatisfiable) << header;
    }
}

TEST(RangeResolver, EmptyObject) {
    auto whole = ResolveRange("", 0);
    ASSERT_TRUE(whole.ok());
    EXPECT_TRUE(whole.value().window.empty());

    EXPECT_FALSE(ResolveRange("bytes=0-", 0).ok());
    EXPECT_FALSE(ResolveRange("bytes=-10", 0).ok());
}

TEST(RangeResolver, UnsatisfiedContentRange) {
    EXPECT_EQ(UnsatisfiedContentRangeValue(1000), "bytes */1000");
}

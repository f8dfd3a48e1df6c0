#include <gtest/gtest.h>

#include "filelink/http/access_request.h"

using filelink::core::ErrorCode;
using filelink::http::DisplayMode;
using filelink::http::ParseAccessRequest;

TEST(AccessRequest, ParsesIdAndCode) {
    auto request = ParseAccessRequest("42", "/dl/42?code=7-9", DisplayMode::kDownload);
    ASSERT_TRUE(request.ok());
    EXPECT_EQ(request.value().object_id, 42);
    EXPECT_EQ(request.value().code, "7-9");
    EXPECT_EQ(request.value().mode, DisplayMode::kDownload);
}

TEST(AccessRequest, RejectsMalformedIds) {
    for (const auto* id : {"", "abc", "12a", "-5", "0", "0000", "1234567890123456789"}) {
        auto request = ParseAccessRequest(id, "/dl/x?code=1-2", DisplayMode::kDownload);
        ASSERT_FALSE(request.ok()) << id;
        EXPECT_EQ(request.error().code, ErrorCode::kInvalidArgument) << id;
    }
}

TEST(AccessRequest, MissingCodeIsUnauthorized) {
    for (const auto* target : {"/dl/5", "/dl/5?code=", "/dl/5?other=1", "/dl/5?code==stream"}) {
        auto request = ParseAccessRequest("5", target, DisplayMode::kDownload);
        ASSERT_FALSE(request.ok()) << target;
        EXPECT_EQ(request.error().code, ErrorCode::kUnauthorized) << target;
    }
}

TEST(AccessRequest, LegacyStreamSuffixSelectsPlayer) {
    auto request = ParseAccessRequest("5", "/dl/5?code=10-20=stream", DisplayMode::kDownload);
    ASSERT_TRUE(request.ok());
    EXPECT_EQ(request.value().code, "10-20");
    EXPECT_EQ(request.value().mode, DisplayMode::kPlayer);
}

TEST(AccessRequest, ModeParameterOverridesRouteDefault) {
    auto player = ParseAccessRequest("5", "/dl/5?code=1-2&mode=player", DisplayMode::kDownload);
    ASSERT_TRUE(player.ok());
    EXPECT_EQ(player.value().mode, DisplayMode::kPlayer);

    auto download =
        ParseAccessRequest("5", "/stream/5?mode=download&code=1-2", DisplayMode::kPlayer);
    ASSERT_TRUE(download.ok());
    EXPECT_EQ(download.value().mode, DisplayMode::kDownload);

    auto route_default = ParseAccessRequest("5", "/stream/5?code=1-2", DisplayMode::kPlayer);
    ASSERT_TRUE(route_default.ok());
    EXPECT_EQ(route_default.value().mode, DisplayMode::kPlayer);
}

TEST(AccessRequest, CodeIsPercentDecoded) {
    auto request = ParseAccessRequest("5", "/dl/5?code=1%2D2", DisplayMode::kDownload);
    ASSERT_TRUE(request.ok());
    EXPECT_EQ(request.value().code, "1-2");
}

TEST(QueryHelpers, GetQueryParamAndStripQuery) {
    EXPECT_EQ(filelink::http::GetQueryParam("/x?a=1&b=two+words", "b"), "two words");
    EXPECT_EQ(filelink::http::GetQueryParam("/x?a=1&flag&b=2", "b"), "2");
    EXPECT_EQ(filelink::http::GetQueryParam("/x?a=1", "b"), "");
    EXPECT_EQ(filelink::http::GetQueryParam("/x", "a"), "");
    EXPECT_EQ(filelink::http::StripQuery("/dl/1?code=2"), "/dl/1");
    EXPECT_EQ(filelink::http::StripQuery("/dl/1"), "/dl/1");
}

TEST(QueryHelpers, EncodeQueryValue) {
    EXPECT_EQ(filelink::http::EncodeQueryValue("12-34"), "12-34");
    EXPECT_EQ(filelink::http::EncodeQueryValue("a&b=c"), "a%26b%3Dc");
    EXPECT_EQ(filelink::http::EncodeQueryValue("a b"), "a%20b");
}

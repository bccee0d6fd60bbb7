#include <catch2/catch_test_macros.hpp>

#include <portainer_mcp/core/text.hpp>

#include <string>

using namespace portainer_mcp;

TEST_CASE("text::IEquals: case-insensitive comparison", "[text]") {
    CHECK(text::IEquals("X-API-Key", "x-api-key"));
    CHECK(text::IEquals("", ""));
    CHECK_FALSE(text::IEquals("Host", "Hosts"));
    CHECK_FALSE(text::IEquals("Cookie", "Cookiz"));
}

TEST_CASE("text::ToUpper", "[text]") {
    CHECK(text::ToUpper("get") == "GET");
    CHECK(text::ToUpper("PaTcH") == "PATCH");
}

TEST_CASE("text::SplitKeyValue: splits at the first '='", "[text]") {
    auto kv = text::SplitKeyValue("filters={\"a\":1}=x");
    REQUIRE(kv.has_value());
    CHECK(kv->first == "filters");
    CHECK(kv->second == "{\"a\":1}=x");

    auto empty_value = text::SplitKeyValue("all=");
    REQUIRE(empty_value.has_value());
    CHECK(empty_value->second.empty());
}

TEST_CASE("text::SplitKeyValue: rejects missing '=' or empty key", "[text]") {
    CHECK_FALSE(text::SplitKeyValue("novalue").has_value());
    CHECK_FALSE(text::SplitKeyValue("=value").has_value());
}

TEST_CASE("text::Base64Encode: RFC 4648 vectors", "[text]") {
    CHECK(text::Base64Encode("") == "");
    CHECK(text::Base64Encode("f") == "Zg==");
    CHECK(text::Base64Encode("fo") == "Zm8=");
    CHECK(text::Base64Encode("foo") == "Zm9v");
    CHECK(text::Base64Encode("foobar") == "Zm9vYmFy");
    CHECK(text::Base64Encode(std::string("\xff\x00\x80", 3)) == "/wCA");
}

TEST_CASE("text::Trim: strips spaces and tabs at both ends", "[text]") {
    CHECK(text::Trim("  Authorization\t") == "Authorization");
    CHECK(text::Trim("a b") == "a b");
    CHECK(text::Trim(" \t ").empty());
}

TEST_CASE("text::IsHttpToken: RFC 7230 header names", "[text]") {
    CHECK(text::IsHttpToken("X-Registry-Auth"));
    CHECK(text::IsHttpToken("If-None-Match"));
    CHECK_FALSE(text::IsHttpToken(""));
    CHECK_FALSE(text::IsHttpToken(" Host"));
    CHECK_FALSE(text::IsHttpToken("X-A:"));
    CHECK_FALSE(text::IsHttpToken("X-A\r\nHost"));
}

TEST_CASE("text::IsSafeHeaderValue: no CR, LF or NUL", "[text]") {
    CHECK(text::IsSafeHeaderValue("Bearer abc; q=1"));
    CHECK_FALSE(text::IsSafeHeaderValue("1\r\nX-API-Key: x"));
    CHECK_FALSE(text::IsSafeHeaderValue("a\nb"));
    CHECK_FALSE(text::IsSafeHeaderValue(std::string("a\0b", 3)));
}

#include <catch2/catch_test_macros.hpp>

#include <portainer_mcp/mcp/schema_validator.hpp>

using namespace portainer_mcp;
using nlohmann::json;

namespace {

const json& UpdateTagsSchema() {
    static const json schema = json::parse(R"({
        "type": "object",
        "properties": {
            "id": {"type": "number"},
            "tagIds": {"type": "array", "items": {"type": "integer"}},
            "role": {"type": "string", "enum": ["admin", "user", "edge_admin"]},
            "options": {
                "type": "object",
                "properties": {"mode": {"type": "string"}},
                "required": ["mode"]
            }
        },
        "required": ["id", "tagIds"]
    })");
    return schema;
}

} // anonymous namespace

TEST_CASE("ValidateArguments: valid arguments pass", "[mcp][schema]") {
    auto r = ValidateArguments(UpdateTagsSchema(), {{"id", 3}, {"tagIds", {1, 2}}});
    CHECK(r.IsOk());
}

TEST_CASE("ValidateArguments: missing required field", "[mcp][schema]") {
    auto r = ValidateArguments(UpdateTagsSchema(), {{"id", 3}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().field == "tagIds");
    CHECK(r.Error().reason == "required parameter is missing");
}

TEST_CASE("ValidateArguments: explicit null counts as missing when required", "[mcp][schema]") {
    auto r = ValidateArguments(UpdateTagsSchema(), {{"id", nullptr}, {"tagIds", json::array()}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().field == "id");
}

TEST_CASE("ValidateArguments: explicit null for an optional field is ignored", "[mcp][schema]") {
    auto r = ValidateArguments(UpdateTagsSchema(),
                               {{"id", 1}, {"tagIds", json::array()}, {"role", nullptr}});
    CHECK(r.IsOk());
}

TEST_CASE("ValidateArguments: wrong type names the field", "[mcp][schema]") {
    auto r = ValidateArguments(UpdateTagsSchema(), {{"id", "three"}, {"tagIds", {1}}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().field == "id");
    CHECK(r.Error().reason == "expected number, got string");
}

TEST_CASE("ValidateArguments: array item index in field", "[mcp][schema]") {
    auto r = ValidateArguments(UpdateTagsSchema(), {{"id", 1}, {"tagIds", {1, 2.5, 3}}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().field == "tagIds[1]");
}

TEST_CASE("ValidateArguments: integral float satisfies integer", "[mcp][schema]") {
    auto r = ValidateArguments(UpdateTagsSchema(), {{"id", 1}, {"tagIds", json::array({4.0})}});
    CHECK(r.IsOk());
}

TEST_CASE("ValidateArguments: enum mismatch", "[mcp][schema]") {
    auto r = ValidateArguments(UpdateTagsSchema(),
                               {{"id", 1}, {"tagIds", json::array()}, {"role", "root"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().field == "role");
    CHECK(r.Error().reason.find("\"root\"") != std::string::npos);
}

TEST_CASE("ValidateArguments: nested object field path", "[mcp][schema]") {
    auto r = ValidateArguments(UpdateTagsSchema(), {{"id", 1},
                                                    {"tagIds", json::array()},
                                                    {"options", json::object()}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().field == "options.mode");
}

TEST_CASE("ValidateArguments: unknown properties are accepted by default", "[mcp][schema]") {
    auto r = ValidateArguments(UpdateTagsSchema(),
                               {{"id", 1}, {"tagIds", json::array()}, {"extra", true}});
    CHECK(r.IsOk());
}

TEST_CASE("ValidateArguments: additionalProperties false rejects extras", "[mcp][schema]") {
    json schema = {{"type", "object"},
                   {"properties", {{"id", {{"type", "integer"}}}}},
                   {"additionalProperties", false}};
    auto r = ValidateArguments(schema, {{"id", 1}, {"extra", true}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().field == "extra");
}

TEST_CASE("ValidateArguments: non-object arguments", "[mcp][schema]") {
    auto r = ValidateArguments(UpdateTagsSchema(), json::array({1, 2}));
    REQUIRE(r.IsErr());
    CHECK(r.Error().field == "arguments");
}

TEST_CASE("ValidateArguments: invalid UTF-8 in an enum value does not throw", "[mcp][schema]") {
    json args = {{"id", 1}, {"tagIds", json::array()}, {"role", std::string("\xff\xfe")}};
    auto r = ValidateArguments(UpdateTagsSchema(), args);
    REQUIRE(r.IsErr());
    CHECK(r.Error().field == "role");
}

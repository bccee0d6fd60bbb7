#include <catch2/catch_test_macros.hpp>

#include <portainer_mcp/mcp/tool_registry.hpp>

using namespace portainer_mcp;

namespace {

ToolBinding MakeBinding(const std::string& name, const std::string& reply) {
    ToolBinding binding;
    binding.definition.name = name;
    binding.definition.description = "test tool";
    binding.definition.input_schema = {{"type", "object"}};
    binding.handler = [reply](const nlohmann::json&, const CallContext&) {
        return CallResult::Ok(TextContent(reply));
    };
    return binding;
}

} // anonymous namespace

// ===========================================================================
// CallFailure
// ===========================================================================

TEST_CASE("CallFailure: UnknownTool message", "[mcp][registry]") {
    auto f = CallFailure::UnknownTool("deleteEverything");
    CHECK(f.kind == FailureKind::UnknownTool);
    CHECK(f.message == "Unknown tool: deleteEverything");
    CHECK_FALSE(f.field.has_value());
}

TEST_CASE("CallFailure: InvalidArguments carries the field", "[mcp][registry]") {
    auto f = CallFailure::InvalidArguments("tagIds[1]", "expected an integer");
    CHECK(f.kind == FailureKind::InvalidArguments);
    REQUIRE(f.field.has_value());
    CHECK(*f.field == "tagIds[1]");

    auto j = f.ToJson();
    CHECK(j["error"]["kind"] == "InvalidArguments");
    CHECK(j["error"]["field"] == "tagIds[1]");
    CHECK(j["error"]["message"] == "Invalid argument 'tagIds[1]': expected an integer");
}

TEST_CASE("CallFailure: Handler prefers the backend message", "[mcp][registry]") {
    auto error = Error::FromHttpStatus("CreateTeam", "/api/teams", 409,
                                       R"({"message":"Team already exists"})");
    auto f = CallFailure::Handler(error);
    CHECK(f.kind == FailureKind::HandlerFailure);
    CHECK(f.message == "Conflict: Team already exists");

    Error plain{"GetUsers", "/api/users", std::nullopt, "connection refused",
                std::nullopt, ErrorCategory::Connection};
    CHECK(CallFailure::Handler(plain).message == "connection refused");
}

TEST_CASE("CallFailure: ToJson omits an absent field", "[mcp][registry]") {
    auto j = CallFailure::UnknownTool("x").ToJson();
    CHECK(j["error"]["kind"] == "UnknownTool");
    CHECK_FALSE(j["error"].contains("field"));
}

TEST_CASE("FailureKindName: all kinds", "[mcp][registry]") {
    CHECK(std::string(FailureKindName(FailureKind::UpstreamUnreachable)) == "UpstreamUnreachable");
    CHECK(std::string(FailureKindName(FailureKind::ResponseTooLarge)) == "ResponseTooLarge");
    CHECK(std::string(FailureKindName(FailureKind::HandlerFailure)) == "HandlerFailure");
}

// ===========================================================================
// Content helpers
// ===========================================================================

TEST_CASE("TextContent: one text block", "[mcp][registry]") {
    auto c = TextContent("hello");
    REQUIRE(c.is_array());
    REQUIRE(c.size() == 1);
    CHECK(c[0]["type"] == "text");
    CHECK(c[0]["text"] == "hello");
}

TEST_CASE("JsonContent: pretty-printed JSON text", "[mcp][registry]") {
    auto c = JsonContent(nlohmann::json::array({{{"id", 1}}}));
    REQUIRE(c.size() == 1);
    auto text = c[0]["text"].get<std::string>();
    CHECK(text.find('\n') != std::string::npos);
    CHECK(nlohmann::json::parse(text)[0]["id"] == 1);
}

// ===========================================================================
// ToolRegistry
// ===========================================================================

TEST_CASE("ToolRegistry: register and find", "[mcp][registry]") {
    ToolRegistry registry;
    CHECK(registry.Register(MakeBinding("listTeams", "teams")));
    CHECK(registry.Size() == 1);
    CHECK(registry.HasTool("listTeams"));
    CHECK_FALSE(registry.HasTool("listUsers"));

    const auto* binding = registry.Find("listTeams");
    REQUIRE(binding != nullptr);
    auto result = binding->handler(nlohmann::json::object(), CallContext{});
    REQUIRE(result.IsOk());
    CHECK(result.Value()[0]["text"] == "teams");
}

TEST_CASE("ToolRegistry: duplicate registration keeps the first", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(MakeBinding("listTeams", "first")));
    CHECK_FALSE(registry.Register(MakeBinding("listTeams", "second")));
    CHECK(registry.Size() == 1);

    auto result = registry.Find("listTeams")->handler(nlohmann::json::object(), CallContext{});
    CHECK(result.Value()[0]["text"] == "first");
}

TEST_CASE("ToolRegistry: Tools returns definitions in name order", "[mcp][registry]") {
    ToolRegistry registry;
    REQUIRE(registry.Register(MakeBinding("listUsers", "")));
    REQUIRE(registry.Register(MakeBinding("createTeam", "")));
    REQUIRE(registry.Register(MakeBinding("getSettings", "")));

    auto tools = registry.Tools();
    REQUIRE(tools.size() == 3);
    CHECK(tools[0]->name == "createTeam");
    CHECK(tools[1]->name == "getSettings");
    CHECK(tools[2]->name == "listUsers");
}

TEST_CASE("CallContext: IsCancelled", "[mcp][registry]") {
    CallContext none;
    CHECK_FALSE(none.IsCancelled());

    CallContext cancelled{[] { return true; }};
    CHECK(cancelled.IsCancelled());
}

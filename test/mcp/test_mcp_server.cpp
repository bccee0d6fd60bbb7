#include <catch2/catch_test_macros.hpp>

#include <portainer_mcp/core/version.hpp>
#include <portainer_mcp/mcp/mcp_server.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace portainer_mcp;

namespace {

const char* kCatalogYaml = R"(
version: v1.2
tools:
  - name: listTeams
    description: List all available teams
    annotations:
      title: List Teams
      readOnlyHint: true
  - name: createTeam
    description: Create a new team
    parameters:
      - name: name
        type: string
        required: true
    annotations:
      readOnlyHint: false
)";

DispatchRouter MakeRouter(bool read_only = false) {
    auto catalog = ToolCatalog::LoadFromString(kCatalogYaml);
    REQUIRE(catalog.IsOk());
    DispatchRouter router(std::move(catalog).Value(), AccessGuard(read_only));
    router.RegisterIfPresent(ToolId::ListTeams, [](const nlohmann::json&, const CallContext&) {
        return CallResult::Ok(JsonContent(nlohmann::json::array({{{"id", 1}, {"name", "devs"}}})));
    });
    router.RegisterIfPresent(ToolId::CreateTeam,
                             [](const nlohmann::json& args, const CallContext&) {
                                 if (args["name"] == "taken") {
                                     return CallResult::Err(CallFailure{
                                         FailureKind::HandlerFailure, "Team already exists",
                                         std::nullopt});
                                 }
                                 return CallResult::Ok(
                                     TextContent("Team created successfully with ID: 2"));
                             });
    return router;
}

nlohmann::json Request(int id, const std::string& method,
                       nlohmann::json params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

nlohmann::json ToolCall(int id, const std::string& name, nlohmann::json args) {
    return Request(id, "tools/call", {{"name", name}, {"arguments", std::move(args)}});
}

} // anonymous namespace

// ===========================================================================
// Protocol
// ===========================================================================

TEST_CASE("McpServer: initialize returns server info and capabilities", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(
        Request(1, "initialize", {{"protocolVersion", "2024-11-05"},
                                  {"clientInfo", {{"name", "test-agent"}}}}));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "Portainer MCP Server");
    CHECK(r["result"]["serverInfo"]["version"] == kVersion);
    CHECK(r["result"]["capabilities"]["tools"]["listChanged"] == false);
}

TEST_CASE("McpServer: ping", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(Request(9, "ping"));
    REQUIRE(response.has_value());
    CHECK((*response)["result"].is_object());
    CHECK((*response)["result"].empty());
}

TEST_CASE("McpServer: notifications get no response", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    nlohmann::json msg = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    CHECK_FALSE(server.HandleMessage(msg).has_value());
}

TEST_CASE("McpServer: unknown method", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(Request(3, "resources/list"));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
}

TEST_CASE("McpServer: wrong jsonrpc version", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    nlohmann::json msg = {{"jsonrpc", "1.0"}, {"id", 4}, {"method", "ping"}};
    auto response = server.HandleMessage(msg);
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32600);
}

TEST_CASE("McpServer: parse error", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleRaw("{not json");
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32700);
    CHECK((*response)["id"].is_null());
}

// ===========================================================================
// tools/list
// ===========================================================================

TEST_CASE("McpServer: tools/list includes schema and annotations", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(response.has_value());

    auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]["name"] == "createTeam");
    CHECK(tools[0]["inputSchema"]["required"][0] == "name");
    CHECK(tools[1]["name"] == "listTeams");
    CHECK(tools[1]["description"] == "List all available teams");
    CHECK(tools[1]["annotations"]["title"] == "List Teams");
}

TEST_CASE("McpServer: tools/list in read-only mode hides mutating tools", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(/*read_only=*/true), in, out);

    auto response = server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(response.has_value());
    auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.size() == 1);
    CHECK(tools[0]["name"] == "listTeams");
}

// ===========================================================================
// tools/call
// ===========================================================================

TEST_CASE("McpServer: tools/call success", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(ToolCall(5, "createTeam", {{"name", "ops"}}));
    REQUIRE(response.has_value());
    auto& result = (*response)["result"];
    CHECK_FALSE(result.contains("isError"));
    CHECK(result["content"][0]["type"] == "text");
    CHECK(result["content"][0]["text"] == "Team created successfully with ID: 2");
}

TEST_CASE("McpServer: unknown tool is a JSON-RPC error", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(ToolCall(6, "deleteEverything", nlohmann::json::object()));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
    CHECK((*response)["error"]["message"] == "Unknown tool: deleteEverything");
}

TEST_CASE("McpServer: read-only refusal matches the unknown tool response", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(/*read_only=*/true), in, out);

    auto refused = server.HandleMessage(ToolCall(7, "createTeam", {{"name", "ops"}}));
    REQUIRE(refused.has_value());
    CHECK((*refused)["error"]["code"] == -32602);
    CHECK((*refused)["error"]["message"] == "Unknown tool: createTeam");
}

TEST_CASE("McpServer: invalid arguments become an isError result", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(ToolCall(8, "createTeam", {{"name", 5}}));
    REQUIRE(response.has_value());
    auto& result = (*response)["result"];
    CHECK(result["isError"] == true);
    auto payload = nlohmann::json::parse(result["content"][0]["text"].get<std::string>());
    CHECK(payload["error"]["kind"] == "InvalidArguments");
    CHECK(payload["error"]["field"] == "name");
}

TEST_CASE("McpServer: handler failure becomes an isError result", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(ToolCall(9, "createTeam", {{"name", "taken"}}));
    REQUIRE(response.has_value());
    auto& result = (*response)["result"];
    CHECK(result["isError"] == true);
    auto payload = nlohmann::json::parse(result["content"][0]["text"].get<std::string>());
    CHECK(payload["error"]["kind"] == "HandlerFailure");
    CHECK(payload["error"]["message"] == "Team already exists");
}

TEST_CASE("McpServer: tools/call without name", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(Request(10, "tools/call", {{"arguments", {}}}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
}

TEST_CASE("McpServer: tools/call with non-object arguments", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(
        Request(11, "tools/call", {{"name", "listTeams"}, {"arguments", "oops"}}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
}

TEST_CASE("McpServer: tools/call without arguments uses an empty object", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(Request(12, "tools/call", {{"name", "listTeams"}}));
    REQUIRE(response.has_value());
    REQUIRE((*response).contains("result"));
    auto teams = nlohmann::json::parse(
        (*response)["result"]["content"][0]["text"].get<std::string>());
    CHECK(teams[0]["name"] == "devs");
}

// ===========================================================================
// Run (stdio loop)
// ===========================================================================

TEST_CASE("McpServer: Run answers each line and skips notifications", "[mcp][server]") {
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n");
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    server.Run();

    std::istringstream lines(out.str());
    std::string line;
    std::vector<nlohmann::json> responses;
    while (std::getline(lines, line)) {
        responses.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"]["tools"].size() == 2);
}

TEST_CASE("McpServer: initialize tolerates a non-string client name", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    auto response = server.HandleMessage(
        Request(1, "initialize", {{"clientInfo", {{"name", 5}}}}));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["serverInfo"]["name"] == "Portainer MCP Server");
}

TEST_CASE("McpServer: Run keeps serving after a malformed initialize", "[mcp][server]") {
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"clientInfo":{"name":5}}})"
        "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"ping"})" "\n");
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);

    REQUIRE_NOTHROW(server.Run());

    std::istringstream lines(out.str());
    std::string line;
    std::vector<nlohmann::json> responses;
    while (std::getline(lines, line)) {
        responses.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"].is_object());
}

#include <catch2/catch_test_macros.hpp>

#include <portainer_mcp/mcp/http_transport.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <thread>

using namespace portainer_mcp;

namespace {

const char* kCatalogYaml = R"(
version: v1.2
tools:
  - name: listTeams
    description: List teams
    annotations:
      readOnlyHint: true
)";

DispatchRouter MakeRouter() {
    auto catalog = ToolCatalog::LoadFromString(kCatalogYaml);
    REQUIRE(catalog.IsOk());
    DispatchRouter router(std::move(catalog).Value(), AccessGuard(false));
    router.RegisterIfPresent(ToolId::ListTeams, [](const nlohmann::json&, const CallContext&) {
        return CallResult::Ok(TextContent("[]"));
    });
    return router;
}

// Runs an HttpTransport on a free local port for the lifetime of the object.
class LocalTransport {
public:
    LocalTransport() : server_(MakeRouter(), in_, out_) {
        TransportConfig config;
        config.kind = TransportKind::Http;
        config.port = 0;
        config.endpoint = "/mcp";
        transport_ = std::make_unique<HttpTransport>(server_, config);

        auto bound = transport_->Bind("127.0.0.1");
        REQUIRE(bound.IsOk());
        port_ = bound.Value();
        thread_ = std::thread([this] { listen_ok_ = transport_->Listen().IsOk(); });
        transport_->WaitUntilReady();
    }

    ~LocalTransport() {
        transport_->Stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LocalTransport(const LocalTransport&) = delete;
    LocalTransport& operator=(const LocalTransport&) = delete;

    [[nodiscard]] int Port() const noexcept { return port_; }

private:
    std::istringstream in_;
    std::ostringstream out_;
    McpServer server_;
    std::unique_ptr<HttpTransport> transport_;
    int port_ = 0;
    bool listen_ok_ = false;
    std::thread thread_;
};

} // anonymous namespace

TEST_CASE("HttpTransport: health endpoint", "[mcp][http]") {
    LocalTransport local;
    httplib::Client client("127.0.0.1", local.Port());

    auto res = client.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(nlohmann::json::parse(res->body)["status"] == "ok");
}

TEST_CASE("HttpTransport: POST dispatches a JSON-RPC request", "[mcp][http]") {
    LocalTransport local;
    httplib::Client client("127.0.0.1", local.Port());

    auto res = client.Post("/mcp", R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})",
                           "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["id"] == 1);
    REQUIRE(body["result"]["tools"].size() == 1);
    CHECK(body["result"]["tools"][0]["name"] == "listTeams");
}

TEST_CASE("HttpTransport: tools/call over HTTP", "[mcp][http]") {
    LocalTransport local;
    httplib::Client client("127.0.0.1", local.Port());

    auto res = client.Post(
        "/mcp",
        R"({"jsonrpc":"2.0","id":"a","method":"tools/call","params":{"name":"listTeams"}})",
        "application/json");
    REQUIRE(res);
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["id"] == "a");
    CHECK(body["result"]["content"][0]["text"] == "[]");
}

TEST_CASE("HttpTransport: notifications are accepted without a body", "[mcp][http]") {
    LocalTransport local;
    httplib::Client client("127.0.0.1", local.Port());

    auto res = client.Post("/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                           "application/json");
    REQUIRE(res);
    CHECK(res->status == 202);
    CHECK(res->body.empty());
}

TEST_CASE("HttpTransport: malformed body yields a parse error", "[mcp][http]") {
    LocalTransport local;
    httplib::Client client("127.0.0.1", local.Port());

    auto res = client.Post("/mcp", "{oops", "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(nlohmann::json::parse(res->body)["error"]["code"] == -32700);
}

TEST_CASE("HttpTransport: GET on the endpoint is not allowed", "[mcp][http]") {
    LocalTransport local;
    httplib::Client client("127.0.0.1", local.Port());

    auto res = client.Get("/mcp");
    REQUIRE(res);
    CHECK(res->status == 405);
    CHECK(res->get_header_value("Allow") == "POST");
}

TEST_CASE("HttpTransport: Listen before Bind fails", "[mcp][http]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeRouter(), in, out);
    HttpTransport transport(server, TransportConfig{});

    auto result = transport.Listen();
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Connection);
}

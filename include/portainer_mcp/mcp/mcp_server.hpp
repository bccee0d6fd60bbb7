#pragma once

#include <portainer_mcp/mcp/dispatch_router.hpp>

#include <atomic>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace portainer_mcp {

inline constexpr const char* kMcpProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "Portainer MCP Server";

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 JSON-RPC 2.0 message handling.
//
// Methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call
//   - notifications/* (no response)
//
// HandleMessage is safe to call from several threads at once; Run serves a
// single newline-delimited stream (stdio).
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(DispatchRouter router,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the stdio loop (blocks until EOF on the input stream).
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications. Never throws: an unexpected
    // exception becomes a -32603 response.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message, const CallContext& context = {});

    // Parse one raw message; parse errors yield a -32700 response.
    [[nodiscard]] std::optional<nlohmann::json> HandleRaw(
        const std::string& raw, const CallContext& context = {});

    [[nodiscard]] const DispatchRouter& Router() const noexcept { return router_; }

private:
    std::optional<nlohmann::json> Route(const nlohmann::json& message,
                                        const CallContext& context);
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id) const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id,
                                   const CallContext& context) const;
    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    DispatchRouter router_;
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> initialized_{false};
};

} // namespace portainer_mcp

#include <portainer_mcp/mcp/mcp_server.hpp>

#include <portainer_mcp/core/log.hpp>
#include <portainer_mcp/core/version.hpp>

#include <exception>
#include <optional>
#include <string>

namespace portainer_mcp {

McpServer::McpServer(DispatchRouter router,
                     std::istream& in,
                     std::ostream& out)
    : router_(std::move(router)), in_(in), out_(out) {}

void McpServer::Run() {
    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty() || line == "\r") continue;

        auto response = HandleRaw(line);
        if (response) {
            out_ << response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                 << "\n";
            out_.flush();
        }
    }
    LogInfo("mcp", "Input stream closed, stopping");
}

std::optional<nlohmann::json> McpServer::HandleRaw(const std::string& raw,
                                                   const CallContext& context) {
    auto message = nlohmann::json::parse(raw, nullptr, /*allow_exceptions=*/false);
    if (message.is_discarded()) {
        return MakeError(nullptr, -32700, "Parse error");
    }
    return HandleMessage(message, context);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message, const CallContext& context) {
    try {
        return Route(message, context);
    } catch (const std::exception& e) {
        LogError("mcp", std::string("Failed to handle message: ") + e.what());
        if (!message.is_object() || !message.contains("id")) {
            return std::nullopt;
        }
        return MakeError(message["id"], -32603, "Internal error");
    }
}

std::optional<nlohmann::json> McpServer::Route(const nlohmann::json& message,
                                               const CallContext& context) {
    if (!message.is_object()) {
        return MakeError(nullptr, -32600, "Invalid Request");
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], -32600, "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id".
    if (!message.contains("id")) {
        return std::nullopt;
    }

    const auto& id = message["id"];
    if (!message.contains("method") || !message["method"].is_string()) {
        return MakeError(id, -32600, "Missing 'method'");
    }
    const auto method = message["method"].get<std::string>();
    const auto params = message.contains("params") && message["params"].is_object()
                            ? message["params"]
                            : nlohmann::json::object();

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id, context);
    } else {
        return MakeError(id, -32601, "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& info = params["clientInfo"];
        const bool named = info.contains("name") && info["name"].is_string();
        LogInfo("mcp", "Client connected: " +
                           (named ? info["name"].get<std::string>() : std::string("unknown")));
    }

    nlohmann::json result;
    result["protocolVersion"] = kMcpProtocolVersion;
    result["capabilities"] = {
        {"tools", {{"listChanged", false}}}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) const {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto* definition : router_.Tools()) {
        nlohmann::json tool = {
            {"name", definition->name},
            {"description", definition->description},
            {"inputSchema", definition->input_schema}
        };
        if (!definition->annotations.empty()) {
            tool["annotations"] = definition->annotations;
        }
        tools.push_back(std::move(tool));
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id,
    const CallContext& context) const {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, -32602, "Missing 'name' parameter");
    }

    CallRequest request;
    request.tool_name = params["name"].get<std::string>();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return MakeError(id, -32602, "'arguments' must be an object");
        }
        request.arguments = params["arguments"];
    }

    if (!initialized_) {
        LogDebug("mcp", "tools/call before initialize");
    }
    LogDebug("mcp", "tools/call " + request.tool_name);
    auto result = router_.Dispatch(request, context);

    if (result.IsOk()) {
        return MakeResult(id, {{"content", result.Value()}});
    }

    const auto& failure = result.Error();
    if (failure.kind == FailureKind::UnknownTool) {
        return MakeError(id, -32602, failure.message);
    }

    nlohmann::json response_result;
    response_result["content"] = TextContent(
        failure.ToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    response_result["isError"] = true;
    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace portainer_mcp

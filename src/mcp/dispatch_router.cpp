#include <portainer_mcp/mcp/dispatch_router.hpp>

#include <portainer_mcp/core/log.hpp>
#include <portainer_mcp/mcp/schema_validator.hpp>

#include <string>

namespace portainer_mcp {

DispatchRouter::DispatchRouter(ToolCatalog catalog, AccessGuard guard)
    : catalog_(std::move(catalog)), guard_(guard) {}

bool DispatchRouter::RegisterIfPresent(ToolId id, ToolHandler handler) {
    return Bind(id, std::move(handler), nullptr, /*check_mutating=*/true);
}

bool DispatchRouter::RegisterProxyIfPresent(ToolId id, ToolHandler handler) {
    // Method-based gating only matters when writes are disabled.
    CallGate gate;
    if (guard_.ReadOnly()) {
        // A missing or mistyped method is left to schema validation; only a
        // method that would write is refused here.
        gate = [guard = guard_](const nlohmann::json& arguments) {
            if (!arguments.is_object() || !arguments.contains("method") ||
                !arguments["method"].is_string()) {
                return true;
            }
            return guard.IsMethodAllowed(arguments["method"].get<std::string>());
        };
    }
    return Bind(id, std::move(handler), std::move(gate), /*check_mutating=*/false);
}

bool DispatchRouter::Bind(ToolId id, ToolHandler handler, CallGate gate,
                          bool check_mutating) {
    const std::string name(ToolName(id));
    const auto* definition = catalog_.Find(name);
    if (definition == nullptr) {
        LogWarn("router", "Tool " + name + " not found, will not be registered for MCP usage");
        return false;
    }
    if (check_mutating && !guard_.IsAllowed(*definition)) {
        LogDebug("router", "Skipping mutating tool " + name + " in read-only mode");
        return false;
    }

    if (!registry_.Register(ToolBinding{*definition, std::move(handler), std::move(gate)})) {
        LogError("router", "Tool " + name + " is already registered, keeping the first binding");
        return false;
    }
    LogDebug("router", "Registered tool " + name);
    return true;
}

CallResult DispatchRouter::Dispatch(const CallRequest& request,
                                    const CallContext& context) const {
    const auto* binding = registry_.Find(request.tool_name);
    if (binding == nullptr) {
        return CallResult::Err(CallFailure::UnknownTool(request.tool_name));
    }

    // A refused call is reported exactly like a tool that does not exist.
    if (binding->gate && !binding->gate(request.arguments)) {
        LogDebug("router", "Call to " + request.tool_name + " refused in read-only mode");
        return CallResult::Err(CallFailure::UnknownTool(request.tool_name));
    }

    auto valid = ValidateArguments(binding->definition.input_schema, request.arguments);
    if (valid.IsErr()) {
        const auto& issue = valid.Error();
        return CallResult::Err(CallFailure::InvalidArguments(issue.field, issue.reason));
    }

    try {
        auto result = binding->handler(request.arguments, context);
        if (result.IsErr()) {
            LogInfo("router", "Tool " + request.tool_name + " failed: " +
                                  result.Error().message);
        }
        return result;
    } catch (const std::exception& e) {
        LogError("router", "Tool " + request.tool_name + " threw: " + e.what());
        return CallResult::Err(CallFailure{FailureKind::HandlerFailure,
                                           std::string("Tool error: ") + e.what(),
                                           std::nullopt});
    } catch (...) {
        LogError("router", "Tool " + request.tool_name + " threw a non-standard exception");
        return CallResult::Err(CallFailure{FailureKind::HandlerFailure,
                                           "Tool error: unknown exception", std::nullopt});
    }
}

} // namespace portainer_mcp

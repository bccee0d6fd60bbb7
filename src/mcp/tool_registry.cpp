#include <portainer_mcp/mcp/tool_registry.hpp>

namespace portainer_mcp {

const char* FailureKindName(FailureKind kind) {
    switch (kind) {
        case FailureKind::UnknownTool:         return "UnknownTool";
        case FailureKind::InvalidArguments:    return "InvalidArguments";
        case FailureKind::HandlerFailure:      return "HandlerFailure";
        case FailureKind::UpstreamUnreachable: return "UpstreamUnreachable";
        case FailureKind::ResponseTooLarge:    return "ResponseTooLarge";
    }
    return "HandlerFailure";
}

CallFailure CallFailure::UnknownTool(const std::string& name) {
    return CallFailure{FailureKind::UnknownTool, "Unknown tool: " + name, std::nullopt};
}

CallFailure CallFailure::InvalidArguments(const std::string& field,
                                          const std::string& reason) {
    return CallFailure{FailureKind::InvalidArguments,
                       "Invalid argument '" + field + "': " + reason, field};
}

CallFailure CallFailure::Handler(const Error& error) {
    // Portainer's own message is what the agent can act on.
    std::string message = error.backend_error.value_or(error.message);
    if (error.backend_error.has_value() && message != error.message) {
        message = error.message + ": " + message;
    }
    return CallFailure{FailureKind::HandlerFailure, message, std::nullopt};
}

nlohmann::json CallFailure::ToJson() const {
    nlohmann::json err = {{"kind", FailureKindName(kind)}, {"message", message}};
    if (field.has_value()) {
        err["field"] = *field;
    }
    return {{"error", err}};
}

Content TextContent(const std::string& text) {
    return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

Content JsonContent(const nlohmann::json& value) {
    return TextContent(value.dump(2));
}

bool ToolRegistry::Register(ToolBinding binding) {
    auto name = binding.definition.name;
    return bindings_.emplace(std::move(name), std::move(binding)).second;
}

const ToolBinding* ToolRegistry::Find(std::string_view name) const {
    auto it = bindings_.find(name);
    return it == bindings_.end() ? nullptr : &it->second;
}

std::vector<const ToolDefinition*> ToolRegistry::Tools() const {
    std::vector<const ToolDefinition*> out;
    out.reserve(bindings_.size());
    for (const auto& [name, binding] : bindings_) {
        out.push_back(&binding.definition);
    }
    return out;
}

} // namespace portainer_mcp

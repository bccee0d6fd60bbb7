#pragma once

#include <portainer_mcp/catalog/tool_catalog.hpp>
#include <portainer_mcp/core/result.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace portainer_mcp {

// ---------------------------------------------------------------------------
// FailureKind / CallFailure: per-call failures. None of them is fatal.
// ---------------------------------------------------------------------------
enum class FailureKind {
    UnknownTool,
    InvalidArguments,
    HandlerFailure,
    UpstreamUnreachable,
    ResponseTooLarge,
};

[[nodiscard]] const char* FailureKindName(FailureKind kind);

struct CallFailure {
    FailureKind kind = FailureKind::HandlerFailure;
    std::string message;
    std::optional<std::string> field;

    static CallFailure UnknownTool(const std::string& name);
    static CallFailure InvalidArguments(const std::string& field,
                                        const std::string& reason);
    static CallFailure Handler(const Error& error);

    // {"error": {"kind": ..., "message": ..., "field": ...}}
    [[nodiscard]] nlohmann::json ToJson() const;

    bool operator==(const CallFailure& other) const {
        return kind == other.kind && message == other.message && field == other.field;
    }
    bool operator!=(const CallFailure& other) const { return !(*this == other); }
};

// MCP content blocks: [{"type": "text", "text": ...}, ...]
using Content = nlohmann::json;
using CallResult = Result<Content, CallFailure>;

// One text content block.
[[nodiscard]] Content TextContent(const std::string& text);
// Pretty-printed JSON in one text content block.
[[nodiscard]] Content JsonContent(const nlohmann::json& value);

struct CallRequest {
    std::string tool_name;
    nlohmann::json arguments = nlohmann::json::object();
};

// Per-call context supplied by the transport.
struct CallContext {
    std::function<bool()> is_cancelled;

    [[nodiscard]] bool IsCancelled() const {
        return is_cancelled && is_cancelled();
    }
};

using ToolHandler = std::function<CallResult(const nlohmann::json& arguments,
                                             const CallContext& context)>;

// Per-call admission check over the raw arguments. Refusal makes the call
// look like an unknown tool.
using CallGate = std::function<bool(const nlohmann::json& arguments)>;

struct ToolBinding {
    ToolDefinition definition;
    ToolHandler handler;
    CallGate gate;  // empty: always admitted
};

// ---------------------------------------------------------------------------
// ToolRegistry: name -> binding. Filled once at startup, then only read.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Returns false (and keeps the existing binding) if the name is taken.
    [[nodiscard]] bool Register(ToolBinding binding);

    [[nodiscard]] const ToolBinding* Find(std::string_view name) const;

    [[nodiscard]] bool HasTool(std::string_view name) const {
        return Find(name) != nullptr;
    }

    // Bound definitions in name order.
    [[nodiscard]] std::vector<const ToolDefinition*> Tools() const;

    [[nodiscard]] size_t Size() const noexcept { return bindings_.size(); }

private:
    std::map<std::string, ToolBinding, std::less<>> bindings_;
};

} // namespace portainer_mcp

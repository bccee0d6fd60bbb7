#pragma once

#include <portainer_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace portainer_mcp {

// Oldest tool catalog document version this binary understands.
inline constexpr const char* kMinimumToolsVersion = "1.0";

// ---------------------------------------------------------------------------
// ToolDefinition: one declared tool. Immutable once loaded.
// ---------------------------------------------------------------------------
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
    bool mutating = true;
    nlohmann::json annotations = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// ToolCatalog: the declared set of tools, loaded once from a YAML document:
//
//   version: v1.2
//   tools:
//     - name: listEnvironments
//       description: ...
//       mutating: false            # optional, else !annotations.readOnlyHint
//       parameters: [...]          # or inputSchema: {...}
//       annotations: {...}
//
// A catalog says nothing about which handlers exist; it may declare tools
// the binary cannot serve.
// ---------------------------------------------------------------------------
class ToolCatalog {
public:
    using DefinitionMap = std::map<std::string, ToolDefinition, std::less<>>;

    [[nodiscard]] static Result<ToolCatalog, Error> LoadFromFile(
        std::string_view path,
        std::string_view minimum_version = kMinimumToolsVersion);

    [[nodiscard]] static Result<ToolCatalog, Error> LoadFromString(
        std::string_view yaml,
        std::string_view minimum_version = kMinimumToolsVersion);

    [[nodiscard]] const ToolDefinition* Find(std::string_view name) const;

    [[nodiscard]] const std::string& Version() const noexcept { return version_; }
    [[nodiscard]] size_t Size() const noexcept { return definitions_.size(); }

private:
    ToolCatalog() = default;

    std::string version_;
    DefinitionMap definitions_;
};

// Compare two dotted numeric versions ("1.0", "v1.2.3"). Missing components
// count as zero. Returns <0, 0 or >0; Err for a non-numeric component.
[[nodiscard]] Result<int, std::string> CompareVersions(std::string_view lhs,
                                                       std::string_view rhs);

} // namespace portainer_mcp

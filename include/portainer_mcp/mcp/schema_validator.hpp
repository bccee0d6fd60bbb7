#pragma once

#include <portainer_mcp/core/result.hpp>

#include <string>

#include <nlohmann/json.hpp>

namespace portainer_mcp {

struct ValidationIssue {
    std::string field;   // "name", "tagIds[2]", "options.mode"; "" for the root
    std::string reason;
};

// Check `arguments` against a JSON Schema object of the subset tool
// catalogs use: type, properties, required, items, enum and
// additionalProperties: false. Properties the schema does not mention are
// accepted unless additionalProperties is false.
[[nodiscard]] Result<void, ValidationIssue> ValidateArguments(
    const nlohmann::json& schema, const nlohmann::json& arguments);

} // namespace portainer_mcp

#include <portainer_mcp/catalog/tool_catalog.hpp>

#include <portainer_mcp/core/log.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <set>
#include <sstream>
#include <vector>

namespace portainer_mcp {

namespace {

Error MakeSchemaError(const std::string& message, const std::string& source = "") {
    return Error{"LoadToolCatalog", source, std::nullopt, message, std::nullopt,
                 ErrorCategory::Schema};
}

const std::set<std::string>& KnownParameterTypes() {
    static const std::set<std::string> types = {
        "string", "number", "integer", "boolean", "array", "object"};
    return types;
}

constexpr int kMaxVersionComponent = 999999999;

Result<std::vector<int>, std::string> ParseVersion(std::string_view version) {
    using R = Result<std::vector<int>, std::string>;
    if (!version.empty() && (version[0] == 'v' || version[0] == 'V')) {
        version.remove_prefix(1);
    }
    if (version.empty()) {
        return R::Err("empty version");
    }

    std::vector<int> parts;
    int current = 0;
    bool have_digit = false;
    for (char c : version) {
        if (c == '.') {
            if (!have_digit) return R::Err("empty version component");
            parts.push_back(current);
            current = 0;
            have_digit = false;
        } else if (c >= '0' && c <= '9') {
            if (current > (kMaxVersionComponent - (c - '0')) / 10) {
                return R::Err("version component out of range");
            }
            current = current * 10 + (c - '0');
            have_digit = true;
        } else {
            return R::Err(std::string("unexpected character '") + c + "' in version");
        }
    }
    if (!have_digit) return R::Err("empty version component");
    parts.push_back(current);
    return R::Ok(std::move(parts));
}

// Convert a YAML node to JSON. Quoted scalars stay strings; plain scalars
// become booleans or numbers when they parse as such.
nlohmann::json YamlToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            return nullptr;
        case YAML::NodeType::Sequence: {
            auto arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(YamlToJson(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            auto obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = YamlToJson(kv.second);
            }
            return obj;
        }
        case YAML::NodeType::Scalar:
            break;
    }

    if (node.Tag() == "!") {
        return node.Scalar();
    }
    bool b = false;
    if (YAML::convert<bool>::decode(node, b)) return b;
    int64_t i = 0;
    if (YAML::convert<int64_t>::decode(node, i)) return i;
    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) return d;
    return node.Scalar();
}

// Build a JSON Schema property from one entry of `parameters`.
Result<nlohmann::json, std::string> ParseParameter(const YAML::Node& param,
                                                   std::string& out_name,
                                                   bool& out_required) {
    using R = Result<nlohmann::json, std::string>;
    if (!param.IsMap()) {
        return R::Err("parameter entry is not a mapping");
    }
    if (!param["name"]) {
        return R::Err("parameter without 'name'");
    }
    out_name = param["name"].as<std::string>();
    if (out_name.empty()) {
        return R::Err("parameter with empty 'name'");
    }

    const auto type = param["type"] ? param["type"].as<std::string>() : std::string("string");
    if (KnownParameterTypes().count(type) == 0) {
        return R::Err("parameter '" + out_name + "' has unknown type '" + type + "'");
    }

    nlohmann::json prop = {{"type", type}};
    if (param["description"]) {
        prop["description"] = param["description"].as<std::string>();
    }
    if (param["enum"]) {
        if (!param["enum"].IsSequence()) {
            return R::Err("parameter '" + out_name + "' has a non-list 'enum'");
        }
        prop["enum"] = YamlToJson(param["enum"]);
    }
    if (type == "array") {
        if (param["items"]) {
            if (!param["items"].IsMap()) {
                return R::Err("parameter '" + out_name + "' has a non-mapping 'items'");
            }
            prop["items"] = YamlToJson(param["items"]);
        }
    } else if (param["items"]) {
        return R::Err("parameter '" + out_name + "' declares 'items' but is not an array");
    }
    if (type == "object" && param["properties"]) {
        prop["properties"] = YamlToJson(param["properties"]);
    }

    out_required = param["required"] && param["required"].as<bool>();
    return R::Ok(std::move(prop));
}

Result<ToolDefinition, std::string> ParseTool(const YAML::Node& node) {
    using R = Result<ToolDefinition, std::string>;
    if (!node.IsMap()) {
        return R::Err("tool entry is not a mapping");
    }
    if (!node["name"] || node["name"].as<std::string>().empty()) {
        return R::Err("tool entry missing 'name'");
    }

    ToolDefinition def;
    def.name = node["name"].as<std::string>();
    if (!node["description"]) {
        return R::Err("tool '" + def.name + "' missing 'description'");
    }
    def.description = node["description"].as<std::string>();

    if (node["annotations"]) {
        if (!node["annotations"].IsMap()) {
            return R::Err("tool '" + def.name + "' has non-mapping 'annotations'");
        }
        def.annotations = YamlToJson(node["annotations"]);
    }

    if (node["mutating"]) {
        def.mutating = node["mutating"].as<bool>();
    } else if (def.annotations.contains("readOnlyHint") &&
               def.annotations["readOnlyHint"].is_boolean()) {
        def.mutating = !def.annotations["readOnlyHint"].get<bool>();
    } else {
        // Undeclared tools are assumed able to change state.
        def.mutating = true;
    }

    if (node["inputSchema"] && node["parameters"]) {
        return R::Err("tool '" + def.name + "' declares both 'inputSchema' and 'parameters'");
    }

    if (node["inputSchema"]) {
        auto schema = YamlToJson(node["inputSchema"]);
        if (!schema.is_object() || schema.value("type", "") != "object") {
            return R::Err("tool '" + def.name + "' inputSchema must be an object schema");
        }
        if (schema.contains("properties") && !schema["properties"].is_object()) {
            return R::Err("tool '" + def.name + "' inputSchema.properties must be a mapping");
        }
        if (schema.contains("required") && !schema["required"].is_array()) {
            return R::Err("tool '" + def.name + "' inputSchema.required must be a list");
        }
        def.input_schema = std::move(schema);
        return R::Ok(std::move(def));
    }

    auto properties = nlohmann::json::object();
    auto required = nlohmann::json::array();
    if (node["parameters"]) {
        if (!node["parameters"].IsSequence()) {
            return R::Err("tool '" + def.name + "' parameters must be a list");
        }
        for (const auto& param : node["parameters"]) {
            std::string name;
            bool is_required = false;
            auto prop = ParseParameter(param, name, is_required);
            if (prop.IsErr()) {
                return R::Err("tool '" + def.name + "': " + prop.Error());
            }
            if (properties.contains(name)) {
                return R::Err("tool '" + def.name + "' declares parameter '" + name + "' twice");
            }
            properties[name] = std::move(prop).Value();
            if (is_required) {
                required.push_back(name);
            }
        }
    }

    def.input_schema = {{"type", "object"},
                        {"properties", std::move(properties)},
                        {"required", std::move(required)}};
    return R::Ok(std::move(def));
}

} // anonymous namespace

Result<int, std::string> CompareVersions(std::string_view lhs, std::string_view rhs) {
    auto a = ParseVersion(lhs);
    if (a.IsErr()) return Result<int, std::string>::Err(a.Error());
    auto b = ParseVersion(rhs);
    if (b.IsErr()) return Result<int, std::string>::Err(b.Error());

    const auto& va = a.Value();
    const auto& vb = b.Value();
    const size_t n = std::max(va.size(), vb.size());
    for (size_t i = 0; i < n; ++i) {
        const int x = i < va.size() ? va[i] : 0;
        const int y = i < vb.size() ? vb[i] : 0;
        if (x != y) {
            return Result<int, std::string>::Ok(x < y ? -1 : 1);
        }
    }
    return Result<int, std::string>::Ok(0);
}

Result<ToolCatalog, Error> ToolCatalog::LoadFromString(std::string_view yaml,
                                                       std::string_view minimum_version) {
    using R = Result<ToolCatalog, Error>;

    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::Exception& e) {
        return R::Err(MakeSchemaError("Failed to parse tool catalog: " + std::string(e.what())));
    }
    if (!root.IsMap()) {
        return R::Err(MakeSchemaError("Tool catalog must be a mapping"));
    }

    ToolCatalog catalog;
    try {
        if (!root["version"]) {
            return R::Err(MakeSchemaError("Tool catalog missing 'version'"));
        }
        catalog.version_ = root["version"].as<std::string>();

        auto cmp = CompareVersions(catalog.version_, minimum_version);
        if (cmp.IsErr()) {
            return R::Err(MakeSchemaError("Invalid tool catalog version '" +
                                          catalog.version_ + "': " + cmp.Error()));
        }
        if (cmp.Value() < 0) {
            return R::Err(MakeSchemaError(
                "Tool catalog version " + catalog.version_ +
                " is older than the minimum supported version " +
                std::string(minimum_version)));
        }

        if (!root["tools"] || !root["tools"].IsSequence()) {
            return R::Err(MakeSchemaError("Tool catalog 'tools' must be a list"));
        }

        for (const auto& node : root["tools"]) {
            auto def = ParseTool(node);
            if (def.IsErr()) {
                return R::Err(MakeSchemaError(def.Error()));
            }
            auto tool = std::move(def).Value();
            if (catalog.definitions_.count(tool.name) > 0) {
                return R::Err(MakeSchemaError("Duplicate tool name '" + tool.name + "'"));
            }
            auto name = tool.name;
            catalog.definitions_.emplace(std::move(name), std::move(tool));
        }
    } catch (const YAML::Exception& e) {
        return R::Err(MakeSchemaError("Malformed tool catalog: " + std::string(e.what())));
    }

    LogDebug("catalog", "Loaded " + std::to_string(catalog.Size()) +
                            " tool definitions (version " + catalog.version_ + ")");
    return R::Ok(std::move(catalog));
}

Result<ToolCatalog, Error> ToolCatalog::LoadFromFile(std::string_view path,
                                                     std::string_view minimum_version) {
    std::ifstream in{std::string(path)};
    if (!in) {
        return Result<ToolCatalog, Error>::Err(
            MakeSchemaError("Cannot open tool catalog", std::string(path)));
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    auto result = LoadFromString(ss.str(), minimum_version);
    if (result.IsErr()) {
        auto error = std::move(result).Error();
        error.endpoint = std::string(path);
        return Result<ToolCatalog, Error>::Err(std::move(error));
    }
    return result;
}

const ToolDefinition* ToolCatalog::Find(std::string_view name) const {
    auto it = definitions_.find(name);
    return it == definitions_.end() ? nullptr : &it->second;
}

} // namespace portainer_mcp

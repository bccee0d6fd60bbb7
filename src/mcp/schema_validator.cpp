#include <portainer_mcp/mcp/schema_validator.hpp>

#include <cmath>

namespace portainer_mcp {

namespace {

using R = Result<void, ValidationIssue>;

std::string TypeName(const nlohmann::json& value) {
    if (value.is_number_integer()) return "integer";
    if (value.is_number()) return "number";
    return value.type_name();
}

bool MatchesType(const std::string& type, const nlohmann::json& value) {
    if (type == "string") return value.is_string();
    if (type == "integer") {
        if (value.is_number_integer()) return true;
        if (value.is_number_float()) {
            const double d = value.get<double>();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    if (type == "number") return value.is_number();
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "null") return value.is_null();
    return true;
}

std::string Join(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

R ValidateValue(const nlohmann::json& schema, const nlohmann::json& value,
                const std::string& field);

R ValidateObject(const nlohmann::json& schema, const nlohmann::json& value,
                 const std::string& field) {
    if (schema.contains("required") && schema["required"].is_array()) {
        for (const auto& req : schema["required"]) {
            if (!req.is_string()) continue;
            const auto key = req.get<std::string>();
            if (!value.contains(key) || value[key].is_null()) {
                return R::Err({Join(field, key), "required parameter is missing"});
            }
        }
    }

    const bool has_properties =
        schema.contains("properties") && schema["properties"].is_object();
    const bool closed = schema.contains("additionalProperties") &&
                        schema["additionalProperties"].is_boolean() &&
                        !schema["additionalProperties"].get<bool>();

    for (const auto& [key, item] : value.items()) {
        if (has_properties && schema["properties"].contains(key)) {
            // An explicit null for an optional parameter means "not given".
            if (item.is_null()) continue;
            auto res = ValidateValue(schema["properties"][key], item, Join(field, key));
            if (res.IsErr()) return res;
        } else if (closed) {
            return R::Err({Join(field, key), "unexpected parameter"});
        }
    }
    return R::Ok();
}

R ValidateValue(const nlohmann::json& schema, const nlohmann::json& value,
                const std::string& field) {
    if (!schema.is_object()) return R::Ok();

    if (schema.contains("type") && schema["type"].is_string()) {
        const auto type = schema["type"].get<std::string>();
        if (!MatchesType(type, value)) {
            return R::Err({field, "expected " + type + ", got " + TypeName(value)});
        }
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto& allowed : schema["enum"]) {
            if (allowed == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return R::Err({field, "value " +
                                      value.dump(-1, ' ', false,
                                                 nlohmann::json::error_handler_t::replace) +
                                      " is not one of " +
                                      schema["enum"].dump()});
        }
    }

    if (value.is_array() && schema.contains("items")) {
        for (size_t i = 0; i < value.size(); ++i) {
            auto res = ValidateValue(schema["items"], value[i],
                                     field + "[" + std::to_string(i) + "]");
            if (res.IsErr()) return res;
        }
    }

    if (value.is_object()) {
        return ValidateObject(schema, value, field);
    }
    return R::Ok();
}

} // anonymous namespace

Result<void, ValidationIssue> ValidateArguments(const nlohmann::json& schema,
                                                const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        return R::Err({"arguments", "expected object, got " + TypeName(arguments)});
    }
    return ValidateObject(schema, arguments, "");
}

} // namespace portainer_mcp

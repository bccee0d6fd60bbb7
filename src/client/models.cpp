#include <portainer_mcp/client/models.hpp>

namespace portainer_mcp {

namespace {

nlohmann::json AccessMapToJson(const AccessMap& accesses) {
    auto obj = nlohmann::json::object();
    for (const auto& [id, level] : accesses) {
        obj[std::to_string(id)] = AccessLevelName(level);
    }
    return obj;
}

} // anonymous namespace

std::string AccessLevelName(AccessLevel level) {
    switch (level) {
        case AccessLevel::EnvironmentAdministrator: return "environment_administrator";
        case AccessLevel::HelpdeskUser:             return "helpdesk_user";
        case AccessLevel::StandardUser:             return "standard_user";
        case AccessLevel::ReadonlyUser:             return "readonly_user";
        case AccessLevel::OperatorUser:             return "operator_user";
    }
    return "unknown";
}

std::optional<AccessLevel> ParseAccessLevel(std::string_view name) {
    if (name == "environment_administrator") return AccessLevel::EnvironmentAdministrator;
    if (name == "helpdesk_user") return AccessLevel::HelpdeskUser;
    if (name == "standard_user") return AccessLevel::StandardUser;
    if (name == "readonly_user") return AccessLevel::ReadonlyUser;
    if (name == "operator_user") return AccessLevel::OperatorUser;
    return std::nullopt;
}

std::optional<AccessLevel> AccessLevelFromRoleId(int role_id) {
    if (role_id < 1 || role_id > 5) return std::nullopt;
    return static_cast<AccessLevel>(role_id);
}

std::string UserRoleName(UserRole role) {
    switch (role) {
        case UserRole::Admin:     return "admin";
        case UserRole::User:      return "user";
        case UserRole::EdgeAdmin: return "edge_admin";
    }
    return "unknown";
}

std::optional<UserRole> ParseUserRole(std::string_view name) {
    if (name == "admin") return UserRole::Admin;
    if (name == "user") return UserRole::User;
    if (name == "edge_admin") return UserRole::EdgeAdmin;
    return std::nullopt;
}

nlohmann::json ToJson(const EnvironmentTag& tag) {
    return {{"id", tag.id},
            {"name", tag.name},
            {"environment_ids", tag.environment_ids}};
}

nlohmann::json ToJson(const Environment& env) {
    return {{"id", env.id},
            {"name", env.name},
            {"status", env.status},
            {"type", env.type},
            {"tag_ids", env.tag_ids},
            {"user_accesses", AccessMapToJson(env.user_accesses)},
            {"team_accesses", AccessMapToJson(env.team_accesses)}};
}

nlohmann::json ToJson(const EnvironmentGroup& group) {
    return {{"id", group.id},
            {"name", group.name},
            {"environment_ids", group.environment_ids},
            {"tag_ids", group.tag_ids}};
}

nlohmann::json ToJson(const AccessGroup& group) {
    return {{"id", group.id},
            {"name", group.name},
            {"environment_ids", group.environment_ids},
            {"user_accesses", AccessMapToJson(group.user_accesses)},
            {"team_accesses", AccessMapToJson(group.team_accesses)}};
}

nlohmann::json ToJson(const Stack& stack) {
    return {{"id", stack.id},
            {"name", stack.name},
            {"created_at", stack.created_at},
            {"group_ids", stack.environment_group_ids}};
}

nlohmann::json ToJson(const Team& team) {
    return {{"id", team.id},
            {"name", team.name},
            {"members", team.member_ids}};
}

nlohmann::json ToJson(const User& user) {
    return {{"id", user.id},
            {"username", user.username},
            {"role", user.role}};
}

nlohmann::json ToJson(const PortainerSettings& settings) {
    return {{"authentication", {{"method", settings.authentication_method}}},
            {"edge", {{"enabled", settings.edge_enabled},
                      {"server_url", settings.edge_server_url}}}};
}

} // namespace portainer_mcp

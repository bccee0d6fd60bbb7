#pragma once

#include <portainer_mcp/core/url.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portainer_mcp {

// ---------------------------------------------------------------------------
// Access levels granted to users and teams on environments and access groups.
// ---------------------------------------------------------------------------
enum class AccessLevel {
    EnvironmentAdministrator = 1,
    HelpdeskUser = 2,
    StandardUser = 3,
    ReadonlyUser = 4,
    OperatorUser = 5,
};

[[nodiscard]] std::string AccessLevelName(AccessLevel level);
[[nodiscard]] std::optional<AccessLevel> ParseAccessLevel(std::string_view name);
// Portainer role IDs map one-to-one onto access levels.
[[nodiscard]] std::optional<AccessLevel> AccessLevelFromRoleId(int role_id);

// User or team ID -> access level.
using AccessMap = std::map<int, AccessLevel>;

enum class UserRole {
    Admin = 1,
    User = 2,
    EdgeAdmin = 3,
};

[[nodiscard]] std::string UserRoleName(UserRole role);
[[nodiscard]] std::optional<UserRole> ParseUserRole(std::string_view name);

// ---------------------------------------------------------------------------
// Domain models, as presented to agents.
// ---------------------------------------------------------------------------
struct EnvironmentTag {
    int id = 0;
    std::string name;
    std::vector<int> environment_ids;
};

struct Environment {
    int id = 0;
    std::string name;
    std::string status;  // "active", "inactive" or "unknown"
    std::string type;    // "docker-local", "kubernetes-agent", ...
    std::vector<int> tag_ids;
    AccessMap user_accesses;
    AccessMap team_accesses;
};

// Edge group.
struct EnvironmentGroup {
    int id = 0;
    std::string name;
    std::vector<int> environment_ids;
    std::vector<int> tag_ids;
};

// Endpoint group.
struct AccessGroup {
    int id = 0;
    std::string name;
    std::vector<int> environment_ids;
    AccessMap user_accesses;
    AccessMap team_accesses;
};

// Edge stack.
struct Stack {
    int id = 0;
    std::string name;
    std::string created_at;  // ISO-8601 UTC
    std::vector<int> environment_group_ids;
};

struct Team {
    int id = 0;
    std::string name;
    std::vector<int> member_ids;
};

struct User {
    int id = 0;
    std::string username;
    std::string role;
};

struct PortainerSettings {
    std::string authentication_method;  // "internal", "ldap", "oauth", "unknown"
    bool edge_enabled = false;
    std::string edge_server_url;
};

nlohmann::json ToJson(const EnvironmentTag& tag);
nlohmann::json ToJson(const Environment& env);
nlohmann::json ToJson(const EnvironmentGroup& group);
nlohmann::json ToJson(const AccessGroup& group);
nlohmann::json ToJson(const Stack& stack);
nlohmann::json ToJson(const Team& team);
nlohmann::json ToJson(const User& user);
nlohmann::json ToJson(const PortainerSettings& settings);

template <typename T>
nlohmann::json ToJsonArray(const std::vector<T>& items) {
    auto arr = nlohmann::json::array();
    for (const auto& item : items) {
        arr.push_back(ToJson(item));
    }
    return arr;
}

// ---------------------------------------------------------------------------
// Raw proxy request/response shapes.
// ---------------------------------------------------------------------------
struct ProxyRequest {
    int environment_id = 0;
    std::string method;
    std::string path;       // relative to the engine API root, starts with '/'
    KeyValueList query;
    KeyValueList headers;   // may repeat keys
    std::string body;
};

struct ProxyResponse {
    int status_code = 0;
    KeyValueList headers;
    std::string body;       // empty when the body went to a ProxyBodySink
};

// Receives upstream body bytes as they arrive. Return false to abort the
// transfer.
using ProxyBodySink = std::function<bool(const char* data, size_t length)>;

// Polled while a proxied request is in flight. Returning true stops the
// request even when the upstream has not sent anything yet.
using ProxyCancelCheck = std::function<bool()>;

} // namespace portainer_mcp

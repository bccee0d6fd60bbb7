#include <portainer_mcp/mcp/tool_handlers.hpp>

#include <portainer_mcp/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <optional>
#include <string>
#include <vector>

namespace portainer_mcp {

namespace {

// ---------------------------------------------------------------------------
// Argument helpers. The schema has already been checked by the router; these
// re-check types because a catalog may declare looser schemas. On failure
// they return nullopt and set out_error.
// ---------------------------------------------------------------------------

std::optional<int> AsInt(const nlohmann::json& value) {
    if (!value.is_number()) return std::nullopt;
    const double d = value.get<double>();
    if (std::floor(d) != d || d < -2147483648.0 || d > 2147483647.0) {
        return std::nullopt;
    }
    return static_cast<int>(d);
}

std::optional<int> RequireInt(const nlohmann::json& args, const std::string& key,
                              CallFailure& out_error) {
    if (!args.contains(key)) {
        out_error = CallFailure::InvalidArguments(key, "required parameter is missing");
        return std::nullopt;
    }
    auto v = AsInt(args[key]);
    if (!v) {
        out_error = CallFailure::InvalidArguments(key, "expected an integer");
    }
    return v;
}

std::optional<std::string> RequireString(const nlohmann::json& args, const std::string& key,
                                         CallFailure& out_error) {
    if (!args.contains(key) || !args[key].is_string() ||
        args[key].get<std::string>().empty()) {
        out_error = CallFailure::InvalidArguments(key, "required parameter is missing");
        return std::nullopt;
    }
    return args[key].get<std::string>();
}

std::optional<std::vector<int>> IntArray(const nlohmann::json& args, const std::string& key,
                                         CallFailure& out_error, bool required = true) {
    std::vector<int> out;
    if (!args.contains(key) || args[key].is_null()) {
        if (required) {
            out_error = CallFailure::InvalidArguments(key, "required parameter is missing");
            return std::nullopt;
        }
        return out;
    }
    if (!args[key].is_array()) {
        out_error = CallFailure::InvalidArguments(key, "expected an array of integers");
        return std::nullopt;
    }
    for (size_t i = 0; i < args[key].size(); ++i) {
        auto v = AsInt(args[key][i]);
        if (!v) {
            out_error = CallFailure::InvalidArguments(key + "[" + std::to_string(i) + "]",
                                                      "expected an integer");
            return std::nullopt;
        }
        out.push_back(*v);
    }
    return out;
}

// [{"id": 1, "access": "standard_user"}, ...]
std::optional<AccessMap> AccessList(const nlohmann::json& args, const std::string& key,
                                    CallFailure& out_error) {
    if (!args.contains(key) || !args[key].is_array()) {
        out_error = CallFailure::InvalidArguments(key, "expected an array of {id, access}");
        return std::nullopt;
    }
    AccessMap out;
    for (size_t i = 0; i < args[key].size(); ++i) {
        const auto field = key + "[" + std::to_string(i) + "]";
        const auto& entry = args[key][i];
        if (!entry.is_object() || !entry.contains("id") || !entry.contains("access")) {
            out_error = CallFailure::InvalidArguments(field, "expected {id, access}");
            return std::nullopt;
        }
        auto id = AsInt(entry["id"]);
        if (!id) {
            out_error = CallFailure::InvalidArguments(field + ".id", "expected an integer");
            return std::nullopt;
        }
        if (!entry["access"].is_string()) {
            out_error = CallFailure::InvalidArguments(field + ".access", "expected a string");
            return std::nullopt;
        }
        const auto access = entry["access"].get<std::string>();
        auto level = ParseAccessLevel(access);
        if (!level) {
            out_error = CallFailure::InvalidArguments(
                field + ".access", "invalid access level '" + access + "'");
            return std::nullopt;
        }
        out[*id] = *level;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

template <typename T>
CallResult ListResult(const Result<std::vector<T>, Error>& result) {
    if (result.IsErr()) return CallResult::Err(CallFailure::Handler(result.Error()));
    return CallResult::Ok(JsonContent(ToJsonArray(result.Value())));
}

CallResult DoneResult(const Result<void, Error>& result, const std::string& message) {
    if (result.IsErr()) return CallResult::Err(CallFailure::Handler(result.Error()));
    return CallResult::Ok(TextContent(message));
}

CallResult CreatedResult(const Result<int, Error>& result, const std::string& what) {
    if (result.IsErr()) return CallResult::Err(CallFailure::Handler(result.Error()));
    return CallResult::Ok(
        TextContent(what + " created successfully with ID: " + std::to_string(result.Value())));
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// createEnvironmentTag
CallResult HandleCreateEnvironmentTag(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto name = RequireString(args, "name", err);
    if (!name) return CallResult::Err(err);
    return CreatedResult(client.CreateEnvironmentTag(*name), "Environment tag");
}

// updateEnvironmentTags
CallResult HandleUpdateEnvironmentTags(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto tag_ids = IntArray(args, "tagIds", err);
    if (!tag_ids) return CallResult::Err(err);
    return DoneResult(client.UpdateEnvironmentTags(*id, *tag_ids),
                      "Environment tags updated successfully");
}

// updateEnvironmentUserAccesses
CallResult HandleUpdateEnvironmentUserAccesses(IPortainerClient& client,
                                               const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto accesses = AccessList(args, "userAccesses", err);
    if (!accesses) return CallResult::Err(err);
    return DoneResult(client.UpdateEnvironmentUserAccesses(*id, *accesses),
                      "Environment user accesses updated successfully");
}

// updateEnvironmentTeamAccesses
CallResult HandleUpdateEnvironmentTeamAccesses(IPortainerClient& client,
                                               const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto accesses = AccessList(args, "teamAccesses", err);
    if (!accesses) return CallResult::Err(err);
    return DoneResult(client.UpdateEnvironmentTeamAccesses(*id, *accesses),
                      "Environment team accesses updated successfully");
}

CallResult HandleCreateEnvironmentGroup(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto name = RequireString(args, "name", err);
    if (!name) return CallResult::Err(err);
    auto env_ids = IntArray(args, "environmentIds", err);
    if (!env_ids) return CallResult::Err(err);
    return CreatedResult(client.CreateEnvironmentGroup(*name, *env_ids), "Environment group");
}

CallResult HandleUpdateEnvironmentGroupName(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto name = RequireString(args, "name", err);
    if (!name) return CallResult::Err(err);
    return DoneResult(client.UpdateEnvironmentGroupName(*id, *name),
                      "Environment group name updated successfully");
}

CallResult HandleUpdateEnvironmentGroupEnvironments(IPortainerClient& client,
                                                    const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto env_ids = IntArray(args, "environmentIds", err);
    if (!env_ids) return CallResult::Err(err);
    return DoneResult(client.UpdateEnvironmentGroupEnvironments(*id, *env_ids),
                      "Environment group environments updated successfully");
}

CallResult HandleUpdateEnvironmentGroupTags(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto tag_ids = IntArray(args, "tagIds", err);
    if (!tag_ids) return CallResult::Err(err);
    return DoneResult(client.UpdateEnvironmentGroupTags(*id, *tag_ids),
                      "Environment group tags updated successfully");
}

CallResult HandleCreateAccessGroup(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto name = RequireString(args, "name", err);
    if (!name) return CallResult::Err(err);
    auto env_ids = IntArray(args, "environmentIds", err, /*required=*/false);
    if (!env_ids) return CallResult::Err(err);
    return CreatedResult(client.CreateAccessGroup(*name, *env_ids), "Access group");
}

CallResult HandleUpdateAccessGroupName(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto name = RequireString(args, "name", err);
    if (!name) return CallResult::Err(err);
    return DoneResult(client.UpdateAccessGroupName(*id, *name),
                      "Access group name updated successfully");
}

CallResult HandleUpdateAccessGroupUserAccesses(IPortainerClient& client,
                                               const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto accesses = AccessList(args, "userAccesses", err);
    if (!accesses) return CallResult::Err(err);
    return DoneResult(client.UpdateAccessGroupUserAccesses(*id, *accesses),
                      "Access group user accesses updated successfully");
}

CallResult HandleUpdateAccessGroupTeamAccesses(IPortainerClient& client,
                                               const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto accesses = AccessList(args, "teamAccesses", err);
    if (!accesses) return CallResult::Err(err);
    return DoneResult(client.UpdateAccessGroupTeamAccesses(*id, *accesses),
                      "Access group team accesses updated successfully");
}

CallResult HandleAddEnvironmentToAccessGroup(IPortainerClient& client,
                                             const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto env_id = RequireInt(args, "environmentId", err);
    if (!env_id) return CallResult::Err(err);
    return DoneResult(client.AddEnvironmentToAccessGroup(*id, *env_id),
                      "Environment added to access group successfully");
}

CallResult HandleRemoveEnvironmentFromAccessGroup(IPortainerClient& client,
                                                  const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto env_id = RequireInt(args, "environmentId", err);
    if (!env_id) return CallResult::Err(err);
    return DoneResult(client.RemoveEnvironmentFromAccessGroup(*id, *env_id),
                      "Environment removed from access group successfully");
}

// getStackFile returns the compose file verbatim.
CallResult HandleGetStackFile(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto result = client.GetStackFile(*id);
    if (result.IsErr()) return CallResult::Err(CallFailure::Handler(result.Error()));
    return CallResult::Ok(TextContent(result.Value()));
}

CallResult HandleCreateStack(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto name = RequireString(args, "name", err);
    if (!name) return CallResult::Err(err);
    auto file = RequireString(args, "file", err);
    if (!file) return CallResult::Err(err);
    auto group_ids = IntArray(args, "environmentGroupIds", err);
    if (!group_ids) return CallResult::Err(err);
    return CreatedResult(client.CreateStack(*name, *file, *group_ids), "Stack");
}

CallResult HandleUpdateStack(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto file = RequireString(args, "file", err);
    if (!file) return CallResult::Err(err);
    auto group_ids = IntArray(args, "environmentGroupIds", err);
    if (!group_ids) return CallResult::Err(err);
    return DoneResult(client.UpdateStack(*id, *file, *group_ids), "Stack updated successfully");
}

CallResult HandleCreateTeam(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto name = RequireString(args, "name", err);
    if (!name) return CallResult::Err(err);
    return CreatedResult(client.CreateTeam(*name), "Team");
}

CallResult HandleUpdateTeamName(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto name = RequireString(args, "name", err);
    if (!name) return CallResult::Err(err);
    return DoneResult(client.UpdateTeamName(*id, *name), "Team name updated successfully");
}

CallResult HandleUpdateTeamMembers(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto user_ids = IntArray(args, "userIds", err);
    if (!user_ids) return CallResult::Err(err);
    return DoneResult(client.UpdateTeamMembers(*id, *user_ids),
                      "Team members updated successfully");
}

CallResult HandleUpdateUserRole(IPortainerClient& client, const nlohmann::json& args) {
    CallFailure err;
    auto id = RequireInt(args, "id", err);
    if (!id) return CallResult::Err(err);
    auto role_name = RequireString(args, "role", err);
    if (!role_name) return CallResult::Err(err);
    auto role = ParseUserRole(*role_name);
    if (!role) {
        return CallResult::Err(
            CallFailure::InvalidArguments("role", "invalid role '" + *role_name + "'"));
    }
    return DoneResult(client.UpdateUserRole(*id, *role), "User role updated successfully");
}

// Adapt a (client, args) handler to the router's signature. A call cancelled
// before it starts never reaches Portainer; one already sent is bounded by
// the client's request timeout.
template <typename Fn>
ToolHandler Bind(IPortainerClient& client, Fn fn) {
    return [&client, fn](const nlohmann::json& args, const CallContext& context) {
        if (context.IsCancelled()) {
            return CallResult::Err(CallFailure{FailureKind::UpstreamUnreachable,
                                               "request cancelled", std::nullopt});
        }
        return fn(client, args);
    };
}

} // anonymous namespace

size_t RegisterPortainerTools(DispatchRouter& router,
                              IPortainerClient& client,
                              const ProxyLimits& proxy_limits) {
    size_t count = 0;
    const auto add = [&](ToolId id, ToolHandler handler) {
        if (router.RegisterIfPresent(id, std::move(handler))) ++count;
    };

    // -- Tags ----------------------------------------------------------------
    add(ToolId::ListEnvironmentTags,
        Bind(client, [](IPortainerClient& c, const nlohmann::json&) {
            return ListResult(c.GetEnvironmentTags());
        }));
    add(ToolId::CreateEnvironmentTag, Bind(client, HandleCreateEnvironmentTag));

    // -- Environments --------------------------------------------------------
    add(ToolId::ListEnvironments,
        Bind(client, [](IPortainerClient& c, const nlohmann::json&) {
            return ListResult(c.GetEnvironments());
        }));
    add(ToolId::UpdateEnvironmentTags, Bind(client, HandleUpdateEnvironmentTags));
    add(ToolId::UpdateEnvironmentUserAccesses,
        Bind(client, HandleUpdateEnvironmentUserAccesses));
    add(ToolId::UpdateEnvironmentTeamAccesses,
        Bind(client, HandleUpdateEnvironmentTeamAccesses));

    // -- Environment groups --------------------------------------------------
    add(ToolId::ListEnvironmentGroups,
        Bind(client, [](IPortainerClient& c, const nlohmann::json&) {
            return ListResult(c.GetEnvironmentGroups());
        }));
    add(ToolId::CreateEnvironmentGroup, Bind(client, HandleCreateEnvironmentGroup));
    add(ToolId::UpdateEnvironmentGroupName, Bind(client, HandleUpdateEnvironmentGroupName));
    add(ToolId::UpdateEnvironmentGroupEnvironments,
        Bind(client, HandleUpdateEnvironmentGroupEnvironments));
    add(ToolId::UpdateEnvironmentGroupTags, Bind(client, HandleUpdateEnvironmentGroupTags));

    // -- Access groups -------------------------------------------------------
    add(ToolId::ListAccessGroups,
        Bind(client, [](IPortainerClient& c, const nlohmann::json&) {
            return ListResult(c.GetAccessGroups());
        }));
    add(ToolId::CreateAccessGroup, Bind(client, HandleCreateAccessGroup));
    add(ToolId::UpdateAccessGroupName, Bind(client, HandleUpdateAccessGroupName));
    add(ToolId::UpdateAccessGroupUserAccesses,
        Bind(client, HandleUpdateAccessGroupUserAccesses));
    add(ToolId::UpdateAccessGroupTeamAccesses,
        Bind(client, HandleUpdateAccessGroupTeamAccesses));
    add(ToolId::AddEnvironmentToAccessGroup, Bind(client, HandleAddEnvironmentToAccessGroup));
    add(ToolId::RemoveEnvironmentFromAccessGroup,
        Bind(client, HandleRemoveEnvironmentFromAccessGroup));

    // -- Stacks --------------------------------------------------------------
    add(ToolId::ListStacks,
        Bind(client, [](IPortainerClient& c, const nlohmann::json&) {
            return ListResult(c.GetStacks());
        }));
    add(ToolId::GetStackFile, Bind(client, HandleGetStackFile));
    add(ToolId::CreateStack, Bind(client, HandleCreateStack));
    add(ToolId::UpdateStack, Bind(client, HandleUpdateStack));

    // -- Teams ---------------------------------------------------------------
    add(ToolId::ListTeams,
        Bind(client, [](IPortainerClient& c, const nlohmann::json&) {
            return ListResult(c.GetTeams());
        }));
    add(ToolId::CreateTeam, Bind(client, HandleCreateTeam));
    add(ToolId::UpdateTeamName, Bind(client, HandleUpdateTeamName));
    add(ToolId::UpdateTeamMembers, Bind(client, HandleUpdateTeamMembers));

    // -- Users ---------------------------------------------------------------
    add(ToolId::ListUsers,
        Bind(client, [](IPortainerClient& c, const nlohmann::json&) {
            return ListResult(c.GetUsers());
        }));
    add(ToolId::UpdateUserRole, Bind(client, HandleUpdateUserRole));

    // -- Settings ------------------------------------------------------------
    add(ToolId::GetSettings,
        Bind(client, [](IPortainerClient& c, const nlohmann::json&) -> CallResult {
            auto result = c.GetSettings();
            if (result.IsErr()) return CallResult::Err(CallFailure::Handler(result.Error()));
            return CallResult::Ok(JsonContent(ToJson(result.Value())));
        }));

    // -- Raw proxies ---------------------------------------------------------
    if (router.RegisterProxyIfPresent(
            ToolId::DockerProxy, MakeProxyHandler(client, ProxyTarget::Docker, proxy_limits))) {
        ++count;
    }
    if (router.RegisterProxyIfPresent(
            ToolId::KubernetesProxy,
            MakeProxyHandler(client, ProxyTarget::Kubernetes, proxy_limits))) {
        ++count;
    }

    LogInfo("mcp", "Registered " + std::to_string(count) + " tools");
    return count;
}

} // namespace portainer_mcp

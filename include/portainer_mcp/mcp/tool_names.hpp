#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace portainer_mcp {

// ---------------------------------------------------------------------------
// ToolId: every tool name this binary has a handler for.
// ---------------------------------------------------------------------------
enum class ToolId {
    ListEnvironmentTags,
    CreateEnvironmentTag,
    ListEnvironments,
    UpdateEnvironmentTags,
    UpdateEnvironmentUserAccesses,
    UpdateEnvironmentTeamAccesses,
    ListEnvironmentGroups,
    CreateEnvironmentGroup,
    UpdateEnvironmentGroupName,
    UpdateEnvironmentGroupEnvironments,
    UpdateEnvironmentGroupTags,
    ListAccessGroups,
    CreateAccessGroup,
    UpdateAccessGroupName,
    UpdateAccessGroupUserAccesses,
    UpdateAccessGroupTeamAccesses,
    AddEnvironmentToAccessGroup,
    RemoveEnvironmentFromAccessGroup,
    ListStacks,
    GetStackFile,
    CreateStack,
    UpdateStack,
    ListTeams,
    CreateTeam,
    UpdateTeamName,
    UpdateTeamMembers,
    ListUsers,
    UpdateUserRole,
    GetSettings,
    DockerProxy,
    KubernetesProxy,
};

// Catalog name of a tool, e.g. "listEnvironments".
[[nodiscard]] std::string_view ToolName(ToolId id);

[[nodiscard]] std::optional<ToolId> ParseToolId(std::string_view name);

[[nodiscard]] const std::vector<ToolId>& AllToolIds();

} // namespace portainer_mcp

#include <portainer_mcp/mcp/tool_names.hpp>

#include <utility>

namespace portainer_mcp {

namespace {

const std::vector<std::pair<ToolId, std::string_view>>& NameTable() {
    static const std::vector<std::pair<ToolId, std::string_view>> table = {
        {ToolId::ListEnvironmentTags, "listEnvironmentTags"},
        {ToolId::CreateEnvironmentTag, "createEnvironmentTag"},
        {ToolId::ListEnvironments, "listEnvironments"},
        {ToolId::UpdateEnvironmentTags, "updateEnvironmentTags"},
        {ToolId::UpdateEnvironmentUserAccesses, "updateEnvironmentUserAccesses"},
        {ToolId::UpdateEnvironmentTeamAccesses, "updateEnvironmentTeamAccesses"},
        {ToolId::ListEnvironmentGroups, "listEnvironmentGroups"},
        {ToolId::CreateEnvironmentGroup, "createEnvironmentGroup"},
        {ToolId::UpdateEnvironmentGroupName, "updateEnvironmentGroupName"},
        {ToolId::UpdateEnvironmentGroupEnvironments, "updateEnvironmentGroupEnvironments"},
        {ToolId::UpdateEnvironmentGroupTags, "updateEnvironmentGroupTags"},
        {ToolId::ListAccessGroups, "listAccessGroups"},
        {ToolId::CreateAccessGroup, "createAccessGroup"},
        {ToolId::UpdateAccessGroupName, "updateAccessGroupName"},
        {ToolId::UpdateAccessGroupUserAccesses, "updateAccessGroupUserAccesses"},
        {ToolId::UpdateAccessGroupTeamAccesses, "updateAccessGroupTeamAccesses"},
        {ToolId::AddEnvironmentToAccessGroup, "addEnvironmentToAccessGroup"},
        {ToolId::RemoveEnvironmentFromAccessGroup, "removeEnvironmentFromAccessGroup"},
        {ToolId::ListStacks, "listStacks"},
        {ToolId::GetStackFile, "getStackFile"},
        {ToolId::CreateStack, "createStack"},
        {ToolId::UpdateStack, "updateStack"},
        {ToolId::ListTeams, "listTeams"},
        {ToolId::CreateTeam, "createTeam"},
        {ToolId::UpdateTeamName, "updateTeamName"},
        {ToolId::UpdateTeamMembers, "updateTeamMembers"},
        {ToolId::ListUsers, "listUsers"},
        {ToolId::UpdateUserRole, "updateUserRole"},
        {ToolId::GetSettings, "getSettings"},
        {ToolId::DockerProxy, "dockerProxy"},
        {ToolId::KubernetesProxy, "kubernetesProxy"},
    };
    return table;
}

} // anonymous namespace

std::string_view ToolName(ToolId id) {
    for (const auto& [tool, name] : NameTable()) {
        if (tool == id) return name;
    }
    return "";
}

std::optional<ToolId> ParseToolId(std::string_view name) {
    for (const auto& [tool, tool_name] : NameTable()) {
        if (tool_name == name) return tool;
    }
    return std::nullopt;
}

const std::vector<ToolId>& AllToolIds() {
    static const std::vector<ToolId> ids = [] {
        std::vector<ToolId> out;
        for (const auto& entry : NameTable()) {
            out.push_back(entry.first);
        }
        return out;
    }();
    return ids;
}

} // namespace portainer_mcp

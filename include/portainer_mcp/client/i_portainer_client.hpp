#pragma once

#include <portainer_mcp/client/models.hpp>
#include <portainer_mcp/core/result.hpp>

#include <string>
#include <vector>

namespace portainer_mcp {

// ---------------------------------------------------------------------------
// IPortainerClient: abstract Portainer API interface.
//
// Tool handlers depend on this interface rather than a concrete HTTP client,
// which keeps them testable offline via MockPortainerClient.
//
// Methods return Result<T, Error> and never throw on expected failures.
// Implementations must be safe for concurrent use.
// ---------------------------------------------------------------------------
class IPortainerClient {
public:
    virtual ~IPortainerClient() = default;

    // Non-copyable, non-movable (polymorphic base).
    IPortainerClient(const IPortainerClient&) = delete;
    IPortainerClient& operator=(const IPortainerClient&) = delete;
    IPortainerClient(IPortainerClient&&) = delete;
    IPortainerClient& operator=(IPortainerClient&&) = delete;

    // -- Tags ----------------------------------------------------------------

    [[nodiscard]] virtual Result<std::vector<EnvironmentTag>, Error> GetEnvironmentTags() = 0;
    [[nodiscard]] virtual Result<int, Error> CreateEnvironmentTag(const std::string& name) = 0;

    // -- Environments --------------------------------------------------------

    [[nodiscard]] virtual Result<std::vector<Environment>, Error> GetEnvironments() = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateEnvironmentTags(
        int id, const std::vector<int>& tag_ids) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateEnvironmentUserAccesses(
        int id, const AccessMap& user_accesses) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateEnvironmentTeamAccesses(
        int id, const AccessMap& team_accesses) = 0;

    // -- Environment groups (edge groups) ------------------------------------

    [[nodiscard]] virtual Result<std::vector<EnvironmentGroup>, Error> GetEnvironmentGroups() = 0;
    [[nodiscard]] virtual Result<int, Error> CreateEnvironmentGroup(
        const std::string& name, const std::vector<int>& environment_ids) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateEnvironmentGroupName(
        int id, const std::string& name) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateEnvironmentGroupEnvironments(
        int id, const std::vector<int>& environment_ids) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateEnvironmentGroupTags(
        int id, const std::vector<int>& tag_ids) = 0;

    // -- Access groups (endpoint groups) -------------------------------------

    [[nodiscard]] virtual Result<std::vector<AccessGroup>, Error> GetAccessGroups() = 0;
    [[nodiscard]] virtual Result<int, Error> CreateAccessGroup(
        const std::string& name, const std::vector<int>& environment_ids) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateAccessGroupName(
        int id, const std::string& name) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateAccessGroupUserAccesses(
        int id, const AccessMap& user_accesses) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateAccessGroupTeamAccesses(
        int id, const AccessMap& team_accesses) = 0;
    [[nodiscard]] virtual Result<void, Error> AddEnvironmentToAccessGroup(
        int id, int environment_id) = 0;
    [[nodiscard]] virtual Result<void, Error> RemoveEnvironmentFromAccessGroup(
        int id, int environment_id) = 0;

    // -- Stacks (edge stacks) ------------------------------------------------

    [[nodiscard]] virtual Result<std::vector<Stack>, Error> GetStacks() = 0;
    [[nodiscard]] virtual Result<std::string, Error> GetStackFile(int id) = 0;
    [[nodiscard]] virtual Result<int, Error> CreateStack(
        const std::string& name, const std::string& file,
        const std::vector<int>& environment_group_ids) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateStack(
        int id, const std::string& file,
        const std::vector<int>& environment_group_ids) = 0;

    // -- Teams ---------------------------------------------------------------

    [[nodiscard]] virtual Result<std::vector<Team>, Error> GetTeams() = 0;
    [[nodiscard]] virtual Result<int, Error> CreateTeam(const std::string& name) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateTeamName(
        int id, const std::string& name) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateTeamMembers(
        int id, const std::vector<int>& user_ids) = 0;

    // -- Users ---------------------------------------------------------------

    [[nodiscard]] virtual Result<std::vector<User>, Error> GetUsers() = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateUserRole(int id, UserRole role) = 0;

    // -- Settings / version --------------------------------------------------

    [[nodiscard]] virtual Result<PortainerSettings, Error> GetSettings() = 0;
    [[nodiscard]] virtual Result<std::string, Error> GetVersion() = 0;

    // -- Raw proxy -----------------------------------------------------------
    // Forward a request to the environment's Docker engine API or Kubernetes
    // API. Any HTTP status is Ok; Err means no response was received or the
    // sink aborted the transfer. When `sink` is set the body is streamed to
    // it and ProxyResponse::body stays empty. When `cancelled` is set the
    // request is stopped as soon as it returns true.

    [[nodiscard]] virtual Result<ProxyResponse, Error> ProxyDockerRequest(
        const ProxyRequest& request, const ProxyBodySink& sink,
        const ProxyCancelCheck& cancelled) = 0;
    [[nodiscard]] virtual Result<ProxyResponse, Error> ProxyKubernetesRequest(
        const ProxyRequest& request, const ProxyBodySink& sink,
        const ProxyCancelCheck& cancelled) = 0;

protected:
    IPortainerClient() = default;
};

} // namespace portainer_mcp

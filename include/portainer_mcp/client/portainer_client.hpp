#pragma once

#include <portainer_mcp/client/i_portainer_client.hpp>
#include <portainer_mcp/core/url.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace portainer_mcp {

struct PortainerClientOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds request_timeout{30};
    std::chrono::seconds proxy_timeout{300};
    bool skip_tls_verify = false;
};

// ---------------------------------------------------------------------------
// PortainerClient: concrete IPortainerClient over cpp-httplib.
//
// Holds only immutable connection settings; every request uses its own
// httplib::Client, so one instance may serve concurrent tool calls.
// Authenticates with the X-API-Key header.
// ---------------------------------------------------------------------------
class PortainerClient : public IPortainerClient {
public:
    PortainerClient(ServerAddress address,
                    std::string token,
                    const PortainerClientOptions& options = {});

    ~PortainerClient() override;

    PortainerClient(const PortainerClient&) = delete;
    PortainerClient& operator=(const PortainerClient&) = delete;
    PortainerClient(PortainerClient&&) = delete;
    PortainerClient& operator=(PortainerClient&&) = delete;

    // -- IPortainerClient implementation -------------------------------------

    [[nodiscard]] Result<std::vector<EnvironmentTag>, Error> GetEnvironmentTags() override;
    [[nodiscard]] Result<int, Error> CreateEnvironmentTag(const std::string& name) override;

    [[nodiscard]] Result<std::vector<Environment>, Error> GetEnvironments() override;
    [[nodiscard]] Result<void, Error> UpdateEnvironmentTags(
        int id, const std::vector<int>& tag_ids) override;
    [[nodiscard]] Result<void, Error> UpdateEnvironmentUserAccesses(
        int id, const AccessMap& user_accesses) override;
    [[nodiscard]] Result<void, Error> UpdateEnvironmentTeamAccesses(
        int id, const AccessMap& team_accesses) override;

    [[nodiscard]] Result<std::vector<EnvironmentGroup>, Error> GetEnvironmentGroups() override;
    [[nodiscard]] Result<int, Error> CreateEnvironmentGroup(
        const std::string& name, const std::vector<int>& environment_ids) override;
    [[nodiscard]] Result<void, Error> UpdateEnvironmentGroupName(
        int id, const std::string& name) override;
    [[nodiscard]] Result<void, Error> UpdateEnvironmentGroupEnvironments(
        int id, const std::vector<int>& environment_ids) override;
    [[nodiscard]] Result<void, Error> UpdateEnvironmentGroupTags(
        int id, const std::vector<int>& tag_ids) override;

    [[nodiscard]] Result<std::vector<AccessGroup>, Error> GetAccessGroups() override;
    [[nodiscard]] Result<int, Error> CreateAccessGroup(
        const std::string& name, const std::vector<int>& environment_ids) override;
    [[nodiscard]] Result<void, Error> UpdateAccessGroupName(
        int id, const std::string& name) override;
    [[nodiscard]] Result<void, Error> UpdateAccessGroupUserAccesses(
        int id, const AccessMap& user_accesses) override;
    [[nodiscard]] Result<void, Error> UpdateAccessGroupTeamAccesses(
        int id, const AccessMap& team_accesses) override;
    [[nodiscard]] Result<void, Error> AddEnvironmentToAccessGroup(
        int id, int environment_id) override;
    [[nodiscard]] Result<void, Error> RemoveEnvironmentFromAccessGroup(
        int id, int environment_id) override;

    [[nodiscard]] Result<std::vector<Stack>, Error> GetStacks() override;
    [[nodiscard]] Result<std::string, Error> GetStackFile(int id) override;
    [[nodiscard]] Result<int, Error> CreateStack(
        const std::string& name, const std::string& file,
        const std::vector<int>& environment_group_ids) override;
    [[nodiscard]] Result<void, Error> UpdateStack(
        int id, const std::string& file,
        const std::vector<int>& environment_group_ids) override;

    [[nodiscard]] Result<std::vector<Team>, Error> GetTeams() override;
    [[nodiscard]] Result<int, Error> CreateTeam(const std::string& name) override;
    [[nodiscard]] Result<void, Error> UpdateTeamName(
        int id, const std::string& name) override;
    [[nodiscard]] Result<void, Error> UpdateTeamMembers(
        int id, const std::vector<int>& user_ids) override;

    [[nodiscard]] Result<std::vector<User>, Error> GetUsers() override;
    [[nodiscard]] Result<void, Error> UpdateUserRole(int id, UserRole role) override;

    [[nodiscard]] Result<PortainerSettings, Error> GetSettings() override;
    [[nodiscard]] Result<std::string, Error> GetVersion() override;

    [[nodiscard]] Result<ProxyResponse, Error> ProxyDockerRequest(
        const ProxyRequest& request, const ProxyBodySink& sink,
        const ProxyCancelCheck& cancelled) override;
    [[nodiscard]] Result<ProxyResponse, Error> ProxyKubernetesRequest(
        const ProxyRequest& request, const ProxyBodySink& sink,
        const ProxyCancelCheck& cancelled) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace portainer_mcp

#include <portainer_mcp/client/portainer_client.hpp>

#include <portainer_mcp/core/log.hpp>
#include <portainer_mcp/core/text.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <condition_variable>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>

namespace portainer_mcp {

namespace {

struct HttpResponse {
    int status_code = 0;
    std::string body;
};

Error MakeClientError(const std::string& operation,
                      const std::string& endpoint,
                      const std::string& message,
                      ErrorCategory category = ErrorCategory::Connection) {
    return Error{operation, endpoint, std::nullopt, message, std::nullopt, category};
}

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        case httplib::Error::Canceled:
            return ErrorCategory::Cancelled;
        default:
            return ErrorCategory::Connection;
    }
}

// Polls a cancel check on its own thread while a request is in flight and
// stops the client when it fires. Joined on destruction.
class CancelWatcher {
public:
    CancelWatcher(httplib::Client& client, const ProxyCancelCheck& cancelled)
        : client_(client), cancelled_(cancelled) {
        if (cancelled_) {
            thread_ = std::thread([this] { Watch(); });
        }
    }

    ~CancelWatcher() { Finish(); }

    CancelWatcher(const CancelWatcher&) = delete;
    CancelWatcher& operator=(const CancelWatcher&) = delete;

    void Finish() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    [[nodiscard]] bool Fired() const { return fired_; }

private:
    void Watch() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!cv_.wait_for(lock, std::chrono::milliseconds(50), [this] { return done_; })) {
            // Keep stopping: a socket still connecting is not yet stoppable.
            if (fired_ || cancelled_()) {
                fired_ = true;
                client_.stop();
            }
        }
    }

    httplib::Client& client_;
    const ProxyCancelCheck& cancelled_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
    bool done_ = false;
    bool fired_ = false;
};

bool IsSensitiveHeader(std::string_view key) {
    return text::IEquals(key, "x-api-key") ||
           text::IEquals(key, "authorization") ||
           text::IEquals(key, "cookie") ||
           text::IEquals(key, "set-cookie");
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    if (!GlobalLogger().Enabled(LogLevel::Debug)) return;
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("http", "  > " + k + ": <redacted>");
        } else {
            LogDebug("http", "  > " + k + ": " + v);
        }
    }
}

void LogResponse(int status, const std::string& body) {
    LogDebug("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

std::string IsoTimeFromUnix(int64_t seconds) {
    if (seconds <= 0) return "";
    const auto t = static_cast<std::time_t>(seconds);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &t);
#else
    gmtime_r(&t, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string EnvironmentTypeName(int type) {
    switch (type) {
        case 1: return "docker-local";
        case 2: return "docker-agent";
        case 3: return "azure-aci";
        case 4: return "docker-edge-agent";
        case 5: return "kubernetes-local";
        case 6: return "kubernetes-agent";
        case 7: return "kubernetes-edge-agent";
        default: return "unknown";
    }
}

std::string EnvironmentStatusName(int status) {
    switch (status) {
        case 1: return "active";
        case 2: return "inactive";
        default: return "unknown";
    }
}

std::string AuthenticationMethodName(int method) {
    switch (method) {
        case 1: return "internal";
        case 2: return "ldap";
        case 3: return "oauth";
        default: return "unknown";
    }
}

std::vector<int> IntList(const nlohmann::json& j, const char* key) {
    std::vector<int> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& v : j[key]) {
            out.push_back(v.get<int>());
        }
    }
    return out;
}

// {"<id>": {"RoleId": n}} -> AccessMap. Unknown role IDs are dropped.
AccessMap ParseAccessPolicies(const nlohmann::json& j, const char* key) {
    AccessMap out;
    if (!j.contains(key) || !j[key].is_object()) return out;
    for (const auto& [id, policy] : j[key].items()) {
        auto level = AccessLevelFromRoleId(policy.value("RoleId", 0));
        if (level) {
            out[std::stoi(id)] = *level;
        }
    }
    return out;
}

nlohmann::json AccessPoliciesJson(const AccessMap& accesses) {
    auto obj = nlohmann::json::object();
    for (const auto& [id, level] : accesses) {
        obj[std::to_string(id)] = {{"RoleId", static_cast<int>(level)}};
    }
    return obj;
}

Environment ParseEnvironment(const nlohmann::json& j) {
    Environment env;
    env.id = j.at("Id").get<int>();
    env.name = j.value("Name", "");
    env.status = EnvironmentStatusName(j.value("Status", 0));
    env.type = EnvironmentTypeName(j.value("Type", 0));
    env.tag_ids = IntList(j, "TagIds");
    env.user_accesses = ParseAccessPolicies(j, "UserAccessPolicies");
    env.team_accesses = ParseAccessPolicies(j, "TeamAccessPolicies");
    return env;
}

// Map a parsed payload with `fn`; missing fields or wrong types become an
// Internal error instead of an exception.
template <typename T, typename Fn>
Result<T, Error> DecodeJson(const std::string& operation, const std::string& path,
                            const nlohmann::json& j, Fn&& fn) {
    try {
        return Result<T, Error>::Ok(fn(j));
    } catch (const std::exception& e) {
        return Result<T, Error>::Err(MakeClientError(
            operation, path,
            std::string("Unexpected Portainer response: ") + e.what(),
            ErrorCategory::Internal));
    }
}

template <typename T, typename Fn>
Result<T, Error> Decode(const std::string& operation, const std::string& path,
                        const std::string& body, Fn&& fn) {
    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return Result<T, Error>::Err(MakeClientError(
            operation, path, "Portainer returned a non-JSON response",
            ErrorCategory::Internal));
    }
    return DecodeJson<T>(operation, path, j, std::forward<Fn>(fn));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: immutable connection settings plus request helpers.
// ---------------------------------------------------------------------------
struct PortainerClient::Impl {
    ServerAddress address;
    std::string token;
    PortainerClientOptions options;

    Impl(ServerAddress addr, std::string api_token, const PortainerClientOptions& opts)
        : address(std::move(addr)), token(std::move(api_token)), options(opts) {}

    std::unique_ptr<httplib::Client> MakeClient(std::chrono::seconds read_timeout) const {
        auto client = std::make_unique<httplib::Client>(address.Origin());
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(read_timeout);
        client->set_write_timeout(read_timeout);
        client->set_url_encode(false);
        if (address.scheme == "https" && options.skip_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
        return client;
    }

    std::string ApiPath(std::string_view path) const {
        return address.base_path + std::string(path);
    }

    // Typed request. Non-2xx statuses become Error::FromHttpStatus.
    Result<HttpResponse, Error> Send(const std::string& operation,
                                     const std::string& method,
                                     const std::string& path,
                                     const nlohmann::json& body = nullptr) const {
        auto client = MakeClient(options.request_timeout);

        httplib::Request req;
        req.method = method;
        req.path = ApiPath(path);
        req.headers.emplace("X-API-Key", token);
        req.headers.emplace("Accept", "application/json");
        if (!body.is_null()) {
            req.body = body.dump();
            req.headers.emplace("Content-Type", "application/json");
        }

        LogDebug("http", method + " " + req.path);
        LogRequestHeaders(req.headers);

        httplib::Response res;
        httplib::Error error = httplib::Error::Success;
        if (!client->send(req, res, error)) {
            return Result<HttpResponse, Error>::Err(MakeClientError(
                operation, path, "HTTP request failed: " + httplib::to_string(error),
                CategoryFromHttpTransportError(error)));
        }
        LogResponse(res.status, res.body);

        if (res.status < 200 || res.status >= 300) {
            return Result<HttpResponse, Error>::Err(
                Error::FromHttpStatus(operation, path, res.status, res.body));
        }
        return Result<HttpResponse, Error>::Ok(HttpResponse{res.status, std::move(res.body)});
    }

    Result<void, Error> SendNoContent(const std::string& operation,
                                      const std::string& method,
                                      const std::string& path,
                                      const nlohmann::json& body = nullptr) const {
        auto res = Send(operation, method, path, body);
        if (res.IsErr()) return Result<void, Error>::Err(res.Error());
        return Result<void, Error>::Ok();
    }

    // POST that returns {"Id": n} (or {"ID": n} for tags).
    Result<int, Error> Create(const std::string& operation,
                              const std::string& path,
                              const nlohmann::json& body) const {
        auto res = Send(operation, "POST", path, body);
        if (res.IsErr()) return Result<int, Error>::Err(res.Error());
        return Decode<int>(operation, path, res.Value().body, [](const nlohmann::json& j) {
            if (j.contains("ID")) return j.at("ID").get<int>();
            return j.at("Id").get<int>();
        });
    }

    Result<nlohmann::json, Error> GetJson(const std::string& operation,
                                          const std::string& path) const {
        auto res = Send(operation, "GET", path);
        if (res.IsErr()) return Result<nlohmann::json, Error>::Err(res.Error());
        return Decode<nlohmann::json>(operation, path, res.Value().body,
                                      [](const nlohmann::json& j) { return j; });
    }

    // Edge groups are replaced as a whole; fetch, modify, put back.
    template <typename Fn>
    Result<void, Error> ModifyEdgeGroup(const std::string& operation, int id,
                                        Fn&& modify) const {
        const auto path = "/api/edge_groups/" + std::to_string(id);
        auto current = GetJson(operation, path);
        if (current.IsErr()) return Result<void, Error>::Err(current.Error());

        nlohmann::json body;
        try {
            const auto& j = current.Value();
            body = {{"name", j.value("Name", "")},
                    {"dynamic", j.value("Dynamic", false)},
                    {"endpoints", IntList(j, "Endpoints")},
                    {"tagIds", IntList(j, "TagIds")}};
        } catch (const std::exception& e) {
            return Result<void, Error>::Err(MakeClientError(
                operation, path,
                std::string("Unexpected Portainer response: ") + e.what(),
                ErrorCategory::Internal));
        }
        modify(body);
        return SendNoContent(operation, "PUT", path, body);
    }

    Result<ProxyResponse, Error> Proxy(const std::string& operation,
                                       const std::string& engine,
                                       const ProxyRequest& request,
                                       const ProxyBodySink& sink,
                                       const ProxyCancelCheck& cancelled) const {
        auto client = MakeClient(options.proxy_timeout);

        const auto upstream = "/api/endpoints/" + std::to_string(request.environment_id) +
                              "/" + engine + request.path;

        httplib::Request req;
        req.method = request.method;
        req.path = ApiPath(upstream);
        if (!request.query.empty()) {
            req.path += "?" + BuildQueryString(request.query);
        }
        for (const auto& [key, value] : request.headers) {
            if (!text::IsHttpToken(key) || !text::IsSafeHeaderValue(value)) {
                return Result<ProxyResponse, Error>::Err(MakeClientError(
                    operation, upstream, "invalid proxy header '" + key + "'",
                    ErrorCategory::Internal));
            }
            req.headers.emplace(key, value);
        }
        req.headers.emplace("X-API-Key", token);
        req.body = request.body;

        ProxyResponse response;
        if (sink) {
            req.content_receiver = [&sink](const char* data, size_t length,
                                           uint64_t /*offset*/,
                                           uint64_t /*total_length*/) {
                return sink(data, length);
            };
        }

        LogDebug("proxy", request.method + " " + req.path);
        LogRequestHeaders(req.headers);

        httplib::Response res;
        httplib::Error error = httplib::Error::Success;
        CancelWatcher watcher(*client, cancelled);
        const bool sent = client->send(req, res, error);
        watcher.Finish();
        if (watcher.Fired()) {
            return Result<ProxyResponse, Error>::Err(MakeClientError(
                operation, upstream, "HTTP request cancelled", ErrorCategory::Cancelled));
        }
        if (!sent) {
            return Result<ProxyResponse, Error>::Err(MakeClientError(
                operation, upstream, "HTTP request failed: " + httplib::to_string(error),
                CategoryFromHttpTransportError(error)));
        }
        LogDebug("proxy", "  < " + std::to_string(res.status));

        response.status_code = res.status;
        for (const auto& [key, value] : res.headers) {
            response.headers.emplace_back(key, value);
        }
        if (!sink) {
            response.body = std::move(res.body);
        }
        return Result<ProxyResponse, Error>::Ok(std::move(response));
    }
};

PortainerClient::PortainerClient(ServerAddress address,
                                 std::string token,
                                 const PortainerClientOptions& options)
    : impl_(std::make_unique<Impl>(std::move(address), std::move(token), options)) {}

PortainerClient::~PortainerClient() = default;

// ---------------------------------------------------------------------------
// Tags
// ---------------------------------------------------------------------------
Result<std::vector<EnvironmentTag>, Error> PortainerClient::GetEnvironmentTags() {
    using R = Result<std::vector<EnvironmentTag>, Error>;
    auto res = impl_->Send("GetEnvironmentTags", "GET", "/api/tags");
    if (res.IsErr()) return R::Err(res.Error());
    return Decode<std::vector<EnvironmentTag>>(
        "GetEnvironmentTags", "/api/tags", res.Value().body, [](const nlohmann::json& j) {
            std::vector<EnvironmentTag> tags;
            for (const auto& item : j) {
                EnvironmentTag tag;
                tag.id = item.at("ID").get<int>();
                tag.name = item.value("Name", "");
                if (item.contains("Endpoints") && item["Endpoints"].is_object()) {
                    for (const auto& [id, member] : item["Endpoints"].items()) {
                        if (member.is_boolean() && member.get<bool>()) {
                            tag.environment_ids.push_back(std::stoi(id));
                        }
                    }
                }
                std::sort(tag.environment_ids.begin(), tag.environment_ids.end());
                tags.push_back(std::move(tag));
            }
            return tags;
        });
}

Result<int, Error> PortainerClient::CreateEnvironmentTag(const std::string& name) {
    return impl_->Create("CreateEnvironmentTag", "/api/tags", {{"name", name}});
}

// ---------------------------------------------------------------------------
// Environments
// ---------------------------------------------------------------------------
Result<std::vector<Environment>, Error> PortainerClient::GetEnvironments() {
    using R = Result<std::vector<Environment>, Error>;
    auto res = impl_->Send("GetEnvironments", "GET", "/api/endpoints");
    if (res.IsErr()) return R::Err(res.Error());
    return Decode<std::vector<Environment>>(
        "GetEnvironments", "/api/endpoints", res.Value().body, [](const nlohmann::json& j) {
            std::vector<Environment> envs;
            for (const auto& item : j) {
                envs.push_back(ParseEnvironment(item));
            }
            return envs;
        });
}

Result<void, Error> PortainerClient::UpdateEnvironmentTags(
    int id, const std::vector<int>& tag_ids) {
    return impl_->SendNoContent("UpdateEnvironmentTags", "PUT",
                                "/api/endpoints/" + std::to_string(id),
                                {{"tagIds", tag_ids}});
}

Result<void, Error> PortainerClient::UpdateEnvironmentUserAccesses(
    int id, const AccessMap& user_accesses) {
    return impl_->SendNoContent("UpdateEnvironmentUserAccesses", "PUT",
                                "/api/endpoints/" + std::to_string(id),
                                {{"userAccessPolicies", AccessPoliciesJson(user_accesses)}});
}

Result<void, Error> PortainerClient::UpdateEnvironmentTeamAccesses(
    int id, const AccessMap& team_accesses) {
    return impl_->SendNoContent("UpdateEnvironmentTeamAccesses", "PUT",
                                "/api/endpoints/" + std::to_string(id),
                                {{"teamAccessPolicies", AccessPoliciesJson(team_accesses)}});
}

// ---------------------------------------------------------------------------
// Environment groups (edge groups)
// ---------------------------------------------------------------------------
Result<std::vector<EnvironmentGroup>, Error> PortainerClient::GetEnvironmentGroups() {
    using R = Result<std::vector<EnvironmentGroup>, Error>;
    auto res = impl_->Send("GetEnvironmentGroups", "GET", "/api/edge_groups");
    if (res.IsErr()) return R::Err(res.Error());
    return Decode<std::vector<EnvironmentGroup>>(
        "GetEnvironmentGroups", "/api/edge_groups", res.Value().body,
        [](const nlohmann::json& j) {
            std::vector<EnvironmentGroup> groups;
            for (const auto& item : j) {
                EnvironmentGroup group;
                group.id = item.at("Id").get<int>();
                group.name = item.value("Name", "");
                group.environment_ids = IntList(item, "Endpoints");
                group.tag_ids = IntList(item, "TagIds");
                groups.push_back(std::move(group));
            }
            return groups;
        });
}

Result<int, Error> PortainerClient::CreateEnvironmentGroup(
    const std::string& name, const std::vector<int>& environment_ids) {
    return impl_->Create("CreateEnvironmentGroup", "/api/edge_groups",
                         {{"name", name}, {"dynamic", false}, {"endpoints", environment_ids}});
}

Result<void, Error> PortainerClient::UpdateEnvironmentGroupName(int id, const std::string& name) {
    return impl_->ModifyEdgeGroup("UpdateEnvironmentGroupName", id,
                                  [&](nlohmann::json& body) { body["name"] = name; });
}

Result<void, Error> PortainerClient::UpdateEnvironmentGroupEnvironments(
    int id, const std::vector<int>& environment_ids) {
    return impl_->ModifyEdgeGroup("UpdateEnvironmentGroupEnvironments", id,
                                  [&](nlohmann::json& body) { body["endpoints"] = environment_ids; });
}

Result<void, Error> PortainerClient::UpdateEnvironmentGroupTags(
    int id, const std::vector<int>& tag_ids) {
    return impl_->ModifyEdgeGroup("UpdateEnvironmentGroupTags", id,
                                  [&](nlohmann::json& body) { body["tagIds"] = tag_ids; });
}

// ---------------------------------------------------------------------------
// Access groups (endpoint groups)
// ---------------------------------------------------------------------------
Result<std::vector<AccessGroup>, Error> PortainerClient::GetAccessGroups() {
    using R = Result<std::vector<AccessGroup>, Error>;
    auto groups_json = impl_->GetJson("GetAccessGroups", "/api/endpoint_groups");
    if (groups_json.IsErr()) return R::Err(groups_json.Error());
    // Membership lives on the environments, not on the group.
    auto envs_json = impl_->GetJson("GetAccessGroups", "/api/endpoints");
    if (envs_json.IsErr()) return R::Err(envs_json.Error());

    const auto& envs = envs_json.Value();
    return DecodeJson<std::vector<AccessGroup>>(
        "GetAccessGroups", "/api/endpoint_groups", groups_json.Value(),
        [&envs](const nlohmann::json& j) {
            std::vector<AccessGroup> groups;
            for (const auto& item : j) {
                AccessGroup group;
                group.id = item.at("Id").get<int>();
                group.name = item.value("Name", "");
                group.user_accesses = ParseAccessPolicies(item, "UserAccessPolicies");
                group.team_accesses = ParseAccessPolicies(item, "TeamAccessPolicies");
                for (const auto& env : envs) {
                    if (env.value("GroupId", 0) == group.id) {
                        group.environment_ids.push_back(env.at("Id").get<int>());
                    }
                }
                groups.push_back(std::move(group));
            }
            return groups;
        });
}

Result<int, Error> PortainerClient::CreateAccessGroup(
    const std::string& name, const std::vector<int>& environment_ids) {
    return impl_->Create("CreateAccessGroup", "/api/endpoint_groups",
                         {{"name", name}, {"associatedEndpoints", environment_ids}});
}

Result<void, Error> PortainerClient::UpdateAccessGroupName(int id, const std::string& name) {
    return impl_->SendNoContent("UpdateAccessGroupName", "PUT",
                                "/api/endpoint_groups/" + std::to_string(id),
                                {{"name", name}});
}

Result<void, Error> PortainerClient::UpdateAccessGroupUserAccesses(
    int id, const AccessMap& user_accesses) {
    return impl_->SendNoContent("UpdateAccessGroupUserAccesses", "PUT",
                                "/api/endpoint_groups/" + std::to_string(id),
                                {{"userAccessPolicies", AccessPoliciesJson(user_accesses)}});
}

Result<void, Error> PortainerClient::UpdateAccessGroupTeamAccesses(
    int id, const AccessMap& team_accesses) {
    return impl_->SendNoContent("UpdateAccessGroupTeamAccesses", "PUT",
                                "/api/endpoint_groups/" + std::to_string(id),
                                {{"teamAccessPolicies", AccessPoliciesJson(team_accesses)}});
}

Result<void, Error> PortainerClient::AddEnvironmentToAccessGroup(int id, int environment_id) {
    return impl_->SendNoContent("AddEnvironmentToAccessGroup", "PUT",
                                "/api/endpoint_groups/" + std::to_string(id) +
                                    "/endpoints/" + std::to_string(environment_id));
}

Result<void, Error> PortainerClient::RemoveEnvironmentFromAccessGroup(int id, int environment_id) {
    return impl_->SendNoContent("RemoveEnvironmentFromAccessGroup", "DELETE",
                                "/api/endpoint_groups/" + std::to_string(id) +
                                    "/endpoints/" + std::to_string(environment_id));
}

// ---------------------------------------------------------------------------
// Stacks (edge stacks)
// ---------------------------------------------------------------------------
Result<std::vector<Stack>, Error> PortainerClient::GetStacks() {
    using R = Result<std::vector<Stack>, Error>;
    auto res = impl_->Send("GetStacks", "GET", "/api/edge_stacks");
    if (res.IsErr()) return R::Err(res.Error());
    return Decode<std::vector<Stack>>(
        "GetStacks", "/api/edge_stacks", res.Value().body, [](const nlohmann::json& j) {
            std::vector<Stack> stacks;
            for (const auto& item : j) {
                Stack stack;
                stack.id = item.at("Id").get<int>();
                stack.name = item.value("Name", "");
                stack.created_at = IsoTimeFromUnix(item.value("CreationDate", int64_t{0}));
                stack.environment_group_ids = IntList(item, "EdgeGroups");
                stacks.push_back(std::move(stack));
            }
            return stacks;
        });
}

Result<std::string, Error> PortainerClient::GetStackFile(int id) {
    const auto path = "/api/edge_stacks/" + std::to_string(id) + "/file";
    auto res = impl_->Send("GetStackFile", "GET", path);
    if (res.IsErr()) return Result<std::string, Error>::Err(res.Error());
    return Decode<std::string>("GetStackFile", path, res.Value().body,
                               [](const nlohmann::json& j) {
                                   return j.at("StackFileContent").get<std::string>();
                               });
}

Result<int, Error> PortainerClient::CreateStack(const std::string& name,
                                                const std::string& file,
                                                const std::vector<int>& environment_group_ids) {
    return impl_->Create("CreateStack", "/api/edge_stacks/create/string",
                         {{"name", name},
                          {"stackFileContent", file},
                          {"edgeGroups", environment_group_ids},
                          {"deploymentType", 0}});
}

Result<void, Error> PortainerClient::UpdateStack(int id, const std::string& file,
                                                 const std::vector<int>& environment_group_ids) {
    return impl_->SendNoContent("UpdateStack", "PUT",
                                "/api/edge_stacks/" + std::to_string(id),
                                {{"stackFileContent", file},
                                 {"edgeGroups", environment_group_ids},
                                 {"deploymentType", 0},
                                 {"updateVersion", true}});
}

// ---------------------------------------------------------------------------
// Teams
// ---------------------------------------------------------------------------
Result<std::vector<Team>, Error> PortainerClient::GetTeams() {
    using R = Result<std::vector<Team>, Error>;
    auto teams_json = impl_->GetJson("GetTeams", "/api/teams");
    if (teams_json.IsErr()) return R::Err(teams_json.Error());
    auto memberships_json = impl_->GetJson("GetTeams", "/api/team_memberships");
    if (memberships_json.IsErr()) return R::Err(memberships_json.Error());

    const auto& memberships = memberships_json.Value();
    return DecodeJson<std::vector<Team>>(
        "GetTeams", "/api/teams", teams_json.Value(),
        [&memberships](const nlohmann::json& j) {
            std::vector<Team> teams;
            for (const auto& item : j) {
                Team team;
                team.id = item.at("Id").get<int>();
                team.name = item.value("Name", "");
                for (const auto& m : memberships) {
                    if (m.value("TeamID", 0) == team.id) {
                        team.member_ids.push_back(m.at("UserID").get<int>());
                    }
                }
                std::sort(team.member_ids.begin(), team.member_ids.end());
                teams.push_back(std::move(team));
            }
            return teams;
        });
}

Result<int, Error> PortainerClient::CreateTeam(const std::string& name) {
    return impl_->Create("CreateTeam", "/api/teams", {{"name", name}});
}

Result<void, Error> PortainerClient::UpdateTeamName(int id, const std::string& name) {
    return impl_->SendNoContent("UpdateTeamName", "PUT",
                                "/api/teams/" + std::to_string(id), {{"name", name}});
}

Result<void, Error> PortainerClient::UpdateTeamMembers(int id, const std::vector<int>& user_ids) {
    using R = Result<void, Error>;
    auto memberships = impl_->GetJson("UpdateTeamMembers", "/api/team_memberships");
    if (memberships.IsErr()) return R::Err(memberships.Error());

    const std::set<int> wanted(user_ids.begin(), user_ids.end());
    std::set<int> present;
    std::vector<int> stale_memberships;
    try {
        for (const auto& m : memberships.Value()) {
            if (m.value("TeamID", 0) != id) continue;
            const int user_id = m.at("UserID").get<int>();
            if (wanted.count(user_id) > 0) {
                present.insert(user_id);
            } else {
                stale_memberships.push_back(m.at("Id").get<int>());
            }
        }
    } catch (const std::exception& e) {
        return R::Err(MakeClientError("UpdateTeamMembers", "/api/team_memberships",
                                      std::string("Unexpected Portainer response: ") + e.what(),
                                      ErrorCategory::Internal));
    }

    for (int membership_id : stale_memberships) {
        auto res = impl_->SendNoContent("UpdateTeamMembers", "DELETE",
                                        "/api/team_memberships/" + std::to_string(membership_id));
        if (res.IsErr()) return res;
    }
    for (int user_id : wanted) {
        if (present.count(user_id) > 0) continue;
        // Role 2 is a regular team member.
        auto res = impl_->SendNoContent("UpdateTeamMembers", "POST", "/api/team_memberships",
                                        {{"userID", user_id}, {"teamID", id}, {"role", 2}});
        if (res.IsErr()) return res;
    }
    return R::Ok();
}

// ---------------------------------------------------------------------------
// Users
// ---------------------------------------------------------------------------
Result<std::vector<User>, Error> PortainerClient::GetUsers() {
    using R = Result<std::vector<User>, Error>;
    auto res = impl_->Send("GetUsers", "GET", "/api/users");
    if (res.IsErr()) return R::Err(res.Error());
    return Decode<std::vector<User>>(
        "GetUsers", "/api/users", res.Value().body, [](const nlohmann::json& j) {
            std::vector<User> users;
            for (const auto& item : j) {
                User user;
                user.id = item.at("Id").get<int>();
                user.username = item.value("Username", "");
                const int role = item.value("Role", 0);
                user.role = (role >= 1 && role <= 3)
                                ? UserRoleName(static_cast<UserRole>(role))
                                : "unknown";
                users.push_back(std::move(user));
            }
            return users;
        });
}

Result<void, Error> PortainerClient::UpdateUserRole(int id, UserRole role) {
    return impl_->SendNoContent("UpdateUserRole", "PUT", "/api/users/" + std::to_string(id),
                                {{"role", static_cast<int>(role)}});
}

// ---------------------------------------------------------------------------
// Settings / version
// ---------------------------------------------------------------------------
Result<PortainerSettings, Error> PortainerClient::GetSettings() {
    auto res = impl_->Send("GetSettings", "GET", "/api/settings");
    if (res.IsErr()) return Result<PortainerSettings, Error>::Err(res.Error());
    return Decode<PortainerSettings>(
        "GetSettings", "/api/settings", res.Value().body, [](const nlohmann::json& j) {
            PortainerSettings settings;
            settings.authentication_method =
                AuthenticationMethodName(j.value("AuthenticationMethod", 0));
            settings.edge_enabled = j.value("EnableEdgeComputeFeatures", false);
            settings.edge_server_url = j.value("EdgePortainerUrl", "");
            return settings;
        });
}

Result<std::string, Error> PortainerClient::GetVersion() {
    auto res = impl_->Send("GetVersion", "GET", "/api/system/version");
    if (res.IsErr()) return Result<std::string, Error>::Err(res.Error());
    return Decode<std::string>("GetVersion", "/api/system/version", res.Value().body,
                               [](const nlohmann::json& j) {
                                   return j.at("ServerVersion").get<std::string>();
                               });
}

// ---------------------------------------------------------------------------
// Raw proxy
// ---------------------------------------------------------------------------
Result<ProxyResponse, Error> PortainerClient::ProxyDockerRequest(
    const ProxyRequest& request, const ProxyBodySink& sink, const ProxyCancelCheck& cancelled) {
    return impl_->Proxy("ProxyDockerRequest", "docker", request, sink, cancelled);
}

Result<ProxyResponse, Error> PortainerClient::ProxyKubernetesRequest(
    const ProxyRequest& request, const ProxyBodySink& sink, const ProxyCancelCheck& cancelled) {
    return impl_->Proxy("ProxyKubernetesRequest", "kubernetes", request, sink, cancelled);
}

} // namespace portainer_mcp

#pragma once

#include <portainer_mcp/client/i_portainer_client.hpp>
#include <portainer_mcp/mcp/tool_registry.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace portainer_mcp {

enum class ProxyTarget {
    Docker,
    Kubernetes,
};

struct ProxyLimits {
    size_t max_response_bytes = 10 * 1024 * 1024;
    std::chrono::seconds timeout{300};  // total in-flight duration
};

// Name of the path argument: "dockerAPIPath" or "kubernetesAPIPath".
[[nodiscard]] const char* ProxyPathArgument(ProxyTarget target);

// Returns the reason `path` is not a safe path below the engine API root,
// or nullopt if it is.
[[nodiscard]] std::optional<std::string> CheckProxyPath(std::string_view path);

// Turn tool arguments into a ProxyRequest. Every failure is
// InvalidArguments naming the offending field.
[[nodiscard]] Result<ProxyRequest, CallFailure> BuildProxyRequest(
    ProxyTarget target, const nlohmann::json& arguments);

// {"status": n, "headers": {"Name": ["v", ...]}, "body": "..."}; a body that
// is not valid UTF-8 is base64-encoded and flagged with "bodyEncoding".
[[nodiscard]] nlohmann::json ProxyEnvelope(int status_code,
                                           const KeyValueList& headers,
                                           const std::string& body);

// Send `request` upstream and collect the body under `limits`.
[[nodiscard]] CallResult ForwardProxyRequest(IPortainerClient& client,
                                             ProxyTarget target,
                                             const ProxyRequest& request,
                                             const ProxyLimits& limits,
                                             const CallContext& context);

// Handler for dockerProxy / kubernetesProxy. `client` must outlive it.
[[nodiscard]] ToolHandler MakeProxyHandler(IPortainerClient& client,
                                           ProxyTarget target,
                                           ProxyLimits limits);

} // namespace portainer_mcp

#include <portainer_mcp/mcp/proxy_bridge.hpp>

#include <portainer_mcp/core/log.hpp>
#include <portainer_mcp/core/text.hpp>
#include <portainer_mcp/core/url.hpp>

#include <array>
#include <cmath>

namespace portainer_mcp {

namespace {

using BuildResult = Result<ProxyRequest, CallFailure>;

bool IsKnownMethod(ProxyTarget target, const std::string& method) {
    static constexpr std::array<const char*, 5> kCommon = {"GET", "POST", "PUT", "DELETE",
                                                           "HEAD"};
    for (const char* m : kCommon) {
        if (method == m) return true;
    }
    return target == ProxyTarget::Kubernetes && method == "PATCH";
}

// Headers carrying credentials or routing are set by the bridge itself.
bool IsReservedHeader(std::string_view key) {
    return text::IEquals(key, "authorization") ||
           text::IEquals(key, "x-api-key") ||
           text::IEquals(key, "host") ||
           text::IEquals(key, "cookie");
}

// Parse an optional array of "key=value" strings.
Result<KeyValueList, CallFailure> ParsePairs(const nlohmann::json& arguments,
                                             const std::string& field) {
    using R = Result<KeyValueList, CallFailure>;
    KeyValueList out;
    if (!arguments.contains(field) || arguments[field].is_null()) {
        return R::Ok(std::move(out));
    }
    const auto& list = arguments[field];
    if (!list.is_array()) {
        return R::Err(CallFailure::InvalidArguments(field, "expected an array of key=value strings"));
    }
    for (size_t i = 0; i < list.size(); ++i) {
        const auto entry_field = field + "[" + std::to_string(i) + "]";
        if (!list[i].is_string()) {
            return R::Err(CallFailure::InvalidArguments(entry_field, "expected a key=value string"));
        }
        auto kv = text::SplitKeyValue(list[i].get<std::string>());
        if (!kv) {
            return R::Err(CallFailure::InvalidArguments(entry_field,
                                                        "expected key=value with a non-empty key"));
        }
        out.push_back(std::move(*kv));
    }
    return R::Ok(std::move(out));
}

const char* EngineName(ProxyTarget target) {
    return target == ProxyTarget::Docker ? "docker" : "kubernetes";
}

} // anonymous namespace

const char* ProxyPathArgument(ProxyTarget target) {
    return target == ProxyTarget::Docker ? "dockerAPIPath" : "kubernetesAPIPath";
}

std::optional<std::string> CheckProxyPath(std::string_view path) {
    if (path.empty() || path.front() != '/') {
        return std::string("must start with '/'");
    }
    if (path.size() > 1 && path[1] == '/') {
        return std::string("must be a relative path, not a network-path reference");
    }
    if (path.find("://") != std::string_view::npos) {
        return std::string("must be a relative path, not an absolute URL");
    }
    for (char c : path) {
        const auto uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc == 0x7F || c == ' ') {
            return std::string("must not contain whitespace or control characters");
        }
        if (c == '?' || c == '#') {
            return std::string("must not contain '?' or '#', use queryParams");
        }
        if (c == '\\') {
            return std::string("must not contain '\\'");
        }
    }

    size_t start = 1;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        const auto decoded = UrlDecode(path.substr(start, end - start));
        if (decoded == "." || decoded == "..") {
            return std::string("must not contain '.' or '..' segments");
        }
        if (decoded.find('/') != std::string::npos || decoded.find('\\') != std::string::npos) {
            return std::string("must not contain encoded path separators");
        }
        for (char c : decoded) {
            const auto uc = static_cast<unsigned char>(c);
            if (uc < 0x20 || uc == 0x7F) {
                return std::string("must not contain encoded control characters");
            }
        }
        start = end + 1;
    }
    return std::nullopt;
}

Result<ProxyRequest, CallFailure> BuildProxyRequest(ProxyTarget target,
                                                    const nlohmann::json& arguments) {
    ProxyRequest request;

    if (!arguments.contains("environmentId") || !arguments["environmentId"].is_number()) {
        return BuildResult::Err(CallFailure::InvalidArguments("environmentId", "expected a number"));
    }
    const double env_id = arguments["environmentId"].get<double>();
    if (std::floor(env_id) != env_id || env_id < 1 || env_id > 2147483647.0) {
        return BuildResult::Err(
            CallFailure::InvalidArguments("environmentId", "expected a positive integer"));
    }
    request.environment_id = static_cast<int>(env_id);

    if (!arguments.contains("method") || !arguments["method"].is_string()) {
        return BuildResult::Err(CallFailure::InvalidArguments("method", "required parameter is missing"));
    }
    request.method = text::ToUpper(arguments["method"].get<std::string>());
    if (!IsKnownMethod(target, request.method)) {
        return BuildResult::Err(CallFailure::InvalidArguments(
            "method", "unsupported HTTP method '" + request.method + "'"));
    }

    const std::string path_field = ProxyPathArgument(target);
    if (!arguments.contains(path_field) || !arguments[path_field].is_string()) {
        return BuildResult::Err(CallFailure::InvalidArguments(path_field, "required parameter is missing"));
    }
    request.path = arguments[path_field].get<std::string>();
    if (auto reason = CheckProxyPath(request.path)) {
        return BuildResult::Err(CallFailure::InvalidArguments(path_field, *reason));
    }

    auto query = ParsePairs(arguments, "queryParams");
    if (query.IsErr()) return BuildResult::Err(query.Error());
    request.query = std::move(query).Value();

    auto headers = ParsePairs(arguments, "headers");
    if (headers.IsErr()) return BuildResult::Err(headers.Error());
    request.headers = std::move(headers).Value();
    for (size_t i = 0; i < request.headers.size(); ++i) {
        const auto field = "headers[" + std::to_string(i) + "]";
        const auto& [key, value] = request.headers[i];
        if (IsReservedHeader(text::Trim(key))) {
            return BuildResult::Err(CallFailure::InvalidArguments(
                field, "header '" + std::string(text::Trim(key)) +
                           "' may not be set by the caller"));
        }
        if (!text::IsHttpToken(key)) {
            return BuildResult::Err(
                CallFailure::InvalidArguments(field, "header name is not a valid HTTP token"));
        }
        if (!text::IsSafeHeaderValue(value)) {
            return BuildResult::Err(CallFailure::InvalidArguments(
                field, "header value must not contain CR, LF or NUL"));
        }
    }

    if (arguments.contains("body") && !arguments["body"].is_null()) {
        if (!arguments["body"].is_string()) {
            return BuildResult::Err(CallFailure::InvalidArguments("body", "expected a string"));
        }
        request.body = arguments["body"].get<std::string>();
    }

    return BuildResult::Ok(std::move(request));
}

nlohmann::json ProxyEnvelope(int status_code, const KeyValueList& headers,
                             const std::string& body) {
    auto header_obj = nlohmann::json::object();
    for (const auto& [key, value] : headers) {
        header_obj[key].push_back(value);
    }

    nlohmann::json envelope = {{"status", status_code}, {"headers", header_obj}};
    nlohmann::json body_json = body;
    try {
        // Serialising fails on invalid UTF-8.
        (void)body_json.dump();
        envelope["body"] = std::move(body_json);
    } catch (const nlohmann::json::type_error&) {
        envelope["body"] = text::Base64Encode(body);
        envelope["bodyEncoding"] = "base64";
    }
    return envelope;
}

CallResult ForwardProxyRequest(IPortainerClient& client,
                               ProxyTarget target,
                               const ProxyRequest& request,
                               const ProxyLimits& limits,
                               const CallContext& context) {
    const auto deadline = std::chrono::steady_clock::now() + limits.timeout;

    std::string body;
    bool too_large = false;
    bool cancelled = false;
    bool timed_out = false;

    ProxyBodySink sink = [&](const char* data, size_t length) {
        if (context.IsCancelled()) {
            cancelled = true;
            return false;
        }
        if (std::chrono::steady_clock::now() > deadline) {
            timed_out = true;
            return false;
        }
        if (body.size() + length > limits.max_response_bytes) {
            too_large = true;
            return false;
        }
        body.append(data, length);
        return true;
    };

    // Also stops an upstream that accepted the request but sends nothing.
    ProxyCancelCheck stop = [&context, deadline] {
        return context.IsCancelled() || std::chrono::steady_clock::now() > deadline;
    };

    auto response = target == ProxyTarget::Docker
                        ? client.ProxyDockerRequest(request, sink, stop)
                        : client.ProxyKubernetesRequest(request, sink, stop);

    if (too_large) {
        return CallResult::Err(CallFailure{
            FailureKind::ResponseTooLarge,
            "Upstream response exceeds " + std::to_string(limits.max_response_bytes) + " bytes",
            std::nullopt});
    }
    if (cancelled || (response.IsErr() && context.IsCancelled())) {
        return CallResult::Err(
            CallFailure{FailureKind::UpstreamUnreachable, "request cancelled", std::nullopt});
    }
    if (timed_out || (response.IsErr() && std::chrono::steady_clock::now() > deadline)) {
        return CallResult::Err(CallFailure{
            FailureKind::UpstreamUnreachable,
            "proxy timeout of " + std::to_string(limits.timeout.count()) + "s exceeded",
            std::nullopt});
    }
    if (response.IsErr()) {
        const auto& error = response.Error();
        LogWarn("proxy", std::string(EngineName(target)) + " proxy request failed: " +
                             error.ToString());
        return CallResult::Err(CallFailure{error.IsTransportFailure()
                                               ? FailureKind::UpstreamUnreachable
                                               : FailureKind::HandlerFailure,
                                           error.message, std::nullopt});
    }

    const auto& res = response.Value();
    // Clients that ignore the sink hand the body back directly.
    if (body.empty() && !res.body.empty()) {
        if (res.body.size() > limits.max_response_bytes) {
            return CallResult::Err(CallFailure{
                FailureKind::ResponseTooLarge,
                "Upstream response exceeds " + std::to_string(limits.max_response_bytes) +
                    " bytes",
                std::nullopt});
        }
        body = res.body;
    }

    auto envelope = ProxyEnvelope(res.status_code, res.headers, body);
    return CallResult::Ok(TextContent(
        envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)));
}

ToolHandler MakeProxyHandler(IPortainerClient& client, ProxyTarget target, ProxyLimits limits) {
    return [&client, target, limits](const nlohmann::json& arguments,
                                      const CallContext& context) -> CallResult {
        auto request = BuildProxyRequest(target, arguments);
        if (request.IsErr()) {
            return CallResult::Err(request.Error());
        }
        return ForwardProxyRequest(client, target, request.Value(), limits, context);
    };
}

} // namespace portainer_mcp

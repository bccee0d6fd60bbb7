#include <portainer_mcp/workflow/server_bootstrap.hpp>

#include <portainer_mcp/catalog/tool_catalog.hpp>
#include <portainer_mcp/client/portainer_client.hpp>
#include <portainer_mcp/core/log.hpp>
#include <portainer_mcp/core/url.hpp>
#include <portainer_mcp/mcp/http_transport.hpp>
#include <portainer_mcp/mcp/mcp_server.hpp>
#include <portainer_mcp/mcp/tool_handlers.hpp>

#include <chrono>

namespace portainer_mcp {

namespace {

constexpr int kExitSuccess    = 0;
constexpr int kExitConnection = 1;
constexpr int kExitConfig     = 2;
constexpr int kExitSchema     = 3;
constexpr int kExitVersion    = 4;
constexpr int kExitInternal   = 99;

} // anonymous namespace

int ExitCodeFromError(const Error& error) {
    switch (error.category) {
        case ErrorCategory::Config:
            return kExitConfig;
        case ErrorCategory::Schema:
            return kExitSchema;
        case ErrorCategory::Version:
            return kExitVersion;
        case ErrorCategory::Connection:
        case ErrorCategory::Authentication:
        case ErrorCategory::Timeout:
        case ErrorCategory::NotFound:
        case ErrorCategory::Server:
            return kExitConnection;
        default:
            return kExitInternal;
    }
}

Result<void, Error> CheckBackendVersion(IPortainerClient& client) {
    auto version = client.GetVersion();
    if (version.IsErr()) {
        auto error = std::move(version).Error();
        error.message = "Failed to get Portainer server version: " + error.message;
        return Result<void, Error>::Err(std::move(error));
    }
    if (version.Value() != kSupportedPortainerVersion) {
        return Result<void, Error>::Err(Error{
            "CheckBackendVersion", "/api/system/version", std::nullopt,
            "Unsupported Portainer server version: " + version.Value() +
                ", only version " + kSupportedPortainerVersion + " is supported",
            std::nullopt, ErrorCategory::Version});
    }
    LogInfo("bootstrap", "Portainer server version " + version.Value());
    return Result<void, Error>::Ok();
}

Result<DispatchRouter, Error> BuildRouter(const AppConfig& config,
                                          IPortainerClient& client) {
    using R = Result<DispatchRouter, Error>;

    auto catalog = ToolCatalog::LoadFromFile(config.tools_path, kMinimumToolsVersion);
    if (catalog.IsErr()) {
        return R::Err(catalog.Error());
    }
    LogInfo("bootstrap", "Loaded " + std::to_string(catalog.Value().Size()) +
                             " tool definitions from " + config.tools_path);

    if (config.disable_version_check) {
        LogWarn("bootstrap", "Portainer version check disabled");
    } else {
        auto check = CheckBackendVersion(client);
        if (check.IsErr()) {
            return R::Err(check.Error());
        }
    }

    DispatchRouter router(std::move(catalog).Value(), AccessGuard(config.read_only));
    if (config.read_only) {
        LogInfo("bootstrap", "Read-only mode: mutating tools are not registered");
    }

    ProxyLimits limits;
    limits.max_response_bytes = config.limits.max_proxy_response_bytes;
    limits.timeout = std::chrono::seconds(config.limits.proxy_timeout_seconds);
    RegisterPortainerTools(router, client, limits);

    return R::Ok(std::move(router));
}

Result<std::unique_ptr<IPortainerClient>, Error> CreateClient(const AppConfig& config) {
    using R = Result<std::unique_ptr<IPortainerClient>, Error>;

    auto address = ParseServerUrl(config.server.url);
    if (address.IsErr()) {
        return R::Err(Error{"CreateClient", config.server.url, std::nullopt,
                            "Invalid server URL: " + address.Error(), std::nullopt,
                            ErrorCategory::Config});
    }

    PortainerClientOptions options;
    options.request_timeout = std::chrono::seconds(config.limits.request_timeout_seconds);
    options.proxy_timeout = std::chrono::seconds(config.limits.proxy_timeout_seconds);
    options.skip_tls_verify = config.server.skip_tls_verify;

    std::unique_ptr<IPortainerClient> client = std::make_unique<PortainerClient>(
        std::move(address).Value(), config.server.token, options);
    return R::Ok(std::move(client));
}

int RunServer(const AppConfig& config, std::istream& in, std::ostream& out) {
    auto client = CreateClient(config);
    if (client.IsErr()) {
        LogError("bootstrap", client.Error().ToString());
        return ExitCodeFromError(client.Error());
    }
    auto portainer = std::move(client).Value();

    auto router = BuildRouter(config, *portainer);
    if (router.IsErr()) {
        LogError("bootstrap", router.Error().ToString());
        return ExitCodeFromError(router.Error());
    }

    McpServer server(std::move(router).Value(), in, out);

    if (config.transport.kind == TransportKind::Stdio) {
        LogInfo("bootstrap", "Serving MCP over stdio");
        server.Run();
        return kExitSuccess;
    }

    HttpTransport transport(server, config.transport);
    auto port = transport.Bind();
    if (port.IsErr()) {
        LogError("bootstrap", port.Error().ToString());
        return ExitCodeFromError(port.Error());
    }
    auto listened = transport.Listen();
    if (listened.IsErr()) {
        LogError("bootstrap", listened.Error().ToString());
        return ExitCodeFromError(listened.Error());
    }
    return kExitSuccess;
}

} // namespace portainer_mcp

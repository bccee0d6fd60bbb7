#include <portainer_mcp/config/config_loader.hpp>

#include <portainer_mcp/core/url.hpp>
#include <portainer_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace portainer_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Config};
}

Result<TransportKind, Error> ParseTransportKind(const std::string& value) {
    if (value == "stdio") {
        return Result<TransportKind, Error>::Ok(TransportKind::Stdio);
    }
    // "sse" is accepted as an alias; the streamable HTTP endpoint replaced it.
    if (value == "http" || value == "sse") {
        return Result<TransportKind, Error>::Ok(TransportKind::Http);
    }
    return Result<TransportKind, Error>::Err(
        MakeConfigError("Unknown transport '" + value + "' (expected stdio or http)"));
}

Result<LogLevel, Error> ParseLevel(const std::string& value) {
    auto level = ParseLogLevel(value);
    if (!level) {
        return Result<LogLevel, Error>::Err(
            MakeConfigError("Unknown log level '" + value + "'"));
    }
    return Result<LogLevel, Error>::Ok(*level);
}

Result<uint16_t, Error> ToPort(int value) {
    if (value < 1 || value > 65535) {
        return Result<uint16_t, Error>::Err(
            MakeConfigError("Port out of range: " + std::to_string(value)));
    }
    return Result<uint16_t, Error>::Ok(static_cast<uint16_t>(value));
}

Result<AppConfig, Error> ApplyYaml(const YAML::Node& root, AppConfig config) {
    // -- Server --
    if (const auto server = root["server"]) {
        if (server["url"]) {
            config.server.url = server["url"].as<std::string>();
        }
        if (server["token"]) {
            config.server.token = server["token"].as<std::string>();
        }
        if (server["token_env"]) {
            config.server.token_env = server["token_env"].as<std::string>();
        }
        if (server["skip_tls_verify"]) {
            config.server.skip_tls_verify = server["skip_tls_verify"].as<bool>();
        }
    }

    // -- Tools / access --
    if (root["tools"]) {
        config.tools_path = root["tools"].as<std::string>();
    }
    if (root["read_only"]) {
        config.read_only = root["read_only"].as<bool>();
    }
    if (root["disable_version_check"]) {
        config.disable_version_check = root["disable_version_check"].as<bool>();
    }

    // -- Transport --
    if (const auto transport = root["transport"]) {
        if (transport["kind"]) {
            auto kind = ParseTransportKind(transport["kind"].as<std::string>());
            if (kind.IsErr()) {
                return Result<AppConfig, Error>::Err(kind.Error());
            }
            config.transport.kind = kind.Value();
        }
        if (transport["port"]) {
            auto port = ToPort(transport["port"].as<int>());
            if (port.IsErr()) {
                return Result<AppConfig, Error>::Err(port.Error());
            }
            config.transport.port = port.Value();
        }
        if (transport["endpoint"]) {
            config.transport.endpoint = transport["endpoint"].as<std::string>();
        }
    }

    // -- Limits --
    if (const auto limits = root["limits"]) {
        if (limits["request_timeout"]) {
            config.limits.request_timeout_seconds = limits["request_timeout"].as<int>();
        }
        if (limits["proxy_timeout"]) {
            config.limits.proxy_timeout_seconds = limits["proxy_timeout"].as<int>();
        }
        if (limits["max_proxy_response_bytes"]) {
            config.limits.max_proxy_response_bytes =
                limits["max_proxy_response_bytes"].as<size_t>();
        }
    }

    // -- Logging --
    if (const auto log = root["log"]) {
        if (log["level"]) {
            auto level = ParseLevel(log["level"].as<std::string>());
            if (level.IsErr()) {
                return Result<AppConfig, Error>::Err(level.Error());
            }
            config.log.level = level.Value();
        }
        if (log["json"]) {
            config.log.json = log["json"].as<bool>();
        }
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml / LoadFromYamlString
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYamlString(std::string_view yaml, AppConfig base) {
    try {
        auto root = YAML::Load(std::string(yaml));
        if (root.IsNull()) {
            return Result<AppConfig, Error>::Ok(std::move(base));
        }
        if (!root.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Config document must be a mapping"));
        }
        return ApplyYaml(root, std::move(base));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML config: " + std::string(e.what())));
    }
}

Result<AppConfig, Error> LoadFromYaml(std::string_view file_path, AppConfig base) {
    std::ifstream in{std::string(file_path)};
    if (!in) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Cannot open config file: " + std::string(file_path)));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return LoadFromYamlString(ss.str(), std::move(base));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("portainer-mcp", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");

    // Backend connection
    program.add_argument("--server")
        .help("Portainer base URL (e.g. https://portainer.example.com:9443)");
    program.add_argument("--token")
        .help("Portainer API token");
    program.add_argument("--token-env")
        .help("Environment variable containing the API token");
    program.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);

    // Tools and access
    program.add_argument("--tools")
        .help("Path to the tool catalog YAML file");
    program.add_argument("--read-only")
        .help("Only expose tools that cannot modify Portainer state")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--disable-version-check")
        .help("Allow connecting to unsupported Portainer versions")
        .default_value(false)
        .implicit_value(true);

    // Transport
    program.add_argument("--transport")
        .help("Transport: stdio or http");
    program.add_argument("--port")
        .help("HTTP listen port")
        .scan<'i', int>();
    program.add_argument("--endpoint")
        .help("HTTP MCP endpoint path");

    // Limits
    program.add_argument("--request-timeout")
        .help("Timeout in seconds for typed backend calls")
        .scan<'i', int>();
    program.add_argument("--proxy-timeout")
        .help("Maximum in-flight seconds for docker/kubernetes proxy calls")
        .scan<'i', int>();
    program.add_argument("--max-proxy-response-bytes")
        .help("Largest proxied response body accepted")
        .scan<'u', unsigned long long>();

    // Logging
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-json")
        .help("Emit logs as JSON lines")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        // argparse throws runtime_error for unknown flags and
        // invalid_argument for values that fail scan<>.
        return Result<AppConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    if (auto path = program.present("--config")) {
        auto yaml = LoadFromYaml(*path);
        if (yaml.IsErr()) {
            return yaml;
        }
        config = std::move(yaml).Value();
    }

    if (auto val = program.present("--server")) {
        config.server.url = *val;
    }
    if (auto val = program.present("--token")) {
        config.server.token = *val;
    }
    if (auto val = program.present("--token-env")) {
        config.server.token_env = *val;
    }
    if (program.get<bool>("--insecure")) {
        config.server.skip_tls_verify = true;
    }

    if (auto val = program.present("--tools")) {
        config.tools_path = *val;
    }
    if (program.get<bool>("--read-only")) {
        config.read_only = true;
    }
    if (program.get<bool>("--disable-version-check")) {
        config.disable_version_check = true;
    }

    if (auto val = program.present("--transport")) {
        auto kind = ParseTransportKind(*val);
        if (kind.IsErr()) {
            return Result<AppConfig, Error>::Err(kind.Error());
        }
        config.transport.kind = kind.Value();
    }
    if (auto val = program.present<int>("--port")) {
        auto port = ToPort(*val);
        if (port.IsErr()) {
            return Result<AppConfig, Error>::Err(port.Error());
        }
        config.transport.port = port.Value();
    }
    if (auto val = program.present("--endpoint")) {
        config.transport.endpoint = *val;
    }

    if (auto val = program.present<int>("--request-timeout")) {
        config.limits.request_timeout_seconds = *val;
    }
    if (auto val = program.present<int>("--proxy-timeout")) {
        config.limits.proxy_timeout_seconds = *val;
    }
    if (auto val = program.present<unsigned long long>("--max-proxy-response-bytes")) {
        config.limits.max_proxy_response_bytes = static_cast<size_t>(*val);
    }

    if (auto val = program.present("--log-level")) {
        auto level = ParseLevel(*val);
        if (level.IsErr()) {
            return Result<AppConfig, Error>::Err(level.Error());
        }
        config.log.level = level.Value();
    }
    if (program.get<bool>("--log-json")) {
        config.log.json = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ResolveTokenEnv
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveTokenEnv(AppConfig config) {
    if (!config.server.token.empty()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }

    const std::string env_var = config.server.token_env.value_or(kDefaultTokenEnv);
    const char* env_val = std::getenv(env_var.c_str());
    if (env_val == nullptr || *env_val == '\0') {
        if (config.server.token_env.has_value()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Environment variable '" + env_var +
                                "' not set (specified by token_env)"));
        }
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    config.server.token = env_val;
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.url.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: server"));
    }
    auto address = ParseServerUrl(config.server.url);
    if (address.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid server URL '" + config.server.url +
                            "': " + address.Error()));
    }
    if (config.server.token.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: token (or set " +
                            config.server.token_env.value_or(kDefaultTokenEnv) + ")"));
    }
    if (config.tools_path.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: tools"));
    }
    if (config.transport.kind == TransportKind::Http) {
        if (config.transport.port == 0) {
            return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
        }
        if (config.transport.endpoint.empty() || config.transport.endpoint[0] != '/') {
            return Result<void, Error>::Err(
                MakeConfigError("Endpoint must start with '/', got '" +
                                config.transport.endpoint + "'"));
        }
        if (config.transport.endpoint == "/health") {
            return Result<void, Error>::Err(
                MakeConfigError("Endpoint '/health' is reserved"));
        }
    }
    if (config.limits.request_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Request timeout must be positive, got " +
                            std::to_string(config.limits.request_timeout_seconds)));
    }
    if (config.limits.proxy_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Proxy timeout must be positive, got " +
                            std::to_string(config.limits.proxy_timeout_seconds)));
    }
    if (config.limits.max_proxy_response_bytes == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("max_proxy_response_bytes must be positive"));
    }
    return Result<void, Error>::Ok();
}

} // namespace portainer_mcp

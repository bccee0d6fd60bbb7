#pragma once

#include <portainer_mcp/core/log.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace portainer_mcp {

struct ServerConfig {
    std::string url;
    std::string token;
    std::optional<std::string> token_env;  // env var name to read the token from
    bool skip_tls_verify = false;
};

enum class TransportKind {
    Stdio,
    Http,
};

struct TransportConfig {
    TransportKind kind = TransportKind::Stdio;
    uint16_t port = 6972;
    std::string endpoint = "/mcp";
};

struct LimitsConfig {
    int request_timeout_seconds = 30;
    int proxy_timeout_seconds = 300;
    size_t max_proxy_response_bytes = 10 * 1024 * 1024;
};

struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool json = false;
};

struct AppConfig {
    ServerConfig server;
    std::string tools_path = "tools.yaml";
    bool read_only = false;
    bool disable_version_check = false;
    TransportConfig transport;
    LimitsConfig limits;
    LogConfig log;
};

} // namespace portainer_mcp

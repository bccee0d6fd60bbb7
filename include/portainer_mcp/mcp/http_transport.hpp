#pragma once

#include <portainer_mcp/config/app_config.hpp>
#include <portainer_mcp/core/result.hpp>
#include <portainer_mcp/mcp/mcp_server.hpp>

#include <memory>
#include <string>

namespace portainer_mcp {

// ---------------------------------------------------------------------------
// HttpTransport: serves McpServer over HTTP with cpp-httplib.
//
//   POST {endpoint}  one JSON-RPC message; 202 for notifications
//   GET  /health     {"status":"ok"}
//
// Requests run on httplib's worker pool. A closed client connection marks
// the in-flight call as cancelled.
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    HttpTransport(McpServer& server, TransportConfig config);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // Bind `host`:config.port (port 0 picks a free one). Returns the port.
    [[nodiscard]] Result<int, Error> Bind(const std::string& host = "0.0.0.0");

    // Serve until Stop(). Requires a successful Bind().
    [[nodiscard]] Result<void, Error> Listen();

    // Block until the listener accepts connections.
    void WaitUntilReady() const;

    void Stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace portainer_mcp

#include <portainer_mcp/mcp/http_transport.hpp>

#include <portainer_mcp/core/log.hpp>

#include <httplib.h>

namespace portainer_mcp {

namespace {

constexpr const char* kJsonContentType = "application/json";

Error MakeTransportError(const std::string& message) {
    return Error{"HttpTransport", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Connection};
}

} // anonymous namespace

struct HttpTransport::Impl {
    McpServer& server;
    TransportConfig config;
    httplib::Server http;
    bool bound = false;

    Impl(McpServer& srv, TransportConfig cfg) : server(srv), config(std::move(cfg)) {
        http.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status":"ok"})", kJsonContentType);
        });

        http.Post(config.endpoint, [this](const httplib::Request& req, httplib::Response& res) {
            HandlePost(req, res);
        });

        // Server-initiated streams are not offered.
        http.Get(config.endpoint, [](const httplib::Request&, httplib::Response& res) {
            res.status = 405;
            res.set_header("Allow", "POST");
        });

        http.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            LogDebug("http", req.method + " " + req.path + " -> " + std::to_string(res.status));
        });
    }

    void HandlePost(const httplib::Request& req, httplib::Response& res) {
        CallContext context;
        context.is_cancelled = [&req] {
            return req.is_connection_closed && req.is_connection_closed();
        };

        auto response = server.HandleRaw(req.body, context);
        if (!response) {
            res.status = 202;
            return;
        }
        res.status = 200;
        res.set_content(
            response->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
            kJsonContentType);
    }
};

HttpTransport::HttpTransport(McpServer& server, TransportConfig config)
    : impl_(std::make_unique<Impl>(server, std::move(config))) {}

HttpTransport::~HttpTransport() {
    Stop();
}

Result<int, Error> HttpTransport::Bind(const std::string& host) {
    int port = 0;
    if (impl_->config.port == 0) {
        port = impl_->http.bind_to_any_port(host);
    } else if (impl_->http.bind_to_port(host, impl_->config.port)) {
        port = impl_->config.port;
    } else {
        port = -1;
    }
    if (port <= 0) {
        return Result<int, Error>::Err(MakeTransportError(
            "Cannot bind " + host + ":" + std::to_string(impl_->config.port)));
    }
    impl_->bound = true;
    LogInfo("http", "Starting HTTP server on " + host + ":" + std::to_string(port) +
                        impl_->config.endpoint);
    return Result<int, Error>::Ok(port);
}

Result<void, Error> HttpTransport::Listen() {
    if (!impl_->bound) {
        return Result<void, Error>::Err(MakeTransportError("Listen() called before Bind()"));
    }
    if (!impl_->http.listen_after_bind()) {
        return Result<void, Error>::Err(MakeTransportError("HTTP listener stopped with an error"));
    }
    return Result<void, Error>::Ok();
}

void HttpTransport::WaitUntilReady() const {
    impl_->http.wait_until_ready();
}

void HttpTransport::Stop() {
    if (impl_ && impl_->http.is_running()) {
        impl_->http.stop();
    }
}

} // namespace portainer_mcp

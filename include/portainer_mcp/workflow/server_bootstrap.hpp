#pragma once

#include <portainer_mcp/client/i_portainer_client.hpp>
#include <portainer_mcp/config/app_config.hpp>
#include <portainer_mcp/core/result.hpp>
#include <portainer_mcp/mcp/dispatch_router.hpp>

#include <iostream>
#include <memory>

namespace portainer_mcp {

// The Portainer release this server's tool handlers are written against.
inline constexpr const char* kSupportedPortainerVersion = "2.31.2";

// Fails with a Version error unless the backend reports exactly
// kSupportedPortainerVersion.
[[nodiscard]] Result<void, Error> CheckBackendVersion(IPortainerClient& client);

// Startup sequence up to a ready router:
//   1. load the tool catalog (Schema errors are fatal)
//   2. check the backend version unless disabled
//   3. bind every known handler the catalog declares and the guard admits
// `client` must outlive the returned router.
[[nodiscard]] Result<DispatchRouter, Error> BuildRouter(const AppConfig& config,
                                                        IPortainerClient& client);

// Create the concrete client for `config`.
[[nodiscard]] Result<std::unique_ptr<IPortainerClient>, Error> CreateClient(
    const AppConfig& config);

// Build everything and serve on the configured transport until it stops.
// Returns a process exit code.
int RunServer(const AppConfig& config,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

// Process exit code for a startup error.
[[nodiscard]] int ExitCodeFromError(const Error& error);

} // namespace portainer_mcp

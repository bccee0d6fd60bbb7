#pragma once

#include <portainer_mcp/client/i_portainer_client.hpp>
#include <portainer_mcp/mcp/dispatch_router.hpp>
#include <portainer_mcp/mcp/proxy_bridge.hpp>

namespace portainer_mcp {

// Register every known tool with the router. Handlers capture `client` by
// reference; it must outlive the router and be safe for concurrent use.
// Returns the number of tools that became reachable.
size_t RegisterPortainerTools(DispatchRouter& router,
                              IPortainerClient& client,
                              const ProxyLimits& proxy_limits);

} // namespace portainer_mcp

#pragma once

#include <portainer_mcp/catalog/tool_catalog.hpp>
#include <portainer_mcp/mcp/access_guard.hpp>
#include <portainer_mcp/mcp/tool_names.hpp>
#include <portainer_mcp/mcp/tool_registry.hpp>

#include <string_view>
#include <vector>

namespace portainer_mcp {

// ---------------------------------------------------------------------------
// DispatchRouter: binds catalog tools to handlers and routes calls.
//
// Registration happens once at startup. After that the router is only read,
// so Dispatch may run concurrently from any number of threads.
// ---------------------------------------------------------------------------
class DispatchRouter {
public:
    DispatchRouter(ToolCatalog catalog, AccessGuard guard);

    // Bind `handler` if the catalog declares the tool and the guard admits
    // it. Returns whether the tool is now reachable.
    bool RegisterIfPresent(ToolId id, ToolHandler handler);

    // As RegisterIfPresent, but the definition's mutating flag is ignored;
    // instead each call's "method" argument is checked against the guard.
    bool RegisterProxyIfPresent(ToolId id, ToolHandler handler);

    // Never throws. Order: lookup, per-call gate, schema validation, handler.
    [[nodiscard]] CallResult Dispatch(const CallRequest& request,
                                      const CallContext& context = {}) const;

    [[nodiscard]] std::vector<const ToolDefinition*> Tools() const {
        return registry_.Tools();
    }

    [[nodiscard]] bool HasTool(std::string_view name) const {
        return registry_.HasTool(name);
    }

private:
    bool Bind(ToolId id, ToolHandler handler, CallGate gate, bool check_mutating);

    ToolCatalog catalog_;
    AccessGuard guard_;
    ToolRegistry registry_;
};

} // namespace portainer_mcp

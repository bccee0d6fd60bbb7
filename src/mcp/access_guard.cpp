#include <portainer_mcp/mcp/access_guard.hpp>

#include <portainer_mcp/core/text.hpp>

namespace portainer_mcp {

bool AccessGuard::IsAllowed(const ToolDefinition& definition) const noexcept {
    return !(read_only_ && definition.mutating);
}

bool AccessGuard::IsMethodAllowed(std::string_view method) const {
    return !read_only_ || text::ToUpper(method) == "GET";
}

} // namespace portainer_mcp

#pragma once

#include <portainer_mcp/catalog/tool_catalog.hpp>

#include <string_view>

namespace portainer_mcp {

// ---------------------------------------------------------------------------
// AccessGuard: the read-only / read-write policy. Every registration path
// and every per-call proxy check goes through these two predicates.
// ---------------------------------------------------------------------------
class AccessGuard {
public:
    explicit AccessGuard(bool read_only) noexcept : read_only_(read_only) {}

    // False iff read-only and the tool may change state.
    [[nodiscard]] bool IsAllowed(const ToolDefinition& definition) const noexcept;

    // False iff read-only and the HTTP method is anything but GET.
    [[nodiscard]] bool IsMethodAllowed(std::string_view method) const;

    [[nodiscard]] bool ReadOnly() const noexcept { return read_only_; }

private:
    bool read_only_;
};

} // namespace portainer_mcp

#pragma once

#include <portainer_mcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace portainer_mcp {

// Ordered key/value pairs; keys may repeat.
using KeyValueList = std::vector<std::pair<std::string, std::string>>;

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// Decode %XX escapes. Malformed escapes are copied through unchanged.
std::string UrlDecode(std::string_view value);

// Build "k1=v1&k2=v2" with both sides percent-encoded, preserving order.
std::string BuildQueryString(const KeyValueList& params);

// ---------------------------------------------------------------------------
// ServerAddress: a parsed Portainer base URL.
//
//   https://portainer.example.com:9443/portainer
//     scheme = "https", host = "portainer.example.com", port = 9443,
//     base_path = "/portainer"
// ---------------------------------------------------------------------------
struct ServerAddress {
    std::string scheme;
    std::string host;
    uint16_t port = 0;
    std::string base_path;

    /// "scheme://host:port" as accepted by httplib::Client.
    [[nodiscard]] std::string Origin() const;
};

Result<ServerAddress, std::string> ParseServerUrl(std::string_view url);

} // namespace portainer_mcp

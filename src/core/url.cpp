#include <portainer_mcp/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace portainer_mcp {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string UrlDecode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = HexValue(value[i + 1]);
            int lo = HexValue(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(value[i]);
    }
    return out;
}

std::string BuildQueryString(const KeyValueList& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) query += '&';
        query += UrlEncode(key);
        query += '=';
        query += UrlEncode(value);
    }
    return query;
}

std::string ServerAddress::Origin() const {
    return scheme + "://" + host + ":" + std::to_string(port);
}

Result<ServerAddress, std::string> ParseServerUrl(std::string_view url) {
    using R = Result<ServerAddress, std::string>;

    ServerAddress address;
    std::string_view rest;
    if (url.substr(0, 8) == "https://") {
        address.scheme = "https";
        address.port = 443;
        rest = url.substr(8);
    } else if (url.substr(0, 7) == "http://") {
        address.scheme = "http";
        address.port = 80;
        rest = url.substr(7);
    } else {
        return R::Err("URL must start with http:// or https://");
    }

    auto slash = rest.find('/');
    auto authority = rest.substr(0, slash);
    if (slash != std::string_view::npos) {
        auto path = rest.substr(slash);
        while (!path.empty() && path.back() == '/') {
            path.remove_suffix(1);
        }
        address.base_path = std::string(path);
    }

    if (authority.empty()) {
        return R::Err("URL has no host");
    }

    // A bracketed IPv6 literal keeps its brackets; the port follows ']'.
    std::string_view port_str;
    bool has_port = false;
    if (authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return R::Err("Unterminated IPv6 address in URL");
        }
        if (close == 1) {
            return R::Err("URL has no host");
        }
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return R::Err("Invalid port in URL");
            }
            port_str = after.substr(1);
            has_port = true;
        }
        authority = authority.substr(0, close + 1);
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            port_str = authority.substr(colon + 1);
            has_port = true;
            authority = authority.substr(0, colon);
        }
    }

    if (has_port) {
        if (port_str.empty() || port_str.size() > 5) {
            return R::Err("Invalid port in URL");
        }
        int port = 0;
        for (char c : port_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return R::Err("Invalid port in URL");
            }
            port = port * 10 + (c - '0');
        }
        if (port < 1 || port > 65535) {
            return R::Err("Port out of range in URL");
        }
        address.port = static_cast<uint16_t>(port);
    }

    if (authority.empty()) {
        return R::Err("URL has no host");
    }
    address.host = std::string(authority);
    return R::Ok(std::move(address));
}

} // namespace portainer_mcp

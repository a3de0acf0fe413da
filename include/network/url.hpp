#pragma once

#include <cstdint>
#include <string>
#include <optional>

namespace dlnacast {
namespace network {

struct UrlParts {
    std::string scheme;   // lower-case
    std::string host;     // lower-case, IPv6 brackets removed
    uint16_t port = 0;    // explicit port, or the scheme default
    bool explicitPort = false;
    std::string path;     // includes query, "/" when absent

    // scheme://host[:port]
    std::string origin() const;
};

// Returns nullopt when the text has no "scheme://" or a malformed authority
std::optional<UrlParts> parseUrl(const std::string& url);

uint16_t defaultPortForScheme(const std::string& scheme);

} // namespace network
} // namespace dlnacast

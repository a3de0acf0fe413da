#pragma once

#include <string>

namespace dlnacast {
namespace network {

// Strict dotted-quad IPv4, each octet in [0,255], no surrounding whitespace
bool validateIpAddress(const std::string& ip);

// Exactly "true" or "false"
bool validateBooleanString(const std::string& value);

/**
 * @brief Accepts http/https URLs with a host that is not loopback or
 * link-local metadata
 *
 * Blocked: localhost, 0.0.0.0, the 127.0.0.0/8 range, ::1 in both
 * spellings, 169.254.* and fd00:*.
 */
bool validateStreamUrl(const std::string& url);

} // namespace network
} // namespace dlnacast

#include "network/url.hpp"

#include <algorithm>
#include <cctype>

namespace dlnacast {
namespace network {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool isSchemeChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

} // namespace

std::string UrlParts::origin() const {
    std::string hostPart = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    std::string result = scheme + "://" + hostPart;
    if (explicitPort || port != defaultPortForScheme(scheme)) {
        result += ":" + std::to_string(port);
    }
    return result;
}

uint16_t defaultPortForScheme(const std::string& scheme) {
    if (scheme == "https") return 443;
    if (scheme == "http") return 80;
    return 0;
}

std::optional<UrlParts> parseUrl(const std::string& url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return std::nullopt;
    }
    if (!std::all_of(url.begin(), url.begin() + schemeEnd, isSchemeChar)) {
        return std::nullopt;
    }

    UrlParts parts;
    parts.scheme = toLower(url.substr(0, schemeEnd));

    size_t authorityStart = schemeEnd + 3;
    size_t authorityEnd = url.find_first_of("/?#", authorityStart);
    std::string authority = url.substr(authorityStart, authorityEnd == std::string::npos
                                                          ? std::string::npos
                                                          : authorityEnd - authorityStart);
    if (authorityEnd == std::string::npos) {
        parts.path = "/";
    } else {
        parts.path = url.substr(authorityEnd);
        if (parts.path[0] != '/') {
            parts.path = "/" + parts.path;
        }
    }

    auto at = authority.rfind('@');
    if (at != std::string::npos) {
        authority = authority.substr(at + 1);
    }

    std::string portText;
    if (!authority.empty() && authority[0] == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            return std::nullopt;
        }
        parts.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return std::nullopt;
            }
            portText = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            parts.host = authority.substr(0, colon);
            portText = authority.substr(colon + 1);
        } else {
            parts.host = authority;
        }
    }

    parts.host = toLower(parts.host);
    parts.port = defaultPortForScheme(parts.scheme);

    if (!portText.empty()) {
        if (portText.size() > 5 ||
            !std::all_of(portText.begin(), portText.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
        long value = std::stol(portText);
        if (value <= 0 || value > 65535) {
            return std::nullopt;
        }
        parts.port = static_cast<uint16_t>(value);
        parts.explicitPort = true;
    }

    return parts;
}

} // namespace network
} // namespace dlnacast

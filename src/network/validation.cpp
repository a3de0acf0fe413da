#include "network/validation.hpp"
#include "network/url.hpp"

#include <regex>

#include <asio/ip/address.hpp>

namespace dlnacast {
namespace network {

namespace {

const std::regex& ipv4Pattern() {
    static const std::regex pattern("^[0-9]{1,3}\\.[0-9]{1,3}\\.[0-9]{1,3}\\.[0-9]{1,3}$");
    return pattern;
}

bool isBlockedV4(const asio::ip::address_v4& address) {
    const asio::ip::address_v4::bytes_type bytes = address.to_bytes();
    // 169.254/16 carries cloud metadata services
    return address.is_loopback() || address.is_unspecified() || (bytes[0] == 169 && bytes[1] == 254);
}

// Any spelling of loopback, unspecified, link-local or fd00::/16, including v4-mapped forms
bool isBlockedAddress(const std::string& host) {
    asio::error_code ec;
    const asio::ip::address address = asio::ip::make_address(host, ec);
    if (ec) {
        return false;
    }

    if (address.is_v4()) {
        return isBlockedV4(address.to_v4());
    }

    const asio::ip::address_v6 v6 = address.to_v6();
    if (v6.is_v4_mapped()) {
        return isBlockedV4(asio::ip::make_address_v4(asio::ip::v4_mapped, v6));
    }
    const asio::ip::address_v6::bytes_type bytes = v6.to_bytes();
    return v6.is_loopback() || v6.is_unspecified() || v6.is_link_local() ||
           (bytes[0] == 0xfd && bytes[1] == 0x00);
}

} // namespace

bool validateIpAddress(const std::string& ip) {
    if (!std::regex_match(ip, ipv4Pattern())) {
        return false;
    }

    size_t start = 0;
    while (start <= ip.size()) {
        size_t dot = ip.find('.', start);
        std::string octet = ip.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (std::stoi(octet) > 255) {
            return false;
        }
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return true;
}

bool validateBooleanString(const std::string& value) {
    return value == "true" || value == "false";
}

bool validateStreamUrl(const std::string& url) {
    auto parts = parseUrl(url);
    if (!parts) {
        return false;
    }

    if (parts->scheme != "http" && parts->scheme != "https") {
        return false;
    }
    if (parts->host.empty()) {
        return false;
    }

    std::string host = parts->host;
    while (!host.empty() && host.back() == '.') {
        host.pop_back();
    }
    if (host.empty() || host == "localhost") {
        return false;
    }
    if (isBlockedAddress(host)) {
        return false;
    }

    return true;
}

} // namespace network
} // namespace dlnacast

#pragma once

#include "dlnacast_types.hpp"
#include "network/http_client.hpp"

#include <cstdint>
#include <string>
#include <vector>
#include <set>
#include <map>
#include <optional>
#include <functional>

namespace dlnacast {
namespace network {

struct DiscoveryConfig {
    std::string multicastAddress = "239.255.255.250";
    uint16_t multicastPort = 1900;
    int mx = 3;
    std::string searchTarget = "urn:schemas-upnp-org:device:MediaRenderer:1";
    int multicastTtl = 2;
    double sendGapSeconds = 0.1;
    uint32_t maxParallelFetches = 10;
    double fetchTimeoutSeconds = 5.0;
    double overallFetchTimeoutSeconds = 15.0;
};

using DeviceCallback = std::function<void(const Device&)>;

/**
 * @brief Turns a UPnP device description document into a Device
 *
 * Returns nullopt for malformed XML, a missing device element, or a
 * description without an AVTransport service (a MediaServer answering a
 * MediaRenderer search).
 */
class DeviceDescriptionParser {
public:
    static std::optional<Device> parse(const std::string& xml, const std::string& location);
};

/**
 * @brief Deduplicates M-SEARCH responses by LOCATION, keeping arrival order
 */
class LocationCollector {
public:
    // True when the response carried a LOCATION not seen before
    bool add(const std::string& response);

    const std::vector<std::string>& locations() const { return locations_; }
    size_t responseCount() const { return responses_; }

private:
    std::set<std::string> seen_;
    std::vector<std::string> locations_;
    size_t responses_ = 0;
};

/**
 * @brief SSDP M-SEARCH discovery of DLNA media renderers
 *
 * discover() multicasts the search twice, gathers responses until the
 * timeout, then fetches the description documents on a bounded worker pool.
 * One failing location never aborts the scan.
 */
class SsdpDiscovery {
public:
    explicit SsdpDiscovery(HttpTransport& http, const DiscoveryConfig& config = DiscoveryConfig());
    virtual ~SsdpDiscovery() = default;

    // The callback runs on the calling thread as each device resolves
    std::vector<Device> discover(double timeoutSeconds, const DeviceCallback& callback = nullptr);

    // Probes common description paths on common ports; first valid device wins
    std::optional<Device> tryDirectConnection(const std::string& host, double timeoutSeconds = 5.0);

    std::optional<Device> fetchDeviceInfo(const std::string& location);

    std::vector<Device> fetchDevices(const std::vector<std::string>& locations,
                                     const DeviceCallback& callback);

    std::string buildSearchRequest() const;

    // Header names are upper-cased; the status line is skipped
    static std::map<std::string, std::string> parseSsdpResponse(const std::string& response);

    static const std::vector<std::string>& directConnectionPaths();
    static const std::vector<uint16_t>& directConnectionPorts();

protected:
    // Multicast search and response collection; returns unique locations
    virtual std::vector<std::string> collectLocations(double timeoutSeconds);

private:
    HttpTransport& http_;
    DiscoveryConfig config_;
};

} // namespace network
} // namespace dlnacast

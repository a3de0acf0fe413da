#pragma once

#include "dlnacast_types.hpp"
#include "core/format_detector.hpp"
#include "network/device_registry.hpp"
#include "network/http_client.hpp"
#include "network/ssdp_discovery.hpp"
#include "streaming/streamer.hpp"
#include "upnp/dlna_client.hpp"

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>

namespace dlnacast {
namespace core {

struct PlaybackSettings {
    std::string publicUrl;              // overrides <local ip>:<port> when set
    double ffmpegStartupTimeout = 10.0;
    double selectScanTimeout = 5.0;
    double directConnectTimeout = 5.0;
    std::string title = "Radio Stream";
};

struct PlayResult {
    bool ok = false;
    HttpStatus status = HttpStatus::OK;
    std::string error;
    std::string stream_url;
    std::string playback_url;
    bool transcoding = false;
    std::optional<std::string> format;
};

struct SelectResult {
    bool ok = false;
    HttpStatus status = HttpStatus::OK;
    std::string error;
    std::optional<Device> device;
};

struct StatusReport {
    bool streaming = false;
    std::optional<TransportInfo> dlna;
    std::optional<Device> current_device;
};

struct DeviceListing {
    std::vector<Device> devices;
    std::optional<double> cache_age_seconds;
};

using LocalAddressResolver = std::function<std::string()>;

/**
 * @brief Runs play/stop/select against the selected renderer
 *
 * At most one streaming session exists. play() and stop() are serialized
 * and a new session is only started after the previous one is fully torn
 * down. Every failure path after a session was started stops it again.
 */
class PlaybackOrchestrator {
public:
    PlaybackOrchestrator(network::HttpTransport& http,
                         network::DeviceRegistry& registry,
                         network::SsdpDiscovery& discovery,
                         FormatDetector& detector,
                         streaming::StreamerFactory& streamers,
                         const PlaybackSettings& settings,
                         const upnp::ControlTimeouts& controlTimeouts = upnp::ControlTimeouts());
    ~PlaybackOrchestrator();

    PlayResult play(const std::string& streamUrl);

    // Best-effort device Stop, then session teardown
    void stop();

    StatusReport status();

    DeviceListing listDevices(bool forceScan, double scanTimeoutSeconds);

    // Current device -> cache -> fresh scan -> direct connection
    SelectResult selectDevice(const std::string& ip);

    // Current device -> cache -> direct connection; used for the configured default
    bool autoSelectDevice(const std::string& ip);

    bool isStreaming();
    std::optional<Device> currentDevice() { return registry_.current(); }

    // Passthrough when the format is known, the renderer declares it and the source is not HTTPS
    static bool shouldPassthrough(const std::optional<std::string>& format,
                                  const std::optional<Capabilities>& capabilities,
                                  const std::string& streamUrl);

    // Outbound interface address, 127.0.0.1 when it cannot be determined
    static std::string detectLocalIp();

    void setLocalAddressResolver(LocalAddressResolver resolver);

private:
    std::unique_ptr<upnp::DlnaClient> makeClient(const Device& device) const;
    std::shared_ptr<streaming::Streamer> currentStreamer();

    // Caller holds operationMutex_
    void stopSessionLocked();
    bool selectWithCapabilities(Device& device);

    network::HttpTransport& http_;
    network::DeviceRegistry& registry_;
    network::SsdpDiscovery& discovery_;
    FormatDetector& detector_;
    streaming::StreamerFactory& streamers_;
    PlaybackSettings settings_;
    upnp::ControlTimeouts controlTimeouts_;
    LocalAddressResolver localAddress_;

    std::mutex operationMutex_;
    std::mutex streamerMutex_;
    std::shared_ptr<streaming::Streamer> streamer_;
};

} // namespace core
} // namespace dlnacast

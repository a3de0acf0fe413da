#include "core/playback_orchestrator.hpp"
#include "upnp/didl_metadata.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <cctype>

#include <asio.hpp>

namespace dlnacast {
namespace core {

namespace {

PlayResult playFailure(HttpStatus status, const std::string& error, const std::string& streamUrl) {
    PlayResult result;
    result.ok = false;
    result.status = status;
    result.error = error;
    result.stream_url = streamUrl;
    return result;
}

SelectResult selectFailure(HttpStatus status, const std::string& error) {
    SelectResult result;
    result.ok = false;
    result.status = status;
    result.error = error;
    return result;
}

bool isHttpsUrl(const std::string& url) {
    static const std::string prefix = "https://";
    if (url.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(url[i])) != prefix[i]) {
            return false;
        }
    }
    return true;
}

std::string stripTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

PlaybackOrchestrator::PlaybackOrchestrator(network::HttpTransport& http,
                                           network::DeviceRegistry& registry,
                                           network::SsdpDiscovery& discovery,
                                           FormatDetector& detector,
                                           streaming::StreamerFactory& streamers,
                                           const PlaybackSettings& settings,
                                           const upnp::ControlTimeouts& controlTimeouts)
    : http_(http)
    , registry_(registry)
    , discovery_(discovery)
    , detector_(detector)
    , streamers_(streamers)
    , settings_(settings)
    , controlTimeouts_(controlTimeouts)
    , localAddress_(&PlaybackOrchestrator::detectLocalIp) {
}

PlaybackOrchestrator::~PlaybackOrchestrator() {
    std::lock_guard<std::mutex> lock(operationMutex_);
    stopSessionLocked();
}

void PlaybackOrchestrator::setLocalAddressResolver(LocalAddressResolver resolver) {
    localAddress_ = resolver ? std::move(resolver) : LocalAddressResolver(&PlaybackOrchestrator::detectLocalIp);
}

std::string PlaybackOrchestrator::detectLocalIp() {
    try {
        // connect() on UDP sends nothing; it only selects the outbound route
        asio::io_context io_context;
        asio::ip::udp::socket socket(io_context);
        socket.connect(asio::ip::udp::endpoint(asio::ip::make_address("8.8.8.8"), 80));
        std::string address = socket.local_endpoint().address().to_string();
        socket.close();
        return address;
    } catch (const asio::system_error& e) {
        Logger::warning("PlaybackOrchestrator: Could not determine local IP: {}", e.what());
        return "127.0.0.1";
    }
}

std::unique_ptr<upnp::DlnaClient> PlaybackOrchestrator::makeClient(const Device& device) const {
    return std::make_unique<upnp::DlnaClient>(http_, device, controlTimeouts_);
}

std::shared_ptr<streaming::Streamer> PlaybackOrchestrator::currentStreamer() {
    std::lock_guard<std::mutex> lock(streamerMutex_);
    return streamer_;
}

void PlaybackOrchestrator::stopSessionLocked() {
    std::shared_ptr<streaming::Streamer> streamer;
    {
        std::lock_guard<std::mutex> lock(streamerMutex_);
        streamer.swap(streamer_);
    }
    if (streamer) {
        streamer->stop();
    }
}

bool PlaybackOrchestrator::isStreaming() {
    auto streamer = currentStreamer();
    return streamer && streamer->isRunning();
}

bool PlaybackOrchestrator::shouldPassthrough(const std::optional<std::string>& format,
                                             const std::optional<Capabilities>& capabilities,
                                             const std::string& streamUrl) {
    if (!format) {
        Logger::warning("PlaybackOrchestrator: Could not detect stream format - defaulting to transcoding for compatibility");
        return false;
    }
    Logger::info("PlaybackOrchestrator: Stream format detected: {}", *format);

    if (!capabilities || !capabilities->isKnown()) {
        Logger::warning("PlaybackOrchestrator: Device capabilities not available - defaulting to transcoding");
        return false;
    }

    Logger::info("PlaybackOrchestrator: Device capabilities available: MP3={}, AAC={}, FLAC={}",
                 capabilities->supports_mp3, capabilities->supports_aac, capabilities->supports_flac);

    if (!upnp::supportsFamily(*capabilities, upnp::formatFamilyFor(*format))) {
        Logger::warning("PlaybackOrchestrator: Device does not support {} - transcoding to MP3 required", *format);
        return false;
    }

    // Many renderers have no TLS stack
    if (isHttpsUrl(streamUrl)) {
        Logger::warning("PlaybackOrchestrator: Device supports {} but stream is HTTPS - transcoding to HTTP for compatibility",
                        *format);
        return false;
    }

    Logger::info("PlaybackOrchestrator: Device supports {} natively - using passthrough mode (no transcoding)", *format);
    return true;
}

PlayResult PlaybackOrchestrator::play(const std::string& streamUrl) {
    std::lock_guard<std::mutex> lock(operationMutex_);

    auto device = registry_.current();
    if (!device) {
        return playFailure(HttpStatus::BAD_REQUEST, "No device selected. Please use /devices/select first.", streamUrl);
    }

    auto client = makeClient(*device);

    if (currentStreamer()) {
        Logger::info("PlaybackOrchestrator: Stopping existing stream");
        stopSessionLocked();
    }

    client->stopIfPlaying();

    PlayResult result;
    result.stream_url = streamUrl;
    result.format = detector_.detect(streamUrl);
    result.transcoding = !shouldPassthrough(result.format, device->capabilities, streamUrl);

    std::shared_ptr<streaming::Streamer> streamer;
    try {
        if (result.transcoding) {
            streamer = streamers_.createTranscoder(streamUrl, [] {
                Logger::error("PlaybackOrchestrator: Transcoder crashed, streaming session ended");
            });
        } else {
            streamer = streamers_.createPassthrough(streamUrl);
        }
        {
            std::lock_guard<std::mutex> streamerLock(streamerMutex_);
            streamer_ = streamer;
        }
        streamer->start();
    } catch (const streaming::StreamerError& e) {
        Logger::error("PlaybackOrchestrator: Failed to start streamer: {}", e.what());
        stopSessionLocked();
        return playFailure(HttpStatus::INTERNAL_ERROR, "Streaming server failed to start", streamUrl);
    }

    if (result.transcoding) {
        if (!streamer->waitUntilReady(settings_.ffmpegStartupTimeout)) {
            stopSessionLocked();
            return playFailure(HttpStatus::INTERNAL_ERROR, "Streaming server failed to start", streamUrl);
        }

        if (!settings_.publicUrl.empty()) {
            result.playback_url = stripTrailingSlash(settings_.publicUrl) + "/stream.mp3";
            Logger::info("PlaybackOrchestrator: Using configured public URL: {}", result.playback_url);
        } else {
            result.playback_url = streamer->getStreamUrl(localAddress_());
            Logger::info("PlaybackOrchestrator: Auto-detected stream URL: {}", result.playback_url);
        }
    } else {
        result.playback_url = streamer->getStreamUrl(std::string());
    }

    // Passthrough advertises the source's own type, transcoding always produces MP3
    const std::string mimeType = result.transcoding ? "audio/mpeg" : *result.format;
    if (!client->playUrl(result.playback_url, settings_.title, mimeType)) {
        stopSessionLocked();
        return playFailure(HttpStatus::INTERNAL_ERROR, "Failed to start playback on DLNA device", streamUrl);
    }

    result.ok = true;
    result.status = HttpStatus::OK;
    Logger::info("PlaybackOrchestrator: Playing {} on {} (transcoding: {})", streamUrl, device->friendly_name,
                 result.transcoding);
    return result;
}

void PlaybackOrchestrator::stop() {
    std::lock_guard<std::mutex> lock(operationMutex_);

    // Stop unconditionally; the renderer may be TRANSITIONING
    if (auto device = registry_.current()) {
        if (!makeClient(*device)->stop()) {
            Logger::debug("PlaybackOrchestrator: DLNA stop command failed (may already be stopped)");
        }
    }

    stopSessionLocked();
}

StatusReport PlaybackOrchestrator::status() {
    StatusReport report;
    report.streaming = isStreaming();
    report.current_device = registry_.current();

    if (report.current_device) {
        report.dlna = makeClient(*report.current_device)->getTransportInfo(2);
        if (!report.dlna && report.streaming) {
            Logger::debug("PlaybackOrchestrator: DLNA query failed but streamer is running - using fallback status");
            TransportInfo fallback;
            fallback.state = "PLAYING";
            fallback.status = "UNKNOWN";
            report.dlna = fallback;
        }
    }
    return report;
}

DeviceListing PlaybackOrchestrator::listDevices(bool forceScan, double scanTimeoutSeconds) {
    DeviceListing listing;
    if (forceScan) {
        Logger::info("PlaybackOrchestrator: Force scan requested (timeout: {}s)", scanTimeoutSeconds);
        listing.devices = discovery_.discover(scanTimeoutSeconds);
        registry_.updateCache(listing.devices);
        listing.cache_age_seconds = 0.0;
    } else {
        listing.cache_age_seconds = registry_.cacheAgeSeconds();
        listing.devices = registry_.cached();
    }
    return listing;
}

bool PlaybackOrchestrator::selectWithCapabilities(Device& device) {
    Logger::info("PlaybackOrchestrator: Detecting capabilities for {}", device.friendly_name);
    device.capabilities = makeClient(device)->detectCapabilities();
    return registry_.select(device);
}

SelectResult PlaybackOrchestrator::selectDevice(const std::string& ip) {
    std::optional<Device> device;

    auto current = registry_.current();
    if (current && current->ip == ip) {
        device = current;
    }

    if (!device) {
        device = registry_.findInCache(ip);
        if (device) {
            Logger::info("PlaybackOrchestrator: Found device in cache: {}", device->friendly_name);
        }
    }

    if (!device) {
        Logger::info("PlaybackOrchestrator: Scanning for device: {}", ip);
        std::vector<Device> devices = discovery_.discover(settings_.selectScanTimeout);
        registry_.updateCache(devices);
        auto it = std::find_if(devices.begin(), devices.end(),
                               [&ip](const Device& candidate) { return candidate.ip == ip; });
        if (it != devices.end()) {
            device = *it;
        }
    }

    if (!device) {
        Logger::info("PlaybackOrchestrator: Device not found in scan, trying direct connection to {}", ip);
        device = discovery_.tryDirectConnection(ip, settings_.directConnectTimeout);
    }

    if (!device) {
        return selectFailure(HttpStatus::NOT_FOUND, "Device " + ip + " not found");
    }

    if (!selectWithCapabilities(*device)) {
        return selectFailure(HttpStatus::INTERNAL_ERROR, "Failed to save device selection");
    }

    SelectResult result;
    result.ok = true;
    result.device = device;
    return result;
}

bool PlaybackOrchestrator::autoSelectDevice(const std::string& ip) {
    auto current = registry_.current();
    if (current && current->ip == ip) {
        Logger::info("PlaybackOrchestrator: Default device already selected: {} ({})", current->friendly_name, ip);
        return true;
    }

    Logger::info("PlaybackOrchestrator: Auto-selecting default device: {}", ip);

    auto device = registry_.findInCache(ip);
    if (!device) {
        Logger::info("PlaybackOrchestrator: Default device {} not in cache, trying direct connection", ip);
        device = discovery_.tryDirectConnection(ip, settings_.directConnectTimeout);
    }

    if (!device) {
        Logger::warning("PlaybackOrchestrator: Could not connect to default device {}", ip);
        return false;
    }

    if (!selectWithCapabilities(*device)) {
        Logger::error("PlaybackOrchestrator: Failed to auto-select default device {}", ip);
        return false;
    }

    Logger::info("PlaybackOrchestrator: Successfully auto-selected default device: {}", device->friendly_name);
    return true;
}

} // namespace core
} // namespace dlnacast

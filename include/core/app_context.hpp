#pragma once

#include "core/format_detector.hpp"
#include "core/playback_orchestrator.hpp"
#include "core/stream_format_cache.hpp"
#include "network/device_registry.hpp"
#include "network/http_client.hpp"
#include "network/ssdp_discovery.hpp"
#include "streaming/streamer.hpp"
#include "utils/config_manager.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

namespace dlnacast {
namespace core {

// Replaceable collaborators with external side effects
struct AppServices {
    std::unique_ptr<network::HttpTransport> http;
    std::unique_ptr<network::SsdpDiscovery> discovery;   // must use *http
    std::unique_ptr<FormatProber> prober;
    std::unique_ptr<streaming::StreamerFactory> streamers;
};

/**
 * @brief Owns every long-lived component of the service
 *
 * Built once in main() and handed to the API layer by reference. start()
 * restores the persisted selection, tries the configured default device and
 * launches the background tasks:
 *  - a discovery scan whose devices are pushed through a bounded queue to a
 *    registry updater thread
 *  - pre-detection of the default stream's format
 * shutdown() joins them and stops any streaming session.
 */
class AppContext {
public:
    static constexpr size_t SCAN_QUEUE_CAPACITY = 32;

    explicit AppContext(const Configuration& config);
    AppContext(const Configuration& config, AppServices services);
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    void start(bool backgroundTasks = true);
    void shutdown();

    // Blocks until the startup scan and pre-caching have finished
    void waitForBackgroundTasks();

    void tryAutoSelectDefaultDevice();

    const Configuration& config() const { return config_; }
    network::HttpTransport& http() { return *services_.http; }
    network::SsdpDiscovery& discovery() { return *services_.discovery; }
    network::DeviceRegistry& registry() { return *registry_; }
    StreamFormatCache& formatCache() { return *formatCache_; }
    FormatDetector& detector() { return *detector_; }
    PlaybackOrchestrator& orchestrator() { return *orchestrator_; }

    static AppServices createDefaultServices(const Configuration& config);
    static streaming::StreamerConfig streamerConfigFrom(const Configuration& config);

private:
    void backgroundScan();
    void precacheDefaultStream();

    Configuration config_;
    AppServices services_;
    std::unique_ptr<network::DeviceRegistry> registry_;
    std::unique_ptr<StreamFormatCache> formatCache_;
    std::unique_ptr<FormatDetector> detector_;
    std::unique_ptr<PlaybackOrchestrator> orchestrator_;

    std::mutex threadsMutex_;
    std::thread scanThread_;
    std::thread precacheThread_;
    std::atomic<bool> stopping_{false};
    bool shutDown_ = false;
};

} // namespace core
} // namespace dlnacast

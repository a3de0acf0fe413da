#pragma once

#include "dlnacast_types.hpp"
#include "utils/json_store.hpp"

#include <string>
#include <vector>
#include <mutex>
#include <optional>

namespace dlnacast {
namespace network {

/**
 * @brief Durable record of the selected renderer and the last scan result
 *
 * Backed by one JSON document:
 *
 *     {"current_device": Device|null, "cached_devices": [Device],
 *      "last_scan_time": <unix seconds>|null}
 *
 * Every read reloads the document first so separate worker processes
 * sharing the file observe each other's writes. The in-memory copy is only
 * a snapshot of the last reload.
 */
class DeviceRegistry {
public:
    explicit DeviceRegistry(const std::string& stateFile, WallClock clock = systemWallClock());

    bool select(const Device& device);
    bool clear();

    bool hasDevice();
    std::optional<Device> current();
    std::optional<std::string> currentDeviceId();

    // Replaces the cache wholesale and stamps last_scan_time
    bool updateCache(const std::vector<Device>& devices);

    // Adds a device found mid-scan unless its id is already cached
    bool appendToCache(const Device& device);

    std::vector<Device> cached();

    // Seconds since the last completed scan, nullopt before the first one
    std::optional<double> cacheAgeSeconds();

    // Matches on ip, or on id
    std::optional<Device> findInCache(const std::string& ipOrId);

    const std::string& stateFile() const { return store_.path(); }

private:
    struct Snapshot {
        std::optional<Device> current;
        std::vector<Device> cached;
        std::optional<double> lastScanTime;
    };

    // Caller holds mutex_
    void reload();
    bool persist();

    JsonFileStore store_;
    WallClock clock_;
    std::mutex mutex_;
    Snapshot snapshot_;
};

} // namespace network
} // namespace dlnacast

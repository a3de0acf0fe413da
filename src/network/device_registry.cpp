#include "network/device_registry.hpp"
#include "../utils/logger.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace dlnacast {
namespace network {

DeviceRegistry::DeviceRegistry(const std::string& stateFile, WallClock clock)
    : store_(stateFile)
    , clock_(clock ? std::move(clock) : systemWallClock()) {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    if (snapshot_.current) {
        Logger::info("DeviceRegistry: Restored device {} ({})", snapshot_.current->friendly_name,
                     snapshot_.current->ip);
    }
}

void DeviceRegistry::reload() {
    json doc;
    if (!store_.read(doc) || !doc.is_object()) {
        // Missing or corrupt state starts empty
        snapshot_ = Snapshot();
        return;
    }

    Snapshot fresh;
    try {
        auto current = doc.find("current_device");
        if (current != doc.end() && current->is_object()) {
            fresh.current = current->get<Device>();
        }

        auto cachedDevices = doc.find("cached_devices");
        if (cachedDevices != doc.end() && cachedDevices->is_array()) {
            for (const auto& entry : *cachedDevices) {
                if (entry.is_object()) {
                    fresh.cached.push_back(entry.get<Device>());
                }
            }
        }

        auto lastScan = doc.find("last_scan_time");
        if (lastScan != doc.end() && lastScan->is_number()) {
            fresh.lastScanTime = lastScan->get<double>();
        }
    } catch (const json::exception& e) {
        Logger::warning("DeviceRegistry: Ignoring malformed state in {}: {}", store_.path(), e.what());
        fresh = Snapshot();
    }

    snapshot_ = std::move(fresh);
}

bool DeviceRegistry::persist() {
    json doc = json::object();
    doc["current_device"] = snapshot_.current ? json(*snapshot_.current) : json(nullptr);
    doc["cached_devices"] = snapshot_.cached;
    doc["last_scan_time"] = snapshot_.lastScanTime ? json(*snapshot_.lastScanTime) : json(nullptr);

    if (!store_.write(doc)) {
        Logger::error("DeviceRegistry: Failed to save state to {}", store_.path());
        return false;
    }
    return true;
}

bool DeviceRegistry::select(const Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    snapshot_.current = device;
    Logger::info("DeviceRegistry: Selected device {} ({})", device.friendly_name, device.ip);
    return persist();
}

bool DeviceRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    snapshot_.current.reset();
    Logger::info("DeviceRegistry: Cleared device selection");
    return persist();
}

bool DeviceRegistry::hasDevice() {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    return snapshot_.current.has_value();
}

std::optional<Device> DeviceRegistry::current() {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    return snapshot_.current;
}

std::optional<std::string> DeviceRegistry::currentDeviceId() {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    if (!snapshot_.current) {
        return std::nullopt;
    }
    return snapshot_.current->id;
}

bool DeviceRegistry::updateCache(const std::vector<Device>& devices) {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    snapshot_.cached = devices;
    snapshot_.lastScanTime = clock_();
    Logger::debug("DeviceRegistry: Cached {} devices", devices.size());
    return persist();
}

bool DeviceRegistry::appendToCache(const Device& device) {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    for (const auto& existing : snapshot_.cached) {
        if (existing.id == device.id) {
            return true;
        }
    }
    snapshot_.cached.push_back(device);
    Logger::debug("DeviceRegistry: Added {} to device cache", device.friendly_name);
    return persist();
}

std::vector<Device> DeviceRegistry::cached() {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    return snapshot_.cached;
}

std::optional<double> DeviceRegistry::cacheAgeSeconds() {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    if (!snapshot_.lastScanTime) {
        return std::nullopt;
    }
    return clock_() - *snapshot_.lastScanTime;
}

std::optional<Device> DeviceRegistry::findInCache(const std::string& ipOrId) {
    std::lock_guard<std::mutex> lock(mutex_);
    reload();
    for (const auto& device : snapshot_.cached) {
        if (device.ip == ipOrId || device.id == ipOrId) {
            return device;
        }
    }
    return std::nullopt;
}

} // namespace network
} // namespace dlnacast

#include "dlnacast_types.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace dlnacast {

namespace {

std::string stringOr(const json& j, const char* key, const std::string& fallback = std::string()) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

bool boolOr(const json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

} // namespace

bool Capabilities::operator==(const Capabilities& other) const {
    return supports_mp3 == other.supports_mp3 &&
           supports_aac == other.supports_aac &&
           supports_flac == other.supports_flac &&
           supports_wav == other.supports_wav &&
           supports_ogg == other.supports_ogg &&
           raw_protocol_info == other.raw_protocol_info;
}

bool Device::operator==(const Device& other) const {
    return id == other.id &&
           udn == other.udn &&
           friendly_name == other.friendly_name &&
           manufacturer == other.manufacturer &&
           model_name == other.model_name &&
           ip == other.ip &&
           port == other.port &&
           location == other.location &&
           control_url == other.control_url &&
           connection_manager_url == other.connection_manager_url &&
           capabilities == other.capabilities;
}

void to_json(json& j, const Capabilities& caps) {
    j = json{
        {"supports_mp3", caps.supports_mp3},
        {"supports_aac", caps.supports_aac},
        {"supports_flac", caps.supports_flac},
        {"supports_wav", caps.supports_wav},
        {"supports_ogg", caps.supports_ogg},
        {"raw_protocol_info", caps.raw_protocol_info}
    };
}

void from_json(const json& j, Capabilities& caps) {
    caps.supports_mp3 = boolOr(j, "supports_mp3");
    caps.supports_aac = boolOr(j, "supports_aac");
    caps.supports_flac = boolOr(j, "supports_flac");
    caps.supports_wav = boolOr(j, "supports_wav");
    caps.supports_ogg = boolOr(j, "supports_ogg");
    caps.raw_protocol_info = stringOr(j, "raw_protocol_info");
}

void to_json(json& j, const Device& device) {
    j = json{
        {"id", device.id},
        {"udn", device.udn},
        {"friendly_name", device.friendly_name},
        {"manufacturer", device.manufacturer},
        {"model_name", device.model_name},
        {"ip", device.ip},
        {"port", device.port},
        {"location", device.location},
        {"control_url", device.control_url},
        {"connection_manager_url", device.connection_manager_url}
    };
    if (device.capabilities) {
        j["capabilities"] = *device.capabilities;
    } else {
        j["capabilities"] = nullptr;
    }
}

void from_json(const json& j, Device& device) {
    device.id = stringOr(j, "id");
    device.udn = stringOr(j, "udn");
    device.friendly_name = stringOr(j, "friendly_name", "Unknown");
    device.manufacturer = stringOr(j, "manufacturer", "Unknown");
    device.model_name = stringOr(j, "model_name", "Unknown");
    device.ip = stringOr(j, "ip");
    device.location = stringOr(j, "location");
    device.control_url = stringOr(j, "control_url");
    device.connection_manager_url = stringOr(j, "connection_manager_url");

    device.port = 0;
    auto port = j.find("port");
    if (port != j.end() && port->is_number_integer()) {
        device.port = port->get<uint16_t>();
    }

    device.capabilities.reset();
    auto caps = j.find("capabilities");
    if (caps != j.end() && caps->is_object()) {
        device.capabilities = caps->get<Capabilities>();
    }
}

void to_json(json& j, const TransportInfo& info) {
    j = json{{"state", info.state}, {"status", info.status}};
}

} // namespace dlnacast

#include "network/ssdp_discovery.hpp"
#include "network/url.hpp"
#include "upnp/xml_document.hpp"
#include "../utils/logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <mutex>
#include <thread>

#include <sys/socket.h>
#include <sys/select.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace dlnacast {
namespace network {

namespace {

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

// Absolute URLs are kept; relative paths hang off the description host
std::string controlUrlFor(const std::string& base, std::string path) {
    if (path.compare(0, 7, "http://") == 0 || path.compare(0, 8, "https://") == 0) {
        return path;
    }
    if (path.empty() || path[0] != '/') {
        path = "/" + path;
    }
    return base + path;
}

struct ServiceEntry {
    std::string serviceType;
    std::string controlUrl;
};

std::vector<ServiceEntry> collectServices(const upnp::XmlElement& device) {
    std::vector<const upnp::XmlElement*> services = device.findAll(upnp::xmlns::DEVICE, "service");
    if (services.empty()) {
        services = device.findAll(std::string(), "service");
    }

    std::vector<ServiceEntry> entries;
    for (const upnp::XmlElement* service : services) {
        ServiceEntry entry;
        entry.serviceType = service->childText(upnp::xmlns::DEVICE, "serviceType");
        entry.controlUrl = service->childText(upnp::xmlns::DEVICE, "controlURL");
        entries.push_back(entry);
    }
    return entries;
}

class UdpSocket {
public:
    UdpSocket() : fd_(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP)) {}
    ~UdpSocket() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }
    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    int fd() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

} // namespace

std::optional<Device> DeviceDescriptionParser::parse(const std::string& xml, const std::string& location) {
    std::string error;
    auto document = upnp::XmlDocument::parse(xml, &error);
    if (!document) {
        Logger::warning("SsdpDiscovery: Invalid description XML from {}: {}", location, error);
        return std::nullopt;
    }

    const upnp::XmlElement* root = document->root();
    const upnp::XmlElement* device = root->findQualifiedOrPlain(upnp::xmlns::DEVICE, "device");
    if (device == nullptr) {
        Logger::warning("SsdpDiscovery: Could not find device element in {}", location);
        return std::nullopt;
    }

    auto url = parseUrl(location);
    if (!url) {
        Logger::warning("SsdpDiscovery: Unparseable location {}", location);
        return std::nullopt;
    }

    Device result;
    result.friendly_name = device->childText(upnp::xmlns::DEVICE, "friendlyName");
    result.manufacturer = device->childText(upnp::xmlns::DEVICE, "manufacturer");
    result.model_name = device->childText(upnp::xmlns::DEVICE, "modelName");
    result.udn = device->childText(upnp::xmlns::DEVICE, "UDN");
    result.ip = url->host;
    result.port = url->port;
    result.location = location;

    const std::string hostPart = url->host.find(':') != std::string::npos ? "[" + url->host + "]" : url->host;
    const std::string base = url->scheme + "://" + hostPart + ":" + std::to_string(url->port);
    const std::vector<ServiceEntry> services = collectServices(*device);

    bool hasAvTransport = false;
    for (const auto& service : services) {
        if (service.serviceType.find("AVTransport") == std::string::npos) {
            continue;
        }
        hasAvTransport = true;
        if (!service.controlUrl.empty()) {
            result.control_url = controlUrlFor(base, service.controlUrl);
            break;
        }
    }

    if (!hasAvTransport) {
        Logger::debug("SsdpDiscovery: Skipping device {} - no AVTransport service (likely MediaServer)",
                      result.friendly_name);
        return std::nullopt;
    }
    if (result.control_url.empty()) {
        result.control_url = base + "/AVTransport/ctrl";
    }

    for (const auto& service : services) {
        if (service.serviceType.find("ConnectionManager") != std::string::npos &&
            !service.controlUrl.empty()) {
            result.connection_manager_url = controlUrlFor(base, service.controlUrl);
            break;
        }
    }
    if (result.connection_manager_url.empty()) {
        result.connection_manager_url = base + "/ConnectionManager/ctrl";
    }

    if (result.udn.compare(0, 5, "uuid:") == 0) {
        result.id = result.udn.substr(5);
    } else if (!result.udn.empty()) {
        result.id = result.udn;
    } else {
        result.id = result.ip + ":" + std::to_string(result.port);
    }

    return result;
}

bool LocationCollector::add(const std::string& response) {
    ++responses_;
    auto headers = SsdpDiscovery::parseSsdpResponse(response);
    auto it = headers.find("LOCATION");
    if (it == headers.end() || it->second.empty()) {
        return false;
    }
    if (!seen_.insert(it->second).second) {
        return false;
    }
    locations_.push_back(it->second);
    return true;
}

SsdpDiscovery::SsdpDiscovery(HttpTransport& http, const DiscoveryConfig& config)
    : http_(http)
    , config_(config) {
}

std::string SsdpDiscovery::buildSearchRequest() const {
    return "M-SEARCH * HTTP/1.1\r\n"
           "HOST: " + config_.multicastAddress + ":" + std::to_string(config_.multicastPort) + "\r\n"
           "MAN: \"ssdp:discover\"\r\n"
           "MX: " + std::to_string(config_.mx) + "\r\n"
           "ST: " + config_.searchTarget + "\r\n"
           "\r\n";
}

std::map<std::string, std::string> SsdpDiscovery::parseSsdpResponse(const std::string& response) {
    std::map<std::string, std::string> headers;

    size_t start = response.find("\r\n");
    if (start == std::string::npos) {
        return headers;
    }
    start += 2;

    while (start < response.size()) {
        size_t end = response.find("\r\n", start);
        std::string line = response.substr(start, end == std::string::npos ? std::string::npos : end - start);
        auto colon = line.find(':');
        if (colon != std::string::npos) {
            headers[toUpper(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 2;
    }
    return headers;
}

std::vector<Device> SsdpDiscovery::discover(double timeoutSeconds, const DeviceCallback& callback) {
    Logger::info("SsdpDiscovery: Starting SSDP discovery (timeout: {}s)", timeoutSeconds);

    std::vector<Device> devices;
    try {
        std::vector<std::string> locations = collectLocations(timeoutSeconds);
        if (!locations.empty()) {
            devices = fetchDevices(locations, callback);
        }
    } catch (const std::exception& e) {
        Logger::error("SsdpDiscovery: SSDP discovery failed: {}", e.what());
    }

    Logger::info("SsdpDiscovery: Discovery complete. Found {} device(s)", devices.size());
    return devices;
}

std::vector<std::string> SsdpDiscovery::collectLocations(double timeoutSeconds) {
    LocationCollector collector;

    UdpSocket sock;
    if (!sock.valid()) {
        Logger::error("SsdpDiscovery: Failed to create UDP socket: {}", std::strerror(errno));
        return {};
    }

    int opt = 1;
    setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    setsockopt(sock.fd(), SOL_SOCKET, SO_BROADCAST, &opt, sizeof(opt));

    unsigned char ttl = static_cast<unsigned char>(config_.multicastTtl);
    setsockopt(sock.fd(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    ip_mreq mreq{};
    inet_pton(AF_INET, config_.multicastAddress.c_str(), &mreq.imr_multiaddr);
    mreq.imr_interface.s_addr = htonl(INADDR_ANY);
    if (setsockopt(sock.fd(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) {
        Logger::debug("SsdpDiscovery: Could not join multicast group {}: {}",
                      config_.multicastAddress, std::strerror(errno));
    }

    sockaddr_in local{};
    local.sin_family = AF_INET;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    local.sin_port = htons(config_.multicastPort);
    if (bind(sock.fd(), reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
        // Unicast replies still reach an ephemeral port
        Logger::warning("SsdpDiscovery: Cannot bind port {} ({}), using an ephemeral port",
                        config_.multicastPort, std::strerror(errno));
        local.sin_port = 0;
        if (bind(sock.fd(), reinterpret_cast<sockaddr*>(&local), sizeof(local)) < 0) {
            Logger::error("SsdpDiscovery: Failed to bind UDP socket: {}", std::strerror(errno));
            return {};
        }
    }

    Logger::debug("SsdpDiscovery: Socket bound, joined multicast group {}", config_.multicastAddress);

    sockaddr_in group{};
    group.sin_family = AF_INET;
    group.sin_port = htons(config_.multicastPort);
    inet_pton(AF_INET, config_.multicastAddress.c_str(), &group.sin_addr);

    const std::string request = buildSearchRequest();
    for (int attempt = 0; attempt < 2; ++attempt) {
        ssize_t sent = sendto(sock.fd(), request.data(), request.size(), 0,
                              reinterpret_cast<sockaddr*>(&group), sizeof(group));
        if (sent < 0) {
            Logger::warning("SsdpDiscovery: M-SEARCH send failed: {}", std::strerror(errno));
        } else {
            Logger::debug("SsdpDiscovery: M-SEARCH request sent (attempt {})", attempt + 1);
        }
        if (attempt == 0) {
            std::this_thread::sleep_for(std::chrono::duration<double>(config_.sendGapSeconds));
        }
    }

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                              std::chrono::duration<double>(timeoutSeconds));
    std::vector<char> buffer(65507);

    while (true) {
        auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) {
            break;
        }
        auto micros = std::chrono::duration_cast<std::chrono::microseconds>(remaining).count();

        fd_set readSet;
        FD_ZERO(&readSet);
        FD_SET(sock.fd(), &readSet);
        timeval timeout{};
        timeout.tv_sec = static_cast<time_t>(micros / 1000000);
        timeout.tv_usec = static_cast<suseconds_t>(micros % 1000000);

        int ready = select(sock.fd() + 1, &readSet, nullptr, nullptr, &timeout);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            Logger::debug("SsdpDiscovery: select failed: {}", std::strerror(errno));
            break;
        }
        if (ready == 0) {
            break;
        }

        sockaddr_in from{};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock.fd(), buffer.data(), buffer.size(), 0,
                                    reinterpret_cast<sockaddr*>(&from), &fromLen);
        if (received <= 0) {
            continue;
        }

        std::string response(buffer.data(), static_cast<size_t>(received));
        char fromText[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &from.sin_addr, fromText, sizeof(fromText));
        Logger::debug("SsdpDiscovery: Received response #{} from {}", collector.responseCount() + 1, fromText);

        // Our own M-SEARCH loops back through the group
        if (response.compare(0, 8, "M-SEARCH") == 0 || response.compare(0, 6, "NOTIFY") == 0) {
            continue;
        }

        if (collector.add(response)) {
            Logger::info("SsdpDiscovery: Found device at {}", collector.locations().back());
        }
    }

    Logger::debug("SsdpDiscovery: Discovery timeout reached. Received {} total responses.",
                  collector.responseCount());
    return collector.locations();
}

std::vector<Device> SsdpDiscovery::fetchDevices(const std::vector<std::string>& locations,
                                                const DeviceCallback& callback) {
    struct Completion {
        std::string location;
        std::optional<Device> device;
    };

    struct SharedState {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Completion> completed;
        size_t nextIndex = 0;
        std::atomic<bool> cancelled{false};
    };

    auto state = std::make_shared<SharedState>();
    const size_t workerCount = std::min<size_t>(std::max<uint32_t>(1, config_.maxParallelFetches),
                                                locations.size());

    Logger::debug("SsdpDiscovery: Fetching device info for {} locations on {} workers",
                  locations.size(), workerCount);

    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        workers.emplace_back([this, state, &locations]() {
            while (!state->cancelled.load()) {
                size_t index;
                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (state->nextIndex >= locations.size()) {
                        return;
                    }
                    index = state->nextIndex++;
                }

                Completion completion;
                completion.location = locations[index];
                completion.device = fetchDeviceInfo(locations[index]);

                {
                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->completed.push_back(std::move(completion));
                }
                state->cv.notify_one();
            }
        });
    }

    const auto deadline = std::chrono::steady_clock::now() +
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                              std::chrono::duration<double>(config_.overallFetchTimeoutSeconds));

    std::vector<Device> devices;
    size_t handled = 0;
    while (handled < locations.size()) {
        Completion completion;
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            if (!state->cv.wait_until(lock, deadline, [&state]() { return !state->completed.empty(); })) {
                break;
            }
            completion = std::move(state->completed.front());
            state->completed.pop_front();
        }
        ++handled;

        if (!completion.device) {
            Logger::warning("SsdpDiscovery: Device at {} returned no info (filtered out or failed parsing)",
                            completion.location);
            continue;
        }

        devices.push_back(*completion.device);
        Logger::info("SsdpDiscovery: Discovered device: {}", completion.device->friendly_name);

        if (callback) {
            try {
                callback(*completion.device);
            } catch (const std::exception& e) {
                Logger::error("SsdpDiscovery: Device callback failed: {}", e.what());
            }
        }
    }

    if (handled < locations.size()) {
        Logger::warning("SsdpDiscovery: Timed out waiting for {} device description(s)",
                        locations.size() - handled);
    }

    // In-flight fetches are bounded by their own timeout
    state->cancelled.store(true);
    for (auto& worker : workers) {
        worker.join();
    }

    return devices;
}

std::optional<Device> SsdpDiscovery::fetchDeviceInfo(const std::string& location) {
    try {
        HttpResponse response = http_.get(location, config_.fetchTimeoutSeconds);
        if (response.status != 200) {
            Logger::warning("SsdpDiscovery: Failed to fetch device description from {} (HTTP {})",
                            location, response.status);
            return std::nullopt;
        }
        return DeviceDescriptionParser::parse(response.body, location);
    } catch (const TransportError& e) {
        Logger::error("SsdpDiscovery: Error fetching device info from {}: {}", location, e.what());
        return std::nullopt;
    }
}

const std::vector<std::string>& SsdpDiscovery::directConnectionPaths() {
    static const std::vector<std::string> paths = {
        "/description.xml",
        "/rootDesc.xml",
        "/dmr",
        "/upnpd/description.xml",
        "/AVTransport/ctrl"
    };
    return paths;
}

const std::vector<uint16_t>& SsdpDiscovery::directConnectionPorts() {
    static const std::vector<uint16_t> ports = {8080, 49152, 9197, 49153, 49154, 80};
    return ports;
}

std::optional<Device> SsdpDiscovery::tryDirectConnection(const std::string& host, double timeoutSeconds) {
    Logger::info("SsdpDiscovery: Attempting direct connection to {}", host);

    for (uint16_t port : directConnectionPorts()) {
        for (const auto& path : directConnectionPaths()) {
            const std::string location = "http://" + host + ":" + std::to_string(port) + path;
            try {
                HttpResponse response = http_.get(location, timeoutSeconds);
                if (response.status != 200 ||
                    toLower(response.header("Content-Type")).find("xml") == std::string::npos) {
                    continue;
                }

                Logger::info("SsdpDiscovery: Found device at {}", location);
                auto device = DeviceDescriptionParser::parse(response.body, location);
                if (device) {
                    return device;
                }
            } catch (const TransportError& e) {
                Logger::debug("SsdpDiscovery: Failed to connect to {}: {}", location, e.what());
            }
        }
    }

    Logger::warning("SsdpDiscovery: Could not connect to device at {}", host);
    return std::nullopt;
}

} // namespace network
} // namespace dlnacast

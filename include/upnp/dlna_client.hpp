#pragma once

#include "dlnacast_types.hpp"
#include "network/http_client.hpp"

#include <string>
#include <vector>
#include <utility>
#include <optional>

namespace dlnacast {
namespace upnp {

struct ControlTimeouts {
    double actionSeconds = 10.0;
    // Renderers may probe the new URI before answering
    double setUriSeconds = 15.0;
    double settleDelaySeconds = 0.5;
    double transportRetryDelaySeconds = 0.3;
};

using SoapArguments = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief UPnP AVTransport / ConnectionManager control point for one renderer
 *
 * Every SOAP call reports failure through its return value; transport
 * errors, non-200 answers and unparseable bodies are logged, never thrown.
 */
class DlnaClient {
public:
    DlnaClient(network::HttpTransport& http, const Device& device,
               const ControlTimeouts& timeouts = ControlTimeouts());

    bool setAVTransportURI(const std::string& uri, const std::string& metadata = std::string());
    bool play(const std::string& speed = "1");
    bool pause();
    bool stop();

    // Stops only PLAYING or PAUSED_PLAYBACK; any other state counts as success
    bool stopIfPlaying();

    std::optional<TransportInfo> getTransportInfo(int retries = 2);

    // ConnectionManager Sink list, nullopt when unavailable
    std::optional<std::string> getProtocolInfo();

    Capabilities detectCapabilities();
    bool canPlayFormat(const std::string& mimeType);

    // SetAVTransportURI, settle delay, then Play
    bool playUrl(const std::string& url, const std::string& title = "Radio Stream",
                 const std::string& mimeType = "audio/mpeg", bool useMetadata = true);

    std::string buildDidlMetadata(const std::string& url, const std::string& title,
                                  const std::string& mimeType) const;

    const std::optional<Capabilities>& capabilities() const { return capabilities_; }
    void setCapabilities(const Capabilities& caps) { capabilities_ = caps; }

    const std::string& controlUrl() const { return controlUrl_; }
    const std::string& connectionManagerUrl() const { return connectionManagerUrl_; }

    static std::string buildSoapEnvelope(const std::string& serviceType, const std::string& action,
                                         const SoapArguments& arguments);

private:
    std::optional<std::string> sendSoapRequest(const std::string& action, const SoapArguments& arguments,
                                               double timeoutSeconds);

    network::HttpTransport& http_;
    std::string controlUrl_;
    std::string connectionManagerUrl_;
    std::string instanceId_ = "0";
    ControlTimeouts timeouts_;
    std::optional<Capabilities> capabilities_;
};

} // namespace upnp
} // namespace dlnacast

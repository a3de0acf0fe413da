#include "upnp/dlna_client.hpp"
#include "upnp/didl_metadata.hpp"
#include "upnp/xml_document.hpp"
#include "../utils/logger.hpp"

#include <chrono>
#include <thread>

namespace dlnacast {
namespace upnp {

namespace {

std::string defaultServiceUrl(const Device& device, const char* path) {
    uint16_t port = device.port != 0 ? device.port : 80;
    return "http://" + device.ip + ":" + std::to_string(port) + path;
}

std::string escapeUri(const std::string& uri) {
    std::string out;
    out.reserve(uri.size());
    for (char c : uri) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c; break;
        }
    }
    return out;
}

void sleepSeconds(double seconds) {
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

} // namespace

DlnaClient::DlnaClient(network::HttpTransport& http, const Device& device, const ControlTimeouts& timeouts)
    : http_(http)
    , controlUrl_(device.control_url.empty() ? defaultServiceUrl(device, "/AVTransport/ctrl")
                                             : device.control_url)
    , connectionManagerUrl_(device.connection_manager_url.empty()
                                ? defaultServiceUrl(device, "/ConnectionManager/ctrl")
                                : device.connection_manager_url)
    , timeouts_(timeouts)
    , capabilities_(device.capabilities) {
}

std::string DlnaClient::buildSoapEnvelope(const std::string& serviceType, const std::string& action,
                                          const SoapArguments& arguments) {
    std::string envelope =
        "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
        "<s:Envelope xmlns:s=\"http://schemas.xmlsoap.org/soap/envelope/\" "
        "s:encodingStyle=\"http://schemas.xmlsoap.org/soap/encoding/\">\n"
        "<s:Body>\n"
        "<u:" + action + " xmlns:u=\"" + serviceType + "\">\n";

    for (const auto& argument : arguments) {
        envelope += "<" + argument.first + ">" + argument.second + "</" + argument.first + ">\n";
    }

    envelope +=
        "</u:" + action + ">\n"
        "</s:Body>\n"
        "</s:Envelope>";
    return envelope;
}

std::optional<std::string> DlnaClient::sendSoapRequest(const std::string& action,
                                                       const SoapArguments& arguments,
                                                       double timeoutSeconds) {
    SoapArguments withInstance;
    withInstance.emplace_back("InstanceID", instanceId_);
    withInstance.insert(withInstance.end(), arguments.begin(), arguments.end());

    const std::string envelope = buildSoapEnvelope(xmlns::AV_TRANSPORT, action, withInstance);

    network::HeaderMap headers;
    headers["Content-Type"] = "text/xml; charset=\"utf-8\"";
    headers["SOAPAction"] = std::string("\"") + xmlns::AV_TRANSPORT + "#" + action + "\"";

    try {
        network::HttpResponse response = http_.post(controlUrl_, envelope, headers, timeoutSeconds);
        if (response.status == 200) {
            Logger::debug("DlnaClient: SOAP action {} succeeded", action);
            return response.body;
        }
        Logger::error("DlnaClient: SOAP action {} failed: {} - {}", action, response.status,
                      response.body.substr(0, 200));
    } catch (const network::TransportError& e) {
        Logger::error("DlnaClient: Failed to send SOAP request {}: {}", action, e.what());
    }
    return std::nullopt;
}

bool DlnaClient::setAVTransportURI(const std::string& uri, const std::string& metadata) {
    Logger::info("DlnaClient: Setting AV Transport URI to {}", uri);

    SoapArguments arguments = {
        {"CurrentURI", escapeUri(uri)},
        {"CurrentURIMetaData", metadata.empty() ? std::string() : xmlEscape(metadata)}
    };
    return sendSoapRequest("SetAVTransportURI", arguments, timeouts_.setUriSeconds).has_value();
}

bool DlnaClient::play(const std::string& speed) {
    Logger::info("DlnaClient: Sending Play command");
    return sendSoapRequest("Play", {{"Speed", speed}}, timeouts_.actionSeconds).has_value();
}

bool DlnaClient::pause() {
    Logger::info("DlnaClient: Sending Pause command");
    return sendSoapRequest("Pause", {}, timeouts_.actionSeconds).has_value();
}

bool DlnaClient::stop() {
    Logger::info("DlnaClient: Sending Stop command");
    return sendSoapRequest("Stop", {}, timeouts_.actionSeconds).has_value();
}

bool DlnaClient::stopIfPlaying() {
    auto info = getTransportInfo();
    if (!info) {
        Logger::debug("DlnaClient: Could not get transport info, skipping Stop command");
        return true;
    }

    // TRANSITIONING is left alone; some renderers reject Stop mid-transition
    if (info->state == "PLAYING" || info->state == "PAUSED_PLAYBACK") {
        Logger::info("DlnaClient: Device is {}, sending Stop command", info->state);
        return stop();
    }

    Logger::debug("DlnaClient: Device is {}, skipping Stop command", info->state);
    return true;
}

std::optional<TransportInfo> DlnaClient::getTransportInfo(int retries) {
    std::string lastError;

    for (int attempt = 0; attempt <= retries; ++attempt) {
        if (attempt > 0) {
            Logger::debug("DlnaClient: GetTransportInfo attempt {} failed ({}), retrying...", attempt, lastError);
            sleepSeconds(timeouts_.transportRetryDelaySeconds);
        }

        auto response = sendSoapRequest("GetTransportInfo", {}, timeouts_.actionSeconds);
        if (!response || response->empty()) {
            lastError = "No response from device";
            continue;
        }

        std::string parseError;
        auto document = XmlDocument::parse(*response, &parseError);
        if (!document) {
            lastError = "Parse error: " + parseError;
            continue;
        }

        TransportInfo info;
        const XmlElement* root = document->root();
        if (const XmlElement* state = root->findFirstAnyNs("CurrentTransportState")) {
            info.state = state->trimmedText();
        }
        if (const XmlElement* status = root->findFirstAnyNs("CurrentTransportStatus")) {
            info.status = status->trimmedText();
        }

        if (attempt > 0) {
            Logger::debug("DlnaClient: GetTransportInfo succeeded on attempt {}", attempt + 1);
        }
        return info;
    }

    Logger::debug("DlnaClient: GetTransportInfo failed after {} attempts: {}", retries + 1, lastError);
    return std::nullopt;
}

std::optional<std::string> DlnaClient::getProtocolInfo() {
    Logger::debug("DlnaClient: Getting protocol info from {}", connectionManagerUrl_);

    const std::string envelope = buildSoapEnvelope(xmlns::CONNECTION_MANAGER, "GetProtocolInfo", {});

    network::HeaderMap headers;
    headers["Content-Type"] = "text/xml; charset=\"utf-8\"";
    headers["SOAPAction"] = std::string("\"") + xmlns::CONNECTION_MANAGER + "#GetProtocolInfo\"";

    try {
        network::HttpResponse response =
            http_.post(connectionManagerUrl_, envelope, headers, timeouts_.actionSeconds);
        if (response.status != 200) {
            Logger::warning("DlnaClient: GetProtocolInfo failed: {} - {}", response.status,
                            response.body.substr(0, 200));
            return std::nullopt;
        }

        std::string parseError;
        auto document = XmlDocument::parse(response.body, &parseError);
        if (!document) {
            Logger::warning("DlnaClient: Invalid GetProtocolInfo response: {}", parseError);
            return std::nullopt;
        }

        const XmlElement* sink = document->root()->findFirstAnyNs("Sink");
        if (sink == nullptr || sink->trimmedText().empty()) {
            Logger::warning("DlnaClient: Could not find Sink element in GetProtocolInfo response");
            return std::nullopt;
        }

        std::string text = sink->trimmedText();
        Logger::debug("DlnaClient: Device supports protocols: {}...", text.substr(0, 200));
        return text;
    } catch (const network::TransportError& e) {
        Logger::warning("DlnaClient: Failed to get protocol info: {}", e.what());
        return std::nullopt;
    }
}

Capabilities DlnaClient::detectCapabilities() {
    auto protocolInfo = getProtocolInfo();

    Capabilities caps;
    if (protocolInfo) {
        caps = parseSinkProtocolInfo(*protocolInfo);
    } else {
        caps.raw_protocol_info = Capabilities::UNKNOWN_PROTOCOL_INFO;
    }

    capabilities_ = caps;
    Logger::info("DlnaClient: Device capabilities: MP3={}, AAC={}, FLAC={}, WAV={}, OGG={}",
                 caps.supports_mp3, caps.supports_aac, caps.supports_flac,
                 caps.supports_wav, caps.supports_ogg);
    return caps;
}

bool DlnaClient::canPlayFormat(const std::string& mimeType) {
    if (!capabilities_) {
        detectCapabilities();
    }
    if (!capabilities_ || !capabilities_->isKnown()) {
        return false;
    }
    return supportsFamily(*capabilities_, formatFamilyFor(mimeType));
}

std::string DlnaClient::buildDidlMetadata(const std::string& url, const std::string& title,
                                          const std::string& mimeType) const {
    return DidlMetadataBuilder::build(url, title, mimeType, capabilities_);
}

bool DlnaClient::playUrl(const std::string& url, const std::string& title,
                         const std::string& mimeType, bool useMetadata) {
    bool uriSet = false;
    if (useMetadata) {
        uriSet = setAVTransportURI(url, buildDidlMetadata(url, title, mimeType));
        if (!uriSet) {
            Logger::warning("DlnaClient: Device rejected metadata, retrying SetAVTransportURI without it");
        }
    }
    if (!uriSet) {
        uriSet = setAVTransportURI(url);
    }
    if (!uriSet) {
        return false;
    }

    // Renderers need time to prepare the new URI before accepting Play
    sleepSeconds(timeouts_.settleDelaySeconds);

    return play();
}

} // namespace upnp
} // namespace dlnacast

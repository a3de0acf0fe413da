#include "upnp/didl_metadata.hpp"
#include "upnp/xml_document.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace dlnacast {
namespace upnp {

namespace {

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

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::vector<std::string> splitSink(const std::string& sink) {
    std::vector<std::string> entries;
    std::stringstream stream(sink);
    std::string entry;
    while (std::getline(stream, entry, ',')) {
        entry = trim(entry);
        if (!entry.empty()) {
            entries.push_back(entry);
        }
    }
    return entries;
}

// protocol:network:contentFormat:additionalInfo
bool splitProtocolInfo(const std::string& entry, std::string fields[4]) {
    size_t start = 0;
    for (int i = 0; i < 3; ++i) {
        size_t colon = entry.find(':', start);
        if (colon == std::string::npos) {
            return false;
        }
        fields[i] = entry.substr(start, colon - start);
        start = colon + 1;
    }
    fields[3] = entry.substr(start);
    return true;
}

} // namespace

FormatFamily formatFamilyFor(const std::string& mimeType) {
    const std::string mime = toLower(mimeType);

    if (contains(mime, "mpeg") || contains(mime, "mp3")) {
        return FormatFamily::MP3;
    }
    if (contains(mime, "aac") || contains(mime, "mp4") || contains(mime, "adts") || contains(mime, "m4a")) {
        return FormatFamily::AAC;
    }
    if (contains(mime, "flac")) {
        return FormatFamily::FLAC;
    }
    if (contains(mime, "wav")) {
        return FormatFamily::WAV;
    }
    if (contains(mime, "ogg")) {
        return FormatFamily::OGG;
    }
    return FormatFamily::UNKNOWN;
}

bool supportsFamily(const Capabilities& caps, FormatFamily family) {
    switch (family) {
        case FormatFamily::MP3: return caps.supports_mp3;
        case FormatFamily::AAC: return caps.supports_aac;
        case FormatFamily::FLAC: return caps.supports_flac;
        case FormatFamily::WAV: return caps.supports_wav;
        case FormatFamily::OGG: return caps.supports_ogg;
        case FormatFamily::UNKNOWN: return false;
    }
    return false;
}

const std::vector<std::string>& mimeAliases(FormatFamily family) {
    static const std::vector<std::string> mp3 = {"audio/mpeg", "audio/mp3"};
    // audio/mp4 is the common DLNA declaration for AAC
    static const std::vector<std::string> aac = {"audio/mp4", "audio/aac", "audio/x-aac"};
    static const std::vector<std::string> flac = {"audio/flac", "audio/x-flac"};
    static const std::vector<std::string> wav = {"audio/wav", "audio/x-wav"};
    static const std::vector<std::string> ogg = {"audio/ogg", "audio/x-ogg"};
    static const std::vector<std::string> none;

    switch (family) {
        case FormatFamily::MP3: return mp3;
        case FormatFamily::AAC: return aac;
        case FormatFamily::FLAC: return flac;
        case FormatFamily::WAV: return wav;
        case FormatFamily::OGG: return ogg;
        case FormatFamily::UNKNOWN: return none;
    }
    return none;
}

Capabilities parseSinkProtocolInfo(const std::string& sink) {
    Capabilities caps;
    caps.raw_protocol_info = sink;

    for (const auto& entry : splitSink(sink)) {
        const std::string proto = toLower(entry);
        if (contains(proto, "audio/mpeg") || contains(proto, "audio/mp3")) {
            caps.supports_mp3 = true;
        }
        if (contains(proto, "audio/aac") || contains(proto, "audio/x-aac") || contains(proto, "audio/mp4")) {
            caps.supports_aac = true;
        }
        if (contains(proto, "audio/flac") || contains(proto, "audio/x-flac")) {
            caps.supports_flac = true;
        }
        if (contains(proto, "audio/wav") || contains(proto, "audio/x-wav")) {
            caps.supports_wav = true;
        }
        if (contains(proto, "audio/ogg") || contains(proto, "audio/x-ogg")) {
            caps.supports_ogg = true;
        }
    }
    return caps;
}

std::optional<std::string> DidlMetadataBuilder::findDeclaredProtocolInfo(const std::string& sink,
                                                                         const std::string& mimeType) {
    if (sink.empty() || sink == Capabilities::UNKNOWN_PROTOCOL_INFO) {
        return std::nullopt;
    }

    std::vector<std::string> candidates = mimeAliases(formatFamilyFor(mimeType));
    const std::string requested = toLower(mimeType);
    if (std::find(candidates.begin(), candidates.end(), requested) == candidates.end()) {
        candidates.push_back(requested);
    }

    const std::vector<std::string> entries = splitSink(sink);
    for (const auto& alias : candidates) {
        for (const auto& entry : entries) {
            std::string fields[4];
            if (!splitProtocolInfo(entry, fields)) {
                continue;
            }
            if (toLower(fields[0]) == "http-get" && toLower(trim(fields[2])) == alias) {
                return entry;
            }
        }
    }
    return std::nullopt;
}

std::string DidlMetadataBuilder::dlnaProfileFor(const std::string& mimeType) {
    switch (formatFamilyFor(mimeType)) {
        case FormatFamily::AAC: return "AAC_ISO";
        case FormatFamily::FLAC: return "FLAC";
        default: return "MP3";
    }
}

std::string DidlMetadataBuilder::synthesizeProtocolInfo(const std::string& mimeType) {
    return "http-get:*:" + mimeType + ":DLNA.ORG_PN=" + dlnaProfileFor(mimeType) + ";" +
           DLNA_STREAMING_FLAGS;
}

std::string DidlMetadataBuilder::build(const std::string& url, const std::string& title,
                                       const std::string& mimeType,
                                       const std::optional<Capabilities>& caps) {
    std::string protocolInfo;
    if (caps) {
        if (auto declared = findDeclaredProtocolInfo(caps->raw_protocol_info, mimeType)) {
            protocolInfo = *declared;
        }
    }
    if (protocolInfo.empty()) {
        protocolInfo = synthesizeProtocolInfo(mimeType);
    }

    std::ostringstream didl;
    didl << "<DIDL-Lite "
         << "xmlns:dc=\"http://purl.org/dc/elements/1.1/\" "
         << "xmlns=\"urn:schemas-upnp-org:metadata-1-0/DIDL-Lite/\" "
         << "xmlns:upnp=\"urn:schemas-upnp-org:metadata-1-0/upnp/\" "
         << "xmlns:dlna=\"urn:schemas-dlna-org:metadata-1-0/\">"
         << "<item id=\"0\" parentID=\"-1\" restricted=\"1\">"
         << "<dc:title>" << xmlEscape(title) << "</dc:title>"
         << "<upnp:class>object.item.audioItem.audioBroadcast</upnp:class>"
         << "<res protocolInfo=\"" << xmlEscape(protocolInfo) << "\">" << xmlEscape(url) << "</res>"
         << "</item>"
         << "</DIDL-Lite>";
    return didl.str();
}

} // namespace upnp
} // namespace dlnacast

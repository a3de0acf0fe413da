#pragma once

#include "dlnacast_types.hpp"

#include <string>
#include <vector>
#include <optional>

namespace dlnacast {
namespace upnp {

enum class FormatFamily {
    MP3,
    AAC,
    FLAC,
    WAV,
    OGG,
    UNKNOWN
};

// Maps any MIME type onto a capability bucket by substring family matching
FormatFamily formatFamilyFor(const std::string& mimeType);

bool supportsFamily(const Capabilities& caps, FormatFamily family);

// MIME spellings tried against a Sink list, in preference order
const std::vector<std::string>& mimeAliases(FormatFamily family);

// Builds the five capability flags from a ConnectionManager Sink string
Capabilities parseSinkProtocolInfo(const std::string& sink);

/**
 * @brief DIDL-Lite item builder for SetAVTransportURI
 *
 * protocolInfo comes from the device's own Sink list when it declares an
 * http-get entry for one of the MIME aliases, otherwise it is synthesized
 * with a DLNA profile and fixed streaming flags.
 */
class DidlMetadataBuilder {
public:
    static constexpr const char* DLNA_STREAMING_FLAGS =
        "DLNA.ORG_OP=01;DLNA.ORG_CI=0;DLNA.ORG_FLAGS=01700000000000000000000000000000";

    static std::optional<std::string> findDeclaredProtocolInfo(const std::string& sink,
                                                               const std::string& mimeType);

    static std::string dlnaProfileFor(const std::string& mimeType);
    static std::string synthesizeProtocolInfo(const std::string& mimeType);

    static std::string build(const std::string& url, const std::string& title,
                             const std::string& mimeType,
                             const std::optional<Capabilities>& caps);
};

} // namespace upnp
} // namespace dlnacast

#pragma once

#include "network/http_client.hpp"
#include "core/stream_format_cache.hpp"

#include <string>
#include <vector>
#include <optional>

namespace dlnacast {
namespace core {

// External media inspector used when the source does not announce a Content-Type
class FormatProber {
public:
    virtual ~FormatProber() = default;

    // MIME type of the first audio stream, nullopt when it cannot be determined
    virtual std::optional<std::string> probeMimeType(const std::string& url) = 0;
};

/**
 * @brief FormatProber backed by an ffprobe subprocess
 *
 * Analysis is bounded to 2 s / 1 MB of input and the whole run to the
 * configured timeout. Only the codecs in the codec table are recognised.
 */
class FfprobeProber : public FormatProber {
public:
    explicit FfprobeProber(const std::string& binary = "ffprobe", double timeoutSeconds = 20.0);

    std::optional<std::string> probeMimeType(const std::string& url) override;

    std::vector<std::string> buildCommand(const std::string& url) const;

    // Picks the first audio stream from ffprobe's JSON output
    static std::optional<std::string> parseProbeOutput(const std::string& output);
    static std::optional<std::string> mimeTypeForCodec(const std::string& codecName);

private:
    std::string binary_;
    double timeoutSeconds_;
};

/**
 * @brief Resolves a stream's MIME type
 *
 * Order: format cache, HEAD request (redirects followed, Content-Type
 * parameters stripped), then the prober. Successful results are cached
 * with the method that produced them ("head" or "ffprobe").
 */
class FormatDetector {
public:
    static constexpr size_t MAX_MIME_LENGTH = 100;

    FormatDetector(network::HttpTransport& http, StreamFormatCache& cache, FormatProber& prober,
                   double headTimeoutSeconds = 5.0);

    std::optional<std::string> detect(const std::string& url);

    // "audio/mpeg; charset=x" -> "audio/mpeg", bounded to MAX_MIME_LENGTH
    static std::string sanitizeContentType(const std::string& contentType);

private:
    std::optional<std::string> detectViaHead(const std::string& url);

    network::HttpTransport& http_;
    StreamFormatCache& cache_;
    FormatProber& prober_;
    double headTimeoutSeconds_;
};

} // namespace core
} // namespace dlnacast

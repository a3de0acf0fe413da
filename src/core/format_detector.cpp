#include "core/format_detector.hpp"
#include "../utils/logger.hpp"
#include "../utils/subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <map>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace dlnacast {
namespace core {

namespace {

std::string trim(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

// FfprobeProber implementation

FfprobeProber::FfprobeProber(const std::string& binary, double timeoutSeconds)
    : binary_(binary)
    , timeoutSeconds_(timeoutSeconds) {
}

std::vector<std::string> FfprobeProber::buildCommand(const std::string& url) const {
    return {
        binary_,
        "-v", "quiet",
        "-print_format", "json",
        "-show_format",
        "-show_streams",
        "-analyzeduration", "2000000",
        "-probesize", "1000000",
        url
    };
}

std::optional<std::string> FfprobeProber::mimeTypeForCodec(const std::string& codecName) {
    static const std::map<std::string, std::string> codecToMime = {
        {"aac", "audio/aac"},
        {"mp3", "audio/mpeg"},
        {"flac", "audio/flac"},
        {"vorbis", "audio/ogg"},
        {"opus", "audio/ogg"},
        {"pcm_s16le", "audio/wav"},
        {"pcm_s24le", "audio/wav"}
    };

    auto it = codecToMime.find(toLower(codecName));
    if (it == codecToMime.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> FfprobeProber::parseProbeOutput(const std::string& output) {
    json data = json::parse(output, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        Logger::warning("FfprobeProber: Unparseable ffprobe output");
        return std::nullopt;
    }

    auto streams = data.find("streams");
    if (streams == data.end() || !streams->is_array() || streams->empty()) {
        Logger::warning("FfprobeProber: ffprobe found no streams");
        return std::nullopt;
    }

    for (const auto& stream : *streams) {
        if (!stream.is_object() || stream.value("codec_type", std::string()) != "audio") {
            continue;
        }

        std::string codec = toLower(stream.value("codec_name", std::string()));
        Logger::info("FfprobeProber: ffprobe detected codec: {}", codec);

        auto mime = mimeTypeForCodec(codec);
        if (mime) {
            Logger::info("FfprobeProber: Mapped codec '{}' to MIME type: {}", codec, *mime);
        } else {
            Logger::warning("FfprobeProber: Unknown codec '{}', cannot map to MIME type", codec);
        }
        return mime;
    }

    Logger::warning("FfprobeProber: ffprobe found no audio streams");
    return std::nullopt;
}

std::optional<std::string> FfprobeProber::probeMimeType(const std::string& url) {
    Logger::info("FfprobeProber: Attempting format detection with ffprobe");

    auto result = Subprocess::run(buildCommand(url), timeoutSeconds_);
    if (!result) {
        Logger::warning("FfprobeProber: ffprobe did not complete");
        return std::nullopt;
    }
    if (result->exitCode != 0) {
        Logger::warning("FfprobeProber: ffprobe failed with exit code {}", result->exitCode);
        return std::nullopt;
    }
    return parseProbeOutput(result->standardOutput);
}

// FormatDetector implementation

FormatDetector::FormatDetector(network::HttpTransport& http, StreamFormatCache& cache, FormatProber& prober,
                               double headTimeoutSeconds)
    : http_(http)
    , cache_(cache)
    , prober_(prober)
    , headTimeoutSeconds_(headTimeoutSeconds) {
}

std::string FormatDetector::sanitizeContentType(const std::string& contentType) {
    std::string mime = trim(contentType.substr(0, contentType.find(';')));
    if (mime.size() > MAX_MIME_LENGTH) {
        mime.resize(MAX_MIME_LENGTH);
    }
    return mime;
}

std::optional<std::string> FormatDetector::detectViaHead(const std::string& url) {
    try {
        Logger::info("FormatDetector: Detecting stream format for: {}", url);
        network::HttpResponse response = http_.head(url, headTimeoutSeconds_, true);

        if (response.redirectCount > 0) {
            Logger::info("FormatDetector: Stream redirected {} time(s), final URL: {}",
                         response.redirectCount, response.effectiveUrl);
        }

        std::string mime = sanitizeContentType(response.header("Content-Type"));
        if (mime.empty()) {
            Logger::warning("FormatDetector: Stream did not return Content-Type header in HEAD response");
            return std::nullopt;
        }

        Logger::info("FormatDetector: Detected stream Content-Type via HEAD: {}", mime);
        return mime;
    } catch (const network::TransportError& e) {
        Logger::warning("FormatDetector: HEAD request failed: {}", e.what());
        return std::nullopt;
    }
}

std::optional<std::string> FormatDetector::detect(const std::string& url) {
    if (auto cached = cache_.get(url)) {
        Logger::debug("FormatDetector: Using cached format {} ({})", cached->mime_type, cached->detection_method);
        return cached->mime_type;
    }

    if (auto mime = detectViaHead(url)) {
        cache_.set(url, *mime, "head");
        return mime;
    }

    Logger::info("FormatDetector: Falling back to ffprobe for format detection");
    auto mime = prober_.probeMimeType(url);
    if (mime) {
        cache_.set(url, *mime, "ffprobe");
    }
    return mime;
}

} // namespace core
} // namespace dlnacast

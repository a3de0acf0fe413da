#include "../test_helpers.hpp"

#include "core/format_detector.hpp"

#include <algorithm>

using namespace dlnacast;
using namespace dlnacast::core;
using namespace dlnacast::testing;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StrictMock;
using ::testing::Throw;

namespace {

std::string writeScript(const TempDir& dir, const std::string& name, const std::string& body) {
    dir.write(name, "#!/bin/sh\n" + body);
    std::filesystem::permissions(dir.file(name), std::filesystem::perms::owner_all);
    return dir.file(name);
}

const char* AAC_PROBE_OUTPUT = R"({
  "streams": [
    {"index": 0, "codec_type": "video", "codec_name": "mjpeg"},
    {"index": 1, "codec_type": "audio", "codec_name": "AAC", "sample_rate": "44100"}
  ],
  "format": {"format_name": "aac"}
})";

} // namespace

class FormatDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cache = std::make_unique<StreamFormatCache>(dir.path(), 3600.0, clock.function());
        detector = std::make_unique<FormatDetector>(http, *cache, prober, 5.0);
    }

    TempDir dir;
    ManualClock clock;
    NiceMock<MockHttpTransport> http;
    StrictMock<MockFormatProber> prober;
    std::unique_ptr<StreamFormatCache> cache;
    std::unique_ptr<FormatDetector> detector;
};

TEST_F(FormatDetectorTest, SanitizesContentType) {
    EXPECT_EQ(FormatDetector::sanitizeContentType("audio/mpeg; charset=utf-8"), "audio/mpeg");
    EXPECT_EQ(FormatDetector::sanitizeContentType("  audio/aacp  "), "audio/aacp");
    EXPECT_EQ(FormatDetector::sanitizeContentType(""), "");
    EXPECT_EQ(FormatDetector::sanitizeContentType(std::string(300, 'x')).size(), FormatDetector::MAX_MIME_LENGTH);
}

TEST_F(FormatDetectorTest, UsesHeadContentTypeAndCachesIt) {
    network::HttpResponse response = httpResponse(200, "", "audio/aac;codecs=mp4a");
    response.redirectCount = 1;
    response.effectiveUrl = "http://edge.example.com/live";
    EXPECT_CALL(http, head("http://radio.example.com/live", 5.0, true)).WillOnce(Return(response));

    EXPECT_EQ(detector->detect("http://radio.example.com/live").value_or(""), "audio/aac");

    auto entry = cache->get("http://radio.example.com/live");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->detection_method, "head");
}

TEST_F(FormatDetectorTest, CacheHitSkipsNetwork) {
    cache->set("http://radio.example.com/live", "audio/flac", "ffprobe");
    EXPECT_CALL(http, head(_, _, _)).Times(0);

    EXPECT_EQ(detector->detect("http://radio.example.com/live").value_or(""), "audio/flac");
}

TEST_F(FormatDetectorTest, FallsBackToProberWithoutContentType) {
    EXPECT_CALL(http, head(_, _, _)).WillOnce(Return(httpResponse(200)));
    EXPECT_CALL(prober, probeMimeType("http://radio.example.com/raw")).WillOnce(Return(std::string("audio/ogg")));

    EXPECT_EQ(detector->detect("http://radio.example.com/raw").value_or(""), "audio/ogg");
    EXPECT_EQ(cache->get("http://radio.example.com/raw")->detection_method, "ffprobe");
}

TEST_F(FormatDetectorTest, FallsBackToProberOnTransportError) {
    EXPECT_CALL(http, head(_, _, _)).WillOnce(Throw(network::TransportError("timed out")));
    EXPECT_CALL(prober, probeMimeType(_)).WillOnce(Return(std::nullopt));

    EXPECT_FALSE(detector->detect("http://radio.example.com/dead").has_value());
    // Failures are not cached
    EXPECT_FALSE(cache->get("http://radio.example.com/dead").has_value());
}

TEST(FfprobeProberTest, MapsKnownCodecs) {
    EXPECT_EQ(FfprobeProber::mimeTypeForCodec("aac").value_or(""), "audio/aac");
    EXPECT_EQ(FfprobeProber::mimeTypeForCodec("mp3").value_or(""), "audio/mpeg");
    EXPECT_EQ(FfprobeProber::mimeTypeForCodec("flac").value_or(""), "audio/flac");
    EXPECT_EQ(FfprobeProber::mimeTypeForCodec("vorbis").value_or(""), "audio/ogg");
    EXPECT_EQ(FfprobeProber::mimeTypeForCodec("opus").value_or(""), "audio/ogg");
    EXPECT_EQ(FfprobeProber::mimeTypeForCodec("pcm_s16le").value_or(""), "audio/wav");
    EXPECT_EQ(FfprobeProber::mimeTypeForCodec("pcm_s24le").value_or(""), "audio/wav");
    EXPECT_FALSE(FfprobeProber::mimeTypeForCodec("alac").has_value());
}

TEST(FfprobeProberTest, PicksFirstAudioStream) {
    EXPECT_EQ(FfprobeProber::parseProbeOutput(AAC_PROBE_OUTPUT).value_or(""), "audio/aac");
}

TEST(FfprobeProberTest, RejectsUnusableOutput) {
    EXPECT_FALSE(FfprobeProber::parseProbeOutput("").has_value());
    EXPECT_FALSE(FfprobeProber::parseProbeOutput("{\"streams\": []}").has_value());
    EXPECT_FALSE(FfprobeProber::parseProbeOutput(
        "{\"streams\": [{\"codec_type\": \"video\", \"codec_name\": \"h264\"}]}").has_value());
    EXPECT_FALSE(FfprobeProber::parseProbeOutput(
        "{\"streams\": [{\"codec_type\": \"audio\", \"codec_name\": \"wmav2\"}]}").has_value());
}

TEST(FfprobeProberTest, CommandBoundsAnalysis) {
    FfprobeProber prober("/opt/ffmpeg/bin/ffprobe");
    auto command = prober.buildCommand("http://radio.example.com/live");
    ASSERT_FALSE(command.empty());
    EXPECT_EQ(command.front(), "/opt/ffmpeg/bin/ffprobe");
    EXPECT_EQ(command.back(), "http://radio.example.com/live");
    EXPECT_THAT(command, ::testing::Contains("-show_streams"));

    auto analyze = std::find(command.begin(), command.end(), "-analyzeduration");
    ASSERT_NE(analyze, command.end());
    EXPECT_EQ(*(analyze + 1), "2000000");
    auto probesize = std::find(command.begin(), command.end(), "-probesize");
    ASSERT_NE(probesize, command.end());
    EXPECT_EQ(*(probesize + 1), "1000000");
}

TEST(FfprobeProberTest, RunsExternalBinary) {
    TempDir dir;
    dir.write("probe.json", AAC_PROBE_OUTPUT);
    const std::string script = writeScript(dir, "fake-ffprobe", "cat '" + dir.file("probe.json") + "'\n");

    FfprobeProber prober(script, 5.0);
    EXPECT_EQ(prober.probeMimeType("http://radio.example.com/live").value_or(""), "audio/aac");
}

TEST(FfprobeProberTest, NonZeroExitYieldsNothing) {
    TempDir dir;
    const std::string script = writeScript(dir, "failing-ffprobe", "echo '{}'\nexit 1\n");

    FfprobeProber prober(script, 5.0);
    EXPECT_FALSE(prober.probeMimeType("http://radio.example.com/live").has_value());
}

TEST(FfprobeProberTest, TimeoutKillsProbe) {
    TempDir dir;
    const std::string script = writeScript(dir, "slow-ffprobe", "exec sleep 30\n");

    FfprobeProber prober(script, 0.5);
    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(prober.probeMimeType("http://radio.example.com/live").has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST(FfprobeProberTest, MissingBinaryYieldsNothing) {
    FfprobeProber prober("/nonexistent/ffprobe", 2.0);
    EXPECT_FALSE(prober.probeMimeType("http://radio.example.com/live").has_value());
}

#pragma once

#include "../test_helpers.hpp"

#include "core/format_detector.hpp"
#include "core/playback_orchestrator.hpp"
#include "core/stream_format_cache.hpp"
#include "network/device_registry.hpp"

#include <memory>

namespace dlnacast {
namespace testing {

/**
 * @brief Real orchestrator wired to mocked HTTP, prober and streamers
 *
 * The renderer answers every SOAP action with 200 and reports STOPPED,
 * HEAD requests report audio/mpeg. Tests override single actions.
 */
class PlaybackFixture : public ::testing::Test {
protected:
    PlaybackFixture()
        : registry(dir.file("device_state.json"), clock.function())
        , formatCache(dir.path(), 86400.0, clock.function())
        , discovery(http)
        , detector(http, formatCache, prober, 1.0) {
        timeouts.settleDelaySeconds = 0.0;
        timeouts.transportRetryDelaySeconds = 0.0;

        using ::testing::_;
        using ::testing::Return;

        ON_CALL(http, get(_, _, _)).WillByDefault(Return(httpResponse(404)));
        ON_CALL(http, head(_, _, _)).WillByDefault(Return(httpResponse(200, "", "audio/mpeg")));
        ON_CALL(http, post(_, _, _, _)).WillByDefault(Return(httpResponse(200, "<ok/>")));
        ON_CALL(http, post(_, _, SoapAction("GetTransportInfo"), _))
            .WillByDefault(Return(httpResponse(200, transportInfoResponse("STOPPED"))));
        ON_CALL(http, post(_, _, SoapAction("GetProtocolInfo"), _))
            .WillByDefault(Return(httpResponse(200, protocolInfoResponse(
                "http-get:*:audio/mpeg:*,http-get:*:audio/flac:*"))));
    }

    core::PlaybackOrchestrator& orchestrator(const core::PlaybackSettings& settings = core::PlaybackSettings()) {
        if (!orchestrator_) {
            orchestrator_ = std::make_unique<core::PlaybackOrchestrator>(
                http, registry, discovery, detector, streamers, settings, timeouts);
            orchestrator_->setLocalAddressResolver([]() { return std::string("192.168.1.5"); });
        }
        return *orchestrator_;
    }

    static Device capableDevice(const std::string& ip = "192.168.1.20") {
        Device device = makeDevice(ip);
        Capabilities caps;
        caps.supports_mp3 = true;
        caps.supports_flac = true;
        caps.raw_protocol_info = "http-get:*:audio/mpeg:*,http-get:*:audio/flac:*";
        device.capabilities = caps;
        return device;
    }

    MockStreamer* preparePassthrough(const std::string& url) {
        using ::testing::_;
        using ::testing::Return;
        MockStreamer* streamer = streamers.prepare();
        ON_CALL(*streamer, isRunning()).WillByDefault(Return(true));
        ON_CALL(*streamer, getStreamUrl(_)).WillByDefault(Return(url));
        return streamer;
    }

    MockStreamer* prepareTranscoder(bool ready = true) {
        using ::testing::_;
        using ::testing::Invoke;
        using ::testing::Return;
        MockStreamer* streamer = streamers.prepare();
        ON_CALL(*streamer, isRunning()).WillByDefault(Return(true));
        ON_CALL(*streamer, isTranscoding()).WillByDefault(Return(true));
        ON_CALL(*streamer, waitUntilReady(_)).WillByDefault(Return(ready));
        ON_CALL(*streamer, getStreamUrl(_)).WillByDefault(Invoke([](const std::string& host) {
            return "http://" + host + ":8080/stream.mp3";
        }));
        return streamer;
    }

    TempDir dir;
    ManualClock clock;
    ::testing::NiceMock<MockHttpTransport> http;
    ::testing::NiceMock<MockFormatProber> prober;
    MockStreamerFactory streamers;
    network::DeviceRegistry registry;
    core::StreamFormatCache formatCache;
    FakeSsdpDiscovery discovery;
    core::FormatDetector detector;
    upnp::ControlTimeouts timeouts;

private:
    std::unique_ptr<core::PlaybackOrchestrator> orchestrator_;
};

} // namespace testing
} // namespace dlnacast

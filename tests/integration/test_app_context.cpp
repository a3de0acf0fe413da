#include "../test_helpers.hpp"

#include "core/app_context.hpp"

using namespace dlnacast;
using namespace dlnacast::testing;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class AppContextTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.storage.dataDir = dir.path();
        config.timeouts.deviceDiscovery = 1.0;

        auto httpMock = std::make_unique<NiceMock<MockHttpTransport>>();
        http = httpMock.get();
        ON_CALL(*http, get(_, _, _)).WillByDefault(Return(httpResponse(404)));
        ON_CALL(*http, get(LOCATION, _, _))
            .WillByDefault(Return(httpResponse(200, rendererDescription("Hall", "uuid:hall"), "text/xml")));
        ON_CALL(*http, head(_, _, _)).WillByDefault(Return(httpResponse(200, "", "audio/aac")));
        ON_CALL(*http, post(_, _, _, _)).WillByDefault(Return(httpResponse(200, "<ok/>")));
        ON_CALL(*http, post(_, _, SoapAction("GetProtocolInfo"), _))
            .WillByDefault(Return(httpResponse(200, protocolInfoResponse("http-get:*:audio/mpeg:*"))));

        auto discoveryFake = std::make_unique<FakeSsdpDiscovery>(*http);
        discovery = discoveryFake.get();
        discovery->locations = {LOCATION};

        services.http = std::move(httpMock);
        services.discovery = std::move(discoveryFake);
        services.prober = std::make_unique<NiceMock<MockFormatProber>>();
        services.streamers = std::make_unique<MockStreamerFactory>();
    }

    static constexpr const char* LOCATION = "http://192.168.1.60:49152/description.xml";

    TempDir dir;
    Configuration config;
    core::AppServices services;
    NiceMock<MockHttpTransport>* http = nullptr;
    FakeSsdpDiscovery* discovery = nullptr;
};

TEST_F(AppContextTest, BackgroundScanFillsCache) {
    core::AppContext context(config, std::move(services));
    context.start(true);
    context.waitForBackgroundTasks();

    EXPECT_EQ(discovery->searches.load(), 1);
    auto cached = context.registry().cached();
    ASSERT_EQ(cached.size(), 1u);
    EXPECT_EQ(cached[0].friendly_name, "Hall");
    EXPECT_FALSE(context.registry().hasDevice());

    context.shutdown();
}

TEST_F(AppContextTest, DefaultStreamFormatIsPrecached) {
    config.defaultRadioUrl = "http://radio.example.com/aac";

    core::AppContext context(config, std::move(services));
    context.start(true);
    context.waitForBackgroundTasks();

    auto entry = context.formatCache().get("http://radio.example.com/aac");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->mime_type, "audio/aac");
    EXPECT_EQ(entry->detection_method, "head");
}

TEST_F(AppContextTest, DefaultDeviceIsSelectedOnStart) {
    config.defaultDeviceIp = "192.168.1.60";

    core::AppContext context(config, std::move(services));
    context.start(false);

    auto current = context.registry().current();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->ip, "192.168.1.60");
    ASSERT_TRUE(current->capabilities.has_value());
    EXPECT_TRUE(current->capabilities->supports_mp3);
    EXPECT_EQ(discovery->searches.load(), 0);
}

TEST_F(AppContextTest, SelectionSurvivesRestart) {
    config.defaultDeviceIp = "192.168.1.60";
    {
        core::AppContext context(config, std::move(services));
        context.start(false);
        ASSERT_TRUE(context.registry().hasDevice());
    }

    Configuration plain = config;
    plain.defaultDeviceIp.clear();
    core::AppServices fresh;
    fresh.http = std::make_unique<NiceMock<MockHttpTransport>>();
    fresh.discovery = std::make_unique<FakeSsdpDiscovery>(*fresh.http);
    fresh.prober = std::make_unique<NiceMock<MockFormatProber>>();
    fresh.streamers = std::make_unique<MockStreamerFactory>();

    core::AppContext restarted(plain, std::move(fresh));
    restarted.start(false);
    auto current = restarted.registry().current();
    ASSERT_TRUE(current.has_value());
    EXPECT_EQ(current->friendly_name, "Hall");
}

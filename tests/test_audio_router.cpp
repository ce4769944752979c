#include "errors.hpp"
#include "playback/audio_router.hpp"
#include "support/manual_scheduler.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace jukebox;
using namespace jukebox::testing;

TEST(ActiveStreamsTest, ParsesServiceListing) {
    const std::string body = R"({
        "activeStreams": 2,
        "streams": [
            {"instanceId": "neko-0", "sinkName": "neko-0_sink", "duration": "12.5s",
             "bytesTransmitted": 409600, "active": true},
            {"instanceId": "neko-1", "sinkName": "neko-1_sink", "duration": "0.1s",
             "bytesTransmitted": 0, "active": false}
        ]
    })";

    auto streams = parse_active_streams(body);
    ASSERT_EQ(streams.size(), 2u);
    EXPECT_EQ(streams[0].instance_id, "neko-0");
    EXPECT_EQ(streams[0].bytes_transmitted, 409600u);
    EXPECT_TRUE(streams[0].active);
    EXPECT_EQ(streams[1].instance_id, "neko-1");
    EXPECT_FALSE(streams[1].active);
}

TEST(ActiveStreamsTest, SkipsEntriesWithoutInstance) {
    auto streams = parse_active_streams(R"({"streams": [{"active": true}, {"instanceId": "neko-2"}]})");
    ASSERT_EQ(streams.size(), 1u);
    EXPECT_EQ(streams[0].instance_id, "neko-2");
    EXPECT_FALSE(streams[0].active);
}

TEST(ActiveStreamsTest, EmptyWhenNothingIsCapturing) {
    EXPECT_TRUE(parse_active_streams(R"({"activeStreams": 0, "streams": []})").empty());
    EXPECT_TRUE(parse_active_streams(R"({"activeStreams": 0})").empty());
}

TEST(ActiveStreamsTest, RejectsMalformedBody) {
    EXPECT_THROW(parse_active_streams("<html>502 Bad Gateway</html>"), StreamError);
    EXPECT_THROW(parse_active_streams("[]"), StreamError);
}

TEST(AudioRouterTest, CaptureUrlTrimsTrailingSlashAndEncodesId) {
    ManualScheduler scheduler;
    AudioRouterConfig config;
    config.service_url = "http://audio:3000/";
    AudioRouter router(config, scheduler, [](Task task) { task(); });

    EXPECT_EQ(router.capture_url("neko-0"), "http://audio:3000/capture/neko-0");
    EXPECT_EQ(router.capture_url("neko 1"), "http://audio:3000/capture/neko%201");
}

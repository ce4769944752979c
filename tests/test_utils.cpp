#include "errors.hpp"
#include "modules/notifications.hpp"
#include "utils/common.hpp"
#include "utils/event_channel.hpp"
#include "utils/string_utils.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace jukebox;

TEST(StringUtilsTest, ShellQuote) {
    EXPECT_EQ(string_utils::shell_quote("plain"), "'plain'");
    EXPECT_EQ(string_utils::shell_quote("it's"), "'it'\\''s'");
}

TEST(StringUtilsTest, JoinAndTrim) {
    EXPECT_EQ(string_utils::join({"a", "b", "c"}, "; "), "a; b; c");
    EXPECT_EQ(string_utils::join({}, ", "), "");
    EXPECT_EQ(string_utils::trim("  padded \t\n"), "padded");
}

TEST(ErrorsTest, ClassifiesBotDetection) {
    EXPECT_TRUE(is_bot_detection_message("ERROR: Sign in to confirm you're not a bot"));
    EXPECT_TRUE(is_bot_detection_message("HTTP Error 429: Too Many Requests"));
    EXPECT_TRUE(is_bot_detection_message("This video is age-restricted"));
    EXPECT_FALSE(is_bot_detection_message("HTTP Error 404: Not Found"));
    EXPECT_FALSE(is_bot_detection_message("Video unavailable"));
}

TEST(ErrorsTest, ErrorMessage) {
    EXPECT_EQ(error_message(nullptr), "");
    EXPECT_EQ(error_message(std::make_exception_ptr(NoHealthyRelayError())),
              "No healthy relay instances available");
}

TEST(CommonTest, FormatsTrackDuration) {
    EXPECT_EQ(format_track_duration(0), "live");
    EXPECT_EQ(format_track_duration(7), "0:07");
    EXPECT_EQ(format_track_duration(187), "3:07");
    EXPECT_EQ(format_track_duration(3723), "1:02:03");
}

TEST(NotificationsTest, WebhookPayloadCarriesEmbed) {
    auto payload = nlohmann::json::parse(
        WebhookNotifier::build_payload({"Relay Authentication Required", "neko-0 needs a login"}));

    EXPECT_EQ(payload["content"], "**Relay Authentication Required**\nneko-0 needs a login");
    ASSERT_EQ(payload["embeds"].size(), 1u);
    EXPECT_EQ(payload["embeds"][0]["title"], "Relay Authentication Required");
    EXPECT_EQ(payload["embeds"][0]["description"], "neko-0 needs a login");
}

TEST(NotificationsTest, EmptyWebhookSendsNothing) {
    int scheduled = 0;
    WebhookNotifier notifier("", [&](Task) { ++scheduled; });
    notifier.notify({"title", "description"});
    EXPECT_EQ(scheduled, 0);
}

TEST(EventChannelTest, HandlersMayUnsubscribeDuringEmit) {
    EventChannel<int> channel;
    std::vector<int> seen;
    Subscription second;
    Subscription first = channel.subscribe([&](const int& value) {
        seen.push_back(value);
        second.reset();
    });
    second = channel.subscribe([&](const int& value) { seen.push_back(value * 10); });

    channel.emit(1);
    channel.emit(2);
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
    EXPECT_EQ(channel.subscriber_count(), 1u);
    EXPECT_FALSE(second.active());

    first.reset();
    EXPECT_FALSE(first.active());
    EXPECT_EQ(channel.subscriber_count(), 0u);
}

#include "errors.hpp"
#include "relay/protocol.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace jukebox;
using json = nlohmann::json;

TEST(ProtocolTest, DecodesSystemInit) {
    auto message = protocol::decode(R"({
        "event": "system/init",
        "session_id": "abc",
        "control_host": "xyz",
        "screen_size": {"width": 1920, "height": 1080, "rate": 30},
        "members": [{"id": "abc", "name": "admin"}, {"id": "xyz", "name": "viewer"}]
    })");

    auto* init = std::get_if<protocol::SystemInit>(&message);
    ASSERT_NE(init, nullptr);
    EXPECT_EQ(init->session_id, "abc");
    ASSERT_TRUE(init->control_host.has_value());
    EXPECT_EQ(*init->control_host, "xyz");
    EXPECT_EQ(init->screen_size.width, 1920);
    EXPECT_EQ(init->screen_size.height, 1080);
    ASSERT_EQ(init->members.size(), 2u);
    EXPECT_EQ(init->members[1].name, "viewer");
}

TEST(ProtocolTest, InitWithoutControlHost) {
    auto message = protocol::decode(R"({"event": "system/init", "session_id": "abc"})");
    auto* init = std::get_if<protocol::SystemInit>(&message);
    ASSERT_NE(init, nullptr);
    EXPECT_FALSE(init->control_host.has_value());
    EXPECT_EQ(init->screen_size.width, 0);
    EXPECT_TRUE(init->members.empty());
}

TEST(ProtocolTest, DecodesControlAndSystemEvents) {
    auto locked = protocol::decode(R"({"event": "control/locked", "id": "abc"})");
    ASSERT_TRUE(std::holds_alternative<protocol::ControlLocked>(locked));
    EXPECT_EQ(std::get<protocol::ControlLocked>(locked).id, "abc");

    auto release = protocol::decode(R"({"event": "control/release", "id": "abc"})");
    EXPECT_TRUE(std::holds_alternative<protocol::ControlRelease>(release));

    auto kicked = protocol::decode(R"({"event": "system/disconnect", "message": "kicked by admin"})");
    ASSERT_TRUE(std::holds_alternative<protocol::SystemDisconnect>(kicked));
    EXPECT_EQ(std::get<protocol::SystemDisconnect>(kicked).message, "kicked by admin");

    auto resolution = protocol::decode(R"({"event": "screen/resolution", "width": 1280, "height": 720, "rate": 60})");
    ASSERT_TRUE(std::holds_alternative<protocol::ScreenResolution>(resolution));
    EXPECT_EQ(std::get<protocol::ScreenResolution>(resolution).size.rate, 60);
}

TEST(ProtocolTest, UnknownEventsAreKept) {
    auto message = protocol::decode(R"({"event": "signal/provide", "sdp": "..."})");
    ASSERT_TRUE(std::holds_alternative<protocol::Unknown>(message));
    EXPECT_EQ(protocol::event_name(message), "signal/provide");
}

TEST(ProtocolTest, RejectsMalformedMessages) {
    EXPECT_THROW(protocol::decode("not json"), RelayProtocolError);
    EXPECT_THROW(protocol::decode(R"({"session_id": "abc"})"), RelayProtocolError);
    EXPECT_THROW(protocol::decode(R"({"event": 42})"), RelayProtocolError);
    EXPECT_THROW(protocol::decode("[1, 2, 3]"), RelayProtocolError);
}

TEST(ProtocolTest, EncodesInputEvents) {
    auto down = json::parse(protocol::encode_mouse_button(true, 640, 360, protocol::mouse::Left));
    EXPECT_EQ(down["event"], "mousedown");
    EXPECT_EQ(down["x"], 640);
    EXPECT_EQ(down["y"], 360);
    EXPECT_EQ(down["button"], 0);

    auto up = json::parse(protocol::encode_mouse_button(false, 1, 2, protocol::mouse::Left));
    EXPECT_EQ(up["event"], "mouseup");

    auto key = json::parse(protocol::encode_key(true, protocol::keysym::Return));
    EXPECT_EQ(key["event"], "keydown");
    EXPECT_EQ(key["keysym"], 0xFF0D);

    EXPECT_EQ(json::parse(protocol::encode_control_request())["event"], "control/request");
    EXPECT_EQ(json::parse(protocol::encode_control_release())["event"], "control/release");
    EXPECT_EQ(json::parse(protocol::encode_heartbeat())["event"], "client/heartbeat");
}

TEST(ProtocolTest, TextToKeysyms) {
    EXPECT_EQ(protocol::text_to_keysyms("ab:/"), (std::vector<uint32_t>{0x61, 0x62, 0x3A, 0x2F}));

    // Latin-1 maps directly, everything else into the Unicode keysym range
    EXPECT_EQ(protocol::text_to_keysyms("\xC3\xA9"), (std::vector<uint32_t>{0xE9}));
    EXPECT_EQ(protocol::text_to_keysyms("\xE2\x82\xAC"), (std::vector<uint32_t>{0x010020AC}));

    // Truncated trailing sequence is dropped
    EXPECT_EQ(protocol::text_to_keysyms("a\xE2\x82"), (std::vector<uint32_t>{0x61}));
    EXPECT_TRUE(protocol::text_to_keysyms("").empty());
}

#include "errors.hpp"
#include "relay/relay_instance.hpp"
#include "support/fake_relay.hpp"
#include "support/manual_scheduler.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace jukebox;
using namespace jukebox::testing;
using json = nlohmann::json;

namespace {

class RelayInstanceTest : public ::testing::Test {
protected:
    ManualScheduler scheduler;
    FakeRelayServer server{scheduler};
    RelayConfig config;

    std::unique_ptr<RelayInstance> make(const std::string& id) {
        return std::make_unique<RelayInstance>(id, config, scheduler, server.factory());
    }

    std::unique_ptr<RelayInstance> connected(const std::string& id) {
        auto instance = make(id);
        instance->initialize();
        scheduler.run_pending();
        return instance;
    }

    std::vector<json> received_of(const std::string& event) const {
        std::vector<json> out;
        for (const auto& text : server.received) {
            auto payload = json::parse(text);
            if (payload.value("event", "") == event) out.push_back(payload);
        }
        return out;
    }
};

template <typename Event>
size_t count_events(const std::vector<RelayEvent>& events) {
    return static_cast<size_t>(std::count_if(events.begin(), events.end(), [](const RelayEvent& event) {
        return std::holds_alternative<Event>(event);
    }));
}

} // namespace

// ==================== Connection ====================

TEST(RelayWsUrlTest, DerivesFromHttpBase) {
    RelayConfig config;
    config.url = "http://neko:8080/";
    EXPECT_EQ(relay_ws_url(config), "ws://neko:8080/ws?username=admin&password=neko");

    config.url = "https://relay.example.com";
    config.username = "bot user";
    config.password = "p@ss";
    EXPECT_EQ(relay_ws_url(config), "wss://relay.example.com/ws?username=bot%20user&password=p%40ss");
}

TEST_F(RelayInstanceTest, ConnectsAndAuthenticates) {
    auto instance = make("neko-0");
    std::vector<RelayEvent> events;
    auto sub = instance->subscribe([&](const RelayEvent& event) { events.push_back(event); });

    instance->initialize();
    EXPECT_EQ(instance->ws_state(), WsState::Connecting);
    scheduler.run_pending();

    EXPECT_EQ(instance->ws_state(), WsState::Ready);
    EXPECT_TRUE(instance->is_authenticated());
    ASSERT_TRUE(instance->session_id().has_value());
    EXPECT_EQ(*instance->session_id(), "session-1");
    EXPECT_FALSE(instance->has_control());
    EXPECT_EQ(count_events<RelayConnected>(events), 1u);
    EXPECT_EQ(count_events<RelayAuthenticated>(events), 1u);

    auto* transport = server.connection_for("session-1");
    ASSERT_NE(transport, nullptr);
    EXPECT_EQ(transport->url(), "ws://neko:8080/ws?username=admin&password=neko");
}

TEST_F(RelayInstanceTest, SendsHeartbeatsOnceAuthenticated) {
    auto instance = connected("neko-0");
    EXPECT_TRUE(received_of("client/heartbeat").empty());

    scheduler.advance(Duration(10000));
    EXPECT_EQ(received_of("client/heartbeat").size(), 1u);
}

TEST_F(RelayInstanceTest, AuthenticationTimesOut) {
    server.send_init = false;
    auto instance = connected("neko-0");
    EXPECT_EQ(instance->ws_state(), WsState::Ready);
    EXPECT_FALSE(instance->is_authenticated());

    scheduler.advance(Duration(4999));
    EXPECT_EQ(instance->ws_state(), WsState::Ready);

    scheduler.advance(Duration(1));
    EXPECT_EQ(instance->ws_state(), WsState::Disconnected);
    EXPECT_TRUE(instance->reconnect_pending());
    EXPECT_EQ(instance->reconnect_attempts(), 1);
    EXPECT_EQ(server.open_connections(), 0u);
}

// ==================== Reconnect ====================

TEST_F(RelayInstanceTest, BackoffIsLinearAndCapped) {
    auto instance = make("neko-0");
    EXPECT_EQ(instance->backoff_delay(1), Duration(5000));
    EXPECT_EQ(instance->backoff_delay(2), Duration(10000));
    EXPECT_EQ(instance->backoff_delay(3), Duration(15000));
    EXPECT_EQ(instance->backoff_delay(4), Duration(20000));
    EXPECT_EQ(instance->backoff_delay(5), Duration(25000));
    EXPECT_EQ(instance->backoff_delay(6), Duration(30000));
    EXPECT_EQ(instance->backoff_delay(10), Duration(30000));
}

TEST_F(RelayInstanceTest, ReconnectGivesUpAfterFiveAttempts) {
    server.accept_connections = false;
    auto instance = connected("neko-0");
    EXPECT_EQ(server.open_attempts, 1);
    EXPECT_EQ(instance->reconnect_attempts(), 1);

    for (int attempt = 1; attempt <= 5; ++attempt) {
        Duration delay = instance->backoff_delay(attempt);
        scheduler.advance(delay - Duration(1));
        EXPECT_EQ(server.open_attempts, attempt) << "attempt " << attempt;

        scheduler.advance(Duration(1));
        EXPECT_EQ(server.open_attempts, attempt + 1) << "attempt " << attempt;
        if (attempt < 5) {
            EXPECT_EQ(instance->reconnect_attempts(), attempt + 1);
            EXPECT_TRUE(instance->reconnect_pending());
        }
    }

    EXPECT_EQ(instance->reconnect_attempts(), 5);
    EXPECT_FALSE(instance->reconnect_pending());

    scheduler.advance(Duration(600000));
    EXPECT_EQ(server.open_attempts, 6);
    EXPECT_EQ(instance->ws_state(), WsState::Disconnected);
}

TEST_F(RelayInstanceTest, DroppedConnectionReconnects) {
    auto instance = connected("neko-0");
    server.drop("session-1");
    scheduler.run_pending();

    EXPECT_FALSE(instance->is_authenticated());
    EXPECT_TRUE(instance->reconnect_pending());

    scheduler.advance(Duration(5000));
    EXPECT_TRUE(instance->is_authenticated());
    EXPECT_EQ(*instance->session_id(), "session-2");
    EXPECT_EQ(instance->reconnect_attempts(), 0);
}

TEST_F(RelayInstanceTest, KickIsTerminalUntilRestart) {
    auto instance = connected("neko-0");
    std::vector<RelayEvent> events;
    auto sub = instance->subscribe([&](const RelayEvent& event) { events.push_back(event); });

    server.kick("session-1", "Kicked by admin");
    scheduler.run_pending();

    EXPECT_TRUE(instance->is_kicked());
    EXPECT_FALSE(instance->is_authenticated());
    EXPECT_FALSE(instance->reconnect_pending());
    ASSERT_EQ(count_events<RelayKicked>(events), 1u);

    scheduler.advance(Duration(120000));
    EXPECT_EQ(server.open_attempts, 1);

    std::exception_ptr restart_error;
    bool restarted = false;
    instance->restart([&](std::exception_ptr error) {
        restart_error = error;
        restarted = true;
    });
    EXPECT_FALSE(instance->is_kicked());

    scheduler.advance(Duration(1000));
    EXPECT_TRUE(restarted);
    EXPECT_FALSE(restart_error);
    EXPECT_TRUE(instance->is_authenticated());
    EXPECT_EQ(server.open_attempts, 2);
}

// ==================== Control ====================

TEST_F(RelayInstanceTest, ControlIsMutuallyExclusive) {
    auto first = connected("neko-0");
    auto second = connected("neko-1");

    std::exception_ptr first_error = std::make_exception_ptr(std::runtime_error("pending"));
    first->request_control([&](std::exception_ptr error) { first_error = error; });
    scheduler.run_pending();

    EXPECT_FALSE(first_error);
    EXPECT_TRUE(first->has_control());
    EXPECT_FALSE(second->has_control());
    ASSERT_TRUE(second->control_host().has_value());
    EXPECT_EQ(*second->control_host(), *first->session_id());

    bool second_done = false;
    std::exception_ptr second_error;
    second->request_control([&](std::exception_ptr error) {
        second_done = true;
        second_error = error;
    });
    scheduler.advance(Duration(4999));
    EXPECT_FALSE(second_done);
    EXPECT_TRUE(first->has_control());

    scheduler.advance(Duration(1));
    ASSERT_TRUE(second_done);
    EXPECT_THROW(std::rethrow_exception(second_error), RelayProtocolTimeout);
    EXPECT_FALSE(second->has_control());

    first->release_control();
    scheduler.run_pending();
    EXPECT_FALSE(first->has_control());

    second_error = nullptr;
    second->request_control([&](std::exception_ptr error) { second_error = error; });
    scheduler.run_pending();
    EXPECT_FALSE(second_error);
    EXPECT_TRUE(second->has_control());
    EXPECT_FALSE(first->has_control());
}

TEST_F(RelayInstanceTest, ControlRequiresConnection) {
    auto instance = make("neko-0");
    std::exception_ptr error;
    instance->request_control([&](std::exception_ptr e) { error = e; });
    ASSERT_TRUE(error);
    EXPECT_THROW(std::rethrow_exception(error), ConnectionLostError);
}

TEST_F(RelayInstanceTest, MouseMoveTakesControlFirst) {
    auto instance = connected("neko-0");
    bool done = false;
    std::exception_ptr move_error;
    instance->send_mouse_move(120, 340, [&](std::exception_ptr error) {
        done = true;
        move_error = error;
    });
    scheduler.run_pending();

    ASSERT_TRUE(done);
    EXPECT_FALSE(move_error);
    EXPECT_TRUE(instance->has_control());
    auto moves = received_of("mousemove");
    ASSERT_EQ(moves.size(), 1u);
    EXPECT_EQ(moves[0]["x"], 120);
    EXPECT_EQ(moves[0]["y"], 340);
}

TEST_F(RelayInstanceTest, PauseTogglesWithSpace) {
    auto instance = connected("neko-0");
    std::exception_ptr pause_error = std::make_exception_ptr(std::runtime_error("pending"));
    instance->pause([&](std::exception_ptr error) { pause_error = error; });
    scheduler.run_pending();

    EXPECT_FALSE(pause_error);
    auto downs = received_of("keydown");
    auto ups = received_of("keyup");
    ASSERT_EQ(downs.size(), 1u);
    ASSERT_EQ(ups.size(), 1u);
    EXPECT_EQ(downs[0]["keysym"].get<uint32_t>(), protocol::keysym::Space);
    EXPECT_EQ(ups[0]["keysym"].get<uint32_t>(), protocol::keysym::Space);
}

TEST_F(RelayInstanceTest, SeekClicksProgressBarAtFraction) {
    auto instance = connected("neko-0");
    std::exception_ptr seek_error = std::make_exception_ptr(std::runtime_error("pending"));
    instance->seek_to(30, 120, [&](std::exception_ptr error) { seek_error = error; });
    scheduler.advance(Duration(1000));

    EXPECT_FALSE(seek_error);
    EXPECT_TRUE(instance->has_control());
    auto presses = received_of("mousedown");
    ASSERT_EQ(presses.size(), 1u);
    // 200..1080 at y 650 on 1280x720, scaled to 1920x1080
    EXPECT_EQ(presses[0]["x"], 630);
    EXPECT_EQ(presses[0]["y"], 975);
    EXPECT_EQ(received_of("mouseup").size(), 1u);
}

TEST_F(RelayInstanceTest, SeekWithoutDurationGoesToStart) {
    auto instance = connected("neko-0");
    std::exception_ptr seek_error = std::make_exception_ptr(std::runtime_error("pending"));
    instance->seek_to(45, 0, [&](std::exception_ptr error) { seek_error = error; });
    scheduler.advance(Duration(1000));

    EXPECT_FALSE(seek_error);
    auto presses = received_of("mousedown");
    ASSERT_EQ(presses.size(), 1u);
    EXPECT_EQ(presses[0]["x"], 300);
}

TEST_F(RelayInstanceTest, SeekRequiresConnection) {
    auto instance = make("neko-0");
    std::exception_ptr seek_error;
    instance->seek_to(10, 100, [&](std::exception_ptr error) { seek_error = error; });
    scheduler.run_pending();

    ASSERT_TRUE(seek_error);
    EXPECT_TRUE(received_of("mousedown").empty());
}

// ==================== Health ====================

TEST_F(RelayInstanceTest, HealthCheckAnswersFromPing) {
    auto instance = connected("neko-0");
    std::optional<bool> healthy;
    instance->health_check([&](bool result) { healthy = result; });
    scheduler.run_pending();
    ASSERT_TRUE(healthy.has_value());
    EXPECT_TRUE(*healthy);
}

TEST_F(RelayInstanceTest, HealthCheckTimesOut) {
    server.answer_pings = false;
    auto instance = connected("neko-0");

    std::optional<bool> healthy;
    instance->health_check([&](bool result) { healthy = result; });
    scheduler.advance(Duration(2999));
    EXPECT_FALSE(healthy.has_value());

    scheduler.advance(Duration(1));
    ASSERT_TRUE(healthy.has_value());
    EXPECT_FALSE(*healthy);
}

TEST_F(RelayInstanceTest, HealthCheckFailsWhenDisconnected) {
    auto instance = make("neko-0");
    std::optional<bool> healthy;
    instance->health_check([&](bool result) { healthy = result; });
    ASSERT_TRUE(healthy.has_value());
    EXPECT_FALSE(*healthy);
}

// ==================== Input ====================

TEST_F(RelayInstanceTest, PlayVideoNavigatesThenClicksPlayer) {
    auto instance = connected("neko-0");
    TimePoint started = scheduler.now();

    bool done = false;
    std::exception_ptr play_error;
    instance->play_video("https://youtu.be/x", [&](std::exception_ptr error) {
        done = true;
        play_error = error;
    });
    scheduler.advance(Duration(60000));

    ASSERT_TRUE(done);
    EXPECT_FALSE(play_error);
    EXPECT_EQ(instance->last_used(), started);

    auto presses = received_of("mousedown");
    ASSERT_EQ(presses.size(), 2u);
    EXPECT_EQ(presses[0]["x"], config.address_bar_x);
    EXPECT_EQ(presses[0]["y"], config.address_bar_y);
    // Centre of the 1920x1080 screen reported at init
    EXPECT_EQ(presses[1]["x"], 960);
    EXPECT_EQ(presses[1]["y"], 540);
    EXPECT_EQ(received_of("mouseup").size(), 2u);

    std::vector<uint32_t> typed;
    for (const auto& key : received_of("keydown")) {
        typed.push_back(key["keysym"].get<uint32_t>());
    }
    auto url_keysyms = protocol::text_to_keysyms("https://youtu.be/x");
    auto found = std::search(typed.begin(), typed.end(), url_keysyms.begin(), url_keysyms.end());
    EXPECT_NE(found, typed.end());
    ASSERT_FALSE(typed.empty());
    EXPECT_EQ(typed.front(), protocol::keysym::Control_L);
    EXPECT_EQ(typed.back(), protocol::keysym::Return);
}

TEST_F(RelayInstanceTest, DropDuringPlaybackFailsTheOperation) {
    auto instance = connected("neko-0");

    bool done = false;
    std::exception_ptr play_error;
    instance->play_video("https://youtu.be/x", [&](std::exception_ptr error) {
        done = true;
        play_error = error;
    });
    scheduler.advance(Duration(500));
    EXPECT_FALSE(done);

    server.drop("session-1");
    scheduler.run_pending();

    ASSERT_TRUE(done);
    EXPECT_THROW(std::rethrow_exception(play_error), ConnectionLostError);
}

#pragma once

#include "relay/protocol.hpp"
#include "relay/relay_transport.hpp"
#include "utils/event_channel.hpp"
#include "utils/scheduler.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jukebox {

struct RelayConfig {
    std::string url = "http://neko:8080";
    std::string username = "admin";
    std::string password = "neko";

    Duration connect_timeout{10000};
    Duration auth_timeout{5000};
    Duration control_timeout{5000};
    Duration health_check_timeout{3000};
    Duration heartbeat_interval{10000};
    Duration ping_interval{30000};

    Duration reconnect_base_delay{5000};
    Duration reconnect_max_delay{30000};
    int max_reconnect_attempts = 5;
    Duration restart_delay{1000};

    // Input choreography; remote rendering is slow
    Duration page_settle_delay{5000};
    Duration input_step_delay{100};
    Duration key_delay{10};
    Duration click_release_delay{50};
    int address_bar_x = 400;
    int address_bar_y = 50;
    // Player progress bar, in the same reference layout
    int progress_bar_start_x = 200;
    int progress_bar_end_x = 1080;
    int progress_bar_y = 650;
    int screen_width = 1280;
    int screen_height = 720;
};

// ws://host/ws?username=..&password=.. derived from the http(s) base URL
std::string relay_ws_url(const RelayConfig& config);

struct Cookie {
    std::string name;
    std::string value;
    std::string domain;
    std::string path;
    std::optional<int64_t> expires;
    bool http_only = false;
    bool secure = false;
    std::optional<std::string> same_site;

    bool operator==(const Cookie& other) const;
};

void to_json(nlohmann::json& j, const Cookie& cookie);
void from_json(const nlohmann::json& j, Cookie& cookie);

enum class WsState {
    Disconnected,
    Connecting,
    Ready
};

const char* to_string(WsState state);

struct RelayConnected {};
struct RelayAuthenticated {
    std::string session_id;
};
struct RelayClosed {
    std::string reason;
};
struct RelayKicked {
    std::string message;
};
struct RelayControlChanged {
    bool has_control = false;
    std::optional<std::string> control_host;
};

using RelayEvent = std::variant<RelayConnected, RelayAuthenticated, RelayClosed, RelayKicked, RelayControlChanged>;

// One remote browser session driven over the relay WebSocket protocol.
// All methods must be called on the scheduler thread.
class RelayInstance {
public:
    using Completion = std::function<void(std::exception_ptr)>;

    RelayInstance(std::string id, RelayConfig config, Scheduler& scheduler, TransportFactory transport_factory);
    ~RelayInstance();

    RelayInstance(const RelayInstance&) = delete;
    RelayInstance& operator=(const RelayInstance&) = delete;

    const std::string& id() const { return id_; }
    WsState ws_state() const { return ws_state_; }
    bool is_authenticated() const { return authenticated_; }
    bool has_control() const { return has_control_; }
    bool is_kicked() const { return kicked_; }
    const std::optional<std::string>& current_video() const { return current_video_; }
    TimePoint last_used() const { return last_used_; }
    const std::optional<std::string>& session_id() const { return session_id_; }
    const std::optional<std::string>& control_host() const { return control_host_; }
    int reconnect_attempts() const { return reconnect_attempts_; }
    bool reconnect_pending() const { return timers_.is_armed("reconnect"); }

    // Connect, falling back to the reconnect schedule on failure
    void initialize();
    void connect(Completion done);

    void request_control(Completion done);
    void release_control();

    void send_mouse_move(int x, int y, Completion done);
    void send_mouse_click(int x, int y, int button, Completion done);
    void send_key(uint32_t keysym, bool pressed, Completion done);
    void send_text(const std::string& text, Completion done);
    void navigate(const std::string& url, Completion done);
    void play_video(const std::string& url, Completion done);
    // Space toggles playback
    void pause(Completion done);
    void resume(Completion done);
    // Clicks the progress bar at seconds / duration; an unknown duration
    // seeks to the start
    void seek_to(double seconds, double duration_seconds, Completion done);

    void health_check(std::function<void(bool)> done);
    void restart(Completion done);
    void shutdown();

    std::vector<Cookie> get_auth_cookies() const { return cookies_; }
    void restore_session(std::vector<Cookie> cookies);

    // Pool bookkeeping
    void assign_video(const std::string& video_id);
    void release_video();

    Duration backoff_delay(int attempt) const;

    Subscription subscribe(std::function<void(const RelayEvent&)> handler) {
        return events_.subscribe(std::move(handler));
    }

private:
    using Step = std::function<void(Completion)>;

    std::string id_;
    RelayConfig config_;
    Scheduler& scheduler_;
    TransportFactory transport_factory_;
    TimerRegistry timers_;
    EventChannel<RelayEvent> events_;

    std::unique_ptr<RelayTransport> transport_;
    uint64_t generation_ = 0;
    WsState ws_state_ = WsState::Disconnected;
    bool authenticated_ = false;
    bool has_control_ = false;
    bool kicked_ = false;
    std::optional<std::string> current_video_;
    TimePoint last_used_{};
    std::optional<std::string> session_id_;
    std::optional<std::string> control_host_;
    int reconnect_attempts_ = 0;
    bool stopped_ = false;
    int screen_width_;
    int screen_height_;
    std::vector<Cookie> cookies_;

    Completion pending_connect_;
    std::vector<Completion> control_waiters_;
    std::map<uint64_t, Completion> pending_delays_;
    std::map<uint64_t, std::function<void(bool)>> pending_health_;
    uint64_t next_op_id_ = 0;

    void handle_open(uint64_t generation, std::exception_ptr error);
    void handle_message(uint64_t generation, const std::string& text);
    void handle_close(const std::string& reason);
    void handle_init(const protocol::SystemInit& init);
    void handle_kick(const std::string& message);

    void schedule_reconnect();
    void retire_transport(bool deferred = true);
    void teardown();
    void abort_pending(std::exception_ptr error);
    void finish_connect(std::exception_ptr error);

    void send(const std::string& text);
    void delay(Duration duration, Completion done);
    void with_control(std::function<void()> action, Completion done);
    void run_steps(std::shared_ptr<std::vector<Step>> steps, size_t index, Completion done);
    void set_control(bool has_control, std::optional<std::string> host);
};

} // namespace jukebox

#include "relay/relay_instance.hpp"
#include "errors.hpp"
#include "utils/logger.hpp"
#include "utils/string_utils.hpp"
#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace jukebox {

std::string relay_ws_url(const RelayConfig& config) {
    std::string base = config.url;
    if (base.rfind("https://", 0) == 0) {
        base = "wss://" + base.substr(8);
    } else if (base.rfind("http://", 0) == 0) {
        base = "ws://" + base.substr(7);
    }
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    return base + "/ws?username=" + string_utils::url_encode(config.username) +
           "&password=" + string_utils::url_encode(config.password);
}

// ==================== Cookie ====================

bool Cookie::operator==(const Cookie& other) const {
    return name == other.name && value == other.value && domain == other.domain &&
           path == other.path && expires == other.expires && http_only == other.http_only &&
           secure == other.secure && same_site == other.same_site;
}

void to_json(json& j, const Cookie& cookie) {
    j = json::object();
    j["name"] = cookie.name;
    j["value"] = cookie.value;
    j["domain"] = cookie.domain;
    j["path"] = cookie.path;
    if (cookie.expires) {
        j["expires"] = *cookie.expires;
    }
    j["httpOnly"] = cookie.http_only;
    j["secure"] = cookie.secure;
    if (cookie.same_site) {
        j["sameSite"] = *cookie.same_site;
    }
}

void from_json(const json& j, Cookie& cookie) {
    cookie.name = j.at("name").get<std::string>();
    cookie.value = j.at("value").get<std::string>();
    cookie.domain = j.value("domain", "");
    cookie.path = j.value("path", "/");
    cookie.expires.reset();
    if (j.contains("expires") && j["expires"].is_number()) {
        cookie.expires = j["expires"].get<int64_t>();
    }
    cookie.http_only = j.value("httpOnly", false);
    cookie.secure = j.value("secure", false);
    cookie.same_site.reset();
    if (j.contains("sameSite") && j["sameSite"].is_string()) {
        cookie.same_site = j["sameSite"].get<std::string>();
    }
}

const char* to_string(WsState state) {
    switch (state) {
        case WsState::Disconnected: return "disconnected";
        case WsState::Connecting: return "connecting";
        case WsState::Ready: return "ready";
    }
    return "unknown";
}

// ==================== RelayInstance ====================

RelayInstance::RelayInstance(std::string id, RelayConfig config, Scheduler& scheduler, TransportFactory transport_factory)
    : id_(std::move(id))
    , config_(std::move(config))
    , scheduler_(scheduler)
    , transport_factory_(std::move(transport_factory))
    , timers_(scheduler)
    , screen_width_(config_.screen_width)
    , screen_height_(config_.screen_height)
{}

RelayInstance::~RelayInstance() {
    stopped_ = true;
    timers_.clear_all();
    retire_transport(false);
}

void RelayInstance::initialize() {
    connect([this](std::exception_ptr error) {
        if (!error) return;
        log_error("Failed to initialize relay instance " + id_ + ": " + error_message(error));
        schedule_reconnect();
    });
}

void RelayInstance::connect(Completion done) {
    stopped_ = false;
    retire_transport();

    auto superseded = std::move(pending_connect_);
    pending_connect_ = std::move(done);

    uint64_t generation = ++generation_;
    ws_state_ = WsState::Connecting;
    transport_ = transport_factory_();

    if (superseded) {
        superseded(std::make_exception_ptr(ConnectionLostError("Superseded by a new connection attempt")));
    }
    if (generation != generation_) {
        return;
    }

    timers_.arm("connect", config_.connect_timeout, [this, generation]() {
        if (generation != generation_) return;
        log_warning("Connection to relay instance " + id_ + " timed out");
        retire_transport();
        ws_state_ = WsState::Disconnected;
        finish_connect(std::make_exception_ptr(RelayProtocolTimeout("Connection timeout")));
    });

    RelayTransport::Handlers handlers;
    handlers.on_message = [this, generation](const std::string& text) {
        handle_message(generation, text);
    };
    handlers.on_close = [this, generation](const std::string& reason) {
        if (generation != generation_) return;
        handle_close(reason);
    };

    transport_->open(relay_ws_url(config_), std::move(handlers), [this, generation](std::exception_ptr error) {
        handle_open(generation, error);
    });
}

void RelayInstance::handle_open(uint64_t generation, std::exception_ptr error) {
    if (generation != generation_) return;
    timers_.clear("connect");

    if (error) {
        log_error("WebSocket error for relay instance " + id_ + ": " + error_message(error));
        retire_transport();
        ws_state_ = WsState::Disconnected;
        finish_connect(error);
        return;
    }

    log_info("Connected to relay instance " + id_);
    ws_state_ = WsState::Ready;
    reconnect_attempts_ = 0;

    timers_.arm_interval("ping", config_.ping_interval, [this]() {
        if (!transport_ || !transport_->is_open()) return;
        transport_->ping([this](std::exception_ptr error) {
            if (error) {
                log_warning("Ping failed for relay instance " + id_ + ": " + error_message(error));
            }
        });
    });

    // system/init must follow the handshake
    timers_.arm("auth", config_.auth_timeout, [this]() {
        log_error("Authentication timeout for relay instance " + id_);
        handle_close("Authentication timeout");
    });

    events_.emit(RelayConnected{});
    finish_connect(nullptr);
}

void RelayInstance::handle_message(uint64_t generation, const std::string& text) {
    if (generation != generation_) return;

    protocol::ServerMessage message;
    try {
        message = protocol::decode(text);
    } catch (const RelayProtocolError& e) {
        log_error("Failed to parse relay message for " + id_ + ": " + e.what());
        return;
    }

    log_debug("Received relay message for " + id_ + ": " + protocol::event_name(message));

    if (auto* init = std::get_if<protocol::SystemInit>(&message)) {
        handle_init(*init);
    } else if (auto* locked = std::get_if<protocol::ControlLocked>(&message)) {
        bool mine = session_id_ && locked->id == *session_id_;
        set_control(mine, locked->id);

        if (mine && !control_waiters_.empty()) {
            timers_.clear("control");
            auto waiters = std::move(control_waiters_);
            control_waiters_.clear();
            for (auto& waiter : waiters) {
                waiter(nullptr);
            }
        }
    } else if (auto* release = std::get_if<protocol::ControlRelease>(&message)) {
        if (control_host_ && *control_host_ == release->id) {
            set_control(false, std::nullopt);
        }
    } else if (auto* requesting = std::get_if<protocol::ControlRequesting>(&message)) {
        log_debug("Control requested by " + requesting->id + " on relay " + id_);
    } else if (auto* disconnect = std::get_if<protocol::SystemDisconnect>(&message)) {
        handle_kick(disconnect->message);
    } else if (auto* error = std::get_if<protocol::SystemError>(&message)) {
        log_error("System error from relay " + id_ + ": " + error->message);
    } else if (auto* resolution = std::get_if<protocol::ScreenResolution>(&message)) {
        if (resolution->size.width > 0 && resolution->size.height > 0) {
            screen_width_ = resolution->size.width;
            screen_height_ = resolution->size.height;
        }
        log_debug("Screen resolution for relay " + id_ + ": " + std::to_string(screen_width_) + "x" +
                  std::to_string(screen_height_));
    } else if (auto* list = std::get_if<protocol::MemberList>(&message)) {
        log_debug("Relay " + id_ + " has " + std::to_string(list->members.size()) + " members");
    } else if (auto* unknown = std::get_if<protocol::Unknown>(&message)) {
        log_debug("Unhandled relay event for " + id_ + ": " + unknown->event);
    }
}

void RelayInstance::handle_init(const protocol::SystemInit& init) {
    timers_.clear("auth");

    session_id_ = init.session_id;
    control_host_ = init.control_host;
    has_control_ = control_host_ && *control_host_ == init.session_id;
    if (init.screen_size.width > 0 && init.screen_size.height > 0) {
        screen_width_ = init.screen_size.width;
        screen_height_ = init.screen_size.height;
    }

    log_info("Relay session initialized for " + id_ + ": session " + init.session_id + ", " +
             std::to_string(init.members.size()) + " members");

    timers_.arm_interval("heartbeat", config_.heartbeat_interval, [this]() {
        if (transport_ && transport_->is_open() && authenticated_) {
            send(protocol::encode_heartbeat());
        }
    });

    authenticated_ = true;
    log_info("Authenticated to relay instance " + id_);
    events_.emit(RelayAuthenticated{init.session_id});
}

void RelayInstance::handle_kick(const std::string& message) {
    log_warning("Relay instance " + id_ + " was disconnected by the server: " + message);
    kicked_ = true;
    handle_close("Kicked: " + message);
    events_.emit(RelayKicked{message});
}

void RelayInstance::handle_close(const std::string& reason) {
    log_warning("WebSocket closed for relay instance " + id_ + ": " + reason);

    retire_transport();
    ws_state_ = WsState::Disconnected;
    authenticated_ = false;
    session_id_.reset();
    set_control(false, std::nullopt);

    timers_.clear("ping");
    timers_.clear("heartbeat");
    timers_.clear("auth");

    abort_pending(std::make_exception_ptr(
        ConnectionLostError("Relay instance " + id_ + " disconnected: " + reason)));

    events_.emit(RelayClosed{reason});
    schedule_reconnect();
}

void RelayInstance::schedule_reconnect() {
    if (stopped_ || kicked_ || ws_state_ != WsState::Disconnected) {
        return;
    }
    if (timers_.is_armed("reconnect")) {
        return;
    }
    if (reconnect_attempts_ >= config_.max_reconnect_attempts) {
        log_error("Relay instance " + id_ + " gave up after " + std::to_string(reconnect_attempts_) +
                  " reconnect attempts");
        return;
    }

    ++reconnect_attempts_;
    Duration delay = backoff_delay(reconnect_attempts_);

    log_info("Scheduling reconnect for relay " + id_ + " in " + std::to_string(delay.count()) + "ms (attempt " +
             std::to_string(reconnect_attempts_) + "/" + std::to_string(config_.max_reconnect_attempts) + ")");

    timers_.arm("reconnect", delay, [this]() {
        connect([this](std::exception_ptr error) {
            if (!error) {
                log_info("Successfully reconnected relay instance " + id_);
                return;
            }
            log_error("Failed to reconnect relay instance " + id_ + ": " + error_message(error));
            schedule_reconnect();
        });
    });
}

Duration RelayInstance::backoff_delay(int attempt) const {
    return std::min(Duration(config_.reconnect_base_delay.count() * attempt), config_.reconnect_max_delay);
}

void RelayInstance::retire_transport(bool deferred) {
    ++generation_;
    if (!transport_) return;

    transport_->close();
    if (!deferred) {
        transport_.reset();
        return;
    }

    // We may be inside one of its callbacks
    std::shared_ptr<RelayTransport> retired(std::move(transport_));
    scheduler_.post([retired]() {});
}

void RelayInstance::finish_connect(std::exception_ptr error) {
    if (!pending_connect_) return;
    auto done = std::move(pending_connect_);
    pending_connect_ = nullptr;
    done(error);
}

void RelayInstance::abort_pending(std::exception_ptr error) {
    timers_.clear("control");
    auto waiters = std::move(control_waiters_);
    control_waiters_.clear();

    auto delays = std::move(pending_delays_);
    pending_delays_.clear();
    for (const auto& [op, done] : delays) {
        timers_.clear("delay:" + std::to_string(op));
    }

    auto health = std::move(pending_health_);
    pending_health_.clear();
    for (const auto& [op, done] : health) {
        timers_.clear("health:" + std::to_string(op));
    }

    for (auto& waiter : waiters) {
        waiter(error);
    }
    for (auto& [op, done] : delays) {
        done(error);
    }
    for (auto& [op, done] : health) {
        done(false);
    }
}

void RelayInstance::teardown() {
    timers_.clear_all();

    if (has_control_) {
        send(protocol::encode_control_release());
    }
    retire_transport();

    ws_state_ = WsState::Disconnected;
    authenticated_ = false;
    has_control_ = false;
    current_video_.reset();
    session_id_.reset();
    control_host_.reset();
    reconnect_attempts_ = 0;

    auto error = std::make_exception_ptr(ConnectionLostError("Relay instance " + id_ + " shut down"));
    finish_connect(error);
    abort_pending(error);
}

void RelayInstance::shutdown() {
    log_info("Shutting down relay instance " + id_);
    stopped_ = true;
    teardown();
}

void RelayInstance::restart(Completion done) {
    log_info("Restarting relay instance " + id_);
    shutdown();
    kicked_ = false;

    delay(config_.restart_delay, [this, done](std::exception_ptr error) {
        if (error) {
            done(error);
            return;
        }
        initialize();
        done(nullptr);
    });
}

// ==================== Input ====================

void RelayInstance::send(const std::string& text) {
    if (!transport_ || !transport_->is_open()) {
        log_warning("Cannot send message to relay " + id_ + ": socket not open");
        return;
    }
    transport_->send(text);
}

void RelayInstance::delay(Duration duration, Completion done) {
    uint64_t op = ++next_op_id_;
    pending_delays_[op] = std::move(done);

    timers_.arm("delay:" + std::to_string(op), duration, [this, op]() {
        auto it = pending_delays_.find(op);
        if (it == pending_delays_.end()) return;
        auto done = std::move(it->second);
        pending_delays_.erase(it);
        done(nullptr);
    });
}

void RelayInstance::set_control(bool has_control, std::optional<std::string> host) {
    bool changed = has_control != has_control_ || host != control_host_;
    has_control_ = has_control;
    control_host_ = std::move(host);

    if (changed) {
        log_debug("Control status for " + id_ + ": " + (has_control_ ? "held" : "not held"));
        events_.emit(RelayControlChanged{has_control_, control_host_});
    }
}

void RelayInstance::request_control(Completion done) {
    if (has_control_) {
        done(nullptr);
        return;
    }
    if (!transport_ || !transport_->is_open()) {
        done(std::make_exception_ptr(ConnectionLostError("Relay instance " + id_ + " is not connected")));
        return;
    }
    if (!authenticated_ || !session_id_) {
        done(std::make_exception_ptr(RelayProtocolError("Relay instance " + id_ + " is not authenticated")));
        return;
    }

    control_waiters_.push_back(std::move(done));
    if (control_waiters_.size() > 1) {
        // Already waiting on the server
        return;
    }

    send(protocol::encode_control_request());
    timers_.arm("control", config_.control_timeout, [this]() {
        log_warning("Control request timed out for relay instance " + id_);
        auto waiters = std::move(control_waiters_);
        control_waiters_.clear();
        for (auto& waiter : waiters) {
            waiter(std::make_exception_ptr(RelayProtocolTimeout("Control request timeout")));
        }
    });
}

void RelayInstance::release_control() {
    if (!has_control_) return;
    send(protocol::encode_control_release());
    set_control(false, std::nullopt);
}

void RelayInstance::with_control(std::function<void()> action, Completion done) {
    request_control([action = std::move(action), done = std::move(done)](std::exception_ptr error) {
        if (error) {
            done(error);
            return;
        }
        action();
        done(nullptr);
    });
}

void RelayInstance::run_steps(std::shared_ptr<std::vector<Step>> steps, size_t index, Completion done) {
    if (index >= steps->size()) {
        done(nullptr);
        return;
    }

    (*steps)[index]([this, steps, index, done](std::exception_ptr error) {
        if (error) {
            done(error);
            return;
        }
        run_steps(steps, index + 1, done);
    });
}

void RelayInstance::send_mouse_move(int x, int y, Completion done) {
    with_control([this, x, y]() { send(protocol::encode_mouse_move(x, y)); }, std::move(done));
}

void RelayInstance::send_mouse_click(int x, int y, int button, Completion done) {
    request_control([this, x, y, button, done](std::exception_ptr error) {
        if (error) {
            done(error);
            return;
        }

        send(protocol::encode_mouse_button(true, x, y, button));
        delay(config_.click_release_delay, [this, x, y, button, done](std::exception_ptr error) {
            if (error) {
                done(error);
                return;
            }
            send(protocol::encode_mouse_button(false, x, y, button));
            done(nullptr);
        });
    });
}

void RelayInstance::send_key(uint32_t keysym, bool pressed, Completion done) {
    with_control([this, keysym, pressed]() { send(protocol::encode_key(pressed, keysym)); }, std::move(done));
}

void RelayInstance::send_text(const std::string& text, Completion done) {
    auto steps = std::make_shared<std::vector<Step>>();
    steps->push_back([this](Completion next) { request_control(std::move(next)); });

    for (uint32_t keysym : protocol::text_to_keysyms(text)) {
        steps->push_back([this, keysym](Completion next) { send_key(keysym, true, std::move(next)); });
        steps->push_back([this, keysym](Completion next) { send_key(keysym, false, std::move(next)); });
        steps->push_back([this](Completion next) { delay(config_.key_delay, std::move(next)); });
    }

    run_steps(steps, 0, std::move(done));
}

void RelayInstance::navigate(const std::string& url, Completion done) {
    using protocol::keysym::Control_L;
    using protocol::keysym::Return;

    auto steps = std::make_shared<std::vector<Step>>();
    auto key = [this](uint32_t keysym, bool pressed) {
        return [this, keysym, pressed](Completion next) { send_key(keysym, pressed, std::move(next)); };
    };
    auto pause_step = [this]() {
        return [this](Completion next) { delay(config_.input_step_delay, std::move(next)); };
    };

    steps->push_back([this](Completion next) { request_control(std::move(next)); });

    // Focus the address bar and select its contents
    steps->push_back([this](Completion next) {
        send_mouse_click(config_.address_bar_x, config_.address_bar_y, protocol::mouse::Left, std::move(next));
    });
    steps->push_back(pause_step());
    steps->push_back(key(Control_L, true));
    steps->push_back(key(protocol::keysym::a, true));
    steps->push_back(key(protocol::keysym::a, false));
    steps->push_back(key(Control_L, false));
    steps->push_back(pause_step());

    steps->push_back([this, url](Completion next) { send_text(url, std::move(next)); });
    steps->push_back(pause_step());

    steps->push_back(key(Return, true));
    steps->push_back(key(Return, false));

    run_steps(steps, 0, [this, done](std::exception_ptr error) {
        if (!error) {
            release_control();
        }
        done(error);
    });
}

void RelayInstance::play_video(const std::string& url, Completion done) {
    last_used_ = scheduler_.now();

    auto steps = std::make_shared<std::vector<Step>>();
    steps->push_back([this, url](Completion next) { navigate(url, std::move(next)); });
    steps->push_back([this](Completion next) { delay(config_.page_settle_delay, std::move(next)); });
    // The player surface fills the centre of the page
    steps->push_back([this](Completion next) {
        send_mouse_click(screen_width_ / 2, screen_height_ / 2, protocol::mouse::Left, std::move(next));
    });

    run_steps(steps, 0, [this, done](std::exception_ptr error) {
        if (error) {
            log_error("Failed to play video on relay " + id_ + ": " + error_message(error));
        }
        done(error);
    });
}

void RelayInstance::pause(Completion done) {
    auto steps = std::make_shared<std::vector<Step>>();
    steps->push_back([this](Completion next) { send_key(protocol::keysym::Space, true, std::move(next)); });
    steps->push_back([this](Completion next) { send_key(protocol::keysym::Space, false, std::move(next)); });
    run_steps(steps, 0, std::move(done));
}

void RelayInstance::resume(Completion done) {
    pause(std::move(done));
}

void RelayInstance::seek_to(double seconds, double duration_seconds, Completion done) {
    double fraction = duration_seconds > 0 ? std::clamp(seconds / duration_seconds, 0.0, 1.0) : 0.0;

    // The reference layout is scaled to the screen the relay reported
    int start_x = config_.progress_bar_start_x * screen_width_ / config_.screen_width;
    int end_x = config_.progress_bar_end_x * screen_width_ / config_.screen_width;
    int y = config_.progress_bar_y * screen_height_ / config_.screen_height;
    int x = start_x + static_cast<int>(std::lround(fraction * (end_x - start_x)));

    log_debug("Relay " + id_ + " seeking to " + std::to_string(seconds) + "s");
    last_used_ = scheduler_.now();
    send_mouse_click(x, y, protocol::mouse::Left, std::move(done));
}

// ==================== Health & sessions ====================

void RelayInstance::health_check(std::function<void(bool)> done) {
    if (!transport_ || !transport_->is_open() || !authenticated_) {
        done(false);
        return;
    }

    uint64_t op = ++next_op_id_;
    std::string key = "health:" + std::to_string(op);
    pending_health_[op] = std::move(done);

    timers_.arm(key, config_.health_check_timeout, [this, op]() {
        auto it = pending_health_.find(op);
        if (it == pending_health_.end()) return;
        auto done = std::move(it->second);
        pending_health_.erase(it);
        log_warning("Health check timed out for relay instance " + id_);
        done(false);
    });

    transport_->ping([this, op, key](std::exception_ptr error) {
        auto it = pending_health_.find(op);
        if (it == pending_health_.end()) return;
        auto done = std::move(it->second);
        pending_health_.erase(it);
        timers_.clear(key);

        if (error) {
            log_warning("Health check failed for relay instance " + id_ + ": " + error_message(error));
        }
        done(!error);
    });
}

void RelayInstance::restore_session(std::vector<Cookie> cookies) {
    log_info("Restored " + std::to_string(cookies.size()) + " session cookies for relay instance " + id_);
    cookies_ = std::move(cookies);
}

void RelayInstance::assign_video(const std::string& video_id) {
    current_video_ = video_id;
    last_used_ = scheduler_.now();
}

void RelayInstance::release_video() {
    current_video_.reset();
    last_used_ = scheduler_.now();
}

} // namespace jukebox

#pragma once

#include "errors.hpp"
#include "relay/relay_transport.hpp"
#include "utils/scheduler.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jukebox {
namespace testing {

class FakeRelayServer;

// In-process transport: delivers everything through the scheduler like
// the real socket would.
class FakeTransport : public RelayTransport {
public:
    FakeTransport(FakeRelayServer& server, Scheduler& scheduler, int connection_id)
        : server_(server), scheduler_(scheduler), connection_id_(connection_id) {}
    ~FakeTransport() override;

    void open(const std::string& url, Handlers handlers, Completion done) override;
    bool is_open() const override { return open_; }
    void send(const std::string& text) override;
    void ping(Completion done) override;
    void close() override;

    // Server side
    void deliver(const std::string& text);
    void drop(const std::string& reason);

    int connection_id() const { return connection_id_; }
    const std::string& session_id() const { return session_id_; }
    void set_session_id(std::string id) { session_id_ = std::move(id); }
    const std::string& url() const { return url_; }

private:
    FakeRelayServer& server_;
    Scheduler& scheduler_;
    int connection_id_;
    std::string url_;
    std::string session_id_;
    Handlers handlers_;
    bool open_ = false;
    // Invalidates deliveries still queued when the transport closes
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

// Arbitrates the control lock the way the relay server does: the first
// requester wins, later ones wait until the holder releases.
class FakeRelayServer {
public:
    explicit FakeRelayServer(Scheduler& scheduler) : scheduler_(scheduler) {}

    TransportFactory factory() {
        return [this]() {
            return std::unique_ptr<RelayTransport>(new FakeTransport(*this, scheduler_, ++next_connection_));
        };
    }

    // Behaviour knobs
    bool accept_connections = true;
    bool send_init = true;
    bool answer_pings = true;

    int open_attempts = 0;
    std::vector<std::string> received;
    std::optional<std::string> control_holder;

    std::vector<std::string> received_events() const {
        std::vector<std::string> events;
        for (const auto& text : received) {
            events.push_back(nlohmann::json::parse(text).value("event", ""));
        }
        return events;
    }

    FakeTransport* connection_for(const std::string& session_id) const {
        for (const auto& [id, transport] : connections_) {
            if (transport->session_id() == session_id) return transport;
        }
        return nullptr;
    }

    size_t open_connections() const { return connections_.size(); }

    void kick(const std::string& session_id, const std::string& message) {
        if (auto* transport = connection_for(session_id)) {
            nlohmann::json payload;
            payload["event"] = "system/disconnect";
            payload["message"] = message;
            transport->deliver(payload.dump());
        }
    }

    void drop(const std::string& session_id) {
        if (auto* transport = connection_for(session_id)) {
            transport->drop("connection reset");
        }
    }

    // Called by FakeTransport
    void attach(FakeTransport* transport) {
        ++open_attempts;
        connections_[transport->connection_id()] = transport;
        transport->set_session_id("session-" + std::to_string(transport->connection_id()));
    }

    void detach(FakeTransport* transport) {
        connections_.erase(transport->connection_id());
        if (control_holder && *control_holder == transport->session_id()) {
            control_holder.reset();
        }
    }

    std::string init_message(const FakeTransport& transport) const {
        nlohmann::json payload;
        payload["event"] = "system/init";
        payload["session_id"] = transport.session_id();
        if (control_holder) {
            payload["control_host"] = *control_holder;
        }
        payload["screen_size"] = {{"width", 1920}, {"height", 1080}, {"rate", 30}};
        payload["members"] = nlohmann::json::array();
        return payload.dump();
    }

    void handle(FakeTransport& from, const std::string& text) {
        received.push_back(text);
        std::string event = nlohmann::json::parse(text).value("event", "");

        if (event == "control/request") {
            if (!control_holder || *control_holder == from.session_id()) {
                control_holder = from.session_id();
                broadcast("control/locked", from.session_id());
            } else if (auto* holder = connection_for(*control_holder)) {
                nlohmann::json payload;
                payload["event"] = "control/requesting";
                payload["id"] = from.session_id();
                holder->deliver(payload.dump());
            }
        } else if (event == "control/release") {
            if (control_holder && *control_holder == from.session_id()) {
                control_holder.reset();
                broadcast("control/release", from.session_id());
            }
        }
    }

private:
    Scheduler& scheduler_;
    int next_connection_ = 0;
    std::map<int, FakeTransport*> connections_;

    void broadcast(const std::string& event, const std::string& id) {
        nlohmann::json payload;
        payload["event"] = event;
        payload["id"] = id;
        std::string text = payload.dump();
        for (const auto& [connection_id, transport] : connections_) {
            transport->deliver(text);
        }
    }
};

inline FakeTransport::~FakeTransport() {
    close();
}

inline void FakeTransport::open(const std::string& url, Handlers handlers, Completion done) {
    url_ = url;
    handlers_ = std::move(handlers);
    std::weak_ptr<bool> alive = alive_;

    if (!server_.accept_connections) {
        ++server_.open_attempts;
        scheduler_.post([alive, done]() {
            if (alive.expired()) return;
            done(std::make_exception_ptr(ConnectionLostError("connection refused")));
        });
        return;
    }

    scheduler_.post([this, alive, done]() {
        if (alive.expired()) return;
        open_ = true;
        server_.attach(this);
        done(nullptr);
        if (server_.send_init) {
            deliver(server_.init_message(*this));
        }
    });
}

inline void FakeTransport::send(const std::string& text) {
    if (!open_) return;
    server_.handle(*this, text);
}

inline void FakeTransport::ping(Completion done) {
    if (!open_ || !server_.answer_pings) return;
    std::weak_ptr<bool> alive = alive_;
    scheduler_.post([alive, done]() {
        if (alive.expired()) return;
        done(nullptr);
    });
}

inline void FakeTransport::close() {
    alive_ = std::make_shared<bool>(true);
    handlers_ = Handlers{};
    if (open_) {
        open_ = false;
        server_.detach(this);
    }
}

inline void FakeTransport::deliver(const std::string& text) {
    std::weak_ptr<bool> alive = alive_;
    scheduler_.post([this, alive, text]() {
        if (alive.expired() || !open_ || !handlers_.on_message) return;
        // The handler may close this transport
        auto on_message = handlers_.on_message;
        on_message(text);
    });
}

inline void FakeTransport::drop(const std::string& reason) {
    std::weak_ptr<bool> alive = alive_;
    scheduler_.post([this, alive, reason]() {
        if (alive.expired() || !open_) return;
        auto on_close = handlers_.on_close;
        open_ = false;
        server_.detach(this);
        if (on_close) on_close(reason);
    });
}

} // namespace testing
} // namespace jukebox

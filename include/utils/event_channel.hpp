#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace jukebox {

// Unsubscribes on destruction. Safe to outlive the channel it came from.
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    Subscription(Subscription&& other) noexcept : cancel_(std::move(other.cancel_)) {
        other.cancel_ = nullptr;
    }

    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            cancel_ = std::move(other.cancel_);
            other.cancel_ = nullptr;
        }
        return *this;
    }

    void reset() {
        if (cancel_) {
            auto cancel = std::move(cancel_);
            cancel_ = nullptr;
            cancel();
        }
    }

    bool active() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

// Typed publish/subscribe channel owned by one entity (a guild session, a relay instance, a stream).
template <typename Event>
class EventChannel {
public:
    using Handler = std::function<void(const Event&)>;

    EventChannel() : state_(std::make_shared<State>()) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    Subscription subscribe(Handler handler) {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = ++state_->next_id;
            state_->handlers.emplace(id, std::move(handler));
        }

        std::weak_ptr<State> weak = state_;
        return Subscription([weak, id]() {
            if (auto state = weak.lock()) {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->handlers.erase(id);
            }
        });
    }

    void emit(const Event& event) {
        std::vector<uint64_t> ids;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            for (const auto& [id, handler] : state_->handlers) {
                ids.push_back(id);
            }
        }

        // Handlers may unsubscribe each other (or themselves) while we dispatch
        auto state = state_;
        for (uint64_t id : ids) {
            Handler handler;
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                auto it = state->handlers.find(id);
                if (it == state->handlers.end()) {
                    continue;
                }
                handler = it->second;
            }
            handler(event);
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->handlers.clear();
    }

    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->handlers.size();
    }

private:
    struct State {
        std::mutex mutex;
        uint64_t next_id = 0;
        std::map<uint64_t, Handler> handlers;
    };

    std::shared_ptr<State> state_;
};

} // namespace jukebox

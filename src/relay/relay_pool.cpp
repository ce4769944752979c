#include "relay/relay_pool.hpp"
#include "errors.hpp"
#include "utils/logger.hpp"
#include "utils/string_utils.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace jukebox {

RelayPool::RelayPool(RelayPoolConfig config, Scheduler& scheduler, KeyValueStore& store, Notifier& notifier,
                     InstanceFactory factory)
    : config_(std::move(config))
    , scheduler_(scheduler)
    , store_(store)
    , notifier_(notifier)
    , factory_(std::move(factory))
    , timers_(scheduler)
{}

RelayPool::~RelayPool() {
    shutdown();
}

void RelayPool::initialize() {
    if (initialized_) return;
    log_info("Initializing relay instance pool (" + std::to_string(config_.size) + " instances)");

    for (int i = 0; i < config_.size; ++i) {
        std::string id = config_.id_prefix + std::to_string(i);
        auto instance = factory_(id);

        subscriptions_.push_back(instance->subscribe([this, id](const RelayEvent& event) {
            if (auto* kicked = std::get_if<RelayKicked>(&event)) {
                notifier_.notify({
                    "Relay Instance Disconnected",
                    "Relay instance `" + id + "` was disconnected by the server (" + kicked->message +
                    "). It stays offline until `/relay restart " + id + "`."
                });
            }
        }));

        instances_.push_back(std::move(instance));
    }

    for (auto& instance : instances_) {
        instance->initialize();
        restore_session(instance->id());
    }

    timers_.arm_interval("health", config_.health_check_interval, [this]() { perform_health_checks(); });
    timers_.arm_interval("sessions", config_.session_maintenance_interval, [this]() { maintain_sessions(); });
    initialized_ = true;
}

RelayInstance* RelayPool::select_idle() const {
    RelayInstance* best = nullptr;
    for (const auto& instance : instances_) {
        if (!instance->is_authenticated() || instance->current_video()) {
            continue;
        }
        if (!best || instance->last_used() < best->last_used()) {
            best = instance.get();
        }
    }
    return best;
}

bool RelayPool::any_authenticated() const {
    for (const auto& instance : instances_) {
        if (instance->is_authenticated()) {
            return true;
        }
    }
    return false;
}

void RelayPool::get_healthy_instance(InstanceCallback done) {
    if (auto* instance = select_idle()) {
        done(instance);
        return;
    }

    if (!any_authenticated()) {
        log_error("No authenticated relay instances available");
        notify_auth_required("No relay instance is authenticated, so blocked videos cannot be played.");
        done(nullptr);
        return;
    }

    log_info("All relay instances are busy, waiting for one to free up");
    uint64_t waiter_id = ++next_waiter_id_;
    waiters_[waiter_id] = Waiter{scheduler_.now() + config_.wait_timeout, std::move(done)};
    timers_.arm("wait:" + std::to_string(waiter_id), config_.wait_poll_interval,
                [this, waiter_id]() { poll_waiter(waiter_id); });
}

void RelayPool::poll_waiter(uint64_t waiter_id) {
    auto it = waiters_.find(waiter_id);
    if (it == waiters_.end()) return;

    RelayInstance* instance = select_idle();
    if (!instance && scheduler_.now() < it->second.deadline) {
        timers_.arm("wait:" + std::to_string(waiter_id), config_.wait_poll_interval,
                    [this, waiter_id]() { poll_waiter(waiter_id); });
        return;
    }

    auto done = std::move(it->second.done);
    waiters_.erase(it);
    if (!instance) {
        log_warning("Timed out waiting for an idle relay instance");
    }
    done(instance);
}

void RelayPool::acquire(const std::string& video_id, AcquireCallback done) {
    if (auto* holder = find_by_video(video_id)) {
        done(std::make_exception_ptr(NoPlaybackMethodError(
            "Video " + video_id + " is already being relayed by " + holder->id())), nullptr);
        return;
    }

    get_healthy_instance([this, video_id, done](RelayInstance* instance) {
        if (!instance) {
            done(std::make_exception_ptr(NoHealthyRelayError()), nullptr);
            return;
        }
        // Someone else may have taken the video while we waited
        if (auto* holder = find_by_video(video_id)) {
            done(std::make_exception_ptr(NoPlaybackMethodError(
                "Video " + video_id + " is already being relayed by " + holder->id())), nullptr);
            return;
        }

        instance->assign_video(video_id);
        log_info("Assigned video " + video_id + " to relay instance " + instance->id());
        done(nullptr, instance);
    });
}

bool RelayPool::release(const std::string& instance_id, const std::string& video_id) {
    auto* instance = get_instance_by_id(instance_id);
    if (!instance || !instance->current_video()) {
        return false;
    }
    if (*instance->current_video() != video_id) {
        log_debug("Relay instance " + instance_id + " moved on to " + *instance->current_video() +
                  ", ignoring release for " + video_id);
        return false;
    }

    log_info("Released relay instance " + instance_id + " from video " + *instance->current_video());
    instance->release_video();
    return true;
}

void RelayPool::maintain_sessions() {
    std::vector<std::string> needs_auth;

    for (const auto& instance : instances_) {
        if (!instance->is_authenticated()) {
            if (!restore_session(instance->id())) {
                log_warning("Relay instance " + instance->id() + " needs authentication");
                needs_auth.push_back(instance->id());
            }
        } else {
            save_session(instance->id());
        }
    }

    if (!needs_auth.empty()) {
        notify_auth_required("Instances without a usable session: " + string_utils::join(needs_auth, ", ") + ".");
    }
}

bool RelayPool::save_session(const std::string& instance_id) {
    auto* instance = get_instance_by_id(instance_id);
    if (!instance) return false;

    auto cookies = instance->get_auth_cookies();
    if (cookies.empty()) {
        return false;
    }

    json payload = cookies;
    if (!store_.set(session_key(instance_id), payload.dump(), config_.session_ttl)) {
        log_error("Failed to save session for " + instance_id);
        return false;
    }
    return true;
}

bool RelayPool::restore_session(const std::string& instance_id) {
    auto* instance = get_instance_by_id(instance_id);
    if (!instance) return false;

    auto stored = store_.get(session_key(instance_id));
    if (!stored) return false;

    try {
        auto cookies = json::parse(*stored).get<std::vector<Cookie>>();
        instance->restore_session(std::move(cookies));
        return true;
    } catch (const json::exception& e) {
        log_error("Failed to restore session for " + instance_id + ": " + e.what());
        return false;
    }
}

void RelayPool::perform_health_checks() {
    for (const auto& instance : instances_) {
        RelayInstance* target = instance.get();
        if (target->is_kicked()) {
            log_debug("Skipping health check for kicked relay instance " + target->id());
            continue;
        }

        target->health_check([this, target](bool healthy) {
            if (healthy) return;
            log_warning("Relay instance " + target->id() + " is unhealthy, attempting restart");
            target->restart([target](std::exception_ptr error) {
                if (error) {
                    log_error("Restart failed for relay instance " + target->id() + ": " + error_message(error));
                }
            });
        });
    }
}

void RelayPool::notify_auth_required(const std::string& detail) {
    notifier_.notify({
        "Relay Authentication Required",
        "One or more relay instances need authentication. " + detail
    });
}

RelayInstance* RelayPool::get_instance_by_id(const std::string& id) const {
    for (const auto& instance : instances_) {
        if (instance->id() == id) {
            return instance.get();
        }
    }
    return nullptr;
}

std::vector<RelayInstance*> RelayPool::get_all_instances() const {
    std::vector<RelayInstance*> result;
    result.reserve(instances_.size());
    for (const auto& instance : instances_) {
        result.push_back(instance.get());
    }
    return result;
}

RelayInstance* RelayPool::find_by_video(const std::string& video_id) const {
    for (const auto& instance : instances_) {
        if (instance->current_video() && *instance->current_video() == video_id) {
            return instance.get();
        }
    }
    return nullptr;
}

void RelayPool::shutdown() {
    if (!initialized_) return;
    timers_.clear_all();

    auto waiters = std::move(waiters_);
    waiters_.clear();
    for (auto& [id, waiter] : waiters) {
        waiter.done(nullptr);
    }

    subscriptions_.clear();
    for (auto& instance : instances_) {
        instance->shutdown();
    }
    initialized_ = false;
}

} // namespace jukebox

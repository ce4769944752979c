#pragma once

#include "database.hpp"
#include "modules/notifications.hpp"
#include "relay/relay_instance.hpp"
#include "utils/event_channel.hpp"
#include "utils/scheduler.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace jukebox {

struct RelayPoolConfig {
    int size = 3;
    std::string id_prefix = "neko-";
    Duration health_check_interval{60000};
    Duration session_maintenance_interval{1800000};
    Duration wait_poll_interval{1000};
    Duration wait_timeout{30000};
    std::chrono::seconds session_ttl{604800};
};

// Fixed set of relay instances. Owns every instance and is the only writer
// of their current video.
class RelayPool {
public:
    using InstanceFactory = std::function<std::unique_ptr<RelayInstance>(const std::string& id)>;
    using InstanceCallback = std::function<void(RelayInstance*)>;
    using AcquireCallback = std::function<void(std::exception_ptr, RelayInstance*)>;

    RelayPool(RelayPoolConfig config, Scheduler& scheduler, KeyValueStore& store, Notifier& notifier,
              InstanceFactory factory);
    ~RelayPool();

    RelayPool(const RelayPool&) = delete;
    RelayPool& operator=(const RelayPool&) = delete;

    void initialize();
    bool is_initialized() const { return initialized_; }

    // Least recently used idle authenticated instance, or null. Waits up to
    // wait_timeout while every authenticated instance is busy.
    void get_healthy_instance(InstanceCallback done);

    // get_healthy_instance plus assignment in the same turn
    void acquire(const std::string& video_id, AcquireCallback done);
    // Frees the instance only while it still holds video_id; a restart may
    // have handed it to another video since
    bool release(const std::string& instance_id, const std::string& video_id);

    void maintain_sessions();
    void perform_health_checks();

    bool save_session(const std::string& instance_id);
    bool restore_session(const std::string& instance_id);

    RelayInstance* get_instance_by_id(const std::string& id) const;
    std::vector<RelayInstance*> get_all_instances() const;
    RelayInstance* find_by_video(const std::string& video_id) const;

    void shutdown();

    static std::string session_key(const std::string& instance_id) { return "session:" + instance_id; }

private:
    struct Waiter {
        TimePoint deadline;
        InstanceCallback done;
    };

    RelayPoolConfig config_;
    Scheduler& scheduler_;
    KeyValueStore& store_;
    Notifier& notifier_;
    InstanceFactory factory_;
    TimerRegistry timers_;

    std::vector<std::unique_ptr<RelayInstance>> instances_;
    std::vector<Subscription> subscriptions_;
    std::map<uint64_t, Waiter> waiters_;
    uint64_t next_waiter_id_ = 0;
    bool initialized_ = false;

    RelayInstance* select_idle() const;
    bool any_authenticated() const;
    void poll_waiter(uint64_t waiter_id);
    void notify_auth_required(const std::string& detail);
};

} // namespace jukebox

#pragma once

#include "utils/scheduler.hpp"
#include <string>

namespace jukebox {

struct Notification {
    std::string title;
    std::string description;
};

// Operator alert sink. Best-effort: implementations log failures, never throw.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const Notification& notification) = 0;
};

// Posts alerts to a Discord-style webhook
class WebhookNotifier : public Notifier {
public:
    // An empty url drops every notification
    WebhookNotifier(std::string webhook_url, BlockingExecutor executor);

    void notify(const Notification& notification) override;

    // Webhook JSON body: content plus one embed
    static std::string build_payload(const Notification& notification);

private:
    std::string webhook_url_;
    BlockingExecutor executor_;
};

} // namespace jukebox

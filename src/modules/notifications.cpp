#include "modules/notifications.hpp"
#include "utils/curl_helper.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace jukebox {

namespace {

constexpr int kWarningColor = 0xFFA500;

} // namespace

WebhookNotifier::WebhookNotifier(std::string webhook_url, BlockingExecutor executor)
    : webhook_url_(std::move(webhook_url))
    , executor_(std::move(executor))
{}

std::string WebhookNotifier::build_payload(const Notification& notification) {
    json embed;
    embed["title"] = notification.title;
    embed["description"] = notification.description;
    embed["color"] = kWarningColor;

    json payload;
    payload["content"] = "**" + notification.title + "**\n" + notification.description;
    payload["embeds"] = json::array({embed});
    return payload.dump();
}

void WebhookNotifier::notify(const Notification& notification) {
    log_warning("Operator alert: " + notification.title + " - " + notification.description);

    if (webhook_url_.empty()) {
        return;
    }

    std::string body = build_payload(notification);
    std::string url = webhook_url_;
    executor_([url, body]() {
        auto response = CurlHelper::post_json(url, body);
        if (!response.success) {
            log_error("Failed to send admin notification: " + response.error);
        } else if (!response.ok()) {
            log_error("Admin notification webhook returned HTTP " + std::to_string(response.status_code));
        }
    });
}

} // namespace jukebox

#include "playback/audio_router.hpp"
#include "errors.hpp"
#include "utils/curl_helper.hpp"
#include "utils/logger.hpp"
#include "utils/string_utils.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace jukebox {

std::vector<ActiveCapture> parse_active_streams(const std::string& body) {
    json payload = json::parse(body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        throw StreamError("Audio service returned a malformed streams listing");
    }

    std::vector<ActiveCapture> captures;
    auto streams = payload.find("streams");
    if (streams == payload.end() || !streams->is_array()) {
        return captures;
    }

    for (const auto& entry : *streams) {
        if (!entry.is_object() || !entry.contains("instanceId") || !entry["instanceId"].is_string()) {
            continue;
        }

        ActiveCapture capture;
        capture.instance_id = entry["instanceId"].get<std::string>();
        if (entry.contains("bytesTransmitted") && entry["bytesTransmitted"].is_number_unsigned()) {
            capture.bytes_transmitted = entry["bytesTransmitted"].get<uint64_t>();
        }
        capture.active = entry.value("active", false);
        captures.push_back(std::move(capture));
    }
    return captures;
}

AudioRouter::AudioRouter(AudioRouterConfig config, Scheduler& scheduler, BlockingExecutor executor)
    : config_(std::move(config))
    , scheduler_(scheduler)
    , executor_(std::move(executor))
{
    while (!config_.service_url.empty() && config_.service_url.back() == '/') {
        config_.service_url.pop_back();
    }
}

std::string AudioRouter::capture_url(const std::string& instance_id) const {
    return config_.service_url + "/capture/" + string_utils::url_encode(instance_id);
}

std::unique_ptr<AudioStream> AudioRouter::capture(const std::string& instance_id) {
    log_info("Opening audio capture for relay instance " + instance_id);
    try {
        return std::make_unique<ProcessAudioStream>(
            ffmpeg_pcm_command(config_.ffmpeg_path, capture_url(instance_id)), "capture:" + instance_id);
    } catch (const StreamError& e) {
        log_error("Failed to capture audio from instance " + instance_id + ": " + e.what());
        throw;
    }
}

void AudioRouter::stop_capture(const std::string& instance_id) {
    std::string url = capture_url(instance_id);
    executor_([url, instance_id]() {
        auto response = CurlHelper::del(url);
        if (!response.success) {
            log_error("Failed to stop audio capture for " + instance_id + ": " + response.error);
        } else if (!response.ok()) {
            log_warning("Stop capture for " + instance_id + " returned HTTP " + std::to_string(response.status_code));
        }
    });
}

void AudioRouter::active_streams(StreamsCallback done) {
    std::string url = config_.service_url + "/streams";
    Scheduler* scheduler = &scheduler_;

    executor_([url, scheduler, done]() {
        std::exception_ptr error;
        auto captures = std::make_shared<std::vector<ActiveCapture>>();

        try {
            auto response = CurlHelper::get(url);
            if (!response.success) {
                throw StreamError("Audio service unreachable: " + response.error);
            }
            if (!response.ok()) {
                throw StreamError("Audio service returned HTTP " + std::to_string(response.status_code));
            }
            *captures = parse_active_streams(response.body);
        } catch (const std::exception& e) {
            log_error(std::string("Failed to get active streams: ") + e.what());
            error = std::current_exception();
        }

        scheduler->post([done, error, captures]() {
            done(error, std::move(*captures));
        });
    });
}

} // namespace jukebox

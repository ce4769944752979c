#pragma once

#include "playback/audio_stream.hpp"
#include "utils/scheduler.hpp"
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace jukebox {

// One entry of the audio service's GET /streams listing
struct ActiveCapture {
    std::string instance_id;
    uint64_t bytes_transmitted = 0;
    bool active = false;
};

// Throws StreamError on a body that is not a streams listing
std::vector<ActiveCapture> parse_active_streams(const std::string& body);

// Client of the companion audio service that captures a relay's browser audio
class AudioCaptureClient {
public:
    virtual ~AudioCaptureClient() = default;

    // Throws StreamError when the capture cannot be opened
    virtual std::unique_ptr<AudioStream> capture(const std::string& instance_id) = 0;

    // Best-effort
    virtual void stop_capture(const std::string& instance_id) = 0;

    using StreamsCallback = std::function<void(std::exception_ptr, std::vector<ActiveCapture>)>;

    // Captures the service is running right now; done runs on the scheduler
    virtual void active_streams(StreamsCallback done) = 0;
};

struct AudioRouterConfig {
    std::string service_url = "http://localhost:3000";
    std::string ffmpeg_path = "ffmpeg";
};

class AudioRouter : public AudioCaptureClient {
public:
    AudioRouter(AudioRouterConfig config, Scheduler& scheduler, BlockingExecutor executor);

    std::unique_ptr<AudioStream> capture(const std::string& instance_id) override;
    void stop_capture(const std::string& instance_id) override;
    void active_streams(StreamsCallback done) override;

    // {service_url}/capture/{instance_id}
    std::string capture_url(const std::string& instance_id) const;

private:
    AudioRouterConfig config_;
    Scheduler& scheduler_;
    BlockingExecutor executor_;
};

} // namespace jukebox

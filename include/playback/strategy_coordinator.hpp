#pragma once

#include "database.hpp"
#include "playback/audio_router.hpp"
#include "playback/audio_stream.hpp"
#include "playback/media_extractor.hpp"
#include "relay/relay_pool.hpp"
#include "utils/scheduler.hpp"
#include "voice/voice_types.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace jukebox {

enum class PlaybackMethod {
    Direct,
    Relay
};

// Name used in the store ("direct" / "neko")
const char* history_label(PlaybackMethod method);

struct PlaybackResult {
    PlaybackMethod method = PlaybackMethod::Direct;
    // Ownership passes to the caller, who must close it
    std::unique_ptr<AudioStream> stream;
    std::optional<std::string> relay_instance;
};

// Where the voice manager gets playable audio from
class PlaybackSource {
public:
    using Callback = std::function<void(std::exception_ptr, PlaybackResult)>;

    virtual ~PlaybackSource() = default;
    virtual void attempt_playback(const Track& track, const VoiceChannelRef& channel, Callback done) = 0;
};

struct CoordinatorConfig {
    // Direct extraction is skipped once the count exceeds this
    int failure_threshold = 2;
    std::chrono::seconds failure_ttl{3600};
    // Expired failure counts and store rows are dropped this often
    std::chrono::seconds maintenance_interval{1800};
};

struct PlaybackStats {
    size_t direct = 0;
    size_t relay = 0;
    size_t recent_failures = 0;
};

class PlaybackStrategyCoordinator : public PlaybackSource {
public:
    // Extractors are tried in order; none are owned
    PlaybackStrategyCoordinator(CoordinatorConfig config, Scheduler& scheduler, KeyValueStore& store,
                                RelayPool& pool, AudioCaptureClient& capture,
                                std::vector<MediaExtractor*> extractors);

    void attempt_playback(const Track& track, const VoiceChannelRef& channel, Callback done) override;

    int failure_count(const std::string& video_id);
    PlaybackStats get_stats();

    // Arms the recurring run_maintenance() timer
    void start_maintenance();
    void run_maintenance();

    // Sticky flag that skips direct extraction for one video
    void set_force_relay(const std::string& video_id, bool enabled);
    bool is_force_relay(const std::string& video_id);

    static std::string failure_key(const std::string& video_id) { return "failure:" + video_id; }
    static std::string force_relay_key(const std::string& video_id) { return "video:force_neko:" + video_id; }

private:
    struct FailureRecord {
        int count = 0;
        TimePoint expires_at;
    };

    // detail joins every extractor's failure text
    using StreamCallback = std::function<void(std::exception_ptr, const std::string& detail,
                                              std::unique_ptr<AudioStream>)>;

    CoordinatorConfig config_;
    Scheduler& scheduler_;
    KeyValueStore& store_;
    RelayPool& pool_;
    AudioCaptureClient& capture_;
    std::vector<MediaExtractor*> extractors_;
    std::map<std::string, FailureRecord> failure_cache_;
    TimerRegistry timers_;

    void direct_stream(const Track& track, size_t index, std::vector<std::string> errors, StreamCallback done);
    void relay_fallback(const Track& track, Callback done);
    void attach_relay_release(AudioStream& stream, const std::string& instance_id, const std::string& video_id);

    void increment_failure(const std::string& video_id);
    void clear_failure(const std::string& video_id);
    void prune_failure_cache();
    void track_history(const std::string& video_id, PlaybackMethod method);
};

} // namespace jukebox

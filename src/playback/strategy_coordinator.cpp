#include "playback/strategy_coordinator.hpp"
#include "errors.hpp"
#include "utils/logger.hpp"
#include "utils/string_utils.hpp"

namespace jukebox {

namespace {

const char* kHistoryKey = "video:history";

} // namespace

const char* history_label(PlaybackMethod method) {
    return method == PlaybackMethod::Direct ? "direct" : "neko";
}

PlaybackStrategyCoordinator::PlaybackStrategyCoordinator(CoordinatorConfig config, Scheduler& scheduler,
                                                         KeyValueStore& store, RelayPool& pool,
                                                         AudioCaptureClient& capture,
                                                         std::vector<MediaExtractor*> extractors)
    : config_(config)
    , scheduler_(scheduler)
    , store_(store)
    , pool_(pool)
    , capture_(capture)
    , extractors_(std::move(extractors))
    , timers_(scheduler)
{}

void PlaybackStrategyCoordinator::attempt_playback(const Track& track, const VoiceChannelRef& channel, Callback done) {
    int failures = failure_count(track.id);

    if (is_force_relay(track.id)) {
        log_info("Video " + track.id + " marked for relay fallback");
        relay_fallback(track, std::move(done));
        return;
    }

    if (failures > config_.failure_threshold) {
        log_info("Video " + track.id + " has failed " + std::to_string(failures) + " times, using relay fallback");
        relay_fallback(track, std::move(done));
        return;
    }

    log_debug("Direct playback of " + track.id + " for guild " + std::to_string(static_cast<uint64_t>(channel.guild_id)));
    direct_stream(track, 0, {}, [this, track, done](std::exception_ptr error, const std::string& detail,
                                                    std::unique_ptr<AudioStream> stream) {
        if (!error) {
            clear_failure(track.id);
            track_history(track.id, PlaybackMethod::Direct);
            PlaybackResult result;
            result.method = PlaybackMethod::Direct;
            result.stream = std::move(stream);
            done(nullptr, std::move(result));
            return;
        }

        // Any extractor hitting the wall counts, not only the last one
        if (is_bot_detection_message(detail)) {
            log_warning("Bot detection for video " + track.id + ", falling back to relay");
            increment_failure(track.id);
            relay_fallback(track, done);
            return;
        }

        log_warning("Direct playback of " + track.id + " failed: " + detail);
        done(error, PlaybackResult{});
    });
}

void PlaybackStrategyCoordinator::direct_stream(const Track& track, size_t index, std::vector<std::string> errors,
                                                StreamCallback done) {
    if (extractors_.empty()) {
        std::string message = "No direct extractors configured";
        done(std::make_exception_ptr(ExtractionError(message)), message, nullptr);
        return;
    }

    MediaExtractor* extractor = extractors_[index];
    extractor->open(track, [this, track, index, errors, done, extractor](std::exception_ptr error,
                                                                         std::unique_ptr<AudioStream> stream) mutable {
        if (!error) {
            done(nullptr, "", std::move(stream));
            return;
        }

        errors.push_back(extractor->name() + ": " + error_message(error));
        if (index + 1 >= extractors_.size()) {
            // The last extractor's own exception travels on
            done(error, string_utils::join(errors, "; "), nullptr);
            return;
        }

        log_warning(extractor->name() + " failed for " + track.id + ", trying " + extractors_[index + 1]->name());
        direct_stream(track, index + 1, std::move(errors), done);
    });
}

void PlaybackStrategyCoordinator::relay_fallback(const Track& track, Callback done) {
    pool_.acquire(track.id, [this, track, done](std::exception_ptr error, RelayInstance* instance) {
        if (error) {
            done(error, PlaybackResult{});
            return;
        }

        std::string instance_id = instance->id();
        instance->play_video(track.source_url, [this, track, instance_id, done](std::exception_ptr error) {
            if (error) {
                pool_.release(instance_id, track.id);
                done(std::make_exception_ptr(NoPlaybackMethodError(
                    "Relay playback failed on " + instance_id + ": " + error_message(error))), PlaybackResult{});
                return;
            }

            std::unique_ptr<AudioStream> stream;
            try {
                stream = capture_.capture(instance_id);
            } catch (const std::exception& e) {
                pool_.release(instance_id, track.id);
                done(std::make_exception_ptr(NoPlaybackMethodError(
                    "Audio capture failed for " + instance_id + ": " + e.what())), PlaybackResult{});
                return;
            }

            attach_relay_release(*stream, instance_id, track.id);
            track_history(track.id, PlaybackMethod::Relay);

            PlaybackResult result;
            result.method = PlaybackMethod::Relay;
            result.stream = std::move(stream);
            result.relay_instance = instance_id;
            done(nullptr, std::move(result));
        });
    });
}

void PlaybackStrategyCoordinator::attach_relay_release(AudioStream& stream, const std::string& instance_id,
                                                       const std::string& video_id) {
    Scheduler* scheduler = &scheduler_;
    RelayPool* pool = &pool_;
    AudioCaptureClient* capture = &capture_;

    // Streams close on the player's thread
    stream.add_close_hook([scheduler, pool, capture, instance_id, video_id]() {
        scheduler->post([pool, capture, instance_id, video_id]() {
            // The capture belongs to whichever video now holds the instance
            if (pool->release(instance_id, video_id)) {
                capture->stop_capture(instance_id);
            }
        });
    });
}

// ==================== Failure records ====================

int PlaybackStrategyCoordinator::failure_count(const std::string& video_id) {
    auto it = failure_cache_.find(video_id);
    if (it != failure_cache_.end()) {
        if (scheduler_.now() < it->second.expires_at) {
            return it->second.count;
        }
        failure_cache_.erase(it);
    }

    auto stored = store_.get(failure_key(video_id));
    if (!stored) {
        return 0;
    }

    try {
        return std::stoi(*stored);
    } catch (const std::exception&) {
        log_warning("Ignoring malformed failure count for " + video_id + ": " + *stored);
        return 0;
    }
}

void PlaybackStrategyCoordinator::increment_failure(const std::string& video_id) {
    int count = failure_count(video_id) + 1;

    failure_cache_[video_id] = FailureRecord{count, scheduler_.now() + config_.failure_ttl};
    if (!store_.set(failure_key(video_id), std::to_string(count), config_.failure_ttl)) {
        log_error("Failed to persist failure count for " + video_id);
    }
}

void PlaybackStrategyCoordinator::clear_failure(const std::string& video_id) {
    failure_cache_.erase(video_id);
    store_.del(failure_key(video_id));
}

void PlaybackStrategyCoordinator::prune_failure_cache() {
    TimePoint now = scheduler_.now();
    for (auto it = failure_cache_.begin(); it != failure_cache_.end();) {
        if (it->second.expires_at <= now) {
            it = failure_cache_.erase(it);
        } else {
            ++it;
        }
    }
}

void PlaybackStrategyCoordinator::track_history(const std::string& video_id, PlaybackMethod method) {
    std::string label = history_label(method);
    store_.hset(kHistoryKey, video_id, label);
    store_.sadd("videos:" + label, video_id);
}

PlaybackStats PlaybackStrategyCoordinator::get_stats() {
    prune_failure_cache();

    PlaybackStats stats;
    stats.direct = store_.smembers("videos:direct").size();
    stats.relay = store_.smembers("videos:neko").size();
    stats.recent_failures = failure_cache_.size();
    return stats;
}

void PlaybackStrategyCoordinator::start_maintenance() {
    timers_.arm_interval("maintenance", config_.maintenance_interval, [this]() { run_maintenance(); });
}

void PlaybackStrategyCoordinator::run_maintenance() {
    prune_failure_cache();

    int purged = store_.purge_expired();
    if (purged > 0) {
        log_debug("Purged " + std::to_string(purged) + " expired store rows");
    }
}

void PlaybackStrategyCoordinator::set_force_relay(const std::string& video_id, bool enabled) {
    if (enabled) {
        store_.set(force_relay_key(video_id), "1");
    } else {
        store_.del(force_relay_key(video_id));
    }
}

bool PlaybackStrategyCoordinator::is_force_relay(const std::string& video_id) {
    return store_.exists(force_relay_key(video_id));
}

} // namespace jukebox

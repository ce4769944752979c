#pragma once

#include "utils/event_channel.hpp"
#include "utils/scheduler.hpp"
#include "voice/voice_connection.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <thread>

namespace jukebox {

// 60 ms of 48 kHz stereo s16le, the largest frame the voice client accepts
constexpr size_t kPcmFrameBytes = 11520;

struct PlayerConfig {
    // Stop reading ahead once the sink holds this much audio
    double max_buffered_seconds = 2.0;
    std::chrono::milliseconds idle_poll{20};
};

// Pumps PCM from an AudioStream into a sink on its own thread. State only
// changes on the scheduler; the pump thread posts its transitions there.
class PcmAudioPlayer : public AudioPlayer {
public:
    explicit PcmAudioPlayer(Scheduler& scheduler, PlayerConfig config = {});
    ~PcmAudioPlayer() override;

    PcmAudioPlayer(const PcmAudioPlayer&) = delete;
    PcmAudioPlayer& operator=(const PcmAudioPlayer&) = delete;

    void play(AudioResource resource) override;
    void stop(bool force = false) override;
    bool pause() override;
    bool unpause() override;
    PlayerState state() const override { return state_; }

    void attach_sink(AudioSink* sink) override { sink_ = sink; }
    Subscription subscribe(std::function<void(const PlayerEvent&)> handler) override {
        return events_.subscribe(std::move(handler));
    }

private:
    Scheduler& scheduler_;
    PlayerConfig config_;
    EventChannel<PlayerEvent> events_;

    PlayerState state_ = PlayerState::Idle;
    std::unique_ptr<AudioStream> stream_;
    Subscription stream_errors_;
    std::thread pump_;
    uint64_t generation_ = 0;

    std::atomic<AudioSink*> sink_{nullptr};
    std::atomic<bool> halt_{false};
    std::atomic<bool> paused_{false};
    // Guards posted tasks that outlive the player
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    void pump(uint64_t generation, AudioStream* stream);
    void post_if_current(uint64_t generation, std::function<void()> action);
    void on_pump_finished(uint64_t generation);
    void halt(bool discard);
    void set_state(PlayerState state);
};

} // namespace jukebox

#include "voice/audio_player.hpp"
#include "utils/logger.hpp"
#include <vector>

namespace jukebox {

PcmAudioPlayer::PcmAudioPlayer(Scheduler& scheduler, PlayerConfig config)
    : scheduler_(scheduler)
    , config_(config)
{}

PcmAudioPlayer::~PcmAudioPlayer() {
    *alive_ = false;
    halt(false);
}

void PcmAudioPlayer::play(AudioResource resource) {
    if (!resource.stream) {
        log_warning("Ignoring play request without a stream");
        return;
    }

    halt(false);

    uint64_t generation = ++generation_;
    stream_ = std::move(resource.stream);
    halt_ = false;
    paused_ = false;

    // Errors are reported on the pump thread
    stream_errors_ = stream_->on_error([this, generation](const StreamFailure& failure) {
        std::string message = failure.message;
        post_if_current(generation, [this, message]() {
            events_.emit(PlayerErrored{message});
        });
    });

    set_state(PlayerState::Buffering);
    pump_ = std::thread(&PcmAudioPlayer::pump, this, generation, stream_.get());
}

void PcmAudioPlayer::stop(bool force) {
    if (state_ == PlayerState::Idle && !stream_) return;
    ++generation_;
    halt(force);
    set_state(PlayerState::Idle);
}

bool PcmAudioPlayer::pause() {
    if (state_ != PlayerState::Playing && state_ != PlayerState::Buffering && state_ != PlayerState::AutoPaused) {
        return false;
    }
    paused_ = true;
    set_state(PlayerState::Paused);
    return true;
}

bool PcmAudioPlayer::unpause() {
    if (state_ != PlayerState::Paused) return false;
    paused_ = false;
    set_state(PlayerState::Playing);
    return true;
}

void PcmAudioPlayer::pump(uint64_t generation, AudioStream* stream) {
    std::vector<uint8_t> frame(kPcmFrameBytes);
    bool started = false;
    bool waiting_for_sink = false;

    while (!halt_) {
        if (paused_) {
            std::this_thread::sleep_for(config_.idle_poll);
            continue;
        }

        AudioSink* sink = sink_;
        if (!sink || !sink->ready()) {
            if (!waiting_for_sink) {
                waiting_for_sink = true;
                post_if_current(generation, [this]() {
                    if (state_ == PlayerState::Playing || state_ == PlayerState::Buffering) {
                        set_state(PlayerState::AutoPaused);
                    }
                });
            }
            std::this_thread::sleep_for(config_.idle_poll);
            continue;
        }

        if (sink->buffered_seconds() > config_.max_buffered_seconds) {
            std::this_thread::sleep_for(config_.idle_poll);
            continue;
        }

        size_t filled = 0;
        while (filled < frame.size() && !halt_) {
            size_t n = stream->read(frame.data() + filled, frame.size() - filled);
            if (n == 0) break;
            filled += n;
        }
        // Whole stereo samples only
        filled -= filled % 4;
        if (filled == 0) break;

        sink->send_pcm(frame.data(), filled);

        if (!started || waiting_for_sink) {
            started = true;
            waiting_for_sink = false;
            post_if_current(generation, [this]() {
                if (state_ == PlayerState::Buffering || state_ == PlayerState::AutoPaused) {
                    set_state(PlayerState::Playing);
                }
            });
        }
    }

    post_if_current(generation, [this, generation]() { on_pump_finished(generation); });
}

void PcmAudioPlayer::post_if_current(uint64_t generation, std::function<void()> action) {
    std::weak_ptr<bool> alive = alive_;
    scheduler_.post([this, alive, generation, action = std::move(action)]() {
        auto flag = alive.lock();
        if (!flag || !*flag || generation != generation_) return;
        action();
    });
}

void PcmAudioPlayer::on_pump_finished(uint64_t generation) {
    if (generation != generation_) return;
    halt(false);
    set_state(PlayerState::Idle);
}

void PcmAudioPlayer::halt(bool discard) {
    halt_ = true;
    stream_errors_.reset();
    if (stream_) {
        // Closing unblocks a pending read
        stream_->close();
    }
    if (pump_.joinable()) {
        pump_.join();
    }
    stream_.reset();
    paused_ = false;

    AudioSink* sink = sink_;
    if (discard && sink) {
        sink->discard();
    }
}

void PcmAudioPlayer::set_state(PlayerState state) {
    if (state == state_) return;
    PlayerState old_state = state_;
    state_ = state;
    log_debug(std::string("Player state ") + to_string(old_state) + " -> " + to_string(state));
    events_.emit(PlayerStateChanged{old_state, state});
}

} // namespace jukebox

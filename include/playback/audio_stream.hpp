#pragma once

#include "utils/event_channel.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace jukebox {

// PCM audio: 48 kHz, stereo, signed 16-bit little endian
constexpr int kPcmSampleRate = 48000;
constexpr int kPcmChannels = 2;

struct StreamFailure {
    std::string message;
};

// Byte stream handed from the playback coordinator to the audio player. The
// holder owns it and must close it on error or completion.
class AudioStream {
public:
    virtual ~AudioStream() = default;

    // Blocking; returns 0 at end of stream
    virtual size_t read(uint8_t* buffer, size_t size) = 0;

    // Idempotent. Runs the close hooks once.
    virtual void close() = 0;

    // Fires at most once, from whichever thread is reading
    Subscription on_error(std::function<void(const StreamFailure&)> handler) {
        return errors_.subscribe(std::move(handler));
    }

    void add_close_hook(std::function<void()> hook);

protected:
    void report_error(const std::string& message);
    void run_close_hooks();

private:
    EventChannel<StreamFailure> errors_;
    std::mutex hooks_mutex_;
    std::vector<std::function<void()>> close_hooks_;
    bool error_reported_ = false;
};

// stdout of a shell pipeline (ffmpeg decoding to PCM)
class ProcessAudioStream : public AudioStream {
public:
    explicit ProcessAudioStream(std::string command, std::string label);
    ~ProcessAudioStream() override;

    size_t read(uint8_t* buffer, size_t size) override;
    void close() override;

    const std::string& label() const { return label_; }

private:
    std::string command_;
    std::string label_;
    // Held for the whole of read() so close() never pcloses under a reader
    std::mutex read_mutex_;
    FILE* pipe_ = nullptr;
    std::atomic<bool> closed_{false};
};

// ffmpeg command line decoding input to the PCM format above
std::string ffmpeg_pcm_command(const std::string& ffmpeg_path, const std::string& input_url);

} // namespace jukebox

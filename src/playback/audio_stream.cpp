#include "playback/audio_stream.hpp"
#include "errors.hpp"
#include "utils/logger.hpp"
#include "utils/process.hpp"
#include "utils/string_utils.hpp"
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace jukebox {

namespace {

constexpr int kReadPollMs = 100;

} // namespace

void AudioStream::add_close_hook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    close_hooks_.push_back(std::move(hook));
}

void AudioStream::report_error(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        if (error_reported_) return;
        error_reported_ = true;
    }
    log_error("Audio stream error: " + message);
    errors_.emit(StreamFailure{message});
}

void AudioStream::run_close_hooks() {
    std::vector<std::function<void()>> hooks;
    {
        std::lock_guard<std::mutex> lock(hooks_mutex_);
        hooks.swap(close_hooks_);
    }
    for (auto& hook : hooks) {
        hook();
    }
}

std::string ffmpeg_pcm_command(const std::string& ffmpeg_path, const std::string& input_url) {
    return ffmpeg_path +
           " -hide_banner -loglevel error"
           " -reconnect 1 -reconnect_streamed 1 -reconnect_delay_max 5"
           " -i " + string_utils::shell_quote(input_url) +
           " -f s16le -ar " + std::to_string(kPcmSampleRate) + " -ac " + std::to_string(kPcmChannels) +
           " pipe:1 2>/dev/null";
}

ProcessAudioStream::ProcessAudioStream(std::string command, std::string label)
    : command_(std::move(command))
    , label_(std::move(label))
{
    pipe_ = popen(command_.c_str(), "r");
    if (!pipe_) {
        throw StreamError("Failed to start decoder for " + label_);
    }
}

ProcessAudioStream::~ProcessAudioStream() {
    close();
}

size_t ProcessAudioStream::read(uint8_t* buffer, size_t size) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    if (!pipe_) return 0;

    int fd = fileno(pipe_);
    ssize_t n = 0;
    while (!closed_) {
        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, kReadPollMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            report_error("Polling decoder output for " + label_ + " failed");
            return 0;
        }
        if (ready == 0) continue;

        n = ::read(fd, buffer, size);
        if (n < 0 && errno == EINTR) continue;
        break;
    }

    if (closed_) return 0;
    if (n > 0) return static_cast<size_t>(n);

    // End of output: a non-zero exit means the decoder or its input failed
    int exit_code = decode_exit_status(pclose(pipe_));
    pipe_ = nullptr;
    if (exit_code != 0) {
        report_error("Decoder for " + label_ + " exited with status " + std::to_string(exit_code));
    }
    return 0;
}

void ProcessAudioStream::close() {
    if (closed_.exchange(true)) return;
    {
        // A blocked reader notices closed_ within one poll interval
        std::lock_guard<std::mutex> lock(read_mutex_);
        if (pipe_) {
            pclose(pipe_);
            pipe_ = nullptr;
        }
    }
    run_close_hooks();
}

} // namespace jukebox

#pragma once

#include "playback/audio_stream.hpp"
#include "utils/scheduler.hpp"
#include "voice/voice_types.hpp"
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace jukebox {

// Direct-play source: turns a track into a PCM stream without a relay.
class MediaExtractor {
public:
    using Callback = std::function<void(std::exception_ptr, std::unique_ptr<AudioStream>)>;

    virtual ~MediaExtractor() = default;

    virtual std::string name() const = 0;

    // done runs on the scheduler. Failures carry the extractor's own error
    // text so it can be classified.
    virtual void open(const Track& track, Callback done) = 0;
};

struct ExtractorConfig {
    std::string ytdlp_path = "yt-dlp";
    std::string ffmpeg_path = "ffmpeg";
    // Extra yt-dlp arguments, e.g. an alternate player client
    std::vector<std::string> extra_args;
};

// yt-dlp resolves the media URL, ffmpeg decodes it
class YtDlpExtractor : public MediaExtractor {
public:
    YtDlpExtractor(std::string name, ExtractorConfig config, Scheduler& scheduler, BlockingExecutor executor);

    std::string name() const override { return name_; }
    void open(const Track& track, Callback done) override;

    std::string build_resolve_command(const std::string& url) const;

    // Last http(s) line of yt-dlp -g output
    static std::string parse_media_url(const std::string& output);

private:
    std::string name_;
    ExtractorConfig config_;
    Scheduler& scheduler_;
    BlockingExecutor executor_;
};

} // namespace jukebox

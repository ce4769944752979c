#include "playback/media_extractor.hpp"
#include "errors.hpp"
#include "utils/logger.hpp"
#include "utils/process.hpp"
#include "utils/string_utils.hpp"
#include <sstream>

namespace jukebox {

YtDlpExtractor::YtDlpExtractor(std::string name, ExtractorConfig config, Scheduler& scheduler, BlockingExecutor executor)
    : name_(std::move(name))
    , config_(std::move(config))
    , scheduler_(scheduler)
    , executor_(std::move(executor))
{}

std::string YtDlpExtractor::build_resolve_command(const std::string& url) const {
    std::string cmd = config_.ytdlp_path + " -f bestaudio -g --no-playlist --no-warnings";
    for (const auto& arg : config_.extra_args) {
        cmd += " " + string_utils::shell_quote(arg);
    }
    // stderr carries the error text we classify
    cmd += " " + string_utils::shell_quote(url) + " 2>&1";
    return cmd;
}

std::string YtDlpExtractor::parse_media_url(const std::string& output) {
    std::istringstream lines(output);
    std::string line;
    std::string media_url;

    while (std::getline(lines, line)) {
        line = string_utils::trim(line);
        if (line.rfind("http://", 0) == 0 || line.rfind("https://", 0) == 0) {
            media_url = line;
        }
    }
    return media_url;
}

void YtDlpExtractor::open(const Track& track, Callback done) {
    std::string command = build_resolve_command(track.source_url);
    std::string ffmpeg = config_.ffmpeg_path;
    std::string name = name_;
    std::string label = track.id.empty() ? track.source_url : track.id;
    Scheduler* scheduler = &scheduler_;

    executor_([command, ffmpeg, name, label, scheduler, done]() {
        std::exception_ptr error;
        auto stream = std::make_shared<std::unique_ptr<AudioStream>>();

        try {
            CommandResult result = run_command(command);
            std::string media_url = parse_media_url(result.output);

            if (result.exit_code != 0 || media_url.empty()) {
                std::string text = string_utils::trim(result.output);
                if (text.empty()) {
                    text = "yt-dlp exited with status " + std::to_string(result.exit_code);
                }
                throw ExtractionError(text);
            }

            *stream = std::make_unique<ProcessAudioStream>(ffmpeg_pcm_command(ffmpeg, media_url), label);
        } catch (const std::exception& e) {
            log_warning(name + " extractor failed for " + label + ": " + e.what());
            error = std::current_exception();
        }

        scheduler->post([done, error, stream]() {
            done(error, std::move(*stream));
        });
    });
}

} // namespace jukebox

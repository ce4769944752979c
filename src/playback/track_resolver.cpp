#include "playback/track_resolver.hpp"
#include "errors.hpp"
#include "utils/logger.hpp"
#include "utils/process.hpp"
#include "utils/string_utils.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <sstream>

using json = nlohmann::json;

namespace jukebox {

namespace {

const std::string kWatchUrl = "https://www.youtube.com/watch?v=";

std::string best_thumbnail(const json& j) {
    if (j.contains("thumbnail") && j["thumbnail"].is_string()) {
        return j["thumbnail"].get<std::string>();
    }
    if (j.contains("thumbnails") && j["thumbnails"].is_array() && !j["thumbnails"].empty()) {
        const auto& last = j["thumbnails"].back();
        if (last.contains("url") && last["url"].is_string()) {
            return last["url"].get<std::string>();
        }
    }
    return "";
}

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    return (it != j.end() && it->is_string()) ? it->get<std::string>() : "";
}

} // namespace

TrackResolver::TrackResolver(ResolverConfig config, Scheduler& scheduler, BlockingExecutor executor)
    : config_(std::move(config))
    , scheduler_(scheduler)
    , executor_(std::move(executor))
{}

bool TrackResolver::is_url(const std::string& query) {
    return query.rfind("http://", 0) == 0 || query.rfind("https://", 0) == 0;
}

bool TrackResolver::is_playlist_url(const std::string& url) {
    return is_url(url) && url.find("list=") != std::string::npos && url.find("watch?v=") == std::string::npos;
}

std::optional<std::string> TrackResolver::extract_video_id(const std::string& url) {
    auto take_id = [&url](size_t start) -> std::optional<std::string> {
        size_t end = url.find_first_of("&?#/", start);
        std::string id = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (id.size() != 11) return std::nullopt;
        return id;
    };

    size_t pos = url.find("v=");
    if (pos != std::string::npos && (pos == 0 || url[pos - 1] == '?' || url[pos - 1] == '&')) {
        return take_id(pos + 2);
    }
    for (const char* marker : {"youtu.be/", "/shorts/", "/embed/"}) {
        pos = url.find(marker);
        if (pos != std::string::npos) {
            return take_id(pos + std::string(marker).size());
        }
    }
    return std::nullopt;
}

std::string TrackResolver::build_command(const std::string& query, int limit) const {
    std::string cmd = config_.ytdlp_path + " --no-warnings";

    if (is_playlist_url(query)) {
        cmd += " --flat-playlist -j --playlist-end " + std::to_string(config_.playlist_limit) + " " +
               string_utils::shell_quote(query);
    } else if (is_url(query)) {
        cmd += " --print-json --skip-download --no-playlist " + string_utils::shell_quote(query);
    } else {
        cmd += " --print-json --skip-download " +
               string_utils::shell_quote("ytsearch" + std::to_string(limit) + ":" + query);
    }
    return cmd + " 2>/dev/null";
}

std::vector<Track> TrackResolver::parse_tracks(const std::string& output) {
    std::vector<Track> tracks;
    std::istringstream lines(output);
    std::string line;

    while (std::getline(lines, line)) {
        line = string_utils::trim(line);
        if (line.empty() || line[0] != '{') continue;

        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            log_debug("Skipping unparseable yt-dlp line");
            continue;
        }

        Track track;
        track.id = string_field(j, "id");
        track.title = string_field(j, "title");
        if (track.title.empty()) track.title = "Unknown";

        track.source_url = string_field(j, "webpage_url");
        if (track.source_url.empty()) {
            std::string url = string_field(j, "url");
            track.source_url = is_url(url) ? url : kWatchUrl + track.id;
        }
        if (track.id.empty()) {
            track.id = extract_video_id(track.source_url).value_or(track.source_url);
        }

        if (j.contains("duration") && j["duration"].is_number()) {
            track.duration_seconds = static_cast<int>(j["duration"].get<double>());
        }
        track.thumbnail_url = best_thumbnail(j);
        track.channel = string_field(j, "channel");
        if (track.channel.empty()) track.channel = string_field(j, "uploader");

        tracks.push_back(std::move(track));
    }
    return tracks;
}

void TrackResolver::resolve(const std::string& query, Callback done) {
    run(build_command(query, 1), std::move(done));
}

void TrackResolver::search(const std::string& query, int limit, Callback done) {
    run(build_command(query, limit > 0 ? limit : config_.search_results), std::move(done));
}

void TrackResolver::run(std::string command, Callback done) {
    Scheduler* scheduler = &scheduler_;

    executor_([command, scheduler, done]() {
        std::exception_ptr error;
        auto tracks = std::make_shared<std::vector<Track>>();

        try {
            CommandResult result = run_command(command);
            *tracks = parse_tracks(result.output);
            if (tracks->empty()) {
                throw ExtractionError("No results found");
            }
        } catch (const std::exception& e) {
            log_warning(std::string("Track lookup failed: ") + e.what());
            error = std::current_exception();
        }

        scheduler->post([done, error, tracks]() {
            done(error, std::move(*tracks));
        });
    });
}

} // namespace jukebox

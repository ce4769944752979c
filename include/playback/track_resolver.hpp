#pragma once

#include "utils/scheduler.hpp"
#include "voice/voice_types.hpp"
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace jukebox {

struct ResolverConfig {
    std::string ytdlp_path = "yt-dlp";
    int search_results = 5;
    int playlist_limit = 100;
};

// Metadata lookup through yt-dlp: searches, single videos and playlists.
class TrackResolver {
public:
    using Callback = std::function<void(std::exception_ptr, std::vector<Track>)>;

    TrackResolver(ResolverConfig config, Scheduler& scheduler, BlockingExecutor executor);

    // URL -> that video (or the playlist's entries); anything else -> first search hit
    void resolve(const std::string& query, Callback done);
    void search(const std::string& query, int limit, Callback done);

    std::string build_command(const std::string& query, int limit) const;

    // One JSON object per line, as printed by --print-json / --flat-playlist -j
    static std::vector<Track> parse_tracks(const std::string& output);
    static bool is_url(const std::string& query);
    static bool is_playlist_url(const std::string& url);
    static std::optional<std::string> extract_video_id(const std::string& url);

private:
    ResolverConfig config_;
    Scheduler& scheduler_;
    BlockingExecutor executor_;

    void run(std::string command, Callback done);
};

} // namespace jukebox

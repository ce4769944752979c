#include "errors.hpp"
#include "playback/track_resolver.hpp"
#include "support/manual_scheduler.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace jukebox;
using namespace jukebox::testing;

TEST(TrackResolverTest, ParsesYtDlpJsonLines) {
    std::string output =
        R"({"id": "dQw4w9WgXcQ", "title": "Never Gonna Give You Up", "webpage_url": "https://www.youtube.com/watch?v=dQw4w9WgXcQ", "duration": 212.0, "thumbnail": "https://i.ytimg.com/vi/dQw4w9WgXcQ/hq.jpg", "channel": "Rick Astley"})"
        "\n"
        "WARNING: something noisy\n"
        R"({"id": "aaaaaaaaaaa", "title": "Flat entry", "url": "aaaaaaaaaaa", "uploader": "Someone", "thumbnails": [{"url": "small"}, {"url": "large"}]})"
        "\n"
        "{broken json\n";

    auto tracks = TrackResolver::parse_tracks(output);
    ASSERT_EQ(tracks.size(), 2u);

    EXPECT_EQ(tracks[0].id, "dQw4w9WgXcQ");
    EXPECT_EQ(tracks[0].title, "Never Gonna Give You Up");
    EXPECT_EQ(tracks[0].duration_seconds, 212);
    EXPECT_EQ(tracks[0].channel, "Rick Astley");
    EXPECT_EQ(tracks[0].thumbnail_url, "https://i.ytimg.com/vi/dQw4w9WgXcQ/hq.jpg");

    // Flat playlist entries carry a bare id in "url"
    EXPECT_EQ(tracks[1].source_url, "https://www.youtube.com/watch?v=aaaaaaaaaaa");
    EXPECT_EQ(tracks[1].channel, "Someone");
    EXPECT_EQ(tracks[1].thumbnail_url, "large");
    EXPECT_EQ(tracks[1].duration_seconds, 0);
}

TEST(TrackResolverTest, ClassifiesQueries) {
    EXPECT_TRUE(TrackResolver::is_url("https://youtu.be/dQw4w9WgXcQ"));
    EXPECT_FALSE(TrackResolver::is_url("never gonna give you up"));

    EXPECT_TRUE(TrackResolver::is_playlist_url("https://www.youtube.com/playlist?list=PL123"));
    EXPECT_FALSE(TrackResolver::is_playlist_url("https://www.youtube.com/watch?v=dQw4w9WgXcQ&list=PL123"));
}

TEST(TrackResolverTest, ExtractsVideoIds) {
    EXPECT_EQ(TrackResolver::extract_video_id("https://www.youtube.com/watch?v=dQw4w9WgXcQ&t=42"),
              std::optional<std::string>("dQw4w9WgXcQ"));
    EXPECT_EQ(TrackResolver::extract_video_id("https://youtu.be/dQw4w9WgXcQ?si=abc"),
              std::optional<std::string>("dQw4w9WgXcQ"));
    EXPECT_EQ(TrackResolver::extract_video_id("https://www.youtube.com/shorts/dQw4w9WgXcQ"),
              std::optional<std::string>("dQw4w9WgXcQ"));
    EXPECT_FALSE(TrackResolver::extract_video_id("https://www.youtube.com/watch?v=short").has_value());
    EXPECT_FALSE(TrackResolver::extract_video_id("https://example.com/").has_value());
}

TEST(TrackResolverTest, BuildsCommandsPerQueryKind) {
    ManualScheduler scheduler;
    TrackResolver resolver(ResolverConfig{}, scheduler, [](Task task) { task(); });

    std::string search = resolver.build_command("rick astley", 5);
    EXPECT_NE(search.find("'ytsearch5:rick astley'"), std::string::npos);

    std::string video = resolver.build_command("https://youtu.be/dQw4w9WgXcQ", 1);
    EXPECT_NE(video.find("--no-playlist"), std::string::npos);

    std::string playlist = resolver.build_command("https://www.youtube.com/playlist?list=PL1", 1);
    EXPECT_NE(playlist.find("--flat-playlist"), std::string::npos);
    EXPECT_NE(playlist.find("--playlist-end 100"), std::string::npos);
}

TEST(TrackResolverTest, EmptyOutputIsNoResults) {
    ManualScheduler scheduler;
    ResolverConfig config;
    config.ytdlp_path = "true";
    TrackResolver resolver(config, scheduler, [](Task task) { task(); });

    bool done = false;
    std::exception_ptr error;
    resolver.resolve("nothing matches this", [&](std::exception_ptr e, std::vector<Track> tracks) {
        done = true;
        error = e;
        EXPECT_TRUE(tracks.empty());
    });
    EXPECT_FALSE(done);

    scheduler.run_pending();
    ASSERT_TRUE(done);
    EXPECT_THROW(std::rethrow_exception(error), ExtractionError);
}

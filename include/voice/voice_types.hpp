#pragma once

#include <dpp/snowflake.h>
#include <string>

namespace jukebox {

// Immutable once queued
struct Track {
    std::string id;
    std::string title;
    std::string source_url;
    int duration_seconds = 0;
    std::string thumbnail_url;
    std::string channel;
    dpp::snowflake requested_by = 0;
};

struct VoiceChannelRef {
    dpp::snowflake guild_id = 0;
    dpp::snowflake channel_id = 0;
};

enum class ConnectionState {
    Connecting,
    Signalling,
    Ready,
    Disconnected,
    Destroyed
};

enum class PlayerState {
    Idle,
    Buffering,
    Playing,
    Paused,
    AutoPaused
};

const char* to_string(ConnectionState state);
const char* to_string(PlayerState state);

} // namespace jukebox

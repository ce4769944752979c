#include "voice/voice_types.hpp"

namespace jukebox {

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Signalling: return "signalling";
        case ConnectionState::Ready: return "ready";
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Destroyed: return "destroyed";
    }
    return "unknown";
}

const char* to_string(PlayerState state) {
    switch (state) {
        case PlayerState::Idle: return "idle";
        case PlayerState::Buffering: return "buffering";
        case PlayerState::Playing: return "playing";
        case PlayerState::Paused: return "paused";
        case PlayerState::AutoPaused: return "autopaused";
    }
    return "unknown";
}

} // namespace jukebox

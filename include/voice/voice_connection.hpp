#pragma once

#include "playback/audio_stream.hpp"
#include "utils/event_channel.hpp"
#include "voice/voice_types.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace jukebox {

struct ConnectionStateChanged {
    ConnectionState old_state;
    ConnectionState new_state;
};

struct PlayerStateChanged {
    PlayerState old_state;
    PlayerState new_state;
};

struct PlayerErrored {
    std::string message;
};

using PlayerEvent = std::variant<PlayerStateChanged, PlayerErrored>;

// A stream queued on a player, tagged with the track it plays
struct AudioResource {
    std::unique_ptr<AudioStream> stream;
    std::optional<Track> track;
};

// Where the player writes PCM frames. Called from the player's pump thread.
class AudioSink {
public:
    virtual ~AudioSink() = default;

    virtual bool ready() const = 0;
    virtual void send_pcm(const uint8_t* data, size_t size) = 0;
    // Drop audio queued but not yet sent
    virtual void discard() = 0;
    // Audio already queued but not yet sent
    virtual double buffered_seconds() const = 0;
};

// Player events are delivered on the scheduler.
class AudioPlayer {
public:
    virtual ~AudioPlayer() = default;

    virtual void play(AudioResource resource) = 0;
    // force also discards audio already handed to the sink
    virtual void stop(bool force = false) = 0;
    virtual bool pause() = 0;
    virtual bool unpause() = 0;
    virtual PlayerState state() const = 0;

    virtual void attach_sink(AudioSink* sink) = 0;
    virtual Subscription subscribe(std::function<void(const PlayerEvent&)> handler) = 0;
};

// One guild's voice connection. State events are delivered on the scheduler.
class VoiceConnection {
public:
    virtual ~VoiceConnection() = default;

    virtual ConnectionState state() const = 0;
    virtual const VoiceChannelRef& channel() const = 0;

    // Route the player's output into this connection
    virtual void subscribe_player(AudioPlayer& player) = 0;
    virtual void destroy() = 0;

    virtual Subscription subscribe(std::function<void(const ConnectionStateChanged&)> handler) = 0;
};

// Creates connections and players for the session manager
class VoiceTransport {
public:
    virtual ~VoiceTransport() = default;

    virtual std::unique_ptr<VoiceConnection> connect(const VoiceChannelRef& channel) = 0;
    virtual std::unique_ptr<AudioPlayer> create_player() = 0;
};

} // namespace jukebox

#pragma once

#include "playback/strategy_coordinator.hpp"
#include "utils/event_channel.hpp"
#include "utils/scheduler.hpp"
#include "voice/voice_connection.hpp"
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace jukebox {

struct VoiceSessionConfig {
    Duration idle_timeout{300000};
    // How long a dropped connection may take to start signalling again
    Duration reconnect_window{5000};
    // Delay between a player error and the finish signal
    Duration error_grace{1000};
};

// Emitted when the current track ends, normally or through an error. The
// queue advances on this.
struct TrackFinished {
    dpp::snowflake guild_id = 0;
    std::optional<Track> track;
    bool errored = false;
};

struct SessionClosed {
    dpp::snowflake guild_id = 0;
    std::string reason;
};

using SessionEvent = std::variant<TrackFinished, SessionClosed>;

// Per-guild voice session state machine. Owns one connection and one
// player per guild; must be used from the scheduler thread.
class VoiceSessionManager {
public:
    using PlayCallback = std::function<void(std::exception_ptr, PlaybackMethod)>;

    VoiceSessionManager(VoiceSessionConfig config, Scheduler& scheduler, VoiceTransport& transport,
                        PlaybackSource& source);
    ~VoiceSessionManager();

    VoiceSessionManager(const VoiceSessionManager&) = delete;
    VoiceSessionManager& operator=(const VoiceSessionManager&) = delete;

    // Replaces any existing connection for the guild; the player is kept
    VoiceConnection& join(const VoiceChannelRef& channel);
    void leave(dpp::snowflake guild_id);

    // Throws NotConnectedError when the guild has no session
    void play(const Track& track, dpp::snowflake guild_id, PlayCallback done);
    void skip(dpp::snowflake guild_id);

    bool pause(dpp::snowflake guild_id);
    bool resume(dpp::snowflake guild_id);
    void stop_all();

    bool is_playing(dpp::snowflake guild_id) const;
    bool has_session(dpp::snowflake guild_id) const;
    std::optional<Track> current_track(dpp::snowflake guild_id) const;
    std::optional<ConnectionState> connection_state(dpp::snowflake guild_id) const;
    std::optional<PlayerState> player_state(dpp::snowflake guild_id) const;
    std::optional<TimePoint> idle_deadline(dpp::snowflake guild_id) const;
    size_t session_count() const { return sessions_.size(); }

    // Throws NotConnectedError when the guild has no session
    Subscription subscribe(dpp::snowflake guild_id, std::function<void(const SessionEvent&)> handler);

private:
    struct GuildSession {
        explicit GuildSession(Scheduler& scheduler) : timers(scheduler) {}

        VoiceChannelRef channel;
        std::unique_ptr<VoiceConnection> connection;
        std::unique_ptr<AudioPlayer> player;
        std::optional<Track> current_track;
        TimerRegistry timers;
        EventChannel<SessionEvent> events;
        Subscription connection_events;
        Subscription player_events;
        Subscription stream_errors;
        uint64_t play_generation = 0;
        bool error_pending = false;
    };

    VoiceSessionConfig config_;
    Scheduler& scheduler_;
    VoiceTransport& transport_;
    PlaybackSource& source_;
    std::map<dpp::snowflake, std::unique_ptr<GuildSession>> sessions_;
    uint64_t next_generation_ = 0;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    GuildSession* find(dpp::snowflake guild_id) const;
    GuildSession& require(dpp::snowflake guild_id) const;

    void on_connection_state(dpp::snowflake guild_id, const ConnectionStateChanged& change);
    void on_player_event(dpp::snowflake guild_id, const PlayerEvent& event);
    void on_player_error(dpp::snowflake guild_id, const std::string& message);
    void on_stream_failure(dpp::snowflake guild_id, uint64_t generation, const std::string& message);
    void on_playback_ready(dpp::snowflake guild_id, uint64_t generation, const Track& track,
                           std::exception_ptr error, PlaybackResult result, const PlayCallback& done);

    void start_idle_timer(GuildSession& session);
    void release_connection(GuildSession& session);
    void close_session(dpp::snowflake guild_id, const std::string& reason, bool notify = true);
};

} // namespace jukebox

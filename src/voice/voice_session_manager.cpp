#include "voice/voice_session_manager.hpp"
#include "errors.hpp"
#include "utils/logger.hpp"

namespace jukebox {

namespace {

std::string guild_str(dpp::snowflake guild_id) {
    return std::to_string(static_cast<uint64_t>(guild_id));
}

} // namespace

VoiceSessionManager::VoiceSessionManager(VoiceSessionConfig config, Scheduler& scheduler,
                                         VoiceTransport& transport, PlaybackSource& source)
    : config_(config)
    , scheduler_(scheduler)
    , transport_(transport)
    , source_(source)
{}

VoiceSessionManager::~VoiceSessionManager() {
    *alive_ = false;
    while (!sessions_.empty()) {
        close_session(sessions_.begin()->first, "shutdown", false);
    }
}

VoiceSessionManager::GuildSession* VoiceSessionManager::find(dpp::snowflake guild_id) const {
    auto it = sessions_.find(guild_id);
    return it != sessions_.end() ? it->second.get() : nullptr;
}

VoiceSessionManager::GuildSession& VoiceSessionManager::require(dpp::snowflake guild_id) const {
    GuildSession* session = find(guild_id);
    if (!session || !session->connection || !session->player) {
        throw NotConnectedError("Not connected to a voice channel in guild " + guild_str(guild_id));
    }
    return *session;
}

// ==================== Lifecycle ====================

VoiceConnection& VoiceSessionManager::join(const VoiceChannelRef& channel) {
    dpp::snowflake guild_id = channel.guild_id;
    log_info("Joining voice channel " + std::to_string(static_cast<uint64_t>(channel.channel_id)) +
             " in guild " + guild_str(guild_id));

    GuildSession* session = find(guild_id);
    if (session) {
        // The old connection goes before the new one is stored
        release_connection(*session);
    } else {
        auto created = std::make_unique<GuildSession>(scheduler_);
        session = created.get();
        sessions_[guild_id] = std::move(created);
    }
    session->channel = channel;

    try {
        session->connection = transport_.connect(channel);
    } catch (const std::exception& e) {
        log_error("Failed to join voice in guild " + guild_str(guild_id) + ": " + e.what());
        close_session(guild_id, std::string("join failed: ") + e.what());
        throw;
    }

    session->connection_events = session->connection->subscribe([this, guild_id](const ConnectionStateChanged& change) {
        on_connection_state(guild_id, change);
    });

    if (!session->player) {
        session->player = transport_.create_player();
        session->player_events = session->player->subscribe([this, guild_id](const PlayerEvent& event) {
            on_player_event(guild_id, event);
        });
    }
    session->connection->subscribe_player(*session->player);

    session->timers.clear("idle");
    return *session->connection;
}

void VoiceSessionManager::leave(dpp::snowflake guild_id) {
    if (!find(guild_id)) return;
    log_info("Leaving voice in guild " + guild_str(guild_id));
    close_session(guild_id, "left");
}

void VoiceSessionManager::stop_all() {
    while (!sessions_.empty()) {
        close_session(sessions_.begin()->first, "stopped");
    }
}

void VoiceSessionManager::release_connection(GuildSession& session) {
    session.timers.clear("reconnect");
    // Unsubscribe first so our own destroy() is not seen as a state change
    session.connection_events.reset();
    if (session.connection) {
        session.connection->destroy();
        session.connection.reset();
    }
}

void VoiceSessionManager::close_session(dpp::snowflake guild_id, const std::string& reason, bool notify) {
    auto it = sessions_.find(guild_id);
    if (it == sessions_.end()) return;

    std::unique_ptr<GuildSession> session = std::move(it->second);
    sessions_.erase(it);

    session->timers.clear_all();
    session->stream_errors.reset();
    session->player_events.reset();
    if (session->player) {
        session->player->stop(true);
    }
    release_connection(*session);
    session->current_track.reset();

    if (notify) {
        session->events.emit(SessionClosed{guild_id, reason});
    }
    session->events.clear();
}

// ==================== Playback ====================

void VoiceSessionManager::play(const Track& track, dpp::snowflake guild_id, PlayCallback done) {
    GuildSession& session = require(guild_id);
    session.timers.clear("idle");

    uint64_t generation = ++next_generation_;
    session.play_generation = generation;
    log_info("Attempting to play " + track.title + " in guild " + guild_str(guild_id));

    std::weak_ptr<bool> alive = alive_;
    source_.attempt_playback(track, session.channel,
        [this, alive, guild_id, generation, track, done](std::exception_ptr error, PlaybackResult result) {
            auto flag = alive.lock();
            if (!flag || !*flag) {
                if (result.stream) result.stream->close();
                return;
            }
            on_playback_ready(guild_id, generation, track, error, std::move(result), done);
        });
}

void VoiceSessionManager::on_playback_ready(dpp::snowflake guild_id, uint64_t generation, const Track& track,
                                            std::exception_ptr error, PlaybackResult result,
                                            const PlayCallback& done) {
    GuildSession* session = find(guild_id);
    if (!session || !session->player || !session->connection) {
        if (result.stream) result.stream->close();
        done(error ? error : std::make_exception_ptr(ConnectionLostError(
            "Voice session in guild " + guild_str(guild_id) + " closed before playback started")),
            result.method);
        return;
    }

    if (session->play_generation != generation) {
        if (result.stream) result.stream->close();
        done(error ? error : std::make_exception_ptr(PlaybackError("Superseded by a newer play request")),
             result.method);
        return;
    }

    if (error) {
        log_error("Playback of " + track.title + " failed in guild " + guild_str(guild_id) + ": " +
                  error_message(error));
        if (session->player->state() == PlayerState::Idle) {
            start_idle_timer(*session);
        }
        done(error, result.method);
        return;
    }

    // Errors arrive on the player's thread
    std::weak_ptr<bool> alive = alive_;
    session->stream_errors = result.stream->on_error([this, alive, guild_id, generation](const StreamFailure& failure) {
        std::string message = failure.message;
        scheduler_.post([this, alive, guild_id, generation, message]() {
            auto flag = alive.lock();
            if (flag && *flag) on_stream_failure(guild_id, generation, message);
        });
    });

    PlaybackMethod method = result.method;
    session->current_track = track;
    session->player->play(AudioResource{std::move(result.stream), track});
    log_info("Started playing " + track.title + " in guild " + guild_str(guild_id) + " via " +
             history_label(method));
    done(nullptr, method);
}

void VoiceSessionManager::on_stream_failure(dpp::snowflake guild_id, uint64_t generation, const std::string& message) {
    GuildSession* session = find(guild_id);
    if (!session || session->play_generation != generation || !session->player) return;

    // Same path as a player error, so the track finishes after the grace delay
    on_player_error(guild_id, "stream failed: " + message);
}

void VoiceSessionManager::skip(dpp::snowflake guild_id) {
    GuildSession& session = require(guild_id);
    session.player->stop();
}

bool VoiceSessionManager::pause(dpp::snowflake guild_id) {
    GuildSession* session = find(guild_id);
    return session && session->player && session->player->pause();
}

bool VoiceSessionManager::resume(dpp::snowflake guild_id) {
    GuildSession* session = find(guild_id);
    return session && session->player && session->player->unpause();
}

// ==================== State machines ====================

void VoiceSessionManager::on_connection_state(dpp::snowflake guild_id, const ConnectionStateChanged& change) {
    GuildSession* session = find(guild_id);
    if (!session) return;

    switch (change.new_state) {
        case ConnectionState::Disconnected:
            log_warning("Voice connection lost in guild " + guild_str(guild_id) + ", waiting for recovery");
            session->timers.arm("reconnect", config_.reconnect_window, [this, guild_id]() {
                log_warning("Voice connection in guild " + guild_str(guild_id) + " did not recover");
                close_session(guild_id, "connection lost");
            });
            break;

        case ConnectionState::Signalling:
        case ConnectionState::Connecting:
        case ConnectionState::Ready:
            session->timers.clear("reconnect");
            break;

        case ConnectionState::Destroyed:
            close_session(guild_id, "connection destroyed");
            break;
    }
}

void VoiceSessionManager::on_player_event(dpp::snowflake guild_id, const PlayerEvent& event) {
    if (auto* errored = std::get_if<PlayerErrored>(&event)) {
        on_player_error(guild_id, errored->message);
        return;
    }

    const auto& change = std::get<PlayerStateChanged>(event);
    GuildSession* session = find(guild_id);
    if (!session) return;

    if (change.new_state == PlayerState::Playing) {
        session->timers.clear("idle");
        return;
    }

    if (change.new_state != PlayerState::Idle || change.old_state == PlayerState::Idle) {
        return;
    }

    session->stream_errors.reset();
    if (!session->error_pending) {
        std::optional<Track> finished = std::move(session->current_track);
        session->current_track.reset();
        session->events.emit(TrackFinished{guild_id, std::move(finished), false});

        // A handler may have closed the session or started the next track
        session = find(guild_id);
        if (!session) return;
    }

    if (session->player->state() == PlayerState::Idle) {
        start_idle_timer(*session);
    }
}

void VoiceSessionManager::on_player_error(dpp::snowflake guild_id, const std::string& message) {
    GuildSession* session = find(guild_id);
    if (!session || session->error_pending) return;

    log_error("Audio player error in guild " + guild_str(guild_id) + ": " + message);
    session->error_pending = true;
    std::optional<Track> failed = std::move(session->current_track);
    session->current_track.reset();
    session->player->stop(true);

    session->timers.arm("error", config_.error_grace, [this, guild_id, failed]() {
        GuildSession* current = find(guild_id);
        if (!current) return;
        current->error_pending = false;
        current->events.emit(TrackFinished{guild_id, failed, true});
    });
}

void VoiceSessionManager::start_idle_timer(GuildSession& session) {
    dpp::snowflake guild_id = session.channel.guild_id;
    session.timers.arm("idle", config_.idle_timeout, [this, guild_id]() {
        log_info("Auto-disconnecting from guild " + guild_str(guild_id) + " due to inactivity");
        close_session(guild_id, "idle");
    });
}

// ==================== Queries ====================

bool VoiceSessionManager::is_playing(dpp::snowflake guild_id) const {
    GuildSession* session = find(guild_id);
    return session && session->player && session->player->state() == PlayerState::Playing;
}

bool VoiceSessionManager::has_session(dpp::snowflake guild_id) const {
    return find(guild_id) != nullptr;
}

std::optional<Track> VoiceSessionManager::current_track(dpp::snowflake guild_id) const {
    GuildSession* session = find(guild_id);
    return session ? session->current_track : std::nullopt;
}

std::optional<ConnectionState> VoiceSessionManager::connection_state(dpp::snowflake guild_id) const {
    GuildSession* session = find(guild_id);
    if (!session || !session->connection) return std::nullopt;
    return session->connection->state();
}

std::optional<PlayerState> VoiceSessionManager::player_state(dpp::snowflake guild_id) const {
    GuildSession* session = find(guild_id);
    if (!session || !session->player) return std::nullopt;
    return session->player->state();
}

std::optional<TimePoint> VoiceSessionManager::idle_deadline(dpp::snowflake guild_id) const {
    GuildSession* session = find(guild_id);
    if (!session) return std::nullopt;
    return session->timers.deadline("idle");
}

Subscription VoiceSessionManager::subscribe(dpp::snowflake guild_id, std::function<void(const SessionEvent&)> handler) {
    GuildSession* session = find(guild_id);
    if (!session) {
        throw NotConnectedError("No voice session in guild " + guild_str(guild_id));
    }
    return session->events.subscribe(std::move(handler));
}

} // namespace jukebox

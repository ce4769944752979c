#pragma once

#include "playback/track_resolver.hpp"
#include "utils/event_channel.hpp"
#include "utils/scheduler.hpp"
#include "voice/voice_session_manager.hpp"
#include <dpp/dpp.h>
#include <deque>
#include <map>
#include <memory>
#include <string>

namespace jukebox {

struct GuildQueue {
    std::deque<Track> tracks;
    dpp::snowflake text_channel_id = 0;
    Subscription session_events;
    // A play request is waiting on the coordinator
    bool starting = false;
};

// Slash-command front end over the voice session manager. Commands are
// registered out of band; this only handles them. Everything past
// handle_command runs on the scheduler.
class MusicModule {
public:
    MusicModule(dpp::cluster& bot, Scheduler& scheduler, VoiceSessionManager& voice, TrackResolver& resolver);
    ~MusicModule();

    bool handles(const std::string& command) const;

    // Called from D++ threads
    void handle_command(const dpp::slashcommand_t& event);

private:
    dpp::cluster& bot_;
    Scheduler& scheduler_;
    VoiceSessionManager& voice_;
    TrackResolver& resolver_;
    std::map<dpp::snowflake, std::unique_ptr<GuildQueue>> queues_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    // Command handlers
    void cmd_play(const dpp::slashcommand_t& event);
    void cmd_pause(const dpp::slashcommand_t& event);
    void cmd_resume(const dpp::slashcommand_t& event);
    void cmd_skip(const dpp::slashcommand_t& event);
    void cmd_queue(const dpp::slashcommand_t& event);
    void cmd_nowplaying(const dpp::slashcommand_t& event);
    void cmd_join(const dpp::slashcommand_t& event);
    void cmd_leave(const dpp::slashcommand_t& event);

    // Join the caller's channel if the guild has no session yet
    bool ensure_session(const dpp::slashcommand_t& event);
    GuildQueue& queue_for(dpp::snowflake guild_id);
    void enqueue(dpp::snowflake guild_id, std::vector<Track> tracks);
    void play_next(dpp::snowflake guild_id);
    void on_session_event(dpp::snowflake guild_id, const SessionEvent& event);
    void announce(dpp::snowflake guild_id, const dpp::message& message);
};

} // namespace jukebox

#include "modules/music.hpp"
#include "errors.hpp"
#include "utils/common.hpp"
#include "utils/logger.hpp"
#include "utils/string_utils.hpp"

namespace jukebox {

namespace {

const size_t kQueuePageSize = 10;

dpp::embed track_embed(const std::string& heading, const Track& track) {
    dpp::embed embed;
    embed.set_title(heading)
         .set_description("**" + string_utils::escape_markdown(track.title) + "**")
         .add_field("Duration", format_track_duration(track.duration_seconds), true)
         .set_color(0x0099ff);

    if (!track.channel.empty()) {
        embed.add_field("Channel", track.channel, true);
    }
    if (track.requested_by != 0) {
        embed.add_field("Requested by", "<@" + snowflake_to_string(track.requested_by) + ">", true);
    }
    if (!track.thumbnail_url.empty()) {
        embed.set_thumbnail(track.thumbnail_url);
    }
    return embed;
}

// Deferred commands must edit their response instead of replying
void respond(const dpp::slashcommand_t& event, const std::string& cmd, const dpp::message& message) {
    if (cmd == "play") {
        event.edit_response(message);
    } else {
        event.reply(message);
    }
}

} // namespace

MusicModule::MusicModule(dpp::cluster& bot, Scheduler& scheduler, VoiceSessionManager& voice, TrackResolver& resolver)
    : bot_(bot)
    , scheduler_(scheduler)
    , voice_(voice)
    , resolver_(resolver)
{}

MusicModule::~MusicModule() {
    *alive_ = false;
}

bool MusicModule::handles(const std::string& cmd) const {
    return cmd == "play" || cmd == "pause" || cmd == "resume" || cmd == "skip" ||
           cmd == "queue" || cmd == "nowplaying" || cmd == "join" || cmd == "leave";
}

void MusicModule::handle_command(const dpp::slashcommand_t& event) {
    std::string cmd = event.command.get_command_name();
    if (cmd == "play") {
        // Lookups take longer than the interaction deadline
        event.thinking();
    }

    std::weak_ptr<bool> alive = alive_;
    scheduler_.post([this, alive, event, cmd]() {
        auto flag = alive.lock();
        if (!flag || !*flag) return;

        try {
            if (cmd == "play") cmd_play(event);
            else if (cmd == "pause") cmd_pause(event);
            else if (cmd == "resume") cmd_resume(event);
            else if (cmd == "skip") cmd_skip(event);
            else if (cmd == "queue") cmd_queue(event);
            else if (cmd == "nowplaying") cmd_nowplaying(event);
            else if (cmd == "join") cmd_join(event);
            else if (cmd == "leave") cmd_leave(event);
        } catch (const NotConnectedError&) {
            respond(event, cmd, error_embed("Not Connected", "I'm not in a voice channel. Use `/join` first."));
        } catch (const std::exception& e) {
            log_error("Command /" + cmd + " failed: " + e.what());
            respond(event, cmd, error_embed("Error", "Something went wrong."));
        }
    });
}

// ==================== Queue ====================

GuildQueue& MusicModule::queue_for(dpp::snowflake guild_id) {
    auto& queue = queues_[guild_id];
    if (!queue) {
        queue = std::make_unique<GuildQueue>();
    }
    return *queue;
}

bool MusicModule::ensure_session(const dpp::slashcommand_t& event) {
    dpp::snowflake guild_id = event.command.guild_id;
    GuildQueue& queue = queue_for(guild_id);
    queue.text_channel_id = event.command.channel_id;

    if (voice_.has_session(guild_id)) {
        return true;
    }

    auto channel_id = find_user_voice_channel(guild_id, event.command.get_issuing_user().id);
    if (!channel_id) {
        return false;
    }

    voice_.join(VoiceChannelRef{guild_id, *channel_id});
    queue.session_events = voice_.subscribe(guild_id, [this, guild_id](const SessionEvent& session_event) {
        on_session_event(guild_id, session_event);
    });
    return true;
}

void MusicModule::enqueue(dpp::snowflake guild_id, std::vector<Track> tracks) {
    GuildQueue& queue = queue_for(guild_id);
    for (auto& track : tracks) {
        queue.tracks.push_back(std::move(track));
    }

    if (!queue.starting && !voice_.current_track(guild_id) && !voice_.is_playing(guild_id)) {
        play_next(guild_id);
    }
}

void MusicModule::play_next(dpp::snowflake guild_id) {
    auto it = queues_.find(guild_id);
    if (it == queues_.end() || it->second->tracks.empty()) {
        return;
    }

    GuildQueue& queue = *it->second;
    Track track = queue.tracks.front();
    queue.tracks.pop_front();
    queue.starting = true;

    std::weak_ptr<bool> alive = alive_;
    voice_.play(track, guild_id, [this, alive, guild_id, track](std::exception_ptr error, PlaybackMethod method) {
        auto flag = alive.lock();
        if (!flag || !*flag) return;

        auto current = queues_.find(guild_id);
        if (current == queues_.end()) return;
        current->second->starting = false;

        if (error) {
            announce(guild_id, error_embed("Playback Failed",
                "Could not play **" + string_utils::escape_markdown(track.title) + "**: " +
                string_utils::truncate(error_message(error), 200)));
            play_next(guild_id);
            return;
        }

        dpp::embed embed = track_embed("Now Playing", track);
        if (method == PlaybackMethod::Relay) {
            embed.set_footer(dpp::embed_footer().set_text("Played through relay"));
        }
        announce(guild_id, dpp::message().add_embed(embed));
    });
}

void MusicModule::on_session_event(dpp::snowflake guild_id, const SessionEvent& event) {
    if (std::holds_alternative<TrackFinished>(event)) {
        play_next(guild_id);
        return;
    }

    const auto& closed = std::get<SessionClosed>(event);
    log_info("Voice session in guild " + snowflake_to_string(guild_id) + " closed (" + closed.reason + ")");
    // Subscription dies with the queue; the channel tolerates that mid-emit
    queues_.erase(guild_id);
}

void MusicModule::announce(dpp::snowflake guild_id, const dpp::message& message) {
    auto it = queues_.find(guild_id);
    if (it == queues_.end() || it->second->text_channel_id == 0) return;

    dpp::message msg = message;
    msg.set_channel_id(it->second->text_channel_id);
    bot_.message_create(msg, [](const dpp::confirmation_callback_t& callback) {
        if (callback.is_error()) {
            log_warning("Failed to send music update: " + callback.get_error().message);
        }
    });
}

// ==================== Command handlers ====================

void MusicModule::cmd_play(const dpp::slashcommand_t& event) {
    std::string query = string_utils::trim(std::get<std::string>(event.get_parameter("query")));
    dpp::snowflake guild_id = event.command.guild_id;

    if (!ensure_session(event)) {
        event.edit_response(error_embed("Not in Voice", "You must be in a voice channel."));
        return;
    }

    dpp::snowflake requester = event.command.get_issuing_user().id;
    std::weak_ptr<bool> alive = alive_;
    resolver_.resolve(query, [this, alive, event, query, guild_id, requester](std::exception_ptr error,
                                                                            std::vector<Track> tracks) {
        auto flag = alive.lock();
        if (!flag || !*flag) return;

        if (error || tracks.empty()) {
            event.edit_response(error_embed("Not Found", "Could not find a track for: " + query));
            return;
        }
        if (!voice_.has_session(guild_id)) {
            event.edit_response(error_embed("Not Connected", "The voice session ended before the track was found."));
            return;
        }

        for (auto& track : tracks) {
            track.requested_by = requester;
        }

        if (tracks.size() == 1) {
            event.edit_response(dpp::message().add_embed(track_embed("Added to Queue", tracks.front())));
        } else {
            event.edit_response(success_embed("Playlist Queued",
                "Added " + std::to_string(tracks.size()) + " tracks to the queue."));
        }
        enqueue(guild_id, std::move(tracks));
    });
}

void MusicModule::cmd_pause(const dpp::slashcommand_t& event) {
    if (!voice_.pause(event.command.guild_id)) {
        event.reply(error_embed("Nothing Playing", "There's nothing playing right now."));
        return;
    }
    event.reply(success_embed("Paused", "Playback paused."));
}

void MusicModule::cmd_resume(const dpp::slashcommand_t& event) {
    if (!voice_.resume(event.command.guild_id)) {
        event.reply(error_embed("Not Paused", "Playback is not paused."));
        return;
    }
    event.reply(success_embed("Resumed", "Playback resumed."));
}

void MusicModule::cmd_skip(const dpp::slashcommand_t& event) {
    dpp::snowflake guild_id = event.command.guild_id;
    auto current = voice_.current_track(guild_id);

    // Throws NotConnectedError without a session
    voice_.skip(guild_id);

    if (current) {
        event.reply(success_embed("Skipped", "Skipped **" + string_utils::escape_markdown(current->title) + "**."));
    } else {
        event.reply(info_embed("Skipped", "Nothing was playing."));
    }
}

void MusicModule::cmd_queue(const dpp::slashcommand_t& event) {
    dpp::snowflake guild_id = event.command.guild_id;
    auto current = voice_.current_track(guild_id);
    auto it = queues_.find(guild_id);

    if (!current && (it == queues_.end() || it->second->tracks.empty())) {
        event.reply(info_embed("Queue", "The queue is empty."));
        return;
    }

    std::string description;
    if (current) {
        description += "**Now:** " + string_utils::escape_markdown(current->title) +
                       " `" + format_track_duration(current->duration_seconds) + "`\n\n";
    }

    if (it != queues_.end()) {
        const auto& tracks = it->second->tracks;
        for (size_t i = 0; i < tracks.size() && i < kQueuePageSize; ++i) {
            description += std::to_string(i + 1) + ". " + string_utils::escape_markdown(tracks[i].title) +
                           " `" + format_track_duration(tracks[i].duration_seconds) + "`\n";
        }
        if (tracks.size() > kQueuePageSize) {
            description += "...and " + std::to_string(tracks.size() - kQueuePageSize) + " more";
        }
    }

    event.reply(info_embed("Queue", description));
}

void MusicModule::cmd_nowplaying(const dpp::slashcommand_t& event) {
    auto current = voice_.current_track(event.command.guild_id);
    if (!current) {
        event.reply(error_embed("Nothing Playing", "There's nothing playing right now."));
        return;
    }

    dpp::embed embed = track_embed("Now Playing", *current);
    if (auto state = voice_.player_state(event.command.guild_id)) {
        embed.add_field("Status", to_string(*state), true);
    }
    event.reply(dpp::message().add_embed(embed));
}

void MusicModule::cmd_join(const dpp::slashcommand_t& event) {
    dpp::snowflake guild_id = event.command.guild_id;
    auto channel_id = find_user_voice_channel(guild_id, event.command.get_issuing_user().id);
    if (!channel_id) {
        event.reply(error_embed("Not in Voice", "You must be in a voice channel."));
        return;
    }

    bool existing = voice_.has_session(guild_id);
    voice_.join(VoiceChannelRef{guild_id, *channel_id});

    GuildQueue& queue = queue_for(guild_id);
    queue.text_channel_id = event.command.channel_id;
    if (!existing) {
        queue.session_events = voice_.subscribe(guild_id, [this, guild_id](const SessionEvent& session_event) {
            on_session_event(guild_id, session_event);
        });
    }

    event.reply(success_embed("Joined", "Joined <#" + snowflake_to_string(*channel_id) + ">"));
}

void MusicModule::cmd_leave(const dpp::slashcommand_t& event) {
    dpp::snowflake guild_id = event.command.guild_id;
    voice_.leave(guild_id);
    queues_.erase(guild_id);
    event.reply(success_embed("Left", "Disconnected from voice channel."));
}

} // namespace jukebox

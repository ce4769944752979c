#include "voice/dpp_voice.hpp"
#include "errors.hpp"
#include "utils/logger.hpp"

namespace jukebox {

DppVoiceConnection::DppVoiceConnection(dpp::cluster& cluster, Scheduler& scheduler, VoiceChannelRef channel)
    : cluster_(cluster)
    , scheduler_(scheduler)
    , channel_(channel)
{}

DppVoiceConnection::~DppVoiceConnection() {
    *alive_ = false;
    detach_handlers();
    if (state_ != ConnectionState::Destroyed) {
        if (auto* client = shard()) {
            client->disconnect_voice(channel_.guild_id);
        }
    }
}

dpp::discord_client* DppVoiceConnection::shard() const {
    dpp::guild* guild = dpp::find_guild(channel_.guild_id);
    if (!guild) return nullptr;
    return cluster_.get_shard(guild->shard_id);
}

void DppVoiceConnection::start() {
    dpp::discord_client* client = shard();
    if (!client) {
        throw NotConnectedError("Guild " + std::to_string(static_cast<uint64_t>(channel_.guild_id)) + " is not available on any shard");
    }

    dpp::snowflake guild_id = channel_.guild_id;

    state_handle_ = cluster_.on_voice_state_update([this, guild_id](const dpp::voice_state_update_t& event) {
        if (event.state.guild_id != guild_id || event.state.user_id != cluster_.me.id) return;
        dpp::snowflake channel_id = event.state.channel_id;
        post([this, channel_id]() {
            if (state_ == ConnectionState::Destroyed) return;
            if (channel_id == 0) {
                set_voice_client(nullptr);
                set_state(ConnectionState::Disconnected);
                return;
            }
            channel_.channel_id = channel_id;
            if (state_ == ConnectionState::Disconnected) {
                set_state(ConnectionState::Signalling);
            }
        });
    });

    server_handle_ = cluster_.on_voice_server_update([this, guild_id](const dpp::voice_server_update_t& event) {
        if (event.guild_id != guild_id) return;
        post([this]() {
            if (state_ == ConnectionState::Destroyed || state_ == ConnectionState::Ready) return;
            set_state(ConnectionState::Connecting);
        });
    });

    ready_handle_ = cluster_.on_voice_ready([this, guild_id](const dpp::voice_ready_t& event) {
        if (!event.voice_client || event.voice_client->server_id != guild_id) return;
        set_voice_client(event.voice_client);
        post([this]() {
            if (state_ == ConnectionState::Destroyed) return;
            set_state(ConnectionState::Ready);
        });
    });

    disconnect_handle_ = cluster_.on_voice_client_disconnect([this, guild_id](const dpp::voice_client_disconnect_t& event) {
        if (!event.voice_client || event.voice_client->server_id != guild_id) return;
        set_voice_client(nullptr);
        post([this]() {
            if (state_ == ConnectionState::Destroyed) return;
            set_state(ConnectionState::Disconnected);
        });
    });

    log_info("Joining voice channel " + std::to_string(static_cast<uint64_t>(channel_.channel_id)) +
             " in guild " + std::to_string(static_cast<uint64_t>(guild_id)));
    client->connect_voice(guild_id, channel_.channel_id, false, true);
}

void DppVoiceConnection::subscribe_player(AudioPlayer& player) {
    if (player_ && player_ != &player) {
        player_->attach_sink(nullptr);
    }
    player_ = &player;
    player.attach_sink(this);
}

void DppVoiceConnection::destroy() {
    if (state_ == ConnectionState::Destroyed) return;

    detach_handlers();
    if (player_) {
        player_->attach_sink(nullptr);
        player_ = nullptr;
    }
    set_voice_client(nullptr);

    if (auto* client = shard()) {
        client->disconnect_voice(channel_.guild_id);
    }
    set_state(ConnectionState::Destroyed);
}

bool DppVoiceConnection::ready() const {
    std::lock_guard<std::mutex> lock(voice_mutex_);
    return voice_client_ && voice_client_->is_ready();
}

void DppVoiceConnection::send_pcm(const uint8_t* data, size_t size) {
    std::lock_guard<std::mutex> lock(voice_mutex_);
    if (!voice_client_) return;
    // send_audio_raw takes the length in bytes
    voice_client_->send_audio_raw(reinterpret_cast<uint16_t*>(const_cast<uint8_t*>(data)), size);
}

void DppVoiceConnection::discard() {
    std::lock_guard<std::mutex> lock(voice_mutex_);
    if (voice_client_) {
        voice_client_->stop_audio();
    }
}

double DppVoiceConnection::buffered_seconds() const {
    std::lock_guard<std::mutex> lock(voice_mutex_);
    return voice_client_ ? voice_client_->get_secs_remaining() : 0.0;
}

void DppVoiceConnection::post(std::function<void()> action) {
    std::weak_ptr<bool> alive = alive_;
    scheduler_.post([alive, action = std::move(action)]() {
        auto flag = alive.lock();
        if (flag && *flag) action();
    });
}

void DppVoiceConnection::detach_handlers() {
    if (state_handle_) cluster_.on_voice_state_update.detach(state_handle_);
    if (server_handle_) cluster_.on_voice_server_update.detach(server_handle_);
    if (ready_handle_) cluster_.on_voice_ready.detach(ready_handle_);
    if (disconnect_handle_) cluster_.on_voice_client_disconnect.detach(disconnect_handle_);
    state_handle_ = server_handle_ = ready_handle_ = disconnect_handle_ = 0;
}

void DppVoiceConnection::set_voice_client(dpp::discord_voice_client* client) {
    std::lock_guard<std::mutex> lock(voice_mutex_);
    voice_client_ = client;
}

void DppVoiceConnection::set_state(ConnectionState state) {
    if (state == state_) return;
    ConnectionState old_state = state_;
    state_ = state;
    log_debug("Voice connection " + std::to_string(static_cast<uint64_t>(channel_.guild_id)) + ": " +
              to_string(old_state) + " -> " + to_string(state));
    events_.emit(ConnectionStateChanged{old_state, state});
}

DppVoiceTransport::DppVoiceTransport(dpp::cluster& cluster, Scheduler& scheduler, PlayerConfig player_config)
    : cluster_(cluster)
    , scheduler_(scheduler)
    , player_config_(player_config)
{}

std::unique_ptr<VoiceConnection> DppVoiceTransport::connect(const VoiceChannelRef& channel) {
    auto connection = std::make_unique<DppVoiceConnection>(cluster_, scheduler_, channel);
    connection->start();
    return connection;
}

std::unique_ptr<AudioPlayer> DppVoiceTransport::create_player() {
    return std::make_unique<PcmAudioPlayer>(scheduler_, player_config_);
}

} // namespace jukebox

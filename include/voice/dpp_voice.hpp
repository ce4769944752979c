#pragma once

#include "utils/event_channel.hpp"
#include "utils/scheduler.hpp"
#include "voice/audio_player.hpp"
#include "voice/voice_connection.hpp"
#include <dpp/dpp.h>
#include <memory>
#include <mutex>

namespace jukebox {

// Voice connection backed by the D++ shard's voice client. Gateway events
// arrive on D++ threads and are forwarded to the scheduler.
class DppVoiceConnection : public VoiceConnection, public AudioSink {
public:
    DppVoiceConnection(dpp::cluster& cluster, Scheduler& scheduler, VoiceChannelRef channel);
    ~DppVoiceConnection() override;

    DppVoiceConnection(const DppVoiceConnection&) = delete;
    DppVoiceConnection& operator=(const DppVoiceConnection&) = delete;

    // Attach gateway handlers and ask the shard to join
    void start();

    ConnectionState state() const override { return state_; }
    const VoiceChannelRef& channel() const override { return channel_; }
    void subscribe_player(AudioPlayer& player) override;
    void destroy() override;
    Subscription subscribe(std::function<void(const ConnectionStateChanged&)> handler) override {
        return events_.subscribe(std::move(handler));
    }

    bool ready() const override;
    void send_pcm(const uint8_t* data, size_t size) override;
    void discard() override;
    double buffered_seconds() const override;

private:
    dpp::cluster& cluster_;
    Scheduler& scheduler_;
    VoiceChannelRef channel_;
    EventChannel<ConnectionStateChanged> events_;
    ConnectionState state_ = ConnectionState::Signalling;
    AudioPlayer* player_ = nullptr;

    mutable std::mutex voice_mutex_;
    dpp::discord_voice_client* voice_client_ = nullptr;

    dpp::event_handle state_handle_ = 0;
    dpp::event_handle server_handle_ = 0;
    dpp::event_handle ready_handle_ = 0;
    dpp::event_handle disconnect_handle_ = 0;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    dpp::discord_client* shard() const;
    void post(std::function<void()> action);
    void detach_handlers();
    void set_voice_client(dpp::discord_voice_client* client);
    void set_state(ConnectionState state);
};

class DppVoiceTransport : public VoiceTransport {
public:
    DppVoiceTransport(dpp::cluster& cluster, Scheduler& scheduler, PlayerConfig player_config = {});

    std::unique_ptr<VoiceConnection> connect(const VoiceChannelRef& channel) override;
    std::unique_ptr<AudioPlayer> create_player() override;

private:
    dpp::cluster& cluster_;
    Scheduler& scheduler_;
    PlayerConfig player_config_;
};

} // namespace jukebox

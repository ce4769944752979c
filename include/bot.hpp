#pragma once

#include "config.hpp"
#include <dpp/dpp.h>
#include <atomic>
#include <memory>
#include <vector>

namespace jukebox {

// Forward declarations
class AsioScheduler;
class ThreadPool;
class Database;
class WebhookNotifier;
class AudioRouter;
class YtDlpExtractor;
class RelayPool;
class PlaybackStrategyCoordinator;
class DppVoiceTransport;
class VoiceSessionManager;
class TrackResolver;
class MusicModule;
class RelayAdminModule;

// Owns every component and wires them together. Components are created in
// dependency order and destroyed in reverse.
class Bot {
public:
    explicit Bot(Config config);
    ~Bot();

    Bot(const Bot&) = delete;
    Bot& operator=(const Bot&) = delete;

    // Initialize and run the bot
    bool initialize();
    void run(const std::atomic<bool>& running);
    void shutdown();

private:
    Config config_;
    bool shut_down_ = false;

    std::unique_ptr<AsioScheduler> scheduler_;
    std::unique_ptr<ThreadPool> workers_;
    std::unique_ptr<Database> database_;
    std::unique_ptr<WebhookNotifier> notifier_;
    std::unique_ptr<AudioRouter> audio_router_;
    std::vector<std::unique_ptr<YtDlpExtractor>> extractors_;
    std::unique_ptr<RelayPool> relay_pool_;
    std::unique_ptr<PlaybackStrategyCoordinator> coordinator_;
    std::unique_ptr<dpp::cluster> cluster_;
    std::unique_ptr<DppVoiceTransport> voice_transport_;
    std::unique_ptr<VoiceSessionManager> voice_;
    std::unique_ptr<TrackResolver> resolver_;

    // Modules
    std::unique_ptr<MusicModule> music_module_;
    std::unique_ptr<RelayAdminModule> relay_admin_module_;

    // Event handlers
    void setup_event_handlers();
    void on_ready(const dpp::ready_t& event);
    void on_slashcommand(const dpp::slashcommand_t& event);

    // Initialize modules
    void init_core();
    void init_modules();
};

} // namespace jukebox

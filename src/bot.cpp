#include "bot.hpp"
#include "database.hpp"
#include "modules/music.hpp"
#include "modules/notifications.hpp"
#include "modules/relay_admin.hpp"
#include "playback/audio_router.hpp"
#include "playback/media_extractor.hpp"
#include "playback/strategy_coordinator.hpp"
#include "playback/track_resolver.hpp"
#include "relay/relay_pool.hpp"
#include "relay/relay_transport.hpp"
#include "utils/curl_helper.hpp"
#include "utils/logger.hpp"
#include "utils/scheduler.hpp"
#include "utils/thread_pool.hpp"
#include "voice/dpp_voice.hpp"
#include "voice/voice_session_manager.hpp"
#include <chrono>
#include <future>
#include <thread>

namespace jukebox {

Bot::Bot(Config config) : config_(std::move(config)) {}

Bot::~Bot() {
    shutdown();
}

bool Bot::initialize() {
    set_log_level(config_.get_log_level());

    // Initialize CURL
    CurlHelper::global_init();

    // Initialize database
    database_ = std::make_unique<Database>();
    if (!database_->initialize(config_.get_database_path())) {
        log_error("Failed to initialize database");
        return false;
    }

    // Create bot cluster
    cluster_ = std::make_unique<dpp::cluster>(
        config_.get_token(),
        dpp::i_default_intents | dpp::i_guild_voice_states
    );
    cluster_->on_log(dpp::utility::cout_logger());

    dpp::cluster* cluster = cluster_.get();
    set_log_sink([cluster](dpp::loglevel level, const std::string& message) {
        cluster->log(level, message);
    });

    init_core();
    init_modules();
    setup_event_handlers();

    log_info("Bot initialized successfully");
    return true;
}

void Bot::init_core() {
    scheduler_ = std::make_unique<AsioScheduler>();
    workers_ = std::make_unique<ThreadPool>(static_cast<size_t>(config_.get_thread_pool_size()), "blocking");
    BlockingExecutor executor = workers_->executor();

    notifier_ = std::make_unique<WebhookNotifier>(config_.get_notification_webhook().value_or(""), executor);
    audio_router_ = std::make_unique<AudioRouter>(config_.audio_router_config(), *scheduler_, executor);

    // Default client first, then an alternate player client that often
    // survives blocks on the default one
    ExtractorConfig primary = config_.extractor_config();
    ExtractorConfig secondary = primary;
    secondary.extra_args = {"--extractor-args", "youtube:player_client=android"};
    extractors_.push_back(std::make_unique<YtDlpExtractor>("yt-dlp", primary, *scheduler_, executor));
    extractors_.push_back(std::make_unique<YtDlpExtractor>("yt-dlp (android)", secondary, *scheduler_, executor));

    AsioScheduler* scheduler = scheduler_.get();
    RelayConfig relay_config = config_.relay_config();
    relay_pool_ = std::make_unique<RelayPool>(
        config_.relay_pool_config(), *scheduler_, *database_, *notifier_,
        [scheduler, relay_config](const std::string& id) {
            return std::make_unique<RelayInstance>(id, relay_config, *scheduler, [scheduler]() {
                return std::make_unique<BeastRelayTransport>(scheduler->context());
            });
        });

    std::vector<MediaExtractor*> extractors;
    for (auto& extractor : extractors_) {
        extractors.push_back(extractor.get());
    }
    coordinator_ = std::make_unique<PlaybackStrategyCoordinator>(
        config_.coordinator_config(), *scheduler_, *database_, *relay_pool_, *audio_router_, std::move(extractors));

    voice_transport_ = std::make_unique<DppVoiceTransport>(*cluster_, *scheduler_);
    voice_ = std::make_unique<VoiceSessionManager>(config_.voice_session_config(), *scheduler_, *voice_transport_,
                                                   *coordinator_);
    resolver_ = std::make_unique<TrackResolver>(config_.resolver_config(), *scheduler_, executor);
}

void Bot::init_modules() {
    music_module_ = std::make_unique<MusicModule>(*cluster_, *scheduler_, *voice_, *resolver_);
    log_info("Music module enabled");

    relay_admin_module_ = std::make_unique<RelayAdminModule>(*scheduler_, *relay_pool_, *coordinator_, *audio_router_);
    log_info("Relay admin module enabled");
}

void Bot::setup_event_handlers() {
    cluster_->on_ready([this](const dpp::ready_t& event) {
        on_ready(event);
    });

    cluster_->on_slashcommand([this](const dpp::slashcommand_t& event) {
        on_slashcommand(event);
    });
}

void Bot::run(const std::atomic<bool>& running) {
    if (!cluster_) {
        log_error("Bot not initialized");
        return;
    }

    scheduler_->start();
    RelayPool* pool = relay_pool_.get();
    PlaybackStrategyCoordinator* coordinator = coordinator_.get();
    scheduler_->post([pool, coordinator]() {
        pool->initialize();
        coordinator->start_maintenance();
    });

    cluster_->start(dpp::st_return);
    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
}

void Bot::shutdown() {
    if (shut_down_) return;
    shut_down_ = true;

    // Stop sessions and relays on the loop before stopping it
    if (scheduler_) {
        auto drained = std::make_shared<std::promise<void>>();
        std::future<void> done = drained->get_future();
        VoiceSessionManager* voice = voice_.get();
        RelayPool* pool = relay_pool_.get();
        scheduler_->post([drained, voice, pool]() {
            if (voice) voice->stop_all();
            if (pool) pool->shutdown();
            drained->set_value();
        });
        if (done.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            log_warning("Timed out waiting for voice sessions and relays to stop");
        }
        scheduler_->stop();
    }

    if (cluster_) {
        cluster_->shutdown();
    }

    if (workers_) {
        workers_->shutdown();
    }

    relay_admin_module_.reset();
    music_module_.reset();
    resolver_.reset();
    voice_.reset();
    voice_transport_.reset();
    coordinator_.reset();
    relay_pool_.reset();
    extractors_.clear();
    audio_router_.reset();
    notifier_.reset();

    set_log_sink(nullptr);
    cluster_.reset();

    if (database_) {
        database_->close();
        database_.reset();
    }
    CurlHelper::global_cleanup();
}

void Bot::on_ready(const dpp::ready_t& event) {
    if (dpp::run_once<struct announce_ready>()) {
        log_info(cluster_->me.username + " has connected to Discord!");
    }
}

void Bot::on_slashcommand(const dpp::slashcommand_t& event) {
    std::string cmd = event.command.get_command_name();

    // Route to appropriate module
    if (music_module_ && music_module_->handles(cmd)) {
        music_module_->handle_command(event);
    }
    else if (relay_admin_module_ && relay_admin_module_->handles(cmd)) {
        relay_admin_module_->handle_command(event);
    }
}

} // namespace jukebox

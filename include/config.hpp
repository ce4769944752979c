#pragma once

#include "playback/audio_router.hpp"
#include "playback/media_extractor.hpp"
#include "playback/strategy_coordinator.hpp"
#include "playback/track_resolver.hpp"
#include "relay/relay_instance.hpp"
#include "relay/relay_pool.hpp"
#include "voice/voice_session_manager.hpp"
#include <dpp/misc-enum.h>
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace jukebox {

class Config {
public:
    Config() = default;

    // Load configuration from .env file
    bool load(const std::string& env_path = ".env");
    bool load(std::istream& input);

    // Get configuration values
    std::string get_token() const { return token_; }
    std::string get_database_path() const { return database_path_; }
    int get_thread_pool_size() const { return thread_pool_size_; }
    dpp::loglevel get_log_level() const { return log_level_; }
    std::optional<std::string> get_notification_webhook() const { return notification_webhook_; }

    // Per-component settings
    VoiceSessionConfig voice_session_config() const;
    CoordinatorConfig coordinator_config() const;
    RelayConfig relay_config() const;
    RelayPoolConfig relay_pool_config() const;
    AudioRouterConfig audio_router_config() const;
    ExtractorConfig extractor_config() const;
    ResolverConfig resolver_config() const;

    // Validation
    bool is_valid() const;

private:
    std::string token_;
    std::string database_path_ = "data/jukebox.db";
    int thread_pool_size_ = 4;
    dpp::loglevel log_level_ = dpp::ll_info;
    std::optional<std::string> notification_webhook_;

    int idle_timeout_ms_ = 300000;
    int relay_pool_size_ = 3;
    int health_check_interval_ms_ = 60000;
    int session_maintenance_interval_ms_ = 1800000;
    int reconnect_base_delay_ms_ = 5000;
    int max_reconnect_attempts_ = 5;
    std::string relay_url_ = "http://neko:8080";
    std::string relay_username_ = "admin";
    std::string relay_password_ = "neko";
    std::string audio_service_url_ = "http://localhost:3000";
    std::string ytdlp_path_ = "yt-dlp";
    std::string ffmpeg_path_ = "ffmpeg";

    std::map<std::string, std::string> env_values_;

    void apply();
    std::string get_env_value(const std::string& key) const;
    void read_int(const std::string& key, int& target, int minimum) const;
    void read_string(const std::string& key, std::string& target) const;
};

} // namespace jukebox

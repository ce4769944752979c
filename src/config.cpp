#include "config.hpp"
#include "utils/logger.hpp"
#include "utils/string_utils.hpp"
#include <cstdlib>
#include <fstream>

namespace jukebox {

bool Config::load(const std::string& env_path) {
    std::ifstream file(env_path);
    if (!file.is_open()) {
        // Fall back to the process environment (containers)
        log_warning("Could not open .env file: " + env_path + ", using environment only");
        env_values_.clear();
        apply();
        return is_valid();
    }
    return load(file);
}

bool Config::load(std::istream& input) {
    env_values_.clear();

    std::string line;
    while (std::getline(input, line)) {
        line = string_utils::trim(line);
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (line.rfind("export ", 0) == 0) {
            line = string_utils::trim(line.substr(7));
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = string_utils::trim(line.substr(0, pos));
        std::string value = string_utils::trim(line.substr(pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                   (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        env_values_[key] = value;
    }

    apply();
    return is_valid();
}

void Config::apply() {
    token_ = get_env_value("DISCORD_BOT_TOKEN");
    if (token_.empty()) {
        log_error("DISCORD_BOT_TOKEN is not set");
    }

    read_string("DATABASE_PATH", database_path_);
    read_int("THREAD_POOL_SIZE", thread_pool_size_, 1);

    std::string level = get_env_value("LOG_LEVEL");
    if (!level.empty()) {
        log_level_ = parse_log_level(level, log_level_);
    }

    std::string webhook = get_env_value("ADMIN_NOTIFICATION_WEBHOOK");
    if (!webhook.empty()) notification_webhook_ = webhook;

    read_int("IDLE_DISCONNECT_TIMEOUT_MS", idle_timeout_ms_, 0);
    read_int("RELAY_POOL_SIZE", relay_pool_size_, 0);
    read_int("RELAY_HEALTH_CHECK_INTERVAL_MS", health_check_interval_ms_, 1);
    read_int("RELAY_SESSION_MAINTENANCE_INTERVAL_MS", session_maintenance_interval_ms_, 1);
    read_int("RELAY_RECONNECT_BASE_DELAY_MS", reconnect_base_delay_ms_, 0);
    read_int("RELAY_MAX_RECONNECT_ATTEMPTS", max_reconnect_attempts_, 0);
    read_string("RELAY_URL", relay_url_);
    read_string("RELAY_USERNAME", relay_username_);
    read_string("RELAY_PASSWORD", relay_password_);
    read_string("AUDIO_SERVICE_URL", audio_service_url_);
    read_string("YTDLP_PATH", ytdlp_path_);
    read_string("FFMPEG_PATH", ffmpeg_path_);
}

void Config::read_int(const std::string& key, int& target, int minimum) const {
    std::string value = get_env_value(key);
    if (value.empty()) return;

    try {
        size_t used = 0;
        int parsed = std::stoi(value, &used);
        if (used != value.size() || parsed < minimum) {
            throw std::invalid_argument(value);
        }
        target = parsed;
    } catch (const std::exception&) {
        log_warning("Invalid value for " + key + ": '" + value + "', keeping " + std::to_string(target));
    }
}

void Config::read_string(const std::string& key, std::string& target) const {
    std::string value = get_env_value(key);
    if (!value.empty()) target = value;
}

std::string Config::get_env_value(const std::string& key) const {
    auto it = env_values_.find(key);
    if (it != env_values_.end()) return it->second;

    const char* env = std::getenv(key.c_str());
    return env ? std::string(env) : "";
}

bool Config::is_valid() const {
    return !token_.empty();
}

VoiceSessionConfig Config::voice_session_config() const {
    VoiceSessionConfig config;
    config.idle_timeout = Duration(idle_timeout_ms_);
    return config;
}

CoordinatorConfig Config::coordinator_config() const {
    return CoordinatorConfig{};
}

RelayConfig Config::relay_config() const {
    RelayConfig config;
    config.url = relay_url_;
    config.username = relay_username_;
    config.password = relay_password_;
    config.reconnect_base_delay = Duration(reconnect_base_delay_ms_);
    config.max_reconnect_attempts = max_reconnect_attempts_;
    return config;
}

RelayPoolConfig Config::relay_pool_config() const {
    RelayPoolConfig config;
    config.size = relay_pool_size_;
    config.health_check_interval = Duration(health_check_interval_ms_);
    config.session_maintenance_interval = Duration(session_maintenance_interval_ms_);
    return config;
}

AudioRouterConfig Config::audio_router_config() const {
    AudioRouterConfig config;
    config.service_url = audio_service_url_;
    config.ffmpeg_path = ffmpeg_path_;
    return config;
}

ExtractorConfig Config::extractor_config() const {
    ExtractorConfig config;
    config.ytdlp_path = ytdlp_path_;
    config.ffmpeg_path = ffmpeg_path_;
    return config;
}

ResolverConfig Config::resolver_config() const {
    ResolverConfig config;
    config.ytdlp_path = ytdlp_path_;
    return config;
}

} // namespace jukebox

#pragma once

#include <dpp/dpp.h>
#include <optional>
#include <string>

namespace jukebox {

// 3:07 / 1:02:03; "live" for zero
std::string format_track_duration(int seconds);

// Snowflake formatting
std::string snowflake_to_string(dpp::snowflake id);

// Permission checking
bool has_permission(const dpp::guild_member& member, const dpp::guild& guild, dpp::permission perm);

// Voice channel the user is sitting in, from the guild cache
std::optional<dpp::snowflake> find_user_voice_channel(dpp::snowflake guild_id, dpp::snowflake user_id);

// Response helpers
dpp::message error_embed(const std::string& title, const std::string& description);
dpp::message success_embed(const std::string& title, const std::string& description);
dpp::message info_embed(const std::string& title, const std::string& description);

} // namespace jukebox

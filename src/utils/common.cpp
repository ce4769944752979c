#include "utils/common.hpp"
#include <iomanip>
#include <sstream>

namespace jukebox {

std::string format_track_duration(int seconds) {
    if (seconds <= 0) {
        return "live";
    }

    int hours = seconds / 3600;
    int minutes = (seconds % 3600) / 60;
    int secs = seconds % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << ":" << std::setfill('0') << std::setw(2);
    }
    oss << minutes << ":" << std::setfill('0') << std::setw(2) << secs;
    return oss.str();
}

std::string snowflake_to_string(dpp::snowflake id) {
    return std::to_string(static_cast<uint64_t>(id));
}

bool has_permission(const dpp::guild_member& member, const dpp::guild& guild, dpp::permission perm) {
    // Owner has all permissions
    if (member.user_id == guild.owner_id) {
        return true;
    }

    dpp::permission member_perms = guild.base_permissions(member);
    if (member_perms.has(dpp::p_administrator)) {
        return true;
    }

    return member_perms.has(perm);
}

std::optional<dpp::snowflake> find_user_voice_channel(dpp::snowflake guild_id, dpp::snowflake user_id) {
    dpp::guild* guild = dpp::find_guild(guild_id);
    if (!guild) {
        return std::nullopt;
    }

    auto vs = guild->voice_members.find(user_id);
    if (vs == guild->voice_members.end() || vs->second.channel_id == 0) {
        return std::nullopt;
    }
    return vs->second.channel_id;
}

dpp::message error_embed(const std::string& title, const std::string& description) {
    dpp::embed embed;
    embed.set_title("❌ " + title)
         .set_description(description)
         .set_color(0xff0000);
    return dpp::message().add_embed(embed);
}

dpp::message success_embed(const std::string& title, const std::string& description) {
    dpp::embed embed;
    embed.set_title("✅ " + title)
         .set_description(description)
         .set_color(0x00ff00);
    return dpp::message().add_embed(embed);
}

dpp::message info_embed(const std::string& title, const std::string& description) {
    dpp::embed embed;
    embed.set_title("ℹ️ " + title)
         .set_description(description)
         .set_color(0x0099ff);
    return dpp::message().add_embed(embed);
}

} // namespace jukebox

#include "modules/relay_admin.hpp"
#include "errors.hpp"
#include "utils/common.hpp"
#include "utils/logger.hpp"
#include <optional>
#include <variant>

namespace jukebox {

namespace {

template <typename T>
std::optional<T> option_value(const dpp::command_data_option& sub, const std::string& name) {
    for (const auto& opt : sub.options) {
        if (opt.name == name && std::holds_alternative<T>(opt.value)) {
            return std::get<T>(opt.value);
        }
    }
    return std::nullopt;
}

} // namespace

RelayAdminModule::RelayAdminModule(Scheduler& scheduler, RelayPool& pool, PlaybackStrategyCoordinator& coordinator,
                                   AudioCaptureClient& capture)
    : scheduler_(scheduler)
    , pool_(pool)
    , coordinator_(coordinator)
    , capture_(capture)
{}

RelayAdminModule::~RelayAdminModule() {
    *alive_ = false;
}

bool RelayAdminModule::is_admin(const dpp::slashcommand_t& event) const {
    dpp::guild* guild = dpp::find_guild(event.command.guild_id);
    if (!guild) {
        return false;
    }
    return has_permission(event.command.member, *guild, dpp::p_administrator);
}

void RelayAdminModule::handle_command(const dpp::slashcommand_t& event) {
    if (!is_admin(event)) {
        event.reply(error_embed("Permission Denied", "Only administrators can manage relays.")
                        .set_flags(dpp::m_ephemeral));
        return;
    }

    auto interaction = event.command.get_command_interaction();
    if (interaction.options.empty()) {
        event.reply(error_embed("Error", "Missing subcommand."));
        return;
    }
    dpp::command_data_option sub = interaction.options[0];
    if (sub.name == "status") {
        // Waits on the audio service
        event.thinking();
    }

    std::weak_ptr<bool> alive = alive_;
    scheduler_.post([this, alive, event, sub]() {
        auto flag = alive.lock();
        if (!flag || !*flag) return;

        if (sub.name == "status") cmd_status(event);
        else if (sub.name == "restart") cmd_restart(event, sub);
        else if (sub.name == "stats") cmd_stats(event);
        else if (sub.name == "force") cmd_force(event, sub);
        else event.reply(error_embed("Error", "Unknown subcommand `" + sub.name + "`."));
    });
}

std::string RelayAdminModule::describe_pool() const {
    std::string description;
    for (RelayInstance* instance : pool_.get_all_instances()) {
        std::string status;
        if (instance->is_kicked()) {
            status = "kicked";
        } else if (instance->is_authenticated()) {
            status = instance->current_video() ? "playing `" + *instance->current_video() + "`" : "idle";
        } else {
            status = to_string(instance->ws_state());
            if (instance->reconnect_pending()) {
                status += ", reconnect " + std::to_string(instance->reconnect_attempts());
            }
        }
        description += "`" + instance->id() + "`: " + status + "\n";
    }
    return description.empty() ? "No relay instances configured." : description;
}

std::string RelayAdminModule::describe_streams(const std::vector<ActiveCapture>& streams) {
    if (streams.empty()) {
        return "No active capture streams.";
    }

    std::string description;
    for (const auto& stream : streams) {
        description += "`" + stream.instance_id + "`: " + (stream.active ? "capturing" : "stalled") + ", " +
                       std::to_string(stream.bytes_transmitted / 1024) + " KiB sent\n";
    }
    return description;
}

void RelayAdminModule::cmd_status(const dpp::slashcommand_t& event) {
    std::string pool = describe_pool();
    std::weak_ptr<bool> alive = alive_;

    capture_.active_streams([alive, event, pool](std::exception_ptr error, std::vector<ActiveCapture> streams) {
        auto flag = alive.lock();
        if (!flag || !*flag) return;

        std::string capture = error ? "Audio service unavailable: " + error_message(error) : describe_streams(streams);
        dpp::embed embed;
        embed.set_title("ℹ️ Relay Pool")
             .set_description(pool)
             .add_field("Capture streams", capture, false)
             .set_color(0x0099ff);
        event.edit_response(dpp::message().add_embed(embed));
    });
}

void RelayAdminModule::cmd_restart(const dpp::slashcommand_t& event, const dpp::command_data_option& sub) {
    std::string id = option_value<std::string>(sub, "instance").value_or("");
    RelayInstance* instance = pool_.get_instance_by_id(id);
    if (!instance) {
        event.reply(error_embed("Unknown Instance", "No relay instance named `" + id + "`."));
        return;
    }

    log_info("Relay " + id + " restart requested by " + snowflake_to_string(event.command.get_issuing_user().id));
    // The reply must not wait for the reconnect
    event.reply(info_embed("Restarting", "Restarting relay instance `" + id + "`."));
    instance->restart([id](std::exception_ptr error) {
        if (error) {
            log_warning("Relay " + id + " restart did not reconnect: " + error_message(error));
        }
    });
}

void RelayAdminModule::cmd_stats(const dpp::slashcommand_t& event) {
    PlaybackStats stats = coordinator_.get_stats();
    dpp::embed embed;
    embed.set_title("Playback Statistics")
         .add_field("Direct", std::to_string(stats.direct), true)
         .add_field("Relay", std::to_string(stats.relay), true)
         .add_field("Recent failures", std::to_string(stats.recent_failures), true)
         .set_color(0x0099ff);
    event.reply(dpp::message().add_embed(embed));
}

void RelayAdminModule::cmd_force(const dpp::slashcommand_t& event, const dpp::command_data_option& sub) {
    std::string video = option_value<std::string>(sub, "video").value_or("");
    bool enabled = option_value<bool>(sub, "enabled").value_or(true);
    if (video.empty()) {
        event.reply(error_embed("Error", "A video id is required."));
        return;
    }

    coordinator_.set_force_relay(video, enabled);
    event.reply(success_embed("Relay Override",
        "Video `" + video + "` " + (enabled ? "will always use the relay." : "uses direct playback again.")));
}

} // namespace jukebox

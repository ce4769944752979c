#pragma once

#include "playback/audio_router.hpp"
#include "playback/strategy_coordinator.hpp"
#include "relay/relay_pool.hpp"
#include "utils/scheduler.hpp"
#include <dpp/dpp.h>
#include <memory>
#include <string>
#include <vector>

namespace jukebox {

// /relay status|restart|stats|force, administrators only
class RelayAdminModule {
public:
    RelayAdminModule(Scheduler& scheduler, RelayPool& pool, PlaybackStrategyCoordinator& coordinator,
                     AudioCaptureClient& capture);
    ~RelayAdminModule();

    bool handles(const std::string& command) const { return command == "relay"; }

    // Called from D++ threads
    void handle_command(const dpp::slashcommand_t& event);

    std::string describe_pool() const;
    static std::string describe_streams(const std::vector<ActiveCapture>& streams);

private:
    Scheduler& scheduler_;
    RelayPool& pool_;
    PlaybackStrategyCoordinator& coordinator_;
    AudioCaptureClient& capture_;
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    void cmd_status(const dpp::slashcommand_t& event);
    void cmd_restart(const dpp::slashcommand_t& event, const dpp::command_data_option& sub);
    void cmd_stats(const dpp::slashcommand_t& event);
    void cmd_force(const dpp::slashcommand_t& event, const dpp::command_data_option& sub);

    bool is_admin(const dpp::slashcommand_t& event) const;
};

} // namespace jukebox

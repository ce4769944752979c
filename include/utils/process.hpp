#pragma once

#include <string>

namespace jukebox {

struct CommandResult {
    int exit_code = -1;
    std::string output;
};

// Run through /bin/sh and collect stdout. Throws std::runtime_error when the
// process cannot be started.
CommandResult run_command(const std::string& command);

// Decode a pclose() status into an exit code (-1 when killed by a signal)
int decode_exit_status(int status);

} // namespace jukebox

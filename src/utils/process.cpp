#include "utils/process.hpp"
#include <array>
#include <cstdio>
#include <stdexcept>
#include <sys/wait.h>

namespace jukebox {

int decode_exit_status(int status) {
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

CommandResult run_command(const std::string& command) {
    std::array<char, 4096> buffer;
    CommandResult result;

    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        throw std::runtime_error("Failed to start: " + command);
    }

    while (fgets(buffer.data(), buffer.size(), pipe) != nullptr) {
        result.output += buffer.data();
    }
    result.exit_code = decode_exit_status(pclose(pipe));

    return result;
}

} // namespace jukebox

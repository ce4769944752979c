#include "bot.hpp"
#include "config.hpp"
#include <atomic>
#include <csignal>
#include <iostream>

static std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

int main(int argc, char* argv[]) {
    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "Jukebox starting..." << std::endl;
    std::cout << "==========================" << std::endl;

    std::string env_path = argc > 1 ? argv[1] : ".env";
    jukebox::Config config;
    if (!config.load(env_path)) {
        std::cerr << "Failed to load configuration" << std::endl;
        return 1;
    }

    jukebox::Bot bot(std::move(config));
    if (!bot.initialize()) {
        std::cerr << "Failed to initialize bot" << std::endl;
        return 1;
    }

    // Run the bot
    bot.run(g_running);

    std::cout << "\nShutting down..." << std::endl;
    bot.shutdown();

    std::cout << "Shutdown complete" << std::endl;
    return 0;
}

#include "client/client_config.hpp"
#include "client/game.hpp"
#include "protocol/frame.hpp"
#include <SDL3/SDL.h>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <string>
#include <utility>

std::function<void()> shutdown_handler;

void signal_handler(int signal) {
    (void)signal;
    if (shutdown_handler) {
        shutdown_handler();
    }
}

// Custom SDL log function with timestamps
void SDLCALL log_with_timestamp(void* userdata, int category, SDL_LogPriority priority, const char* message) {
    (void)userdata;
    (void)category;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    const char* priority_str = "";
    switch (priority) {
        case SDL_LOG_PRIORITY_VERBOSE: priority_str = "VERBOSE"; break;
        case SDL_LOG_PRIORITY_DEBUG:   priority_str = "DEBUG"; break;
        case SDL_LOG_PRIORITY_INFO:    priority_str = "INFO"; break;
        case SDL_LOG_PRIORITY_WARN:    priority_str = "WARN"; break;
        case SDL_LOG_PRIORITY_ERROR:   priority_str = "ERROR"; break;
        case SDL_LOG_PRIORITY_CRITICAL: priority_str = "CRITICAL"; break;
        default: priority_str = "???"; break;
    }

    fprintf(stderr, "[%02d:%02d:%02d.%03d] [%s] %s\n",
            tm_now.tm_hour, tm_now.tm_min, tm_now.tm_sec,
            static_cast<int>(ms.count()),
            priority_str, message);
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --host <host>    Server host (default from client.json)" << std::endl;
    std::cout << "  -p, --port <port>    Server port (default: " << volley::protocol::DEFAULT_PORT << ")" << std::endl;
    std::cout << "  -r, --room <room>    Room to join" << std::endl;
    std::cout << "  -d, --data <dir>     Directory holding client.json and weapons.json" << std::endl;
    std::cout << "  -v, --verbose        Enable debug logging" << std::endl;
    std::cout << "  --help               Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string host;
    std::string room;
    std::string data_dir;
    int port = 0;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            try {
                port = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                port = -1;
            }
            if (port <= 0 || port > 65535) {
                std::cerr << "Invalid port: " << argv[i] << std::endl;
                return 1;
            }
        } else if ((arg == "-r" || arg == "--room") && i + 1 < argc) {
            room = argv[++i];
        } else if ((arg == "-d" || arg == "--data") && i + 1 < argc) {
            data_dir = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Set up timestamped logging
    SDL_SetLogOutputFunction(log_with_timestamp, nullptr);
    if (verbose) {
        SDL_SetLogPriorities(SDL_LOG_PRIORITY_DEBUG);
    }

    volley::client::ClientConfig config;
    if (!data_dir.empty()) {
        if (!config.load(data_dir)) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to load configuration from %s", data_dir.c_str());
            return 1;
        }
    } else if (!config.load("data") && !config.load("../data")) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "No usable data directory, running with built-in defaults");
    }

    if (!host.empty()) config.server().host = host;
    if (port > 0) config.server().port = static_cast<uint16_t>(port);
    if (!room.empty()) config.server().room = room;

    SDL_Log("=== Volley Client ===");
    SDL_Log("Server: %s:%u room '%s'", config.server().host.c_str(),
            static_cast<unsigned>(config.server().port), config.server().room.c_str());

    try {
        volley::client::Game game(std::move(config));

        if (!game.init_engine()) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to initialize engine");
            return 1;
        }

        shutdown_handler = [&game]() { game.quit(); };
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        game.run();
        game.shutdown_engine();
        shutdown_handler = nullptr;
    } catch (const std::exception& e) {
        SDL_LogCritical(SDL_LOG_CATEGORY_APPLICATION, "Client error: %s", e.what());
        return 1;
    }

    return 0;
}

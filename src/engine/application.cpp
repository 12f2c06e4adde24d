#include "application.hpp"
#include <SDL3/SDL.h>
#include <cstdint>

namespace volley::engine {

Application::Application(double fixed_timestep, double max_frame_delta)
    : scheduler_(fixed_timestep, max_frame_delta) {
}

Application::~Application() = default;

bool Application::init_engine() {
    if (!SDL_Init(SDL_INIT_EVENTS)) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Failed to initialize SDL: %s", SDL_GetError());
        return false;
    }
    return true;
}

bool Application::process_events() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        if (event.type == SDL_EVENT_QUIT) {
            return false;
        }
    }
    return true;
}

void Application::run() {
    if (!on_init()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Application::run: initialization failed");
        return;
    }

    running_ = true;
    last_frame_time_ns_ = SDL_GetTicksNS();
    fps_timer_ = SDL_GetTicks();

    while (running_) {
        uint64_t now_ns = SDL_GetTicksNS();
        double dt = static_cast<double>(now_ns - last_frame_time_ns_) / 1e9;
        last_frame_time_ns_ = now_ns;

        // FPS counter
        frame_count_++;
        uint64_t now_ms = SDL_GetTicks();
        if (now_ms - fps_timer_ >= 1000) {
            fps_ = static_cast<float>(frame_count_);
            frame_count_ = 0;
            fps_timer_ = now_ms;
        }

        if (!process_events()) {
            running_ = false;
            break;
        }

        // The scheduler caps dt itself, so stalls are not clamped here
        on_update(static_cast<float>(dt));
        if (!running_) break;
        scheduler_.advance(dt);

        if (frame_rate_cap_ > 0) {
            uint64_t frame_ns = SDL_GetTicksNS() - now_ns;
            uint64_t budget_ns = 1000000000ull / static_cast<uint64_t>(frame_rate_cap_);
            if (frame_ns < budget_ns) {
                SDL_DelayNS(budget_ns - frame_ns);
            }
        }
    }

    on_shutdown();
}

void Application::shutdown_engine() {
    SDL_Quit();
}

} // namespace volley::engine

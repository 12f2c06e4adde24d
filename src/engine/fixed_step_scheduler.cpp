#include "fixed_step_scheduler.hpp"
#include <algorithm>
#include <stdexcept>

namespace volley::engine {

namespace {
// Absorbs float drift so an exact multiple of the timestep runs that many steps
constexpr double STEP_EPSILON = 1e-9;
}

FixedStepScheduler::FixedStepScheduler(double fixed_timestep, double max_frame_delta)
    : fixed_timestep_(fixed_timestep), max_frame_delta_(max_frame_delta) {
    if (fixed_timestep_ <= 0.0) {
        throw std::invalid_argument("FixedStepScheduler: fixed timestep must be positive");
    }
    if (max_frame_delta_ < fixed_timestep_) {
        throw std::invalid_argument("FixedStepScheduler: max frame delta below one timestep");
    }
}

int FixedStepScheduler::advance(double frame_delta) {
    frame_delta = std::clamp(frame_delta, 0.0, max_frame_delta_);
    accumulator_ += frame_delta;

    const float step_dt = static_cast<float>(fixed_timestep_);
    int steps = 0;
    while (accumulator_ + STEP_EPSILON >= fixed_timestep_) {
        for (auto& hook : fixed_tick_hooks_) hook(step_dt);
        for (auto& hook : physics_hooks_) hook(step_dt);

        accumulator_ = std::max(0.0, accumulator_ - fixed_timestep_);
        sim_time_ += fixed_timestep_;
        ++total_steps_;
        ++steps;
    }

    alpha_ = static_cast<float>(std::clamp(accumulator_ / fixed_timestep_, 0.0, 1.0));

    const float frame_dt = static_cast<float>(frame_delta);
    for (auto& hook : drain_hooks_) hook();
    for (auto& hook : interpolation_hooks_) hook(frame_dt, alpha_);
    for (auto& hook : timer_hooks_) hook(frame_dt);

    return steps;
}

void FixedStepScheduler::reset() {
    accumulator_ = 0.0;
    sim_time_ = 0.0;
    alpha_ = 0.0f;
    total_steps_ = 0;
}

} // namespace volley::engine

#pragma once

#include "common/physics_constants.hpp"
#include <cstdint>
#include <functional>
#include <vector>

namespace volley::engine {

/**
 * Accumulator-driven fixed timestep.
 *
 * Each advance() adds the (capped) frame delta to the accumulator and runs
 * whole physics steps while at least one timestep is banked. Every executed
 * step first runs the fixed-tick hooks (input capture) and then the physics
 * hooks, so exactly one input is produced per simulated step. The frame
 * hooks run once per advance() regardless of how many steps ran.
 */
class FixedStepScheduler {
public:
    using StepHook = std::function<void(float dt)>;
    using InterpolationHook = std::function<void(float frame_dt, float alpha)>;
    using FrameHook = std::function<void(float frame_dt)>;
    using DrainHook = std::function<void()>;

    explicit FixedStepScheduler(double fixed_timestep = physics::FIXED_TIMESTEP,
                                double max_frame_delta = physics::MAX_FRAME_DELTA);

    void add_fixed_tick_hook(StepHook hook) { fixed_tick_hooks_.push_back(std::move(hook)); }
    void add_physics_hook(StepHook hook) { physics_hooks_.push_back(std::move(hook)); }
    void add_drain_hook(DrainHook hook) { drain_hooks_.push_back(std::move(hook)); }
    void add_interpolation_hook(InterpolationHook hook) { interpolation_hooks_.push_back(std::move(hook)); }
    void add_timer_hook(FrameHook hook) { timer_hooks_.push_back(std::move(hook)); }

    /** Run one frame. Returns the number of physics steps executed. */
    int advance(double frame_delta);

    void reset();

    double fixed_timestep() const { return fixed_timestep_; }
    double accumulator() const { return accumulator_; }
    float alpha() const { return alpha_; }
    uint64_t total_steps() const { return total_steps_; }
    double sim_time() const { return sim_time_; }

private:
    double fixed_timestep_;
    double max_frame_delta_;
    double accumulator_ = 0.0;
    double sim_time_ = 0.0;
    float alpha_ = 0.0f;
    uint64_t total_steps_ = 0;

    std::vector<StepHook> fixed_tick_hooks_;
    std::vector<StepHook> physics_hooks_;
    std::vector<DrainHook> drain_hooks_;
    std::vector<InterpolationHook> interpolation_hooks_;
    std::vector<FrameHook> timer_hooks_;
};

} // namespace volley::engine

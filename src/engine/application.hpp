#pragma once

#include "engine/fixed_step_scheduler.hpp"
#include <cstdint>

namespace volley::engine {

/**
 * Base application class that owns the SDL lifecycle, the main loop,
 * frame timing and the fixed-step scheduler.
 *
 * Subclasses register their per-step and per-frame work on scheduler()
 * during on_init(). on_update() runs once per frame before the scheduler
 * advances, which is where socket I/O gets pumped.
 */
class Application {
public:
    explicit Application(double fixed_timestep = physics::FIXED_TIMESTEP,
                         double max_frame_delta = physics::MAX_FRAME_DELTA);
    virtual ~Application();

    /** Initialize SDL subsystems. Call before init(). */
    bool init_engine();

    /** Run on_init() and the main loop until quit() is called. */
    void run();

    /** Shut down SDL. */
    void shutdown_engine();

    /** Request the main loop to stop. */
    void quit() { running_ = false; }
    bool running() const { return running_; }

    float fps() const { return fps_; }

    /** Sleep between frames to hold roughly this rate. 0 disables the cap. */
    void set_frame_rate_cap(int fps) { frame_rate_cap_ = fps; }

protected:
    virtual bool on_init() = 0;
    virtual void on_shutdown() {}

    /** Called once per frame with wall-clock delta in seconds. */
    virtual void on_update(float dt) = 0;

    FixedStepScheduler& scheduler() { return scheduler_; }
    const FixedStepScheduler& scheduler() const { return scheduler_; }

private:
    bool process_events();

    FixedStepScheduler scheduler_;
    bool running_ = false;
    int frame_rate_cap_ = 0;
    uint64_t last_frame_time_ns_ = 0;
    float fps_ = 0.0f;
    int frame_count_ = 0;
    uint64_t fps_timer_ = 0;
};

} // namespace volley::engine

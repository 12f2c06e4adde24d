#pragma once

#include "engine/input_state.hpp"
#include <cstdint>

namespace volley::client {

// Scripted input for the headless client: runs in a slow circle, hops now
// and then and pulls the trigger whenever the pattern says so. FireControl
// decides whether a pull actually fires.
class BotInputSource : public engine::InputSource {
public:
    engine::InputState sample() override {
        ++tick_;
        engine::InputState state;
        state.forward = 1.0f;
        state.camera_yaw = static_cast<float>(tick_) * 0.01f;
        state.camera_pitch = 0.0f;
        state.sprint = (tick_ / 300) % 2 == 1;
        state.jump = tick_ % 180 < 6;
        state.fire = tick_ % 20 == 0;
        return state;
    }

private:
    uint64_t tick_ = 0;
};

} // namespace volley::client

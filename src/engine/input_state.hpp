#pragma once

namespace volley::engine {

/**
 * Device-level input, sampled once per physics step. Carries no sequence
 * numbers or wire knowledge; InputCapture stamps it into an InputSample.
 */
struct InputState {
    // Movement axes, camera-relative
    float forward = 0.0f;
    float right = 0.0f;

    // Camera orientation in radians
    float camera_yaw = 0.0f;
    float camera_pitch = 0.0f;

    bool jump = false;
    bool sprint = false;
    bool dive = false;

    bool fire = false;
};

class InputSource {
public:
    virtual ~InputSource() = default;

    // Current device state. Called once per physics step.
    virtual InputState sample() = 0;
};

} // namespace volley::engine

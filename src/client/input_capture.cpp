#include "input_capture.hpp"
#include "client/entity_synchronizer.hpp"
#include "client/network_client.hpp"
#include <utility>

namespace volley::client {

using namespace volley::protocol;

InputCapture::InputCapture(engine::InputSource& source, EntitySynchronizer& entities, NetworkClient& connection,
                           Clock clock, size_t history_size)
    : source_(source),
      entities_(entities),
      connection_(connection),
      clock_(std::move(clock)),
      history_size_(history_size) {
}

InputSample InputCapture::capture(float dt) {
    last_state_ = source_.sample();

    InputSample sample;
    sample.sequence = next_sequence_++;
    sample.delta_time = dt;
    sample.forward = InputSample::to_axis(last_state_.forward);
    sample.right = InputSample::to_axis(last_state_.right);
    sample.camera_yaw = last_state_.camera_yaw;
    sample.camera_pitch = last_state_.camera_pitch;
    sample.jump = last_state_.jump;
    sample.sprint = last_state_.sprint;
    sample.dive = last_state_.dive;
    sample.timestamp = clock_ ? clock_() : 0.0;

    history_.push_back(sample);
    while (history_.size() > history_size_) {
        history_.pop_front();
    }

    entities_.set_local_input(sample);
    connection_.send_input(sample);
    return sample;
}

} // namespace volley::client

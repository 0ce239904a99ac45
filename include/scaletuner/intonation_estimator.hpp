#pragma once

#include "scaletuner/block.hpp"
#include "scaletuner/circular_buffer.hpp"
#include "scaletuner/scale.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace scaletuner {

struct IntonationConfig {
    int tuning_note = 9;          // scale degree the reference pitch belongs to (A in 12-EDO)
    float tuning_pitch = 440.0f;  // Hz
    std::size_t history_length = 20;
};

// Maps the pitch of a tunable block onto the nearest degree of the active scale
// and reports the signed error in cents, raw and averaged over the time the
// same note has been held.
class IntonationEstimator {
public:
    // Uses 12-EDO.
    explicit IntonationEstimator(const IntonationConfig& config = IntonationConfig{});
    // A tuning note outside `scale` falls back to degree 0.
    explicit IntonationEstimator(std::shared_ptr<const Scale> scale,
                                 const IntonationConfig& config = IntonationConfig{});

    void process(Block& block);

    std::shared_ptr<const Scale> scale() const { return scale_; }
    // Resets the tuning note to 0 when the new scale does not have it.
    void set_scale(std::shared_ptr<const Scale> scale);

    int tuning_note() const { return tuning_note_; }
    // Throws LookupError when the degree or name is not in the active scale.
    void set_tuning_note(int degree);
    void set_tuning_note(const std::string& name);

    float tuning_pitch() const { return tuning_pitch_; }
    // Throws ConfigError unless `hz` is positive.
    void set_tuning_pitch(float hz);

    // Latest results; note is -1 while nothing is tunable.
    int note() const { return note_; }
    float error() const { return error_; }
    float error_adj() const { return error_adj_; }

    const CircularBuffer<int>& note_history() const { return note_history_; }
    const CircularBuffer<float>& error_history() const { return error_history_; }
    const CircularBuffer<float>& error_adj_history() const { return error_adj_history_; }

private:
    void clear_histories();

    std::shared_ptr<const Scale> scale_;
    int tuning_note_ = 0;
    float tuning_pitch_ = 440.0f;

    int note_ = -1;
    float error_ = 0.0f;
    float error_adj_ = 0.0f;

    CircularBuffer<int> note_history_;
    CircularBuffer<float> error_history_;
    CircularBuffer<float> error_adj_history_;
};

} // namespace scaletuner

#include "scaletuner/intonation_estimator.hpp"
#include "scaletuner/errors.hpp"

#include <cmath>
#include <numeric>
#include <utility>

namespace scaletuner {

IntonationEstimator::IntonationEstimator(const IntonationConfig& config)
    : IntonationEstimator(std::make_shared<const Scale>(Scale::equal_temperament(12)), config) {}

IntonationEstimator::IntonationEstimator(std::shared_ptr<const Scale> scale, const IntonationConfig& config)
    : note_history_(config.history_length),
      error_history_(config.history_length),
      error_adj_history_(config.history_length) {
    tuning_note_ = config.tuning_note;
    set_scale(std::move(scale));
    set_tuning_pitch(config.tuning_pitch);
}

void IntonationEstimator::set_scale(std::shared_ptr<const Scale> scale) {
    if (!scale) {
        throw ConfigError("intonation estimator needs a scale");
    }
    scale_ = std::move(scale);
    if (tuning_note_ < 0 || tuning_note_ >= static_cast<int>(scale_->size())) {
        tuning_note_ = 0;
    }
}

void IntonationEstimator::set_tuning_note(int degree) {
    tuning_note_ = scale_->note(degree).index;
}

void IntonationEstimator::set_tuning_note(const std::string& name) {
    tuning_note_ = scale_->index_of(name);
}

void IntonationEstimator::set_tuning_pitch(float hz) {
    if (!(hz > 0.0f)) {
        throw ConfigError("tuning pitch must be positive");
    }
    tuning_pitch_ = hz;
}

void IntonationEstimator::clear_histories() {
    note_history_.clear();
    error_history_.clear();
    error_adj_history_.clear();
}

void IntonationEstimator::process(Block& block) {
    if (!block.tunable || !(block.pitch > 0.0f)) {
        note_ = -1;
        error_ = 0.0f;
        error_adj_ = 0.0f;
        clear_histories();
        block.note = -1;
        block.error = 0.0f;
        block.error_adj = 0.0f;
        return;
    }

    const std::vector<double>& cents = scale_->cents();

    // Distance from the tonic in cents, folded into [0, 1200)
    double dist = 1200.0 * std::log2(static_cast<double>(block.pitch) / tuning_pitch_) + cents[tuning_note_];
    dist = std::fmod(dist, 1200.0);
    if (dist < 0.0) dist += 1200.0;

    int note = 0;
    for (std::size_t i = 1; i < cents.size(); ++i) {
        if (std::fabs(dist - cents[i]) < std::fabs(dist - cents[note])) note = static_cast<int>(i);
    }

    double error = 0.0;
    const int last = static_cast<int>(cents.size()) - 1;
    if (note == last && std::fabs(dist - 1200.0) < std::fabs(dist - cents[last])) {
        // Just below the octave: closer to the tonic one octave up.
        note = 0;
        error = dist - 1200.0;
    } else {
        error = dist - cents[note];
    }

    if (!note_history_.empty() && note_history_.read()->back() != note) {
        clear_histories();
    }
    note_history_.append(note);
    error_history_.append(static_cast<float>(error));

    const auto errors = error_history_.read();
    const double sum = std::accumulate(errors->begin(), errors->end(), 0.0);
    const float error_adj = static_cast<float>(sum / errors->size());
    error_adj_history_.append(error_adj);

    note_ = note;
    error_ = static_cast<float>(error);
    error_adj_ = error_adj;

    block.note = note;
    block.error = error_;
    block.error_adj = error_adj;
}

} // namespace scaletuner

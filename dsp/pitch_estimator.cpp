#include "scaletuner/pitch_estimator.hpp"
#include "scaletuner/errors.hpp"
#include "scaletuner/yin.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>

namespace scaletuner {

namespace {

// Minima closer than this many lags are merged.
constexpr int kMinimaDistance = 5;

// Difference function is computed down to this frequency.
constexpr float kLowestAnalyzedHz = 40.0f;

} // namespace

PitchEstimator::PitchEstimator(float samplerate, const PitchConfig& config, std::size_t history_length)
    : samplerate_(samplerate),
      config_(config),
      lag_history_(history_length),
      score_history_(history_length),
      pitch_history_(history_length) {
    set_samplerate(samplerate);
    set_config(config);
}

void PitchEstimator::set_samplerate(float samplerate) {
    if (!(samplerate > 0.0f)) {
        throw ConfigError("pitch estimator sample rate must be positive");
    }
    // Tracked lags are in samples at the old rate
    if (samplerate != samplerate_) {
        reset();
    }
    samplerate_ = samplerate;
    update_lags();
}

void PitchEstimator::validate(const PitchConfig& config) {
    if (!(config.fmin >= kLowestAnalyzedHz) || !(config.fmax > config.fmin)) {
        throw ConfigError("pitch search range needs 40 <= fmin < fmax");
    }
    if (config.min_thresh < 0.0f || config.abs_thresh < 0.0f || config.onset_thresh < 0.0f ||
        config.offset_thresh_2 < 0.0f || config.integer_thresh < 0.0f) {
        throw ConfigError("pitch thresholds must be non-negative");
    }
    if (config.interp_half_width < 1 || config.interp_upsample_fac < 1) {
        throw ConfigError("interpolation half-width and upsampling factor must be at least 1");
    }
}

void PitchEstimator::set_config(const PitchConfig& config) {
    validate(config);
    config_ = config;
    update_lags();
}

void PitchEstimator::set_frequency_range(float fmin, float fmax) {
    PitchConfig c = config_;
    c.fmin = fmin;
    c.fmax = fmax;
    set_config(c);
}

void PitchEstimator::update_lags() {
    num_lags_ = static_cast<int>(std::ceil(samplerate_ / kLowestAnalyzedHz));
    lag_min_ = static_cast<int>(std::floor(samplerate_ / config_.fmax));
    lag_max_ = static_cast<int>(std::ceil(samplerate_ / config_.fmin));
}

void PitchEstimator::reset() {
    state_ = OnsetState::NoOnset;
    onset_lag_ = 0;
    onset_time_ = 0.0;
    offset_time_ = 0.0;
    lag_history_.clear();
    score_history_.clear();
    pitch_history_.clear();
}

std::vector<int> PitchEstimator::find_candidates(const std::vector<float>& dn, float height) const {
    std::vector<int> out;
    for (int ix : yin::local_minima(dn, kMinimaDistance)) {
        if (ix < lag_min_ || ix > lag_max_) continue;
        if (dn[ix] > height) continue;
        out.push_back(ix);
    }
    return out;
}

void PitchEstimator::process(Block& block) {
    const std::vector<float>& x = block.data();
    block.d = yin::difference_function(x.data(), static_cast<int>(x.size()), num_lags_);
    block.dn = yin::cumulative_mean_normalized(block.d);
    block.minima = find_candidates(block.dn, config_.min_thresh);
    block.tunable = false;

    const double t = block.timestamp();
    Step step;
    if (state_ == OnsetState::OnsetActive) {
        step = step_onset_active(block.minima, block.dn, t);
        apply(step.event);
        state_ = step.next;
    }
    // Also reached right after a forced offset, so a new tone can start in
    // the same block.
    if (state_ == OnsetState::NoOnset) {
        Step fresh = step_no_onset(block.minima, block.dn, t);
        apply(fresh.event);
        state_ = fresh.next;
        if (fresh.tunable) step = fresh;
    }

    if (!step.tunable) {
        return;
    }

    const int ix_best = step.lag;
    const float lag = yin::refine_minimum(block.d, ix_best, config_.interp_half_width,
                                          config_.interp_upsample_fac);
    const float pitch = samplerate_ / (lag > 0.0f ? lag : static_cast<float>(ix_best));
    const float score = block.dn[ix_best];

    lag_history_.append(ix_best);
    score_history_.append(score);
    pitch_history_.append(pitch);

    block.tunable = true;
    block.ix_best = ix_best;
    block.dn_score = score;
    block.pitch = pitch;
}

PitchEstimator::Step PitchEstimator::step_no_onset(const std::vector<int>& candidates,
                                                   const std::vector<float>& dn, double t) const {
    Step s;
    s.next = OnsetState::NoOnset;
    for (int ix : candidates) {
        if (dn[ix] < config_.onset_thresh) {
            s.next = OnsetState::OnsetActive;
            s.event = Event{Event::Kind::Onset, ix, t};
            s.tunable = true;
            s.lag = ix;
            break;
        }
    }
    return s;
}

PitchEstimator::Step PitchEstimator::step_onset_active(const std::vector<int>& candidates,
                                                       const std::vector<float>& dn, double t) const {
    Step s;
    s.next = OnsetState::OnsetActive;
    if (candidates.empty()) {
        s.next = OnsetState::NoOnset;
        s.event = Event{Event::Kind::Offset, 0, t};
        return s;
    }

    // First confident candidate, else the deepest one.
    int best = -1;
    for (int ix : candidates) {
        if (dn[ix] < config_.abs_thresh) { best = ix; break; }
    }
    if (best < 0) {
        best = candidates.front();
        for (int ix : candidates) {
            if (dn[ix] < dn[best]) best = ix;
        }
    }

    const double log_ratio = std::log2(static_cast<double>(best) / onset_lag_);
    if (std::fabs(log_ratio - std::round(log_ratio)) < config_.integer_thresh) {
        int near_ref = candidates.front();
        for (int ix : candidates) {
            if (std::abs(ix - onset_lag_) < std::abs(near_ref - onset_lag_)) near_ref = ix;
        }
        if (dn[near_ref] < config_.offset_thresh_2) {
            if (config_.verbose && near_ref != best) {
                std::cout << std::fixed << std::setprecision(2)
                          << " + " << (log_ratio < 0.0 ? "too-high" : "too-low") << " error corrected: found "
                          << near_ref << " (" << samplerate_ / near_ref << " Hz), target " << onset_lag_
                          << " (" << samplerate_ / onset_lag_ << " Hz), delta=" << std::setprecision(4)
                          << log_ratio << std::endl;
            }
            best = near_ref;
        } else {
            // Harmonic of the reference, but the reference itself has faded.
            s.next = OnsetState::NoOnset;
            s.event = Event{Event::Kind::Offset, 0, t};
        }
    }

    s.tunable = true;
    s.lag = best;
    return s;
}

void PitchEstimator::apply(const Event& event) {
    switch (event.kind) {
        case Event::Kind::None:
            break;
        case Event::Kind::Onset:
            onset_lag_ = event.lag;
            onset_time_ = event.time;
            offset_time_ = 0.0;
            if (config_.verbose) {
                std::cout << "Pitch onset at " << event.time << " s, lag " << event.lag << std::endl;
            }
            break;
        case Event::Kind::Offset:
            lag_history_.clear();
            score_history_.clear();
            pitch_history_.clear();
            onset_lag_ = 0;
            onset_time_ = 0.0;
            offset_time_ = event.time;
            if (config_.verbose) {
                std::cout << "Pitch offset at " << event.time << " s" << std::endl;
            }
            break;
    }
}

} // namespace scaletuner

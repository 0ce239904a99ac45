#pragma once

#include "scaletuner/block.hpp"
#include "scaletuner/circular_buffer.hpp"

#include <cstddef>
#include <vector>

namespace scaletuner {

struct PitchConfig {
    float fmin = 60.0f;            // lowest pitch searched (Hz), at least 40
    float fmax = 1500.0f;          // highest pitch searched (Hz)
    float min_thresh = 0.3f;       // candidates must have dn at or below this
    float abs_thresh = 0.1f;       // confident candidate while tracking
    float onset_thresh = 0.15f;    // a new tone needs a candidate below this
    float offset_thresh_2 = 0.45f; // reference lag must stay below this to keep tracking
    float integer_thresh = 0.1f;   // tolerance on log2(lag ratio) for harmonic matches
    int interp_half_width = 10;    // lags on each side of the minimum to interpolate
    int interp_upsample_fac = 20;
    bool verbose = false;
};

enum class OnsetState { NoOnset, OnsetActive };

// YIN pitch tracker.
//
// Computes the difference function over lags up to samplerate/40, picks a
// minimum of the normalized difference inside [fmin, fmax] and refines it to
// sub-sample precision. Once a tone has started, the lag found at onset is
// kept as a reference so octave jumps to a harmonic of it are corrected.
//
// Not thread-safe; drive it from one thread.
class PitchEstimator {
public:
    explicit PitchEstimator(float samplerate, const PitchConfig& config = PitchConfig{},
                            std::size_t history_length = 20);

    void process(Block& block);

    float samplerate() const { return samplerate_; }
    // A different rate also resets the tracking state.
    void set_samplerate(float samplerate);

    const PitchConfig& config() const { return config_; }
    // Throws ConfigError on invalid values.
    static void validate(const PitchConfig& config);
    void set_config(const PitchConfig& config);
    void set_frequency_range(float fmin, float fmax);

    int num_lags() const { return num_lags_; }
    int lag_min() const { return lag_min_; }
    int lag_max() const { return lag_max_; }

    // Tracking state
    OnsetState state() const { return state_; }
    int onset_lag() const { return onset_lag_; }
    double onset_time() const { return onset_time_; }
    double offset_time() const { return offset_time_; }

    const CircularBuffer<int>& lag_history() const { return lag_history_; }
    const CircularBuffer<float>& score_history() const { return score_history_; }
    const CircularBuffer<float>& pitch_history() const { return pitch_history_; }

    // Back to NoOnset with empty histories.
    void reset();

private:
    struct Event {
        enum class Kind { None, Onset, Offset };
        Kind kind = Kind::None;
        int lag = 0;
        double time = 0.0;
    };

    struct Step {
        OnsetState next = OnsetState::NoOnset;
        Event event;
        bool tunable = false;
        int lag = 0;
    };

    void update_lags();
    std::vector<int> find_candidates(const std::vector<float>& dn, float height) const;

    Step step_no_onset(const std::vector<int>& candidates, const std::vector<float>& dn, double t) const;
    Step step_onset_active(const std::vector<int>& candidates, const std::vector<float>& dn, double t) const;
    void apply(const Event& event);

    float samplerate_;
    PitchConfig config_;

    int num_lags_ = 0;
    int lag_min_ = 0;
    int lag_max_ = 0;

    OnsetState state_ = OnsetState::NoOnset;
    int onset_lag_ = 0;
    double onset_time_ = 0.0;
    double offset_time_ = 0.0;

    CircularBuffer<int> lag_history_;
    CircularBuffer<float> score_history_;
    CircularBuffer<float> pitch_history_;
};

} // namespace scaletuner

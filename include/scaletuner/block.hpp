#pragma once

#include <cstddef>
#include <vector>

namespace scaletuner {

// One analysis cycle: a mono snapshot of the input buffer plus the results
// the estimators fill in as the block passes through them.
class Block {
public:
    Block(std::vector<float> data, std::size_t index, double timestamp, double samplerate);

    const std::vector<float>& data() const { return data_; }
    std::size_t index() const { return index_; }
    double timestamp() const { return timestamp_; }
    double samplerate() const { return samplerate_; }

    // Preprocessing
    float rms = 0.0f;

    // Pitch estimation
    std::vector<float> d;         // YIN difference function, one value per lag
    std::vector<float> dn;        // cumulative-mean-normalized difference
    std::vector<int> minima;      // candidate lags that passed the search window and height
    bool tunable = false;
    int ix_best = 0;              // chosen lag (integer)
    float dn_score = 1.0f;        // dn at ix_best
    float pitch = -1.0f;          // Hz

    // Intonation estimation
    int note = -1;                // scale degree, -1 when untuned
    float error = 0.0f;           // cents, raw
    float error_adj = 0.0f;       // cents, smoothed

private:
    std::vector<float> data_;
    std::size_t index_;
    double timestamp_;
    double samplerate_;
};

float compute_rms(const std::vector<float>& samples);

} // namespace scaletuner

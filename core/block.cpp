#include "scaletuner/block.hpp"

#include <cmath>
#include <utility>

namespace scaletuner {

Block::Block(std::vector<float> data, std::size_t index, double timestamp, double samplerate)
    : data_(std::move(data)), index_(index), timestamp_(timestamp), samplerate_(samplerate) {}

float compute_rms(const std::vector<float>& samples) {
    if (samples.empty()) return 0.0f;
    double acc = 0.0;
    for (float s : samples) acc += static_cast<double>(s) * s;
    return static_cast<float>(std::sqrt(acc / static_cast<double>(samples.size())));
}

} // namespace scaletuner

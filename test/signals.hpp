#pragma once

#include <cmath>
#include <vector>

namespace scaletuner::test {

// Unit-amplitude sine, `phase` given in samples.
inline std::vector<float> sine(float freq, float samplerate, int length, int phase = 0) {
    std::vector<float> x(static_cast<size_t>(length));
    for (int i = 0; i < length; ++i) {
        x[i] = static_cast<float>(std::sin(2.0 * M_PI * freq * (i + phase) / samplerate));
    }
    return x;
}

} // namespace scaletuner::test

#pragma once

#include <vector>

namespace scaletuner::yin {

// d[tau] = sum_{n<W} (x[n] - x[n+tau])^2 for tau in [0, num_lags), with
// W = length/2 - 1. Terms past the end of the input are left out.
std::vector<float> difference_function(const float* x, int length, int num_lags);

// Cumulative mean normalized difference: dn[0] = 1,
// dn[tau] = d[tau] * tau / sum_{k<=tau} d[k]. Lags whose running sum is still
// zero (silence) get 1.
std::vector<float> cumulative_mean_normalized(const std::vector<float>& d);

// Interior local minima of `x` (plateaus resolve to their middle sample),
// thinned so that no two are closer than `min_distance` samples. Deeper minima
// win; between equal values the earlier one wins. Returned in index order.
std::vector<int> local_minima(const std::vector<float>& x, int min_distance);

// Lag of the minimum of `d` near `ix`: `d[ix-half_width .. ix+half_width]` is
// resampled at `upsample` times its density with piecewise quadratic
// interpolation and the position of the smallest value is returned.
float refine_minimum(const std::vector<float>& d, int ix, int half_width, int upsample);

} // namespace scaletuner::yin

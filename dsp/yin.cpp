#include "scaletuner/yin.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace scaletuner::yin {

std::vector<float> difference_function(const float* x, int length, int num_lags) {
    std::vector<float> d(static_cast<size_t>(std::max(0, num_lags)), 0.0f);
    const int window = length / 2 - 1;
    if (!x || window <= 0) return d;

    for (int tau = 0; tau < num_lags; ++tau) {
        const int n_max = std::min(window, length - tau);
        double sum = 0.0;
        for (int n = 0; n < n_max; ++n) {
            const double delta = static_cast<double>(x[n]) - x[n + tau];
            sum += delta * delta;
        }
        d[tau] = static_cast<float>(sum);
    }
    return d;
}

std::vector<float> cumulative_mean_normalized(const std::vector<float>& d) {
    std::vector<float> dn(d.size(), 1.0f);
    double running_sum = d.empty() ? 0.0 : d[0];
    for (size_t tau = 1; tau < d.size(); ++tau) {
        running_sum += d[tau];
        if (running_sum > 0.0) {
            dn[tau] = static_cast<float>(d[tau] * static_cast<double>(tau) / running_sum);
        }
    }
    return dn;
}

std::vector<int> local_minima(const std::vector<float>& x, int min_distance) {
    std::vector<int> minima;
    const int n = static_cast<int>(x.size());

    int i = 1;
    while (i < n - 1) {
        if (x[i - 1] > x[i]) {
            // Walk across a flat bottom
            int ahead = i + 1;
            while (ahead < n - 1 && x[ahead] == x[i]) ++ahead;
            if (x[ahead] > x[i]) {
                minima.push_back((i + ahead - 1) / 2);
                i = ahead;
                continue;
            }
        }
        ++i;
    }

    if (min_distance <= 1 || minima.size() < 2) return minima;

    // Visit deepest first; stable so equal depths keep index order.
    std::vector<size_t> order(minima.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return x[minima[a]] < x[minima[b]];
    });

    std::vector<bool> keep(minima.size(), true);
    for (size_t idx : order) {
        if (!keep[idx]) continue;
        for (size_t j = idx + 1; j < minima.size() && minima[j] - minima[idx] < min_distance; ++j) {
            keep[j] = false;
        }
        for (size_t j = idx; j-- > 0 && minima[idx] - minima[j] < min_distance;) {
            keep[j] = false;
        }
    }

    std::vector<int> out;
    for (size_t k = 0; k < minima.size(); ++k) {
        if (keep[k]) out.push_back(minima[k]);
    }
    return out;
}

// Quadratic through the three samples nearest `pos`.
static double quadratic_at(const std::vector<float>& d, int lower, int upper, double pos) {
    int c = static_cast<int>(std::lround(pos));
    c = std::clamp(c, lower + 1, upper - 1);
    const double y0 = d[c - 1], y1 = d[c], y2 = d[c + 1];
    const double t = pos - c;
    return y1 + 0.5 * t * (y2 - y0) + 0.5 * t * t * (y2 - 2.0 * y1 + y0);
}

float refine_minimum(const std::vector<float>& d, int ix, int half_width, int upsample) {
    const int n = static_cast<int>(d.size());
    const int lower = std::max(0, ix - half_width);
    const int upper = std::min(ix + half_width, n - 1);
    if (upper - lower < 2) return static_cast<float>(ix);

    const int num_in = upper - lower + 1;
    const int num_out = static_cast<int>(std::ceil(static_cast<double>(num_in) * upsample));
    const double step = static_cast<double>(upper - lower) / std::max(1, num_out - 1);

    double best_pos = lower;
    double best_val = quadratic_at(d, lower, upper, lower);
    for (int k = 1; k < num_out; ++k) {
        const double pos = lower + step * k;
        const double val = quadratic_at(d, lower, upper, pos);
        if (val < best_val) {
            best_val = val;
            best_pos = pos;
        }
    }
    return static_cast<float>(best_pos);
}

} // namespace scaletuner::yin

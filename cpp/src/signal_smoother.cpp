// ─────────────────────────────────────────────────────────────────────────────
// signal_smoother.cpp  –  Symmetric Moving Average
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/signal_smoother.h"

#include <algorithm>
#include <cmath>

namespace swingphase {

int clamp_smoothing_window(int half_window) {
    if (half_window <= 0) return 0;
    return std::clamp(half_window, kMinSmoothingWindow, kMaxSmoothingWindow);
}

std::vector<double> moving_average(const std::vector<double>& values,
                                   int half_window) {
    const int w = clamp_smoothing_window(half_window);
    if (w == 0 || values.size() < 2) return values;

    const int n = static_cast<int>(values.size());
    std::vector<double> out(values.size(), 0.0);
    for (int i = 0; i < n; ++i) {
        const int lo = std::max(0, i - w);
        const int hi = std::min(n - 1, i + w);
        double sum = 0.0;
        int count = 0;
        for (int j = lo; j <= hi; ++j) {
            if (!std::isfinite(values[j])) continue;
            sum += values[j];
            ++count;
        }
        out[i] = count ? sum / count : values[i];
    }
    return out;
}

std::vector<std::optional<double>> moving_average(
    const std::vector<std::optional<double>>& values, int half_window) {
    const int w = clamp_smoothing_window(half_window);
    if (w == 0 || values.size() < 2) return values;

    const int n = static_cast<int>(values.size());
    std::vector<std::optional<double>> out(values.size());
    for (int i = 0; i < n; ++i) {
        if (!values[i]) continue;
        const int lo = std::max(0, i - w);
        const int hi = std::min(n - 1, i + w);
        double sum = 0.0;
        int count = 0;
        for (int j = lo; j <= hi; ++j) {
            if (!values[j] || !std::isfinite(*values[j])) continue;
            sum += *values[j];
            ++count;
        }
        out[i] = count ? sum / count : *values[i];
    }
    return out;
}

}  // namespace swingphase

#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// signal_smoother.h  –  Symmetric Moving Average
//
// Suppresses single-frame pose jitter before any threshold is applied.
// The window is [i - half_window, i + half_window], clipped at the ends.
// ─────────────────────────────────────────────────────────────────────────────

#include <optional>
#include <vector>

namespace swingphase {

constexpr int kMinSmoothingWindow = 1;
constexpr int kMaxSmoothingWindow = 3;

/// Clamp a requested half window into the supported 1..3 range
/// (0 is kept and means "no smoothing").
int clamp_smoothing_window(int half_window);

std::vector<double> moving_average(const std::vector<double>& values,
                                   int half_window);

/// Gap-aware variant: only present neighbours are averaged and absent
/// samples stay absent.
std::vector<std::optional<double>> moving_average(
    const std::vector<std::optional<double>>& values, int half_window);

}  // namespace swingphase

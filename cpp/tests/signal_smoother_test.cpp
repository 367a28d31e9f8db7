// ─────────────────────────────────────────────────────────────────────────────
// signal_smoother_test.cpp  –  Moving Average
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/signal_smoother.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <optional>
#include <vector>

namespace {

using namespace swingphase;

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

bool test_window_clamp() {
    if (clamp_smoothing_window(0) != 0 || clamp_smoothing_window(-3) != 0 ||
        clamp_smoothing_window(2) != 2 || clamp_smoothing_window(9) != 3) {
        std::cerr << "signal_smoother_test: window clamp mismatch.\n";
        return false;
    }
    return true;
}

bool test_impulse_spreads() {
    const std::vector<double> in = {0.0, 0.0, 3.0, 0.0, 0.0};
    const std::vector<double> out = moving_average(in, 1);
    const std::vector<double> want = {0.0, 1.0, 1.0, 1.0, 0.0};
    for (std::size_t i = 0; i < want.size(); ++i) {
        if (!near(out[i], want[i])) {
            std::cerr << "signal_smoother_test: impulse at " << i << " got " << out[i] << ".\n";
            return false;
        }
    }
    return true;
}

bool test_edges_clipped() {
    const std::vector<double> in = {4.0, 2.0, 0.0, 0.0, 0.0, 0.0};
    const std::vector<double> out = moving_average(in, 2);
    // [0, 2] at the left edge
    if (!near(out[0], 2.0) || !near(out[1], 1.5)) {
        std::cerr << "signal_smoother_test: edge window not clipped.\n";
        return false;
    }
    return true;
}

bool test_identity_and_length() {
    const std::vector<double> in = {1.0, 5.0, 2.0};
    if (moving_average(in, 0) != in) {
        std::cerr << "signal_smoother_test: window 0 should be identity.\n";
        return false;
    }
    if (moving_average(in, 3).size() != in.size()) {
        std::cerr << "signal_smoother_test: length changed.\n";
        return false;
    }
    return true;
}

bool test_non_finite_skipped() {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    const std::vector<double> out = moving_average(std::vector<double>{2.0, nan, 4.0}, 1);
    if (!near(out[0], 2.0) || !near(out[1], 3.0) || !near(out[2], 4.0)) {
        std::cerr << "signal_smoother_test: NaN leaked into the average.\n";
        return false;
    }
    return true;
}

bool test_gap_aware() {
    const std::vector<std::optional<double>> in = {1.0, std::nullopt, 3.0, 5.0};
    const auto out = moving_average(in, 1);
    if (out[1].has_value()) {
        std::cerr << "signal_smoother_test: absent sample became present.\n";
        return false;
    }
    if (!out[0] || !near(*out[0], 1.0) || !out[2] || !near(*out[2], 4.0) ||
        !out[3] || !near(*out[3], 4.0)) {
        std::cerr << "signal_smoother_test: gap-aware average mismatch.\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!test_window_clamp()) {
        return 1;
    }
    if (!test_impulse_spreads()) {
        return 1;
    }
    if (!test_edges_clipped()) {
        return 1;
    }
    if (!test_identity_and_length()) {
        return 1;
    }
    if (!test_non_finite_skipped()) {
        return 1;
    }
    if (!test_gap_aware()) {
        return 1;
    }
    std::cout << "Signal smoother test passed.\n";
    return 0;
}

// ─────────────────────────────────────────────────────────────────────────────
// phase_detector.cpp  –  Swing Phase Boundary Detection
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/phase_detector.h"
#include "swingphase/body_signals.h"
#include "swingphase/log.h"
#include "swingphase/signal_smoother.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>

namespace swingphase {

namespace {

using OptSeries = std::vector<std::optional<double>>;

int frame_count(const std::vector<Frame>& frames) {
    return static_cast<int>(frames.size());
}

int clamp_index(int i, int n) {
    return std::clamp(i, 0, std::max(0, n - 1));
}

double energy_at(const MotionEnergySeries& energy, int i) {
    if (i < 0 || i >= static_cast<int>(energy.size())) return 0.0;
    const double v = energy[static_cast<std::size_t>(i)];
    return std::isfinite(v) ? v : 0.0;
}

struct SmoothedHands {
    HandLevel level = HandLevel::None;
    OptSeries x;
    OptSeries y;

    bool available() const { return level != HandLevel::None; }
};

SmoothedHands smoothed_hands(const std::vector<Frame>& frames,
                             const DetectorConfig& cfg) {
    HandSeries raw = hand_series(frames);
    SmoothedHands s;
    s.level = raw.level;
    s.x = moving_average(raw.x, cfg.smoothing_window);
    s.y = moving_average(raw.y, cfg.smoothing_window);
    return s;
}

/// Forearm angles when any frame has an elbow/wrist pair, shoulder-line
/// angles otherwise.
OptSeries swing_angles(const std::vector<Frame>& frames) {
    OptSeries forearm(frames.size());
    OptSeries shoulder(frames.size());
    bool any_forearm = false;
    for (std::size_t i = 0; i < frames.size(); ++i) {
        forearm[i] = forearm_angle(frames[i].pose);
        shoulder[i] = shoulder_angle(frames[i].pose);
        any_forearm = any_forearm || forearm[i].has_value();
    }
    return any_forearm ? forearm : shoulder;
}

/// Index of the largest energy in [lo, hi], first wins on ties.
int argmax_energy(const MotionEnergySeries& energy, int lo, int hi) {
    int best = lo;
    double best_v = -std::numeric_limits<double>::infinity();
    for (int i = lo; i <= hi; ++i) {
        const double v = energy_at(energy, i);
        if (v > best_v) {
            best_v = v;
            best = i;
        }
    }
    return best;
}

/// Index of the smallest energy in [lo, hi], last wins on ties.
int argmin_energy(const MotionEnergySeries& energy, int lo, int hi) {
    int best = hi;
    double best_v = std::numeric_limits<double>::infinity();
    for (int i = lo; i <= hi; ++i) {
        const double v = energy_at(energy, i);
        if (v <= best_v) {
            best_v = v;
            best = i;
        }
    }
    return best;
}

}  // namespace

// ─── Address ────────────────────────────────────────────────────────────────
int detect_address(const std::vector<Frame>& frames,
                   const MotionEnergySeries& energy,
                   const DetectorConfig& cfg) {
    const int n = frame_count(frames);
    if (n <= 1) return 0;

    int window = static_cast<int>(std::lround(n * cfg.address_window_fraction));
    window = std::clamp(window, 2, std::max(2, cfg.address_window_cap));
    window = std::min(window, n);

    const SmoothedHands hands = smoothed_hands(frames, cfg);
    const double e_range = energy.range() > 0.0 ? energy.range() : 1.0;
    const double x_range = present_range(hands.x);

    // Frame 0 has no predecessor to move from, so scanning starts at 1.
    int best = 1;
    double best_score = std::numeric_limits<double>::infinity();
    for (int i = 1; i < window; ++i) {
        double score = cfg.address_energy_weight * energy_at(energy, i) / e_range;
        const auto& x0 = hands.x[i - 1];
        const auto& x1 = hands.x[i];
        if (x0 && x1 && x_range > 0.0) {
            score += cfg.address_drift_weight * std::fabs(*x1 - *x0) / x_range;
        }
        if (score < best_score) {
            best_score = score;
            best = i;
        }
    }
    return best;
}

// ─── Top ────────────────────────────────────────────────────────────────────
int detect_top(const std::vector<Frame>& frames,
               const MotionEnergySeries& energy,
               const DetectorConfig& cfg) {
    const int n = frame_count(frames);
    if (n <= 1) return 0;

    const int search_end = std::clamp(
        static_cast<int>(std::ceil(n * cfg.top_search_fraction)), 1, n);

    const SmoothedHands hands = smoothed_hands(frames, cfg);
    int best = -1;
    double best_y = std::numeric_limits<double>::infinity();
    if (hands.available()) {
        for (int i = 0; i < search_end; ++i) {
            const auto& y = hands.y[i];
            if (y && *y < best_y) {
                best_y = *y;
                best = i;
            }
        }
    }

    if (best < 0) {
        // No hand height anywhere: the pause before the energy peak, which
        // is where detect_impact lands without hands.
        const int peak = argmax_energy(energy, 1, n - 1);
        const int lo = std::max(1, peak / 3);
        const int hi = peak - 2;   // leaves a downswing frame before impact
        const int top = hi < lo ? std::max(0, hi) : argmin_energy(energy, lo, hi);
        SWINGPHASE_LOG_DEBUG("PhaseDetector",
            "top from energy pause: " << top << " (peak " << peak << ")");
        return clamp_index(top, n);
    }

    // Pause at the top: keep the last frame of the plateau.
    const double band = cfg.top_plateau_fraction * present_range(hands.y);
    int top = best;
    while (top + 1 < search_end) {
        const auto& next = hands.y[top + 1];
        if (!next || *next > best_y + band) break;
        ++top;
    }
    return top;
}

// ─── Backswing ──────────────────────────────────────────────────────────────
int detect_backswing(const std::vector<Frame>& frames,
                     const MotionEnergySeries& energy,
                     int address, int top,
                     const DetectorConfig& cfg) {
    const int n = frame_count(frames);
    if (n <= 1) return 0;
    address = clamp_index(address, n);
    top = clamp_index(top, n);
    if (top - address < 2) return clamp_index(address + 1, n);

    const SmoothedHands hands = smoothed_hands(frames, cfg);
    if (hands.available()) {
        const double eps = cfg.backswing_rise_fraction * present_range(hands.y);
        for (int i = address + 1; i < top; ++i) {
            const auto& prev = hands.y[i - 1];
            const auto& curr = hands.y[i];
            if (!prev || !curr) continue;

            // y shrinks as the hands rise.
            const double rise = *prev - *curr;
            if (rise <= eps) continue;

            const auto& next = hands.y[i + 1];
            const bool reversed = next && (*next - *curr) > 0.5 * eps;
            if (!reversed) return i;
        }
    }

    // No clean rising edge: largest single-step angular change.
    const OptSeries angles = swing_angles(frames);
    int best = -1;
    double best_step = -1.0;
    for (int i = address + 1; i < top; ++i) {
        const auto& a0 = angles[i - 1];
        const auto& a1 = angles[i];
        if (!a0 || !a1) continue;
        const double step = std::fabs(wrap_angle(*a1 - *a0));
        if (step > best_step) {
            best_step = step;
            best = i;
        }
    }
    if (best >= 0) return best;

    // No angles either: steepest rise in motion energy.
    double best_rise = 0.0;
    for (int i = address + 1; i < top; ++i) {
        const double rise = energy_at(energy, i) - energy_at(energy, i - 1);
        if (rise > best_rise) {
            best_rise = rise;
            best = i;
        }
    }
    if (best >= 0) return best;

    return std::max(address + 1, (address + top) / 2);
}

// ─── Impact ─────────────────────────────────────────────────────────────────
int detect_impact(const std::vector<Frame>& frames,
                  const MotionEnergySeries& energy,
                  int top,
                  const DetectorConfig& cfg) {
    const int n = frame_count(frames);
    if (n <= 1) return 0;
    top = clamp_index(top, n);
    if (top >= n - 1) return n - 1;

    const SmoothedHands hands = smoothed_hands(frames, cfg);
    const double floor_v = cfg.impact_reversal_floor;

    // Downswing direction: the first clear hand step after top.
    int direction = 0;
    if (hands.available()) {
        for (int i = top + 1; i < n; ++i) {
            const auto& x0 = hands.x[i - 1];
            const auto& x1 = hands.x[i];
            if (!x0 || !x1) continue;
            const double v = *x1 - *x0;
            if (std::fabs(v) > floor_v) {
                direction = v > 0 ? 1 : -1;
                break;
            }
        }
    }

    if (direction != 0) {
        int fastest = -1;
        double fastest_v = 0.0;
        for (int i = top + 2; i < n; ++i) {
            const auto& xm2 = hands.x[i - 2];
            const auto& xm1 = hands.x[i - 1];
            const auto& x0 = hands.x[i];
            if (!xm2 || !xm1 || !x0) continue;

            const double v1 = (*xm1 - *xm2) * direction;
            const double v2 = (*x0 - *xm1) * direction;
            if (v1 <= 0.0) continue;

            if (v2 < 0.0) {
                const int last = std::min(n - 1, i - 1 + std::max(1, cfg.impact_confirm_frames));
                for (int j = i; j <= last; ++j) {
                    const auto& xj = hands.x[j];
                    if (xj && std::fabs(*xj - *xm1) > floor_v) {
                        return i - 1;
                    }
                }
            }
            if (v1 > fastest_v) {
                fastest_v = v1;
                fastest = i - 1;
            }
        }
        if (fastest >= 0) {
            SWINGPHASE_LOG_DEBUG("PhaseDetector",
                "no clean reversal, impact at peak hand speed " << fastest);
            return fastest;
        }
    }

    return argmax_energy(energy, top + 1, n - 1);
}

// ─── Downswing ──────────────────────────────────────────────────────────────
int detect_downswing(const std::vector<Frame>& frames,
                     const MotionEnergySeries& energy,
                     int top, int impact,
                     const DetectorConfig& cfg) {
    const int n = frame_count(frames);
    if (n <= 1) return 0;
    top = clamp_index(top, n);
    impact = clamp_index(impact, n);
    const int fallback = clamp_index(top + 1, n);

    const SmoothedHands hands = smoothed_hands(frames, cfg);
    if (!hands.available()) {
        const int mid = (top + impact) / 2;
        return mid > top ? mid : fallback;
    }

    const auto& top_y = hands.y[top];
    if (!top_y) return fallback;

    const int search_end = impact > top + 1 ? impact - 1 : n - 1;
    const double range = present_range(hands.y);
    const double dy_eps = cfg.downswing_step_fraction * range;
    const double delta_eps = cfg.downswing_delta_fraction * range;
    const double motion_eps = cfg.downswing_motion_factor * energy.median();

    int top_window = static_cast<int>(std::floor(n * cfg.top_window_fraction));
    if (cfg.top_window_cap > 0) top_window = std::min(top_window, cfg.top_window_cap);

    for (int i = top + 1; i <= search_end; ++i) {
        const auto& prev = hands.y[i - 1];
        const auto& curr = hands.y[i];
        if (!prev || !curr) continue;

        // y grows as the hands descend.
        const double dy = *curr - *prev;
        const double below_top = *curr - *top_y;
        const bool has_motion = energy_at(energy, i) >= motion_eps;

        bool sustained = dy > dy_eps;
        if (sustained && i + 1 < n) {
            const auto& next = hands.y[i + 1];
            if (next && (*next - *curr) <= -0.5 * dy_eps) sustained = false;
        }

        if (i <= top + top_window) {
            if (below_top > 0.0 &&
                (sustained || (below_top >= 0.3 * delta_eps && has_motion))) {
                return i;
            }
        } else if (below_top >= delta_eps && sustained && has_motion) {
            return i;
        }
    }
    return fallback;
}

// ─── Finish ─────────────────────────────────────────────────────────────────
int detect_finish(const std::vector<Frame>& frames,
                  const MotionEnergySeries& energy,
                  int impact,
                  const DetectorConfig& cfg) {
    const int n = frame_count(frames);
    if (n <= 1) return 0;

    const int tail = static_cast<int>(std::floor(n * (1.0 - cfg.finish_window_fraction)));
    const int start = std::max(clamp_index(impact, n) + 1, tail);
    if (start > n - 1) return n - 1;

    int best = n - 1;
    double best_v = std::numeric_limits<double>::infinity();
    for (int i = start; i < n; ++i) {
        const double v = energy_at(energy, i);
        if (v <= best_v) {  // later frame wins ties
            best_v = v;
            best = i;
        }
    }
    return best;
}

// ─── All Phases ─────────────────────────────────────────────────────────────
PhaseIndices detect_phases(const std::vector<Frame>& frames,
                           const MotionEnergySeries& energy,
                           const DetectorConfig& cfg) {
    PhaseIndices p;
    if (frames.empty()) return p;

    p.address   = detect_address(frames, energy, cfg);
    p.top       = detect_top(frames, energy, cfg);
    p.backswing = detect_backswing(frames, energy, p.address, p.top, cfg);
    p.impact    = detect_impact(frames, energy, p.top, cfg);
    p.downswing = detect_downswing(frames, energy, p.top, p.impact, cfg);
    p.finish    = detect_finish(frames, energy, p.impact, cfg);

    SWINGPHASE_LOG_DEBUG("PhaseDetector",
        "raw indices address=" << p.address << " backswing=" << p.backswing
        << " top=" << p.top << " downswing=" << p.downswing
        << " impact=" << p.impact << " finish=" << p.finish);
    return p;
}

}  // namespace swingphase

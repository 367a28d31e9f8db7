#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// phase_detector.h  –  Swing Phase Boundary Detection
//
// Six sub-detectors, one per phase.  Each is a pure function of the frames,
// the (already smoothed) motion energy series and the earlier anchors it
// depends on, so it can be exercised on its own with synthetic curves.
//
// Evaluation order: address → top → backswing → impact → downswing → finish.
// Downswing is searched between top and impact, hence impact comes first.
//
// Thresholds are fractions of the observed signal range or median, never
// absolute pixel values, except the impact reversal floor which is an
// absolute distance in normalized image units.
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/motion_energy.h"
#include "swingphase/types.h"

#include <vector>

namespace swingphase {

struct DetectorConfig {
    int    smoothing_window        = 1;     // half window for energy & hand signals

    // Address
    double address_window_fraction = 0.20;  // early search window, of N
    int    address_window_cap      = 20;    // frames
    double address_energy_weight   = 0.7;
    double address_drift_weight    = 0.3;

    // Backswing
    double backswing_rise_fraction = 0.02;  // of hand-height range

    // Top
    double top_search_fraction     = 0.75;  // ignore follow-through artifacts
    double top_plateau_fraction    = 0.005; // of hand-height range

    // Downswing
    double top_window_fraction     = 0.15;  // transition window after top, of N
    int    top_window_cap          = 5;     // frames, 0 = uncapped
    double downswing_step_fraction = 0.02;  // per-frame drop, of range
    double downswing_delta_fraction = 0.04; // drop below top, of range
    double downswing_motion_factor = 0.6;   // of median energy

    // Impact
    double impact_reversal_floor   = 0.005; // normalized units
    int    impact_confirm_frames   = 3;

    // Finish
    double finish_window_fraction  = 0.15;  // tail of the sequence
};

int detect_address(const std::vector<Frame>& frames,
                   const MotionEnergySeries& energy,
                   const DetectorConfig& cfg);

int detect_top(const std::vector<Frame>& frames,
               const MotionEnergySeries& energy,
               const DetectorConfig& cfg);

int detect_backswing(const std::vector<Frame>& frames,
                     const MotionEnergySeries& energy,
                     int address, int top,
                     const DetectorConfig& cfg);

int detect_impact(const std::vector<Frame>& frames,
                  const MotionEnergySeries& energy,
                  int top,
                  const DetectorConfig& cfg);

int detect_downswing(const std::vector<Frame>& frames,
                     const MotionEnergySeries& energy,
                     int top, int impact,
                     const DetectorConfig& cfg);

int detect_finish(const std::vector<Frame>& frames,
                  const MotionEnergySeries& energy,
                  int impact,
                  const DetectorConfig& cfg);

/// Run all six sub-detectors.  The result is in bounds but not yet
/// order-repaired; pass it through enforce_order().
PhaseIndices detect_phases(const std::vector<Frame>& frames,
                           const MotionEnergySeries& energy,
                           const DetectorConfig& cfg);

}  // namespace swingphase

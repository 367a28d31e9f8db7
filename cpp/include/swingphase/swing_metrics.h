#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// swing_metrics.h  –  2D Pose Metrics Keyed by Phase
//
// Chest rotation, head / knee sway, spine tilt, hand vs chest timing,
// lower-body lead and the hand trace, all read off the frames at the
// segmented phase indices.  Every metric is absent when its joints are.
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/types.h"

#include <optional>
#include <vector>

namespace swingphase {

enum class Handedness { Right, Left };

struct SwayMetric {
    double dx = 0.0;
    double dy = 0.0;
    double dist = 0.0;
    std::optional<double> dist_norm;   // / shoulder width
};

enum class HandChestOrder { HandFirst, TorsoFirst, Mixed, Unclear };
const char* hand_chest_order_str(HandChestOrder o);  // "hand_first", ...

struct HandVsChest {
    std::optional<double> hand_advance_norm;      // top → impact, / shoulder width
    std::optional<double> shoulder_rotation_deg;
    std::optional<double> ratio;
    HandChestOrder classification = HandChestOrder::Unclear;
};

enum class BodyLead { LowerBody, Chest, Unclear };
const char* body_lead_str(BodyLead l);  // "lower_body", ...

struct LowerBodyLead {
    std::optional<int> hip_start_index;
    std::optional<int> chest_start_index;
    std::optional<int> delta_frames;     // hip - chest
    BodyLead lead = BodyLead::Unclear;
    double threshold = 0.0;
};

struct HandTracePoint {
    Point2 position;
    Phase phase = Phase::Backswing;     // Backswing or Downswing
    int frame_index = 0;
    double timestamp_sec = 0.0;
};

struct SwingMetrics {
    std::optional<double> chest_rotation_deg;
    std::optional<SwayMetric> head_sway;
    std::optional<SwayMetric> knee_sway;
    std::optional<double> spine_tilt_delta_deg;
    HandVsChest hand_vs_chest;
    std::optional<LowerBodyLead> lower_body_lead;

    std::optional<Point2> hand_address;
    std::optional<Point2> hand_top;
    std::optional<Point2> hand_impact;
    std::vector<HandTracePoint> hand_trace;

    std::size_t frame_count = 0;
    std::size_t usable_pose_count = 0;
};

/// Trunk tilt from vertical (degrees), shoulder centre over hip centre.
std::optional<double> trunk_tilt_deg(const Pose& pose);

SwingMetrics compute_swing_metrics(const std::vector<Frame>& frames,
                                   const PhaseIndices& indices,
                                   Handedness handedness = Handedness::Right);

}  // namespace swingphase

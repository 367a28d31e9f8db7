// ─────────────────────────────────────────────────────────────────────────────
// swing_metrics.cpp  –  2D Pose Metrics Keyed by Phase
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/swing_metrics.h"
#include "swingphase/body_signals.h"

#include <algorithm>
#include <cmath>

namespace swingphase {

const char* hand_chest_order_str(HandChestOrder o) {
    switch (o) {
        case HandChestOrder::HandFirst:  return "hand_first";
        case HandChestOrder::TorsoFirst: return "torso_first";
        case HandChestOrder::Mixed:      return "mixed";
        case HandChestOrder::Unclear:    return "unclear";
    }
    return "unclear";
}

const char* body_lead_str(BodyLead l) {
    switch (l) {
        case BodyLead::LowerBody: return "lower_body";
        case BodyLead::Chest:     return "chest";
        case BodyLead::Unclear:   return "unclear";
    }
    return "unclear";
}

namespace {

constexpr double kRotationScaleDeg   = 45.0;   // rotation that counts as one unit
constexpr double kHandFirstRatio     = 1.25;
constexpr double kTorsoFirstRatio    = 0.85;
constexpr double kMinLeadThreshold   = 0.012;
constexpr double kLeadWidthFraction  = 0.12;
constexpr double kDefaultLeadThreshold = 0.02;

double rad_to_deg(double rad) { return rad * 180.0 / kPi; }

std::optional<SwayMetric> sway(const std::optional<Point2>& from,
                               const std::optional<Point2>& to,
                               const std::optional<double>& scale) {
    if (!from || !to) return std::nullopt;
    SwayMetric s;
    s.dx = to->x - from->x;
    s.dy = to->y - from->y;
    s.dist = std::hypot(s.dx, s.dy);
    if (scale) s.dist_norm = s.dist / *scale;
    return s;
}

}  // namespace

std::optional<double> trunk_tilt_deg(const Pose& pose) {
    auto shoulder = shoulder_center(pose);
    auto hip = hip_center(pose);
    if (!shoulder || !hip) return std::nullopt;
    const double dx = shoulder->x - hip->x;
    const double dy = shoulder->y - hip->y;
    if (!std::isfinite(dx) || !std::isfinite(dy)) return std::nullopt;
    return rad_to_deg(std::atan2(std::abs(dx), std::abs(dy)));
}

SwingMetrics compute_swing_metrics(const std::vector<Frame>& frames,
                                   const PhaseIndices& indices,
                                   Handedness handedness) {
    SwingMetrics m;
    m.frame_count = frames.size();
    if (frames.empty()) return m;

    const bool left = handedness == Handedness::Left;
    const int last = static_cast<int>(frames.size()) - 1;
    auto safe = [last](int i) { return std::clamp(i, 0, last); };
    auto pose_at = [&frames, &safe](int i) -> const Pose& {
        return frames[static_cast<std::size_t>(safe(i))].pose;
    };

    const int address = safe(indices.address);
    const int top = safe(indices.top);
    const int impact = safe(indices.impact);

    const Pose& address_pose = pose_at(address);
    const Pose& top_pose = pose_at(top);
    const Pose& impact_pose = pose_at(impact);

    // Normalization scale: shoulder width at address, else at top
    std::optional<double> scale = shoulder_width(address_pose);
    if (!scale) scale = shoulder_width(top_pose);
    if (scale) scale = std::max(0.001, *scale);

    // ── Sway ────────────────────────────────────────────────────────────
    m.head_sway = sway(shoulder_center(address_pose), shoulder_center(top_pose), scale);
    m.knee_sway = sway(knee_center(address_pose), knee_center(top_pose), scale);

    // ── Chest rotation ──────────────────────────────────────────────────
    auto angle_top = shoulder_angle(top_pose);
    auto angle_impact = shoulder_angle(impact_pose);
    if (angle_top && angle_impact) {
        m.chest_rotation_deg = std::abs(rad_to_deg(wrap_angle(*angle_impact - *angle_top)));
    }

    // ── Hand vs chest ───────────────────────────────────────────────────
    m.hand_address = hand_point(address_pose, left);
    m.hand_top = hand_point(top_pose, left);
    m.hand_impact = hand_point(impact_pose, left);

    HandVsChest& hvc = m.hand_vs_chest;
    hvc.shoulder_rotation_deg = m.chest_rotation_deg;
    auto advance = distance(m.hand_top, m.hand_impact);
    if (advance && scale) hvc.hand_advance_norm = *advance / *scale;
    if (hvc.hand_advance_norm && m.chest_rotation_deg) {
        const double rotation_norm = std::max(0.001, *m.chest_rotation_deg / kRotationScaleDeg);
        hvc.ratio = *hvc.hand_advance_norm / rotation_norm;
    }
    if (!hvc.ratio || !std::isfinite(*hvc.ratio)) {
        hvc.classification = HandChestOrder::Unclear;
    } else if (*hvc.ratio >= kHandFirstRatio) {
        hvc.classification = HandChestOrder::HandFirst;
    } else if (*hvc.ratio <= kTorsoFirstRatio) {
        hvc.classification = HandChestOrder::TorsoFirst;
    } else {
        hvc.classification = HandChestOrder::Mixed;
    }

    // ── Spine tilt ──────────────────────────────────────────────────────
    auto tilt_address = trunk_tilt_deg(address_pose);
    auto tilt_top = trunk_tilt_deg(top_pose);
    if (tilt_address && tilt_top) {
        m.spine_tilt_delta_deg = std::abs(*tilt_top - *tilt_address);
    }

    // ── Lower-body lead (top → impact) ──────────────────────────────────
    auto base_hip = hip_center(top_pose);
    if (!base_hip) base_hip = hip_center(address_pose);
    auto base_shoulder = shoulder_center(top_pose);
    if (!base_shoulder) base_shoulder = shoulder_center(address_pose);
    if (base_hip && base_shoulder) {
        LowerBodyLead lead;
        lead.threshold = scale ? std::max(kMinLeadThreshold, *scale * kLeadWidthFraction)
                               : kDefaultLeadThreshold;
        for (int i = top + 1; i <= impact; ++i) {
            const Pose& pose = pose_at(i);
            auto hip_move = distance(hip_center(pose), base_hip);
            auto chest_move = distance(shoulder_center(pose), base_shoulder);
            if (!lead.hip_start_index && hip_move && *hip_move > lead.threshold) {
                lead.hip_start_index = i;
            }
            if (!lead.chest_start_index && chest_move && *chest_move > lead.threshold) {
                lead.chest_start_index = i;
            }
            if (lead.hip_start_index && lead.chest_start_index) break;
        }
        if (lead.hip_start_index && lead.chest_start_index) {
            lead.delta_frames = *lead.hip_start_index - *lead.chest_start_index;
            lead.lead = *lead.hip_start_index <= *lead.chest_start_index ? BodyLead::LowerBody
                                                                         : BodyLead::Chest;
        }
        m.lower_body_lead = lead;
    }

    // ── Hand trace (address → impact) ───────────────────────────────────
    for (int i = address; i <= impact; ++i) {
        const Frame& f = frames[static_cast<std::size_t>(i)];
        auto hand = hand_point(f.pose, left);
        if (!hand) continue;
        m.hand_trace.push_back({*hand, i <= top ? Phase::Backswing : Phase::Downswing,
                                f.index, f.timestamp_sec});
    }

    m.usable_pose_count = static_cast<std::size_t>(
        std::count_if(frames.begin(), frames.end(),
                      [](const Frame& f) { return !f.pose.empty(); }));
    return m;
}

}  // namespace swingphase

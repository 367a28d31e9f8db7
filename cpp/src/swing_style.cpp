// ─────────────────────────────────────────────────────────────────────────────
// swing_style.cpp  –  Torso / Arm Dominance Classification
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/swing_style.h"
#include "swingphase/body_signals.h"
#include "swingphase/log.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace swingphase {

const char* swing_style_str(SwingStyle s) {
    switch (s) {
        case SwingStyle::TorsoDominant: return "torso-dominant";
        case SwingStyle::ArmDominant:   return "arm-dominant";
        case SwingStyle::Mixed:         return "mixed";
    }
    return "mixed";
}

const char* style_confidence_str(StyleConfidence c) {
    switch (c) {
        case StyleConfidence::High:   return "high";
        case StyleConfidence::Medium: return "medium";
        case StyleConfidence::Low:    return "low";
    }
    return "low";
}

const char* style_trend_str(StyleTrend t) {
    switch (t) {
        case StyleTrend::Improving: return "improving";
        case StyleTrend::Worsening: return "worsening";
        case StyleTrend::Unchanged: return "unchanged";
        case StyleTrend::Unclear:   return "unclear";
    }
    return "unclear";
}

StyleConfidence downgrade(StyleConfidence c) {
    return c == StyleConfidence::High ? StyleConfidence::Medium : StyleConfidence::Low;
}

namespace {

constexpr const char* kRotationLeads  = "chest rotation leads early in the downswing";
constexpr const char* kHandsDropFirst = "hands drop first early in the downswing";
constexpr const char* kHandsAway      = "hands drift away from the body in the downswing";
constexpr const char* kHandsInPlane   = "hands stay within the chest rotation plane";
constexpr const char* kAmbiguous      = "signals are ambiguous, classified as mixed";
constexpr const char* kInsufficient   = "insufficient data to classify";

bool finite(const Point2& p) { return std::isfinite(p.x) && std::isfinite(p.y); }

SwingStyleAssessment insufficient() {
    SwingStyleAssessment a;
    a.evidence.push_back(kInsufficient);
    return a;
}

}  // namespace

SwingStyleAssessment classify_swing_style(const SwingStyleInput& input,
                                          bool face_unstable_hint) {
    const StyleFrameInput& top = input.top;
    const StyleFrameInput& ds = input.downswing;
    if (!std::isfinite(top.shoulder_angle) || !std::isfinite(ds.shoulder_angle) ||
        !finite(top.hand_position) || !finite(ds.hand_position)) {
        return insufficient();
    }

    const double shoulder_delta = std::abs(wrap_angle(ds.shoulder_angle - top.shoulder_angle)) / kPi;
    const double hand_drop = std::clamp(ds.hand_position.y - top.hand_position.y, 0.0, 1.0);

    int torso = 0;
    int arm = 0;
    bool rotation_vote = false;
    bool plane_vote = false;
    std::vector<std::string> evidence;

    // ① rotation vs hand drop, top → downswing
    if (shoulder_delta >= hand_drop * 1.15 && shoulder_delta >= 0.03) {
        torso += 2;
        rotation_vote = true;
        evidence.push_back(kRotationLeads);
    } else if (hand_drop >= shoulder_delta * 1.35 && hand_drop >= 0.04) {
        arm += 2;
        rotation_vote = true;
        evidence.push_back(kHandsDropFirst);
    }

    // ② hand vs torso at downswing
    if (ds.shoulder_width && std::isfinite(*ds.shoulder_width) &&
        *ds.shoulder_width >= 0.03 && ds.shoulder_center && finite(*ds.shoulder_center)) {
        const double width = *ds.shoulder_width;
        const double dx = ds.hand_position.x - ds.shoulder_center->x;
        const double dy = ds.hand_position.y - ds.shoulder_center->y;
        const double ratio = std::hypot(dx, dy) / width;
        const double x_ratio = std::abs(dx) / width;
        if (ratio >= 1.3 || x_ratio >= 0.9) {
            arm += 2;
            plane_vote = true;
            evidence.push_back(kHandsAway);
        } else if (ratio <= 1.05) {
            torso += 1;
            plane_vote = true;
            evidence.push_back(kHandsInPlane);
        }
    }

    SwingStyleAssessment out;
    if (std::abs(torso - arm) <= 1) {
        out.style = SwingStyle::Mixed;
    } else if (torso > arm) {
        out.style = SwingStyle::TorsoDominant;
    } else {
        out.style = SwingStyle::ArmDominant;
    }

    const bool full_agreement =
        (out.style == SwingStyle::TorsoDominant && torso >= 3 && arm == 0) ||
        (out.style == SwingStyle::ArmDominant && arm >= 4 && torso == 0);

    if (out.style == SwingStyle::Mixed) {
        out.confidence = StyleConfidence::Low;
    } else if (full_agreement) {
        out.confidence = StyleConfidence::High;
    } else if (rotation_vote || plane_vote) {
        out.confidence = StyleConfidence::Medium;
    } else {
        out.confidence = StyleConfidence::Low;
    }
    if (face_unstable_hint) out.confidence = downgrade(out.confidence);

    if (evidence.empty()) {
        out.evidence.push_back(kAmbiguous);
    } else {
        if (evidence.size() > kMaxStyleEvidence) evidence.resize(kMaxStyleEvidence);
        out.evidence = std::move(evidence);
    }

    SWINGPHASE_LOG_DEBUG("SwingStyle", swing_style_str(out.style)
        << " (" << style_confidence_str(out.confidence) << ") torso=" << torso
        << " arm=" << arm);
    return out;
}

SwingStyleAssessment classify_swing_style(const std::optional<SwingStyleInput>& input,
                                          bool face_unstable_hint) {
    if (!input) return insufficient();
    return classify_swing_style(*input, face_unstable_hint);
}

namespace {

std::optional<StyleFrameInput> frame_input(const std::vector<Frame>& frames, int index,
                                           bool left_handed) {
    if (index < 0 || index >= static_cast<int>(frames.size())) return std::nullopt;
    const Pose& pose = frames[static_cast<std::size_t>(index)].pose;
    auto angle = shoulder_angle(pose);
    auto hand = hand_point(pose, left_handed);
    if (!angle || !hand) return std::nullopt;

    StyleFrameInput in;
    in.shoulder_angle = *angle;
    in.hand_position = *hand;
    in.shoulder_center = shoulder_center(pose);
    in.shoulder_width = shoulder_width(pose);
    return in;
}

}  // namespace

std::optional<SwingStyleInput> style_input_from_phases(
    const std::vector<Frame>& frames, const PhaseIndices& indices, bool left_handed) {
    auto top = frame_input(frames, indices.top, left_handed);
    auto ds = frame_input(frames, indices.downswing, left_handed);
    if (!top || !ds) return std::nullopt;

    SwingStyleInput input;
    input.top = *top;
    input.downswing = *ds;
    if (auto impact = frame_input(frames, indices.impact, left_handed)) {
        input.impact = *impact;
    } else {
        input.impact = *ds;
    }
    return input;
}

SwingStyleChange detect_style_change(const std::optional<SwingStyle>& previous,
                                     const SwingStyleAssessment& current) {
    SwingStyleChange c;
    c.previous = previous.value_or(SwingStyle::Mixed);
    c.current = current.style;

    if (c.previous == SwingStyle::ArmDominant && c.current == SwingStyle::TorsoDominant) {
        c.change = StyleTrend::Improving;
    } else if (c.previous == SwingStyle::TorsoDominant && c.current == SwingStyle::ArmDominant) {
        c.change = StyleTrend::Worsening;
    } else if (c.previous == c.current && c.previous != SwingStyle::Mixed) {
        c.change = StyleTrend::Unchanged;
    } else {
        c.change = StyleTrend::Unclear;
    }

    if (c.change == StyleTrend::Unclear) {
        c.confidence = current.confidence == StyleConfidence::High ? StyleConfidence::Medium
                                                                   : StyleConfidence::Low;
    } else {
        c.confidence = current.confidence;
    }
    return c;
}

}  // namespace swingphase

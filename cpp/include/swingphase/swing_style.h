#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// swing_style.h  –  Torso / Arm Dominance Classification
//
// Two votes over the top → downswing transition:
//   1. Shoulder rotation vs hand drop
//   2. Hand distance from the shoulder centre at downswing
// The difference of the vote totals decides torso-dominant, arm-dominant or
// mixed.  Confidence depends on how many criteria agree.
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/types.h"

#include <optional>
#include <string>
#include <vector>

namespace swingphase {

enum class SwingStyle { TorsoDominant, ArmDominant, Mixed };
enum class StyleConfidence { High, Medium, Low };

const char* swing_style_str(SwingStyle s);            // "torso-dominant", ...
const char* style_confidence_str(StyleConfidence c);  // "high", ...

/// One step down: high → medium → low → low.
StyleConfidence downgrade(StyleConfidence c);

/// Per-phase inputs.  Angles in radians, positions normalized.
struct StyleFrameInput {
    double shoulder_angle = 0.0;
    Point2 hand_position;
    std::optional<Point2> shoulder_center;
    std::optional<double> shoulder_width;
};

struct SwingStyleInput {
    StyleFrameInput top;
    StyleFrameInput downswing;
    StyleFrameInput impact;
};

struct SwingStyleAssessment {
    SwingStyle style = SwingStyle::Mixed;
    StyleConfidence confidence = StyleConfidence::Low;
    std::vector<std::string> evidence;   // at most two entries
};

constexpr std::size_t kMaxStyleEvidence = 2;

SwingStyleAssessment classify_swing_style(const SwingStyleInput& input,
                                          bool face_unstable_hint = false);

/// Missing input (or non-finite required signals) → mixed / low.
SwingStyleAssessment classify_swing_style(const std::optional<SwingStyleInput>& input,
                                          bool face_unstable_hint = false);

/// Derive the inputs from the frames at top, downswing and impact.
/// std::nullopt when shoulder angle or hand position is missing at top or
/// downswing.
std::optional<SwingStyleInput> style_input_from_phases(
    const std::vector<Frame>& frames, const PhaseIndices& indices,
    bool left_handed = false);

// ─── Change vs Previous Swing ───────────────────────────────────────────────
enum class StyleTrend { Improving, Worsening, Unchanged, Unclear };

const char* style_trend_str(StyleTrend t);

struct SwingStyleChange {
    SwingStyle previous = SwingStyle::Mixed;
    SwingStyle current = SwingStyle::Mixed;
    StyleTrend change = StyleTrend::Unclear;
    StyleConfidence confidence = StyleConfidence::Low;
};

/// No previous swing is treated as mixed.
SwingStyleChange detect_style_change(const std::optional<SwingStyle>& previous,
                                     const SwingStyleAssessment& current);

}  // namespace swingphase

#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// body_signals.h  –  Derived Body Signals (hand height, angles, centres)
//
// Every helper returns std::nullopt when the joints it needs are absent;
// nothing is ever read as a (0, 0) coordinate.
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/types.h"

#include <optional>
#include <vector>

namespace swingphase {

constexpr double kPi = 3.14159265358979323846;

/// Body part that stands in for "the hands" across a whole sequence.
enum class HandLevel { Wrists, Shoulders, Hips, None };

const char* hand_level_str(HandLevel level);

/// Hand position series.  The level is fixed for the whole sequence: the
/// first of wrists → shoulders → hips present in any frame.
struct HandSeries {
    HandLevel level = HandLevel::None;
    std::vector<std::optional<double>> x;
    std::vector<std::optional<double>> y;

    bool available() const { return level != HandLevel::None; }
};

HandSeries hand_series(const std::vector<Frame>& frames);

/// Mean of the present joints among `a` and `b`.
std::optional<Point2> mean_point(const Pose& pose, Joint a, Joint b);

std::optional<Point2> shoulder_center(const Pose& pose);
std::optional<Point2> hip_center(const Pose& pose);
std::optional<Point2> knee_center(const Pose& pose);
std::optional<double> shoulder_width(const Pose& pose);

/// Angle of the line left shoulder → right shoulder (radians).
std::optional<double> shoulder_angle(const Pose& pose);

/// Angle of elbow → wrist, lead (left) arm first.
std::optional<double> forearm_angle(const Pose& pose);

/// Lead-hand position: left wrist for a right-handed golfer, right wrist for
/// a left-handed one, falling back to the wrist mean.
std::optional<Point2> hand_point(const Pose& pose, bool left_handed);

/// Wrap an angle difference into [-pi, pi].
double wrap_angle(double radians);

std::optional<double> distance(const std::optional<Point2>& a,
                               const std::optional<Point2>& b);

/// max - min over the present samples (0 when fewer than two).
double present_range(const std::vector<std::optional<double>>& values);

double median(std::vector<double> values);

}  // namespace swingphase

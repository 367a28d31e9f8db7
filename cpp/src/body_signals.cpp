// ─────────────────────────────────────────────────────────────────────────────
// body_signals.cpp  –  Derived Body Signals
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/body_signals.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace swingphase {

const char* hand_level_str(HandLevel level) {
    switch (level) {
        case HandLevel::Wrists:    return "wrists";
        case HandLevel::Shoulders: return "shoulders";
        case HandLevel::Hips:      return "hips";
        case HandLevel::None:      return "none";
    }
    return "unknown";
}

std::optional<Point2> mean_point(const Pose& pose, Joint a, Joint b) {
    const auto& pa = pose[a];
    const auto& pb = pose[b];
    if (pa && pb) return Point2{0.5 * (pa->x + pb->x), 0.5 * (pa->y + pb->y)};
    if (pa) return pa->point();
    if (pb) return pb->point();
    return std::nullopt;
}

static std::optional<Point2> level_point(const Pose& pose, HandLevel level) {
    switch (level) {
        case HandLevel::Wrists:
            return mean_point(pose, Joint::LeftWrist, Joint::RightWrist);
        case HandLevel::Shoulders:
            return mean_point(pose, Joint::LeftShoulder, Joint::RightShoulder);
        case HandLevel::Hips:
            return mean_point(pose, Joint::LeftHip, Joint::RightHip);
        case HandLevel::None:
            break;
    }
    return std::nullopt;
}

HandSeries hand_series(const std::vector<Frame>& frames) {
    HandSeries s;
    for (HandLevel level : {HandLevel::Wrists, HandLevel::Shoulders, HandLevel::Hips}) {
        const bool present = std::any_of(frames.begin(), frames.end(),
            [level](const Frame& f) { return level_point(f.pose, level).has_value(); });
        if (present) {
            s.level = level;
            break;
        }
    }

    s.x.resize(frames.size());
    s.y.resize(frames.size());
    if (!s.available()) return s;

    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (auto p = level_point(frames[i].pose, s.level)) {
            s.x[i] = p->x;
            s.y[i] = p->y;
        }
    }
    return s;
}

std::optional<Point2> shoulder_center(const Pose& pose) {
    return mean_point(pose, Joint::LeftShoulder, Joint::RightShoulder);
}

std::optional<Point2> hip_center(const Pose& pose) {
    return mean_point(pose, Joint::LeftHip, Joint::RightHip);
}

std::optional<Point2> knee_center(const Pose& pose) {
    return mean_point(pose, Joint::LeftKnee, Joint::RightKnee);
}

std::optional<double> shoulder_width(const Pose& pose) {
    const auto& ls = pose[Joint::LeftShoulder];
    const auto& rs = pose[Joint::RightShoulder];
    if (!ls || !rs) return std::nullopt;
    return std::hypot(rs->x - ls->x, rs->y - ls->y);
}

std::optional<double> shoulder_angle(const Pose& pose) {
    const auto& ls = pose[Joint::LeftShoulder];
    const auto& rs = pose[Joint::RightShoulder];
    if (!ls || !rs) return std::nullopt;
    return std::atan2(rs->y - ls->y, rs->x - ls->x);
}

std::optional<double> forearm_angle(const Pose& pose) {
    const auto& lw = pose[Joint::LeftWrist];
    const auto& le = pose[Joint::LeftElbow];
    if (lw && le) return std::atan2(lw->y - le->y, lw->x - le->x);

    const auto& rw = pose[Joint::RightWrist];
    const auto& re = pose[Joint::RightElbow];
    if (rw && re) return std::atan2(rw->y - re->y, rw->x - re->x);
    return std::nullopt;
}

std::optional<Point2> hand_point(const Pose& pose, bool left_handed) {
    const auto& lead = left_handed ? pose[Joint::RightWrist] : pose[Joint::LeftWrist];
    if (lead) return lead->point();
    return mean_point(pose, Joint::LeftWrist, Joint::RightWrist);
}

double wrap_angle(double radians) {
    const double two_pi = 2.0 * kPi;
    double d = std::fmod(radians + kPi, two_pi);
    if (d < 0) d += two_pi;
    return d - kPi;
}

std::optional<double> distance(const std::optional<Point2>& a,
                               const std::optional<Point2>& b) {
    if (!a || !b) return std::nullopt;
    return std::hypot(a->x - b->x, a->y - b->y);
}

double present_range(const std::vector<std::optional<double>>& values) {
    double lo = std::numeric_limits<double>::infinity();
    double hi = -std::numeric_limits<double>::infinity();
    int count = 0;
    for (const auto& v : values) {
        if (!v || !std::isfinite(*v)) continue;
        lo = std::min(lo, *v);
        hi = std::max(hi, *v);
        ++count;
    }
    return count >= 2 ? hi - lo : 0.0;
}

double median(std::vector<double> values) {
    values.erase(std::remove_if(values.begin(), values.end(),
                                [](double v) { return !std::isfinite(v); }),
                 values.end());
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    const std::size_t mid = values.size() / 2;
    if (values.size() % 2 == 1) return values[mid];
    return 0.5 * (values[mid - 1] + values[mid]);
}

}  // namespace swingphase

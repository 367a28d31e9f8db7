// ─────────────────────────────────────────────────────────────────────────────
// keypoint_adapter.cpp  –  Joint Name Mapping, Normalization & Fallback Pose
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/keypoint_adapter.h"
#include "swingphase/body_signals.h"
#include "swingphase/log.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace swingphase {

namespace {

struct NameEntry {
    const char* key;   // lower-case, separators removed
    Joint joint;
    bool alias;
};

const NameEntry kNames[] = {
    {"leftshoulder",  Joint::LeftShoulder,  false},
    {"rightshoulder", Joint::RightShoulder, false},
    {"leftelbow",     Joint::LeftElbow,     false},
    {"rightelbow",    Joint::RightElbow,    false},
    {"leftwrist",     Joint::LeftWrist,     false},
    {"rightwrist",    Joint::RightWrist,    false},
    {"lefthip",       Joint::LeftHip,       false},
    {"righthip",      Joint::RightHip,      false},
    {"leftknee",      Joint::LeftKnee,      false},
    {"rightknee",     Joint::RightKnee,     false},
    {"leftankle",     Joint::LeftAnkle,     false},
    {"rightankle",    Joint::RightAnkle,    false},
    {"lefthand",      Joint::LeftWrist,     true},
    {"righthand",     Joint::RightWrist,    true},
};

std::string fold_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '_' || c == '-' || c == ' ' || c == '.') continue;
        out.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

// Normalized estimators overshoot 1 slightly at the image border; anything
// past this is a pixel coordinate.
constexpr double kPixelSpaceThreshold = 2.0;

double to_normalized(double v, int extent) {
    if (extent > 0) {
        v /= static_cast<double>(extent);
    }
    return std::clamp(v, 0.0, 1.0);
}

/// One coordinate space per sequence: an estimator reports either pixels or
/// normalized units, never a mix.
bool uses_pixel_coordinates(const std::vector<RawPoseResult>& results) {
    for (const auto& r : results) {
        if (!r.joints) continue;
        for (const auto& j : *r.joints) {
            if ((std::isfinite(j.x) && j.x > kPixelSpaceThreshold) ||
                (std::isfinite(j.y) && j.y > kPixelSpaceThreshold)) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

std::optional<Joint> canonical_joint(const std::string& name, bool* is_alias) {
    const std::string key = fold_name(name);
    for (const auto& e : kNames) {
        if (key == e.key) {
            if (is_alias) *is_alias = e.alias;
            return e.joint;
        }
    }
    return std::nullopt;
}

Pose synthetic_pose(double timestamp_sec, double duration_sec) {
    const double t = std::max(0.0, timestamp_sec);
    // Fraction of the clip; one full backswing/downswing arc over the duration.
    const double u = duration_sec > 1e-9 ? std::clamp(t / duration_sec, 0.0, 1.0)
                                         : 0.5;
    const double arc = std::sin(kPi * u);
    const double sway = 0.005 * std::sin(t);

    auto kp = [](double x, double y) {
        Keypoint k;
        k.x = x;
        k.y = y;
        return k;
    };

    Pose pose;
    pose[Joint::LeftShoulder]  = kp(0.42, 0.40 + sway);
    pose[Joint::RightShoulder] = kp(0.58, 0.40 + sway);
    pose[Joint::LeftHip]       = kp(0.43, 0.62);
    pose[Joint::RightHip]      = kp(0.57, 0.62);

    const double hand_x = 0.50 + 0.12 * std::sin(2.0 * kPi * u);
    const double hand_y = 0.58 - 0.30 * arc;
    pose[Joint::LeftWrist]  = kp(hand_x - 0.01, hand_y);
    pose[Joint::RightWrist] = kp(hand_x + 0.01, hand_y);
    pose[Joint::LeftElbow]  = kp(0.5 * (0.42 + hand_x), 0.5 * (0.40 + hand_y));
    pose[Joint::RightElbow] = kp(0.5 * (0.58 + hand_x), 0.5 * (0.40 + hand_y));
    return pose;
}

KeypointAdapter::KeypointAdapter(AdapterOptions options)
    : options_(options) {}

cv::Size KeypointAdapter::frame_extent(const RawPoseResult& r,
                                       const cv::Size& sequence_extent) const {
    const cv::Size image =
        r.image.empty() ? sequence_extent : cv::Size(r.image.cols, r.image.rows);
    return cv::Size(options_.image_width > 0 ? options_.image_width : image.width,
                    options_.image_height > 0 ? options_.image_height : image.height);
}

std::optional<Keypoint> KeypointAdapter::convert_joint(const RawJoint& joint,
                                                      const cv::Size& extent) const {
    if (!std::isfinite(joint.x) || !std::isfinite(joint.y)) {
        return std::nullopt;
    }
    if (joint.score && *joint.score < options_.min_joint_confidence) {
        return std::nullopt;
    }
    Keypoint kp;
    kp.x = to_normalized(joint.x, extent.width);
    kp.y = to_normalized(joint.y, extent.height);
    kp.confidence = joint.score;
    return kp;
}

Pose KeypointAdapter::convert_pose(const std::vector<RawJoint>& joints,
                                   const cv::Size& extent) const {
    Pose pose;
    Pose aliases;
    for (const auto& raw : joints) {
        bool alias = false;
        auto joint = canonical_joint(raw.name, &alias);
        if (!joint) continue;

        auto kp = convert_joint(raw, extent);
        if (!kp) continue;

        if (alias) {
            aliases[*joint] = kp;
        } else {
            pose[*joint] = kp;
        }
    }
    // Hand points stand in for wrists only when the wrist itself is missing.
    for (Joint j : {Joint::LeftWrist, Joint::RightWrist}) {
        if (!pose.has(j) && aliases.has(j)) {
            pose[j] = aliases[j];
        }
    }
    return pose;
}

AdaptedFrames KeypointAdapter::adapt(const std::vector<RawPoseResult>& results) const {
    AdaptedFrames out;
    if (results.empty()) return out;

    std::vector<const RawPoseResult*> ordered;
    ordered.reserve(results.size());
    for (const auto& r : results) ordered.push_back(&r);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const RawPoseResult* a, const RawPoseResult* b) {
                         return a->index < b->index;
                     });

    const bool pixel_space = uses_pixel_coordinates(results);
    cv::Size sequence_extent;
    for (const RawPoseResult* r : ordered) {
        if (!r->image.empty()) {
            sequence_extent = cv::Size(r->image.cols, r->image.rows);
            break;
        }
    }

    out.frames.reserve(ordered.size());
    double prev_ts = 0.0;
    int clamped_ts = 0;
    int unscaled = 0;
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const RawPoseResult& r = *ordered[i];

        Frame f;
        f.index = static_cast<int>(i);
        double ts = std::isfinite(r.timestamp_sec) ? std::max(0.0, r.timestamp_sec) : prev_ts;
        if (i > 0 && ts < prev_ts) {
            ts = prev_ts;
            ++clamped_ts;
        }
        f.timestamp_sec = ts;
        prev_ts = ts;

        f.confidence = r.confidence;
        f.image = r.image;
        if (r.joints && !pixel_space) {
            f.pose = convert_pose(*r.joints, cv::Size());
        } else if (r.joints) {
            const cv::Size extent = frame_extent(r, sequence_extent);
            if (extent.width > 0 && extent.height > 0) {
                f.pose = convert_pose(*r.joints, extent);
            } else if (!r.joints->empty()) {
                ++unscaled;
            }
        }
        if (!f.pose.empty()) {
            f.provenance = Provenance::Estimated;
            ++out.usable_pose_frames;
        }
        out.frames.push_back(std::move(f));
    }

    if (unscaled > 0) {
        SWINGPHASE_LOG_WARN("KeypointAdapter",
            unscaled << " frame(s) report pixel coordinates with no image size"
            " – joints dropped");
    }
    if (clamped_ts > 0) {
        SWINGPHASE_LOG_WARN("KeypointAdapter",
            clamped_ts << " timestamp(s) went backwards and were clamped");
    }

    const bool has_images = std::any_of(
        out.frames.begin(), out.frames.end(),
        [](const Frame& f) { return !f.image.empty(); });

    if (out.usable_pose_frames == 0 && options_.synthesize_when_empty &&
        !(options_.prefer_pixels_over_synthetic && has_images)) {
        const double t0 = out.frames.front().timestamp_sec;
        const double duration = out.frames.back().timestamp_sec - t0;
        for (auto& f : out.frames) {
            f.pose = synthetic_pose(f.timestamp_sec - t0, duration);
            f.provenance = Provenance::Synthetic;
        }
        out.synthetic = true;
        SWINGPHASE_LOG_INFO("KeypointAdapter",
            "No usable joints in " << out.frames.size()
            << " frames – using synthetic trajectory");
    }

    SWINGPHASE_LOG_DEBUG("KeypointAdapter",
        "Adapted " << out.frames.size() << " frames ("
        << out.usable_pose_frames << " with pose)");
    return out;
}

}  // namespace swingphase

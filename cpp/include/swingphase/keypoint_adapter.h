#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// keypoint_adapter.h  –  Upstream Pose Results → Canonical Frames
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/types.h"

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace swingphase {

/// One named joint as reported by the external estimator.
struct RawJoint {
    std::string name;           // "leftWrist", "left_wrist", "LEFT_WRIST", ...
    double x = 0.0;
    double y = 0.0;
    std::optional<float> score;
};

/// Per-frame estimator output.  `joints` is empty when the estimator
/// returned nothing for this frame.
struct RawPoseResult {
    int index = 0;
    double timestamp_sec = 0.0;
    std::optional<std::vector<RawJoint>> joints;
    std::optional<float> confidence;
    cv::Mat image;
};

struct AdapterOptions {
    float min_joint_confidence = 0.0f;   // joints scored below are dropped
    int   image_width  = 0;              // pixel extent, 0 = frame image width
    int   image_height = 0;              // pixel extent, 0 = frame image height
    bool  synthesize_when_empty = true;
    bool  prefer_pixels_over_synthetic = true;  // images present: leave poses empty
};

struct AdaptedFrames {
    std::vector<Frame> frames;
    bool synthetic = false;          // every pose came from the fallback curve
    int  usable_pose_frames = 0;     // frames with at least one real joint
};

/// Map a joint name in any of the known vocabularies onto a canonical joint.
/// Hand aliases ("left_hand") resolve to the wrist with `is_alias` set.
std::optional<Joint> canonical_joint(const std::string& name,
                                     bool* is_alias = nullptr);

/// Deterministic stand-in pose keyed by time.  Only used when the estimator
/// produced nothing at all; always tagged Provenance::Synthetic.
Pose synthetic_pose(double timestamp_sec, double duration_sec);

// ─── Keypoint Adapter ───────────────────────────────────────────────────────
class KeypointAdapter {
public:
    explicit KeypointAdapter(AdapterOptions options = {});

    /// Normalize heterogeneous results into frames ordered by index and
    /// re-indexed 0..N-1.  Pixel coordinates are scaled by the option extent,
    /// else the frame image, else the first image in the sequence; frames
    /// with none of those lose their joints.
    AdaptedFrames adapt(const std::vector<RawPoseResult>& results) const;

    const AdapterOptions& options() const { return options_; }

private:
    /// Empty extent: coordinates are already normalized.
    Pose convert_pose(const std::vector<RawJoint>& joints, const cv::Size& extent) const;
    std::optional<Keypoint> convert_joint(const RawJoint& joint, const cv::Size& extent) const;
    cv::Size frame_extent(const RawPoseResult& r, const cv::Size& sequence_extent) const;

    AdapterOptions options_;
};

}  // namespace swingphase

#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// types.h  –  Core Value Types: Joints, Frames & Phase Indices
// ─────────────────────────────────────────────────────────────────────────────

#include <opencv2/core.hpp>

#include <array>
#include <cstddef>
#include <optional>
#include <vector>

namespace swingphase {

/// Canonical joint set.  Upstream vocabularies are mapped onto these.
enum class Joint {
    LeftShoulder = 0,
    RightShoulder,
    LeftElbow,
    RightElbow,
    LeftWrist,
    RightWrist,
    LeftHip,
    RightHip,
    LeftKnee,
    RightKnee,
    LeftAnkle,
    RightAnkle,
};

constexpr std::size_t kJointCount = 12;

constexpr std::array<Joint, kJointCount> kAllJoints = {
    Joint::LeftShoulder, Joint::RightShoulder,
    Joint::LeftElbow,    Joint::RightElbow,
    Joint::LeftWrist,    Joint::RightWrist,
    Joint::LeftHip,      Joint::RightHip,
    Joint::LeftKnee,     Joint::RightKnee,
    Joint::LeftAnkle,    Joint::RightAnkle,
};

/// camelCase name, e.g. "leftShoulder".
const char* joint_name(Joint joint);

struct Point2 {
    double x = 0.0;
    double y = 0.0;
};

/// Normalized image position (origin top-left, y grows downwards).
struct Keypoint {
    double x = 0.0;
    double y = 0.0;
    std::optional<float> confidence;

    Point2 point() const { return {x, y}; }
};

/// Enum-indexed joint slots.  An empty slot means "not observed".
class Pose {
public:
    const std::optional<Keypoint>& operator[](Joint j) const {
        return joints_[static_cast<std::size_t>(j)];
    }
    std::optional<Keypoint>& operator[](Joint j) {
        return joints_[static_cast<std::size_t>(j)];
    }

    bool has(Joint j) const { return (*this)[j].has_value(); }
    std::size_t present_count() const;
    bool empty() const { return present_count() == 0; }

private:
    std::array<std::optional<Keypoint>, kJointCount> joints_{};
};

/// Where the joints of a frame came from.
enum class Provenance { None, Estimated, Synthetic };

const char* provenance_str(Provenance p);

struct Frame {
    int index = 0;                   // 0-based position in the sequence
    double timestamp_sec = 0.0;      // non-decreasing
    Pose pose;
    Provenance provenance = Provenance::None;
    std::optional<float> confidence; // frame-level estimator confidence
    cv::Mat image;                   // opaque payload, only read for pixel energy
};

// ─── Phases ─────────────────────────────────────────────────────────────────
enum class Phase { Address = 0, Backswing, Top, Downswing, Impact, Finish };

constexpr std::size_t kPhaseCount = 6;

constexpr std::array<Phase, kPhaseCount> kAllPhases = {
    Phase::Address, Phase::Backswing, Phase::Top,
    Phase::Downswing, Phase::Impact, Phase::Finish,
};

const char* phase_name(Phase phase);

struct PhaseIndices {
    int address   = 0;
    int backswing = 0;
    int top       = 0;
    int downswing = 0;
    int impact    = 0;
    int finish    = 0;

    int at(Phase phase) const;
    void set(Phase phase, int index);

    std::array<int, kPhaseCount> to_array() const {
        return {address, backswing, top, downswing, impact, finish};
    }
    static PhaseIndices from_array(const std::array<int, kPhaseCount>& a);

    /// True when strictly increasing and inside [0, frame_count - 1].
    bool is_valid(std::size_t frame_count) const;

    bool operator==(const PhaseIndices& o) const {
        return to_array() == o.to_array();
    }
    bool operator!=(const PhaseIndices& o) const { return !(*this == o); }
};

/// One frame per phase, in phase order.
struct PhaseFrame {
    Phase phase = Phase::Address;
    Frame frame;
};

using PhaseFrames = std::vector<PhaseFrame>;

}  // namespace swingphase

// ─────────────────────────────────────────────────────────────────────────────
// keypoint_adapter_test.cpp  –  Name Mapping, Normalization & Fallback Pose
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/keypoint_adapter.h"

#include <opencv2/core.hpp>

#include <cmath>
#include <iostream>
#include <limits>

namespace {

using namespace swingphase;

bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

RawPoseResult result(int index, double ts, std::vector<RawJoint> joints) {
    RawPoseResult r;
    r.index = index;
    r.timestamp_sec = ts;
    r.joints = std::move(joints);
    return r;
}

bool test_vocabularies() {
    const char* spellings[] = {"leftWrist", "left_wrist", "LEFT_WRIST", "Left Wrist", "left-wrist"};
    for (const char* s : spellings) {
        auto j = canonical_joint(s);
        if (!j || *j != Joint::LeftWrist) {
            std::cerr << "keypoint_adapter_test: '" << s << "' not mapped to leftWrist.\n";
            return false;
        }
    }
    bool alias = false;
    auto hand = canonical_joint("right_hand", &alias);
    if (!hand || *hand != Joint::RightWrist || !alias) {
        std::cerr << "keypoint_adapter_test: hand alias not resolved.\n";
        return false;
    }
    if (canonical_joint("nose")) {
        std::cerr << "keypoint_adapter_test: unknown joint should not map.\n";
        return false;
    }
    return true;
}

bool test_ordering_and_timestamps() {
    std::vector<RawPoseResult> in;
    in.push_back(result(7, 0.30, {{"left_hip", 0.4, 0.6, 0.9f}}));
    in.push_back(result(3, 0.10, {{"left_hip", 0.4, 0.6, 0.9f}}));
    in.push_back(result(9, 0.20, {{"left_hip", 0.4, 0.6, 0.9f}}));   // goes backwards

    const AdaptedFrames out = KeypointAdapter().adapt(in);
    if (out.frames.size() != 3 || out.synthetic || out.usable_pose_frames != 3) {
        std::cerr << "keypoint_adapter_test: unexpected frame count or flags.\n";
        return false;
    }
    for (std::size_t i = 0; i < out.frames.size(); ++i) {
        if (out.frames[i].index != static_cast<int>(i)) {
            std::cerr << "keypoint_adapter_test: frames not re-indexed.\n";
            return false;
        }
    }
    if (!near(out.frames[0].timestamp_sec, 0.10) || !near(out.frames[1].timestamp_sec, 0.30) ||
        !near(out.frames[2].timestamp_sec, 0.30)) {
        std::cerr << "keypoint_adapter_test: timestamps not sorted / clamped.\n";
        return false;
    }
    if (out.frames[0].provenance != Provenance::Estimated) {
        std::cerr << "keypoint_adapter_test: estimated frame has wrong provenance.\n";
        return false;
    }
    return true;
}

bool test_normalization_and_filtering() {
    AdapterOptions opts;
    opts.image_width = 640;
    opts.image_height = 480;
    opts.min_joint_confidence = 0.3f;

    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::vector<RawPoseResult> in;
    in.push_back(result(0, 0.0, {
        {"leftShoulder", 320.0, 240.0, 0.9f},
        {"rightShoulder", 384.0, 192.0, std::nullopt},
        {"leftElbow", 0.5, 0.5, 0.1f},          // below threshold
        {"rightElbow", nan, 0.5, 0.9f},         // non-finite
        {"leftKnee", -0.2, 1.0, 0.9f},          // clamped
    }));

    const Pose& pose = KeypointAdapter(opts).adapt(in).frames[0].pose;
    if (!pose.has(Joint::LeftShoulder) || !near(pose[Joint::LeftShoulder]->x, 0.5) ||
        !near(pose[Joint::LeftShoulder]->y, 0.5)) {
        std::cerr << "keypoint_adapter_test: pixel coordinates not normalized.\n";
        return false;
    }
    if (!pose.has(Joint::RightShoulder) || pose[Joint::RightShoulder]->confidence ||
        !near(pose[Joint::RightShoulder]->x, 0.6)) {
        std::cerr << "keypoint_adapter_test: unscored joint should be kept without score.\n";
        return false;
    }
    if (pose.has(Joint::LeftElbow) || pose.has(Joint::RightElbow)) {
        std::cerr << "keypoint_adapter_test: low-score / NaN joints not dropped.\n";
        return false;
    }
    if (!pose.has(Joint::LeftKnee) || !near(pose[Joint::LeftKnee]->x, 0.0)) {
        std::cerr << "keypoint_adapter_test: coordinate not clamped to [0, 1].\n";
        return false;
    }
    return true;
}

std::vector<RawPoseResult> pixel_wrists(bool with_images) {
    const double xs[] = {350.0, 370.0, 390.0};
    const double ys[] = {330.0, 300.0, 270.0};
    std::vector<RawPoseResult> in;
    for (int i = 0; i < 3; ++i) {
        in.push_back(result(i, 0.1 * i, {
            {"left_wrist", xs[i], ys[i], 0.9f},
            {"right_wrist", 0.5, 0.8, 0.9f},    // a pixel near the corner
        }));
        if (with_images && i == 0) in.back().image = cv::Mat(480, 640, CV_8UC3, cv::Scalar::all(0));
    }
    return in;
}

bool test_pixel_joints_scaled_by_image() {
    const AdaptedFrames out = KeypointAdapter().adapt(pixel_wrists(true));
    if (out.synthetic || out.usable_pose_frames != 3) {
        std::cerr << "keypoint_adapter_test: pixel joints should stay estimated.\n";
        return false;
    }
    // Frames 1 and 2 carry no image and borrow the sequence's image size.
    const Pose& last = out.frames[2].pose;
    if (!near(out.frames[0].pose[Joint::LeftWrist]->x, 350.0 / 640.0) ||
        !near(out.frames[0].pose[Joint::LeftWrist]->y, 330.0 / 480.0) ||
        !near(last[Joint::LeftWrist]->x, 390.0 / 640.0) ||
        !near(last[Joint::LeftWrist]->y, 270.0 / 480.0)) {
        std::cerr << "keypoint_adapter_test: pixel joints not scaled by the image size.\n";
        return false;
    }
    if (!near(last[Joint::RightWrist]->x, 0.5 / 640.0) ||
        !near(last[Joint::RightWrist]->y, 0.8 / 480.0)) {
        std::cerr << "keypoint_adapter_test: small pixel values read as normalized.\n";
        return false;
    }
    return true;
}

bool test_pixel_joints_without_extent_dropped() {
    const AdaptedFrames out = KeypointAdapter().adapt(pixel_wrists(false));
    if (out.usable_pose_frames != 0) {
        std::cerr << "keypoint_adapter_test: unscalable pixel joints were kept.\n";
        return false;
    }
    if (!out.synthetic || out.frames[1].provenance != Provenance::Synthetic) {
        std::cerr << "keypoint_adapter_test: dropped joints should fall back to synthetic.\n";
        return false;
    }

    AdapterOptions off;
    off.synthesize_when_empty = false;
    const AdaptedFrames bare = KeypointAdapter(off).adapt(pixel_wrists(false));
    if (!bare.frames[0].pose.empty() || bare.frames[0].provenance == Provenance::Estimated) {
        std::cerr << "keypoint_adapter_test: pixel joints clamped instead of dropped.\n";
        return false;
    }
    return true;
}

bool test_normalized_overshoot_clamped() {
    std::vector<RawPoseResult> in;
    in.push_back(result(0, 0.0, {{"left_wrist", 1.02, 0.5, 0.9f}, {"left_hip", 0.4, 0.6, 0.9f}}));
    const Pose& pose = KeypointAdapter().adapt(in).frames[0].pose;
    if (!near(pose[Joint::LeftWrist]->x, 1.0) || !near(pose[Joint::LeftHip]->x, 0.4)) {
        std::cerr << "keypoint_adapter_test: border overshoot should clamp, not rescale.\n";
        return false;
    }
    return true;
}

bool test_hand_alias_precedence() {
    std::vector<RawPoseResult> in;
    in.push_back(result(0, 0.0, {
        {"left_hand", 0.1, 0.1, 0.9f},
        {"left_wrist", 0.2, 0.2, 0.9f},
        {"right_hand", 0.8, 0.3, 0.9f},
    }));
    const Pose& pose = KeypointAdapter().adapt(in).frames[0].pose;
    if (!near(pose[Joint::LeftWrist]->x, 0.2)) {
        std::cerr << "keypoint_adapter_test: alias overrode a real wrist.\n";
        return false;
    }
    if (!pose.has(Joint::RightWrist) || !near(pose[Joint::RightWrist]->x, 0.8)) {
        std::cerr << "keypoint_adapter_test: alias did not fill the missing wrist.\n";
        return false;
    }
    return true;
}

bool test_synthetic_fallback() {
    std::vector<RawPoseResult> in;
    for (int i = 0; i < 10; ++i) {
        RawPoseResult r;
        r.index = i;
        r.timestamp_sec = 0.1 * i;
        if (i % 2 == 0) r.joints = std::vector<RawJoint>{};   // estimator returned nothing
        in.push_back(r);
    }

    const AdaptedFrames out = KeypointAdapter().adapt(in);
    if (!out.synthetic || out.usable_pose_frames != 0) {
        std::cerr << "keypoint_adapter_test: synthetic flag not set.\n";
        return false;
    }
    for (const Frame& f : out.frames) {
        if (f.provenance != Provenance::Synthetic || !f.pose.has(Joint::LeftWrist)) {
            std::cerr << "keypoint_adapter_test: synthetic frame missing pose.\n";
            return false;
        }
    }

    const AdaptedFrames again = KeypointAdapter().adapt(in);
    if (again.frames[4].pose[Joint::LeftWrist]->y != out.frames[4].pose[Joint::LeftWrist]->y) {
        std::cerr << "keypoint_adapter_test: synthetic trajectory not deterministic.\n";
        return false;
    }

    AdapterOptions off;
    off.synthesize_when_empty = false;
    if (KeypointAdapter(off).adapt(in).synthetic) {
        std::cerr << "keypoint_adapter_test: synthesis ran while disabled.\n";
        return false;
    }
    return true;
}

bool test_images_preferred_over_synthetic() {
    std::vector<RawPoseResult> in;
    for (int i = 0; i < 4; ++i) {
        RawPoseResult r;
        r.index = i;
        r.timestamp_sec = 0.1 * i;
        r.image = cv::Mat(8, 8, CV_8UC3, cv::Scalar(i * 10, i * 10, i * 10));
        in.push_back(r);
    }
    const AdaptedFrames out = KeypointAdapter().adapt(in);
    if (out.synthetic || !out.frames[0].pose.empty() || out.frames[2].image.empty()) {
        std::cerr << "keypoint_adapter_test: images should bypass the synthetic pose.\n";
        return false;
    }
    return true;
}

bool test_synthetic_pose_shape() {
    const Pose start = synthetic_pose(0.0, 2.0);
    const Pose mid = synthetic_pose(1.0, 2.0);
    const Pose end = synthetic_pose(2.0, 2.0);
    const double y0 = start[Joint::LeftWrist]->y;
    const double y1 = mid[Joint::LeftWrist]->y;
    const double y2 = end[Joint::LeftWrist]->y;
    if (!(y1 < y0 && y1 < y2)) {
        std::cerr << "keypoint_adapter_test: synthetic hands should peak mid-clip.\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!test_vocabularies()) {
        return 1;
    }
    if (!test_ordering_and_timestamps()) {
        return 1;
    }
    if (!test_normalization_and_filtering()) {
        return 1;
    }
    if (!test_pixel_joints_scaled_by_image()) {
        return 1;
    }
    if (!test_pixel_joints_without_extent_dropped()) {
        return 1;
    }
    if (!test_normalized_overshoot_clamped()) {
        return 1;
    }
    if (!test_hand_alias_precedence()) {
        return 1;
    }
    if (!test_synthetic_fallback()) {
        return 1;
    }
    if (!test_images_preferred_over_synthetic()) {
        return 1;
    }
    if (!test_synthetic_pose_shape()) {
        return 1;
    }
    std::cout << "Keypoint adapter test passed.\n";
    return 0;
}

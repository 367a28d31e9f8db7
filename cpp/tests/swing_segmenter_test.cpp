// ─────────────────────────────────────────────────────────────────────────────
// swing_segmenter_test.cpp  –  Pipeline, Fallbacks & Ordering Guarantees
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/signal_smoother.h"
#include "swingphase/swing_segmenter.h"
#include "synthetic_swing_test_utils.h"

#include <opencv2/core.hpp>

#include <cmath>
#include <iostream>
#include <limits>
#include <random>

namespace {

using namespace swingphase;
using namespace swingphase::tests;

bool frames_match_indices(const SegmentationResult& r) {
    if (r.frames.size() != kPhaseCount) return false;
    for (std::size_t k = 0; k < kPhaseCount; ++k) {
        if (r.frames[k].phase != kAllPhases[k]) return false;
        if (r.frames[k].frame.index != r.indices.at(kAllPhases[k])) return false;
    }
    return true;
}

bool test_canonical_swing() {
    const std::vector<Frame> frames = swing_frames(40);
    const SegmentationResult r = SwingSegmenter().segment(frames);

    if (r.fallback_used || r.reason != FallbackReason::None || r.synthetic) {
        std::cerr << "swing_segmenter_test: canonical swing fell back ("
                  << fallback_reason_str(r.reason) << ").\n";
        return false;
    }
    if (r.energy.source != MotionSignalSource::Joints || r.energy.size() != frames.size()) {
        std::cerr << "swing_segmenter_test: energy series contract broken.\n";
        return false;
    }
    const int window = SegmenterConfig{}.detector.smoothing_window;
    if (r.raw_energy.size() != frames.size() || r.raw_energy[0] != 0.0 ||
        !(r.energy[0] > 0.0) ||
        r.energy.values != moving_average(r.raw_energy.values, window)) {
        std::cerr << "swing_segmenter_test: raw and smoothed energy not both reported.\n";
        return false;
    }
    if (!r.indices.is_valid(frames.size())) {
        std::cerr << "swing_segmenter_test: canonical indices not ordered.\n";
        return false;
    }
    if (r.indices.top != 19 && r.indices.top != 20) {
        std::cerr << "swing_segmenter_test: top expected near t=1.0, got " << r.indices.top
                  << ".\n";
        return false;
    }
    if (r.indices.address >= 8) {
        std::cerr << "swing_segmenter_test: address expected near t=0, got "
                  << r.indices.address << ".\n";
        return false;
    }
    if (r.indices.finish < 34) {
        std::cerr << "swing_segmenter_test: finish expected near t=2.0, got "
                  << r.indices.finish << ".\n";
        return false;
    }
    if (!frames_match_indices(r)) {
        std::cerr << "swing_segmenter_test: phase frames do not match indices.\n";
        return false;
    }
    return true;
}

bool test_deterministic() {
    std::vector<Frame> frames = swing_frames(36);
    std::mt19937 rng(11);
    std::uniform_real_distribution<double> jitter(-0.004, 0.004);
    for (Frame& f : frames) {
        auto& lw = f.pose[Joint::LeftWrist];
        lw->x += jitter(rng);
        lw->y += jitter(rng);
    }
    const SwingSegmenter segmenter;
    const SegmentationResult a = segmenter.segment(frames);
    const SegmentationResult b = segmenter.segment(frames);
    if (a.indices != b.indices || a.energy.values != b.energy.values ||
        a.order_repaired != b.order_repaired) {
        std::cerr << "swing_segmenter_test: identical input gave different output.\n";
        return false;
    }
    return true;
}

bool test_missing_wrists() {
    std::vector<Frame> gaps = swing_frames(40);
    for (std::size_t i = 0; i < gaps.size(); i += 3) {
        gaps[i].pose[Joint::LeftWrist].reset();
        gaps[i].pose[Joint::RightWrist].reset();
    }
    const SegmentationResult r = SwingSegmenter().segment(gaps);
    if (!r.indices.is_valid(gaps.size())) {
        std::cerr << "swing_segmenter_test: gappy wrists broke ordering.\n";
        return false;
    }

    // No wrists at all: shoulders carry the swing.
    std::vector<Frame> shoulders = empty_frames(40);
    for (Frame& f : shoulders) {
        const double y = swing_hand_y(f.timestamp_sec) - 0.2;
        const double x = swing_hand_x(f.timestamp_sec);
        set_joint(f, Joint::LeftShoulder, x - 0.08, y);
        set_joint(f, Joint::RightShoulder, x + 0.08, y);
    }
    const SegmentationResult s = SwingSegmenter().segment(shoulders);
    if (!s.indices.is_valid(shoulders.size()) || s.fallback_used) {
        std::cerr << "swing_segmenter_test: shoulder-only swing not segmented.\n";
        return false;
    }
    if (s.indices.top != 19 && s.indices.top != 20) {
        std::cerr << "swing_segmenter_test: shoulder-only top got " << s.indices.top << ".\n";
        return false;
    }
    return true;
}

bool test_degenerate_motion() {
    const std::vector<Frame> frames = still_frames(21);
    const SegmentationResult r = SwingSegmenter().segment(frames);
    if (!r.fallback_used || r.reason != FallbackReason::DegenerateMotion) {
        std::cerr << "swing_segmenter_test: still frames should be degenerate.\n";
        return false;
    }
    const PhaseIndices want = PhaseIndices::from_array({1, 4, 7, 11, 15, 19});
    if (r.indices != want ||
        r.indices != proportional_indices(frames, SegmenterConfig{}.fallback_ratios)) {
        std::cerr << "swing_segmenter_test: degenerate output is not the proportional split.\n";
        return false;
    }
    if (!frames_match_indices(r)) {
        std::cerr << "swing_segmenter_test: fallback phase frames mismatch.\n";
        return false;
    }
    return true;
}

bool test_equal_timestamps_use_index_span() {
    std::vector<Frame> frames = still_frames(10);
    for (Frame& f : frames) f.timestamp_sec = 0.0;
    const SegmentationResult r = SwingSegmenter().segment(frames);
    if (r.indices != PhaseIndices::from_array({0, 2, 3, 5, 7, 9})) {
        std::cerr << "swing_segmenter_test: equal timestamps should split by index.\n";
        return false;
    }
    return true;
}

bool test_short_and_empty_input() {
    const SegmentationResult empty = SwingSegmenter().segment(std::vector<Frame>{});
    if (!empty.fallback_used || empty.reason != FallbackReason::EmptyInput ||
        empty.indices != PhaseIndices{} || !empty.frames.empty()) {
        std::cerr << "swing_segmenter_test: empty input contract broken.\n";
        return false;
    }

    const std::vector<Frame> four = swing_frames(4);
    const SegmentationResult shortr = SwingSegmenter().segment(four);
    if (!shortr.fallback_used || shortr.reason != FallbackReason::InsufficientFrames) {
        std::cerr << "swing_segmenter_test: 4 frames should be insufficient.\n";
        return false;
    }
    const auto a = shortr.indices.to_array();
    for (std::size_t k = 0; k < a.size(); ++k) {
        if (a[k] < 0 || a[k] > 3 || (k > 0 && a[k] < a[k - 1])) {
            std::cerr << "swing_segmenter_test: short input indices out of order.\n";
            return false;
        }
    }
    if (shortr.frames.size() != kPhaseCount) {
        std::cerr << "swing_segmenter_test: short input should still yield six frames.\n";
        return false;
    }

    const std::vector<Frame> six = swing_frames(6);
    const SegmentationResult minimal = SwingSegmenter().segment(six);
    if (minimal.indices != PhaseIndices::from_array({0, 1, 2, 3, 4, 5})) {
        std::cerr << "swing_segmenter_test: six frames must map one phase per frame.\n";
        return false;
    }
    return true;
}

bool test_adversarial_inputs_stay_ordered() {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> coord(0.0, 1.0);
    std::bernoulli_distribution present(0.7);

    for (std::size_t n = 6; n <= 60; n += 3) {
        std::vector<Frame> frames = empty_frames(n);
        for (Frame& f : frames) {
            for (Joint j : kAllJoints) {
                if (present(rng)) set_joint(f, j, coord(rng), coord(rng));
            }
        }
        const SegmentationResult r = SwingSegmenter().segment(frames);
        if (!r.indices.is_valid(n)) {
            std::cerr << "swing_segmenter_test: random poses broke ordering at n=" << n << ".\n";
            return false;
        }
    }

    std::vector<Frame> poisoned = swing_frames(20);
    poisoned[7].pose[Joint::LeftWrist] =
        Keypoint{std::numeric_limits<double>::quiet_NaN(), 0.5, 0.9f};
    const SegmentationResult p = SwingSegmenter().segment(poisoned);
    if (!p.indices.is_valid(poisoned.size())) {
        std::cerr << "swing_segmenter_test: NaN joint broke ordering.\n";
        return false;
    }

    std::vector<Frame> nothing = empty_frames(15);
    const SegmentationResult q = SwingSegmenter().segment(nothing);
    if (!q.indices.is_valid(nothing.size()) || !q.fallback_used) {
        std::cerr << "swing_segmenter_test: frames without any signal should fall back.\n";
        return false;
    }
    return true;
}

bool test_raw_results_synthetic() {
    std::vector<RawPoseResult> raw;
    for (int i = 0; i < 30; ++i) {
        RawPoseResult r;
        r.index = i;
        r.timestamp_sec = i / 15.0;
        raw.push_back(r);
    }
    const SegmentationResult r = SwingSegmenter().segment(raw);
    if (!r.synthetic || !r.indices.is_valid(raw.size())) {
        std::cerr << "swing_segmenter_test: synthetic path not flagged or unordered.\n";
        return false;
    }
    if (r.frames.front().frame.provenance != Provenance::Synthetic) {
        std::cerr << "swing_segmenter_test: synthetic frames lost their provenance.\n";
        return false;
    }
    return true;
}

bool test_raw_results_pixels() {
    // Brightness steps grow to a peak at frame 12 then shrink.
    std::vector<RawPoseResult> raw;
    double level = 0.0;
    for (int i = 0; i < 20; ++i) {
        const double step = i <= 12 ? 1.5 * i : 1.5 * (24 - i);
        if (i > 0) level += step;
        RawPoseResult r;
        r.index = i;
        r.timestamp_sec = i / 10.0;
        r.image = cv::Mat(24, 32, CV_8UC3, cv::Scalar(level, level, level));
        raw.push_back(r);
    }
    const SegmentationResult r = SwingSegmenter().segment(raw);
    if (r.synthetic || r.energy.source != MotionSignalSource::Pixels) {
        std::cerr << "swing_segmenter_test: image-only input should use pixel energy.\n";
        return false;
    }
    if (!r.indices.is_valid(raw.size())) {
        std::cerr << "swing_segmenter_test: pixel path indices unordered.\n";
        return false;
    }
    if (r.fallback_used || r.indices.impact != 12) {
        std::cerr << "swing_segmenter_test: pixel impact expected at peak 12, got "
                  << r.indices.impact << " (top " << r.indices.top << ").\n";
        return false;
    }
    return true;
}

bool test_config_sanitized() {
    SegmenterConfig cfg;
    cfg.min_frames = 2;
    cfg.joint_energy_epsilon = -1.0;
    cfg.fallback_ratios = {0.5, 0.4, 0.3, 0.2, 0.1, 0.0};
    cfg.detector.smoothing_window = 9;
    cfg.detector.impact_confirm_frames = 0;

    const SegmenterConfig s = cfg.sanitized();
    const SegmenterConfig defaults;
    if (s.min_frames != 6 || s.joint_energy_epsilon != defaults.joint_energy_epsilon ||
        s.fallback_ratios != defaults.fallback_ratios || s.detector.smoothing_window != 3 ||
        s.detector.impact_confirm_frames != 1) {
        std::cerr << "swing_segmenter_test: sanitized() did not repair the config.\n";
        return false;
    }
    if (SwingSegmenter(cfg).config().min_frames != 6) {
        std::cerr << "swing_segmenter_test: segmenter should hold the sanitized config.\n";
        return false;
    }
    return true;
}

}  // namespace

int main() {
    if (!test_canonical_swing()) {
        return 1;
    }
    if (!test_deterministic()) {
        return 1;
    }
    if (!test_missing_wrists()) {
        return 1;
    }
    if (!test_degenerate_motion()) {
        return 1;
    }
    if (!test_equal_timestamps_use_index_span()) {
        return 1;
    }
    if (!test_short_and_empty_input()) {
        return 1;
    }
    if (!test_adversarial_inputs_stay_ordered()) {
        return 1;
    }
    if (!test_raw_results_synthetic()) {
        return 1;
    }
    if (!test_raw_results_pixels()) {
        return 1;
    }
    if (!test_config_sanitized()) {
        return 1;
    }
    std::cout << "Swing segmenter test passed.\n";
    return 0;
}

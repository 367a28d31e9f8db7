#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// motion_energy.h  –  Per-Frame Motion Energy from Joints or Pixels
//
// One scalar per frame measuring how much moved since the previous frame.
// The raw series has energy[0] == 0 (nothing to diff against); smoothing
// lifts it to the mean of its window.
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/types.h"

#include <opencv2/core.hpp>

#include <vector>

namespace swingphase {

/// Which signal drives the energy series.  Auto picks Joints when any frame
/// carries a joint, otherwise Pixels.
enum class MotionSignalSource { Auto, Joints, Pixels };

const char* source_str(MotionSignalSource s);

struct MotionEnergySeries {
    std::vector<double> values;
    MotionSignalSource source = MotionSignalSource::Joints;

    std::size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
    double operator[](std::size_t i) const { return values[i]; }

    double min() const;
    double max() const;
    double range() const { return empty() ? 0.0 : max() - min(); }
    double median() const;
};

struct PixelEnergyOptions {
    int sample_width = 160;   // frames are downsampled to this width first
    int pixel_stride = 8;     // compare every Nth pixel
};

/// Resolve Auto against the frames.
MotionSignalSource resolve_source(const std::vector<Frame>& frames,
                                  MotionSignalSource requested);

/// Σ over joints present in both frames of the Euclidean displacement.
std::vector<double> joint_motion_energy(const std::vector<Frame>& frames);

/// Mean absolute per-channel difference between consecutive downsampled
/// images.  Missing or mismatched images contribute 0.
std::vector<double> pixel_motion_energy(const std::vector<Frame>& frames,
                                        const PixelEnergyOptions& options = {});

/// Difference score for one image pair (already downsampled, CV_8UC3).
double pixel_difference(const cv::Mat& prev, const cv::Mat& curr, int stride);

MotionEnergySeries compute_motion_energy(const std::vector<Frame>& frames,
                                         MotionSignalSource source,
                                         const PixelEnergyOptions& options = {});

/// max - min below epsilon: motion alone cannot discriminate phases.
bool is_degenerate(const MotionEnergySeries& energy, double epsilon);

}  // namespace swingphase

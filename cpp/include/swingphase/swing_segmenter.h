#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// swing_segmenter.h  –  Frames → Six Ordered Swing Phases
//
// Brings together all components:
//   1. Adapt raw pose results into canonical frames (optional)
//   2. Compute the motion energy series (joints or pixels)
//   3. Smooth it once
//   4. Run the six phase sub-detectors
//   5. Repair the order
//   6. Look up one frame per phase
//
// segment() never throws and always returns six in-bounds indices; quality
// is reported through fallback_used / reason / synthetic.
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/keypoint_adapter.h"
#include "swingphase/motion_energy.h"
#include "swingphase/phase_detector.h"
#include "swingphase/types.h"

#include <array>
#include <vector>

namespace swingphase {

enum class FallbackReason { None, EmptyInput, InsufficientFrames, DegenerateMotion };

const char* fallback_reason_str(FallbackReason r);

struct SegmenterConfig {
    MotionSignalSource source = MotionSignalSource::Auto;
    int    min_frames             = 6;      // below: proportional fallback
    double joint_energy_epsilon   = 1e-4;   // normalized units
    double pixel_energy_epsilon   = 1e-3;   // 0..255 intensity units
    std::array<double, kPhaseCount> fallback_ratios = {
        0.05, 0.20, 0.35, 0.55, 0.75, 0.95};

    PixelEnergyOptions pixels;
    DetectorConfig     detector;
    AdapterOptions     adapter;

    /// Copy with every out-of-range field replaced by a legal value.
    /// Each replacement is logged as a warning.
    SegmenterConfig sanitized() const;
};

struct SegmentationResult {
    PhaseIndices indices;
    PhaseFrames frames;              // one per phase, in phase order
    MotionEnergySeries energy;       // smoothed series the detectors saw
    MotionEnergySeries raw_energy;   // before smoothing, raw_energy[0] == 0
    MotionSignalSource source = MotionSignalSource::Joints;
    bool fallback_used = false;
    FallbackReason reason = FallbackReason::None;
    bool synthetic = false;          // poses came from the adapter fallback
    bool order_repaired = false;
    std::size_t frame_count = 0;
};

/// Indices at fixed fractions of the timestamp span (index span when every
/// timestamp is equal), nearest frame, order-repaired.
PhaseIndices proportional_indices(const std::vector<Frame>& frames,
                                  const std::array<double, kPhaseCount>& ratios);

/// Copy the frame at each phase index.
PhaseFrames lookup_phase_frames(const std::vector<Frame>& frames,
                                const PhaseIndices& indices);

// ─── Swing Segmenter ────────────────────────────────────────────────────────
class SwingSegmenter {
public:
    explicit SwingSegmenter(SegmenterConfig config = {});

    SegmentationResult segment(const std::vector<Frame>& frames) const;

    /// Adapt heterogeneous estimator output first, then segment.
    SegmentationResult segment(const std::vector<RawPoseResult>& results) const;

    const SegmenterConfig& config() const { return config_; }

private:
    SegmentationResult segment_impl(const std::vector<Frame>& frames,
                                    bool synthetic) const;
    SegmentationResult fallback(const std::vector<Frame>& frames,
                                FallbackReason reason,
                                SegmentationResult result) const;

    SegmenterConfig config_;
};

}  // namespace swingphase

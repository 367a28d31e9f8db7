// ─────────────────────────────────────────────────────────────────────────────
// swing_segmenter.cpp  –  Frames → Six Ordered Swing Phases
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/swing_segmenter.h"
#include "swingphase/log.h"
#include "swingphase/order_enforcer.h"
#include "swingphase/signal_smoother.h"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <utility>

namespace swingphase {

const char* fallback_reason_str(FallbackReason r) {
    switch (r) {
        case FallbackReason::None:               return "none";
        case FallbackReason::EmptyInput:         return "empty_input";
        case FallbackReason::InsufficientFrames: return "insufficient_frames";
        case FallbackReason::DegenerateMotion:   return "degenerate_motion";
    }
    return "none";
}

// ─── Config ─────────────────────────────────────────────────────────────────
namespace {

constexpr const char* kTag = "Segmenter";

void clamp_fraction(double& value, double lo, double hi, const char* name) {
    if (!std::isfinite(value) || value < lo || value > hi) {
        const double fixed = std::isfinite(value) ? std::clamp(value, lo, hi) : lo;
        SWINGPHASE_LOG_WARN(kTag, name << "=" << value << " out of range, using "
                                       << fixed);
        value = fixed;
    }
}

void clamp_int(int& value, int lo, int hi, const char* name) {
    if (value < lo || value > hi) {
        const int fixed = std::clamp(value, lo, hi);
        SWINGPHASE_LOG_WARN(kTag, name << "=" << value << " out of range, using "
                                       << fixed);
        value = fixed;
    }
}

void clamp_positive(double& value, double fallback, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        SWINGPHASE_LOG_WARN(kTag, name << "=" << value << " must be positive, using "
                                       << fallback);
        value = fallback;
    }
}

}  // namespace

SegmenterConfig SegmenterConfig::sanitized() const {
    SegmenterConfig c = *this;
    const SegmenterConfig defaults;

    clamp_int(c.min_frames, static_cast<int>(kPhaseCount), 1 << 20, "min_frames");
    clamp_positive(c.joint_energy_epsilon, defaults.joint_energy_epsilon,
                   "joint_energy_epsilon");
    clamp_positive(c.pixel_energy_epsilon, defaults.pixel_energy_epsilon,
                   "pixel_energy_epsilon");

    bool ratios_ok = true;
    for (std::size_t k = 0; k < kPhaseCount; ++k) {
        const double r = c.fallback_ratios[k];
        if (!std::isfinite(r) || r < 0.0 || r > 1.0 ||
            (k > 0 && r <= c.fallback_ratios[k - 1])) {
            ratios_ok = false;
        }
    }
    if (!ratios_ok) {
        SWINGPHASE_LOG_WARN(kTag, "fallback ratios must be increasing in [0,1], "
                                  "using defaults");
        c.fallback_ratios = defaults.fallback_ratios;
    }

    clamp_int(c.pixels.sample_width, 16, 4096, "pixels.sample_width");
    clamp_int(c.pixels.pixel_stride, 1, 64, "pixels.pixel_stride");

    DetectorConfig& d = c.detector;
    const int window = clamp_smoothing_window(d.smoothing_window);
    if (window != d.smoothing_window) {
        SWINGPHASE_LOG_WARN(kTag, "smoothing_window=" << d.smoothing_window
                                  << " out of range, using " << window);
        d.smoothing_window = window;
    }
    clamp_fraction(d.address_window_fraction, 0.01, 1.0, "address_window_fraction");
    clamp_int(d.address_window_cap, 1, 1 << 20, "address_window_cap");
    clamp_fraction(d.address_energy_weight, 0.0, 1.0, "address_energy_weight");
    clamp_fraction(d.address_drift_weight, 0.0, 1.0, "address_drift_weight");
    clamp_fraction(d.backswing_rise_fraction, 0.0, 1.0, "backswing_rise_fraction");
    clamp_fraction(d.top_search_fraction, 0.1, 1.0, "top_search_fraction");
    clamp_fraction(d.top_plateau_fraction, 0.0, 1.0, "top_plateau_fraction");
    clamp_fraction(d.top_window_fraction, 0.0, 1.0, "top_window_fraction");
    clamp_int(d.top_window_cap, 0, 1 << 20, "top_window_cap");
    clamp_fraction(d.downswing_step_fraction, 0.0, 1.0, "downswing_step_fraction");
    clamp_fraction(d.downswing_delta_fraction, 0.0, 1.0, "downswing_delta_fraction");
    clamp_fraction(d.downswing_motion_factor, 0.0, 10.0, "downswing_motion_factor");
    clamp_fraction(d.impact_reversal_floor, 0.0, 1.0, "impact_reversal_floor");
    clamp_int(d.impact_confirm_frames, 1, 60, "impact_confirm_frames");
    clamp_fraction(d.finish_window_fraction, 0.01, 1.0, "finish_window_fraction");

    if (c.adapter.min_joint_confidence < 0.0f ||
        c.adapter.min_joint_confidence > 1.0f ||
        !std::isfinite(c.adapter.min_joint_confidence)) {
        SWINGPHASE_LOG_WARN(kTag, "adapter.min_joint_confidence="
                                  << c.adapter.min_joint_confidence
                                  << " out of range, using 0");
        c.adapter.min_joint_confidence = 0.0f;
    }
    clamp_int(c.adapter.image_width, 0, 1 << 16, "adapter.image_width");
    clamp_int(c.adapter.image_height, 0, 1 << 16, "adapter.image_height");
    return c;
}

// ─── Proportional Fallback ──────────────────────────────────────────────────
PhaseIndices proportional_indices(const std::vector<Frame>& frames,
                                  const std::array<double, kPhaseCount>& ratios) {
    const std::size_t n = frames.size();
    if (n == 0) return {};

    const double t0 = frames.front().timestamp_sec;
    const double t1 = frames.back().timestamp_sec;
    const double span = t1 - t0;
    const bool by_time = std::isfinite(span) && span > 0.0;

    std::array<int, kPhaseCount> a{};
    for (std::size_t k = 0; k < kPhaseCount; ++k) {
        const double r = std::clamp(ratios[k], 0.0, 1.0);
        if (!by_time) {
            a[k] = static_cast<int>(std::lround(r * static_cast<double>(n - 1)));
            continue;
        }
        const double target = t0 + r * span;
        int best = 0;
        double best_d = std::abs(frames[0].timestamp_sec - target);
        for (std::size_t i = 1; i < n; ++i) {
            const double d = std::abs(frames[i].timestamp_sec - target);
            if (d < best_d) {   // earlier frame wins ties
                best_d = d;
                best = static_cast<int>(i);
            }
        }
        a[k] = best;
    }
    return enforce_order(PhaseIndices::from_array(a), n).indices;
}

PhaseFrames lookup_phase_frames(const std::vector<Frame>& frames,
                                const PhaseIndices& indices) {
    PhaseFrames out;
    if (frames.empty()) return out;
    out.reserve(kPhaseCount);
    const int last = static_cast<int>(frames.size()) - 1;
    for (Phase phase : kAllPhases) {
        const int i = std::clamp(indices.at(phase), 0, last);
        out.push_back({phase, frames[static_cast<std::size_t>(i)]});
    }
    return out;
}

// ─── Swing Segmenter ────────────────────────────────────────────────────────
SwingSegmenter::SwingSegmenter(SegmenterConfig config)
    : config_(config.sanitized()) {}

SegmentationResult SwingSegmenter::segment(const std::vector<Frame>& frames) const {
    return segment_impl(frames, false);
}

SegmentationResult SwingSegmenter::segment(
    const std::vector<RawPoseResult>& results) const {
    KeypointAdapter adapter(config_.adapter);
    AdaptedFrames adapted = adapter.adapt(results);
    return segment_impl(adapted.frames, adapted.synthetic);
}

SegmentationResult SwingSegmenter::fallback(const std::vector<Frame>& frames,
                                            FallbackReason reason,
                                            SegmentationResult result) const {
    result.indices = proportional_indices(frames, config_.fallback_ratios);
    result.frames = lookup_phase_frames(frames, result.indices);
    result.fallback_used = true;
    result.reason = reason;
    result.order_repaired = false;
    SWINGPHASE_LOG_INFO(kTag, "proportional fallback ("
                              << fallback_reason_str(reason) << ") over "
                              << frames.size() << " frames");
    return result;
}

SegmentationResult SwingSegmenter::segment_impl(const std::vector<Frame>& frames,
                                                bool synthetic) const {
    SegmentationResult result;
    result.synthetic = synthetic;
    result.frame_count = frames.size();
    result.source = resolve_source(frames, config_.source);
    result.energy.source = result.source;
    result.energy.values.assign(frames.size(), 0.0);
    result.raw_energy = result.energy;

    if (frames.empty()) {
        return fallback(frames, FallbackReason::EmptyInput, std::move(result));
    }
    if (frames.size() < static_cast<std::size_t>(config_.min_frames)) {
        return fallback(frames, FallbackReason::InsufficientFrames,
                        std::move(result));
    }

    try {
        result.raw_energy =
            compute_motion_energy(frames, result.source, config_.pixels);
        result.energy.source = result.raw_energy.source;
        result.energy.values =
            moving_average(result.raw_energy.values, config_.detector.smoothing_window);

        const double eps = result.energy.source == MotionSignalSource::Pixels
                               ? config_.pixel_energy_epsilon
                               : config_.joint_energy_epsilon;
        if (is_degenerate(result.energy, eps)) {
            return fallback(frames, FallbackReason::DegenerateMotion,
                            std::move(result));
        }

        const PhaseIndices raw_indices =
            detect_phases(frames, result.energy, config_.detector);
        const OrderRepair repair = enforce_order(raw_indices, frames.size());
        result.indices = repair.indices;
        result.order_repaired = repair.repaired;
        result.frames = lookup_phase_frames(frames, result.indices);
    } catch (const cv::Exception& e) {
        SWINGPHASE_LOG_ERROR(kTag, "OpenCV error: " << e.what());
        return fallback(frames, FallbackReason::DegenerateMotion, std::move(result));
    } catch (const std::exception& e) {
        SWINGPHASE_LOG_ERROR(kTag, "segmentation failed: " << e.what());
        return fallback(frames, FallbackReason::DegenerateMotion, std::move(result));
    }

    SWINGPHASE_LOG_INFO(kTag, "segmented " << frames.size() << " frames from "
                              << source_str(result.energy.source)
                              << (result.order_repaired ? " (order repaired)" : ""));
    return result;
}

}  // namespace swingphase

// ─────────────────────────────────────────────────────────────────────────────
// motion_energy.cpp  –  Joint Displacement & Pixel Difference Energy
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/motion_energy.h"
#include "swingphase/body_signals.h"
#include "swingphase/log.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace swingphase {

const char* source_str(MotionSignalSource s) {
    switch (s) {
        case MotionSignalSource::Auto:   return "auto";
        case MotionSignalSource::Joints: return "joints";
        case MotionSignalSource::Pixels: return "pixels";
    }
    return "unknown";
}

double MotionEnergySeries::min() const {
    if (values.empty()) return 0.0;
    return *std::min_element(values.begin(), values.end());
}

double MotionEnergySeries::max() const {
    if (values.empty()) return 0.0;
    return *std::max_element(values.begin(), values.end());
}

double MotionEnergySeries::median() const {
    return swingphase::median(values);
}

MotionSignalSource resolve_source(const std::vector<Frame>& frames,
                                  MotionSignalSource requested) {
    if (requested != MotionSignalSource::Auto) return requested;
    const bool any_joint = std::any_of(frames.begin(), frames.end(),
        [](const Frame& f) { return !f.pose.empty(); });
    return any_joint ? MotionSignalSource::Joints : MotionSignalSource::Pixels;
}

// ─── Joints ─────────────────────────────────────────────────────────────────
std::vector<double> joint_motion_energy(const std::vector<Frame>& frames) {
    std::vector<double> energy(frames.size(), 0.0);
    for (std::size_t i = 1; i < frames.size(); ++i) {
        const Pose& prev = frames[i - 1].pose;
        const Pose& curr = frames[i].pose;
        double sum = 0.0;
        for (Joint j : kAllJoints) {
            const auto& a = prev[j];
            const auto& b = curr[j];
            if (!a || !b) continue;
            sum += std::hypot(b->x - a->x, b->y - a->y);
        }
        energy[i] = sum;
    }
    return energy;
}

// ─── Pixels ─────────────────────────────────────────────────────────────────
static cv::Mat downsample(const cv::Mat& image, int sample_width) {
    if (image.empty() || image.cols <= 0 || image.rows <= 0) return {};

    cv::Mat bgr;
    switch (image.channels()) {
        case 1:  cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR); break;
        case 4:  cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR); break;
        case 3:  bgr = image; break;
        default: return {};
    }

    if (bgr.depth() != CV_8U) {
        // Float images are expected in [0, 1].
        const double scale =
            (bgr.depth() == CV_32F || bgr.depth() == CV_64F) ? 255.0 : 1.0;
        cv::Mat converted;
        bgr.convertTo(converted, CV_8UC3, scale);
        bgr = converted;
    }

    const int w = std::max(1, std::min(sample_width, bgr.cols));
    const int h = std::max(1, static_cast<int>(std::lround(
        static_cast<double>(w) * bgr.rows / bgr.cols)));

    cv::Mat small;
    cv::resize(bgr, small, cv::Size(w, h), 0, 0, cv::INTER_AREA);
    return small;
}

double pixel_difference(const cv::Mat& prev, const cv::Mat& curr, int stride) {
    if (prev.empty() || curr.empty()) return 0.0;
    if (prev.size() != curr.size() || prev.type() != CV_8UC3 ||
        curr.type() != CV_8UC3) {
        return 0.0;
    }

    stride = std::max(1, stride);
    const int cols = curr.cols;
    const long total = static_cast<long>(curr.rows) * cols;

    double sum = 0.0;
    long samples = 0;
    for (long p = 0; p < total; p += stride) {
        const int r = static_cast<int>(p / cols);
        const int c = static_cast<int>(p % cols);
        const cv::Vec3b& a = prev.at<cv::Vec3b>(r, c);
        const cv::Vec3b& b = curr.at<cv::Vec3b>(r, c);
        sum += std::abs(int(a[0]) - int(b[0])) +
               std::abs(int(a[1]) - int(b[1])) +
               std::abs(int(a[2]) - int(b[2]));
        ++samples;
    }
    return samples > 0 ? sum / (3.0 * static_cast<double>(samples)) : 0.0;
}

std::vector<double> pixel_motion_energy(const std::vector<Frame>& frames,
                                        const PixelEnergyOptions& options) {
    std::vector<double> energy(frames.size(), 0.0);
    cv::Mat prev;
    int unreadable = 0;

    for (std::size_t i = 0; i < frames.size(); ++i) {
        cv::Mat curr;
        try {
            curr = downsample(frames[i].image, options.sample_width);
        } catch (const cv::Exception& e) {
            SWINGPHASE_LOG_WARN("MotionEnergy",
                "Frame " << i << " image rejected: " << e.what());
            curr.release();
        }
        if (curr.empty()) ++unreadable;

        if (i > 0) {
            energy[i] = pixel_difference(prev, curr, options.pixel_stride);
        }
        prev = curr;
    }

    if (unreadable > 0) {
        SWINGPHASE_LOG_INFO("MotionEnergy",
            unreadable << "/" << frames.size()
            << " frames had no usable image payload");
    }
    return energy;
}

// ─── Dispatch ───────────────────────────────────────────────────────────────
MotionEnergySeries compute_motion_energy(const std::vector<Frame>& frames,
                                         MotionSignalSource source,
                                         const PixelEnergyOptions& options) {
    MotionEnergySeries series;
    series.source = resolve_source(frames, source);
    if (series.source == MotionSignalSource::Pixels) {
        series.values = pixel_motion_energy(frames, options);
    } else {
        series.values = joint_motion_energy(frames);
    }
    return series;
}

bool is_degenerate(const MotionEnergySeries& energy, double epsilon) {
    if (energy.empty()) return true;
    for (double v : energy.values) {
        if (!std::isfinite(v)) return true;
    }
    return energy.range() < epsilon;
}

}  // namespace swingphase

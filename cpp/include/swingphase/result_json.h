#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// result_json.h  –  Compact JSON for Segmentation, Style & Metrics
//
// Segmentation payload schema:
// {
//   "phases": { "address": { "index": <i>, "timestamp_sec": <f> }, ... },
//   "frame_count": <i>, "source": "joints"|"pixels",
//   "fallback_used": <bool>, "reason": "<reason>",
//   "synthetic": <bool>, "order_repaired": <bool>
// }
// Non-finite numbers are written as null.
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/swing_metrics.h"
#include "swingphase/swing_segmenter.h"
#include "swingphase/swing_style.h"

#include <string>

namespace swingphase {

std::string to_json(const SegmentationResult& result);
std::string to_json(const SwingStyleAssessment& assessment);
std::string to_json(const SwingStyleChange& change);
std::string to_json(const SwingMetrics& metrics);

/// Number formatting shared by the writers: "%.6g", or null.
std::string json_number(double value);

/// Quoted, escaped string literal.
std::string json_string(const std::string& value);

}  // namespace swingphase

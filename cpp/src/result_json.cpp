// ─────────────────────────────────────────────────────────────────────────────
// result_json.cpp  –  Compact JSON for Segmentation, Style & Metrics
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/result_json.h"

#include <cmath>
#include <cstdio>
#include <sstream>

namespace swingphase {

std::string json_number(double value) {
    if (!std::isfinite(value)) return "null";
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.6g", value);
    return buf;
}

std::string json_string(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (char c : value) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char esc[8];
                    std::snprintf(esc, sizeof(esc), "\\u%04x", c);
                    out += esc;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

namespace {

const char* json_bool(bool b) { return b ? "true" : "false"; }

std::string opt_number(const std::optional<double>& v) {
    return v ? json_number(*v) : "null";
}

std::string opt_int(const std::optional<int>& v) {
    return v ? std::to_string(*v) : "null";
}

std::string point_json(const std::optional<Point2>& p) {
    if (!p) return "null";
    return "{\"x\":" + json_number(p->x) + ",\"y\":" + json_number(p->y) + "}";
}

std::string sway_json(const std::optional<SwayMetric>& s) {
    if (!s) return "null";
    std::ostringstream oss;
    oss << "{\"dx\":" << json_number(s->dx)
        << ",\"dy\":" << json_number(s->dy)
        << ",\"dist\":" << json_number(s->dist)
        << ",\"dist_norm\":" << opt_number(s->dist_norm) << "}";
    return oss.str();
}

}  // namespace

std::string to_json(const SegmentationResult& result) {
    std::ostringstream oss;
    oss << "{\"phases\":{";
    for (std::size_t k = 0; k < result.frames.size(); ++k) {
        const PhaseFrame& pf = result.frames[k];
        if (k > 0) oss << ",";
        oss << "\"" << phase_name(pf.phase) << "\":{"
            << "\"index\":" << result.indices.at(pf.phase)
            << ",\"timestamp_sec\":" << json_number(pf.frame.timestamp_sec) << "}";
    }
    oss << "}"
        << ",\"frame_count\":" << result.frame_count
        << ",\"source\":\"" << source_str(result.energy.source) << "\""
        << ",\"fallback_used\":" << json_bool(result.fallback_used)
        << ",\"reason\":\"" << fallback_reason_str(result.reason) << "\""
        << ",\"synthetic\":" << json_bool(result.synthetic)
        << ",\"order_repaired\":" << json_bool(result.order_repaired)
        << "}";
    return oss.str();
}

std::string to_json(const SwingStyleAssessment& assessment) {
    std::ostringstream oss;
    oss << "{\"type\":\"" << swing_style_str(assessment.style) << "\""
        << ",\"confidence\":\"" << style_confidence_str(assessment.confidence) << "\""
        << ",\"evidence\":[";
    for (std::size_t i = 0; i < assessment.evidence.size(); ++i) {
        if (i > 0) oss << ",";
        oss << json_string(assessment.evidence[i]);
    }
    oss << "]}";
    return oss.str();
}

std::string to_json(const SwingStyleChange& change) {
    char buf[160];
    std::snprintf(buf, sizeof(buf),
        "{"
            "\"previous\":\"%s\","
            "\"current\":\"%s\","
            "\"change\":\"%s\","
            "\"confidence\":\"%s\""
        "}",
        swing_style_str(change.previous), swing_style_str(change.current),
        style_trend_str(change.change), style_confidence_str(change.confidence));
    return buf;
}

std::string to_json(const SwingMetrics& m) {
    std::ostringstream oss;
    oss << "{\"chest_rotation_deg\":" << opt_number(m.chest_rotation_deg)
        << ",\"head_sway\":" << sway_json(m.head_sway)
        << ",\"knee_sway\":" << sway_json(m.knee_sway)
        << ",\"spine_tilt_delta_deg\":" << opt_number(m.spine_tilt_delta_deg);

    const HandVsChest& hvc = m.hand_vs_chest;
    oss << ",\"hand_vs_chest\":{"
        << "\"hand_advance_norm\":" << opt_number(hvc.hand_advance_norm)
        << ",\"shoulder_rotation_deg\":" << opt_number(hvc.shoulder_rotation_deg)
        << ",\"ratio\":" << opt_number(hvc.ratio)
        << ",\"classification\":\"" << hand_chest_order_str(hvc.classification) << "\"}";

    oss << ",\"lower_body_lead\":";
    if (m.lower_body_lead) {
        const LowerBodyLead& l = *m.lower_body_lead;
        oss << "{\"hip_start_index\":" << opt_int(l.hip_start_index)
            << ",\"chest_start_index\":" << opt_int(l.chest_start_index)
            << ",\"delta_frames\":" << opt_int(l.delta_frames)
            << ",\"lead\":\"" << body_lead_str(l.lead) << "\""
            << ",\"threshold\":" << json_number(l.threshold) << "}";
    } else {
        oss << "null";
    }

    oss << ",\"hand_keypoints\":{"
        << "\"address\":" << point_json(m.hand_address)
        << ",\"top\":" << point_json(m.hand_top)
        << ",\"impact\":" << point_json(m.hand_impact) << "}";

    oss << ",\"hand_trace\":[";
    for (std::size_t i = 0; i < m.hand_trace.size(); ++i) {
        const HandTracePoint& p = m.hand_trace[i];
        if (i > 0) oss << ",";
        oss << "{\"x\":" << json_number(p.position.x)
            << ",\"y\":" << json_number(p.position.y)
            << ",\"phase\":\"" << phase_name(p.phase) << "\""
            << ",\"frame_index\":" << p.frame_index
            << ",\"timestamp_sec\":" << json_number(p.timestamp_sec) << "}";
    }
    oss << "]"
        << ",\"frame_count\":" << m.frame_count
        << ",\"usable_pose_count\":" << m.usable_pose_count
        << "}";
    return oss.str();
}

}  // namespace swingphase

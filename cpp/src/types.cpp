// ─────────────────────────────────────────────────────────────────────────────
// types.cpp  –  Names & Validation for Core Value Types
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/types.h"

namespace swingphase {

const char* joint_name(Joint joint) {
    switch (joint) {
        case Joint::LeftShoulder:  return "leftShoulder";
        case Joint::RightShoulder: return "rightShoulder";
        case Joint::LeftElbow:     return "leftElbow";
        case Joint::RightElbow:    return "rightElbow";
        case Joint::LeftWrist:     return "leftWrist";
        case Joint::RightWrist:    return "rightWrist";
        case Joint::LeftHip:       return "leftHip";
        case Joint::RightHip:      return "rightHip";
        case Joint::LeftKnee:      return "leftKnee";
        case Joint::RightKnee:     return "rightKnee";
        case Joint::LeftAnkle:     return "leftAnkle";
        case Joint::RightAnkle:    return "rightAnkle";
    }
    return "unknown";
}

std::size_t Pose::present_count() const {
    std::size_t n = 0;
    for (const auto& kp : joints_) {
        if (kp) ++n;
    }
    return n;
}

const char* provenance_str(Provenance p) {
    switch (p) {
        case Provenance::None:      return "none";
        case Provenance::Estimated: return "estimated";
        case Provenance::Synthetic: return "synthetic";
    }
    return "unknown";
}

const char* phase_name(Phase phase) {
    switch (phase) {
        case Phase::Address:   return "address";
        case Phase::Backswing: return "backswing";
        case Phase::Top:       return "top";
        case Phase::Downswing: return "downswing";
        case Phase::Impact:    return "impact";
        case Phase::Finish:    return "finish";
    }
    return "unknown";
}

int PhaseIndices::at(Phase phase) const {
    return to_array()[static_cast<std::size_t>(phase)];
}

void PhaseIndices::set(Phase phase, int index) {
    auto a = to_array();
    a[static_cast<std::size_t>(phase)] = index;
    *this = from_array(a);
}

PhaseIndices PhaseIndices::from_array(const std::array<int, kPhaseCount>& a) {
    PhaseIndices p;
    p.address   = a[0];
    p.backswing = a[1];
    p.top       = a[2];
    p.downswing = a[3];
    p.impact    = a[4];
    p.finish    = a[5];
    return p;
}

bool PhaseIndices::is_valid(std::size_t frame_count) const {
    if (frame_count == 0) return false;
    const auto a = to_array();
    const int last = static_cast<int>(frame_count) - 1;
    for (std::size_t k = 0; k < a.size(); ++k) {
        if (a[k] < 0 || a[k] > last) return false;
        if (k > 0 && a[k] <= a[k - 1]) return false;
    }
    return true;
}

}  // namespace swingphase

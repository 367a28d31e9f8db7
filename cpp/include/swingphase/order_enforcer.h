#pragma once
// ─────────────────────────────────────────────────────────────────────────────
// order_enforcer.h  –  Phase Index Monotonicity Repair
//
// The sub-detectors are locally optimal but not coordinated.  This pass is
// the single place that guarantees address < backswing < ... < finish, all
// inside [0, N-1].  It never re-runs detection, it only nudges indices.
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/types.h"

#include <cstddef>

namespace swingphase {

struct OrderRepair {
    PhaseIndices indices;
    bool repaired = false;   // any index moved
};

/// Clamp into bounds, leave room for the phases that follow, then push every
/// index that does not exceed its predecessor to predecessor + 1.
/// Strictly increasing whenever frame_count >= 6; non-decreasing otherwise.
OrderRepair enforce_order(const PhaseIndices& indices, std::size_t frame_count);

}  // namespace swingphase

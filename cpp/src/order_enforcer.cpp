// ─────────────────────────────────────────────────────────────────────────────
// order_enforcer.cpp  –  Phase Index Monotonicity Repair
// ─────────────────────────────────────────────────────────────────────────────

#include "swingphase/order_enforcer.h"
#include "swingphase/log.h"

#include <algorithm>

namespace swingphase {

OrderRepair enforce_order(const PhaseIndices& indices, std::size_t frame_count) {
    OrderRepair out;
    if (frame_count == 0) {
        out.repaired = indices != PhaseIndices{};
        return out;
    }

    const int n = static_cast<int>(frame_count);
    const int last = n - 1;
    const int phases = static_cast<int>(kPhaseCount);
    auto a = indices.to_array();

    for (int k = 0; k < phases; ++k) {
        // Phase k needs (phases - 1 - k) distinct frames after it.
        const int room = std::max(0, last - (phases - 1 - k));
        a[k] = std::clamp(a[k], 0, room);
    }

    for (int k = 1; k < phases; ++k) {
        if (a[k] <= a[k - 1]) {
            a[k] = std::min(last, a[k - 1] + 1);
        }
    }

    out.indices = PhaseIndices::from_array(a);
    out.repaired = out.indices != indices;
    if (out.repaired) {
        SWINGPHASE_LOG_DEBUG("OrderEnforcer",
            "repaired order over " << frame_count << " frames");
    }
    return out;
}

}  // namespace swingphase

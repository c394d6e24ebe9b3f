#pragma once

#include "model/tensor.hpp"

#include <vector>

namespace eap {

/// One gradient per destination slot, indexed by SlotId.
using SlotGradients = std::vector<Activation>;

/// k / steps for k = 1..steps. The last point is always the clean end.
std::vector<double> interpolationPoints(int steps);

/// a += b, slot by slot. CaptureError on mismatched slots or shapes.
void addInPlace(SlotGradients& a, const SlotGradients& b);

/// Element-wise scale of every slot gradient.
void scaleInPlace(SlotGradients& grads, double factor);

// ─── Integrated-gradient fold ─────────────────────────────────
// Mean of sample(alpha) over the interpolation points. sample() is
// called once per point, in increasing alpha; the fold itself holds
// no other state.

template <typename SampleFn>
SlotGradients integrateGradients(int steps, SampleFn&& sample) {
    SlotGradients total;
    bool first = true;
    for (double alpha : interpolationPoints(steps)) {
        SlotGradients g = sample(alpha);
        if (first) {
            total = std::move(g);
            first = false;
        } else {
            addInPlace(total, g);
        }
    }
    if (!total.empty()) scaleInPlace(total, 1.0 / static_cast<double>(steps));
    return total;
}

} // namespace eap

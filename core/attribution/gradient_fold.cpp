#include "attribution/gradient_fold.hpp"
#include "common/errors.hpp"

#include <string>

namespace eap {

std::vector<double> interpolationPoints(int steps) {
    std::vector<double> points;
    if (steps < 1) return points;
    points.reserve(static_cast<size_t>(steps));
    for (int k = 1; k <= steps; k++) {
        points.push_back(static_cast<double>(k) / static_cast<double>(steps));
    }
    return points;
}

void addInPlace(SlotGradients& a, const SlotGradients& b) {
    if (a.size() != b.size()) {
        throw CaptureError("Gradient sample covers " + std::to_string(b.size()) +
                           " slots, expected " + std::to_string(a.size()));
    }
    for (size_t i = 0; i < a.size(); i++) {
        if (a[i].rows() != b[i].rows() || a[i].cols() != b[i].cols()) {
            throw CaptureError("Gradient shape changed between samples at slot " +
                               std::to_string(i));
        }
        a[i] += b[i];
    }
}

void scaleInPlace(SlotGradients& grads, double factor) {
    for (Activation& g : grads) g *= factor;
}

} // namespace eap

#pragma once

#include "model/tensor.hpp"

#include <cstddef>
#include <vector>

namespace eap {

/// Answer pair a behavioral metric compares.
struct Label {
    int correct = 0;
    int incorrect = 0;
};

/// One batch of paired clean/corrupted examples. Row i of clean,
/// row i of corrupted, labels[i] and input_lengths[i] form one example.
struct Batch {
    ModelInput clean;
    ModelInput corrupted;
    std::vector<Label> labels;
    std::vector<int> input_lengths;

    size_t size() const { return static_cast<size_t>(clean.rows()); }
};

} // namespace eap

#pragma once

#include "data/batch.hpp"

#include <cstddef>
#include <vector>

namespace eap {

// ─── Dataset ──────────────────────────────────────────────────
// Ordered sequence of batches. Order is fixed; nothing here shuffles.

class Dataset {
public:
    Dataset() = default;
    explicit Dataset(std::vector<Batch> batches) : batches_(std::move(batches)) {}

    void add(Batch batch) { batches_.push_back(std::move(batch)); }

    size_t batchCount() const { return batches_.size(); }
    size_t exampleCount() const;
    bool empty() const { return batches_.empty(); }

    const Batch& batch(size_t index) const { return batches_.at(index); }
    std::vector<Batch>::const_iterator begin() const { return batches_.begin(); }
    std::vector<Batch>::const_iterator end() const { return batches_.end(); }

    /// ConfigurationError naming the first batch whose clean, corrupted,
    /// label and length streams disagree in size, or whose inputs
    /// differ in width from each other or from input_width (if >= 0).
    void validate(int input_width = -1) const;

    /// Batches [first, first + count).
    Dataset slice(size_t first, size_t count) const;

    static Dataset concat(const Dataset& a, const Dataset& b);

private:
    std::vector<Batch> batches_;
};

} // namespace eap

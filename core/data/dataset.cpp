#include "data/dataset.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <string>

namespace eap {

size_t Dataset::exampleCount() const {
    size_t total = 0;
    for (const Batch& b : batches_) total += b.size();
    return total;
}

void Dataset::validate(int input_width) const {
    for (size_t i = 0; i < batches_.size(); i++) {
        const Batch& b = batches_[i];
        std::string where = "Batch " + std::to_string(i) + ": ";

        if (b.clean.rows() == 0) {
            throw ConfigurationError(where + "empty batch");
        }
        if (b.corrupted.rows() != b.clean.rows()) {
            throw ConfigurationError(where + std::to_string(b.clean.rows()) + " clean vs " +
                                     std::to_string(b.corrupted.rows()) + " corrupted examples");
        }
        if (b.labels.size() != b.size()) {
            throw ConfigurationError(where + std::to_string(b.size()) + " examples vs " +
                                     std::to_string(b.labels.size()) + " labels");
        }
        if (b.input_lengths.size() != b.size()) {
            throw ConfigurationError(where + std::to_string(b.size()) + " examples vs " +
                                     std::to_string(b.input_lengths.size()) + " input lengths");
        }
        if (b.corrupted.cols() != b.clean.cols()) {
            throw ConfigurationError(where + "clean width " + std::to_string(b.clean.cols()) +
                                     " vs corrupted width " + std::to_string(b.corrupted.cols()));
        }
        if (input_width >= 0 && b.clean.cols() != input_width) {
            throw ConfigurationError(where + "input width " + std::to_string(b.clean.cols()) +
                                     ", model expects " + std::to_string(input_width));
        }
    }
}

Dataset Dataset::slice(size_t first, size_t count) const {
    first = std::min(first, batches_.size());
    size_t last = first + std::min(count, batches_.size() - first);
    return Dataset(std::vector<Batch>(batches_.begin() + first, batches_.begin() + last));
}

Dataset Dataset::concat(const Dataset& a, const Dataset& b) {
    std::vector<Batch> all = a.batches_;
    all.insert(all.end(), b.batches_.begin(), b.batches_.end());
    return Dataset(std::move(all));
}

} // namespace eap

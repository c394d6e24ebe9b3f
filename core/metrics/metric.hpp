#pragma once

#include "data/batch.hpp"
#include "model/tensor.hpp"

#include <Eigen/Core>

#include <memory>
#include <string>
#include <vector>

namespace eap {

// ─── Metric ───────────────────────────────────────────────────
// Behavioral measure of a batch of logits. evaluate() is per
// example and unreduced; gradient() is the gradient of the sum of
// evaluate() over the batch w.r.t. logits, with clean_logits held
// constant.

class Metric {
public:
    virtual ~Metric() = default;

    virtual Eigen::VectorXd evaluate(const Logits& logits,
                                     const Logits& clean_logits,
                                     const std::vector<int>& input_lengths,
                                     const std::vector<Label>& labels) const = 0;

    virtual Logits gradient(const Logits& logits,
                            const Logits& clean_logits,
                            const std::vector<int>& input_lengths,
                            const std::vector<Label>& labels) const = 0;

    virtual std::string name() const = 0;
};

/// logits[correct] - logits[incorrect]
class LogitDifference : public Metric {
public:
    Eigen::VectorXd evaluate(const Logits& logits, const Logits& clean_logits,
                             const std::vector<int>& input_lengths,
                             const std::vector<Label>& labels) const override;
    Logits gradient(const Logits& logits, const Logits& clean_logits,
                    const std::vector<int>& input_lengths,
                    const std::vector<Label>& labels) const override;
    std::string name() const override { return "logit_diff"; }
};

/// softmax(logits)[correct] - softmax(logits)[incorrect]
class ProbabilityDifference : public Metric {
public:
    Eigen::VectorXd evaluate(const Logits& logits, const Logits& clean_logits,
                             const std::vector<int>& input_lengths,
                             const std::vector<Label>& labels) const override;
    Logits gradient(const Logits& logits, const Logits& clean_logits,
                    const std::vector<int>& input_lengths,
                    const std::vector<Label>& labels) const override;
    std::string name() const override { return "prob_diff"; }
};

/// KL(softmax(clean_logits) || softmax(logits)). Labels are unused.
class KLDivergence : public Metric {
public:
    Eigen::VectorXd evaluate(const Logits& logits, const Logits& clean_logits,
                             const std::vector<int>& input_lengths,
                             const std::vector<Label>& labels) const override;
    Logits gradient(const Logits& logits, const Logits& clean_logits,
                    const std::vector<int>& input_lengths,
                    const std::vector<Label>& labels) const override;
    std::string name() const override { return "kl_div"; }
};

/// "logit_diff", "prob_diff" or "kl_div". ConfigurationError otherwise.
std::unique_ptr<Metric> makeMetric(const std::string& name);

/// Row-wise softmax, stabilised by the row maximum.
Eigen::MatrixXd softmaxRows(const Logits& logits);

/// Row-wise log-softmax.
Eigen::MatrixXd logSoftmaxRows(const Logits& logits);

} // namespace eap

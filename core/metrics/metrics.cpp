#include "metrics/metric.hpp"
#include "common/errors.hpp"

#include <string>

namespace eap {

namespace {

void checkLabels(const Logits& logits, const std::vector<Label>& labels) {
    if (static_cast<Eigen::Index>(labels.size()) != logits.rows()) {
        throw ConfigurationError(std::to_string(labels.size()) + " labels for " +
                                 std::to_string(logits.rows()) + " rows of logits");
    }
    for (const Label& l : labels) {
        if (l.correct < 0 || l.correct >= logits.cols() ||
            l.incorrect < 0 || l.incorrect >= logits.cols()) {
            throw ConfigurationError("Label index outside vocabulary of " +
                                     std::to_string(logits.cols()));
        }
    }
}

void checkReference(const Logits& logits, const Logits& clean_logits) {
    if (clean_logits.rows() != logits.rows() || clean_logits.cols() != logits.cols()) {
        throw ConfigurationError("Clean logits shape does not match logits");
    }
}

} // namespace

Eigen::MatrixXd logSoftmaxRows(const Logits& logits) {
    Eigen::VectorXd max = logits.rowwise().maxCoeff();
    Eigen::MatrixXd shifted = logits.colwise() - max;
    Eigen::VectorXd log_norm = shifted.array().exp().rowwise().sum().log().matrix();
    return shifted.colwise() - log_norm;
}

Eigen::MatrixXd softmaxRows(const Logits& logits) {
    return logSoftmaxRows(logits).array().exp().matrix();
}

// ─── Logit difference ─────────────────────────────────────────

Eigen::VectorXd LogitDifference::evaluate(const Logits& logits, const Logits&,
                                          const std::vector<int>&,
                                          const std::vector<Label>& labels) const {
    checkLabels(logits, labels);
    Eigen::VectorXd out(logits.rows());
    for (Eigen::Index i = 0; i < logits.rows(); i++) {
        out(i) = logits(i, labels[i].correct) - logits(i, labels[i].incorrect);
    }
    return out;
}

Logits LogitDifference::gradient(const Logits& logits, const Logits&,
                                 const std::vector<int>&,
                                 const std::vector<Label>& labels) const {
    checkLabels(logits, labels);
    Logits grad = Logits::Zero(logits.rows(), logits.cols());
    for (Eigen::Index i = 0; i < logits.rows(); i++) {
        grad(i, labels[i].correct) += 1.0;
        grad(i, labels[i].incorrect) -= 1.0;
    }
    return grad;
}

// ─── Probability difference ───────────────────────────────────

Eigen::VectorXd ProbabilityDifference::evaluate(const Logits& logits, const Logits&,
                                                const std::vector<int>&,
                                                const std::vector<Label>& labels) const {
    checkLabels(logits, labels);
    Eigen::MatrixXd p = softmaxRows(logits);
    Eigen::VectorXd out(logits.rows());
    for (Eigen::Index i = 0; i < logits.rows(); i++) {
        out(i) = p(i, labels[i].correct) - p(i, labels[i].incorrect);
    }
    return out;
}

Logits ProbabilityDifference::gradient(const Logits& logits, const Logits&,
                                       const std::vector<int>&,
                                       const std::vector<Label>& labels) const {
    checkLabels(logits, labels);
    Eigen::MatrixXd p = softmaxRows(logits);
    Logits grad(logits.rows(), logits.cols());
    for (Eigen::Index i = 0; i < logits.rows(); i++) {
        int c = labels[i].correct;
        int w = labels[i].incorrect;
        // d p_c / d z_j = p_c (delta_cj - p_j)
        grad.row(i) = -(p(i, c) - p(i, w)) * p.row(i);
        grad(i, c) += p(i, c);
        grad(i, w) -= p(i, w);
    }
    return grad;
}

// ─── KL divergence ────────────────────────────────────────────

Eigen::VectorXd KLDivergence::evaluate(const Logits& logits, const Logits& clean_logits,
                                       const std::vector<int>&,
                                       const std::vector<Label>&) const {
    checkReference(logits, clean_logits);
    Eigen::MatrixXd log_p = logSoftmaxRows(clean_logits);
    Eigen::MatrixXd log_q = logSoftmaxRows(logits);
    return (log_p.array().exp() * (log_p - log_q).array()).rowwise().sum().matrix();
}

Logits KLDivergence::gradient(const Logits& logits, const Logits& clean_logits,
                              const std::vector<int>&,
                              const std::vector<Label>&) const {
    checkReference(logits, clean_logits);
    return softmaxRows(logits) - softmaxRows(clean_logits);
}

std::unique_ptr<Metric> makeMetric(const std::string& name) {
    if (name == "logit_diff") return std::make_unique<LogitDifference>();
    if (name == "prob_diff") return std::make_unique<ProbabilityDifference>();
    if (name == "kl_div") return std::make_unique<KLDivergence>();
    throw ConfigurationError("Unknown metric: " + name);
}

} // namespace eap

#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "metrics/metric.hpp"

#include <cmath>

using namespace eap;

namespace {

Logits sampleLogits() {
    Logits z(2, 4);
    z << 0.3, -1.2, 2.0, 0.1,
         1.5, 0.4, -0.7, 0.9;
    return z;
}

std::vector<Label> sampleLabels() {
    std::vector<Label> labels(2);
    labels[0].correct = 2;
    labels[0].incorrect = 0;
    labels[1].correct = 0;
    labels[1].incorrect = 3;
    return labels;
}

void expectGradientMatchesFiniteDifferences(const Metric& metric, const Logits& z,
                                            const Logits& clean) {
    std::vector<int> lengths(z.rows(), 1);
    std::vector<Label> labels = sampleLabels();
    Logits analytic = metric.gradient(z, clean, lengths, labels);

    const double eps = 1e-6;
    for (Eigen::Index i = 0; i < z.rows(); i++) {
        for (Eigen::Index j = 0; j < z.cols(); j++) {
            Logits plus = z;
            Logits minus = z;
            plus(i, j) += eps;
            minus(i, j) -= eps;
            double numeric = (metric.evaluate(plus, clean, lengths, labels).sum() -
                              metric.evaluate(minus, clean, lengths, labels).sum()) / (2.0 * eps);
            EXPECT_NEAR(analytic(i, j), numeric, 1e-6) << metric.name() << " at " << i << "," << j;
        }
    }
}

} // namespace

// ─── Softmax ───────────────────────────────────────────────────

TEST(MetricTest, SoftmaxRowsSumToOne) {
    Eigen::MatrixXd p = softmaxRows(sampleLogits());
    for (Eigen::Index i = 0; i < p.rows(); i++) {
        EXPECT_NEAR(p.row(i).sum(), 1.0, 1e-12);
    }
}

TEST(MetricTest, SoftmaxStableForLargeLogits) {
    Logits z(1, 3);
    z << 1000.0, 1000.0, -1000.0;
    Eigen::MatrixXd p = softmaxRows(z);
    EXPECT_NEAR(p(0, 0), 0.5, 1e-12);
    EXPECT_NEAR(p(0, 2), 0.0, 1e-12);
    EXPECT_TRUE(std::isfinite(logSoftmaxRows(z)(0, 2)));
}

// ─── Logit / probability difference ────────────────────────────

TEST(MetricTest, LogitDifferenceValues) {
    LogitDifference metric;
    Logits z = sampleLogits();
    Eigen::VectorXd v = metric.evaluate(z, z, {1, 1}, sampleLabels());
    EXPECT_DOUBLE_EQ(v(0), 2.0 - 0.3);
    EXPECT_DOUBLE_EQ(v(1), 1.5 - 0.9);
}

TEST(MetricTest, LogitDifferenceGradient) {
    LogitDifference metric;
    expectGradientMatchesFiniteDifferences(metric, sampleLogits(), sampleLogits());
}

TEST(MetricTest, ProbabilityDifferenceGradient) {
    ProbabilityDifference metric;
    expectGradientMatchesFiniteDifferences(metric, sampleLogits(), sampleLogits());
}

TEST(MetricTest, ProbabilityDifferenceBounded) {
    ProbabilityDifference metric;
    Logits z = sampleLogits();
    Eigen::VectorXd v = metric.evaluate(z, z, {1, 1}, sampleLabels());
    for (Eigen::Index i = 0; i < v.size(); i++) {
        EXPECT_GE(v(i), -1.0);
        EXPECT_LE(v(i), 1.0);
    }
}

// ─── KL divergence ─────────────────────────────────────────────

TEST(MetricTest, KLDivergenceZeroAgainstItself) {
    KLDivergence metric;
    Logits z = sampleLogits();
    Eigen::VectorXd v = metric.evaluate(z, z, {1, 1}, sampleLabels());
    EXPECT_NEAR(v(0), 0.0, 1e-12);
    EXPECT_NEAR(v(1), 0.0, 1e-12);
    EXPECT_NEAR(metric.gradient(z, z, {1, 1}, sampleLabels()).norm(), 0.0, 1e-12);
}

TEST(MetricTest, KLDivergencePositiveAndDifferentiable) {
    KLDivergence metric;
    Logits clean = sampleLogits();
    Logits z = clean;
    z(0, 1) += 1.0;
    z(1, 2) -= 0.5;
    Eigen::VectorXd v = metric.evaluate(z, clean, {1, 1}, sampleLabels());
    EXPECT_GT(v(0), 0.0);
    EXPECT_GT(v(1), 0.0);
    expectGradientMatchesFiniteDifferences(metric, z, clean);
}

// ─── Errors / factory ──────────────────────────────────────────

TEST(MetricTest, FactoryByName) {
    EXPECT_EQ(makeMetric("logit_diff")->name(), "logit_diff");
    EXPECT_EQ(makeMetric("prob_diff")->name(), "prob_diff");
    EXPECT_EQ(makeMetric("kl_div")->name(), "kl_div");
    EXPECT_THROW(makeMetric("accuracy"), ConfigurationError);
}

TEST(MetricTest, LabelOutsideVocabularyThrows) {
    LogitDifference metric;
    Logits z = sampleLogits();
    std::vector<Label> outside(2);
    outside[1].correct = 4;
    EXPECT_THROW(metric.evaluate(z, z, {1, 1}, outside), ConfigurationError);

    std::vector<Label> too_few(1);
    EXPECT_THROW(metric.gradient(z, z, {1, 1}, too_few), ConfigurationError);
}

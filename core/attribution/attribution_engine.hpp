#pragma once

#include "attribution/attribution_config.hpp"
#include "attribution/gradient_fold.hpp"
#include "data/dataset.hpp"
#include "graph/graph.hpp"
#include "metrics/metric.hpp"
#include "model/model.hpp"

#include <cstddef>
#include <vector>

namespace eap {

struct AttributionReport {
    AttributionMethod method = AttributionMethod::Eap;
    size_t batches = 0;
    size_t examples = 0;
    size_t non_finite_edges = 0;   // scores left as-is for callers to filter
};

// ─── Attribution Engine ───────────────────────────────────────
// Scores every edge U → (D, slot) of a graph with
//
//     score += sum( grad(D, slot) * (clean_out(U) - corrupted_out(U)) )
//
// where grad is the metric gradient at the slot input: taken at the
// clean point (EAP), averaged over interpolated inputs (EAP-IG), or
// averaged over both endpoints (clean-corrupted). Positive scores
// mean patching the edge to its corrupted value lowers the metric.
//
// Batches run strictly in order; each one's captures are released
// once its scores are added to the graph. Scores are summed over the
// dataset, never averaged.

class AttributionEngine {
public:
    explicit AttributionEngine(AttributionConfig config = {});

    const AttributionConfig& config() const { return config_; }

    /// Adds the dataset's scores to graph's edges.
    /// ConfigurationError before any model call if the configuration,
    /// the model/graph pairing or any batch is invalid.
    AttributionReport attribute(const Model& model, Graph& graph,
                                const Dataset& dataset, const Metric& metric) const;

    /// Scores of one batch, indexed by EdgeId. Does not touch graph.
    std::vector<double> scoreBatch(const Model& model, const Graph& graph,
                                   const Batch& batch, const Metric& metric) const;

    /// ConfigurationError unless model, graph and dataset fit together.
    static void checkCompatible(const Model& model, const Graph& graph, const Dataset& dataset);

    /// Per edge: sum(grads[edge.slot_id] * diffs[edge.source]).
    static std::vector<double> edgeScores(const Graph& graph,
                                          const std::vector<Activation>& diffs,
                                          const SlotGradients& grads);

private:
    AttributionConfig config_;

    SlotGradients gradientsAt(const Model& model, const ComponentCatalog& catalog,
                              const ModelInput& input, const Logits& clean_logits,
                              const Batch& batch, const Metric& metric,
                              const Activation* input_override) const;
};

} // namespace eap

#pragma once

#include "data/dataset.hpp"
#include "graph/graph.hpp"
#include "metrics/metric.hpp"
#include "model/forward_context.hpp"
#include "model/model.hpp"

#include <vector>

namespace eap {

// ─── Circuit Evaluator ────────────────────────────────────────
// Measures a circuit by activation patching. On the clean input,
// every edge outside the circuit delivers its source's corrupted-run
// output instead of the current one:
//
//   slot_in = natural - sum_{e into slot, e out of circuit}
//                        (current_out(src) - corrupted_out(src))
//
// A slot with no circuit edge thus sees exactly its corrupted-run
// input, and a graph with every edge in circuit reproduces the clean
// run. Patching follows edge flags only; node flags are informative.

class CircuitEvaluator {
public:
    CircuitEvaluator() = default;

    /// Per-example metric of the patched run, concatenated over batches.
    std::vector<double> evaluateGraph(const Model& model, const Graph& graph,
                                      const Dataset& dataset, const Metric& metric) const;

    /// Per-example metric of the unpatched model on clean inputs, or
    /// on corrupted inputs when run_corrupted is set.
    std::vector<double> evaluateBaseline(const Model& model, const Dataset& dataset,
                                         const Metric& metric, bool run_corrupted = false) const;

    /// Slot-by-slot corrupted sources for the graph's out-of-circuit
    /// edges, with the corrupted outputs they need.
    static PatchPlan buildPatchPlan(const Graph& graph, const ForwardContext& corrupted);
};

} // namespace eap

#include "evaluation/circuit_evaluator.hpp"
#include "attribution/attribution_engine.hpp"
#include "common/logging.hpp"

namespace eap {

namespace {

void append(std::vector<double>& out, const Eigen::VectorXd& values) {
    out.insert(out.end(), values.data(), values.data() + values.size());
}

} // namespace

PatchPlan CircuitEvaluator::buildPatchPlan(const Graph& graph, const ForwardContext& corrupted) {
    PatchPlan plan;
    plan.corrupted_sources.resize(graph.slotCount());
    plan.corrupted_outputs.resize(graph.nodeCount());

    for (const Edge& e : graph.edges()) {
        if (e.in_circuit) continue;
        plan.corrupted_sources[e.slot_id].push_back(e.source);
        if (plan.corrupted_outputs[e.source].size() == 0) {
            plan.corrupted_outputs[e.source] = corrupted.output(e.source);
        }
    }
    return plan;
}

std::vector<double> CircuitEvaluator::evaluateGraph(const Model& model, const Graph& graph,
                                                    const Dataset& dataset,
                                                    const Metric& metric) const {
    AttributionEngine::checkCompatible(model, graph, dataset);

    auto log = logger();
    log->info("Evaluating circuit of {} / {} edges over {} batches, metric {}",
              graph.countIncludedEdges(), graph.edgeCount(), dataset.batchCount(), metric.name());

    const ComponentCatalog& catalog = graph.catalog();
    std::vector<double> results;
    results.reserve(dataset.exampleCount());

    for (size_t i = 0; i < dataset.batchCount(); i++) {
        const Batch& batch = dataset.batch(i);

        ForwardContext corrupted(catalog);
        model.forward(batch.corrupted, corrupted);
        corrupted.requireOutputs();
        PatchPlan plan = buildPatchPlan(graph, corrupted);

        ForwardContext reference(catalog);
        Logits clean_logits = model.forward(batch.clean, reference);
        reference.requireOutputs();

        ForwardContext patched(catalog);
        patched.setPatchPlan(&plan);
        Logits logits = model.forward(batch.clean, patched);
        patched.requireOutputs();
        patched.requireSlotInputs();

        append(results, metric.evaluate(logits, clean_logits, batch.input_lengths, batch.labels));
        log->debug("Batch {}/{}: {} slot contributions patched", i + 1, dataset.batchCount(),
                   plan.patchedEdgeCount());
    }
    return results;
}

std::vector<double> CircuitEvaluator::evaluateBaseline(const Model& model, const Dataset& dataset,
                                                       const Metric& metric,
                                                       bool run_corrupted) const {
    ComponentCatalog catalog(model.config());
    dataset.validate(model.inputWidth());

    logger()->info("Evaluating {} baseline over {} batches, metric {}",
                   run_corrupted ? "corrupted" : "clean", dataset.batchCount(), metric.name());

    std::vector<double> results;
    results.reserve(dataset.exampleCount());

    for (const Batch& batch : dataset) {
        ForwardContext clean(catalog);
        Logits clean_logits = model.forward(batch.clean, clean);

        if (run_corrupted) {
            ForwardContext corrupted(catalog);
            Logits logits = model.forward(batch.corrupted, corrupted);
            append(results, metric.evaluate(logits, clean_logits, batch.input_lengths, batch.labels));
        } else {
            append(results, metric.evaluate(clean_logits, clean_logits, batch.input_lengths,
                                            batch.labels));
        }
    }
    return results;
}

} // namespace eap

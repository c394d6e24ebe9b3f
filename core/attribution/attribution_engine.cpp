#include "attribution/attribution_engine.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <string>

namespace eap {

AttributionEngine::AttributionEngine(AttributionConfig config)
    : config_(config) {}

void AttributionEngine::checkCompatible(const Model& model, const Graph& graph,
                                        const Dataset& dataset) {
    const ModelConfig& mc = model.config();
    const ModelConfig& gc = graph.config();
    if (!sameTopology(mc, gc)) {
        throw ConfigurationError("Model " + model.name() + " has " +
                                 std::to_string(mc.n_layers) + " layers x " +
                                 std::to_string(mc.n_heads) + " heads, graph was built for " +
                                 std::to_string(gc.n_layers) + " x " + std::to_string(gc.n_heads));
    }
    if (mc.d_model != gc.d_model) {
        throw ConfigurationError("Model d_model " + std::to_string(mc.d_model) +
                                 " does not match graph d_model " + std::to_string(gc.d_model));
    }
    dataset.validate(model.inputWidth());
}

std::vector<double> AttributionEngine::edgeScores(const Graph& graph,
                                                  const std::vector<Activation>& diffs,
                                                  const SlotGradients& grads) {
    if (grads.size() != graph.slotCount()) {
        throw CaptureError("Got gradients for " + std::to_string(grads.size()) +
                           " slots, graph has " + std::to_string(graph.slotCount()));
    }

    std::vector<double> scores(graph.edgeCount(), 0.0);
    for (const Edge& e : graph.edges()) {
        const Activation& grad = grads[e.slot_id];
        const Activation& diff = diffs.at(e.source);
        if (grad.rows() != diff.rows() || grad.cols() != diff.cols()) {
            throw CaptureError("Gradient at " + graph.edgeName(e.id) +
                               " does not match the shape of its source activation");
        }
        scores[e.id] = (grad.array() * diff.array()).sum();
    }
    return scores;
}

SlotGradients AttributionEngine::gradientsAt(const Model& model, const ComponentCatalog& catalog,
                                             const ModelInput& input, const Logits& clean_logits,
                                             const Batch& batch, const Metric& metric,
                                             const Activation* input_override) const {
    ForwardContext ctx(catalog);
    if (input_override) ctx.overrideOutput(catalog.inputNode(), *input_override);

    Logits logits = model.forward(input, ctx);
    Logits grad = metric.gradient(logits, clean_logits, batch.input_lengths, batch.labels);
    model.backward(grad, ctx);
    return ctx.takeSlotGradients();
}

std::vector<double> AttributionEngine::scoreBatch(const Model& model, const Graph& graph,
                                                  const Batch& batch, const Metric& metric) const {
    const ComponentCatalog& catalog = graph.catalog();

    // Endpoint captures. Neither pass is differentiated here.
    ForwardContext corrupted(catalog);
    Logits corrupted_logits = model.forward(batch.corrupted, corrupted);
    corrupted.requireOutputs();

    ForwardContext clean(catalog);
    Logits clean_logits = model.forward(batch.clean, clean);
    clean.requireOutputs();

    std::vector<Activation> diffs(catalog.nodeCount());
    for (const Node& n : catalog.nodes()) {
        if (n.kind == NodeKind::LogitsOutput) continue;
        diffs[n.id] = clean.output(n.id) - corrupted.output(n.id);
    }

    SlotGradients grads;
    switch (config_.method) {
        case AttributionMethod::Eap: {
            Logits grad = metric.gradient(clean_logits, clean_logits,
                                          batch.input_lengths, batch.labels);
            model.backward(grad, clean);
            grads = clean.takeSlotGradients();
            break;
        }
        case AttributionMethod::EapIgInputs: {
            const Activation& clean_in = clean.output(catalog.inputNode());
            const Activation& corrupted_in = corrupted.output(catalog.inputNode());
            grads = integrateGradients(config_.ig_steps, [&](double alpha) {
                Activation point = corrupted_in + alpha * (clean_in - corrupted_in);
                return gradientsAt(model, catalog, batch.clean, clean_logits, batch, metric, &point);
            });
            break;
        }
        case AttributionMethod::CleanCorrupted: {
            Logits clean_grad = metric.gradient(clean_logits, clean_logits,
                                                batch.input_lengths, batch.labels);
            model.backward(clean_grad, clean);
            grads = clean.takeSlotGradients();

            Logits corrupted_grad = metric.gradient(corrupted_logits, clean_logits,
                                                    batch.input_lengths, batch.labels);
            model.backward(corrupted_grad, corrupted);
            addInPlace(grads, corrupted.takeSlotGradients());
            scaleInPlace(grads, 0.5);
            break;
        }
    }

    return edgeScores(graph, diffs, grads);
}

AttributionReport AttributionEngine::attribute(const Model& model, Graph& graph,
                                               const Dataset& dataset, const Metric& metric) const {
    validateConfig(config_);
    checkCompatible(model, graph, dataset);

    auto log = logger();
    log->info("Attributing {} edges with {} over {} batches ({} examples), metric {}",
              graph.edgeCount(), toString(config_.method), dataset.batchCount(),
              dataset.exampleCount(), metric.name());
    if (config_.method == AttributionMethod::EapIgInputs) {
        log->debug("Integrated gradients over {} interpolation steps", config_.ig_steps);
    }

    AttributionReport report;
    report.method = config_.method;

    // Running totals per edge; the graph sees them only once every batch succeeded.
    std::vector<double> totals(graph.edgeCount(), 0.0);
    for (size_t i = 0; i < dataset.batchCount(); i++) {
        const Batch& batch = dataset.batch(i);
        std::vector<double> scores = scoreBatch(model, graph, batch, metric);
        for (size_t eid = 0; eid < scores.size(); eid++) {
            totals[eid] += scores[eid];
        }
        report.batches++;
        report.examples += batch.size();
        log->debug("Batch {}/{} done ({} examples)", i + 1, dataset.batchCount(), batch.size());
    }

    for (size_t eid = 0; eid < totals.size(); eid++) {
        graph.accumulate(static_cast<EdgeId>(eid), totals[eid]);
    }
    graph.refreshNodeScores();
    report.non_finite_edges = graph.nonFiniteEdgeCount();
    if (report.non_finite_edges > 0) {
        log->warn("{} of {} edge scores are not finite", report.non_finite_edges, graph.edgeCount());
    }
    log->info("Attribution finished: {} batches, {} examples", report.batches, report.examples);
    return report;
}

} // namespace eap

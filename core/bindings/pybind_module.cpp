// PyBind11 bindings for the EAP circuit-discovery core.
// Exposes Graph, pruning, attribution, evaluation and the toy model to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include "attribution/attribution_engine.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "data/dataset.hpp"
#include "evaluation/circuit_evaluator.hpp"
#include "graph/graph.hpp"
#include "metrics/metric.hpp"
#include "model/toy_transformer.hpp"
#include "pruning/circuit_pruner.hpp"

namespace py = pybind11;

PYBIND11_MODULE(eap_bindings, m) {
    m.doc() = "EAP circuit discovery C++ core bindings";

    // ── Errors ──
    auto base_error = py::register_exception<eap::EapError>(m, "EapError");
    py::register_exception<eap::ConfigurationError>(m, "ConfigurationError", base_error.ptr());
    py::register_exception<eap::CaptureError>(m, "CaptureError", base_error.ptr());

    // ── Enums ──
    py::enum_<eap::NodeKind>(m, "NodeKind")
        .value("Input", eap::NodeKind::Input)
        .value("AttentionHead", eap::NodeKind::AttentionHead)
        .value("MlpOutput", eap::NodeKind::MlpOutput)
        .value("LogitsOutput", eap::NodeKind::LogitsOutput);

    py::enum_<eap::Slot>(m, "Slot")
        .value("Query", eap::Slot::Query)
        .value("Key", eap::Slot::Key)
        .value("Value", eap::Slot::Value)
        .value("Residual", eap::Slot::Residual);

    py::enum_<eap::AttributionMethod>(m, "AttributionMethod")
        .value("EAP", eap::AttributionMethod::Eap)
        .value("EAP_IG_inputs", eap::AttributionMethod::EapIgInputs)
        .value("clean_corrupted", eap::AttributionMethod::CleanCorrupted);

    // ── ModelConfig ──
    py::class_<eap::ModelConfig>(m, "ModelConfig")
        .def(py::init<>())
        .def_readwrite("n_layers", &eap::ModelConfig::n_layers)
        .def_readwrite("n_heads", &eap::ModelConfig::n_heads)
        .def_readwrite("d_model", &eap::ModelConfig::d_model)
        .def_readwrite("parallel_attn_mlp", &eap::ModelConfig::parallel_attn_mlp);

    // ── Export records ──
    py::class_<eap::NodeRecord>(m, "NodeRecord")
        .def_readonly("id", &eap::NodeRecord::id)
        .def_readonly("name", &eap::NodeRecord::name)
        .def_readonly("kind", &eap::NodeRecord::kind)
        .def_readonly("layer", &eap::NodeRecord::layer)
        .def_readonly("head", &eap::NodeRecord::head)
        .def_readonly("score", &eap::NodeRecord::score)
        .def_readonly("in_circuit", &eap::NodeRecord::in_circuit);

    py::class_<eap::EdgeRecord>(m, "EdgeRecord")
        .def_readonly("id", &eap::EdgeRecord::id)
        .def_readonly("name", &eap::EdgeRecord::name)
        .def_readonly("source", &eap::EdgeRecord::source)
        .def_readonly("target", &eap::EdgeRecord::target)
        .def_readonly("slot", &eap::EdgeRecord::slot)
        .def_readonly("score", &eap::EdgeRecord::score)
        .def_readonly("in_circuit", &eap::EdgeRecord::in_circuit);

    py::class_<eap::GraphExport>(m, "GraphExport")
        .def_readonly("config", &eap::GraphExport::config)
        .def_readonly("nodes", &eap::GraphExport::nodes)
        .def_readonly("edges", &eap::GraphExport::edges);

    // ── Graph ──
    py::class_<eap::Graph>(m, "Graph")
        .def_static("build", &eap::Graph::build)
        .def("node_count", &eap::Graph::nodeCount)
        .def("edge_count", &eap::Graph::edgeCount)
        .def("find_edge", py::overload_cast<const std::string&>(&eap::Graph::findEdge, py::const_))
        .def("find_node", &eap::Graph::findNode)
        .def("edge_name", &eap::Graph::edgeName)
        .def("accumulate", &eap::Graph::accumulate)
        .def("reset_scores", &eap::Graph::resetScores)
        .def("include_all", &eap::Graph::includeAll)
        .def("set_edge_in_circuit", &eap::Graph::setEdgeInCircuit)
        .def("prune_top_n", &eap::Graph::pruneTopN,
             py::arg("n"), py::arg("keep_dead_ends") = false)
        .def("count_included_nodes", &eap::Graph::countIncludedNodes)
        .def("count_included_edges", &eap::Graph::countIncludedEdges)
        .def("export_records", &eap::Graph::exportRecords);

    // ── PruneResult ──
    py::class_<eap::PruneResult>(m, "PruneResult")
        .def_readonly("edges_kept", &eap::PruneResult::edges_kept)
        .def_readonly("nodes_kept", &eap::PruneResult::nodes_kept)
        .def_readonly("min_kept_magnitude", &eap::PruneResult::min_kept_magnitude);

    py::class_<eap::CircuitPruner>(m, "CircuitPruner")
        .def(py::init<>())
        .def("prune_top_n", &eap::CircuitPruner::pruneTopN,
             py::arg("graph"), py::arg("n"), py::arg("keep_dead_ends") = false)
        .def_static("rank_edges", &eap::CircuitPruner::rankEdges);

    // ── Data ──
    py::class_<eap::Label>(m, "Label")
        .def(py::init<>())
        .def(py::init([](int correct, int incorrect) { return eap::Label{correct, incorrect}; }))
        .def_readwrite("correct", &eap::Label::correct)
        .def_readwrite("incorrect", &eap::Label::incorrect);

    py::class_<eap::Batch>(m, "Batch")
        .def(py::init<>())
        .def_readwrite("clean", &eap::Batch::clean)
        .def_readwrite("corrupted", &eap::Batch::corrupted)
        .def_readwrite("labels", &eap::Batch::labels)
        .def_readwrite("input_lengths", &eap::Batch::input_lengths);

    py::class_<eap::Dataset>(m, "Dataset")
        .def(py::init<>())
        .def("add", &eap::Dataset::add)
        .def("batch_count", &eap::Dataset::batchCount)
        .def("example_count", &eap::Dataset::exampleCount);

    // ── Model / metrics ──
    py::class_<eap::Model>(m, "Model");

    py::class_<eap::ToyDimensions>(m, "ToyDimensions")
        .def(py::init<>())
        .def_readwrite("d_input", &eap::ToyDimensions::d_input)
        .def_readwrite("d_head", &eap::ToyDimensions::d_head)
        .def_readwrite("d_mlp", &eap::ToyDimensions::d_mlp)
        .def_readwrite("d_vocab", &eap::ToyDimensions::d_vocab);

    py::class_<eap::ToyTransformer, eap::Model>(m, "ToyTransformer")
        .def(py::init<const eap::ModelConfig&, const eap::ToyDimensions&>())
        .def_static("random", &eap::ToyTransformer::random,
                    py::arg("config"), py::arg("dims"), py::arg("seed"), py::arg("scale") = 0.5);

    py::class_<eap::Metric>(m, "Metric")
        .def("name", &eap::Metric::name);

    m.def("make_metric", &eap::makeMetric, py::arg("name"));

    // ── Attribution ──
    py::class_<eap::AttributionConfig>(m, "AttributionConfig")
        .def(py::init<>())
        .def_readwrite("method", &eap::AttributionConfig::method)
        .def_readwrite("ig_steps", &eap::AttributionConfig::ig_steps);

    py::class_<eap::AttributionReport>(m, "AttributionReport")
        .def_readonly("method", &eap::AttributionReport::method)
        .def_readonly("batches", &eap::AttributionReport::batches)
        .def_readonly("examples", &eap::AttributionReport::examples)
        .def_readonly("non_finite_edges", &eap::AttributionReport::non_finite_edges);

    py::class_<eap::AttributionEngine>(m, "AttributionEngine")
        .def(py::init<eap::AttributionConfig>(), py::arg("config") = eap::AttributionConfig{})
        .def("attribute", &eap::AttributionEngine::attribute,
             py::arg("model"), py::arg("graph"), py::arg("dataset"), py::arg("metric"));

    m.def("parse_attribution_method", &eap::parseAttributionMethod);

    // ── Evaluation ──
    py::class_<eap::CircuitEvaluator>(m, "CircuitEvaluator")
        .def(py::init<>())
        .def("evaluate_graph", &eap::CircuitEvaluator::evaluateGraph,
             py::arg("model"), py::arg("graph"), py::arg("dataset"), py::arg("metric"))
        .def("evaluate_baseline", &eap::CircuitEvaluator::evaluateBaseline,
             py::arg("model"), py::arg("dataset"), py::arg("metric"),
             py::arg("run_corrupted") = false);

    m.def("set_log_level", [](const std::string& level) {
        eap::setLogLevel(spdlog::level::from_str(level));
    }, py::arg("level"));
}

#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"
#include "graph/component_catalog.hpp"
#include "graph/graph_export.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace eap {

// ─── Graph ─────────────────────────────────────────────────────
// Computation graph over a model's components. G = (N, E).
// Flat arena: node and edge ids are indices into contiguous
// vectors, so score accumulation is a direct indexed addition.
// Topology is fixed at build time; only scores and in-circuit
// flags change afterwards.

class Graph {
public:
    /// Build the full graph for a model configuration.
    /// All scores start at zero, every node and edge in circuit.
    static Graph build(const ModelConfig& config);

    const ModelConfig& config() const { return catalog_.config(); }
    const ComponentCatalog& catalog() const { return catalog_; }

    // ── Node access ──
    size_t nodeCount() const { return nodes_.size(); }
    const Node& node(NodeId id) const { return nodes_.at(id); }
    const std::vector<Node>& nodes() const { return nodes_; }
    std::optional<NodeId> findNode(const std::string& name) const;

    // ── Edge access ──
    size_t edgeCount() const { return edges_.size(); }
    const Edge& edge(EdgeId id) const { return edges_.at(id); }
    const std::vector<Edge>& edges() const { return edges_; }
    std::optional<EdgeId> findEdge(const std::string& name) const;
    std::string edgeName(EdgeId id) const;

    /// The edge source → (target, slot), if the catalog allows it.
    std::optional<EdgeId> findEdge(NodeId source, NodeId target, Slot slot) const;

    // ── Adjacency ──
    const std::vector<EdgeId>& incoming(NodeId id) const { return incoming_.at(id); }
    const std::vector<EdgeId>& outgoing(NodeId id) const { return outgoing_.at(id); }
    size_t slotCount() const { return slot_edges_.size(); }
    const std::vector<EdgeId>& slotEdges(SlotId slot) const { return slot_edges_.at(slot); }

    // ── Scores ──
    /// Adds delta to an edge's score. Repeated calls accumulate.
    void accumulate(EdgeId id, double delta) { edges_.at(id).score += delta; }
    void resetScores();
    /// node.score = sum of |score| over the node's incident edges.
    void refreshNodeScores();
    size_t nonFiniteEdgeCount() const;

    // ── Circuit membership ──
    void setEdgeInCircuit(EdgeId id, bool in_circuit) { edges_.at(id).in_circuit = in_circuit; }
    void setNodeInCircuit(NodeId id, bool in_circuit) { nodes_.at(id).in_circuit = in_circuit; }
    void includeAll();

    /// Keep the n highest-|score| edges. See CircuitPruner.
    void pruneTopN(size_t n, bool keep_dead_ends = false);

    size_t countIncludedNodes() const;
    size_t countIncludedEdges() const;

    // ── Export / iteration ──
    GraphExport exportRecords() const;
    void forEachNode(const std::function<void(const Node&)>& fn) const;
    void forEachEdge(const std::function<void(const Edge&)>& fn) const;

private:
    explicit Graph(const ModelConfig& config) : catalog_(config) {}

    ComponentCatalog catalog_;
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;

    std::vector<std::vector<EdgeId>> incoming_;
    std::vector<std::vector<EdgeId>> outgoing_;
    std::vector<std::vector<EdgeId>> slot_edges_;

    std::unordered_map<std::string, NodeId> node_names_;
    std::unordered_map<std::string, EdgeId> edge_names_;
};

} // namespace eap

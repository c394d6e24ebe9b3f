#include "graph/graph.hpp"
#include "pruning/circuit_pruner.hpp"

#include <cmath>

namespace eap {

Graph Graph::build(const ModelConfig& config) {
    Graph g(config);
    const ComponentCatalog& catalog = g.catalog_;

    g.nodes_ = catalog.nodes();
    g.incoming_.resize(g.nodes_.size());
    g.outgoing_.resize(g.nodes_.size());
    g.slot_edges_.resize(catalog.slotCount());

    std::vector<CatalogEdge> legal = catalog.legalEdges();
    g.edges_.reserve(legal.size());
    for (const CatalogEdge& ce : legal) {
        EdgeId id = static_cast<EdgeId>(g.edges_.size());
        g.edges_.emplace_back(id, ce.source, ce.target, ce.slot, ce.slot_id);
        g.outgoing_[ce.source].push_back(id);
        g.incoming_[ce.target].push_back(id);
        g.slot_edges_[ce.slot_id].push_back(id);
    }

    for (const Node& n : g.nodes_) {
        g.node_names_.emplace(n.name(), n.id);
    }
    for (const Edge& e : g.edges_) {
        g.edge_names_.emplace(g.edgeName(e.id), e.id);
    }
    return g;
}

// ─── Lookup ───────────────────────────────────────────────────

std::optional<NodeId> Graph::findNode(const std::string& name) const {
    auto it = node_names_.find(name);
    if (it == node_names_.end()) return std::nullopt;
    return it->second;
}

std::optional<EdgeId> Graph::findEdge(const std::string& name) const {
    auto it = edge_names_.find(name);
    if (it == edge_names_.end()) return std::nullopt;
    return it->second;
}

std::optional<EdgeId> Graph::findEdge(NodeId source, NodeId target, Slot slot) const {
    if (target >= incoming_.size()) return std::nullopt;
    for (EdgeId eid : incoming_[target]) {
        const Edge& e = edges_[eid];
        if (e.source == source && e.slot == slot) return eid;
    }
    return std::nullopt;
}

std::string Graph::edgeName(EdgeId id) const {
    const Edge& e = edges_.at(id);
    return nodes_[e.source].name() + "->" + nodes_[e.target].name() + slotSuffix(e.slot);
}

// ─── Scores ───────────────────────────────────────────────────

void Graph::resetScores() {
    for (Edge& e : edges_) e.score = 0.0;
    for (Node& n : nodes_) n.score = 0.0;
}

void Graph::refreshNodeScores() {
    for (Node& n : nodes_) n.score = 0.0;
    for (const Edge& e : edges_) {
        double magnitude = std::abs(e.score);
        nodes_[e.source].score += magnitude;
        nodes_[e.target].score += magnitude;
    }
}

size_t Graph::nonFiniteEdgeCount() const {
    size_t count = 0;
    for (const Edge& e : edges_) {
        if (!std::isfinite(e.score)) count++;
    }
    return count;
}

// ─── Circuit membership ───────────────────────────────────────

void Graph::includeAll() {
    for (Edge& e : edges_) e.in_circuit = true;
    for (Node& n : nodes_) n.in_circuit = true;
}

void Graph::pruneTopN(size_t n, bool keep_dead_ends) {
    CircuitPruner pruner;
    pruner.pruneTopN(*this, n, keep_dead_ends);
}

size_t Graph::countIncludedNodes() const {
    size_t count = 0;
    for (const Node& n : nodes_) {
        if (n.in_circuit) count++;
    }
    return count;
}

size_t Graph::countIncludedEdges() const {
    size_t count = 0;
    for (const Edge& e : edges_) {
        if (e.in_circuit) count++;
    }
    return count;
}

// ─── Export / iteration ───────────────────────────────────────

GraphExport Graph::exportRecords() const {
    GraphExport out;
    out.config = config();
    out.nodes.reserve(nodes_.size());
    out.edges.reserve(edges_.size());

    for (const Node& n : nodes_) {
        out.nodes.push_back({n.id, n.name(), n.kind, n.layer, n.head, n.score, n.in_circuit});
    }
    for (const Edge& e : edges_) {
        out.edges.push_back({e.id, edgeName(e.id), nodes_[e.source].name(),
                             nodes_[e.target].name(), e.slot, e.score, e.in_circuit});
    }
    return out;
}

void Graph::forEachNode(const std::function<void(const Node&)>& fn) const {
    for (const Node& n : nodes_) fn(n);
}

void Graph::forEachEdge(const std::function<void(const Edge&)>& fn) const {
    for (const Edge& e : edges_) fn(e);
}

} // namespace eap

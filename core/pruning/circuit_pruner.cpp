#include "pruning/circuit_pruner.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <cmath>

namespace eap {

namespace {

double rankKey(double score) {
    double magnitude = std::abs(score);
    return std::isnan(magnitude) ? -1.0 : magnitude;
}

} // namespace

std::vector<EdgeId> CircuitPruner::rankEdges(const Graph& graph) {
    std::vector<EdgeId> order(graph.edgeCount());
    for (size_t i = 0; i < order.size(); i++) {
        order[i] = static_cast<EdgeId>(i);
    }

    const std::vector<Edge>& edges = graph.edges();
    std::sort(order.begin(), order.end(), [&](EdgeId a, EdgeId b) {
        double ka = rankKey(edges[a].score);
        double kb = rankKey(edges[b].score);
        if (ka != kb) return ka > kb;
        return a < b;
    });
    return order;
}

std::vector<bool> CircuitPruner::reachesLogits(const Graph& graph) {
    // Edges always point to a higher node id, so a reverse sweep over
    // ids is a reverse topological order.
    std::vector<bool> reaches(graph.nodeCount(), false);
    NodeId logits = graph.catalog().logitsNode();
    reaches[logits] = true;

    for (size_t i = graph.nodeCount(); i-- > 0;) {
        if (i == logits) continue;
        for (EdgeId eid : graph.outgoing(static_cast<NodeId>(i))) {
            const Edge& e = graph.edge(eid);
            if (e.in_circuit && reaches[e.target]) {
                reaches[i] = true;
                break;
            }
        }
    }
    return reaches;
}

void CircuitPruner::updateNodeFlags(Graph& graph, bool keep_dead_ends) {
    std::vector<bool> reaches;
    if (!keep_dead_ends) reaches = reachesLogits(graph);

    NodeId input = graph.catalog().inputNode();
    for (const Node& n : graph.nodes()) {
        bool fed = (n.id == input);
        if (!fed) {
            for (EdgeId eid : graph.incoming(n.id)) {
                if (graph.edge(eid).in_circuit) {
                    fed = true;
                    break;
                }
            }
        }
        bool alive = keep_dead_ends || reaches[n.id];
        graph.setNodeInCircuit(n.id, fed && alive);
    }
}

PruneResult CircuitPruner::pruneTopN(Graph& graph, size_t n, bool keep_dead_ends) const {
    std::vector<EdgeId> order = rankEdges(graph);
    size_t keep = std::min(n, order.size());

    PruneResult result;
    for (size_t rank = 0; rank < order.size(); rank++) {
        graph.setEdgeInCircuit(order[rank], rank < keep);
    }
    if (keep > 0) {
        result.min_kept_magnitude = std::abs(graph.edge(order[keep - 1]).score);
    }

    updateNodeFlags(graph, keep_dead_ends);

    result.edges_kept = graph.countIncludedEdges();
    result.nodes_kept = graph.countIncludedNodes();
    logger()->info("Pruned to top {} of {} edges: {} edges, {} nodes in circuit{}",
                   n, order.size(), result.edges_kept, result.nodes_kept,
                   keep_dead_ends ? " (dead ends kept)" : "");
    return result;
}

} // namespace eap

#pragma once

#include "graph/graph.hpp"

#include <cstddef>
#include <vector>

namespace eap {

struct PruneResult {
    size_t edges_kept = 0;
    size_t nodes_kept = 0;
    double min_kept_magnitude = 0.0;   // |score| of the weakest kept edge
};

// ─── Circuit Pruner ───────────────────────────────────────────
// Selects a circuit from a scored graph.
//
// 1. Rank edges by descending |score|, ties broken by edge id.
// 2. Keep the top n edges, drop the rest.
// 3. A node stays iff it is the input or has a kept incoming edge,
//    and (unless keep_dead_ends) it reaches logits through kept edges.

class CircuitPruner {
public:
    CircuitPruner() = default;

    PruneResult pruneTopN(Graph& graph, size_t n, bool keep_dead_ends = false) const;

    /// Edge ids by descending |score|. NaN scores rank last.
    static std::vector<EdgeId> rankEdges(const Graph& graph);

    /// Recompute node flags from the current edge flags.
    static void updateNodeFlags(Graph& graph, bool keep_dead_ends);

    /// Per node: true iff logits is reachable through in-circuit edges.
    static std::vector<bool> reachesLogits(const Graph& graph);
};

} // namespace eap

#pragma once

#include "graph/component_catalog.hpp"

#include <string>
#include <vector>

namespace eap {

// ─── Graph Export ─────────────────────────────────────────────
// Flat, self-describing view of a scored graph for serializers and
// renderers. Carries no format of its own.

struct NodeRecord {
    NodeId id = 0;
    std::string name;
    NodeKind kind = NodeKind::Input;
    int layer = -1;
    int head = -1;
    double score = 0.0;
    bool in_circuit = true;
};

struct EdgeRecord {
    EdgeId id = 0;
    std::string name;
    std::string source;
    std::string target;
    Slot slot = Slot::Residual;
    double score = 0.0;
    bool in_circuit = true;
};

struct GraphExport {
    ModelConfig config;
    std::vector<NodeRecord> nodes;
    std::vector<EdgeRecord> edges;
};

} // namespace eap

#pragma once

#include <cstdint>
#include <string>

namespace eap {

using NodeId = uint32_t;

// ─── Node Kind ────────────────────────────────────────────────
// Tagged variant of an addressable signal point in the model.
// Layer/head fields are meaningful only for the kinds that use them.

enum class NodeKind : uint8_t {
    Input,
    AttentionHead,
    MlpOutput,
    LogitsOutput
};

inline const char* toString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Input:         return "input";
        case NodeKind::AttentionHead: return "attention";
        case NodeKind::MlpOutput:     return "mlp";
        case NodeKind::LogitsOutput:  return "logits";
    }
    return "unknown";
}

/// A node in the computation graph.
/// One per model component; never destroyed, only marked out of circuit.
struct Node {
    NodeId id = 0;
    NodeKind kind = NodeKind::Input;
    int layer = -1;
    int head = -1;
    int stage = 0;          // execution stage; edges only go to later stages
    bool in_circuit = true;
    double score = 0.0;

    Node() = default;
    Node(NodeId id, NodeKind kind, int layer, int head, int stage)
        : id(id), kind(kind), layer(layer), head(head), stage(stage) {}

    /// input, a{layer}.h{head}, m{layer}, logits
    std::string name() const {
        switch (kind) {
            case NodeKind::Input:
                return "input";
            case NodeKind::AttentionHead:
                return "a" + std::to_string(layer) + ".h" + std::to_string(head);
            case NodeKind::MlpOutput:
                return "m" + std::to_string(layer);
            case NodeKind::LogitsOutput:
                return "logits";
        }
        return "unknown";
    }
};

} // namespace eap

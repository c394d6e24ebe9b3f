#pragma once

#include "graph/node.hpp"
#include "graph/edge.hpp"

#include <cstddef>
#include <vector>

namespace eap {

// ─── Model Configuration ──────────────────────────────────────
// The few integers the graph topology depends on. d_model is not
// part of the topology but sizes every activation.

struct ModelConfig {
    int n_layers = 2;
    int n_heads = 2;
    int d_model = 8;
    bool parallel_attn_mlp = false;   // MLP reads the same residual as the layer's heads
};

/// Throws ConfigurationError unless every dimension is positive.
void validateConfig(const ModelConfig& config);

/// True when both configs produce the same node/edge set.
bool sameTopology(const ModelConfig& a, const ModelConfig& b);

struct DestinationSlot {
    SlotId id = 0;
    NodeId node = 0;
    Slot slot = Slot::Residual;
};

struct CatalogEdge {
    NodeId source = 0;
    NodeId target = 0;
    Slot slot = Slot::Residual;
    SlotId slot_id = 0;
};

// ─── Component Catalog ────────────────────────────────────────
// Enumerates the addressable signal points of a transformer and
// which upstream points each of them may read.
//
// Node order is execution order: input, then per layer its heads
// followed by its MLP, then logits. Every node carries a stage;
// an edge U → (D, slot) is legal iff stage(U) < stage(D). Heads of
// one layer share a stage, so they never read each other.

class ComponentCatalog {
public:
    explicit ComponentCatalog(const ModelConfig& config);

    const ModelConfig& config() const { return config_; }

    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<DestinationSlot>& slots() const { return slots_; }

    /// All legal edges in creation order: destination node, slot, source.
    std::vector<CatalogEdge> legalEdges() const;

    size_t nodeCount() const { return nodes_.size(); }
    size_t slotCount() const { return slots_.size(); }
    size_t edgeCount() const;

    // ── Index lookups (ConfigurationError when out of bounds) ──
    NodeId inputNode() const { return 0; }
    NodeId headNode(int layer, int head) const;
    NodeId mlpNode(int layer) const;
    NodeId logitsNode() const { return static_cast<NodeId>(nodes_.size() - 1); }
    SlotId slotOf(NodeId node, Slot slot) const;

    bool isLegal(NodeId source, NodeId target, Slot slot) const;

    /// The slots a node of the given kind exposes, in q/k/v order.
    static std::vector<Slot> slotsFor(NodeKind kind);

private:
    ModelConfig config_;
    std::vector<Node> nodes_;
    std::vector<DestinationSlot> slots_;
    std::vector<std::vector<SlotId>> node_slots_;

    void checkLayer(int layer) const;
};

} // namespace eap

#include "graph/component_catalog.hpp"
#include "common/errors.hpp"

#include <string>

namespace eap {

void validateConfig(const ModelConfig& config) {
    if (config.n_layers < 1)
        throw ConfigurationError("n_layers must be positive, got " + std::to_string(config.n_layers));
    if (config.n_heads < 1)
        throw ConfigurationError("n_heads must be positive, got " + std::to_string(config.n_heads));
    if (config.d_model < 1)
        throw ConfigurationError("d_model must be positive, got " + std::to_string(config.d_model));
}

bool sameTopology(const ModelConfig& a, const ModelConfig& b) {
    return a.n_layers == b.n_layers &&
           a.n_heads == b.n_heads &&
           a.parallel_attn_mlp == b.parallel_attn_mlp;
}

ComponentCatalog::ComponentCatalog(const ModelConfig& config)
    : config_(config) {
    validateConfig(config_);

    const int L = config_.n_layers;
    const int H = config_.n_heads;
    nodes_.reserve(static_cast<size_t>(L) * (H + 1) + 2);

    NodeId next = 0;
    nodes_.emplace_back(next++, NodeKind::Input, -1, -1, 0);
    for (int layer = 0; layer < L; layer++) {
        int attn_stage = 2 * layer + 1;
        int mlp_stage = config_.parallel_attn_mlp ? attn_stage : attn_stage + 1;
        for (int head = 0; head < H; head++) {
            nodes_.emplace_back(next++, NodeKind::AttentionHead, layer, head, attn_stage);
        }
        nodes_.emplace_back(next++, NodeKind::MlpOutput, layer, -1, mlp_stage);
    }
    nodes_.emplace_back(next++, NodeKind::LogitsOutput, -1, -1, 2 * L + 1);

    node_slots_.resize(nodes_.size());
    for (const Node& n : nodes_) {
        for (Slot s : slotsFor(n.kind)) {
            SlotId sid = static_cast<SlotId>(slots_.size());
            slots_.push_back({sid, n.id, s});
            node_slots_[n.id].push_back(sid);
        }
    }
}

std::vector<Slot> ComponentCatalog::slotsFor(NodeKind kind) {
    switch (kind) {
        case NodeKind::Input:
            return {};
        case NodeKind::AttentionHead:
            return {Slot::Query, Slot::Key, Slot::Value};
        case NodeKind::MlpOutput:
        case NodeKind::LogitsOutput:
            return {Slot::Residual};
    }
    return {};
}

std::vector<CatalogEdge> ComponentCatalog::legalEdges() const {
    std::vector<CatalogEdge> edges;
    edges.reserve(edgeCount());
    for (const DestinationSlot& ds : slots_) {
        const Node& target = nodes_[ds.node];
        for (const Node& source : nodes_) {
            if (source.stage >= target.stage) break;  // nodes are stage-ordered
            edges.push_back({source.id, target.id, ds.slot, ds.id});
        }
    }
    return edges;
}

size_t ComponentCatalog::edgeCount() const {
    size_t count = 0;
    for (const DestinationSlot& ds : slots_) {
        const Node& target = nodes_[ds.node];
        for (const Node& source : nodes_) {
            if (source.stage >= target.stage) break;
            count++;
        }
    }
    return count;
}

void ComponentCatalog::checkLayer(int layer) const {
    if (layer < 0 || layer >= config_.n_layers) {
        throw ConfigurationError("Layer index out of bounds: " + std::to_string(layer) +
                                 " (n_layers=" + std::to_string(config_.n_layers) + ")");
    }
}

NodeId ComponentCatalog::headNode(int layer, int head) const {
    checkLayer(layer);
    if (head < 0 || head >= config_.n_heads) {
        throw ConfigurationError("Head index out of bounds: " + std::to_string(head) +
                                 " (n_heads=" + std::to_string(config_.n_heads) + ")");
    }
    return static_cast<NodeId>(1 + layer * (config_.n_heads + 1) + head);
}

NodeId ComponentCatalog::mlpNode(int layer) const {
    checkLayer(layer);
    return static_cast<NodeId>(1 + layer * (config_.n_heads + 1) + config_.n_heads);
}

SlotId ComponentCatalog::slotOf(NodeId node, Slot slot) const {
    if (node >= nodes_.size())
        throw ConfigurationError("Node not found: " + std::to_string(node));

    std::vector<Slot> kinds = slotsFor(nodes_[node].kind);
    for (size_t i = 0; i < kinds.size(); i++) {
        if (kinds[i] == slot) return node_slots_[node][i];
    }
    throw ConfigurationError("Node " + nodes_[node].name() + " has no slot" +
                             std::string(slotSuffix(slot)));
}

bool ComponentCatalog::isLegal(NodeId source, NodeId target, Slot slot) const {
    if (source >= nodes_.size() || target >= nodes_.size()) return false;
    if (source == target) return false;

    bool has_slot = false;
    for (Slot s : slotsFor(nodes_[target].kind)) {
        if (s == slot) has_slot = true;
    }
    return has_slot && nodes_[source].stage < nodes_[target].stage;
}

} // namespace eap

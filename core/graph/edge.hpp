#pragma once

#include "graph/node.hpp"

#include <cstdint>

namespace eap {

using EdgeId = uint32_t;
using SlotId = uint32_t;

// ─── Slot ─────────────────────────────────────────────────────
// The input of a downstream node an edge writes into. Attention
// heads read the residual stream through three projections, so
// each of q/k/v is a separate edge target.

enum class Slot : uint8_t {
    Query,
    Key,
    Value,
    Residual
};

inline const char* slotSuffix(Slot slot) {
    switch (slot) {
        case Slot::Query: return "<q>";
        case Slot::Key:   return "<k>";
        case Slot::Value: return "<v>";
        case Slot::Residual: return "";
    }
    return "";
}

/// A directed edge source → (target, slot) with a signed attribution score.
struct Edge {
    EdgeId id = 0;
    NodeId source = 0;
    NodeId target = 0;
    Slot slot = Slot::Residual;
    SlotId slot_id = 0;     // global destination-slot index
    double score = 0.0;
    bool in_circuit = true;

    Edge() = default;
    Edge(EdgeId id, NodeId source, NodeId target, Slot slot, SlotId slot_id)
        : id(id), source(source), target(target), slot(slot), slot_id(slot_id) {}
};

} // namespace eap

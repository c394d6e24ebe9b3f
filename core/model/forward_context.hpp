#pragma once

#include "graph/component_catalog.hpp"
#include "model/tensor.hpp"

#include <optional>
#include <vector>

namespace eap {

// ─── Patch Plan ───────────────────────────────────────────────
// Which upstream contributions each destination slot must take
// from the corrupted run instead of the current one.

struct PatchPlan {
    std::vector<std::vector<NodeId>> corrupted_sources;   // per slot
    std::vector<Activation> corrupted_outputs;            // per node

    size_t patchedEdgeCount() const {
        size_t count = 0;
        for (const auto& sources : corrupted_sources) count += sources.size();
        return count;
    }
};

// ─── Forward Context ──────────────────────────────────────────
// Explicit capture/override channel between the core and a model.
// A model passes every node output through emitOutput() and every
// slot input through readSlot(); backward() reports the gradient at
// each slot through recordSlotGradient(). The context records all
// of it and applies output overrides and edge patches on the way.
//
// One context per forward pass. It owns its buffers, so dropping it
// releases the batch's captures.

class ForwardContext {
public:
    explicit ForwardContext(const ComponentCatalog& catalog);

    const ComponentCatalog& catalog() const { return catalog_; }

    // ── Set up before the pass ──
    /// Replace a node's output with a fixed value on this pass.
    void overrideOutput(NodeId node, Activation value);
    /// Patch slot inputs per plan. The plan must outlive the pass.
    void setPatchPlan(const PatchPlan* plan) { patch_ = plan; }

    // ── Model-facing hooks ──
    /// Records a node's output; returns the value downstream must use.
    const Activation& emitOutput(NodeId node, Activation value);
    /// Records a slot's input; returns the (possibly patched) value.
    const Activation& readSlot(SlotId slot, Activation natural);
    void recordSlotGradient(SlotId slot, Activation grad);

    // ── Captures ──
    bool hasOutput(NodeId node) const;
    const Activation& output(NodeId node) const;
    const Activation& slotInput(SlotId slot) const;
    const Activation& slotGradient(SlotId slot) const;

    /// CaptureError unless every node with downstream readers emitted.
    void requireOutputs() const;
    /// CaptureError unless every slot input went through readSlot().
    void requireSlotInputs() const;
    /// CaptureError unless every slot received a gradient.
    void requireGradients() const;

    /// Moves the slot gradients out, leaving the context without them.
    std::vector<Activation> takeSlotGradients();

private:
    const ComponentCatalog& catalog_;
    const PatchPlan* patch_ = nullptr;

    std::vector<std::optional<Activation>> overrides_;
    std::vector<std::optional<Activation>> outputs_;
    std::vector<std::optional<Activation>> slot_inputs_;
    std::vector<std::optional<Activation>> slot_grads_;
};

} // namespace eap

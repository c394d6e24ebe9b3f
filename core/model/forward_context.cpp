#include "model/forward_context.hpp"
#include "common/errors.hpp"

#include <string>

namespace eap {

namespace {

std::string shapeOf(const Activation& a) {
    return std::to_string(a.rows()) + "x" + std::to_string(a.cols());
}

} // namespace

ForwardContext::ForwardContext(const ComponentCatalog& catalog)
    : catalog_(catalog),
      overrides_(catalog.nodeCount()),
      outputs_(catalog.nodeCount()),
      slot_inputs_(catalog.slotCount()),
      slot_grads_(catalog.slotCount()) {}

void ForwardContext::overrideOutput(NodeId node, Activation value) {
    overrides_.at(node) = std::move(value);
}

const Activation& ForwardContext::emitOutput(NodeId node, Activation value) {
    std::optional<Activation>& slot = outputs_.at(node);
    const std::optional<Activation>& forced = overrides_[node];
    if (forced) {
        if (forced->rows() != value.rows() || forced->cols() != value.cols()) {
            throw CaptureError("Override for " + catalog_.nodes()[node].name() + " has shape " +
                               shapeOf(*forced) + ", model produced " + shapeOf(value));
        }
        slot = *forced;
    } else {
        slot = std::move(value);
    }
    return *slot;
}

const Activation& ForwardContext::readSlot(SlotId slot, Activation natural) {
    if (patch_) {
        for (NodeId source : patch_->corrupted_sources.at(slot)) {
            const std::optional<Activation>& current = outputs_.at(source);
            if (!current) {
                throw CaptureError("Slot " + std::to_string(slot) + " read before " +
                                   catalog_.nodes()[source].name() + " emitted its output");
            }
            const Activation& corrupted = patch_->corrupted_outputs.at(source);
            if (current->rows() != natural.rows() || current->cols() != natural.cols() ||
                corrupted.rows() != natural.rows() || corrupted.cols() != natural.cols()) {
                throw CaptureError("Patch for slot " + std::to_string(slot) + " from " +
                                   catalog_.nodes()[source].name() + " has shape " +
                                   shapeOf(corrupted) + ", slot input is " + shapeOf(natural));
            }
            natural -= *current - corrupted;
        }
    }
    slot_inputs_.at(slot) = std::move(natural);
    return *slot_inputs_[slot];
}

void ForwardContext::recordSlotGradient(SlotId slot, Activation grad) {
    slot_grads_.at(slot) = std::move(grad);
}

bool ForwardContext::hasOutput(NodeId node) const {
    return node < outputs_.size() && outputs_[node].has_value();
}

const Activation& ForwardContext::output(NodeId node) const {
    if (!hasOutput(node)) {
        throw CaptureError("No output captured for node " + std::to_string(node));
    }
    return *outputs_[node];
}

const Activation& ForwardContext::slotInput(SlotId slot) const {
    if (slot >= slot_inputs_.size() || !slot_inputs_[slot]) {
        throw CaptureError("No input captured for slot " + std::to_string(slot));
    }
    return *slot_inputs_[slot];
}

const Activation& ForwardContext::slotGradient(SlotId slot) const {
    if (slot >= slot_grads_.size() || !slot_grads_[slot]) {
        throw CaptureError("No gradient captured for slot " + std::to_string(slot));
    }
    return *slot_grads_[slot];
}

void ForwardContext::requireOutputs() const {
    for (const Node& n : catalog_.nodes()) {
        if (n.kind == NodeKind::LogitsOutput) continue;
        if (!outputs_[n.id]) {
            throw CaptureError("Model did not record an output for " + n.name());
        }
    }
}

void ForwardContext::requireSlotInputs() const {
    for (const DestinationSlot& ds : catalog_.slots()) {
        if (!slot_inputs_[ds.id]) {
            throw CaptureError("Model did not read slot " +
                               catalog_.nodes()[ds.node].name() + slotSuffix(ds.slot) +
                               " through the context");
        }
    }
}

void ForwardContext::requireGradients() const {
    for (const DestinationSlot& ds : catalog_.slots()) {
        if (!slot_grads_[ds.id]) {
            throw CaptureError("Model did not record a gradient for " +
                               catalog_.nodes()[ds.node].name() + slotSuffix(ds.slot));
        }
    }
}

std::vector<Activation> ForwardContext::takeSlotGradients() {
    requireGradients();
    std::vector<Activation> grads;
    grads.reserve(slot_grads_.size());
    for (std::optional<Activation>& g : slot_grads_) {
        grads.push_back(std::move(*g));
        g.reset();
    }
    return grads;
}

} // namespace eap

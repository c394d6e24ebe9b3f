#pragma once

#include "graph/component_catalog.hpp"
#include "model/forward_context.hpp"
#include "model/tensor.hpp"

#include <string>

namespace eap {

// ─── Model ────────────────────────────────────────────────────
// Interface to the network under study. Attribution and evaluation
// drive it only through forward/backward and a ForwardContext.
//
// Contract:
//  - forward() routes each node output through ctx.emitOutput() and
//    continues with the returned value; it routes each slot input
//    through ctx.readSlot() and continues with the returned value.
//  - backward() differentiates the scalar whose logits-gradient it is
//    given, through the pass last recorded in ctx, and reports the
//    gradient at every destination slot via ctx.recordSlotGradient().
//  - Both are deterministic for fixed inputs.

class Model {
public:
    virtual ~Model() = default;

    virtual const ModelConfig& config() const = 0;

    /// Width of one example of ModelInput.
    virtual int inputWidth() const = 0;

    virtual Logits forward(const ModelInput& input, ForwardContext& ctx) const = 0;

    virtual void backward(const Logits& grad_logits, ForwardContext& ctx) const = 0;

    virtual std::string name() const = 0;
};

} // namespace eap

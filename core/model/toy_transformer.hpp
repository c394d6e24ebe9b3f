#pragma once

#include "model/model.hpp"

#include <Eigen/Core>

#include <cstdint>
#include <vector>

namespace eap {

/// Sizes of the toy transformer beyond the graph topology.
struct ToyDimensions {
    int d_input = 4;
    int d_head = 4;
    int d_mlp = 8;
    int d_vocab = 4;
};

struct AttentionWeights {
    Eigen::MatrixXd w_q;   // d_model x d_head
    Eigen::MatrixXd w_k;   // d_model x d_head
    Eigen::MatrixXd w_v;   // d_model x d_head
    Eigen::MatrixXd w_o;   // d_head x d_model
};

struct MlpWeights {
    Eigen::MatrixXd w_in;      // d_model x d_mlp
    Eigen::RowVectorXd b_in;   // d_mlp
    Eigen::MatrixXd w_out;     // d_mlp x d_model
};

struct ToyTransformerWeights {
    Eigen::MatrixXd w_embed;                               // d_input x d_model
    std::vector<std::vector<AttentionWeights>> attention;  // [layer][head]
    std::vector<MlpWeights> mlp;                           // [layer]
    Eigen::MatrixXd w_unembed;                             // d_model x d_vocab
};

// ─── Toy Transformer ──────────────────────────────────────────
// Small residual network with the same component layout as a
// transformer, and an exact analytic backward pass.
//
//   resid  = x W_E                                   (input)
//   head   = sigmoid(<q, k> / sqrt(d_head)) * v W_O  (q/k/v read the residual)
//   mlp    = tanh(resid W_in + b) W_out
//   logits = resid W_U
//
// There is no sequence axis: one row is one example, so the gate
// stands in for the attention pattern while keeping the three
// independent projections of the residual stream.

class ToyTransformer : public Model {
public:
    /// All weights zero.
    ToyTransformer(const ModelConfig& config, const ToyDimensions& dims);

    /// Weights drawn i.i.d. from N(0, scale^2) with a fixed seed.
    static ToyTransformer random(const ModelConfig& config, const ToyDimensions& dims,
                                 uint32_t seed, double scale = 0.5);

    const ModelConfig& config() const override { return catalog_.config(); }
    int inputWidth() const override { return dims_.d_input; }
    std::string name() const override { return "toy-transformer"; }

    const ToyDimensions& dimensions() const { return dims_; }
    const ComponentCatalog& catalog() const { return catalog_; }

    ToyTransformerWeights& weights() { return weights_; }
    const ToyTransformerWeights& weights() const { return weights_; }

    /// ConfigurationError if any weight has the wrong shape.
    void validateWeights() const;

    Logits forward(const ModelInput& input, ForwardContext& ctx) const override;

    /// Assumes the pass recorded in ctx was not edge-patched.
    void backward(const Logits& grad_logits, ForwardContext& ctx) const override;

private:
    ComponentCatalog catalog_;
    ToyDimensions dims_;
    ToyTransformerWeights weights_;
};

} // namespace eap

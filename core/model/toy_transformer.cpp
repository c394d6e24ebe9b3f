#include "model/toy_transformer.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <random>
#include <string>

namespace eap {

namespace {

template <typename M>
void checkShape(const M& m, Eigen::Index rows, Eigen::Index cols,
                const std::string& what) {
    if (m.rows() != rows || m.cols() != cols) {
        throw ConfigurationError(what + " has shape " + std::to_string(m.rows()) + "x" +
                                 std::to_string(m.cols()) + ", expected " +
                                 std::to_string(rows) + "x" + std::to_string(cols));
    }
}

Eigen::VectorXd headGate(const Eigen::MatrixXd& q, const Eigen::MatrixXd& k, double inv_sqrt) {
    Eigen::ArrayXd s = (q.array() * k.array()).rowwise().sum() * inv_sqrt;
    return (1.0 + (-s).exp()).inverse().matrix();
}

Eigen::MatrixXd mlpHidden(const Activation& in, const MlpWeights& m) {
    Eigen::MatrixXd pre = in * m.w_in;
    pre.rowwise() += m.b_in;
    return pre.array().tanh().matrix();
}

} // namespace

ToyTransformer::ToyTransformer(const ModelConfig& config, const ToyDimensions& dims)
    : catalog_(config), dims_(dims) {
    if (dims_.d_input < 1 || dims_.d_head < 1 || dims_.d_mlp < 1 || dims_.d_vocab < 1) {
        throw ConfigurationError("Toy transformer dimensions must be positive");
    }

    const int d = config.d_model;
    weights_.w_embed = Eigen::MatrixXd::Zero(dims_.d_input, d);
    weights_.attention.resize(config.n_layers);
    weights_.mlp.resize(config.n_layers);
    for (int layer = 0; layer < config.n_layers; layer++) {
        weights_.attention[layer].resize(config.n_heads);
        for (AttentionWeights& w : weights_.attention[layer]) {
            w.w_q = Eigen::MatrixXd::Zero(d, dims_.d_head);
            w.w_k = Eigen::MatrixXd::Zero(d, dims_.d_head);
            w.w_v = Eigen::MatrixXd::Zero(d, dims_.d_head);
            w.w_o = Eigen::MatrixXd::Zero(dims_.d_head, d);
        }
        MlpWeights& m = weights_.mlp[layer];
        m.w_in = Eigen::MatrixXd::Zero(d, dims_.d_mlp);
        m.b_in = Eigen::RowVectorXd::Zero(dims_.d_mlp);
        m.w_out = Eigen::MatrixXd::Zero(dims_.d_mlp, d);
    }
    weights_.w_unembed = Eigen::MatrixXd::Zero(d, dims_.d_vocab);
}

ToyTransformer ToyTransformer::random(const ModelConfig& config, const ToyDimensions& dims,
                                      uint32_t seed, double scale) {
    ToyTransformer model(config, dims);
    std::mt19937 rng(seed);
    std::normal_distribution<double> dist(0.0, scale);
    auto fill = [&](auto& m) {
        for (Eigen::Index i = 0; i < m.size(); i++) m.data()[i] = dist(rng);
    };

    ToyTransformerWeights& w = model.weights_;
    fill(w.w_embed);
    for (auto& layer : w.attention) {
        for (AttentionWeights& head : layer) {
            fill(head.w_q);
            fill(head.w_k);
            fill(head.w_v);
            fill(head.w_o);
        }
    }
    for (MlpWeights& m : w.mlp) {
        fill(m.w_in);
        fill(m.b_in);
        fill(m.w_out);
    }
    fill(w.w_unembed);
    return model;
}

void ToyTransformer::validateWeights() const {
    const ModelConfig& cfg = config();
    const int d = cfg.d_model;
    checkShape(weights_.w_embed, dims_.d_input, d, "w_embed");
    checkShape(weights_.w_unembed, d, dims_.d_vocab, "w_unembed");

    if (static_cast<int>(weights_.attention.size()) != cfg.n_layers ||
        static_cast<int>(weights_.mlp.size()) != cfg.n_layers) {
        throw ConfigurationError("Toy transformer weights do not cover " +
                                 std::to_string(cfg.n_layers) + " layers");
    }
    for (int layer = 0; layer < cfg.n_layers; layer++) {
        if (static_cast<int>(weights_.attention[layer].size()) != cfg.n_heads) {
            throw ConfigurationError("Layer " + std::to_string(layer) + " has " +
                                     std::to_string(weights_.attention[layer].size()) + " heads");
        }
        for (int head = 0; head < cfg.n_heads; head++) {
            const AttentionWeights& w = weights_.attention[layer][head];
            std::string tag = "a" + std::to_string(layer) + ".h" + std::to_string(head);
            checkShape(w.w_q, d, dims_.d_head, tag + ".w_q");
            checkShape(w.w_k, d, dims_.d_head, tag + ".w_k");
            checkShape(w.w_v, d, dims_.d_head, tag + ".w_v");
            checkShape(w.w_o, dims_.d_head, d, tag + ".w_o");
        }
        const MlpWeights& m = weights_.mlp[layer];
        std::string tag = "m" + std::to_string(layer);
        checkShape(m.w_in, d, dims_.d_mlp, tag + ".w_in");
        checkShape(m.b_in, 1, dims_.d_mlp, tag + ".b_in");
        checkShape(m.w_out, dims_.d_mlp, d, tag + ".w_out");
    }
}

Logits ToyTransformer::forward(const ModelInput& input, ForwardContext& ctx) const {
    validateWeights();
    if (input.cols() != dims_.d_input) {
        throw ConfigurationError("Input width " + std::to_string(input.cols()) +
                                 " does not match d_input " + std::to_string(dims_.d_input));
    }

    const ModelConfig& cfg = config();
    const double inv_sqrt = 1.0 / std::sqrt(static_cast<double>(dims_.d_head));

    Activation resid = ctx.emitOutput(catalog_.inputNode(), input * weights_.w_embed);

    for (int layer = 0; layer < cfg.n_layers; layer++) {
        const Activation layer_in = resid;

        for (int head = 0; head < cfg.n_heads; head++) {
            const AttentionWeights& w = weights_.attention[layer][head];
            NodeId node = catalog_.headNode(layer, head);

            Eigen::MatrixXd q = ctx.readSlot(catalog_.slotOf(node, Slot::Query), layer_in) * w.w_q;
            Eigen::MatrixXd k = ctx.readSlot(catalog_.slotOf(node, Slot::Key), layer_in) * w.w_k;
            Eigen::MatrixXd v = ctx.readSlot(catalog_.slotOf(node, Slot::Value), layer_in) * w.w_v;

            Eigen::VectorXd gate = headGate(q, k, inv_sqrt);
            Activation out = gate.asDiagonal() * (v * w.w_o);
            resid += ctx.emitOutput(node, std::move(out));
        }

        const MlpWeights& m = weights_.mlp[layer];
        NodeId mlp = catalog_.mlpNode(layer);
        const Activation& mlp_in = ctx.readSlot(catalog_.slotOf(mlp, Slot::Residual),
                                                cfg.parallel_attn_mlp ? layer_in : resid);
        resid += ctx.emitOutput(mlp, mlpHidden(mlp_in, m) * m.w_out);
    }

    const Activation& final_in =
        ctx.readSlot(catalog_.slotOf(catalog_.logitsNode(), Slot::Residual), resid);
    return final_in * weights_.w_unembed;
}

void ToyTransformer::backward(const Logits& grad_logits, ForwardContext& ctx) const {
    if (grad_logits.cols() != dims_.d_vocab) {
        throw ConfigurationError("Logit gradient width " + std::to_string(grad_logits.cols()) +
                                 " does not match d_vocab " + std::to_string(dims_.d_vocab));
    }

    const ModelConfig& cfg = config();
    const double inv_sqrt = 1.0 / std::sqrt(static_cast<double>(dims_.d_head));

    // g: gradient w.r.t. the residual stream after the current layer
    Activation g = grad_logits * weights_.w_unembed.transpose();
    ctx.recordSlotGradient(catalog_.slotOf(catalog_.logitsNode(), Slot::Residual), g);

    for (int layer = cfg.n_layers - 1; layer >= 0; layer--) {
        const MlpWeights& m = weights_.mlp[layer];
        SlotId mlp_slot = catalog_.slotOf(catalog_.mlpNode(layer), Slot::Residual);

        Eigen::MatrixXd hidden = mlpHidden(ctx.slotInput(mlp_slot), m);
        Eigen::MatrixXd d_hidden =
            ((g * m.w_out.transpose()).array() * (1.0 - hidden.array().square())).matrix();
        Activation d_mlp_in = d_hidden * m.w_in.transpose();
        ctx.recordSlotGradient(mlp_slot, d_mlp_in);

        // Heads write into the stream the MLP reads unless the layer is parallel.
        Activation g_heads = cfg.parallel_attn_mlp ? g : Activation(g + d_mlp_in);
        Activation g_in = cfg.parallel_attn_mlp ? Activation(g + d_mlp_in) : g_heads;

        for (int head = 0; head < cfg.n_heads; head++) {
            const AttentionWeights& w = weights_.attention[layer][head];
            NodeId node = catalog_.headNode(layer, head);
            SlotId q_slot = catalog_.slotOf(node, Slot::Query);
            SlotId k_slot = catalog_.slotOf(node, Slot::Key);
            SlotId v_slot = catalog_.slotOf(node, Slot::Value);

            Eigen::MatrixXd q = ctx.slotInput(q_slot) * w.w_q;
            Eigen::MatrixXd k = ctx.slotInput(k_slot) * w.w_k;
            Eigen::MatrixXd v = ctx.slotInput(v_slot) * w.w_v;
            Eigen::VectorXd gate = headGate(q, k, inv_sqrt);
            Eigen::MatrixXd u = v * w.w_o;

            Eigen::ArrayXd d_gate = (g_heads.array() * u.array()).rowwise().sum();
            Eigen::VectorXd d_score =
                (d_gate * gate.array() * (1.0 - gate.array()) * inv_sqrt).matrix();

            Activation dq_in = (d_score.asDiagonal() * k) * w.w_q.transpose();
            Activation dk_in = (d_score.asDiagonal() * q) * w.w_k.transpose();
            Activation dv_in = (gate.asDiagonal() * (g_heads * w.w_o.transpose())) * w.w_v.transpose();

            g_in += dq_in + dk_in + dv_in;
            ctx.recordSlotGradient(q_slot, std::move(dq_in));
            ctx.recordSlotGradient(k_slot, std::move(dk_in));
            ctx.recordSlotGradient(v_slot, std::move(dv_in));
        }
        g = std::move(g_in);
    }
}

} // namespace eap

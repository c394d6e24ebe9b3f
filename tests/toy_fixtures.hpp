#pragma once

#include "data/dataset.hpp"
#include "model/toy_transformer.hpp"

#include <random>

namespace eap_test {

inline eap::ModelConfig smallConfig(int layers = 2, int heads = 2, int d_model = 6,
                                    bool parallel = false) {
    eap::ModelConfig config;
    config.n_layers = layers;
    config.n_heads = heads;
    config.d_model = d_model;
    config.parallel_attn_mlp = parallel;
    return config;
}

inline eap::ToyDimensions smallDims() {
    eap::ToyDimensions dims;
    dims.d_input = 5;
    dims.d_head = 3;
    dims.d_mlp = 7;
    dims.d_vocab = 4;
    return dims;
}

inline eap::Batch randomBatch(std::mt19937& rng, int size, const eap::ToyDimensions& dims) {
    std::normal_distribution<double> value(0.0, 1.0);
    std::uniform_int_distribution<int> token(0, dims.d_vocab - 1);

    eap::Batch batch;
    batch.clean = eap::ModelInput(size, dims.d_input);
    batch.corrupted = eap::ModelInput(size, dims.d_input);
    for (int i = 0; i < size; i++) {
        for (int j = 0; j < dims.d_input; j++) {
            batch.clean(i, j) = value(rng);
            batch.corrupted(i, j) = value(rng);
        }
        eap::Label label;
        label.correct = token(rng);
        label.incorrect = (label.correct + 1) % dims.d_vocab;
        batch.labels.push_back(label);
        batch.input_lengths.push_back(1);
    }
    return batch;
}

inline eap::Dataset randomDataset(uint32_t seed, int batches, int batch_size,
                                  const eap::ToyDimensions& dims) {
    std::mt19937 rng(seed);
    eap::Dataset dataset;
    for (int b = 0; b < batches; b++) {
        dataset.add(randomBatch(rng, batch_size, dims));
    }
    return dataset;
}

// ─── Injected path ────────────────────────────────────────────
// Two layers, two heads, every weight zero except one route:
// input dim 0 -> a1.h0 value -> residual dim 1 -> logit 0.
// With clean input e0 and corrupted input 0, the logit difference
// (correct 0, incorrect 1) is 0.5 clean and 0 corrupted, and only
// input->a1.h0<v> and a1.h0->logits carry attribution.

inline eap::ToyTransformer injectedPathModel() {
    eap::ToyDimensions dims;
    dims.d_input = 4;
    dims.d_head = 2;
    dims.d_mlp = 3;
    dims.d_vocab = 2;
    eap::ToyTransformer model(smallConfig(2, 2, 4), dims);

    eap::ToyTransformerWeights& w = model.weights();
    w.w_embed = Eigen::MatrixXd::Identity(4, 4);
    w.attention[1][0].w_v(0, 0) = 1.0;
    w.attention[1][0].w_o(0, 1) = 1.0;
    w.w_unembed(1, 0) = 1.0;
    return model;
}

inline eap::Dataset injectedPathDataset() {
    eap::Batch batch;
    batch.clean = eap::ModelInput::Zero(1, 4);
    batch.clean(0, 0) = 1.0;
    batch.corrupted = eap::ModelInput::Zero(1, 4);
    eap::Label label;
    label.correct = 0;
    label.incorrect = 1;
    batch.labels.push_back(label);
    batch.input_lengths.push_back(1);

    eap::Dataset dataset;
    dataset.add(batch);
    return dataset;
}

/// Forwards to another model and counts the passes it is asked for.
class CountingModel : public eap::Model {
public:
    explicit CountingModel(const eap::Model& inner) : inner_(inner) {}

    const eap::ModelConfig& config() const override { return inner_.config(); }
    int inputWidth() const override { return inner_.inputWidth(); }
    std::string name() const override { return "counting:" + inner_.name(); }

    eap::Logits forward(const eap::ModelInput& input, eap::ForwardContext& ctx) const override {
        forwards++;
        return inner_.forward(input, ctx);
    }

    void backward(const eap::Logits& grad_logits, eap::ForwardContext& ctx) const override {
        backwards++;
        inner_.backward(grad_logits, ctx);
    }

    mutable int forwards = 0;
    mutable int backwards = 0;

private:
    const eap::Model& inner_;
};

} // namespace eap_test

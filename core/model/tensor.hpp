#pragma once

#include <Eigen/Core>

namespace eap {

// Rows are examples throughout: a batch of B examples is a B x width matrix.
using Activation = Eigen::MatrixXd;   // B x d_model (node outputs, slot inputs, slot gradients)
using Logits = Eigen::MatrixXd;       // B x d_vocab
using ModelInput = Eigen::MatrixXd;   // B x d_input

} // namespace eap

#ifndef PONDER_TRANSITION_H
#define PONDER_TRANSITION_H

#include <string>
#include <torch/torch.h>

#include "Activations.h"
#include "ModelArgs.h"

namespace Model {
    /**
     * Transformer transition function: activation(x @ W1 + b1) @ W2 + b2,
     * applied to every position independently. Used in both the classic and the
     * Universal Transformer (where it is also shared between time steps).
     */
    struct TransformerTransitionImpl : torch::nn::Module {
        TransformerTransitionImpl(int64_t d_model, const TransitionArgs &args);

        TransformerTransitionImpl(int64_t d_model, Activation activation, int64_t size_multiplier = 4);

        torch::Tensor forward(const torch::Tensor &x);

        Activation activation;
        int64_t d_model;
        int64_t size_multiplier;

        torch::Tensor weights1; // [d_model, size_multiplier * d_model]
        torch::Tensor biases1;
        torch::Tensor weights2; // [size_multiplier * d_model, d_model]
        torch::Tensor biases2;
    };

    TORCH_MODULE (TransformerTransition);

    // Position-wise 1D convolution over the sequence axis ("cnn" transition).
    // Kernel and bias carry an L2 penalty exposed through regularization_loss().
    struct ConvTransitionImpl : torch::nn::Module {
        static constexpr double l2 = 0.01;

        ConvTransitionImpl(int64_t d_model, const TransitionArgs &args);

        torch::Tensor forward(const torch::Tensor &x);

        torch::Tensor regularization_loss() const;

        Activation activation;
        int64_t d_model;
        int64_t window_size;
        torch::nn::Conv1d conv{nullptr};
    };

    TORCH_MODULE (ConvTransition);

    // Builds the transition selected by name ("dot" or "cnn").
    torch::nn::AnyModule make_transition(const std::string &transition_type, int64_t d_model,
                                         const TransitionArgs &args);
} // namespace Model

#endif //PONDER_TRANSITION_H

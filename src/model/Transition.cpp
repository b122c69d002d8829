#include "Transition.h"

#include <stdexcept>
#include <utility>

namespace Model {
    TransformerTransitionImpl::TransformerTransitionImpl(const int64_t d_model, const TransitionArgs &args)
        : TransformerTransitionImpl(d_model, get_activation(args.activation), args.size_multiplier) {
    }

    TransformerTransitionImpl::TransformerTransitionImpl(const int64_t d_model, Activation activation,
                                                         const int64_t size_multiplier)
        : activation(std::move(activation)),
          d_model(d_model),
          size_multiplier(size_multiplier) {
        if (d_model <= 0) {
            throw std::invalid_argument("TransformerTransition d_model must be positive");
        }
        if (size_multiplier < 1) {
            throw std::invalid_argument("TransformerTransition size_multiplier must be >= 1, got "
                                        + std::to_string(size_multiplier));
        }
        if (!this->activation) {
            throw std::invalid_argument("TransformerTransition requires an activation function");
        }

        const int64_t hidden_dim = size_multiplier * d_model;
        weights1 = register_parameter("weights1", torch::empty({d_model, hidden_dim}));
        biases1 = register_parameter("biases1", torch::zeros({hidden_dim}));
        weights2 = register_parameter("weights2", torch::empty({hidden_dim, d_model}));
        biases2 = register_parameter("biases2", torch::zeros({d_model}));

        torch::NoGradGuard no_grad;
        torch::nn::init::xavier_uniform_(weights1);
        torch::nn::init::xavier_uniform_(weights2);
    }

    torch::Tensor TransformerTransitionImpl::forward(const torch::Tensor &x) {
        // Flatten batch and sequence axes so each position goes through the same dense layers
        const auto flat = x.reshape({-1, d_model});
        const auto step1 = activation(torch::matmul(flat, weights1) + biases1);
        const auto step2 = torch::matmul(step1, weights2) + biases2;

        auto shape = x.sizes().vec();
        shape.back() = d_model;
        return step2.view(shape);
    }

    ConvTransitionImpl::ConvTransitionImpl(const int64_t d_model, const TransitionArgs &args)
        : activation(get_activation(args.activation)),
          d_model(d_model),
          window_size(args.size_multiplier) {
        if (d_model <= 0) {
            throw std::invalid_argument("ConvTransition d_model must be positive");
        }
        if (window_size < 1) {
            throw std::invalid_argument("ConvTransition window size must be >= 1, got "
                                        + std::to_string(window_size));
        }

        conv = register_module("conv", torch::nn::Conv1d(
                                   torch::nn::Conv1dOptions(d_model, d_model, window_size)
                                   .padding(torch::kSame)));

        torch::NoGradGuard no_grad;
        torch::nn::init::kaiming_normal_(conv->weight, 0.0, torch::kFanIn, torch::kReLU);
        torch::nn::init::zeros_(conv->bias);
    }

    torch::Tensor ConvTransitionImpl::forward(const torch::Tensor &x) {
        // Conv1d works channels-first: [B, S, D] -> [B, D, S] and back
        const auto y = conv->forward(x.transpose(1, 2)).transpose(1, 2);
        return activation(y);
    }

    torch::Tensor ConvTransitionImpl::regularization_loss() const {
        return l2 * (conv->weight.square().sum() + conv->bias.square().sum());
    }

    torch::nn::AnyModule make_transition(const std::string &transition_type, const int64_t d_model,
                                         const TransitionArgs &args) {
        if (transition_type == "dot") {
            return torch::nn::AnyModule(TransformerTransition(d_model, args));
        }
        if (transition_type == "cnn") {
            return torch::nn::AnyModule(ConvTransition(d_model, args));
        }
        throw std::invalid_argument("Transformer transition " + transition_type + " is not implemented.");
    }
} // namespace Model

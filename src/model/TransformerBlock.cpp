#include "TransformerBlock.h"
#include "Utils.h"

#include <stdexcept>

namespace Model {
    TransformerBlockImpl::TransformerBlockImpl(const BlockArgs &args)
        : args(args) {
        if (args.residual_dropout < 0.0 || args.residual_dropout >= 1.0) {
            throw std::invalid_argument("TransformerBlock residual_dropout must be in [0, 1)");
        }
        if (args.attention_dropout < 0.0 || args.attention_dropout >= 1.0) {
            throw std::invalid_argument("TransformerBlock attention_dropout must be in [0, 1)");
        }

        // Resolve the transition first so an unknown type fails before anything else is built
        TransitionArgs transition_args;
        transition_args.activation = args.activation;
        transition_args.size_multiplier = args.size_multiplier;
        transition = make_transition(args.transition_type, args.d_model, transition_args);

        AttentionArgs attention_args;
        attention_args.d_model = args.d_model;
        attention_args.num_heads = args.num_heads;
        attention_args.use_masking = args.use_masking;
        attention_args.local_masking = args.local_masking;
        attention_args.compression_window_size = args.compression_window_size;
        attention_args.dropout = args.attention_dropout;

        attention = register_module(args.name + "_self_attention", MultiHeadSelfAttention(attention_args));
        norm1 = register_module(args.name + "_normalization1", LayerNormalization(args.d_model));
        norm2 = register_module(args.name + "_normalization2", LayerNormalization(args.d_model));
        register_module(args.name + "_transition", transition.ptr());

        if (args.residual_dropout > 0.0) {
            dropout = register_module(args.name + "_dropout", torch::nn::Dropout(args.residual_dropout));
        }
    }

    torch::Tensor TransformerBlockImpl::apply_dropout(const torch::Tensor &x) {
        if (dropout.is_empty()) {
            return x;
        }
        return dropout->forward(x);
    }

    torch::Tensor TransformerBlockImpl::forward(const torch::Tensor &x, const std::optional<torch::Tensor> &lengths) {
        check_sequence_input(x, args.d_model, "TransformerBlock " + args.name);

        const auto attended = attention->forward(x, lengths);
        const auto post_residual1 = args.vanilla_wiring
                                        ? x + apply_dropout(attended)
                                        : apply_dropout(x + attended);
        const auto norm1_output = norm1->forward(post_residual1);

        const auto transformed = transition.forward(norm1_output);
        const auto post_residual2 = args.vanilla_wiring
                                        ? norm1_output + apply_dropout(transformed)
                                        : apply_dropout(norm1_output + transformed);
        return norm2->forward(post_residual2);
    }

    torch::Tensor TransformerBlockImpl::call(const std::vector<torch::Tensor> &inputs) {
        const auto [input, lengths] = unpack_call_inputs(inputs, "TransformerBlock " + args.name);
        return forward(input, lengths);
    }

    torch::Tensor TransformerBlockImpl::regularization_loss() {
        if (args.transition_type == "cnn") {
            return transition.get<ConvTransition>()->regularization_loss();
        }
        return torch::zeros({}, norm1->gain.options());
    }
} // namespace Model

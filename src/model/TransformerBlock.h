#ifndef PONDER_TRANSFORMERBLOCK_H
#define PONDER_TRANSFORMERBLOCK_H

#include <optional>
#include <vector>
#include <torch/torch.h>
#include "ModelArgs.h"
#include "Attention.h"
#include "LayerNormalization.h"
#include "Transition.h"

namespace Model {
    /**
     * One section of both the Transformer and the Universal Transformer:
     *
     * - Multi-head self-attention (masked or unmasked, with attention dropout)
     * - Residual connection
     * - Dropout
     * - Layer normalization
     * - Transition function
     * - Residual connection
     * - Dropout
     * - Layer normalization
     *
     * By default dropout follows the Universal Transformer paper and is applied after
     * the residual add. vanilla_wiring=true restores the 2017 order, where dropout is
     * applied to each sub-layer output before it is added to the sub-layer input.
     */
    struct TransformerBlockImpl : torch::nn::Module {
        explicit TransformerBlockImpl(const BlockArgs &args);

        torch::Tensor forward(const torch::Tensor &x, const std::optional<torch::Tensor> &lengths = std::nullopt);

        // {input} or {input, lengths}
        torch::Tensor call(const std::vector<torch::Tensor> &inputs);

        // L2 penalty of a "cnn" transition, zero for "dot"
        torch::Tensor regularization_loss();

        MultiHeadSelfAttention attention{nullptr};
        LayerNormalization norm1{nullptr};
        LayerNormalization norm2{nullptr};
        torch::nn::AnyModule transition;
        torch::nn::Dropout dropout{nullptr}; // unset when residual_dropout == 0

        BlockArgs args;

    private:
        torch::Tensor apply_dropout(const torch::Tensor &x);
    };

    TORCH_MODULE (TransformerBlock);
} // namespace Model

#endif //PONDER_TRANSFORMERBLOCK_H

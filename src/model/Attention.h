#ifndef PONDER_ATTENTION_H
#define PONDER_ATTENTION_H

#include "ModelArgs.h"
#include <torch/torch.h>
#include <optional>

namespace Model {
    /**
     * Multi-head self-attention with optional causal masking, local (banded) causal
     * masking, key masking by sequence length and memory-compressed keys/values
     * ("Generating Wikipedia by Summarizing Long Sequences").
     */
    class MultiHeadSelfAttentionImpl : public torch::nn::Module {
    public:
        explicit MultiHeadSelfAttentionImpl(const AttentionArgs &args);

        torch::Tensor forward(
            const torch::Tensor &x,
            const std::optional<torch::Tensor> &lengths = std::nullopt
        );

        torch::Tensor qkv_weights; // [d_model, 3 * d_model]
        torch::Tensor output_weights; // [d_model, d_model]
        torch::Tensor key_compression; // [head_dim, head_dim, window], only with compression
        torch::Tensor value_compression;
        torch::nn::Dropout attn_dropout{nullptr};

        AttentionArgs args;

    private:
        torch::Tensor compress(const torch::Tensor &t, const torch::Tensor &kernel) const;

        torch::Tensor attention_mask(int64_t query_len, int64_t key_len,
                                     const std::optional<torch::Tensor> &lengths,
                                     const torch::Device &device) const;

        int64_t head_dim;
    };

    TORCH_MODULE (MultiHeadSelfAttention);
} // namespace Model

#endif //PONDER_ATTENTION_H

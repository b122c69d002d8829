#include "Attention.h"
#include "Utils.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace Model {
    MultiHeadSelfAttentionImpl::MultiHeadSelfAttentionImpl(const AttentionArgs &args)
        : args(args) {
        if (args.d_model <= 0 || args.num_heads <= 0) {
            throw std::invalid_argument("MultiHeadSelfAttention: d_model and num_heads must be positive");
        }
        if (args.d_model % args.num_heads != 0) {
            throw std::invalid_argument(
                "MultiHeadSelfAttention: d_model (" + std::to_string(args.d_model) +
                ") must be divisible by num_heads (" + std::to_string(args.num_heads) + ")");
        }
        if (args.dropout < 0.0 || args.dropout >= 1.0) {
            throw std::invalid_argument("MultiHeadSelfAttention: dropout must be in [0, 1)");
        }
        if (args.local_masking.has_value() && *args.local_masking < 1) {
            throw std::invalid_argument("MultiHeadSelfAttention: local_masking must be >= 1");
        }
        if (args.compression_window_size.has_value() && *args.compression_window_size < 1) {
            throw std::invalid_argument("MultiHeadSelfAttention: compression_window_size must be >= 1");
        }
        head_dim = args.d_model / args.num_heads;

        qkv_weights = register_parameter("qkv_weights", torch::empty({args.d_model, 3 * args.d_model}));
        output_weights = register_parameter("output_weights", torch::empty({args.d_model, args.d_model}));

        torch::NoGradGuard no_grad;
        torch::nn::init::xavier_uniform_(qkv_weights);
        torch::nn::init::xavier_uniform_(output_weights);

        if (args.compression_window_size.has_value()) {
            const auto window = *args.compression_window_size;
            key_compression = register_parameter("key_compression", torch::empty({head_dim, head_dim, window}));
            value_compression = register_parameter("value_compression", torch::empty({head_dim, head_dim, window}));
            torch::nn::init::xavier_uniform_(key_compression);
            torch::nn::init::xavier_uniform_(value_compression);
        }

        attn_dropout = register_module("attn_dropout", torch::nn::Dropout(args.dropout));
    }

    torch::Tensor MultiHeadSelfAttentionImpl::compress(const torch::Tensor &t, const torch::Tensor &kernel) const {
        // t: [B, H, S, D] -> strided conv over S, shared by all heads -> [B, H, S / window, D]
        const auto bsz = t.size(0);
        const auto n_heads = t.size(1);
        const auto seqlen = t.size(2);
        const auto window = *args.compression_window_size;
        if (seqlen < window) {
            throw std::invalid_argument(
                "MultiHeadSelfAttention: sequence length " + std::to_string(seqlen) +
                " is shorter than compression window " + std::to_string(window));
        }
        const auto flat = t.reshape({bsz * n_heads, seqlen, head_dim}).transpose(1, 2);
        const auto compressed = torch::conv1d(flat, kernel, {}, window);
        return compressed.transpose(1, 2).reshape({bsz, n_heads, -1, head_dim});
    }

    torch::Tensor MultiHeadSelfAttentionImpl::attention_mask(
        const int64_t query_len,
        const int64_t key_len,
        const std::optional<torch::Tensor> &lengths,
        const torch::Device &device
    ) const {
        // true where attention is allowed, broadcastable to [B, H, S_q, S_k]
        auto allowed = torch::ones({1, 1, query_len, key_len}, torch::dtype(torch::kBool).device(device));

        if (args.use_masking || args.local_masking.has_value()) {
            allowed = allowed.tril();
        }
        if (args.local_masking.has_value()) {
            // position i only sees j with i - window < j <= i
            allowed = allowed.triu(-(*args.local_masking - 1));
        }
        if (lengths.has_value()) {
            // a compressed key j summarizes positions [j * window, (j + 1) * window)
            const auto stride = args.compression_window_size.value_or(1);
            const auto flat = lengths->to(device).reshape({-1, 1}).to(torch::kLong);
            const auto key_start = torch::arange(key_len, flat.options()).unsqueeze(0) * stride;
            const auto key_valid = (key_start < flat).view({-1, 1, 1, key_len});
            allowed = allowed.logical_and(key_valid);
        }
        return allowed;
    }

    torch::Tensor MultiHeadSelfAttentionImpl::forward(
        const torch::Tensor &x,
        const std::optional<torch::Tensor> &lengths
    ) {
        check_sequence_input(x, args.d_model, "MultiHeadSelfAttention");
        const auto bsz = x.size(0);
        const auto seqlen = x.size(1);
        if (lengths.has_value() && lengths->numel() != bsz) {
            throw std::invalid_argument("MultiHeadSelfAttention: lengths must hold one entry per batch element");
        }

        const auto qkv = torch::matmul(x, qkv_weights).chunk(3, -1);
        auto split_heads = [&](const torch::Tensor &t) {
            // [B, S, d_model] -> [B, H, S, head_dim]
            return t.reshape({bsz, seqlen, args.num_heads, head_dim}).transpose(1, 2);
        };
        const auto q = split_heads(qkv[0]);
        auto k = split_heads(qkv[1]);
        auto v = split_heads(qkv[2]);

        if (args.compression_window_size.has_value()) {
            k = compress(k, key_compression);
            v = compress(v, value_compression);
        }

        auto scores = torch::matmul(q, k.transpose(-2, -1)) / std::sqrt(static_cast<double>(head_dim));
        const auto allowed = attention_mask(seqlen, k.size(2), lengths, x.device());
        scores = scores.masked_fill(allowed.logical_not(), -1e9);

        auto weights = torch::softmax(scores, -1);
        weights = attn_dropout->forward(weights);

        const auto output = torch::matmul(weights, v)
                .transpose(1, 2)
                .contiguous()
                .view({bsz, seqlen, args.d_model});
        return torch::matmul(output, output_weights);
    }
} // namespace Model

#ifndef PONDER_MODELARGS_H
#define PONDER_MODELARGS_H

#include <cstdint>
#include <optional>
#include <string>

namespace Model {
    struct NormArgs {
        int64_t axis = -1;
    };

    struct TransitionArgs {
        std::string activation = "gelu";
        int64_t size_multiplier = 4;
    };

    struct AttentionArgs {
        int64_t d_model = 512;
        int64_t num_heads = 8;
        bool use_masking = true;
        std::optional<int64_t> local_masking = std::nullopt;
        std::optional<int64_t> compression_window_size = std::nullopt;
        double dropout = 0.0;
    };

    struct BlockArgs {
        std::string name = "transformer";
        int64_t d_model = 512;
        int64_t num_heads = 8;
        std::string transition_type = "dot"; // "dot" or "cnn"
        double residual_dropout = 0.0;
        double attention_dropout = 0.0;
        std::string activation = "gelu";
        std::optional<int64_t> compression_window_size = std::nullopt;
        int64_t size_multiplier = 4;
        bool use_masking = true;
        std::optional<int64_t> local_masking = std::nullopt;
        bool vanilla_wiring = false;
    };

    struct ACTArgs {
        double halt_epsilon = 0.01;
        double time_penalty = 0.01;
        bool return_step = false;
        bool verbose = true; // print a line whenever control tensors are (re)initialized
    };

    struct EncoderArgs {
        BlockArgs block;
        int64_t depth = 6;
        bool act = true;
        bool share_weights = true; // false stacks `depth` independent blocks (2017 Transformer)
        ACTArgs act_args;
    };
}

#endif //PONDER_MODELARGS_H

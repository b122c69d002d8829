#ifndef PONDER_LAYERNORMALIZATION_H
#define PONDER_LAYERNORMALIZATION_H

#include <torch/torch.h>
#include "ModelArgs.h"

namespace Model {
    // Layer Normalization (https://arxiv.org/abs/1607.06450).
    // Same computation at training and test time.
    struct LayerNormalizationImpl : torch::nn::Module {
        static constexpr double eps = 1e-5;

        int64_t axis;
        torch::Tensor gain;
        torch::Tensor bias;

        explicit LayerNormalizationImpl(int64_t dim, const NormArgs &args = {});

        torch::Tensor forward(const torch::Tensor &x) const;
    };

    TORCH_MODULE(LayerNormalization);
} // namespace Model

#endif //PONDER_LAYERNORMALIZATION_H

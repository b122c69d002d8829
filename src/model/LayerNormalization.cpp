#include "LayerNormalization.h"

#include <stdexcept>
#include <string>

namespace Model {
    LayerNormalizationImpl::LayerNormalizationImpl(const int64_t dim, const NormArgs &args)
        : axis(args.axis) {
        if (dim <= 0) {
            throw std::invalid_argument("LayerNormalization dim must be positive, got " + std::to_string(dim));
        }
        gain = register_parameter("gain", torch::ones({dim}));
        bias = register_parameter("bias", torch::zeros({dim}));
    }

    torch::Tensor LayerNormalizationImpl::forward(const torch::Tensor &x) const {
        const auto mean = x.mean({axis}, true);
        const auto centered = x - mean;
        const auto variance = centered.square().mean({axis}, true);
        const auto normalized = centered / torch::sqrt(variance + eps);
        return gain * normalized + bias;
    }
} // namespace Model

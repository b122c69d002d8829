#ifndef PONDER_UNIVERSALTRANSFORMER_H
#define PONDER_UNIVERSALTRANSFORMER_H

#include <optional>
#include <vector>
#include <torch/torch.h>

#include "ModelArgs.h"
#include "TransformerACT.h"
#include "TransformerBlock.h"

namespace Model {
    // Encoder running a block `depth` times. With share_weights a single block is
    // reapplied (Universal Transformer), otherwise `depth` independent blocks are
    // stacked. With act the ACT-weighted sum of step outputs is returned.
    class UniversalTransformerImpl : public torch::nn::Module {
    public:
        explicit UniversalTransformerImpl(const EncoderArgs &args);

        torch::Tensor forward(const torch::Tensor &x, const std::optional<torch::Tensor> &lengths = std::nullopt);

        // Finalized ponder cost plus transition regularization, a scalar.
        torch::Tensor auxiliary_loss();

        EncoderArgs args;

        std::vector<TransformerBlock> blocks;
        TransformerACT act{nullptr};

        // From the last forward pass, only set when ACT is enabled
        torch::optional<torch::Tensor> last_ponder_cost;
        torch::optional<torch::Tensor> last_active_steps;
    };

    TORCH_MODULE (UniversalTransformer);
} // namespace Model

#endif //PONDER_UNIVERSALTRANSFORMER_H

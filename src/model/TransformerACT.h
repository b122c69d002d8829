#ifndef PONDER_TRANSFORMERACT_H
#define PONDER_TRANSFORMERACT_H

#include <optional>
#include <utility>
#include <vector>
#include <torch/torch.h>

#include "ModelArgs.h"

namespace Model {
    /**
     * Running control state of Adaptive Computation Time.
     * All tensors except weighted_output are shaped (batch, sequence_length).
     */
    struct ACTState {
        torch::Tensor halt_budget; // 1 - halt_epsilon minus all halting so far, may go negative
        torch::Tensor remainder; // 1 - halting so far, the weight of the step that exhausts the budget
        torch::Tensor active_steps; // number of steps each token took part in
        torch::Tensor weighted_output; // (batch, sequence_length, d_model)
        torch::Tensor ponder_cost; // (batch,), from the most recent step
        int64_t batch_size = -1;
        int64_t sequence_length = -1;

        [[nodiscard]] bool initialized() const { return halt_budget.defined(); }

        // Control tensors must be rebuilt when the input no longer matches their shape
        [[nodiscard]] bool matches(int64_t batch, int64_t seqlen) const {
            return initialized() && batch_size == batch && sequence_length == seqlen;
        }
    };

    struct ACTOutput {
        torch::Tensor output; // the step input, passed through unchanged
        torch::Tensor weighted_output; // running weighted sum over steps
        torch::Tensor ponder_cost; // (batch,)
        torch::Tensor active_steps; // (batch, sequence_length)
        torch::Tensor halting_weight; // weight applied to this step, (batch, sequence_length)

        // [output, weighted_output, ponder_cost] and active_steps when return_step is set
        [[nodiscard]] std::vector<torch::Tensor> to_list(bool return_step) const;
    };

    // Fresh control state for a (batch, sequence_length) halting tensor.
    ACTState init_act_state(const torch::Tensor &halting, const ACTArgs &args);

    /**
     * One ACT step. `halting` is the sigmoid halting unit output (batch, sequence_length),
     * `input` the block output of this step. Pure: the caller owns the returned state.
     */
    std::pair<ACTState, ACTOutput> act_step(
        ACTState state,
        const torch::Tensor &halting,
        const torch::Tensor &input,
        const std::optional<torch::Tensor> &lengths,
        const ACTArgs &args
    );

    /**
     * Adaptive Computation Time (https://arxiv.org/abs/1603.08983) for the Transformer.
     *
     *     auto block = TransformerBlock(block_args);
     *     auto act = TransformerACT(d_model);
     *     auto next = input; // (batch_size, sequence_length, d_model)
     *     torch::Tensor result;
     *     for (int64_t i = 0; i < depth; ++i) {
     *         auto out = act->forward(block->forward(next));
     *         next = out.output;
     *         result = out.weighted_output;
     *     }
     *     act->finalize(); // ponder cost becomes the auxiliary loss
     *
     * Calls on one instance must happen in order of increasing depth.
     */
    class TransformerACTImpl : public torch::nn::Module {
    public:
        explicit TransformerACTImpl(int64_t d_model, const ACTArgs &args = {});

        ACTOutput forward(const torch::Tensor &input, const std::optional<torch::Tensor> &lengths = std::nullopt);

        // {input} or {input, lengths}; returns 3 tensors, or 4 with return_step
        std::vector<torch::Tensor> call(const std::vector<torch::Tensor> &inputs);

        // sigmoid(input @ halting_kernel + halting_biases) shaped (batch, sequence_length)
        torch::Tensor halting_probability(const torch::Tensor &input) const;

        // Registers the most recent ponder cost (mean over the batch) as the auxiliary loss.
        void finalize();

        // Drops all control state; the next call starts a new sequence of steps silently.
        void reset();

        [[nodiscard]] const ACTState &state() const { return state_; }

        ACTArgs args;
        int64_t d_model;
        torch::optional<torch::Tensor> ponder_loss;

        torch::Tensor halting_kernel; // [d_model, 1]
        torch::Tensor halting_biases; // [1]

    private:
        ACTState state_;
        // shape of the last "init control tensors" line, kept across reset()
        int64_t logged_batch_size_ = -1;
        int64_t logged_sequence_length_ = -1;
    };

    TORCH_MODULE (TransformerACT);
} // namespace Model

#endif //PONDER_TRANSFORMERACT_H

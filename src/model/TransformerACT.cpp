#include "TransformerACT.h"
#include "Utils.h"

#include <iostream>
#include <stdexcept>

namespace Model {
    std::vector<torch::Tensor> ACTOutput::to_list(const bool return_step) const {
        if (return_step) {
            return {output, weighted_output, ponder_cost, active_steps};
        }
        return {output, weighted_output, ponder_cost};
    }

    ACTState init_act_state(const torch::Tensor &halting, const ACTArgs &args) {
        ACTState state;
        state.remainder = torch::ones_like(halting);
        state.active_steps = torch::zeros_like(halting);
        state.halt_budget = torch::ones_like(halting) - args.halt_epsilon;
        state.batch_size = halting.size(0);
        state.sequence_length = halting.size(1);
        return state;
    }

    std::pair<ACTState, ACTOutput> act_step(
        ACTState state,
        const torch::Tensor &halting,
        const torch::Tensor &input,
        const std::optional<torch::Tensor> &lengths,
        const ACTArgs &args
    ) {
        TORCH_CHECK(input.dim() == 3, "ACT input must be (batch, sequence_length, d_model)");
        const auto batch_size = input.size(0);
        const auto seqlen = input.size(1);
        TORCH_CHECK(halting.dim() == 2 && halting.size(0) == batch_size && halting.size(1) == seqlen,
                    "halting must be shaped (batch, sequence_length)");

        if (!state.matches(batch_size, seqlen)) {
            auto fresh = init_act_state(halting, args);
            fresh.weighted_output = std::move(state.weighted_output);
            state = std::move(fresh);
        }

        const auto step_is_active = state.halt_budget > 0;
        const auto no_further_steps = (state.halt_budget - halting) <= 0;

        // Weight of this step:
        // a. the halting output while the token still has budget left after it,
        // b. the remainder on the step that exhausts the budget,
        // c. zero once the token has halted.
        const auto halting_weight = torch::where(
            step_is_active,
            torch::where(no_further_steps, state.remainder, halting),
            torch::zeros_like(halting));

        state.active_steps = state.active_steps + step_is_active.to(halting.scalar_type());

        // padding never accrues cost
        state.remainder = mask_length_if_provided(state.remainder, lengths);
        state.active_steps = mask_length_if_provided(state.active_steps, lengths);

        // Which step is the last one is unknown, so the cost is recomputed on every call
        state.ponder_cost = args.time_penalty * (state.remainder + state.active_steps).mean(1);

        state.remainder = torch::where(no_further_steps, state.remainder, state.remainder - halting);
        state.halt_budget = state.halt_budget - halting; // OK to become negative

        // Skip the multiply entirely once no token in the batch is active
        torch::Tensor step_weighted_output;
        if (step_is_active.any().item<bool>()) {
            step_weighted_output = halting_weight.unsqueeze(-1) * input;
        } else {
            step_weighted_output = torch::zeros_like(input);
        }

        if (!state.weighted_output.defined() || state.weighted_output.sizes() != input.sizes()) {
            state.weighted_output = step_weighted_output;
        } else {
            state.weighted_output = state.weighted_output + step_weighted_output;
        }

        ACTOutput output{input, state.weighted_output, state.ponder_cost, state.active_steps, halting_weight};
        return {std::move(state), std::move(output)};
    }

    TransformerACTImpl::TransformerACTImpl(const int64_t d_model, const ACTArgs &args)
        : args(args),
          d_model(d_model) {
        if (d_model <= 0) {
            throw std::invalid_argument("TransformerACT d_model must be positive");
        }
        if (args.halt_epsilon <= 0.0) {
            throw std::invalid_argument("TransformerACT halt_epsilon must be > 0");
        }
        if (args.time_penalty < 0.0) {
            throw std::invalid_argument("TransformerACT time_penalty must be >= 0");
        }

        halting_kernel = register_parameter("halting_kernel", torch::empty({d_model, 1}));
        halting_biases = register_parameter("halting_biases", torch::full({1}, 0.1));

        torch::NoGradGuard no_grad;
        torch::nn::init::xavier_uniform_(halting_kernel);
    }

    torch::Tensor TransformerACTImpl::halting_probability(const torch::Tensor &input) const {
        const auto seqlen = input.size(1);
        const auto logits = torch::matmul(input.reshape({-1, d_model}), halting_kernel) + halting_biases;
        return torch::sigmoid(logits.view({-1, seqlen}));
    }

    ACTOutput TransformerACTImpl::forward(const torch::Tensor &input, const std::optional<torch::Tensor> &lengths) {
        check_sequence_input(input, d_model, "TransformerACT");
        if (lengths.has_value() && lengths->numel() != input.size(0)) {
            throw std::invalid_argument("TransformerACT: lengths must hold one entry per batch element");
        }

        const auto halting = halting_probability(input);
        if (args.verbose && (logged_batch_size_ != input.size(0) || logged_sequence_length_ != input.size(1))) {
            std::cout << "init control tensors " << halting.sizes() << std::endl;
            logged_batch_size_ = input.size(0);
            logged_sequence_length_ = input.size(1);
        }

        auto [next_state, output] = act_step(std::move(state_), halting, input, lengths, args);
        state_ = std::move(next_state);
        return output;
    }

    std::vector<torch::Tensor> TransformerACTImpl::call(const std::vector<torch::Tensor> &inputs) {
        const auto [input, lengths] = unpack_call_inputs(inputs, "TransformerACT");
        return forward(input, lengths).to_list(args.return_step);
    }

    void TransformerACTImpl::finalize() {
        if (!state_.ponder_cost.defined()) {
            throw std::logic_error("TransformerACT::finalize called before any step");
        }
        ponder_loss = state_.ponder_cost.mean();
    }

    void TransformerACTImpl::reset() {
        state_ = ACTState{};
        ponder_loss = torch::nullopt;
    }
} // namespace Model

#include "UniversalTransformer.h"

#include <stdexcept>
#include <string>

namespace Model {
    UniversalTransformerImpl::UniversalTransformerImpl(const EncoderArgs &args) : args(args) {
        if (args.depth < 1) {
            throw std::invalid_argument("UniversalTransformer depth must be >= 1, got " + std::to_string(args.depth));
        }

        if (args.share_weights) {
            blocks.push_back(register_module(args.block.name, TransformerBlock(args.block)));
        } else {
            for (int64_t i = 0; i < args.depth; ++i) {
                auto block_args = args.block;
                block_args.name = args.block.name + "_" + std::to_string(i);
                blocks.push_back(register_module(block_args.name, TransformerBlock(block_args)));
            }
        }

        if (args.act) {
            act = register_module("act", TransformerACT(args.block.d_model, args.act_args));
        }
    }

    torch::Tensor UniversalTransformerImpl::forward(const torch::Tensor &x, const std::optional<torch::Tensor> &lengths) {
        if (!act.is_empty()) {
            act->reset();
        }
        last_ponder_cost = torch::nullopt;
        last_active_steps = torch::nullopt;

        auto next = x;
        torch::Tensor weighted_output;
        for (int64_t step = 0; step < args.depth; ++step) {
            auto &block = args.share_weights ? blocks.front() : blocks[step];
            next = block->forward(next, lengths);
            if (!act.is_empty()) {
                auto out = act->forward(next, lengths);
                next = out.output;
                weighted_output = out.weighted_output;
                last_ponder_cost = out.ponder_cost;
                last_active_steps = out.active_steps;
            }
        }

        if (act.is_empty()) {
            return next;
        }
        act->finalize();
        return weighted_output;
    }

    torch::Tensor UniversalTransformerImpl::auxiliary_loss() {
        auto total = torch::zeros({}, blocks.front()->norm1->gain.options());
        if (!act.is_empty() && act->ponder_loss.has_value()) {
            total = total + act->ponder_loss.value();
        }
        for (auto &block: blocks) {
            total = total + block->regularization_loss();
        }
        return total;
    }
} // namespace Model

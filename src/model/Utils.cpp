#include "Utils.h"

#include <stdexcept>

namespace Model {
    CallInputs unpack_call_inputs(const std::vector<torch::Tensor> &inputs, const std::string &layer_name) {
        CallInputs result;
        if (inputs.size() == 2) {
            // called with input and lengths
            result.input = inputs[0];
            result.lengths = inputs[1];
        } else if (inputs.size() == 1 && inputs[0].defined() && inputs[0].dim() == 3) {
            // called with tensor (batch, seq_len, d_model)
            result.input = inputs[0];
        } else {
            throw std::invalid_argument(
                layer_name + ": you must call this layer passing either a list of two tensors "
                "(for input and lengths), or a single input tensor");
        }
        if (!result.input.defined() || result.input.dim() != 3) {
            throw std::invalid_argument(layer_name + ": input must be a 3D tensor (batch, sequence_length, d_model)");
        }
        if (result.lengths.has_value() && !result.lengths->defined()) {
            result.lengths = std::nullopt;
        }
        return result;
    }

    void check_sequence_input(const torch::Tensor &x, const int64_t d_model, const std::string &layer_name) {
        if (!x.defined() || x.dim() != 3) {
            throw std::invalid_argument(layer_name + ": input must be a 3D tensor (batch, sequence_length, d_model)");
        }
        if (x.size(-1) != d_model) {
            throw std::invalid_argument(
                layer_name + ": expected last dimension " + std::to_string(d_model) +
                ", got " + std::to_string(x.size(-1)));
        }
    }

    torch::Tensor sequence_mask(const torch::Tensor &lengths, const int64_t maxlen) {
        TORCH_CHECK(lengths.dim() == 1 || (lengths.dim() == 2 && lengths.size(1) == 1),
                    "lengths must be shaped (batch,) or (batch, 1)");
        const auto flat = lengths.reshape({-1, 1}).to(torch::kLong);
        const auto positions = torch::arange(maxlen, flat.options()).unsqueeze(0);
        return positions < flat;
    }

    torch::Tensor mask_length_if_provided(const torch::Tensor &x, const std::optional<torch::Tensor> &lengths) {
        if (!lengths.has_value()) {
            return x;
        }
        const auto mask = sequence_mask(lengths->to(x.device()), x.size(1));
        TORCH_CHECK(mask.size(0) == x.size(0), "lengths batch size does not match input batch size");
        return x * mask.to(x.scalar_type());
    }
} // namespace Model

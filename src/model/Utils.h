#ifndef PONDER_UTILS_H
#define PONDER_UTILS_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <torch/torch.h>

namespace Model {
    // Input tensor plus optional per-example valid lengths.
    struct CallInputs {
        torch::Tensor input;
        std::optional<torch::Tensor> lengths;
    };

    /**
     * Accepts either {input, lengths} or {input} with a 3D input of shape
     * (batch, sequence_length, d_model). Anything else throws std::invalid_argument.
     */
    CallInputs unpack_call_inputs(const std::vector<torch::Tensor> &inputs, const std::string &layer_name);

    // Throws std::invalid_argument unless x is (batch, sequence_length, d_model).
    void check_sequence_input(const torch::Tensor &x, int64_t d_model, const std::string &layer_name);

    // Boolean mask of shape (batch, maxlen), true where position < length.
    // Lengths may be shaped (batch,) or (batch, 1).
    torch::Tensor sequence_mask(const torch::Tensor &lengths, int64_t maxlen);

    // Zeroes positions of a (batch, sequence_length) tensor beyond each length. No-op without lengths.
    torch::Tensor mask_length_if_provided(const torch::Tensor &x, const std::optional<torch::Tensor> &lengths);
} // namespace Model

#endif //PONDER_UTILS_H

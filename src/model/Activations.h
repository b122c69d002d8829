#ifndef PONDER_ACTIVATIONS_H
#define PONDER_ACTIVATIONS_H

#include <functional>
#include <string>
#include <torch/torch.h>

namespace Model {
    using Activation = std::function<torch::Tensor(const torch::Tensor &)>;

    /**
     * GELU activation, tanh approximation from "Gaussian Error Linear Units (GELUs)".
     * 0.5 * x * (1 + tanh(sqrt(2 / pi) * (x + 0.044715 * x^3)))
     */
    torch::Tensor gelu(const torch::Tensor &x);

    torch::Tensor linear(const torch::Tensor &x);

    // Looks the name up in the process-wide registry, throws std::invalid_argument if unknown.
    Activation get_activation(const std::string &name);
} // namespace Model

#endif //PONDER_ACTIVATIONS_H

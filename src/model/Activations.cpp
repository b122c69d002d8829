#include "Activations.h"
#include "Registry.h"

#include <cmath>
#include <numbers>

namespace Model {
    torch::Tensor gelu(const torch::Tensor &x) {
        const double c = std::sqrt(2.0 / std::numbers::pi);
        return 0.5 * x * (1.0 + torch::tanh(c * (x + 0.044715 * torch::pow(x, 3))));
    }

    torch::Tensor linear(const torch::Tensor &x) {
        return x;
    }

    Activation get_activation(const std::string &name) {
        return Registry::instance().activation(name);
    }
} // namespace Model

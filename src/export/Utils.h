#ifndef PONDER_EXPORT_UTILS_H
#define PONDER_EXPORT_UTILS_H

#include <cstdint>
#include <vector>
#include <torch/torch.h>

namespace Export {
    // Appends the tensor as contiguous CPU float32 bytes, returns the byte offset it starts at.
    size_t serialize_fp32(std::vector<uint8_t> &out, const torch::Tensor &tensor);
} // namespace Export

#endif //PONDER_EXPORT_UTILS_H

#include "Utils.h"
#include <cstring>

namespace Export {
    size_t serialize_fp32(std::vector<uint8_t> &out, const torch::Tensor &tensor) {
        torch::Tensor t = tensor.detach();
        if (t.device().type() != torch::kCPU) t = t.cpu();
        if (t.dtype() != torch::kFloat32) t = t.to(torch::kFloat32);
        if (!t.is_contiguous()) t = t.contiguous();

        const size_t offset = out.size();
        const auto num_bytes = static_cast<size_t>(t.numel()) * sizeof(float);
        out.resize(offset + num_bytes);
        if (num_bytes > 0) {
            std::memcpy(out.data() + offset, t.data_ptr<float>(), num_bytes);
        }
        return offset;
    }
} // namespace Export

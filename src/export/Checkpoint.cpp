#include "Checkpoint.h"
#include "Utils.h"

#include <iostream>
#include <stdexcept>
#include <vector>

#define SAFETENSORS_CPP_IMPLEMENTATION
#include <safetensors.hh>

using json = nlohmann::json;

namespace Export {
    // Helper to map safetensors data types to torch::ScalarType
    static torch::ScalarType get_dtype(const safetensors::dtype type) {
        switch (type) {
            case safetensors::dtype::kFLOAT32: return torch::kFloat32;
            case safetensors::dtype::kFLOAT16: return torch::kFloat16;
            case safetensors::dtype::kBFLOAT16: return torch::kBFloat16;
            case safetensors::dtype::kFLOAT64: return torch::kFloat64;
            default: throw std::runtime_error("Unsupported safetensors dtype");
        }
    }

    void save_checkpoint(const torch::nn::Module &module, const std::string &path, const json &config) {
        safetensors::safetensors_t st;

        for (const auto &k_v: module.named_parameters(true)) {
            const std::string &name = k_v.key();
            const torch::Tensor &param = k_v.value();

            safetensors::tensor_t tensor_info;
            tensor_info.dtype = safetensors::dtype::kFLOAT32;
            for (const auto d: param.sizes()) {
                tensor_info.shape.push_back(static_cast<size_t>(d));
            }
            const size_t begin = serialize_fp32(st.storage, param);
            tensor_info.data_offsets[0] = begin;
            tensor_info.data_offsets[1] = st.storage.size();
            st.tensors.insert(name, tensor_info);
        }
        st.metadata.insert("config", config.dump());

        std::string warn, err;
        if (!safetensors::save_to_file(st, path, &warn, &err)) {
            throw std::runtime_error("Failed to save safetensors file " + path + ": " + err);
        }
        if (!warn.empty()) {
            std::cerr << "Warning: " << warn << std::endl;
        }
    }

    Checkpoint load_checkpoint(const std::string &path) {
        std::string warn, err;
        safetensors::safetensors_t st;

        if (!safetensors::load_from_file(path, &st, &warn, &err)) {
            throw std::runtime_error("Failed to load safetensors file " + path + ": " + err);
        }

        Checkpoint checkpoint;
        uint8_t *base_ptr = st.storage.data();

        for (const std::vector<std::string> &keys = st.tensors.keys(); const auto &name: keys) {
            safetensors::tensor_t tensor_info;
            st.tensors.at(name, &tensor_info);

            std::vector<int64_t> sizes;
            sizes.reserve(tensor_info.shape.size());
            for (const auto d: tensor_info.shape) {
                sizes.push_back(static_cast<int64_t>(d));
            }

            auto options = torch::TensorOptions().dtype(get_dtype(tensor_info.dtype));
            const auto data_ptr = static_cast<void *>(base_ptr + tensor_info.data_offsets[0]);

            // clone: the blob is owned by st and released on return
            checkpoint.tensors[name] = torch::from_blob(data_ptr, sizes, options).clone();
        }

        std::string config_text;
        if (st.metadata.at("config", &config_text)) {
            checkpoint.config = json::parse(config_text);
        } else {
            checkpoint.config = json::object();
        }
        return checkpoint;
    }

    json load_into(torch::nn::Module &module, const std::string &path) {
        auto checkpoint = load_checkpoint(path);

        torch::NoGradGuard no_grad;
        for (auto &k_v: module.named_parameters(true)) {
            const std::string &key = k_v.key();
            auto &param = k_v.value();

            const auto it = checkpoint.tensors.find(key);
            if (it == checkpoint.tensors.end()) {
                throw std::runtime_error("Checkpoint " + path + " is missing key " + key);
            }
            if (it->second.sizes() != param.sizes()) {
                throw std::runtime_error("Checkpoint " + path + " has a shape mismatch for " + key);
            }
            param.set_data(it->second.to(param.options()));
        }
        return checkpoint.config;
    }
} // namespace Export

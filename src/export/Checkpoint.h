#ifndef PONDER_CHECKPOINT_H
#define PONDER_CHECKPOINT_H

#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include <torch/torch.h>

namespace Export {
    struct Checkpoint {
        std::map<std::string, torch::Tensor> tensors;
        nlohmann::json config;
    };

    /**
     * Writes every named parameter of the module as float32 into a .safetensors file.
     * The config is stored as JSON text under the "config" metadata key.
     */
    void save_checkpoint(const torch::nn::Module &module, const std::string &path,
                         const nlohmann::json &config = nlohmann::json::object());

    Checkpoint load_checkpoint(const std::string &path);

    /**
     * Copies the checkpoint tensors into the module parameters of the same name.
     * Throws std::runtime_error on missing keys or shape mismatches. Returns the stored config.
     */
    nlohmann::json load_into(torch::nn::Module &module, const std::string &path);
} // namespace Export

#endif //PONDER_CHECKPOINT_H

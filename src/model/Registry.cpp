#include "Registry.h"

#include "Attention.h"
#include "Config.h"
#include "LayerNormalization.h"
#include "Transition.h"
#include "TransformerACT.h"
#include "TransformerBlock.h"
#include "UniversalTransformer.h"

#include <stdexcept>
#include <utility>

using json = nlohmann::json;

namespace Model {
    Registry &Registry::instance() {
        static Registry registry;
        return registry;
    }

    Registry::Registry() {
        register_builtins();
    }

    void Registry::register_builtins() {
        activations_["gelu"] = gelu;
        activations_["linear"] = linear;
        activations_["relu"] = [](const torch::Tensor &x) { return torch::relu(x); };
        activations_["tanh"] = [](const torch::Tensor &x) { return torch::tanh(x); };
        activations_["sigmoid"] = [](const torch::Tensor &x) { return torch::sigmoid(x); };

        // Components sized by the input take d_model from the config
        modules_["LayerNormalization"] = [](const json &config) -> std::shared_ptr<torch::nn::Module> {
            return LayerNormalization(config.at("d_model").get<int64_t>(), config.get<NormArgs>()).ptr();
        };
        modules_["TransformerTransition"] = [](const json &config) -> std::shared_ptr<torch::nn::Module> {
            return TransformerTransition(config.at("d_model").get<int64_t>(), config.get<TransitionArgs>()).ptr();
        };
        modules_["ConvTransition"] = [](const json &config) -> std::shared_ptr<torch::nn::Module> {
            return ConvTransition(config.at("d_model").get<int64_t>(), config.get<TransitionArgs>()).ptr();
        };
        modules_["TransformerACT"] = [](const json &config) -> std::shared_ptr<torch::nn::Module> {
            return TransformerACT(config.at("d_model").get<int64_t>(), config.get<ACTArgs>()).ptr();
        };
        modules_["MultiHeadSelfAttention"] = [](const json &config) -> std::shared_ptr<torch::nn::Module> {
            return MultiHeadSelfAttention(config.get<AttentionArgs>()).ptr();
        };
        modules_["TransformerBlock"] = [](const json &config) -> std::shared_ptr<torch::nn::Module> {
            return TransformerBlock(config.get<BlockArgs>()).ptr();
        };
        modules_["UniversalTransformer"] = [](const json &config) -> std::shared_ptr<torch::nn::Module> {
            return UniversalTransformer(config.get<EncoderArgs>()).ptr();
        };
    }

    void Registry::add_module(const std::string &name, ModuleFactory factory) {
        std::lock_guard lock(mutex_);
        modules_[name] = std::move(factory);
    }

    void Registry::add_activation(const std::string &name, Activation activation) {
        std::lock_guard lock(mutex_);
        activations_[name] = std::move(activation);
    }

    std::shared_ptr<torch::nn::Module> Registry::create(const std::string &name, const json &config) const {
        ModuleFactory factory;
        {
            std::lock_guard lock(mutex_);
            const auto it = modules_.find(name);
            if (it == modules_.end()) {
                throw std::invalid_argument("Unknown component: " + name);
            }
            factory = it->second;
        }
        return factory(config);
    }

    Activation Registry::activation(const std::string &name) const {
        std::lock_guard lock(mutex_);
        const auto it = activations_.find(name);
        if (it == activations_.end()) {
            throw std::invalid_argument("Unknown activation function: " + name);
        }
        return it->second;
    }

    bool Registry::has_module(const std::string &name) const {
        std::lock_guard lock(mutex_);
        return modules_.contains(name);
    }

    bool Registry::has_activation(const std::string &name) const {
        std::lock_guard lock(mutex_);
        return activations_.contains(name);
    }

    std::vector<std::string> Registry::module_names() const {
        std::lock_guard lock(mutex_);
        std::vector<std::string> names;
        names.reserve(modules_.size());
        for (const auto &[name, factory]: modules_) {
            names.push_back(name);
        }
        return names;
    }
} // namespace Model

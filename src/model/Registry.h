#ifndef PONDER_REGISTRY_H
#define PONDER_REGISTRY_H

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <torch/torch.h>

#include "Activations.h"

namespace Model {
    using ModuleFactory = std::function<std::shared_ptr<torch::nn::Module>(const nlohmann::json &config)>;

    /**
     * Process-wide lookup table of named components, used to rebuild modules from
     * saved configurations. Built-in components and activations are registered once,
     * the first time the registry is used.
     */
    class Registry {
    public:
        static Registry &instance();

        // Adding an existing name replaces the previous entry.
        void add_module(const std::string &name, ModuleFactory factory);

        void add_activation(const std::string &name, Activation activation);

        // Throws std::invalid_argument for unknown names.
        [[nodiscard]] std::shared_ptr<torch::nn::Module> create(const std::string &name,
                                                                const nlohmann::json &config) const;

        template<typename ModuleType>
        [[nodiscard]] std::shared_ptr<ModuleType> create_as(const std::string &name,
                                                            const nlohmann::json &config) const {
            auto module = std::dynamic_pointer_cast<ModuleType>(create(name, config));
            if (!module) {
                throw std::invalid_argument("Component " + name + " does not have the requested type");
            }
            return module;
        }

        [[nodiscard]] Activation activation(const std::string &name) const;

        [[nodiscard]] bool has_module(const std::string &name) const;

        [[nodiscard]] bool has_activation(const std::string &name) const;

        [[nodiscard]] std::vector<std::string> module_names() const;

        Registry(const Registry &) = delete;

        Registry &operator=(const Registry &) = delete;

    private:
        Registry();

        void register_builtins();

        mutable std::mutex mutex_;
        std::map<std::string, ModuleFactory> modules_;
        std::map<std::string, Activation> activations_;
    };
} // namespace Model

#endif //PONDER_REGISTRY_H

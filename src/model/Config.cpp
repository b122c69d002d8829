#include "Config.h"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace Model {
    namespace {
        json optional_to_json(const std::optional<int64_t> &value) {
            return value.has_value() ? json(*value) : json(nullptr);
        }

        std::optional<int64_t> optional_from_json(const json &j, const char *key,
                                                  const std::optional<int64_t> &fallback) {
            if (!j.contains(key)) {
                return fallback;
            }
            if (j.at(key).is_null()) {
                return std::nullopt;
            }
            return j.at(key).get<int64_t>();
        }
    } // namespace

    void to_json(json &j, const NormArgs &args) {
        j = json{{"axis", args.axis}};
    }

    void from_json(const json &j, NormArgs &args) {
        args.axis = j.value("axis", args.axis);
    }

    void to_json(json &j, const TransitionArgs &args) {
        j = json{
            {"activation", args.activation},
            {"size_multiplier", args.size_multiplier}
        };
    }

    void from_json(const json &j, TransitionArgs &args) {
        args.activation = j.value("activation", args.activation);
        args.size_multiplier = j.value("size_multiplier", args.size_multiplier);
    }

    void to_json(json &j, const AttentionArgs &args) {
        j = json{
            {"d_model", args.d_model},
            {"num_heads", args.num_heads},
            {"use_masking", args.use_masking},
            {"local_masking", optional_to_json(args.local_masking)},
            {"compression_window_size", optional_to_json(args.compression_window_size)},
            {"dropout", args.dropout}
        };
    }

    void from_json(const json &j, AttentionArgs &args) {
        args.d_model = j.value("d_model", args.d_model);
        args.num_heads = j.value("num_heads", args.num_heads);
        args.use_masking = j.value("use_masking", args.use_masking);
        args.local_masking = optional_from_json(j, "local_masking", args.local_masking);
        args.compression_window_size = optional_from_json(j, "compression_window_size", args.compression_window_size);
        args.dropout = j.value("dropout", args.dropout);
    }

    void to_json(json &j, const BlockArgs &args) {
        j = json{
            {"name", args.name},
            {"d_model", args.d_model},
            {"num_heads", args.num_heads},
            {"transition_type", args.transition_type},
            {"residual_dropout", args.residual_dropout},
            {"attention_dropout", args.attention_dropout},
            {"activation", args.activation},
            {"compression_window_size", optional_to_json(args.compression_window_size)},
            {"size_multiplier", args.size_multiplier},
            {"use_masking", args.use_masking},
            {"local_masking", optional_to_json(args.local_masking)},
            {"vanilla_wiring", args.vanilla_wiring}
        };
    }

    void from_json(const json &j, BlockArgs &args) {
        args.name = j.value("name", args.name);
        args.d_model = j.value("d_model", args.d_model);
        args.num_heads = j.value("num_heads", args.num_heads);
        args.transition_type = j.value("transition_type", args.transition_type);
        args.residual_dropout = j.value("residual_dropout", args.residual_dropout);
        args.attention_dropout = j.value("attention_dropout", args.attention_dropout);
        args.activation = j.value("activation", args.activation);
        args.compression_window_size = optional_from_json(j, "compression_window_size", args.compression_window_size);
        args.size_multiplier = j.value("size_multiplier", args.size_multiplier);
        args.use_masking = j.value("use_masking", args.use_masking);
        args.local_masking = optional_from_json(j, "local_masking", args.local_masking);
        args.vanilla_wiring = j.value("vanilla_wiring", args.vanilla_wiring);
    }

    void to_json(json &j, const ACTArgs &args) {
        j = json{
            {"halt_epsilon", args.halt_epsilon},
            {"time_penalty", args.time_penalty},
            {"return_step", args.return_step},
            {"verbose", args.verbose}
        };
    }

    void from_json(const json &j, ACTArgs &args) {
        args.halt_epsilon = j.value("halt_epsilon", args.halt_epsilon);
        args.time_penalty = j.value("time_penalty", args.time_penalty);
        args.return_step = j.value("return_step", args.return_step);
        args.verbose = j.value("verbose", args.verbose);
    }

    void to_json(json &j, const EncoderArgs &args) {
        j = json{
            {"block", args.block},
            {"depth", args.depth},
            {"act", args.act},
            {"share_weights", args.share_weights},
            {"act_options", args.act_args}
        };
    }

    void from_json(const json &j, EncoderArgs &args) {
        if (j.contains("block")) {
            from_json(j.at("block"), args.block);
        }
        args.depth = j.value("depth", args.depth);
        args.act = j.value("act", args.act);
        args.share_weights = j.value("share_weights", args.share_weights);
        if (j.contains("act_options")) {
            from_json(j.at("act_options"), args.act_args);
        }
    }

    EncoderArgs load_encoder_args(const std::string &path) {
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open config file " + path);
        }
        json config;
        f >> config;

        EncoderArgs args;
        from_json(config, args);
        return args;
    }
} // namespace Model

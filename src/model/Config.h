#ifndef PONDER_CONFIG_H
#define PONDER_CONFIG_H

#include <string>
#include <nlohmann/json.hpp>

#include "ModelArgs.h"

namespace Model {
    // JSON (de)serialization of every options struct. Missing keys keep their
    // defaults and null optional integers mean "none".
    void to_json(nlohmann::json &j, const NormArgs &args);
    void from_json(const nlohmann::json &j, NormArgs &args);

    void to_json(nlohmann::json &j, const TransitionArgs &args);
    void from_json(const nlohmann::json &j, TransitionArgs &args);

    void to_json(nlohmann::json &j, const AttentionArgs &args);
    void from_json(const nlohmann::json &j, AttentionArgs &args);

    void to_json(nlohmann::json &j, const BlockArgs &args);
    void from_json(const nlohmann::json &j, BlockArgs &args);

    void to_json(nlohmann::json &j, const ACTArgs &args);
    void from_json(const nlohmann::json &j, ACTArgs &args);

    void to_json(nlohmann::json &j, const EncoderArgs &args);
    void from_json(const nlohmann::json &j, EncoderArgs &args);

    // Reads an EncoderArgs JSON document from disk, throws std::runtime_error if unreadable.
    EncoderArgs load_encoder_args(const std::string &path);
} // namespace Model

#endif //PONDER_CONFIG_H

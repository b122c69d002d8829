#include <iostream>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <torch/torch.h>

#include <export/Checkpoint.h>
#include <model/Config.h>
#include <model/UniversalTransformer.h>

int main(const int argc, char **argv) {
    CLI::App app{"Ponder - Universal Transformer encoder with Adaptive Computation Time"};

    Model::EncoderArgs args;
    args.block.name = "universal";
    args.block.d_model = 16;
    args.block.num_heads = 2;
    args.depth = 3;

    int64_t batch = 2;
    int64_t seq_len = 5;
    uint64_t seed = 0;
    bool vanilla = false;
    bool no_act = false;
    bool stack = false;
    std::string config_path;
    std::string save_path;

    app.add_option("--config", config_path, "JSON file with encoder options, overrides the flags below")
            ->check(CLI::ExistingFile);
    app.add_option("--d-model", args.block.d_model, "Model dimension")->capture_default_str();
    app.add_option("--heads", args.block.num_heads, "Number of attention heads")->capture_default_str();
    app.add_option("--depth", args.depth, "Number of block applications")->capture_default_str();
    app.add_option("--transition", args.block.transition_type, "Transition function: dot, cnn")
            ->check(CLI::IsMember({"dot", "cnn"}))
            ->capture_default_str();
    app.add_option("--batch", batch, "Batch size")->capture_default_str();
    app.add_option("--seq-len", seq_len, "Sequence length")->capture_default_str();
    app.add_option("--seed", seed, "Random seed")->capture_default_str();
    app.add_flag("--vanilla", vanilla, "Use the 2017 Transformer residual/dropout order");
    app.add_flag("--no-act", no_act, "Disable Adaptive Computation Time");
    app.add_flag("--stack", stack, "Stack independent blocks instead of sharing weights");
    app.add_option("--save", save_path, "Write the encoder weights to a .safetensors file");

    CLI11_PARSE(app, argc, argv);

    try {
        if (!config_path.empty()) {
            std::cout << "Loading config from " << config_path << std::endl;
            args = Model::load_encoder_args(config_path);
        } else {
            args.block.vanilla_wiring = vanilla;
            args.act = !no_act;
            args.share_weights = !stack;
        }
        args.act_args.return_step = true;

        torch::manual_seed(seed);
        std::cout << "Encoder config: " << nlohmann::json(args).dump() << std::endl;

        Model::UniversalTransformer encoder(args);
        encoder->eval();

        const auto input = torch::randn({batch, seq_len, args.block.d_model});
        const auto lengths = torch::randint(1, seq_len + 1, {batch}, torch::kLong);
        std::cout << "Lengths: " << lengths << std::endl;

        torch::NoGradGuard no_grad;
        const auto output = encoder->forward(input, lengths);

        std::cout << "Output shape: " << output.sizes() << std::endl;
        if (encoder->last_ponder_cost.has_value()) {
            std::cout << "Ponder cost: " << encoder->last_ponder_cost.value() << std::endl;
            std::cout << "Active steps:\n" << encoder->last_active_steps.value() << std::endl;
        }
        std::cout << "Auxiliary loss: " << encoder->auxiliary_loss().item<double>() << std::endl;

        if (!save_path.empty()) {
            std::cout << "Saving weights to " << save_path << "..." << std::endl;
            Export::save_checkpoint(*encoder, save_path, nlohmann::json(args));
        }
        std::cout << "Done." << std::endl;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}

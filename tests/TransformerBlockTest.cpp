#include <gtest/gtest.h>
#include <torch/torch.h>

#include <model/TransformerBlock.h>

#include <stdexcept>

namespace {
    Model::BlockArgs block_args(const bool vanilla_wiring) {
        Model::BlockArgs args;
        args.name = "block";
        args.d_model = 16;
        args.num_heads = 2;
        args.vanilla_wiring = vanilla_wiring;
        return args;
    }

    void copy_parameters(const Model::TransformerBlock &from, Model::TransformerBlock &to) {
        torch::NoGradGuard no_grad;
        auto target = to->named_parameters();
        for (const auto &k_v: from->named_parameters()) {
            target[k_v.key()].copy_(k_v.value());
        }
    }

    // Replays the block's sub-layers with residual dropout placed for the given wiring.
    torch::Tensor replay_block(Model::TransformerBlock &block, const torch::Tensor &x, const bool vanilla_wiring) {
        const auto drop = [&](const torch::Tensor &t) { return block->dropout->forward(t); };

        const auto attended = block->attention->forward(x);
        const auto post_residual1 = vanilla_wiring ? x + drop(attended) : drop(x + attended);
        const auto norm1_output = block->norm1->forward(post_residual1);

        const auto transformed = block->transition.forward(norm1_output);
        const auto post_residual2 = vanilla_wiring ? norm1_output + drop(transformed) : drop(norm1_output + transformed);
        return block->norm2->forward(post_residual2);
    }

    TEST(TransformerBlockTest, OutputShape) {
        Model::TransformerBlock block(block_args(false));
        const auto x = torch::randn({2, 5, 16});

        EXPECT_EQ(block->forward(x).sizes(), x.sizes());
        EXPECT_EQ(block->forward(x, torch::tensor({2, 5})).sizes(), x.sizes());
    }

    TEST(TransformerBlockTest, SubmodulesNamedAfterBlock) {
        Model::TransformerBlock block(block_args(false));
        const auto children = block->named_children();

        EXPECT_TRUE(children.contains("block_self_attention"));
        EXPECT_TRUE(children.contains("block_normalization1"));
        EXPECT_TRUE(children.contains("block_normalization2"));
        EXPECT_TRUE(children.contains("block_transition"));
        EXPECT_FALSE(children.contains("block_dropout"));

        auto args = block_args(false);
        args.residual_dropout = 0.1;
        Model::TransformerBlock with_dropout(args);
        EXPECT_TRUE(with_dropout->named_children().contains("block_dropout"));
    }

    TEST(TransformerBlockTest, OutputIsNormalized) {
        Model::TransformerBlock block(block_args(true));
        const auto y = block->forward(torch::randn({2, 5, 16}) * 4);

        const auto mean = y.mean({-1});
        EXPECT_TRUE(torch::allclose(mean, torch::zeros_like(mean), 0.0, 1e-5));
    }

    TEST(TransformerBlockTest, WiringModesAgreeWithoutDropout) {
        torch::manual_seed(20);
        Model::TransformerBlock vanilla(block_args(true));
        Model::TransformerBlock universal(block_args(false));
        copy_parameters(vanilla, universal);

        const auto x = torch::randn({2, 5, 16});
        const auto lengths = torch::tensor({3, 5});
        EXPECT_TRUE(torch::allclose(vanilla->forward(x, lengths), universal->forward(x, lengths), 1e-6, 1e-6));
    }

    TEST(TransformerBlockTest, DropoutIsIdentityInEval) {
        torch::manual_seed(21);
        auto args = block_args(false);
        Model::TransformerBlock plain(args);
        args.residual_dropout = 0.5;
        args.attention_dropout = 0.5;
        Model::TransformerBlock dropped(args);
        copy_parameters(plain, dropped);
        dropped->eval();

        const auto x = torch::randn({2, 5, 16});
        EXPECT_TRUE(torch::allclose(plain->forward(x), dropped->forward(x), 1e-6, 1e-6));
    }

    TEST(TransformerBlockTest, ResidualDropoutFollowsWiring) {
        torch::manual_seed(22);
        auto args = block_args(true);
        args.residual_dropout = 0.5;
        Model::TransformerBlock vanilla(args);
        args.vanilla_wiring = false;
        Model::TransformerBlock universal(args);
        copy_parameters(vanilla, universal);
        ASSERT_TRUE(vanilla->is_training());

        const auto x = torch::randn({2, 5, 16});
        const int64_t seed = 7;

        for (auto *block: {&vanilla, &universal}) {
            const bool vanilla_wiring = (*block)->args.vanilla_wiring;

            torch::manual_seed(seed);
            const auto y = (*block)->forward(x);
            torch::manual_seed(seed);
            const auto expected = replay_block(*block, x, vanilla_wiring);
            torch::manual_seed(seed);
            const auto swapped = replay_block(*block, x, !vanilla_wiring);

            EXPECT_TRUE(torch::allclose(y, expected, 1e-5, 1e-6)) << "vanilla_wiring=" << vanilla_wiring;
            EXPECT_FALSE(torch::allclose(y, swapped, 1e-5, 1e-6)) << "vanilla_wiring=" << vanilla_wiring;
        }

        torch::manual_seed(seed);
        const auto vanilla_out = vanilla->forward(x);
        torch::manual_seed(seed);
        const auto universal_out = universal->forward(x);
        EXPECT_FALSE(torch::allclose(vanilla_out, universal_out, 1e-5, 1e-6));
    }

    TEST(TransformerBlockTest, CallAcceptsTensorOrTensorAndLengths) {
        Model::TransformerBlock block(block_args(false));
        block->eval();
        const auto x = torch::randn({2, 5, 16});
        const auto lengths = torch::tensor({4, 5});

        EXPECT_TRUE(torch::allclose(block->call({x}), block->forward(x)));
        EXPECT_TRUE(torch::allclose(block->call({x, lengths}), block->forward(x, lengths)));
    }

    TEST(TransformerBlockTest, CallRejectsOtherShapes) {
        Model::TransformerBlock block(block_args(false));
        const auto x = torch::randn({2, 5, 16});

        EXPECT_THROW(block->call({}), std::invalid_argument);
        EXPECT_THROW(block->call({x, x, x}), std::invalid_argument);
        EXPECT_THROW(block->call({torch::randn({5, 16})}), std::invalid_argument);
        EXPECT_THROW(block->call({torch::randn({5, 16}), torch::tensor({5})}), std::invalid_argument);
        EXPECT_THROW(block->forward(torch::randn({2, 5, 8})), std::invalid_argument);
    }

    TEST(TransformerBlockTest, RejectsInvalidConfiguration) {
        auto args = block_args(false);
        args.transition_type = "rnn";
        EXPECT_THROW(Model::TransformerBlock{args}, std::invalid_argument);

        args = block_args(false);
        args.residual_dropout = 1.0;
        EXPECT_THROW(Model::TransformerBlock{args}, std::invalid_argument);

        args = block_args(false);
        args.attention_dropout = -0.1;
        EXPECT_THROW(Model::TransformerBlock{args}, std::invalid_argument);

        args = block_args(false);
        args.activation = "no_such_activation";
        EXPECT_THROW(Model::TransformerBlock{args}, std::invalid_argument);
    }

    TEST(TransformerBlockTest, ConvTransitionBlock) {
        auto args = block_args(false);
        args.transition_type = "cnn";
        args.activation = "relu";
        Model::TransformerBlock block(args);
        const auto x = torch::randn({2, 5, 16});

        EXPECT_EQ(block->forward(x).sizes(), x.sizes());
        EXPECT_GT(block->regularization_loss().item<double>(), 0.0);

        Model::TransformerBlock dot(block_args(false));
        EXPECT_EQ(dot->regularization_loss().item<double>(), 0.0);
    }
} // namespace

#include <gtest/gtest.h>
#include <torch/torch.h>

#include <model/TransformerACT.h>

#include <optional>
#include <stdexcept>
#include <vector>

using torch::indexing::None;
using torch::indexing::Slice;

namespace {
    Model::ACTArgs quiet_args() {
        Model::ACTArgs args;
        args.verbose = false;
        return args;
    }

    // Runs act_step over a fixed sequence of halting tensors and returns every step output.
    std::vector<Model::ACTOutput> run_steps(const std::vector<torch::Tensor> &haltings, const torch::Tensor &input,
                                            const std::optional<torch::Tensor> &lengths = std::nullopt) {
        Model::ACTState state;
        std::vector<Model::ACTOutput> outputs;
        for (const auto &halting: haltings) {
            auto [next, out] = Model::act_step(std::move(state), halting, input, lengths, quiet_args());
            state = std::move(next);
            outputs.push_back(out);
        }
        return outputs;
    }

    void set_halting_bias(Model::TransformerACT &act, const double bias) {
        torch::NoGradGuard no_grad;
        act->halting_kernel.zero_();
        act->halting_biases.fill_(bias);
    }

    TEST(TransformerACTTest, InitialControlState) {
        const auto halting = torch::full({2, 3}, 0.5);
        const auto state = Model::init_act_state(halting, quiet_args());

        EXPECT_TRUE(torch::allclose(state.halt_budget, torch::full({2, 3}, 0.99)));
        EXPECT_TRUE(torch::equal(state.remainder, torch::ones({2, 3})));
        EXPECT_TRUE(torch::equal(state.active_steps, torch::zeros({2, 3})));
        EXPECT_EQ(state.batch_size, 2);
        EXPECT_EQ(state.sequence_length, 3);
    }

    TEST(TransformerACTTest, CertainHaltingExhaustsOnFirstStep) {
        torch::manual_seed(30);
        const auto input = torch::randn({1, 3, 4});
        const auto outputs = run_steps({torch::ones({1, 3})}, input);
        const auto &out = outputs.front();

        EXPECT_TRUE(torch::equal(out.active_steps, torch::ones({1, 3})));
        EXPECT_TRUE(torch::equal(out.halting_weight, torch::ones({1, 3})));
        EXPECT_TRUE(torch::allclose(out.weighted_output, input));
    }

    TEST(TransformerACTTest, ExhaustingStepUsesRemainder) {
        const auto input = torch::ones({1, 1, 2});
        const auto outputs = run_steps({torch::full({1, 1}, 0.6), torch::full({1, 1}, 0.7)}, input);

        EXPECT_NEAR(outputs[0].halting_weight.item<float>(), 0.6f, 1e-6);
        // 0.39 - 0.7 <= 0: the last step gets the remaining 0.4, not 0.7
        EXPECT_NEAR(outputs[1].halting_weight.item<float>(), 0.4f, 1e-6);
        EXPECT_TRUE(torch::allclose(outputs[1].weighted_output, torch::ones({1, 1, 2})));
        EXPECT_EQ(outputs[1].active_steps.item<float>(), 2.0f);
    }

    TEST(TransformerACTTest, AppliedWeightsSumToOne) {
        torch::manual_seed(31);
        const auto input = torch::ones({3, 4, 1});
        std::vector<torch::Tensor> haltings;
        for (int step = 0; step < 30; ++step) {
            haltings.push_back(torch::rand({3, 4}) * 0.9 + 0.05);
        }
        const auto outputs = run_steps(haltings, input);

        auto total = torch::zeros({3, 4});
        for (const auto &out: outputs) {
            total += out.halting_weight;
        }
        EXPECT_TRUE(torch::allclose(total, torch::ones({3, 4}), 0.0, 1e-5));
        EXPECT_TRUE(torch::allclose(outputs.back().weighted_output.squeeze(-1), torch::ones({3, 4}), 0.0, 1e-5));
    }

    TEST(TransformerACTTest, ActiveStepsStopOnceHalted) {
        const auto input = torch::ones({1, 2, 3});
        const std::vector<torch::Tensor> haltings(6, torch::full({1, 2}, 0.3));
        const auto outputs = run_steps(haltings, input);

        // budget: 0.99, 0.69, 0.39, 0.09 are positive, then -0.21
        EXPECT_TRUE(torch::equal(outputs[3].active_steps, torch::full({1, 2}, 4.0)));
        EXPECT_TRUE(torch::equal(outputs[5].active_steps, torch::full({1, 2}, 4.0)));
        EXPECT_TRUE(torch::equal(outputs[4].halting_weight, torch::zeros({1, 2})));
    }

    TEST(TransformerACTTest, PonderCostIsRecomputedEachStep) {
        const auto input = torch::ones({1, 1, 2});
        const std::vector<torch::Tensor> haltings(5, torch::full({1, 1}, 0.3));
        const auto outputs = run_steps(haltings, input);

        EXPECT_EQ(outputs[0].ponder_cost.sizes(), torch::IntArrayRef({1}));
        EXPECT_NEAR(outputs[0].ponder_cost.item<float>(), 0.01f * (1.0f + 1.0f), 1e-6);
        EXPECT_NEAR(outputs[1].ponder_cost.item<float>(), 0.01f * (0.7f + 2.0f), 1e-6);
        EXPECT_NEAR(outputs[3].ponder_cost.item<float>(), 0.01f * (0.1f + 4.0f), 1e-6);
        // halted: remainder and active steps no longer change
        EXPECT_NEAR(outputs[4].ponder_cost.item<float>(), 0.01f * (0.1f + 4.0f), 1e-6);
    }

    TEST(TransformerACTTest, PaddingAccruesNoCost) {
        const auto input = torch::ones({2, 4, 3});
        const auto lengths = torch::tensor({2, 4}, torch::kLong);
        const std::vector<torch::Tensor> haltings(2, torch::full({2, 4}, 0.5));
        const auto outputs = run_steps(haltings, input, lengths);

        EXPECT_TRUE(torch::equal(outputs[0].active_steps,
            torch::tensor({{1.0f, 1.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 1.0f, 1.0f}})));
        EXPECT_NEAR(outputs[0].ponder_cost[0].item<float>(), 0.01f * (2.0f * 2.0f) / 4.0f, 1e-6);
        EXPECT_NEAR(outputs[0].ponder_cost[1].item<float>(), 0.01f * 2.0f, 1e-6);

        // step 2 exhausts every token, the remainder of 0.5 is kept
        EXPECT_NEAR(outputs[1].ponder_cost[0].item<float>(), 0.01f * (2.0f * 2.5f) / 4.0f, 1e-6);
        EXPECT_TRUE(torch::equal(outputs[1].active_steps.index({0, Slice(2, None)}), torch::zeros({2})));
    }

    TEST(TransformerACTTest, AcceptsColumnLengths) {
        const auto input = torch::ones({2, 3, 2});
        const auto lengths = torch::tensor({{1}, {3}}, torch::kLong);
        const auto outputs = run_steps({torch::full({2, 3}, 0.5)}, input, lengths);

        EXPECT_TRUE(torch::equal(outputs[0].active_steps, torch::tensor({{1.0f, 0.0f, 0.0f}, {1.0f, 1.0f, 1.0f}})));
    }

    TEST(TransformerACTTest, ParametersAndHaltingProbability) {
        Model::TransformerACT act(8, quiet_args());
        const auto params = act->named_parameters();

        ASSERT_TRUE(params.contains("halting_kernel"));
        ASSERT_TRUE(params.contains("halting_biases"));
        EXPECT_EQ(act->halting_kernel.sizes(), torch::IntArrayRef({8, 1}));
        EXPECT_TRUE(torch::allclose(act->halting_biases, torch::full({1}, 0.1)));

        const auto x = torch::randn({2, 5, 8});
        const auto expected = torch::sigmoid(torch::matmul(x, act->halting_kernel).squeeze(-1) + 0.1);
        EXPECT_TRUE(torch::allclose(act->halting_probability(x), expected, 1e-5, 1e-6));
    }

    TEST(TransformerACTTest, SaturatedHaltingThroughModule) {
        Model::TransformerACT act(4, quiet_args());
        set_halting_bias(act, 100.0); // sigmoid saturates to exactly 1
        const auto first = torch::randn({2, 3, 4});
        const auto second = torch::randn({2, 3, 4});

        const auto out1 = act->forward(first);
        EXPECT_TRUE(torch::equal(out1.output, first));
        EXPECT_TRUE(torch::allclose(out1.weighted_output, first));
        EXPECT_TRUE(torch::equal(out1.active_steps, torch::ones({2, 3})));

        // nothing is active any more, the step contributes zeros
        const auto out2 = act->forward(second);
        EXPECT_TRUE(torch::equal(out2.weighted_output, out1.weighted_output));
        EXPECT_TRUE(torch::equal(out2.active_steps, torch::ones({2, 3})));
    }

    TEST(TransformerACTTest, BatchSizeChangeReinitializes) {
        Model::TransformerACT act(4, quiet_args());
        set_halting_bias(act, -5.0);

        act->forward(torch::randn({2, 3, 4}));
        const auto out = act->forward(torch::randn({2, 3, 4}));
        EXPECT_TRUE(torch::equal(out.active_steps, torch::full({2, 3}, 2.0)));

        const auto smaller = torch::randn({1, 3, 4});
        const auto last = act->forward(smaller);
        EXPECT_EQ(act->state().batch_size, 1);
        EXPECT_TRUE(torch::equal(last.active_steps, torch::ones({1, 3})));
        EXPECT_EQ(last.weighted_output.sizes(), smaller.sizes());
        EXPECT_TRUE(torch::allclose(last.weighted_output, torch::sigmoid(torch::tensor(-5.0)) * smaller));
    }

    TEST(TransformerACTTest, SequenceLengthChangeReinitializes) {
        Model::TransformerACT act(4, quiet_args());
        set_halting_bias(act, -5.0);

        act->forward(torch::randn({2, 3, 4}));
        act->forward(torch::randn({2, 3, 4}));

        const auto longer = torch::randn({2, 5, 4});
        const auto out = act->forward(longer);
        EXPECT_EQ(act->state().batch_size, 2);
        EXPECT_EQ(act->state().sequence_length, 5);
        EXPECT_TRUE(torch::equal(out.active_steps, torch::ones({2, 5})));
        EXPECT_EQ(out.weighted_output.sizes(), longer.sizes());
        EXPECT_TRUE(torch::allclose(out.weighted_output, torch::sigmoid(torch::tensor(-5.0)) * longer));
    }

    TEST(TransformerACTTest, InitLineOnlyOnShapeChange) {
        Model::ACTArgs args;
        args.verbose = true;
        Model::TransformerACT act(4, args);
        const auto x = torch::randn({2, 3, 4});

        testing::internal::CaptureStdout();
        act->forward(x);
        act->forward(x);
        act->reset();
        act->forward(x);
        const auto same_shape = testing::internal::GetCapturedStdout();
        EXPECT_EQ(same_shape, "init control tensors [2, 3]\n");

        testing::internal::CaptureStdout();
        act->forward(torch::randn({1, 3, 4}));
        const auto new_shape = testing::internal::GetCapturedStdout();
        EXPECT_EQ(new_shape, "init control tensors [1, 3]\n");
    }

    TEST(TransformerACTTest, ReturnStepAddsActiveSteps) {
        const auto x = torch::randn({2, 5, 8});

        Model::TransformerACT plain(8, quiet_args());
        EXPECT_EQ(plain->call({x}).size(), 3u);

        auto args = quiet_args();
        args.return_step = true;
        Model::TransformerACT with_steps(8, args);
        const auto outputs = with_steps->call({x, torch::tensor({3, 5})});
        ASSERT_EQ(outputs.size(), 4u);
        EXPECT_EQ(outputs[0].sizes(), x.sizes());
        EXPECT_EQ(outputs[1].sizes(), x.sizes());
        EXPECT_EQ(outputs[2].sizes(), torch::IntArrayRef({2}));
        EXPECT_EQ(outputs[3].sizes(), torch::IntArrayRef({2, 5}));
    }

    TEST(TransformerACTTest, RejectsInvalidCalls) {
        Model::TransformerACT act(8, quiet_args());
        const auto x = torch::randn({2, 5, 8});

        EXPECT_THROW(act->call({}), std::invalid_argument);
        EXPECT_THROW(act->call({torch::randn({5, 8})}), std::invalid_argument);
        EXPECT_THROW(act->call({x, x, x}), std::invalid_argument);
        EXPECT_THROW(act->forward(torch::randn({2, 5, 4})), std::invalid_argument);
        EXPECT_THROW(act->forward(x, torch::tensor({1, 2, 3})), std::invalid_argument);
        EXPECT_FALSE(act->state().initialized());
    }

    TEST(TransformerACTTest, RejectsInvalidOptions) {
        auto args = quiet_args();
        args.halt_epsilon = 0.0;
        EXPECT_THROW(Model::TransformerACT(8, args), std::invalid_argument);

        args = quiet_args();
        args.time_penalty = -0.5;
        EXPECT_THROW(Model::TransformerACT(8, args), std::invalid_argument);
    }

    TEST(TransformerACTTest, FinalizeRegistersLastPonderCost) {
        Model::TransformerACT act(8, quiet_args());
        EXPECT_THROW(act->finalize(), std::logic_error);

        Model::ACTOutput out;
        auto next = torch::randn({2, 5, 8});
        for (int step = 0; step < 3; ++step) {
            out = act->forward(next);
            next = out.output;
        }
        act->finalize();

        ASSERT_TRUE(act->ponder_loss.has_value());
        EXPECT_EQ(act->ponder_loss->dim(), 0);
        EXPECT_TRUE(torch::allclose(*act->ponder_loss, out.ponder_cost.mean()));

        act->reset();
        EXPECT_FALSE(act->ponder_loss.has_value());
        EXPECT_FALSE(act->state().initialized());
    }
} // namespace

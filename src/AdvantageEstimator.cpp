//
// Created by moinshaikh on 3/5/26.
//

#include<sstream>
#include<stdexcept>
#include<vector>

#include<torch/torch.h>

#include"../include/AdvantageEstimator.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    torch::Tensor computeTemporalDifferences(torch::Tensor rewards,
        torch::Tensor terminals,
        torch::Tensor values,
        torch::Tensor bootstrapValue)
    {
        if (rewards.dim() != 2 || terminals.sizes() != rewards.sizes() || values.sizes() != rewards.sizes() ||
            bootstrapValue.dim() != 1 || bootstrapValue.size(0) != rewards.size(1))
        {
            std::ostringstream message;
            message << "Rollout shapes disagree: rewards " << rewards.sizes() << ", terminals " << terminals.sizes()
                    << ", values " << values.sizes() << ", bootstrap value " << bootstrapValue.sizes();
            throw std::invalid_argument(message.str());
        }

        auto masks = 1 - terminals.to(rewards.options().dtype(torch::kFloat));
        auto num_steps = rewards.size(0);

        std::vector<torch::Tensor> deltas;
        for (int64_t t = 0; t < num_steps; ++t)
        {
            auto next_value = (t + 1 < num_steps) ? values[t + 1] : bootstrapValue;
            auto target = (rewards[t] + next_value * masks[t]).detach();
            deltas.push_back(target - values[t]);
        }
        return torch::stack(deltas);
    }

    torch::Tensor computeAdvantages(torch::Tensor deltas, float discount, float gaeLambda)
    {
        if (deltas.dim() != 2)
        {
            std::ostringstream message;
            message << "Residuals need shape [T, workers], got " << deltas.sizes();
            throw std::invalid_argument(message.str());
        }

        auto decay = discount * gaeLambda;
        auto num_steps = deltas.size(0);

        // Backward accumulation of the same sum; no mask between steps
        std::vector<torch::Tensor> advantages(num_steps);
        auto running = torch::zeros_like(deltas[0]);
        for (int64_t t = num_steps - 1; t >= 0; --t)
        {
            running = deltas[t] + decay * running;
            advantages[t] = running;
        }
        return torch::stack(advantages);
    }

    TEST_CASE("Advantage estimation")
    {
        // Two workers, three steps; worker 1 terminates on the last step
        auto rewards = torch::tensor({1.f, 0.f, 1.f, 0.f, 1.f, 5.f}).reshape({3, 2});
        auto terminals = torch::tensor({0.f, 0.f, 0.f, 0.f, 0.f, 1.f}).reshape({3, 2});
        auto values = torch::tensor({0.5f, 0.1f, 0.6f, 0.1f, 0.7f, 0.1f}).reshape({3, 2});
        auto bootstrap = torch::tensor({0.8f, 0.f});

        SUBCASE("Temporal differences bootstrap the last step")
        {
            auto deltas = computeTemporalDifferences(rewards, terminals, values, bootstrap);
            INFO("Deltas: \n" << deltas);

            REQUIRE(deltas.sizes().vec() == std::vector<int64_t>{3, 2});
            CHECK(deltas[0][0].item().toFloat() == doctest::Approx(1.1));
            CHECK(deltas[1][0].item().toFloat() == doctest::Approx(1.1));
            CHECK(deltas[2][0].item().toFloat() == doctest::Approx(1.1));
            CHECK(deltas[0][1].item().toFloat() == doctest::Approx(0));
            CHECK(deltas[1][1].item().toFloat() == doctest::Approx(0));
            CHECK(deltas[2][1].item().toFloat() == doctest::Approx(4.9));
        }

        SUBCASE("Advantages decay with discount * lambda")
        {
            auto deltas = computeTemporalDifferences(rewards, terminals, values, bootstrap);
            auto advantages = computeAdvantages(deltas, 0.99, 0.95);
            INFO("Advantages: \n" << advantages);

            CHECK(advantages[0][0].item().toFloat() == doctest::Approx(3.107544275).epsilon(1e-5));
            CHECK(advantages[1][0].item().toFloat() == doctest::Approx(2.13455).epsilon(1e-5));
            CHECK(advantages[2][0].item().toFloat() == doctest::Approx(1.1).epsilon(1e-5));
            CHECK(advantages[0][1].item().toFloat() == doctest::Approx(4.334247225).epsilon(1e-5));
            CHECK(advantages[1][1].item().toFloat() == doctest::Approx(4.60845).epsilon(1e-5));
            CHECK(advantages[2][1].item().toFloat() == doctest::Approx(4.9).epsilon(1e-5));
        }

        SUBCASE("Zero lambda leaves the residuals")
        {
            auto deltas = computeTemporalDifferences(rewards, terminals, values, bootstrap);
            auto advantages = computeAdvantages(deltas, 0.99, 0);

            CHECK(torch::allclose(advantages, deltas));
        }

        SUBCASE("Zero rewards reduce to value differences")
        {
            auto deltas = computeTemporalDifferences(torch::zeros({3, 2}), torch::zeros({3, 2}), values, bootstrap);
            auto advantages = computeAdvantages(deltas, 0.99, 0.95);

            CHECK(deltas[0][0].item().toFloat() == doctest::Approx(0.1));
            CHECK(deltas[1][0].item().toFloat() == doctest::Approx(0.1));
            CHECK(deltas[2][0].item().toFloat() == doctest::Approx(0.1));
            CHECK(deltas[2][1].item().toFloat() == doctest::Approx(-0.1));
            CHECK(torch::allclose(advantages[2], deltas[2]));
        }

        SUBCASE("Residuals after a terminal still reach earlier advantages")
        {
            // Worker 0 terminates at t = 0, yet adv[0] sums delta[1] and delta[2]
            auto early_terminal = torch::tensor({1.f, 0.f, 0.f, 0.f, 0.f, 0.f}).reshape({3, 2});
            auto deltas = computeTemporalDifferences(rewards, early_terminal, values, bootstrap);
            auto advantages = computeAdvantages(deltas, 0.99, 0.95);

            auto decay = 0.99 * 0.95;
            CHECK(deltas[0][0].item().toFloat() == doctest::Approx(0.5));
            auto expected = deltas[0][0].item().toDouble() + decay * deltas[1][0].item().toDouble() +
                            decay * decay * deltas[2][0].item().toDouble();
            CHECK(advantages[0][0].item().toDouble() == doctest::Approx(expected).epsilon(1e-5));
            CHECK(advantages[0][0].item().toDouble() > deltas[0][0].item().toDouble());
        }

        SUBCASE("Gradients reach only the value of the same step")
        {
            auto trainable = values.clone().requires_grad_(true);
            auto deltas = computeTemporalDifferences(rewards, terminals, trainable, bootstrap);
            deltas[0].sum().backward();

            CHECK(trainable.grad()[0][0].item().toFloat() == doctest::Approx(-1));
            CHECK(trainable.grad()[1][0].item().toFloat() == doctest::Approx(0));
        }

        SUBCASE("Mismatched shapes are rejected")
        {
            CHECK_THROWS_AS(computeTemporalDifferences(rewards, terminals, values, torch::zeros({3})),
                            std::invalid_argument);
            CHECK_THROWS_AS(computeTemporalDifferences(rewards, torch::zeros({2, 2}), values, bootstrap),
                            std::invalid_argument);
            CHECK_THROWS_AS(computeAdvantages(torch::zeros({3}), 0.99, 0.95), std::invalid_argument);
        }
    }
}

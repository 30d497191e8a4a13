//
// Created by moinshaikh on 2/1/26.
//
#include<cmath>
#include<limits>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>
#include<doctest/doctest.h>
#include"../../include/Distribution/Normal.hpp"

namespace RolloutEngine
{
    namespace
    {
        const double logSqrtTwoPi = 0.5 * std::log(2 * M_PI);
    }

    Normal::Normal(const torch::Tensor loc, const torch::Tensor scale)
    {
        auto broadcasted = torch::broadcast_tensors({loc, scale});
        this->loc = broadcasted[0];
        this->scale = broadcasted[1];
        this->batch_shape = this->loc.sizes().vec();
        this->event_shape = {};
    }

    /**
     * @brief Differential entropy 0.5 + 0.5 ln(2 pi) + ln(sigma), summed over the action dimension.
     */
    torch::Tensor Normal::entropy()
    {
        return (0.5 + logSqrtTwoPi + torch::log(scale)).sum(-1);
    }

    /**
     * @brief Element-wise log density -(x - mu)^2 / (2 sigma^2) - ln(sigma) - ln(sqrt(2 pi)).
     */
    torch::Tensor Normal::logProbability(torch::Tensor value)
    {
        auto variance = scale.pow(2);
        return -(value - loc).pow(2) / (2 * variance) - scale.log() - logSqrtTwoPi;
    }

    torch::Tensor Normal::sample(c10::ArrayRef<int64_t> sample_shape)
    {
        auto shape = extendedShape(sample_shape);
        torch::NoGradGuard no_grad;
        return at::normal(loc.expand(shape), scale.expand(shape));
    }

    TEST_CASE("Normal")
    {
        float locs_array[] = {0, 1, 2, 3, 4, 5};
        float scales_array[] = {5, 4, 3, 2, 1, 0};
        auto locs = torch::from_blob(locs_array, {2, 3});
        auto scales = torch::from_blob(scales_array, {2, 3});
        auto dist = Normal(locs, scales);

        SUBCASE("Sample shape is sample dimensions followed by the batch shape")
        {
            CHECK(dist.sample().sizes().vec() == std::vector<int64_t>{2, 3});
            CHECK(dist.sample({20}).sizes().vec() == std::vector<int64_t>{20, 2, 3});
            CHECK(dist.sample({2, 20}).sizes().vec() == std::vector<int64_t>{2, 20, 2, 3});
        }

        SUBCASE("entropy() reduces the action dimension")
        {
            auto entropies = dist.entropy();
            INFO("Entropies: \n" << entropies);

            CHECK(entropies.sizes().vec() == std::vector<int64_t>{2});
            CHECK(entropies[0].item().toDouble() == doctest::Approx(8.3512).epsilon(1e-3));
            CHECK(entropies[1].item().toDouble() == -std::numeric_limits<float>::infinity());
        }

        SUBCASE("logProbability() is element-wise")
        {
            float actions[2][3] = {{0, 1, 2},
                                   {0, 1, 2}};
            auto log_probs = dist.logProbability(torch::from_blob(actions, {2, 3}));
            INFO(log_probs << "\n");

            CHECK(log_probs.sizes().vec() == std::vector<int64_t>{2, 3});
            CHECK(log_probs[0][0].item().toDouble() == doctest::Approx(-2.5284).epsilon(1e-3));
            CHECK(log_probs[0][1].item().toDouble() == doctest::Approx(-2.3052).epsilon(1e-3));
            CHECK(log_probs[1][0].item().toDouble() == doctest::Approx(-2.7371).epsilon(1e-3));
            CHECK(std::isnan(log_probs[1][2].item().toDouble()));
        }

        SUBCASE("Samples carry no gradient history")
        {
            auto trainable_loc = torch::zeros({3}, torch::requires_grad());
            auto trainable = Normal(trainable_loc, torch::ones({3}));
            CHECK_FALSE(trainable.sample().requires_grad());
        }
    }
}

//
// Created by moinshaikh on 1/30/26.
//

#include<stdexcept>

#include<ATen/core/Reduction.h>
#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

#include"../../include/Distribution/Bernoulli.hpp"
#include<doctest/doctest.h>


namespace RolloutEngine
{
    /**
     * @details Probabilities are clamped away from 0 and 1 before being turned
     * into log-odds, so log(0) never reaches the loss.
     */
    Bernoulli::Bernoulli(const torch::Tensor *probs, const torch::Tensor *logits)
    {
        if ((probs == nullptr) == (logits == nullptr))
        {
            throw std::runtime_error("Bernoulli needs exactly one of probs or logits");
        }

        const torch::Tensor &input = (probs != nullptr) ? *probs : *logits;
        if (input.dim() < 1)
        {
            throw std::runtime_error("Bernoulli parameters need at least one dimension");
        }

        if (probs != nullptr)
        {
            this->probs = *probs;
            auto clamped = this->probs.clamp(1.21e-7, 1.0 - 1.21e-7);
            this->logits = torch::log(clamped) - torch::log1p(-clamped);
        }
        else
        {
            this->logits = *logits;
            this->probs = torch::sigmoid(*logits);
        }

        this->param = input;
        this->batch_shape = input.sizes().vec();
    }

    /**
     * @brief -(p log p + (1 - p) log(1 - p)), computed through the BCE-with-logits kernel.
     */
    torch::Tensor Bernoulli::entropy()
    {
        return torch::binary_cross_entropy_with_logits(logits,
                                                       probs,
                                                       torch::Tensor(),
                                                       torch::Tensor(),
                                                       at::Reduction::None);
    }

    torch::Tensor Bernoulli::logProbability(torch::Tensor value)
    {
        auto broadcasted = torch::broadcast_tensors({logits, value.to(logits.dtype())});
        return -torch::binary_cross_entropy_with_logits(broadcasted[0],
                                                        broadcasted[1],
                                                        torch::Tensor(),
                                                        torch::Tensor(),
                                                        at::Reduction::None);
    }

    torch::Tensor Bernoulli::sample(c10::ArrayRef<int64_t> sampleShape)
    {
        auto shape = extendedShape(sampleShape);
        torch::NoGradGuard no_grad;
        return torch::bernoulli(probs.expand(shape));
    }


    TEST_CASE("Bernoulli")
    {
        SUBCASE("Throws unless exactly one parameterization is given")
        {
            auto tensor = torch::ones({2});
            CHECK_THROWS(Bernoulli(&tensor, &tensor));
            CHECK_THROWS(Bernoulli(nullptr, nullptr));
        }

        SUBCASE("Samples are zeros and ones")
        {
            auto probabilities = torch::full({5}, 0.3);
            auto dist = Bernoulli(&probabilities, nullptr);

            auto output = dist.sample({100});
            CHECK(output.sizes().vec() == std::vector<int64_t>{100, 5});
            CHECK(((output == 0) | (output == 1)).all().item().toBool());
        }

        SUBCASE("One row of switches per worker")
        {
            auto logits = torch::zeros({3, 4});
            auto dist = Bernoulli(nullptr, &logits);

            CHECK(dist.sample().sizes().vec() == std::vector<int64_t>{3, 4});
        }

        SUBCASE("entropy() is element-wise")
        {
            float probabilities[2][2] = {{0.5, 0.0},
                                         {0.25, 0.25}};
            auto probabilities_tensor = torch::from_blob(probabilities, {2, 2});
            auto dist = Bernoulli(&probabilities_tensor, nullptr);

            auto entropies = dist.entropy();
            CHECK(entropies.sizes().vec() == std::vector<int64_t>{2, 2});
            CHECK(entropies[0][0].item().toDouble() == doctest::Approx(0.6931).epsilon(1e-3));
            CHECK(entropies[0][1].item().toDouble() == doctest::Approx(0.0).epsilon(1e-3));
            CHECK(entropies[1][0].item().toDouble() == doctest::Approx(0.5623).epsilon(1e-3));
        }

        SUBCASE("logProbability() of ones and zeros")
        {
            float probabilities[2][2] = {{0.5, 0.0},
                                         {0.25, 0.25}};
            auto probabilities_tensor = torch::from_blob(probabilities, {2, 2});
            auto dist = Bernoulli(&probabilities_tensor, nullptr);

            float actions[2][2] = {{1, 0},
                                   {1, 0}};
            auto log_probs = dist.logProbability(torch::from_blob(actions, {2, 2}));
            INFO(log_probs << "\n");

            CHECK(log_probs[0][0].item().toDouble() == doctest::Approx(-0.6931).epsilon(1e-3));
            CHECK(log_probs[0][1].item().toDouble() == doctest::Approx(0.0).epsilon(1e-3));
            CHECK(log_probs[1][0].item().toDouble() == doctest::Approx(-1.3863).epsilon(1e-3));
            CHECK(log_probs[1][1].item().toDouble() == doctest::Approx(-0.2876).epsilon(1e-3));
        }
    }

}

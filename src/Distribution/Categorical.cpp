//
// Created by moinshaikh on 1/30/26.
//

#include<stdexcept>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

#include"../../include/Distribution/Categorical.hpp"
#include<doctest/doctest.h>


namespace RolloutEngine
{
    /**
     * @brief Normalizes whichever parameterization was given.
     *
     * Probabilities are rescaled to sum to one and clamped away from 0 and 1
     * before taking the log; logits are shifted by their log-sum-exp.
     */
    Categorical::Categorical(const torch::Tensor *probs, const torch::Tensor *logits)
    {
        if ((probs == nullptr) == (logits == nullptr))
        {
            throw std::runtime_error("Categorical needs exactly one of probs or logits");
        }
        if (probs != nullptr)
        {
            if (probs->dim() < 1)
            {
                throw std::runtime_error("Categorical probs need at least one dimension");
            }
            this->probs = *probs / probs->sum(-1, true);
            this->probs = this->probs.clamp(1.21e-7, 1. - 1.21e-7);
            this->logits = torch::log(this->probs);
        }
        else
        {
            if (logits->dim() < 1)
            {
                throw std::runtime_error("Categorical logits need at least one dimension");
            }
            this->logits = *logits - logits->logsumexp(-1, true);
            this->probs = torch::softmax(this->logits, -1);
        }
        param = probs != nullptr ? *probs : *logits;
        numEvents = param.size(-1);
        batch_shape = param.sizes().vec();
        batch_shape.pop_back();
    }

    torch::Tensor Categorical::entropy()
    {
        return -(logits * probs).sum(-1);
    }

    torch::Tensor Categorical::logProbability(torch::Tensor value)
    {
        value = value.to(torch::kLong).unsqueeze(-1);
        auto broadcasted = torch::broadcast_tensors({value, logits});
        auto index = broadcasted[0].narrow(-1, 0, 1);
        return broadcasted[1].gather(-1, index).squeeze(-1);
    }

    /**
     * @details multinomial only accepts 1-D or 2-D input, so the expanded
     * probabilities are flattened to [N, numEvents] and the draws reshaped
     * back to [sampleShape, batch_shape].
     */
    torch::Tensor Categorical::sample(c10::ArrayRef<int64_t> sampleShape)
    {
        auto outputShape = extendedShape(sampleShape);
        auto probsShape = outputShape;
        probsShape.push_back(numEvents);

        torch::Tensor expanded = probs;
        for (size_t i = 0; i < sampleShape.size(); ++i)
        {
            expanded = expanded.unsqueeze(0);
        }
        auto probs2D = expanded.expand(probsShape).contiguous().view({-1, numEvents});
        auto draws = torch::multinomial(probs2D, 1, true);
        return draws.contiguous().view(outputShape);
    }

    TEST_CASE("Categorical")
    {
        SUBCASE("Throws unless exactly one parameterization is given")
        {
            auto tensor = torch::ones({3});
            CHECK_THROWS(Categorical(&tensor, &tensor));
            CHECK_THROWS(Categorical(nullptr, nullptr));
        }

        SUBCASE("Samples stay inside the action range")
        {
            auto probabilities = torch::full({6}, 1.0 / 6);
            auto dist = Categorical(&probabilities, nullptr);

            auto output = dist.sample({200});
            CHECK((output >= 0).all().item().toBool());
            CHECK((output < 6).all().item().toBool());
        }

        SUBCASE("One draw per worker when the batch axis is the worker axis")
        {
            auto logits = torch::zeros({4, 3});
            auto dist = Categorical(nullptr, &logits);

            CHECK(dist.sample().sizes().vec() == std::vector<int64_t>{4});
            CHECK(dist.sample({7}).sizes().vec() == std::vector<int64_t>{7, 4});
        }

        SUBCASE("Degenerate probabilities always give the certain action")
        {
            float probabilities[2][3] = {{0, 0, 1},
                                         {1, 0, 0}};
            auto probabilities_tensor = torch::from_blob(probabilities, {2, 3});
            auto dist = Categorical(&probabilities_tensor, nullptr);

            auto output = dist.sample({10});
            CHECK((output.select(1, 0) == 2).all().item().toBool());
            CHECK((output.select(1, 1) == 0).all().item().toBool());
        }

        SUBCASE("entropy() of uniform and two-way distributions")
        {
            float probabilities[2][4] = {{0.5, 0.5, 0.0, 0.0},
                                         {0.25, 0.25, 0.25, 0.25}};
            auto probabilities_tensor = torch::from_blob(probabilities, {2, 4});
            auto dist = Categorical(&probabilities_tensor, nullptr);

            auto entropies = dist.entropy();
            CHECK(entropies.sizes().vec() == std::vector<int64_t>{2});
            CHECK(entropies[0].item().toDouble() == doctest::Approx(0.6931).epsilon(1e-3));
            CHECK(entropies[1].item().toDouble() == doctest::Approx(1.3863).epsilon(1e-3));
        }

        SUBCASE("logProbability() picks the entry of each worker's action")
        {
            float probabilities[2][4] = {{0.5, 0.5, 0.0, 0.0},
                                         {0.25, 0.25, 0.25, 0.25}};
            auto probabilities_tensor = torch::from_blob(probabilities, {2, 4});
            auto dist = Categorical(&probabilities_tensor, nullptr);

            float actions[] = {1, 3};
            auto log_probs = dist.logProbability(torch::from_blob(actions, {2}));

            CHECK(log_probs.sizes().vec() == std::vector<int64_t>{2});
            CHECK(log_probs[0].item().toDouble() == doctest::Approx(-0.6931).epsilon(1e-3));
            CHECK(log_probs[1].item().toDouble() == doctest::Approx(-1.3863).epsilon(1e-3));
        }
    }
}

//
// Created by moinshaikh on 2/6/26.
//

#include<memory>

#include<torch/torch.h>

#include"../../include/Model/OutputLayers.hpp"
#include"../../include/Model/ModelUtils.hpp"
#include"../../include/Distribution/Distribution.hpp"
#include"../../include/Distribution/Bernoulli.hpp"
#include"../../include/Distribution/Categorical.hpp"
#include"../../include/Distribution/Normal.hpp"

#include<doctest/doctest.h>

namespace RolloutEngine
{
    BernoulliOutput::BernoulliOutput(unsigned int numInputs, unsigned int numOutputs) :
        linear(numInputs, numOutputs)
    {
        register_module("linear", linear);
        initWeights(linear->named_parameters(), 0.01, 0);
    }

    std::unique_ptr<Distribution> BernoulliOutput::forward(torch::Tensor x)
    {
        x = linear(x);
        return std::make_unique<Bernoulli>(nullptr, &x);
    }

    CategoricalOutput::CategoricalOutput(unsigned int numInputs, unsigned int numOutputs) :
        linear(numInputs, numOutputs)
    {
        register_module("linear", linear);
        initWeights(linear->named_parameters(), 0.01, 0);
    }

    std::unique_ptr<Distribution> CategoricalOutput::forward(torch::Tensor x)
    {
        x = linear(x);
        return std::make_unique<Categorical>(nullptr, &x);
    }

    NormalOutput::NormalOutput(unsigned int numInputs, unsigned int numOutputs) :
        linear_loc(numInputs, numOutputs)
    {
        register_module("linear_loc", linear_loc);
        scale_log = register_parameter("scale_log", torch::zeros({numOutputs}));
        initWeights(linear_loc->named_parameters(), 1, 0);
    }

    std::unique_ptr<Distribution> NormalOutput::forward(torch::Tensor x)
    {
        auto loc = linear_loc(x);
        auto scale = scale_log.exp().expand_as(loc);
        return std::make_unique<Normal>(loc, scale);
    }

    TEST_CASE("BernoulliOutput")
    {
        auto output_layer = BernoulliOutput(3, 5);
        auto features = torch::rand({2, 3});

        SUBCASE("One draw per worker and action dimension")
        {
            auto dist = output_layer.forward(features);
            CHECK(dist->sample().sizes().vec() == std::vector<int64_t>{2, 5});
        }

        SUBCASE("Samples are binary")
        {
            auto sample = output_layer.forward(features)->sample({50});
            CHECK((sample == 0).logical_or(sample == 1).all().item().toBool());
        }
    }

    TEST_CASE("CategoricalOutput")
    {
        auto output_layer = CategoricalOutput(3, 5);
        auto features = torch::rand({2, 3});

        SUBCASE("One action index per worker")
        {
            auto dist = output_layer.forward(features);
            auto output = dist->sample();

            CHECK(output.sizes().vec() == std::vector<int64_t>{2});
            CHECK(output.min().item().toLong() >= 0);
            CHECK(output.max().item().toLong() < 5);
        }

        SUBCASE("Log probabilities carry gradients back to the layer")
        {
            auto dist = output_layer.forward(features);
            auto log_probs = dist->logProbability(torch::zeros({2}, torch::kLong));

            CHECK(log_probs.requires_grad());
        }
    }

    TEST_CASE("NormalOutput")
    {
        auto output_layer = NormalOutput(3, 5);

        SUBCASE("One action vector per worker")
        {
            auto dist = output_layer.forward(torch::rand({2, 3}));
            CHECK(dist->sample().sizes().vec() == std::vector<int64_t>{2, 5});
        }

        SUBCASE("Initial standard deviation is one")
        {
            // Entropy of a unit Gaussian is 0.5 + 0.5 ln(2 pi) per dimension
            auto entropy = output_layer.forward(torch::rand({2, 3}))->entropy();

            CHECK(entropy.sizes().vec() == std::vector<int64_t>{2});
            CHECK(entropy[0].item().toDouble() == doctest::Approx(5 * 1.4189385).epsilon(1e-4));
        }
    }
}

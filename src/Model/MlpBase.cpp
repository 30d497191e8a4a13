//
// Created by moinshaikh on 2/4/26.
//

#include<cmath>

#include<torch/torch.h>

#include"../../include/Model/MlpBase.hpp"
#include"../../include/Model/ModelUtils.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    /**
     * @brief Builds both branches and the value head.
     *
     * Actor:  tanh(W2 tanh(W1 x + b1) + b2)
     * Critic: Wc tanh(W2' tanh(W1' x + b1') + b2') + bc
     *
     * with x the flattened windowed state.
     */
    MlpBase::MlpBase(unsigned int numInputs, unsigned int hiddenSize, unsigned int valueSize) :
        NNBase(hiddenSize, valueSize),
        flatten(Flatten()),
        actor(nullptr),
        critic(nullptr),
        criticLinear(nullptr),
        numInputs(numInputs)
    {
        actor = torch::nn::Sequential(
            torch::nn::Linear(numInputs, hiddenSize),
            torch::nn::Functional(torch::tanh),
            torch::nn::Linear(hiddenSize, hiddenSize),
            torch::nn::Functional(torch::tanh));
        critic = torch::nn::Sequential(
            torch::nn::Linear(numInputs, hiddenSize),
            torch::nn::Functional(torch::tanh),
            torch::nn::Linear(hiddenSize, hiddenSize),
            torch::nn::Functional(torch::tanh));
        criticLinear = torch::nn::Linear(hiddenSize, valueSize);

        register_module("flatten", flatten);
        register_module("actor", actor);
        register_module("critic", critic);
        register_module("criticLinear", criticLinear);

        initWeights(actor->named_parameters(), std::sqrt(2.), 0);
        initWeights(critic->named_parameters(), std::sqrt(2.), 0);
        initWeights(criticLinear->named_parameters(), std::sqrt(2.), 0);

        train();
    }

    std::vector<torch::Tensor> MlpBase::forward(torch::Tensor state)
    {
        auto x = flatten->forward(state);
        auto hidden_critic = critic->forward(x);
        auto hidden_actor = actor->forward(x);

        return {criticLinear->forward(hidden_critic), hidden_actor};
    }

    TEST_CASE("MlpBase")
    {
        SUBCASE("Single-frame window")
        {
            auto base = MlpBase(5, 10);
            auto outputs = base.forward(torch::rand({4, 1, 5}));

            REQUIRE(outputs.size() == 2);

            // Critic
            CHECK(outputs[0].sizes().vec() == std::vector<int64_t>{4, 1});

            // Actor
            CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{4, 10});
        }

        SUBCASE("Stacked window is flattened into the input layer")
        {
            auto base = MlpBase(3 * 5, 10);
            auto outputs = base.forward(torch::rand({4, 3, 5}));

            CHECK(outputs[0].sizes().vec() == std::vector<int64_t>{4, 1});
            CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{4, 10});
        }

        SUBCASE("Vector valued critic")
        {
            auto base = MlpBase(5, 10, 3);
            auto outputs = base.forward(torch::rand({2, 1, 5}));

            CHECK(outputs[0].sizes().vec() == std::vector<int64_t>{2, 3});
        }

        SUBCASE("Actor features are bounded by tanh")
        {
            auto base = MlpBase(5, 10);
            auto outputs = base.forward(torch::rand({8, 1, 5}) * 100);

            CHECK(outputs[1].abs().max().item().toFloat() <= 1.0f);
        }
    }
}

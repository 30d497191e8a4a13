/**
 * @file Policy.cpp
 * @brief Actor-critic policy network and its default builder
 * @author moinshaikh
 * @date 2/6/26
 *
 * The policy couples a base network (MlpBase or CnnBase) with the output
 * layer matching the action space. It also owns the per-space conventions for
 * action shapes, log probabilities and entropies, so that the rollout
 * controller can treat every action space the same way:
 *
 * - Discrete: actions are [workers, 1] indices; the Categorical already
 *   yields one log probability and one entropy per worker.
 * - Box / MultiBinary: actions are [workers, dims]; per-dimension log
 *   probabilities and entropies are summed to one scalar per worker.
 */

#include<functional>
#include<numeric>
#include<stdexcept>
#include<vector>

#include<torch/torch.h>

#include"../../include/AgentConfig.hpp"
#include"../../include/Model/Policy.hpp"
#include"../../include/Model/CnnBase.hpp"
#include"../../include/Model/MlpBase.hpp"
#include"../../include/Model/OutputLayers.hpp"
#include"../../include/Space.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    /**
     * @throws std::runtime_error for an action space type without an output layer
     */
    PolicyImpl::PolicyImpl(ActionSpace actionSpace, std::shared_ptr<NNBase> base) :
        actionSpace(actionSpace),
        base(register_module("base", base))
    {
        if (actionSpace.shape.empty())
        {
            throw std::runtime_error("Action space has no shape");
        }

        int numOutput = actionSpace.shape[0];
        if (actionSpace.type == "Discrete")
        {
            outputLayer = std::make_shared<CategoricalOutput>(base->getOutputSize(), numOutput);
        }
        else if (actionSpace.type == "Box")
        {
            outputLayer = std::make_shared<NormalOutput>(base->getOutputSize(), numOutput);
        }
        else if (actionSpace.type == "MultiBinary")
        {
            outputLayer = std::make_shared<BernoulliOutput>(base->getOutputSize(), numOutput);
        }
        else
        {
            throw std::runtime_error("Unsupported action space type: " + actionSpace.type);
        }

        register_module("output", outputLayer);
    }

    PolicyOutput PolicyImpl::forward(torch::Tensor state)
    {
        auto base_output = base->forward(state);

        PolicyOutput output;
        output.value = base_output[0];
        output.distribution = outputLayer->forward(base_output[1]);
        return output;
    }

    torch::Tensor PolicyImpl::sampleAction(Distribution &distribution) const
    {
        auto action = distribution.sample();
        if (actionSpace.isDiscrete())
        {
            action = action.unsqueeze(-1);
        }
        return action;
    }

    torch::Tensor PolicyImpl::logProbability(Distribution &distribution, torch::Tensor action) const
    {
        if (actionSpace.isDiscrete())
        {
            return distribution.logProbability(action.squeeze(-1));
        }
        return distribution.logProbability(action).sum(-1);
    }

    torch::Tensor PolicyImpl::entropy(Distribution &distribution) const
    {
        auto entropies = distribution.entropy();
        // Normal already reduces over the action dimension
        if (actionSpace.type == "MultiBinary")
        {
            entropies = entropies.sum(-1);
        }
        return entropies;
    }

    Policy buildDefaultPolicy(const AgentConfig &config)
    {
        std::shared_ptr<NNBase> base;
        // The convolutional trunk only fits 84x84 frames; other grids are flattened
        if (config.observationShape == std::vector<int64_t>{CnnBase::frameSize, CnnBase::frameSize})
        {
            base = std::make_shared<CnnBase>(config.windowLength,
                                             config.hiddenSize,
                                             config.valueSize);
        }
        else
        {
            auto observationSize = std::accumulate(config.observationShape.begin(),
                                                   config.observationShape.end(),
                                                   static_cast<int64_t>(1),
                                                   std::multiplies<int64_t>());
            base = std::make_shared<MlpBase>(config.windowLength * observationSize,
                                             config.hiddenSize,
                                             config.valueSize);
        }

        Policy policy(config.actionSpace, base);
        policy->to(config.device);
        return policy;
    }

TEST_CASE("Policy")
{
    auto base = std::make_shared<MlpBase>(2 * 3, 10);

    SUBCASE("Discrete")
    {
        Policy policy(ActionSpace{"Discrete", {5}}, base);
        auto state = torch::rand({4, 2, 3});    // 4 workers, window of 2, 3 features

        SUBCASE("forward() returns a value per worker and a distribution")
        {
            auto output = policy->forward(state);

            INFO("Value: \n" << output.value << "\n");
            CHECK(output.value.sizes().vec() == std::vector<int64_t>{4, 1});
            REQUIRE(output.distribution != nullptr);
        }

        SUBCASE("Sampled actions have one row per worker")
        {
            auto output = policy->forward(state);
            auto action = policy->sampleAction(*output.distribution);

            INFO("Actions: \n" << action << "\n");
            CHECK(action.sizes().vec() == std::vector<int64_t>{4, 1});
        }

        SUBCASE("Log probabilities and entropies are one scalar per worker")
        {
            auto output = policy->forward(state);
            auto action = policy->sampleAction(*output.distribution);

            auto log_probs = policy->logProbability(*output.distribution, action);
            auto entropies = policy->entropy(*output.distribution);

            CHECK(log_probs.sizes().vec() == std::vector<int64_t>{4});
            CHECK(entropies.sizes().vec() == std::vector<int64_t>{4});
            CHECK(log_probs.max().item().toFloat() <= 0);
            CHECK(log_probs.requires_grad());
        }
    }

    SUBCASE("Box")
    {
        Policy policy(ActionSpace{"Box", {2}}, base);
        auto output = policy->forward(torch::rand({4, 2, 3}));
        auto action = policy->sampleAction(*output.distribution);

        CHECK(action.sizes().vec() == std::vector<int64_t>{4, 2});
        CHECK(policy->logProbability(*output.distribution, action).sizes().vec() == std::vector<int64_t>{4});
        CHECK(policy->entropy(*output.distribution).sizes().vec() == std::vector<int64_t>{4});
    }

    SUBCASE("MultiBinary")
    {
        Policy policy(ActionSpace{"MultiBinary", {3}}, base);
        auto output = policy->forward(torch::rand({4, 2, 3}));
        auto action = policy->sampleAction(*output.distribution);

        CHECK(action.sizes().vec() == std::vector<int64_t>{4, 3});
        CHECK(policy->logProbability(*output.distribution, action).sizes().vec() == std::vector<int64_t>{4});
        CHECK(policy->entropy(*output.distribution).sizes().vec() == std::vector<int64_t>{4});
    }

    SUBCASE("Unknown action space type is rejected")
    {
        ActionSpace tuple_space{"Tuple", {2}};
        CHECK_THROWS_AS(Policy(tuple_space, base), std::runtime_error);
    }
}

TEST_CASE("buildDefaultPolicy")
{
    AgentConfig config;
    config.actionSpace = ActionSpace{"Discrete", {3}};
    config.numWorkers = 2;
    config.windowLength = 4;

    SUBCASE("Vector observations get a fully connected base over the window")
    {
        config.observationShape = {5};
        auto policy = buildDefaultPolicy(config);
        auto output = policy->forward(torch::rand({2, 4, 5}));

        CHECK(output.value.sizes().vec() == std::vector<int64_t>{2, 1});
    }

    SUBCASE("Frames get a convolutional base with the window as channels")
    {
        config.observationShape = {84, 84};
        config.hiddenSize = 32;
        auto policy = buildDefaultPolicy(config);
        auto output = policy->forward(torch::rand({2, 4, 84, 84}));

        CHECK(output.value.sizes().vec() == std::vector<int64_t>{2, 1});
    }

    SUBCASE("Small grids fall back to the fully connected base")
    {
        config.observationShape = {10, 10};
        auto policy = buildDefaultPolicy(config);

        torch::Tensor value;
        CHECK_NOTHROW(value = policy->forward(torch::rand({2, 4, 10, 10})).value);
        CHECK(value.sizes().vec() == std::vector<int64_t>{2, 1});
    }

    SUBCASE("Value head width follows the config")
    {
        config.observationShape = {5};
        config.valueSize = 3;
        auto policy = buildDefaultPolicy(config);

        CHECK(policy->getValueSize() == 3);
        CHECK(policy->forward(torch::rand({2, 4, 5})).value.size(1) == 3);
    }
}
}

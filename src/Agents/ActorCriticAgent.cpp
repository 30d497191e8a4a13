/**
 * @file ActorCriticAgent.cpp
 * @brief Rollout orchestration and advantage aggregation for actor-critic agents
 * @author moinshaikh
 * @date 3/5/26
 *
 * The agent keeps three pieces of state in step:
 *
 * - the experience store, written in two phases: predict() opens a timestep
 *   and caches value, log probability and entropy; observe() commits the
 *   outcome into the same slot;
 * - the episodic tracker, fed with the raw rewards of every observe();
 * - the bootstrap observation set by setNewObservation(), used once per
 *   rollout to estimate the value after the last stored step.
 */

#include<memory>
#include<sstream>
#include<stdexcept>
#include<utility>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Agents/ActorCriticAgent.hpp"
#include"../../include/AdvantageEstimator.hpp"
#include"../../include/Processor/FrameScaler.hpp"
#include"../../include/Telemetry/SpdlogTelemetrySink.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    namespace
    {
        const AgentConfig &validated(const AgentConfig &config)
        {
            config.validate();
            return config;
        }

        Policy buildPolicy(const PolicyBuilder &policyBuilder, const AgentConfig &config)
        {
            if (!policyBuilder)
            {
                throw std::invalid_argument("ActorCriticAgent needs a policy builder");
            }
            auto policy = policyBuilder(config);
            policy->to(config.device);
            return policy;
        }

        /// One value per worker: [workers] passes through, [workers, valueSize] is summed
        torch::Tensor reduceValue(const torch::Tensor &value)
        {
            return value.dim() == 1 ? value : value.sum(-1);
        }
    }

    ActorCriticAgent::ActorCriticAgent(AgentConfig config,
        PolicyBuilder policyBuilder,
        std::shared_ptr<FeatureProcessor> processor,
        std::shared_ptr<TelemetrySink> telemetry) :
        config(validated(config)),
        policy(buildPolicy(policyBuilder, this->config)),
        optimizer(std::make_unique<torch::optim::Adam>(policy->parameters(),
                                                       torch::optim::AdamOptions(this->config.learningRate))),
        processor(std::move(processor)),
        telemetry(telemetry ? std::move(telemetry)
                            : std::make_shared<SpdlogTelemetrySink>(this->config.logDirectory)),
        store(this->config.numFramesPerProc,
              this->config.numWorkers,
              this->config.observationShape,
              this->config.actionSpace,
              this->config.windowLength,
              this->config.device),
        tracker(this->config.numWorkers, this->config.smoothLength, this->telemetry)
    {
        // Processors with state (running statistics) live next to the observations
        if (auto module = std::dynamic_pointer_cast<torch::nn::Module>(this->processor))
        {
            module->to(this->config.device);
        }

        spdlog::info("Actor-critic agent: {} workers, horizon {}, window {}, {} action space",
                     this->config.numWorkers,
                     this->config.numFramesPerProc,
                     this->config.windowLength,
                     this->config.actionSpace.type);
    }

    torch::Tensor ActorCriticAgent::processObservations(torch::Tensor observations) const
    {
        if (processor)
        {
            return processor->process(observations);
        }
        return observations;
    }

    torch::Tensor ActorCriticAgent::shapeRewards(torch::Tensor rewards) const
    {
        if (!config.rewardShaper)
        {
            return rewards;
        }

        auto shaped = rewards.detach().to(torch::kCPU, torch::kFloat).contiguous().clone();
        auto data = shaped.data_ptr<float>();
        for (int64_t i = 0; i < shaped.numel(); ++i)
        {
            data[i] = config.rewardShaper(data[i]);
        }
        return shaped;
    }

    void ActorCriticAgent::reportScalar(const std::string &tag, double value, int64_t step)
    {
        try
        {
            telemetry->addScalar(tag, value, step);
        }
        catch (const std::exception &e)
        {
            spdlog::warn("Telemetry for {} at step {} failed: {}", tag, step, e.what());
        }
    }

    torch::Tensor ActorCriticAgent::predict(torch::Tensor observations, bool training)
    {
        auto state = store.getRecentState(processObservations(observations));

        if (!training)
        {
            torch::NoGradGuard no_grad;
            auto output = policy->forward(state);
            return policy->sampleAction(*output.distribution).cpu();
        }

        auto output = policy->forward(state);
        auto action = policy->sampleAction(*output.distribution);
        auto log_prob = policy->logProbability(*output.distribution, action);
        auto entropy = policy->entropy(*output.distribution);

        auto handle = store.beginTimestep();
        store.storeStatistics(handle, output.value, log_prob, entropy);
        pendingTimestep = handle;

        return action.detach().cpu();
    }

    void ActorCriticAgent::observe(torch::Tensor observations,
        torch::Tensor actions,
        torch::Tensor rewards,
        torch::Tensor terminals,
        const std::vector<StepInfo> &info,
        bool training)
    {
        if (!info.empty() && static_cast<int64_t>(info.size()) != config.numWorkers)
        {
            throw std::invalid_argument("Got info for " + std::to_string(info.size()) + " workers, expected " +
                                        std::to_string(config.numWorkers));
        }

        auto processed = processObservations(observations);
        auto shaped_rewards = shapeRewards(rewards);

        if (training)
        {
            if (!pendingTimestep)
            {
                throw std::logic_error("observe() needs a preceding predict() with training enabled");
            }
            store.commit(*pendingTimestep, processed, actions, shaped_rewards, terminals);
            pendingTimestep.reset();

            if (processor)
            {
                processor->update(observations);
            }
        }
        else
        {
            store.append(processed, actions, shaped_rewards, terminals, false);
        }

        tracker.record(actions, rewards, terminals);
    }

    void ActorCriticAgent::setNewObservation(torch::Tensor observations)
    {
        newObservation = processObservations(observations);
    }

    torch::Tensor ActorCriticAgent::getNewestState() const
    {
        if (!newObservation.defined())
        {
            throw std::logic_error("No new observation set; call setNewObservation() after the last observe()");
        }
        return store.getRecentState(newObservation);
    }

    AggregatedExperiences ActorCriticAgent::aggregateExperiences()
    {
        if (!store.isFull())
        {
            throw std::logic_error("Cannot aggregate a partial rollout: " + std::to_string(store.size()) + " of " +
                                   std::to_string(store.capacity()) + " steps stored");
        }

        auto newest_state = getNewestState();
        auto batch = store.sample();
        auto values = batch.values.sum(-1);

        torch::Tensor bootstrap_value;
        {
            torch::NoGradGuard no_grad;
            bootstrap_value = reduceValue(policy->forward(newest_state).value);
        }

        auto deltas = computeTemporalDifferences(batch.rewards, batch.terminals, values, bootstrap_value);
        auto advantages = computeAdvantages(deltas, config.discount, config.gaeLambda);

        store.reset();
        newObservation = torch::Tensor();

        spdlog::debug("Aggregated rollout of {} steps, mean advantage {:.4f}",
                      advantages.size(0), advantages.mean().item<float>());

        return {advantages, batch.logProbs, batch.entropies};
    }

    namespace
    {
        class RolloutOnlyAgent : public ActorCriticAgent
        {
        public:
            using ActorCriticAgent::ActorCriticAgent;

            std::vector<UpdateDatum> fit() override
            {
                aggregateExperiences();
                return {};
            }
        };

        /**
         * Value of a [workers, 2, 1] state: the newest frame in the first
         * column, the frame before it in the second, so the agent's sum over
         * the value head is the sum of the whole window.
         */
        class WindowSumBase : public NNBase
        {
        private:
            bool flatValue;

        public:
            explicit WindowSumBase(bool flatValue = false) : NNBase(2, flatValue ? 1 : 2), flatValue(flatValue)
            {
            }

            std::vector<torch::Tensor> forward(torch::Tensor state) override
            {
                auto newest = state.select(1, -1).sum(-1);
                auto previous = state.select(1, 0).sum(-1);
                auto features = torch::stack({newest, previous}, -1);
                if (flatValue)
                {
                    return {newest + previous, features};
                }
                return {features, features};
            }
        };

        struct DeviceRecordingProcessor : public torch::nn::Module, public FeatureProcessor
        {
            std::vector<torch::Device> devices;

            using torch::nn::Module::to;

            void to(torch::Device device, bool non_blocking) override
            {
                devices.push_back(device);
                torch::nn::Module::to(device, non_blocking);
            }

            torch::Tensor process(torch::Tensor raw) override
            {
                return raw;
            }
        };

        AgentConfig makeWindowConfig(bool flatValue)
        {
            AgentConfig config;
            config.observationShape = {1};
            config.actionSpace = ActionSpace{"Discrete", {2}};
            config.numWorkers = 2;
            config.numFramesPerProc = 3;
            config.windowLength = 2;
            config.valueSize = flatValue ? 1 : 2;
            return config;
        }

        AgentConfig makeTestConfig()
        {
            AgentConfig config;
            config.observationShape = {3};
            config.actionSpace = ActionSpace{"Discrete", {2}};
            config.numWorkers = 2;
            config.numFramesPerProc = 3;
            config.hiddenSize = 8;
            return config;
        }
    }

    TEST_CASE("ActorCriticAgent")
    {
        torch::manual_seed(0);
        auto config = makeTestConfig();
        RolloutOnlyAgent agent(config, buildDefaultPolicy, nullptr, std::make_shared<NullTelemetrySink>());

        auto observations = torch::rand({2, 3});
        auto no_terminals = torch::zeros({2});

        auto step = [&agent, &observations, &no_terminals]() {
            auto actions = agent.predict(observations);
            agent.observe(observations, actions, torch::ones({2}), no_terminals);
            return actions;
        };

        SUBCASE("predict() returns detached CPU actions, one row per worker")
        {
            auto actions = agent.predict(observations);

            CHECK(actions.sizes().vec() == std::vector<int64_t>{2, 1});
            CHECK(actions.device().is_cpu());
            CHECK_FALSE(actions.requires_grad());
        }

        SUBCASE("Each observe() commits one timestep")
        {
            step();
            CHECK(agent.getStore().size() == 1);
            step();
            step();
            CHECK(agent.isRolloutFull());
        }

        SUBCASE("observe() without predict() is rejected")
        {
            CHECK_THROWS_AS(agent.observe(observations, torch::zeros({2, 1}), torch::ones({2}), no_terminals),
                            std::logic_error);
        }

        SUBCASE("predict() twice without observe() is rejected")
        {
            agent.predict(observations);
            CHECK_THROWS_AS(agent.predict(observations), std::logic_error);
        }

        SUBCASE("A full horizon accepts no further timesteps")
        {
            step();
            step();
            step();
            CHECK_THROWS_AS(agent.predict(observations), std::logic_error);
        }

        SUBCASE("Aggregation needs a full horizon")
        {
            step();
            agent.setNewObservation(observations);
            CHECK_THROWS_AS(agent.aggregateExperiences(), std::logic_error);
        }

        SUBCASE("Aggregation needs a bootstrap observation")
        {
            step();
            step();
            step();
            CHECK_THROWS_AS(agent.aggregateExperiences(), std::logic_error);
            CHECK_THROWS_AS(agent.getNewestState(), std::logic_error);
        }

        SUBCASE("Aggregation yields time-major tensors and empties the store")
        {
            step();
            step();
            step();
            agent.setNewObservation(observations);
            auto experiences = agent.aggregateExperiences();

            CHECK(experiences.advantages.sizes().vec() == std::vector<int64_t>{3, 2});
            CHECK(experiences.logProbs.sizes().vec() == std::vector<int64_t>{3, 2});
            CHECK(experiences.entropies.sizes().vec() == std::vector<int64_t>{3, 2});
            CHECK(experiences.advantages.requires_grad());
            CHECK(agent.getStore().size() == 0);

            // The bootstrap observation is consumed with the rollout
            CHECK_THROWS_AS(agent.getNewestState(), std::logic_error);

            step();
            CHECK(agent.getStore().size() == 1);
        }

        SUBCASE("Evaluation steps leave the horizon alone")
        {
            auto actions = agent.predict(observations, false);
            agent.observe(observations, actions, torch::ones({2}), no_terminals, {}, false);

            CHECK(agent.getStore().size() == 0);
            CHECK_FALSE(agent.getStore().hasPendingTimestep());
            CHECK(agent.getTracker().getRecordStep() == 1);
        }

        SUBCASE("Terminals reach the tracker")
        {
            auto actions = agent.predict(observations);
            agent.observe(observations, actions, torch::ones({2}), torch::tensor({1.f, 0.f}));

            CHECK(agent.getTracker().getAccumulator(0).episodeIndex == 1);
            CHECK(agent.getTracker().getAccumulator(0).rewards.empty());
            CHECK(agent.getTracker().getAccumulator(1).rewards.size() == 1);
        }

        SUBCASE("Info must cover every worker")
        {
            auto actions = agent.predict(observations);
            std::vector<StepInfo> info(3);
            CHECK_THROWS_AS(agent.observe(observations, actions, torch::ones({2}), no_terminals, info),
                            std::invalid_argument);
        }
    }

    TEST_CASE("ActorCriticAgent reward shaping and processing")
    {
        torch::manual_seed(0);
        auto config = makeTestConfig();
        config.rewardShaper = [](float reward) { return reward * 10; };
        RolloutOnlyAgent agent(config, buildDefaultPolicy, std::make_shared<FrameScaler>(2),
                               std::make_shared<NullTelemetrySink>());

        auto observations = torch::full({2, 3}, 4.f);

        SUBCASE("Store receives shaped rewards, tracker raw ones")
        {
            for (int i = 0; i < 3; ++i)
            {
                auto actions = agent.predict(observations);
                agent.observe(observations, actions, torch::ones({2}), torch::zeros({2}));
            }

            auto batch = agent.getStore().sample();
            CHECK(batch.rewards[0][0].item().toFloat() == doctest::Approx(10));
            CHECK(agent.getTracker().getAccumulator(0).rewards[0] == doctest::Approx(1));
        }

        SUBCASE("Observations are processed before they are stored")
        {
            auto actions = agent.predict(observations);
            agent.observe(observations, actions, torch::ones({2}), torch::zeros({2}));
            agent.setNewObservation(observations);

            auto state = agent.getNewestState();
            CHECK(state.sizes().vec() == std::vector<int64_t>{2, 1, 3});
            CHECK(state[0][0][0].item().toFloat() == doctest::Approx(2));
        }
    }

    TEST_CASE("ActorCriticAgent bootstraps from the newest state")
    {
        for (bool flat_value : {false, true})
        {
            CAPTURE(flat_value);
            auto config = makeWindowConfig(flat_value);
            PolicyBuilder builder = [flat_value](const AgentConfig &agentConfig) {
                return Policy(agentConfig.actionSpace, std::make_shared<WindowSumBase>(flat_value));
            };
            RolloutOnlyAgent agent(config, builder, nullptr, std::make_shared<NullTelemetrySink>());

            // Worker 1 finishes its episode on the last step
            auto rewards = torch::tensor({{1.f, 0.f}, {1.f, 0.f}, {1.f, 5.f}});
            auto terminals = torch::tensor({{0.f, 0.f}, {0.f, 0.f}, {0.f, 1.f}});
            auto observations = torch::tensor({{1.f, 2.f}, {3.f, 4.f}, {5.f, 6.f}});
            for (int64_t t = 0; t < 3; ++t)
            {
                auto actions = agent.predict(observations[t].unsqueeze(-1));
                agent.observe(observations[t].unsqueeze(-1), actions, rewards[t], terminals[t]);
            }
            agent.setNewObservation(torch::tensor({{7.f}, {8.f}}));

            // Cached values sum the window [previous, current]
            auto values = torch::tensor({{1.f, 2.f}, {4.f, 6.f}, {8.f, 10.f}});
            // Worker 0 sees [5, 7]; worker 1's window was cleared by its terminal, [0, 8]
            auto bootstrap = torch::tensor({12.f, 8.f});

            auto experiences = agent.aggregateExperiences();
            auto expected = computeAdvantages(computeTemporalDifferences(rewards, terminals, values, bootstrap),
                                              config.discount, config.gaeLambda);

            INFO("Advantages: \n" << experiences.advantages);
            CHECK(torch::allclose(experiences.advantages.detach(), expected));

            // Last step: 1 + 12 - 8 for worker 0, the terminal drops worker 1's bootstrap: 5 - 10
            CHECK(experiences.advantages[2][0].item().toFloat() == doctest::Approx(5));
            CHECK(experiences.advantages[2][1].item().toFloat() == doctest::Approx(-5));
        }
    }

    TEST_CASE("ActorCriticAgent moves module processors to the config device")
    {
        auto processor = std::make_shared<DeviceRecordingProcessor>();
        RolloutOnlyAgent agent(makeTestConfig(), buildDefaultPolicy, processor,
                               std::make_shared<NullTelemetrySink>());

        REQUIRE(processor->devices.size() == 1);
        CHECK(processor->devices[0] == agent.getConfig().device);
    }

    TEST_CASE("ActorCriticAgent rejects bad configurations")
    {
        auto config = makeTestConfig();
        auto null_sink = std::make_shared<NullTelemetrySink>();

        SUBCASE("Invalid horizon")
        {
            config.numFramesPerProc = 0;
            CHECK_THROWS_AS(RolloutOnlyAgent(config, buildDefaultPolicy, nullptr, null_sink),
                            std::invalid_argument);
        }

        SUBCASE("Unknown action space")
        {
            config.actionSpace.type = "Dict";
            CHECK_THROWS_AS(RolloutOnlyAgent(config, buildDefaultPolicy, nullptr, null_sink),
                            std::runtime_error);
        }

        SUBCASE("Missing policy builder")
        {
            CHECK_THROWS_AS(RolloutOnlyAgent(config, PolicyBuilder(), nullptr, null_sink),
                            std::invalid_argument);
        }
    }
}

/**
 * @file A2CAgent.cpp
 * @brief Synchronous advantage actor-critic update
 * @author moinshaikh
 * @date 2/7/26
 *
 * Advantages come straight from the GAE aggregation of the rollout. They are
 * not normalized. The critic is trained on the squared advantage, which is
 * the squared distance between the cached value and its GAE target.
 */

#include<memory>
#include<string>
#include<utility>
#include<vector>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../../include/Agents/A2CAgent.hpp"
#include"../../include/Agents/ActorCriticAgent.hpp"
#include"../../include/Telemetry/TelemetrySink.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    A2CAgent::A2CAgent(AgentConfig config,
        PolicyBuilder policyBuilder,
        std::shared_ptr<FeatureProcessor> processor,
        std::shared_ptr<TelemetrySink> telemetry) :
        ActorCriticAgent(std::move(config), std::move(policyBuilder), std::move(processor), std::move(telemetry)),
        fitStep(0)
    {
    }

    void A2CAgent::pushRecord(std::deque<float> &record, float value)
    {
        record.push_back(value);
        if (static_cast<int64_t>(record.size()) > config.smoothLength)
        {
            record.pop_front();
        }
    }

    std::vector<UpdateDatum> A2CAgent::fit()
    {
        auto experiences = aggregateExperiences();

        auto actor_loss = -(experiences.logProbs * experiences.advantages.detach()).mean();
        auto critic_loss = experiences.advantages.pow(2).mean();
        auto entropy = experiences.entropies.mean();
        auto loss = actor_loss + config.valueLossCoef * critic_loss - config.entropyCoef * entropy;

        optimizer->zero_grad();
        loss.backward();
        torch::nn::utils::clip_grad_norm_(policy->parameters(), config.maxGradNorm);
        optimizer->step();

        std::vector<UpdateDatum> data{{"Loss", loss.item().toFloat()},
                                      {"Actor loss", actor_loss.item().toFloat()},
                                      {"Critic loss", critic_loss.item().toFloat()},
                                      {"Entropy", entropy.item().toFloat()}};

        pushRecord(lossRecord, data[0].value);
        pushRecord(actorLossRecord, data[1].value);
        pushRecord(criticLossRecord, data[2].value);
        pushRecord(entropyRecord, data[3].value);

        reportScalar("data/loss", data[0].value, fitStep);
        reportScalar("data/actor_loss", data[1].value, fitStep);
        reportScalar("data/critic_loss", data[2].value, fitStep);
        reportScalar("data/entropy", data[3].value, fitStep);

        spdlog::debug("Update {}: loss {:.4f}", fitStep, data[0].value);
        fitStep++;
        return data;
    }

    namespace
    {
        struct ScalarRecorder : public TelemetrySink
        {
            std::vector<std::string> tags;

            void addScalar(const std::string &tag, double value, int64_t step) override
            {
                tags.push_back(tag);
            }

            void addHistogram(const std::string &tag, torch::Tensor values, int64_t step) override
            {
            }
        };

        AgentConfig makeBanditConfig()
        {
            AgentConfig config;
            config.observationShape = {1};
            config.actionSpace = ActionSpace{"Discrete", {2}};
            config.numWorkers = 2;
            config.numFramesPerProc = 5;
            config.hiddenSize = 5;
            config.learningRate = 1e-2;
            config.smoothLength = 3;
            return config;
        }

        void runRollout(A2CAgent &agent, bool rewardMatching)
        {
            for (int j = 0; j < 5; ++j)
            {
                auto observation = torch::randint(0, 2, {2, 1}).to(torch::kFloat);
                auto actions = agent.predict(observation);

                // Either reward equals the action or +1 for copying the observation, -1 otherwise
                auto rewards = rewardMatching
                    ? (actions.to(torch::kLong) == observation.to(torch::kLong)).to(torch::kFloat) * 2 - 1
                    : actions.to(torch::kFloat);
                agent.observe(observation, actions, rewards.view({2}), torch::zeros({2}));
            }
            agent.setNewObservation(torch::randint(0, 2, {2, 1}).to(torch::kFloat));
        }

        float probabilityOfAction(A2CAgent &agent, float observation, int64_t action)
        {
            torch::NoGradGuard no_grad;
            auto &policy = agent.getPolicy();
            auto output = policy->forward(torch::full({2, 1, 1}, observation));
            auto log_prob = policy->logProbability(*output.distribution, torch::full({2, 1}, action, torch::kLong));
            return log_prob.exp()[0].item().toFloat();
        }
    }

    TEST_CASE("A2CAgent")
    {
        torch::manual_seed(0);
        auto recorder = std::make_shared<ScalarRecorder>();
        A2CAgent agent(makeBanditConfig(), buildDefaultPolicy, nullptr, recorder);

        SUBCASE("fit() needs a full rollout")
        {
            CHECK_THROWS_AS(agent.fit(), std::logic_error);
        }

        SUBCASE("fit() reports every loss term and clears the rollout")
        {
            runRollout(agent, false);
            auto data = agent.fit();

            REQUIRE(data.size() == 4);
            CHECK(data[0].name == "Loss");
            CHECK(data[1].name == "Actor loss");
            CHECK(data[2].name == "Critic loss");
            CHECK(data[3].name == "Entropy");
            CHECK(data[2].value >= 0);

            CHECK(agent.getStore().size() == 0);
            CHECK(agent.getFitStep() == 1);
            CHECK(recorder->tags == std::vector<std::string>{"data/loss", "data/actor_loss",
                                                             "data/critic_loss", "data/entropy"});
        }

        SUBCASE("fit() moves the parameters")
        {
            std::vector<torch::Tensor> before;
            for (const auto &parameter : agent.getPolicy()->parameters())
            {
                before.push_back(parameter.detach().clone());
            }

            runRollout(agent, false);
            agent.fit();

            bool changed = false;
            auto after = agent.getPolicy()->parameters();
            for (size_t i = 0; i < before.size(); ++i)
            {
                changed = changed || !torch::equal(before[i], after[i].detach());
            }
            CHECK(changed);
        }

        SUBCASE("Smoothed loss records are bounded")
        {
            for (int i = 0; i < 5; ++i)
            {
                runRollout(agent, false);
                agent.fit();
            }

            CHECK(agent.getLossRecord().size() == 3);
            CHECK(agent.getEntropyRecord().size() == 3);
            CHECK(agent.getFitStep() == 5);
        }

        SUBCASE("Learns to prefer the rewarded action")
        {
            auto pre_training = probabilityOfAction(agent, 1, 1);
            for (int i = 0; i < 30; ++i)
            {
                runRollout(agent, false);
                agent.fit();
            }
            auto post_training = probabilityOfAction(agent, 1, 1);

            INFO("Pre-training probability: " << pre_training);
            INFO("Post-training probability: " << post_training);
            CHECK(post_training > pre_training);
        }

        SUBCASE("Learns to copy the observation")
        {
            for (int i = 0; i < 100; ++i)
            {
                runRollout(agent, true);
                agent.fit();
            }

            INFO("P(1 | 1): " << probabilityOfAction(agent, 1, 1));
            INFO("P(1 | 0): " << probabilityOfAction(agent, 0, 1));
            CHECK(probabilityOfAction(agent, 1, 1) > probabilityOfAction(agent, 0, 1));
        }
    }
}

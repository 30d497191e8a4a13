#pragma once

//
// Created by moinshaikh on 3/5/26.
//

#ifndef ROLLOUTENGINE_ACTORCRITICAGENT_HPP
#define ROLLOUTENGINE_ACTORCRITICAGENT_HPP

#include<memory>
#include<optional>
#include<vector>

#include<torch/torch.h>

#include"Agent.hpp"
#include"../AgentConfig.hpp"
#include"../EpisodicTracker.hpp"
#include"../ExperienceStore.hpp"
#include"../Model/Policy.hpp"
#include"../Processor/FeatureProcessor.hpp"
#include"../Telemetry/TelemetrySink.hpp"

namespace RolloutEngine
{
    /**
     * @class ActorCriticAgent
     * @brief Rollout controller shared by on-policy actor-critic agents
     *
     * Owns the policy, its Adam optimizer, the experience store and the
     * episodic tracker. It drives the predict -> observe cycle, and once the
     * horizon is full turns the rollout into GAE advantages with
     * aggregateExperiences(). How those advantages become a parameter update
     * is left to fit() in the concrete agent.
     *
     * A typical driver step:
     *
     * @code
     * auto actions = agent.predict(observations);
     * // step the environments with actions
     * agent.observe(observations, actions, rewards, terminals);
     * agent.setNewObservation(next_observations);
     * if (agent.isRolloutFull()) agent.fit();
     * @endcode
     */
    class ActorCriticAgent : public Agent
    {
    protected:
        AgentConfig config;
        Policy policy;
        std::unique_ptr<torch::optim::Adam> optimizer;
        std::shared_ptr<FeatureProcessor> processor;
        std::shared_ptr<TelemetrySink> telemetry;
        ExperienceStore store;
        EpisodicTracker tracker;

        std::optional<TimestepHandle> pendingTimestep;
        torch::Tensor newObservation;

        torch::Tensor processObservations(torch::Tensor observations) const;
        torch::Tensor shapeRewards(torch::Tensor rewards) const;

        /** @brief Forwards a scalar to telemetry, logging instead of throwing on failure */
        void reportScalar(const std::string &tag, double value, int64_t step);

    public:
        /**
         * @param config Validated before anything is built
         * @param policyBuilder Builds the network from the config
         * @param processor Optional observation transform; moved to config.device when it is a torch module
         * @param telemetry Telemetry destination; a SpdlogTelemetrySink under
         *                  config.logDirectory when null
         * @throws std::invalid_argument for an invalid config
         * @throws std::runtime_error for an unsupported action space
         */
        explicit ActorCriticAgent(AgentConfig config,
            PolicyBuilder policyBuilder = buildDefaultPolicy,
            std::shared_ptr<FeatureProcessor> processor = nullptr,
            std::shared_ptr<TelemetrySink> telemetry = nullptr);

        torch::Tensor predict(torch::Tensor observations, bool training = true) override;

        /**
         * @throws std::logic_error when training without a preceding predict()
         * @throws std::invalid_argument if a per-worker array does not match the worker count
         */
        void observe(torch::Tensor observations,
            torch::Tensor actions,
            torch::Tensor rewards,
            torch::Tensor terminals,
            const std::vector<StepInfo> &info = {},
            bool training = true) override;

        /**
         * @brief Remembers the observation that follows the last stored transition.
         *
         * Used only to bootstrap the value of the last step; it is never stored.
         */
        void setNewObservation(torch::Tensor observations);

        /**
         * @throws std::logic_error if no new observation was set
         */
        torch::Tensor getNewestState() const;

        /**
         * @brief Advantages, log probabilities and entropies of the full rollout.
         *
         * Empties the store and forgets the bootstrap observation.
         *
         * @throws std::logic_error if the horizon is not full or no new observation was set
         */
        AggregatedExperiences aggregateExperiences() override;

        inline bool isRolloutFull() const
        {
            return store.isFull();
        }

        inline Policy &getPolicy()
        {
            return policy;
        }

        inline const AgentConfig &getConfig() const
        {
            return config;
        }

        inline const ExperienceStore &getStore() const
        {
            return store;
        }

        inline const EpisodicTracker &getTracker() const
        {
            return tracker;
        }
    };
}

#endif //ROLLOUTENGINE_ACTORCRITICAGENT_HPP

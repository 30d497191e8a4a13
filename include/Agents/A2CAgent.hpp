#pragma once

//
// Created by moinshaikh on 1/28/26.
//

#ifndef ROLLOUTENGINE_A2CAGENT_HPP
#define ROLLOUTENGINE_A2CAGENT_HPP

#include<deque>
#include<memory>
#include<vector>

#include<torch/torch.h>

#include"ActorCriticAgent.hpp"

namespace RolloutEngine
{
    /**
     * @class A2CAgent
     * @brief Synchronous advantage actor-critic
     *
     * One gradient step per full rollout on
     *
     *     loss = actor + valueLossCoef * critic - entropyCoef * entropy
     *     actor  = -mean(logProb * stopgrad(advantage))
     *     critic = mean(advantage^2)
     *
     * with the gradient norm clipped to maxGradNorm before the Adam step.
     */
    class A2CAgent : public ActorCriticAgent
    {
    private:
        std::deque<float> lossRecord;
        std::deque<float> actorLossRecord;
        std::deque<float> criticLossRecord;
        std::deque<float> entropyRecord;
        int64_t fitStep;

        void pushRecord(std::deque<float> &record, float value);

    public:
        explicit A2CAgent(AgentConfig config,
            PolicyBuilder policyBuilder = buildDefaultPolicy,
            std::shared_ptr<FeatureProcessor> processor = nullptr,
            std::shared_ptr<TelemetrySink> telemetry = nullptr);

        /**
         * @brief Consumes the full rollout and updates the policy.
         *
         * @return Loss, actor loss, critic loss and entropy of this update
         * @throws std::logic_error if the horizon is not full or no new observation was set
         */
        std::vector<UpdateDatum> fit() override;

        /** @brief Number of completed fit() calls */
        inline int64_t getFitStep() const
        {
            return fitStep;
        }

        /** @brief Losses of the last smoothLength updates, oldest first */
        inline const std::deque<float> &getLossRecord() const
        {
            return lossRecord;
        }

        inline const std::deque<float> &getActorLossRecord() const
        {
            return actorLossRecord;
        }

        inline const std::deque<float> &getCriticLossRecord() const
        {
            return criticLossRecord;
        }

        inline const std::deque<float> &getEntropyRecord() const
        {
            return entropyRecord;
        }
    };
}

#endif //ROLLOUTENGINE_A2CAGENT_HPP

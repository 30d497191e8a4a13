#pragma once

//
// Created by moinshaikh on 1/28/26.
//

#ifndef ROLLOUTENGINE_AGENT_HPP
#define ROLLOUTENGINE_AGENT_HPP

#include<map>
#include<string>
#include<vector>

#include<torch/torch.h>

namespace RolloutEngine
{
    /**
     * @brief One named training statistic returned by Agent::fit()
     */
    struct UpdateDatum
    {
        std::string name;
        float value;
    };

    /** @brief Extra per-worker data an environment reports with a step */
    using StepInfo = std::map<std::string, float>;

    /**
     * @brief Training inputs derived from one full rollout, each [T, workers]
     *
     * logProbs and entropies are the statistics cached at action time;
     * advantages are differentiable through the cached values.
     */
    struct AggregatedExperiences
    {
        torch::Tensor advantages;
        torch::Tensor logProbs;
        torch::Tensor entropies;
    };

    /**
     * @brief What a training driver sees of an on-policy agent
     *
     * Every step of a driver loop is one predict() followed by exactly one
     * observe() for all workers at once. Once the rollout horizon is full,
     * fit() (or aggregateExperiences() for drivers that compute their own
     * loss) consumes it.
     */
    class Agent
    {
    public:
        virtual ~Agent() = 0;

        /**
         * @param observations Raw observations [workers, observation...]
         * @param training Cache the statistics needed for the next update
         * @return Sampled actions on the CPU, one row per worker
         */
        virtual torch::Tensor predict(torch::Tensor observations, bool training = true) = 0;

        /**
         * @param observations The observations predict() was called with
         * @param actions The actions predict() returned
         * @param rewards One reward per worker
         * @param terminals One flag per worker
         * @param info Optional per-worker environment info
         * @param training Store the transition for the next update
         */
        virtual void observe(torch::Tensor observations,
            torch::Tensor actions,
            torch::Tensor rewards,
            torch::Tensor terminals,
            const std::vector<StepInfo> &info = {},
            bool training = true) = 0;

        virtual AggregatedExperiences aggregateExperiences() = 0;

        virtual std::vector<UpdateDatum> fit() = 0;
    };
    inline Agent::~Agent() {}
}


#endif //ROLLOUTENGINE_AGENT_HPP

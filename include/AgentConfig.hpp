#pragma once
//
// Created by moinshaikh on 3/2/26.
//

#ifndef ROLLOUTENGINE_AGENTCONFIG_HPP
#define ROLLOUTENGINE_AGENTCONFIG_HPP

#include<functional>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"Space.hpp"

namespace RolloutEngine
{
    /** @brief Optional transform applied to rewards before they are stored for training */
    using RewardShaper = std::function<float(float)>;

    /**
     * @brief Hyperparameters and shapes shared by every actor-critic agent
     *
     * Holds everything an agent needs at construction time. Default values
     * follow the usual A2C settings; drivers overwrite the fields they care
     * about and call validate() before handing the config to an agent.
     */
    struct AgentConfig
    {
        std::vector<int64_t> observationShape;  ///< Shape of one processed observation (no worker axis)
        ActionSpace actionSpace;                ///< Action space of the environment
        int64_t numWorkers = 1;                 ///< Number of parallel workers stepped in lockstep
        int64_t smoothLength = 100;             ///< Capacity of every smoothed record window
        std::string logDirectory = "./logs";    ///< Directory the telemetry sink writes into
        int64_t windowLength = 1;               ///< Number of observations stacked into one state
        float learningRate = 7e-4;              ///< Adam learning rate
        float discount = 0.99;                  ///< Discount factor gamma
        float gaeLambda = 0.95;                 ///< GAE trace parameter lambda
        int64_t numFramesPerProc = 5;           ///< Rollout horizon T per worker
        /// Minibatch size for algorithm variants that split a rollout into minibatches.
        /// A2CAgent consumes the whole rollout in one step and does not read it.
        int64_t batchSize = 32;
        float entropyCoef = 0.01;               ///< Weight of the entropy bonus
        float valueLossCoef = 0.5;              ///< Weight of the critic loss
        float maxGradNorm = 0.5;                ///< Gradient norm clipping threshold
        unsigned int hiddenSize = 64;           ///< Hidden width used by the default policy builder
        unsigned int valueSize = 1;             ///< Width of the value head, summed to a scalar by the agent
        torch::Device device = torch::kCPU;     ///< Device the model and rollout tensors live on
        RewardShaper rewardShaper;              ///< Applied to stored rewards when set

        /**
         * @brief Checks the config for values no agent can work with
         *
         * @throws std::invalid_argument naming the first offending field
         */
        void validate() const;
    };
}

#endif //ROLLOUTENGINE_AGENTCONFIG_HPP

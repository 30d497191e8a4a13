#pragma once
//
// Created by moinshaikh on 3/3/26.
//

#ifndef ROLLOUTENGINE_FEATUREPROCESSOR_HPP
#define ROLLOUTENGINE_FEATUREPROCESSOR_HPP

#include<torch/torch.h>

namespace RolloutEngine
{
    /**
     * @brief Transform applied to raw observations before they reach the policy or the store
     *
     * The agent calls process() on every batch of observations it is handed
     * (predict, observe and the bootstrap observation) and update() once per
     * committed batch, so stateful processors see each transition exactly once.
     */
    class FeatureProcessor
    {
    public:
        virtual ~FeatureProcessor() = default;

        /**
         * @param raw Observations of shape [workers, observation...]
         * @return Processed observations, same leading worker axis
         */
        virtual torch::Tensor process(torch::Tensor raw) = 0;

        /** @brief Feeds committed raw observations to stateful processors; no-op by default */
        virtual void update(torch::Tensor raw)
        {
        }
    };
}

#endif //ROLLOUTENGINE_FEATUREPROCESSOR_HPP

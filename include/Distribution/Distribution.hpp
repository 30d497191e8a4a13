#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef ROLLOUTENGINE_DISTRIBUTION_HPP
#define ROLLOUTENGINE_DISTRIBUTION_HPP

#include<vector>
#include<torch/torch.h>

namespace RolloutEngine
{
    /**
     * @class Distribution
     * @brief Action distribution produced by a policy for one batch of workers.
     *
     * A policy forward pass yields one Distribution whose batch axis is the
     * worker axis. The rollout controller draws an action from it with
     * sample() and, while training, caches logProbability() of that action
     * and entropy() next to the value estimate of the same timestep.
     *
     * @see Categorical
     * @see Normal
     * @see Bernoulli
     */
    class Distribution
    {
    protected:
        std::vector<int64_t> batch_shape;  ///< Leading dimensions indexing independent distributions
        std::vector<int64_t> event_shape;  ///< Trailing dimensions of a single draw

        /**
         * @brief Shape of a draw of `sampleShapes` samples: sample + batch + event dimensions.
         */
        std::vector<int64_t> extendedShape(c10::ArrayRef<int64_t> &sampleShapes);
    public:
        virtual ~Distribution() = 0;

        /**
         * @brief Entropy in nats, one entry per batch element.
         */
        virtual torch::Tensor entropy() = 0;

        /**
         * @brief Log probability (mass or density) of `value` under the distribution.
         *
         * @param value Tensor broadcastable against the batch shape
         */
        virtual torch::Tensor logProbability(torch::Tensor value) = 0;

        /**
         * @brief Draws samples of shape [sampleShape, batch_shape, event_shape].
         */
        virtual torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) = 0;
    };

    inline Distribution::~Distribution() {

    }
}

#endif //ROLLOUTENGINE_DISTRIBUTION_HPP

#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef ROLLOUTENGINE_CATEGORICAL_HPP
#define ROLLOUTENGINE_CATEGORICAL_HPP

#include"Distribution.hpp"
#include<c10/util/ArrayRef.h>

namespace RolloutEngine
{
    /**
     * @class Categorical
     * @brief Distribution over a finite set of actions, used for "Discrete" action spaces.
     *
     * Parameterized by either probabilities or logits over the last dimension.
     * Whichever parameterization is given, both are kept normalized so that
     * sampling goes through `probs` and log probabilities through `logits`.
     */
    class Categorical : public Distribution
    {
    private:
        torch::Tensor probs;      ///< Normalized probabilities, last dimension indexes actions
        torch::Tensor logits;     ///< Normalized log probabilities
        torch::Tensor param;      ///< The tensor the distribution was built from
        int64_t numEvents;        ///< Number of actions

    public:
        /**
         * @brief Builds the distribution from exactly one of `probs` or `logits`.
         *
         * @throws std::runtime_error if both or neither are given, or the tensor is zero-dimensional
         */
        Categorical(const torch::Tensor *probs, const torch::Tensor *logits);

        /** @return -sum(p log p) over the action dimension */
        torch::Tensor entropy() override;

        /**
         * @brief Log probability of the action indices in `value`.
         */
        torch::Tensor logProbability(torch::Tensor value) override;

        /**
         * @brief Draws action indices through torch::multinomial.
         */
        torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) override;

        inline torch::Tensor getLogits() const { return logits; }
        inline torch::Tensor getParam() const { return param; }
        inline torch::Tensor getProbability() const { return probs; }
    };
}

#endif //ROLLOUTENGINE_CATEGORICAL_HPP

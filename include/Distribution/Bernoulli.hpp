#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef ROLLOUTENGINE_BERNOULLI_HPP
#define ROLLOUTENGINE_BERNOULLI_HPP

#include"Distribution.hpp"

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

namespace RolloutEngine
{
    /**
     * @class Bernoulli
     * @brief Independent on/off switches, used for "MultiBinary" action spaces.
     *
     * Each element of the parameter tensor is the success probability (or
     * log-odds) of one binary action dimension. entropy() and
     * logProbability() are element-wise; the policy sums them over the action
     * dimension to obtain one value per worker.
     */
    class Bernoulli : public Distribution
    {
    private:
        torch::Tensor probs;      ///< Probability of drawing 1
        torch::Tensor logits;     ///< Log-odds of drawing 1
        torch::Tensor param;      ///< The tensor the distribution was built from
    public:
        /**
         * @brief Builds the distribution from exactly one of `probs` or `logits`.
         *
         * @throws std::runtime_error if both or neither are given, or the tensor is zero-dimensional
         */
        Bernoulli(const torch::Tensor *probs, const torch::Tensor *logits);

        torch::Tensor entropy() override;

        torch::Tensor logProbability(torch::Tensor value) override;

        torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) override;

        inline torch::Tensor getLogits() const { return logits; }
        inline torch::Tensor getProbs() const { return probs; }
    };
}

#endif //ROLLOUTENGINE_BERNOULLI_HPP

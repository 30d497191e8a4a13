#pragma once
//
// Created by moinshaikh on 3/5/26.
//

#ifndef ROLLOUTENGINE_ADVANTAGEESTIMATOR_HPP
#define ROLLOUTENGINE_ADVANTAGEESTIMATOR_HPP

#include<torch/torch.h>

namespace RolloutEngine
{
    /**
     * @brief Bootstrapped one-step TD residuals of a full rollout
     *
     * With mask[t] = 1 - terminal[t]:
     *
     *     target[t]   = reward[t] + value[t + 1] * mask[t]     (t < T - 1)
     *     target[T-1] = reward[T-1] + bootstrap * mask[T-1]
     *     delta[t]    = target[t] - value[t]
     *
     * Targets are detached, so gradients reach only value[t] through delta[t].
     * There is no discount factor in the target.
     *
     * @param rewards [T, workers]
     * @param terminals [T, workers], any dtype, non-zero means terminal
     * @param values [T, workers], already reduced to one value per worker
     * @param bootstrapValue [workers], value of the state after the last step
     * @return delta [T, workers]
     * @throws std::invalid_argument if the shapes disagree
     */
    torch::Tensor computeTemporalDifferences(torch::Tensor rewards,
        torch::Tensor terminals,
        torch::Tensor values,
        torch::Tensor bootstrapValue);

    /**
     * @brief Generalized advantage estimates from TD residuals
     *
     *     adv[t] = sum_{k=t}^{T-1} (discount * gaeLambda)^(k - t) * delta[k]
     *
     * The sum runs to the end of the rollout for every worker, also across
     * that worker's terminals; only the residuals themselves are masked.
     *
     * @param deltas [T, workers]
     * @return advantages [T, workers], differentiable through deltas
     */
    torch::Tensor computeAdvantages(torch::Tensor deltas, float discount, float gaeLambda);
}

#endif //ROLLOUTENGINE_ADVANTAGEESTIMATOR_HPP

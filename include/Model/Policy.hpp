//
// Created by moinshaikh on 1/28/26.
//

#ifndef ROLLOUTENGINE_POLICY_HPP
#define ROLLOUTENGINE_POLICY_HPP

#include<functional>
#include<memory>
#include<vector>

#include<torch/torch.h>
#include<torch/nn.h>

#include"NNBase.hpp"
#include"OutputLayers.hpp"
#include"../Distribution/Distribution.hpp"
#include"../Space.hpp"

namespace RolloutEngine
{
    struct AgentConfig;

    /**
     * @brief Result of one policy forward pass
     *
     * `distribution` has the worker axis as its batch axis. `value` is the raw
     * critic output of shape [workers, valueSize], still attached to the graph.
     */
    struct PolicyOutput
    {
        std::unique_ptr<Distribution> distribution;
        torch::Tensor value;
    };

    /**
     * @class PolicyImpl
     * @brief Actor-critic network: a base trunk plus an action-space specific output layer
     *
     * The output layer is chosen from the action space type:
     *  - "Discrete"    -> CategoricalOutput
     *  - "Box"         -> NormalOutput
     *  - "MultiBinary" -> BernoulliOutput
     *
     * Actions handed in and out of the policy always have one row per worker:
     * [workers, 1] for discrete spaces, [workers, actionDims] otherwise.
     */
    class PolicyImpl : public torch::nn::Module
    {
    private:
        ActionSpace actionSpace;

        std::shared_ptr<NNBase> base;

        std::shared_ptr<OutputLayer> outputLayer;

    public:
        /**
         * @throws std::runtime_error if the action space type is not one of the three above
         */
        PolicyImpl(ActionSpace actionSpace, std::shared_ptr<NNBase> base);

        /**
         * @param state Windowed state [workers, window, observation...]
         */
        PolicyOutput forward(torch::Tensor state);

        /**
         * @brief Draws one action per worker, shaped [workers, actionSize].
         */
        torch::Tensor sampleAction(Distribution &distribution) const;

        /**
         * @brief Log probability of a stored action, one scalar per worker.
         *
         * Log probabilities of independent action dimensions are summed.
         */
        torch::Tensor logProbability(Distribution &distribution, torch::Tensor action) const;

        /**
         * @brief Entropy of the distribution, one scalar per worker.
         */
        torch::Tensor entropy(Distribution &distribution) const;

        inline const ActionSpace &getActionSpace() const
        {
            return actionSpace;
        }

        inline unsigned int getValueSize() const
        {
            return base->getValueSize();
        }
    };
    TORCH_MODULE(Policy);

    /**
     * @brief Builds the network an agent trains
     *
     * Agents receive one of these instead of subclassing to swap the network.
     */
    using PolicyBuilder = std::function<Policy(const AgentConfig &)>;

    /**
     * @brief Default builder: CnnBase for single-channel 84x84 frame
     * observations, MlpBase (over the flattened window) for everything else,
     * other two-dimensional grids included.
     */
    Policy buildDefaultPolicy(const AgentConfig &config);
}


#endif //ROLLOUTENGINE_POLICY_HPP

//
// Created by moinshaikh on 1/28/26.
//

#ifndef ROLLOUTENGINE_NNBASE_HPP
#define ROLLOUTENGINE_NNBASE_HPP
#include<torch/torch.h>
#include<torch/nn.h>
#include<vector>

namespace RolloutEngine
{
    /**
     * @brief Shared trunk of an actor-critic network
     *
     * A base turns a windowed state [workers, window, observation...] into
     * two tensors: the critic's value estimate and the features the policy's
     * output layer turns into an action distribution. The value head may be
     * wider than one column (one column per reward channel); the agent sums
     * it to a scalar per worker.
     */
    class NNBase : public torch::nn::Module
    {
    private:
        unsigned int hiddenSize;
        unsigned int valueSize;
    public:
        NNBase(unsigned int hiddenSize, unsigned int valueSize);

        /**
         * @brief Runs the trunk on a batch of windowed states.
         *
         * @param state Tensor of shape [workers, window, observation...]
         * @return {value [workers, valueSize], actor features [workers, hiddenSize]}
         */
        virtual std::vector<torch::Tensor> forward(torch::Tensor state) = 0;

        inline unsigned int getOutputSize() const
        {
            return hiddenSize;
        }

        inline unsigned int getValueSize() const
        {
            return valueSize;
        }
    };
 }

#endif //ROLLOUTENGINE_NNBASE_HPP

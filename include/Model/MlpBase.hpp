//
// Created by moinshaikh on 1/28/26.
//

#ifndef ROLLOUTENGINE_MLP_BASE_HPP
#define ROLLOUTENGINE_MLP_BASE_HPP


#include<torch/nn.h>
#include"NNBase.hpp"
#include"ModelUtils.hpp"



namespace RolloutEngine
{
    /**
     * @brief Fully connected actor-critic trunk for vector observations
     *
     * The windowed state is flattened to [workers, window * features] and fed
     * to two independent two-layer tanh networks: the actor branch produces
     * the features for the output layer, the critic branch ends in a linear
     * value head of width `valueSize`.
     *
     * Weights are orthogonally initialized with gain sqrt(2) and zero biases.
     */
    class MlpBase : public NNBase
    {
    private:
        Flatten flatten;
        torch::nn::Sequential actor;      /**< Actor branch, output width hiddenSize */
        torch::nn::Sequential critic;     /**< Critic branch before the value head */
        torch::nn::Linear criticLinear;   /**< Value head, output width valueSize */
        unsigned int numInputs;           /**< window length * observation size */

    public:
        /**
         * @param numInputs Flattened state size, i.e. window length times the
         *                  number of features of one observation
         * @param hiddenSize Width of both hidden layers in each branch
         * @param valueSize Width of the value head
         */
        MlpBase(unsigned int numInputs,
            unsigned int hiddenSize = 64,
            unsigned int valueSize = 1);

        /**
         * @return {value [workers, valueSize], actor features [workers, hiddenSize]}
         */
        std::vector<torch::Tensor> forward(torch::Tensor state) override;

        inline unsigned int getNumInputs() const
        {
            return numInputs;
        }
    };
}
#endif //ROLLOUTENGINE_MLP_BASE_HPP

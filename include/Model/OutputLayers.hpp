//
// Created by moinshaikh on 1/28/26.
//

#ifndef ROLLOUTENGINE_OUTPUTLAYERS_HPP
#define ROLLOUTENGINE_OUTPUTLAYERS_HPP

#include<torch/torch.h>
#include<torch/nn.h>
#include<memory>

#include"../Distribution/Distribution.hpp"

namespace RolloutEngine {
    /**
     * @class OutputLayer
     * @brief Maps actor features to an action distribution.
     *
     * The policy picks one concrete layer per action space type and owns it
     * as a registered submodule, so its parameters are trained together with
     * the base network.
    */
    class OutputLayer : public torch::nn::Module
    {
    public:
        virtual ~OutputLayer() = 0;

        /**
          * @param x Actor features of shape [workers, numInputs]
          * @return Distribution with the worker axis as its batch axis
          */
        virtual std::unique_ptr<Distribution> forward(torch::Tensor x) = 0;

    };

    inline OutputLayer::~OutputLayer()  {

    }

    /**
     * @class BernoulliOutput
     * @brief One independent Bernoulli per action dimension ("MultiBinary" spaces).
     *
     * A linear layer produces one logit per action dimension.
    */
    class BernoulliOutput : public OutputLayer
    {
    private:
        torch::nn::Linear linear;

    public:
        BernoulliOutput(unsigned int numInputs, unsigned int numOutputs);

        std::unique_ptr<Distribution> forward(torch::Tensor x) override;
    };

    /**
     * @class CategoricalOutput
     * @brief Categorical distribution over `numOutputs` actions ("Discrete" spaces).
     *
     * A linear layer produces one logit per action; the Categorical turns
     * them into probabilities with a softmax.
    */
    class CategoricalOutput : public OutputLayer
    {
    private:
        torch::nn::Linear linear;
    public:
        CategoricalOutput(unsigned int numInputs, unsigned int numOutputs);

        std::unique_ptr<Distribution> forward(torch::Tensor x) override;
    };

    /**
     * @class NormalOutput
     * @brief Diagonal Gaussian over a continuous action vector ("Box" spaces).
     *
     * The mean is a linear function of the features. The standard deviation
     * does not depend on the state: it is exp(scale_log), with scale_log a
     * learnable vector initialized to zero (unit standard deviation).
    */
    class NormalOutput : public OutputLayer
    {
    private:
        torch::nn::Linear linear_loc;
        torch::Tensor scale_log;

    public:
        NormalOutput(unsigned int numInputs, unsigned int numOutputs);

        std::unique_ptr<Distribution> forward(torch::Tensor x) override;
    };
}


#endif //ROLLOUTENGINE_OUTPUTLAYERS_HPP

//
// Created by moinshaikh on 1/28/26.
//

#ifndef ROLLOUTENGINE_MODELUTILS_HPP
#define ROLLOUTENGINE_MODELUTILS_HPP

#include<torch/nn.h>

#include<string>

namespace RolloutEngine
{
    /**
     * @brief Collapses every dimension after the first into one.
     *
     * Turns a windowed state [workers, window, features...] into the flat
     * [workers, window * features] rows an MLP expects.
     */
    struct FlattenImpl : torch::nn::Module
    {
        torch::Tensor forward(torch::Tensor x);
    };
    TORCH_MODULE(Flatten);

    /**
     * @brief Fills `tensor` in place with a (semi-)orthogonal matrix scaled by `gain`.
     *
     * Tensors with fewer than two dimensions are left untouched.
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gain);

    /**
     * @brief Initializes a module's parameters by name.
     *
     * Parameters whose name contains "weight" get orthogonal_() with
     * `weightGain`, parameters whose name contains "bias" are set to
     * `biasValue`. Anything else is left alone.
     */
    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters, double weightGain, double biasValue);

}


#endif //ROLLOUTENGINE_MODELUTILS_HPP

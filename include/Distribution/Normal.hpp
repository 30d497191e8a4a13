#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef ROLLOUTENGINE_NORMAL_HPP
#define ROLLOUTENGINE_NORMAL_HPP

#include<torch/torch.h>
#include<c10/util/ArrayRef.h>
#include"Distribution.hpp"



namespace RolloutEngine
{
    /**
     * @class Normal
     * @brief Diagonal Gaussian over continuous ("Box") actions.
     *
     * `loc` and `scale` are broadcast against each other; every element is an
     * independent univariate normal. entropy() sums over the last (action)
     * dimension so it returns one value per worker, while logProbability()
     * stays element-wise and the caller reduces it.
     */
    class Normal : public Distribution
    {
    private:
        torch::Tensor loc;    ///< Mean
        torch::Tensor scale;  ///< Standard deviation
    public:
        Normal(const torch::Tensor loc, const torch::Tensor scale);

        torch::Tensor entropy() override;

        torch::Tensor logProbability(torch::Tensor value) override;

        /**
         * @brief Draws without tracking gradients through the sample.
         */
        torch::Tensor sample(c10::ArrayRef<int64_t> sample_shape = {}) override;


        inline torch::Tensor getLoc() const
        {
            return loc;
        }

        inline torch::Tensor getScale() const
        {
            return scale;
        }
    };
}

#endif //ROLLOUTENGINE_NORMAL_HPP

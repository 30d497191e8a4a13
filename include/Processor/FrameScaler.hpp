#pragma once
//
// Created by moinshaikh on 3/3/26.
//

#ifndef ROLLOUTENGINE_FRAMESCALER_HPP
#define ROLLOUTENGINE_FRAMESCALER_HPP

#include<torch/torch.h>

#include"FeatureProcessor.hpp"

namespace RolloutEngine
{
    /**
     * @brief Casts frames to float and divides them by a constant (255 for byte images)
     */
    class FrameScaler : public FeatureProcessor
    {
    private:
        float scale;
    public:
        /**
         * @throws std::invalid_argument if scale is not positive
         */
        explicit FrameScaler(float scale = 255.f);

        torch::Tensor process(torch::Tensor raw) override;

        inline float getScale() const
        {
            return scale;
        }
    };
}

#endif //ROLLOUTENGINE_FRAMESCALER_HPP

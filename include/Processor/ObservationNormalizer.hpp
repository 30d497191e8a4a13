#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef ROLLOUTENGINE_OBSERVATIONNORMALIZER_HPP
#define ROLLOUTENGINE_OBSERVATIONNORMALIZER_HPP

#include<torch/torch.h>
#include<torch/nn.h>
#include<vector>

#include"FeatureProcessor.hpp"
#include"RunningMeanStd.hpp"

namespace RolloutEngine
{
    /**
     * @brief Normalizes observations to zero mean and unit variance, then clips them
     *
     * processed = clamp((x - mean) / sqrt(var + 1e-8), -clip, clip)
     *
     * The running statistics only move on update(), which the agent calls
     * once per committed batch of raw observations.
     */
    class ObservationNormalizerImpl : public torch::nn::Module, public FeatureProcessor
    {
    private:
        torch::Tensor clip;
        RunningMeanStd rms;
    public:
        /**
         * @param size Number of features of one observation
         * @param clip Bound applied symmetrically after normalization
         */
        explicit ObservationNormalizerImpl(int64_t size, float clip = 10.0);

        ObservationNormalizerImpl(const std::vector<float> &means, const std::vector<float> &variances, float clip = 10.0);

        torch::Tensor process(torch::Tensor raw) override;

        void update(torch::Tensor raw) override;

        std::vector<float> getMean() const;
        std::vector<float> getVariances() const;

        inline float getClipValue() const
        {
            return clip.item().toFloat();
        }

        inline int64_t getStepCount() const {
            return rms->getCount();
        }
    };
    TORCH_MODULE(ObservationNormalizer);
}

#endif //ROLLOUTENGINE_OBSERVATIONNORMALIZER_HPP

#pragma once
//
// Created by moinshaikh on 1/27/26.
//

#ifndef ROLLOUTENGINE_RUNNINGMEANSTD_HPP
#define ROLLOUTENGINE_RUNNINGMEANSTD_HPP

#include<torch/torch.h>
#include<torch/nn.h>
#include<vector>


namespace RolloutEngine
{
    /**
     * @brief Running mean and variance of a stream of feature vectors
     *
     * Batches are merged with the parallel variant of Welford's algorithm.
     * Statistics live in registered buffers so they follow the owning module
     * across devices.
    */
    class RunningMeanStdImpl : public torch::nn::Module
    {
    private:
        torch::Tensor count;
        torch::Tensor mean;
        torch::Tensor variance;

        void updateFromMoments(torch::Tensor batchMean, torch::Tensor batchVariance, int64_t batchCount);
    public:
        /**
         * @brief Zero mean, unit variance tracker for vectors of `size` features.
         */
        explicit RunningMeanStdImpl(int64_t size);

        RunningMeanStdImpl(std::vector<float> means, std::vector<float> variances);

        /**
         * @brief Merges a batch into the statistics.
         *
         * @param observation Any tensor whose element count is a multiple of the
         *                    feature size; it is viewed as [-1, size].
         */
        void update(torch::Tensor observation);

        inline int64_t getCount() const
        {
            return static_cast<int64_t>(count.item().toFloat());
        }

        inline torch::Tensor getMean() const
        {
            return mean.clone();
        }

        inline torch::Tensor getVariance() const
        {
            return variance.clone();
        }
    };
    TORCH_MODULE(RunningMeanStd);
}
#endif //ROLLOUTENGINE_RUNNINGMEANSTD_HPP

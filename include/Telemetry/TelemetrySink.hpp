#pragma once
//
// Created by moinshaikh on 3/4/26.
//

#ifndef ROLLOUTENGINE_TELEMETRYSINK_HPP
#define ROLLOUTENGINE_TELEMETRYSINK_HPP

#include<cstdint>
#include<string>

#include<torch/torch.h>

namespace RolloutEngine
{
    /**
     * @brief Destination for training telemetry (episode summaries, losses)
     *
     * Implementations may throw; callers inside the agent catch and log
     * those failures so telemetry never interrupts training.
     */
    class TelemetrySink
    {
    public:
        virtual ~TelemetrySink() = default;

        virtual void addScalar(const std::string &tag, double value, int64_t step) = 0;

        /**
         * @param values Samples of any shape; they are flattened
         */
        virtual void addHistogram(const std::string &tag, torch::Tensor values, int64_t step) = 0;
    };

    /**
     * @brief Discards everything
     */
    class NullTelemetrySink : public TelemetrySink
    {
    public:
        void addScalar(const std::string &tag, double value, int64_t step) override
        {
        }

        void addHistogram(const std::string &tag, torch::Tensor values, int64_t step) override
        {
        }
    };
}

#endif //ROLLOUTENGINE_TELEMETRYSINK_HPP

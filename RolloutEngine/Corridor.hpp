#pragma once
/**
 * @file Corridor.hpp
 * @brief Headless vectorized corridor environment for the training driver
 * @author moinshaikh
 * @date 3/6/26
 *
 * Each worker walks along a one-dimensional corridor of `length` cells,
 * starting in cell 0. Action 0 steps left (bounded by the wall), action 1
 * steps right. Reaching the last cell pays +1 and ends the episode; every
 * other step costs `stepPenalty`. An episode that runs for `timeLimit` steps
 * also ends. Finished workers are reset immediately, so the observation
 * returned with a terminal already belongs to the next episode.
 *
 * Observations are one-hot encodings of the position, [workers, length].
 */

#ifndef ROLLOUTENGINE_CORRIDOR_HPP
#define ROLLOUTENGINE_CORRIDOR_HPP

#include<cstdint>
#include<vector>

#include<torch/torch.h>

namespace Corridor
{
    struct StepResult
    {
        torch::Tensor observations;   ///< [workers, length]
        torch::Tensor rewards;        ///< [workers]
        torch::Tensor terminals;      ///< [workers], 1 for a finished episode
    };

    class VectorCorridor
    {
    private:
        std::vector<int64_t> positions;
        std::vector<int64_t> elapsed;
        int64_t length;
        int64_t timeLimit;
        float stepPenalty;

        torch::Tensor observe() const;

    public:
        /**
         * @throws std::invalid_argument for fewer than one worker, fewer than two cells or a non-positive time limit
         */
        VectorCorridor(int64_t numWorkers, int64_t length, int64_t timeLimit, float stepPenalty = 0.01);

        /** @brief Puts every worker back at the start */
        torch::Tensor reset();

        /**
         * @param actions One action per worker, [workers] or [workers, 1]
         * @throws std::invalid_argument if there is not one action per worker
         */
        StepResult step(torch::Tensor actions);

        inline int64_t getLength() const
        {
            return length;
        }

        inline int64_t getNumWorkers() const
        {
            return static_cast<int64_t>(positions.size());
        }
    };
}

#endif //ROLLOUTENGINE_CORRIDOR_HPP

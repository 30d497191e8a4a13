#pragma once
//
// Created by moinshaikh on 1/28/26.
//

#ifndef ROLLOUTENGINE_EXPERIENCESTORE_HPP
#define ROLLOUTENGINE_EXPERIENCESTORE_HPP

#include<cstdint>
#include<optional>
#include<vector>

#include<c10/util/ArrayRef.h>
#include<torch/torch.h>

#include"Space.hpp"

namespace RolloutEngine
{
    /**
     * @brief Ticket for one timestep of the two-phase write
     *
     * Issued by ExperienceStore::beginTimestep() and redeemed by commit().
     * A handle from before a reset() is stale and rejected.
     */
    struct TimestepHandle
    {
        int64_t step;
        uint64_t generation;

        inline bool operator==(const TimestepHandle &other) const
        {
            return step == other.step && generation == other.generation;
        }
    };

    /**
     * @brief A full horizon of transitions, time-major: every tensor is [T, workers, ...]
     *
     * values, logProbs and entropies are the statistics cached when the
     * actions were chosen; they are still attached to the policy's graph.
     */
    struct RolloutBatch
    {
        torch::Tensor observations;   ///< [T, workers, observation...]
        torch::Tensor actions;        ///< [T, workers, actionSize]
        torch::Tensor rewards;        ///< [T, workers]
        torch::Tensor terminals;      ///< [T, workers], kBool
        torch::Tensor values;         ///< [T, workers, valueSize]
        torch::Tensor logProbs;       ///< [T, workers]
        torch::Tensor entropies;      ///< [T, workers]
    };

    /**
     * @class ExperienceStore
     * @brief Fixed-horizon rollout buffer for lockstep workers
     *
     * Transitions are written in two phases so the statistics computed while
     * choosing an action and the outcome observed afterwards land in the same
     * slot:
     *
     * @code
     * auto handle = store.beginTimestep();
     * store.storeStatistics(handle, value, logProb, entropy);  // at action time
     * store.commit(handle, observations, actions, rewards, terminals);
     * @endcode
     *
     * Besides the horizon the store keeps the last `windowLength - 1`
     * committed observations of every worker's current episode, used by
     * getRecentState(). That window survives reset() and is cleared per worker
     * on a terminal.
     */
    class ExperienceStore
    {
    private:
        torch::Tensor observations;
        torch::Tensor actions;
        torch::Tensor rewards;
        torch::Tensor terminals;
        std::vector<torch::Tensor> values;
        std::vector<torch::Tensor> logProbs;
        std::vector<torch::Tensor> entropies;

        torch::Tensor recentObservations;    ///< [workers, windowLength - 1, observation...]

        std::vector<int64_t> observationShape;
        ActionSpace actionSpace;
        torch::Device device;
        int64_t numSteps;
        int64_t numWorkers;
        int64_t windowLength;
        int64_t step;
        uint64_t generation;
        std::optional<TimestepHandle> pending;

        void checkHandle(const TimestepHandle &handle, const char *operation) const;
        torch::Tensor checkWorkerRows(torch::Tensor tensor, int64_t width, const char *name) const;
        torch::Tensor checkObservations(torch::Tensor observation) const;
        void pushWindow(torch::Tensor observation, torch::Tensor terminal);

    public:
        /**
         * @param numSteps Horizon T
         * @param numWorkers Number of lockstep workers
         * @param observationShape Shape of one processed observation
         * @param actionSpace Action space, decides the stored action width and dtype
         * @param windowLength Number of observations stacked into one state
         * @param device Device every stored tensor lives on
         */
        ExperienceStore(int64_t numSteps,
            int64_t numWorkers,
            c10::ArrayRef<int64_t> observationShape,
            ActionSpace actionSpace,
            int64_t windowLength,
            torch::Device device);

        /**
         * @brief Opens the next timestep.
         *
         * @throws std::logic_error if the horizon is full or a timestep is already open
         */
        TimestepHandle beginTimestep();

        /**
         * @brief Caches the statistics computed when the actions were chosen.
         *
         * @param value [workers, valueSize] or [workers]
         * @param logProb One entry per worker
         * @param entropy One entry per worker
         * @throws std::logic_error for a handle that is not the open timestep
         * @throws std::invalid_argument if a worker axis does not match
         */
        void storeStatistics(const TimestepHandle &handle,
            torch::Tensor value,
            torch::Tensor logProb,
            torch::Tensor entropy);

        /**
         * @brief Writes the outcome of the open timestep and closes it.
         *
         * @throws std::logic_error for a handle that is not the open timestep
         * @throws std::invalid_argument if a worker axis does not match
         */
        void commit(const TimestepHandle &handle,
            torch::Tensor observation,
            torch::Tensor action,
            torch::Tensor reward,
            torch::Tensor terminal);

        /**
         * @brief Single-call write without cached statistics.
         *
         * With `training` the transition takes the next horizon slot (a
         * rollout containing such slots cannot be sampled); without it only
         * the observation window moves.
         */
        void append(torch::Tensor observation,
            torch::Tensor action,
            torch::Tensor reward,
            torch::Tensor terminal,
            bool training);

        /**
         * @brief Stacks `observation` behind each worker's recent observations.
         *
         * @param observation [workers, observation...]
         * @return [workers, windowLength, observation...], zero-padded at the front
         */
        torch::Tensor getRecentState(torch::Tensor observation) const;

        /**
         * @throws std::logic_error unless the horizon is full and every step has statistics
         */
        RolloutBatch sample() const;

        /**
         * @brief Empties the horizon. The observation window is kept.
         */
        void reset();

        inline bool isFull() const
        {
            return step == numSteps;
        }

        inline int64_t size() const
        {
            return step;
        }

        inline int64_t capacity() const
        {
            return numSteps;
        }

        inline bool hasPendingTimestep() const
        {
            return pending.has_value();
        }
    };
}




#endif //ROLLOUTENGINE_EXPERIENCESTORE_HPP

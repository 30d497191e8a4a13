#pragma once
//
// Created by moinshaikh on 3/4/26.
//

#ifndef ROLLOUTENGINE_EPISODICTRACKER_HPP
#define ROLLOUTENGINE_EPISODICTRACKER_HPP

#include<cstdint>
#include<deque>
#include<memory>
#include<vector>

#include<torch/torch.h>

#include"Telemetry/TelemetrySink.hpp"

namespace RolloutEngine
{
    /**
     * @brief What one worker has done since its last terminal
     */
    struct EpisodeAccumulator
    {
        std::vector<float> rewards;
        std::vector<float> actions;     ///< Flattened action rows, one row per step
        int64_t episodeIndex = 0;       ///< Completed episodes so far, never reset
    };

    /**
     * @class EpisodicTracker
     * @brief Per-worker episode bookkeeping and episode summaries
     *
     * Every record() call feeds one lockstep step of all workers. When a
     * worker reports a terminal, its episode is summarized to the telemetry
     * sink (reward sum, reward and action histograms) under the worker's
     * episode index, and its accumulator starts over.
     *
     * Telemetry tags, with `i` the worker id:
     *  - data/episode_reward_sum_i
     *  - data/episode_action_i
     *  - data/episode_reward_dist_i
     */
    class EpisodicTracker
    {
    private:
        std::vector<EpisodeAccumulator> accumulators;
        std::vector<std::deque<float>> smoothedRewards;
        std::deque<float> smoothedEpisodeReturns;
        std::shared_ptr<TelemetrySink> sink;
        int64_t numWorkers;
        int64_t smoothLength;
        int64_t recordStep;

        void emitEpisode(int64_t worker);

    public:
        /**
         * @param numWorkers Number of workers, one accumulator each
         * @param smoothLength Capacity of every smoothed window
         * @param sink Telemetry destination; a NullTelemetrySink when null
         */
        EpisodicTracker(int64_t numWorkers, int64_t smoothLength, std::shared_ptr<TelemetrySink> sink);

        /**
         * @brief Records one step of every worker.
         *
         * @param actions [workers, ...] actions taken
         * @param rewards One raw reward per worker
         * @param terminals One flag per worker
         * @throws std::invalid_argument if any array does not have one entry per worker
         */
        void record(torch::Tensor actions, torch::Tensor rewards, torch::Tensor terminals);

        const EpisodeAccumulator &getAccumulator(int64_t worker) const;

        /** @brief Last `smoothLength` step rewards of a worker, oldest first */
        const std::deque<float> &getSmoothedRewards(int64_t worker) const;

        /** @brief Reward sums of the last `smoothLength` completed episodes across all workers */
        inline const std::deque<float> &getSmoothedEpisodeReturns() const
        {
            return smoothedEpisodeReturns;
        }

        /** @brief Number of record() calls so far */
        inline int64_t getRecordStep() const
        {
            return recordStep;
        }

        inline int64_t getNumWorkers() const
        {
            return numWorkers;
        }
    };
}

#endif //ROLLOUTENGINE_EPISODICTRACKER_HPP

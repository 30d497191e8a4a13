//
// Created by moinshaikh on 3/4/26.
//

#include<numeric>
#include<sstream>
#include<stdexcept>
#include<string>
#include<utility>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"../include/EpisodicTracker.hpp"
#include"../include/Telemetry/TelemetrySink.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    namespace
    {
        torch::Tensor perWorker(torch::Tensor tensor, int64_t numWorkers, const char *name)
        {
            if (tensor.dim() == 0 || tensor.size(0) != numWorkers)
            {
                std::ostringstream message;
                message << name << " has shape " << tensor.sizes() << " but there are " << numWorkers << " workers";
                throw std::invalid_argument(message.str());
            }
            return tensor.detach().to(torch::kCPU, torch::kFloat).reshape({numWorkers, -1}).contiguous();
        }
    }

    EpisodicTracker::EpisodicTracker(int64_t numWorkers, int64_t smoothLength, std::shared_ptr<TelemetrySink> sink) :
        accumulators(numWorkers > 0 ? numWorkers : 0),
        smoothedRewards(numWorkers > 0 ? numWorkers : 0),
        sink(sink ? std::move(sink) : std::make_shared<NullTelemetrySink>()),
        numWorkers(numWorkers),
        smoothLength(smoothLength),
        recordStep(0)
    {
        if (numWorkers <= 0 || smoothLength <= 0)
        {
            throw std::invalid_argument("EpisodicTracker needs a positive worker count and smooth length, got " +
                                        std::to_string(numWorkers) + " and " + std::to_string(smoothLength));
        }
    }

    void EpisodicTracker::record(torch::Tensor actions, torch::Tensor rewards, torch::Tensor terminals)
    {
        auto action_rows = perWorker(actions, numWorkers, "Actions");
        auto reward_rows = perWorker(rewards, numWorkers, "Rewards");
        auto terminal_rows = perWorker(terminals, numWorkers, "Terminals");
        if (reward_rows.size(1) != 1 || terminal_rows.size(1) != 1)
        {
            throw std::invalid_argument("Rewards and terminals need exactly one entry per worker");
        }

        for (int64_t i = 0; i < numWorkers; ++i)
        {
            auto reward = reward_rows[i][0].item<float>();
            auto &accumulator = accumulators[i];

            auto &window = smoothedRewards[i];
            window.push_back(reward);
            if (static_cast<int64_t>(window.size()) > smoothLength)
            {
                window.pop_front();
            }

            accumulator.rewards.push_back(reward);
            auto action = action_rows[i];
            accumulator.actions.insert(accumulator.actions.end(),
                                       action.data_ptr<float>(),
                                       action.data_ptr<float>() + action.numel());

            if (terminal_rows[i][0].item<float>() != 0)
            {
                emitEpisode(i);
                accumulator.episodeIndex++;
                accumulator.rewards.clear();
                accumulator.actions.clear();
            }
        }
        recordStep++;
    }

    void EpisodicTracker::emitEpisode(int64_t worker)
    {
        auto &accumulator = accumulators[worker];
        auto reward_sum = std::accumulate(accumulator.rewards.begin(), accumulator.rewards.end(), 0.0);

        smoothedEpisodeReturns.push_back(static_cast<float>(reward_sum));
        if (static_cast<int64_t>(smoothedEpisodeReturns.size()) > smoothLength)
        {
            smoothedEpisodeReturns.pop_front();
        }

        auto suffix = "_" + std::to_string(worker);
        try
        {
            sink->addScalar("data/episode_reward_sum" + suffix, reward_sum, accumulator.episodeIndex);
            sink->addHistogram("data/episode_action" + suffix,
                               torch::tensor(accumulator.actions),
                               accumulator.episodeIndex);
            sink->addHistogram("data/episode_reward_dist" + suffix,
                               torch::tensor(accumulator.rewards),
                               accumulator.episodeIndex);
        }
        catch (const std::exception &e)
        {
            spdlog::warn("Telemetry for worker {} episode {} failed: {}", worker, accumulator.episodeIndex, e.what());
        }
    }

    const EpisodeAccumulator &EpisodicTracker::getAccumulator(int64_t worker) const
    {
        return accumulators.at(worker);
    }

    const std::deque<float> &EpisodicTracker::getSmoothedRewards(int64_t worker) const
    {
        return smoothedRewards.at(worker);
    }

    namespace
    {
        struct RecordingSink : public TelemetrySink
        {
            std::vector<std::pair<std::string, double>> scalars;
            std::vector<std::pair<std::string, int64_t>> scalarSteps;
            std::vector<std::pair<std::string, int64_t>> histograms;

            void addScalar(const std::string &tag, double value, int64_t step) override
            {
                scalars.emplace_back(tag, value);
                scalarSteps.emplace_back(tag, step);
            }

            void addHistogram(const std::string &tag, torch::Tensor values, int64_t step) override
            {
                histograms.emplace_back(tag, values.numel());
            }
        };

        struct FailingSink : public TelemetrySink
        {
            void addScalar(const std::string &tag, double value, int64_t step) override
            {
                throw std::runtime_error("disk full");
            }

            void addHistogram(const std::string &tag, torch::Tensor values, int64_t step) override
            {
                throw std::runtime_error("disk full");
            }
        };
    }

    TEST_CASE("EpisodicTracker")
    {
        auto sink = std::make_shared<RecordingSink>();
        EpisodicTracker tracker(2, 3, sink);

        auto no_terminals = torch::zeros({2});

        SUBCASE("Accumulators exist for every worker from the start")
        {
            CHECK(tracker.getAccumulator(0).rewards.empty());
            CHECK(tracker.getAccumulator(1).episodeIndex == 0);
            CHECK_THROWS_AS(tracker.getAccumulator(2), std::out_of_range);
        }

        SUBCASE("Steps accumulate until a terminal")
        {
            tracker.record(torch::tensor({1, 2}), torch::tensor({0.5f, 1.f}), no_terminals);
            tracker.record(torch::tensor({3, 4}), torch::tensor({0.5f, 1.f}), no_terminals);

            CHECK(tracker.getAccumulator(0).rewards.size() == 2);
            CHECK(tracker.getAccumulator(1).actions == std::vector<float>{2, 4});
            CHECK(tracker.getRecordStep() == 2);
            CHECK(sink->scalars.empty());
        }

        SUBCASE("A terminal summarizes and clears only that worker")
        {
            tracker.record(torch::tensor({1, 2}), torch::tensor({1.f, 0.f}), no_terminals);
            tracker.record(torch::tensor({1, 2}), torch::tensor({2.f, 5.f}), torch::tensor({0.f, 1.f}));

            CHECK(tracker.getAccumulator(1).rewards.empty());
            CHECK(tracker.getAccumulator(1).actions.empty());
            CHECK(tracker.getAccumulator(1).episodeIndex == 1);
            CHECK(tracker.getAccumulator(0).rewards.size() == 2);
            CHECK(tracker.getAccumulator(0).episodeIndex == 0);

            REQUIRE(sink->scalars.size() == 1);
            CHECK(sink->scalars[0].first == "data/episode_reward_sum_1");
            CHECK(sink->scalars[0].second == doctest::Approx(5));
            CHECK(sink->scalarSteps[0].second == 0);

            REQUIRE(sink->histograms.size() == 2);
            CHECK(sink->histograms[0].first == "data/episode_action_1");
            CHECK(sink->histograms[0].second == 2);
            CHECK(sink->histograms[1].first == "data/episode_reward_dist_1");

            REQUIRE(tracker.getSmoothedEpisodeReturns().size() == 1);
            CHECK(tracker.getSmoothedEpisodeReturns().front() == doctest::Approx(5));
        }

        SUBCASE("Episode index counts episodes and tags the next summary")
        {
            auto terminals = torch::tensor({1.f, 0.f});
            tracker.record(torch::tensor({0, 0}), torch::tensor({1.f, 0.f}), terminals);
            tracker.record(torch::tensor({0, 0}), torch::tensor({3.f, 0.f}), terminals);

            CHECK(tracker.getAccumulator(0).episodeIndex == 2);
            REQUIRE(sink->scalarSteps.size() == 2);
            CHECK(sink->scalarSteps[0].second == 0);
            CHECK(sink->scalarSteps[1].second == 1);
        }

        SUBCASE("Smoothed reward window keeps the newest entries")
        {
            for (int i = 0; i < 5; ++i)
            {
                tracker.record(torch::tensor({0, 0}), torch::tensor({float(i), 0.f}), no_terminals);
            }

            auto &window = tracker.getSmoothedRewards(0);
            REQUIRE(window.size() == 3);
            CHECK(window[0] == doctest::Approx(2));
            CHECK(window[2] == doctest::Approx(4));
        }

        SUBCASE("Vector actions are flattened per step")
        {
            tracker.record(torch::ones({2, 3}), torch::zeros({2}), no_terminals);
            CHECK(tracker.getAccumulator(0).actions.size() == 3);
        }

        SUBCASE("Mismatched worker counts are rejected")
        {
            CHECK_THROWS_AS(tracker.record(torch::tensor({1, 2, 3}), torch::zeros({2}), no_terminals),
                            std::invalid_argument);
            CHECK_THROWS_AS(tracker.record(torch::tensor({1, 2}), torch::zeros({3}), no_terminals),
                            std::invalid_argument);
            CHECK_THROWS_AS(tracker.record(torch::tensor({1, 2}), torch::zeros({2}), torch::zeros({1})),
                            std::invalid_argument);
            CHECK(tracker.getRecordStep() == 0);
        }

        SUBCASE("Telemetry failures do not interrupt recording")
        {
            EpisodicTracker failing(1, 3, std::make_shared<FailingSink>());
            CHECK_NOTHROW(failing.record(torch::tensor({1}), torch::tensor({1.f}), torch::tensor({1.f})));
            CHECK(failing.getAccumulator(0).episodeIndex == 1);
            CHECK(failing.getAccumulator(0).rewards.empty());
        }
    }
}

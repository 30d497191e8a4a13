//
// Created by moinshaikh on 3/6/26.
//

#include<algorithm>
#include<stdexcept>
#include<string>

#include<torch/torch.h>

#include"Corridor.hpp"
#include<doctest/doctest.h>

namespace Corridor
{
    VectorCorridor::VectorCorridor(int64_t numWorkers, int64_t length, int64_t timeLimit, float stepPenalty) :
        positions(numWorkers > 0 ? numWorkers : 0, 0),
        elapsed(numWorkers > 0 ? numWorkers : 0, 0),
        length(length),
        timeLimit(timeLimit),
        stepPenalty(stepPenalty)
    {
        if (numWorkers <= 0 || length < 2 || timeLimit <= 0)
        {
            throw std::invalid_argument("Corridor needs workers, at least two cells and a time limit, got " +
                                        std::to_string(numWorkers) + ", " + std::to_string(length) + ", " +
                                        std::to_string(timeLimit));
        }
    }

    torch::Tensor VectorCorridor::observe() const
    {
        auto observations = torch::zeros({getNumWorkers(), length});
        for (int64_t i = 0; i < getNumWorkers(); ++i)
        {
            observations[i][positions[i]] = 1;
        }
        return observations;
    }

    torch::Tensor VectorCorridor::reset()
    {
        std::fill(positions.begin(), positions.end(), 0);
        std::fill(elapsed.begin(), elapsed.end(), 0);
        return observe();
    }

    StepResult VectorCorridor::step(torch::Tensor actions)
    {
        auto num_workers = getNumWorkers();
        if (actions.numel() != num_workers)
        {
            throw std::invalid_argument("Corridor got " + std::to_string(actions.numel()) + " actions for " +
                                        std::to_string(num_workers) + " workers");
        }

        auto action_values = actions.to(torch::kCPU, torch::kLong).flatten().contiguous();
        auto action_data = action_values.data_ptr<int64_t>();

        auto rewards = torch::zeros({num_workers});
        auto terminals = torch::zeros({num_workers});
        for (int64_t i = 0; i < num_workers; ++i)
        {
            auto move = action_data[i] == 1 ? 1 : -1;
            positions[i] = std::clamp<int64_t>(positions[i] + move, 0, length - 1);
            elapsed[i]++;

            bool reached_goal = positions[i] == length - 1;
            rewards[i] = reached_goal ? 1.f : -stepPenalty;
            if (reached_goal || elapsed[i] >= timeLimit)
            {
                terminals[i] = 1;
                positions[i] = 0;
                elapsed[i] = 0;
            }
        }

        return {observe(), rewards, terminals};
    }

    TEST_CASE("VectorCorridor")
    {
        VectorCorridor corridor(2, 3, 4);
        auto start = corridor.reset();

        SUBCASE("Starts one-hot in the first cell")
        {
            CHECK(start.sizes().vec() == std::vector<int64_t>{2, 3});
            CHECK(start[0][0].item().toFloat() == doctest::Approx(1));
            CHECK(start.sum().item().toFloat() == doctest::Approx(2));
        }

        SUBCASE("Walking right reaches the goal and resets")
        {
            corridor.step(torch::tensor({1, 0}));
            auto result = corridor.step(torch::tensor({1, 0}));

            CHECK(result.rewards[0].item().toFloat() == doctest::Approx(1));
            CHECK(result.terminals[0].item().toFloat() == doctest::Approx(1));
            CHECK(result.observations[0][0].item().toFloat() == doctest::Approx(1));

            CHECK(result.rewards[1].item().toFloat() == doctest::Approx(-0.01));
            CHECK(result.terminals[1].item().toFloat() == doctest::Approx(0));
        }

        SUBCASE("The wall stops left moves")
        {
            auto result = corridor.step(torch::tensor({0, 0}));
            CHECK(result.observations[0][0].item().toFloat() == doctest::Approx(1));
        }

        SUBCASE("Time limit ends an episode")
        {
            StepResult result;
            for (int i = 0; i < 4; ++i)
            {
                result = corridor.step(torch::tensor({0, 0}));
            }
            CHECK(result.terminals[1].item().toFloat() == doctest::Approx(1));
        }

        SUBCASE("Needs one action per worker")
        {
            CHECK_THROWS_AS(corridor.step(torch::tensor({1, 1, 1})), std::invalid_argument);
        }
    }
}

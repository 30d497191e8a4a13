//
// Created by moinshaikh on 2/2/26.
//

#include<sstream>
#include<stdexcept>
#include<string>
#include<vector>

#include"../include/ExperienceStore.hpp"
#include"../include/Space.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    /**
     * @details Observations, actions, rewards and terminals are preallocated
     * for the whole horizon. Cached statistics are kept per step as separate
     * tensors because they carry the policy's autograd graph and are only
     * stacked when the rollout is sampled.
     *
     * @throws std::invalid_argument for a non-positive horizon, worker count or window
     */
    ExperienceStore::ExperienceStore(int64_t numSteps,
        int64_t numWorkers,
        c10::ArrayRef<int64_t> observationShape,
        ActionSpace actionSpace,
        int64_t windowLength,
        torch::Device device) :
        observationShape(observationShape.vec()),
        actionSpace(actionSpace),
        device(device),
        numSteps(numSteps),
        numWorkers(numWorkers),
        windowLength(windowLength),
        step(0),
        generation(0)
    {
        if (numSteps <= 0 || numWorkers <= 0 || windowLength <= 0)
        {
            throw std::invalid_argument("ExperienceStore needs a positive horizon, worker count and window, got " +
                                        std::to_string(numSteps) + ", " + std::to_string(numWorkers) + ", " +
                                        std::to_string(windowLength));
        }

        std::vector<int64_t> observation_shape{numSteps, numWorkers};
        observation_shape.insert(observation_shape.end(), observationShape.begin(), observationShape.end());
        observations = torch::zeros(observation_shape, torch::TensorOptions(device));

        actions = torch::zeros({numSteps, numWorkers, actionSpace.actionSize()}, torch::TensorOptions(device));
        if (actionSpace.isDiscrete())
        {
            actions = actions.to(torch::kLong);
        }
        rewards = torch::zeros({numSteps, numWorkers}, torch::TensorOptions(device));
        terminals = torch::zeros({numSteps, numWorkers}, torch::TensorOptions(device).dtype(torch::kBool));

        std::vector<int64_t> window_shape{numWorkers, windowLength - 1};
        window_shape.insert(window_shape.end(), observationShape.begin(), observationShape.end());
        recentObservations = torch::zeros(window_shape, torch::TensorOptions(device));

        values.resize(numSteps);
        logProbs.resize(numSteps);
        entropies.resize(numSteps);
    }

    void ExperienceStore::checkHandle(const TimestepHandle &handle, const char *operation) const
    {
        if (!pending)
        {
            throw std::logic_error(std::string(operation) + " without an open timestep");
        }
        if (!(*pending == handle))
        {
            throw std::logic_error(std::string(operation) + " with a handle for step " + std::to_string(handle.step) +
                                   " that is not the open timestep " + std::to_string(pending->step));
        }
    }

    torch::Tensor ExperienceStore::checkWorkerRows(torch::Tensor tensor, int64_t width, const char *name) const
    {
        if (tensor.dim() == 0 || tensor.size(0) != numWorkers || tensor.numel() != numWorkers * width)
        {
            std::ostringstream message;
            message << name << " has shape " << tensor.sizes() << ", expected " << numWorkers
                    << " rows of " << width << " (one per worker)";
            throw std::invalid_argument(message.str());
        }
        return tensor.reshape({numWorkers, width});
    }

    torch::Tensor ExperienceStore::checkObservations(torch::Tensor observation) const
    {
        std::vector<int64_t> expected{numWorkers};
        expected.insert(expected.end(), observationShape.begin(), observationShape.end());
        if (observation.sizes().vec() != expected)
        {
            std::ostringstream message;
            message << "Observations have shape " << observation.sizes() << ", expected "
                    << c10::IntArrayRef(expected);
            throw std::invalid_argument(message.str());
        }
        return observation.to(device, torch::kFloat);
    }

    void ExperienceStore::pushWindow(torch::Tensor observation, torch::Tensor terminal)
    {
        if (windowLength == 1)
        {
            return;
        }

        torch::NoGradGuard no_grad;
        auto shifted = torch::cat({recentObservations.slice(1, 1), observation.unsqueeze(1)}, 1);

        // A finished episode leaves nothing behind for the next one
        std::vector<int64_t> keep_shape(shifted.dim(), 1);
        keep_shape[0] = numWorkers;
        auto keep = terminal.logical_not().to(torch::kFloat).reshape(keep_shape);
        recentObservations = shifted * keep;
    }

    TimestepHandle ExperienceStore::beginTimestep()
    {
        if (pending)
        {
            throw std::logic_error("Timestep " + std::to_string(pending->step) + " is still open");
        }
        if (isFull())
        {
            throw std::logic_error("ExperienceStore is full (" + std::to_string(numSteps) +
                                   " steps), aggregate or reset it first");
        }

        pending = TimestepHandle{step, generation};
        return *pending;
    }

    void ExperienceStore::storeStatistics(const TimestepHandle &handle,
        torch::Tensor value,
        torch::Tensor logProb,
        torch::Tensor entropy)
    {
        checkHandle(handle, "storeStatistics");

        if (value.dim() == 1)
        {
            value = value.unsqueeze(-1);
        }
        if (value.dim() != 2 || value.size(0) != numWorkers)
        {
            std::ostringstream message;
            message << "Value has shape " << value.sizes() << ", expected [" << numWorkers << ", valueSize]";
            throw std::invalid_argument(message.str());
        }

        values[handle.step] = value.to(device);
        logProbs[handle.step] = checkWorkerRows(logProb, 1, "Log probabilities").squeeze(-1).to(device);
        entropies[handle.step] = checkWorkerRows(entropy, 1, "Entropies").squeeze(-1).to(device);
    }

    void ExperienceStore::commit(const TimestepHandle &handle,
        torch::Tensor observation,
        torch::Tensor action,
        torch::Tensor reward,
        torch::Tensor terminal)
    {
        checkHandle(handle, "commit");

        observation = checkObservations(observation);
        action = checkWorkerRows(action, actionSpace.actionSize(), "Actions");
        reward = checkWorkerRows(reward, 1, "Rewards").squeeze(-1);
        terminal = checkWorkerRows(terminal, 1, "Terminals").squeeze(-1).to(device, torch::kBool);

        {
            torch::NoGradGuard no_grad;
            observations[handle.step].copy_(observation);
            actions[handle.step].copy_(action);
            rewards[handle.step].copy_(reward);
            terminals[handle.step].copy_(terminal);
        }

        pushWindow(observation, terminal);
        pending.reset();
        step++;
    }

    void ExperienceStore::append(torch::Tensor observation,
        torch::Tensor action,
        torch::Tensor reward,
        torch::Tensor terminal,
        bool training)
    {
        if (training)
        {
            auto handle = beginTimestep();
            commit(handle, observation, action, reward, terminal);
            return;
        }

        observation = checkObservations(observation);
        terminal = checkWorkerRows(terminal, 1, "Terminals").squeeze(-1).to(device, torch::kBool);
        pushWindow(observation, terminal);
    }

    torch::Tensor ExperienceStore::getRecentState(torch::Tensor observation) const
    {
        observation = checkObservations(observation);
        if (windowLength == 1)
        {
            return observation.unsqueeze(1);
        }
        return torch::cat({recentObservations, observation.unsqueeze(1)}, 1);
    }

    RolloutBatch ExperienceStore::sample() const
    {
        if (!isFull())
        {
            throw std::logic_error("Rollout is not complete: " + std::to_string(step) + " of " +
                                   std::to_string(numSteps) + " steps stored");
        }
        for (int64_t t = 0; t < numSteps; ++t)
        {
            if (!values[t].defined())
            {
                throw std::logic_error("Step " + std::to_string(t) + " has no cached value, log probability "
                                       "and entropy");
            }
        }

        RolloutBatch batch;
        batch.observations = observations.clone();
        batch.actions = actions.clone();
        batch.rewards = rewards.clone();
        batch.terminals = terminals.clone();
        batch.values = torch::stack(values);
        batch.logProbs = torch::stack(logProbs);
        batch.entropies = torch::stack(entropies);
        return batch;
    }

    void ExperienceStore::reset()
    {
        torch::NoGradGuard no_grad;
        observations.zero_();
        actions.zero_();
        rewards.zero_();
        terminals.zero_();
        values.assign(numSteps, torch::Tensor());
        logProbs.assign(numSteps, torch::Tensor());
        entropies.assign(numSteps, torch::Tensor());

        pending.reset();
        generation++;
        step = 0;
    }

    TEST_CASE("ExperienceStore")
    {
        ExperienceStore store(3, 2, {4}, ActionSpace{"Discrete", {5}}, 1, torch::kCPU);

        auto fill_step = [&store](float reward) {
            auto handle = store.beginTimestep();
            store.storeStatistics(handle, torch::rand({2, 1}), torch::rand({2}), torch::rand({2}));
            store.commit(handle, torch::rand({2, 4}), torch::ones({2, 1}), torch::full({2}, reward),
                         torch::zeros({2}));
        };

        SUBCASE("Starts empty")
        {
            CHECK(store.size() == 0);
            CHECK(store.capacity() == 3);
            CHECK_FALSE(store.isFull());
        }

        SUBCASE("Two-phase writes fill the horizon")
        {
            fill_step(1);
            fill_step(2);
            CHECK(store.size() == 2);
            CHECK_FALSE(store.isFull());

            fill_step(3);
            CHECK(store.isFull());
        }

        SUBCASE("A second timestep cannot open while one is pending")
        {
            store.beginTimestep();
            CHECK(store.hasPendingTimestep());
            CHECK_THROWS_AS(store.beginTimestep(), std::logic_error);
        }

        SUBCASE("Commit needs the open handle")
        {
            TimestepHandle never_issued{0, 0};
            CHECK_THROWS_AS(store.commit(never_issued, torch::rand({2, 4}), torch::ones({2, 1}),
                                         torch::ones({2}), torch::zeros({2})),
                            std::logic_error);

            auto handle = store.beginTimestep();
            TimestepHandle wrong_step{handle.step + 1, handle.generation};
            CHECK_THROWS_AS(store.storeStatistics(wrong_step, torch::rand({2, 1}), torch::rand({2}),
                                                  torch::rand({2})),
                            std::logic_error);
        }

        SUBCASE("Handles do not survive a reset")
        {
            auto handle = store.beginTimestep();
            store.reset();

            CHECK_FALSE(store.hasPendingTimestep());
            CHECK_THROWS_AS(store.commit(handle, torch::rand({2, 4}), torch::ones({2, 1}),
                                         torch::ones({2}), torch::zeros({2})),
                            std::logic_error);

            auto fresh = store.beginTimestep();
            CHECK(fresh.step == handle.step);
            CHECK(fresh.generation != handle.generation);
        }

        SUBCASE("Full horizon refuses more transitions")
        {
            fill_step(1);
            fill_step(1);
            fill_step(1);

            CHECK_THROWS_AS(store.beginTimestep(), std::logic_error);
            CHECK_THROWS_AS(store.append(torch::rand({2, 4}), torch::ones({2, 1}), torch::ones({2}),
                                         torch::zeros({2}), true),
                            std::logic_error);
        }

        SUBCASE("Per-worker arrays must match the worker count")
        {
            auto handle = store.beginTimestep();
            CHECK_THROWS_AS(store.commit(handle, torch::rand({2, 4}), torch::ones({2, 1}),
                                         torch::ones({3}), torch::zeros({2})),
                            std::invalid_argument);
            CHECK_THROWS_AS(store.commit(handle, torch::rand({3, 4}), torch::ones({2, 1}),
                                         torch::ones({2}), torch::zeros({2})),
                            std::invalid_argument);
            CHECK_THROWS_AS(store.storeStatistics(handle, torch::rand({2, 1}), torch::rand({3}),
                                                  torch::rand({2})),
                            std::invalid_argument);

            // A rejected commit leaves the timestep open
            CHECK(store.hasPendingTimestep());
            CHECK(store.size() == 0);
        }

        SUBCASE("sample() needs a full horizon")
        {
            fill_step(1);
            CHECK_THROWS_AS(store.sample(), std::logic_error);
        }

        SUBCASE("sample() needs statistics for every step")
        {
            fill_step(1);
            store.append(torch::rand({2, 4}), torch::ones({2, 1}), torch::ones({2}), torch::zeros({2}), true);
            fill_step(1);

            CHECK(store.isFull());
            CHECK_THROWS_AS(store.sample(), std::logic_error);
        }

        SUBCASE("sample() is time-major")
        {
            fill_step(1);
            fill_step(2);
            fill_step(3);

            auto batch = store.sample();
            CHECK(batch.observations.sizes().vec() == std::vector<int64_t>{3, 2, 4});
            CHECK(batch.actions.sizes().vec() == std::vector<int64_t>{3, 2, 1});
            CHECK(batch.actions.scalar_type() == torch::kLong);
            CHECK(batch.rewards.sizes().vec() == std::vector<int64_t>{3, 2});
            CHECK(batch.terminals.sizes().vec() == std::vector<int64_t>{3, 2});
            CHECK(batch.values.sizes().vec() == std::vector<int64_t>{3, 2, 1});
            CHECK(batch.logProbs.sizes().vec() == std::vector<int64_t>{3, 2});
            CHECK(batch.entropies.sizes().vec() == std::vector<int64_t>{3, 2});

            CHECK(batch.rewards[0][1].item().toFloat() == doctest::Approx(1));
            CHECK(batch.rewards[2][0].item().toFloat() == doctest::Approx(3));
        }

        SUBCASE("Cached statistics keep their graph")
        {
            auto weight = torch::ones({1}, torch::requires_grad());
            for (int i = 0; i < 3; ++i)
            {
                auto handle = store.beginTimestep();
                store.storeStatistics(handle, torch::ones({2, 1}) * weight, torch::ones({2}) * weight,
                                      torch::ones({2}) * weight);
                store.commit(handle, torch::rand({2, 4}), torch::ones({2, 1}), torch::ones({2}), torch::zeros({2}));
            }

            auto batch = store.sample();
            batch.logProbs.sum().backward();
            CHECK(weight.grad()[0].item().toFloat() == doctest::Approx(6));
        }

        SUBCASE("reset() empties the horizon")
        {
            fill_step(1);
            fill_step(1);
            fill_step(1);
            store.reset();

            CHECK(store.size() == 0);
            fill_step(1);
            CHECK(store.size() == 1);
        }
    }

    TEST_CASE("ExperienceStore windowed state")
    {
        ExperienceStore store(5, 2, {2}, ActionSpace{"Box", {1}}, 3, torch::kCPU);

        auto commit = [&store](float observation, bool terminal_0) {
            auto handle = store.beginTimestep();
            store.commit(handle, torch::full({2, 2}, observation), torch::zeros({2, 1}), torch::zeros({2}),
                         torch::tensor({terminal_0, false}));
        };

        SUBCASE("Empty history is zero-padded")
        {
            auto state = store.getRecentState(torch::full({2, 2}, 7.f));

            CHECK(state.sizes().vec() == std::vector<int64_t>{2, 3, 2});
            CHECK(state[0][0][0].item().toFloat() == doctest::Approx(0));
            CHECK(state[0][1][0].item().toFloat() == doctest::Approx(0));
            CHECK(state[0][2][0].item().toFloat() == doctest::Approx(7));
        }

        SUBCASE("Committed observations precede the newest one")
        {
            commit(1, false);
            commit(2, false);
            commit(3, false);
            auto state = store.getRecentState(torch::full({2, 2}, 4.f));

            CHECK(state[1][0][0].item().toFloat() == doctest::Approx(2));
            CHECK(state[1][1][0].item().toFloat() == doctest::Approx(3));
            CHECK(state[1][2][0].item().toFloat() == doctest::Approx(4));
        }

        SUBCASE("A terminal clears only that worker's history")
        {
            commit(1, false);
            commit(2, true);
            auto state = store.getRecentState(torch::full({2, 2}, 3.f));

            CHECK(state[0][0][0].item().toFloat() == doctest::Approx(0));
            CHECK(state[0][1][0].item().toFloat() == doctest::Approx(0));
            CHECK(state[1][0][0].item().toFloat() == doctest::Approx(1));
            CHECK(state[1][1][0].item().toFloat() == doctest::Approx(2));
        }

        SUBCASE("History survives a horizon reset")
        {
            commit(1, false);
            commit(2, false);
            store.reset();
            auto state = store.getRecentState(torch::full({2, 2}, 3.f));

            CHECK(state[0][1][0].item().toFloat() == doctest::Approx(2));
        }

        SUBCASE("Untracked appends only move the window")
        {
            store.append(torch::full({2, 2}, 5.f), torch::zeros({2, 1}), torch::zeros({2}),
                         torch::zeros({2}), false);
            auto state = store.getRecentState(torch::full({2, 2}, 6.f));

            CHECK(store.size() == 0);
            CHECK(state[0][1][0].item().toFloat() == doctest::Approx(5));
        }

        SUBCASE("Observation shape is checked")
        {
            CHECK_THROWS_AS(store.getRecentState(torch::zeros({2, 3})), std::invalid_argument);
        }
    }
}

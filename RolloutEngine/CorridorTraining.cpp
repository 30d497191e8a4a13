//
// Created by moinshaikh on 3/6/26.
//

#include<chrono>
#include<exception>
#include<memory>
#include<numeric>
#include<string>

#include<spdlog/spdlog.h>

#include<ATen/Parallel.h>

#include"../include/RolloutEngine.hpp"

#include"Corridor.hpp"

using namespace RolloutEngine;

// Algorithm hyperparameters
const float discountFactor = 0.99;
const float entropyCoef = 1e-2;
const float gae = 0.95;
const float learningRate = 1e-3;
const int logInterval = 10;
const int maxFrames = 200000;
const int numFramesPerProc = 8;
const int smoothLength = 20;
const float valueLossCoef = 0.5;
const float maxGradNorm = 0.5;

// Environment hyperparameters
const int numEnvs = 8;
const int corridorLength = 6;
const int timeLimit = 30;
const int windowLength = 2;
const std::string logDirectory = "./logs/corridor";

// Model hyperparameters
const int hiddenSize = 32;
const bool normalizeObservations = true;
const bool useCuda = false;

int main(int argc, char *argv[])
{
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("%^[%T %7l] %v%$");
    at::set_num_threads(1);
    torch::manual_seed(0);

    try
    {
        torch::Device device = useCuda ? torch::kCUDA : torch::kCPU;

        AgentConfig config;
        config.observationShape = {corridorLength};
        config.actionSpace = ActionSpace{"Discrete", {2}};
        config.numWorkers = numEnvs;
        config.smoothLength = smoothLength;
        config.logDirectory = logDirectory;
        config.windowLength = windowLength;
        config.learningRate = learningRate;
        config.discount = discountFactor;
        config.gaeLambda = gae;
        config.numFramesPerProc = numFramesPerProc;
        config.entropyCoef = entropyCoef;
        config.valueLossCoef = valueLossCoef;
        config.maxGradNorm = maxGradNorm;
        config.hiddenSize = hiddenSize;
        config.device = device;

        std::shared_ptr<FeatureProcessor> processor;
        if (normalizeObservations)
        {
            processor = std::make_shared<ObservationNormalizerImpl>(corridorLength);
        }

        A2CAgent agent(config, buildDefaultPolicy, processor);
        Corridor::VectorCorridor env(numEnvs, corridorLength, timeLimit);

        auto observation = env.reset().to(device);
        const int numUpdates = maxFrames / (numFramesPerProc * numEnvs);
        auto start_time = std::chrono::high_resolution_clock::now();

        spdlog::info("Training on {} corridors of length {}", numEnvs, corridorLength);
        for (int update = 0; update < numUpdates; ++update)
        {
            for (int step = 0; step < numFramesPerProc; ++step)
            {
                auto actions = agent.predict(observation);
                auto result = env.step(actions);

                agent.observe(observation, actions, result.rewards.to(device), result.terminals.to(device));
                observation = result.observations.to(device);
            }

            agent.setNewObservation(observation);
            auto data = agent.fit();

            if (update % logInterval == 0 && update > 0)
            {
                auto total_frames = (update + 1) * numFramesPerProc * numEnvs;
                auto run_time = std::chrono::high_resolution_clock::now() - start_time;
                auto fps = total_frames / std::chrono::duration<double>(run_time).count();

                spdlog::info("---");
                spdlog::info("Update: {}/{}", update, numUpdates);
                spdlog::info("Total frames: {}", total_frames);
                spdlog::info("FPS: {}", fps);
                for (const auto &datum : data)
                {
                    spdlog::info("{}: {}", datum.name, datum.value);
                }

                const auto &returns = agent.getTracker().getSmoothedEpisodeReturns();
                if (!returns.empty())
                {
                    auto average = std::accumulate(returns.begin(), returns.end(), 0.f) / returns.size();
                    spdlog::info("Reward: {}", average);
                }
            }
        }
    }
    catch (const std::exception &error)
    {
        spdlog::error("Training stopped: {}", error.what());
        return 1;
    }

    return 0;
}

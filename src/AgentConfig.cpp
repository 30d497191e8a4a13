//
// Created by moinshaikh on 3/2/26.
//

#include<stdexcept>
#include<string>

#include"../include/AgentConfig.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    void AgentConfig::validate() const
    {
        if (observationShape.empty())
        {
            throw std::invalid_argument("observationShape must have at least one dimension");
        }
        if (actionSpace.shape.empty())
        {
            throw std::invalid_argument("actionSpace.shape must have at least one dimension");
        }
        if (numWorkers <= 0)
        {
            throw std::invalid_argument("numWorkers must be positive, got " + std::to_string(numWorkers));
        }
        if (numFramesPerProc <= 0)
        {
            throw std::invalid_argument("numFramesPerProc must be positive, got " +
                                        std::to_string(numFramesPerProc));
        }
        if (windowLength <= 0)
        {
            throw std::invalid_argument("windowLength must be positive, got " + std::to_string(windowLength));
        }
        if (smoothLength <= 0)
        {
            throw std::invalid_argument("smoothLength must be positive, got " + std::to_string(smoothLength));
        }
        if (batchSize <= 0)
        {
            throw std::invalid_argument("batchSize must be positive, got " + std::to_string(batchSize));
        }
        if (discount < 0 || discount > 1)
        {
            throw std::invalid_argument("discount must lie in [0, 1], got " + std::to_string(discount));
        }
        if (gaeLambda < 0 || gaeLambda > 1)
        {
            throw std::invalid_argument("gaeLambda must lie in [0, 1], got " + std::to_string(gaeLambda));
        }
    }

    TEST_CASE("AgentConfig")
    {
        AgentConfig config;
        config.observationShape = {4};
        config.actionSpace = ActionSpace{"Discrete", {2}};

        SUBCASE("Defaults are valid once shapes are set")
        {
            CHECK_NOTHROW(config.validate());
        }

        SUBCASE("Rejects a missing observation shape")
        {
            config.observationShape.clear();
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }

        SUBCASE("Rejects a non-positive horizon")
        {
            config.numFramesPerProc = 0;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }

        SUBCASE("Rejects a non-positive worker count")
        {
            config.numWorkers = -2;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }

        SUBCASE("Rejects a non-positive minibatch size")
        {
            config.batchSize = 0;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }

        SUBCASE("Rejects out of range discount and lambda")
        {
            config.discount = 1.5;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
            config.discount = 0.99;
            config.gaeLambda = -0.1;
            CHECK_THROWS_AS(config.validate(), std::invalid_argument);
        }
    }
}

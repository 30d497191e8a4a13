//
// Created by moinshaikh on 2/6/26.
//

#include<cmath>

#include<torch/torch.h>

#include"../../include/Model/CnnBase.hpp"
#include"../../include/Model/ModelUtils.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    CnnBase::CnnBase(unsigned int numFrames, unsigned int hiddenSize, unsigned int valueSize) :
        NNBase(hiddenSize, valueSize),
        main(torch::nn::Conv2d(torch::nn::Conv2dOptions(numFrames, 32, 8).stride(4)),
            torch::nn::Functional(torch::relu),
            torch::nn::Conv2d(torch::nn::Conv2dOptions(32, 64, 4).stride(2)),
            torch::nn::Functional(torch::relu),
            torch::nn::Conv2d(torch::nn::Conv2dOptions(64, 32, 3).stride(1)),
            torch::nn::Functional(torch::relu),
            torch::nn::Flatten(),
            torch::nn::Linear(32 * 7 * 7, hiddenSize),
            torch::nn::Functional(torch::relu)),
        criticLinear(torch::nn::Linear(hiddenSize, valueSize))
    {
        register_module("main", main);
        register_module("criticLinear", criticLinear);

        initWeights(main->named_parameters(), std::sqrt(2.), 0);
        initWeights(criticLinear->named_parameters(), 1, 0);
        train();
    }

    std::vector<torch::Tensor> CnnBase::forward(torch::Tensor state)
    {
        auto x = main->forward(state);
        return {criticLinear->forward(x), x};
    }

    TEST_CASE("CnnBase")
    {
        auto base = std::make_shared<CnnBase>(4, 16);

        SUBCASE("Window of frames is read as channels")
        {
            auto outputs = base->forward(torch::rand({2, 4, 84, 84}));

            REQUIRE(outputs.size() == 2);

            // Critic
            CHECK(outputs[0].sizes().vec() == std::vector<int64_t>{2, 1});

            // Actor
            CHECK(outputs[1].sizes().vec() == std::vector<int64_t>{2, 16});
        }

        SUBCASE("Wrong window length is rejected by the first convolution")
        {
            CHECK_THROWS(base->forward(torch::rand({2, 3, 84, 84})));
        }
    }
}

//
// Created by moinshaikh on 2/5/26.
//
#include<stdexcept>

#include<torch/torch.h>

#include"../../include/Model/NNBase.hpp"
#include"../../include/Model/MlpBase.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    NNBase::NNBase(unsigned int hiddenSize, unsigned int valueSize) :
        hiddenSize(hiddenSize),
        valueSize(valueSize)
    {
        if (hiddenSize == 0 || valueSize == 0)
        {
            throw std::invalid_argument("NNBase needs a positive hidden and value size");
        }
    }

    TEST_CASE("NNBase")
    {
        SUBCASE("Reports the sizes it was built with")
        {
            auto base = std::make_shared<MlpBase>(6, 32, 3);
            CHECK(base->getOutputSize() == 32);
            CHECK(base->getValueSize() == 3);
        }

        SUBCASE("Rejects an empty value head")
        {
            CHECK_THROWS_AS(MlpBase(6, 32, 0), std::invalid_argument);
        }
    }
}

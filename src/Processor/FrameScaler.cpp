//
// Created by moinshaikh on 3/3/26.
//

#include<stdexcept>
#include<string>

#include"../../include/Processor/FrameScaler.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    FrameScaler::FrameScaler(float scale) : scale(scale)
    {
        if (scale <= 0)
        {
            throw std::invalid_argument("FrameScaler needs a positive scale, got " + std::to_string(scale));
        }
    }

    torch::Tensor FrameScaler::process(torch::Tensor raw)
    {
        return raw.to(torch::kFloat) / scale;
    }

    TEST_CASE("FrameScaler")
    {
        SUBCASE("Byte frames end up in [0, 1]")
        {
            FrameScaler scaler;
            auto frames = torch::randint(0, 256, {2, 84, 84}, torch::kByte);
            auto processed = scaler.process(frames);

            CHECK(processed.scalar_type() == torch::kFloat);
            CHECK(processed.max().item().toFloat() <= 1.f);
            CHECK(processed.min().item().toFloat() >= 0.f);
        }

        SUBCASE("Custom scale")
        {
            FrameScaler scaler(4);
            CHECK(scaler.process(torch::full({1, 2}, 2.f))[0][0].item().toFloat() == doctest::Approx(0.5));
        }

        SUBCASE("Non-positive scale is rejected")
        {
            CHECK_THROWS_AS(FrameScaler(0), std::invalid_argument);
        }
    }
}

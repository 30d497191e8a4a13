//
// Created by moinshaikh on 2/4/26.
//


#include"../../include/Processor/RunningMeanStd.hpp"

#include<doctest/doctest.h>

namespace RolloutEngine
{

    /**
     * @details The count starts at 1e-4 rather than 0 so the first merge
     * never divides by zero; the prior it represents is negligible.
     */
    RunningMeanStdImpl::RunningMeanStdImpl(int64_t size)
    : count(register_buffer("count", torch::full({1}, 1e-4, torch::kFloat))),
      mean(register_buffer("mean", torch::zeros({size}))),
      variance(register_buffer("variance", torch::ones({size}))) {}

    RunningMeanStdImpl::RunningMeanStdImpl(std::vector<float> means, std::vector<float> variances) :
        count(register_buffer("count", torch::full({1}, 1e-4, torch::kFloat))),
        mean(register_buffer("mean", torch::tensor(means))),
        variance(register_buffer("variance", torch::tensor(variances)))
    {
    }

    void RunningMeanStdImpl::update(torch::Tensor observation)
    {
        observation = observation.to(mean.device(), torch::kFloat).reshape({-1, mean.size(0)});
        auto batchMeans = observation.mean(0);
        auto batchVar = observation.var(0, false, false);
        updateFromMoments(batchMeans, batchVar, observation.size(0));
    }

    /**
     * @brief Merges (mean_B, var_B, n_B) into the running (mean_A, var_A, n_A).
     *
     * mean_AB = mean_A + delta * n_B / (n_A + n_B)
     * M2_AB   = n_A var_A + n_B var_B + delta^2 n_A n_B / (n_A + n_B)
     * var_AB  = M2_AB / (n_A + n_B)
     *
     * with delta = mean_B - mean_A.
     */
    void RunningMeanStdImpl::updateFromMoments(torch::Tensor batchMean, torch::Tensor batchVariance, int64_t batchCount)
    {
        torch::NoGradGuard no_grad;
        auto delta = batchMean - mean;
        auto total_count = count + batchCount;

        mean.copy_(mean + delta * batchCount / total_count);
        auto m_a = variance * count;
        auto m_b = batchVariance * batchCount;
        auto m2 = m_a + m_b + torch::pow(delta, 2) * count * batchCount / total_count;
        variance.copy_(m2 / total_count);
        count.copy_(total_count);
    }

    TEST_CASE("RunningMeanStd")
    {
        SUBCASE("Matches the batch statistics after single updates")
        {
            RunningMeanStd rms(5);
            auto observations = torch::rand({3, 5});
            rms->update(observations[0]);
            rms->update(observations[1]);
            rms->update(observations[2]);

            auto expected_mean = observations.mean(0);
            auto expected_variance = observations.var(0, false, false);

            auto actual_mean = rms->getMean();
            auto actual_variance = rms->getVariance();

            for (int i = 0; i < 5; ++i)
            {
                DOCTEST_CHECK(expected_mean[i].item().toFloat() ==
                              doctest::Approx(actual_mean[i].item().toFloat())
                                  .epsilon(0.001));
                DOCTEST_CHECK(expected_variance[i].item().toFloat() ==
                              doctest::Approx(actual_variance[i].item().toFloat())
                                  .epsilon(0.001));
            }
        }

        SUBCASE("A worker batch counts as one sample per worker")
        {
            RunningMeanStd rms(2);
            rms->update(torch::rand({4, 2}));

            CHECK(rms->getCount() == 4);
        }

        SUBCASE("Loads mean and variance from constructor correctly")
        {
            RunningMeanStd rms(std::vector<float>{1, 2, 3}, std::vector<float>{4, 5, 6});

            auto mean = rms->getMean();
            auto variance = rms->getVariance();
            DOCTEST_CHECK(mean[0].item().toFloat() == doctest::Approx(1));
            DOCTEST_CHECK(mean[2].item().toFloat() == doctest::Approx(3));
            DOCTEST_CHECK(variance[0].item().toFloat() == doctest::Approx(4));
            DOCTEST_CHECK(variance[2].item().toFloat() == doctest::Approx(6));
        }
    }
}

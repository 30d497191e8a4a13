//
// Created by moinshaikh on 2/4/26.
//

#include"../../include/Processor/ObservationNormalizer.hpp"
#include"../../include/Processor/RunningMeanStd.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    ObservationNormalizerImpl::ObservationNormalizerImpl(int64_t size, float clip)
    : clip(register_buffer("clip", torch::full({1}, clip, torch::kFloat))),
      rms(register_module("rms", RunningMeanStd(size))) {}


    ObservationNormalizerImpl::ObservationNormalizerImpl(const std::vector<float> &means,
                                                         const std::vector<float> &variances,
                                                         float clip)
    : clip(register_buffer("clip", torch::full({1}, clip, torch::kFloat))),
      rms(register_module("rms", RunningMeanStd(means, variances))) {}

    torch::Tensor ObservationNormalizerImpl::process(torch::Tensor raw)
    {
        auto observation = raw.to(torch::kFloat);
        auto normalized_obs = (observation - rms->getMean()) /
                              torch::sqrt(rms->getVariance() + 1e-8);
        auto bound = getClipValue();
        return torch::clamp(normalized_obs, -bound, bound);
    }

    void ObservationNormalizerImpl::update(torch::Tensor raw)
    {
        rms->update(raw);
    }

    std::vector<float> ObservationNormalizerImpl::getMean() const
    {
        auto mean = rms->getMean().cpu().contiguous();
        return std::vector<float>(mean.data_ptr<float>(), mean.data_ptr<float>() + mean.numel());
    }

    std::vector<float> ObservationNormalizerImpl::getVariances() const
    {
        auto variance = rms->getVariance().cpu().contiguous();
        return std::vector<float>(variance.data_ptr<float>(), variance.data_ptr<float>() + variance.numel());
    }

    TEST_CASE("ObservationNormalizer")
{
    SUBCASE("Clips values correctly")
    {
        ObservationNormalizer normalizer(7, 1);
        float observation_array[] = {-1000, -100, -10, 0, 10, 100, 1000};
        auto observation = torch::from_blob(observation_array, {1, 7});
        auto processed_observation = normalizer->process(observation);

        DOCTEST_CHECK(!(processed_observation > 1).any().item().toBool());
        DOCTEST_CHECK(!(processed_observation < -1).any().item().toBool());
    }

    SUBCASE("Normalizes values correctly")
    {
        ObservationNormalizer normalizer(5);

        float obs_1_array[] = {-10., 0., 5., 3.2, 0.};
        float obs_2_array[] = {-5., 2., 4., 3.7, -3.};
        float obs_3_array[] = {1, 2, 3, 4, 5};
        auto obs_1 = torch::from_blob(obs_1_array, {1, 5});
        auto obs_2 = torch::from_blob(obs_2_array, {1, 5});
        auto obs_3 = torch::from_blob(obs_3_array, {1, 5});

        normalizer->update(obs_1);
        normalizer->update(obs_2);
        normalizer->update(obs_3);
        auto processed_observation = normalizer->process(obs_3);

        DOCTEST_CHECK(processed_observation[0][0].item().toFloat() == doctest::Approx(1.26008659));
        DOCTEST_CHECK(processed_observation[0][1].item().toFloat() == doctest::Approx(0.70712887));
        DOCTEST_CHECK(processed_observation[0][2].item().toFloat() == doctest::Approx(-1.2240818));
        DOCTEST_CHECK(processed_observation[0][3].item().toFloat() == doctest::Approx(1.10914509));
        DOCTEST_CHECK(processed_observation[0][4].item().toFloat() == doctest::Approx(1.31322402));
    }

    SUBCASE("process() leaves the statistics alone")
    {
        ObservationNormalizer normalizer(3);
        normalizer->process(torch::rand({4, 3}));

        DOCTEST_CHECK(normalizer->getStepCount() == 0);
        DOCTEST_CHECK(normalizer->getMean()[0] == doctest::Approx(0));
    }

    SUBCASE("Works through the FeatureProcessor interface")
    {
        std::shared_ptr<FeatureProcessor> processor = std::make_shared<ObservationNormalizerImpl>(
            std::vector<float>({1, 2, 3}), std::vector<float>({4, 4, 4}));

        float raw_array[] = {3, 2, 1};
        auto processed = processor->process(torch::from_blob(raw_array, {1, 3}));

        DOCTEST_CHECK(processed[0][0].item().toFloat() == doctest::Approx(1).epsilon(1e-4));
        DOCTEST_CHECK(processed[0][1].item().toFloat() == doctest::Approx(0).epsilon(1e-4));
        DOCTEST_CHECK(processed[0][2].item().toFloat() == doctest::Approx(-1).epsilon(1e-4));
    }
}

}

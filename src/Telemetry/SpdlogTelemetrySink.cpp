//
// Created by moinshaikh on 3/4/26.
//

#include<filesystem>
#include<fstream>
#include<sstream>
#include<stdexcept>
#include<vector>

#include<spdlog/spdlog.h>
#include<spdlog/sinks/basic_file_sink.h>
#include<spdlog/fmt/ranges.h>
#include<torch/torch.h>

#include"../../include/Telemetry/SpdlogTelemetrySink.hpp"
#include"../../include/Telemetry/TelemetrySink.hpp"
#include<doctest/doctest.h>

namespace RolloutEngine
{
    SpdlogTelemetrySink::SpdlogTelemetrySink(const std::string &logDirectory, int64_t bins) :
        logDirectory(logDirectory),
        bins(bins)
    {
        if (bins <= 0)
        {
            throw std::invalid_argument("Histogram needs at least one bin, got " + std::to_string(bins));
        }

        if (std::filesystem::exists(logDirectory))
        {
            std::filesystem::remove_all(logDirectory);
        }
        std::filesystem::create_directories(logDirectory);

        // Not registered with spdlog, so several sinks can coexist
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(getLogFile(), true);
        logger = std::make_shared<spdlog::logger>("telemetry", file_sink);
        logger->set_pattern("[%Y-%m-%d %T.%e] %v");
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::warn);
    }

    void SpdlogTelemetrySink::addScalar(const std::string &tag, double value, int64_t step)
    {
        logger->info("scalar {} step={} value={}", tag, step, value);
    }

    void SpdlogTelemetrySink::addHistogram(const std::string &tag, torch::Tensor values, int64_t step)
    {
        auto samples = values.detach().to(torch::kCPU, torch::kFloat).flatten();
        if (samples.numel() == 0)
        {
            logger->info("histogram {} step={} empty", tag, step);
            return;
        }

        auto min = samples.min().item().toFloat();
        auto max = samples.max().item().toFloat();
        auto counts = torch::histc(samples, bins, min, max).to(torch::kLong).contiguous();
        std::vector<int64_t> count_vector(counts.data_ptr<int64_t>(), counts.data_ptr<int64_t>() + counts.numel());

        logger->info("histogram {} step={} min={} max={} counts=[{}]",
                     tag, step, min, max, fmt::join(count_vector, ", "));
    }

    void SpdlogTelemetrySink::flush()
    {
        logger->flush();
    }

    std::string SpdlogTelemetrySink::getLogFile() const
    {
        return (std::filesystem::path(logDirectory) / "telemetry.log").string();
    }

    TEST_CASE("SpdlogTelemetrySink")
    {
        auto directory = (std::filesystem::temp_directory_path() / "rollout_engine_telemetry_test").string();

        auto read_log = [](const std::string &file) {
            std::ifstream stream(file);
            std::stringstream contents;
            contents << stream.rdbuf();
            return contents.str();
        };

        SUBCASE("Wipes an existing log directory")
        {
            std::filesystem::create_directories(directory);
            std::ofstream(std::filesystem::path(directory) / "stale.txt") << "old run";

            SpdlogTelemetrySink sink(directory);

            CHECK_FALSE(std::filesystem::exists(std::filesystem::path(directory) / "stale.txt"));
            CHECK(std::filesystem::exists(sink.getLogFile()));
        }

        SUBCASE("Scalars are written with tag and step")
        {
            SpdlogTelemetrySink sink(directory);
            sink.addScalar("data/episode_reward_sum_0", 2.5, 3);
            sink.flush();

            auto contents = read_log(sink.getLogFile());
            CHECK(contents.find("scalar data/episode_reward_sum_0 step=3 value=2.5") != std::string::npos);
        }

        SUBCASE("Histograms are bucketed")
        {
            SpdlogTelemetrySink sink(directory, 2);
            float samples[] = {0, 0, 0, 1};
            sink.addHistogram("data/episode_action_1", torch::from_blob(samples, {4}), 0);
            sink.flush();

            auto contents = read_log(sink.getLogFile());
            CHECK(contents.find("histogram data/episode_action_1 step=0 min=0 max=1 counts=[3, 1]") !=
                  std::string::npos);
        }

        SUBCASE("Empty histograms are still recorded")
        {
            SpdlogTelemetrySink sink(directory);
            sink.addHistogram("data/empty", torch::zeros({0}), 1);
            sink.flush();

            CHECK(read_log(sink.getLogFile()).find("histogram data/empty step=1 empty") != std::string::npos);
        }

        std::filesystem::remove_all(directory);
    }
}

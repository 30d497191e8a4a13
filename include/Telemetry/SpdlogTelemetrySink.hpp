#pragma once
//
// Created by moinshaikh on 3/4/26.
//

#ifndef ROLLOUTENGINE_SPDLOGTELEMETRYSINK_HPP
#define ROLLOUTENGINE_SPDLOGTELEMETRYSINK_HPP

#include<cstdint>
#include<memory>
#include<string>

#include<spdlog/spdlog.h>
#include<torch/torch.h>

#include"TelemetrySink.hpp"

namespace RolloutEngine
{
    /**
     * @brief Writes telemetry as plain text lines to `<logDirectory>/telemetry.log`
     *
     * One line per record:
     *
     *     scalar <tag> step=<step> value=<value>
     *     histogram <tag> step=<step> min=<min> max=<max> counts=[c0, c1, ...]
     *
     * Histograms use `bins` equal-width buckets between the sample minimum and
     * maximum (torch::histc). The log directory is wiped when the sink is
     * created so every run starts from an empty file.
     */
    class SpdlogTelemetrySink : public TelemetrySink
    {
    private:
        std::shared_ptr<spdlog::logger> logger;
        std::string logDirectory;
        int64_t bins;

    public:
        /**
         * @throws spdlog::spdlog_ex if the log file cannot be opened
         * @throws std::filesystem::filesystem_error if the directory cannot be recreated
         */
        explicit SpdlogTelemetrySink(const std::string &logDirectory, int64_t bins = 10);

        void addScalar(const std::string &tag, double value, int64_t step) override;

        void addHistogram(const std::string &tag, torch::Tensor values, int64_t step) override;

        void flush();

        std::string getLogFile() const;
    };
}

#endif //ROLLOUTENGINE_SPDLOGTELEMETRYSINK_HPP

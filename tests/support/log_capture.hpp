/**
 * @file log_capture.hpp
 * @brief RAII ostream sink on the fwv logger so tests can assert on messages
 *
 * the capture lowers the logger threshold to @p level for its lifetime and
 * restores both the level and the sink list afterwards.
 */
#pragma once

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>

#include "fwv/common/log.hpp"

namespace fwv::test_support
{

class LogCapture
{
public:
    explicit LogCapture(spdlog::level::level_enum level = spdlog::level::debug)
        : sink_{std::make_shared<spdlog::sinks::ostream_sink_st>(stream_)},
          previous_level_{log::logger()->level()}
    {
        sink_->set_pattern("%l %v");
        log::logger()->sinks().push_back(sink_);
        log::set_level(level);
    }

    LogCapture(const LogCapture &)                     = delete;
    auto operator=(const LogCapture &) -> LogCapture & = delete;

    ~LogCapture()
    {
        auto &sinks = log::logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        log::set_level(previous_level_);
    }

    [[nodiscard]] auto text() const -> std::string { return stream_.str(); }

private:
    std::ostringstream                              stream_{};
    std::shared_ptr<spdlog::sinks::ostream_sink_st> sink_;
    spdlog::level::level_enum                       previous_level_;
};

} // namespace fwv::test_support

/**
 * @file log.cpp
 * @brief lazily created spdlog logger shared by every fwv module
 */
#include "fwv/common/log.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace fwv::log
{
namespace
{

[[nodiscard]] auto make_logger() -> std::shared_ptr<spdlog::logger>
{
    const std::string name{kLoggerName};
    if (auto existing = spdlog::get(name))
    {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(name);
    created->set_pattern("[%n %l] %v");
    created->set_level(spdlog::level::warn);
    return created;
}

} // namespace

auto logger() -> const std::shared_ptr<spdlog::logger> &
{
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

void set_level(spdlog::level::level_enum level)
{
    logger()->set_level(level);
}

} // namespace fwv::log

/**
 * @file log.hpp
 * @brief one shared spdlog logger for the whole library uwu
 *
 * the registry logs three kinds of breadcrumbs: warnings when a dataset hands
 * us units we cannot interpret, debug chatter while plugins load, and debug
 * notes when the dependency sweep swallows an error. everything funnels
 * through a single named logger ("fwv") so apps can retarget or silence it in
 * one place, and tests can bolt an ostream sink on to assert messages.
 *
 * example:
 * @code
 * fwv::log::set_level(spdlog::level::debug);
 * fwv::log::logger()->debug("loaded {} fields", count);
 * @endcode
 */
#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace fwv::log
{

/// name of the library logger inside spdlog's registry
inline constexpr std::string_view kLoggerName = "fwv";

/**
 * @brief shared library logger (stderr colour sink, created on first use)
 *
 * ⚠️ IMPURE FUNCTION (touches spdlog's global registry)
 */
[[nodiscard]] auto logger() -> const std::shared_ptr<spdlog::logger> &;

/**
 * @brief adjust the library log threshold (default: warn)
 */
void set_level(spdlog::level::level_enum level);

} // namespace fwv::log

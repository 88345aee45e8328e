/**
 * @file dataset_config.hpp
 * @brief YAML dataset descriptions -> DatasetDescription, no exceptions escape uwu
 *
 * the loader parses a YAML document describing one dataset (geometry, unit
 * system, on-disk field list, known-field catalogs, raw arrays, validation
 * knobs) into a dataset::DatasetDescription. it never throws: every failure
 * comes back as a ConfigError with a breadcrumb trail like
 * {"field_list", "[2]"} so typos are easy to find.
 *
 * minimal document:
 * @code{.yaml}
 * name: blast_wave
 * field_list:
 *   - [gas, density]
 *   - [gas, velocity_x]
 * known_fluid_fields:
 *   - {name: density, units: "g/cm**3"}
 *   - {name: velocity_x, units: "cm/s", aliases: [velocity_x]}
 * @endcode
 *
 * example (basic usage):
 * @code
 * auto description = fwv::config::load_dataset_from_file("tests/data/gas_box.yaml");
 * if (!description) {
 *     fmt::print(stderr, "config error: {}\n", description.error().message);
 *     return EXIT_FAILURE;
 * }
 * @endcode
 *
 * @note yaml-cpp 0.8.0+ powers parsing
 */
#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "fwv/dataset/description.hpp"

namespace YAML
{
class Node;
} // namespace YAML

namespace fwv::config
{

/**
 * @brief config error payload with context breadcrumbs
 */
struct ConfigError
{
    std::string              message; ///< human-readable error message
    std::vector<std::string> context; ///< breadcrumb trail showing where things derailed
};

using DatasetResult = std::expected<dataset::DatasetDescription, ConfigError>;

/**
 * @brief load and validate a dataset description from disk
 *
 * ⚠️ IMPURE FUNCTION (reads the filesystem)
 */
[[nodiscard]] auto load_dataset_from_file(const std::filesystem::path &path) -> DatasetResult;

/**
 * @brief parse a dataset description from YAML text
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto load_dataset_from_string(std::string_view yaml_text) -> DatasetResult;

/**
 * @brief validate an already-parsed YAML node
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto parse_dataset_node(const YAML::Node &root) -> DatasetResult;

} // namespace fwv::config

/**
 * @file builtin_plugins.hpp
 * @brief the derived-field plugins every dataset starts with
 *
 * | plugin          | registers (under the default fluid type)                          |
 * |-----------------|-------------------------------------------------------------------|
 * | fluid           | velocity_magnitude, kinetic_energy_density, pressure, sound_speed |
 * | magnetic_field  | magnetic_field_strength, magnetic_energy_density, plasma_beta     |
 * | cutting_plane   | cutting_plane_velocity_normal (only with a slice context)         |
 *
 * the plugins register unconditionally; the validation sweep afterwards
 * prunes whatever the dataset cannot feed.
 */
#pragma once

#include <optional>
#include <string_view>

#include "fwv/fields/plugin_registry.hpp"

namespace fwv::fields
{
class FieldRegistry;
} // namespace fwv::fields

namespace fwv::plugins
{

/// fresh registry holding every built-in plugin
[[nodiscard]] auto builtin_plugins() -> fields::PluginRegistry;

void setup_fluid_fields(fields::FieldRegistry &registry, std::string_view ftype,
                        const std::optional<fields::SliceInfo> &slice_info);

void setup_magnetic_field_fields(fields::FieldRegistry &registry, std::string_view ftype,
                                 const std::optional<fields::SliceInfo> &slice_info);

void setup_cutting_plane_fields(fields::FieldRegistry &registry, std::string_view ftype,
                                const std::optional<fields::SliceInfo> &slice_info);

} // namespace fwv::plugins

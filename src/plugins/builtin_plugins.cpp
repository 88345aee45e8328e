/**
 * @file builtin_plugins.cpp
 * @brief name -> routine table for the built-in plugins
 */
#include "fwv/plugins/builtin_plugins.hpp"

namespace fwv::plugins
{

auto builtin_plugins() -> fields::PluginRegistry
{
    fields::PluginRegistry registry{};
    registry.add("cutting_plane", setup_cutting_plane_fields);
    registry.add("fluid", setup_fluid_fields);
    registry.add("magnetic_field", setup_magnetic_field_fields);
    return registry;
}

} // namespace fwv::plugins

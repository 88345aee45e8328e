/**
 * @file plugin_registry.cpp
 * @brief storage for named field plugins
 */
#include "fwv/fields/plugin_registry.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace fwv::fields
{

void PluginRegistry::add(std::string name, PluginFunction plugin)
{
    plugins_.insert_or_assign(std::move(name), std::move(plugin));
}

auto PluginRegistry::names() const -> std::vector<std::string>
{
    std::vector<std::string> out;
    out.reserve(plugins_.size());
    for (const auto &[name, plugin] : plugins_)
    {
        out.push_back(name);
    }
    return out;
}

auto PluginRegistry::contains(std::string_view name) const -> bool
{
    return plugins_.find(name) != plugins_.end();
}

auto PluginRegistry::find(std::string_view name) const -> const PluginFunction &
{
    const auto it = plugins_.find(name);
    if (it == plugins_.end())
    {
        throw std::out_of_range(fmt::format("no field plugin named '{}'", name));
    }
    return it->second;
}

} // namespace fwv::fields

/**
 * @file plugin_registry.hpp
 * @brief named field-population routines ("plugins")
 *
 * a plugin is a free function that registers a batch of related derived
 * fields. plugins are keyed by stable names and always applied in name order,
 * so the order they were added in never leaks into the resulting registry.
 */
#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fwv::fields
{

class FieldRegistry;

/**
 * @brief geometric context for plugins that only make sense on a slice
 */
struct SliceInfo
{
    std::array<double, 3> normal{0.0, 0.0, 1.0}; ///< plane normal in axis order (need not be unit length)
};

/// (registry, default fluid type, slice context) -> registers fields
using PluginFunction =
    std::function<void(FieldRegistry &, std::string_view ftype, const std::optional<SliceInfo> &slice_info)>;

class PluginRegistry
{
public:
    /// add or replace the routine called @p name
    void add(std::string name, PluginFunction plugin);

    /// routine names in application order
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto contains(std::string_view name) const -> bool;

    /**
     * @throws std::out_of_range when no routine is registered under @p name
     */
    [[nodiscard]] auto find(std::string_view name) const -> const PluginFunction &;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return plugins_.size(); }

private:
    std::map<std::string, PluginFunction, std::less<>> plugins_{};
};

} // namespace fwv::fields

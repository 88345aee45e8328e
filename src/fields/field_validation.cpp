/**
 * @file field_validation.cpp
 * @brief plugin application and the dependency validation sweep
 */
#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "fwv/common/log.hpp"
#include "fwv/dataset/dataset.hpp"
#include "fwv/fields/errors.hpp"
#include "fwv/fields/field_registry.hpp"

namespace fwv::fields
{

auto FieldRegistry::load_plugin(std::string_view plugin_name, std::string_view ftype) -> std::vector<FieldKey>
{
    if (plugins_ == nullptr)
    {
        throw std::out_of_range(fmt::format("no field plugin named '{}'", plugin_name));
    }
    return load_plugin(plugins_->find(plugin_name), ftype);
}

auto FieldRegistry::load_plugin(const PluginFunction &plugin, std::string_view ftype) -> std::vector<FieldKey>
{
    const auto before = fields_;
    plugin(*this, ftype, slice_info_);

    std::vector<FieldKey> loaded;
    for (const auto &[key, definition] : fields_)
    {
        const auto previous = before.find(key);
        if (previous == before.end() || previous->second != definition)
        {
            loaded.push_back(key);
        }
    }
    return loaded;
}

auto FieldRegistry::load_all_plugins(std::string_view ftype, ValidationMode mode) -> ValidationReport
{
    std::vector<FieldKey> loaded;
    if (plugins_ != nullptr)
    {
        for (const auto &plugin_name : plugins_->names())
        {
            const auto added = load_plugin(plugins_->find(plugin_name), ftype);
            loaded.insert(loaded.end(), added.begin(), added.end());
            log::logger()->debug("Loaded {} ({} new fields)", plugin_name, added.size());
        }
    }
    return find_dependencies(loaded, mode);
}

auto FieldRegistry::validate(const std::optional<std::vector<FieldKey>> &fields, ValidationMode mode)
    -> ValidationReport
{
    const auto to_check = fields.value_or(keys());

    ValidationReport   report{};
    std::set<FieldKey> visited;
    for (const auto &key : to_check)
    {
        if (!visited.insert(key).second)
        {
            continue;
        }
        const auto definition = find(key);
        if (!definition)
        {
            continue;
        }

        const DependencyRecord *record = nullptr;
        try
        {
            record = &definition->dependencies(*this);
        }
        catch (const FieldNotFound &missing)
        {
            log::logger()->debug("Field {} needs missing field {}", key, missing.key());
            prune(key);
            report.unavailable.push_back(key);
            continue;
        }
        catch (const std::exception &error)
        {
            if (mode == ValidationMode::Strict || show_field_errors_.contains(key))
            {
                throw;
            }
            log::logger()->debug("Raises {} during field {} detection.", error.what(), key);
            prune(key);
            continue;
        }

        const bool missing = std::any_of(record->requested.begin(), record->requested.end(),
                                         [this](const FieldKey &needed) { return !is_on_disk(needed); });
        if (missing)
        {
            prune(key);
            report.unavailable.push_back(key);
            continue;
        }
        report.dependencies.emplace(key, *record);
        log::logger()->debug("Succeeded with {} (needs {})", key, record->requested);
    }

    if (dataset_ != nullptr)
    {
        dataset_->publish_dependencies(report.dependencies);
    }
    return report;
}

} // namespace fwv::fields

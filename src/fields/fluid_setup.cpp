/**
 * @file fluid_setup.cpp
 * @brief on-disk cell fields: catalog metadata, unit overrides, curvilinear alias remapping
 */
#include <algorithm>
#include <array>
#include <string>
#include <variant>

#include <fmt/format.h>

#include "fwv/common/log.hpp"
#include "fwv/dataset/dataset.hpp"
#include "fwv/fields/errors.hpp"
#include "fwv/fields/field_registry.hpp"
#include "fwv/geometry/coordinates.hpp"

namespace fwv::fields
{
namespace
{

[[nodiscard]] auto find_known(const std::vector<KnownField> &catalog, const std::string &name) -> const KnownField *
{
    const auto it =
        std::find_if(catalog.begin(), catalog.end(), [&name](const KnownField &known) { return known.name == name; });
    return it == catalog.end() ? nullptr : &*it;
}

/**
 * @brief rewrite foo_x/foo_y/foo_z onto the dataset's axis names
 *
 * ✨ PURE FUNCTION ✨
 *
 * only complete triples are remapped; a lone foo_x stays foo_x.
 */
[[nodiscard]] auto remap_vector_alias(const std::string &alias, const std::set<std::string> &gallery,
                                      const std::array<std::string, 3> &axis_names) -> std::string
{
    static constexpr std::array<std::string_view, 3> kSuffixes{"_x", "_y", "_z"};
    if (alias.size() < 2U)
    {
        return alias;
    }
    const auto suffix = std::string_view{alias}.substr(alias.size() - 2U);
    const auto slot   = std::find(kSuffixes.begin(), kSuffixes.end(), suffix);
    if (slot == kSuffixes.end())
    {
        return alias;
    }

    const auto stem = alias.substr(0, alias.size() - 2U);
    for (const auto sibling : kSuffixes)
    {
        if (!gallery.contains(stem + std::string{sibling}))
        {
            return alias;
        }
    }
    return fmt::format("{}_{}", stem, axis_names[static_cast<std::size_t>(slot - kSuffixes.begin())]);
}

} // namespace

auto FieldRegistry::aliases_gallery() const -> std::set<std::string>
{
    std::set<std::string> gallery;
    if (!is_curvilinear())
    {
        return gallery;
    }
    for (const auto &field : field_list_)
    {
        if (is_particle_type(field.category()))
        {
            continue;
        }
        if (const auto *known = find_known(catalogs_.fluid, field.name()); known != nullptr)
        {
            gallery.insert(known->aliases.begin(), known->aliases.end());
        }
    }
    return gallery;
}

auto FieldRegistry::resolve_fluid_units(const FieldKey &field, const std::string &catalog_units) const -> std::string
{
    if (dataset_ == nullptr)
    {
        return catalog_units;
    }

    const dataset::UnitOverride *override_units = nullptr;
    if (const auto by_name = dataset_->field_units_by_name().find(field.name());
        by_name != dataset_->field_units_by_name().end())
    {
        override_units = &by_name->second;
    }
    else if (const auto by_key = dataset_->field_units_by_key().find(field);
             by_key != dataset_->field_units_by_key().end())
    {
        override_units = &by_key->second;
    }
    if (override_units == nullptr)
    {
        return catalog_units;
    }

    if (const auto *text = std::get_if<std::string>(override_units); text != nullptr)
    {
        return *text;
    }
    const auto multiplier = std::get<double>(*override_units);
    if (!catalog_units.empty())
    {
        return fmt::format("(({})*{})", catalog_units, multiplier);
    }
    if (multiplier != 1.0)
    {
        log::logger()->warn("Cannot interpret units: {} * {}, setting to dimensionless.", multiplier, catalog_units);
    }
    return {};
}

void FieldRegistry::setup_fluid_aliases(std::string_view ftype)
{
    const auto  gallery    = aliases_gallery();
    const auto &axis_names = coordinates().axis_names();
    const auto  curvilinear = is_curvilinear();

    for (const auto &field : field_list_)
    {
        if (field.is_bare())
        {
            throw MalformedIdentity(fmt::format("on-disk field '{}' has no category", field.name()));
        }
        if (is_particle_type(field.category()))
        {
            continue;
        }

        static const KnownField unknown{};
        const auto *known = find_known(catalogs_.fluid, field.name());
        if (known == nullptr)
        {
            known = &unknown;
        }

        add_output_field(field, SamplingKind::Cell,
                         {.units = resolve_fluid_units(field, known->units), .display_name = known->display_name});

        for (const auto &declared : known->aliases)
        {
            const auto alias_name = curvilinear ? remap_vector_alias(declared, gallery, axis_names) : declared;
            alias(FieldKey{std::string{ftype}, alias_name}, field);
        }
    }
}

void FieldRegistry::setup_fluid_index_fields()
{
    if (dataset_ == nullptr)
    {
        return;
    }
    std::set<std::string> index_fields;
    for (const auto &key : keys())
    {
        if (key.category() == "index")
        {
            index_fields.insert(key.name());
        }
    }
    for (const auto &ftype : dataset_->fluid_types())
    {
        if (ftype == "index" || ftype == "deposit")
        {
            continue;
        }
        for (const auto &name : index_fields)
        {
            const FieldKey target{ftype, name};
            if (contains(target))
            {
                continue;
            }
            alias(target, FieldKey{"index", name});
        }
    }
}

} // namespace fwv::fields

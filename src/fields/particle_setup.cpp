/**
 * @file particle_setup.cpp
 * @brief per-particle-type registration: catalog fields, kinematics, deposits, sph views, unions
 */
#include <algorithm>
#include <stdexcept>
#include <string>
#include <variant>

#include <fmt/format.h>

#include "fwv/dataset/dataset.hpp"
#include "fwv/fields/errors.hpp"
#include "fwv/fields/field_registry.hpp"
#include "fwv/fields/particle_fields.hpp"
#include "fwv/units/units.hpp"

namespace fwv::fields
{
namespace
{

/// output units are never forced onto these
constexpr std::string_view kSkipOutputUnits = "code_length";

[[nodiscard]] auto is_vector_particle_field(std::string_view name) -> bool
{
    return name == "particle_position" || name == "particle_velocity";
}

[[nodiscard]] auto unit_override(const dataset::Dataset *dataset, const FieldKey &field)
    -> std::optional<std::string>
{
    if (dataset == nullptr)
    {
        return std::nullopt;
    }
    const auto it = dataset->field_units_by_key().find(field);
    if (it == dataset->field_units_by_key().end())
    {
        return std::nullopt;
    }
    if (const auto *text = std::get_if<std::string>(&it->second); text != nullptr)
    {
        return *text;
    }
    const auto multiplier = std::get<double>(it->second);
    return multiplier == 1.0 ? std::string{} : fmt::format("{}", multiplier);
}

} // namespace

void FieldRegistry::setup_particle_fields(const std::string &ptype, const std::string &ftype)
{
    auto known_fields = catalogs_.particle;
    std::sort(known_fields.begin(), known_fields.end(),
              [](const KnownField &lhs, const KnownField &rhs) { return lhs.name < rhs.name; });

    const auto raw_types = raw_particle_types();
    const bool is_raw    = std::find(raw_types.begin(), raw_types.end(), ptype) != raw_types.end();

    for (const auto &known : known_fields)
    {
        const FieldKey field{ptype, known.name};
        const auto     units = unit_override(dataset_, field).value_or(known.units);

        auto output_units = units;
        const bool self_alias =
            std::find(known.aliases.begin(), known.aliases.end(), known.name) != known.aliases.end();
        if ((self_alias || !is_raw) && units != kSkipOutputUnits)
        {
            const auto dimension = unit_catalog().dimension_of(units);
            if (!dimension)
            {
                throw UnitConversionError(fmt::format("field {}: {}", field, dimension.error().message));
            }
            if (!dimension->is_dimensionless())
            {
                output_units = unit_system().units_for(*dimension);
            }
        }
        if (!is_on_disk(field))
        {
            continue;
        }

        add_output_field(field, SamplingKind::Particle,
                         {.units        = units,
                          .display_name = known.display_name,
                          .output_units = output_units,
                          .vector_field = is_vector_particle_field(known.name)});
        for (const auto &alias_name : known.aliases)
        {
            alias(FieldKey{ptype, alias_name}, field, output_units);
        }
    }

    const FieldKey position{ptype, "particle_position"};
    const FieldKey velocity{ptype, "particle_velocity"};
    if (is_on_disk(position) || field_aliases_.contains(position))
    {
        // combined vectors missing from the catalog still need their component count
        for (const auto &vector : {position, velocity})
        {
            if (is_on_disk(vector) && !contains(vector))
            {
                add_output_field(vector, SamplingKind::Particle,
                                 {.units = unit_override(dataset_, vector).value_or(std::string{}),
                                  .vector_field = true});
            }
        }
        particle_scalar_functions(*this, ptype, "particle_position", "particle_velocity");
    }
    else
    {
        // a passthrough particle_position that is not on disk would shadow the synthesized vector
        if (const auto it = fields_.find(position); it != fields_.end() && it->second->is_passthrough())
        {
            static_cast<void>(erase(position));
        }
        particle_vector_functions(*this, ptype,
                                  {"particle_position_x", "particle_position_y", "particle_position_z"},
                                  {"particle_velocity_x", "particle_velocity_y", "particle_velocity_z"});
    }
    particle_deposition_functions(*this, ptype, "particle_position", "particle_mass");
    standard_particle_fields(*this, ptype);

    for (const auto &field : field_list_)
    {
        if (contains(field) || !is_particle_type(field.category()))
        {
            continue;
        }
        add_output_field(field, SamplingKind::Particle,
                         {.units        = unit_override(dataset_, field).value_or(std::string{}),
                          .vector_field = is_vector_particle_field(field.name())});
    }

    static_cast<void>(setup_smoothed_fields(ptype, ftype));
}

auto FieldRegistry::setup_smoothed_fields(const std::string &ptype, const std::string &ftype)
    -> std::vector<std::pair<FieldKey, FieldKey>>
{
    std::vector<std::pair<FieldKey, FieldKey>> new_aliases;
    if (!contains(FieldKey{ptype, "density"}) || dataset_ == nullptr || !dataset_->is_sph_particle_type(ptype))
    {
        return new_aliases;
    }

    const auto &whitelist = sph_whitelist_fields();
    for (const auto &key : keys())
    {
        if (key.category() != ptype)
        {
            continue;
        }
        const auto &name = key.name();
        const bool  listed = std::find(whitelist.begin(), whitelist.end(), name) != whitelist.end();
        if (!listed && !name.starts_with("particle_"))
        {
            continue;
        }

        auto fluid_name = name;
        if (const auto at = fluid_name.find("particle_position_"); at != std::string::npos)
        {
            fluid_name.erase(at, std::string_view{"particle_position_"}.size());
        }
        else if (const auto prefix = fluid_name.find("particle_"); prefix != std::string::npos)
        {
            fluid_name.erase(prefix, std::string_view{"particle_"}.size());
        }
        if (fluid_name.empty())
        {
            continue;
        }
        new_aliases.emplace_back(FieldKey{ftype, fluid_name}, key);
        new_aliases.emplace_back(FieldKey{ptype, fluid_name}, key);
    }

    for (const auto &[alias_key, source] : new_aliases)
    {
        alias(alias_key, source);
    }
    return new_aliases;
}

void FieldRegistry::setup_extra_union_fields(const std::string &ptype)
{
    if (ptype != "all")
    {
        throw std::invalid_argument(
            fmt::format("extra union fields are only supported for particle type \"all\", not \"{}\"", ptype));
    }
    for (const auto &extra : catalogs_.extra_union)
    {
        add_union_field(*this, ptype, extra.name, extra.units);
    }
}

} // namespace fwv::fields

/**
 * @file particle_fields.cpp
 * @brief kinematic, deposition, standard and union particle fields
 */
#include "fwv/fields/particle_fields.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "fwv/fields/field_registry.hpp"
#include "fwv/units/units.hpp"

namespace fwv::fields
{
namespace
{

constexpr std::array<std::string_view, 3> kAxes{"x", "y", "z"};

[[nodiscard]] auto require_vector(const FieldArray &array, const FieldKey &key) -> const FieldArray &
{
    if (array.components != 3U)
    {
        throw std::invalid_argument(
            fmt::format("field {} has {} components, expected a 3-vector", key, array.components));
    }
    return array;
}

/**
 * @brief index of the cell holding each particle, or cell_count when it lies outside every cell
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto nearest_cells(const FieldArray &positions, const std::array<FieldArray, 3> &centers,
                                 const std::array<FieldArray, 3> &widths) -> std::vector<std::size_t>
{
    const auto cell_count = centers[0].values.size();
    std::vector<std::size_t> owners(positions.size(), cell_count);
    for (std::size_t particle = 0; particle < positions.size(); ++particle)
    {
        for (std::size_t cell = 0; cell < cell_count; ++cell)
        {
            bool inside = true;
            for (std::size_t axis = 0; axis < 3U && inside; ++axis)
            {
                const auto lower = centers[axis].values[cell] - 0.5 * widths[axis].values[cell];
                const auto upper = centers[axis].values[cell] + 0.5 * widths[axis].values[cell];
                const auto value = positions.component(particle, axis);
                inside           = value >= lower && value < upper;
            }
            if (inside)
            {
                owners[particle] = cell;
                break;
            }
        }
    }
    return owners;
}

/// positions of @p ptype expressed in the units of the cell centres
[[nodiscard]] auto deposit_inputs(DataSource &data, const FieldKey &coord_key, std::array<FieldArray, 3> &centers,
                                  std::array<FieldArray, 3> &widths) -> FieldArray
{
    for (std::size_t axis = 0; axis < 3U; ++axis)
    {
        centers[axis] = data.cell_centers(axis);
        widths[axis]  = data.cell_widths(axis);
    }
    auto positions = data.get(coord_key);
    static_cast<void>(require_vector(positions, coord_key));
    if (!centers[0].units.empty())
    {
        positions = data.in_units(std::move(positions), centers[0].units);
    }
    return positions;
}

} // namespace

auto sph_whitelist_fields() -> const std::vector<std::string> &
{
    static const std::vector<std::string> fields{
        "density",         "temperature",       "metallicity",        "thermal_energy",
        "smoothing_length", "star_formation_rate", "pressure",        "H_fraction",
        "He_fraction",     "C_fraction",        "N_fraction",         "O_fraction",
        "Ne_fraction",     "Mg_fraction",       "Si_fraction",        "Fe_fraction",
        "H_density",       "He_density",        "electron_density",   "H_p0_number_density",
        "H_p1_number_density", "He_p0_number_density", "He_p1_number_density", "He_p2_number_density",
    };
    return fields;
}

void particle_scalar_functions(FieldRegistry &registry, const std::string &ptype, const std::string &coord_name,
                               const std::string &vel_name)
{
    const auto length_units   = registry.unit_system().units_for(units::dims::length);
    const auto velocity_units = registry.unit_system().units_for(units::dims::velocity);

    for (const auto &[name, units] : {std::pair{coord_name, length_units}, std::pair{vel_name, velocity_units}})
    {
        const FieldKey source{ptype, name};
        for (std::size_t axis = 0; axis < kAxes.size(); ++axis)
        {
            registry.add_field(
                FieldKey{ptype, fmt::format("{}_{}", name, kAxes[axis])},
                [source, axis](const FieldDefinition &, DataSource &data)
                { return extract_component(require_vector(data.get(source), source), axis); },
                SamplingKind::Particle, {.units = units});
        }
    }
}

void particle_vector_functions(FieldRegistry &registry, const std::string &ptype,
                               const std::array<std::string, 3> &coord_names,
                               const std::array<std::string, 3> &vel_names)
{
    const auto make_vector = [](std::array<FieldKey, 3> sources)
    {
        return [sources = std::move(sources)](const FieldDefinition &definition, DataSource &data)
        {
            std::array<FieldArray, 3> parts{};
            for (std::size_t axis = 0; axis < 3U; ++axis)
            {
                parts[axis] = data.in_units(data.get(sources[axis]), definition.units());
            }
            FieldArray out{};
            out.components = 3U;
            out.units      = definition.units();
            const auto count = std::min({parts[0].values.size(), parts[1].values.size(), parts[2].values.size()});
            out.values.reserve(count * 3U);
            for (std::size_t i = 0; i < count; ++i)
            {
                for (const auto &part : parts)
                {
                    out.values.push_back(part.values[i]);
                }
            }
            return out;
        };
    };

    const auto keys_for = [&ptype](const std::array<std::string, 3> &names)
    { return std::array<FieldKey, 3>{FieldKey{ptype, names[0]}, FieldKey{ptype, names[1]}, FieldKey{ptype, names[2]}}; };

    registry.add_field(FieldKey{ptype, "particle_position"}, make_vector(keys_for(coord_names)), SamplingKind::Particle,
                       {.units        = registry.unit_system().units_for(units::dims::length),
                        .vector_field = true});
    registry.add_field(FieldKey{ptype, "particle_velocity"}, make_vector(keys_for(vel_names)), SamplingKind::Particle,
                       {.units        = registry.unit_system().units_for(units::dims::velocity),
                        .vector_field = true});
}

void particle_deposition_functions(FieldRegistry &registry, const std::string &ptype, const std::string &coord_name,
                                   const std::string &mass_name)
{
    const FieldKey coord_key{ptype, coord_name};
    const FieldKey mass_key{ptype, mass_name};
    const auto    &system = registry.unit_system();

    registry.add_field(
        FieldKey{"deposit", ptype + "_count"},
        [coord_key](const FieldDefinition &, DataSource &data)
        {
            std::array<FieldArray, 3> centers{};
            std::array<FieldArray, 3> widths{};
            const auto positions = deposit_inputs(data, coord_key, centers, widths);
            FieldArray counts    = filled(centers[0].values.size(), 0.0);
            for (const auto cell : nearest_cells(positions, centers, widths))
            {
                if (cell < counts.values.size())
                {
                    counts.values[cell] += 1.0;
                }
            }
            return counts;
        },
        SamplingKind::Cell, {.display_name = fmt::format("{} Count", ptype)});

    registry.add_field(
        FieldKey{"deposit", ptype + "_mass"},
        [coord_key, mass_key](const FieldDefinition &definition, DataSource &data)
        {
            std::array<FieldArray, 3> centers{};
            std::array<FieldArray, 3> widths{};
            const auto positions = deposit_inputs(data, coord_key, centers, widths);
            const auto masses    = data.in_units(data.get(mass_key), definition.units());
            FieldArray deposited = filled(centers[0].values.size(), 0.0, definition.units());
            const auto owners    = nearest_cells(positions, centers, widths);
            for (std::size_t particle = 0; particle < owners.size() && particle < masses.values.size(); ++particle)
            {
                if (owners[particle] < deposited.values.size())
                {
                    deposited.values[owners[particle]] += masses.values[particle];
                }
            }
            return deposited;
        },
        SamplingKind::Cell,
        {.units = system.units_for(units::dims::mass), .display_name = fmt::format("{} Mass", ptype)});

    const FieldKey deposited_mass{"deposit", ptype + "_mass"};
    registry.add_field(
        FieldKey{"deposit", ptype + "_density"},
        [deposited_mass](const FieldDefinition &, DataSource &data)
        {
            const auto mass   = data.get(deposited_mass);
            const auto volume = data.get(FieldKey{"index", "cell_volume"});
            return combine(mass, volume, [](double m, double v) { return v > 0.0 ? m / v : 0.0; },
                           units::divide(mass.units, volume.units));
        },
        SamplingKind::Cell,
        {.units = system.units_for(units::dims::density), .display_name = fmt::format("{} Density", ptype)});
}

void standard_particle_fields(FieldRegistry &registry, const std::string &ptype)
{
    const auto &system = registry.unit_system();
    const FieldKey mass_key{ptype, "particle_mass"};

    registry.add_field(
        FieldKey{ptype, "particle_ones"},
        [mass_key](const FieldDefinition &, DataSource &data)
        {
            auto ones = data.get(mass_key);
            ones.values.assign(ones.values.size(), 1.0);
            ones.units.clear();
            return ones;
        },
        SamplingKind::Particle, {.take_log = false});

    std::array<FieldKey, 3> velocity{};
    for (std::size_t axis = 0; axis < 3U; ++axis)
    {
        velocity[axis] = FieldKey{ptype, fmt::format("particle_velocity_{}", kAxes[axis])};
    }

    registry.add_field(
        FieldKey{ptype, "particle_velocity_magnitude"},
        [velocity](const FieldDefinition &definition, DataSource &data)
        {
            FieldArray magnitude{};
            for (const auto &component : velocity)
            {
                const auto values = data.in_units(data.get(component), definition.units());
                if (magnitude.values.empty())
                {
                    magnitude.values.assign(values.values.size(), 0.0);
                }
                magnitude = combine(magnitude, values, [](double acc, double v) { return acc + v * v; });
            }
            for (auto &value : magnitude.values)
            {
                value = std::sqrt(value);
            }
            magnitude.units = definition.units();
            return magnitude;
        },
        SamplingKind::Particle, {.units = system.units_for(units::dims::velocity)});

    const FieldKey speed_key{ptype, "particle_velocity_magnitude"};
    registry.add_field(
        FieldKey{ptype, "particle_kinetic_energy"},
        [mass_key, speed_key](const FieldDefinition &, DataSource &data)
        {
            const auto mass  = data.get(mass_key);
            const auto speed = data.get(speed_key);
            return combine(mass, speed, [](double m, double v) { return 0.5 * m * v * v; },
                           units::multiply(mass.units, units::power(speed.units, 2)));
        },
        SamplingKind::Particle, {.units = system.units_for(units::dims::energy)});
}

void add_union_field(FieldRegistry &registry, const std::string &ptype, const std::string &field,
                     const std::string &units)
{
    std::vector<FieldKey> members;
    for (const auto &member : registry.raw_particle_types())
    {
        members.emplace_back(member, field);
    }

    registry.add_field(
        FieldKey{ptype, field},
        [members](const FieldDefinition &definition, DataSource &data)
        {
            FieldArray joined{};
            joined.units = definition.units();
            for (const auto &member : members)
            {
                const auto part   = data.in_units(data.get(member), definition.units());
                joined.components = part.components;
                joined.values.insert(joined.values.end(), part.values.begin(), part.values.end());
            }
            return joined;
        },
        SamplingKind::Particle, {.units = units});
}

} // namespace fwv::fields

/**
 * @file fluid_fields.cpp
 * @brief hydro derived fields: speed, kinetic energy, ideal-gas pressure, sound speed
 */
#include <array>
#include <cmath>
#include <cstddef>
#include <string>
#include <utility>

#include "fwv/fields/field_registry.hpp"
#include "fwv/fields/validators.hpp"
#include "fwv/plugins/builtin_plugins.hpp"
#include "fwv/units/units.hpp"

namespace fwv::plugins
{
namespace
{

using fields::DataSource;
using fields::FieldArray;
using fields::FieldDefinition;
using fields::FieldKey;

[[nodiscard]] auto velocity_components(std::string_view ftype) -> std::array<FieldKey, 3>
{
    const std::string type{ftype};
    return {FieldKey{type, "velocity_x"}, FieldKey{type, "velocity_y"}, FieldKey{type, "velocity_z"}};
}

} // namespace

void setup_fluid_fields(fields::FieldRegistry &registry, std::string_view ftype,
                        const std::optional<fields::SliceInfo> & /*slice_info*/)
{
    const std::string type{ftype};
    const auto       &system = registry.unit_system();
    const auto        velocity = velocity_components(ftype);
    const FieldKey    density{type, "density"};
    const FieldKey    speed{type, "velocity_magnitude"};
    const FieldKey    pressure{type, "pressure"};
    const FieldKey    thermal_energy{type, "specific_thermal_energy"};

    registry.add_field(
        speed,
        [velocity](const FieldDefinition &definition, DataSource &data)
        {
            FieldArray sum{};
            for (const auto &component : velocity)
            {
                const auto values = data.in_units(data.get(component), definition.units());
                if (sum.values.empty())
                {
                    sum.values.assign(values.values.size(), 0.0);
                }
                sum = fields::combine(sum, values, [](double acc, double v) { return acc + v * v; });
            }
            for (auto &value : sum.values)
            {
                value = std::sqrt(value);
            }
            sum.units = definition.units();
            return sum;
        },
        fields::SamplingKind::Cell, {.units = system.units_for(units::dims::velocity), .display_name = "|v|"});

    registry.add_field(
        FieldKey{type, "kinetic_energy_density"},
        [density, speed](const FieldDefinition &, DataSource &data)
        {
            const auto rho = data.get(density);
            const auto v   = data.get(speed);
            return fields::combine(rho, v, [](double r, double s) { return 0.5 * r * s * s; },
                                   units::multiply(rho.units, units::power(v.units, 2)));
        },
        fields::SamplingKind::Cell, {.units = system.units_for(units::dims::pressure)});

    registry.add_field(
        pressure,
        [density, thermal_energy](const FieldDefinition &, DataSource &data)
        {
            const auto gamma = data.parameter("gamma");
            const auto rho   = data.get(density);
            const auto e     = data.get(thermal_energy);
            return fields::combine(rho, e, [gamma](double r, double u) { return (gamma - 1.0) * r * u; },
                                   units::multiply(rho.units, e.units));
        },
        fields::SamplingKind::Cell,
        {.units      = system.units_for(units::dims::pressure),
         .validators = {fields::validate_parameter({"gamma"})}});

    registry.add_field(
        FieldKey{type, "sound_speed"},
        [density, pressure](const FieldDefinition &definition, DataSource &data)
        {
            const auto gamma = data.parameter("gamma");
            const auto p     = data.get(pressure);
            const auto rho   = data.get(density);
            auto squared = fields::combine(p, rho, [gamma](double pp, double r) { return r > 0.0 ? gamma * pp / r : 0.0; },
                                           units::divide(p.units, rho.units));
            squared = data.in_units(std::move(squared), units::power(definition.units(), 2));
            for (auto &value : squared.values)
            {
                value = std::sqrt(value);
            }
            squared.units = definition.units();
            return squared;
        },
        fields::SamplingKind::Cell,
        {.units      = system.units_for(units::dims::velocity),
         .validators = {fields::validate_parameter({"gamma"})}});
}

void setup_cutting_plane_fields(fields::FieldRegistry &registry, std::string_view ftype,
                                const std::optional<fields::SliceInfo> &slice_info)
{
    if (!slice_info)
    {
        return;
    }
    auto       normal = slice_info->normal;
    const auto length = std::sqrt(normal[0] * normal[0] + normal[1] * normal[1] + normal[2] * normal[2]);
    if (length == 0.0)
    {
        return;
    }
    for (auto &component : normal)
    {
        component /= length;
    }

    const auto velocity = velocity_components(ftype);
    registry.add_field(
        FieldKey{std::string{ftype}, "cutting_plane_velocity_normal"},
        [velocity, normal](const FieldDefinition &definition, DataSource &data)
        {
            FieldArray projected{};
            for (std::size_t axis = 0; axis < 3U; ++axis)
            {
                const auto values = data.in_units(data.get(velocity[axis]), definition.units());
                if (projected.values.empty())
                {
                    projected.values.assign(values.values.size(), 0.0);
                }
                const auto weight = normal[axis];
                projected = fields::combine(projected, values, [weight](double acc, double v) { return acc + weight * v; });
            }
            projected.units = definition.units();
            return projected;
        },
        fields::SamplingKind::Cell,
        {.units        = registry.unit_system().units_for(units::dims::velocity),
         .display_name = "Velocity normal to the cutting plane",
         .take_log     = false});
}

} // namespace fwv::plugins

/**
 * @file magnetic_fields.cpp
 * @brief MHD derived fields in gaussian units
 *
 * B^2 / (8 pi) is evaluated with B in gauss, which keeps the energy density
 * consistent with the pressure units of either unit system.
 */
#include <array>
#include <cmath>
#include <numbers>
#include <optional>
#include <string>

#include "fwv/fields/field_registry.hpp"
#include "fwv/plugins/builtin_plugins.hpp"
#include "fwv/units/units.hpp"

namespace fwv::plugins
{

using fields::DataSource;
using fields::FieldArray;
using fields::FieldDefinition;
using fields::FieldKey;

void setup_magnetic_field_fields(fields::FieldRegistry &registry, std::string_view ftype,
                                 const std::optional<fields::SliceInfo> & /*slice_info*/)
{
    const std::string type{ftype};
    const auto       &system = registry.unit_system();
    const std::array<FieldKey, 3> components{FieldKey{type, "magnetic_field_x"}, FieldKey{type, "magnetic_field_y"},
                                             FieldKey{type, "magnetic_field_z"}};
    const FieldKey strength{type, "magnetic_field_strength"};
    const FieldKey energy{type, "magnetic_energy_density"};
    const FieldKey pressure{type, "pressure"};

    registry.add_field(
        strength,
        [components](const FieldDefinition &definition, DataSource &data)
        {
            FieldArray sum{};
            for (const auto &component : components)
            {
                const auto values = data.in_units(data.get(component), definition.units());
                if (sum.values.empty())
                {
                    sum.values.assign(values.values.size(), 0.0);
                }
                sum = fields::combine(sum, values, [](double acc, double b) { return acc + b * b; });
            }
            for (auto &value : sum.values)
            {
                value = std::sqrt(value);
            }
            sum.units = definition.units();
            return sum;
        },
        fields::SamplingKind::Cell, {.units = system.units_for(units::dims::magnetic_field), .display_name = "|B|"});

    registry.add_field(
        energy,
        [strength](const FieldDefinition &, DataSource &data)
        {
            auto b = data.in_units(data.get(strength), "G");
            for (auto &value : b.values)
            {
                value = value * value / (8.0 * std::numbers::pi);
            }
            b.units = "G**2";
            return b;
        },
        fields::SamplingKind::Cell, {.units = system.units_for(units::dims::pressure)});

    registry.add_field(
        FieldKey{type, "plasma_beta"},
        [pressure, energy](const FieldDefinition &, DataSource &data)
        {
            const auto p     = data.get(pressure);
            const auto p_mag = data.in_units(data.get(energy), p.units);
            return fields::combine(p, p_mag, [](double gas, double mag) { return mag > 0.0 ? gas / mag : 0.0; });
        },
        fields::SamplingKind::Cell, {.units = ""});
}

} // namespace fwv::plugins

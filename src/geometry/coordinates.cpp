/**
 * @file coordinates.cpp
 * @brief axis orders and the geometry-dependent index fields
 */
#include "fwv/geometry/coordinates.hpp"

#include <cmath>
#include <utility>
#include <vector>

#include "fwv/fields/field_registry.hpp"
#include "fwv/units/units.hpp"

namespace fwv::geometry
{
namespace
{

using fields::DataSource;
using fields::FieldArray;
using fields::FieldDefinition;
using fields::FieldKey;

[[nodiscard]] auto index_key(std::string name) -> FieldKey
{
    return FieldKey{"index", std::move(name)};
}

/// r dr dz dtheta, with the radial axis in slot 0
[[nodiscard]] auto cylindrical_volume(const std::array<FieldArray, 3> &centers, const std::array<FieldArray, 3> &widths,
                                      std::size_t cell) -> double
{
    return centers[0].values[cell] * widths[0].values[cell] * widths[1].values[cell] * widths[2].values[cell];
}

/// (r2^3 - r1^3) / 3 * (cos theta1 - cos theta2) * dphi
[[nodiscard]] auto spherical_volume(const std::array<FieldArray, 3> &centers, const std::array<FieldArray, 3> &widths,
                                    std::size_t cell) -> double
{
    const auto r1     = centers[0].values[cell] - 0.5 * widths[0].values[cell];
    const auto r2     = centers[0].values[cell] + 0.5 * widths[0].values[cell];
    const auto theta1 = centers[1].values[cell] - 0.5 * widths[1].values[cell];
    const auto theta2 = centers[1].values[cell] + 0.5 * widths[1].values[cell];
    return (r2 * r2 * r2 - r1 * r1 * r1) / 3.0 * (std::cos(theta1) - std::cos(theta2)) * widths[2].values[cell];
}

} // namespace

auto to_string(GeometryKind kind) noexcept -> std::string_view
{
    switch (kind)
    {
    case GeometryKind::Cartesian:
        return "cartesian";
    case GeometryKind::Cylindrical:
        return "cylindrical";
    case GeometryKind::Polar:
        return "polar";
    case GeometryKind::Spherical:
        return "spherical";
    }
    return "unknown";
}

auto parse_geometry_kind(std::string_view text) -> std::optional<GeometryKind>
{
    for (const auto kind :
         {GeometryKind::Cartesian, GeometryKind::Cylindrical, GeometryKind::Polar, GeometryKind::Spherical})
    {
        if (to_string(kind) == text)
        {
            return kind;
        }
    }
    return std::nullopt;
}

auto default_axis_order(GeometryKind kind) -> std::array<std::string, 3>
{
    switch (kind)
    {
    case GeometryKind::Cylindrical:
        return {"r", "z", "theta"};
    case GeometryKind::Polar:
        return {"r", "theta", "z"};
    case GeometryKind::Spherical:
        return {"r", "theta", "phi"};
    case GeometryKind::Cartesian:
        break;
    }
    return {"x", "y", "z"};
}

Coordinates::Coordinates(GeometryKind kind, std::optional<std::array<std::string, 3>> axis_order)
    : kind_{kind}, axis_names_{axis_order ? std::move(*axis_order) : default_axis_order(kind)}
{
}

auto Coordinates::axis_index(std::string_view name) const noexcept -> std::optional<std::size_t>
{
    for (std::size_t axis = 0; axis < axis_names_.size(); ++axis)
    {
        if (axis_names_[axis] == name)
        {
            return axis;
        }
    }
    return std::nullopt;
}

auto Coordinates::is_angular(std::size_t axis) const noexcept -> bool
{
    return axis < axis_names_.size() && (axis_names_[axis] == "theta" || axis_names_[axis] == "phi");
}

void setup_index_fields(fields::FieldRegistry &registry, const Coordinates &coordinates)
{
    const auto length_units = registry.unit_system().units_for(units::dims::length);

    for (std::size_t axis = 0; axis < 3U; ++axis)
    {
        const auto &name  = coordinates.axis_names()[axis];
        const auto  units = coordinates.is_angular(axis) ? std::string{} : length_units;

        registry.add_field(
            index_key(name),
            [axis](const FieldDefinition &, DataSource &data) { return data.cell_centers(axis); },
            fields::SamplingKind::Cell, {.units = units, .display_name = name, .take_log = false});
        registry.add_field(
            index_key("d" + name),
            [axis](const FieldDefinition &, DataSource &data) { return data.cell_widths(axis); },
            fields::SamplingKind::Cell, {.units = units, .display_name = "d" + name, .take_log = false});
    }

    const auto kind = coordinates.kind();
    const auto axes = coordinates.axis_names();
    registry.add_field(
        index_key("cell_volume"),
        [kind, axes](const FieldDefinition &, DataSource &data)
        {
            std::array<FieldArray, 3> centers{};
            std::array<FieldArray, 3> widths{};
            for (std::size_t axis = 0; axis < 3U; ++axis)
            {
                centers[axis] = data.get(index_key(axes[axis]));
                widths[axis]  = data.get(index_key("d" + axes[axis]));
            }
            FieldArray volume{};
            const auto count = widths[0].values.size();
            volume.values.reserve(count);
            for (std::size_t cell = 0; cell < count; ++cell)
            {
                switch (kind)
                {
                case GeometryKind::Cartesian:
                    volume.values.push_back(widths[0].values[cell] * widths[1].values[cell] * widths[2].values[cell]);
                    break;
                case GeometryKind::Cylindrical:
                case GeometryKind::Polar:
                    volume.values.push_back(cylindrical_volume(centers, widths, cell));
                    break;
                case GeometryKind::Spherical:
                    volume.values.push_back(spherical_volume(centers, widths, cell));
                    break;
                }
            }
            return volume;
        },
        fields::SamplingKind::Cell, {.units = registry.unit_system().units_for(units::dims::volume)});

    registry.add_field(
        index_key("ones"),
        [](const FieldDefinition &, DataSource &data)
        {
            auto ones = data.cell_widths(0);
            ones.values.assign(ones.values.size(), 1.0);
            ones.units.clear();
            return ones;
        },
        fields::SamplingKind::Cell, {.take_log = false});
}

} // namespace fwv::geometry

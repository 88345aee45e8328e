/**
 * @file coordinates.hpp
 * @brief coordinate-system facts the field registry consumes uwu
 *
 * the registry only cares about three things here: the axis names (so vector
 * aliases like `velocity_x` can become `velocity_r` on curvilinear grids),
 * whether the geometry is curvilinear, and the index fields every geometry
 * exposes: cell centres, cell widths, cell volume and a column of ones.
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fwv::fields
{
class FieldRegistry;
} // namespace fwv::fields

namespace fwv::geometry
{

/**
 * @brief supported coordinate systems
 */
enum class GeometryKind : std::uint8_t
{
    Cartesian   = 0U,
    Cylindrical = 1U,
    Polar       = 2U,
    Spherical   = 3U
};

[[nodiscard]] auto to_string(GeometryKind kind) noexcept -> std::string_view;

/// "cartesian" / "cylindrical" / "polar" / "spherical", nullopt otherwise
[[nodiscard]] auto parse_geometry_kind(std::string_view text) -> std::optional<GeometryKind>;

/**
 * @brief default axis order: xyz, (r, z, theta), (r, theta, z), (r, theta, phi)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto default_axis_order(GeometryKind kind) -> std::array<std::string, 3>;

/**
 * @brief geometry kind plus its axis names
 */
class Coordinates
{
public:
    Coordinates() = default;

    /**
     * @param kind        coordinate system
     * @param axis_order  override for the default axis names (frontends sometimes reorder)
     */
    explicit Coordinates(GeometryKind kind, std::optional<std::array<std::string, 3>> axis_order = std::nullopt);

    [[nodiscard]] auto kind() const noexcept -> GeometryKind { return kind_; }
    [[nodiscard]] auto axis_names() const noexcept -> const std::array<std::string, 3> & { return axis_names_; }
    [[nodiscard]] auto axis_index(std::string_view name) const noexcept -> std::optional<std::size_t>;
    [[nodiscard]] auto is_curvilinear() const noexcept -> bool { return kind_ != GeometryKind::Cartesian; }

    /// theta and phi are measured in radians and carry no length units
    [[nodiscard]] auto is_angular(std::size_t axis) const noexcept -> bool;

private:
    GeometryKind               kind_{GeometryKind::Cartesian};
    std::array<std::string, 3> axis_names_{"x", "y", "z"};
};

/**
 * @brief register the ("index", *) fields for @p coordinates
 *
 * ⚠️ IMPURE FUNCTION (mutates the registry)
 *
 * registers, per axis a: ("index", a) cell centres and ("index", "d" + a)
 * cell widths, plus ("index", "cell_volume") and ("index", "ones").
 */
void setup_index_fields(fields::FieldRegistry &registry, const Coordinates &coordinates);

} // namespace fwv::geometry

/**
 * @file description.hpp
 * @brief plain-data description of a dataset, as loaded from YAML
 *
 * ✨ PURE FUNCTION ✨ (aggregates only, no behaviour)
 *
 * everything a frontend would normally hard-code (known-field catalogs, unit
 * overrides, particle types) arrives through this struct instead, one instance
 * per dataset.
 */
#pragma once

#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "fwv/fields/field_key.hpp"
#include "fwv/fields/field_registry.hpp"
#include "fwv/fields/plugin_registry.hpp"
#include "fwv/geometry/coordinates.hpp"

namespace fwv::dataset
{

/// unit override: a unit string, or a bare multiplier applied to the catalog units
using UnitOverride = std::variant<std::string, double>;

/**
 * @brief `code_<name>` unit definition, e.g. code_length = 3.0857e21 cm
 */
struct CodeUnit
{
    double      value{1.0};
    std::string units{};
};

/**
 * @brief uniform grid over [left_edge, right_edge] with x varying fastest
 */
struct Domain
{
    std::array<std::size_t, 3> dimensions{1U, 1U, 1U};
    std::array<double, 3>      left_edge{0.0, 0.0, 0.0};
    std::array<double, 3>      right_edge{1.0, 1.0, 1.0};
    std::string                units{"cm"}; ///< units of the non-angular edges

    [[nodiscard]] auto cell_count() const noexcept -> std::size_t
    {
        return dimensions[0] * dimensions[1] * dimensions[2];
    }
};

/**
 * @brief raw values of one on-disk field
 */
struct RawField
{
    std::vector<double> values{};
    std::size_t         components{1U};
};

struct DatasetDescription
{
    std::string                               name{};
    geometry::GeometryKind                    geometry{geometry::GeometryKind::Cartesian};
    std::optional<std::array<std::string, 3>> axis_order{};
    std::string                               unit_system{"cgs"};
    std::map<std::string, CodeUnit>           code_units{};

    std::string              default_fluid_type{"gas"};
    std::vector<std::string> fluid_types{};
    std::vector<std::string> particle_types{};
    std::vector<std::string> sph_particle_types{};

    std::vector<fields::FieldKey>                field_list{};
    std::map<std::string, UnitOverride>          field_units_by_name{};
    std::map<fields::FieldKey, UnitOverride>     field_units_by_key{};
    fields::FieldCatalogs                        catalogs{};
    std::map<std::string, double>                parameters{};
    Domain                                       domain{};
    std::map<fields::FieldKey, RawField>         data{};
    std::optional<fields::SliceInfo>             slice{};

    bool                          field_test{false};
    std::vector<fields::FieldKey> show_field_errors{};
};

} // namespace fwv::dataset

/**
 * @file data_source.hpp
 * @brief the interface field functions read their inputs through
 *
 * a field function never touches storage directly. it asks a DataSource for
 * other fields (`get`), declares raw on-disk requirements (`request`), reads
 * dataset parameters and cell geometry. two implementations exist:
 * - fields::FieldDetector: dry run that only records what was touched
 * - dataset::FieldEvaluator: real evaluation over the dataset's raw arrays
 */
#pragma once

#include <cstddef>
#include <string_view>
#include <utility>

#include "fwv/fields/field_array.hpp"
#include "fwv/fields/field_key.hpp"

namespace fwv::units
{
class UnitCatalog;
} // namespace fwv::units

namespace fwv::fields
{

/**
 * @brief rescale @p array into @p units
 *
 * arrays with empty units are treated as unit-agnostic and only get relabelled.
 *
 * @throws UnitConversionError when either side fails to parse or dimensions differ
 */
[[nodiscard]] auto convert_units(FieldArray array, std::string_view units, const units::UnitCatalog &catalog)
    -> FieldArray;

class DataSource
{
public:
    DataSource()                                         = default;
    DataSource(const DataSource &)                       = delete;
    auto operator=(const DataSource &) -> DataSource &   = delete;
    DataSource(DataSource &&)                            = delete;
    auto operator=(DataSource &&) -> DataSource &        = delete;
    virtual ~DataSource()                                = default;

    /**
     * @brief values of @p key, resolved through the registry when it is derived
     *
     * @throws FieldNotFound when @p key is neither on disk nor registered
     */
    [[nodiscard]] virtual auto get(const FieldKey &key) -> FieldArray = 0;

    /**
     * @brief declare that @p key must be present on disk
     *
     * dry runs record the identity; real evaluation throws FieldNotFound when absent.
     */
    virtual void request(const FieldKey &key) = 0;

    /**
     * @brief named dataset parameter (gamma, mu, ...)
     *
     * @throws std::out_of_range during real evaluation when the dataset lacks it
     */
    [[nodiscard]] virtual auto parameter(std::string_view name) -> double = 0;

    /// cell-centre coordinate along @p axis (axis order of the dataset geometry)
    [[nodiscard]] virtual auto cell_centers(std::size_t axis) -> FieldArray = 0;

    /// cell width along @p axis
    [[nodiscard]] virtual auto cell_widths(std::size_t axis) -> FieldArray = 0;

    [[nodiscard]] virtual auto is_dry_run() const noexcept -> bool = 0;

    /// unit symbols of the dataset being read
    [[nodiscard]] virtual auto unit_catalog() const -> const units::UnitCatalog & = 0;

    /// convert_units() against this source's catalog
    [[nodiscard]] auto in_units(FieldArray array, std::string_view units) const -> FieldArray
    {
        return convert_units(std::move(array), units, unit_catalog());
    }
};

} // namespace fwv::fields

/**
 * @file data_source.cpp
 * @brief unit conversion shared by every data source
 */
#include "fwv/fields/data_source.hpp"

#include <fmt/format.h>

#include "fwv/fields/errors.hpp"
#include "fwv/units/units.hpp"

namespace fwv::fields
{

auto convert_units(FieldArray array, std::string_view units, const units::UnitCatalog &catalog) -> FieldArray
{
    if (array.units.empty() || array.units == units)
    {
        array.units = std::string{units};
        return array;
    }
    const auto factor = catalog.conversion_factor(array.units, units);
    if (!factor)
    {
        throw UnitConversionError(factor.error().message);
    }
    if (*factor != 1.0)
    {
        for (auto &value : array.values)
        {
            value *= *factor;
        }
    }
    array.units = std::string{units};
    return array;
}

} // namespace fwv::fields

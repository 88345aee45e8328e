/**
 * @file validators.cpp
 * @brief data-field and parameter validators
 */
#include "fwv/fields/validators.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace fwv::fields
{

ValidateDataField::ValidateDataField(std::vector<FieldKey> fields) : fields_{std::move(fields)} {}

void ValidateDataField::check(DataSource &source) const
{
    for (const auto &field : fields_)
    {
        source.request(field);
    }
}

auto ValidateDataField::describe() const -> std::string
{
    std::vector<std::string> labels;
    labels.reserve(fields_.size());
    for (const auto &field : fields_)
    {
        labels.push_back(field.to_string());
    }
    return fmt::format("ValidateDataField({})", fmt::join(labels, ", "));
}

ValidateParameter::ValidateParameter(std::vector<std::string> parameters) : parameters_{std::move(parameters)} {}

void ValidateParameter::check(DataSource &source) const
{
    for (const auto &name : parameters_)
    {
        static_cast<void>(source.parameter(name));
    }
}

auto ValidateParameter::describe() const -> std::string
{
    return fmt::format("ValidateParameter({})", fmt::join(parameters_, ", "));
}

auto validate_data_field(std::vector<FieldKey> fields) -> ValidatorPtr
{
    return std::make_shared<const ValidateDataField>(std::move(fields));
}

auto validate_parameter(std::vector<std::string> parameters) -> ValidatorPtr
{
    return std::make_shared<const ValidateParameter>(std::move(parameters));
}

} // namespace fwv::fields

/**
 * @file field_definition.cpp
 * @brief FieldDefinition construction, sampling-kind sanitising and unit finalisation
 */
#include "fwv/fields/field_definition.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "fwv/common/log.hpp"
#include "fwv/fields/errors.hpp"
#include "fwv/fields/field_detector.hpp"
#include "fwv/units/units.hpp"

namespace fwv::fields
{

auto to_string(SamplingKind kind) noexcept -> std::string_view
{
    switch (kind)
    {
    case SamplingKind::Cell:
        return "cell";
    case SamplingKind::Particle:
        return "particle";
    case SamplingKind::Local:
        return "local";
    }
    return "unknown";
}

auto parse_sampling_kind(std::string_view text, std::optional<bool> particle_type) -> SamplingKind
{
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    SamplingKind kind{};
    if (lowered == "cell")
    {
        kind = SamplingKind::Cell;
    }
    else if (lowered == "particle")
    {
        kind = SamplingKind::Particle;
    }
    else if (lowered == "local")
    {
        kind = SamplingKind::Local;
    }
    else
    {
        throw std::invalid_argument(
            fmt::format("Invalid sampling type {}. Valid sampling types are cell, particle, local", text));
    }

    return sanitize_sampling_kind(kind, particle_type);
}

auto sanitize_sampling_kind(SamplingKind kind, std::optional<bool> particle_type) -> SamplingKind
{
    if (particle_type.value_or(false))
    {
        log::logger()->warn("'particle_type' is deprecated in favour of the sampling kind argument");
        if (kind != SamplingKind::Particle)
        {
            throw ConflictingConfiguration("Conflicting values for parameters 'sampling_type' and 'particle_type'.");
        }
    }
    return kind;
}

FieldDefinition::FieldDefinition(FieldKey key, SamplingKind sampling, FieldFunction function, FieldOptions options)
    : key_{std::move(key)},
      sampling_{sampling},
      function_{std::move(function)},
      units_{std::move(options.units)},
      output_units_{options.output_units.value_or(units_)},
      display_name_{std::move(options.display_name)},
      validators_{std::move(options.validators)},
      take_log_{options.take_log},
      vector_field_{options.vector_field}
{
}

void FieldDefinition::check_validators(DataSource &source) const
{
    for (const auto &validator : validators_)
    {
        validator->check(source);
    }
}

auto FieldDefinition::compute(DataSource &source) const -> FieldArray
{
    if (!function_)
    {
        throw std::logic_error(fmt::format("field {} is read from storage and has no function", key_));
    }
    return function_(*this, source);
}

auto FieldDefinition::dependencies(const FieldRegistry &registry) const -> const DependencyRecord &
{
    if (!requested_)
    {
        FieldDetector detector{registry};
        detector.detect(*this);
        requested_ = DependencyRecord{detector.requested(), detector.requested_parameters()};
    }
    return *requested_;
}

auto make_translation(FieldKey source) -> FieldFunction
{
    return [source = std::move(source)](const FieldDefinition &, DataSource &data) { return data.get(source); };
}

auto finalize_units(const FieldDefinition &definition, FieldArray array, const units::UnitCatalog &catalog)
    -> FieldArray
{
    try
    {
        return convert_units(std::move(array), definition.units(), catalog);
    }
    catch (const UnitConversionError &error)
    {
        throw UnitConversionError(fmt::format("field {}: {}", definition.key(), error.what()));
    }
}

} // namespace fwv::fields

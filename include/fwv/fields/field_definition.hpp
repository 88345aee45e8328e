/**
 * @file field_definition.hpp
 * @brief immutable metadata record describing one registered field uwu
 *
 * a FieldDefinition bundles everything the registry knows about a field:
 * identity, sampling kind, units, display name, validators and the function
 * that computes it. an empty function is the passthrough sentinel: the values
 * come straight from storage and the definition only attaches metadata.
 *
 * the only state that changes after construction is the lazily computed
 * dependency record. the first dependency check runs a dry evaluation and
 * caches the result, so re-validating a field never recomputes it.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "fwv/fields/data_source.hpp"
#include "fwv/fields/field_array.hpp"
#include "fwv/fields/field_key.hpp"
#include "fwv/fields/validators.hpp"

namespace fwv::units
{
class UnitCatalog;
} // namespace fwv::units

namespace fwv::fields
{

class FieldDefinition;
class FieldRegistry;

/**
 * @brief where a field lives: per mesh cell, per particle, or a local scalar
 */
enum class SamplingKind : std::uint8_t
{
    Cell     = 0U,
    Particle = 1U,
    Local    = 2U
};

[[nodiscard]] auto to_string(SamplingKind kind) noexcept -> std::string_view;

/**
 * @brief parse "cell" / "particle" / "local" (case-insensitive)
 *
 * ⚠️ IMPURE FUNCTION (logs a deprecation warning when @p particle_type is set)
 *
 * @param[in] text           sampling kind label
 * @param[in] particle_type  deprecated boolean spelling of "particle"
 * @return parsed SamplingKind
 *
 * @throws std::invalid_argument for unknown labels
 * @throws ConflictingConfiguration when particle_type is true but text is not "particle"
 */
[[nodiscard]] auto parse_sampling_kind(std::string_view text, std::optional<bool> particle_type = std::nullopt)
    -> SamplingKind;

/**
 * @brief reconcile @p kind with the deprecated boolean particle flag
 *
 * @throws ConflictingConfiguration when particle_type is true but @p kind is not Particle
 */
[[nodiscard]] auto sanitize_sampling_kind(SamplingKind kind, std::optional<bool> particle_type) -> SamplingKind;

/**
 * @brief computing callable: (definition, data source) -> values
 *
 * an empty std::function is the passthrough sentinel.
 */
using FieldFunction = std::function<FieldArray(const FieldDefinition &, DataSource &)>;

/**
 * @brief optional metadata accepted by every registration call
 */
struct FieldOptions
{
    std::string                units{};          ///< "" = dimensionless
    std::optional<std::string> display_name{};   ///< label for plots / listings
    std::optional<std::string> output_units{};   ///< defaults to units
    std::vector<ValidatorPtr>  validators{};     ///< preconditions checked before the function
    bool                       take_log{true};   ///< hint for downstream plotting
    bool                       vector_field{false}; ///< three interleaved components
    bool                       force_override{false}; ///< replace an existing definition
    std::optional<bool>        particle_type{};  ///< deprecated spelling of SamplingKind::Particle
};

/**
 * @brief what a field needs from the dataset: on-disk identities and parameters
 */
struct DependencyRecord
{
    std::set<FieldKey>    requested{};
    std::set<std::string> parameters{};

    friend auto operator==(const DependencyRecord &, const DependencyRecord &) -> bool = default;
};

class FieldDefinition
{
public:
    FieldDefinition(FieldKey key, SamplingKind sampling, FieldFunction function, FieldOptions options);

    [[nodiscard]] auto key() const noexcept -> const FieldKey & { return key_; }
    [[nodiscard]] auto sampling() const noexcept -> SamplingKind { return sampling_; }
    [[nodiscard]] auto units() const noexcept -> const std::string & { return units_; }
    [[nodiscard]] auto output_units() const noexcept -> const std::string & { return output_units_; }
    [[nodiscard]] auto display_name() const noexcept -> const std::optional<std::string> & { return display_name_; }
    [[nodiscard]] auto validators() const noexcept -> const std::vector<ValidatorPtr> & { return validators_; }
    [[nodiscard]] auto take_log() const noexcept -> bool { return take_log_; }
    [[nodiscard]] auto vector_field() const noexcept -> bool { return vector_field_; }
    [[nodiscard]] auto is_passthrough() const noexcept -> bool { return !function_; }
    [[nodiscard]] auto is_particle() const noexcept -> bool { return sampling_ == SamplingKind::Particle; }

    /// run every validator against @p source
    void check_validators(DataSource &source) const;

    /**
     * @brief invoke the computing function (validators are not run)
     *
     * @throws std::logic_error for passthrough definitions
     */
    [[nodiscard]] auto compute(DataSource &source) const -> FieldArray;

    /**
     * @brief dependency record, computed by a dry run on first use and cached
     *
     * ⚠️ IMPURE FUNCTION (fills the cache)
     *
     * @param[in] registry registry used to resolve derived inputs
     * @return cached DependencyRecord
     *
     * @throws FieldNotFound, CyclicFieldDependency, UnitConversionError or
     *         whatever the field function throws; nothing is cached then
     */
    [[nodiscard]] auto dependencies(const FieldRegistry &registry) const -> const DependencyRecord &;

    [[nodiscard]] auto has_cached_dependencies() const noexcept -> bool { return requested_.has_value(); }

private:
    FieldKey                   key_;
    SamplingKind               sampling_;
    FieldFunction              function_;
    std::string                units_;
    std::string                output_units_;
    std::optional<std::string> display_name_;
    std::vector<ValidatorPtr>  validators_;
    bool                       take_log_;
    bool                       vector_field_;

    mutable std::optional<DependencyRecord> requested_{};
};

/**
 * @brief function that re-exposes @p source; unit conversion happens when the result is finalised
 */
[[nodiscard]] auto make_translation(FieldKey source) -> FieldFunction;

/**
 * @brief stamp or convert @p array into @p definition's units
 *
 * empty units on the array mean the function already produced the declared
 * units. anything else is converted.
 *
 * @throws UnitConversionError when the units cannot be converted
 */
[[nodiscard]] auto finalize_units(const FieldDefinition &definition, FieldArray array,
                                  const units::UnitCatalog &catalog) -> FieldArray;

} // namespace fwv::fields

/**
 * @file dataset.hpp
 * @brief the dataset: owns the field registry and publishes what it can compute uwu
 *
 * a Dataset turns a DatasetDescription into live state:
 * - a unit catalog with the dataset's `code_*` units and its preferred unit system
 * - the sorted on-disk field list, extended with the "all" particle union
 * - a FieldRegistry built by create_field_info()
 * - the derived field list and dependency map the validation sweep publishes
 *
 * example:
 * @code
 * auto description = fwv::config::load_dataset_from_file("sim.yaml");
 * fwv::dataset::Dataset ds{std::move(*description)};
 * ds.create_field_info();
 * const auto speed = ds.evaluate({"gas", "velocity_magnitude"});
 * @endcode
 */
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fwv/dataset/description.hpp"
#include "fwv/fields/field_array.hpp"
#include "fwv/fields/field_key.hpp"
#include "fwv/fields/field_registry.hpp"
#include "fwv/fields/plugin_registry.hpp"
#include "fwv/geometry/coordinates.hpp"
#include "fwv/units/units.hpp"

namespace fwv::dataset
{

class Dataset
{
public:
    /**
     * @throws std::invalid_argument for an unknown unit system or a broken code unit
     */
    explicit Dataset(DatasetDescription description);

    Dataset(const Dataset &)                     = delete;
    auto operator=(const Dataset &) -> Dataset & = delete;
    Dataset(Dataset &&)                          = delete;
    auto operator=(Dataset &&) -> Dataset &      = delete;
    ~Dataset();

    /**
     * @brief build and validate the field registry
     *
     * ⚠️ IMPURE FUNCTION (replaces any previous registry and published lists)
     *
     * @param mode validation mode; defaults to Strict for field-test datasets
     */
    void create_field_info(std::optional<fields::ValidationMode> mode = std::nullopt);

    [[nodiscard]] auto has_field_info() const noexcept -> bool { return field_info_ != nullptr; }

    /**
     * @throws std::logic_error before create_field_info()
     */
    [[nodiscard]] auto field_info() -> fields::FieldRegistry &;
    [[nodiscard]] auto field_info() const -> const fields::FieldRegistry &;

    /// plugins applied by create_field_info (built-ins plus anything added before)
    [[nodiscard]] auto plugins() noexcept -> fields::PluginRegistry & { return plugins_; }

    /**
     * @brief evaluate @p key against the raw data
     *
     * @throws FieldNotFound when the field is unknown or pruned
     */
    [[nodiscard]] auto evaluate(const fields::FieldKey &key) const -> fields::FieldArray;

    /// merge a validation sweep into the published lists
    void publish_dependencies(const std::map<fields::FieldKey, fields::DependencyRecord> &dependencies);

    [[nodiscard]] auto name() const noexcept -> const std::string & { return description_.name; }
    [[nodiscard]] auto description() const noexcept -> const DatasetDescription & { return description_; }
    [[nodiscard]] auto coordinates() const noexcept -> const geometry::Coordinates & { return coordinates_; }
    [[nodiscard]] auto unit_system() const noexcept -> const units::UnitSystem & { return unit_system_; }
    [[nodiscard]] auto unit_catalog() const noexcept -> const units::UnitCatalog & { return unit_catalog_; }
    [[nodiscard]] auto domain() const noexcept -> const Domain & { return description_.domain; }
    [[nodiscard]] auto default_fluid_type() const noexcept -> const std::string & { return description_.default_fluid_type; }
    [[nodiscard]] auto fluid_types() const noexcept -> const std::vector<std::string> & { return fluid_types_; }
    [[nodiscard]] auto particle_types() const noexcept -> const std::vector<std::string> & { return particle_types_; }
    [[nodiscard]] auto particle_types_raw() const noexcept -> const std::vector<std::string> & { return description_.particle_types; }
    [[nodiscard]] auto is_particle_type(std::string_view category) const -> bool;
    [[nodiscard]] auto is_sph_particle_type(std::string_view category) const -> bool;
    [[nodiscard]] auto field_list() const noexcept -> const std::vector<fields::FieldKey> & { return field_list_; }
    [[nodiscard]] auto is_on_disk(const fields::FieldKey &key) const -> bool;
    [[nodiscard]] auto field_test() const noexcept -> bool { return description_.field_test; }

    /// per-name then per-identity unit overrides
    [[nodiscard]] auto field_units_by_name() const noexcept -> const std::map<std::string, UnitOverride> & { return description_.field_units_by_name; }
    [[nodiscard]] auto field_units_by_key() const noexcept -> const std::map<fields::FieldKey, UnitOverride> & { return description_.field_units_by_key; }

    /**
     * @throws std::out_of_range when the parameter is not defined
     */
    [[nodiscard]] auto parameter(std::string_view name) const -> double;

    /**
     * @brief raw values of an on-disk field; ("all", f) concatenates every raw particle type
     *
     * @throws FieldNotFound when no raw data is stored for @p key
     */
    [[nodiscard]] auto raw_field(const fields::FieldKey &key) const -> RawField;

    [[nodiscard]] auto derived_field_list() const noexcept -> const std::vector<fields::FieldKey> & { return derived_field_list_; }
    [[nodiscard]] auto field_dependencies() const noexcept -> const std::map<fields::FieldKey, fields::DependencyRecord> & { return field_dependencies_; }

private:
    DatasetDescription                                   description_;
    geometry::Coordinates                                coordinates_;
    units::UnitSystem                                    unit_system_;
    units::UnitCatalog                                   unit_catalog_{};
    std::vector<std::string>                             fluid_types_{};
    std::vector<std::string>                             particle_types_{};
    std::vector<fields::FieldKey>                        field_list_{};
    fields::PluginRegistry                               plugins_;
    std::unique_ptr<fields::FieldRegistry>               field_info_{};
    std::vector<fields::FieldKey>                        derived_field_list_{};
    std::map<fields::FieldKey, fields::DependencyRecord> field_dependencies_{};
};

} // namespace fwv::dataset

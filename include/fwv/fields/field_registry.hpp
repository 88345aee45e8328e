/**
 * @file field_registry.hpp
 * @brief the field container: identity -> definition, aliases, fallback chain, validation uwu
 *
 * a FieldRegistry is the authoritative answer to "which fields can this
 * dataset compute?". it is populated in phases by the owning dataset:
 * 1. fluid aliasing: on-disk cell fields get catalog metadata + declared aliases
 * 2. index fields and particle setup (vectors, deposits, unions, sph views)
 * 3. plugins, applied in name order
 * 4. one validation sweep that dry-runs every field and prunes the ones whose
 *    on-disk requirements this dataset cannot meet
 *
 * registries chain: lookup, containment and key listing consult the local
 * map first and then walk the fallback. a local definition always shadows a
 * fallback one. the chain must be acyclic; nobody checks that at runtime.
 *
 * example:
 * @code
 * fwv::fields::FieldRegistry registry{};
 * registry.add_output_field({"gas", "density"}, fwv::fields::SamplingKind::Cell, {.units = "g/cm**3"});
 * registry.alias({"gas", "rho"}, {"gas", "density"});
 * const auto &definition = registry.lookup({"gas", "rho"}); // translation onto ("gas", "density")
 * @endcode
 *
 * @note single-writer: mutate from one thread during setup, read afterwards
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "fwv/fields/field_definition.hpp"
#include "fwv/fields/field_key.hpp"
#include "fwv/fields/plugin_registry.hpp"

namespace fwv::dataset
{
class Dataset;
} // namespace fwv::dataset

namespace fwv::geometry
{
class Coordinates;
} // namespace fwv::geometry

namespace fwv::units
{
class UnitCatalog;
class UnitSystem;
} // namespace fwv::units

namespace fwv::fields
{

/**
 * @brief static metadata a frontend knows about a bare field name
 */
struct KnownField
{
    std::string                name;
    std::string                units{};
    std::vector<std::string>   aliases{};
    std::optional<std::string> display_name{};
};

/**
 * @brief frontend-supplied catalogs, injected once per registry
 */
struct FieldCatalogs
{
    std::vector<KnownField> fluid{};       ///< keyed by bare name of on-disk cell fields
    std::vector<KnownField> particle{};    ///< keyed by bare name of on-disk particle fields
    std::vector<KnownField> extra_union{}; ///< derived union fields for the "all" particle type
};

/**
 * @brief how the validation sweep treats unexpected errors during discovery
 */
enum class ValidationMode : std::uint8_t
{
    Lenient = 0U, ///< log at debug level and drop the field
    Strict  = 1U  ///< rethrow to the caller
};

/**
 * @brief outcome of one validation sweep
 */
struct ValidationReport
{
    std::map<FieldKey, DependencyRecord> dependencies{}; ///< survivors and what they read
    std::vector<FieldKey>                unavailable{};  ///< dropped because their inputs are missing
};

class FieldRegistry
{
public:
    /// deferred registration handle: call it with the function to register
    using Registrar = std::function<void(FieldFunction)>;

    /// detached registry: no dataset, no on-disk fields, cgs units, default fluid type "gas"
    FieldRegistry();

    /**
     * @param dataset     owning dataset (may be null); receives the validation results
     * @param field_list  on-disk identities of the dataset
     * @param catalogs    known-field metadata for this frontend
     * @param plugins     plugin routines applied by load_all_plugins (may be null)
     * @param slice_info  slice context forwarded to plugins
     */
    FieldRegistry(dataset::Dataset *dataset, std::vector<FieldKey> field_list, FieldCatalogs catalogs = {},
                  const PluginRegistry *plugins = nullptr, std::optional<SliceInfo> slice_info = std::nullopt);

    FieldRegistry(const FieldRegistry &)                     = delete;
    auto operator=(const FieldRegistry &) -> FieldRegistry & = delete;
    FieldRegistry(FieldRegistry &&)                          = delete;
    auto operator=(FieldRegistry &&) -> FieldRegistry &      = delete;
    ~FieldRegistry()                                         = default;

    /**
     * @brief empty registry chained to @p fallback
     *
     * the child shares the fallback's dataset, on-disk list and catalogs but
     * starts with no definitions of its own.
     */
    [[nodiscard]] static auto create_with_fallback(FieldRegistry &fallback, std::string name = {})
        -> std::unique_ptr<FieldRegistry>;

    void set_fallback(FieldRegistry *fallback) noexcept { fallback_ = fallback; }
    [[nodiscard]] auto fallback() const noexcept -> FieldRegistry * { return fallback_; }
    [[nodiscard]] auto name() const noexcept -> const std::string & { return name_; }

    // ---------------------------------------------------------------- registration

    /**
     * @brief register a computed field
     *
     * no-op when @p key already resolves (locally or through the fallback)
     * unless options.force_override is set. bare keys are qualified to
     * ("all", name) for particle fields or (default fluid type, name)
     * otherwise, and the bare name becomes an alias of the qualified key.
     *
     * @throws ConflictingConfiguration when options.particle_type contradicts @p sampling
     */
    void add_field(const FieldKey &key, FieldFunction function, SamplingKind sampling, FieldOptions options = {});

    /**
     * @brief deferred form of add_field: metadata now, function later
     */
    [[nodiscard]] auto deferred_add_field(FieldKey key, SamplingKind sampling, FieldOptions options = {}) -> Registrar;

    /**
     * @brief register a field read verbatim from storage (always replaces)
     */
    void add_output_field(const FieldKey &key, SamplingKind sampling, FieldOptions options = {});

    /**
     * @brief expose @p source under @p alias_key, converting units when they differ
     *
     * no-op when @p source does not resolve. default units are the unit
     * system's preferred string for the source's dimension, or the source's
     * own units when it is dimensionless.
     *
     * @throws UnitConversionError when the source carries unparseable units
     */
    void alias(const FieldKey &alias_key, const FieldKey &source, std::optional<std::string> units = std::nullopt);

    // ---------------------------------------------------------------- queries

    [[nodiscard]] auto contains(const FieldKey &key) const -> bool;
    [[nodiscard]] auto contains_local(const FieldKey &key) const -> bool { return fields_.contains(key); }

    /// definition for @p key anywhere in the chain, nullptr when absent
    [[nodiscard]] auto find(const FieldKey &key) const -> std::shared_ptr<const FieldDefinition>;

    /**
     * @throws FieldNotFound when @p key is absent from the whole chain
     */
    [[nodiscard]] auto lookup(const FieldKey &key) const -> const FieldDefinition &;

    /// local keys (sorted), then the fallback's; duplicates are possible
    [[nodiscard]] auto keys() const -> std::vector<FieldKey>;

    /// local (key, definition) pairs only
    [[nodiscard]] auto local_items() const -> std::vector<std::pair<FieldKey, std::shared_ptr<const FieldDefinition>>>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return fields_.size(); }

    /// remove a local definition; returns whether one was removed
    auto erase(const FieldKey &key) -> bool;

    /// remove @p key from this registry and every fallback below it
    void prune(const FieldKey &key);

    /// alias -> source relations recorded by alias()
    [[nodiscard]] auto field_aliases() const noexcept -> const std::map<FieldKey, FieldKey> & { return field_aliases_; }

    // ---------------------------------------------------------------- dataset facts

    [[nodiscard]] auto field_list() const noexcept -> const std::vector<FieldKey> & { return field_list_; }
    [[nodiscard]] auto is_on_disk(const FieldKey &key) const -> bool;
    [[nodiscard]] auto catalogs() const noexcept -> const FieldCatalogs & { return catalogs_; }
    [[nodiscard]] auto default_fluid_type() const -> std::string;
    [[nodiscard]] auto is_particle_type(std::string_view category) const -> bool;
    [[nodiscard]] auto raw_particle_types() const -> std::vector<std::string>;
    [[nodiscard]] auto unit_system() const -> const units::UnitSystem &;
    [[nodiscard]] auto unit_catalog() const -> const units::UnitCatalog &;
    [[nodiscard]] auto coordinates() const -> const geometry::Coordinates &;
    [[nodiscard]] auto is_curvilinear() const -> bool;
    [[nodiscard]] auto slice_info() const noexcept -> const std::optional<SliceInfo> & { return slice_info_; }

    // ---------------------------------------------------------------- fluid setup (fluid_setup.cpp)

    /**
     * @brief passthrough + catalog aliases for every on-disk cell field
     *
     * @throws MalformedIdentity when the on-disk list contains a bare name
     */
    void setup_fluid_aliases(std::string_view ftype = "gas");

    /// alias every ("index", f) into each fluid type except index and deposit
    void setup_fluid_index_fields();

    /// catalog aliases of on-disk cell fields, gathered only on curvilinear geometries
    [[nodiscard]] auto aliases_gallery() const -> std::set<std::string>;

    // ---------------------------------------------------------------- particle setup (particle_setup.cpp)

    /**
     * @brief catalog metadata, kinematic vectors, deposits, standard fields and sph views for @p ptype
     */
    void setup_particle_fields(const std::string &ptype, const std::string &ftype = "gas");

    /**
     * @brief fluid-view aliases of sph particle fields
     *
     * @return (alias, source) pairs that were attempted
     */
    auto setup_smoothed_fields(const std::string &ptype, const std::string &ftype = "gas")
        -> std::vector<std::pair<FieldKey, FieldKey>>;

    /**
     * @throws std::invalid_argument unless @p ptype is "all"
     */
    void setup_extra_union_fields(const std::string &ptype = "all");

    // ---------------------------------------------------------------- plugins + validation (field_validation.cpp)

    /**
     * @brief apply one routine, returning the identities it introduced or replaced
     *
     * @throws std::out_of_range when @p plugin_name is unknown
     */
    auto load_plugin(std::string_view plugin_name, std::string_view ftype = "gas") -> std::vector<FieldKey>;
    auto load_plugin(const PluginFunction &plugin, std::string_view ftype = "gas") -> std::vector<FieldKey>;

    /**
     * @brief apply every plugin in name order, then validate everything they added
     */
    auto load_all_plugins(std::string_view ftype = "gas", ValidationMode mode = ValidationMode::Lenient)
        -> ValidationReport;

    /**
     * @brief dry-run @p fields (all keys when nullopt), prune the unsatisfiable ones
     *
     * results are merged into the owning dataset's derived field list and
     * dependency map. identities that no longer resolve are skipped.
     *
     * @throws whatever discovery raised, in Strict mode or for identities
     *         registered through show_field_errors()
     */
    auto validate(const std::optional<std::vector<FieldKey>> &fields = std::nullopt,
                  ValidationMode mode = ValidationMode::Lenient) -> ValidationReport;

    /// validate() under its historical name, applied to a specific batch
    auto find_dependencies(const std::vector<FieldKey> &loaded, ValidationMode mode = ValidationMode::Lenient)
        -> ValidationReport
    {
        return validate(loaded, mode);
    }

    /// discovery errors for @p key always propagate, regardless of mode
    void show_field_errors(const FieldKey &key) { show_field_errors_.insert(key); }

private:
    [[nodiscard]] auto qualify(const FieldKey &key, SamplingKind sampling) const -> FieldKey;
    [[nodiscard]] auto resolve_fluid_units(const FieldKey &field, const std::string &catalog_units) const
        -> std::string;

    dataset::Dataset                                          *dataset_{nullptr};
    std::string                                                name_{};
    std::vector<FieldKey>                                      field_list_{};
    FieldCatalogs                                              catalogs_{};
    const PluginRegistry                                      *plugins_{nullptr};
    std::optional<SliceInfo>                                   slice_info_{};
    std::map<FieldKey, std::shared_ptr<const FieldDefinition>> fields_{};
    std::map<FieldKey, FieldKey>                               field_aliases_{};
    std::set<FieldKey>                                         show_field_errors_{};
    FieldRegistry                                             *fallback_{nullptr};
};

} // namespace fwv::fields

/**
 * @file field_registry.cpp
 * @brief registration, aliasing and chained lookup
 */
#include "fwv/fields/field_registry.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "fwv/dataset/dataset.hpp"
#include "fwv/fields/errors.hpp"
#include "fwv/geometry/coordinates.hpp"
#include "fwv/units/units.hpp"

namespace fwv::fields
{
namespace
{

[[nodiscard]] auto detached_unit_system() -> const units::UnitSystem &
{
    static const auto system = units::UnitSystem::cgs();
    return system;
}

[[nodiscard]] auto detached_unit_catalog() -> const units::UnitCatalog &
{
    static const units::UnitCatalog catalog{};
    return catalog;
}

[[nodiscard]] auto detached_coordinates() -> const geometry::Coordinates &
{
    static const geometry::Coordinates coordinates{};
    return coordinates;
}

} // namespace

FieldRegistry::FieldRegistry() = default;

FieldRegistry::FieldRegistry(dataset::Dataset *dataset, std::vector<FieldKey> field_list, FieldCatalogs catalogs,
                             const PluginRegistry *plugins, std::optional<SliceInfo> slice_info)
    : dataset_{dataset},
      field_list_{std::move(field_list)},
      catalogs_{std::move(catalogs)},
      plugins_{plugins},
      slice_info_{std::move(slice_info)}
{
    std::sort(field_list_.begin(), field_list_.end());
    field_list_.erase(std::unique(field_list_.begin(), field_list_.end()), field_list_.end());
}

auto FieldRegistry::create_with_fallback(FieldRegistry &fallback, std::string name) -> std::unique_ptr<FieldRegistry>
{
    auto registry = std::make_unique<FieldRegistry>(fallback.dataset_, fallback.field_list_, fallback.catalogs_,
                                                    fallback.plugins_, fallback.slice_info_);
    registry->name_     = std::move(name);
    registry->fallback_ = &fallback;
    return registry;
}

auto FieldRegistry::qualify(const FieldKey &key, SamplingKind sampling) const -> FieldKey
{
    const auto ftype = sampling == SamplingKind::Particle ? std::string{"all"} : default_fluid_type();
    return FieldKey{ftype, key.name()};
}

void FieldRegistry::add_field(const FieldKey &key, FieldFunction function, SamplingKind sampling,
                              FieldOptions options)
{
    if (!options.force_override && contains(key))
    {
        return;
    }
    sampling = sanitize_sampling_kind(sampling, options.particle_type);

    if (!key.is_bare())
    {
        fields_.insert_or_assign(key, std::make_shared<const FieldDefinition>(key, sampling, std::move(function),
                                                                              std::move(options)));
        return;
    }

    const auto qualified = qualify(key, sampling);
    if (!contains(qualified))
    {
        fields_.insert_or_assign(qualified, std::make_shared<const FieldDefinition>(
                                                qualified, sampling, std::move(function), std::move(options)));
        alias(key, qualified);
        return;
    }
    fields_.insert_or_assign(key, std::make_shared<const FieldDefinition>(key, sampling, std::move(function),
                                                                          std::move(options)));
}

auto FieldRegistry::deferred_add_field(FieldKey key, SamplingKind sampling, FieldOptions options) -> Registrar
{
    return [this, key = std::move(key), sampling, options = std::move(options)](FieldFunction function)
    { add_field(key, std::move(function), sampling, options); };
}

void FieldRegistry::add_output_field(const FieldKey &key, SamplingKind sampling, FieldOptions options)
{
    sampling = sanitize_sampling_kind(sampling, options.particle_type);
    fields_.insert_or_assign(key, std::make_shared<const FieldDefinition>(key, sampling, FieldFunction{},
                                                                          std::move(options)));
}

void FieldRegistry::alias(const FieldKey &alias_key, const FieldKey &source, std::optional<std::string> units)
{
    const auto original = find(source);
    if (!original)
    {
        return;
    }
    if (!units)
    {
        const auto dimension = unit_catalog().dimension_of(original->units());
        if (!dimension)
        {
            throw UnitConversionError(
                fmt::format("cannot alias {} to {}: {}", alias_key, source, dimension.error().message));
        }
        units = dimension->is_dimensionless() ? original->units() : unit_system().units_for(*dimension);
    }

    field_aliases_.insert_or_assign(alias_key, source);
    add_field(alias_key, make_translation(source), original->sampling(),
              {.units        = std::move(*units),
               .display_name = original->display_name(),
               .take_log     = original->take_log(),
               .vector_field = original->vector_field()});
}

auto FieldRegistry::contains(const FieldKey &key) const -> bool
{
    if (fields_.contains(key))
    {
        return true;
    }
    return fallback_ != nullptr && fallback_->contains(key);
}

auto FieldRegistry::find(const FieldKey &key) const -> std::shared_ptr<const FieldDefinition>
{
    if (const auto it = fields_.find(key); it != fields_.end())
    {
        return it->second;
    }
    if (fallback_ == nullptr)
    {
        return nullptr;
    }
    return fallback_->find(key);
}

auto FieldRegistry::lookup(const FieldKey &key) const -> const FieldDefinition &
{
    if (const auto it = fields_.find(key); it != fields_.end())
    {
        return *it->second;
    }
    if (fallback_ == nullptr)
    {
        throw FieldNotFound(key);
    }
    return fallback_->lookup(key);
}

auto FieldRegistry::keys() const -> std::vector<FieldKey>
{
    std::vector<FieldKey> out;
    out.reserve(fields_.size());
    for (const auto &[key, definition] : fields_)
    {
        out.push_back(key);
    }
    if (fallback_ != nullptr)
    {
        const auto inherited = fallback_->keys();
        out.insert(out.end(), inherited.begin(), inherited.end());
    }
    return out;
}

auto FieldRegistry::local_items() const -> std::vector<std::pair<FieldKey, std::shared_ptr<const FieldDefinition>>>
{
    return {fields_.begin(), fields_.end()};
}

auto FieldRegistry::erase(const FieldKey &key) -> bool
{
    field_aliases_.erase(key);
    return fields_.erase(key) > 0U;
}

void FieldRegistry::prune(const FieldKey &key)
{
    for (auto *registry = this; registry != nullptr; registry = registry->fallback_)
    {
        static_cast<void>(registry->erase(key));
    }
}

auto FieldRegistry::is_on_disk(const FieldKey &key) const -> bool
{
    return std::binary_search(field_list_.begin(), field_list_.end(), key);
}

auto FieldRegistry::default_fluid_type() const -> std::string
{
    return dataset_ != nullptr ? dataset_->default_fluid_type() : std::string{"gas"};
}

auto FieldRegistry::is_particle_type(std::string_view category) const -> bool
{
    return dataset_ != nullptr && dataset_->is_particle_type(category);
}

auto FieldRegistry::raw_particle_types() const -> std::vector<std::string>
{
    return dataset_ != nullptr ? dataset_->particle_types_raw() : std::vector<std::string>{};
}

auto FieldRegistry::unit_system() const -> const units::UnitSystem &
{
    return dataset_ != nullptr ? dataset_->unit_system() : detached_unit_system();
}

auto FieldRegistry::unit_catalog() const -> const units::UnitCatalog &
{
    return dataset_ != nullptr ? dataset_->unit_catalog() : detached_unit_catalog();
}

auto FieldRegistry::coordinates() const -> const geometry::Coordinates &
{
    return dataset_ != nullptr ? dataset_->coordinates() : detached_coordinates();
}

auto FieldRegistry::is_curvilinear() const -> bool
{
    return coordinates().is_curvilinear();
}

} // namespace fwv::fields

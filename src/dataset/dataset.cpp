/**
 * @file dataset.cpp
 * @brief dataset state, the field-info build sequence and result publishing
 */
#include "fwv/dataset/dataset.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>

#include "fwv/common/log.hpp"
#include "fwv/dataset/field_evaluator.hpp"
#include "fwv/fields/errors.hpp"
#include "fwv/plugins/builtin_plugins.hpp"

namespace fwv::dataset
{
namespace
{

[[nodiscard]] auto make_unit_system(const std::string &name) -> units::UnitSystem
{
    if (name == "cgs")
    {
        return units::UnitSystem::cgs();
    }
    if (name == "mks")
    {
        return units::UnitSystem::mks();
    }
    throw std::invalid_argument(fmt::format("unknown unit system '{}' (expected cgs or mks)", name));
}

template <typename T>
void sort_unique(std::vector<T> &values)
{
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

} // namespace

Dataset::Dataset(DatasetDescription description)
    : description_{std::move(description)},
      coordinates_{description_.geometry, description_.axis_order},
      unit_system_{make_unit_system(description_.unit_system)},
      plugins_{plugins::builtin_plugins()}
{
    for (const auto &[name, code_unit] : description_.code_units)
    {
        const auto defined = unit_catalog_.define("code_" + name, code_unit.value, code_unit.units);
        if (!defined)
        {
            throw std::invalid_argument(fmt::format("code unit '{}': {}", name, defined.error().message));
        }
    }

    particle_types_ = description_.particle_types;
    if (!particle_types_.empty() && !is_particle_type("all"))
    {
        particle_types_.emplace_back("all");
    }

    field_list_ = description_.field_list;
    if (!description_.particle_types.empty())
    {
        // fields every raw particle type stores become on-disk union fields of "all"
        std::map<std::string, std::size_t> owners;
        for (const auto &field : description_.field_list)
        {
            const auto &raw = description_.particle_types;
            if (std::find(raw.begin(), raw.end(), field.category()) != raw.end())
            {
                ++owners[field.name()];
            }
        }
        for (const auto &[name, count] : owners)
        {
            if (count == description_.particle_types.size())
            {
                field_list_.emplace_back("all", name);
            }
        }
    }
    sort_unique(field_list_);

    fluid_types_ = description_.fluid_types;
    fluid_types_.push_back(description_.default_fluid_type);
    fluid_types_.emplace_back("deposit");
    fluid_types_.emplace_back("index");
    for (const auto &field : field_list_)
    {
        if (!is_particle_type(field.category()) && !field.is_bare())
        {
            fluid_types_.push_back(field.category());
        }
    }
    sort_unique(fluid_types_);
}

Dataset::~Dataset() = default;

void Dataset::create_field_info(std::optional<fields::ValidationMode> mode)
{
    const auto validation =
        mode.value_or(field_test() ? fields::ValidationMode::Strict : fields::ValidationMode::Lenient);

    field_info_.reset();
    derived_field_list_.clear();
    field_dependencies_.clear();

    auto registry = std::make_unique<fields::FieldRegistry>(this, field_list_, description_.catalogs, &plugins_,
                                                            description_.slice);
    for (const auto &key : description_.show_field_errors)
    {
        registry->show_field_errors(key);
    }

    registry->setup_fluid_aliases(default_fluid_type());
    geometry::setup_index_fields(*registry, coordinates_);
    for (const auto &ptype : particle_types_)
    {
        registry->setup_particle_fields(ptype, default_fluid_type());
    }
    registry->setup_fluid_index_fields();
    if (!particle_types_.empty())
    {
        registry->setup_extra_union_fields("all");
    }
    static_cast<void>(registry->load_all_plugins(default_fluid_type(), validation));
    const auto report = registry->validate(std::nullopt, validation);

    log::logger()->info("{}: {} derived fields, {} unavailable", name(), derived_field_list_.size(),
                        report.unavailable.size());
    field_info_ = std::move(registry);
}

auto Dataset::field_info() -> fields::FieldRegistry &
{
    if (!field_info_)
    {
        throw std::logic_error(fmt::format("dataset '{}' has no field info yet", name()));
    }
    return *field_info_;
}

auto Dataset::field_info() const -> const fields::FieldRegistry &
{
    if (!field_info_)
    {
        throw std::logic_error(fmt::format("dataset '{}' has no field info yet", name()));
    }
    return *field_info_;
}

auto Dataset::evaluate(const fields::FieldKey &key) const -> fields::FieldArray
{
    FieldEvaluator evaluator{*this};
    return evaluator.get(key);
}

void Dataset::publish_dependencies(const std::map<fields::FieldKey, fields::DependencyRecord> &dependencies)
{
    std::set<fields::FieldKey> merged{derived_field_list_.begin(), derived_field_list_.end()};
    for (const auto &[key, record] : dependencies)
    {
        merged.insert(key);
        field_dependencies_.insert_or_assign(key, record);
    }
    derived_field_list_.assign(merged.begin(), merged.end());
}

auto Dataset::is_particle_type(std::string_view category) const -> bool
{
    return std::find(particle_types_.begin(), particle_types_.end(), category) != particle_types_.end();
}

auto Dataset::is_sph_particle_type(std::string_view category) const -> bool
{
    const auto &sph = description_.sph_particle_types;
    return std::find(sph.begin(), sph.end(), category) != sph.end();
}

auto Dataset::is_on_disk(const fields::FieldKey &key) const -> bool
{
    return std::binary_search(field_list_.begin(), field_list_.end(), key);
}

auto Dataset::parameter(std::string_view name) const -> double
{
    const auto it = description_.parameters.find(std::string{name});
    if (it == description_.parameters.end())
    {
        throw std::out_of_range(fmt::format("dataset '{}' has no parameter '{}'", this->name(), name));
    }
    return it->second;
}

auto Dataset::raw_field(const fields::FieldKey &key) const -> RawField
{
    if (const auto it = description_.data.find(key); it != description_.data.end())
    {
        return it->second;
    }
    if (key.category() != "all" || description_.particle_types.empty())
    {
        throw fields::FieldNotFound(key);
    }

    RawField joined{};
    for (const auto &member : description_.particle_types)
    {
        const auto part = raw_field(fields::FieldKey{member, key.name()});
        joined.components = part.components;
        joined.values.insert(joined.values.end(), part.values.begin(), part.values.end());
    }
    return joined;
}

} // namespace fwv::dataset

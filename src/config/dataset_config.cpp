/**
 * @file dataset_config.cpp
 * @brief yaml-cpp backed dataset loader with breadcrumb errors
 */
#include "fwv/config/dataset_config.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <stdexcept>
#include <utility>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "fwv/fields/errors.hpp"

namespace fwv::config
{
namespace
{

using Status = std::expected<void, ConfigError>;

[[nodiscard]] auto make_error(std::string message, std::vector<std::string> ctx) -> std::unexpected<ConfigError>
{
    return std::unexpected(ConfigError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto index_label(std::size_t i) -> std::string
{
    return fmt::format("[{}]", i);
}

[[nodiscard]] auto with(std::vector<std::string> ctx, std::string leaf) -> std::vector<std::string>
{
    ctx.push_back(std::move(leaf));
    return ctx;
}

[[nodiscard]] auto node_to_string_vec(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<std::vector<std::string>, ConfigError>
{
    if (!node || !node.IsSequence())
    {
        return make_error("expected sequence for string list", std::move(ctx));
    }
    std::vector<std::string> items;
    items.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i)
    {
        if (!node[i].IsScalar())
        {
            return make_error("expected scalar string", with(ctx, index_label(i)));
        }
        items.emplace_back(node[i].as<std::string>());
    }
    return items;
}

[[nodiscard]] auto node_to_doubles(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<std::vector<double>, ConfigError>
{
    if (!node || !node.IsSequence())
    {
        return make_error("expected sequence of numbers", std::move(ctx));
    }
    std::vector<double> values;
    values.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i)
    {
        try
        {
            values.push_back(node[i].as<double>());
        }
        catch (const YAML::Exception &ex)
        {
            return make_error(ex.what(), with(ctx, index_label(i)));
        }
    }
    return values;
}

[[nodiscard]] auto node_to_vec3(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<std::array<double, 3>, ConfigError>
{
    auto values = node_to_doubles(node, ctx);
    if (!values)
    {
        return std::unexpected(std::move(values.error()));
    }
    if (values->size() != 3U)
    {
        return make_error("expected sequence[3] for vector", std::move(ctx));
    }
    return std::array<double, 3>{(*values)[0], (*values)[1], (*values)[2]};
}

/// [category, name] pair; a bare scalar is a malformed identity
[[nodiscard]] auto node_to_field_key(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<fields::FieldKey, ConfigError>
{
    if (!node || !node.IsSequence() || node.size() != 2U || !node[0].IsScalar() || !node[1].IsScalar())
    {
        return make_error("field identity must be a [category, name] pair", std::move(ctx));
    }
    const auto category = node[0].as<std::string>();
    if (category.empty() || category == fields::kBareCategory)
    {
        return make_error("field category must be a real category name", std::move(ctx));
    }
    try
    {
        return fields::FieldKey{category, node[1].as<std::string>()};
    }
    catch (const fields::MalformedIdentity &ex)
    {
        return make_error(ex.what(), std::move(ctx));
    }
}

/// units given either as a string or as a bare numeric multiplier
[[nodiscard]] auto node_to_unit_override(const YAML::Node &node, std::vector<std::string> ctx)
    -> std::expected<dataset::UnitOverride, ConfigError>
{
    if (!node || !node.IsScalar())
    {
        return make_error("units must be a string or a number", std::move(ctx));
    }
    if (node.Tag() != "!")
    {
        std::optional<double> multiplier;
        try
        {
            multiplier = node.as<double>();
        }
        catch (const YAML::BadConversion &)
        {
            // not numeric: fall through to the string form
        }
        if (multiplier)
        {
            if (!std::isfinite(*multiplier) || *multiplier == 0.0)
            {
                return make_error("numeric units must be a finite, non-zero multiplier", std::move(ctx));
            }
            return dataset::UnitOverride{*multiplier};
        }
    }
    return dataset::UnitOverride{node.as<std::string>()};
}

[[nodiscard]] auto parse_known_fields(const YAML::Node &node, const std::string &section)
    -> std::expected<std::vector<fields::KnownField>, ConfigError>
{
    std::vector<fields::KnownField> known;
    if (!node)
    {
        return known;
    }
    if (!node.IsSequence())
    {
        return make_error(fmt::format("{} must be a sequence", section), {section});
    }
    known.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i)
    {
        const auto                     entry = node[i];
        const std::vector<std::string> ctx{section, index_label(i)};
        if (!entry.IsMap() || !entry["name"] || !entry["name"].IsScalar())
        {
            return make_error("known field entry must be a map with a 'name'", ctx);
        }
        fields::KnownField field{};
        field.name = entry["name"].as<std::string>();
        if (field.name.empty())
        {
            return make_error("known field name must not be empty", with(ctx, "name"));
        }
        if (const auto units = entry["units"]; units)
        {
            if (!units.IsScalar())
            {
                return make_error("units must be a scalar string", with(ctx, "units"));
            }
            field.units = units.as<std::string>();
        }
        if (const auto aliases = entry["aliases"]; aliases)
        {
            auto parsed = node_to_string_vec(aliases, with(ctx, "aliases"));
            if (!parsed)
            {
                return std::unexpected(std::move(parsed.error()));
            }
            field.aliases = std::move(*parsed);
        }
        if (const auto display = entry["display_name"]; display)
        {
            if (!display.IsScalar())
            {
                return make_error("display_name must be a scalar string", with(ctx, "display_name"));
            }
            field.display_name = display.as<std::string>();
        }
        known.push_back(std::move(field));
    }
    return known;
}

[[nodiscard]] auto parse_geometry(const YAML::Node &root, dataset::DatasetDescription &out) -> Status
{
    const auto node = root["geometry"];
    if (!node)
    {
        return {};
    }
    if (node.IsScalar())
    {
        const auto kind = geometry::parse_geometry_kind(node.as<std::string>());
        if (!kind)
        {
            return make_error(fmt::format("unknown geometry '{}'", node.as<std::string>()), {"geometry"});
        }
        out.geometry = *kind;
        return {};
    }
    if (!node.IsMap() || !node["type"] || !node["type"].IsScalar())
    {
        return make_error("geometry must be a name or a map with 'type'", {"geometry"});
    }
    const auto kind = geometry::parse_geometry_kind(node["type"].as<std::string>());
    if (!kind)
    {
        return make_error(fmt::format("unknown geometry '{}'", node["type"].as<std::string>()), {"geometry", "type"});
    }
    out.geometry = *kind;
    if (const auto order = node["axis_order"]; order)
    {
        auto names = node_to_string_vec(order, {"geometry", "axis_order"});
        if (!names)
        {
            return std::unexpected(std::move(names.error()));
        }
        if (names->size() != 3U)
        {
            return make_error("axis_order needs exactly three names", {"geometry", "axis_order"});
        }
        out.axis_order = std::array<std::string, 3>{(*names)[0], (*names)[1], (*names)[2]};
    }
    return {};
}

[[nodiscard]] auto parse_units(const YAML::Node &root, dataset::DatasetDescription &out) -> Status
{
    if (const auto system = root["unit_system"]; system)
    {
        if (!system.IsScalar())
        {
            return make_error("unit_system must be a scalar", {"unit_system"});
        }
        out.unit_system = system.as<std::string>();
        if (out.unit_system != "cgs" && out.unit_system != "mks")
        {
            return make_error(fmt::format("unknown unit system '{}' (expected cgs or mks)", out.unit_system),
                              {"unit_system"});
        }
    }

    if (const auto code_units = root["code_units"]; code_units)
    {
        if (!code_units.IsMap())
        {
            return make_error("code_units must be a map", {"code_units"});
        }
        for (const auto &entry : code_units)
        {
            const auto name = entry.first.as<std::string>();
            const auto node = entry.second;
            if (!node.IsSequence() || node.size() != 2U)
            {
                return make_error("code unit must be [value, units]", {"code_units", name});
            }
            try
            {
                out.code_units.insert_or_assign(name,
                                                dataset::CodeUnit{node[0].as<double>(), node[1].as<std::string>()});
            }
            catch (const YAML::Exception &ex)
            {
                return make_error(ex.what(), {"code_units", name});
            }
        }
    }

    if (const auto overrides = root["field_units"]; overrides)
    {
        if (!overrides.IsSequence())
        {
            return make_error("field_units must be a sequence", {"field_units"});
        }
        for (std::size_t i = 0; i < overrides.size(); ++i)
        {
            const auto                     entry = overrides[i];
            const std::vector<std::string> ctx{"field_units", index_label(i)};
            if (!entry.IsMap())
            {
                return make_error("field_units entry must be a map", ctx);
            }
            auto units = node_to_unit_override(entry["units"], with(ctx, "units"));
            if (!units)
            {
                return std::unexpected(std::move(units.error()));
            }
            if (entry["name"] && entry["field"])
            {
                return make_error("give either 'name' or 'field', not both", ctx);
            }
            if (const auto name = entry["name"]; name && name.IsScalar())
            {
                out.field_units_by_name.insert_or_assign(name.as<std::string>(), std::move(*units));
            }
            else if (entry["field"])
            {
                auto key = node_to_field_key(entry["field"], with(ctx, "field"));
                if (!key)
                {
                    return std::unexpected(std::move(key.error()));
                }
                out.field_units_by_key.insert_or_assign(std::move(*key), std::move(*units));
            }
            else
            {
                return make_error("field_units entry needs 'name' or 'field'", ctx);
            }
        }
    }
    return {};
}

[[nodiscard]] auto parse_types(const YAML::Node &root, dataset::DatasetDescription &out) -> Status
{
    if (const auto ftype = root["default_fluid_type"]; ftype)
    {
        if (!ftype.IsScalar() || ftype.as<std::string>().empty())
        {
            return make_error("default_fluid_type must be a non-empty string", {"default_fluid_type"});
        }
        out.default_fluid_type = ftype.as<std::string>();
    }
    for (auto [key, target] : {std::pair{"fluid_types", &out.fluid_types},
                               std::pair{"particle_types", &out.particle_types},
                               std::pair{"sph_particle_types", &out.sph_particle_types}})
    {
        if (const auto node = root[key]; node)
        {
            auto names = node_to_string_vec(node, {key});
            if (!names)
            {
                return std::unexpected(std::move(names.error()));
            }
            *target = std::move(*names);
        }
    }
    for (std::size_t i = 0; i < out.sph_particle_types.size(); ++i)
    {
        const auto &sph = out.sph_particle_types[i];
        if (std::find(out.particle_types.begin(), out.particle_types.end(), sph) == out.particle_types.end())
        {
            return make_error(fmt::format("sph particle type '{}' is not a particle type", sph),
                              {"sph_particle_types", index_label(i)});
        }
    }
    return {};
}

[[nodiscard]] auto parse_fields(const YAML::Node &root, dataset::DatasetDescription &out) -> Status
{
    if (const auto list = root["field_list"]; list)
    {
        if (!list.IsSequence())
        {
            return make_error("field_list must be a sequence", {"field_list"});
        }
        out.field_list.reserve(list.size());
        for (std::size_t i = 0; i < list.size(); ++i)
        {
            auto key = node_to_field_key(list[i], {"field_list", index_label(i)});
            if (!key)
            {
                return std::unexpected(std::move(key.error()));
            }
            out.field_list.push_back(std::move(*key));
        }
    }

    const std::array<std::pair<const char *, std::vector<fields::KnownField> *>, 3> catalogs{
        std::pair{"known_fluid_fields", &out.catalogs.fluid},
        std::pair{"known_particle_fields", &out.catalogs.particle},
        std::pair{"extra_union_fields", &out.catalogs.extra_union}};
    for (const auto &[section, target] : catalogs)
    {
        auto parsed = parse_known_fields(root[section], section);
        if (!parsed)
        {
            return std::unexpected(std::move(parsed.error()));
        }
        *target = std::move(*parsed);
    }

    if (const auto data = root["data"]; data)
    {
        if (!data.IsSequence())
        {
            return make_error("data must be a sequence", {"data"});
        }
        std::map<std::string, std::size_t> particle_counts;
        for (std::size_t i = 0; i < data.size(); ++i)
        {
            const auto                     entry = data[i];
            const std::vector<std::string> ctx{"data", index_label(i)};
            if (!entry.IsMap())
            {
                return make_error("data entry must be a map", ctx);
            }
            auto key = node_to_field_key(entry["field"], with(ctx, "field"));
            if (!key)
            {
                return std::unexpected(std::move(key.error()));
            }
            auto values = node_to_doubles(entry["values"], with(ctx, "values"));
            if (!values)
            {
                return std::unexpected(std::move(values.error()));
            }
            dataset::RawField raw{std::move(*values), 1U};
            if (const auto components = entry["components"]; components)
            {
                try
                {
                    raw.components = components.as<std::size_t>();
                }
                catch (const YAML::Exception &ex)
                {
                    return make_error(ex.what(), with(ctx, "components"));
                }
                if (raw.components == 0U || raw.values.size() % raw.components != 0U)
                {
                    return make_error("values must hold a whole number of components", with(ctx, "components"));
                }
            }

            // cell arrays cover the domain; every array of one particle type has one entry per particle
            const auto  elements = raw.values.size() / raw.components;
            const auto &category = key->category();
            const bool  particle = category == "all" || std::find(out.particle_types.begin(), out.particle_types.end(),
                                                                  category) != out.particle_types.end();
            if (!particle && elements != out.domain.cell_count())
            {
                return make_error(fmt::format("{} holds {} elements but the domain has {} cells", *key, elements,
                                              out.domain.cell_count()),
                                  with(ctx, "values"));
            }
            if (particle)
            {
                const auto [seen, inserted] = particle_counts.try_emplace(std::string{category}, elements);
                if (!inserted && seen->second != elements)
                {
                    return make_error(fmt::format("{} holds {} elements but earlier '{}' arrays hold {}", *key,
                                                  elements, category, seen->second),
                                      with(ctx, "values"));
                }
            }
            out.data.insert_or_assign(std::move(*key), std::move(raw));
        }

        for (std::size_t i = 0; i < out.field_list.size(); ++i)
        {
            if (!out.data.contains(out.field_list[i]))
            {
                return make_error(fmt::format("on-disk field {} has no data entry", out.field_list[i]),
                                  {"field_list", index_label(i)});
            }
        }
    }
    return {};
}

[[nodiscard]] auto parse_domain(const YAML::Node &root, dataset::DatasetDescription &out) -> Status
{
    const auto node = root["domain"];
    if (!node)
    {
        return {};
    }
    if (!node.IsMap())
    {
        return make_error("domain must be a map", {"domain"});
    }
    if (const auto dims = node["dimensions"]; dims)
    {
        if (!dims.IsSequence() || dims.size() != 3U)
        {
            return make_error("dimensions must be sequence[3]", {"domain", "dimensions"});
        }
        for (std::size_t i = 0; i < 3U; ++i)
        {
            try
            {
                out.domain.dimensions[i] = dims[i].as<std::size_t>();
            }
            catch (const YAML::Exception &ex)
            {
                return make_error(ex.what(), {"domain", "dimensions", index_label(i)});
            }
            if (out.domain.dimensions[i] == 0U)
            {
                return make_error("dimensions must be >= 1", {"domain", "dimensions", index_label(i)});
            }
        }
    }
    for (auto [key, target] : {std::pair{"left_edge", &out.domain.left_edge},
                               std::pair{"right_edge", &out.domain.right_edge}})
    {
        if (const auto edge = node[key]; edge)
        {
            auto parsed = node_to_vec3(edge, {"domain", key});
            if (!parsed)
            {
                return std::unexpected(std::move(parsed.error()));
            }
            *target = *parsed;
        }
    }
    for (std::size_t i = 0; i < 3U; ++i)
    {
        if (out.domain.right_edge[i] <= out.domain.left_edge[i])
        {
            return make_error("right_edge must exceed left_edge", {"domain", "right_edge", index_label(i)});
        }
    }
    if (const auto units = node["units"]; units)
    {
        if (!units.IsScalar())
        {
            return make_error("domain units must be a scalar string", {"domain", "units"});
        }
        out.domain.units = units.as<std::string>();
    }
    return {};
}

[[nodiscard]] auto parse_runtime(const YAML::Node &root, dataset::DatasetDescription &out) -> Status
{
    if (const auto parameters = root["parameters"]; parameters)
    {
        if (!parameters.IsMap())
        {
            return make_error("parameters must be a map", {"parameters"});
        }
        for (const auto &entry : parameters)
        {
            const auto name = entry.first.as<std::string>();
            try
            {
                out.parameters.insert_or_assign(name, entry.second.as<double>());
            }
            catch (const YAML::Exception &ex)
            {
                return make_error(ex.what(), {"parameters", name});
            }
        }
    }

    if (const auto slice = root["slice"]; slice)
    {
        if (!slice.IsMap())
        {
            return make_error("slice must be a map", {"slice"});
        }
        auto normal = node_to_vec3(slice["normal"], {"slice", "normal"});
        if (!normal)
        {
            return std::unexpected(std::move(normal.error()));
        }
        if ((*normal)[0] == 0.0 && (*normal)[1] == 0.0 && (*normal)[2] == 0.0)
        {
            return make_error("slice normal must be non-zero", {"slice", "normal"});
        }
        out.slice = fields::SliceInfo{*normal};
    }

    if (const auto validation = root["validation"]; validation)
    {
        if (!validation.IsMap())
        {
            return make_error("validation must be a map", {"validation"});
        }
        if (const auto field_test = validation["field_test"]; field_test)
        {
            try
            {
                out.field_test = field_test.as<bool>();
            }
            catch (const YAML::Exception &ex)
            {
                return make_error(ex.what(), {"validation", "field_test"});
            }
        }
        if (const auto show = validation["show_field_errors"]; show)
        {
            if (!show.IsSequence())
            {
                return make_error("show_field_errors must be a sequence", {"validation", "show_field_errors"});
            }
            for (std::size_t i = 0; i < show.size(); ++i)
            {
                auto key = node_to_field_key(show[i], {"validation", "show_field_errors", index_label(i)});
                if (!key)
                {
                    return std::unexpected(std::move(key.error()));
                }
                out.show_field_errors.push_back(std::move(*key));
            }
        }
    }
    return {};
}

} // namespace

auto load_dataset_from_file(const std::filesystem::path &path) -> DatasetResult
{
    try
    {
        const auto node = YAML::LoadFile(path.string());
        return parse_dataset_node(node);
    }
    catch (const YAML::BadFile &ex)
    {
        return make_error(fmt::format("unable to open dataset file: {}", ex.what()), {path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(fmt::format("YAML parse error: {}", ex.what()), {path.string()});
    }
}

auto load_dataset_from_string(std::string_view yaml_text) -> DatasetResult
{
    try
    {
        const auto node = YAML::Load(std::string{yaml_text});
        return parse_dataset_node(node);
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(fmt::format("YAML parse error: {}", ex.what()), {});
    }
}

auto parse_dataset_node(const YAML::Node &root) -> DatasetResult
{
    if (!root || !root.IsMap())
    {
        return make_error("dataset root must be a mapping", {});
    }

    dataset::DatasetDescription description{};
    const auto name = root["name"];
    if (!name || !name.IsScalar() || name.as<std::string>().empty())
    {
        return make_error("missing dataset 'name'", {"name"});
    }
    description.name = name.as<std::string>();

    for (const auto section : {parse_geometry, parse_units, parse_types, parse_domain, parse_fields, parse_runtime})
    {
        if (auto status = section(root, description); !status)
        {
            return std::unexpected(std::move(status.error()));
        }
    }

    return description;
}

} // namespace fwv::config

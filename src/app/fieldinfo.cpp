/**
 * @file fieldinfo.cpp
 * @brief fwv_fieldinfo: load a dataset description and report its derived fields uwu
 *
 * usage:
 * @code
 * fwv_fieldinfo <dataset.yaml> [--strict] [--deps] [--debug] [category/name ...]
 * @endcode
 *
 * without field arguments the tool lists every derived field the dataset can
 * compute. with field arguments it evaluates each one and prints a short
 * summary (element count, units, min/max). `--deps` adds the dependency record
 * of each derived field, `--strict` turns validation errors into hard failures.
 */

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "fwv/common/log.hpp"
#include "fwv/config/dataset_config.hpp"
#include "fwv/dataset/dataset.hpp"
#include "fwv/fields/errors.hpp"
#include "fwv/fields/field_key.hpp"

namespace
{

struct Options
{
    std::filesystem::path              dataset_path{};
    bool                               strict{false};
    bool                               show_dependencies{false};
    bool                               debug{false};
    std::vector<fwv::fields::FieldKey> requested{};
};

void print_usage()
{
    fmt::print(stderr, "usage: fwv_fieldinfo <dataset.yaml> [--strict] [--deps] [--debug] [category/name ...]\n");
}

/**
 * @brief parse argv into Options
 *
 * @throws fwv::fields::MalformedIdentity for an unparsable field argument
 */
[[nodiscard]] auto parse_options(int argc, char **argv) -> std::optional<Options>
{
    Options options{};
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};
        if (arg == "--strict")
        {
            options.strict = true;
        }
        else if (arg == "--deps")
        {
            options.show_dependencies = true;
        }
        else if (arg == "--debug")
        {
            options.debug = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            return std::nullopt;
        }
        else if (arg.starts_with("--"))
        {
            fmt::print(stderr, "unknown option '{}'\n", arg);
            return std::nullopt;
        }
        else if (options.dataset_path.empty())
        {
            options.dataset_path = std::filesystem::path{arg};
        }
        else
        {
            options.requested.push_back(fwv::fields::parse_field_key(arg));
        }
    }
    if (options.dataset_path.empty())
    {
        return std::nullopt;
    }
    return options;
}

void print_dependencies(const fwv::dataset::Dataset &dataset, const fwv::fields::FieldKey &key)
{
    const auto &deps = dataset.field_dependencies();
    const auto  it   = deps.find(key);
    if (it == deps.end())
    {
        return;
    }
    if (!it->second.requested.empty())
    {
        fmt::print("    needs  {}\n", fmt::join(it->second.requested, ", "));
    }
    if (!it->second.parameters.empty())
    {
        fmt::print("    params {}\n", fmt::join(it->second.parameters, ", "));
    }
}

void list_fields(const fwv::dataset::Dataset &dataset, bool show_dependencies)
{
    const auto &registry = dataset.field_info();
    fmt::print("{}: {} on-disk, {} derived\n", dataset.name(), dataset.field_list().size(),
               dataset.derived_field_list().size());
    for (const auto &key : dataset.derived_field_list())
    {
        const auto definition = registry.find(key);
        const auto units      = definition ? definition->units() : std::string{};
        fmt::print("  {:<48} [{}]\n", key, units.empty() ? "dimensionless" : units);
        if (show_dependencies)
        {
            print_dependencies(dataset, key);
        }
    }
}

/// @return false when any requested field could not be evaluated
[[nodiscard]] auto evaluate_fields(const fwv::dataset::Dataset &dataset, const Options &options) -> bool
{
    bool ok = true;
    for (const auto &key : options.requested)
    {
        try
        {
            const auto array = dataset.evaluate(key);
            if (array.values.empty())
            {
                fmt::print("{}: empty [{}]\n", key, array.units);
                continue;
            }
            const auto [lo, hi] = std::minmax_element(array.values.begin(), array.values.end());
            fmt::print("{}: {} elements x {} [{}] min={:.6g} max={:.6g}\n", key, array.size(), array.components,
                       array.units.empty() ? "dimensionless" : array.units, *lo, *hi);
            if (options.show_dependencies)
            {
                print_dependencies(dataset, key);
            }
        }
        catch (const fwv::fields::FieldNotFound &ex)
        {
            fmt::print(stderr, "{}\n", ex.what());
            ok = false;
        }
    }
    return ok;
}

} // namespace

auto main(int argc, char **argv) -> int
{
    try
    {
        const auto options = parse_options(argc, argv);
        if (!options)
        {
            print_usage();
            return EXIT_FAILURE;
        }
        if (options->debug)
        {
            fwv::log::set_level(spdlog::level::debug);
        }

        auto description = fwv::config::load_dataset_from_file(options->dataset_path);
        if (!description)
        {
            fmt::print(stderr, "config error: {} (at {})\n", description.error().message,
                       fmt::join(description.error().context, "/"));
            return EXIT_FAILURE;
        }

        fwv::dataset::Dataset dataset{std::move(*description)};
        dataset.create_field_info(options->strict ? std::optional{fwv::fields::ValidationMode::Strict}
                                                  : std::nullopt);

        if (options->requested.empty())
        {
            list_fields(dataset, options->show_dependencies);
            return EXIT_SUCCESS;
        }
        return evaluate_fields(dataset, *options) ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    catch (const std::exception &ex)
    {
        fmt::print(stderr, "fwv_fieldinfo: {}\n", ex.what());
        return EXIT_FAILURE;
    }
}

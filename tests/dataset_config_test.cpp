/**
 * @file dataset_config_test.cpp
 * @brief dataset YAML loader validation because parsing bugs are cringe uwu
 */
#include <cctype>
#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "fwv/config/dataset_config.hpp"
#include "support/dataset_builder.hpp"

using fwv::fields::FieldKey;
using testing::ElementsAre;
using testing::ElementsAreArray;
using testing::HasSubstr;

namespace
{

[[nodiscard]] auto test_data_path(std::string_view file) -> std::filesystem::path
{
    return std::filesystem::path{FWV_TEST_DATA_DIR} / file;
}

} // namespace

TEST(DatasetConfig, ParsesTheDefaultBuilderDocument)
{
    const auto result = fwv::test_support::load_dataset();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->name, "gas_box");
    EXPECT_EQ(result->geometry, fwv::geometry::GeometryKind::Cartesian);
    EXPECT_EQ(result->unit_system, "cgs");
    EXPECT_EQ(result->field_list.size(), 4U);
    EXPECT_EQ(result->field_list.front(), (FieldKey{"gas", "density"}));
    ASSERT_EQ(result->catalogs.fluid.size(), 4U);
    EXPECT_EQ(result->catalogs.fluid.front().units, "g/cm**3");
    EXPECT_THAT(result->catalogs.fluid.front().aliases, ElementsAre("density"));
    EXPECT_EQ(result->catalogs.fluid.front().display_name, std::optional<std::string>{"Density"});
    EXPECT_DOUBLE_EQ(result->parameters.at("gamma"), 5.0 / 3.0);
    EXPECT_THAT(result->domain.dimensions, ElementsAre(2U, 1U, 1U));
    EXPECT_THAT(result->data.at({"gas", "velocity_y"}).values, ElementsAre(4.0, 0.0));
    EXPECT_FALSE(result->field_test);
    EXPECT_FALSE(result->slice.has_value());
}

TEST(DatasetConfig, LoadsFixturesFromDisk)
{
    const auto gas = fwv::config::load_dataset_from_file(test_data_path("gas_box.yaml"));
    ASSERT_TRUE(gas.has_value()) << gas.error().message;
    EXPECT_EQ(gas->domain.units, "cm");
    EXPECT_DOUBLE_EQ(gas->parameters.at("gamma"), 1.4);

    const auto sph = fwv::config::load_dataset_from_file(test_data_path("sph_particles.yaml"));
    ASSERT_TRUE(sph.has_value()) << sph.error().message;
    EXPECT_THAT(sph->particle_types, ElementsAre("PartType0"));
    EXPECT_THAT(sph->sph_particle_types, ElementsAre("PartType0"));
    EXPECT_DOUBLE_EQ(sph->code_units.at("length").value, 1.0);
    EXPECT_EQ(sph->code_units.at("length").units, "cm");
}

TEST(DatasetConfig, MissingFileReportsThePath)
{
    const auto result = fwv::config::load_dataset_from_file(test_data_path("does_not_exist.yaml"));
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("unable to open dataset file"));
}

TEST(DatasetConfig, BareFieldListEntriesAreRejected)
{
    const auto result = fwv::config::load_dataset_from_file(test_data_path("broken_field_list.yaml"));
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("[category, name]"));
    EXPECT_THAT(result.error().context, ElementsAre("field_list", "[1]"));
}

TEST(DatasetConfig, UnitOverridesAcceptStringsAndNumbers)
{
    fwv::test_support::DatasetBuilderOptions options{};
    options.field_units = {{"density", std::nullopt, "\"kg/m**3\""},
                           {std::nullopt, std::array<std::string, 2>{"gas", "velocity_x"}, "2.5"},
                           {"velocity_y", std::nullopt, "km/s"}};
    const auto result = fwv::test_support::load_dataset(options);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    EXPECT_EQ(std::get<std::string>(result->field_units_by_name.at("density")), "kg/m**3");
    EXPECT_EQ(std::get<std::string>(result->field_units_by_name.at("velocity_y")), "km/s");
    EXPECT_DOUBLE_EQ(std::get<double>(result->field_units_by_key.at({"gas", "velocity_x"})), 2.5);
}

TEST(DatasetConfig, QuotedNumbersStayStrings)
{
    fwv::test_support::DatasetBuilderOptions options{};
    options.field_units = {{"density", std::nullopt, "\"2\""}};
    const auto result   = fwv::test_support::load_dataset(options);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(std::get<std::string>(result->field_units_by_name.at("density")), "2");
}

TEST(DatasetConfig, ParsesGeometryMapsAndSlices)
{
    auto yaml = fwv::test_support::make_dataset_yaml();
    yaml += "slice:\n  normal: [0, 0, 2]\n";
    yaml.replace(yaml.find("geometry: cartesian"), std::string_view{"geometry: cartesian"}.size(),
                 "geometry:\n  type: cylindrical\n  axis_order: [r, theta, z]");
    const auto result = fwv::config::load_dataset_from_string(yaml);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->geometry, fwv::geometry::GeometryKind::Cylindrical);
    ASSERT_TRUE(result->axis_order.has_value());
    EXPECT_THAT(*result->axis_order, ElementsAre("r", "theta", "z"));
    ASSERT_TRUE(result->slice.has_value());
    EXPECT_THAT(result->slice->normal, ElementsAre(0.0, 0.0, 2.0));
}

TEST(DatasetConfig, ParsesValidationKnobs)
{
    auto yaml = fwv::test_support::make_dataset_yaml({.field_test = true});
    yaml += "  show_field_errors:\n    - [gas, pressure]\n";
    const auto result = fwv::config::load_dataset_from_string(yaml);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->field_test);
    EXPECT_THAT(result->show_field_errors, ElementsAre(FieldKey{"gas", "pressure"}));
}

TEST(DatasetConfig, DescriptionsWithoutDataStillLoad)
{
    fwv::test_support::DatasetBuilderOptions options{};
    options.data.clear();
    const auto result = fwv::test_support::load_dataset(options);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->field_list.size(), 4U);
    EXPECT_TRUE(result->data.empty());
}

TEST(DatasetConfig, ParsesVectorData)
{
    const auto result = fwv::test_support::load_dataset(fwv::test_support::particle_options());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto &position = result->data.at({"io", "particle_position"});
    EXPECT_EQ(position.components, 3U);
    EXPECT_EQ(position.values.size(), 6U);
    EXPECT_EQ(result->catalogs.particle.size(), 3U);
}

struct InvalidDatasetCase
{
    std::string                                name;
    fwv::test_support::DatasetBuilderOptions   options;
    std::string                                expected_message_substring;
    std::vector<std::string>                   expected_context;
    std::function<void(std::string &)>         mutate_yaml; ///< optional for bespoke tweaks
};

void PrintTo(const InvalidDatasetCase &test_case, std::ostream *os)
{
    *os << test_case.name << " (expects \"" << test_case.expected_message_substring << "\")";
}

class DatasetInvalidTest : public ::testing::TestWithParam<InvalidDatasetCase>
{};

TEST_P(DatasetInvalidTest, ReportsDetailedValidationErrors)
{
    auto yaml = fwv::test_support::make_dataset_yaml(GetParam().options);
    if (GetParam().mutate_yaml)
    {
        GetParam().mutate_yaml(yaml);
    }
    const auto result = fwv::config::load_dataset_from_string(yaml);
    ASSERT_FALSE(result.has_value()) << "expected failure for case: " << GetParam().name;
    EXPECT_THAT(result.error().message, HasSubstr(GetParam().expected_message_substring));
    if (!GetParam().expected_context.empty())
    {
        EXPECT_THAT(result.error().context, ElementsAreArray(GetParam().expected_context));
    }
}

namespace
{

void replace_once(std::string &text, std::string_view from, std::string_view to)
{
    const auto at = text.find(from);
    if (at != std::string::npos)
    {
        text.replace(at, from.size(), to);
    }
}

auto make_invalid_cases() -> std::vector<InvalidDatasetCase>
{
    using fwv::test_support::DatasetBuilderOptions;
    std::vector<InvalidDatasetCase> cases;

    cases.push_back({"unknown geometry", DatasetBuilderOptions{.geometry = "toroidal"}, "unknown geometry",
                     {"geometry"}, {}});
    cases.push_back({"unknown unit system", DatasetBuilderOptions{.unit_system = "imperial"}, "unknown unit system",
                     {"unit_system"}, {}});
    cases.push_back({"empty category", DatasetBuilderOptions{}, "real category name", {"field_list", "[0]"},
                     [](std::string &yaml) { replace_once(yaml, "- [gas, density]", "- [\"\", density]"); }});
    cases.push_back({"sph type that is not a particle type",
                     DatasetBuilderOptions{.particle_types = {"io"}, .sph_particle_types = {"gas"}},
                     "is not a particle type",
                     {"sph_particle_types", "[0]"},
                     {}});
    cases.push_back({"zero dimension", DatasetBuilderOptions{.dimensions = {0U, 1U, 1U}}, "dimensions must be >= 1",
                     {"domain", "dimensions", "[0]"}, {}});
    cases.push_back({"inverted domain",
                     DatasetBuilderOptions{.left_edge = {0.0, 2.0, 0.0}},
                     "right_edge must exceed left_edge",
                     {"domain", "right_edge", "[1]"},
                     {}});
    cases.push_back({"ragged vector data",
                     DatasetBuilderOptions{.data = {{{"io", "particle_position"}, {1.0, 2.0, 3.0, 4.0}, 3U}}},
                     "whole number of components",
                     {"data", "[0]", "components"},
                     {}});
    cases.push_back({"missing name", DatasetBuilderOptions{}, "missing dataset 'name'", {"name"},
                     [](std::string &yaml) { replace_once(yaml, "name: gas_box\n", ""); }});
    cases.push_back({"non-map root", DatasetBuilderOptions{}, "dataset root must be a mapping", {},
                     [](std::string &yaml) { yaml = "- just\n- a\n- list\n"; }});
    cases.push_back({"non-numeric parameter", DatasetBuilderOptions{}, "", {"parameters", "gamma"},
                     [](std::string &yaml) { replace_once(yaml, "gamma: ", "gamma: fast #"); }});
    cases.push_back({"units override without target", DatasetBuilderOptions{}, "needs 'name' or 'field'",
                     {"field_units", "[0]"},
                     [](std::string &yaml) { yaml += "field_units:\n  - units: cm\n"; }});
    cases.push_back({"zero slice normal", DatasetBuilderOptions{.slice_normal = std::array<double, 3>{0.0, 0.0, 0.0}},
                     "slice normal must be non-zero", {"slice", "normal"}, {}});
    cases.push_back({"broken code unit", DatasetBuilderOptions{}, "code unit must be [value, units]",
                     {"code_units", "length"},
                     [](std::string &yaml) { yaml += "code_units:\n  length: 3.0\n"; }});
    cases.push_back({"short cell array",
                     DatasetBuilderOptions{.data = {{{"gas", "density"}, {1.0, 2.0}},
                                                    {{"gas", "velocity_x"}, {3.0, 0.0}},
                                                    {{"gas", "velocity_y"}, {4.0}},
                                                    {{"gas", "velocity_z"}, {0.0, 5.0}}}},
                     "but the domain has 2 cells",
                     {"data", "[2]", "values"},
                     {}});
    cases.push_back({"particle arrays of different lengths", [] {
                         auto options = fwv::test_support::particle_options();
                         options.data.back().values.push_back(6.0);
                         return options;
                     }(),
                     "earlier 'io' arrays hold 2",
                     {"data", "[6]", "values"},
                     {}});
    cases.push_back({"listed field without data",
                     DatasetBuilderOptions{.data = {{{"gas", "velocity_x"}, {3.0, 0.0}},
                                                    {{"gas", "velocity_y"}, {4.0, 0.0}},
                                                    {{"gas", "velocity_z"}, {0.0, 5.0}}}},
                     "has no data entry",
                     {"field_list", "[0]"},
                     {}});
    cases.push_back({"zero numeric units", DatasetBuilderOptions{.field_units = {{"density", std::nullopt, "0"}}},
                     "finite, non-zero multiplier", {"field_units", "[0]", "units"}, {}});
    cases.push_back({"malformed yaml", DatasetBuilderOptions{}, "YAML parse error", {},
                     [](std::string &yaml) { yaml += "field_list: [unclosed\n"; }});
    return cases;
}

} // namespace

INSTANTIATE_TEST_SUITE_P(DatasetConfig, DatasetInvalidTest, ::testing::ValuesIn(make_invalid_cases()),
                         [](const ::testing::TestParamInfo<InvalidDatasetCase> &info)
                         {
                             std::string label = info.param.name;
                             for (auto &c : label)
                             {
                                 if (std::isalnum(static_cast<unsigned char>(c)) == 0)
                                 {
                                     c = '_';
                                 }
                             }
                             return label;
                         });

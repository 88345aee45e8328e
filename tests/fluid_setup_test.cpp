/**
 * @file fluid_setup_test.cpp
 * @brief on-disk cell fields: catalog aliases, unit overrides, curvilinear remapping, index aliases
 */
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "fwv/dataset/dataset.hpp"
#include "fwv/fields/errors.hpp"
#include "fwv/fields/field_registry.hpp"
#include "fwv/geometry/coordinates.hpp"
#include "support/log_capture.hpp"

using fwv::dataset::Dataset;
using fwv::dataset::DatasetDescription;
using fwv::fields::FieldKey;
using fwv::fields::FieldRegistry;
using fwv::fields::KnownField;
using testing::HasSubstr;
using testing::IsEmpty;
using testing::UnorderedElementsAre;

namespace
{

/// enzo-style frontend: capitalised on-disk names, lowercase aliases under "gas"
[[nodiscard]] auto enzo_description(fwv::geometry::GeometryKind geometry = fwv::geometry::GeometryKind::Cartesian)
    -> DatasetDescription
{
    DatasetDescription description{};
    description.name       = "enzo_box";
    description.geometry   = geometry;
    description.field_list = {{"enzo", "Density"}, {"enzo", "x-velocity"}, {"enzo", "y-velocity"},
                              {"enzo", "z-velocity"}, {"enzo", "Metallicity"}};
    description.catalogs.fluid = {
        KnownField{"Density", "g/cm**3", {"density"}, "Density"},
        KnownField{"x-velocity", "cm/s", {"velocity_x"}, std::nullopt},
        KnownField{"y-velocity", "cm/s", {"velocity_y"}, std::nullopt},
        KnownField{"z-velocity", "cm/s", {"velocity_z"}, std::nullopt},
    };
    return description;
}

struct Fixture
{
    explicit Fixture(DatasetDescription description)
        : dataset{std::move(description)},
          registry{&dataset, dataset.field_list(), dataset.description().catalogs}
    {
    }

    Dataset       dataset;
    FieldRegistry registry;
};

} // namespace

TEST(FluidSetup, OnDiskFieldsBecomePassthroughsWithCatalogMetadata)
{
    Fixture fixture{enzo_description()};
    fixture.registry.setup_fluid_aliases("gas");

    const auto &density = fixture.registry.lookup({"enzo", "Density"});
    EXPECT_TRUE(density.is_passthrough());
    EXPECT_EQ(density.units(), "g/cm**3");
    EXPECT_EQ(density.display_name(), std::optional<std::string>{"Density"});

    const auto &metallicity = fixture.registry.lookup({"enzo", "Metallicity"});
    EXPECT_TRUE(metallicity.is_passthrough());
    EXPECT_EQ(metallicity.units(), "");
}

TEST(FluidSetup, CatalogAliasesLandUnderTheFluidType)
{
    Fixture fixture{enzo_description()};
    fixture.registry.setup_fluid_aliases("gas");

    const auto &density = fixture.registry.lookup({"gas", "density"});
    EXPECT_FALSE(density.is_passthrough());
    EXPECT_EQ(density.units(), "g/cm**3");
    EXPECT_EQ(fixture.registry.field_aliases().at({"gas", "density"}), (FieldKey{"enzo", "Density"}));
    EXPECT_EQ(fixture.registry.lookup({"gas", "velocity_x"}).units(), "cm/s");
}

TEST(FluidSetup, AliasesUseThePreferredUnitsOfTheUnitSystem)
{
    auto description        = enzo_description();
    description.unit_system = "mks";
    Fixture fixture{std::move(description)};
    fixture.registry.setup_fluid_aliases("gas");

    EXPECT_EQ(fixture.registry.lookup({"enzo", "Density"}).units(), "g/cm**3");
    EXPECT_EQ(fixture.registry.lookup({"gas", "density"}).units(), "kg/m**3");
    EXPECT_EQ(fixture.registry.lookup({"gas", "velocity_x"}).units(), "m/s");
}

TEST(FluidSetup, ParticleCategoriesAreLeftToParticleSetup)
{
    auto description           = enzo_description();
    description.particle_types = {"io"};
    description.field_list.emplace_back("io", "particle_mass");
    Fixture fixture{std::move(description)};
    fixture.registry.setup_fluid_aliases("gas");

    EXPECT_FALSE(fixture.registry.contains({"io", "particle_mass"}));
}

TEST(FluidSetup, BareOnDiskNamesAreRejected)
{
    auto description = enzo_description();
    description.field_list.push_back(FieldKey::bare("Temperature"));
    Fixture fixture{std::move(description)};
    EXPECT_THROW(fixture.registry.setup_fluid_aliases("gas"), fwv::fields::MalformedIdentity);
}

TEST(FluidSetupUnits, StringOverridesReplaceCatalogUnits)
{
    auto description = enzo_description();
    description.field_units_by_name.emplace("Density", "kg/m**3");
    Fixture fixture{std::move(description)};
    fixture.registry.setup_fluid_aliases("gas");
    EXPECT_EQ(fixture.registry.lookup({"enzo", "Density"}).units(), "kg/m**3");
}

TEST(FluidSetupUnits, NumericOverridesScaleCatalogUnits)
{
    auto description = enzo_description();
    description.field_units_by_key.emplace(FieldKey{"enzo", "x-velocity"}, 2.0);
    Fixture fixture{std::move(description)};
    fixture.registry.setup_fluid_aliases("gas");
    EXPECT_EQ(fixture.registry.lookup({"enzo", "x-velocity"}).units(), "((cm/s)*2)");
    EXPECT_EQ(fixture.registry.lookup({"gas", "velocity_x"}).units(), "cm/s");
}

TEST(FluidSetupUnits, PerNameOverridesWinOverPerKeyOverrides)
{
    auto description = enzo_description();
    description.field_units_by_name.emplace("Density", "Msun/kpc**3");
    description.field_units_by_key.emplace(FieldKey{"enzo", "Density"}, "kg/m**3");
    Fixture fixture{std::move(description)};
    fixture.registry.setup_fluid_aliases("gas");
    EXPECT_EQ(fixture.registry.lookup({"enzo", "Density"}).units(), "Msun/kpc**3");
}

TEST(FluidSetupUnits, NumericOverrideWithoutCatalogUnitsFallsBackToDimensionless)
{
    auto description = enzo_description();
    description.field_units_by_name.emplace("Metallicity", 3.0);
    Fixture fixture{std::move(description)};

    const fwv::test_support::LogCapture capture{spdlog::level::warn};
    fixture.registry.setup_fluid_aliases("gas");
    EXPECT_EQ(fixture.registry.lookup({"enzo", "Metallicity"}).units(), "");
    EXPECT_THAT(capture.text(), HasSubstr("Cannot interpret units: 3 * , setting to dimensionless."));
}

TEST(FluidSetupUnits, UnitMultiplierOfOneIsSilent)
{
    auto description = enzo_description();
    description.field_units_by_name.emplace("Metallicity", 1.0);
    Fixture fixture{std::move(description)};

    const fwv::test_support::LogCapture capture{spdlog::level::warn};
    fixture.registry.setup_fluid_aliases("gas");
    EXPECT_EQ(fixture.registry.lookup({"enzo", "Metallicity"}).units(), "");
    EXPECT_THAT(capture.text(), IsEmpty());
}

TEST(FluidSetupCurvilinear, CompleteVectorTriplesAreRemappedOntoAxisNames)
{
    Fixture fixture{enzo_description(fwv::geometry::GeometryKind::Cylindrical)};
    EXPECT_THAT(fixture.registry.aliases_gallery(),
                UnorderedElementsAre("density", "velocity_x", "velocity_y", "velocity_z"));

    fixture.registry.setup_fluid_aliases("gas");
    // cylindrical axis order is (r, z, theta)
    EXPECT_EQ(fixture.registry.field_aliases().at({"gas", "velocity_r"}), (FieldKey{"enzo", "x-velocity"}));
    EXPECT_EQ(fixture.registry.field_aliases().at({"gas", "velocity_z"}), (FieldKey{"enzo", "y-velocity"}));
    EXPECT_EQ(fixture.registry.field_aliases().at({"gas", "velocity_theta"}), (FieldKey{"enzo", "z-velocity"}));
    EXPECT_FALSE(fixture.registry.contains({"gas", "velocity_x"}));
    EXPECT_TRUE(fixture.registry.contains({"gas", "density"}));
}

TEST(FluidSetupCurvilinear, IncompleteTriplesKeepTheirCartesianNames)
{
    auto description = enzo_description(fwv::geometry::GeometryKind::Spherical);
    std::erase(description.field_list, FieldKey{"enzo", "z-velocity"});
    Fixture fixture{std::move(description)};
    fixture.registry.setup_fluid_aliases("gas");

    EXPECT_TRUE(fixture.registry.contains({"gas", "velocity_x"}));
    EXPECT_TRUE(fixture.registry.contains({"gas", "velocity_y"}));
    EXPECT_FALSE(fixture.registry.contains({"gas", "velocity_r"}));
}

TEST(FluidSetupCurvilinear, CartesianDatasetsHaveNoGallery)
{
    Fixture fixture{enzo_description()};
    EXPECT_THAT(fixture.registry.aliases_gallery(), IsEmpty());
    fixture.registry.setup_fluid_aliases("gas");
    EXPECT_TRUE(fixture.registry.contains({"gas", "velocity_x"}));
}

TEST(FluidSetupIndex, IndexFieldsAreAliasedIntoEveryFluidType)
{
    Fixture fixture{enzo_description()};
    fwv::geometry::setup_index_fields(fixture.registry, fixture.dataset.coordinates());
    fixture.registry.setup_fluid_index_fields();

    for (const auto *ftype : {"gas", "enzo"})
    {
        EXPECT_TRUE(fixture.registry.contains({ftype, "x"})) << ftype;
        EXPECT_TRUE(fixture.registry.contains({ftype, "dz"})) << ftype;
        EXPECT_TRUE(fixture.registry.contains({ftype, "cell_volume"})) << ftype;
    }
    EXPECT_FALSE(fixture.registry.contains({"deposit", "x"}));
    EXPECT_EQ(fixture.registry.lookup({"gas", "cell_volume"}).units(), "cm**3");
}

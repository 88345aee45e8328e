/**
 * @file particle_setup_test.cpp
 * @brief per-particle-type registration: kinematics, deposits, standard fields, sph views, unions
 */
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "fwv/config/dataset_config.hpp"
#include "fwv/dataset/dataset.hpp"
#include "fwv/fields/field_registry.hpp"
#include "support/dataset_builder.hpp"

using fwv::dataset::Dataset;
using fwv::fields::FieldKey;
using fwv::fields::FieldRegistry;
using testing::Contains;
using testing::IsEmpty;
using testing::Pair;

namespace
{

[[nodiscard]] auto fixture_path(std::string_view file) -> std::filesystem::path
{
    return std::filesystem::path{FWV_TEST_DATA_DIR} / file;
}

[[nodiscard]] auto load_fixture(std::string_view file) -> fwv::dataset::DatasetDescription
{
    auto result = fwv::config::load_dataset_from_file(fixture_path(file));
    if (!result)
    {
        throw std::runtime_error("fixture failed to load: " + result.error().message);
    }
    return std::move(*result);
}

struct Fixture
{
    explicit Fixture(fwv::dataset::DatasetDescription description)
        : dataset{std::move(description)},
          registry{&dataset, dataset.field_list(), dataset.description().catalogs}
    {
    }

    Dataset       dataset;
    FieldRegistry registry;
};

} // namespace

TEST(ParticleSetup, CombinedVectorsOnDiskYieldPerAxisScalars)
{
    Fixture fixture{fwv::test_support::make_description(fwv::test_support::particle_options())};
    fixture.registry.setup_particle_fields("io", "gas");

    const auto &position = fixture.registry.lookup({"io", "particle_position"});
    EXPECT_TRUE(position.is_passthrough());
    EXPECT_TRUE(position.vector_field());

    for (const auto *name : {"particle_position_x", "particle_position_y", "particle_position_z"})
    {
        const auto &component = fixture.registry.lookup({"io", name});
        EXPECT_FALSE(component.is_passthrough()) << name;
        EXPECT_EQ(component.units(), "cm") << name;
    }
    EXPECT_EQ(fixture.registry.lookup({"io", "particle_velocity_y"}).units(), "cm/s");
}

TEST(ParticleSetup, PerAxisScalarsOnDiskYieldCombinedVectors)
{
    Fixture fixture{load_fixture("sph_particles.yaml")};
    fixture.registry.setup_particle_fields("PartType0", "gas");

    const auto &position = fixture.registry.lookup({"PartType0", "particle_position"});
    EXPECT_FALSE(position.is_passthrough());
    EXPECT_TRUE(position.vector_field());
    EXPECT_EQ(position.units(), "m");
    EXPECT_EQ(fixture.registry.lookup({"PartType0", "particle_velocity"}).units(), "m/s");
}

TEST(ParticleSetup, RegistersDepositsAndStandardFields)
{
    Fixture fixture{fwv::test_support::make_description(fwv::test_support::particle_options())};
    fixture.registry.setup_particle_fields("io", "gas");

    for (const auto *name : {"io_count", "io_mass", "io_density"})
    {
        EXPECT_TRUE(fixture.registry.contains({"deposit", name})) << name;
    }
    EXPECT_EQ(fixture.registry.lookup({"deposit", "io_density"}).units(), "g/cm**3");
    EXPECT_EQ(fixture.registry.lookup({"deposit", "io_mass"}).display_name(), std::optional<std::string>{"io Mass"});

    EXPECT_EQ(fixture.registry.lookup({"io", "particle_ones"}).units(), "");
    EXPECT_EQ(fixture.registry.lookup({"io", "particle_velocity_magnitude"}).units(), "cm/s");
    EXPECT_EQ(fixture.registry.lookup({"io", "particle_kinetic_energy"}).units(), "erg");
}

TEST(ParticleSetup, OutputUnitsFollowTheUnitSystemOnlyForNonRawTypes)
{
    auto options        = fwv::test_support::particle_options();
    options.unit_system = "mks";
    Fixture fixture{fwv::test_support::make_description(options)};
    fixture.registry.setup_particle_fields("io", "gas");
    fixture.registry.setup_particle_fields("all", "gas");

    const auto &raw_mass = fixture.registry.lookup({"io", "particle_mass"});
    EXPECT_EQ(raw_mass.units(), "g");
    EXPECT_EQ(raw_mass.output_units(), "g");

    const auto &union_mass = fixture.registry.lookup({"all", "particle_mass"});
    EXPECT_EQ(union_mass.units(), "g");
    EXPECT_EQ(union_mass.output_units(), "kg");
}

TEST(ParticleSetup, SphTypesGainFluidViews)
{
    Fixture fixture{load_fixture("sph_particles.yaml")};
    fixture.registry.setup_particle_fields("PartType0", "gas");

    const auto &aliases = fixture.registry.field_aliases();
    EXPECT_THAT(aliases, Contains(Pair(FieldKey{"gas", "density"}, FieldKey{"PartType0", "density"})));
    EXPECT_THAT(aliases, Contains(Pair(FieldKey{"gas", "temperature"}, FieldKey{"PartType0", "temperature"})));
    EXPECT_THAT(aliases, Contains(Pair(FieldKey{"gas", "x"}, FieldKey{"PartType0", "particle_position_x"})));
    EXPECT_THAT(aliases, Contains(Pair(FieldKey{"gas", "mass"}, FieldKey{"PartType0", "particle_mass"})));
    EXPECT_THAT(aliases, Contains(Pair(FieldKey{"PartType0", "velocity_z"},
                                       FieldKey{"PartType0", "particle_velocity_z"})));
    EXPECT_EQ(fixture.registry.lookup({"gas", "density"}).units(), "kg/m**3");
}

TEST(ParticleSetup, NonSphTypesGetNoSmoothedAliases)
{
    Fixture fixture{fwv::test_support::make_description(fwv::test_support::particle_options())};
    fixture.registry.setup_particle_fields("io", "gas");
    EXPECT_THAT(fixture.registry.setup_smoothed_fields("io", "gas"), IsEmpty());
    EXPECT_FALSE(fixture.registry.contains({"gas", "mass"}));
}

TEST(ParticleSetup, ExtraUnionFieldsOnlyForAll)
{
    auto options               = fwv::test_support::particle_options();
    options.extra_union_fields = {{"particle_age", "s", {}, {}}};
    Fixture fixture{fwv::test_support::make_description(options)};

    EXPECT_THROW(fixture.registry.setup_extra_union_fields("io"), std::invalid_argument);
    fixture.registry.setup_extra_union_fields("all");
    ASSERT_TRUE(fixture.registry.contains({"all", "particle_age"}));
    EXPECT_TRUE(fixture.registry.lookup({"all", "particle_age"}).is_particle());
}

TEST(ParticleSetup, AllTypeSeesUnionFieldsOnDisk)
{
    Fixture fixture{fwv::test_support::make_description(fwv::test_support::particle_options())};
    EXPECT_TRUE(fixture.dataset.is_on_disk({"all", "particle_mass"}));
    EXPECT_TRUE(fixture.dataset.is_particle_type("all"));
    EXPECT_FALSE(fixture.dataset.is_particle_type("gas"));
}

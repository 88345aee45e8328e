/**
 * @file field_registry_test.cpp
 * @brief registration rules, aliasing and the fallback chain of FieldRegistry
 */
#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "fwv/fields/errors.hpp"
#include "fwv/fields/field_registry.hpp"

using fwv::fields::FieldKey;
using fwv::fields::FieldRegistry;
using fwv::fields::SamplingKind;
using testing::Contains;
using testing::ElementsAre;
using testing::Not;

namespace
{

[[nodiscard]] auto constant_field(double value) -> fwv::fields::FieldFunction
{
    return [value](const fwv::fields::FieldDefinition &, fwv::fields::DataSource &)
    { return fwv::fields::filled(4U, value); };
}

} // namespace

TEST(FieldRegistry, SecondRegistrationIsANoOp)
{
    FieldRegistry registry{};
    registry.add_field({"gas", "foo"}, constant_field(1.0), SamplingKind::Cell, {.units = "cm"});
    const auto first = registry.find({"gas", "foo"});

    registry.add_field({"gas", "foo"}, constant_field(2.0), SamplingKind::Cell, {.units = "g"});
    EXPECT_EQ(registry.find({"gas", "foo"}), first);
    EXPECT_EQ(registry.lookup({"gas", "foo"}).units(), "cm");
    EXPECT_EQ(registry.size(), 1U);
}

TEST(FieldRegistry, ForceOverrideReplacesTheDefinition)
{
    FieldRegistry registry{};
    registry.add_field({"gas", "foo"}, constant_field(1.0), SamplingKind::Cell, {.units = "cm"});
    registry.add_field({"gas", "foo"}, constant_field(2.0), SamplingKind::Cell,
                       {.units = "g", .force_override = true});
    EXPECT_EQ(registry.lookup({"gas", "foo"}).units(), "g");

    // overriding twice with the same arguments leaves an equivalent definition behind
    registry.add_field({"gas", "foo"}, constant_field(2.0), SamplingKind::Cell,
                       {.units = "g", .force_override = true});
    EXPECT_EQ(registry.lookup({"gas", "foo"}).units(), "g");
    EXPECT_EQ(registry.size(), 1U);
}

TEST(FieldRegistry, BareCellFieldsAreQualifiedToTheDefaultFluidType)
{
    FieldRegistry registry{};
    registry.add_field(FieldKey::bare("foo"), constant_field(1.0), SamplingKind::Cell, {.units = "cm"});

    ASSERT_TRUE(registry.contains_local({"gas", "foo"}));
    ASSERT_TRUE(registry.contains_local(FieldKey::bare("foo")));
    EXPECT_EQ(registry.field_aliases().at(FieldKey::bare("foo")), (FieldKey{"gas", "foo"}));
    EXPECT_FALSE(registry.lookup({"gas", "foo"}).is_passthrough());
}

TEST(FieldRegistry, BareParticleFieldsAreQualifiedToAll)
{
    FieldRegistry registry{};
    registry.add_field(FieldKey::bare("mass2"), constant_field(1.0), SamplingKind::Particle, {.units = "g"});
    ASSERT_TRUE(registry.contains({"all", "mass2"}));
    EXPECT_TRUE(registry.lookup({"all", "mass2"}).is_particle());
    EXPECT_TRUE(registry.contains(FieldKey::bare("mass2")));
}

TEST(FieldRegistry, BareNameKeepsItsOwnDefinitionWhenTheQualifiedKeyExists)
{
    FieldRegistry registry{};
    registry.add_field({"gas", "foo"}, constant_field(1.0), SamplingKind::Cell, {.units = "cm"});
    registry.add_field(FieldKey::bare("foo"), constant_field(2.0), SamplingKind::Cell, {.units = "g"});
    EXPECT_EQ(registry.lookup({"gas", "foo"}).units(), "cm");
    EXPECT_EQ(registry.lookup(FieldKey::bare("foo")).units(), "g");
}

TEST(FieldRegistry, DeprecatedParticleFlagMustAgreeWithSampling)
{
    FieldRegistry registry{};
    EXPECT_THROW(registry.add_field({"io", "foo"}, constant_field(1.0), SamplingKind::Cell, {.particle_type = true}),
                 fwv::fields::ConflictingConfiguration);
    EXPECT_FALSE(registry.contains({"io", "foo"}));

    registry.add_field({"io", "bar"}, constant_field(1.0), SamplingKind::Particle, {.particle_type = true});
    EXPECT_TRUE(registry.lookup({"io", "bar"}).is_particle());
}

TEST(FieldRegistry, DeferredRegistrationHappensWhenTheFunctionArrives)
{
    FieldRegistry registry{};
    auto register_later = registry.deferred_add_field({"gas", "foo"}, SamplingKind::Cell, {.units = "K"});
    EXPECT_FALSE(registry.contains({"gas", "foo"}));

    register_later(constant_field(3.0));
    ASSERT_TRUE(registry.contains({"gas", "foo"}));
    EXPECT_EQ(registry.lookup({"gas", "foo"}).units(), "K");
}

TEST(FieldRegistry, OutputFieldsAlwaysReplaceAndArePassthroughs)
{
    FieldRegistry registry{};
    registry.add_field({"gas", "density"}, constant_field(1.0), SamplingKind::Cell, {.units = "g"});
    registry.add_output_field({"gas", "density"}, SamplingKind::Cell, {.units = "g/cm**3"});
    const auto &definition = registry.lookup({"gas", "density"});
    EXPECT_TRUE(definition.is_passthrough());
    EXPECT_EQ(definition.units(), "g/cm**3");
    EXPECT_EQ(definition.output_units(), "g/cm**3");
}

TEST(FieldRegistry, AliasUsesThePreferredUnitsOfTheSourceDimension)
{
    FieldRegistry registry{};
    registry.add_output_field({"gas", "vel"}, SamplingKind::Cell, {.units = "km/s", .display_name = "V"});
    registry.alias({"gas", "velocity"}, {"gas", "vel"});

    const auto &alias = registry.lookup({"gas", "velocity"});
    EXPECT_EQ(alias.units(), "cm/s");
    EXPECT_EQ(alias.display_name(), std::optional<std::string>{"V"});
    EXPECT_FALSE(alias.is_passthrough());
    EXPECT_EQ(registry.field_aliases().at({"gas", "velocity"}), (FieldKey{"gas", "vel"}));
}

TEST(FieldRegistry, AliasKeepsDimensionlessSourceUnitsAndHonoursExplicitUnits)
{
    FieldRegistry registry{};
    registry.add_output_field({"gas", "ratio"}, SamplingKind::Cell, {.units = "dimensionless"});
    registry.alias({"gas", "ratio_alias"}, {"gas", "ratio"});
    EXPECT_EQ(registry.lookup({"gas", "ratio_alias"}).units(), "dimensionless");

    registry.add_output_field({"gas", "len"}, SamplingKind::Cell, {.units = "cm"});
    registry.alias({"gas", "len_km"}, {"gas", "len"}, "km");
    EXPECT_EQ(registry.lookup({"gas", "len_km"}).units(), "km");
}

TEST(FieldRegistry, AliasOfAMissingSourceDoesNothing)
{
    FieldRegistry registry{};
    registry.alias({"gas", "velocity"}, {"gas", "nope"});
    EXPECT_FALSE(registry.contains({"gas", "velocity"}));
    EXPECT_TRUE(registry.field_aliases().empty());
}

TEST(FieldRegistry, AliasOfUnparsableUnitsThrows)
{
    FieldRegistry registry{};
    registry.add_output_field({"gas", "odd"}, SamplingKind::Cell, {.units = "furlongs"});
    EXPECT_THROW(registry.alias({"gas", "odd_alias"}, {"gas", "odd"}), fwv::fields::UnitConversionError);
}

TEST(FieldRegistry, LookupOfAnUnknownKeyThrowsFieldNotFound)
{
    const FieldRegistry registry{};
    try
    {
        static_cast<void>(registry.lookup({"gas", "magnetic_field_x"}));
        FAIL() << "expected FieldNotFound";
    }
    catch (const fwv::fields::FieldNotFound &ex)
    {
        EXPECT_EQ(ex.key(), (FieldKey{"gas", "magnetic_field_x"}));
    }
    EXPECT_EQ(registry.find({"gas", "magnetic_field_x"}), nullptr);
}

TEST(FieldRegistry, EraseDropsTheAliasRecordToo)
{
    FieldRegistry registry{};
    registry.add_output_field({"gas", "density"}, SamplingKind::Cell, {.units = "g/cm**3"});
    registry.alias({"gas", "rho"}, {"gas", "density"});
    EXPECT_TRUE(registry.erase({"gas", "rho"}));
    EXPECT_FALSE(registry.contains({"gas", "rho"}));
    EXPECT_TRUE(registry.field_aliases().empty());
    EXPECT_FALSE(registry.erase({"gas", "rho"}));
}

TEST(FieldRegistryFallback, LocalDefinitionsShadowTheFallback)
{
    FieldRegistry base{};
    base.add_field({"gas", "shared"}, constant_field(1.0), SamplingKind::Cell, {.units = "cm"});
    base.add_field({"gas", "base_only"}, constant_field(1.0), SamplingKind::Cell, {.units = "s"});

    auto child = FieldRegistry::create_with_fallback(base, "child");
    child->add_field({"gas", "shared"}, constant_field(2.0), SamplingKind::Cell,
                     {.units = "g", .force_override = true});

    EXPECT_EQ(child->lookup({"gas", "shared"}).units(), "g");
    EXPECT_EQ(base.lookup({"gas", "shared"}).units(), "cm");
    EXPECT_EQ(child->lookup({"gas", "base_only"}).units(), "s");
    EXPECT_TRUE(child->contains({"gas", "base_only"}));
    EXPECT_FALSE(child->contains_local({"gas", "base_only"}));
    EXPECT_EQ(child->name(), "child");
    EXPECT_EQ(child->fallback(), &base);
}

TEST(FieldRegistryFallback, RegistrationIsSkippedWhenTheFallbackAlreadyHasTheKey)
{
    FieldRegistry base{};
    base.add_field({"gas", "shared"}, constant_field(1.0), SamplingKind::Cell, {.units = "cm"});
    auto child = FieldRegistry::create_with_fallback(base);
    child->add_field({"gas", "shared"}, constant_field(2.0), SamplingKind::Cell, {.units = "g"});
    EXPECT_FALSE(child->contains_local({"gas", "shared"}));
    EXPECT_EQ(child->size(), 0U);
}

TEST(FieldRegistryFallback, KeysListLocalEntriesFirst)
{
    FieldRegistry base{};
    base.add_field({"gas", "a"}, constant_field(1.0), SamplingKind::Cell);
    auto child = FieldRegistry::create_with_fallback(base);
    child->add_field({"gas", "z"}, constant_field(1.0), SamplingKind::Cell);
    EXPECT_THAT(child->keys(), ElementsAre(FieldKey{"gas", "z"}, FieldKey{"gas", "a"}));
}

TEST(FieldRegistryFallback, PruneRemovesTheKeyFromTheWholeChain)
{
    FieldRegistry base{};
    base.add_field({"gas", "doomed"}, constant_field(1.0), SamplingKind::Cell);
    auto child = FieldRegistry::create_with_fallback(base);
    child->add_field({"gas", "doomed"}, constant_field(1.0), SamplingKind::Cell, {.force_override = true});

    child->prune({"gas", "doomed"});
    EXPECT_FALSE(child->contains({"gas", "doomed"}));
    EXPECT_FALSE(base.contains({"gas", "doomed"}));
    EXPECT_THAT(child->keys(), Not(Contains(FieldKey{"gas", "doomed"})));
}

TEST(FieldRegistryFallback, ChildInheritsTheOnDiskFieldList)
{
    FieldRegistry base{nullptr, {{"gas", "velocity_x"}, {"gas", "density"}, {"gas", "density"}}};
    EXPECT_THAT(base.field_list(), ElementsAre(FieldKey{"gas", "density"}, FieldKey{"gas", "velocity_x"}));

    auto child = FieldRegistry::create_with_fallback(base);
    EXPECT_TRUE(child->is_on_disk({"gas", "density"}));
    EXPECT_FALSE(child->is_on_disk({"gas", "pressure"}));
}

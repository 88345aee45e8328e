/**
 * @file particle_fields.hpp
 * @brief stock particle field library used by particle setup
 *
 * these are plain free functions that register fields into a registry. the
 * field functions they install never hold a reference back to the registry;
 * everything they need is captured by value at registration time.
 */
#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace fwv::fields
{

class FieldRegistry;

/**
 * @brief bare names that sph particle types expose as fluid views
 */
[[nodiscard]] auto sph_whitelist_fields() -> const std::vector<std::string> &;

/**
 * @brief per-axis scalars from on-disk combined vectors
 *
 * registers (ptype, coord_name + "_" + a) and (ptype, vel_name + "_" + a) for a in x, y, z.
 */
void particle_scalar_functions(FieldRegistry &registry, const std::string &ptype, const std::string &coord_name,
                               const std::string &vel_name);

/**
 * @brief combined (ptype, "particle_position") / (ptype, "particle_velocity") from per-axis scalars
 */
void particle_vector_functions(FieldRegistry &registry, const std::string &ptype,
                               const std::array<std::string, 3> &coord_names,
                               const std::array<std::string, 3> &vel_names);

/**
 * @brief nearest-grid-point deposits: ("deposit", ptype + "_count" | "_mass" | "_density")
 */
void particle_deposition_functions(FieldRegistry &registry, const std::string &ptype, const std::string &coord_name,
                                   const std::string &mass_name);

/**
 * @brief particle_ones, particle_velocity_magnitude, particle_kinetic_energy for @p ptype
 */
void standard_particle_fields(FieldRegistry &registry, const std::string &ptype);

/**
 * @brief (ptype, field) as the concatenation of (member, field) over every raw particle type
 */
void add_union_field(FieldRegistry &registry, const std::string &ptype, const std::string &field,
                     const std::string &units);

} // namespace fwv::fields

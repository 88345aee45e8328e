/**
 * @file field_array.hpp
 * @brief flat value buffer + units label handed between field functions
 *
 * vector quantities (particle_position, particle_velocity) are stored
 * interleaved: element i, component c lives at values[i * components + c].
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace fwv::fields
{

/**
 * @brief values of one field over a chunk of cells or particles
 */
struct FieldArray
{
    std::vector<double> values{};     ///< interleaved when components > 1
    std::size_t         components{1U}; ///< 1 for scalars, 3 for vectors
    std::string         units{};      ///< "" means "already in the definition's units"

    [[nodiscard]] auto size() const noexcept -> std::size_t
    {
        return components == 0U ? 0U : values.size() / components;
    }

    [[nodiscard]] auto component(std::size_t element, std::size_t axis) const -> double
    {
        return values[element * components + axis];
    }
};

/**
 * @brief scalar array of @p count copies of @p value
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] inline auto filled(std::size_t count, double value, std::string units = {}) -> FieldArray
{
    return FieldArray{std::vector<double>(count, value), 1U, std::move(units)};
}

/**
 * @brief pull one axis out of an interleaved vector array
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] inline auto extract_component(const FieldArray &vector, std::size_t axis) -> FieldArray
{
    FieldArray out{};
    out.units = vector.units;
    out.values.reserve(vector.size());
    for (std::size_t i = 0; i < vector.size(); ++i)
    {
        out.values.push_back(vector.component(i, axis));
    }
    return out;
}

/**
 * @brief element-wise binary combination of two equally sized scalar arrays
 *
 * ✨ PURE FUNCTION ✨
 *
 * the result carries @p units; callers choose them since this helper has no
 * idea what the operation means dimensionally.
 *
 * @throws std::invalid_argument when the arrays hold different numbers of values
 */
template <typename BinaryOp>
[[nodiscard]] auto combine(const FieldArray &lhs, const FieldArray &rhs, BinaryOp op, std::string units = {})
    -> FieldArray
{
    if (lhs.values.size() != rhs.values.size())
    {
        throw std::invalid_argument("cannot combine arrays of " + std::to_string(lhs.values.size()) + " and "
                                    + std::to_string(rhs.values.size()) + " values");
    }
    FieldArray out{};
    out.units = std::move(units);
    out.values.reserve(lhs.values.size());
    for (std::size_t i = 0; i < lhs.values.size(); ++i)
    {
        out.values.push_back(op(lhs.values[i], rhs.values[i]));
    }
    return out;
}

} // namespace fwv::fields

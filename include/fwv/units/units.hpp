/**
 * @file units.hpp
 * @brief tiny dimensional-analysis layer the field registry leans on uwu
 *
 * the registry never does physics with units; it only needs three answers:
 * - what physical dimension does this unit string carry?
 * - what string does this dataset's unit system prefer for that dimension?
 * - by what factor do I scale values to go from unit A to unit B?
 *
 * UnitCatalog answers the first and third question by parsing expressions like
 * `g/cm**3`, `((erg/g)*2.5)` or `code_length` into a dimension vector plus a
 * scale factor relative to the cgs base units. UnitSystem answers the second
 * one for the cgs and mks flavours.
 *
 * dimensions are tracked as real-valued exponents so gaussian magnetic fields
 * (g^1/2 cm^-1/2 s^-1) fit without a fifth base quantity.
 *
 * example:
 * @code
 * const fwv::units::UnitCatalog catalog{};
 * const auto factor = catalog.conversion_factor("kg/m**3", "g/cm**3");
 * // factor.value() == 1.0e-3
 * @endcode
 */
#pragma once

#include <array>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace fwv::units
{

/**
 * @brief exponent vector over (mass, length, time, temperature)
 *
 * ✨ PURE FUNCTION ✨ (plain value type)
 */
struct Dimension
{
    double mass{0.0};
    double length{0.0};
    double time{0.0};
    double temperature{0.0};

    [[nodiscard]] constexpr auto is_dimensionless() const noexcept -> bool
    {
        return mass == 0.0 && length == 0.0 && time == 0.0 && temperature == 0.0;
    }

    /// "M L^-3" style label, "dimensionless" when empty
    [[nodiscard]] auto to_string() const -> std::string;

    friend auto operator==(const Dimension &lhs, const Dimension &rhs) noexcept -> bool;
};

[[nodiscard]] constexpr auto operator*(const Dimension &lhs, const Dimension &rhs) noexcept -> Dimension
{
    return Dimension{lhs.mass + rhs.mass, lhs.length + rhs.length, lhs.time + rhs.time,
                     lhs.temperature + rhs.temperature};
}

[[nodiscard]] constexpr auto operator/(const Dimension &lhs, const Dimension &rhs) noexcept -> Dimension
{
    return Dimension{lhs.mass - rhs.mass, lhs.length - rhs.length, lhs.time - rhs.time,
                     lhs.temperature - rhs.temperature};
}

[[nodiscard]] constexpr auto pow(const Dimension &dim, double exponent) noexcept -> Dimension
{
    return Dimension{dim.mass * exponent, dim.length * exponent, dim.time * exponent, dim.temperature * exponent};
}

/// named dimensions used by the built-in field plugins
namespace dims
{
inline constexpr Dimension dimensionless{};
inline constexpr Dimension mass{.mass = 1.0};
inline constexpr Dimension length{.length = 1.0};
inline constexpr Dimension time{.time = 1.0};
inline constexpr Dimension temperature{.temperature = 1.0};
inline constexpr Dimension area{.length = 2.0};
inline constexpr Dimension volume{.length = 3.0};
inline constexpr Dimension velocity{.length = 1.0, .time = -1.0};
inline constexpr Dimension density{.mass = 1.0, .length = -3.0};
inline constexpr Dimension number_density{.length = -3.0};
inline constexpr Dimension energy{.mass = 1.0, .length = 2.0, .time = -2.0};
inline constexpr Dimension specific_energy{.length = 2.0, .time = -2.0};
inline constexpr Dimension pressure{.mass = 1.0, .length = -1.0, .time = -2.0};
inline constexpr Dimension magnetic_field{.mass = 0.5, .length = -0.5, .time = -1.0};
} // namespace dims

/**
 * @brief unit parse/convert failure with breadcrumb context (same shape as ConfigError)
 */
struct UnitError
{
    std::string              message; ///< what went wrong
    std::vector<std::string> context; ///< offending expression / token trail
};

/**
 * @brief parsed unit: its dimension and the factor that maps it onto cgs base units
 */
struct UnitInfo
{
    Dimension dimension{};
    double    factor{1.0};
};

/**
 * @brief symbol table + expression parser for unit strings
 *
 * the default catalog knows the usual cgs/SI/astro suspects (g, kg, cm, m, pc,
 * s, yr, K, erg, J, dyn, N, Pa, G, T, eV, Msun, ...). datasets bolt on their
 * own `code_*` units through define().
 */
class UnitCatalog
{
public:
    UnitCatalog();

    /**
     * @brief parse a unit expression into dimension + cgs factor
     *
     * ✨ PURE FUNCTION ✨
     *
     * grammar: product of powers, `*` `/` `**` (or `^`), parentheses, numeric
     * literals. the empty string and "dimensionless" are dimensionless with
     * factor 1.
     *
     * @param[in] expression unit string such as "g/cm**3" or "((cm/s)*1e5)"
     * @return UnitInfo or UnitError naming the expression
     */
    [[nodiscard]] auto parse(std::string_view expression) const -> std::expected<UnitInfo, UnitError>;

    /// convenience wrapper: only the dimension of @p expression
    [[nodiscard]] auto dimension_of(std::string_view expression) const -> std::expected<Dimension, UnitError>;

    /**
     * @brief factor f such that value_in_to = f * value_in_from
     *
     * @return UnitError when either side fails to parse or dimensions differ
     */
    [[nodiscard]] auto conversion_factor(std::string_view from, std::string_view to) const
        -> std::expected<double, UnitError>;

    /// register or replace a symbol with an explicit definition
    void define(std::string symbol, UnitInfo info);

    /**
     * @brief register `symbol` as `scale * expression` (e.g. code_length = 3.08e24 * cm)
     */
    [[nodiscard]] auto define(std::string symbol, double scale, std::string_view expression)
        -> std::expected<void, UnitError>;

    [[nodiscard]] auto contains(std::string_view symbol) const -> bool;

private:
    std::unordered_map<std::string, UnitInfo> symbols_{};
};

/**
 * @brief preferred unit strings per dimension (cgs or mks flavour)
 */
class UnitSystem
{
public:
    /**
     * @param name   label ("cgs", "mks")
     * @param base   symbols for (mass, length, time, temperature)
     */
    UnitSystem(std::string name, std::array<std::string, 4> base);

    [[nodiscard]] static auto cgs() -> UnitSystem;
    [[nodiscard]] static auto mks() -> UnitSystem;

    /// set the string returned for @p dimension instead of the composed base-unit product
    void set_preferred(const Dimension &dimension, std::string units);

    /**
     * @brief preferred string for @p dimension
     *
     * ✨ PURE FUNCTION ✨
     *
     * named entries win ("erg", "G"); anything else is composed from the base
     * symbols, e.g. "g*cm**2/s**2". dimensionless returns "".
     */
    [[nodiscard]] auto units_for(const Dimension &dimension) const -> std::string;

    [[nodiscard]] auto name() const noexcept -> const std::string & { return name_; }

private:
    std::string                                    name_;
    std::array<std::string, 4>                     base_;
    std::vector<std::pair<Dimension, std::string>> preferred_{};
};

/**
 * @brief compose unit strings; empty operands count as dimensionless
 *
 * ✨ PURE FUNCTION ✨
 *
 * multiply("g", "cm/s") == "(g)*(cm/s)", divide("", "cm**3") == "1/(cm**3)"
 */
[[nodiscard]] auto multiply(std::string_view lhs, std::string_view rhs) -> std::string;
[[nodiscard]] auto divide(std::string_view lhs, std::string_view rhs) -> std::string;
[[nodiscard]] auto power(std::string_view base, int exponent) -> std::string;

} // namespace fwv::units

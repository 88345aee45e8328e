/**
 * @file units.cpp
 * @brief unit symbol table, recursive-descent expression parser and unit systems
 */
#include "fwv/units/units.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <numbers>
#include <optional>
#include <string>

#include <fmt/format.h>

namespace fwv::units
{
namespace
{

constexpr double kExponentTolerance = 1.0e-9;

[[nodiscard]] auto make_error(std::string message, std::string_view expression) -> UnitError
{
    return UnitError{std::move(message), {std::string{expression}}};
}

/**
 * @brief single-pass parser over a unit expression
 *
 * product := power (('*' | '/') power)*
 * power   := primary (('**' | '^') exponent)?
 * primary := number | symbol | '(' product ')'
 * exponent:= ['+'|'-'] number | '(' ['+'|'-'] number ['/' number] ')'
 */
class ExpressionParser
{
public:
    ExpressionParser(std::string_view text, const std::unordered_map<std::string, UnitInfo> &symbols)
        : text_{text}, symbols_{&symbols}
    {
    }

    [[nodiscard]] auto run() -> std::expected<UnitInfo, UnitError>
    {
        auto result = parse_product();
        if (!result)
        {
            return result;
        }
        skip_spaces();
        if (pos_ != text_.size())
        {
            return std::unexpected(make_error(fmt::format("unexpected '{}' at offset {}", text_[pos_], pos_), text_));
        }
        if (!std::isfinite(result->factor) || result->factor == 0.0)
        {
            return std::unexpected(make_error("unit scale factor must be finite and non-zero", text_));
        }
        return result;
    }

private:
    void skip_spaces()
    {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0)
        {
            ++pos_;
        }
    }

    [[nodiscard]] auto peek(std::string_view token) -> bool
    {
        skip_spaces();
        return text_.substr(pos_, token.size()) == token;
    }

    [[nodiscard]] auto consume(std::string_view token) -> bool
    {
        if (peek(token))
        {
            pos_ += token.size();
            return true;
        }
        return false;
    }

    [[nodiscard]] auto parse_number() -> std::optional<double>
    {
        skip_spaces();
        const auto *begin = text_.data() + pos_;
        const auto *end   = text_.data() + text_.size();
        double      value = 0.0;
        const auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc{} || ptr == begin)
        {
            return std::nullopt;
        }
        pos_ += static_cast<std::size_t>(ptr - begin);
        return value;
    }

    [[nodiscard]] auto parse_signed_number() -> std::optional<double>
    {
        double sign = 1.0;
        if (consume("-"))
        {
            sign = -1.0;
        }
        else if (consume("+"))
        {
            sign = 1.0;
        }
        const auto value = parse_number();
        if (!value)
        {
            return std::nullopt;
        }
        return sign * *value;
    }

    [[nodiscard]] auto parse_exponent() -> std::expected<double, UnitError>
    {
        if (consume("("))
        {
            auto numerator = parse_signed_number();
            if (!numerator)
            {
                return std::unexpected(make_error("malformed exponent", text_));
            }
            double value = *numerator;
            if (consume("/"))
            {
                const auto denominator = parse_number();
                if (!denominator || *denominator == 0.0)
                {
                    return std::unexpected(make_error("malformed fractional exponent", text_));
                }
                value /= *denominator;
            }
            if (!consume(")"))
            {
                return std::unexpected(make_error("missing ')' after exponent", text_));
            }
            return value;
        }
        const auto value = parse_signed_number();
        if (!value)
        {
            return std::unexpected(make_error("malformed exponent", text_));
        }
        return *value;
    }

    [[nodiscard]] auto parse_symbol() -> std::expected<UnitInfo, UnitError>
    {
        skip_spaces();
        const auto start = pos_;
        while (pos_ < text_.size()
               && (std::isalnum(static_cast<unsigned char>(text_[pos_])) != 0 || text_[pos_] == '_'))
        {
            ++pos_;
        }
        if (start == pos_)
        {
            if (pos_ >= text_.size())
            {
                return std::unexpected(make_error("unexpected end of unit expression", text_));
            }
            return std::unexpected(make_error(fmt::format("unexpected '{}' at offset {}", text_[pos_], pos_), text_));
        }
        const std::string symbol{text_.substr(start, pos_ - start)};
        const auto        it = symbols_->find(symbol);
        if (it == symbols_->end())
        {
            return std::unexpected(UnitError{fmt::format("unknown unit symbol '{}'", symbol),
                                             {std::string{text_}, symbol}});
        }
        return it->second;
    }

    [[nodiscard]] auto parse_primary() -> std::expected<UnitInfo, UnitError>
    {
        if (consume("("))
        {
            auto inner = parse_product();
            if (!inner)
            {
                return inner;
            }
            if (!consume(")"))
            {
                return std::unexpected(make_error("missing ')'", text_));
            }
            return inner;
        }
        skip_spaces();
        if (pos_ < text_.size()
            && (std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0 || text_[pos_] == '.'))
        {
            const auto value = parse_number();
            if (!value)
            {
                return std::unexpected(make_error("malformed numeric factor", text_));
            }
            return UnitInfo{dims::dimensionless, *value};
        }
        return parse_symbol();
    }

    [[nodiscard]] auto parse_power() -> std::expected<UnitInfo, UnitError>
    {
        auto base = parse_primary();
        if (!base)
        {
            return base;
        }
        if (consume("**") || consume("^"))
        {
            const auto exponent = parse_exponent();
            if (!exponent)
            {
                return std::unexpected(exponent.error());
            }
            return UnitInfo{pow(base->dimension, *exponent), std::pow(base->factor, *exponent)};
        }
        return base;
    }

    [[nodiscard]] auto parse_product() -> std::expected<UnitInfo, UnitError>
    {
        auto lhs = parse_power();
        if (!lhs)
        {
            return lhs;
        }
        while (true)
        {
            if (peek("**"))
            {
                break;
            }
            if (consume("*"))
            {
                const auto rhs = parse_power();
                if (!rhs)
                {
                    return rhs;
                }
                lhs = UnitInfo{lhs->dimension * rhs->dimension, lhs->factor * rhs->factor};
            }
            else if (consume("/"))
            {
                const auto rhs = parse_power();
                if (!rhs)
                {
                    return rhs;
                }
                lhs = UnitInfo{lhs->dimension / rhs->dimension, lhs->factor / rhs->factor};
            }
            else
            {
                break;
            }
        }
        return lhs;
    }

    std::string_view                                  text_;
    const std::unordered_map<std::string, UnitInfo> *symbols_;
    std::size_t                                       pos_{0U};
};

[[nodiscard]] auto format_exponent(double exponent) -> std::string
{
    const double magnitude = std::abs(exponent);
    if (std::abs(magnitude - 1.0) < kExponentTolerance)
    {
        return {};
    }
    return fmt::format("**{:g}", magnitude);
}

} // namespace

auto Dimension::to_string() const -> std::string
{
    if (is_dimensionless())
    {
        return "dimensionless";
    }
    std::string out;
    const std::array<std::pair<char, double>, 4> parts{
        {{'M', mass}, {'L', length}, {'T', time}, {'K', temperature}}};
    for (const auto &[label, exponent] : parts)
    {
        if (std::abs(exponent) < kExponentTolerance)
        {
            continue;
        }
        if (!out.empty())
        {
            out += ' ';
        }
        out += label;
        if (std::abs(exponent - 1.0) > kExponentTolerance)
        {
            out += fmt::format("^{:g}", exponent);
        }
    }
    return out;
}

auto operator==(const Dimension &lhs, const Dimension &rhs) noexcept -> bool
{
    return std::abs(lhs.mass - rhs.mass) < kExponentTolerance && std::abs(lhs.length - rhs.length) < kExponentTolerance
           && std::abs(lhs.time - rhs.time) < kExponentTolerance
           && std::abs(lhs.temperature - rhs.temperature) < kExponentTolerance;
}

UnitCatalog::UnitCatalog()
{
    // mass
    define("g", {dims::mass, 1.0});
    define("kg", {dims::mass, 1.0e3});
    define("mg", {dims::mass, 1.0e-3});
    define("amu", {dims::mass, 1.66053906660e-24});
    define("mp", {dims::mass, 1.67262192369e-24});
    define("Msun", {dims::mass, 1.98841e33});

    // length
    define("cm", {dims::length, 1.0});
    define("m", {dims::length, 1.0e2});
    define("mm", {dims::length, 1.0e-1});
    define("um", {dims::length, 1.0e-4});
    define("nm", {dims::length, 1.0e-7});
    define("km", {dims::length, 1.0e5});
    define("au", {dims::length, 1.495978707e13});
    define("ly", {dims::length, 9.4607304725808e17});
    define("pc", {dims::length, 3.0856775814913673e18});
    define("kpc", {dims::length, 3.0856775814913673e21});
    define("Mpc", {dims::length, 3.0856775814913673e24});

    // time
    define("s", {dims::time, 1.0});
    define("ms", {dims::time, 1.0e-3});
    define("min", {dims::time, 60.0});
    define("hr", {dims::time, 3600.0});
    define("day", {dims::time, 86400.0});
    define("yr", {dims::time, 3.15576e7});
    define("kyr", {dims::time, 3.15576e10});
    define("Myr", {dims::time, 3.15576e13});
    define("Gyr", {dims::time, 3.15576e16});

    // temperature
    define("K", {dims::temperature, 1.0});

    // energy, force, pressure
    define("erg", {dims::energy, 1.0});
    define("J", {dims::energy, 1.0e7});
    define("eV", {dims::energy, 1.602176634e-12});
    define("keV", {dims::energy, 1.602176634e-9});
    define("dyn", {dims::energy / dims::length, 1.0});
    define("dyne", {dims::energy / dims::length, 1.0});
    define("N", {dims::energy / dims::length, 1.0e5});
    define("Pa", {dims::pressure, 10.0});

    // magnetic field (gaussian)
    define("G", {dims::magnetic_field, 1.0});
    define("gauss", {dims::magnetic_field, 1.0});
    define("uG", {dims::magnetic_field, 1.0e-6});
    define("T", {dims::magnetic_field, 1.0e4});

    // angles and friends
    define("dimensionless", {dims::dimensionless, 1.0});
    define("rad", {dims::dimensionless, 1.0});
    define("radian", {dims::dimensionless, 1.0});
    define("degree", {dims::dimensionless, std::numbers::pi / 180.0});
}

auto UnitCatalog::parse(std::string_view expression) const -> std::expected<UnitInfo, UnitError>
{
    const auto first = expression.find_first_not_of(" \t");
    if (first == std::string_view::npos)
    {
        return UnitInfo{dims::dimensionless, 1.0};
    }
    ExpressionParser parser{expression, symbols_};
    return parser.run();
}

auto UnitCatalog::dimension_of(std::string_view expression) const -> std::expected<Dimension, UnitError>
{
    const auto info = parse(expression);
    if (!info)
    {
        return std::unexpected(info.error());
    }
    return info->dimension;
}

auto UnitCatalog::conversion_factor(std::string_view from, std::string_view to) const
    -> std::expected<double, UnitError>
{
    const auto source = parse(from);
    if (!source)
    {
        return std::unexpected(source.error());
    }
    const auto target = parse(to);
    if (!target)
    {
        return std::unexpected(target.error());
    }
    if (!(source->dimension == target->dimension))
    {
        return std::unexpected(UnitError{
            fmt::format("cannot convert '{}' ({}) to '{}' ({})", from, source->dimension.to_string(), to,
                        target->dimension.to_string()),
            {std::string{from}, std::string{to}}});
    }
    return source->factor / target->factor;
}

void UnitCatalog::define(std::string symbol, UnitInfo info)
{
    symbols_.insert_or_assign(std::move(symbol), info);
}

auto UnitCatalog::define(std::string symbol, double scale, std::string_view expression)
    -> std::expected<void, UnitError>
{
    const auto info = parse(expression);
    if (!info)
    {
        auto error = info.error();
        error.context.insert(error.context.begin(), symbol);
        return std::unexpected(std::move(error));
    }
    const auto factor = scale * info->factor;
    if (!std::isfinite(factor) || factor == 0.0)
    {
        return std::unexpected(UnitError{fmt::format("unit '{}' needs a finite, non-zero scale", symbol),
                                         {symbol, std::string{expression}}});
    }
    define(std::move(symbol), UnitInfo{info->dimension, factor});
    return {};
}

auto UnitCatalog::contains(std::string_view symbol) const -> bool
{
    return symbols_.contains(std::string{symbol});
}

UnitSystem::UnitSystem(std::string name, std::array<std::string, 4> base)
    : name_{std::move(name)}, base_{std::move(base)}
{
}

auto UnitSystem::cgs() -> UnitSystem
{
    UnitSystem system{"cgs", {"g", "cm", "s", "K"}};
    system.set_preferred(dims::energy, "erg");
    system.set_preferred(dims::specific_energy, "erg/g");
    system.set_preferred(dims::pressure, "dyn/cm**2");
    system.set_preferred(dims::energy / dims::length, "dyn");
    system.set_preferred(dims::magnetic_field, "G");
    return system;
}

auto UnitSystem::mks() -> UnitSystem
{
    UnitSystem system{"mks", {"kg", "m", "s", "K"}};
    system.set_preferred(dims::energy, "J");
    system.set_preferred(dims::specific_energy, "J/kg");
    system.set_preferred(dims::pressure, "Pa");
    system.set_preferred(dims::energy / dims::length, "N");
    system.set_preferred(dims::magnetic_field, "T");
    return system;
}

void UnitSystem::set_preferred(const Dimension &dimension, std::string units)
{
    for (auto &[dim, label] : preferred_)
    {
        if (dim == dimension)
        {
            label = std::move(units);
            return;
        }
    }
    preferred_.emplace_back(dimension, std::move(units));
}

auto UnitSystem::units_for(const Dimension &dimension) const -> std::string
{
    if (dimension.is_dimensionless())
    {
        return {};
    }
    for (const auto &[dim, label] : preferred_)
    {
        if (dim == dimension)
        {
            return label;
        }
    }

    const std::array<double, 4> exponents{dimension.mass, dimension.length, dimension.time, dimension.temperature};
    std::string numerator;
    std::string denominator;
    std::size_t denominator_terms = 0U;
    for (std::size_t i = 0; i < exponents.size(); ++i)
    {
        if (std::abs(exponents[i]) < kExponentTolerance)
        {
            continue;
        }
        const bool positive = exponents[i] > 0.0;
        auto      &target   = positive ? numerator : denominator;
        if (!target.empty())
        {
            target += '*';
        }
        target += base_[i] + format_exponent(exponents[i]);
        if (!positive)
        {
            ++denominator_terms;
        }
    }
    if (numerator.empty())
    {
        numerator = "1";
    }
    if (denominator.empty())
    {
        return numerator;
    }
    if (denominator_terms > 1U)
    {
        return numerator + "/(" + denominator + ")";
    }
    return numerator + "/" + denominator;
}

auto multiply(std::string_view lhs, std::string_view rhs) -> std::string
{
    if (lhs.empty())
    {
        return std::string{rhs};
    }
    if (rhs.empty())
    {
        return std::string{lhs};
    }
    return fmt::format("({})*({})", lhs, rhs);
}

auto divide(std::string_view lhs, std::string_view rhs) -> std::string
{
    if (rhs.empty())
    {
        return std::string{lhs};
    }
    if (lhs.empty())
    {
        return fmt::format("1/({})", rhs);
    }
    return fmt::format("({})/({})", lhs, rhs);
}

auto power(std::string_view base, int exponent) -> std::string
{
    if (base.empty())
    {
        return {};
    }
    return fmt::format("({})**{}", base, exponent);
}

} // namespace fwv::units

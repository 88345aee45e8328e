/**
 * @file field_key.hpp
 * @brief two-part field identity (category, name) with deterministic ordering uwu
 *
 * every field in the registry is addressed by a FieldKey. a concrete key looks
 * like ("gas", "density") or ("io", "particle_mass"); a bare key is plain sugar
 * for a name nobody qualified yet, and it lives under the sentinel category
 * `?` so sorting a mixed bag of keys gives the same answer on every platform.
 * the sentinel is punctuation on purpose: real categories never start with it,
 * so bare names always sort ahead of tupled ones.
 *
 * @note fmt::formatter is specialised at the bottom so keys drop straight into
 *       log lines and error messages
 */
#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace fwv::fields
{

/// sentinel category carried by bare (unqualified) names
inline constexpr std::string_view kBareCategory = "?";

/**
 * @brief (category, name) identity of a field
 *
 * ✨ PURE FUNCTION ✨ (value type, no hidden state)
 *
 * construction validates that the name is non-empty; anything else is a
 * programming error and throws MalformedIdentity.
 */
class FieldKey
{
public:
    FieldKey() = default;

    /**
     * @brief qualified key; an empty or `?` category produces a bare key
     *
     * @throws MalformedIdentity if @p name is empty
     */
    FieldKey(std::string category, std::string name);

    /**
     * @brief bare key for a not-yet-qualified name
     *
     * @throws MalformedIdentity if @p name is empty
     */
    [[nodiscard]] static auto bare(std::string name) -> FieldKey;

    [[nodiscard]] auto category() const noexcept -> const std::string & { return category_; }
    [[nodiscard]] auto name() const noexcept -> const std::string & { return name_; }
    [[nodiscard]] auto is_bare() const noexcept -> bool { return category_ == kBareCategory; }

    /// "('gas', 'density')" for qualified keys, "density" for bare ones
    [[nodiscard]] auto to_string() const -> std::string;

    friend auto operator==(const FieldKey &lhs, const FieldKey &rhs) noexcept -> bool = default;

    friend auto operator<(const FieldKey &lhs, const FieldKey &rhs) noexcept -> bool
    {
        if (lhs.category_ != rhs.category_)
        {
            return lhs.category_ < rhs.category_;
        }
        return lhs.name_ < rhs.name_;
    }

private:
    std::string category_{kBareCategory};
    std::string name_{};
};

/**
 * @brief parse "category/name" or plain "name" (CLI + config convenience)
 *
 * @throws MalformedIdentity on empty input or a trailing slash
 */
[[nodiscard]] auto parse_field_key(std::string_view text) -> FieldKey;

} // namespace fwv::fields

template <>
struct std::hash<fwv::fields::FieldKey>
{
    [[nodiscard]] auto operator()(const fwv::fields::FieldKey &key) const noexcept -> std::size_t
    {
        const auto h1 = std::hash<std::string>{}(key.category());
        const auto h2 = std::hash<std::string>{}(key.name());
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6U) + (h1 >> 2U));
    }
};

template <>
struct fmt::formatter<fwv::fields::FieldKey> : fmt::formatter<std::string>
{
    auto format(const fwv::fields::FieldKey &key, format_context &ctx) const -> decltype(ctx.out())
    {
        return fmt::formatter<std::string>::format(key.to_string(), ctx);
    }
};

/**
 * @file field_key.cpp
 * @brief FieldKey construction, formatting and the registry exception types
 */
#include "fwv/fields/field_key.hpp"

#include <fmt/format.h>

#include "fwv/fields/errors.hpp"

namespace fwv::fields
{

FieldKey::FieldKey(std::string category, std::string name) : category_{std::move(category)}, name_{std::move(name)}
{
    if (name_.empty())
    {
        throw MalformedIdentity(fmt::format("field name must not be empty (category '{}')", category_));
    }
    if (category_.empty())
    {
        category_ = std::string{kBareCategory};
    }
}

auto FieldKey::bare(std::string name) -> FieldKey
{
    return FieldKey{std::string{kBareCategory}, std::move(name)};
}

auto FieldKey::to_string() const -> std::string
{
    if (is_bare())
    {
        return name_;
    }
    return fmt::format("('{}', '{}')", category_, name_);
}

auto parse_field_key(std::string_view text) -> FieldKey
{
    if (text.empty())
    {
        throw MalformedIdentity("empty field identity");
    }
    const auto slash = text.find('/');
    if (slash == std::string_view::npos)
    {
        return FieldKey::bare(std::string{text});
    }
    if (slash + 1U >= text.size())
    {
        throw MalformedIdentity(fmt::format("field identity '{}' has no name after '/'", text));
    }
    return FieldKey{std::string{text.substr(0, slash)}, std::string{text.substr(slash + 1U)}};
}

FieldNotFound::FieldNotFound(FieldKey key)
    : std::out_of_range(fmt::format("No field named {}", key)), key_{std::move(key)}
{
}

CyclicFieldDependency::CyclicFieldDependency(const FieldKey &key)
    : std::runtime_error(fmt::format("field {} depends on itself", key))
{
}

} // namespace fwv::fields

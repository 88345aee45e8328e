/**
 * @file errors.hpp
 * @brief exception types thrown by the field registry and its collaborators
 *
 * lookups and registration failures throw (they are programming or plugin bugs
 * the caller must see). parsing problems stay on the std::expected rails in the
 * config and units modules instead.
 */
#pragma once

#include <stdexcept>
#include <string>

#include "fwv/fields/field_key.hpp"

namespace fwv::fields
{

/**
 * @brief identity absent from a registry and its entire fallback chain
 */
class FieldNotFound : public std::out_of_range
{
public:
    explicit FieldNotFound(FieldKey key);

    [[nodiscard]] auto key() const noexcept -> const FieldKey & { return key_; }

private:
    FieldKey key_;
};

/**
 * @brief a field identity that cannot be interpreted (empty name, bare key where a qualified one is required)
 */
class MalformedIdentity : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief mutually exclusive registration options supplied together
 */
class ConflictingConfiguration : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief a field produced values whose units cannot be converted to its declared units
 */
class UnitConversionError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief a derived field reached itself again while resolving its inputs
 */
class CyclicFieldDependency : public std::runtime_error
{
public:
    explicit CyclicFieldDependency(const FieldKey &key);
};

} // namespace fwv::fields

/**
 * @file validators.hpp
 * @brief preconditions a data source must meet before a field function runs
 *
 * validators double as dependency declarations: during the dry run the
 * detector records every identity and parameter they ask for, which is how a
 * field that only *declares* an on-disk requirement ends up in the requested
 * set even when its function never reads it.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "fwv/fields/data_source.hpp"
#include "fwv/fields/field_key.hpp"

namespace fwv::fields
{

class FieldValidator
{
public:
    FieldValidator()                                             = default;
    FieldValidator(const FieldValidator &)                       = delete;
    auto operator=(const FieldValidator &) -> FieldValidator &   = delete;
    virtual ~FieldValidator()                                    = default;

    /**
     * @brief run the precondition against @p source
     *
     * @throws FieldNotFound / std::out_of_range when the precondition fails during real evaluation
     */
    virtual void check(DataSource &source) const = 0;

    [[nodiscard]] virtual auto describe() const -> std::string = 0;
};

using ValidatorPtr = std::shared_ptr<const FieldValidator>;

/**
 * @brief requires the listed identities to be present on disk
 */
class ValidateDataField final : public FieldValidator
{
public:
    explicit ValidateDataField(std::vector<FieldKey> fields);

    void check(DataSource &source) const override;
    [[nodiscard]] auto describe() const -> std::string override;

    [[nodiscard]] auto fields() const noexcept -> const std::vector<FieldKey> & { return fields_; }

private:
    std::vector<FieldKey> fields_;
};

/**
 * @brief requires the listed dataset parameters to be defined
 */
class ValidateParameter final : public FieldValidator
{
public:
    explicit ValidateParameter(std::vector<std::string> parameters);

    void check(DataSource &source) const override;
    [[nodiscard]] auto describe() const -> std::string override;

private:
    std::vector<std::string> parameters_;
};

[[nodiscard]] auto validate_data_field(std::vector<FieldKey> fields) -> ValidatorPtr;
[[nodiscard]] auto validate_parameter(std::vector<std::string> parameters) -> ValidatorPtr;

} // namespace fwv::fields

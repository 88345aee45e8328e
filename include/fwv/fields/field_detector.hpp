/**
 * @file field_detector.hpp
 * @brief dry-run data source that discovers which on-disk fields a field reads
 *
 * the detector never touches real data. every request returns a small array
 * of ones while the detector notes what was asked for:
 * - on-disk identities (directly, through passthrough definitions, or through
 *   ValidateDataField) land in requested()
 * - parameters land in requested_parameters()
 * - derived inputs are evaluated recursively, so multi-hop chains resolve here
 *
 * a field that reaches itself again throws CyclicFieldDependency; identities
 * the registry cannot resolve throw FieldNotFound.
 */
#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "fwv/fields/data_source.hpp"
#include "fwv/fields/field_definition.hpp"

namespace fwv::fields
{

class FieldRegistry;

class FieldDetector final : public DataSource
{
public:
    /// element count of the placeholder arrays handed to field functions
    static constexpr std::size_t kPlaceholderLength = 16U;

    explicit FieldDetector(const FieldRegistry &registry);

    /**
     * @brief dry-run @p definition, accumulating its requirements
     *
     * ⚠️ IMPURE FUNCTION (mutates the detector's records)
     */
    void detect(const FieldDefinition &definition);

    [[nodiscard]] auto get(const FieldKey &key) -> FieldArray override;
    void request(const FieldKey &key) override;
    [[nodiscard]] auto parameter(std::string_view name) -> double override;
    [[nodiscard]] auto cell_centers(std::size_t axis) -> FieldArray override;
    [[nodiscard]] auto cell_widths(std::size_t axis) -> FieldArray override;
    [[nodiscard]] auto is_dry_run() const noexcept -> bool override { return true; }
    [[nodiscard]] auto unit_catalog() const -> const units::UnitCatalog & override;

    [[nodiscard]] auto requested() const noexcept -> const std::set<FieldKey> & { return requested_; }
    [[nodiscard]] auto requested_parameters() const noexcept -> const std::set<std::string> & { return parameters_; }

private:
    [[nodiscard]] auto evaluate(const FieldDefinition &definition) -> FieldArray;
    [[nodiscard]] static auto placeholder(const FieldDefinition *definition) -> FieldArray;

    const FieldRegistry           *registry_;
    std::set<FieldKey>             requested_{};
    std::set<std::string>          parameters_{};
    std::map<FieldKey, FieldArray> cache_{};
    std::vector<FieldKey>          stack_{};
};

} // namespace fwv::fields

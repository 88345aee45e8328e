/**
 * @file field_evaluator.hpp
 * @brief real DataSource: evaluates fields against a dataset's raw arrays
 *
 * ⚠️ IMPURE FUNCTION territory (memoises every field it computes)
 *
 * evaluation mirrors the dry run in fields::FieldDetector: on-disk identities
 * are served from storage, everything else is looked up in the registry, its
 * validators run, its function runs, and the result is converted into the
 * definition's units. the memo lives as long as the evaluator.
 */
#pragma once

#include <cstddef>
#include <map>
#include <vector>

#include "fwv/fields/data_source.hpp"
#include "fwv/fields/field_array.hpp"
#include "fwv/fields/field_key.hpp"

namespace fwv::fields
{
class FieldDefinition;
} // namespace fwv::fields

namespace fwv::dataset
{

class Dataset;

class FieldEvaluator final : public fields::DataSource
{
public:
    /**
     * @throws std::logic_error when the dataset has no field registry yet
     */
    explicit FieldEvaluator(const Dataset &dataset);

    /// evaluate a definition that is not necessarily registered
    [[nodiscard]] auto evaluate(const fields::FieldDefinition &definition) -> fields::FieldArray;

    [[nodiscard]] auto get(const fields::FieldKey &key) -> fields::FieldArray override;
    void request(const fields::FieldKey &key) override;
    [[nodiscard]] auto parameter(std::string_view name) -> double override;
    [[nodiscard]] auto cell_centers(std::size_t axis) -> fields::FieldArray override;
    [[nodiscard]] auto cell_widths(std::size_t axis) -> fields::FieldArray override;
    [[nodiscard]] auto is_dry_run() const noexcept -> bool override { return false; }
    [[nodiscard]] auto unit_catalog() const -> const units::UnitCatalog & override;

private:
    const Dataset                                  *dataset_;
    std::map<fields::FieldKey, fields::FieldArray> cache_{};
    std::vector<fields::FieldKey>                  stack_{};
};

} // namespace fwv::dataset

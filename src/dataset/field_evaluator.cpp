/**
 * @file field_evaluator.cpp
 * @brief memoised evaluation over raw arrays + uniform-grid cell geometry
 */
#include "fwv/dataset/field_evaluator.hpp"

#include <algorithm>
#include <stdexcept>

#include "fwv/dataset/dataset.hpp"
#include "fwv/fields/errors.hpp"
#include "fwv/fields/field_definition.hpp"
#include "fwv/fields/field_registry.hpp"

namespace fwv::dataset
{
namespace
{

class EvaluationFrame
{
public:
    EvaluationFrame(std::vector<fields::FieldKey> &stack, const fields::FieldKey &key) : stack_{&stack}
    {
        stack_->push_back(key);
    }
    EvaluationFrame(const EvaluationFrame &)                     = delete;
    auto operator=(const EvaluationFrame &) -> EvaluationFrame & = delete;
    ~EvaluationFrame() { stack_->pop_back(); }

private:
    std::vector<fields::FieldKey> *stack_;
};

/// grid index of @p cell along @p axis (x varies fastest)
[[nodiscard]] auto grid_index(const Domain &domain, std::size_t cell, std::size_t axis) -> std::size_t
{
    switch (axis)
    {
    case 0U:
        return cell % domain.dimensions[0];
    case 1U:
        return (cell / domain.dimensions[0]) % domain.dimensions[1];
    default:
        return cell / (domain.dimensions[0] * domain.dimensions[1]);
    }
}

[[nodiscard]] auto cell_width(const Domain &domain, std::size_t axis) -> double
{
    return (domain.right_edge[axis] - domain.left_edge[axis]) / static_cast<double>(domain.dimensions[axis]);
}

[[nodiscard]] auto axis_units(const Dataset &dataset, std::size_t axis) -> std::string
{
    return dataset.coordinates().is_angular(axis) ? std::string{} : dataset.domain().units;
}

} // namespace

FieldEvaluator::FieldEvaluator(const Dataset &dataset) : dataset_{&dataset}
{
    if (!dataset.has_field_info())
    {
        throw std::logic_error("field evaluation needs create_field_info() first");
    }
}

auto FieldEvaluator::evaluate(const fields::FieldDefinition &definition) -> fields::FieldArray
{
    if (definition.is_passthrough())
    {
        return get(definition.key());
    }
    if (std::find(stack_.begin(), stack_.end(), definition.key()) != stack_.end())
    {
        throw fields::CyclicFieldDependency(definition.key());
    }

    const EvaluationFrame frame{stack_, definition.key()};
    definition.check_validators(*this);
    return fields::finalize_units(definition, definition.compute(*this), unit_catalog());
}

auto FieldEvaluator::get(const fields::FieldKey &key) -> fields::FieldArray
{
    if (const auto it = cache_.find(key); it != cache_.end())
    {
        return it->second;
    }

    const auto &registry   = dataset_->field_info();
    const auto  definition = registry.find(key);
    fields::FieldArray result{};
    if (dataset_->is_on_disk(key))
    {
        auto raw          = dataset_->raw_field(key);
        result.values     = std::move(raw.values);
        result.components = raw.components;
        result.units      = definition ? definition->units() : std::string{};
    }
    else if (!definition || definition->is_passthrough())
    {
        throw fields::FieldNotFound(key);
    }
    else
    {
        result = evaluate(*definition);
    }
    cache_.emplace(key, result);
    return result;
}

void FieldEvaluator::request(const fields::FieldKey &key)
{
    if (!dataset_->is_on_disk(key))
    {
        throw fields::FieldNotFound(key);
    }
}

auto FieldEvaluator::parameter(std::string_view name) -> double
{
    return dataset_->parameter(name);
}

auto FieldEvaluator::cell_centers(std::size_t axis) -> fields::FieldArray
{
    const auto &domain = dataset_->domain();
    const auto  width  = cell_width(domain, axis);
    auto        centers = fields::filled(domain.cell_count(), 0.0, axis_units(*dataset_, axis));
    for (std::size_t cell = 0; cell < centers.values.size(); ++cell)
    {
        centers.values[cell] =
            domain.left_edge[axis] + (static_cast<double>(grid_index(domain, cell, axis)) + 0.5) * width;
    }
    return centers;
}

auto FieldEvaluator::cell_widths(std::size_t axis) -> fields::FieldArray
{
    const auto &domain = dataset_->domain();
    return fields::filled(domain.cell_count(), cell_width(domain, axis), axis_units(*dataset_, axis));
}

auto FieldEvaluator::unit_catalog() const -> const units::UnitCatalog &
{
    return dataset_->unit_catalog();
}

} // namespace fwv::dataset

/**
 * @file field_detector.cpp
 * @brief recursive dry-run evaluation with cycle detection
 */
#include "fwv/fields/field_detector.hpp"

#include <algorithm>

#include "fwv/fields/errors.hpp"
#include "fwv/fields/field_registry.hpp"

namespace fwv::fields
{
namespace
{

/// pops the evaluation stack on every exit path
class StackFrame
{
public:
    StackFrame(std::vector<FieldKey> &stack, const FieldKey &key) : stack_{&stack} { stack_->push_back(key); }
    StackFrame(const StackFrame &)                     = delete;
    auto operator=(const StackFrame &) -> StackFrame & = delete;
    ~StackFrame() { stack_->pop_back(); }

private:
    std::vector<FieldKey> *stack_;
};

} // namespace

FieldDetector::FieldDetector(const FieldRegistry &registry) : registry_{&registry} {}

void FieldDetector::detect(const FieldDefinition &definition)
{
    static_cast<void>(evaluate(definition));
}

auto FieldDetector::get(const FieldKey &key) -> FieldArray
{
    if (const auto it = cache_.find(key); it != cache_.end())
    {
        return it->second;
    }

    const auto definition = registry_->find(key);
    FieldArray result{};
    if (registry_->is_on_disk(key))
    {
        requested_.insert(key);
        result = placeholder(definition.get());
    }
    else if (!definition)
    {
        throw FieldNotFound(key);
    }
    else
    {
        result = evaluate(*definition);
    }
    cache_.emplace(key, result);
    return result;
}

void FieldDetector::request(const FieldKey &key)
{
    requested_.insert(key);
}

auto FieldDetector::parameter(std::string_view name) -> double
{
    parameters_.emplace(name);
    return 1.0;
}

auto FieldDetector::cell_centers(std::size_t /*axis*/) -> FieldArray
{
    return filled(kPlaceholderLength, 1.0);
}

auto FieldDetector::cell_widths(std::size_t /*axis*/) -> FieldArray
{
    return filled(kPlaceholderLength, 1.0);
}

auto FieldDetector::unit_catalog() const -> const units::UnitCatalog &
{
    return registry_->unit_catalog();
}

auto FieldDetector::evaluate(const FieldDefinition &definition) -> FieldArray
{
    if (definition.is_passthrough())
    {
        requested_.insert(definition.key());
        return placeholder(&definition);
    }
    if (std::find(stack_.begin(), stack_.end(), definition.key()) != stack_.end())
    {
        throw CyclicFieldDependency(definition.key());
    }

    const StackFrame frame{stack_, definition.key()};
    definition.check_validators(*this);
    auto values = definition.compute(*this);
    return finalize_units(definition, std::move(values), unit_catalog());
}

auto FieldDetector::placeholder(const FieldDefinition *definition) -> FieldArray
{
    FieldArray array{};
    array.components = (definition != nullptr && definition->vector_field()) ? 3U : 1U;
    array.values.assign(kPlaceholderLength * array.components, 1.0);
    array.units = definition != nullptr ? definition->units() : std::string{};
    return array;
}

} // namespace fwv::fields

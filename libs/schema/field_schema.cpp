/**
 * @file field_schema.cpp
 * @brief TypeSchema field ordering and lookup
 */

#include "canonhash/field_schema.hpp"
#include "canonhash/schema_traits.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <format>

namespace canonhash {

FieldValue FieldValue::scalar(Scalar value)
{
    FieldValue result;
    result.m_value = std::move(value);
    return result;
}

FieldValue FieldValue::list(List items)
{
    FieldValue result;
    result.m_value = std::move(items);
    return result;
}

FieldValue FieldValue::object(ObjectRef ref)
{
    if (ref.is_absent()) {
        return absent();
    }
    FieldValue result;
    result.m_value = ref;
    return result;
}

FieldValue::Kind FieldValue::kind() const noexcept
{
    switch (m_value.index()) {
        case 1:
            return Kind::kScalar;
        case 2:
            return Kind::kList;
        case 3:
            return Kind::kObject;
        default:
            return Kind::kAbsent;
    }
}

TypeSchema::TypeSchema(std::string type_name,
                       std::vector<SchemaField> fields,
                       std::optional<BaseLink> base)
    : m_type_name(std::move(type_name))
    , m_fields(std::move(fields))
    , m_base(std::move(base))
{
    // Visiting order must not depend on declaration order beyond tie-breaking.
    std::ranges::stable_sort(m_fields, {}, [](const SchemaField& field) {
        return field.descriptor.order_key;
    });
}

std::vector<FieldDescriptor> TypeSchema::fields_of() const
{
    std::vector<FieldDescriptor> result;
    for (const TypeSchema* level = this; level != nullptr;
         level = level->base() ? level->base()->schema : nullptr) {
        for (const auto& field : level->m_fields) {
            result.push_back(field.descriptor);
        }
    }
    return result;
}

canonhash::Result<FieldValue> TypeSchema::read(const void* instance,
                                               const FieldDescriptor& descriptor) const
{
    const TypeSchema* level = this;
    while (level != nullptr) {
        auto it = std::ranges::find(level->m_fields, descriptor, &SchemaField::descriptor);
        if (it != level->m_fields.end()) {
            return it->read(instance);
        }
        const BaseLink* base = level->base();
        if (base == nullptr) {
            break;
        }
        instance = base->upcast(instance);
        level = base->schema;
    }
    return std::unexpected(Error::make(
        std::string(error_code::kFieldAccess),
        std::format("Type '{}' selects no field '{}'", m_type_name, descriptor.name)));
}

namespace detail {

double widen_float(float value)
{
    std::array<char, 64> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return static_cast<double>(value);
    }
    double widened = 0.0;
    auto parsed = std::from_chars(buffer.data(), end, widened);
    if (parsed.ec != std::errc{}) {
        // inf and nan
        return static_cast<double>(value);
    }
    return widened;
}

}  // namespace detail

}  // namespace canonhash

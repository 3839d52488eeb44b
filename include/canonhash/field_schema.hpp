#pragma once

/**
 * @file field_schema.hpp
 * @brief Runtime field schema: which fields of a type are hashed, and how to read them
 *
 * A TypeSchema is the per-type field selection consumed by the canonicalizer.
 * Own fields are kept stable-sorted by order key (ties keep declaration order);
 * an optional BaseLink chains to the ancestor type's schema, whose fields are
 * visited after the type's own fields.
 *
 * Statically described C++ types get their TypeSchema from schema_traits.hpp,
 * JSON documents get theirs from document_schema.hpp.
 */

#include "canonhash/canonical_node.hpp"
#include "canonhash/common.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace canonhash {

class TypeSchema;

/**
 * @brief Selected field: name plus order key
 */
struct FieldDescriptor
{
    std::string name;
    int order_key;

    bool operator==(const FieldDescriptor&) const = default;
};

/**
 * @brief Non-owning reference to an instance of a schema-described type
 *
 * A null instance is the absent value.
 */
struct ObjectRef
{
    const void* instance = nullptr;
    const TypeSchema* schema = nullptr;

    [[nodiscard]] bool is_absent() const noexcept { return instance == nullptr; }
};

/**
 * @brief Current value of a field as seen by the canonicalizer
 */
class FieldValue
{
public:
    using List = std::vector<FieldValue>;

    enum class Kind { kAbsent, kScalar, kList, kObject };

    FieldValue() = default;

    [[nodiscard]] static FieldValue absent() { return FieldValue{}; }
    [[nodiscard]] static FieldValue scalar(Scalar value);
    [[nodiscard]] static FieldValue list(List items);
    [[nodiscard]] static FieldValue object(ObjectRef ref);

    [[nodiscard]] Kind kind() const noexcept;

    [[nodiscard]] const Scalar& as_scalar() const { return std::get<Scalar>(m_value); }
    [[nodiscard]] const List& as_list() const { return std::get<List>(m_value); }
    [[nodiscard]] const ObjectRef& as_object() const { return std::get<ObjectRef>(m_value); }

    /**
     * @brief Keep a by-value source alive while this value is in use
     *
     * Object and list values produced from a temporary (a getter's return
     * value) point into that temporary; the owner handle extends its lifetime.
     */
    void retain(std::shared_ptr<const void> owner) { m_owner = std::move(owner); }

private:
    std::variant<std::monostate, Scalar, List, ObjectRef> m_value;
    std::shared_ptr<const void> m_owner;
};

/// Reads one field of an instance; errors surface as FieldAccessError
using FieldReader = std::function<canonhash::Result<FieldValue>(const void* instance)>;

/// Converts a pointer to a derived instance into a pointer to its ancestor subobject
using Upcast = std::function<const void*(const void* instance)>;

struct SchemaField
{
    FieldDescriptor descriptor;
    FieldReader read;
};

struct BaseLink
{
    const TypeSchema* schema;
    Upcast upcast;
};

class TypeSchema
{
public:
    TypeSchema(std::string type_name,
               std::vector<SchemaField> fields,
               std::optional<BaseLink> base = std::nullopt);

    [[nodiscard]] const std::string& type_name() const noexcept { return m_type_name; }

    /**
     * @brief The type's own fields in visiting order (no ancestors)
     */
    [[nodiscard]] const std::vector<SchemaField>& own_fields() const noexcept { return m_fields; }

    [[nodiscard]] const BaseLink* base() const noexcept
    {
        return m_base ? &*m_base : nullptr;
    }

    /**
     * @brief Full field selection: own fields, then each ancestor level
     */
    [[nodiscard]] std::vector<FieldDescriptor> fields_of() const;

    /**
     * @brief Read a selected field on an instance of this type
     *
     * The descriptor is resolved against this type first, then up the
     * ancestor chain.
     * @return FieldAccessError when the type selects no such field
     */
    [[nodiscard]] canonhash::Result<FieldValue> read(const void* instance,
                                                     const FieldDescriptor& descriptor) const;

private:
    std::string m_type_name;
    std::vector<SchemaField> m_fields;
    std::optional<BaseLink> m_base;
};

}  // namespace canonhash

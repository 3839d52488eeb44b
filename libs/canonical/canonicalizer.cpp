/**
 * @file canonicalizer.cpp
 * @brief Canonical tree construction
 */

#include "canonhash/canonicalizer.hpp"

#include <format>

namespace canonhash {

namespace {

[[nodiscard]] Error depth_error(std::size_t max_depth, const TypeSchema* schema)
{
    return Error::make(std::string(error_code::kDepthLimitExceeded),
                       std::format("Nesting deeper than {} levels while canonicalizing '{}' "
                                   "(cyclic value?)",
                                   max_depth,
                                   schema != nullptr ? schema->type_name() : "<list>"));
}

[[nodiscard]] Error field_access_error(const TypeSchema& schema,
                                       const FieldDescriptor& descriptor,
                                       const Error& cause)
{
    return Error::make(std::string(error_code::kFieldAccess),
                       std::format("Cannot read field '{}' of type '{}': {}",
                                   descriptor.name,
                                   schema.type_name(),
                                   cause.message));
}

}  // namespace

Canonicalizer::Canonicalizer(CanonicalizeOptions options)
    : m_options(options)
{}

canonhash::Result<CanonicalNode> Canonicalizer::canonicalize(ObjectRef value) const
{
    if (value.is_absent()) {
        return CanonicalNode(CanonicalMap{});
    }
    return canonicalize_object(value, 0);
}

canonhash::Result<CanonicalNode> Canonicalizer::canonicalize_object(ObjectRef value,
                                                                    std::size_t depth) const
{
    if (value.schema == nullptr) {
        return std::unexpected(Error::make(std::string(error_code::kInvalidArgument),
                                           "Object reference without a type schema"));
    }
    if (depth >= m_options.max_depth) {
        return std::unexpected(depth_error(m_options.max_depth, value.schema));
    }

    CanonicalMap map;
    const void* instance = value.instance;
    const TypeSchema* level = value.schema;
    while (level != nullptr) {
        for (const auto& field : level->own_fields()) {
            auto read = field.read(instance);
            if (!read) {
                return std::unexpected(field_access_error(*level, field.descriptor, read.error()));
            }
            if (read->kind() == FieldValue::Kind::kAbsent) {
                continue;
            }
            auto node = canonicalize_present(*read, depth + 1);
            if (!node) {
                return std::unexpected(node.error());
            }
            put_field(map, field.descriptor.name, std::move(*node));
        }

        const BaseLink* base = level->base();
        if (base == nullptr) {
            break;
        }
        instance = base->upcast(instance);
        level = base->schema;
    }
    return CanonicalNode(std::move(map));
}

canonhash::Result<CanonicalNode> Canonicalizer::canonicalize_present(const FieldValue& value,
                                                                     std::size_t depth) const
{
    switch (value.kind()) {
        case FieldValue::Kind::kScalar:
            return CanonicalNode(value.as_scalar());
        case FieldValue::Kind::kObject:
            return canonicalize_object(value.as_object(), depth);
        case FieldValue::Kind::kList: {
            if (depth >= m_options.max_depth) {
                return std::unexpected(depth_error(m_options.max_depth, nullptr));
            }
            CanonicalList items;
            items.reserve(value.as_list().size());
            for (const auto& item : value.as_list()) {
                if (item.kind() == FieldValue::Kind::kAbsent) {
                    continue;
                }
                auto node = canonicalize_present(item, depth + 1);
                if (!node) {
                    return std::unexpected(node.error());
                }
                items.push_back(std::move(*node));
            }
            return CanonicalNode(std::move(items));
        }
        case FieldValue::Kind::kAbsent:
            break;
    }
    return CanonicalNode{};
}

}  // namespace canonhash

/**
 * @file canonical_node.cpp
 * @brief Canonical tree node accessors and structural equality
 */

#include "canonhash/canonical_node.hpp"

#include <algorithm>
#include <limits>

namespace canonhash {

Scalar Scalar::unsigned_integer(std::uint64_t v)
{
    if (v <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return Scalar{.value = static_cast<std::int64_t>(v)};
    }
    return Scalar{.value = v};
}

CanonicalNode::CanonicalNode()
    : m_value(CanonicalNull{})
{}

CanonicalNode::CanonicalNode(Scalar scalar)
    : m_value(std::move(scalar))
{}

CanonicalNode::CanonicalNode(CanonicalMap map)
    : m_value(std::move(map))
{}

CanonicalNode::CanonicalNode(CanonicalList list)
    : m_value(std::move(list))
{}

bool CanonicalNode::is_null() const noexcept
{
    return std::holds_alternative<CanonicalNull>(m_value);
}

bool CanonicalNode::is_scalar() const noexcept
{
    return std::holds_alternative<Scalar>(m_value);
}

bool CanonicalNode::is_map() const noexcept
{
    return std::holds_alternative<CanonicalMap>(m_value);
}

bool CanonicalNode::is_list() const noexcept
{
    return std::holds_alternative<CanonicalList>(m_value);
}

const Scalar& CanonicalNode::as_scalar() const
{
    return std::get<Scalar>(m_value);
}

const CanonicalMap& CanonicalNode::as_map() const
{
    return std::get<CanonicalMap>(m_value);
}

const CanonicalList& CanonicalNode::as_list() const
{
    return std::get<CanonicalList>(m_value);
}

const CanonicalNode* CanonicalNode::find(std::string_view name) const
{
    const auto* map = std::get_if<CanonicalMap>(&m_value);
    if (map == nullptr) {
        return nullptr;
    }
    auto it = std::ranges::find(*map, name, &CanonicalField::name);
    return it == map->end() ? nullptr : &it->node;
}

bool operator==(const CanonicalNode& lhs, const CanonicalNode& rhs)
{
    return lhs.m_value == rhs.m_value;
}

bool operator==(const CanonicalField& lhs, const CanonicalField& rhs)
{
    return lhs.name == rhs.name && lhs.node == rhs.node;
}

void put_field(CanonicalMap& map, std::string name, CanonicalNode node)
{
    auto it = std::ranges::find(map, name, &CanonicalField::name);
    if (it != map.end()) {
        it->node = std::move(node);
        return;
    }
    map.push_back(CanonicalField{.name = std::move(name), .node = std::move(node)});
}

}  // namespace canonhash

#pragma once

/**
 * @file canonical_node.hpp
 * @brief Canonical intermediate representation of a hashed value
 *
 * A canonical tree is a closed tagged union:
 * - Null: only for exhaustive matching, never produced by the canonicalizer
 * - Scalar: text, boolean, integer, floating point or timestamp
 * - Map: ordered (name, node) entries, insertion order = field selection order
 * - List: ordered nodes, source iteration order
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace canonhash {

/// Date/time scalar, millisecond precision since the Unix epoch
using Timestamp = std::chrono::sys_time<std::chrono::milliseconds>;

/**
 * @brief Leaf value of a canonical tree
 *
 * Integers that fit in int64 are always stored signed; uint64 is used only
 * above INT64_MAX, so equal numbers from different source widths compare equal.
 */
struct Scalar
{
    using Value = std::variant<std::string, bool, std::int64_t, std::uint64_t, double, Timestamp>;

    Value value;

    [[nodiscard]] static Scalar text(std::string v) { return Scalar{.value = std::move(v)}; }
    [[nodiscard]] static Scalar boolean(bool v) { return Scalar{.value = v}; }
    [[nodiscard]] static Scalar integer(std::int64_t v) { return Scalar{.value = v}; }
    [[nodiscard]] static Scalar unsigned_integer(std::uint64_t v);
    [[nodiscard]] static Scalar number(double v) { return Scalar{.value = v}; }
    [[nodiscard]] static Scalar timestamp(Timestamp v) { return Scalar{.value = v}; }

    bool operator==(const Scalar&) const = default;
};

struct CanonicalNull
{
    bool operator==(const CanonicalNull&) const = default;
};

struct CanonicalField;
class CanonicalNode;

using CanonicalMap = std::vector<CanonicalField>;
using CanonicalList = std::vector<CanonicalNode>;

class CanonicalNode
{
public:
    using Value = std::variant<CanonicalNull, Scalar, CanonicalMap, CanonicalList>;

    CanonicalNode();
    CanonicalNode(Scalar scalar);        // NOLINT(google-explicit-constructor)
    CanonicalNode(CanonicalMap map);     // NOLINT(google-explicit-constructor)
    CanonicalNode(CanonicalList list);   // NOLINT(google-explicit-constructor)

    [[nodiscard]] bool is_null() const noexcept;
    [[nodiscard]] bool is_scalar() const noexcept;
    [[nodiscard]] bool is_map() const noexcept;
    [[nodiscard]] bool is_list() const noexcept;

    [[nodiscard]] const Scalar& as_scalar() const;
    [[nodiscard]] const CanonicalMap& as_map() const;
    [[nodiscard]] const CanonicalList& as_list() const;

    /**
     * @brief Look up a map entry by name
     * @return Entry node or nullptr when this is not a map or the name is absent
     */
    [[nodiscard]] const CanonicalNode* find(std::string_view name) const;

    [[nodiscard]] const Value& value() const noexcept { return m_value; }

    friend bool operator==(const CanonicalNode& lhs, const CanonicalNode& rhs);

private:
    Value m_value;
};

struct CanonicalField
{
    std::string name;
    CanonicalNode node;

    friend bool operator==(const CanonicalField& lhs, const CanonicalField& rhs);
};

/**
 * @brief Insert or replace a map entry
 *
 * A name that is already present keeps its position and takes the new node.
 */
void put_field(CanonicalMap& map, std::string name, CanonicalNode node);

}  // namespace canonhash

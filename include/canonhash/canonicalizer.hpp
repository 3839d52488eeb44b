#pragma once

/**
 * @file canonicalizer.hpp
 * @brief Flatten a schema-described value into its canonical tree
 *
 * Rules:
 * - Absent root yields an empty map
 * - Fields are visited in selection order: own fields by order key, then each
 *   ancestor level by its own order keys
 * - Absent field values are omitted, never emitted as null
 * - Collections become lists in iteration order; absent elements are skipped
 * - Scalars are stored as-is; complex values recurse into nested maps
 */

#include "canonhash/canonical_node.hpp"
#include "canonhash/common.hpp"
#include "canonhash/field_schema.hpp"
#include "canonhash/schema_traits.hpp"

#include <cstddef>

namespace canonhash {

/// Nesting depth beyond which canonicalization fails with DepthLimitExceeded
inline constexpr std::size_t kDefaultMaxDepth = 256;

struct CanonicalizeOptions
{
    std::size_t max_depth = kDefaultMaxDepth;
};

class Canonicalizer
{
public:
    explicit Canonicalizer(CanonicalizeOptions options = {});

    /**
     * @brief Build the canonical tree of a value
     * @return Map node, FieldAccessError, DepthLimitExceeded, or InvalidArgument
     *         for a present instance without a schema
     */
    [[nodiscard]] canonhash::Result<CanonicalNode> canonicalize(ObjectRef value) const;

    [[nodiscard]] const CanonicalizeOptions& options() const noexcept { return m_options; }

private:
    [[nodiscard]] canonhash::Result<CanonicalNode> canonicalize_object(ObjectRef value,
                                                                       std::size_t depth) const;
    [[nodiscard]] canonhash::Result<CanonicalNode> canonicalize_present(const FieldValue& value,
                                                                        std::size_t depth) const;

    CanonicalizeOptions m_options;
};

template <Hashable T>
[[nodiscard]] canonhash::Result<CanonicalNode> canonicalize(const T& value,
                                                            CanonicalizeOptions options = {})
{
    return Canonicalizer(options).canonicalize(make_ref(value));
}

template <Hashable T>
[[nodiscard]] canonhash::Result<CanonicalNode> canonicalize(const T* value,
                                                            CanonicalizeOptions options = {})
{
    return Canonicalizer(options).canonicalize(make_ref(value));
}

}  // namespace canonhash

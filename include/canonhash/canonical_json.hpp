#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON encoding of canonical trees
 *
 * Rules:
 * - UTF-8 encoding, invalid sequences rejected
 * - Object keys in map insertion order (field selection order), never re-sorted
 * - Array elements in list order
 * - No whitespace (minimal representation)
 * - Integers as JSON integers, doubles in shortest round-trip form
 * - Timestamps as integer milliseconds since the Unix epoch
 * - NaN and infinities rejected with EncodingError
 */

#include "canonhash/canonical_node.hpp"
#include "canonhash/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace canonhash::canonical {

/**
 * @brief Deterministic byte serializer for canonical trees
 *
 * Implementations must preserve map key order and list element order exactly.
 */
class CanonicalEncoder
{
public:
    virtual ~CanonicalEncoder() = default;

    [[nodiscard]] virtual canonhash::Result<std::string> encode(const CanonicalNode& node) const = 0;
};

class JsonCanonicalEncoder final : public CanonicalEncoder
{
public:
    [[nodiscard]] canonhash::Result<std::string> encode(const CanonicalNode& node) const override;
};

/**
 * Convert a canonical tree to an insertion-ordered JSON value
 * @param node Canonical tree
 * @return Ordered JSON or EncodingError for non-finite numbers
 */
[[nodiscard]] canonhash::Result<nlohmann::ordered_json> to_json(const CanonicalNode& node);

/**
 * Serialize a canonical tree to canonical JSON text
 * @param node Canonical tree
 * @return Canonical byte string or EncodingError
 */
[[nodiscard]] canonhash::Result<std::string> encode_json(const CanonicalNode& node);

/**
 * Validate a canonical tree for JSON encoding
 * - No NaN or infinite numbers
 * @param node Canonical tree
 * @return Empty on success, EncodingError naming the offending path
 */
[[nodiscard]] canonhash::VoidResult validate_for_canonical(const CanonicalNode& node);

}  // namespace canonhash::canonical

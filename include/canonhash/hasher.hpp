#pragma once

/**
 * @file hasher.hpp
 * @brief Hash pipeline: canonicalize, encode, digest, Base64
 *
 * hash(value, algorithm):
 * 1. resolve the algorithm (UnsupportedAlgorithm, before any other work)
 * 2. canonicalize the value (FieldAccessError, DepthLimitExceeded)
 * 3. encode the canonical tree (EncodingError)
 * 4. digest the encoded bytes
 * 5. Base64-encode the digest (standard alphabet, padded)
 *
 * Equal canonical trees always produce equal hashes for the same algorithm.
 */

#include "canonhash/canonical_json.hpp"
#include "canonhash/canonical_node.hpp"
#include "canonhash/canonicalizer.hpp"
#include "canonhash/common.hpp"
#include "canonhash/digest.hpp"
#include "canonhash/field_schema.hpp"
#include "canonhash/schema_traits.hpp"

#include <set>
#include <string>
#include <string_view>

namespace canonhash {

using digest::kDefaultAlgorithm;

/**
 * @brief Stateless hashing service
 *
 * Holds non-owning references to a digest registry and an encoder; both must
 * outlive the Hasher. Safe to share across threads.
 */
class Hasher
{
public:
    /// Default registry, canonical JSON encoder, default canonicalize options
    Hasher();

    Hasher(const digest::DigestRegistry& registry,
           const canonical::CanonicalEncoder& encoder,
           CanonicalizeOptions options = {});

    [[nodiscard]] canonhash::Result<std::string> hash(ObjectRef value,
                                                      std::string_view algorithm) const;

    [[nodiscard]] canonhash::Result<std::string> hash(ObjectRef value) const;

    /**
     * @brief Hash an already built canonical tree
     */
    [[nodiscard]] canonhash::Result<std::string> hash_tree(const CanonicalNode& tree,
                                                           std::string_view algorithm) const;

    /**
     * @brief Raw digest bytes of a value (steps 1-4 of the pipeline)
     */
    [[nodiscard]] canonhash::Result<Bytes> digest(ObjectRef value, std::string_view algorithm) const;

    [[nodiscard]] std::set<std::string> supported_algorithms() const;

private:
    [[nodiscard]] canonhash::Result<Bytes> digest_tree(const CanonicalNode& tree,
                                                       const digest::DigestFunction& function) const;

    const digest::DigestRegistry* m_registry;
    const canonical::CanonicalEncoder* m_encoder;
    Canonicalizer m_canonicalizer;
};

/**
 * @brief Algorithms usable with hash(); never empty, fixed for the process lifetime
 */
[[nodiscard]] std::set<std::string> supported_algorithms();

[[nodiscard]] canonhash::Result<std::string> hash_tree(const CanonicalNode& tree,
                                                       std::string_view algorithm = kDefaultAlgorithm);

template <Hashable T>
[[nodiscard]] canonhash::Result<std::string> hash(const T& value, std::string_view algorithm)
{
    return Hasher().hash(make_ref(value), algorithm);
}

template <Hashable T>
[[nodiscard]] canonhash::Result<std::string> hash(const T& value)
{
    return Hasher().hash(make_ref(value));
}

/// A null pointer hashes as the absent root (empty map)
template <Hashable T>
[[nodiscard]] canonhash::Result<std::string> hash(const T* value, std::string_view algorithm)
{
    return Hasher().hash(make_ref(value), algorithm);
}

template <Hashable T>
[[nodiscard]] canonhash::Result<std::string> hash(const T* value)
{
    return Hasher().hash(make_ref(value));
}

}  // namespace canonhash

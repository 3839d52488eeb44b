/**
 * @file hasher.cpp
 * @brief Hash pipeline orchestration
 */

#include "canonhash/hasher.hpp"

namespace canonhash {

namespace {

[[nodiscard]] const canonical::CanonicalEncoder& default_encoder()
{
    static const canonical::JsonCanonicalEncoder encoder{};
    return encoder;
}

}  // namespace

Hasher::Hasher()
    : Hasher(digest::default_registry(), default_encoder())
{}

Hasher::Hasher(const digest::DigestRegistry& registry,
               const canonical::CanonicalEncoder& encoder,
               CanonicalizeOptions options)
    : m_registry(&registry)
    , m_encoder(&encoder)
    , m_canonicalizer(options)
{}

canonhash::Result<std::string> Hasher::hash(ObjectRef value, std::string_view algorithm) const
{
    auto bytes = digest(value, algorithm);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return common::base64_encode(*bytes);
}

canonhash::Result<std::string> Hasher::hash(ObjectRef value) const
{
    return hash(value, kDefaultAlgorithm);
}

canonhash::Result<std::string> Hasher::hash_tree(const CanonicalNode& tree,
                                                 std::string_view algorithm) const
{
    auto function = m_registry->find(algorithm);
    if (!function) {
        return std::unexpected(function.error());
    }
    auto bytes = digest_tree(tree, **function);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return common::base64_encode(*bytes);
}

canonhash::Result<Bytes> Hasher::digest(ObjectRef value, std::string_view algorithm) const
{
    // Unknown algorithms fail before any canonicalization
    auto function = m_registry->find(algorithm);
    if (!function) {
        return std::unexpected(function.error());
    }

    auto tree = m_canonicalizer.canonicalize(value);
    if (!tree) {
        return std::unexpected(tree.error());
    }
    return digest_tree(*tree, **function);
}

std::set<std::string> Hasher::supported_algorithms() const
{
    return m_registry->algorithms();
}

canonhash::Result<Bytes> Hasher::digest_tree(const CanonicalNode& tree,
                                             const digest::DigestFunction& function) const
{
    auto encoded = m_encoder->encode(tree);
    if (!encoded) {
        return std::unexpected(encoded.error());
    }
    return function.digest(common::as_bytes(*encoded));
}

std::set<std::string> supported_algorithms()
{
    return digest::default_registry().algorithms();
}

canonhash::Result<std::string> hash_tree(const CanonicalNode& tree, std::string_view algorithm)
{
    return Hasher().hash_tree(tree, algorithm);
}

}  // namespace canonhash

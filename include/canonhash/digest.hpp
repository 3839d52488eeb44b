#pragma once

/**
 * @file digest.hpp
 * @brief Digest functions and the algorithm registry
 *
 * The default registry is built once and never changes:
 * - "SHA-256" (built-in implementation)
 * - "SHA-1", "SHA-384", "SHA-512", "MD5" (OpenSSL EVP)
 *
 * Identifiers are matched ASCII case-insensitively.
 */

#include "canonhash/common.hpp"

#include <memory>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace canonhash::digest {

/// Algorithm used when the caller names none
inline constexpr std::string_view kDefaultAlgorithm = "SHA-256";

class DigestFunction
{
public:
    virtual ~DigestFunction() = default;

    /// Registry identifier, e.g. "SHA-256"
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    /// Digest length in bytes
    [[nodiscard]] virtual std::size_t digest_size() const noexcept = 0;

    [[nodiscard]] virtual canonhash::Result<Bytes> digest(std::span<const std::uint8_t> data) const = 0;
};

/// Built-in SHA-256, see common::sha256_digest
[[nodiscard]] std::unique_ptr<DigestFunction> make_sha256();

/**
 * @brief OpenSSL EVP digest
 * @param name Registry identifier
 * @param evp_name OpenSSL digest name, e.g. "SHA512"
 * @return Digest function, or UnsupportedAlgorithm when no loaded provider implements it
 */
[[nodiscard]] canonhash::Result<std::unique_ptr<DigestFunction>> make_openssl_digest(
    std::string name, std::string evp_name);

class DigestRegistry
{
public:
    DigestRegistry() = default;

    DigestRegistry(const DigestRegistry&) = delete;
    DigestRegistry& operator=(const DigestRegistry&) = delete;
    DigestRegistry(DigestRegistry&&) noexcept = default;
    DigestRegistry& operator=(DigestRegistry&&) noexcept = default;

    /**
     * @brief Register a digest function
     * @return DuplicateAlgorithm when the identifier is taken
     */
    [[nodiscard]] canonhash::VoidResult add(std::unique_ptr<DigestFunction> function);

    /**
     * @brief Resolve an algorithm identifier
     * @return Digest function or UnsupportedAlgorithm
     */
    [[nodiscard]] canonhash::Result<const DigestFunction*> find(std::string_view algorithm) const;

    [[nodiscard]] bool contains(std::string_view algorithm) const;

    [[nodiscard]] std::set<std::string> algorithms() const;

private:
    std::vector<std::unique_ptr<DigestFunction>> m_functions;
};

/**
 * @brief Process-wide immutable registry
 */
[[nodiscard]] const DigestRegistry& default_registry();

}  // namespace canonhash::digest

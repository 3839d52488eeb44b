/**
 * @file digest_registry.cpp
 * @brief Digest function registry
 */

#include "canonhash/digest.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <stdexcept>
#include <utility>

namespace canonhash::digest {

namespace {

class Sha256Digest final : public DigestFunction
{
public:
    [[nodiscard]] std::string_view name() const noexcept override { return "SHA-256"; }

    [[nodiscard]] std::size_t digest_size() const noexcept override
    {
        return common::kSha256DigestSize;
    }

    [[nodiscard]] canonhash::Result<Bytes> digest(std::span<const std::uint8_t> data) const override
    {
        auto hash = common::sha256_digest(data);
        return Bytes(hash.begin(), hash.end());
    }
};

struct OpenSslAlgorithm
{
    std::string_view name;
    std::string_view evp_name;
};

constexpr std::array<OpenSslAlgorithm, 4> kOpenSslAlgorithms = {{
    {    "SHA-1",   "SHA1"},
    {  "SHA-384", "SHA384"},
    {  "SHA-512", "SHA512"},
    {      "MD5",    "MD5"},
}};

[[nodiscard]] DigestRegistry build_default_registry()
{
    DigestRegistry registry;
    if (auto added = registry.add(make_sha256()); !added) {
        throw std::logic_error(added.error().message);
    }
    for (const auto& algorithm : kOpenSslAlgorithms) {
        auto function =
            make_openssl_digest(std::string(algorithm.name), std::string(algorithm.evp_name));
        if (!function) {
            // No provider implements it (e.g. MD5 under a FIPS-only configuration)
            continue;
        }
        if (auto added = registry.add(std::move(*function)); !added) {
            throw std::logic_error(added.error().message);
        }
    }
    return registry;
}

}  // namespace

std::unique_ptr<DigestFunction> make_sha256()
{
    return std::make_unique<Sha256Digest>();
}

canonhash::VoidResult DigestRegistry::add(std::unique_ptr<DigestFunction> function)
{
    if (function == nullptr) {
        return std::unexpected(
            Error::make(std::string(error_code::kInvalidArgument), "Null digest function"));
    }
    if (contains(function->name())) {
        return std::unexpected(
            Error::make(std::string(error_code::kDuplicateAlgorithm),
                        std::format("Digest algorithm already registered: {}", function->name())));
    }
    m_functions.push_back(std::move(function));
    return {};
}

canonhash::Result<const DigestFunction*> DigestRegistry::find(std::string_view algorithm) const
{
    auto it = std::ranges::find_if(m_functions, [algorithm](const auto& function) {
        return common::iequals(function->name(), algorithm);
    });
    if (it == m_functions.end()) {
        return std::unexpected(
            Error::make(std::string(error_code::kUnsupportedAlgorithm),
                        std::format("Unsupported digest algorithm: {}", algorithm)));
    }
    return it->get();
}

bool DigestRegistry::contains(std::string_view algorithm) const
{
    return find(algorithm).has_value();
}

std::set<std::string> DigestRegistry::algorithms() const
{
    std::set<std::string> names;
    for (const auto& function : m_functions) {
        names.emplace(function->name());
    }
    return names;
}

const DigestRegistry& default_registry()
{
    static const DigestRegistry registry = build_default_registry();
    return registry;
}

}  // namespace canonhash::digest

/**
 * @file openssl_digest.cpp
 * @brief Digest functions backed by OpenSSL EVP
 */

#include "canonhash/digest.hpp"

#include <format>
#include <memory>

#include <openssl/evp.h>

namespace canonhash::digest {

namespace {

struct MdContextDeleter
{
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdContext = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

struct MdDeleter
{
    void operator()(EVP_MD* md) const noexcept { EVP_MD_free(md); }
};

/// Fetched implementation from the default library context
using FetchedMd = std::unique_ptr<EVP_MD, MdDeleter>;

class OpenSslDigest final : public DigestFunction
{
public:
    OpenSslDigest(std::string name, FetchedMd md)
        : m_name(std::move(name))
        , m_md(std::move(md))
    {}

    [[nodiscard]] std::string_view name() const noexcept override { return m_name; }

    [[nodiscard]] std::size_t digest_size() const noexcept override
    {
        return static_cast<std::size_t>(EVP_MD_get_size(m_md.get()));
    }

    [[nodiscard]] canonhash::Result<Bytes> digest(std::span<const std::uint8_t> data) const override
    {
        MdContext ctx(EVP_MD_CTX_new());
        if (!ctx) {
            return std::unexpected(failure("EVP_MD_CTX_new"));
        }
        if (EVP_DigestInit_ex2(ctx.get(), m_md.get(), nullptr) != 1) {
            return std::unexpected(failure("EVP_DigestInit_ex2"));
        }
        if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
            return std::unexpected(failure("EVP_DigestUpdate"));
        }

        Bytes out(static_cast<std::size_t>(EVP_MAX_MD_SIZE));
        unsigned int out_len = 0;
        if (EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
            return std::unexpected(failure("EVP_DigestFinal_ex"));
        }
        out.resize(out_len);
        return out;
    }

private:
    [[nodiscard]] Error failure(std::string_view step) const
    {
        return Error::make(std::string(error_code::kDigestFailure),
                           std::format("{} failed for {}", step, m_name));
    }

    std::string m_name;
    FetchedMd m_md;
};

}  // namespace

canonhash::Result<std::unique_ptr<DigestFunction>> make_openssl_digest(std::string name,
                                                                       std::string evp_name)
{
    // Fails unless a loaded provider implements the digest
    FetchedMd md(EVP_MD_fetch(nullptr, evp_name.c_str(), nullptr));
    if (!md) {
        return std::unexpected(
            Error::make(std::string(error_code::kUnsupportedAlgorithm),
                        std::format("No OpenSSL provider implements digest {}", evp_name)));
    }
    return std::make_unique<OpenSslDigest>(std::move(name), std::move(md));
}

}  // namespace canonhash::digest

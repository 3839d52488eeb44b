/**
 * @file encoding.cpp
 * @brief Hex and Base64 text encodings for digest output
 */

#include "canonhash/common.hpp"

#include <cctype>
#include <format>

#include <openssl/evp.h>

namespace canonhash::common {

namespace {

[[nodiscard]] Error malformed_base64(std::string message)
{
    return Error::make(std::string(error_code::kInvalidArgument), std::move(message));
}

}  // namespace

std::string to_hex(std::span<const std::uint8_t> bytes)
{
    std::string result;
    result.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        result += std::format("{:02x}", b);
    }
    return result;
}

std::string base64_encode(std::span<const std::uint8_t> bytes)
{
    if (bytes.empty()) {
        return {};
    }
    // EVP_EncodeBlock writes 4 characters per started 3-byte group plus a NUL
    std::string out(((bytes.size() + 2) / 3) * 4 + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        bytes.data(),
                                        static_cast<int>(bytes.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

canonhash::Result<Bytes> base64_decode(std::string_view text)
{
    if (text.size() % 4 != 0) {
        return std::unexpected(malformed_base64(
            std::format("Base64 text length must be a multiple of 4, got {}", text.size())));
    }
    if (text.empty()) {
        return Bytes{};
    }

    Bytes out((text.size() / 4) * 3);
    const int decoded = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (decoded < 0) {
        return std::unexpected(malformed_base64("Invalid Base64 text"));
    }

    // EVP_DecodeBlock keeps the zero bytes standing in for '=' padding
    std::size_t padding = 0;
    if (text.ends_with("==")) {
        padding = 2;
    } else if (text.ends_with('=')) {
        padding = 1;
    }
    if (static_cast<std::size_t>(decoded) < padding) {
        return std::unexpected(malformed_base64("Invalid Base64 padding"));
    }
    out.resize(static_cast<std::size_t>(decoded) - padding);

    // Only the canonical spelling is accepted (no whitespace, stray padding or trailing bits)
    if (base64_encode(out) != text) {
        return std::unexpected(malformed_base64("Base64 text is not in canonical padded form"));
    }
    return out;
}

bool iequals(std::string_view a, std::string_view b) noexcept
{
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i]))
            != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace canonhash::common

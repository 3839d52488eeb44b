#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, result aliases, digest and text encodings
 */

#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace canonhash {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }

    [[nodiscard]] bool is(std::string_view expected_code) const noexcept
    {
        return code == expected_code;
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/// Raw byte buffer (encoder output, digest output)
using Bytes = std::vector<std::uint8_t>;

/**
 * Error codes carried in Error::code.
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */
namespace error_code {

inline constexpr std::string_view kUnsupportedAlgorithm = "UnsupportedAlgorithm";
inline constexpr std::string_view kFieldAccess = "FieldAccessError";
inline constexpr std::string_view kEncoding = "EncodingError";
inline constexpr std::string_view kDepthLimitExceeded = "DepthLimitExceeded";
inline constexpr std::string_view kDigestFailure = "DigestFailure";
inline constexpr std::string_view kDuplicateAlgorithm = "DuplicateAlgorithm";
inline constexpr std::string_view kSchemaError = "SchemaError";
inline constexpr std::string_view kUnknownType = "UnknownType";
inline constexpr std::string_view kSchemaValidationFailed = "SchemaValidationFailed";
inline constexpr std::string_view kIOError = "IOError";
inline constexpr std::string_view kParseError = "ParseError";
inline constexpr std::string_view kInvalidArgument = "InvalidArgument";
inline constexpr std::string_view kMissingArgument = "MissingArgument";

}  // namespace error_code

}  // namespace canonhash

namespace canonhash::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

inline constexpr std::size_t kSha256DigestSize = 32;

/**
 * Compute the raw SHA-256 digest of data
 * @param data Input bytes
 * @return 32 digest bytes
 */
[[nodiscard]] std::array<std::uint8_t, kSha256DigestSize> sha256_digest(
    std::span<const std::uint8_t> data);

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

// ============================================================================
// Text encodings
// ============================================================================

/**
 * Lowercase hex encoding
 */
[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes);

/**
 * Base64 encoding (RFC 4648 standard alphabet, '=' padding, no line breaks)
 */
[[nodiscard]] std::string base64_encode(std::span<const std::uint8_t> bytes);

/**
 * Base64 decoding of padded standard-alphabet text
 * @return Decoded bytes or InvalidArgument on malformed input
 */
[[nodiscard]] canonhash::Result<Bytes> base64_decode(std::string_view text);

/**
 * View a string's bytes without copying
 */
[[nodiscard]] inline std::span<const std::uint8_t> as_bytes(std::string_view text) noexcept
{
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

/**
 * ASCII case-insensitive comparison (algorithm identifiers)
 */
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

}  // namespace canonhash::common

#pragma once

/**
 * @file version.hpp
 * @brief canonhash version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace canonhash {

/// canonhash version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Canonical encoding version; hashes are comparable only within one encoding
constexpr const char* kEncodingVersion = "canonical-json.v1";

}  // namespace canonhash

#pragma once

/**
 * @file config.hpp
 * @brief CLI configuration file (canonhash_config.v1)
 *
 * @code
 * {"schema_version": "canonhash_config.v1", "default_algorithm": "SHA-512", "max_depth": 64}
 * @endcode
 *
 * Both settings are optional; omitted settings keep their library defaults.
 */

#include "canonhash/canonicalizer.hpp"
#include "canonhash/common.hpp"
#include "canonhash/digest.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace canonhash::config {

inline constexpr std::string_view kConfigSchemaVersion = "canonhash_config.v1";

struct Config
{
    std::string default_algorithm = std::string(digest::kDefaultAlgorithm);
    std::size_t max_depth = kDefaultMaxDepth;
};

/**
 * @brief Read settings from a parsed config document
 * @return Config, InvalidArgument for malformed settings, or
 *         UnsupportedAlgorithm when @p registry lacks default_algorithm
 */
[[nodiscard]] canonhash::Result<Config> parse_config(
    const nlohmann::json& j,
    const digest::DigestRegistry& registry = digest::default_registry());

/**
 * @brief Load a config file validated against <schema_dir>/config.v1.schema.json
 */
[[nodiscard]] canonhash::Result<Config> load_config(
    const std::filesystem::path& path,
    const std::string& schema_dir,
    const digest::DigestRegistry& registry = digest::default_registry());

}  // namespace canonhash::config

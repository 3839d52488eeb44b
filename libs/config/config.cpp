/**
 * @file config.cpp
 * @brief CLI configuration loading
 */

#include "canonhash/config.hpp"

#include "canonhash/schema_validate.hpp"

#include <cstdint>
#include <format>
#include <fstream>

namespace canonhash::config {

namespace {

[[nodiscard]] Error invalid_config(std::string message)
{
    return Error::make(std::string(error_code::kInvalidArgument), std::move(message));
}

}  // namespace

canonhash::Result<Config> parse_config(const nlohmann::json& j,
                                       const digest::DigestRegistry& registry)
{
    if (!j.is_object()) {
        return std::unexpected(invalid_config("Config must be a JSON object"));
    }

    Config config;
    try {
        if (auto it = j.find("schema_version");
            it != j.end() && it->get<std::string>() != kConfigSchemaVersion) {
            return std::unexpected(invalid_config(
                std::format("Unsupported config schema_version: {}", it->get<std::string>())));
        }
        if (auto it = j.find("default_algorithm"); it != j.end()) {
            config.default_algorithm = it->get<std::string>();
        }
        if (auto it = j.find("max_depth"); it != j.end()) {
            if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
                return std::unexpected(
                    invalid_config(std::format("max_depth must be a positive integer, got {}",
                                               it->dump())));
            }
            config.max_depth = static_cast<std::size_t>(it->get<std::int64_t>());
        }
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(invalid_config(std::format("Malformed config: {}", ex.what())));
    }

    if (auto function = registry.find(config.default_algorithm); !function) {
        return std::unexpected(function.error());
    }
    return config;
}

canonhash::Result<Config> load_config(const std::filesystem::path& path,
                                      const std::string& schema_dir,
                                      const digest::DigestRegistry& registry)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make(std::string(error_code::kIOError),
                                           "Failed to open config file: " + path.string()));
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make(std::string(error_code::kParseError),
                        std::format("Failed to parse config file {}: {}", path.string(), ex.what())));
    }

    const auto schema_path = (std::filesystem::path(schema_dir) / "config.v1.schema.json").string();
    if (auto result = common::validate_json(j, schema_path); !result) {
        return std::unexpected(result.error());
    }
    return parse_config(j, registry);
}

}  // namespace canonhash::config

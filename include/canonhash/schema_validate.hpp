#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "canonhash/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace canonhash::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] canonhash::VoidResult validate_json(const nlohmann::json& j,
                                                  const std::string& schema_path);

/**
 * Validate JSON against an in-memory JSON Schema.
 */
[[nodiscard]] canonhash::VoidResult validate_json_with_schema(const nlohmann::json& j,
                                                              nlohmann::json schema);

}  // namespace canonhash::common

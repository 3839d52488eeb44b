/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "canonhash/schema_validate.hpp"

#include <format>
#include <fstream>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace canonhash::common {

namespace {

// valijson resolves "#/definitions/..." only; schemas here use "$defs".
void normalize_schema_defs(nlohmann::json& schema)
{
    if (schema.is_object()) {
        if (schema.contains("$defs") && !schema.contains("definitions")) {
            schema["definitions"] = schema["$defs"];
        }
        for (auto& [key, value] : schema.items()) {
            if (key == "$ref" && value.is_string()) {
                constexpr std::string_view kPrefix = "#/$defs/";
                const auto ref = value.get<std::string>();
                if (ref.starts_with(kPrefix)) {
                    value = "#/definitions/" + ref.substr(kPrefix.size());
                }
                continue;
            }
            normalize_schema_defs(value);
        }
        return;
    }
    if (schema.is_array()) {
        for (auto& value : schema) {
            normalize_schema_defs(value);
        }
    }
}

std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string result;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (context.empty()) {
            context = "/";
        }

        if (!result.empty()) {
            result += '\n';
        }
        result += std::format("{}: {}", context, error.description);
    }

    return result;
}

}  // namespace

canonhash::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    std::ifstream schema_stream(schema_path);
    if (!schema_stream) {
        return std::unexpected(Error::make(std::string(error_code::kIOError),
                                           "Failed to open schema file: " + schema_path));
    }

    nlohmann::json schema_json;
    try {
        schema_stream >> schema_json;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make(std::string(error_code::kParseError),
                        std::format("Failed to parse schema JSON {}: {}", schema_path, ex.what())));
    }

    return validate_json_with_schema(j, std::move(schema_json));
}

canonhash::VoidResult validate_json_with_schema(const nlohmann::json& j, nlohmann::json schema)
{
    normalize_schema_defs(schema);

    valijson::Schema parsed_schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(schema);
        parser.populateSchema(schema_adapter, parsed_schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make(std::string(error_code::kParseError),
                        std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);

    if (!validator.validate(parsed_schema, target_adapter, &results)) {
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(
            Error::make(std::string(error_code::kSchemaValidationFailed), std::move(error)));
    }

    return {};
}

}  // namespace canonhash::common

/**
 * @file canonical_json.cpp
 * @brief Canonical JSON encoding of canonical trees
 */

#include "canonhash/canonical_json.hpp"

#include <cmath>
#include <format>
#include <ranges>
#include <type_traits>
#include <variant>

namespace canonhash::canonical {

namespace {

[[nodiscard]] Error encoding_error(std::string message)
{
    return Error::make(std::string(error_code::kEncoding), std::move(message));
}

canonhash::VoidResult validate_finite(const CanonicalNode& node, std::string_view path)
{
    if (node.is_scalar()) {
        const auto* number = std::get_if<double>(&node.as_scalar().value);
        if (number != nullptr && !std::isfinite(*number)) {
            return std::unexpected(encoding_error(
                std::format("Non-finite number not allowed in canonical JSON at: {}", path)));
        }
    } else if (node.is_map()) {
        for (const auto& field : node.as_map()) {
            if (auto result = validate_finite(field.node, std::format("{}.{}", path, field.name));
                !result) {
                return result;
            }
        }
    } else if (node.is_list()) {
        for (auto [i, item] : std::views::enumerate(node.as_list())) {
            if (auto result = validate_finite(item, std::format("{}[{}]", path, i)); !result) {
                return result;
            }
        }
    }
    return {};
}

[[nodiscard]] nlohmann::ordered_json scalar_to_json(const Scalar& scalar)
{
    return std::visit(
        [](const auto& value) -> nlohmann::ordered_json {
            using V = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<V, Timestamp>) {
                return value.time_since_epoch().count();
            } else {
                return value;
            }
        },
        scalar.value);
}

/**
 * @brief Build the ordered JSON value (input already validated)
 */
[[nodiscard]] nlohmann::ordered_json make_ordered_json(const CanonicalNode& node)
{
    if (node.is_scalar()) {
        return scalar_to_json(node.as_scalar());
    }
    if (node.is_map()) {
        nlohmann::ordered_json result = nlohmann::ordered_json::object();
        for (const auto& field : node.as_map()) {
            result[field.name] = make_ordered_json(field.node);
        }
        return result;
    }
    if (node.is_list()) {
        nlohmann::ordered_json result = nlohmann::ordered_json::array();
        result.get_ref<nlohmann::ordered_json::array_t&>().reserve(node.as_list().size());
        for (const auto& item : node.as_list()) {
            result.push_back(make_ordered_json(item));
        }
        return result;
    }
    return nullptr;
}

}  // namespace

canonhash::Result<std::string> JsonCanonicalEncoder::encode(const CanonicalNode& node) const
{
    return encode_json(node);
}

canonhash::Result<nlohmann::ordered_json> to_json(const CanonicalNode& node)
{
    if (auto result = validate_finite(node, "$"); !result) {
        return std::unexpected(result.error());
    }
    return make_ordered_json(node);
}

canonhash::Result<std::string> encode_json(const CanonicalNode& node)
{
    auto json = to_json(node);
    if (!json) {
        return std::unexpected(json.error());
    }

    // Serialize without whitespace; strict handler rejects invalid UTF-8
    try {
        return json->dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::strict);
    } catch (const nlohmann::ordered_json::exception& ex) {
        return std::unexpected(
            encoding_error(std::format("Failed to serialize canonical JSON: {}", ex.what())));
    }
}

canonhash::VoidResult validate_for_canonical(const CanonicalNode& node)
{
    return validate_finite(node, "$");
}

}  // namespace canonhash::canonical

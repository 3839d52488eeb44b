/**
 * @file document_schema.cpp
 * @brief Type catalog for JSON documents
 */

#include "canonhash/document_schema.hpp"

#include "canonhash/schema_validate.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <format>
#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <set>
#include <unordered_map>

namespace canonhash::document {

namespace {

namespace fs = std::filesystem;

[[nodiscard]] Error schema_error(std::string message)
{
    return Error::make(std::string(error_code::kSchemaError), std::move(message));
}

[[nodiscard]] Error unknown_type(std::string_view name, std::string_view context)
{
    return Error::make(std::string(error_code::kUnknownType),
                       std::format("Unknown type '{}' ({})", name, context));
}

[[nodiscard]] bool is_identifier(std::string_view text)
{
    if (text.empty()) {
        return false;
    }
    return std::ranges::all_of(text, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '.' || c == ':';
    });
}

/// Schemas by type name; heap-allocated inside the catalog so readers can point at it
struct SchemaTable
{
    std::map<std::string, std::unique_ptr<TypeSchema>, std::less<>> schemas;

    [[nodiscard]] const TypeSchema* find(std::string_view name) const
    {
        auto it = schemas.find(name);
        return it == schemas.end() ? nullptr : it->second.get();
    }
};

[[nodiscard]] Error type_mismatch(const FieldType& type, const nlohmann::json& value)
{
    return Error::make(std::string(error_code::kFieldAccess),
                       std::format("expected {}, got {}", type.to_string(), value.type_name()));
}

canonhash::Result<FieldValue> read_value(const SchemaTable& table,
                                         const nlohmann::json& value,
                                         const FieldType& type)
{
    if (value.is_null()) {
        return FieldValue::absent();
    }

    switch (type.kind) {
        case FieldType::Kind::kString:
            if (value.is_string()) {
                return FieldValue::scalar(Scalar::text(value.get<std::string>()));
            }
            break;
        case FieldType::Kind::kBoolean:
            if (value.is_boolean()) {
                return FieldValue::scalar(Scalar::boolean(value.get<bool>()));
            }
            break;
        case FieldType::Kind::kInteger:
            if (value.is_number_unsigned()) {
                return FieldValue::scalar(Scalar::unsigned_integer(value.get<std::uint64_t>()));
            }
            if (value.is_number_integer()) {
                return FieldValue::scalar(Scalar::integer(value.get<std::int64_t>()));
            }
            break;
        case FieldType::Kind::kNumber:
            if (value.is_number()) {
                return FieldValue::scalar(Scalar::number(value.get<double>()));
            }
            break;
        case FieldType::Kind::kTimestamp:
            if (value.is_number_integer()) {
                return FieldValue::scalar(
                    Scalar::timestamp(Timestamp{std::chrono::milliseconds{value.get<std::int64_t>()}}));
            }
            break;
        case FieldType::Kind::kObject:
            if (value.is_object()) {
                return FieldValue::object(
                    ObjectRef{.instance = &value, .schema = table.find(type.type_name)});
            }
            break;
        case FieldType::Kind::kList:
            if (value.is_array()) {
                FieldValue::List items;
                items.reserve(value.size());
                for (const auto& element : value) {
                    auto item = read_value(table, element, *type.element);
                    if (!item) {
                        return std::unexpected(item.error());
                    }
                    items.push_back(std::move(*item));
                }
                return FieldValue::list(std::move(items));
            }
            break;
    }
    return std::unexpected(type_mismatch(type, value));
}

[[nodiscard]] FieldReader make_reader(const SchemaTable* table, std::string name, FieldType type)
{
    return [table, name = std::move(name), type = std::move(type)](
               const void* instance) -> canonhash::Result<FieldValue> {
        const auto& object = *static_cast<const nlohmann::json*>(instance);
        auto it = object.find(name);
        if (it == object.end()) {
            return FieldValue::absent();
        }
        return read_value(*table, *it, type);
    };
}

[[nodiscard]] const void* same_instance(const void* instance)
{
    return instance;
}

canonhash::VoidResult check_referenced_types(const FieldType& type,
                                             const std::set<std::string, std::less<>>& declared,
                                             std::string_view context)
{
    if (type.kind == FieldType::Kind::kList) {
        return check_referenced_types(*type.element, declared, context);
    }
    if (type.kind == FieldType::Kind::kObject && !declared.contains(type.type_name)) {
        return std::unexpected(unknown_type(type.type_name, context));
    }
    return {};
}

/// Order keys are JSON integers within the range of int
[[nodiscard]] canonhash::Result<int> read_order_key(const nlohmann::json& order,
                                                    std::string_view type_name,
                                                    std::string_view field_name)
{
    constexpr auto kMin = std::numeric_limits<int>::min();
    constexpr auto kMax = std::numeric_limits<int>::max();
    bool in_range = false;
    if (order.is_number_unsigned()) {
        in_range = order.get<std::uint64_t>() <= static_cast<std::uint64_t>(kMax);
    } else if (order.is_number_integer()) {
        const auto value = order.get<std::int64_t>();
        in_range = value >= kMin && value <= kMax;
    }
    if (!in_range) {
        return std::unexpected(schema_error(
            std::format("Type '{}': order of field '{}' must be an integer in [{}, {}], got {}",
                        type_name, field_name, kMin, kMax, order.dump())));
    }
    return static_cast<int>(order.get<std::int64_t>());
}

[[nodiscard]] canonhash::Result<TypeDeclaration> parse_declaration(const nlohmann::json& j)
{
    TypeDeclaration declaration;
    declaration.name = j.at("name").get<std::string>();
    if (auto it = j.find("extends"); it != j.end() && !it->is_null()) {
        declaration.extends = it->get<std::string>();
    }
    for (const auto& field : j.at("fields")) {
        auto type = FieldType::parse(field.at("type").get<std::string>());
        if (!type) {
            return std::unexpected(schema_error(
                std::format("Type '{}': {}", declaration.name, type.error().message)));
        }
        auto name = field.at("name").get<std::string>();
        auto order_key = read_order_key(field.at("order"), declaration.name, name);
        if (!order_key) {
            return std::unexpected(order_key.error());
        }
        declaration.fields.push_back(FieldDeclaration{.name = std::move(name),
                                                      .order_key = *order_key,
                                                      .type = std::move(*type)});
    }
    return declaration;
}

}  // namespace

struct TypeCatalog::Storage
{
    std::vector<std::string> order;
    SchemaTable table;
};

// ============================================================================
// FieldType
// ============================================================================

canonhash::Result<FieldType> FieldType::parse(std::string_view text)
{
    constexpr std::string_view kListPrefix = "list<";
    if (text.starts_with(kListPrefix) && text.ends_with(">")) {
        auto element =
            parse(text.substr(kListPrefix.size(), text.size() - kListPrefix.size() - 1));
        if (!element) {
            return std::unexpected(element.error());
        }
        return FieldType{.kind = Kind::kList,
                         .type_name = {},
                         .element = std::make_shared<const FieldType>(std::move(*element))};
    }

    static const std::unordered_map<std::string_view, Kind> kScalarKinds = {
        {   "string",    Kind::kString},
        {  "boolean",   Kind::kBoolean},
        {  "integer",   Kind::kInteger},
        {   "number",    Kind::kNumber},
        {"timestamp", Kind::kTimestamp},
    };
    if (auto it = kScalarKinds.find(text); it != kScalarKinds.end()) {
        return FieldType{.kind = it->second, .type_name = {}, .element = nullptr};
    }

    if (!is_identifier(text)) {
        return std::unexpected(schema_error(std::format("Invalid field type: '{}'", text)));
    }
    return FieldType{.kind = Kind::kObject, .type_name = std::string(text), .element = nullptr};
}

std::string FieldType::to_string() const
{
    switch (kind) {
        case Kind::kString:
            return "string";
        case Kind::kBoolean:
            return "boolean";
        case Kind::kInteger:
            return "integer";
        case Kind::kNumber:
            return "number";
        case Kind::kTimestamp:
            return "timestamp";
        case Kind::kObject:
            return type_name;
        case Kind::kList:
            return "list<" + element->to_string() + ">";
    }
    return {};
}

// ============================================================================
// TypeCatalog
// ============================================================================

TypeCatalog::TypeCatalog(std::unique_ptr<Storage> storage)
    : m_storage(std::move(storage))
{}

TypeCatalog::TypeCatalog(TypeCatalog&&) noexcept = default;
TypeCatalog& TypeCatalog::operator=(TypeCatalog&&) noexcept = default;
TypeCatalog::~TypeCatalog() = default;

canonhash::Result<TypeCatalog> TypeCatalog::from_declarations(
    std::vector<TypeDeclaration> declarations)
{
    std::map<std::string, const TypeDeclaration*, std::less<>> by_name;
    std::set<std::string, std::less<>> declared;
    for (const auto& declaration : declarations) {
        if (!by_name.emplace(declaration.name, &declaration).second) {
            return std::unexpected(
                schema_error(std::format("Duplicate type declaration: '{}'", declaration.name)));
        }
        declared.insert(declaration.name);
    }

    for (const auto& declaration : declarations) {
        if (declaration.extends && !declared.contains(*declaration.extends)) {
            return std::unexpected(unknown_type(*declaration.extends,
                                                std::format("base of '{}'", declaration.name)));
        }
        std::set<std::string, std::less<>> field_names;
        for (const auto& field : declaration.fields) {
            if (!field_names.insert(field.name).second) {
                return std::unexpected(schema_error(std::format(
                    "Type '{}' declares field '{}' twice", declaration.name, field.name)));
            }
            auto checked = check_referenced_types(
                field.type, declared, std::format("field '{}.{}'", declaration.name, field.name));
            if (!checked) {
                return std::unexpected(checked.error());
            }
        }
    }

    auto storage = std::make_unique<Storage>();
    const SchemaTable* table = &storage->table;

    enum class State { kVisiting, kDone };
    std::map<std::string, State, std::less<>> state;

    // Bases are built before derived types so BaseLink can point at them
    std::function<canonhash::VoidResult(const TypeDeclaration&)> build =
        [&](const TypeDeclaration& declaration) -> canonhash::VoidResult {
        if (auto it = state.find(declaration.name); it != state.end()) {
            if (it->second == State::kVisiting) {
                return std::unexpected(schema_error(
                    std::format("Inheritance cycle through type '{}'", declaration.name)));
            }
            return {};
        }
        state.emplace(declaration.name, State::kVisiting);

        std::optional<BaseLink> base;
        if (declaration.extends) {
            if (auto built = build(*by_name.at(*declaration.extends)); !built) {
                return built;
            }
            base = BaseLink{.schema = storage->table.find(*declaration.extends),
                            .upcast = same_instance};
        }

        std::vector<SchemaField> fields;
        fields.reserve(declaration.fields.size());
        for (const auto& field : declaration.fields) {
            fields.push_back(SchemaField{
                .descriptor = FieldDescriptor{.name = field.name, .order_key = field.order_key},
                .read = make_reader(table, field.name, field.type)});
        }
        storage->table.schemas.emplace(
            declaration.name,
            std::make_unique<TypeSchema>(declaration.name, std::move(fields), std::move(base)));
        state[declaration.name] = State::kDone;
        return {};
    };

    for (const auto& declaration : declarations) {
        if (auto built = build(declaration); !built) {
            return std::unexpected(built.error());
        }
        storage->order.push_back(declaration.name);
    }

    return TypeCatalog(std::move(storage));
}

canonhash::Result<TypeCatalog> TypeCatalog::from_json(const nlohmann::json& catalog)
{
    std::vector<TypeDeclaration> declarations;
    try {
        if (auto it = catalog.find("schema_version");
            it != catalog.end() && it->get<std::string>() != kCatalogSchemaVersion) {
            return std::unexpected(schema_error(std::format(
                "Unsupported catalog schema_version: {}", it->get<std::string>())));
        }
        for (const auto& type : catalog.at("types")) {
            auto declaration = parse_declaration(type);
            if (!declaration) {
                return std::unexpected(declaration.error());
            }
            declarations.push_back(std::move(*declaration));
        }
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            schema_error(std::format("Malformed type catalog: {}", ex.what())));
    }
    return from_declarations(std::move(declarations));
}

canonhash::Result<TypeCatalog> TypeCatalog::load(const fs::path& path, const std::string& schema_dir)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make(std::string(error_code::kIOError),
                                           "Failed to open type catalog: " + path.string()));
    }

    nlohmann::json catalog;
    try {
        in >> catalog;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make(std::string(error_code::kParseError),
                        std::format("Failed to parse type catalog {}: {}", path.string(), ex.what())));
    }

    const auto schema_path = (fs::path(schema_dir) / "type_catalog.v1.schema.json").string();
    if (auto result = common::validate_json(catalog, schema_path); !result) {
        return std::unexpected(Error::make(result.error().code,
                                           "Type catalog schema validation failed: "
                                               + result.error().message));
    }

    return from_json(catalog);
}

const TypeSchema* TypeCatalog::find(std::string_view type_name) const
{
    return m_storage->table.find(type_name);
}

canonhash::Result<ObjectRef> TypeCatalog::bind(const nlohmann::json& document,
                                               std::string_view type_name) const
{
    const TypeSchema* schema = find(type_name);
    if (schema == nullptr) {
        return std::unexpected(unknown_type(type_name, "document root"));
    }
    if (document.is_null()) {
        return ObjectRef{.instance = nullptr, .schema = schema};
    }
    if (!document.is_object()) {
        return std::unexpected(Error::make(
            std::string(error_code::kFieldAccess),
            std::format("Document for type '{}' must be an object, got {}", type_name,
                        document.type_name())));
    }
    return ObjectRef{.instance = &document, .schema = schema};
}

std::vector<std::string> TypeCatalog::type_names() const
{
    return m_storage->order;
}

}  // namespace canonhash::document

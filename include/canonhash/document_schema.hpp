#pragma once

/**
 * @file document_schema.hpp
 * @brief Field schemas for JSON documents, declared in a type catalog
 *
 * Catalog format (type_catalog.v1):
 *
 * @code
 * {
 *   "schema_version": "type_catalog.v1",
 *   "types": [
 *     {"name": "Person", "fields": [{"name": "name", "order": 1, "type": "string"},
 *                                   {"name": "age",  "order": 2, "type": "integer"}]},
 *     {"name": "Employee", "extends": "Person",
 *      "fields": [{"name": "reports", "order": 1, "type": "list<Person>"}]}
 *   ]
 * }
 * @endcode
 *
 * Field types: string, boolean, integer, number, timestamp (integer epoch
 * milliseconds), a catalog type name, or list<T>. Missing keys and JSON null
 * are absent values. Document keys not selected by the type are ignored.
 */

#include "canonhash/common.hpp"
#include "canonhash/field_schema.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace canonhash::document {

inline constexpr std::string_view kCatalogSchemaVersion = "type_catalog.v1";

/**
 * @brief Declared type of a document field
 */
struct FieldType
{
    enum class Kind { kString, kBoolean, kInteger, kNumber, kTimestamp, kObject, kList };

    Kind kind;
    std::string type_name;                     ///< kObject only
    std::shared_ptr<const FieldType> element;  ///< kList only

    /**
     * Parse a type expression such as "integer", "Person" or "list<list<string>>"
     * @return FieldType or SchemaError
     */
    [[nodiscard]] static canonhash::Result<FieldType> parse(std::string_view text);

    [[nodiscard]] std::string to_string() const;
};

struct FieldDeclaration
{
    std::string name;
    int order_key;
    FieldType type;
};

struct TypeDeclaration
{
    std::string name;
    std::optional<std::string> extends;
    std::vector<FieldDeclaration> fields;
};

class TypeCatalog
{
public:
    /**
     * @brief Build a catalog from declarations
     * @return Catalog, SchemaError (duplicate type, inheritance cycle) or
     *         UnknownType (undeclared base or field type)
     */
    [[nodiscard]] static canonhash::Result<TypeCatalog> from_declarations(
        std::vector<TypeDeclaration> declarations);

    /**
     * @brief Build a catalog from its JSON form (no JSON Schema validation)
     */
    [[nodiscard]] static canonhash::Result<TypeCatalog> from_json(const nlohmann::json& catalog);

    /**
     * @brief Load a catalog file, validated against
     *        <schema_dir>/type_catalog.v1.schema.json
     */
    [[nodiscard]] static canonhash::Result<TypeCatalog> load(const std::filesystem::path& path,
                                                             const std::string& schema_dir);

    TypeCatalog(TypeCatalog&&) noexcept;
    TypeCatalog& operator=(TypeCatalog&&) noexcept;
    ~TypeCatalog();

    [[nodiscard]] const TypeSchema* find(std::string_view type_name) const;

    /**
     * @brief Root value for a document
     *
     * A JSON null document is the absent root.
     * @return ObjectRef into @p document (which must outlive it), UnknownType,
     *         or FieldAccessError when the document is not an object
     */
    [[nodiscard]] canonhash::Result<ObjectRef> bind(const nlohmann::json& document,
                                                    std::string_view type_name) const;

    /// Declared type names in declaration order
    [[nodiscard]] std::vector<std::string> type_names() const;

private:
    struct Storage;

    explicit TypeCatalog(std::unique_ptr<Storage> storage);

    std::unique_ptr<Storage> m_storage;
};

}  // namespace canonhash::document

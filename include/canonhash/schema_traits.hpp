#pragma once

/**
 * @file schema_traits.hpp
 * @brief Compile-time field schemas for C++ types
 *
 * A type opts into hashing by specializing canonhash::FieldSchema:
 *
 * @code
 * template <>
 * struct canonhash::FieldSchema<Person>
 * {
 *     static constexpr std::string_view kTypeName = "Person";
 *     using Base = Entity;  // optional ancestor, must have its own FieldSchema
 *
 *     static auto fields()
 *     {
 *         return std::make_tuple(canonhash::field("name", 1, &Person::name),
 *                                canonhash::field("age", 2, &Person::age));
 *     }
 * };
 * @endcode
 *
 * Field types are classified at compile time:
 * - std::optional, raw/unique/shared pointers: absent when empty, else unwrapped
 * - text, bool, char, integers, floating point, enums, system_clock time points: scalar
 * - any other input range: list
 * - a type with its own FieldSchema: nested object
 * Anything else is rejected with a static_assert.
 */

#include "canonhash/field_schema.hpp"

#include <chrono>
#include <concepts>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace canonhash {

/// Specialize per hashable type (see file comment)
template <typename T>
struct FieldSchema;

template <typename T>
concept Hashable = requires {
    { FieldSchema<T>::kTypeName } -> std::convertible_to<std::string_view>;
    FieldSchema<T>::fields();
};

/**
 * @brief One selected field: name, order key and how to read it
 *
 * Accessor is a data member pointer, a member function pointer or any
 * callable taking the owning object by const reference.
 */
template <typename Accessor>
struct FieldBinding
{
    std::string_view name;
    int order_key;
    Accessor accessor;
};

template <typename T, typename M>
[[nodiscard]] constexpr FieldBinding<M T::*> field(std::string_view name, int order_key, M T::*member)
{
    return FieldBinding<M T::*>{.name = name, .order_key = order_key, .accessor = member};
}

/**
 * @brief Field computed by a getter
 *
 * The getter may return a value, a reference, or canonhash::Result<V>; an
 * error result surfaces as FieldAccessError.
 */
template <typename Getter>
[[nodiscard]] constexpr FieldBinding<Getter> computed_field(std::string_view name,
                                                            int order_key,
                                                            Getter getter)
{
    return FieldBinding<Getter>{.name = name, .order_key = order_key, .accessor = std::move(getter)};
}

template <Hashable T>
[[nodiscard]] const TypeSchema& schema_of();

namespace detail {

template <typename T>
inline constexpr bool kAlwaysFalse = false;

template <typename T>
struct is_optional : std::false_type
{};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type
{};

template <typename T>
struct is_smart_pointer : std::false_type
{};
template <typename T, typename D>
struct is_smart_pointer<std::unique_ptr<T, D>> : std::true_type
{};
template <typename T>
struct is_smart_pointer<std::shared_ptr<T>> : std::true_type
{};

template <typename T>
struct is_result : std::false_type
{};
template <typename T>
struct is_result<std::expected<T, Error>> : std::true_type
{};

template <typename T>
struct is_system_time : std::false_type
{};
template <typename D>
struct is_system_time<std::chrono::time_point<std::chrono::system_clock, D>> : std::true_type
{};

/// Character arrays are not text: they are read as ranges, never through strlen
template <typename V>
concept TextLike = std::convertible_to<const V&, std::string_view>
                   && !std::is_same_v<V, std::nullptr_t> && !std::is_array_v<V>;

template <typename V>
concept ScalarKind = std::is_arithmetic_v<V> || std::is_enum_v<V> || is_system_time<V>::value
                     || TextLike<V>;

/**
 * @brief Widen a float through its shortest round-trip decimal form
 *
 * 0.1f becomes 0.1 rather than 0.100000001490116.
 */
[[nodiscard]] double widen_float(float value);

template <ScalarKind V>
[[nodiscard]] Scalar make_scalar(const V& value)
{
    if constexpr (std::is_same_v<V, bool>) {
        return Scalar::boolean(value);
    } else if constexpr (std::is_same_v<V, char>) {
        return Scalar::text(std::string(1, value));
    } else if constexpr (std::is_enum_v<V>) {
        return make_scalar(std::to_underlying(value));
    } else if constexpr (std::signed_integral<V>) {
        return Scalar::integer(static_cast<std::int64_t>(value));
    } else if constexpr (std::unsigned_integral<V>) {
        return Scalar::unsigned_integer(static_cast<std::uint64_t>(value));
    } else if constexpr (std::is_same_v<V, float>) {
        return Scalar::number(widen_float(value));
    } else if constexpr (std::floating_point<V>) {
        return Scalar::number(static_cast<double>(value));
    } else if constexpr (is_system_time<V>::value) {
        return Scalar::timestamp(std::chrono::floor<std::chrono::milliseconds>(value));
    } else {
        return Scalar::text(std::string(std::string_view(value)));
    }
}

}  // namespace detail

/**
 * @brief Classify a C++ value for the canonicalizer
 *
 * Object and list values reference @p value; it must outlive the result.
 */
template <typename V>
[[nodiscard]] FieldValue to_field_value(const V& value)
{
    if constexpr (std::is_same_v<V, std::nullptr_t> || std::is_same_v<V, std::nullopt_t>) {
        return FieldValue::absent();
    } else if constexpr (detail::is_optional<V>::value) {
        if (!value.has_value()) {
            return FieldValue::absent();
        }
        return to_field_value(*value);
    } else if constexpr (std::is_pointer_v<V> && detail::TextLike<V>) {
        if (value == nullptr) {
            return FieldValue::absent();
        }
        return FieldValue::scalar(detail::make_scalar(value));
    } else if constexpr (std::is_pointer_v<V> || detail::is_smart_pointer<V>::value) {
        if (value == nullptr) {
            return FieldValue::absent();
        }
        return to_field_value(*value);
    } else if constexpr (detail::ScalarKind<V>) {
        return FieldValue::scalar(detail::make_scalar(value));
    } else if constexpr (std::ranges::input_range<const V>) {
        using Item = std::ranges::range_value_t<const V>;
        FieldValue::List items;
        if constexpr (std::ranges::sized_range<const V>) {
            items.reserve(std::ranges::size(value));
        }
        for (const auto& item : value) {
            // static_cast unwraps proxy references such as std::vector<bool>'s
            items.push_back(to_field_value(static_cast<const Item&>(item)));
        }
        return FieldValue::list(std::move(items));
    } else if constexpr (Hashable<V>) {
        return FieldValue::object(ObjectRef{.instance = &value, .schema = &schema_of<V>()});
    } else {
        static_assert(detail::kAlwaysFalse<V>,
                      "Field type is not hashable: specialize canonhash::FieldSchema for it, "
                      "or select a computed_field that returns a supported type");
        return FieldValue::absent();
    }
}

namespace detail {

/**
 * @brief Field value for a by-value source (getter result)
 */
template <typename V>
[[nodiscard]] FieldValue retained_field_value(V&& value)
{
    using Stored = std::remove_cvref_t<V>;
    if constexpr (ScalarKind<Stored> && !std::is_pointer_v<Stored>) {
        return to_field_value(value);
    } else {
        auto owner = std::make_shared<const Stored>(std::forward<V>(value));
        FieldValue result = to_field_value(*owner);
        result.retain(std::move(owner));
        return result;
    }
}

template <typename Owner, typename Accessor>
[[nodiscard]] FieldReader make_reader(Accessor accessor)
{
    return [accessor = std::move(accessor)](const void* instance) -> canonhash::Result<FieldValue> {
        const Owner& owner = *static_cast<const Owner*>(instance);
        using Returned = std::invoke_result_t<const Accessor&, const Owner&>;
        if constexpr (std::is_lvalue_reference_v<Returned>) {
            return to_field_value(std::invoke(accessor, owner));
        } else if constexpr (is_result<std::remove_cvref_t<Returned>>::value) {
            auto result = std::invoke(accessor, owner);
            if (!result) {
                return std::unexpected(std::move(result).error());
            }
            return retained_field_value(std::move(result).value());
        } else {
            return retained_field_value(std::invoke(accessor, owner));
        }
    };
}

template <Hashable T>
[[nodiscard]] TypeSchema build_schema()
{
    std::vector<SchemaField> fields;
    std::apply(
        [&fields](auto&&... binding) {
            (fields.push_back(SchemaField{
                 .descriptor = FieldDescriptor{.name = std::string(binding.name),
                                               .order_key = binding.order_key},
                 .read = make_reader<T>(binding.accessor)}),
             ...);
        },
        FieldSchema<T>::fields());

    std::string type_name(FieldSchema<T>::kTypeName);
    if constexpr (requires { typename FieldSchema<T>::Base; }) {
        using Base = typename FieldSchema<T>::Base;
        static_assert(std::is_base_of_v<Base, T>, "FieldSchema<T>::Base must be a base class of T");
        static_assert(Hashable<Base>, "FieldSchema<T>::Base needs its own FieldSchema");
        return TypeSchema(std::move(type_name),
                          std::move(fields),
                          BaseLink{.schema = &schema_of<Base>(),
                                   .upcast = [](const void* instance) -> const void* {
                                       return static_cast<const Base*>(
                                           static_cast<const T*>(instance));
                                   }});
    } else {
        return TypeSchema(std::move(type_name), std::move(fields));
    }
}

}  // namespace detail

/**
 * @brief Process-wide immutable schema for T, built on first use
 */
template <Hashable T>
const TypeSchema& schema_of()
{
    static const TypeSchema schema = detail::build_schema<T>();
    return schema;
}

template <Hashable T>
[[nodiscard]] ObjectRef make_ref(const T& value)
{
    return ObjectRef{.instance = &value, .schema = &schema_of<T>()};
}

/// A null pointer yields the absent root
template <Hashable T>
[[nodiscard]] ObjectRef make_ref(const T* value)
{
    return ObjectRef{.instance = value, .schema = &schema_of<T>()};
}

}  // namespace canonhash

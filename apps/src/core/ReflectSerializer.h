#pragma once

#include "reflect.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

/**
 * Reflection-based JSON serialization for aggregate types.
 *
 * Uses qlibs/reflect for compile-time member iteration and nlohmann/json for the
 * document. Nested aggregates are serialized through their own ADL to_json/from_json,
 * enums by enumerator name, and empty optionals are omitted.
 *
 * Deserialization starts from a value-initialized object, so members missing from
 * the JSON keep their in-class defaults.
 *
 * Example:
 *   struct Range { double min = -1.0; double max = 2.0; };
 *   auto j = ReflectSerializer::to_json(Range{});
 *   auto r = ReflectSerializer::from_json<Range>(nlohmann::json{ { "max", 3.0 } });
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename E>
std::string enumToString(E value)
{
    return std::string(reflect::enum_name(value));
}

template <typename E>
E enumFromString(const std::string& str)
{
    for (const auto& [enumValue, enumName] : reflect::enumerators<E>) {
        if (enumName == str) {
            return static_cast<E>(enumValue);
        }
    }
    throw std::runtime_error("Invalid enum value: " + str);
}

/**
 * Serialize any aggregate type to nlohmann::json.
 */
template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            const auto& value = reflect::get<I>(obj);

            using MemberType = std::remove_cvref_t<decltype(value)>;

            if constexpr (is_optional_v<MemberType>) {
                if (value.has_value()) {
                    using InnerType = typename MemberType::value_type;
                    if constexpr (std::is_enum_v<InnerType>) {
                        j[name] = enumToString(*value);
                    }
                    else {
                        j[name] = *value;
                    }
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                j[name] = enumToString(value);
            }
            else {
                j[name] = value;
            }
        },
        obj);

    return j;
}

/**
 * Deserialize nlohmann::json to any aggregate type.
 */
template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name) || j[name].is_null()) {
                return;
            }

            using MemberType = std::remove_reference_t<decltype(reflect::get<I>(obj))>;

            if constexpr (is_optional_v<MemberType>) {
                using InnerType = typename MemberType::value_type;
                if constexpr (std::is_enum_v<InnerType>) {
                    reflect::get<I>(obj) = enumFromString<InnerType>(j[name].get<std::string>());
                }
                else {
                    reflect::get<I>(obj) = j[name].get<InnerType>();
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                reflect::get<I>(obj) = enumFromString<MemberType>(j[name].get<std::string>());
            }
            else {
                reflect::get<I>(obj) = j[name].get<MemberType>();
            }
        },
        obj);

    return obj;
}

} // namespace ReflectSerializer

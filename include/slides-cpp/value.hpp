/// @file value.hpp
/// @brief The document tree value type and small typed accessors.

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace slides_cpp {

/// A node of the presentation tree.
///
/// A tagged variant of insertion-ordered string maps, sequences and
/// scalars (null, bool, integers, double, string). Presentations,
/// pages, elements and request payloads are all Values.
using Value = nlohmann::ordered_json;

/// Helper for constructing ad-hoc visitors from lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed member access ------------------------------------------------------

/// Get a member of a map, or nullptr if `obj` is not a map or lacks `key`.
inline auto find_member(const Value& obj, std::string_view key) -> const Value* {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(std::string{key});
    return it != obj.end() ? &*it : nullptr;
}

inline auto find_member(Value& obj, std::string_view key) -> Value* {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(std::string{key});
    return it != obj.end() ? &*it : nullptr;
}

/// Extract a string member, or nullopt on absence or type mismatch.
/// @code
/// auto id = get_string(element, "objectId");
/// @endcode
inline auto get_string(const Value& obj, std::string_view key) -> std::optional<std::string> {
    const auto* v = find_member(obj, key);
    if (!v || !v->is_string()) return std::nullopt;
    return v->get<std::string>();
}

/// True if `obj` is a map whose `objectId` equals `id`.
inline auto has_object_id(const Value& obj, std::string_view id) -> bool {
    const auto* v = find_member(obj, "objectId");
    return v && v->is_string() && v->get_ref<const std::string&>() == id;
}

/// Get (creating if absent or not a map) a map member.
inline auto ensure_object(Value& obj, std::string_view key) -> Value& {
    auto& member = obj[std::string{key}];
    if (!member.is_object()) member = Value::object();
    return member;
}

/// Get (creating if absent or not a sequence) a sequence member.
inline auto ensure_array(Value& obj, std::string_view key) -> Value& {
    auto& member = obj[std::string{key}];
    if (!member.is_array()) member = Value::array();
    return member;
}

}  // namespace slides_cpp

/// @file path.hpp
/// @brief Dotted-path access into a Value tree.
///
/// A path is a `.`-separated list of segments ("notesPage.pageElements.0").
/// A numeric segment indexes a sequence when the current node is a
/// sequence; on a map it is an ordinary key.

#pragma once

#include <slides-cpp/error.hpp>
#include <slides-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace slides_cpp {

/// Split a dotted path into its segments. "" yields one empty segment.
auto split_path(std::string_view path) -> std::vector<std::string>;

/// Parse a segment as a sequence index (digits only).
auto parse_index(std::string_view segment) -> std::optional<std::size_t>;

/// Find the node at a path without copying it.
/// @return nullptr if any segment is missing.
auto find_path(const Value& root, std::string_view path) -> const Value*;

/// Get a copy of the node at a path.
/// @return The node, or not_found naming the first missing segment.
auto get_path(const Value& root, std::string_view path) -> Result<Value>;

/// Get a copy of the node at a path, or `fallback` if only the final
/// segment is missing. A missing intermediate segment is still not_found.
auto get_path(const Value& root, std::string_view path, const Value& fallback) -> Result<Value>;

/// Set the node at a path, replacing whatever is there.
///
/// Missing (or null) intermediate map members are created as empty maps.
/// Fails with conflict when an intermediate index is out of range, when a
/// scalar sits where traversal must continue, or when the final segment
/// would index past the end of a sequence.
auto set_path(Value& root, std::string_view path, Value value) -> Result<void>;

}  // namespace slides_cpp

/// @file field_mask.hpp
/// @brief Field-mask patching of one Value tree from another.

#pragma once

#include <slides-cpp/error.hpp>
#include <slides-cpp/value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace slides_cpp {

/// The reserved mask that replaces every top-level field of the target.
inline constexpr std::string_view full_replace_mask = "*";

/// Split a mask on ',' into trimmed, non-empty paths.
auto parse_field_mask(std::string_view mask) -> std::vector<std::string>;

/// True if the mask is the wildcard or selects `path` or one of its
/// ancestors ("notesPage" touches "notesPage.notesProperties").
auto mask_touches(std::string_view mask, std::string_view path) -> bool;

/// Copy the masked fields of `updates` onto `target`.
///
/// - `"*"` assigns every top-level member of `updates` onto `target`.
/// - Otherwise each path is read from `updates` (absent paths are skipped)
///   and written into `target` with set_path().
///
/// A conflict aborts the call and names the offending field. Fields
/// written for earlier paths of the same mask stay written.
auto apply_field_mask(Value& target, const Value& updates, std::string_view mask) -> Result<void>;

}  // namespace slides_cpp

/// @file locator.hpp
/// @brief Locating pages and page elements inside a presentation.

#pragma once

#include <slides-cpp/error.hpp>
#include <slides-cpp/value.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>

namespace slides_cpp {

/// Where a page element lives.
///
/// All pointers refer into the presentation that was searched and are
/// invalidated by any structural change to it.
struct ElementLocation {
    Value* element{nullptr};    ///< The element itself.
    Value* container{nullptr};  ///< The sequence holding the element.
    std::size_t index{0};       ///< Position of the element in `container`.
    Value* page{nullptr};       ///< The slide or notes page the element is on.
    Value* group{nullptr};      ///< The enclosing group element, or nullptr at top level.
};

// -- Pages --------------------------------------------------------------------

/// Find a slide by object ID.
auto find_slide(Value& presentation, std::string_view id) -> Value*;
auto find_slide(const Value& presentation, std::string_view id) -> const Value*;

/// Position of a slide in `slides`.
auto find_slide_index(const Value& presentation, std::string_view id) -> std::optional<std::size_t>;

/// Find a layout by object ID.
auto find_layout(Value& presentation, std::string_view id) -> Value*;

/// Find any page: slides, layouts, masters, then the notes master
/// (stored either as one page or a sequence of pages).
auto find_page(const Value& presentation, std::string_view id) -> const Value*;
auto find_page(Value& presentation, std::string_view id) -> Value*;

/// The slide's canonical notes page, or nullptr.
auto notes_page(Value& slide) -> Value*;
auto notes_page(const Value& slide) -> const Value*;

// -- Elements -----------------------------------------------------------------

/// The children of a group element, or nullptr if `element` is not a group.
auto group_children(Value& element) -> Value*;
auto group_children(const Value& element) -> const Value*;

/// Search a sequence of elements depth-first (each group's children before
/// the next sibling).
auto find_in_elements(Value& elements, std::string_view id, Value* page)
    -> std::optional<ElementLocation>;

/// Find a page element anywhere on a slide or a slide's notes page.
///
/// Slides are searched in order; on each slide the top-level elements and
/// their groups come first, then the notes page.
/// @return The location, or not_found.
auto find_element(Value& presentation, std::string_view id) -> Result<ElementLocation>;

/// Visit every element of a sequence and of all nested groups, parents
/// before children.
void for_each_element(Value& elements, const std::function<void(Value&)>& fn);
void for_each_element(const Value& elements, const std::function<void(const Value&)>& fn);

/// True if any page or page element (including layouts, masters and
/// notes pages) carries `id`.
auto contains_object_id(const Value& presentation, std::string_view id) -> bool;

}  // namespace slides_cpp

/// @file text.hpp
/// @brief TextContent helpers: code-point offsets and index bookkeeping.
///
/// A shape's text lives at `shape.text.textElements`. Each element is a
/// `textRun` (content + style) or a `paragraphMarker` and carries
/// `startIndex`/`endIndex`. Indices count Unicode code points, are
/// contiguous from 0, and the sequence ends with a length-1 paragraph
/// marker.

#pragma once

#include <slides-cpp/value.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace slides_cpp {

/// Number of code points in a UTF-8 string.
auto utf8_length(std::string_view s) -> std::size_t;

/// Byte offset of the code point at `index`, clamped to `s.size()`.
auto utf8_offset(std::string_view s, std::size_t index) -> std::size_t;

/// A paragraph marker with an empty style.
auto make_paragraph_marker() -> Value;

/// A text run element with the given content and style.
auto make_text_run(std::string content, Value style = Value::object()) -> Value;

/// Length of one text element: 1 for a paragraph marker, the run's
/// content length for a text run, 0 otherwise.
auto text_element_length(const Value& text_element) -> std::size_t;

/// Recompute every element's startIndex/endIndex, appending a terminating
/// paragraph marker if the sequence does not end with one.
void reindex_text_elements(Value& text_elements);

/// The element's `shape.text.textElements`, or nullptr if it has none.
auto find_text_elements(Value& element) -> Value*;
auto find_text_elements(const Value& element) -> const Value*;

/// The element's text elements, creating `shape`, `text` and an empty
/// paragraph as needed.
auto ensure_text_elements(Value& element) -> Value&;

/// Every textRun object of an element's text.
auto text_runs(Value& element) -> std::vector<Value*>;

/// Trimmed, non-empty run contents of shapes and table cells in a
/// sequence of elements (groups included), in document order.
auto collect_text(const Value& elements) -> std::vector<std::string>;

}  // namespace slides_cpp

/// @file request.hpp
/// @brief Typed batchUpdate requests and their parsing from JSON.

#pragma once

#include <slides-cpp/error.hpp>
#include <slides-cpp/identity.hpp>
#include <slides-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace slides_cpp {

/// A reference to a table cell. Text edits inside cells are not simulated.
struct TableCellLocation {
    std::optional<std::int64_t> row_index;
    std::optional<std::int64_t> column_index;
    auto operator==(const TableCellLocation&) const -> bool = default;
};

/// Which part of a text run a range selects.
enum class RangeType : std::uint8_t {
    all,               ///< The whole run.
    fixed_range,       ///< [start_index, end_index).
    from_start_index,  ///< [start_index, end).
};

/// Convert a RangeType to its wire name.
constexpr auto to_string_view(RangeType type) noexcept -> std::string_view {
    switch (type) {
        case RangeType::all:              return "ALL";
        case RangeType::fixed_range:      return "FIXED_RANGE";
        case RangeType::from_start_index: return "FROM_START_INDEX";
    }
    return "unknown";
}

/// A text range selector.
struct TextRange {
    RangeType type{RangeType::all};
    std::optional<std::int64_t> start_index;
    std::optional<std::int64_t> end_index;
    auto operator==(const TextRange&) const -> bool = default;
};

/// The layout a new slide is based on. At most one field is set.
struct LayoutReference {
    std::optional<std::string> layout_id;
    std::optional<std::string> predefined_layout;
    auto operator==(const LayoutReference&) const -> bool = default;
};

// -- Requests -----------------------------------------------------------------

struct CreateSlide {
    std::optional<std::string> object_id;
    std::optional<std::int64_t> insertion_index;
    std::optional<LayoutReference> layout;
    auto operator==(const CreateSlide&) const -> bool = default;
};

struct CreateShape {
    std::optional<std::string> object_id;
    std::string shape_type;
    std::optional<std::string> page_object_id;
    std::optional<Value> size;
    std::optional<Value> transform;
    auto operator==(const CreateShape&) const -> bool = default;
};

struct InsertText {
    std::string object_id;
    std::string text;
    std::optional<std::int64_t> insertion_index;
    std::optional<TableCellLocation> cell_location;
    auto operator==(const InsertText&) const -> bool = default;
};

struct ReplaceAllText {
    std::string find_text;
    bool match_case{false};
    std::string replace_text;
    std::vector<std::string> page_object_ids;  ///< Empty = every page.
    auto operator==(const ReplaceAllText&) const -> bool = default;
};

struct DeleteObject {
    std::string object_id;
    auto operator==(const DeleteObject&) const -> bool = default;
};

struct DeleteText {
    std::string object_id;
    TextRange text_range;
    std::optional<TableCellLocation> cell_location;
    auto operator==(const DeleteText&) const -> bool = default;
};

struct UpdateTextStyle {
    std::string object_id;
    Value style = Value::object();
    std::optional<std::string> fields;
    std::optional<TextRange> text_range;
    std::optional<TableCellLocation> cell_location;
    auto operator==(const UpdateTextStyle&) const -> bool = default;
};

struct GroupObjects {
    std::optional<std::string> group_object_id;
    std::vector<std::string> children_object_ids;
    auto operator==(const GroupObjects&) const -> bool = default;
};

struct UngroupObjects {
    std::vector<std::string> object_ids;
    auto operator==(const UngroupObjects&) const -> bool = default;
};

struct UpdatePageElementAltText {
    std::string object_id;
    std::optional<std::string> title;
    std::optional<std::string> description;
    auto operator==(const UpdatePageElementAltText&) const -> bool = default;
};

struct UpdateSlideProperties {
    std::string object_id;
    Value slide_properties = Value::object();
    std::string fields;
    auto operator==(const UpdateSlideProperties&) const -> bool = default;
};

struct DuplicateObject {
    std::string object_id;
    IdMap object_ids;  ///< Caller-chosen old -> new IDs.
    auto operator==(const DuplicateObject&) const -> bool = default;
};

/// One batchUpdate request.
using Request = std::variant<
    CreateSlide,
    CreateShape,
    InsertText,
    ReplaceAllText,
    DeleteObject,
    DeleteText,
    UpdateTextStyle,
    GroupObjects,
    UngroupObjects,
    UpdatePageElementAltText,
    UpdateSlideProperties,
    DuplicateObject
>;

/// The wire name of a request ("createSlide", "insertText", ...).
auto request_name(const Request& request) -> std::string_view;

/// Parse one envelope item: an object with exactly one key naming the
/// operation, whose value is the parameter object.
/// @return The typed request, or invalid_input.
auto parse_request(const Value& item) -> Result<Request>;

}  // namespace slides_cpp

/// @file handlers.hpp
/// @brief One handler per batchUpdate request.
///
/// Each handler validates its request completely before the first write
/// to the presentation, so a rejected request leaves it untouched. On
/// success the returned Value is the reply body (`{objectId}`,
/// `{occurrencesChanged}`, the applied style, or `{}`), and every page
/// the handler changed carries a fresh `revisionId`.

#pragma once

#include <slides-cpp/error.hpp>
#include <slides-cpp/identity.hpp>
#include <slides-cpp/options.hpp>
#include <slides-cpp/request.hpp>
#include <slides-cpp/value.hpp>

#include <array>
#include <string_view>

namespace slides_cpp {

/// State shared by the handlers of one batch.
struct HandlerContext {
    IdFactory& ids;
    const StoreOptions& options;
    /// Set by any handler that wrote to the presentation, even one that then failed.
    bool mutated{false};
};

/// Every predefined layout name a createSlide request may reference.
inline constexpr std::array<std::string_view, 11> predefined_layout_names = {
    "BLANK", "CAPTION_ONLY", "TITLE", "TITLE_AND_BODY", "TITLE_AND_TWO_COLUMNS",
    "TITLE_ONLY", "SECTION_HEADER", "SECTION_TITLE_AND_DESCRIPTION",
    "ONE_COLUMN_TEXT", "MAIN_POINT", "BIG_NUMBER",
};

/// Check a caller-chosen ID for a new object against the configured
/// pattern and length limit.
auto check_new_object_id(std::string_view id, const StoreOptions& options) -> Result<void>;

/// Add the standard layouts a presentation lacks (matched by name or
/// display name). With `options.ensure_standard_layouts` off only BLANK
/// is guaranteed.
void ensure_standard_layouts(Value& presentation, HandlerContext& ctx);

// -- Slides -------------------------------------------------------------------

auto handle(Value& presentation, const CreateSlide& request, HandlerContext& ctx) -> Result<Value>;
auto handle(Value& presentation, const UpdateSlideProperties& request, HandlerContext& ctx) -> Result<Value>;
auto handle(Value& presentation, const DeleteObject& request, HandlerContext& ctx) -> Result<Value>;
auto handle(Value& presentation, const DuplicateObject& request, HandlerContext& ctx) -> Result<Value>;

// -- Page elements ------------------------------------------------------------

auto handle(Value& presentation, const CreateShape& request, HandlerContext& ctx) -> Result<Value>;
auto handle(Value& presentation, const GroupObjects& request, HandlerContext& ctx) -> Result<Value>;
auto handle(Value& presentation, const UngroupObjects& request, HandlerContext& ctx) -> Result<Value>;
auto handle(Value& presentation, const UpdatePageElementAltText& request, HandlerContext& ctx) -> Result<Value>;

// -- Text ---------------------------------------------------------------------

auto handle(Value& presentation, const InsertText& request, HandlerContext& ctx) -> Result<Value>;
auto handle(Value& presentation, const DeleteText& request, HandlerContext& ctx) -> Result<Value>;
auto handle(Value& presentation, const ReplaceAllText& request, HandlerContext& ctx) -> Result<Value>;
auto handle(Value& presentation, const UpdateTextStyle& request, HandlerContext& ctx) -> Result<Value>;

}  // namespace slides_cpp

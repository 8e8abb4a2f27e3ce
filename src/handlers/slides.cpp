#include "common.hpp"

#include <slides-cpp/field_mask.hpp>
#include <slides-cpp/locator.hpp>
#include <slides-cpp/path.hpp>
#include <slides-cpp/text.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace slides_cpp {

using detail::quote_id;
using detail::touch_page;

namespace {

struct StandardLayout {
    std::string_view name;
    std::string_view display_name;
};

constexpr std::array<StandardLayout, 10> standard_layouts = {{
    {"BLANK", "Blank"},
    {"TITLE", "Title Slide"},
    {"TITLE_AND_BODY", "Title and Body"},
    {"TITLE_AND_TWO_COLUMNS", "Title and Two Columns"},
    {"TITLE_ONLY", "Title Only"},
    {"SECTION_HEADER", "Section Header"},
    {"CAPTION_ONLY", "Caption Only"},
    {"ONE_COLUMN_TEXT", "One Column Text"},
    {"MAIN_POINT", "Main Point"},
    {"BIG_NUMBER", "Big Number"},
}};

constexpr std::string_view speaker_notes_path = "notesPage.notesProperties.speakerNotesObjectId";

auto to_lower(std::string_view s) -> std::string {
    auto out = std::string{};
    out.reserve(s.size());
    for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

// "TITLE_AND_BODY" -> "Title And Body"
auto title_case(std::string_view name) -> std::string {
    auto out = std::string{};
    auto word_start = true;
    for (char c : name) {
        if (c == '_') {
            out.push_back(' ');
            word_start = true;
            continue;
        }
        auto uc = static_cast<unsigned char>(c);
        out.push_back(static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc)));
        word_start = false;
    }
    return out;
}

auto white_background() -> Value {
    return {{"backgroundColor", {{"opaqueColor", {{"rgbColor",
        {{"red", 1.0}, {"green", 1.0}, {"blue", 1.0}}}}}}}};
}

auto black_background() -> Value {
    return {{"backgroundColor", {{"opaqueColor", {{"rgbColor",
        {{"red", 0.0}, {"green", 0.0}, {"blue", 0.0}}}}}}}};
}

auto new_layout_id(std::string_view name, HandlerContext& ctx) -> std::string {
    return "layout_" + to_lower(name) + "_" + ctx.ids.new_id().substr(0, 8);
}

auto make_layout(std::string id, std::string_view name, std::string display_name,
                 HandlerContext& ctx) -> Value {
    return {
        {"objectId", std::move(id)},
        {"pageType", "LAYOUT"},
        {"revisionId", ctx.ids.new_id()},
        {"pageProperties", white_background()},
        {"layoutProperties", {{"name", std::string{name}}, {"displayName", std::move(display_name)}}},
        {"pageElements", Value::array()},
    };
}

auto make_placeholder(std::string_view type, double height, double translate_y,
                      HandlerContext& ctx) -> Value {
    auto text_elements = Value::array();
    reindex_text_elements(text_elements);
    return {
        {"objectId", to_lower(type) + "_placeholder_" + ctx.ids.new_id().substr(0, 8)},
        {"shape", {{"shapeType", "TEXT_BOX"}, {"text", {{"textElements", std::move(text_elements)}}}}},
        {"size", {
            {"width", {{"magnitude", 400.0}, {"unit", "PT"}}},
            {"height", {{"magnitude", height}, {"unit", "PT"}}},
        }},
        {"transform", {
            {"scaleX", 1.0}, {"scaleY", 1.0},
            {"translateX", 50.0}, {"translateY", translate_y},
            {"unit", "PT"},
        }},
        {"placeholder", {{"type", std::string{type}}, {"index", 0}}},
    };
}

// A layout skeleton for a predefined layout the deck does not have yet.
auto make_predefined_layout(std::string_view name, HandlerContext& ctx) -> Value {
    auto layout = make_layout(new_layout_id(name, ctx), name, title_case(name), ctx);
    auto& elements = layout["pageElements"];
    if (name == "TITLE_AND_BODY") {
        elements.push_back(make_placeholder("TITLE", 50.0, 50.0, ctx));
        elements.push_back(make_placeholder("BODY", 200.0, 120.0, ctx));
    } else if (name == "TITLE") {
        elements.push_back(make_placeholder("TITLE", 100.0, 100.0, ctx));
    }
    return layout;
}

auto layout_matches(const Value& layout, std::string_view name) -> bool {
    const auto* props = find_member(layout, "layoutProperties");
    if (!props) return false;
    return get_string(*props, "name") == name || get_string(*props, "displayName") == name;
}

auto find_layout_by_name(Value& presentation, std::string_view name) -> Value* {
    auto* layouts = find_member(presentation, "layouts");
    if (!layouts || !layouts->is_array()) return nullptr;
    for (auto& layout : *layouts) {
        if (layout_matches(layout, name)) return &layout;
    }
    return nullptr;
}

auto is_predefined_layout(std::string_view name) -> bool {
    return std::find(predefined_layout_names.begin(), predefined_layout_names.end(), name)
        != predefined_layout_names.end();
}

auto is_id_start(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

auto is_id_char(char c) -> bool {
    return is_id_start(c) || c == ':' || c == '-';
}

}  // anonymous namespace

auto check_new_object_id(std::string_view id, const StoreOptions& options) -> Result<void> {
    if (id.empty()) return invalid_input("object ID must not be empty");
    if (!options.validate_object_ids) return {};
    if (id.size() > options.max_object_id_length) {
        return invalid_input("object ID " + quote_id(id) + " is longer than "
                             + std::to_string(options.max_object_id_length) + " characters");
    }
    if (!is_id_start(id.front()) || !std::all_of(id.begin(), id.end(), is_id_char)) {
        return invalid_input("object ID " + quote_id(id)
                             + " must match [a-zA-Z0-9_][a-zA-Z0-9_:-]*");
    }
    return {};
}

void ensure_standard_layouts(Value& presentation, HandlerContext& ctx) {
    auto& layouts = ensure_array(presentation, "layouts");
    for (const auto& standard : standard_layouts) {
        if (!ctx.options.ensure_standard_layouts && standard.name != "BLANK") continue;
        auto present = std::any_of(layouts.begin(), layouts.end(), [&](const Value& layout) {
            return layout_matches(layout, standard.name) || layout_matches(layout, standard.display_name);
        });
        if (present) continue;
        layouts.push_back(make_layout(new_layout_id(standard.name, ctx), standard.name,
                                      std::string{standard.display_name}, ctx));
    }
}

// -- createSlide --------------------------------------------------------------

auto handle(Value& presentation, const CreateSlide& request, HandlerContext& ctx) -> Result<Value> {
    auto slide_id = std::string{};
    if (request.object_id) {
        if (auto ok = detail::check_unused_id(presentation, *request.object_id, ctx); !ok) {
            return ok.error();
        }
        slide_id = *request.object_id;
    }
    if (request.insertion_index && *request.insertion_index < 0) {
        return invalid_input("insertionIndex must not be negative");
    }

    std::optional<std::string> layout_id;
    std::optional<std::string> predefined;
    if (request.layout && request.layout->layout_id) {
        layout_id = *request.layout->layout_id;
        if (!find_layout(presentation, *layout_id)) {
            return not_found("layout with ID " + quote_id(*layout_id) + " not found");
        }
    } else if (request.layout && request.layout->predefined_layout) {
        predefined = *request.layout->predefined_layout;
        if (!is_predefined_layout(*predefined)) {
            return invalid_input("unknown predefined layout " + quote_id(*predefined));
        }
    }

    // Validation is complete; everything below writes.
    ctx.mutated = true;
    if (predefined) {
        if (auto* existing = find_layout_by_name(presentation, *predefined)) {
            layout_id = get_string(*existing, "objectId");
        } else {
            auto layout = make_predefined_layout(*predefined, ctx);
            layout_id = layout["objectId"].get<std::string>();
            ensure_array(presentation, "layouts").push_back(std::move(layout));
        }
    } else if (!layout_id) {
        ensure_standard_layouts(presentation, ctx);
        if (const auto* blank = find_layout_by_name(presentation, "BLANK")) {
            layout_id = get_string(*blank, "objectId");
        }
    }

    if (slide_id.empty()) slide_id = ctx.ids.new_id("slide");

    auto slide = Value{
        {"objectId", slide_id},
        {"pageType", "SLIDE"},
        {"revisionId", ctx.ids.new_id()},
        {"pageProperties", black_background()},
        {"slideProperties", {{"layoutObjectId", layout_id ? Value(*layout_id) : Value()}}},
        {"pageElements", Value::array()},
    };

    auto& slides = ensure_array(presentation, "slides");
    auto at = std::min(static_cast<std::size_t>(request.insertion_index.value_or(
                           static_cast<std::int64_t>(slides.size()))),
                       slides.size());
    slides.insert(slides.begin() + static_cast<std::ptrdiff_t>(at), std::move(slide));
    return Value{{"objectId", slide_id}};
}

// -- updateSlideProperties ----------------------------------------------------

auto handle(Value& presentation, const UpdateSlideProperties& request, HandlerContext& ctx) -> Result<Value> {
    auto* slide = find_slide(presentation, request.object_id);
    if (!slide) return not_found("slide " + quote_id(request.object_id) + " not found");

    const Value* speaker_notes_id = nullptr;
    if (mask_touches(request.fields, speaker_notes_path)) {
        speaker_notes_id = find_path(request.slide_properties, speaker_notes_path);
        if (speaker_notes_id && speaker_notes_id->is_null()) speaker_notes_id = nullptr;
    }
    if (speaker_notes_id && !notes_page(*slide)) {
        return invalid_input("slide " + quote_id(request.object_id)
                             + " has no canonical notesPage to update");
    }

    auto& properties = ensure_object(*slide, "slideProperties");
    if (auto applied = apply_field_mask(properties, request.slide_properties, request.fields); !applied) {
        touch_page(slide, ctx);
        return applied.error();
    }

    if (speaker_notes_id) {
        auto& notes_properties = ensure_object(*notes_page(*slide), "notesPageProperties");
        notes_properties["speakerNotesObjectId"] = *speaker_notes_id;
    }
    touch_page(slide, ctx);
    return Value::object();
}

// -- deleteObject -------------------------------------------------------------

namespace {

// Remove every element carrying `id` from a sequence and from nested
// groups; a group left without children is removed as well.
auto prune_elements(Value& elements, std::string_view id) -> bool {
    if (!elements.is_array()) return false;
    auto removed = false;
    for (std::size_t i = 0; i < elements.size();) {
        auto& element = elements[i];
        if (has_object_id(element, id)) {
            elements.erase(i);
            removed = true;
            continue;
        }
        if (auto* children = group_children(element)) {
            if (!children->empty() && prune_elements(*children, id)) {
                removed = true;
                if (children->empty()) {
                    elements.erase(i);
                    continue;
                }
            }
        }
        ++i;
    }
    return removed;
}

}  // anonymous namespace

auto handle(Value& presentation, const DeleteObject& request, HandlerContext& ctx) -> Result<Value> {
    if (auto index = find_slide_index(presentation, request.object_id)) {
        presentation["slides"].erase(*index);
        ctx.mutated = true;
        return Value::object();
    }

    auto* slides = find_member(presentation, "slides");
    if (slides && slides->is_array()) {
        for (auto& slide : *slides) {
            if (auto* elements = find_member(slide, "pageElements");
                elements && prune_elements(*elements, request.object_id)) {
                touch_page(&slide, ctx);
                return Value::object();
            }
            if (auto* notes = notes_page(slide)) {
                if (auto* elements = find_member(*notes, "pageElements");
                    elements && prune_elements(*elements, request.object_id)) {
                    touch_page(notes, ctx);
                    return Value::object();
                }
            }
        }
    }
    return not_found("object with ID " + quote_id(request.object_id) + " not found for deletion");
}

// -- duplicateObject ----------------------------------------------------------

auto handle(Value& presentation, const DuplicateObject& request, HandlerContext& ctx) -> Result<Value> {
    for (const auto& [old_id, new_id] : request.object_ids) {
        if (auto ok = detail::check_unused_id(presentation, new_id, ctx); !ok) return ok.error();
    }

    auto id_map = request.object_ids;

    if (auto index = find_slide_index(presentation, request.object_id)) {
        auto& slides = presentation["slides"];
        auto [it, inserted] = id_map.try_emplace(request.object_id, std::string{});
        if (inserted) it->second = ctx.ids.new_id("slide");
        auto copy = ctx.ids.remap(slides[*index], id_map);
        copy["revisionId"] = ctx.ids.new_id();
        auto new_id = it->second;
        slides.insert(slides.begin() + static_cast<std::ptrdiff_t>(*index + 1), std::move(copy));
        ctx.mutated = true;
        return Value{{"objectId", new_id}};
    }

    auto location = find_element(presentation, request.object_id);
    if (!location) {
        return not_found("object with ID " + quote_id(request.object_id) + " not found for duplication");
    }

    auto [it, inserted] = id_map.try_emplace(request.object_id, std::string{});
    if (inserted) it->second = ctx.ids.new_id();
    auto new_id = it->second;
    auto copy = ctx.ids.remap(*location->element, id_map);
    auto& container = *location->container;
    container.insert(container.begin() + static_cast<std::ptrdiff_t>(location->index + 1),
                     std::move(copy));
    touch_page(location->page, ctx);
    return Value{{"objectId", new_id}};
}

}  // namespace slides_cpp

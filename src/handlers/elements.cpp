#include "common.hpp"

#include <slides-cpp/locator.hpp>
#include <slides-cpp/text.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace slides_cpp {

using detail::quote_id;
using detail::touch_page;

namespace {

auto top_level_index(const Value& slide, std::string_view id) -> std::optional<std::size_t> {
    const auto* elements = find_member(slide, "pageElements");
    if (!elements || !elements->is_array()) return std::nullopt;
    for (std::size_t i = 0; i < elements->size(); ++i) {
        if (has_object_id((*elements)[i], id)) return i;
    }
    return std::nullopt;
}

// The slide with `id` among its top-level elements.
auto slide_owning(Value& presentation, std::string_view id) -> Value* {
    auto* slides = find_member(presentation, "slides");
    if (!slides || !slides->is_array()) return nullptr;
    for (auto& slide : *slides) {
        if (top_level_index(slide, id)) return &slide;
    }
    return nullptr;
}

auto contains(const std::vector<std::string>& ids, std::string_view id) -> bool {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

}  // anonymous namespace

// -- createShape --------------------------------------------------------------

auto handle(Value& presentation, const CreateShape& request, HandlerContext& ctx) -> Result<Value> {
    if (request.shape_type.empty()) {
        return invalid_input("shapeType is required to create a shape");
    }
    if (!request.page_object_id || request.page_object_id->empty()) {
        return invalid_input("elementProperties.pageObjectId is required to create a shape");
    }
    if (request.object_id) {
        if (auto ok = detail::check_unused_id(presentation, *request.object_id, ctx); !ok) {
            return ok.error();
        }
    }
    auto* page = find_slide(presentation, *request.page_object_id);
    if (!page) {
        return not_found("page with ID " + quote_id(*request.page_object_id)
                         + " not found for creating shape");
    }

    auto shape_id = request.object_id ? *request.object_id : ctx.ids.new_id();
    auto shape = Value{{"shapeType", request.shape_type}};
    if (request.shape_type == "TEXT_BOX") {
        auto text_elements = Value::array();
        reindex_text_elements(text_elements);
        shape["text"] = Value{{"textElements", std::move(text_elements)}};
    }

    auto element = Value{{"objectId", shape_id}, {"shape", std::move(shape)}};
    if (request.size) element["size"] = *request.size;
    if (request.transform) element["transform"] = *request.transform;

    ensure_array(*page, "pageElements").push_back(std::move(element));
    touch_page(page, ctx);
    return Value{{"objectId", shape_id}};
}

// -- groupObjects -------------------------------------------------------------

auto handle(Value& presentation, const GroupObjects& request, HandlerContext& ctx) -> Result<Value> {
    const auto& children = request.children_object_ids;
    if (children.size() < 2) {
        return invalid_input("groupObjects needs at least two children");
    }
    if (std::set<std::string>(children.begin(), children.end()).size() != children.size()) {
        return invalid_input("childrenObjectIds must not repeat an ID");
    }
    if (request.group_object_id) {
        if (auto ok = detail::check_unused_id(presentation, *request.group_object_id, ctx); !ok) {
            return ok.error();
        }
    }

    auto* slide = slide_owning(presentation, children.front());
    if (!slide) {
        return not_found("slide for elements to group not found: no slide holds "
                         + quote_id(children.front()));
    }
    for (const auto& id : children) {
        if (!top_level_index(*slide, id)) {
            return not_found("object " + quote_id(id) + " is not a top-level element of slide "
                             + quote_id(get_string(*slide, "objectId").value_or("")));
        }
    }

    auto& elements = (*slide)["pageElements"];
    auto grouped = Value::array();
    auto kept = Value::array();
    for (auto& element : elements) {
        const auto id = get_string(element, "objectId");
        if (id && contains(children, *id)) {
            grouped.push_back(std::move(element));
        } else {
            kept.push_back(std::move(element));
        }
    }

    auto group_id = request.group_object_id ? *request.group_object_id : ctx.ids.new_id();
    kept.push_back(Value{
        {"objectId", group_id},
        {"elementGroup", {{"children", std::move(grouped)}}},
    });
    elements = std::move(kept);
    touch_page(slide, ctx);
    return Value{{"objectId", group_id}};
}

// -- ungroupObjects -----------------------------------------------------------

auto handle(Value& presentation, const UngroupObjects& request, HandlerContext& ctx) -> Result<Value> {
    const auto& ids = request.object_ids;
    if (ids.empty()) return invalid_input("objectIds list cannot be empty");

    auto* slides = find_member(presentation, "slides");
    if (slides && slides->is_array()) {
        for (auto& slide : *slides) {
            auto* elements = find_member(slide, "pageElements");
            if (!elements || !elements->is_array()) continue;

            for (std::size_t i = 0; i < elements->size(); ++i) {
                auto& group = (*elements)[i];
                auto* members = group_children(group);
                if (!members) continue;

                auto group_id = get_string(group, "objectId").value_or("");
                auto whole_group = contains(ids, group_id);
                auto released = Value::array();
                auto kept = Value::array();
                for (auto& child : *members) {
                    const auto child_id = get_string(child, "objectId");
                    if (whole_group || (child_id && contains(ids, *child_id))) {
                        released.push_back(child);
                    } else {
                        kept.push_back(child);
                    }
                }
                if (released.empty()) continue;

                if (kept.empty()) {
                    elements->erase(i);
                } else {
                    *members = std::move(kept);
                }
                for (auto& child : released) elements->push_back(std::move(child));
                touch_page(&slide, ctx);
                return Value{{"objectId", group_id}};
            }
        }
    }
    return not_found("no group on any slide holds the requested objects");
}

// -- updatePageElementAltText -------------------------------------------------

auto handle(Value& presentation, const UpdatePageElementAltText& request, HandlerContext& ctx) -> Result<Value> {
    auto location = find_element(presentation, request.object_id);
    if (!location) {
        return not_found("page element " + quote_id(request.object_id) + " not found");
    }
    auto& element = *location->element;
    if (request.title) element["title"] = *request.title;
    if (request.description) element["description"] = *request.description;
    touch_page(location->page, ctx);
    return Value::object();
}

}  // namespace slides_cpp

#include <slides-cpp/locator.hpp>

#include <array>
#include <string>
#include <utility>

namespace slides_cpp {

namespace {

constexpr std::array<std::string_view, 3> page_sections = {"slides", "layouts", "masters"};

auto find_in_section(const Value& presentation, std::string_view section,
                     std::string_view id) -> const Value* {
    const auto* pages = find_member(presentation, section);
    if (!pages || !pages->is_array()) return nullptr;
    for (const auto& page : *pages) {
        if (has_object_id(page, id)) return &page;
    }
    return nullptr;
}

auto page_elements(Value& page) -> Value* {
    auto* elements = find_member(page, "pageElements");
    return elements && elements->is_array() ? elements : nullptr;
}

auto contains_in_elements(const Value& elements, std::string_view id) -> bool {
    auto found = false;
    for_each_element(elements, [&](const Value& element) {
        if (has_object_id(element, id)) found = true;
    });
    return found;
}

}  // anonymous namespace

// -- Pages --------------------------------------------------------------------

auto find_slide(const Value& presentation, std::string_view id) -> const Value* {
    return find_in_section(presentation, "slides", id);
}

auto find_slide(Value& presentation, std::string_view id) -> Value* {
    return const_cast<Value*>(find_slide(std::as_const(presentation), id));
}

auto find_slide_index(const Value& presentation, std::string_view id) -> std::optional<std::size_t> {
    const auto* slides = find_member(presentation, "slides");
    if (!slides || !slides->is_array()) return std::nullopt;
    for (std::size_t i = 0; i < slides->size(); ++i) {
        if (has_object_id((*slides)[i], id)) return i;
    }
    return std::nullopt;
}

auto find_layout(Value& presentation, std::string_view id) -> Value* {
    return const_cast<Value*>(find_in_section(presentation, "layouts", id));
}

auto find_page(const Value& presentation, std::string_view id) -> const Value* {
    for (auto section : page_sections) {
        if (const auto* page = find_in_section(presentation, section, id)) return page;
    }
    const auto* notes_master = find_member(presentation, "notesMaster");
    if (!notes_master) return nullptr;
    if (notes_master->is_array()) {
        for (const auto& page : *notes_master) {
            if (has_object_id(page, id)) return &page;
        }
        return nullptr;
    }
    return has_object_id(*notes_master, id) ? notes_master : nullptr;
}

auto find_page(Value& presentation, std::string_view id) -> Value* {
    return const_cast<Value*>(find_page(std::as_const(presentation), id));
}

auto notes_page(const Value& slide) -> const Value* {
    const auto* notes = find_member(slide, "notesPage");
    return notes && notes->is_object() ? notes : nullptr;
}

auto notes_page(Value& slide) -> Value* {
    return const_cast<Value*>(notes_page(std::as_const(slide)));
}

// -- Elements -----------------------------------------------------------------

auto group_children(const Value& element) -> const Value* {
    const auto* group = find_member(element, "elementGroup");
    if (!group) return nullptr;
    const auto* children = find_member(*group, "children");
    return children && children->is_array() ? children : nullptr;
}

auto group_children(Value& element) -> Value* {
    return const_cast<Value*>(group_children(std::as_const(element)));
}

auto find_in_elements(Value& elements, std::string_view id, Value* page)
    -> std::optional<ElementLocation> {
    if (!elements.is_array()) return std::nullopt;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        auto& element = elements[i];
        if (has_object_id(element, id)) {
            return ElementLocation{&element, &elements, i, page, nullptr};
        }
        if (auto* children = group_children(element)) {
            if (auto found = find_in_elements(*children, id, page)) {
                if (!found->group) found->group = &element;
                return found;
            }
        }
    }
    return std::nullopt;
}

auto find_element(Value& presentation, std::string_view id) -> Result<ElementLocation> {
    auto* slides = find_member(presentation, "slides");
    if (slides && slides->is_array()) {
        for (auto& slide : *slides) {
            if (auto* elements = page_elements(slide)) {
                if (auto found = find_in_elements(*elements, id, &slide)) return *found;
            }
            if (auto* notes = notes_page(slide)) {
                if (auto* elements = page_elements(*notes)) {
                    if (auto found = find_in_elements(*elements, id, notes)) return *found;
                }
            }
        }
    }
    return not_found("object with ID '" + std::string{id} + "' not found");
}

void for_each_element(Value& elements, const std::function<void(Value&)>& fn) {
    if (!elements.is_array()) return;
    for (auto& element : elements) {
        fn(element);
        if (auto* children = group_children(element)) {
            for_each_element(*children, fn);
        }
    }
}

void for_each_element(const Value& elements, const std::function<void(const Value&)>& fn) {
    if (!elements.is_array()) return;
    for (const auto& element : elements) {
        fn(element);
        if (const auto* children = group_children(element)) {
            for_each_element(*children, fn);
        }
    }
}

auto contains_object_id(const Value& presentation, std::string_view id) -> bool {
    auto page_contains = [&](const Value& page) {
        if (has_object_id(page, id)) return true;
        if (const auto* elements = find_member(page, "pageElements")) {
            if (contains_in_elements(*elements, id)) return true;
        }
        if (const auto* notes = notes_page(page)) {
            if (has_object_id(*notes, id)) return true;
            if (const auto* elements = find_member(*notes, "pageElements")) {
                if (contains_in_elements(*elements, id)) return true;
            }
        }
        return false;
    };
    for (auto section : page_sections) {
        const auto* pages = find_member(presentation, section);
        if (!pages || !pages->is_array()) continue;
        for (const auto& page : *pages) {
            if (page_contains(page)) return true;
        }
    }
    return false;
}

}  // namespace slides_cpp

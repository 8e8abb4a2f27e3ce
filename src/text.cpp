#include <slides-cpp/text.hpp>
#include <slides-cpp/locator.hpp>

#include <utility>

namespace slides_cpp {

namespace {

auto is_continuation(char c) -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

auto trim(std::string_view s) -> std::string_view {
    constexpr std::string_view ws = " \t\r\n\v\f";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

auto ends_with_paragraph_marker(const Value& text_elements) -> bool {
    return !text_elements.empty() && text_elements.back().is_object()
        && text_elements.back().contains("paragraphMarker");
}

void collect_run_text(const Value& text_elements, std::vector<std::string>& out) {
    if (!text_elements.is_array()) return;
    for (const auto& text_element : text_elements) {
        const auto* run = find_member(text_element, "textRun");
        if (!run) continue;
        auto content = get_string(*run, "content");
        if (!content) continue;
        auto trimmed = trim(*content);
        if (!trimmed.empty()) out.emplace_back(trimmed);
    }
}

}  // anonymous namespace

auto utf8_length(std::string_view s) -> std::size_t {
    auto n = std::size_t{0};
    for (char c : s) {
        if (!is_continuation(c)) ++n;
    }
    return n;
}

auto utf8_offset(std::string_view s, std::size_t index) -> std::size_t {
    auto seen = std::size_t{0};
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (is_continuation(s[i])) continue;
        if (seen == index) return i;
        ++seen;
    }
    return s.size();
}

auto make_paragraph_marker() -> Value {
    return Value{{"paragraphMarker", {{"style", Value::object()}}}};
}

auto make_text_run(std::string content, Value style) -> Value {
    return Value{{"textRun", {{"content", std::move(content)}, {"style", std::move(style)}}}};
}

auto text_element_length(const Value& text_element) -> std::size_t {
    if (const auto* run = find_member(text_element, "textRun")) {
        auto content = get_string(*run, "content");
        return content ? utf8_length(*content) : 0;
    }
    if (find_member(text_element, "paragraphMarker")) return 1;
    return 0;
}

void reindex_text_elements(Value& text_elements) {
    if (!text_elements.is_array()) text_elements = Value::array();
    if (!ends_with_paragraph_marker(text_elements)) {
        text_elements.push_back(make_paragraph_marker());
    }
    auto offset = std::size_t{0};
    for (auto& text_element : text_elements) {
        if (!text_element.is_object()) continue;
        text_element["startIndex"] = offset;
        offset += text_element_length(text_element);
        text_element["endIndex"] = offset;
    }
}

auto find_text_elements(const Value& element) -> const Value* {
    const auto* shape = find_member(element, "shape");
    if (!shape) return nullptr;
    const auto* text = find_member(*shape, "text");
    if (!text) return nullptr;
    const auto* elements = find_member(*text, "textElements");
    return elements && elements->is_array() ? elements : nullptr;
}

auto find_text_elements(Value& element) -> Value* {
    return const_cast<Value*>(find_text_elements(std::as_const(element)));
}

auto ensure_text_elements(Value& element) -> Value& {
    auto& shape = ensure_object(element, "shape");
    auto& text = ensure_object(shape, "text");
    auto& text_elements = ensure_array(text, "textElements");
    if (text_elements.empty()) reindex_text_elements(text_elements);
    return text_elements;
}

auto text_runs(Value& element) -> std::vector<Value*> {
    auto runs = std::vector<Value*>{};
    auto* text_elements = find_text_elements(element);
    if (!text_elements) return runs;
    for (auto& text_element : *text_elements) {
        auto* run = find_member(text_element, "textRun");
        if (run && run->is_object()) runs.push_back(run);
    }
    return runs;
}

auto collect_text(const Value& elements) -> std::vector<std::string> {
    auto out = std::vector<std::string>{};
    for_each_element(elements, [&](const Value& element) {
        if (const auto* text_elements = find_text_elements(element)) {
            collect_run_text(*text_elements, out);
        }
        const auto* table = find_member(element, "table");
        if (!table) return;
        const auto* rows = find_member(*table, "tableRows");
        if (!rows || !rows->is_array()) return;
        for (const auto& row : *rows) {
            const auto* cells = find_member(row, "tableCells");
            if (!cells || !cells->is_array()) continue;
            for (const auto& cell : *cells) {
                const auto* text = find_member(cell, "text");
                if (!text) continue;
                if (const auto* cell_elements = find_member(*text, "textElements")) {
                    collect_run_text(*cell_elements, out);
                }
            }
        }
    });
    return out;
}

}  // namespace slides_cpp

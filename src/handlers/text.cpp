#include "common.hpp"

#include <slides-cpp/field_mask.hpp>
#include <slides-cpp/locator.hpp>
#include <slides-cpp/text.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <set>
#include <string>
#include <utility>

namespace slides_cpp {

using detail::quote_id;
using detail::touch_page;

namespace {

auto first_run_index(const Value& text_elements) -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < text_elements.size(); ++i) {
        const auto* run = find_member(text_elements[i], "textRun");
        if (run && run->is_object()) return i;
    }
    return std::nullopt;
}

auto ascii_lower(char c) -> char {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

// Position of `needle` in `haystack` at or after `from`.
auto find_text(std::string_view haystack, std::string_view needle, std::size_t from,
               bool match_case) -> std::size_t {
    if (match_case) return haystack.find(needle, from);
    if (needle.size() > haystack.size()) return std::string_view::npos;
    for (auto i = from; i + needle.size() <= haystack.size(); ++i) {
        auto equal = std::equal(needle.begin(), needle.end(), haystack.begin() + static_cast<std::ptrdiff_t>(i),
                                [](char a, char b) { return ascii_lower(a) == ascii_lower(b); });
        if (equal) return i;
    }
    return std::string_view::npos;
}

// Replace every non-overlapping occurrence, left to right.
auto replace_all(std::string& content, std::string_view find, std::string_view replacement,
                 bool match_case) -> std::size_t {
    auto out = std::string{};
    auto count = std::size_t{0};
    auto pos = std::size_t{0};
    for (;;) {
        auto hit = find_text(content, find, pos, match_case);
        if (hit == std::string_view::npos) break;
        out.append(content, pos, hit - pos);
        out.append(replacement);
        pos = hit + find.size();
        ++count;
    }
    if (count == 0) return 0;
    out.append(content, pos, std::string::npos);
    content = std::move(out);
    return count;
}

// Replace in every run of every element of a page; returns the count.
auto replace_on_page(Value& page, const ReplaceAllText& request) -> std::size_t {
    auto* elements = find_member(page, "pageElements");
    if (!elements) return 0;
    auto total = std::size_t{0};
    for_each_element(*elements, [&](Value& element) {
        auto changed = std::size_t{0};
        for (auto* run : text_runs(element)) {
            auto* content = find_member(*run, "content");
            if (!content || !content->is_string()) continue;
            changed += replace_all(content->get_ref<std::string&>(), request.find_text,
                                   request.replace_text, request.match_case);
        }
        if (changed > 0) {
            reindex_text_elements(*find_text_elements(element));
            total += changed;
        }
    });
    return total;
}

auto reject_cell(const std::optional<TableCellLocation>& cell, std::string_view what) -> Result<void> {
    if (cell) return unimplemented("table cell text " + std::string{what} + " is not simulated");
    return {};
}

}  // anonymous namespace

// -- insertText ---------------------------------------------------------------

auto handle(Value& presentation, const InsertText& request, HandlerContext& ctx) -> Result<Value> {
    if (auto ok = reject_cell(request.cell_location, "insertion"); !ok) return ok.error();
    auto location = find_element(presentation, request.object_id);
    if (!location) {
        return not_found("object with ID " + quote_id(request.object_id)
                         + " not found for insertText request");
    }

    auto& text_elements = ensure_text_elements(*location->element);
    auto run_index = first_run_index(text_elements);
    if (!run_index) {
        text_elements.insert(text_elements.begin(), make_text_run(""));
        run_index = 0;
    }

    auto& run = text_elements[*run_index]["textRun"];
    auto& content = run["content"];
    if (!content.is_string()) content = "";
    auto& current = content.get_ref<std::string&>();

    auto length = static_cast<std::int64_t>(utf8_length(current));
    auto index = std::clamp(request.insertion_index.value_or(length), std::int64_t{0}, length);
    current.insert(utf8_offset(current, static_cast<std::size_t>(index)), request.text);

    reindex_text_elements(text_elements);
    touch_page(location->page, ctx);
    return Value::object();
}

// -- deleteText ---------------------------------------------------------------

auto handle(Value& presentation, const DeleteText& request, HandlerContext& ctx) -> Result<Value> {
    if (auto ok = reject_cell(request.cell_location, "deletion"); !ok) return ok.error();
    auto location = find_element(presentation, request.object_id);
    if (!location) return location.error();

    const auto& range = request.text_range;
    if (range.type == RangeType::fixed_range && (!range.start_index || !range.end_index)) {
        return invalid_input("FIXED_RANGE needs startIndex and endIndex");
    }
    if (range.type == RangeType::from_start_index && !range.start_index) {
        return invalid_input("FROM_START_INDEX needs startIndex");
    }

    auto* text_elements = find_text_elements(*location->element);
    if (!text_elements || text_elements->empty()) return Value::object();

    auto content = std::string{};
    auto style = Value::object();
    if (auto run_index = first_run_index(*text_elements)) {
        const auto& run = (*text_elements)[*run_index]["textRun"];
        content = get_string(run, "content").value_or("");
        if (const auto* s = find_member(run, "style"); s && s->is_object()) style = *s;
    }

    auto length = static_cast<std::int64_t>(utf8_length(content));
    auto start = std::int64_t{0};
    auto end = length;
    if (range.type != RangeType::all) start = *range.start_index;
    if (range.type == RangeType::fixed_range) end = *range.end_index;
    start = std::clamp(start, std::int64_t{0}, length);
    end = std::clamp(end, start, length);

    if (start < end) {
        auto from = utf8_offset(content, static_cast<std::size_t>(start));
        auto to = utf8_offset(content, static_cast<std::size_t>(end));
        content.erase(from, to - from);
    }

    auto rebuilt = Value::array();
    if (!content.empty()) rebuilt.push_back(make_text_run(std::move(content), std::move(style)));
    reindex_text_elements(rebuilt);
    *text_elements = std::move(rebuilt);
    touch_page(location->page, ctx);
    return Value::object();
}

// -- replaceAllText -----------------------------------------------------------

auto handle(Value& presentation, const ReplaceAllText& request, HandlerContext& ctx) -> Result<Value> {
    if (request.find_text.empty()) {
        return invalid_input("containsText.text must not be empty");
    }

    const auto wanted = std::set<std::string, std::less<>>(request.page_object_ids.begin(),
                                                           request.page_object_ids.end());
    // Slides, then masters, then layouts; page IDs narrow the scan.
    constexpr std::array<std::string_view, 3> sections = {"slides", "masters", "layouts"};

    auto occurrences = std::size_t{0};
    for (auto section : sections) {
        auto* pages = find_member(presentation, section);
        if (!pages || !pages->is_array()) continue;
        for (auto& page : *pages) {
            if (!wanted.empty()) {
                auto id = get_string(page, "objectId");
                if (!id || !wanted.contains(*id)) continue;
            }
            auto changed = replace_on_page(page, request);
            if (changed > 0) touch_page(&page, ctx);
            occurrences += changed;
        }
    }
    return Value{{"occurrencesChanged", occurrences}};
}

// -- updateTextStyle ----------------------------------------------------------

auto handle(Value& presentation, const UpdateTextStyle& request, HandlerContext& ctx) -> Result<Value> {
    if (auto ok = reject_cell(request.cell_location, "styling"); !ok) return ok.error();
    auto location = find_element(presentation, request.object_id);
    if (!location) return location.error();

    const auto masked = request.fields && !parse_field_mask(*request.fields).empty()
                     && *request.fields != full_replace_mask;

    for (auto* run : text_runs(*location->element)) {
        auto& style = ensure_object(*run, "style");
        if (masked) {
            if (auto applied = apply_field_mask(style, request.style, *request.fields); !applied) {
                touch_page(location->page, ctx);
                return applied.error();
            }
        } else {
            for (const auto& [key, value] : request.style.items()) style[key] = value;
        }
    }
    touch_page(location->page, ctx);
    return request.style;
}

}  // namespace slides_cpp

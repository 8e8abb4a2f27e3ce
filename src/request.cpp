#include <slides-cpp/request.hpp>

#include <functional>
#include <limits>
#include <map>
#include <utility>

namespace slides_cpp {

namespace {

// Typed reads from one request's parameter object. The first type error
// is remembered; later reads return empty values. Null counts as absent.
class Params {
public:
    Params(const Value& params, std::string_view op) : params_{params}, op_{op} {}

    auto failed() const -> bool { return error_.has_value(); }
    auto error() const -> const Error& { return *error_; }

    auto has(std::string_view key) const -> bool {
        const auto* v = find_member(params_, key);
        return v && !v->is_null();
    }

    auto required_string(std::string_view key) -> std::string {
        if (!has(key)) {
            fail(std::string{key} + " is required");
            return {};
        }
        return optional_string(key).value_or(std::string{});
    }

    auto optional_string(std::string_view key) -> std::optional<std::string> {
        const auto* v = member(key);
        if (!v) return std::nullopt;
        if (!v->is_string()) {
            fail(std::string{key} + " must be a string");
            return std::nullopt;
        }
        return v->get<std::string>();
    }

    auto optional_int(std::string_view key) -> std::optional<std::int64_t> {
        const auto* v = member(key);
        if (!v) return std::nullopt;
        if (!v->is_number_integer()) {
            fail(std::string{key} + " must be an integer");
            return std::nullopt;
        }
        constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (v->is_number_unsigned() && v->get<std::uint64_t>() > max) {
            fail(std::string{key} + " is out of range");
            return std::nullopt;
        }
        return v->get<std::int64_t>();
    }

    auto optional_bool(std::string_view key) -> std::optional<bool> {
        const auto* v = member(key);
        if (!v) return std::nullopt;
        if (!v->is_boolean()) {
            fail(std::string{key} + " must be a boolean");
            return std::nullopt;
        }
        return v->get<bool>();
    }

    auto optional_object(std::string_view key) -> std::optional<Value> {
        const auto* v = member(key);
        if (!v) return std::nullopt;
        if (!v->is_object()) {
            fail(std::string{key} + " must be an object");
            return std::nullopt;
        }
        return *v;
    }

    auto required_object(std::string_view key) -> Value {
        if (!has(key)) {
            fail(std::string{key} + " is required");
            return Value::object();
        }
        return optional_object(key).value_or(Value::object());
    }

    auto string_list(std::string_view key, bool required) -> std::vector<std::string> {
        auto out = std::vector<std::string>{};
        const auto* v = member(key);
        if (!v) {
            if (required) fail(std::string{key} + " is required");
            return out;
        }
        if (!v->is_array()) {
            fail(std::string{key} + " must be a list of strings");
            return out;
        }
        for (const auto& item : *v) {
            if (!item.is_string()) {
                fail(std::string{key} + " must be a list of strings");
                return {};
            }
            out.push_back(item.get<std::string>());
        }
        return out;
    }

    // Nested parameter object read with its own Params.
    auto nested(std::string_view key) -> std::optional<Params> {
        const auto* v = member(key);
        if (!v) return std::nullopt;
        if (!v->is_object()) {
            fail(std::string{key} + " must be an object");
            return std::nullopt;
        }
        return Params{*v, op_};
    }

    void absorb(const Params& other) {
        if (other.failed() && !failed()) error_ = other.error_;
    }

    void fail(std::string msg) {
        if (!error_) {
            error_ = invalid_input("invalid parameters for " + std::string{op_}
                                   + " request: " + std::move(msg));
        }
    }

private:
    auto member(std::string_view key) const -> const Value* {
        const auto* v = find_member(params_, key);
        return v && !v->is_null() ? v : nullptr;
    }

    const Value& params_;
    std::string_view op_;
    std::optional<Error> error_;
};

auto read_cell_location(Params& p) -> std::optional<TableCellLocation> {
    auto cell = p.nested("cellLocation");
    if (!cell) return std::nullopt;
    auto loc = TableCellLocation{
        .row_index = cell->optional_int("rowIndex"),
        .column_index = cell->optional_int("columnIndex"),
    };
    p.absorb(*cell);
    return loc;
}

auto read_text_range(Params& p, std::string_view key) -> std::optional<TextRange> {
    auto range = p.nested(key);
    if (!range) return std::nullopt;
    auto out = TextRange{};
    auto type = range->optional_string("type").value_or("ALL");
    if (type == "ALL") {
        out.type = RangeType::all;
    } else if (type == "FIXED_RANGE") {
        out.type = RangeType::fixed_range;
    } else if (type == "FROM_START_INDEX") {
        out.type = RangeType::from_start_index;
    } else {
        range->fail("unsupported textRange type: " + type);
    }
    out.start_index = range->optional_int("startIndex");
    out.end_index = range->optional_int("endIndex");
    p.absorb(*range);
    return out;
}

auto parse_create_slide(Params& p) -> Request {
    auto req = CreateSlide{
        .object_id = p.optional_string("objectId"),
        .insertion_index = p.optional_int("insertionIndex"),
        .layout = std::nullopt,
    };
    if (auto ref = p.nested("slideLayoutReference")) {
        req.layout = LayoutReference{
            .layout_id = ref->optional_string("layoutId"),
            .predefined_layout = ref->optional_string("predefinedLayout"),
        };
        if (req.layout->layout_id && req.layout->predefined_layout) {
            ref->fail("slideLayoutReference accepts only one of layoutId and predefinedLayout");
        }
        p.absorb(*ref);
    }
    return req;
}

auto parse_create_shape(Params& p) -> Request {
    auto req = CreateShape{
        .object_id = p.optional_string("objectId"),
        .shape_type = p.required_string("shapeType"),
        .page_object_id = std::nullopt,
        .size = std::nullopt,
        .transform = std::nullopt,
    };
    if (auto props = p.nested("elementProperties")) {
        req.page_object_id = props->optional_string("pageObjectId");
        req.size = props->optional_object("size");
        req.transform = props->optional_object("transform");
        p.absorb(*props);
    }
    return req;
}

auto parse_insert_text(Params& p) -> Request {
    return InsertText{
        .object_id = p.required_string("objectId"),
        .text = p.required_string("text"),
        .insertion_index = p.optional_int("insertionIndex"),
        .cell_location = read_cell_location(p),
    };
}

auto parse_replace_all_text(Params& p) -> Request {
    auto req = ReplaceAllText{};
    req.replace_text = p.optional_string("replaceText").value_or(std::string{});
    req.page_object_ids = p.string_list("pageObjectIds", false);
    auto criteria = p.nested("containsText");
    if (!criteria) {
        p.fail("containsText is required");
        return req;
    }
    req.find_text = criteria->required_string("text");
    req.match_case = criteria->optional_bool("matchCase").value_or(false);
    p.absorb(*criteria);
    return req;
}

auto parse_delete_object(Params& p) -> Request {
    return DeleteObject{.object_id = p.required_string("objectId")};
}

auto parse_delete_text(Params& p) -> Request {
    auto req = DeleteText{};
    req.object_id = p.required_string("objectId");
    req.cell_location = read_cell_location(p);
    if (auto range = read_text_range(p, "textRange")) {
        req.text_range = *range;
    } else {
        p.fail("textRange is required");
    }
    return req;
}

auto parse_update_text_style(Params& p) -> Request {
    return UpdateTextStyle{
        .object_id = p.required_string("objectId"),
        .style = p.required_object("style"),
        .fields = p.optional_string("fields"),
        .text_range = read_text_range(p, "textRange"),
        .cell_location = read_cell_location(p),
    };
}

auto parse_group_objects(Params& p) -> Request {
    return GroupObjects{
        .group_object_id = p.optional_string("groupObjectId"),
        .children_object_ids = p.string_list("childrenObjectIds", true),
    };
}

auto parse_ungroup_objects(Params& p) -> Request {
    return UngroupObjects{.object_ids = p.string_list("objectIds", true)};
}

auto parse_update_alt_text(Params& p) -> Request {
    return UpdatePageElementAltText{
        .object_id = p.required_string("objectId"),
        .title = p.optional_string("title"),
        .description = p.optional_string("description"),
    };
}

auto parse_update_slide_properties(Params& p) -> Request {
    return UpdateSlideProperties{
        .object_id = p.required_string("objectId"),
        .slide_properties = p.required_object("slideProperties"),
        .fields = p.required_string("fields"),
    };
}

auto parse_duplicate_object(Params& p) -> Request {
    auto req = DuplicateObject{.object_id = p.required_string("objectId"), .object_ids = {}};
    if (auto mapping = p.optional_object("objectIds")) {
        for (const auto& [old_id, new_id] : mapping->items()) {
            if (!new_id.is_string()) {
                p.fail("objectIds values must be strings");
                break;
            }
            req.object_ids.emplace(old_id, new_id.get<std::string>());
        }
    }
    return req;
}

using Parser = std::function<Request(Params&)>;

auto parsers() -> const std::map<std::string, Parser, std::less<>>& {
    static const auto table = std::map<std::string, Parser, std::less<>>{
        {"createSlide", parse_create_slide},
        {"createShape", parse_create_shape},
        {"insertText", parse_insert_text},
        {"replaceAllText", parse_replace_all_text},
        {"deleteObject", parse_delete_object},
        {"deleteText", parse_delete_text},
        {"updateTextStyle", parse_update_text_style},
        {"groupObjects", parse_group_objects},
        {"ungroupObjects", parse_ungroup_objects},
        {"updatePageElementAltText", parse_update_alt_text},
        {"updateSlideProperties", parse_update_slide_properties},
        {"duplicateObject", parse_duplicate_object},
    };
    return table;
}

}  // anonymous namespace

auto request_name(const Request& request) -> std::string_view {
    return std::visit(overload{
        [](const CreateSlide&) -> std::string_view { return "createSlide"; },
        [](const CreateShape&) -> std::string_view { return "createShape"; },
        [](const InsertText&) -> std::string_view { return "insertText"; },
        [](const ReplaceAllText&) -> std::string_view { return "replaceAllText"; },
        [](const DeleteObject&) -> std::string_view { return "deleteObject"; },
        [](const DeleteText&) -> std::string_view { return "deleteText"; },
        [](const UpdateTextStyle&) -> std::string_view { return "updateTextStyle"; },
        [](const GroupObjects&) -> std::string_view { return "groupObjects"; },
        [](const UngroupObjects&) -> std::string_view { return "ungroupObjects"; },
        [](const UpdatePageElementAltText&) -> std::string_view { return "updatePageElementAltText"; },
        [](const UpdateSlideProperties&) -> std::string_view { return "updateSlideProperties"; },
        [](const DuplicateObject&) -> std::string_view { return "duplicateObject"; },
    }, request);
}

auto parse_request(const Value& item) -> Result<Request> {
    if (!item.is_object() || item.size() != 1) {
        return invalid_input("request must be an object with a single key naming the operation");
    }
    const auto& name = item.begin().key();
    const auto& params = item.begin().value();

    const auto& table = parsers();
    auto it = table.find(name);
    if (it == table.end()) {
        return invalid_input("unsupported request type: '" + name + "'");
    }
    if (!params.is_object()) {
        return invalid_input("parameters for request '" + name + "' must be an object");
    }

    auto reader = Params{params, it->first};
    auto request = it->second(reader);
    if (reader.failed()) return reader.error();
    return request;
}

}  // namespace slides_cpp

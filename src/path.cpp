#include <slides-cpp/path.hpp>

#include <charconv>
#include <utility>

namespace slides_cpp {

auto split_path(std::string_view path) -> std::vector<std::string> {
    auto segments = std::vector<std::string>{};
    auto pos = std::size_t{0};
    while (true) {
        auto next = path.find('.', pos);
        segments.emplace_back(path.substr(pos, next - pos));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return segments;
}

auto parse_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec == std::errc{} && ptr == segment.data() + segment.size()) return result;
    return std::nullopt;
}

namespace {

// One step of a read walk. nullptr when the segment does not resolve.
auto step(const Value& node, const std::string& segment) -> const Value* {
    if (node.is_array()) {
        auto idx = parse_index(segment);
        if (!idx || *idx >= node.size()) return nullptr;
        return &node[*idx];
    }
    if (node.is_object()) {
        auto it = node.find(segment);
        return it != node.end() ? &*it : nullptr;
    }
    return nullptr;
}

auto join_prefix(const std::vector<std::string>& segments, std::size_t count) -> std::string {
    auto out = std::string{};
    for (std::size_t i = 0; i < count; ++i) {
        if (i > 0) out.push_back('.');
        out += segments[i];
    }
    return out;
}

auto is_container(const Value& v) -> bool {
    return v.is_object() || v.is_array();
}

}  // anonymous namespace

auto find_path(const Value& root, std::string_view path) -> const Value* {
    const auto* current = &root;
    for (const auto& segment : split_path(path)) {
        current = step(*current, segment);
        if (!current) return nullptr;
    }
    return current;
}

auto get_path(const Value& root, std::string_view path) -> Result<Value> {
    auto segments = split_path(path);
    const auto* current = &root;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        current = step(*current, segments[i]);
        if (!current) {
            return not_found("path '" + std::string{path} + "': segment '"
                             + join_prefix(segments, i + 1) + "' not found");
        }
    }
    return *current;
}

auto get_path(const Value& root, std::string_view path, const Value& fallback) -> Result<Value> {
    auto segments = split_path(path);
    const auto* current = &root;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto* next = step(*current, segments[i]);
        if (!next) {
            if (i + 1 == segments.size()) return fallback;
            return not_found("path '" + std::string{path} + "': segment '"
                             + join_prefix(segments, i + 1) + "' not found");
        }
        current = next;
    }
    return *current;
}

namespace {

// Validate a set without touching the tree. Once the walk leaves the
// existing tree every remaining segment lands in a fresh map, so only
// the existing part can conflict.
auto check_set(const Value& root, const std::vector<std::string>& segments,
               std::string_view path) -> Result<void> {
    const auto* current = &root;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];
        auto is_last = (i + 1 == segments.size());
        if (current->is_null()) return {};
        if (current->is_array()) {
            auto idx = parse_index(segment);
            if (!idx) {
                return conflict("path conflict at '" + join_prefix(segments, i + 1)
                                + "': sequence requires a numeric index");
            }
            if (*idx >= current->size()) {
                return conflict("path conflict at '" + join_prefix(segments, i + 1)
                                + "': index " + std::to_string(*idx) + " out of range");
            }
            if (is_last) return {};
            current = &(*current)[*idx];
            if (!is_container(*current)) {
                return conflict("path conflict at '" + join_prefix(segments, i + 1)
                                + "': element is not a container");
            }
        } else if (current->is_object()) {
            if (is_last) return {};
            auto it = current->find(segment);
            if (it == current->end()) return {};
            current = &*it;
            if (!current->is_null() && !is_container(*current)) {
                return conflict("path conflict at '" + join_prefix(segments, i + 1)
                                + "': value is not a container");
            }
        } else {
            return conflict("path conflict at '" + std::string{path}
                            + "': cannot traverse into a scalar");
        }
    }
    return {};
}

}  // anonymous namespace

auto set_path(Value& root, std::string_view path, Value value) -> Result<void> {
    auto segments = split_path(path);
    if (auto checked = check_set(root, segments, path); !checked) return checked;

    auto* current = &root;
    for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
        if (current->is_null()) *current = Value::object();
        if (current->is_array()) {
            current = &(*current)[*parse_index(segments[i])];
        } else {
            current = &(*current)[segments[i]];
        }
    }

    const auto& last = segments.back();
    if (current->is_array()) {
        (*current)[*parse_index(last)] = std::move(value);
    } else {
        if (current->is_null()) *current = Value::object();
        (*current)[last] = std::move(value);
    }
    return {};
}

}  // namespace slides_cpp

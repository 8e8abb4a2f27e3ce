#include <slides-cpp/field_mask.hpp>
#include <slides-cpp/path.hpp>

namespace slides_cpp {

namespace {

auto trim(std::string_view s) -> std::string_view {
    constexpr std::string_view ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

}  // anonymous namespace

auto parse_field_mask(std::string_view mask) -> std::vector<std::string> {
    auto paths = std::vector<std::string>{};
    auto pos = std::size_t{0};
    while (pos <= mask.size()) {
        auto next = mask.find(',', pos);
        auto path = trim(mask.substr(pos, next - pos));
        if (!path.empty()) paths.emplace_back(path);
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return paths;
}

auto mask_touches(std::string_view mask, std::string_view path) -> bool {
    for (const auto& field : parse_field_mask(mask)) {
        if (field == full_replace_mask || field == path) return true;
        if (path.size() > field.size() && path.starts_with(field) && path[field.size()] == '.') {
            return true;
        }
    }
    return false;
}

auto apply_field_mask(Value& target, const Value& updates, std::string_view mask) -> Result<void> {
    if (trim(mask).empty()) return {};

    if (trim(mask) == full_replace_mask) {
        if (!updates.is_object()) return {};
        if (!target.is_object()) {
            return conflict("field '*': target is not a map");
        }
        for (const auto& [key, value] : updates.items()) {
            target[key] = value;
        }
        return {};
    }

    for (const auto& path : parse_field_mask(mask)) {
        const auto* value = find_path(updates, path);
        if (!value) continue;
        auto written = set_path(target, path, *value);
        if (!written) {
            return conflict("error applying update for field '" + path + "': "
                            + written.error().message);
        }
    }
    return {};
}

}  // namespace slides_cpp

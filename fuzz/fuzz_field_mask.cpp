// Fuzz target for apply_field_mask() and the path helpers. The first
// line of the input is the mask; the rest is the update object.

#include <slides-cpp/field_mask.hpp>
#include <slides-cpp/path.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto newline = text.find('\n');
    const auto mask = text.substr(0, newline);
    const auto body = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);

    const auto updates = slides_cpp::Value::parse(body, nullptr, false);
    if (updates.is_discarded()) return 0;

    auto target = slides_cpp::Value::parse(R"({"layoutObjectId": "l1", "notesPage": {"objectId": "n1"}})");
    auto applied = slides_cpp::apply_field_mask(target, updates, mask);
    (void)applied;

    for (const auto& path : slides_cpp::parse_field_mask(mask)) {
        auto value = slides_cpp::get_path(target, path);
        (void)value;
    }
    return 0;
}

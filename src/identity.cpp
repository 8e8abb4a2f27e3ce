#include <slides-cpp/identity.hpp>

#include <array>

namespace slides_cpp {

namespace {

constexpr std::array<std::string_view, 3> remapped_keys = {
    "objectId", "revisionId", "speakerNotesObjectId",
};

auto is_remapped_key(std::string_view key) -> bool {
    for (auto k : remapped_keys) {
        if (k == key) return true;
    }
    return false;
}

}  // anonymous namespace

IdFactory::IdFactory() {
    auto rd = std::random_device{};
    auto seed = (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
    rng_.seed(seed);
}

IdFactory::IdFactory(std::uint64_t seed) : rng_{seed} {}

auto IdFactory::random_hex(std::size_t digits) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto out = std::string{};
    out.reserve(digits);
    auto bits = std::uint64_t{0};
    auto available = 0;
    for (std::size_t i = 0; i < digits; ++i) {
        if (available == 0) {
            bits = rng_();
            available = 16;
        }
        out.push_back(hex_chars[bits & 0x0F]);
        bits >>= 4;
        --available;
    }
    return out;
}

auto IdFactory::new_id() -> std::string {
    // 8-4-4-4-12 with the version nibble set to 4 and the variant to 10xx.
    auto hex = random_hex(32);
    hex[12] = '4';
    static constexpr char variant_chars[] = "89ab";
    hex[16] = variant_chars[static_cast<unsigned char>(hex[16]) & 0x03];
    auto out = std::string{};
    out.reserve(36);
    out.append(hex, 0, 8).push_back('-');
    out.append(hex, 8, 4).push_back('-');
    out.append(hex, 12, 4).push_back('-');
    out.append(hex, 16, 4).push_back('-');
    out.append(hex, 20, 12);
    return out;
}

auto IdFactory::new_id(std::string_view prefix) -> std::string {
    auto out = std::string{prefix};
    out.push_back('_');
    out += random_hex(32);
    return out;
}

auto IdFactory::remap(const Value& subtree, IdMap& id_map) -> Value {
    if (subtree.is_object()) {
        auto copy = Value::object();
        for (const auto& [key, value] : subtree.items()) {
            if (is_remapped_key(key) && value.is_string()) {
                const auto& old_id = value.get_ref<const std::string&>();
                auto it = id_map.find(old_id);
                if (it == id_map.end()) {
                    it = id_map.emplace(old_id, new_id()).first;
                }
                copy[key] = it->second;
            } else {
                copy[key] = remap(value, id_map);
            }
        }
        return copy;
    }
    if (subtree.is_array()) {
        auto copy = Value::array();
        for (const auto& item : subtree) {
            copy.push_back(remap(item, id_map));
        }
        return copy;
    }
    return subtree;
}

}  // namespace slides_cpp

#include <slides-cpp/options.hpp>

#include <cstdint>
#include <fstream>
#include <string>

namespace slides_cpp {

namespace {

auto wrong_type(std::string_view key, std::string_view expected) -> Error {
    return invalid_input("option '" + std::string{key} + "' must be " + std::string{expected});
}

}  // anonymous namespace

auto options_from_value(const Value& config) -> Result<StoreOptions> {
    if (!config.is_object()) return invalid_input("options must be a JSON object");

    auto opts = StoreOptions{};

    auto read_bool = [&](std::string_view key, bool& out) -> Result<void> {
        const auto* v = find_member(config, key);
        if (!v) return {};
        if (!v->is_boolean()) return wrong_type(key, "a boolean");
        out = v->get<bool>();
        return {};
    };

    if (auto r = read_bool("ensureStandardLayouts", opts.ensure_standard_layouts); !r) return r.error();
    if (auto r = read_bool("validateObjectIds", opts.validate_object_ids); !r) return r.error();
    if (auto r = read_bool("compressSnapshots", opts.compress_snapshots); !r) return r.error();

    if (const auto* v = find_member(config, "maxObjectIdLength")) {
        if (!v->is_number_integer() || v->get<std::int64_t>() <= 0) {
            return wrong_type("maxObjectIdLength", "a positive integer");
        }
        opts.max_object_id_length = v->get<std::size_t>();
    }

    if (const auto* v = find_member(config, "logLevel")) {
        if (!v->is_string()) return wrong_type("logLevel", "a string");
        auto lvl = log::parse_level(v->get_ref<const std::string&>());
        if (!lvl) return wrong_type("logLevel", "one of debug, info, warn, error, off");
        opts.log_level = *lvl;
    }

    return opts;
}

auto load_options(const std::filesystem::path& path) -> Result<StoreOptions> {
    auto in = std::ifstream{path};
    if (!in) return invalid_input("cannot open options file: " + path.string());
    auto config = Value::parse(in, nullptr, false);
    if (config.is_discarded()) return invalid_input("options file is not valid JSON: " + path.string());
    return options_from_value(config);
}

}  // namespace slides_cpp

/// @file options.hpp
/// @brief DocumentStore configuration.

#pragma once

#include <slides-cpp/error.hpp>
#include <slides-cpp/log.hpp>
#include <slides-cpp/value.hpp>

#include <cstddef>
#include <filesystem>

namespace slides_cpp {

/// Tunables for a DocumentStore and the handlers it runs.
///
/// @code
/// auto opts = load_options("slides.json");
/// if (!opts) return opts.error();
/// auto store = DocumentStore{*opts};
/// @endcode
struct StoreOptions {
    /// createSlide without a layout reference adds the standard layouts
    /// (BLANK, TITLE, TITLE_AND_BODY, ...) to the deck. When false only
    /// BLANK is added.
    bool ensure_standard_layouts{true};

    /// Reject caller-supplied IDs for new objects that do not match
    /// `[A-Za-z0-9_][A-Za-z0-9_:-]*` or exceed max_object_id_length.
    bool validate_object_ids{true};
    std::size_t max_object_id_length{50};

    /// save_binary() deflates the snapshot.
    bool compress_snapshots{true};

    log::Level log_level{log::Level::info};

    auto operator==(const StoreOptions&) const -> bool = default;
};

/// Read options from a JSON object. Missing and unknown keys are ignored;
/// a key with the wrong type is invalid_input.
///
/// Keys: ensureStandardLayouts, validateObjectIds, maxObjectIdLength,
/// compressSnapshots, logLevel.
auto options_from_value(const Value& config) -> Result<StoreOptions>;

/// Read options from a JSON file.
/// @return invalid_input if the file cannot be read or parsed.
auto load_options(const std::filesystem::path& path) -> Result<StoreOptions>;

}  // namespace slides_cpp

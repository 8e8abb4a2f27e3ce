/// @file identity.hpp
/// @brief Object ID generation and subtree ID remapping.

#pragma once

#include <slides-cpp/value.hpp>

#include <cstdint>
#include <map>
#include <random>
#include <string>
#include <string_view>

namespace slides_cpp {

/// Mapping from old object IDs to new ones.
using IdMap = std::map<std::string, std::string>;

/// Generates opaque, collision-resistant object IDs.
///
/// IDs are random (version 4 UUID layout); no central counter is kept,
/// so independently created factories do not coordinate. A seeded
/// factory produces a reproducible sequence for tests.
///
/// @code
/// auto ids = IdFactory{};
/// auto element_id = ids.new_id();          // "3f2b...-...."
/// auto slide_id = ids.new_id("slide");     // "slide_9c1e..."
/// @endcode
class IdFactory {
public:
    /// Construct with a nondeterministic seed.
    IdFactory();

    /// Construct with a fixed seed.
    explicit IdFactory(std::uint64_t seed);

    /// A fresh UUID-formatted ID.
    auto new_id() -> std::string;

    /// A fresh ID of the form `<prefix>_<32 hex digits>`.
    auto new_id(std::string_view prefix) -> std::string;

    /// Deep-copy `subtree`, rewriting IDs through `id_map`.
    ///
    /// Every string value under a key named `objectId`, `revisionId` or
    /// `speakerNotesObjectId` is replaced by its mapping; an ID seen for
    /// the first time gets a fresh ID that is recorded in `id_map`, so
    /// repeated references stay consistent. Entries already in `id_map`
    /// are used as given. All other members are copied unchanged.
    auto remap(const Value& subtree, IdMap& id_map) -> Value;

private:
    auto random_hex(std::size_t digits) -> std::string;

    std::mt19937_64 rng_;
};

}  // namespace slides_cpp

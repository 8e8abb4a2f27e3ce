/// @file store.hpp
/// @brief The DocumentStore: presentations addressed by ID.

#pragma once

#include <slides-cpp/batch_update.hpp>
#include <slides-cpp/error.hpp>
#include <slides-cpp/identity.hpp>
#include <slides-cpp/options.hpp>
#include <slides-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace slides_cpp {

/// Optimistic concurrency for a batch. At most one field is set; a batch
/// naming a revision other than the current one is rejected whole.
struct WriteControl {
    std::optional<std::string> required_revision_id;
    std::optional<std::string> target_revision_id;

    auto operator==(const WriteControl&) const -> bool = default;
};

/// Result of DocumentStore::batch_update().
struct BatchUpdateResponse {
    std::string presentation_id;
    Value replies = Value::array();
    std::string required_revision_id;      ///< The presentation's revision after the batch.
    std::optional<BatchFailure> failure;   ///< Set when a request stopped the batch.

    auto ok() const noexcept -> bool { return !failure.has_value(); }

    /// `{presentationId, replies, writeControl: {requiredRevisionId}}`.
    auto to_value() const -> Value;
};

/// An in-memory collection of presentations.
///
/// The store exclusively owns its presentations; readers get copies.
/// Writers are serialized with one lock per store; readers share it.
///
/// @code
/// auto store = DocumentStore{};
/// auto deck = store.create_presentation({{"title", "Roadmap"}});
/// auto id = (*deck)["presentationId"].get<std::string>();
/// auto response = store.batch_update(id, Value::parse(R"([
///     {"createSlide": {"objectId": "s1"}}
/// ])"));
/// @endcode
class DocumentStore {
public:
    /// Construct with default options.
    DocumentStore();

    /// Construct with the given options. The process-wide log threshold is left
    /// alone; callers apply `options.log_level` with log::set_level().
    explicit DocumentStore(StoreOptions options);

    /// Construct with fixed-seed ID generation.
    DocumentStore(StoreOptions options, std::uint64_t seed);

    DocumentStore(const DocumentStore&) = delete;
    auto operator=(const DocumentStore&) -> DocumentStore& = delete;

    auto options() const -> const StoreOptions& { return options_; }

    // -- Presentations --------------------------------------------------------

    /// Create a presentation from a request object holding `title` and,
    /// optionally, `presentationId`, `pageSize`, `slides`, `masters`,
    /// `layouts`, `notesMaster` and `locale`.
    /// @return The stored presentation, invalid_input, or conflict.
    auto create_presentation(const Value& request) -> Result<Value>;

    /// A copy of a presentation.
    auto get_presentation(std::string_view presentation_id) const -> Result<Value>;

    /// A copy of any page (slide, layout, master or notes master).
    auto get_page(std::string_view presentation_id, std::string_view page_id) const -> Result<Value>;

    /// A text summary: title, slide count, revision and per-slide content.
    auto summarize(std::string_view presentation_id, bool include_notes = false) const -> Result<Value>;

    /// Remove a presentation.
    auto remove_presentation(std::string_view presentation_id) -> Result<void>;

    /// IDs of every stored presentation, sorted.
    auto presentation_ids() const -> std::vector<std::string>;

    auto size() const -> std::size_t;

    // -- Mutation -------------------------------------------------------------

    /// Apply a request envelope to a presentation.
    ///
    /// The Result is an error only when nothing was applied (bad ID, unknown
    /// presentation, write-control mismatch). A request failure inside the
    /// batch is reported in the response, after the earlier requests' effects
    /// have been committed. The revision is regenerated whenever anything was
    /// written, including a failing request's partial write.
    auto batch_update(std::string_view presentation_id, const Value& requests,
                      const WriteControl& write_control = {}) -> Result<BatchUpdateResponse>;

    /// Typed variant of batch_update().
    auto batch_update(std::string_view presentation_id, std::span<const Request> requests,
                      const WriteControl& write_control = {}) -> Result<BatchUpdateResponse>;

    // -- Snapshots ------------------------------------------------------------

    /// `{"presentations": {id: presentation, ...}}`
    auto save() const -> Value;

    /// Replace the store's contents with a snapshot.
    auto load(const Value& snapshot) -> Result<void>;

    /// The snapshot as JSON text, deflated when `compress_snapshots` is set.
    auto save_binary() const -> std::vector<std::byte>;

    /// Load either form written by save_binary().
    auto load_binary(const std::vector<std::byte>& data) -> Result<void>;

private:
    template <typename Apply>
    auto run_batch(std::string_view presentation_id, const WriteControl& write_control,
                   Apply&& apply) -> Result<BatchUpdateResponse>;

    StoreOptions options_;
    IdFactory ids_;
    std::map<std::string, Value, std::less<>> presentations_;
    mutable std::shared_mutex mutex_;
};

}  // namespace slides_cpp

#include <slides-cpp/store.hpp>
#include <slides-cpp/locator.hpp>
#include <slides-cpp/log.hpp>
#include <slides-cpp/text.hpp>

#include "storage/compression.hpp"

#include <array>
#include <mutex>
#include <string>
#include <utility>

namespace slides_cpp {

namespace {

constexpr std::array<std::string_view, 7> copied_fields = {
    "title", "pageSize", "slides", "masters", "layouts", "notesMaster", "locale",
};

auto is_blank(std::string_view s) -> bool {
    return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

auto check_presentation_id(std::string_view id) -> Result<void> {
    if (is_blank(id)) return invalid_input("presentationId cannot be empty or contain only whitespace");
    return {};
}

auto missing(std::string_view id) -> Error {
    return not_found("presentation with ID '" + std::string{id} + "' not found");
}

auto join(const std::vector<std::string>& parts) -> std::string {
    auto out = std::string{};
    for (const auto& part : parts) {
        if (!out.empty()) out.push_back(' ');
        out += part;
    }
    return out;
}

auto notes_text(const Value& slide) -> std::string {
    const auto* notes = notes_page(slide);
    if (!notes) {
        if (const auto* props = find_member(slide, "slideProperties")) notes = find_member(*props, "notesPage");
    }
    if (!notes) return {};
    const auto* elements = find_member(*notes, "pageElements");
    return elements ? join(collect_text(*elements)) : std::string{};
}

}  // anonymous namespace

auto BatchUpdateResponse::to_value() const -> Value {
    return Value{
        {"presentationId", presentation_id},
        {"replies", replies},
        {"writeControl", {{"requiredRevisionId", required_revision_id}}},
    };
}

DocumentStore::DocumentStore() : DocumentStore(StoreOptions{}) {}

DocumentStore::DocumentStore(StoreOptions options) : options_{std::move(options)} {}

DocumentStore::DocumentStore(StoreOptions options, std::uint64_t seed)
    : options_{std::move(options)}, ids_{seed} {}

// -- Presentations ------------------------------------------------------------

auto DocumentStore::create_presentation(const Value& request) -> Result<Value> {
    if (!request.is_object() || request.empty()) {
        return invalid_input("create request must be a non-empty object");
    }
    auto requested_id = std::optional<std::string>{};
    if (const auto* id = find_member(request, "presentationId"); id && !id->is_null()) {
        if (!id->is_string() || is_blank(id->get_ref<const std::string&>())) {
            return invalid_input("presentationId must be a non-empty string");
        }
        requested_id = id->get<std::string>();
    }

    auto lock = std::unique_lock{mutex_};
    auto id = requested_id ? *requested_id : ids_.new_id();
    if (presentations_.contains(id)) {
        return conflict("presentation with ID '" + id + "' already exists");
    }

    auto presentation = Value{{"presentationId", id}};
    for (auto field : copied_fields) {
        if (const auto* value = find_member(request, field); value && !value->is_null()) {
            presentation[std::string{field}] = *value;
        }
    }
    for (auto section : {"slides", "masters", "layouts"}) ensure_array(presentation, section);
    presentation["revisionId"] = ids_.new_id();

    log::info("created presentation '" + id + "'");
    auto it = presentations_.emplace(id, std::move(presentation)).first;
    return it->second;
}

auto DocumentStore::get_presentation(std::string_view presentation_id) const -> Result<Value> {
    if (auto ok = check_presentation_id(presentation_id); !ok) return ok.error();
    auto lock = std::shared_lock{mutex_};
    auto it = presentations_.find(presentation_id);
    if (it == presentations_.end()) return missing(presentation_id);
    return it->second;
}

auto DocumentStore::get_page(std::string_view presentation_id, std::string_view page_id) const -> Result<Value> {
    if (auto ok = check_presentation_id(presentation_id); !ok) return ok.error();
    if (is_blank(page_id)) return invalid_input("pageObjectId cannot be empty or contain only whitespace");
    auto lock = std::shared_lock{mutex_};
    auto it = presentations_.find(presentation_id);
    if (it == presentations_.end()) return missing(presentation_id);
    const auto* page = find_page(it->second, page_id);
    if (!page) {
        return not_found("page with ID '" + std::string{page_id} + "' not found in presentation '"
                         + std::string{presentation_id} + "'");
    }
    return *page;
}

auto DocumentStore::summarize(std::string_view presentation_id, bool include_notes) const -> Result<Value> {
    if (auto ok = check_presentation_id(presentation_id); !ok) return ok.error();
    auto lock = std::shared_lock{mutex_};
    auto it = presentations_.find(presentation_id);
    if (it == presentations_.end()) return missing(presentation_id);
    const auto& presentation = it->second;

    auto title = get_string(presentation, "title");
    auto revision = get_string(presentation, "revisionId");
    auto summary = Value{
        {"title", title && !title->empty() ? *title : std::string{"Untitled Presentation"}},
        {"slideCount", 0},
        {"lastModified", revision && !revision->empty() ? "Revision " + *revision : std::string{"Unknown"}},
        {"slides", Value::array()},
    };

    const auto* slides = find_member(presentation, "slides");
    if (!slides || !slides->is_array() || slides->empty()) {
        summary["summary"] = "This presentation contains no slides.";
        return summary;
    }

    auto& out = summary["slides"];
    for (std::size_t i = 0; i < slides->size(); ++i) {
        const auto& slide = (*slides)[i];
        auto number = i + 1;
        const auto* elements = find_member(slide, "pageElements");
        auto info = Value{
            {"slideNumber", number},
            {"slideId", get_string(slide, "objectId").value_or("slide_" + std::to_string(number))},
            {"content", elements ? join(collect_text(*elements)) : std::string{}},
        };
        if (include_notes) {
            if (auto notes = notes_text(slide); !notes.empty()) info["notes"] = std::move(notes);
        }
        out.push_back(std::move(info));
    }
    summary["slideCount"] = out.size();
    return summary;
}

auto DocumentStore::remove_presentation(std::string_view presentation_id) -> Result<void> {
    if (auto ok = check_presentation_id(presentation_id); !ok) return ok;
    auto lock = std::unique_lock{mutex_};
    auto it = presentations_.find(presentation_id);
    if (it == presentations_.end()) return missing(presentation_id);
    presentations_.erase(it);
    log::info("removed presentation '" + std::string{presentation_id} + "'");
    return {};
}

auto DocumentStore::presentation_ids() const -> std::vector<std::string> {
    auto lock = std::shared_lock{mutex_};
    auto ids = std::vector<std::string>{};
    ids.reserve(presentations_.size());
    for (const auto& [id, presentation] : presentations_) ids.push_back(id);
    return ids;
}

auto DocumentStore::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return presentations_.size();
}

// -- Mutation -----------------------------------------------------------------

template <typename Apply>
auto DocumentStore::run_batch(std::string_view presentation_id, const WriteControl& write_control,
                              Apply&& apply) -> Result<BatchUpdateResponse> {
    if (auto ok = check_presentation_id(presentation_id); !ok) return ok.error();
    if (write_control.required_revision_id && write_control.target_revision_id) {
        return invalid_input("writeControl accepts only one of requiredRevisionId and targetRevisionId");
    }

    auto lock = std::unique_lock{mutex_};
    auto it = presentations_.find(presentation_id);
    if (it == presentations_.end()) return missing(presentation_id);
    auto& presentation = it->second;

    const auto& expected = write_control.required_revision_id
        ? write_control.required_revision_id : write_control.target_revision_id;
    if (expected) {
        auto current = get_string(presentation, "revisionId").value_or("");
        if (*expected != current) {
            log::warn("batchUpdate on '" + std::string{presentation_id} + "' rejected: revision '"
                      + *expected + "' is not current");
            return Error{ErrorKind::revision_mismatch,
                         "revision mismatch: expected '" + *expected + "', current is '" + current + "'"};
        }
    }

    auto ctx = HandlerContext{ids_, options_};
    auto result = apply(presentation, ctx);

    auto response = BatchUpdateResponse{};
    response.presentation_id = std::string{presentation_id};
    // A request that wrote and then failed still leaves the presentation changed.
    if (result.ok() || !result.replies.empty() || ctx.mutated) {
        presentation["revisionId"] = ids_.new_id();
    }
    response.replies = std::move(result.replies);
    response.required_revision_id = get_string(presentation, "revisionId").value_or("");
    response.failure = std::move(result.failure);
    return response;
}

auto DocumentStore::batch_update(std::string_view presentation_id, const Value& requests,
                                 const WriteControl& write_control) -> Result<BatchUpdateResponse> {
    return run_batch(presentation_id, write_control, [&](Value& presentation, HandlerContext& ctx) {
        return apply_requests(presentation, requests, ctx);
    });
}

auto DocumentStore::batch_update(std::string_view presentation_id, std::span<const Request> requests,
                                 const WriteControl& write_control) -> Result<BatchUpdateResponse> {
    return run_batch(presentation_id, write_control, [&](Value& presentation, HandlerContext& ctx) {
        return apply_requests(presentation, requests, ctx);
    });
}

// -- Snapshots ----------------------------------------------------------------

auto DocumentStore::save() const -> Value {
    auto lock = std::shared_lock{mutex_};
    auto presentations = Value::object();
    for (const auto& [id, presentation] : presentations_) presentations[id] = presentation;
    return Value{{"presentations", std::move(presentations)}};
}

auto DocumentStore::load(const Value& snapshot) -> Result<void> {
    const auto* presentations = find_member(snapshot, "presentations");
    if (!presentations || !presentations->is_object()) {
        return invalid_input("snapshot must hold a 'presentations' map");
    }
    auto loaded = std::map<std::string, Value, std::less<>>{};
    for (const auto& [id, presentation] : presentations->items()) {
        if (!presentation.is_object()) {
            return invalid_input("snapshot entry '" + id + "' is not a presentation");
        }
        loaded.emplace(id, presentation);
    }

    auto lock = std::unique_lock{mutex_};
    presentations_ = std::move(loaded);
    log::info("loaded snapshot with " + std::to_string(presentations_.size()) + " presentations");
    return {};
}

auto DocumentStore::save_binary() const -> std::vector<std::byte> {
    auto text = save().dump();
    if (options_.compress_snapshots) {
        if (auto compressed = storage::deflate_compress(text)) {
            log::info("saved snapshot: " + std::to_string(text.size()) + " bytes deflated to "
                      + std::to_string(compressed->size()));
            return std::move(*compressed);
        }
        log::warn("snapshot compression failed; saving uncompressed JSON");
    }
    const auto* first = reinterpret_cast<const std::byte*>(text.data());
    return {first, first + text.size()};
}

auto DocumentStore::load_binary(const std::vector<std::byte>& data) -> Result<void> {
    if (data.empty()) return invalid_input("snapshot is empty");

    // Plain JSON snapshots start with '{'. A deflated stream may too, so
    // fall back to inflating when the bytes do not parse.
    if (data.front() == std::byte{'{'}) {
        auto text = std::string_view{reinterpret_cast<const char*>(data.data()), data.size()};
        auto snapshot = Value::parse(text, nullptr, false);
        if (!snapshot.is_discarded()) return load(snapshot);
    }

    auto inflated = storage::deflate_decompress(data);
    if (!inflated) return invalid_input("snapshot is neither JSON nor a deflated JSON document");
    auto snapshot = Value::parse(*inflated, nullptr, false);
    if (snapshot.is_discarded()) return invalid_input("snapshot is not valid JSON");
    return load(snapshot);
}

}  // namespace slides_cpp

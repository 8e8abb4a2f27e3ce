// basic_usage: demonstrates the core slides-cpp API
//
// Creates a presentation, applies a batch of requests from JSON,
// reads the result back, and prints a summary.
//
// Run: ./build/examples/basic_usage

#include <slides-cpp/slides.hpp>

#include <cstdio>
#include <string>

namespace sc = slides_cpp;

int main() {
    auto store = sc::DocumentStore{};

    // -- Create a presentation ------------------------------------------------
    auto deck = store.create_presentation({{"title", "Quarterly Review"}});
    if (!deck) {
        std::fprintf(stderr, "create failed: %s\n", deck.error().message.c_str());
        return 1;
    }
    auto id = (*deck)["presentationId"].get<std::string>();
    std::printf("Created presentation %s\n", id.c_str());

    // -- Apply a batch of requests --------------------------------------------
    auto response = store.batch_update(id, sc::Value::parse(R"([
        {"createSlide": {"objectId": "intro", "slideLayoutReference": {"predefinedLayout": "TITLE_AND_BODY"}}},
        {"createShape": {"objectId": "headline", "shapeType": "TEXT_BOX",
                         "elementProperties": {"pageObjectId": "intro"}}},
        {"insertText": {"objectId": "headline", "text": "Revenue is up {{pct}}"}},
        {"replaceAllText": {"containsText": {"text": "{{pct}}", "matchCase": true}, "replaceText": "12%"}},
        {"updateTextStyle": {"objectId": "headline", "style": {"bold": true}, "fields": "bold"}}
    ])"));
    if (!response) {
        std::fprintf(stderr, "batchUpdate rejected: %s\n", response.error().message.c_str());
        return 1;
    }
    if (!response->ok()) {
        std::fprintf(stderr, "request %zu failed: %s\n",
                     response->failure->index, response->failure->error.message.c_str());
        return 1;
    }
    std::printf("Replies: %s\n", response->to_value()["replies"].dump().c_str());

    // -- Read a page back -----------------------------------------------------
    if (auto slide = store.get_page(id, "intro")) {
        std::printf("Slide 'intro' uses layout %s\n",
                    (*slide)["slideProperties"]["layoutObjectId"].get<std::string>().c_str());
    }

    // -- Optimistic concurrency -----------------------------------------------
    auto stale = store.batch_update(id, sc::Value::parse(R"([{"deleteObject": {"objectId": "intro"}}])"),
                                    sc::WriteControl{.required_revision_id = "not-the-current-revision"});
    if (!stale) {
        std::printf("Stale write rejected: %s\n", stale.error().message.c_str());
    }

    // -- Summary --------------------------------------------------------------
    if (auto summary = store.summarize(id)) {
        std::printf("%s\n", summary->dump(2).c_str());
    }

    return 0;
}

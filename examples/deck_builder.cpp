// deck_builder: builds a deck with typed requests and snapshots it
//
// Uses the typed Request structs instead of JSON, groups and duplicates
// elements, then saves a compressed snapshot and loads it into a second
// store.
//
// Run: ./build/examples/deck_builder [options.json]

#include <slides-cpp/slides.hpp>

#include <cstdio>
#include <string>
#include <vector>

namespace sc = slides_cpp;

int main(int argc, char** argv) {
    auto options = sc::StoreOptions{};
    if (argc > 1) {
        auto loaded = sc::load_options(argv[1]);
        if (!loaded) {
            std::fprintf(stderr, "%s\n", loaded.error().message.c_str());
            return 1;
        }
        options = *loaded;
    }

    sc::log::set_level(options.log_level);
    auto store = sc::DocumentStore{options};
    auto deck = store.create_presentation({{"presentationId", "team-offsite"}, {"title", "Team Offsite"}});
    if (!deck) {
        std::fprintf(stderr, "%s\n", deck.error().message.c_str());
        return 1;
    }

    // -- Agenda slide with a grouped caption ----------------------------------
    const auto requests = std::vector<sc::Request>{
        sc::CreateSlide{.object_id = "agenda",
                        .layout = sc::LayoutReference{.predefined_layout = "TITLE_ONLY"}},
        sc::CreateShape{.object_id = "agenda_title", .shape_type = "TEXT_BOX", .page_object_id = "agenda"},
        sc::InsertText{.object_id = "agenda_title", .text = "Agenda"},
        sc::CreateShape{.object_id = "logo", .shape_type = "RECTANGLE", .page_object_id = "agenda"},
        sc::UpdatePageElementAltText{.object_id = "logo", .title = "Logo",
                                     .description = "Company logo"},
        sc::GroupObjects{.group_object_id = "header", .children_object_ids = {"agenda_title", "logo"}},
        sc::DuplicateObject{.object_id = "agenda", .object_ids = {{"agenda", "agenda_day2"}}},
    };

    auto response = store.batch_update("team-offsite", requests);
    if (!response || !response->ok()) {
        const auto& error = response ? response->failure->error : response.error();
        std::fprintf(stderr, "batchUpdate failed: %s\n", error.message.c_str());
        return 1;
    }

    // -- Snapshot into a second store -----------------------------------------
    auto bytes = store.save_binary();
    std::printf("Snapshot: %zu bytes (%s)\n", bytes.size(),
                options.compress_snapshots ? "deflated" : "plain JSON");

    auto replica = sc::DocumentStore{options};
    if (auto loaded = replica.load_binary(bytes); !loaded) {
        std::fprintf(stderr, "load failed: %s\n", loaded.error().message.c_str());
        return 1;
    }

    if (auto summary = replica.summarize("team-offsite")) {
        std::printf("%s\n", summary->dump(2).c_str());
    }

    for (const auto& line : sc::log::recent(10)) {
        std::printf("log: %s\n", line.c_str());
    }
    return 0;
}

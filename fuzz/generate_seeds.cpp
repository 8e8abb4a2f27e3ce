// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <slides-cpp/slides.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

static void write_seed(const std::string& path, const std::string& text) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << text;
}

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    namespace sc = slides_cpp;
    const auto batch_dir = std::string{"fuzz/corpus/batch_update"};
    const auto mask_dir = std::string{"fuzz/corpus/field_mask"};
    const auto snapshot_dir = std::string{"fuzz/corpus/load_snapshot"};
    for (const auto& dir : {batch_dir, mask_dir, snapshot_dir}) fs::create_directories(dir);

    // Batch envelopes
    write_seed(batch_dir + "/seed_empty.json", "[]");
    write_seed(batch_dir + "/seed_text.json", R"([
        {"insertText": {"objectId": "t1", "text": " world", "insertionIndex": 5}},
        {"replaceAllText": {"containsText": {"text": "HELLO"}, "replaceText": "bye"}},
        {"deleteText": {"objectId": "t1", "textRange": {"type": "FIXED_RANGE", "startIndex": 1, "endIndex": 3}}}
    ])");
    write_seed(batch_dir + "/seed_structure.json", R"([
        {"createSlide": {"objectId": "s2", "slideLayoutReference": {"predefinedLayout": "TITLE"}}},
        {"createShape": {"objectId": "t2", "shapeType": "TEXT_BOX", "elementProperties": {"pageObjectId": "s1"}}},
        {"groupObjects": {"groupObjectId": "g1", "childrenObjectIds": ["t1", "t2"]}},
        {"duplicateObject": {"objectId": "s1"}},
        {"ungroupObjects": {"objectIds": ["g1"]}},
        {"deleteObject": {"objectId": "t2"}}
    ])");

    // Field masks
    write_seed(mask_dir + "/seed_star.txt", "*\n{\"layoutObjectId\": \"l2\"}");
    write_seed(mask_dir + "/seed_nested.txt",
               "notesPage.notesProperties.speakerNotesObjectId,isSkipped\n"
               "{\"notesPage\": {\"notesProperties\": {\"speakerNotesObjectId\": \"x\"}}, \"isSkipped\": true}");

    // Snapshots, both encodings
    for (auto compress : {true, false}) {
        auto options = sc::StoreOptions{};
        options.compress_snapshots = compress;
        auto store = sc::DocumentStore{options, 1};
        auto deck = store.create_presentation({{"presentationId", "seed"}, {"title", "Seed"}});
        if (!deck) return 1;
        auto response = store.batch_update("seed", sc::Value::parse(R"([
            {"createSlide": {"objectId": "s1"}},
            {"createShape": {"objectId": "t1", "shapeType": "TEXT_BOX", "elementProperties": {"pageObjectId": "s1"}}},
            {"insertText": {"objectId": "t1", "text": "seed"}}
        ])"));
        if (!response) return 1;
        write_seed(snapshot_dir + (compress ? "/seed_deflated.bin" : "/seed_plain.bin"), store.save_binary());
    }
    return 0;
}

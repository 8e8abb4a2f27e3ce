// slides-cpp benchmarks: measures throughput of batch updates, lookups
// and snapshots.

#include <slides-cpp/slides.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace slides_cpp;

static auto quiet_options() -> StoreOptions {
    auto options = StoreOptions{};
    options.log_level = log::Level::off;
    log::set_level(options.log_level);
    return options;
}

// A deck with `slides` slides, each holding `per_slide` text boxes.
static auto make_deck(DocumentStore& store, int slides, int per_slide) -> std::string {
    auto deck = store.create_presentation({{"presentationId", "bench"}, {"title", "Bench"}});
    benchmark::DoNotOptimize(deck);
    auto requests = std::vector<Request>{};
    for (int s = 0; s < slides; ++s) {
        auto slide_id = "s" + std::to_string(s);
        requests.push_back(CreateSlide{.object_id = slide_id});
        for (int e = 0; e < per_slide; ++e) {
            auto element_id = slide_id + "_t" + std::to_string(e);
            requests.push_back(CreateShape{.object_id = element_id, .shape_type = "TEXT_BOX",
                                           .page_object_id = slide_id});
            requests.push_back(InsertText{.object_id = element_id, .text = "Hello {{name}}"});
        }
    }
    auto response = store.batch_update("bench", requests);
    benchmark::DoNotOptimize(response);
    return "bench";
}

// =============================================================================
// Request parsing
// =============================================================================

static void bm_parse_request(benchmark::State& state) {
    const auto item = Value::parse(R"({"updateTextStyle": {
        "objectId": "t1", "style": {"bold": true}, "fields": "bold",
        "textRange": {"type": "FIXED_RANGE", "startIndex": 0, "endIndex": 4}
    }})");
    for (auto _ : state) {
        auto request = parse_request(item);
        benchmark::DoNotOptimize(request);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_parse_request);

// =============================================================================
// Batch updates
// =============================================================================

static void bm_create_slides(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        state.PauseTiming();
        auto store = DocumentStore{quiet_options(), 1};
        auto deck = store.create_presentation({{"presentationId", "bench"}});
        benchmark::DoNotOptimize(deck);
        auto requests = std::vector<Request>(n, CreateSlide{});
        state.ResumeTiming();

        auto response = store.batch_update("bench", requests);
        benchmark::DoNotOptimize(response);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_create_slides)->Range(8, 512);

static void bm_insert_text_append(benchmark::State& state) {
    auto store = DocumentStore{quiet_options(), 1};
    auto id = make_deck(store, 1, 1);
    const auto requests = std::vector<Request>{InsertText{.object_id = "s0_t0", .text = "x"}};
    for (auto _ : state) {
        auto response = store.batch_update(id, requests);
        benchmark::DoNotOptimize(response);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_insert_text_append);

static void bm_replace_all_text(benchmark::State& state) {
    const auto slides = static_cast<int>(state.range(0));
    auto store = DocumentStore{quiet_options(), 1};
    auto id = make_deck(store, slides, 4);
    // Replacing with the same text keeps the deck unchanged between runs.
    const auto requests = std::vector<Request>{
        ReplaceAllText{.find_text = "{{name}}", .match_case = true, .replace_text = "{{name}}"},
    };
    for (auto _ : state) {
        auto response = store.batch_update(id, requests);
        benchmark::DoNotOptimize(response);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * slides * 4);
}
BENCHMARK(bm_replace_all_text)->Range(8, 256);

static void bm_json_envelope(benchmark::State& state) {
    auto store = DocumentStore{quiet_options(), 1};
    auto id = make_deck(store, 4, 2);
    const auto requests = Value::parse(R"([
        {"updateTextStyle": {"objectId": "s0_t0", "style": {"italic": true}, "fields": "italic"}},
        {"updatePageElementAltText": {"objectId": "s1_t1", "title": "t", "description": "d"}},
        {"updateSlideProperties": {"objectId": "s2", "slideProperties": {"isSkipped": false}, "fields": "isSkipped"}}
    ])");
    for (auto _ : state) {
        auto response = store.batch_update(id, requests);
        benchmark::DoNotOptimize(response);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations()) * 3);
}
BENCHMARK(bm_json_envelope);

// =============================================================================
// Lookups
// =============================================================================

static void bm_find_element(benchmark::State& state) {
    auto store = DocumentStore{quiet_options(), 1};
    auto id = make_deck(store, 64, 8);
    auto deck = *store.get_presentation(id);
    for (auto _ : state) {
        auto found = find_element(deck, "s63_t7");
        benchmark::DoNotOptimize(found);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_find_element);

static void bm_summarize(benchmark::State& state) {
    auto store = DocumentStore{quiet_options(), 1};
    auto id = make_deck(store, 32, 4);
    for (auto _ : state) {
        auto summary = store.summarize(id);
        benchmark::DoNotOptimize(summary);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_summarize);

// =============================================================================
// Snapshots
// =============================================================================

static void bm_save_binary(benchmark::State& state) {
    auto options = quiet_options();
    options.compress_snapshots = state.range(0) != 0;
    auto store = DocumentStore{options, 1};
    make_deck(store, 32, 4);
    for (auto _ : state) {
        auto bytes = store.save_binary();
        benchmark::DoNotOptimize(bytes);
        state.SetBytesProcessed(static_cast<std::int64_t>(bytes.size()));
    }
    state.SetLabel(options.compress_snapshots ? "deflated" : "plain");
}
BENCHMARK(bm_save_binary)->Arg(0)->Arg(1);

static void bm_load_binary(benchmark::State& state) {
    auto options = quiet_options();
    options.compress_snapshots = state.range(0) != 0;
    auto store = DocumentStore{options, 1};
    make_deck(store, 32, 4);
    const auto bytes = store.save_binary();
    for (auto _ : state) {
        auto replica = DocumentStore{options, 2};
        auto loaded = replica.load_binary(bytes);
        benchmark::DoNotOptimize(loaded);
    }
    state.SetItemsProcessed(state.iterations());
    state.SetLabel(options.compress_snapshots ? "deflated" : "plain");
}
BENCHMARK(bm_load_binary)->Arg(0)->Arg(1);

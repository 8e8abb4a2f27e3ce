// Fuzz target for apply_requests(). Parses the input as a request
// envelope and runs it against a small deck. Whatever happens, the
// deck must still serialize.

#include <slides-cpp/slides.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};
    const auto requests = slides_cpp::Value::parse(text, nullptr, false);
    if (requests.is_discarded()) return 0;

    static const auto base = slides_cpp::Value::parse(R"({
        "presentationId": "fuzz",
        "slides": [{"objectId": "s1", "pageElements": [
            {"objectId": "t1", "shape": {"shapeType": "TEXT_BOX", "text": {"textElements": [
                {"textRun": {"content": "hello", "style": {}}},
                {"paragraphMarker": {"style": {}}}
            ]}}}
        ]}],
        "layouts": [],
        "masters": []
    })");

    slides_cpp::log::set_level(slides_cpp::log::Level::off);
    auto deck = base;
    auto ids = slides_cpp::IdFactory{1};
    auto options = slides_cpp::StoreOptions{};
    auto ctx = slides_cpp::HandlerContext{ids, options};
    auto result = slides_cpp::apply_requests(deck, requests, ctx);
    (void)result;

    auto dumped = deck.dump();
    (void)dumped;
    return 0;
}

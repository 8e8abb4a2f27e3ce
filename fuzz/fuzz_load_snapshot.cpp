// Fuzz target for DocumentStore::load_binary(). Exercises the inflate
// and JSON paths. A snapshot that loads must save again.

#include <slides-cpp/slides.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto* first = reinterpret_cast<const std::byte*>(data);
    const auto bytes = std::vector<std::byte>(first, first + size);

    slides_cpp::log::set_level(slides_cpp::log::Level::off);
    auto store = slides_cpp::DocumentStore{slides_cpp::StoreOptions{}, 1};
    if (store.load_binary(bytes)) {
        auto saved = store.save_binary();
        (void)saved;
    }
    return 0;
}

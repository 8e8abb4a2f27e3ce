#include "storage/compression.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace slides_cpp::storage;

TEST(Compression, round_trip_shrinks_repetitive_text) {
    auto text = std::string{};
    for (int i = 0; i < 200; ++i) text += R"({"objectId": "slide", "pageType": "SLIDE"},)";
    auto compressed = deflate_compress(text);
    ASSERT_TRUE(compressed);
    EXPECT_LT(compressed->size(), text.size());

    auto restored = deflate_decompress(*compressed);
    ASSERT_TRUE(restored);
    EXPECT_EQ(*restored, text);
}

TEST(Compression, empty_input) {
    auto compressed = deflate_compress("");
    ASSERT_TRUE(compressed);
    EXPECT_FALSE(compressed->empty());
    EXPECT_FALSE(deflate_decompress({}));
}

TEST(Compression, respects_output_limit) {
    auto text = std::string(100000, 'x');
    auto compressed = deflate_compress(text);
    ASSERT_TRUE(compressed);
    EXPECT_FALSE(deflate_decompress(*compressed, 4096));
    EXPECT_TRUE(deflate_decompress(*compressed, text.size() * 2));
}

TEST(Compression, rejects_corrupt_stream) {
    auto bad = std::vector<std::byte>{std::byte{0xff}, std::byte{0xff}, std::byte{0xff}};
    EXPECT_FALSE(deflate_decompress(bad));
}

#include <slides-cpp/path.hpp>

#include <gtest/gtest.h>

using namespace slides_cpp;

namespace {

auto sample() -> Value {
    return Value::parse(R"({
        "slideProperties": {"layoutObjectId": "layout_1"},
        "pageElements": [{"objectId": "sh1"}, {"objectId": "sh2"}],
        "count": 3,
        "nothing": null,
        "0": "literal zero key"
    })");
}

}  // namespace

// -- split / parse ------------------------------------------------------------

TEST(SplitPath, splits_on_dots) {
    auto parts = split_path("a.b.0");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
    EXPECT_EQ(parts[2], "0");
}

TEST(ParseIndex, digits_only) {
    EXPECT_EQ(parse_index("12"), std::size_t{12});
    EXPECT_FALSE(parse_index("1a").has_value());
    EXPECT_FALSE(parse_index("-1").has_value());
    EXPECT_FALSE(parse_index("").has_value());
}

// -- get ----------------------------------------------------------------------

TEST(GetPath, reads_nested_map_member) {
    auto r = get_path(sample(), "slideProperties.layoutObjectId");
    ASSERT_TRUE(r);
    EXPECT_EQ(*r, "layout_1");
}

TEST(GetPath, numeric_segment_indexes_sequences) {
    auto r = get_path(sample(), "pageElements.1.objectId");
    ASSERT_TRUE(r);
    EXPECT_EQ(*r, "sh2");
}

TEST(GetPath, numeric_segment_is_a_key_on_maps) {
    auto r = get_path(sample(), "0");
    ASSERT_TRUE(r);
    EXPECT_EQ(*r, "literal zero key");
}

TEST(GetPath, missing_final_segment_is_not_found) {
    auto r = get_path(sample(), "slideProperties.notesPage");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::not_found);
}

TEST(GetPath, missing_final_segment_uses_fallback) {
    auto r = get_path(sample(), "slideProperties.notesPage", Value("none"));
    ASSERT_TRUE(r);
    EXPECT_EQ(*r, "none");
}

TEST(GetPath, missing_intermediate_segment_ignores_fallback) {
    auto r = get_path(sample(), "nope.deeper", Value("none"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::not_found);
}

TEST(GetPath, out_of_range_index_is_not_found) {
    EXPECT_FALSE(get_path(sample(), "pageElements.5.objectId"));
}

TEST(FindPath, returns_pointer_or_null) {
    auto doc = sample();
    ASSERT_NE(find_path(doc, "count"), nullptr);
    EXPECT_EQ(*find_path(doc, "count"), 3);
    EXPECT_EQ(find_path(doc, "count.x"), nullptr);
}

// -- set ----------------------------------------------------------------------

TEST(SetPath, set_then_get_round_trips) {
    auto doc = sample();
    ASSERT_TRUE(set_path(doc, "slideProperties.layoutObjectId", Value("layout_2")));
    EXPECT_EQ(*get_path(doc, "slideProperties.layoutObjectId"), "layout_2");
}

TEST(SetPath, vivifies_missing_intermediate_maps) {
    auto doc = Value::object();
    ASSERT_TRUE(set_path(doc, "a.b.c", Value(1)));
    EXPECT_EQ(doc, Value::parse(R"({"a": {"b": {"c": 1}}})"));
}

TEST(SetPath, vivifies_through_null) {
    auto doc = sample();
    ASSERT_TRUE(set_path(doc, "nothing.inner", Value(true)));
    EXPECT_EQ(doc["nothing"]["inner"], true);
}

TEST(SetPath, replaces_sequence_item) {
    auto doc = sample();
    ASSERT_TRUE(set_path(doc, "pageElements.0.objectId", Value("renamed")));
    EXPECT_EQ(doc["pageElements"][0]["objectId"], "renamed");
    EXPECT_EQ(doc["pageElements"].size(), 2u);
}

TEST(SetPath, final_index_past_end_is_conflict) {
    auto doc = sample();
    auto r = set_path(doc, "pageElements.2", Value::object());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::conflict);
    EXPECT_EQ(doc["pageElements"].size(), 2u);
}

TEST(SetPath, intermediate_index_out_of_range_is_conflict) {
    auto doc = sample();
    auto r = set_path(doc, "pageElements.9.objectId", Value("x"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::conflict);
}

TEST(SetPath, scalar_in_the_way_is_conflict) {
    auto doc = sample();
    auto r = set_path(doc, "count.inner", Value(1));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::conflict);
    EXPECT_EQ(doc["count"], 3);
}

TEST(SetPath, conflict_leaves_tree_unchanged) {
    auto doc = sample();
    ASSERT_FALSE(set_path(doc, "count.a.b", Value(1)));
    EXPECT_EQ(doc, sample());
}

TEST(SetPath, sequence_needs_numeric_segment) {
    auto doc = sample();
    auto r = set_path(doc, "pageElements.first.objectId", Value("x"));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::conflict);
}

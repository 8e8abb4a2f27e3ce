#include <slides-cpp/identity.hpp>

#include <gtest/gtest.h>

#include <regex>
#include <set>
#include <string>

using namespace slides_cpp;

TEST(IdFactory, new_id_has_uuid_v4_layout) {
    auto ids = IdFactory{7};
    auto id = ids.new_id();
    EXPECT_TRUE(std::regex_match(id, std::regex{"[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}"}))
        << id;
}

TEST(IdFactory, prefixed_ids) {
    auto ids = IdFactory{7};
    auto id = ids.new_id("slide");
    ASSERT_EQ(id.size(), 6u + 32u);
    EXPECT_EQ(id.substr(0, 6), "slide_");
}

TEST(IdFactory, ids_do_not_repeat) {
    auto ids = IdFactory{};
    auto seen = std::set<std::string>{};
    for (int i = 0; i < 1000; ++i) seen.insert(ids.new_id());
    EXPECT_EQ(seen.size(), 1000u);
}

TEST(IdFactory, same_seed_same_sequence) {
    auto a = IdFactory{99};
    auto b = IdFactory{99};
    EXPECT_EQ(a.new_id(), b.new_id());
    EXPECT_EQ(a.new_id("x"), b.new_id("x"));
}

// -- remap --------------------------------------------------------------------

TEST(IdFactoryRemap, rewrites_identity_keys_only) {
    auto ids = IdFactory{1};
    auto subtree = Value::parse(R"({
        "objectId": "g1",
        "revisionId": "r1",
        "title": "g1",
        "elementGroup": {"children": [
            {"objectId": "sh1", "shape": {"shapeType": "TEXT_BOX"}},
            {"objectId": "sh2", "layoutObjectId": "sh1"}
        ]}
    })");
    auto map = IdMap{};
    auto copy = ids.remap(subtree, map);

    EXPECT_NE(copy["objectId"], "g1");
    EXPECT_NE(copy["revisionId"], "r1");
    EXPECT_EQ(copy["title"], "g1");
    EXPECT_NE(copy["elementGroup"]["children"][0]["objectId"], "sh1");
    EXPECT_EQ(copy["elementGroup"]["children"][0]["shape"]["shapeType"], "TEXT_BOX");
    EXPECT_EQ(copy["elementGroup"]["children"][1]["layoutObjectId"], "sh1");
    EXPECT_EQ(map.size(), 4u);
    EXPECT_EQ(map.at("sh1"), copy["elementGroup"]["children"][0]["objectId"]);
}

TEST(IdFactoryRemap, honours_caller_mappings) {
    auto ids = IdFactory{1};
    auto subtree = Value::parse(R"({"objectId": "s1", "pageElements": [{"objectId": "sh1"}]})");
    auto map = IdMap{{"s1", "s1_copy"}};
    auto copy = ids.remap(subtree, map);

    EXPECT_EQ(copy["objectId"], "s1_copy");
    EXPECT_NE(copy["pageElements"][0]["objectId"], "sh1");
}

TEST(IdFactoryRemap, repeated_references_stay_consistent) {
    auto ids = IdFactory{1};
    auto subtree = Value::parse(R"({
        "notesPage": {"objectId": "n1", "notesPageProperties": {"speakerNotesObjectId": "t1"}},
        "pageElements": [{"objectId": "t1"}]
    })");
    auto map = IdMap{};
    auto copy = ids.remap(subtree, map);

    EXPECT_EQ(copy["notesPage"]["notesPageProperties"]["speakerNotesObjectId"],
              copy["pageElements"][0]["objectId"]);
}

TEST(IdFactoryRemap, leaves_original_untouched) {
    auto ids = IdFactory{1};
    const auto subtree = Value::parse(R"({"objectId": "a"})");
    auto map = IdMap{};
    (void)ids.remap(subtree, map);
    EXPECT_EQ(subtree["objectId"], "a");
}

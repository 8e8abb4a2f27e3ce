#include <slides-cpp/batch_update.hpp>
#include <slides-cpp/locator.hpp>
#include <slides-cpp/log.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace slides_cpp;

namespace {

class BatchUpdateTest : public ::testing::Test {
protected:
    auto apply(std::string_view json) -> BatchResult {
        return apply_requests(deck, Value::parse(json), ctx);
    }

    Value deck = Value::parse(R"({"presentationId": "p1", "slides": [], "layouts": [], "masters": []})");
    IdFactory ids{7};
    StoreOptions options;
    HandlerContext ctx{ids, options};
};

}  // namespace

// -- Success ------------------------------------------------------------------

TEST_F(BatchUpdateTest, replies_follow_request_order) {
    auto result = apply(R"([
        {"createSlide": {"objectId": "s1", "slideLayoutReference": {"predefinedLayout": "BLANK"}}},
        {"createShape": {"objectId": "sh1", "shapeType": "TEXT_BOX",
                         "elementProperties": {"pageObjectId": "s1"}}},
        {"insertText": {"objectId": "sh1", "text": "Hi", "insertionIndex": 0}},
        {"replaceAllText": {"containsText": {"text": "Hi"}, "replaceText": "Bye"}}
    ])");
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.replies.size(), 4u);
    EXPECT_EQ(result.replies[0]["createSlide"]["objectId"], "s1");
    EXPECT_EQ(result.replies[1]["createShape"]["objectId"], "sh1");
    EXPECT_EQ(result.replies[2]["insertText"], Value::object());
    EXPECT_EQ(result.replies[3]["replaceAllText"]["occurrencesChanged"], 1);

    const auto* shape = find_element(deck, "sh1")->element;
    EXPECT_EQ((*shape)["shape"]["text"]["textElements"][0]["textRun"]["content"], "Bye");
}

TEST_F(BatchUpdateTest, empty_batch_has_no_replies) {
    auto result = apply("[]");
    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(result.replies.empty());
}

TEST_F(BatchUpdateTest, typed_requests) {
    const auto requests = std::vector<Request>{
        CreateSlide{.object_id = "s1"},
        CreateShape{.object_id = "a", .shape_type = "TEXT_BOX", .page_object_id = "s1"},
        CreateShape{.object_id = "b", .shape_type = "TEXT_BOX", .page_object_id = "s1"},
        GroupObjects{.group_object_id = "g1", .children_object_ids = {"a", "b"}},
        DeleteObject{.object_id = "g1"},
    };
    auto result = apply_requests(deck, requests, ctx);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.replies.size(), 5u);
    EXPECT_EQ(result.replies[3]["groupObjects"]["objectId"], "g1");
    EXPECT_EQ(result.replies[4]["deleteObject"], Value::object());
    EXPECT_FALSE(contains_object_id(deck, "a"));
    EXPECT_FALSE(contains_object_id(deck, "b"));
    EXPECT_TRUE(deck["slides"][0]["pageElements"].empty());
}

// -- Failure ------------------------------------------------------------------

TEST_F(BatchUpdateTest, stops_at_first_failure_and_keeps_earlier_effects) {
    auto result = apply(R"([
        {"createSlide": {"objectId": "s1"}},
        {"createSlide": {"objectId": "s2"}},
        {"deleteObject": {"objectId": "missing"}},
        {"createSlide": {"objectId": "s3"}}
    ])");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure->index, 2u);
    EXPECT_EQ(result.failure->request, "deleteObject");
    EXPECT_EQ(result.failure->error.kind, ErrorKind::not_found);
    EXPECT_EQ(result.replies.size(), 2u);

    EXPECT_NE(find_slide(deck, "s1"), nullptr);
    EXPECT_NE(find_slide(deck, "s2"), nullptr);
    EXPECT_EQ(find_slide(deck, "s3"), nullptr);
}

TEST_F(BatchUpdateTest, unknown_request_fails_at_its_index) {
    auto result = apply(R"([
        {"createSlide": {"objectId": "s1"}},
        {"createTable": {"rows": 2}}
    ])");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure->index, 1u);
    EXPECT_EQ(result.failure->request, "createTable");
    EXPECT_EQ(result.failure->error.kind, ErrorKind::invalid_input);
    EXPECT_EQ(result.replies.size(), 1u);
}

TEST_F(BatchUpdateTest, malformed_item_has_no_request_name) {
    auto result = apply(R"([{"createSlide": {}, "deleteObject": {"objectId": "x"}}])");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure->index, 0u);
    EXPECT_EQ(result.failure->request, "");
}

TEST_F(BatchUpdateTest, requests_must_be_a_list) {
    auto result = apply(R"({"createSlide": {}})");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure->error, invalid_input("requests must be a list"));
    EXPECT_TRUE(deck["slides"].empty());
}

TEST_F(BatchUpdateTest, failures_are_logged) {
    auto lines = std::vector<std::string>{};
    log::set_sink([&](log::Level level, std::string_view line) {
        if (level == log::Level::warn) lines.emplace_back(line);
    });
    apply(R"([{"deleteObject": {"objectId": "missing"}}])");
    log::set_sink({});

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("request 0 (deleteObject)"), std::string::npos);
    EXPECT_NE(lines[0].find("not_found"), std::string::npos);
}

// -- Scenarios ----------------------------------------------------------------

TEST_F(BatchUpdateTest, group_then_ungroup_round_trip) {
    auto result = apply(R"([
        {"createSlide": {"objectId": "s1"}},
        {"createShape": {"objectId": "a", "shapeType": "TEXT_BOX", "elementProperties": {"pageObjectId": "s1"}}},
        {"createShape": {"objectId": "b", "shapeType": "TEXT_BOX", "elementProperties": {"pageObjectId": "s1"}}},
        {"groupObjects": {"groupObjectId": "g1", "childrenObjectIds": ["a", "b"]}},
        {"ungroupObjects": {"objectIds": ["a", "b"]}}
    ])");
    ASSERT_TRUE(result.ok());
    const auto& elements = deck["slides"][0]["pageElements"];
    ASSERT_EQ(elements.size(), 2u);
    EXPECT_EQ(elements[0]["objectId"], "a");
    EXPECT_EQ(elements[1]["objectId"], "b");
    EXPECT_FALSE(contains_object_id(deck, "g1"));
}

TEST_F(BatchUpdateTest, duplicate_id_in_batch_is_a_conflict) {
    auto result = apply(R"([
        {"createSlide": {"objectId": "s1"}},
        {"createShape": {"objectId": "s1", "shapeType": "TEXT_BOX", "elementProperties": {"pageObjectId": "s1"}}}
    ])");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.failure->index, 1u);
    EXPECT_EQ(result.failure->error.kind, ErrorKind::conflict);
}

TEST_F(BatchUpdateTest, duplicate_slide_then_edit_copy) {
    auto result = apply(R"([
        {"createSlide": {"objectId": "s1"}},
        {"createShape": {"objectId": "t1", "shapeType": "TEXT_BOX", "elementProperties": {"pageObjectId": "s1"}}},
        {"insertText": {"objectId": "t1", "text": "original"}},
        {"duplicateObject": {"objectId": "s1", "objectIds": {"s1": "s1_copy", "t1": "t1_copy"}}},
        {"insertText": {"objectId": "t1_copy", "text": "copy of ", "insertionIndex": 0}}
    ])");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.replies[3]["duplicateObject"]["objectId"], "s1_copy");
    const auto* copy = find_element(deck, "t1_copy")->element;
    EXPECT_EQ((*copy)["shape"]["text"]["textElements"][0]["textRun"]["content"], "copy of original");
    const auto* original = find_element(deck, "t1")->element;
    EXPECT_EQ((*original)["shape"]["text"]["textElements"][0]["textRun"]["content"], "original");
}

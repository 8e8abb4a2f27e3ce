#include <slides-cpp/request.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace slides_cpp;

namespace {

auto parse(const char* json) -> Result<Request> {
    return parse_request(Value::parse(json));
}

}  // namespace

// -- Envelope -----------------------------------------------------------------

TEST(ParseRequest, item_must_have_exactly_one_key) {
    auto r = parse(R"({"createSlide": {}, "deleteObject": {"objectId": "x"}})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_input);
    EXPECT_FALSE(parse(R"({})"));
    EXPECT_FALSE(parse(R"([])"));
}

TEST(ParseRequest, unknown_operation_is_invalid_input) {
    auto r = parse(R"({"createVideo": {}})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_input);
    EXPECT_NE(r.error().message.find("createVideo"), std::string::npos);
}

TEST(ParseRequest, parameters_must_be_an_object) {
    auto r = parse(R"({"createSlide": 5})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_input);
}

TEST(RequestName, matches_wire_name) {
    EXPECT_EQ(request_name(Request{CreateSlide{}}), "createSlide");
    EXPECT_EQ(request_name(Request{UpdatePageElementAltText{}}), "updatePageElementAltText");
    EXPECT_EQ(request_name(Request{DuplicateObject{}}), "duplicateObject");
}

// -- Operations ---------------------------------------------------------------

TEST(ParseRequest, create_slide_with_layout_reference) {
    auto r = parse(R"({"createSlide": {
        "objectId": "s1", "insertionIndex": 2,
        "slideLayoutReference": {"predefinedLayout": "TITLE"}
    }})");
    ASSERT_TRUE(r);
    const auto& req = std::get<CreateSlide>(*r);
    EXPECT_EQ(req.object_id, "s1");
    EXPECT_EQ(req.insertion_index, 2);
    ASSERT_TRUE(req.layout.has_value());
    EXPECT_EQ(req.layout->predefined_layout, "TITLE");
    EXPECT_FALSE(req.layout->layout_id.has_value());
}

TEST(ParseRequest, create_slide_rejects_both_layout_fields) {
    auto r = parse(R"({"createSlide": {"slideLayoutReference": {"layoutId": "l", "predefinedLayout": "BLANK"}}})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_input);
}

TEST(ParseRequest, create_shape_reads_element_properties) {
    auto r = parse(R"({"createShape": {
        "objectId": "sh1", "shapeType": "TEXT_BOX",
        "elementProperties": {"pageObjectId": "s1", "size": {"width": {"magnitude": 10, "unit": "PT"}}}
    }})");
    ASSERT_TRUE(r);
    const auto& req = std::get<CreateShape>(*r);
    EXPECT_EQ(req.shape_type, "TEXT_BOX");
    EXPECT_EQ(req.page_object_id, "s1");
    ASSERT_TRUE(req.size.has_value());
    EXPECT_EQ((*req.size)["width"]["magnitude"], 10);
    EXPECT_FALSE(req.transform.has_value());
}

TEST(ParseRequest, create_shape_needs_shape_type) {
    auto r = parse(R"({"createShape": {"elementProperties": {"pageObjectId": "s1"}}})");
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("shapeType"), std::string::npos);
}

TEST(ParseRequest, insert_text_with_cell_location) {
    auto r = parse(R"({"insertText": {"objectId": "t", "text": "x", "cellLocation": {"rowIndex": 1, "columnIndex": 0}}})");
    ASSERT_TRUE(r);
    const auto& req = std::get<InsertText>(*r);
    ASSERT_TRUE(req.cell_location.has_value());
    EXPECT_EQ(req.cell_location->row_index, 1);
    EXPECT_FALSE(req.insertion_index.has_value());
}

TEST(ParseRequest, wrong_type_is_invalid_input) {
    auto r = parse(R"({"insertText": {"objectId": "t", "text": 7}})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_input);
    EXPECT_NE(r.error().message.find("insertText"), std::string::npos);
}

TEST(ParseRequest, index_beyond_int64_is_invalid_input) {
    auto r = parse(R"({"insertText": {"objectId": "t", "text": "x", "insertionIndex": 18446744073709551615}})");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::invalid_input);
    EXPECT_NE(r.error().message.find("insertionIndex is out of range"), std::string::npos);

    auto slide = parse(R"({"createSlide": {"insertionIndex": 9223372036854775808}})");
    ASSERT_FALSE(slide);
    EXPECT_EQ(slide.error().kind, ErrorKind::invalid_input);

    auto largest = parse(R"({"insertText": {"objectId": "t", "text": "x", "insertionIndex": 9223372036854775807}})");
    ASSERT_TRUE(largest);
    EXPECT_EQ(std::get<InsertText>(*largest).insertion_index, std::numeric_limits<std::int64_t>::max());
}

TEST(ParseRequest, null_counts_as_absent) {
    auto r = parse(R"({"insertText": {"objectId": "t", "text": "x", "insertionIndex": null}})");
    ASSERT_TRUE(r);
    EXPECT_FALSE(std::get<InsertText>(*r).insertion_index.has_value());
}

TEST(ParseRequest, replace_all_text_defaults) {
    auto r = parse(R"({"replaceAllText": {"containsText": {"text": "Hi"}, "replaceText": "Bye"}})");
    ASSERT_TRUE(r);
    const auto& req = std::get<ReplaceAllText>(*r);
    EXPECT_EQ(req.find_text, "Hi");
    EXPECT_FALSE(req.match_case);
    EXPECT_EQ(req.replace_text, "Bye");
    EXPECT_TRUE(req.page_object_ids.empty());
}

TEST(ParseRequest, replace_all_text_needs_contains_text) {
    EXPECT_FALSE(parse(R"({"replaceAllText": {"replaceText": "Bye"}})"));
}

TEST(ParseRequest, delete_text_range_types) {
    auto r = parse(R"({"deleteText": {"objectId": "t", "textRange": {"type": "FIXED_RANGE", "startIndex": 1, "endIndex": 3}}})");
    ASSERT_TRUE(r);
    const auto& req = std::get<DeleteText>(*r);
    EXPECT_EQ(req.text_range.type, RangeType::fixed_range);
    EXPECT_EQ(req.text_range.start_index, 1);
    EXPECT_EQ(req.text_range.end_index, 3);

    auto bad = parse(R"({"deleteText": {"objectId": "t", "textRange": {"type": "SOME"}}})");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().kind, ErrorKind::invalid_input);

    EXPECT_FALSE(parse(R"({"deleteText": {"objectId": "t"}})"));
}

TEST(ParseRequest, update_text_style_keeps_style_payload) {
    auto r = parse(R"({"updateTextStyle": {"objectId": "t", "style": {"bold": true}, "fields": "bold"}})");
    ASSERT_TRUE(r);
    const auto& req = std::get<UpdateTextStyle>(*r);
    EXPECT_EQ(req.style, Value::parse(R"({"bold": true})"));
    EXPECT_EQ(req.fields, "bold");
}

TEST(ParseRequest, group_and_ungroup_lists) {
    auto g = parse(R"({"groupObjects": {"groupObjectId": "g1", "childrenObjectIds": ["a", "b"]}})");
    ASSERT_TRUE(g);
    EXPECT_EQ(std::get<GroupObjects>(*g).children_object_ids, (std::vector<std::string>{"a", "b"}));

    EXPECT_FALSE(parse(R"({"groupObjects": {"childrenObjectIds": ["a", 3]}})"));
    EXPECT_FALSE(parse(R"({"ungroupObjects": {}})"));
}

TEST(ParseRequest, update_slide_properties_needs_fields) {
    EXPECT_FALSE(parse(R"({"updateSlideProperties": {"objectId": "s1", "slideProperties": {}}})"));
    auto r = parse(R"({"updateSlideProperties": {"objectId": "s1", "slideProperties": {"layoutObjectId": "l"}, "fields": "*"}})");
    ASSERT_TRUE(r);
    EXPECT_EQ(std::get<UpdateSlideProperties>(*r).fields, "*");
}

TEST(ParseRequest, duplicate_object_mapping) {
    auto r = parse(R"({"duplicateObject": {"objectId": "s1", "objectIds": {"s1": "s1_copy"}}})");
    ASSERT_TRUE(r);
    EXPECT_EQ(std::get<DuplicateObject>(*r).object_ids.at("s1"), "s1_copy");
    EXPECT_FALSE(parse(R"({"duplicateObject": {"objectId": "s1", "objectIds": {"s1": 1}}})"));
}

TEST(ParseRequest, alt_text_fields_are_optional) {
    auto r = parse(R"({"updatePageElementAltText": {"objectId": "sh1", "title": "Logo"}})");
    ASSERT_TRUE(r);
    const auto& req = std::get<UpdatePageElementAltText>(*r);
    EXPECT_EQ(req.title, "Logo");
    EXPECT_FALSE(req.description.has_value());
}

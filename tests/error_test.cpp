#include <slides-cpp/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace slides_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::invalid_input),     "invalid_input");
    EXPECT_EQ(to_string_view(ErrorKind::not_found),         "not_found");
    EXPECT_EQ(to_string_view(ErrorKind::conflict),          "conflict");
    EXPECT_EQ(to_string_view(ErrorKind::unimplemented),     "unimplemented");
    EXPECT_EQ(to_string_view(ErrorKind::revision_mismatch), "revision_mismatch");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::conflict, "duplicate"};
    const auto e2 = Error{ErrorKind::conflict, "duplicate"};
    const auto e3 = Error{ErrorKind::not_found, "duplicate"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, helper_constructors_set_the_kind) {
    EXPECT_EQ(invalid_input("x").kind, ErrorKind::invalid_input);
    EXPECT_EQ(not_found("x").kind, ErrorKind::not_found);
    EXPECT_EQ(conflict("x").kind, ErrorKind::conflict);
    EXPECT_EQ(unimplemented("x").kind, ErrorKind::unimplemented);
    EXPECT_EQ(not_found("slide 's1' not found").message, "slide 's1' not found");
}

// -- Result -------------------------------------------------------------------

TEST(Result, holds_a_value) {
    auto r = Result<int>{42};
    ASSERT_TRUE(r);
    EXPECT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
    EXPECT_EQ(r.value(), 42);
}

TEST(Result, holds_an_error) {
    auto r = Result<int>{not_found("missing")};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().kind, ErrorKind::not_found);
    EXPECT_EQ(r.error().message, "missing");
}

TEST(Result, arrow_reaches_the_value) {
    auto r = Result<std::string>{std::string{"hello"}};
    EXPECT_EQ(r->size(), 5u);
}

TEST(Result, value_can_be_moved_out) {
    auto r = Result<std::string>{std::string{"payload"}};
    auto s = std::move(r).value();
    EXPECT_EQ(s, "payload");
}

TEST(ResultVoid, default_is_success) {
    auto r = Result<void>{};
    EXPECT_TRUE(r);
}

TEST(ResultVoid, carries_an_error) {
    auto r = Result<void>{conflict("path blocked")};
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error(), conflict("path blocked"));
}

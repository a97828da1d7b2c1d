#include <coedit-cpp/error.hpp>

#include <gtest/gtest.h>

using namespace coedit_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::invalid_value),     "invalid_value");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_session),   "invalid_session");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_document),  "invalid_document");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_operation), "invalid_operation");
    EXPECT_EQ(to_string_view(ErrorKind::session_not_found), "session_not_found");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::invalid_value, "UserId cannot be empty"};
    const auto e2 = Error{ErrorKind::invalid_value, "UserId cannot be empty"};
    const auto e3 = Error{ErrorKind::invalid_session, "UserId cannot be empty"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::invalid_document, "foo"};
    const auto e2 = Error{ErrorKind::invalid_document, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Exception, carries_kind_and_message) {
    try {
        throw InvalidSessionError{"Session ID cannot be empty"};
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_session);
        EXPECT_EQ(e.error().message, "Session ID cannot be empty");
        EXPECT_STREQ(e.what(), "Session ID cannot be empty");
    }
}

TEST(Exception, subclasses_map_to_their_kind) {
    EXPECT_EQ(InvalidValueError{"x"}.kind(), ErrorKind::invalid_value);
    EXPECT_EQ(InvalidDocumentError{"x"}.kind(), ErrorKind::invalid_document);
    EXPECT_EQ(InvalidOperationError{"x"}.kind(), ErrorKind::invalid_operation);
    EXPECT_EQ(SessionNotFoundError{"x"}.kind(), ErrorKind::session_not_found);
}

TEST(Exception, catchable_as_runtime_error) {
    EXPECT_THROW(throw InvalidValueError{"bad"}, std::runtime_error);
}

#include <coedit-cpp/mention.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace coedit_cpp;

namespace {

const auto pattern = MentionPattern{};

}  // namespace

// -- MentionPattern -----------------------------------------------------------

TEST(MentionPattern, default_is_at_j) {
    EXPECT_EQ(pattern.prefix(), "@j");
    EXPECT_EQ(pattern.size(), 2u);
}

TEST(MentionPattern, empty_throws) {
    EXPECT_THROW(MentionPattern{""}, InvalidValueError);
}

TEST(MentionPattern, line_break_or_trailing_space_throws) {
    EXPECT_THROW(MentionPattern{"@j\n"}, InvalidValueError);
    EXPECT_THROW(MentionPattern{"@\nj"}, InvalidValueError);
    EXPECT_THROW(MentionPattern{"@j\r"}, InvalidValueError);
    EXPECT_THROW(MentionPattern{"@j "}, InvalidValueError);
    EXPECT_THROW(MentionPattern{"@j\t"}, InvalidValueError);
    EXPECT_NO_THROW(MentionPattern{"/ask"});
}

TEST(MentionPattern, prefix_match_ignores_case) {
    EXPECT_TRUE(pattern.is_prefix_of("@j hello"));
    EXPECT_TRUE(pattern.is_prefix_of("@J hello"));
    EXPECT_FALSE(pattern.is_prefix_of("@"));
    EXPECT_FALSE(pattern.is_prefix_of(" @j"));
}

// -- detect_at_cursor ---------------------------------------------------------

TEST(DetectAtCursor, round_trip_with_question) {
    const auto text = std::string{"@j what is TypeScript?"};
    const auto d = detect_at_cursor(pattern, text, 5);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->from, 0u);
    EXPECT_EQ(d->to, 22u);
    EXPECT_EQ(d->text, "@j what is TypeScript?");

    const auto q = extract_question(pattern, d);
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(*q, "what is TypeScript?");
    EXPECT_TRUE(is_valid_for_query(pattern, d));
}

TEST(DetectAtCursor, span_boundaries_are_inclusive) {
    const auto text = std::string{"@j hi"};
    EXPECT_TRUE(detect_at_cursor(pattern, text, 0).has_value());
    EXPECT_TRUE(detect_at_cursor(pattern, text, 5).has_value());
}

TEST(DetectAtCursor, cursor_before_span_misses) {
    const auto text = std::string{"Intro @j question"};
    EXPECT_FALSE(detect_at_cursor(pattern, text, 3).has_value());
    const auto d = detect_at_cursor(pattern, text, 6);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->from, 6u);
    EXPECT_EQ(d->text, "@j question");
}

TEST(DetectAtCursor, cursor_past_text_misses) {
    EXPECT_FALSE(detect_at_cursor(pattern, "@j hi", 6).has_value());
}

TEST(DetectAtCursor, span_stops_at_newline) {
    const auto text = std::string{"@j first\nsecond line"};
    const auto d = detect_at_cursor(pattern, text, 3);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->to, 8u);
    EXPECT_EQ(d->text, "@j first");
    EXPECT_FALSE(detect_at_cursor(pattern, text, 12).has_value());
}

TEST(DetectAtCursor, picks_the_line_under_the_cursor) {
    const auto text = std::string{"@j one\nplain\n@j two"};
    const auto first = detect_at_cursor(pattern, text, 2);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->text, "@j one");

    const auto second = detect_at_cursor(pattern, text, 16);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->from, 13u);
    EXPECT_EQ(second->text, "@j two");

    EXPECT_FALSE(detect_at_cursor(pattern, text, 9).has_value());
}

TEST(DetectAtCursor, prefix_inside_a_word_does_not_trigger) {
    EXPECT_FALSE(detect_at_cursor(pattern, "mail@jane.com", 6).has_value());
    EXPECT_FALSE(detect_at_cursor(pattern, "@java rocks", 2).has_value());
}

TEST(DetectAtCursor, uppercase_prefix_triggers) {
    const auto d = detect_at_cursor(pattern, "@J Why?", 4);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(extract_question(pattern, d), "Why?");
}

TEST(DetectAtCursor, bare_prefix_is_detected_but_not_valid) {
    const auto d = detect_at_cursor(pattern, "@j", 2);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->text, "@j");
    EXPECT_FALSE(is_valid_for_query(pattern, d));
}

TEST(DetectAtCursor, custom_pattern) {
    const auto agent = MentionPattern{"@agent"};
    const auto d = detect_at_cursor(agent, "hey @agent summarize", 12);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->from, 4u);
    EXPECT_EQ(extract_question(agent, d), "summarize");
}

TEST(DetectAtCursor, empty_text) {
    EXPECT_FALSE(detect_at_cursor(pattern, "", 0).has_value());
}

// -- extract_question ---------------------------------------------------------

TEST(ExtractQuestion, whitespace_only_tail_is_rejected) {
    const auto d = std::optional{MentionDetection{0, 3, "@j "}};
    EXPECT_FALSE(extract_question(pattern, d).has_value());
    EXPECT_FALSE(is_valid_for_query(pattern, d));
}

TEST(ExtractQuestion, no_detection_is_nullopt) {
    EXPECT_FALSE(extract_question(pattern, std::nullopt).has_value());
    EXPECT_FALSE(is_valid_for_query(pattern, std::nullopt));
}

TEST(ExtractQuestion, text_without_prefix_is_nullopt) {
    const auto d = std::optional{MentionDetection{0, 5, "hello"}};
    EXPECT_FALSE(extract_question(pattern, d).has_value());
}

TEST(ExtractQuestion, trims_surrounding_whitespace) {
    const auto d = std::optional{MentionDetection{0, 14, "@j   spaced  \t"}};
    EXPECT_EQ(extract_question(pattern, d), "spaced");
}

// -- parse_agent_command ------------------------------------------------------

TEST(ParseAgentCommand, agent_name_and_question) {
    const auto c = parse_agent_command(pattern, "@j writer What is this?");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->agent_name, "writer");
    EXPECT_EQ(c->question, "What is this?");
}

TEST(ParseAgentCommand, single_word_is_the_question) {
    const auto c = parse_agent_command(pattern, "@j What?");
    ASSERT_TRUE(c.has_value());
    EXPECT_FALSE(c->agent_name.has_value());
    EXPECT_EQ(c->question, "What?");
}

TEST(ParseAgentCommand, non_handle_first_word_is_the_question) {
    const auto c = parse_agent_command(pattern, "@j what's new today");
    ASSERT_TRUE(c.has_value());
    EXPECT_FALSE(c->agent_name.has_value());
    EXPECT_EQ(c->question, "what's new today");
}

TEST(ParseAgentCommand, handle_may_contain_dash_and_underscore) {
    const auto c = parse_agent_command(pattern, "@j code_review-2 check this");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->agent_name, "code_review-2");
    EXPECT_EQ(c->question, "check this");
}

TEST(ParseAgentCommand, empty_command_is_nullopt) {
    EXPECT_FALSE(parse_agent_command(pattern, "@j   ").has_value());
    EXPECT_FALSE(parse_agent_command(pattern, "no prefix").has_value());
}

// json_test.cpp: Tests for nlohmann/json interoperability

#include <coedit-cpp/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace ce = coedit_cpp;
using json = nlohmann::json;

namespace {

auto sample_document() -> ce::Document {
    return ce::Document::create(ce::DocumentId{"d1"}, ce::DocumentContent{"# Notes"},
                                ce::UserId{"alice"}, ce::Timestamp{1000})
        .update_content(ce::DocumentContent{"# Notes\n\nDone"}, ce::UserId{"bob"},
                        ce::Timestamp{2000});
}

auto sample_session() -> ce::CollaborationSession {
    return ce::CollaborationSession::create("s1", ce::DocumentId{"d1"}, ce::Timestamp{500})
        .add_participant(ce::Participant::join(ce::UserId{"u2"}, ce::UserName{"Bob"},
                                               ce::UserColor{"#4ECDC4"}))
        .add_participant(ce::Participant::join(ce::UserId{"u1"}, ce::UserName{"Alice"},
                                               ce::UserColor{"#FF6B6B"}))
        .deactivate_participant(ce::UserId{"u2"});
}

}  // namespace

// =============================================================================
// Value objects
// =============================================================================

TEST(JsonValues, identity_values_are_strings) {
    EXPECT_EQ(json(ce::UserId{"u1"}), json("u1"));
    EXPECT_EQ(json("d9").get<ce::DocumentId>(), ce::DocumentId{"d9"});
}

TEST(JsonValues, empty_identity_string_throws) {
    EXPECT_THROW(json("").get<ce::UserId>(), ce::InvalidValueError);
}

TEST(JsonValues, timestamp_is_a_number) {
    EXPECT_EQ(json(ce::Timestamp{1234}), json(1234));
    EXPECT_EQ(json(99).get<ce::Timestamp>(), ce::Timestamp{99});
}

TEST(JsonValues, change_kind_is_a_name) {
    EXPECT_EQ(json(ce::ChangeKind::update), json("update"));
    EXPECT_EQ(json("create").get<ce::ChangeKind>(), ce::ChangeKind::create);
    EXPECT_THROW(json("delete").get<ce::ChangeKind>(), ce::InvalidDocumentError);
}

TEST(JsonValues, mention_detection) {
    const auto d = ce::MentionDetection{0, 22, "@j what is TypeScript?"};
    const auto j = json(d);
    EXPECT_EQ(j["from"], 0);
    EXPECT_EQ(j["to"], 22);
    EXPECT_EQ(j.get<ce::MentionDetection>(), d);
}

TEST(JsonValues, agent_command_with_and_without_agent) {
    const auto with = ce::AgentCommand{"writer", "Draft an intro"};
    EXPECT_EQ(json(with)["agent_name"], "writer");
    EXPECT_EQ(json(with).get<ce::AgentCommand>(), with);

    const auto without = ce::AgentCommand{std::nullopt, "Why?"};
    EXPECT_TRUE(json(without)["agent_name"].is_null());
    EXPECT_EQ(json(without).get<ce::AgentCommand>(), without);
}

TEST(JsonValues, agent_query_exports_lifecycle) {
    const auto q = ce::AgentQuery::create("q-1", "Why?", "writer", ce::Timestamp{10})
                       .mark_streaming()
                       .mark_completed("Because.", ce::Timestamp{30});
    const auto j = json(q);
    EXPECT_EQ(j["status"], "completed");
    EXPECT_EQ(j["agent_name"], "writer");
    EXPECT_EQ(j["response"], "Because.");
    EXPECT_EQ(j["ended_at"], 30);
    EXPECT_FALSE(j.contains("error"));
}

TEST(JsonValues, error_exports_kind_name) {
    const auto j = json(ce::Error{ce::ErrorKind::session_not_found, "no s9"});
    EXPECT_EQ(j["kind"], "session_not_found");
    EXPECT_EQ(j["message"], "no s9");
}

// =============================================================================
// Document
// =============================================================================

TEST(JsonDocument, export_shape) {
    const auto j = json(sample_document());
    EXPECT_EQ(j["id"], "d1");
    EXPECT_EQ(j["content"], "# Notes\n\nDone");
    EXPECT_EQ(j["version"], 2);
    EXPECT_EQ(j["created_at"], 1000);
    EXPECT_EQ(j["updated_at"], 2000);
    ASSERT_EQ(j["changes"].size(), 2u);
    EXPECT_EQ(j["changes"][0]["kind"], "create");
    EXPECT_EQ(j["changes"][1]["actor"], "bob");
    EXPECT_EQ(j["changes"][1]["seq"], 2);
}

TEST(JsonDocument, import_restores_equal_value) {
    const auto doc = sample_document();
    EXPECT_EQ(json(doc).get<ce::Document>(), doc);
}

TEST(JsonDocument, import_through_text) {
    const auto doc = sample_document();
    const auto text = json(doc).dump();
    EXPECT_EQ(json::parse(text).get<ce::Document>(), doc);
}

TEST(JsonDocument, version_mismatch_throws) {
    auto j = json(sample_document());
    j["version"] = 7;
    EXPECT_THROW(j.get<ce::Document>(), ce::InvalidDocumentError);
}

TEST(JsonDocument, broken_history_throws) {
    auto j = json(sample_document());
    j["changes"][1]["kind"] = "create";
    EXPECT_THROW(j.get<ce::Document>(), ce::InvalidDocumentError);
}

TEST(JsonDocument, missing_field_throws_json_error) {
    auto j = json(sample_document());
    j.erase("content");
    EXPECT_THROW(j.get<ce::Document>(), json::out_of_range);
}

// =============================================================================
// Participant and session
// =============================================================================

TEST(JsonSession, participants_sorted_by_user_id) {
    const auto j = json(sample_session());
    EXPECT_EQ(j["session_id"], "s1");
    EXPECT_EQ(j["document_id"], "d1");
    ASSERT_EQ(j["participants"].size(), 2u);
    EXPECT_EQ(j["participants"][0]["user_id"], "u1");
    EXPECT_EQ(j["participants"][1]["user_id"], "u2");
    EXPECT_EQ(j["participants"][1]["is_active"], false);
}

TEST(JsonSession, import_restores_equal_value) {
    const auto s = sample_session();
    EXPECT_EQ(json(s).get<ce::CollaborationSession>(), s);
}

TEST(JsonSession, participant_defaults_to_active) {
    const auto j = json{{"user_id", "u1"}, {"user_name", "Ann"}, {"user_color", "#000"}};
    EXPECT_TRUE(j.get<ce::Participant>().is_active());
}

TEST(JsonSession, empty_session_id_throws) {
    auto j = json(sample_session());
    j["session_id"] = "";
    EXPECT_THROW(j.get<ce::CollaborationSession>(), ce::InvalidSessionError);
}

// =============================================================================
// Config
// =============================================================================

TEST(JsonConfig, export_uses_millisecond_key) {
    const auto j = json(ce::Config{});
    EXPECT_EQ(j["max_participants"], 10);
    EXPECT_EQ(j["mention_pattern"], "@j");
    EXPECT_EQ(j["log_level"], "info");
    EXPECT_EQ(j["agent_timeout_ms"], 30000);
}

TEST(JsonConfig, round_trip) {
    auto c = ce::Config{};
    c.max_participants = 4;
    c.mention_pattern = ce::MentionPattern{"@bot"};
    EXPECT_EQ(json(c).get<ce::Config>(), c);
}

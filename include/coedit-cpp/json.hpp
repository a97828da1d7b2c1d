/// @file json.hpp
/// @brief nlohmann/json interoperability for coedit-cpp.
///
/// Provides ADL serialization (to_json/from_json) for every value type,
/// and adl_serializer specializations for the aggregates that have no
/// default constructor (DocumentChange, Document, Participant,
/// CollaborationSession). This is the shape a persistence collaborator
/// stores and hands back.

#pragma once

#include <coedit-cpp/agent_query.hpp>
#include <coedit-cpp/change.hpp>
#include <coedit-cpp/config.hpp>
#include <coedit-cpp/document.hpp>
#include <coedit-cpp/error.hpp>
#include <coedit-cpp/mention.hpp>
#include <coedit-cpp/participant.hpp>
#include <coedit-cpp/session.hpp>
#include <coedit-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace coedit_cpp {

// =============================================================================
// Value objects
// =============================================================================

void to_json(nlohmann::json& j, const Timestamp& t);
void from_json(const nlohmann::json& j, Timestamp& t);

template <typename Tag>
void to_json(nlohmann::json& j, const StringValue<Tag>& v) {
    j = v.value();
}

/// @throws InvalidValueError for an empty string.
template <typename Tag>
void from_json(const nlohmann::json& j, StringValue<Tag>& v) {
    v = StringValue<Tag>{j.get<std::string>()};
}

void to_json(nlohmann::json& j, const DocumentContent& c);
void from_json(const nlohmann::json& j, DocumentContent& c);

void to_json(nlohmann::json& j, ChangeKind kind);
void from_json(const nlohmann::json& j, ChangeKind& kind);

void to_json(nlohmann::json& j, const MentionPattern& p);
void from_json(const nlohmann::json& j, MentionPattern& p);

// =============================================================================
// Mention and agent types
// =============================================================================

void to_json(nlohmann::json& j, const MentionDetection& d);
void from_json(const nlohmann::json& j, MentionDetection& d);

void to_json(nlohmann::json& j, const AgentCommand& c);
void from_json(const nlohmann::json& j, AgentCommand& c);

void to_json(nlohmann::json& j, QueryStatus status);
void to_json(nlohmann::json& j, const AgentQuery& q);

void to_json(nlohmann::json& j, const Error& e);

// =============================================================================
// Configuration
// =============================================================================

void to_json(nlohmann::json& j, const Config& c);

/// Missing keys keep their current values in @p c.
void from_json(const nlohmann::json& j, Config& c);

}  // namespace coedit_cpp

/// @cond ADL_SERIALIZERS

namespace nlohmann {

template <>
struct adl_serializer<coedit_cpp::DocumentChange> {
    static void to_json(json& j, const coedit_cpp::DocumentChange& c);
    static auto from_json(const json& j) -> coedit_cpp::DocumentChange;
};

/// Restores through Document::restore(), so a stored document whose
/// history is inconsistent throws InvalidDocumentError.
template <>
struct adl_serializer<coedit_cpp::Document> {
    static void to_json(json& j, const coedit_cpp::Document& d);
    static auto from_json(const json& j) -> coedit_cpp::Document;
};

template <>
struct adl_serializer<coedit_cpp::Participant> {
    static void to_json(json& j, const coedit_cpp::Participant& p);
    static auto from_json(const json& j) -> coedit_cpp::Participant;
};

/// Participants are written as an array ordered by user id.
template <>
struct adl_serializer<coedit_cpp::CollaborationSession> {
    static void to_json(json& j, const coedit_cpp::CollaborationSession& s);
    static auto from_json(const json& j) -> coedit_cpp::CollaborationSession;
};

}  // namespace nlohmann

/// @endcond

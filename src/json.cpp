#include <coedit-cpp/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace coedit_cpp {

// =============================================================================
// Value objects
// =============================================================================

void to_json(nlohmann::json& j, const Timestamp& t) {
    j = t.millis_since_epoch;
}

void from_json(const nlohmann::json& j, Timestamp& t) {
    t.millis_since_epoch = j.get<std::int64_t>();
}

void to_json(nlohmann::json& j, const DocumentContent& c) {
    j = c.value();
}

void from_json(const nlohmann::json& j, DocumentContent& c) {
    c = DocumentContent{j.get<std::string>()};
}

void to_json(nlohmann::json& j, ChangeKind kind) {
    j = std::string{to_string_view(kind)};
}

void from_json(const nlohmann::json& j, ChangeKind& kind) {
    const auto name = j.get<std::string>();
    if (name == "create") {
        kind = ChangeKind::create;
    } else if (name == "update") {
        kind = ChangeKind::update;
    } else {
        throw InvalidDocumentError{"unknown change kind: " + name};
    }
}

void to_json(nlohmann::json& j, const MentionPattern& p) {
    j = p.prefix();
}

void from_json(const nlohmann::json& j, MentionPattern& p) {
    p = MentionPattern{j.get<std::string>()};
}

// =============================================================================
// Mention and agent types
// =============================================================================

void to_json(nlohmann::json& j, const MentionDetection& d) {
    j = nlohmann::json{{"from", d.from}, {"to", d.to}, {"text", d.text}};
}

void from_json(const nlohmann::json& j, MentionDetection& d) {
    j.at("from").get_to(d.from);
    j.at("to").get_to(d.to);
    j.at("text").get_to(d.text);
}

void to_json(nlohmann::json& j, const AgentCommand& c) {
    j = nlohmann::json{{"question", c.question}};
    j["agent_name"] = c.agent_name ? nlohmann::json(*c.agent_name) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, AgentCommand& c) {
    j.at("question").get_to(c.question);
    if (auto it = j.find("agent_name"); it != j.end() && !it->is_null()) {
        c.agent_name = it->get<std::string>();
    } else {
        c.agent_name.reset();
    }
}

void to_json(nlohmann::json& j, QueryStatus status) {
    j = std::string{to_string_view(status)};
}

void to_json(nlohmann::json& j, const AgentQuery& q) {
    j = nlohmann::json{
        {"query_id", q.query_id()},
        {"question", q.question()},
        {"status", q.status()},
        {"started_at", q.started_at()},
    };
    if (q.agent_name()) j["agent_name"] = *q.agent_name();
    if (q.ended_at()) j["ended_at"] = *q.ended_at();
    if (q.response()) j["response"] = *q.response();
    if (q.error()) j["error"] = *q.error();
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{{"kind", std::string{to_string_view(e.kind)}}, {"message", e.message}};
}

// =============================================================================
// Configuration
// =============================================================================

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"max_participants", c.max_participants},
        {"mention_pattern", c.mention_pattern},
        {"log_level", c.log_level},
        {"agent_timeout_ms", c.agent_timeout.count()},
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (auto it = j.find("max_participants"); it != j.end()) {
        const auto cap = it->get<std::int64_t>();
        if (cap < 1) {
            throw InvalidValueError{"max_participants must be at least 1"};
        }
        c.max_participants = static_cast<std::size_t>(cap);
    }
    if (auto it = j.find("mention_pattern"); it != j.end()) {
        it->get_to(c.mention_pattern);
    }
    if (auto it = j.find("log_level"); it != j.end()) {
        it->get_to(c.log_level);
    }
    if (auto it = j.find("agent_timeout_ms"); it != j.end()) {
        c.agent_timeout = std::chrono::milliseconds{it->get<std::int64_t>()};
    }
}

}  // namespace coedit_cpp

// =============================================================================
// adl_serializer specializations
// =============================================================================

namespace nlohmann {

using namespace coedit_cpp;

void adl_serializer<DocumentChange>::to_json(json& j, const DocumentChange& c) {
    j = json{
        {"kind", c.kind()},
        {"actor", c.actor()},
        {"occurred_at", c.occurred_at()},
        {"seq", c.seq()},
    };
}

auto adl_serializer<DocumentChange>::from_json(const json& j) -> DocumentChange {
    return DocumentChange{
        j.at("kind").get<ChangeKind>(),
        j.at("actor").get<UserId>(),
        j.at("occurred_at").get<Timestamp>(),
        j.at("seq").get<std::uint64_t>(),
    };
}

void adl_serializer<Document>::to_json(json& j, const Document& d) {
    j = json{
        {"id", d.id()},
        {"content", d.content()},
        {"created_at", d.created_at()},
        {"updated_at", d.updated_at()},
        {"version", d.version()},
        {"changes", d.change_history()},
    };
}

auto adl_serializer<Document>::from_json(const json& j) -> Document {
    auto changes = j.at("changes").get<std::vector<DocumentChange>>();
    if (auto it = j.find("version"); it != j.end() && it->get<std::uint64_t>() != changes.size()) {
        throw InvalidDocumentError{"version " + std::to_string(it->get<std::uint64_t>()) +
                                   " does not match " + std::to_string(changes.size()) +
                                   " changes"};
    }
    return Document::restore(
        j.at("id").get<DocumentId>(),
        j.at("content").get<DocumentContent>(),
        j.at("created_at").get<Timestamp>(),
        j.at("updated_at").get<Timestamp>(),
        std::move(changes));
}

void adl_serializer<Participant>::to_json(json& j, const Participant& p) {
    j = json{
        {"user_id", p.user_id()},
        {"user_name", p.user_name()},
        {"user_color", p.user_color()},
        {"is_active", p.is_active()},
    };
}

auto adl_serializer<Participant>::from_json(const json& j) -> Participant {
    return Participant{
        j.at("user_id").get<UserId>(),
        j.at("user_name").get<UserName>(),
        j.at("user_color").get<UserColor>(),
        j.value("is_active", true),
    };
}

void adl_serializer<CollaborationSession>::to_json(json& j, const CollaborationSession& s) {
    auto members = std::vector<Participant>{};
    members.reserve(s.participant_count());
    for (const auto& [id, p] : s.participants()) {
        members.push_back(p);
    }
    std::ranges::sort(members, {}, [](const Participant& p) { return p.user_id(); });

    j = json{
        {"session_id", s.session_id()},
        {"document_id", s.document_id()},
        {"created_at", s.created_at()},
        {"participants", members},
    };
}

auto adl_serializer<CollaborationSession>::from_json(const json& j) -> CollaborationSession {
    return CollaborationSession::restore(
        j.at("session_id").get<std::string>(),
        j.at("document_id").get<DocumentId>(),
        j.at("created_at").get<Timestamp>(),
        j.at("participants").get<std::vector<Participant>>());
}

}  // namespace nlohmann

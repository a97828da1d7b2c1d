#include <coedit-cpp/session.hpp>

#include <coedit-cpp/error.hpp>

#include <utility>

namespace coedit_cpp {

namespace {

void validate_ids(const std::string& session_id, const DocumentId& document_id) {
    if (session_id.empty()) {
        throw InvalidSessionError{"Session ID cannot be empty"};
    }
    if (document_id.empty()) {
        throw InvalidDocumentError{"Document ID cannot be empty"};
    }
}

}  // anonymous namespace

CollaborationSession::CollaborationSession(std::string session_id, DocumentId document_id,
                                           Timestamp created_at,
                                           std::shared_ptr<const ParticipantMap> participants)
    : session_id_{std::move(session_id)},
      document_id_{std::move(document_id)},
      created_at_{created_at},
      participants_{std::move(participants)} {}

auto CollaborationSession::create(std::string session_id, DocumentId document_id,
                                  Timestamp at) -> CollaborationSession {
    validate_ids(session_id, document_id);
    return CollaborationSession{std::move(session_id), std::move(document_id), at,
                                std::make_shared<const ParticipantMap>()};
}

auto CollaborationSession::restore(std::string session_id, DocumentId document_id,
                                   Timestamp created_at,
                                   const std::vector<Participant>& participants)
    -> CollaborationSession {
    validate_ids(session_id, document_id);
    auto map = ParticipantMap{};
    for (const auto& p : participants) {
        map.insert_or_assign(p.user_id(), p);
    }
    return CollaborationSession{std::move(session_id), std::move(document_id), created_at,
                                std::make_shared<const ParticipantMap>(std::move(map))};
}

auto CollaborationSession::with_participants(
    std::shared_ptr<const ParticipantMap> participants) const -> CollaborationSession {
    return CollaborationSession{session_id_, document_id_, created_at_, std::move(participants)};
}

auto CollaborationSession::add_participant(const Participant& participant) const
    -> CollaborationSession {
    auto next = std::make_shared<ParticipantMap>(*participants_);
    next->insert_or_assign(participant.user_id(), participant);
    return with_participants(std::move(next));
}

auto CollaborationSession::remove_participant(const UserId& user_id) const
    -> CollaborationSession {
    if (!participants_->contains(user_id)) return *this;
    auto next = std::make_shared<ParticipantMap>(*participants_);
    next->erase(user_id);
    return with_participants(std::move(next));
}

auto CollaborationSession::deactivate_participant(const UserId& user_id) const
    -> CollaborationSession {
    auto it = participants_->find(user_id);
    if (it == participants_->end()) return *this;
    auto next = std::make_shared<ParticipantMap>(*participants_);
    next->insert_or_assign(user_id, it->second.deactivate());
    return with_participants(std::move(next));
}

auto CollaborationSession::participant(const UserId& user_id) const
    -> std::optional<Participant> {
    auto it = participants_->find(user_id);
    if (it == participants_->end()) return std::nullopt;
    return it->second;
}

auto CollaborationSession::has_participant(const UserId& user_id) const -> bool {
    return participants_->contains(user_id);
}

auto CollaborationSession::active_participants() const -> std::vector<Participant> {
    auto result = std::vector<Participant>{};
    for (const auto& [id, p] : *participants_) {
        if (p.is_active()) result.push_back(p);
    }
    return result;
}

auto CollaborationSession::operator==(const CollaborationSession& other) const -> bool {
    return session_id_ == other.session_id_ &&
           document_id_ == other.document_id_ &&
           created_at_ == other.created_at_ &&
           *participants_ == *other.participants_;
}

}  // namespace coedit_cpp

/// @file session.hpp
/// @brief CollaborationSession: the identity-keyed participant registry
/// for one document.

#pragma once

#include <coedit-cpp/participant.hpp>
#include <coedit-cpp/types.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace coedit_cpp {

/// Session membership, keyed by the participant's own user id.
using ParticipantMap = std::unordered_map<UserId, Participant>;

/// A live editing context binding participants to one document.
///
/// CollaborationSession is an immutable value: add, remove and deactivate
/// return a new session. The participant map is shared between a session
/// and the sessions derived from it until one of them changes it.
///
/// Membership is by UserId only. Two joins for the same user collapse
/// into one member, with the later join replacing the earlier entry.
///
/// The session refers to its document by id; it does not own the
/// document's lifecycle.
class CollaborationSession {
public:
    /// Open a session with no participants.
    /// @throws InvalidSessionError if @p session_id is empty.
    /// @throws InvalidDocumentError if @p document_id is empty.
    static auto create(std::string session_id, DocumentId document_id,
                       Timestamp at = Timestamp::now()) -> CollaborationSession;

    /// Rebuild a session from persisted parts. A later participant with
    /// the same user id as an earlier one replaces it.
    /// @throws InvalidSessionError, InvalidDocumentError as for create().
    static auto restore(std::string session_id, DocumentId document_id,
                        Timestamp created_at,
                        const std::vector<Participant>& participants) -> CollaborationSession;

    // -- Membership (returns a new value) -------------------------------------

    /// Insert @p participant, replacing any member with the same user id.
    auto add_participant(const Participant& participant) const -> CollaborationSession;

    /// Drop the member with @p user_id. No-op if absent.
    auto remove_participant(const UserId& user_id) const -> CollaborationSession;

    /// Mark the member with @p user_id inactive. The member stays in the
    /// session. No-op if absent.
    auto deactivate_participant(const UserId& user_id) const -> CollaborationSession;

    // -- Reading --------------------------------------------------------------

    auto session_id() const noexcept -> const std::string& { return session_id_; }
    auto document_id() const noexcept -> const DocumentId& { return document_id_; }
    auto created_at() const noexcept -> Timestamp { return created_at_; }

    /// The member with @p user_id, or nullopt.
    auto participant(const UserId& user_id) const -> std::optional<Participant>;

    /// True for active and inactive members alike.
    auto has_participant(const UserId& user_id) const -> bool;

    /// Members with is_active(). Order is unspecified.
    auto active_participants() const -> std::vector<Participant>;

    /// All members, inactive ones included.
    auto participant_count() const noexcept -> std::size_t { return participants_->size(); }

    /// Read-only view of the membership map.
    auto participants() const noexcept -> const ParticipantMap& { return *participants_; }

    auto operator==(const CollaborationSession& other) const -> bool;

private:
    CollaborationSession(std::string session_id, DocumentId document_id,
                         Timestamp created_at,
                         std::shared_ptr<const ParticipantMap> participants);

    auto with_participants(std::shared_ptr<const ParticipantMap> participants) const
        -> CollaborationSession;

    std::string session_id_;
    DocumentId document_id_;
    Timestamp created_at_;
    std::shared_ptr<const ParticipantMap> participants_;
};

}  // namespace coedit_cpp

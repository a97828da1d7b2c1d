#include <coedit-cpp/policy.hpp>

namespace coedit_cpp {

auto can_user_edit(const Participant& participant) noexcept -> bool {
    return participant.is_active();
}

auto is_session_full(const ParticipantMap& participants, std::size_t max_capacity) noexcept
    -> bool {
    return participants.size() >= max_capacity;
}

auto can_participant_join(const ParticipantMap& participants, const Participant& candidate,
                          std::size_t max_capacity) -> bool {
    if (participants.contains(candidate.user_id())) return true;
    return !is_session_full(participants, max_capacity);
}

auto is_session_full(const CollaborationSession& session, std::size_t max_capacity) noexcept
    -> bool {
    return is_session_full(session.participants(), max_capacity);
}

auto can_participant_join(const CollaborationSession& session, const Participant& candidate,
                          std::size_t max_capacity) -> bool {
    return can_participant_join(session.participants(), candidate, max_capacity);
}

}  // namespace coedit_cpp

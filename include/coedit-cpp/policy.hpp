/// @file policy.hpp
/// @brief Edit-permission policy: pure functions over participants and
/// session membership.

#pragma once

#include <coedit-cpp/participant.hpp>
#include <coedit-cpp/session.hpp>

#include <cstddef>

namespace coedit_cpp {

/// Only active participants may edit.
auto can_user_edit(const Participant& participant) noexcept -> bool;

/// True when @p participants holds @p max_capacity or more members.
/// Inactive members occupy a slot until they are removed.
auto is_session_full(const ParticipantMap& participants, std::size_t max_capacity) noexcept
    -> bool;

/// Whether @p candidate may be admitted.
///
/// A user who already has a slot (a rejoin, e.g. after a dropped
/// connection) is always admitted, even when the session is at
/// capacity. A new user is admitted only while the session is not full.
auto can_participant_join(const ParticipantMap& participants, const Participant& candidate,
                          std::size_t max_capacity) -> bool;

/// @copydoc is_session_full(const ParticipantMap&, std::size_t)
auto is_session_full(const CollaborationSession& session, std::size_t max_capacity) noexcept
    -> bool;

/// @copydoc can_participant_join(const ParticipantMap&, const Participant&, std::size_t)
auto can_participant_join(const CollaborationSession& session, const Participant& candidate,
                          std::size_t max_capacity) -> bool;

}  // namespace coedit_cpp

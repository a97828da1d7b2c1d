/// @file participant.hpp
/// @brief Participant: a session member's identity and activity state.

#pragma once

#include <coedit-cpp/types.hpp>

#include <utility>

namespace coedit_cpp {

/// A member of a collaboration session.
///
/// Participants are immutable values: deactivate() returns a new
/// Participant and leaves the original as it was. Sessions replace
/// entries rather than editing them.
class Participant {
public:
    /// A user entering a session. The result is active.
    static auto join(UserId user_id, UserName user_name, UserColor user_color) -> Participant {
        return Participant{std::move(user_id), std::move(user_name), std::move(user_color), true};
    }

    Participant(UserId user_id, UserName user_name, UserColor user_color, bool is_active)
        : user_id_{std::move(user_id)},
          user_name_{std::move(user_name)},
          user_color_{std::move(user_color)},
          is_active_{is_active} {}

    /// Copy with is_active() == false. Idempotent.
    auto deactivate() const -> Participant {
        return Participant{user_id_, user_name_, user_color_, false};
    }

    auto user_id() const noexcept -> const UserId& { return user_id_; }
    auto user_name() const noexcept -> const UserName& { return user_name_; }
    auto user_color() const noexcept -> const UserColor& { return user_color_; }
    auto is_active() const noexcept -> bool { return is_active_; }

    auto operator==(const Participant&) const -> bool = default;

private:
    UserId user_id_;
    UserName user_name_;
    UserColor user_color_;
    bool is_active_;
};

}  // namespace coedit_cpp

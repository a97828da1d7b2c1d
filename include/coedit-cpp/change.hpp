/// @file change.hpp
/// @brief DocumentChange: one immutable entry in a document's audit log.

#pragma once

#include <coedit-cpp/types.hpp>

#include <cstdint>
#include <string_view>
#include <utility>

namespace coedit_cpp {

/// The kind of mutation a change records.
enum class ChangeKind : std::uint8_t {
    create,  ///< The document was created.
    update,  ///< The document content was replaced.
};

/// Convert a ChangeKind to its string representation.
constexpr auto to_string_view(ChangeKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ChangeKind::create: return "create";
        case ChangeKind::update: return "update";
    }
    return "unknown";
}

/// A single mutation of a Document, attributed to an actor.
///
/// Exactly one change is recorded per mutation. Changes are never
/// modified or removed; they live as long as the owning Document.
/// `seq` is the 1-based position of the change in the history, so the
/// change that produced version N has seq N.
class DocumentChange {
public:
    DocumentChange(ChangeKind kind, UserId actor, Timestamp occurred_at, std::uint64_t seq)
        : kind_{kind}, actor_{std::move(actor)}, occurred_at_{occurred_at}, seq_{seq} {}

    /// The change that opens every history.
    static auto create_change(UserId actor, Timestamp at) -> DocumentChange {
        return DocumentChange{ChangeKind::create, std::move(actor), at, 1};
    }

    /// A content replacement at position @p seq.
    static auto update_change(UserId actor, Timestamp at, std::uint64_t seq) -> DocumentChange {
        return DocumentChange{ChangeKind::update, std::move(actor), at, seq};
    }

    auto kind() const noexcept -> ChangeKind { return kind_; }
    auto actor() const noexcept -> const UserId& { return actor_; }
    auto occurred_at() const noexcept -> Timestamp { return occurred_at_; }
    auto seq() const noexcept -> std::uint64_t { return seq_; }

    auto is_create() const noexcept -> bool { return kind_ == ChangeKind::create; }
    auto is_update() const noexcept -> bool { return kind_ == ChangeKind::update; }

    auto operator==(const DocumentChange&) const -> bool = default;

private:
    ChangeKind kind_;
    UserId actor_;
    Timestamp occurred_at_;
    std::uint64_t seq_;
};

}  // namespace coedit_cpp

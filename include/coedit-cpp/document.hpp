/// @file document.hpp
/// @brief The Document aggregate: versioned content plus its change log.

#pragma once

#include <coedit-cpp/change.hpp>
#include <coedit-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace coedit_cpp {

/// A versioned markdown document that owns its full change history.
///
/// Document is an immutable value. Every mutation returns a new Document
/// with one more entry in its history; the receiver is left untouched.
/// The following always hold:
///  - version() == change_history().size()
///  - change_history().front().is_create()
///  - updated_at() never decreases from one version to the next
///
/// @code
/// auto doc = Document::create(DocumentId{"doc-1"}, DocumentContent{"# Hello"},
///                             UserId{"user-1"});
/// auto edited = doc.update_content(DocumentContent{"# Hello World"}, UserId{"user-2"});
/// // doc.version() == 1, edited.version() == 2
/// @endcode
class Document {
public:
    /// Create a document at version 1 with a single create change.
    /// created_at() and updated_at() are both @p at.
    static auto create(DocumentId id, DocumentContent content, UserId actor,
                       Timestamp at = Timestamp::now()) -> Document;

    /// Rebuild a document from persisted parts.
    ///
    /// The version is taken from the length of @p changes.
    /// @throws InvalidDocumentError if @p id is empty or the history is
    ///   inconsistent: empty, not opened by a create change, containing a
    ///   second create, seq numbers out of order, or timestamps that go
    ///   backwards.
    static auto restore(DocumentId id, DocumentContent content,
                        Timestamp created_at, Timestamp updated_at,
                        std::vector<DocumentChange> changes) -> Document;

    // -- Mutation (returns a new value) ---------------------------------------

    /// Replace the content, recording an update change by @p actor.
    ///
    /// The new document has version()+1 and updated_at() set to @p at,
    /// or left as is when @p at is earlier (clock skew never moves
    /// updated_at backwards). created_at() is carried over.
    auto update_content(DocumentContent new_content, UserId actor,
                        Timestamp at = Timestamp::now()) const -> Document;

    // -- Reading --------------------------------------------------------------

    auto id() const noexcept -> const DocumentId& { return id_; }
    auto content() const noexcept -> const DocumentContent& { return content_; }
    auto created_at() const noexcept -> Timestamp { return created_at_; }
    auto updated_at() const noexcept -> Timestamp { return updated_at_; }
    auto version() const noexcept -> std::uint64_t { return changes_.size(); }

    /// True iff the content is the empty string.
    auto is_empty() const noexcept -> bool { return content_.is_empty(); }

    /// Count whitespace-delimited words.
    ///
    /// A leading run of '#' on each line (a markdown heading marker) is
    /// not counted. Returns 0 for empty content.
    auto word_count() const -> std::size_t;

    /// True once any update change has been recorded.
    auto has_been_modified() const noexcept -> bool { return changes_.size() > 1; }

    /// The full change log, oldest first.
    auto change_history() const noexcept -> const std::vector<DocumentChange>& {
        return changes_;
    }

    auto operator==(const Document&) const -> bool = default;

private:
    Document(DocumentId id, DocumentContent content, Timestamp created_at,
             Timestamp updated_at, std::vector<DocumentChange> changes);

    DocumentId id_;
    DocumentContent content_;
    Timestamp created_at_;
    Timestamp updated_at_;
    std::vector<DocumentChange> changes_;
};

/// Count words in markdown text the way Document::word_count() does.
auto count_words(std::string_view markdown) -> std::size_t;

}  // namespace coedit_cpp

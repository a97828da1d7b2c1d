#include <coedit-cpp/document.hpp>

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>

namespace coedit_cpp {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

}  // anonymous namespace

auto count_words(std::string_view markdown) -> std::size_t {
    auto count = std::size_t{0};
    auto in_word = false;
    auto at_line_start = true;

    for (std::size_t i = 0; i < markdown.size(); ++i) {
        const auto c = markdown[i];
        if (c == '\n') {
            in_word = false;
            at_line_start = true;
            continue;
        }
        if (is_space(c)) {
            in_word = false;
            continue;
        }
        if (at_line_start) {
            at_line_start = false;
            if (c == '#') {
                // Skip the heading marker run; it is not a word.
                while (i + 1 < markdown.size() && markdown[i + 1] == '#') ++i;
                continue;
            }
        }
        if (!in_word) {
            ++count;
            in_word = true;
        }
    }
    return count;
}

Document::Document(DocumentId id, DocumentContent content, Timestamp created_at,
                   Timestamp updated_at, std::vector<DocumentChange> changes)
    : id_{std::move(id)},
      content_{std::move(content)},
      created_at_{created_at},
      updated_at_{updated_at},
      changes_{std::move(changes)} {}

auto Document::create(DocumentId id, DocumentContent content, UserId actor,
                      Timestamp at) -> Document {
    if (id.empty()) {
        throw InvalidDocumentError{"Document ID cannot be empty"};
    }
    auto changes = std::vector<DocumentChange>{};
    changes.push_back(DocumentChange::create_change(std::move(actor), at));
    return Document{std::move(id), std::move(content), at, at, std::move(changes)};
}

auto Document::restore(DocumentId id, DocumentContent content,
                       Timestamp created_at, Timestamp updated_at,
                       std::vector<DocumentChange> changes) -> Document {
    if (id.empty()) {
        throw InvalidDocumentError{"Document ID cannot be empty"};
    }
    if (changes.empty()) {
        throw InvalidDocumentError{"document history cannot be empty"};
    }
    if (!changes.front().is_create()) {
        throw InvalidDocumentError{"document history must start with a create change"};
    }
    if (updated_at < created_at) {
        throw InvalidDocumentError{"updated_at precedes created_at"};
    }
    for (std::size_t i = 0; i < changes.size(); ++i) {
        const auto& change = changes[i];
        if (change.seq() != i + 1) {
            throw InvalidDocumentError{"change seq " + std::to_string(change.seq()) +
                                       " at position " + std::to_string(i + 1)};
        }
        if (i > 0 && change.is_create()) {
            throw InvalidDocumentError{"create change after the start of the history"};
        }
        if (i > 0 && change.occurred_at() < changes[i - 1].occurred_at()) {
            throw InvalidDocumentError{"change timestamps go backwards"};
        }
    }
    if (changes.front().occurred_at() != created_at) {
        throw InvalidDocumentError{"created_at differs from the create change"};
    }
    if (updated_at < changes.back().occurred_at()) {
        throw InvalidDocumentError{"updated_at precedes the last change"};
    }
    return Document{std::move(id), std::move(content), created_at, updated_at,
                    std::move(changes)};
}

auto Document::update_content(DocumentContent new_content, UserId actor,
                              Timestamp at) const -> Document {
    const auto stamped = std::max(at, updated_at_);
    auto changes = changes_;
    changes.push_back(
        DocumentChange::update_change(std::move(actor), stamped, changes.size() + 1));
    return Document{id_, std::move(new_content), created_at_, stamped, std::move(changes)};
}

auto Document::word_count() const -> std::size_t {
    if (content_.is_empty()) return 0;
    return count_words(content_.value());
}

}  // namespace coedit_cpp

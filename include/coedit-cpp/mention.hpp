/// @file mention.hpp
/// @brief Mention detection: find an agent-invocation command under the
/// cursor and extract the question it carries.

#pragma once

#include <coedit-cpp/error.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace coedit_cpp {

/// The literal prefix that starts an agent invocation, e.g. "@j".
///
/// Matching is ASCII case-insensitive, so "@J" triggers as well.
class MentionPattern {
public:
    /// The pattern used when none is configured.
    static constexpr std::string_view default_prefix = "@j";

    MentionPattern() : prefix_{default_prefix} {}

    /// @throws InvalidValueError if @p prefix is empty, contains a line
    ///   break, or ends in whitespace.
    explicit MentionPattern(std::string prefix) : prefix_{std::move(prefix)} {
        if (prefix_.empty()) {
            throw InvalidValueError{"MentionPattern cannot be empty"};
        }
        // Detection scans one line at a time.
        if (prefix_.find_first_of("\n\r") != std::string::npos) {
            throw InvalidValueError{"MentionPattern cannot contain a line break"};
        }
        if (std::string_view{" \t\f\v"}.find(prefix_.back()) != std::string_view::npos) {
            throw InvalidValueError{"MentionPattern cannot end in whitespace"};
        }
    }

    auto prefix() const noexcept -> const std::string& { return prefix_; }
    auto size() const noexcept -> std::size_t { return prefix_.size(); }

    /// True when @p text begins with the prefix.
    auto is_prefix_of(std::string_view text) const noexcept -> bool;

    auto operator==(const MentionPattern&) const -> bool = default;

private:
    std::string prefix_;
};

/// A detected command span in editor text.
///
/// Offsets are byte offsets into the scanned text; the span is
/// [from, to) and `text` is exactly that slice.
struct MentionDetection {
    std::size_t from{0};  ///< Offset of the first character of the prefix.
    std::size_t to{0};    ///< Offset one past the end of the line.
    std::string text;     ///< The spanned text, prefix included.

    auto operator==(const MentionDetection&) const -> bool = default;
};

/// A parsed command: an optional addressed agent plus the question.
struct AgentCommand {
    std::optional<std::string> agent_name;  ///< Leading agent handle, if any.
    std::string question;                   ///< The text to ask.

    auto operator==(const AgentCommand&) const -> bool = default;
};

/// Find the mention that contains @p cursor.
///
/// The text is scanned line by line. On each line the first occurrence
/// of the prefix that is followed by whitespace or the end of the line
/// opens a span that runs to the end of that line. The span is returned
/// only when from <= cursor <= to; both boundaries count, so a caret
/// sitting just before the prefix or at the end of the line still hits.
///
/// @return The span under the cursor, or nullopt when there is none.
auto detect_at_cursor(const MentionPattern& pattern, std::string_view text,
                      std::size_t cursor) -> std::optional<MentionDetection>;

/// The question carried by @p detection: the text after the prefix with
/// surrounding whitespace removed.
///
/// @return nullopt when there is no detection, when its text does not
///   start with the prefix, or when nothing but whitespace follows it.
auto extract_question(const MentionPattern& pattern,
                      const std::optional<MentionDetection>& detection)
    -> std::optional<std::string>;

/// True iff @p detection is present and carries a non-blank question.
auto is_valid_for_query(const MentionPattern& pattern,
                        const std::optional<MentionDetection>& detection) -> bool;

/// Split a command into an addressed agent and a question.
///
/// "@j writer What is this?" yields {"writer", "What is this?"}; a
/// command whose first word is followed by nothing, or is not a plain
/// handle ([A-Za-z0-9_-]+), yields no agent and the whole remainder as
/// the question. Whether the handle names a real agent is for the agent
/// collaborator to decide.
///
/// @return nullopt when the command carries no question.
auto parse_agent_command(const MentionPattern& pattern, std::string_view text)
    -> std::optional<AgentCommand>;

}  // namespace coedit_cpp

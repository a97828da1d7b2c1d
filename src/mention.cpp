#include <coedit-cpp/mention.hpp>

#include <algorithm>

namespace coedit_cpp {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

auto to_lower(char c) -> char {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

auto iequals(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y) { return to_lower(x) == to_lower(y); });
}

auto trim(std::string_view s) -> std::string_view {
    auto begin = std::size_t{0};
    auto end = s.size();
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

auto is_handle(std::string_view word) -> bool {
    return !word.empty() && std::ranges::all_of(word, [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
}

// Offset of the first prefix occurrence in `line` that ends at a word
// boundary, or npos.
auto find_prefix(const MentionPattern& pattern, std::string_view line) -> std::size_t {
    const auto n = pattern.size();
    if (line.size() < n) return std::string_view::npos;
    for (std::size_t i = 0; i + n <= line.size(); ++i) {
        if (!iequals(line.substr(i, n), pattern.prefix())) continue;
        if (i + n == line.size() || is_space(line[i + n])) return i;
    }
    return std::string_view::npos;
}

auto question_of(const MentionPattern& pattern, std::string_view text)
    -> std::optional<std::string> {
    if (!pattern.is_prefix_of(text)) return std::nullopt;
    auto rest = trim(text.substr(pattern.size()));
    if (rest.empty()) return std::nullopt;
    return std::string{rest};
}

}  // anonymous namespace

auto MentionPattern::is_prefix_of(std::string_view text) const noexcept -> bool {
    return text.size() >= prefix_.size() && iequals(text.substr(0, prefix_.size()), prefix_);
}

auto detect_at_cursor(const MentionPattern& pattern, std::string_view text,
                      std::size_t cursor) -> std::optional<MentionDetection> {
    if (cursor > text.size()) return std::nullopt;

    auto line_start = std::size_t{0};
    while (line_start <= text.size()) {
        auto line_end = text.find('\n', line_start);
        if (line_end == std::string_view::npos) line_end = text.size();

        // Lines are visited in order; once the cursor is behind us no
        // later span can contain it.
        if (cursor < line_start) break;

        const auto line = text.substr(line_start, line_end - line_start);
        const auto at = find_prefix(pattern, line);
        if (at != std::string_view::npos) {
            const auto from = line_start + at;
            const auto to = line_end;
            if (cursor >= from && cursor <= to) {
                return MentionDetection{from, to, std::string{text.substr(from, to - from)}};
            }
        }

        if (line_end == text.size()) break;
        line_start = line_end + 1;
    }
    return std::nullopt;
}

auto extract_question(const MentionPattern& pattern,
                      const std::optional<MentionDetection>& detection)
    -> std::optional<std::string> {
    if (!detection) return std::nullopt;
    return question_of(pattern, detection->text);
}

auto is_valid_for_query(const MentionPattern& pattern,
                        const std::optional<MentionDetection>& detection) -> bool {
    return detection.has_value() && extract_question(pattern, detection).has_value();
}

auto parse_agent_command(const MentionPattern& pattern, std::string_view text)
    -> std::optional<AgentCommand> {
    auto question = question_of(pattern, trim(text));
    if (!question) return std::nullopt;

    const auto body = std::string_view{*question};
    const auto space = std::ranges::find_if(body, is_space);
    if (space != body.end()) {
        const auto head = body.substr(0, static_cast<std::size_t>(space - body.begin()));
        const auto tail = trim(body.substr(head.size()));
        if (is_handle(head) && !tail.empty()) {
            return AgentCommand{std::string{head}, std::string{tail}};
        }
    }
    return AgentCommand{std::nullopt, std::move(*question)};
}

}  // namespace coedit_cpp

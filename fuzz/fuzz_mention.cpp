// Fuzz target for mention detection: arbitrary text and cursor.
// Any detection must lie inside the text and contain the cursor.

#include <coedit-cpp/mention.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) return 0;
    const auto cursor = static_cast<std::size_t>(data[0]) | (static_cast<std::size_t>(data[1]) << 8);
    const auto text = std::string_view{reinterpret_cast<const char*>(data + 2), size - 2};

    const auto pattern = coedit_cpp::MentionPattern{};
    const auto d = coedit_cpp::detect_at_cursor(pattern, text, cursor);
    if (d) {
        if (d->from > cursor || cursor > d->to || d->to > text.size()) std::abort();
        if (text.substr(d->from, d->to - d->from) != d->text) std::abort();
        auto question = coedit_cpp::extract_question(pattern, d);
        if (question && question->empty()) std::abort();
        (void)coedit_cpp::parse_agent_command(pattern, d->text);
    }
    return 0;
}

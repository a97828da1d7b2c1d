// coedit-cpp benchmarks. Throughput of the hot paths: joins,
// edits, mention detection and snapshots.

#include <coedit-cpp/coedit.hpp>
#include <coedit-cpp/snapshot.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace coedit_cpp;

static auto member(std::int64_t i) -> Participant {
    const auto id = "user-" + std::to_string(i);
    return Participant::join(UserId{id}, UserName{id}, UserColor{"#FF6B6B"});
}

static auto session_with(std::int64_t n) -> CollaborationSession {
    auto s = CollaborationSession::create("s1", DocumentId{"d1"});
    for (std::int64_t i = 0; i < n; ++i) s = s.add_participant(member(i));
    return s;
}

static auto document_with(std::int64_t updates) -> Document {
    auto doc = Document::create(DocumentId{"d1"}, DocumentContent{"# Title"}, UserId{"u"},
                                Timestamp{0});
    for (std::int64_t i = 0; i < updates; ++i) {
        doc = doc.update_content(DocumentContent{"# Title\n\nline " + std::to_string(i)},
                                 UserId{"u"}, Timestamp{i});
    }
    return doc;
}

// =============================================================================
// Session membership
// =============================================================================

static void bm_session_add_participant(benchmark::State& state) {
    const auto base = session_with(state.range(0));
    const auto p = member(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(base.add_participant(p));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_session_add_participant)->Arg(2)->Arg(10)->Arg(100);

static void bm_session_derive_shares_map(benchmark::State& state) {
    const auto base = session_with(state.range(0));
    for (auto _ : state) {
        auto copy = base;
        benchmark::DoNotOptimize(copy.participant_count());
    }
}
BENCHMARK(bm_session_derive_shares_map)->Arg(10)->Arg(100);

static void bm_can_participant_join(benchmark::State& state) {
    const auto s = session_with(10);
    const auto rejoin = member(3);
    const auto stranger = member(99);
    for (auto _ : state) {
        benchmark::DoNotOptimize(can_participant_join(s, rejoin, 10));
        benchmark::DoNotOptimize(can_participant_join(s, stranger, 10));
    }
}
BENCHMARK(bm_can_participant_join);

// =============================================================================
// Document
// =============================================================================

static void bm_document_update(benchmark::State& state) {
    const auto doc = document_with(state.range(0));
    const auto content = DocumentContent{"# Title\n\nnew text"};
    for (auto _ : state) {
        benchmark::DoNotOptimize(doc.update_content(content, UserId{"u"}));
    }
}
BENCHMARK(bm_document_update)->Arg(1)->Arg(100)->Arg(1000);

static void bm_word_count(benchmark::State& state) {
    auto text = std::string{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        text += "## Heading " + std::to_string(i) + "\nsome words on a line\n";
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(count_words(text));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(text.size()));
}
BENCHMARK(bm_word_count)->Arg(10)->Arg(1000);

// =============================================================================
// Mention detection
// =============================================================================

static void bm_detect_at_cursor(benchmark::State& state) {
    auto text = std::string{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        text += "a line of regular prose without any mention\n";
    }
    const auto cursor = text.size() + 5;
    text += "@j what is TypeScript?";
    const auto pattern = MentionPattern{};
    for (auto _ : state) {
        benchmark::DoNotOptimize(detect_at_cursor(pattern, text, cursor));
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(text.size()));
}
BENCHMARK(bm_detect_at_cursor)->Arg(1)->Arg(100)->Arg(1000);

// =============================================================================
// Snapshots
// =============================================================================

static void bm_save_document(benchmark::State& state) {
    const auto doc = document_with(state.range(0));
    for (auto _ : state) {
        benchmark::DoNotOptimize(save_document(doc));
    }
}
BENCHMARK(bm_save_document)->Arg(10)->Arg(1000);

static void bm_load_document(benchmark::State& state) {
    const auto bytes = save_document(document_with(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(load_document(bytes));
    }
}
BENCHMARK(bm_load_document)->Arg(10)->Arg(1000);

BENCHMARK_MAIN();

// snapshot_demo: persist a document and a session, then restore them
//
// Shows the JSON export used by a persistence layer and the compact
// binary snapshot built on top of it.
//
// Build: cmake --build build
// Run:   ./build/examples/snapshot_demo

#include <coedit-cpp/coedit.hpp>
#include <coedit-cpp/json.hpp>
#include <coedit-cpp/snapshot.hpp>

#include <cstddef>
#include <cstdio>
#include <string>

namespace ce = coedit_cpp;
using json = nlohmann::json;

int main() {
    auto doc = ce::Document::create(ce::DocumentId{"notes"}, ce::DocumentContent{"# Notes"},
                                    ce::UserId{"alice"});
    for (int i = 1; i <= 50; ++i) {
        doc = doc.update_content(
            ce::DocumentContent{"# Notes\n\nrevision " + std::to_string(i)},
            ce::UserId{i % 2 == 0 ? "alice" : "bob"});
    }

    auto session = ce::CollaborationSession::create("s1", doc.id())
                       .add_participant(ce::Participant::join(
                           ce::UserId{"alice"}, ce::UserName{"Alice"}, ce::UserColor{"#FF6B6B"}))
                       .add_participant(ce::Participant::join(
                           ce::UserId{"bob"}, ce::UserName{"Bob"}, ce::UserColor{"#4ECDC4"}));

    // -- JSON ------------------------------------------------------------------
    const auto session_json = json(session);
    std::printf("session as JSON:\n%s\n\n", session_json.dump(2).c_str());

    const auto doc_text = json(doc).dump();
    std::printf("document JSON: %zu bytes\n", doc_text.size());

    // -- Binary snapshot -------------------------------------------------------
    const auto bytes = ce::save_document(doc);
    std::printf("document snapshot: %zu bytes\n", bytes.size());

    auto restored = ce::load_document(bytes);
    if (!restored) {
        std::printf("failed to restore document\n");
        return 1;
    }
    std::printf("restored version %llu, equal: %s\n",
                static_cast<unsigned long long>(restored->version()),
                *restored == doc ? "yes" : "no");

    auto restored_session = ce::load_session(ce::save_session(session));
    std::printf("restored session with %zu participant(s)\n",
                restored_session ? restored_session->participant_count() : std::size_t{0});

    // -- Tampered input is refused ---------------------------------------------
    auto tampered = bytes;
    tampered.back() ^= std::byte{0x5A};
    std::printf("tampered snapshot loads: %s\n",
                ce::load_document(tampered) ? "yes" : "no");
    return 0;
}

// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <coedit-cpp/coedit.hpp>
#include <coedit-cpp/snapshot.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace ce = coedit_cpp;

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

static void write_text_seed(const std::string& path, std::uint16_t cursor,
                            const std::string& text) {
    auto data = std::vector<std::byte>{std::byte(cursor & 0xFF), std::byte(cursor >> 8)};
    for (auto c : text) data.push_back(static_cast<std::byte>(c));
    write_seed(path, data);
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    // Seed 1: fresh document
    {
        auto doc = ce::Document::create(ce::DocumentId{"d1"}, ce::DocumentContent{},
                                        ce::UserId{"u1"}, ce::Timestamp{0});
        write_seed(dir + "/seed_doc_new.bin", ce::save_document(doc));
    }

    // Seed 2: document with a few edits
    {
        auto doc = ce::Document::create(ce::DocumentId{"d1"}, ce::DocumentContent{"# A"},
                                        ce::UserId{"u1"}, ce::Timestamp{0});
        doc = doc.update_content(ce::DocumentContent{"# A\nb"}, ce::UserId{"u2"},
                                 ce::Timestamp{5});
        doc = doc.update_content(ce::DocumentContent{"# A\nb c"}, ce::UserId{"u1"},
                                 ce::Timestamp{9});
        write_seed(dir + "/seed_doc_edits.bin", ce::save_document(doc));
    }

    // Seed 3: session with an inactive member
    {
        auto s = ce::CollaborationSession::create("s1", ce::DocumentId{"d1"}, ce::Timestamp{0})
                     .add_participant(ce::Participant::join(ce::UserId{"u1"},
                                                            ce::UserName{"Ann"},
                                                            ce::UserColor{"#FF6B6B"}))
                     .add_participant(ce::Participant::join(ce::UserId{"u2"},
                                                            ce::UserName{"Ben"},
                                                            ce::UserColor{"#4ECDC4"}))
                     .deactivate_participant(ce::UserId{"u2"});
        write_seed(dir + "/seed_session.bin", ce::save_session(s));
    }

    // Seeds 4-5: mention text (first two bytes are the cursor)
    write_text_seed(dir + "/seed_mention.txt", 5, "@j what is TypeScript?");
    write_text_seed(dir + "/seed_mention_lines.txt", 20, "intro\n@j writer draft\n@j other");

    return 0;
}

// collaborative_session: three editors share a document and ask an agent
//
// Shows the registry flow: open a session, join up to capacity, edit,
// drop a connection and rejoin, then raise an "@j" mention and wait for
// the answer to land in the document.
//
// Build: cmake --build build
// Run:   ./build/examples/collaborative_session

#include <coedit-cpp/coedit.hpp>

#include <cstdio>
#include <memory>
#include <string>

namespace ce = coedit_cpp;

namespace {

// Stands in for a real model: answers with a canned reply.
class CannedAgent : public ce::AgentInvoker {
public:
    auto invoke(const ce::AgentRequest& request) -> std::string override {
        const auto who = request.command.agent_name.value_or("default agent");
        return "> " + who + ": \"" + request.command.question + "\" is a good question.";
    }
};

void print_session(const ce::SessionRegistry& registry, const std::string& id) {
    const auto session = registry.session(id);
    std::printf("  %zu member(s), %zu active\n", session.participant_count(),
                session.active_participants().size());
}

}  // namespace

int main() {
    auto config = ce::Config{};
    config.max_participants = 3;
    auto registry = ce::SessionRegistry{config, std::make_shared<CannedAgent>()};

    auto doc = ce::Document::create(ce::DocumentId{"roadmap"},
                                    ce::DocumentContent{"# Roadmap"}, ce::UserId{"alice"});
    registry.open_session("s1", doc);

    // -- Join up to capacity ---------------------------------------------------
    const auto people = {"alice", "bob", "carol", "dave"};
    for (const auto* name : people) {
        auto p = ce::Participant::join(ce::UserId{name}, ce::UserName{name},
                                       ce::UserColor{"#FF6B6B"});
        auto result = registry.join("s1", p);
        std::printf("%s: %.*s\n", name, static_cast<int>(ce::to_string_view(result).size()),
                    ce::to_string_view(result).data());
    }
    print_session(registry, "s1");

    // -- Edits -----------------------------------------------------------------
    registry.edit("s1", ce::UserId{"bob"}, ce::DocumentContent{"# Roadmap\n\n- ship v1"});

    // -- Bob drops and comes back ---------------------------------------------
    registry.disconnect("s1", ce::UserId{"bob"});
    auto refused = registry.edit("s1", ce::UserId{"bob"}, ce::DocumentContent{"lost edit"});
    std::printf("edit while disconnected: %.*s\n",
                static_cast<int>(ce::to_string_view(refused).size()),
                ce::to_string_view(refused).data());
    print_session(registry, "s1");
    registry.join("s1", ce::Participant::join(ce::UserId{"bob"}, ce::UserName{"Bob"},
                                              ce::UserColor{"#4ECDC4"}));
    print_session(registry, "s1");

    // -- Agent mention ---------------------------------------------------------
    const auto line = std::string{"@j planner what should ship after v1?"};
    if (auto detection = registry.detect_mention(line, line.size())) {
        std::printf("mention [%zu, %zu): %s\n", detection->from, detection->to,
                    detection->text.c_str());
    }
    if (auto id = registry.submit_query("s1", ce::UserId{"carol"}, line, 4)) {
        registry.wait_for_queries();
        const auto q = registry.query(*id);
        std::printf("query %s: %.*s\n", id->c_str(),
                    static_cast<int>(ce::to_string_view(q->status()).size()),
                    ce::to_string_view(q->status()).data());
    }

    // -- Final document --------------------------------------------------------
    const auto final_doc = registry.document("s1");
    std::printf("\nversion %llu, %zu words\n%s\n",
                static_cast<unsigned long long>(final_doc.version()), final_doc.word_count(),
                final_doc.content().value().c_str());
    for (const auto& change : final_doc.change_history()) {
        std::printf("  #%llu %.*s by %s\n", static_cast<unsigned long long>(change.seq()),
                    static_cast<int>(ce::to_string_view(change.kind()).size()),
                    ce::to_string_view(change.kind()).data(), change.actor().value().c_str());
    }
    return 0;
}

/// @file registry.hpp
/// @brief SessionRegistry: live sessions, their documents, and agent
/// queries raised from them.

#pragma once

#include <coedit-cpp/agent_query.hpp>
#include <coedit-cpp/config.hpp>
#include <coedit-cpp/document.hpp>
#include <coedit-cpp/mention.hpp>
#include <coedit-cpp/participant.hpp>
#include <coedit-cpp/session.hpp>
#include <coedit-cpp/types.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace coedit_cpp {

/// Everything an agent is told about one question.
struct AgentRequest {
    std::string query_id;     ///< Id of the tracking AgentQuery.
    std::string session_id;   ///< Session the mention was typed in.
    DocumentId document_id;   ///< Document the answer lands in.
    UserId requested_by;      ///< Participant who typed the mention.
    std::string question;     ///< Question with the prefix removed.
    AgentCommand command;     ///< The question split into agent handle and text.
    Timestamp deadline;       ///< Answers arriving later are dropped.
};

/// The agent collaborator.
///
/// invoke() runs on an executor worker and may block. Throwing any
/// std::exception marks the query failed with the exception's message.
class AgentInvoker {
public:
    virtual ~AgentInvoker() = default;

    /// Answer @p request. An empty answer counts as a failure.
    virtual auto invoke(const AgentRequest& request) -> std::string = 0;
};

/// Outcome of SessionRegistry::join().
enum class JoinResult : std::uint8_t {
    joined,        ///< New member admitted.
    rejoined,      ///< Existing member replaced and marked active.
    session_full,  ///< New member refused: the session is at capacity.
};

/// Outcome of SessionRegistry::edit().
enum class EditResult : std::uint8_t {
    applied,            ///< The document has a new version.
    not_a_participant,  ///< The user is not a member of the session.
    not_permitted,      ///< The user is a member but inactive.
};

constexpr auto to_string_view(JoinResult r) noexcept -> std::string_view {
    switch (r) {
        case JoinResult::joined:       return "joined";
        case JoinResult::rejoined:     return "rejoined";
        case JoinResult::session_full: return "session_full";
    }
    return "unknown";
}

constexpr auto to_string_view(EditResult r) noexcept -> std::string_view {
    switch (r) {
        case EditResult::applied:           return "applied";
        case EditResult::not_a_participant: return "not_a_participant";
        case EditResult::not_permitted:     return "not_permitted";
    }
    return "unknown";
}

/// Holds the open sessions of a process and serializes work on each.
///
/// Each session id maps to a slot holding the CollaborationSession and
/// its Document. Operations on one session run one at a time; operations
/// on different sessions run in parallel.
///
/// Agent queries run on the global executor. A response is appended to
/// the document as a single update change by the user who asked, but
/// only if the session is still open when it arrives, still edits the
/// same document, and the deadline from Config::agent_timeout has not
/// passed. Otherwise the query is marked failed and nothing is written.
///
/// @code
/// auto registry = SessionRegistry{Config{}, std::make_shared<MyAgent>()};
/// registry.open_session("s1", Document::create(DocumentId{"d1"}, {}, UserId{"u1"}));
/// registry.join("s1", Participant::join(UserId{"u1"}, UserName{"Ann"}, UserColor{"#FF6B6B"}));
/// registry.edit("s1", UserId{"u1"}, DocumentContent{"@j what is TypeScript?"});
/// auto id = registry.submit_query("s1", UserId{"u1"}, "@j what is TypeScript?", 5);
/// @endcode
class SessionRegistry {
public:
    /// @throws InvalidValueError if @p config is invalid.
    explicit SessionRegistry(Config config = {},
                             std::shared_ptr<AgentInvoker> invoker = nullptr);

    /// Waits for queries still running.
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    auto operator=(const SessionRegistry&) -> SessionRegistry& = delete;

    // -- Sessions -------------------------------------------------------------

    /// Open a session with no participants over @p document.
    /// @throws InvalidSessionError if @p session_id is empty.
    /// @throws InvalidOperationError if @p session_id is already open.
    auto open_session(std::string session_id, Document document,
                      Timestamp at = Timestamp::now()) -> CollaborationSession;

    /// Close a session. Queries still running for it will be dropped;
    /// records of its finished queries are released.
    /// @return false if no such session was open.
    auto close_session(const std::string& session_id) -> bool;

    auto has_session(const std::string& session_id) const -> bool;

    /// @throws SessionNotFoundError
    auto session(const std::string& session_id) const -> CollaborationSession;

    /// @throws SessionNotFoundError
    auto document(const std::string& session_id) const -> Document;

    /// Open session ids in ascending order.
    auto session_ids() const -> std::vector<std::string>;

    // -- Membership -----------------------------------------------------------

    /// Admit @p participant, subject to can_participant_join().
    /// @throws SessionNotFoundError
    auto join(const std::string& session_id, const Participant& participant) -> JoinResult;

    /// Mark a member inactive after a dropped connection. The member
    /// keeps its slot.
    /// @return false if @p user_id is not a member.
    /// @throws SessionNotFoundError
    auto disconnect(const std::string& session_id, const UserId& user_id) -> bool;

    /// Remove a member. The session closes when its last member leaves,
    /// as by close_session().
    /// @return false if @p user_id is not a member.
    /// @throws SessionNotFoundError
    auto leave(const std::string& session_id, const UserId& user_id) -> bool;

    // -- Editing --------------------------------------------------------------

    /// Replace the document content on behalf of @p user_id.
    /// @throws SessionNotFoundError
    auto edit(const std::string& session_id, const UserId& user_id, DocumentContent content,
              Timestamp at = Timestamp::now()) -> EditResult;

    // -- Agent queries --------------------------------------------------------

    /// Run mention detection with the configured pattern.
    auto detect_mention(std::string_view text, std::size_t cursor) const
        -> std::optional<MentionDetection>;

    /// Start an agent query for the mention under @p cursor in @p text.
    ///
    /// @return The query id, or nullopt when there is no valid mention
    ///   under the cursor or @p user_id may not edit the session.
    /// @throws SessionNotFoundError
    /// @throws InvalidOperationError if no AgentInvoker was given.
    auto submit_query(const std::string& session_id, const UserId& user_id,
                      std::string_view text, std::size_t cursor) -> std::optional<std::string>;

    /// Current state of a query, or nullopt for an unknown or released id.
    auto query(const std::string& query_id) const -> std::optional<AgentQuery>;

    /// Release the record of a completed or failed query.
    /// @return false if the id is unknown or the query is still running.
    auto forget_query(const std::string& query_id) -> bool;

    /// Number of query records held, running ones included.
    auto query_count() const -> std::size_t;

    /// Block until every submitted query has completed or failed.
    void wait_for_queries();

    auto config() const noexcept -> const Config& { return config_; }

private:
    struct Slot {
        std::mutex mutex;
        bool open{true};
        CollaborationSession session;
        Document document;

        Slot(CollaborationSession s, Document d)
            : session{std::move(s)}, document{std::move(d)} {}
    };

    auto find_slot(const std::string& session_id) const -> std::shared_ptr<Slot>;
    auto slot_or_throw(const std::string& session_id) const -> std::shared_ptr<Slot>;
    void erase_slot(const std::string& session_id, const std::shared_ptr<Slot>& slot);

    void run_query(const AgentRequest& request);
    void land_response(const AgentRequest& request, std::string response);
    void fail_query(const std::string& query_id, const std::string& reason);
    void store_query(const std::string& session_id, const AgentQuery& query);
    void release_finished_queries(const std::string& session_id);

    struct QueryRecord {
        std::string session_id;
        AgentQuery query;
    };

    Config config_;
    std::shared_ptr<AgentInvoker> invoker_;

    mutable std::shared_mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> sessions_;

    mutable std::mutex queries_mutex_;
    std::unordered_map<std::string, QueryRecord> queries_;
    std::atomic<std::uint64_t> next_query_{1};

    std::mutex in_flight_mutex_;
    std::condition_variable in_flight_done_;
    std::size_t in_flight_{0};
};

}  // namespace coedit_cpp

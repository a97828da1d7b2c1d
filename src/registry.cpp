#include <coedit-cpp/registry.hpp>

#include <coedit-cpp/error.hpp>
#include <coedit-cpp/policy.hpp>

#include "executor.hpp"
#include "log.hpp"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace coedit_cpp {

namespace {

// The document after an agent answer lands: the answer follows the
// existing content after a blank line.
auto append_response(const DocumentContent& content, const std::string& response)
    -> DocumentContent {
    if (content.is_empty()) return DocumentContent{response};
    return DocumentContent{content.value() + "\n\n" + response};
}

}  // anonymous namespace

SessionRegistry::SessionRegistry(Config config, std::shared_ptr<AgentInvoker> invoker)
    : config_{std::move(config)}, invoker_{std::move(invoker)} {
    validate(config_);
    detail::set_log_level(config_.log_level);
}

SessionRegistry::~SessionRegistry() {
    wait_for_queries();
}

// -- Slots --------------------------------------------------------------------

auto SessionRegistry::find_slot(const std::string& session_id) const -> std::shared_ptr<Slot> {
    auto lock = std::shared_lock{sessions_mutex_};
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return nullptr;
    return it->second;
}

auto SessionRegistry::slot_or_throw(const std::string& session_id) const
    -> std::shared_ptr<Slot> {
    auto slot = find_slot(session_id);
    if (!slot) {
        throw SessionNotFoundError{"no open session with id " + session_id};
    }
    return slot;
}

void SessionRegistry::erase_slot(const std::string& session_id,
                                 const std::shared_ptr<Slot>& slot) {
    {
        auto lock = std::unique_lock{sessions_mutex_};
        auto it = sessions_.find(session_id);
        // A new session may already have been opened under the same id.
        if (it == sessions_.end() || it->second != slot) return;
        sessions_.erase(it);
    }
    release_finished_queries(session_id);
}

// -- Sessions -----------------------------------------------------------------

auto SessionRegistry::open_session(std::string session_id, Document document, Timestamp at)
    -> CollaborationSession {
    auto session = CollaborationSession::create(session_id, document.id(), at);
    {
        auto lock = std::unique_lock{sessions_mutex_};
        if (sessions_.contains(session_id)) {
            throw InvalidOperationError{"session " + session_id + " is already open"};
        }
        sessions_.emplace(session_id, std::make_shared<Slot>(session, std::move(document)));
    }
    detail::logger()->info("session {} opened for document {}", session_id,
                           session.document_id().value());
    return session;
}

auto SessionRegistry::close_session(const std::string& session_id) -> bool {
    auto slot = find_slot(session_id);
    if (!slot) return false;
    {
        auto lock = std::lock_guard{slot->mutex};
        if (!slot->open) return false;
        slot->open = false;
    }
    erase_slot(session_id, slot);
    detail::logger()->info("session {} closed", session_id);
    return true;
}

auto SessionRegistry::has_session(const std::string& session_id) const -> bool {
    auto lock = std::shared_lock{sessions_mutex_};
    return sessions_.contains(session_id);
}

auto SessionRegistry::session(const std::string& session_id) const -> CollaborationSession {
    auto slot = slot_or_throw(session_id);
    auto lock = std::lock_guard{slot->mutex};
    return slot->session;
}

auto SessionRegistry::document(const std::string& session_id) const -> Document {
    auto slot = slot_or_throw(session_id);
    auto lock = std::lock_guard{slot->mutex};
    return slot->document;
}

auto SessionRegistry::session_ids() const -> std::vector<std::string> {
    auto ids = std::vector<std::string>{};
    {
        auto lock = std::shared_lock{sessions_mutex_};
        ids.reserve(sessions_.size());
        for (const auto& [id, slot] : sessions_) {
            ids.push_back(id);
        }
    }
    std::ranges::sort(ids);
    return ids;
}

// -- Membership ---------------------------------------------------------------

auto SessionRegistry::join(const std::string& session_id, const Participant& participant)
    -> JoinResult {
    auto slot = slot_or_throw(session_id);
    auto lock = std::lock_guard{slot->mutex};
    if (!slot->open) {
        throw SessionNotFoundError{"no open session with id " + session_id};
    }

    const auto& user = participant.user_id().value();
    if (!can_participant_join(slot->session, participant, config_.max_participants)) {
        detail::logger()->warn("session {} is full ({} members), refused {}", session_id,
                               slot->session.participant_count(), user);
        return JoinResult::session_full;
    }

    const auto rejoin = slot->session.has_participant(participant.user_id());
    slot->session = slot->session.add_participant(participant);
    detail::logger()->info("{} {} session {}", user, rejoin ? "rejoined" : "joined", session_id);
    return rejoin ? JoinResult::rejoined : JoinResult::joined;
}

auto SessionRegistry::disconnect(const std::string& session_id, const UserId& user_id) -> bool {
    auto slot = slot_or_throw(session_id);
    auto lock = std::lock_guard{slot->mutex};
    if (!slot->open || !slot->session.has_participant(user_id)) return false;
    slot->session = slot->session.deactivate_participant(user_id);
    detail::logger()->info("{} disconnected from session {}", user_id.value(), session_id);
    return true;
}

auto SessionRegistry::leave(const std::string& session_id, const UserId& user_id) -> bool {
    auto slot = slot_or_throw(session_id);
    auto now_empty = false;
    {
        auto lock = std::lock_guard{slot->mutex};
        if (!slot->open || !slot->session.has_participant(user_id)) return false;
        slot->session = slot->session.remove_participant(user_id);
        now_empty = slot->session.participant_count() == 0;
        if (now_empty) slot->open = false;
    }
    detail::logger()->info("{} left session {}", user_id.value(), session_id);
    if (now_empty) {
        erase_slot(session_id, slot);
        detail::logger()->info("session {} closed after its last participant left", session_id);
    }
    return true;
}

// -- Editing ------------------------------------------------------------------

auto SessionRegistry::edit(const std::string& session_id, const UserId& user_id,
                           DocumentContent content, Timestamp at) -> EditResult {
    auto slot = slot_or_throw(session_id);
    auto lock = std::lock_guard{slot->mutex};
    if (!slot->open) {
        throw SessionNotFoundError{"no open session with id " + session_id};
    }

    auto member = slot->session.participant(user_id);
    if (!member) {
        detail::logger()->warn("edit by non-member {} in session {} refused", user_id.value(),
                               session_id);
        return EditResult::not_a_participant;
    }
    if (!can_user_edit(*member)) {
        detail::logger()->warn("edit by inactive {} in session {} refused", user_id.value(),
                               session_id);
        return EditResult::not_permitted;
    }

    slot->document = slot->document.update_content(std::move(content), user_id, at);
    detail::logger()->debug("session {} document {} now at version {}", session_id,
                            slot->document.id().value(), slot->document.version());
    return EditResult::applied;
}

// -- Agent queries ------------------------------------------------------------

auto SessionRegistry::detect_mention(std::string_view text, std::size_t cursor) const
    -> std::optional<MentionDetection> {
    return detect_at_cursor(config_.mention_pattern, text, cursor);
}

auto SessionRegistry::submit_query(const std::string& session_id, const UserId& user_id,
                                   std::string_view text, std::size_t cursor)
    -> std::optional<std::string> {
    if (!invoker_) {
        throw InvalidOperationError{"no agent invoker configured"};
    }

    auto slot = slot_or_throw(session_id);
    auto document_id = DocumentId{};
    {
        auto lock = std::lock_guard{slot->mutex};
        if (!slot->open) {
            throw SessionNotFoundError{"no open session with id " + session_id};
        }
        auto member = slot->session.participant(user_id);
        if (!member || !can_user_edit(*member)) {
            detail::logger()->warn("agent query by {} in session {} refused", user_id.value(),
                                   session_id);
            return std::nullopt;
        }
        document_id = slot->session.document_id();
    }

    const auto& pattern = config_.mention_pattern;
    const auto detection = detect_at_cursor(pattern, text, cursor);
    const auto question = extract_question(pattern, detection);
    if (!question) return std::nullopt;
    auto command = parse_agent_command(pattern, detection->text);
    if (!command) return std::nullopt;

    const auto started = Timestamp::now();
    auto request = AgentRequest{
        "q-" + std::to_string(next_query_.fetch_add(1)),
        session_id,
        std::move(document_id),
        user_id,
        *question,
        std::move(*command),
        Timestamp{started.millis_since_epoch + config_.agent_timeout.count()},
    };
    store_query(session_id, AgentQuery::create(request.query_id, request.question,
                                   request.command.agent_name, started));
    detail::logger()->info("query {} submitted by {} in session {}: {}", request.query_id,
                           user_id.value(), session_id, request.question);

    {
        auto lock = std::lock_guard{in_flight_mutex_};
        ++in_flight_;
    }
    detail::global_executor().silent_async([this, request] {
        run_query(request);
        auto lock = std::lock_guard{in_flight_mutex_};
        --in_flight_;
        in_flight_done_.notify_all();
    });
    return request.query_id;
}

void SessionRegistry::run_query(const AgentRequest& request) {
    try {
        {
            auto lock = std::lock_guard{queries_mutex_};
            auto it = queries_.find(request.query_id);
            if (it != queries_.end()) it->second.query = it->second.query.mark_streaming();
        }
        auto response = invoker_->invoke(request);
        if (response.empty()) {
            fail_query(request.query_id, "agent returned an empty response");
            return;
        }
        land_response(request, std::move(response));
    } catch (const std::exception& e) {
        fail_query(request.query_id, e.what());
    }
}

void SessionRegistry::land_response(const AgentRequest& request, std::string response) {
    auto slot = find_slot(request.session_id);
    if (!slot) {
        fail_query(request.query_id, "session closed before the response arrived");
        return;
    }

    const auto now = Timestamp::now();
    {
        auto lock = std::lock_guard{slot->mutex};
        if (!slot->open) {
            fail_query(request.query_id, "session closed before the response arrived");
            return;
        }
        if (slot->session.document_id() != request.document_id) {
            fail_query(request.query_id, "session no longer edits the queried document");
            return;
        }
        if (now > request.deadline) {
            fail_query(request.query_id, "agent response arrived after the deadline");
            return;
        }
        slot->document = slot->document.update_content(
            append_response(slot->document.content(), response), request.requested_by, now);
    }

    {
        auto lock = std::lock_guard{queries_mutex_};
        auto it = queries_.find(request.query_id);
        if (it != queries_.end() && it->second.query.is_active()) {
            it->second.query = it->second.query.mark_completed(std::move(response), now);
        }
    }
    detail::logger()->info("query {} answered in session {}", request.query_id,
                           request.session_id);
}

void SessionRegistry::fail_query(const std::string& query_id, const std::string& reason) {
    const auto message = reason.empty() ? std::string{"agent invocation failed"} : reason;
    {
        auto lock = std::lock_guard{queries_mutex_};
        auto it = queries_.find(query_id);
        if (it != queries_.end() && it->second.query.is_active()) {
            it->second.query = it->second.query.mark_failed(message);
        }
    }
    detail::logger()->warn("query {} dropped: {}", query_id, message);
}

void SessionRegistry::store_query(const std::string& session_id, const AgentQuery& query) {
    auto lock = std::lock_guard{queries_mutex_};
    queries_.insert_or_assign(query.query_id(), QueryRecord{session_id, query});
}

// Running queries keep their record; they fail once they try to land.
void SessionRegistry::release_finished_queries(const std::string& session_id) {
    auto lock = std::lock_guard{queries_mutex_};
    const auto released = std::erase_if(queries_, [&](const auto& entry) {
        return entry.second.session_id == session_id && !entry.second.query.is_active();
    });
    if (released > 0) {
        detail::logger()->debug("released {} finished queries of session {}", released,
                                session_id);
    }
}

auto SessionRegistry::query(const std::string& query_id) const -> std::optional<AgentQuery> {
    auto lock = std::lock_guard{queries_mutex_};
    auto it = queries_.find(query_id);
    if (it == queries_.end()) return std::nullopt;
    return it->second.query;
}

auto SessionRegistry::forget_query(const std::string& query_id) -> bool {
    auto lock = std::lock_guard{queries_mutex_};
    auto it = queries_.find(query_id);
    if (it == queries_.end() || it->second.query.is_active()) return false;
    queries_.erase(it);
    return true;
}

auto SessionRegistry::query_count() const -> std::size_t {
    auto lock = std::lock_guard{queries_mutex_};
    return queries_.size();
}

void SessionRegistry::wait_for_queries() {
    auto lock = std::unique_lock{in_flight_mutex_};
    in_flight_done_.wait(lock, [this] { return in_flight_ == 0; });
}

}  // namespace coedit_cpp

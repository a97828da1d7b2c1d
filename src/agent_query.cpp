#include <coedit-cpp/agent_query.hpp>

#include <coedit-cpp/error.hpp>

#include <algorithm>
#include <utility>

namespace coedit_cpp {

namespace {

auto is_blank(std::string_view s) -> bool {
    return std::ranges::all_of(s, [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    });
}

}  // anonymous namespace

auto AgentQuery::create(std::string query_id, std::string question,
                        std::optional<std::string> agent_name, Timestamp at) -> AgentQuery {
    if (query_id.empty()) {
        throw InvalidValueError{"Query ID cannot be empty"};
    }
    if (is_blank(question)) {
        throw InvalidValueError{"Question cannot be empty"};
    }
    auto q = AgentQuery{};
    q.query_id_ = std::move(query_id);
    q.question_ = std::move(question);
    q.agent_name_ = std::move(agent_name);
    q.started_at_ = at;
    return q;
}

auto AgentQuery::mark_streaming() const -> AgentQuery {
    if (status_ != QueryStatus::pending) {
        throw InvalidOperationError{"Can only mark pending queries as streaming"};
    }
    auto next = *this;
    next.status_ = QueryStatus::streaming;
    return next;
}

auto AgentQuery::mark_completed(std::string response, Timestamp at) const -> AgentQuery {
    if (status_ != QueryStatus::streaming) {
        throw InvalidOperationError{"Can only mark streaming queries as completed"};
    }
    if (response.empty()) {
        throw InvalidValueError{"Response cannot be empty"};
    }
    auto next = *this;
    next.status_ = QueryStatus::completed;
    next.response_ = std::move(response);
    next.ended_at_ = std::max(at, started_at_);
    return next;
}

auto AgentQuery::mark_failed(std::string error, Timestamp at) const -> AgentQuery {
    if (!is_active()) {
        throw InvalidOperationError{"Can only fail pending or streaming queries"};
    }
    if (error.empty()) {
        throw InvalidValueError{"Error message cannot be empty"};
    }
    auto next = *this;
    next.status_ = QueryStatus::failed;
    next.error_ = std::move(error);
    next.ended_at_ = std::max(at, started_at_);
    return next;
}

auto AgentQuery::duration() const -> std::optional<std::int64_t> {
    if (!ended_at_) return std::nullopt;
    return ended_at_->millis_since_epoch - started_at_.millis_since_epoch;
}

}  // namespace coedit_cpp

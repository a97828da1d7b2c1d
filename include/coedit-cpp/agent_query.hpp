/// @file agent_query.hpp
/// @brief AgentQuery: the lifecycle of one agent invocation.

#pragma once

#include <coedit-cpp/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace coedit_cpp {

/// Where an agent query is in its lifecycle.
enum class QueryStatus : std::uint8_t {
    pending,    ///< Submitted, agent not yet answering.
    streaming,  ///< Agent is producing a response.
    completed,  ///< Response landed.
    failed,     ///< Agent call failed or was abandoned.
};

/// Convert a QueryStatus to its string representation.
constexpr auto to_string_view(QueryStatus status) noexcept -> std::string_view {
    switch (status) {
        case QueryStatus::pending:   return "pending";
        case QueryStatus::streaming: return "streaming";
        case QueryStatus::completed: return "completed";
        case QueryStatus::failed:    return "failed";
    }
    return "unknown";
}

/// One question sent to an agent, tracked from submission to result.
///
/// Transitions: pending -> streaming -> completed, and pending or
/// streaming -> failed. Each transition returns a new value.
class AgentQuery {
public:
    /// Start tracking a question.
    /// @throws InvalidValueError if @p query_id is empty or @p question is blank.
    static auto create(std::string query_id, std::string question,
                       std::optional<std::string> agent_name = std::nullopt,
                       Timestamp at = Timestamp::now()) -> AgentQuery;

    /// @throws InvalidOperationError unless pending.
    auto mark_streaming() const -> AgentQuery;

    /// @throws InvalidOperationError unless streaming.
    /// @throws InvalidValueError if @p response is empty.
    auto mark_completed(std::string response, Timestamp at = Timestamp::now()) const
        -> AgentQuery;

    /// @throws InvalidOperationError if already completed or failed.
    /// @throws InvalidValueError if @p error is empty.
    auto mark_failed(std::string error, Timestamp at = Timestamp::now()) const -> AgentQuery;

    auto query_id() const noexcept -> const std::string& { return query_id_; }
    auto question() const noexcept -> const std::string& { return question_; }
    auto agent_name() const noexcept -> const std::optional<std::string>& { return agent_name_; }
    auto status() const noexcept -> QueryStatus { return status_; }
    auto started_at() const noexcept -> Timestamp { return started_at_; }
    auto ended_at() const noexcept -> const std::optional<Timestamp>& { return ended_at_; }
    auto response() const noexcept -> const std::optional<std::string>& { return response_; }
    auto error() const noexcept -> const std::optional<std::string>& { return error_; }

    /// True while pending or streaming.
    auto is_active() const noexcept -> bool {
        return status_ == QueryStatus::pending || status_ == QueryStatus::streaming;
    }

    /// Milliseconds from start to end, once the query has ended.
    auto duration() const -> std::optional<std::int64_t>;

    auto operator==(const AgentQuery&) const -> bool = default;

private:
    AgentQuery() = default;

    std::string query_id_;
    std::string question_;
    std::optional<std::string> agent_name_;
    QueryStatus status_{QueryStatus::pending};
    Timestamp started_at_;
    std::optional<Timestamp> ended_at_;
    std::optional<std::string> response_;
    std::optional<std::string> error_;
};

}  // namespace coedit_cpp

/// @file config.hpp
/// @brief Runtime configuration for a SessionRegistry.

#pragma once

#include <coedit-cpp/mention.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace coedit_cpp {

/// Longest accepted Config::agent_timeout.
inline constexpr std::chrono::milliseconds max_agent_timeout = std::chrono::hours{24};

/// Settings for sessions, mention detection, logging and agent calls.
///
/// Loaded from a JSON object; keys that are absent keep the defaults
/// below.
///
/// @code{.json}
/// {
///   "max_participants": 10,
///   "mention_pattern": "@j",
///   "log_level": "info",
///   "agent_timeout_ms": 30000
/// }
/// @endcode
struct Config {
    std::size_t max_participants{10};               ///< Session capacity, inactive members included.
    MentionPattern mention_pattern{};               ///< Prefix that triggers an agent query.
    std::string log_level{"info"};                  ///< spdlog level name.
    std::chrono::milliseconds agent_timeout{30000}; ///< Deadline for an agent response to land.

    auto operator==(const Config&) const -> bool = default;
};

/// Check a configuration.
/// @throws InvalidValueError for zero capacity, a timeout that is not
///   positive or exceeds max_agent_timeout, or an unknown log level.
void validate(const Config& config);

/// Parse and validate a configuration from JSON text.
/// @throws InvalidValueError on malformed JSON or invalid values.
auto parse_config(std::string_view json_text) -> Config;

/// Read, parse and validate a configuration file.
/// @throws InvalidValueError if the file cannot be read or is invalid.
auto load_config(const std::filesystem::path& path) -> Config;

}  // namespace coedit_cpp

#pragma once

// The library's spdlog logger.
//
// The domain value types never log. Only SessionRegistry reports what
// happens to sessions and agent queries, through the logger below.
//
// Internal header, not installed.

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace coedit_cpp::detail {

inline constexpr std::string_view logger_name = "coedit";

// The shared "coedit" logger. Registered with a stdout colour sink on
// first use; later calls return the registered instance, so an
// application may register its own "coedit" logger beforehand.
auto logger() -> std::shared_ptr<spdlog::logger>;

// True if spdlog knows @p name as a level ("trace" .. "critical", "off").
auto is_log_level(std::string_view name) -> bool;

// Apply a level name. Unknown names leave the level unchanged.
void set_log_level(std::string_view name);

}  // namespace coedit_cpp::detail

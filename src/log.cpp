#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace coedit_cpp::detail {

auto logger() -> std::shared_ptr<spdlog::logger> {
    static auto mutex = std::mutex{};
    auto lock = std::lock_guard{mutex};
    const auto name = std::string{logger_name};
    if (auto existing = spdlog::get(name)) return existing;
    return spdlog::stdout_color_mt(name);
}

auto is_log_level(std::string_view name) -> bool {
    const auto level_name = std::string{name};
    // from_str() maps unknown names to off, so "off" itself is checked first.
    return level_name == "off" ||
           spdlog::level::from_str(level_name) != spdlog::level::off;
}

void set_log_level(std::string_view name) {
    if (!is_log_level(name)) return;
    logger()->set_level(spdlog::level::from_str(std::string{name}));
}

}  // namespace coedit_cpp::detail

#include <coedit-cpp/config.hpp>

#include <coedit-cpp/error.hpp>
#include <coedit-cpp/json.hpp>

#include "log.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace coedit_cpp {

void validate(const Config& config) {
    if (config.max_participants == 0) {
        throw InvalidValueError{"max_participants must be at least 1"};
    }
    if (config.agent_timeout.count() <= 0) {
        throw InvalidValueError{"agent_timeout_ms must be positive"};
    }
    if (config.agent_timeout > max_agent_timeout) {
        throw InvalidValueError{"agent_timeout_ms exceeds " +
                                std::to_string(max_agent_timeout.count())};
    }
    if (!detail::is_log_level(config.log_level)) {
        throw InvalidValueError{"unknown log level: " + config.log_level};
    }
}

auto parse_config(std::string_view json_text) -> Config {
    auto config = Config{};
    try {
        const auto j = nlohmann::json::parse(json_text);
        if (!j.is_object()) {
            throw InvalidValueError{"configuration must be a JSON object"};
        }
        from_json(j, config);
    } catch (const nlohmann::json::exception& e) {
        throw InvalidValueError{std::string{"malformed configuration: "} + e.what()};
    }
    validate(config);
    return config;
}

auto load_config(const std::filesystem::path& path) -> Config {
    auto in = std::ifstream{path};
    if (!in) {
        throw InvalidValueError{"cannot read configuration file " + path.string()};
    }
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

}  // namespace coedit_cpp

#include <coedit-cpp/config.hpp>

#include <coedit-cpp/error.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace coedit_cpp;
using namespace std::chrono_literals;

TEST(Config, defaults) {
    const auto c = Config{};
    EXPECT_EQ(c.max_participants, 10u);
    EXPECT_EQ(c.mention_pattern.prefix(), "@j");
    EXPECT_EQ(c.log_level, "info");
    EXPECT_EQ(c.agent_timeout, 30000ms);
    EXPECT_NO_THROW(validate(c));
}

TEST(Config, parse_overrides_given_keys_only) {
    const auto c = parse_config(R"({"max_participants": 3, "mention_pattern": "@agent"})");
    EXPECT_EQ(c.max_participants, 3u);
    EXPECT_EQ(c.mention_pattern.prefix(), "@agent");
    EXPECT_EQ(c.log_level, "info");
    EXPECT_EQ(c.agent_timeout, 30000ms);
}

TEST(Config, parse_all_keys) {
    const auto c = parse_config(
        R"({"max_participants": 5, "mention_pattern": "@j", "log_level": "debug",
            "agent_timeout_ms": 1500})");
    EXPECT_EQ(c.max_participants, 5u);
    EXPECT_EQ(c.log_level, "debug");
    EXPECT_EQ(c.agent_timeout, 1500ms);
}

TEST(Config, empty_object_is_defaults) {
    EXPECT_EQ(parse_config("{}"), Config{});
}

TEST(Config, zero_capacity_rejected) {
    EXPECT_THROW(parse_config(R"({"max_participants": 0})"), InvalidValueError);
    EXPECT_THROW(parse_config(R"({"max_participants": -2})"), InvalidValueError);
}

TEST(Config, empty_pattern_rejected) {
    EXPECT_THROW(parse_config(R"({"mention_pattern": ""})"), InvalidValueError);
}

TEST(Config, unknown_log_level_rejected) {
    EXPECT_THROW(parse_config(R"({"log_level": "chatty"})"), InvalidValueError);
    EXPECT_NO_THROW(parse_config(R"({"log_level": "off"})"));
}

TEST(Config, non_positive_timeout_rejected) {
    EXPECT_THROW(parse_config(R"({"agent_timeout_ms": 0})"), InvalidValueError);
}

TEST(Config, oversized_timeout_rejected) {
    EXPECT_THROW(parse_config(R"({"agent_timeout_ms": 9223372036854775807})"),
                 InvalidValueError);
    EXPECT_THROW(parse_config(R"({"agent_timeout_ms": 86400001})"), InvalidValueError);
    EXPECT_NO_THROW(parse_config(R"({"agent_timeout_ms": 86400000})"));

    auto c = Config{};
    c.agent_timeout = std::chrono::milliseconds::max();
    EXPECT_THROW(validate(c), InvalidValueError);
}

TEST(Config, malformed_json_rejected) {
    EXPECT_THROW(parse_config("{not json"), InvalidValueError);
    EXPECT_THROW(parse_config("[1, 2]"), InvalidValueError);
    EXPECT_THROW(parse_config(R"({"max_participants": "many"})"), InvalidValueError);
}

TEST(Config, load_from_file) {
    const auto path = std::filesystem::temp_directory_path() / "coedit_config_test.json";
    {
        auto out = std::ofstream{path};
        out << R"({"max_participants": 4, "log_level": "warn"})";
    }
    const auto c = load_config(path);
    EXPECT_EQ(c.max_participants, 4u);
    EXPECT_EQ(c.log_level, "warn");
    std::filesystem::remove(path);
}

TEST(Config, missing_file_rejected) {
    EXPECT_THROW(load_config("/nonexistent/coedit.json"), InvalidValueError);
}

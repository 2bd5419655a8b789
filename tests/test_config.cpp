#include <gtest/gtest.h>
#include <corvo/config.hpp>
#include <corvo/error.hpp>

#include <cstdlib>

namespace {

using namespace corvo;

TEST(Config, Defaults) {
    Config cfg;
    EXPECT_EQ(cfg.while_limit, 0u);
    EXPECT_EQ(cfg.max_call_depth, 1000u);
    EXPECT_EQ(cfg.log_level, spdlog::level::warn);
}

TEST(Config, ParseCount) {
    EXPECT_EQ(parse_count("42", "n"), 42u);
    EXPECT_EQ(parse_count("0", "n"), 0u);
    EXPECT_THROW(parse_count("", "n"), InvalidArgumentError);
    EXPECT_THROW(parse_count("4x", "n"), InvalidArgumentError);
    EXPECT_THROW(parse_count("-1", "n"), InvalidArgumentError);
    EXPECT_THROW(parse_count("99999999999999999999999999", "n"), InvalidArgumentError);
}

TEST(Config, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
    EXPECT_EQ(parse_log_level("off"), spdlog::level::off);
    EXPECT_THROW(parse_log_level("loud"), InvalidArgumentError);
}

TEST(Config, FromEnvironment) {
    ::unsetenv("CORVO_WHILE_LIMIT");
    ::unsetenv("CORVO_MAX_DEPTH");
    ::unsetenv("CORVO_LOG_LEVEL");
    EXPECT_EQ(config_from_env().max_call_depth, 1000u);

    ::setenv("CORVO_WHILE_LIMIT", "10000", 1);
    ::setenv("CORVO_MAX_DEPTH", "64", 1);
    ::setenv("CORVO_LOG_LEVEL", "info", 1);
    Config cfg = config_from_env();
    EXPECT_EQ(cfg.while_limit, 10000u);
    EXPECT_EQ(cfg.max_call_depth, 64u);
    EXPECT_EQ(cfg.log_level, spdlog::level::info);

    ::setenv("CORVO_MAX_DEPTH", "deep", 1);
    EXPECT_THROW(config_from_env(), InvalidArgumentError);

    ::unsetenv("CORVO_WHILE_LIMIT");
    ::unsetenv("CORVO_MAX_DEPTH");
    ::unsetenv("CORVO_LOG_LEVEL");
}

} // namespace

#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include <spdlog/common.h>

namespace corvo {

struct Config {
    /// Stop a `while` loop after this many iterations; 0 means no limit.
    std::size_t while_limit{0};
    /// Deepest allowed chain of nested section calls.
    std::size_t max_call_depth{1000};
    spdlog::level::level_enum log_level{spdlog::level::warn};
};

/// Defaults overridden by CORVO_WHILE_LIMIT, CORVO_MAX_DEPTH and
/// CORVO_LOG_LEVEL. Throws InvalidArgumentError on malformed values.
Config config_from_env();

std::size_t parse_count(std::string_view text, std::string_view what);
spdlog::level::level_enum parse_log_level(std::string_view text);

} // namespace corvo

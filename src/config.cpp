#include "corvo/config.hpp"
#include "corvo/error.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <string>

namespace corvo {

std::size_t parse_count(std::string_view text, std::string_view what) {
    if (text.empty()) throw InvalidArgumentError(std::string(what) + " must not be empty");

    std::size_t n = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw InvalidArgumentError(std::string(what) + " must be a whole number, got '" + std::string(text) + "'");
        }
        std::size_t d = static_cast<std::size_t>(c - '0');
        if (n > (std::numeric_limits<std::size_t>::max() - d) / 10) {
            throw InvalidArgumentError(std::string(what) + " is too large");
        }
        n = n * 10 + d;
    }
    return n;
}

spdlog::level::level_enum parse_log_level(std::string_view text) {
    std::string name(text);
    auto lvl = spdlog::level::from_str(name);
    // from_str maps unknown names to `off`
    if (lvl == spdlog::level::off && name != "off") {
        throw InvalidArgumentError("Unknown log level '" + name + "'");
    }
    return lvl;
}

Config config_from_env() {
    Config cfg;
    if (const char* v = std::getenv("CORVO_WHILE_LIMIT")) cfg.while_limit = parse_count(v, "CORVO_WHILE_LIMIT");
    if (const char* v = std::getenv("CORVO_MAX_DEPTH")) cfg.max_call_depth = parse_count(v, "CORVO_MAX_DEPTH");
    if (const char* v = std::getenv("CORVO_LOG_LEVEL")) cfg.log_level = parse_log_level(v);
    return cfg;
}

} // namespace corvo

#include "corvo/config.hpp"
#include "corvo/error.hpp"
#include "corvo/grammar.hpp"
#include "corvo/interpreter.hpp"
#include "corvo/io.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <string>
#include <string_view>

namespace {

constexpr int kExitCorvoError = 1;
constexpr int kExitInternal   = 2;
constexpr int kExitUsage      = 64;

void usage() {
    fmt::print(stderr,
               "usage: corvo [--log-level LEVEL] [--while-limit N] [--max-depth N] [--print-tree] <program.corvo>\n");
}

struct Options {
    corvo::Config cfg;
    std::string path;
    bool print_tree{false};
};

// Returns false on bad usage.
bool parse_args(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value = [&](std::string_view flag) -> std::string_view {
            if (i + 1 >= argc) throw corvo::InvalidArgumentError(fmt::format("{} needs a value", flag));
            return argv[++i];
        };

        if (arg == "--log-level") {
            opts.cfg.log_level = corvo::parse_log_level(value(arg));
        } else if (arg == "--while-limit") {
            opts.cfg.while_limit = corvo::parse_count(value(arg), "--while-limit");
        } else if (arg == "--max-depth") {
            opts.cfg.max_call_depth = corvo::parse_count(value(arg), "--max-depth");
        } else if (arg == "--print-tree") {
            opts.print_tree = true;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (!arg.empty() && arg.front() == '-') {
            fmt::print(stderr, "corvo: unknown option '{}'\n", arg);
            return false;
        } else if (opts.path.empty()) {
            opts.path = std::string(arg);
        } else {
            fmt::print(stderr, "corvo: only one program file may be given\n");
            return false;
        }
    }
    return !opts.path.empty();
}

} // namespace

int main(int argc, char** argv) {
    auto logger = spdlog::stderr_color_mt("corvo");
    spdlog::set_default_logger(logger);

    Options opts;
    try {
        opts.cfg = corvo::config_from_env();
        if (!parse_args(argc, argv, opts)) {
            usage();
            return kExitUsage;
        }
    } catch (const corvo::Error& e) {
        fmt::print(stderr, "corvo: {}\n", e.what());
        return kExitUsage;
    }
    spdlog::set_level(opts.cfg.log_level);

    try {
        std::string source = corvo::read_text_file(opts.path);
        spdlog::debug("loaded {} ({} bytes)", opts.path, source.size());

        if (opts.print_tree) {
            fmt::print("{}", corvo::pretty(corvo::parse_tree(source)));
            return 0;
        }

        corvo::Interpreter interp(std::cout, std::cin, opts.cfg);
        interp.run_source(source);
        std::cout.flush();
    } catch (const corvo::Error& e) {
        std::cout.flush();
        fmt::print(stderr, "{}\n", corvo::format_error(e));
        return kExitCorvoError;
    } catch (const std::exception& e) {
        std::cout.flush();
        fmt::print(stderr, "internal error: {}\n", e.what());
        return kExitInternal;
    }
    return 0;
}

//! # Logging Options
//!
//! Builds a LogConfig from argv and the PYSTRUCT_LOG environment variable.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>

namespace pystruct::log {

namespace {

/// `-v`, `-vv`, `-vvv`: the number of v's, or 0 for any other argument.
auto verbosity_of(std::string_view arg) -> int {
    if (arg.size() < 2 || arg[0] != '-') {
        return 0;
    }
    if (arg.find_first_not_of('v', 1) != std::string_view::npos) {
        return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

auto level_for_verbosity(int count) -> LogLevel {
    switch (count) {
    case 1:
        return LogLevel::Info;
    case 2:
        return LogLevel::Debug;
    default:
        return LogLevel::Trace;
    }
}

/// Value of `--name=value` when `arg` has that prefix.
auto option_value(std::string_view arg, std::string_view prefix) -> std::optional<std::string> {
    if (!arg.starts_with(prefix)) {
        return std::nullopt;
    }
    return std::string(arg.substr(prefix.size()));
}

} // namespace

bool is_log_option(std::string_view arg) {
    static constexpr std::string_view prefixes[] = {"--log-level=", "--log-filter=", "--log-file=",
                                                    "--log-format="};
    for (auto prefix : prefixes) {
        if (arg.starts_with(prefix)) {
            return true;
        }
    }
    return arg == "-q" || arg == "--quiet" || arg == "--verbose" || verbosity_of(arg) > 0;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    int verbosity = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (auto value = option_value(arg, "--log-level=")) {
            explicit_level = parse_level(*value);
        } else if (auto filter = option_value(arg, "--log-filter=")) {
            config.filter_spec = *filter;
        } else if (auto file = option_value(arg, "--log-file=")) {
            config.log_file = *file;
        } else if (auto format = option_value(arg, "--log-format=")) {
            config.format = (*format == "json" || *format == "JSON") ? LogFormat::JSON
                                                                     : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbosity = std::max(verbosity, 1);
        } else {
            verbosity = std::max(verbosity, verbosity_of(arg));
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
    } else if (verbosity > 0) {
        config.level = level_for_verbosity(verbosity);
    } else if (config.filter_spec.empty()) {
        const char* env = std::getenv("PYSTRUCT_LOG");
        std::string_view value = env != nullptr ? env : "";
        // A filter spec has '=' or ','; anything else is a level name.
        if (value.find_first_of("=,") != std::string_view::npos) {
            config.filter_spec = std::string(value);
        } else if (!value.empty()) {
            config.level = parse_level(value);
        }
    }
    return config;
}

} // namespace pystruct::log

#include "cli/run_config.hpp"

#include "cli/utils.hpp"
#include "filter/registry.hpp"
#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <charconv>
#include <limits>
#include <system_error>

namespace pystruct::cli {

namespace fs = std::filesystem;

namespace {

auto parse_int(std::string_view text, std::string_view what)
    -> Result<int64_t, ConfigurationError> {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return ConfigurationError{"invalid " + std::string(what) + " '" + std::string(text) + "'"};
    }
    return value;
}

auto fits_int(int64_t value) -> bool {
    return value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max();
}

auto resolve(const std::string& value, const fs::path& base_dir) -> fs::path {
    fs::path path(value);
    if (path.is_relative() && !base_dir.empty()) {
        return base_dir / path;
    }
    return path;
}

auto manifest_string(const std::string& key, const json::JsonValue& value)
    -> Result<std::string, ConfigurationError> {
    if (!value.is_string()) {
        return ConfigurationError{"manifest key '" + key + "' must be a string"};
    }
    return value.as_string();
}

auto manifest_int(const std::string& key, const json::JsonValue& value)
    -> Result<int64_t, ConfigurationError> {
    auto number = value.try_as_i64();
    if (!number) {
        return ConfigurationError{"manifest key '" + key + "' must be an integer"};
    }
    return *number;
}

auto manifest_filters(const json::JsonValue& value)
    -> Result<std::vector<std::string>, ConfigurationError> {
    if (value.is_string()) {
        return filter::split_filter_names(value.as_string());
    }
    if (!value.is_array()) {
        return ConfigurationError{"manifest key 'filters' must be an array or a string"};
    }
    std::vector<std::string> names;
    for (const auto& item : value.as_array()) {
        if (!item.is_string()) {
            return ConfigurationError{"manifest key 'filters' must contain only strings"};
        }
        names.push_back(item.as_string());
    }
    return names;
}

} // namespace

// ============================================================================
// RunConfig
// ============================================================================

auto RunConfig::validate() const -> Result<bool, ConfigurationError> {
    if (identity.name.empty()) {
        return ConfigurationError{"missing repository name (--name)"};
    }
    if (identity.url.empty()) {
        return ConfigurationError{"missing repository url (--url)"};
    }
    if (root.empty()) {
        return ConfigurationError{"missing repository root directory"};
    }
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return ConfigurationError{"repository root is not a directory: " + root.string()};
    }
    if (jobs && *jobs <= 0) {
        return ConfigurationError{"worker count must be positive, got " + std::to_string(*jobs)};
    }
    if (timeout_ms < 0) {
        return ConfigurationError{"timeout must not be negative, got " +
                                  std::to_string(timeout_ms)};
    }
    return true;
}

auto RunConfig::filter_names() const -> std::vector<std::string> {
    if (filters) {
        return *filters;
    }
    auto names = filter::split_filter_names(DEFAULT_FILTER_CHAIN);
    return is_ok(names) ? unwrap(names) : std::vector<std::string>{};
}

auto RunConfig::report_path() const -> fs::path {
    if (!report.empty()) {
        return report;
    }
    if (output.empty()) {
        return {};
    }
    auto path = output;
    path += ".report.json";
    return path;
}

// ============================================================================
// Manifest
// ============================================================================

auto apply_manifest(RunConfig& config, const json::JsonValue& manifest, const fs::path& base_dir)
    -> Result<bool, ConfigurationError> {
    if (!manifest.is_object()) {
        return ConfigurationError{"manifest must be a JSON object"};
    }

    for (const auto& [key, value] : manifest.as_object()) {
        if (key == "name" || key == "url" || key == "pypi_tag" || key == "git_commit_hash" ||
            key == "root" || key == "output" || key == "report") {
            auto text = manifest_string(key, value);
            if (is_err(text)) {
                return unwrap_err(text);
            }
            auto& s = unwrap(text);
            if (key == "name") {
                config.identity.name = s;
            } else if (key == "url") {
                config.identity.url = s;
            } else if (key == "pypi_tag") {
                config.identity.pypi_tag = s;
            } else if (key == "git_commit_hash") {
                config.identity.git_commit_hash = s;
            } else if (key == "root") {
                config.root = resolve(s, base_dir);
            } else if (key == "output") {
                config.output = resolve(s, base_dir);
            } else {
                config.report = resolve(s, base_dir);
            }
        } else if (key == "filters") {
            auto names = manifest_filters(value);
            if (is_err(names)) {
                return unwrap_err(names);
            }
            config.filters = std::move(unwrap(names));
        } else if (key == "jobs" || key == "timeout_ms") {
            auto number = manifest_int(key, value);
            if (is_err(number)) {
                return unwrap_err(number);
            }
            if (key == "jobs") {
                if (!fits_int(unwrap(number))) {
                    return ConfigurationError{"manifest key 'jobs' is out of range"};
                }
                config.jobs = static_cast<int>(unwrap(number));
            } else {
                config.timeout_ms = unwrap(number);
            }
        } else {
            return ConfigurationError{"unknown manifest key '" + key + "'"};
        }
    }
    return true;
}

auto load_manifest(RunConfig& config, const fs::path& file) -> Result<bool, ConfigurationError> {
    auto text = read_file(file);
    if (is_err(text)) {
        return ConfigurationError{unwrap_err(text).message};
    }
    auto manifest = json::parse_json(unwrap(text));
    if (is_err(manifest)) {
        return ConfigurationError{file.string() + ": " + unwrap_err(manifest).to_string()};
    }
    PYSTRUCT_LOG_DEBUG("cli", "Loaded run manifest " << file.string());
    return apply_manifest(config, unwrap(manifest), file.parent_path());
}

// ============================================================================
// Command Line
// ============================================================================

auto parse_run_config(const std::vector<std::string>& args)
    -> Result<RunConfig, ConfigurationError> {
    RunConfig config;

    // The manifest is applied first so that flags override it.
    for (const auto& arg : args) {
        if (arg.starts_with("--config=")) {
            auto loaded = load_manifest(config, arg.substr(9));
            if (is_err(loaded)) {
                return unwrap_err(loaded);
            }
        }
    }

    bool root_given = false;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (log::is_log_option(arg) || arg.starts_with("--config=")) {
            continue;
        }

        if (arg.starts_with("--name=")) {
            config.identity.name = arg.substr(7);
        } else if (arg.starts_with("--url=")) {
            config.identity.url = arg.substr(6);
        } else if (arg.starts_with("--pypi-tag=")) {
            config.identity.pypi_tag = arg.substr(11);
        } else if (arg.starts_with("--commit=")) {
            config.identity.git_commit_hash = arg.substr(9);
        } else if (arg.starts_with("--filters=")) {
            auto names = filter::split_filter_names(arg.substr(10));
            if (is_err(names)) {
                return unwrap_err(names);
            }
            config.filters = std::move(unwrap(names));
        } else if (arg.starts_with("--jobs=") || (arg.starts_with("-j") && arg.size() > 2)) {
            auto text = arg.substr(arg[1] == 'j' ? 2 : 7);
            auto value = parse_int(text, "worker count");
            if (is_err(value)) {
                return unwrap_err(value);
            }
            if (!fits_int(unwrap(value))) {
                return ConfigurationError{"invalid worker count '" + std::string(text) + "'"};
            }
            config.jobs = static_cast<int>(unwrap(value));
        } else if (arg.starts_with("--timeout-ms=")) {
            auto value = parse_int(arg.substr(13), "timeout");
            if (is_err(value)) {
                return unwrap_err(value);
            }
            config.timeout_ms = unwrap(value);
        } else if (arg.starts_with("--output=")) {
            config.output = arg.substr(9);
        } else if (arg == "-o") {
            if (i + 1 >= args.size()) {
                return ConfigurationError{"-o requires a file name"};
            }
            config.output = args[++i];
        } else if (arg.starts_with("--report=")) {
            config.report = arg.substr(9);
        } else if (arg.starts_with("-")) {
            return ConfigurationError{"unknown option '" + arg + "'"};
        } else if (!root_given) {
            config.root = arg;
            root_given = true;
        } else {
            return ConfigurationError{"unexpected argument '" + arg + "'"};
        }
    }

    return config;
}

} // namespace pystruct::cli

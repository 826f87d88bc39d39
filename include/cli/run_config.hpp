//! # Run Configuration
//!
//! Everything an `extract` run needs, gathered from an optional JSON
//! manifest and the command line (flags win over the manifest).
//!
//! ## Manifest
//!
//! ```json
//! {
//!     "name": "requests",
//!     "url": "https://github.com/psf/requests",
//!     "pypi_tag": "v2.31.0",
//!     "git_commit_hash": "147c8511",
//!     "root": "checkouts/requests",
//!     "filters": ["TestModuleFilter", "NoStringTypeFilter", "EmptyFilter"],
//!     "jobs": 8,
//!     "timeout_ms": 60000,
//!     "output": "out/requests.json",
//!     "report": "out/requests.report.json"
//! }
//! ```
//!
//! `filters` may also be a comma-separated string. Relative `root`,
//! `output` and `report` paths are resolved against the manifest's
//! directory. Unknown keys are rejected.
//!
//! ## Command Line
//!
//! | Flag | Field |
//! |------|-------|
//! | `<root>` (positional) | `root` |
//! | `--name=`, `--url=`, `--pypi-tag=`, `--commit=` | identity |
//! | `--filters=A,B` | `filters` |
//! | `--jobs=N`, `-jN` | `jobs` |
//! | `--timeout-ms=N` | `timeout_ms` |
//! | `--output=F`, `-o F` | `output` |
//! | `--report=F` | `report` |
//! | `--config=F` | manifest file |

#ifndef PYSTRUCT_CLI_RUN_CONFIG_HPP
#define PYSTRUCT_CLI_RUN_CONFIG_HPP

#include "common.hpp"
#include "json/json_value.hpp"
#include "model/entities.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pystruct::cli {

/// Filter chain used when neither the manifest nor the command line names one.
constexpr const char* DEFAULT_FILTER_CHAIN = "NoStringTypeFilter,EmptyFilter";

struct RunConfig {
    model::RepositoryIdentity identity;
    std::filesystem::path root;
    std::optional<std::vector<std::string>> filters; ///< Unset means the default chain.
    std::optional<int> jobs;                         ///< Unset means hardware concurrency.
    int64_t timeout_ms = 0;                          ///< 0 means no deadline.
    std::filesystem::path output;                    ///< Empty means stdout.
    std::filesystem::path report;                    ///< Empty means derived from `output`.

    /// Checks the identity, the root directory, the worker count and the
    /// timeout.
    [[nodiscard]] auto validate() const -> Result<bool, ConfigurationError>;

    /// The filter chain to run: `filters`, or the default chain.
    [[nodiscard]] auto filter_names() const -> std::vector<std::string>;

    /// Where the run report goes: `report`, else `<output>.report.json`,
    /// else empty (no report file when the dataset goes to stdout).
    [[nodiscard]] auto report_path() const -> std::filesystem::path;
};

/// Applies manifest values onto `config`.
[[nodiscard]] auto apply_manifest(RunConfig& config, const json::JsonValue& manifest,
                                  const std::filesystem::path& base_dir)
    -> Result<bool, ConfigurationError>;

/// Reads a manifest file and applies it onto `config`.
[[nodiscard]] auto load_manifest(RunConfig& config, const std::filesystem::path& file)
    -> Result<bool, ConfigurationError>;

/// Builds a configuration from `extract` arguments (without the command
/// name). Logging options are skipped; they are handled by the logger.
[[nodiscard]] auto parse_run_config(const std::vector<std::string>& args)
    -> Result<RunConfig, ConfigurationError>;

} // namespace pystruct::cli

#endif // PYSTRUCT_CLI_RUN_CONFIG_HPP

//! # Source Unit Loader
//!
//! Resolves the modules of a repository: every `*.py` file under the root,
//! one file per module. Hidden directories (`.git`, `.venv`, ...) and
//! `__pycache__` are not entered.
//!
//! Paths are relative to the root with `/` separators and sorted, which
//! fixes the module order of the assembled repository. A file that cannot
//! be read becomes an `Io` failure; it does not stop the others.

#ifndef PYSTRUCT_EXTRACT_LOADER_HPP
#define PYSTRUCT_EXTRACT_LOADER_HPP

#include "common.hpp"
#include "extract/failure.hpp"
#include "lexer/source.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace pystruct::extract {

/// One module's materialized text. `source.filename()` is the relative path.
struct SourceUnit {
    std::string relative_path;
    lexer::Source source;
};

/// The result of loading a repository root.
struct LoadedSources {
    std::vector<SourceUnit> units;            ///< In sorted path order.
    std::vector<ExtractionFailure> failures;  ///< Unreadable files.
    size_t files_discovered = 0;
};

/// Lists the relative paths of the `*.py` files under `root`, sorted.
///
/// Fails if `root` is not a directory or cannot be traversed.
[[nodiscard]] auto discover_sources(const fs::path& root)
    -> Result<std::vector<std::string>, std::string>;

/// Reads the given files relative to `root`.
[[nodiscard]] auto load_sources(const fs::path& root,
                                const std::vector<std::string>& relative_paths) -> LoadedSources;

/// Discovers and reads every module under `root`.
[[nodiscard]] auto load_sources(const fs::path& root) -> Result<LoadedSources, std::string>;

} // namespace pystruct::extract

#endif // PYSTRUCT_EXTRACT_LOADER_HPP

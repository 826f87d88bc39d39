//! # Repository Extraction
//!
//! Runs the extraction stages for one repository root:
//!
//! ```text
//! load_sources() → ParallelExtractor::run() → assemble_repository()
//! ```
//!
//! and produces the repository together with its `ExtractionReport`.

#ifndef PYSTRUCT_EXTRACT_REPOSITORY_EXTRACTOR_HPP
#define PYSTRUCT_EXTRACT_REPOSITORY_EXTRACTOR_HPP

#include "common.hpp"
#include "extract/cancellation.hpp"
#include "extract/failure.hpp"
#include "model/entities.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace pystruct::extract {

/// What happened to the files of one repository.
struct ExtractionReport {
    size_t files_discovered = 0;
    size_t modules_extracted = 0;
    std::vector<ExtractionFailure> failures; ///< Loader failures first, then per-file order.
    int64_t elapsed_ms = 0;

    [[nodiscard]] auto count(FailureKind kind) const -> size_t;
};

struct ExtractOptions {
    std::filesystem::path root;
    model::RepositoryIdentity identity;
    int jobs = 0; ///< Worker threads, 0 = hardware concurrency.
};

struct ExtractionResult {
    Rc<const model::Repository> repository;
    ExtractionReport report;
};

/// Extracts the repository under `options.root`.
///
/// Fails only when the root itself cannot be listed; unreadable and
/// unparsable files are reported, not fatal.
[[nodiscard]] auto extract_repository(const ExtractOptions& options,
                                      const CancellationToken& token)
    -> Result<ExtractionResult, std::string>;

} // namespace pystruct::extract

#endif // PYSTRUCT_EXTRACT_REPOSITORY_EXTRACTOR_HPP

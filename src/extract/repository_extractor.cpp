#include "extract/repository_extractor.hpp"

#include "extract/assembler.hpp"
#include "extract/loader.hpp"
#include "extract/parallel.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <chrono>

namespace pystruct::extract {

auto ExtractionReport::count(FailureKind kind) const -> size_t {
    return static_cast<size_t>(std::count_if(failures.begin(), failures.end(),
                                             [kind](const auto& f) { return f.kind == kind; }));
}

auto extract_repository(const ExtractOptions& options, const CancellationToken& token)
    -> Result<ExtractionResult, std::string> {
    auto start = std::chrono::steady_clock::now();

    auto loaded = load_sources(options.root);
    if (is_err(loaded)) {
        return unwrap_err(loaded);
    }
    auto& sources = unwrap(loaded);

    ParallelExtractor extractor(options.jobs);
    auto outcomes = extractor.run(sources.units, token);
    auto assembly = assemble_repository(options.identity, std::move(outcomes));

    ExtractionReport report;
    report.files_discovered = sources.files_discovered;
    report.modules_extracted = assembly.repository->modules.size();
    report.failures = std::move(sources.failures);
    for (auto& failure : assembly.failures) {
        report.failures.push_back(std::move(failure));
    }
    report.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - start)
                            .count();

    PYSTRUCT_LOG_INFO("extract", options.identity.name
                                     << ": " << report.modules_extracted << " of "
                                     << report.files_discovered << " modules extracted, "
                                     << report.count(FailureKind::Syntax) << " syntax errors, "
                                     << report.count(FailureKind::Io) << " unreadable, "
                                     << report.count(FailureKind::Cancelled) << " cancelled");

    return ExtractionResult{.repository = std::move(assembly.repository),
                            .report = std::move(report)};
}

} // namespace pystruct::extract

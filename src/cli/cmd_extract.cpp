//! # Extract Command
//!
//! ```text
//! parse config ─► validate ─► resolve filter chain ─► extract ─► filter ─► write
//! ```
//!
//! Everything that can make the run fatal (bad flags, bad manifest, unknown
//! filter, missing root) is checked before the first source file is read.

#include "cli/commands.hpp"
#include "cli/run_config.hpp"
#include "cli/utils.hpp"
#include "extract/repository_extractor.hpp"
#include "filter/pipeline.hpp"
#include "log/log.hpp"
#include "model/stats.hpp"
#include "serialize/dataset_json.hpp"
#include "serialize/report_json.hpp"

#include <chrono>
#include <iostream>

namespace pystruct::cli {

int run_extract(const std::vector<std::string>& args, const filter::FilterRegistry& registry) {
    auto parsed = parse_run_config(args);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed).message << "\n";
        return 1;
    }
    const auto& config = unwrap(parsed);

    auto valid = config.validate();
    if (is_err(valid)) {
        std::cerr << "error: " << unwrap_err(valid).message << "\n";
        return 1;
    }

    auto pipeline = filter::FilterPipeline::create(registry, config.filter_names());
    if (is_err(pipeline)) {
        std::cerr << "error: " << unwrap_err(pipeline).message << "\n";
        return 1;
    }

    extract::CancellationToken token;
    if (config.timeout_ms > 0) {
        token.set_timeout(std::chrono::milliseconds(config.timeout_ms));
    }

    extract::ExtractOptions options{
        .root = config.root,
        .identity = config.identity,
        .jobs = config.jobs.value_or(0),
    };
    auto extracted = extract::extract_repository(options, token);
    if (is_err(extracted)) {
        std::cerr << "error: " << unwrap_err(extracted) << "\n";
        return 1;
    }
    auto& result = unwrap(extracted);

    filter::FilterReport filter_report;
    model::Dataset dataset;
    if (auto kept = unwrap(pipeline).apply(result.repository, filter_report)) {
        dataset.push_back(std::move(kept));
    } else {
        PYSTRUCT_LOG_INFO("cli", config.identity.name << ": no modules left after filtering");
    }

    auto text = serialize::write_dataset(dataset);
    if (config.output.empty()) {
        std::cout << text << "\n";
    } else {
        auto written = write_file(config.output, text + "\n");
        if (is_err(written)) {
            std::cerr << "error: " << unwrap_err(written).message << "\n";
            return 1;
        }
    }

    auto report_path = config.report_path();
    if (!report_path.empty()) {
        auto report = serialize::report_to_json(result.report, filter_report);
        auto written = write_file(report_path, report.to_string_pretty(2) + "\n");
        if (is_err(written)) {
            std::cerr << "error: " << unwrap_err(written).message << "\n";
            return 1;
        }
    }

    auto counts = model::count_entities(dataset);
    auto removed = filter_report.total();
    PYSTRUCT_LOG_INFO("cli", config.identity.name
                                 << ": kept " << counts.modules << " modules, " << counts.classes
                                 << " classes, " << counts.functions << " functions, "
                                 << counts.methods << " methods; filters removed "
                                 << removed.modules << " modules, " << removed.functions
                                 << " functions, " << removed.methods << " methods; "
                                 << result.report.failures.size() << " files failed");
    return 0;
}

} // namespace pystruct::cli

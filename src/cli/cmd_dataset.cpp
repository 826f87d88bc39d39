//! # Dataset Commands
//!
//! `filter`, `stats` and `filters` work on dataset files written by
//! `extract` (or on the registry alone) and never touch source trees.

#include "cli/commands.hpp"
#include "cli/run_config.hpp"
#include "cli/utils.hpp"
#include "filter/pipeline.hpp"
#include "json/json_value.hpp"
#include "log/log.hpp"
#include "model/stats.hpp"
#include "serialize/dataset_json.hpp"
#include "serialize/report_json.hpp"

#include <iomanip>
#include <iostream>
#include <optional>

namespace pystruct::cli {

namespace {

struct DatasetArgs {
    std::string input;
    std::string output;
    std::optional<std::vector<std::string>> filters;
    bool json = false;
};

auto parse_dataset_args(const std::vector<std::string>& args, bool accepts_filters)
    -> Result<DatasetArgs, ConfigurationError> {
    DatasetArgs parsed;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (log::is_log_option(arg)) {
            continue;
        }

        if (accepts_filters && arg.starts_with("--filters=")) {
            auto names = filter::split_filter_names(arg.substr(10));
            if (is_err(names)) {
                return unwrap_err(names);
            }
            parsed.filters = std::move(unwrap(names));
        } else if (accepts_filters && arg.starts_with("--output=")) {
            parsed.output = arg.substr(9);
        } else if (accepts_filters && arg == "-o") {
            if (i + 1 >= args.size()) {
                return ConfigurationError{"-o requires a file name"};
            }
            parsed.output = args[++i];
        } else if (!accepts_filters && arg == "--json") {
            parsed.json = true;
        } else if (arg.starts_with("-")) {
            return ConfigurationError{"unknown option '" + arg + "'"};
        } else if (parsed.input.empty()) {
            parsed.input = arg;
        } else {
            return ConfigurationError{"unexpected argument '" + arg + "'"};
        }
    }
    if (parsed.input.empty()) {
        return ConfigurationError{"missing dataset file"};
    }
    return parsed;
}

auto load_dataset(const std::string& path) -> std::optional<model::Dataset> {
    auto text = read_file(path);
    if (is_err(text)) {
        std::cerr << "error: " << unwrap_err(text).message << "\n";
        return std::nullopt;
    }
    auto dataset = serialize::read_dataset(unwrap(text));
    if (is_err(dataset)) {
        std::cerr << "error: " << path << ": " << unwrap_err(dataset).to_string() << "\n";
        return std::nullopt;
    }
    PYSTRUCT_LOG_DEBUG("cli", "Read " << unwrap(dataset).size() << " repositories from " << path);
    return std::move(unwrap(dataset));
}

void print_counts_row(std::string_view label, const model::EntityCounts& c) {
    std::cout << "  " << std::left << std::setw(28) << label << std::right << std::setw(9)
              << c.modules << std::setw(9) << c.classes << std::setw(11) << c.functions
              << std::setw(9) << c.methods << std::setw(8) << c.parameters << std::setw(7)
              << c.typed_parameters << "\n";
}

} // namespace

// ============================================================================
// filter
// ============================================================================

int run_filter(const std::vector<std::string>& args, const filter::FilterRegistry& registry) {
    auto parsed = parse_dataset_args(args, true);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed).message << "\n";
        std::cerr << "Usage: pystruct filter <dataset.json> --filters=A,B [-o out.json]\n";
        return 1;
    }
    const auto& options = unwrap(parsed);

    auto pipeline =
        options.filters
            ? filter::FilterPipeline::create(registry, *options.filters)
            : filter::FilterPipeline::create(registry, std::string_view(DEFAULT_FILTER_CHAIN));
    if (is_err(pipeline)) {
        std::cerr << "error: " << unwrap_err(pipeline).message << "\n";
        return 1;
    }

    auto dataset = load_dataset(options.input);
    if (!dataset) {
        return 1;
    }

    filter::FilterReport report;
    auto filtered = unwrap(pipeline).apply(*dataset, report);

    auto removed = report.total();
    PYSTRUCT_LOG_INFO("cli", "Kept " << filtered.size() << " of " << dataset->size()
                                     << " repositories; filters removed " << removed.modules
                                     << " modules, " << removed.classes << " classes, "
                                     << removed.functions << " functions, " << removed.methods
                                     << " methods");

    auto text = serialize::write_dataset(filtered);
    if (options.output.empty()) {
        std::cout << text << "\n";
        return 0;
    }
    auto written = write_file(options.output, text + "\n");
    if (is_err(written)) {
        std::cerr << "error: " << unwrap_err(written).message << "\n";
        return 1;
    }
    return 0;
}

// ============================================================================
// stats
// ============================================================================

int run_stats(const std::vector<std::string>& args) {
    auto parsed = parse_dataset_args(args, false);
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed).message << "\n";
        std::cerr << "Usage: pystruct stats <dataset.json> [--json]\n";
        return 1;
    }
    const auto& options = unwrap(parsed);

    auto dataset = load_dataset(options.input);
    if (!dataset) {
        return 1;
    }

    if (options.json) {
        json::JsonArray repositories;
        for (const auto& repository : *dataset) {
            json::JsonObject entry;
            entry.emplace_back("name", json::JsonValue(repository->identity.name));
            entry.emplace_back("counts", serialize::to_json(model::count_entities(*repository)));
            repositories.emplace_back(std::move(entry));
        }
        json::JsonObject out;
        out.emplace_back("repositories", json::JsonValue(std::move(repositories)));
        out.emplace_back("total", serialize::to_json(model::count_entities(*dataset)));
        std::cout << json::JsonValue(std::move(out)).to_string_pretty(2) << "\n";
        return 0;
    }

    std::cout << "  " << std::left << std::setw(28) << "Repository" << std::right
              << "  Modules  Classes  Functions  Methods  Params  Typed\n";
    for (const auto& repository : *dataset) {
        print_counts_row(repository->identity.name, model::count_entities(*repository));
    }
    auto total = model::count_entities(*dataset);
    print_counts_row("Total (" + std::to_string(total.repositories) + " repositories)", total);
    return 0;
}

// ============================================================================
// filters
// ============================================================================

int run_list_filters(const filter::FilterRegistry& registry) {
    std::cout << "Available filters:\n";
    for (const auto& f : registry.filters()) {
        std::string scopes;
        for (const auto& stage : f->stages) {
            if (!scopes.empty()) {
                scopes += ", ";
            }
            scopes += filter::scope_name(filter::scope_of(stage));
        }
        std::cout << "  " << std::left << std::setw(22) << f->name << f->description << " ["
                  << scopes << "]\n";
    }
    std::cout << "\nDefault chain: " << DEFAULT_FILTER_CHAIN << "\n";
    return 0;
}

} // namespace pystruct::cli

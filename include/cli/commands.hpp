//! # CLI Commands
//!
//! | Command | Reads | Writes |
//! |---------|-------|--------|
//! | `extract` | a repository checkout | dataset JSON and run report |
//! | `filter` | a dataset JSON file | the filtered dataset |
//! | `stats` | a dataset JSON file | entity counts |
//! | `filters` | - | the registry listing |
//!
//! Every command returns the process exit status: 0 on success, 1 when
//! the run could not be carried out. Per-file parse failures during
//! `extract` are reported but do not fail the run.

#ifndef PYSTRUCT_CLI_COMMANDS_HPP
#define PYSTRUCT_CLI_COMMANDS_HPP

#include "filter/registry.hpp"

#include <string>
#include <vector>

namespace pystruct::cli {

/// `pystruct extract <root> [options]`
int run_extract(const std::vector<std::string>& args, const filter::FilterRegistry& registry);

/// `pystruct filter <dataset.json> --filters=A,B [-o out.json]`
int run_filter(const std::vector<std::string>& args, const filter::FilterRegistry& registry);

/// `pystruct stats <dataset.json> [--json]`
int run_stats(const std::vector<std::string>& args);

/// `pystruct filters`
int run_list_filters(const filter::FilterRegistry& registry);

} // namespace pystruct::cli

#endif // PYSTRUCT_CLI_COMMANDS_HPP

//! # CLI Utilities
//!
//! File helpers and the usage text shared by the `pystruct` commands.

#ifndef PYSTRUCT_CLI_UTILS_HPP
#define PYSTRUCT_CLI_UTILS_HPP

#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace pystruct::cli {

/// A file that could not be read or written. The message names the path.
struct IoError {
    std::string message;
};

[[nodiscard]] auto read_file(const std::filesystem::path& path) -> Result<std::string, IoError>;

/// Writes `content` to `path`, creating parent directories as needed.
[[nodiscard]] auto write_file(const std::filesystem::path& path, std::string_view content)
    -> Result<bool, IoError>;

void print_usage();
void print_version();

} // namespace pystruct::cli

#endif // PYSTRUCT_CLI_UTILS_HPP

#include "cli/utils.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace pystruct::cli {

auto read_file(const std::filesystem::path& path) -> Result<std::string, IoError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return IoError{"cannot open file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return IoError{"cannot read file: " + path.string()};
    }
    return buffer.str();
}

auto write_file(const std::filesystem::path& path, std::string_view content)
    -> Result<bool, IoError> {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return IoError{"cannot create directory " + path.parent_path().string() + ": " +
                           ec.message()};
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return IoError{"cannot open file for writing: " + path.string()};
    }
    file << content;
    if (!file.good()) {
        return IoError{"cannot write file: " + path.string()};
    }
    return true;
}

void print_usage() {
    std::cout << "pystruct - structural extraction of Python repositories\n\n";
    std::cout << "Usage: pystruct <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  extract <root>      Extract a repository into a dataset\n";
    std::cout << "  filter <dataset>    Apply a filter chain to an existing dataset\n";
    std::cout << "  stats <dataset>     Print entity counts of a dataset\n";
    std::cout << "  filters             List the available filters\n\n";
    std::cout << "Extract options:\n";
    std::cout << "  --name=<name>           Repository name (required)\n";
    std::cout << "  --url=<url>             Repository URL (required)\n";
    std::cout << "  --pypi-tag=<tag>        Released version tag\n";
    std::cout << "  --commit=<hash>         Git commit hash\n";
    std::cout << "  --filters=<A,B,...>     Filter chain\n";
    std::cout << "                          (default: NoStringTypeFilter,EmptyFilter)\n";
    std::cout << "  --jobs=<n>, -j<n>       Worker threads (default: hardware concurrency)\n";
    std::cout << "  --timeout-ms=<ms>       Cancel extraction after the given time\n";
    std::cout << "  --output=<file>, -o     Dataset output file (default: stdout)\n";
    std::cout << "  --report=<file>         Run report file (default: <output>.report.json)\n";
    std::cout << "  --config=<file>         JSON run manifest; flags override its values\n\n";
    std::cout << "Filter and stats options:\n";
    std::cout << "  --filters=<A,B,...>     Filter chain to apply\n";
    std::cout << "  --output=<file>, -o     Output file (default: stdout)\n";
    std::cout << "  --json                  Print statistics as JSON\n\n";
    std::cout << "Logging options:\n";
    std::cout << "  --log-level=<level>     trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>     Per-module levels, e.g. extract=debug,*=warn\n";
    std::cout << "  --log-file=<file>       Also write log records to a file\n";
    std::cout << "  --log-format=text|json  Log record format\n";
    std::cout << "  -v, -vv, -vvv, -q       Shorthand log levels\n\n";
    std::cout << "  --help, -h              Show this help\n";
    std::cout << "  --version, -V           Show the version\n\n";
    std::cout << "The PYSTRUCT_LOG environment variable sets the log level or filter\n";
    std::cout << "when no logging option is given.\n";
}

void print_version() {
    std::cout << "pystruct " << VERSION << "\n";
}

} // namespace pystruct::cli

//! # CLI Command Dispatcher
//!
//! ```text
//! pystruct_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ extract        → run_extract()
//!   ├─ filter         → run_filter()
//!   ├─ stats          → run_stats()
//!   └─ filters        → run_list_filters()
//! ```
//!
//! Logging is configured from the whole command line (and `PYSTRUCT_LOG`)
//! before any command runs; commands skip the logging options.
//!
//! ## Return Codes
//!
//! | Code | Meaning |
//! |------|---------|
//! | 0 | Success, including runs where some files failed to parse |
//! | 1 | Configuration, I/O or dataset error |

#include "cli/commands.hpp"
#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "filter/registry.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace pystruct::cli {

int pystruct_main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 0;
    }

    log::Logger::init(log::parse_log_options(argc, argv));

    std::string command = argv[1];
    std::vector<std::string> args(argv + 2, argv + argc);

    if (command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return 0;
    }

    auto registry = filter::FilterRegistry::builtin();
    PYSTRUCT_LOG_DEBUG("cli", "Command '" << command << "' with " << args.size() << " arguments");

    int status = 1;
    if (command == "extract") {
        status = run_extract(args, registry);
    } else if (command == "filter") {
        status = run_filter(args, registry);
    } else if (command == "stats") {
        status = run_stats(args);
    } else if (command == "filters") {
        status = run_list_filters(registry);
    } else {
        std::cerr << "error: unknown command '" << command << "'\n";
        std::cerr << "Run 'pystruct --help' for usage.\n";
    }

    log::Logger::instance().flush();
    return status;
}

} // namespace pystruct::cli

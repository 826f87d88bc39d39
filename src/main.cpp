//! # pystruct Entry Point
//!
//! ```bash
//! pystruct extract ./requests --name=requests --url=https://github.com/psf/requests -o raw.json
//! pystruct filter raw.json --filters=TestModuleFilter,NoStringTypeFilter,EmptyFilter
//! pystruct stats raw.json
//! pystruct filters
//! ```
//!
//! All work happens in `cli::pystruct_main()` (`cli/dispatcher.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return pystruct::cli::pystruct_main(argc, argv);
}

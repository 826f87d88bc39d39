//! # Driver Interface
//!
//! `pystruct_main()` dispatches to the command handler named by argv[1].

#ifndef PYSTRUCT_CLI_DRIVER_HPP
#define PYSTRUCT_CLI_DRIVER_HPP

namespace pystruct::cli {

int pystruct_main(int argc, char* argv[]);

} // namespace pystruct::cli

#endif // PYSTRUCT_CLI_DRIVER_HPP

//! # conform Driver Interface
//!
//! `conform_main()` dispatches to the command handler named by argv[1].

#ifndef CONFORM_CLI_DRIVER_HPP
#define CONFORM_CLI_DRIVER_HPP

namespace conform::cli {

int conform_main(int argc, char* argv[]);

} // namespace conform::cli

#endif // CONFORM_CLI_DRIVER_HPP

//! # CLI Dispatcher
//!
//! Main entry point of the jstub CLI.
//!
//! ```text
//! jstub_main()
//!   ├─ logging options  → Logger::init()
//!   ├─ --help, -h       → print_usage()
//!   ├─ --version, -V    → print_version()
//!   └─ <prefix>...      → run_generate()
//! ```

#include "cmd_generate.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>

/// Runs the CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                                   |
/// |------|-----------------------------------------------------------|
/// | 0    | Success                                                   |
/// | 1    | Usage error, unreadable dump or fatal generation failure  |
int jstub_main(int argc, char* argv[]) {
    using namespace jstub::cli;

    jstub::log::Logger::init(jstub::log::parse_log_options(argc, argv));

    auto opts = parse_generate_args(argc, argv);
    if (opts.show_help) {
        print_usage();
        return 0;
    }
    if (opts.show_version) {
        print_version();
        return 0;
    }
    if (opts.prefixes.empty()) {
        std::cerr << "error: no package prefix given\n\n";
        print_usage();
        return 1;
    }

    int rc = run_generate(opts);
    jstub::log::Logger::instance().flush();
    return rc;
}

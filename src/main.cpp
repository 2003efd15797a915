//! # jstub Entry Point
//!
//! Delegates to the CLI driver.
//!
//! ## Usage
//!
//! ```bash
//! jstub --classpath=dumps/*.json --output-dir=typings java com.example
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return jstub_main(argc, argv);
}

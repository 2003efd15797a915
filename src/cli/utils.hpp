//! # CLI Utilities Interface
//!
//! This header defines shared utility functions for the CLI.
//!
//! ## Functions
//!
//! | Function              | Description                        |
//! |-----------------------|------------------------------------|
//! | `split_list()`        | Split a delimited option value     |
//! | `print_usage()`       | Print CLI help text                |
//! | `print_version()`     | Print tool version                 |

#pragma once
#include <string>
#include <vector>

namespace jstub::cli {

// Option values
std::vector<std::string> split_list(const std::string& value, char separator);

// Help text
void print_usage();
void print_version();

} // namespace jstub::cli

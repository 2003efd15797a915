//! # Generate Command Interface
//!
//! Parses the command line into generator options and runs a generation.

#pragma once
#include "stubgen/generator.hpp"

#include <string>
#include <vector>

namespace jstub::cli {

struct GenerateOptions {
    std::vector<std::string> prefixes;
    std::vector<std::string> classpath; ///< Unexpanded `--classpath` entries
    stubgen::GeneratorOptions generator;
    bool show_help = false;
    bool show_version = false;
};

// Parse command-line arguments; logging options are skipped
GenerateOptions parse_generate_args(int argc, char* argv[]);

// Glob-expand classpath entries; entries matching nothing are warned about
std::vector<std::string> expand_classpath(const std::vector<std::string>& entries);

// Load the dumps and generate stubs
// Returns 0 on success, 1 on unreadable dumps or fatal generation errors
int run_generate(const GenerateOptions& options);

} // namespace jstub::cli

//! # Stub Generator
//!
//! Entry point of the stub generator: walks the requested packages and
//! writes one `__init__.pyi` per package and package prefix.
//!
//! ## Pipeline
//!
//! ```text
//! roots -> walk_packages -> plan_stub_paths
//!       -> per package: PackageScheduler -> ClassEmitter -> PackageStub
//!       -> write_package_stub (+ interop modules for `java`)
//! ```
//!
//! ## Failure Policy
//!
//! | Failure | Effect |
//! |---------|--------|
//! | Root package cannot be listed | run aborts with `GenerateError` |
//! | Stub file cannot be written | run aborts with `GenerateError` |
//! | Class or nested class fails to load | logged, skipped, counted in `failures` |
//! | Referenced class cannot be resolved | empty placeholder, counted in `placeholders` |

#ifndef JSTUB_STUBGEN_GENERATOR_HPP
#define JSTUB_STUBGEN_GENERATOR_HPP

#include "common.hpp"
#include "reflect/provider.hpp"
#include "stubgen/emission_state.hpp"
#include "stubgen/generate_error.hpp"
#include "stubgen/output_writer.hpp"
#include "stubgen/type_translator.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace jstub::stubgen {

struct GeneratorOptions {
    std::filesystem::path output_dir = ".";
    /// Emit Javadoc as docstrings.
    bool include_javadoc = true;
    /// Suffix the top-level package directory with `-stubs`.
    bool use_stubs_suffix = true;
};

struct GenerationSummary {
    size_t packages_written = 0;
    size_t classes_emitted = 0;
    size_t placeholders = 0;
    size_t failures = 0;
};

/// Builds the stub of one package in memory. `class_names` are the binary
/// names of the package's top-level classes, `subpackages` the simple
/// names of its child packages.
[[nodiscard]] auto generate_package_stub(const reflect::ReflectionProvider& provider,
                                         const TypeTranslator& translator,
                                         const std::string& package,
                                         const std::vector<std::string>& class_names,
                                         const std::set<std::string>& subpackages,
                                         bool include_javadoc, EmissionState& state)
    -> PackageStub;

/// Generates stubs for every root package and all of its descendants.
auto generate_java_stubs(const reflect::ReflectionProvider& provider,
                         const std::vector<std::string>& roots, const GeneratorOptions& options)
    -> Result<GenerationSummary, GenerateError>;

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_GENERATOR_HPP

//! # Output Writer
//!
//! Assembles and writes one package stub file:
//!
//! ```python
//! import java.lang          # sorted, unique import lines
//! import typing
//!
//!
//! class Foo(java.lang.Object): ...
//! ```
//!
//! Every line, the last included, ends with `\n`.

#ifndef JSTUB_STUBGEN_OUTPUT_WRITER_HPP
#define JSTUB_STUBGEN_OUTPUT_WRITER_HPP

#include "common.hpp"
#include "stubgen/generate_error.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace jstub::stubgen {

/// In-memory contents of one `__init__.pyi`.
struct PackageStub {
    std::string package;
    std::set<std::string> imports;
    std::vector<std::string> lines;
};

[[nodiscard]] auto render_package_stub(const PackageStub& stub) -> std::string;

/// Writes `text` to `path`, creating missing parent directories.
auto write_text_file(const std::filesystem::path& path, const std::string& text)
    -> Result<bool, GenerateError>;

inline auto write_package_stub(const std::filesystem::path& path, const PackageStub& stub)
    -> Result<bool, GenerateError> {
    return write_text_file(path, render_package_stub(stub));
}

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_OUTPUT_WRITER_HPP

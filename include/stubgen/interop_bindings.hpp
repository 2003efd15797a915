//! # Interop Bindings
//!
//! The `java` package stub re-exports the interop layer's API, and two
//! fixed modules describing that API are written beside it:
//!
//! | File | Declares |
//! |------|----------|
//! | `java/chaquopy.pyi` | `cast`, `jclass`, `jarray`, proxies, `JavaArray` and its primitive specializations |
//! | `java/primitive.pyi` | `jboolean` ... `jchar` wrappers |
//!
//! The translator refers to `java.jint`, `java.chaquopy.JavaArrayJInt` and
//! friends, so these names must resolve even though no Java class defines
//! them.

#ifndef JSTUB_STUBGEN_INTEROP_BINDINGS_HPP
#define JSTUB_STUBGEN_INTEROP_BINDINGS_HPP

#include "common.hpp"
#include "stubgen/generate_error.hpp"
#include "stubgen/output_writer.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace jstub::stubgen {

/// Names the `java` package re-exports, in `__all__` order.
[[nodiscard]] auto interop_names() -> const std::vector<std::string>&;

/// Adds the re-export imports and the `__all__` list to the `java` stub.
void add_interop_bindings(PackageStub& stub);

[[nodiscard]] auto chaquopy_module_text() -> const std::string&;
[[nodiscard]] auto primitive_module_text() -> const std::string&;

/// Writes `chaquopy.pyi` and `primitive.pyi` into `java_dir`.
auto write_interop_modules(const std::filesystem::path& java_dir) -> Result<bool, GenerateError>;

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_INTEROP_BINDINGS_HPP

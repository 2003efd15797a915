//! # Identifier Policy
//!
//! Maps Java identifiers to names that are legal in stub files.
//!
//! | Java name | Result |
//! |-----------|--------|
//! | `lambda`, `print` | `lambda_`, `print_` (reserved word, suffixed) |
//! | `__eq__` | rejected; the member is dropped |
//! | `getName` | unchanged |
//!
//! Package paths are mangled segment by segment (`org.python.core` stays,
//! `com.example.from` becomes `com.example.from_`).

#ifndef JSTUB_STUBGEN_IDENTIFIERS_HPP
#define JSTUB_STUBGEN_IDENTIFIERS_HPP

#include "reflect/java_type.hpp"
#include "stubgen/type_expr.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jstub::stubgen {

/// Hard keywords of the target language plus `exec` and `print`.
[[nodiscard]] auto is_reserved_word(std::string_view word) -> bool;

/// Returns a safe identifier for `name`, or nullopt when the name is
/// dunder-shaped (`__x__`) and must not be emitted at all.
[[nodiscard]] auto pysafe(std::string_view name) -> std::optional<std::string>;

/// Applies `pysafe` to every segment of a dotted path; rejected segments
/// become empty.
[[nodiscard]] auto pysafe_package_path(std::string_view path) -> std::string;

/// `[A-Za-z_][A-Za-z0-9_]*`.
[[nodiscard]] auto is_valid_identifier(std::string_view name) -> bool;

/// Derives an argument name from its type when reflection does not
/// provide one: `StringBuilder` -> `stringBuilder`, `int[]` -> `intArray`,
/// repeated types get a counter starting at 2 (`string`, `string2`).
[[nodiscard]] auto infer_arg_name(const reflect::JavaTypeRef& type,
                                  const std::vector<ArgumentSig>& previous) -> std::string;

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_IDENTIFIERS_HPP

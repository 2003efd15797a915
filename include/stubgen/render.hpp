//! # Stub Text Rendering
//!
//! Turns `TypeExpr` trees, type variables and documentation into stub
//! source text, recording imports and referenced classes as a side effect.
//!
//! ## Name Resolution
//!
//! | Referenced name | Rendered as | Import recorded |
//! |-----------------|-------------|-----------------|
//! | `builtins.Exception` | `Exception` | - |
//! | same package, emitted or deferrable | `Local` | - |
//! | same package, not emitted, not deferrable | `pkg.Local` | `import <top-level>` |
//! | other package | `other.pkg.Name` | `import other.pkg` |
//!
//! Supertype lists are evaluated when the class statement runs, so they
//! cannot be deferred; annotations can.

#ifndef JSTUB_STUBGEN_RENDER_HPP
#define JSTUB_STUBGEN_RENDER_HPP

#include "reflect/provider.hpp"
#include "stubgen/emission_state.hpp"
#include "stubgen/type_expr.hpp"

#include <string>
#include <vector>

namespace jstub::stubgen {

/// Renders a type annotation for use inside `package`.
[[nodiscard]] auto render_type(const TypeExpr& type, const std::string& package,
                               EmissionState& state, bool deferrable = true) -> std::string;

/// `_Box__T = typing.TypeVar('_Box__T', bound=java.lang.Number)  # <T>`
[[nodiscard]] auto render_type_var_declaration(const TypeVariable& var, const std::string& package,
                                               EmissionState& state) -> std::string;

/// Replaces the HTML escapes and invisible spaces Javadoc leaves behind.
[[nodiscard]] auto sanitize_javadoc_html(const std::string& html) -> std::string;

/// Triple-quoted docstring lines for `doc`, indented by four spaces when
/// `indent` is set. Empty documentation yields no lines.
[[nodiscard]] auto docstring_lines(const std::string& doc, bool indent = true)
    -> std::vector<std::string>;

/// Sanitized documentation for `cls`, or an empty `ClassDoc` when
/// documentation is disabled or unavailable.
[[nodiscard]] auto extract_class_doc(const reflect::ReflectionProvider& provider,
                                     const reflect::ClassInfo& cls, bool include_javadoc)
    -> ClassDoc;

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_RENDER_HPP

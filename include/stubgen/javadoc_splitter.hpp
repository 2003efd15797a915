//! # Javadoc Overload Splitter
//!
//! Javadoc extraction yields one text blob per method name, holding the
//! documentation of every overload one after another, each introduced by a
//! rendered signature line:
//!
//! ```text
//! public static int max(int a, int b)
//!
//! Returns the greater of two int values.
//! public static long max(long a, long b)
//!
//! Returns the greater of two long values.
//! ```
//!
//! `split_overload_docs` assigns the lines to overloads by matching each
//! line against a per-overload header pattern (modifiers, type parameter
//! count, any return type, the name and the argument count). A matched
//! header switches the current overload; the line after it is a separator
//! and is dropped. When several overloads share a pattern, the argument
//! types written in the header decide. Lines before the first header, and
//! lines after a header no overload claims, are dropped.
//!
//! This is a heuristic and never fails: the worst outcome is missing
//! documentation.

#ifndef JSTUB_STUBGEN_JAVADOC_SPLITTER_HPP
#define JSTUB_STUBGEN_JAVADOC_SPLITTER_HPP

#include "stubgen/type_expr.hpp"

#include <string>
#include <vector>

namespace jstub::stubgen {

/// Splits `doc` across `signatures`; the result has one entry per
/// signature, in the same order. `header_name` overrides the name matched
/// in headers (constructors are documented under the class name).
[[nodiscard]] auto split_overload_docs(const std::vector<FunctionSig>& signatures,
                                       const std::string& doc, const std::string& header_name = "")
    -> std::vector<std::string>;

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_JAVADOC_SPLITTER_HPP

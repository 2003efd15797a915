//! # Stub Type Expressions
//!
//! Value types produced by the type translator and consumed by the class
//! emitter. A `TypeExpr` is a target-language type before rendering: names
//! are still fully qualified Java-style names (`java.util.Map$Entry`) and
//! only become stub text in `render.hpp`.
//!
//! ## Examples
//!
//! | Java type (argument position) | `TypeExpr` |
//! |-------------------------------|------------|
//! | `int` | `typing.Union[int, java.jint, java.lang.Integer]` |
//! | `List<String>` | `java.util.List[typing.Union[str, java.lang.String]]` |
//! | `byte[]` | `java.chaquopy.JavaArrayJByte` |
//!
//! An empty `name` with arguments renders as a bare bracket list
//! (`[A, B]`), which is how callable parameter lists are represented.

#ifndef JSTUB_STUBGEN_TYPE_EXPR_HPP
#define JSTUB_STUBGEN_TYPE_EXPR_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jstub::stubgen {

/// A target type expression tree.
struct TypeExpr {
    std::string name;
    std::vector<TypeExpr> type_args;

    TypeExpr() = default;
    explicit TypeExpr(std::string name) : name(std::move(name)) {}
    TypeExpr(std::string name, std::vector<TypeExpr> args)
        : name(std::move(name)), type_args(std::move(args)) {}

    auto operator==(const TypeExpr& other) const -> bool {
        return name == other.name && type_args == other.type_args;
    }

    /// Debug rendering without import bookkeeping: `Name[A, B]`.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// A declared type variable and the target name generated for it.
struct TypeVariable {
    std::string source_name;    ///< Java name (`T`)
    std::string generated_name; ///< Scoped target name (`_Box__T`)
    std::optional<TypeExpr> bound;
};

/// One argument of a generated function signature.
struct ArgumentSig {
    std::string name;
    std::optional<TypeExpr> type; ///< Absent only for the `self` receiver
    bool variadic = false;
};

/// One overload of a generated function.
struct FunctionSig {
    std::string name; ///< Java method name, or `__init__` for constructors
    bool is_static = false;
    std::vector<ArgumentSig> args;
    TypeExpr return_type;
    std::vector<TypeVariable> type_vars;
    /// Erased simple Java type of each non-receiver argument (`int`,
    /// `String`, `List[]`), used to tell same-arity overloads apart in
    /// documentation headers.
    std::vector<std::string> source_arg_types;
};

/// Sanitized documentation for one class.
struct ClassDoc {
    std::string description;
    std::string constructors;
    std::map<std::string, std::string> methods;
    std::map<std::string, std::string> fields;
};

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_TYPE_EXPR_HPP

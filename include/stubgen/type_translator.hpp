//! # Type Translator
//!
//! Converts reflected Java types into `TypeExpr` trees.
//!
//! ## Position Semantics
//!
//! | Java | Return / field | Argument | Array element |
//! |------|----------------|----------|---------------|
//! | `int`, `Integer` | `int` | `Union[int, java.jint, java.lang.Integer]` | `java.jint` |
//! | `String` | `str` | `Union[str, java.lang.String]` | `java.lang.String` |
//! | `Object` | `java.lang.Object` | `Union[java.lang.Object, int, bool, float, str]` | `java.lang.Object` |
//! | `Class<T>` | `typing.Type[T]` | `typing.Type[T]` | `typing.Type[T]` |
//! | `int[]` | `java.chaquopy.JavaArrayJInt` | same | - |
//! | `Foo[]` | `java.chaquopy.JavaArray[Foo]` | same | - |
//!
//! Argument-position unions mirror the conversions the interop layer
//! performs implicitly when Python values are passed to Java.
//!
//! ## Type Variables
//!
//! A variable resolves to the generated name of the innermost in-scope
//! `TypeVariable` with the same Java name (method, then class, then
//! enclosing class). Out-of-scope variables fall back to their first bound,
//! with parameterized bounds reduced to their raw type.
//!
//! ## Functional Interfaces
//!
//! With a provider attached, an argument whose type is a functional
//! interface becomes `typing.Union[Iface[...], typing.Callable[[...], R]]`,
//! since the interop layer turns Python callables into proxies there.

#ifndef JSTUB_STUBGEN_TYPE_TRANSLATOR_HPP
#define JSTUB_STUBGEN_TYPE_TRANSLATOR_HPP

#include "reflect/provider.hpp"
#include "stubgen/type_expr.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jstub::stubgen {

/// One row of the primitive table.
struct PrimitiveMapping {
    const char* java_primitive; ///< `int`
    const char* java_boxed;     ///< `java.lang.Integer`
    const char* wrapper;        ///< `java.jint`
    const char* plain;          ///< `int`
};

/// The nine Java primitives (void included), in declaration order.
[[nodiscard]] auto primitive_mappings() -> const std::vector<PrimitiveMapping>&;

/// Primitive row for a primitive or boxed type name, or nullptr.
[[nodiscard]] auto find_primitive(const std::string& type_name) -> const PrimitiveMapping*;

/// Specialized array type for a primitive wrapper (`java.jint` ->
/// `java.chaquopy.JavaArrayJInt`), or nullptr.
[[nodiscard]] auto specialized_array_type(const std::string& wrapper) -> const char*;

/// Applies the fixed name mappings (primitives, String, Class, Object) to
/// a class name with already translated arguments.
[[nodiscard]] auto translate_type_name(const std::string& type_name, std::vector<TypeExpr> type_args,
                                       bool is_argument, bool is_array_element) -> TypeExpr;

class TypeTranslator {
public:
    /// `provider` enables functional-interface detection; may be null.
    explicit TypeTranslator(const reflect::ReflectionProvider* provider = nullptr)
        : provider_(provider) {}

    /// Translates a Java type. A null type (constructor return) is `None`.
    [[nodiscard]] auto translate(const reflect::JavaTypeRef& type,
                                 const std::vector<TypeVariable>& scope, bool is_argument = false,
                                 bool is_array_element = false) const -> TypeExpr;

    /// Builds the scoped declaration for a type parameter:
    /// `T extends Comparable<T>` in scope `Box` -> `_Box__T` bound to
    /// `java.lang.Comparable`. Bounds of `Object` are dropped.
    [[nodiscard]] auto make_type_variable(const reflect::TypeParameter& param,
                                          const std::string& scope_id) const -> TypeVariable;

    /// The callable form of a functional interface, with the interface's
    /// type parameters substituted positionally from `type_args` (left to
    /// their bounds when no arguments are given). nullopt when the class is
    /// not a functional interface or cannot be loaded.
    [[nodiscard]] auto functional_callable(const std::string& class_name,
                                           const std::vector<TypeExpr>& type_args) const
        -> std::optional<TypeExpr>;

private:
    struct FunctionalMethod {
        reflect::ClassRef cls;
        const reflect::MethodInfo* method = nullptr;
    };

    auto translate_impl(const reflect::JavaTypeRef& type, const std::vector<TypeVariable>& scope,
                        bool is_argument, bool is_array_element, int depth) const -> TypeExpr;

    auto with_callable(TypeExpr base, const reflect::JavaType& type,
                       const std::vector<TypeVariable>& scope, int depth) const -> TypeExpr;

    auto find_functional_method(const std::string& class_name) const
        -> std::optional<FunctionalMethod>;

    const reflect::ReflectionProvider* provider_;
    mutable std::map<std::string, std::optional<FunctionalMethod>> functional_cache_;
};

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_TYPE_TRANSLATOR_HPP

//! # Class Emitter
//!
//! Writes the stub declaration of one class, its nested classes included.
//!
//! ## Output Shape
//!
//! ```python
//!
//! _Box__T = typing.TypeVar('_Box__T', bound=java.lang.Number)  # <T>
//! class Box(java.lang.Object, typing.Generic[_Box__T]):
//!     """Class description."""
//!     def __init__(self, t: _Box__T) -> None: ...
//!     def get(self) -> _Box__T: ...
//!     SIZE: typing.ClassVar[int] = ...
//!     class Entry(java.lang.Object): ...
//! ```
//!
//! Body order is constructors, methods (grouped by name), fields, nested
//! classes. Type variables of a class and all of its nested classes are
//! declared together before the top-level class statement; method type
//! variables are declared inside the class body, ahead of the overloads
//! that use them.
//!
//! ## Type Variable Scopes
//!
//! | Declaration | Scope id | Generated name |
//! |-------------|----------|----------------|
//! | `class Outer$Inner<T>` | `Outer__Inner` | `_Outer__Inner__T` |
//! | `<T> T get()` | `get` | `_get__T` |
//! | 2nd overload of `of` | `of_1` | `_of_1__T` |
//!
//! A non-static nested class also sees its enclosing class's variables;
//! static methods and static nested classes do not.

#ifndef JSTUB_STUBGEN_CLASS_EMITTER_HPP
#define JSTUB_STUBGEN_CLASS_EMITTER_HPP

#include "reflect/provider.hpp"
#include "stubgen/emission_state.hpp"
#include "stubgen/type_translator.hpp"

#include <string>
#include <vector>

namespace jstub::stubgen {

class ClassEmitter {
public:
    ClassEmitter(const reflect::ReflectionProvider& provider, const TypeTranslator& translator,
                 std::string package, bool include_javadoc, EmissionState& state);

    /// Appends a blank line, the type variable declarations and the
    /// declaration of a top-level class, then marks it emitted.
    void emit_top_level(const reflect::ClassInfo& cls, std::vector<std::string>& out);

    /// Appends `class Name: ...` for an unresolvable class and marks
    /// `local_name` emitted. `local_name` may be nested (`Outer$Hidden`).
    void emit_placeholder(const std::string& local_name, std::vector<std::string>& out);

    [[nodiscard]] auto package() const -> const std::string& {
        return package_;
    }

    /// Scope identifier of a class: local binary name with `.` -> `_`
    /// and `$` -> `__`.
    [[nodiscard]] static auto class_scope_id(const reflect::ClassInfo& cls) -> std::string;

    /// Erased simple Java name of a type as Javadoc writes it
    /// (`List`, `T`, `int[]`).
    [[nodiscard]] static auto source_type_name(const reflect::JavaTypeRef& type) -> std::string;

private:
    void emit_class(const reflect::ClassInfo& cls, std::vector<std::string>& out,
                    std::vector<std::string>& type_var_out,
                    const std::vector<TypeVariable>* enclosing_scope);

    void emit_functions(const std::string& python_name, const std::string& java_name,
                        const std::vector<const reflect::MethodInfo*>& overloads,
                        const std::string& doc, const std::string& header_name,
                        const std::vector<TypeVariable>& class_scope,
                        std::vector<std::string>& out);

    void emit_field(const reflect::FieldInfo& field, const ClassDoc& doc,
                    const std::vector<TypeVariable>& class_scope, std::vector<std::string>& out);

    void emit_nested_classes(const reflect::ClassInfo& cls,
                             const std::vector<TypeVariable>& scope,
                             std::vector<std::string>& out,
                             std::vector<std::string>& type_var_out);

    void repair_nested_references(const reflect::ClassInfo& cls,
                                  const std::vector<TypeVariable>& scope,
                                  std::vector<std::string>& out,
                                  std::vector<std::string>& type_var_out);

    auto super_types(const reflect::ClassInfo& cls, const std::vector<TypeVariable>& scope,
                     const std::vector<TypeVariable>& own_vars) -> std::vector<std::string>;

    const reflect::ReflectionProvider& provider_;
    const TypeTranslator& translator_;
    std::string package_;
    bool include_javadoc_;
    EmissionState& state_;
};

/// True for classes that get a declaration of their own: not anonymous,
/// not local and not synthetic.
[[nodiscard]] auto is_declarable_class(const reflect::ClassInfo& cls) -> bool;

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_CLASS_EMITTER_HPP

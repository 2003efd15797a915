//! # Java Reflection Model
//!
//! Immutable value types describing what Java reflection reports about a
//! class: its generic type tree, members, modifiers and documentation.
//! These mirror `java.lang.reflect` closely enough that the stub generator
//! can be written against them without a running JVM.
//!
//! ## Type Tree
//!
//! | Java reflection type | `JavaTypeKind` | `name` | `args` |
//! |----------------------|----------------|--------|--------|
//! | `Class` (incl. primitives) | `Class` | binary name (`java.util.Map$Entry`, `int`) | - |
//! | `ParameterizedType` | `Parameterized` | raw type binary name | actual type arguments |
//! | `TypeVariable` | `TypeVariable` | variable name (`T`) | - (see `declaration`) |
//! | `WildcardType` | `Wildcard` | `?` | upper bounds (`lower_bounds` separately) |
//! | `GenericArrayType` / array class | `Array` | - | `[component]` |
//!
//! Type variables point back at their declaring `TypeParameter` through a
//! weak reference, so self-referential bounds such as `E extends Enum<E>`
//! do not form ownership cycles.

#ifndef JSTUB_REFLECT_JAVA_TYPE_HPP
#define JSTUB_REFLECT_JAVA_TYPE_HPP

#include "common.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jstub::reflect {

// ============================================================================
// Modifiers
// ============================================================================

/// Bits of `java.lang.reflect.Modifier`.
namespace modifier {
constexpr uint32_t PUBLIC = 0x0001;
constexpr uint32_t PRIVATE = 0x0002;
constexpr uint32_t PROTECTED = 0x0004;
constexpr uint32_t STATIC = 0x0008;
constexpr uint32_t FINAL = 0x0010;
constexpr uint32_t SYNCHRONIZED = 0x0020;
constexpr uint32_t VOLATILE = 0x0040;
constexpr uint32_t TRANSIENT = 0x0080;
constexpr uint32_t NATIVE = 0x0100;
constexpr uint32_t INTERFACE = 0x0200;
constexpr uint32_t ABSTRACT = 0x0400;
constexpr uint32_t STRICT = 0x0800;

/// Renders modifiers the way `Modifier.toString` does ("public static final").
[[nodiscard]] auto to_string(uint32_t modifiers) -> std::string;
} // namespace modifier

// ============================================================================
// Generic Type Tree
// ============================================================================

enum class JavaTypeKind {
    Class,
    Parameterized,
    TypeVariable,
    Wildcard,
    Array,
};

struct JavaType;
struct TypeParameter;

using JavaTypeRef = Rc<const JavaType>;

/// One node of a reflected generic type.
struct JavaType {
    JavaTypeKind kind = JavaTypeKind::Class;
    std::string name;
    std::vector<JavaTypeRef> args;
    std::vector<JavaTypeRef> lower_bounds;
    std::weak_ptr<const TypeParameter> declaration;

    [[nodiscard]] static auto make_class(std::string name) -> JavaTypeRef;
    [[nodiscard]] static auto make_parameterized(std::string raw, std::vector<JavaTypeRef> args)
        -> JavaTypeRef;
    [[nodiscard]] static auto make_array(JavaTypeRef component) -> JavaTypeRef;
    [[nodiscard]] static auto make_wildcard(std::vector<JavaTypeRef> upper,
                                            std::vector<JavaTypeRef> lower) -> JavaTypeRef;
    [[nodiscard]] static auto make_type_variable(std::string name,
                                                 std::weak_ptr<const TypeParameter> decl)
        -> JavaTypeRef;

    [[nodiscard]] auto is_array() const -> bool {
        return kind == JavaTypeKind::Array;
    }

    /// Component type of an array; nullptr for any other kind.
    [[nodiscard]] auto component() const -> JavaTypeRef {
        return is_array() && !args.empty() ? args.front() : nullptr;
    }

    /// Declared bounds of a type variable, or an empty list when the
    /// declaration is unknown.
    [[nodiscard]] auto variable_bounds() const -> std::vector<JavaTypeRef>;

    /// Equivalent of `Type.getTypeName()`:
    /// `java.util.List<java.lang.String>`, `int[]`, `T`, `? extends Foo`.
    [[nodiscard]] auto type_name() const -> std::string;

    /// Binary name of the erasure (`java.util.List`, `int[]`, `java.lang.Object`).
    [[nodiscard]] auto erasure() const -> std::string;
};

/// A declared type parameter (`T extends Comparable<T>`).
struct TypeParameter {
    std::string name;
    /// Declared bounds; `java.lang.Object` when none were written.
    std::vector<JavaTypeRef> bounds;
};

using TypeParameterRef = Rc<const TypeParameter>;

// ============================================================================
// Members
// ============================================================================

/// A formal parameter of a method or constructor.
struct ParameterInfo {
    /// Reflected name; only present when the class was compiled with `-parameters`.
    std::optional<std::string> name;
    JavaTypeRef type;
};

/// A method or constructor.
struct MethodInfo {
    std::string name; ///< `<init>` for constructors
    std::string declaring_class;
    uint32_t modifiers = 0;
    std::vector<TypeParameterRef> type_parameters;
    std::vector<ParameterInfo> parameters;
    JavaTypeRef return_type; ///< nullptr for constructors
    std::vector<JavaTypeRef> exceptions;
    bool varargs = false;
    bool synthetic = false;
    bool bridge = false;

    [[nodiscard]] auto is_public() const -> bool {
        return (modifiers & modifier::PUBLIC) != 0;
    }
    [[nodiscard]] auto is_static() const -> bool {
        return (modifiers & modifier::STATIC) != 0;
    }
    [[nodiscard]] auto is_abstract() const -> bool {
        return (modifiers & modifier::ABSTRACT) != 0;
    }
    [[nodiscard]] auto is_constructor() const -> bool {
        return return_type == nullptr;
    }

    /// Equivalent of `Method.toString()` / `Constructor.toString()`, used as
    /// a stable sort key for overloads:
    /// `public static void java.util.Collections.sort(java.util.List)`.
    [[nodiscard]] auto to_string() const -> std::string;
};

/// A field.
struct FieldInfo {
    std::string name;
    uint32_t modifiers = 0;
    JavaTypeRef type;

    [[nodiscard]] auto is_public() const -> bool {
        return (modifiers & modifier::PUBLIC) != 0;
    }
    [[nodiscard]] auto is_static() const -> bool {
        return (modifiers & modifier::STATIC) != 0;
    }
};

/// Raw documentation extracted from Javadoc, keyed by Java member name.
struct JavadocInfo {
    std::string description;
    std::string constructors;
    std::map<std::string, std::string> methods;
    std::map<std::string, std::string> fields;
};

// ============================================================================
// Classes
// ============================================================================

/// Everything reflection reports about one class or interface.
struct ClassInfo {
    std::string name; ///< Binary name, e.g. `java.util.Map$Entry`
    uint32_t modifiers = 0;
    bool is_interface = false;
    bool is_anonymous = false;
    bool is_local = false;
    bool is_synthetic = false;

    std::vector<TypeParameterRef> type_parameters;
    /// `getGenericSuperclass()`; absent for interfaces and `java.lang.Object`.
    std::optional<JavaTypeRef> generic_superclass;
    std::vector<JavaTypeRef> generic_interfaces;

    /// `getConstructors()`: public constructors.
    std::vector<MethodInfo> constructors;
    /// `getMethods()`: public methods including inherited ones.
    std::vector<MethodInfo> methods;
    /// `getDeclaredMethods()`: every method declared by this class.
    std::vector<MethodInfo> declared_methods;
    /// `getDeclaredFields()`.
    std::vector<FieldInfo> declared_fields;
    /// Binary names of `getDeclaredClasses()`.
    std::vector<std::string> member_classes;

    std::optional<JavadocInfo> javadoc;

    [[nodiscard]] auto is_public() const -> bool {
        return (modifiers & modifier::PUBLIC) != 0;
    }
    [[nodiscard]] auto is_static() const -> bool {
        return (modifiers & modifier::STATIC) != 0;
    }

    /// Package part of the binary name (`java.util` for `java.util.Map$Entry`).
    [[nodiscard]] auto package_name() const -> std::string;

    /// Binary name without the package (`Map$Entry`).
    [[nodiscard]] auto local_name() const -> std::string;

    /// `getSimpleName()`: the innermost name (`Entry`).
    [[nodiscard]] auto simple_name() const -> std::string;

    /// Binary name of the enclosing class, or empty for top-level classes.
    [[nodiscard]] auto enclosing_class() const -> std::string;
};

using ClassRef = Rc<const ClassInfo>;

/// Splits a binary class name into package and local part at the last '.'.
[[nodiscard]] auto split_package(const std::string& binary_name)
    -> std::pair<std::string, std::string>;

} // namespace jstub::reflect

#endif // JSTUB_REFLECT_JAVA_TYPE_HPP

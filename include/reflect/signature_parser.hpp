//! # JVM Generic Signature Parser
//!
//! Parses the `Signature` attribute grammar of the JVM specification
//! (JVMS 4.7.9.1) into `JavaType` trees. Plain descriptors such as
//! `(ILjava/lang/String;)V` are a subset of the grammar and parse too.
//!
//! ## Grammar Summary
//!
//! | Form | Example |
//! |------|---------|
//! | Class signature | `<T:Ljava/lang/Object;>Ljava/lang/Object;Ljava/lang/Comparable<TT;>;` |
//! | Method signature | `<K:Ljava/lang/Object;>(TK;[I)Ljava/util/List<+TK;>;^Ljava/io/IOException;` |
//! | Field signature | `Ljava/util/Map<Ljava/lang/String;*>.Entry<TK;TV;>;` |
//!
//! ## Type Variable Binding
//!
//! Type variable references (`TT;`) are bound while parsing, by name, to
//! the innermost `TypeScope` declaring them: method, then class, then the
//! non-static enclosing classes. Forward references inside one formal
//! parameter list (`<A:TB;B:Ljava/lang/Object;>`) are supported. A name no
//! scope declares yields an unbound variable whose bound is unknown.

#ifndef JSTUB_REFLECT_SIGNATURE_PARSER_HPP
#define JSTUB_REFLECT_SIGNATURE_PARSER_HPP

#include "common.hpp"
#include "reflect/java_type.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace jstub::reflect {

/// A signature that does not follow the grammar.
struct SignatureError {
    std::string message;
    size_t offset = 0;

    [[nodiscard]] auto to_string() const -> std::string {
        return "offset " + std::to_string(offset) + ": " + message;
    }
};

/// Type parameters declared by one generic declaration, chained to the
/// enclosing declaration's scope.
class TypeScope {
public:
    explicit TypeScope(const TypeScope* parent = nullptr) : parent_(parent) {}

    void set_parent(const TypeScope* parent) {
        parent_ = parent;
    }

    /// Declares a parameter, or returns the existing one of that name.
    auto declare(const std::string& name) -> Rc<TypeParameter>;

    /// Innermost parameter with this name, searching enclosing scopes.
    [[nodiscard]] auto lookup(std::string_view name) const -> Rc<TypeParameter>;

    [[nodiscard]] auto parameters() const -> const std::vector<Rc<TypeParameter>>& {
        return params_;
    }

private:
    const TypeScope* parent_;
    std::vector<Rc<TypeParameter>> params_;
};

struct ClassSignature {
    std::vector<TypeParameterRef> type_parameters;
    JavaTypeRef superclass;
    std::vector<JavaTypeRef> interfaces;
};

struct MethodSignature {
    std::vector<TypeParameterRef> type_parameters;
    std::vector<JavaTypeRef> parameters;
    JavaTypeRef return_type; ///< `void` is the class type named "void"
    std::vector<JavaTypeRef> exceptions;
};

/// Parses a class signature, declaring its type parameters into `scope`.
[[nodiscard]] auto parse_class_signature(std::string_view signature, TypeScope& scope)
    -> Result<ClassSignature, SignatureError>;

/// Parses a method or constructor signature. The method's own type
/// parameters get a fresh scope nested in `enclosing` (may be null).
[[nodiscard]] auto parse_method_signature(std::string_view signature, const TypeScope* enclosing)
    -> Result<MethodSignature, SignatureError>;

/// Parses a single field type signature (or descriptor).
[[nodiscard]] auto parse_field_signature(std::string_view signature, const TypeScope* scope)
    -> Result<JavaTypeRef, SignatureError>;

/// Maps a primitive descriptor character (`I`, `Z`, `V`, ...) to its Java
/// name; returns nullptr for other characters.
[[nodiscard]] auto primitive_name(char descriptor) -> const char*;

} // namespace jstub::reflect

#endif // JSTUB_REFLECT_SIGNATURE_PARSER_HPP

//! # Java Reflection Model Implementation
//!
//! Type-name rendering and erasure, following what `java.lang.reflect`
//! prints for the same types.

#include "reflect/java_type.hpp"

#include <sstream>

namespace jstub::reflect {

// ============================================================================
// Modifiers
// ============================================================================

auto modifier::to_string(uint32_t modifiers) -> std::string {
    // Same order as java.lang.reflect.Modifier.toString
    static const std::pair<uint32_t, const char*> ORDER[] = {
        {PUBLIC, "public"},       {PROTECTED, "protected"},
        {PRIVATE, "private"},     {ABSTRACT, "abstract"},
        {STATIC, "static"},       {FINAL, "final"},
        {TRANSIENT, "transient"}, {VOLATILE, "volatile"},
        {SYNCHRONIZED, "synchronized"}, {NATIVE, "native"},
        {STRICT, "strictfp"},     {INTERFACE, "interface"},
    };

    std::string out;
    for (const auto& [bit, word] : ORDER) {
        if ((modifiers & bit) != 0) {
            if (!out.empty()) {
                out += ' ';
            }
            out += word;
        }
    }
    return out;
}

// ============================================================================
// JavaType
// ============================================================================

auto JavaType::make_class(std::string name) -> JavaTypeRef {
    auto type = make_rc<JavaType>();
    type->kind = JavaTypeKind::Class;
    type->name = std::move(name);
    return type;
}

auto JavaType::make_parameterized(std::string raw, std::vector<JavaTypeRef> args) -> JavaTypeRef {
    auto type = make_rc<JavaType>();
    type->kind = JavaTypeKind::Parameterized;
    type->name = std::move(raw);
    type->args = std::move(args);
    return type;
}

auto JavaType::make_array(JavaTypeRef component) -> JavaTypeRef {
    auto type = make_rc<JavaType>();
    type->kind = JavaTypeKind::Array;
    type->args.push_back(std::move(component));
    return type;
}

auto JavaType::make_wildcard(std::vector<JavaTypeRef> upper, std::vector<JavaTypeRef> lower)
    -> JavaTypeRef {
    auto type = make_rc<JavaType>();
    type->kind = JavaTypeKind::Wildcard;
    type->name = "?";
    if (upper.empty()) {
        upper.push_back(make_class("java.lang.Object"));
    }
    type->args = std::move(upper);
    type->lower_bounds = std::move(lower);
    return type;
}

auto JavaType::make_type_variable(std::string name, std::weak_ptr<const TypeParameter> decl)
    -> JavaTypeRef {
    auto type = make_rc<JavaType>();
    type->kind = JavaTypeKind::TypeVariable;
    type->name = std::move(name);
    type->declaration = std::move(decl);
    return type;
}

auto JavaType::variable_bounds() const -> std::vector<JavaTypeRef> {
    if (auto decl = declaration.lock()) {
        return decl->bounds;
    }
    return {};
}

static auto join_type_names(const std::vector<JavaTypeRef>& types, const char* sep)
    -> std::string {
    std::string out;
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += types[i]->type_name();
    }
    return out;
}

auto JavaType::type_name() const -> std::string {
    switch (kind) {
    case JavaTypeKind::Class:
    case JavaTypeKind::TypeVariable:
        return name;
    case JavaTypeKind::Parameterized:
        if (args.empty()) {
            return name;
        }
        return name + "<" + join_type_names(args, ", ") + ">";
    case JavaTypeKind::Wildcard:
        if (!lower_bounds.empty()) {
            return "? super " + join_type_names(lower_bounds, " & ");
        }
        if (args.empty() || args.front()->erasure() == "java.lang.Object") {
            return "?";
        }
        return "? extends " + join_type_names(args, " & ");
    case JavaTypeKind::Array:
        return (args.empty() ? std::string("?") : args.front()->type_name()) + "[]";
    }
    return name;
}

auto JavaType::erasure() const -> std::string {
    switch (kind) {
    case JavaTypeKind::Class:
    case JavaTypeKind::Parameterized:
        return name;
    case JavaTypeKind::TypeVariable: {
        auto bounds = variable_bounds();
        return bounds.empty() ? std::string("java.lang.Object") : bounds.front()->erasure();
    }
    case JavaTypeKind::Wildcard:
        return args.empty() ? std::string("java.lang.Object") : args.front()->erasure();
    case JavaTypeKind::Array:
        return (args.empty() ? std::string("java.lang.Object") : args.front()->erasure()) + "[]";
    }
    return name;
}

// ============================================================================
// MethodInfo
// ============================================================================

auto MethodInfo::to_string() const -> std::string {
    std::ostringstream oss;
    auto mods = modifier::to_string(modifiers & ~modifier::INTERFACE);
    if (!mods.empty()) {
        oss << mods << ' ';
    }
    if (is_constructor()) {
        oss << declaring_class;
    } else {
        oss << return_type->erasure() << ' ' << declaring_class << '.' << name;
    }
    oss << '(';
    for (size_t i = 0; i < parameters.size(); ++i) {
        if (i > 0) {
            oss << ',';
        }
        oss << parameters[i].type->erasure();
    }
    oss << ')';
    if (!exceptions.empty()) {
        oss << " throws ";
        for (size_t i = 0; i < exceptions.size(); ++i) {
            if (i > 0) {
                oss << ',';
            }
            oss << exceptions[i]->erasure();
        }
    }
    return oss.str();
}

// ============================================================================
// ClassInfo
// ============================================================================

auto split_package(const std::string& binary_name) -> std::pair<std::string, std::string> {
    auto dot = binary_name.rfind('.');
    if (dot == std::string::npos) {
        return {"", binary_name};
    }
    return {binary_name.substr(0, dot), binary_name.substr(dot + 1)};
}

auto ClassInfo::package_name() const -> std::string {
    return split_package(name).first;
}

auto ClassInfo::local_name() const -> std::string {
    return split_package(name).second;
}

auto ClassInfo::simple_name() const -> std::string {
    auto local = local_name();
    auto dollar = local.rfind('$');
    return dollar == std::string::npos ? local : local.substr(dollar + 1);
}

auto ClassInfo::enclosing_class() const -> std::string {
    auto local = local_name();
    auto dollar = local.rfind('$');
    if (dollar == std::string::npos) {
        return "";
    }
    return name.substr(0, name.size() - (local.size() - dollar));
}

} // namespace jstub::reflect

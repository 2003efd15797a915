//! # Type Translator Implementation

#include "stubgen/type_translator.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace jstub::stubgen {

using reflect::JavaType;
using reflect::JavaTypeKind;
using reflect::JavaTypeRef;

// ============================================================================
// Fixed Name Tables
// ============================================================================

auto primitive_mappings() -> const std::vector<PrimitiveMapping>& {
    static const std::vector<PrimitiveMapping> TABLE = {
        {"void", "java.lang.Void", "java.jvoid", "None"},
        {"byte", "java.lang.Byte", "java.jbyte", "int"},
        {"short", "java.lang.Short", "java.jshort", "int"},
        {"int", "java.lang.Integer", "java.jint", "int"},
        {"long", "java.lang.Long", "java.jlong", "int"},
        {"boolean", "java.lang.Boolean", "java.jboolean", "bool"},
        {"double", "java.lang.Double", "java.jdouble", "float"},
        {"float", "java.lang.Float", "java.jfloat", "float"},
        {"char", "java.lang.Character", "java.jchar", "str"},
    };
    return TABLE;
}

auto find_primitive(const std::string& type_name) -> const PrimitiveMapping* {
    for (const auto& row : primitive_mappings()) {
        if (type_name == row.java_primitive || type_name == row.java_boxed) {
            return &row;
        }
    }
    return nullptr;
}

auto specialized_array_type(const std::string& wrapper) -> const char* {
    static const std::map<std::string, const char*> ARRAYS = {
        {"java.jboolean", "java.chaquopy.JavaArrayJBoolean"},
        {"java.jbyte", "java.chaquopy.JavaArrayJByte"},
        {"java.jshort", "java.chaquopy.JavaArrayJShort"},
        {"java.jint", "java.chaquopy.JavaArrayJInt"},
        {"java.jlong", "java.chaquopy.JavaArrayJLong"},
        {"java.jfloat", "java.chaquopy.JavaArrayJFloat"},
        {"java.jdouble", "java.chaquopy.JavaArrayJDouble"},
        {"java.jchar", "java.chaquopy.JavaArrayJChar"},
    };
    auto it = ARRAYS.find(wrapper);
    return it == ARRAYS.end() ? nullptr : it->second;
}

auto translate_type_name(const std::string& type_name, std::vector<TypeExpr> type_args,
                         bool is_argument, bool is_array_element) -> TypeExpr {
    // Array elements never get the argument-position widening
    bool widen = is_argument && !is_array_element;
    std::vector<TypeExpr> alternatives;

    if (const auto* prim = find_primitive(type_name)) {
        alternatives.emplace_back(is_array_element ? prim->wrapper : prim->plain);
        if (widen) {
            alternatives.emplace_back(prim->wrapper);
            alternatives.emplace_back(prim->java_boxed);
        }
    } else if (type_name == "java.lang.String") {
        if (is_array_element) {
            alternatives.emplace_back("java.lang.String");
        } else {
            alternatives.emplace_back("str");
            if (widen) {
                alternatives.emplace_back("java.lang.String");
            }
        }
    } else if (type_name == "java.lang.Class") {
        alternatives.emplace_back("typing.Type", std::move(type_args));
    } else if (type_name == "java.lang.Object") {
        alternatives.emplace_back("java.lang.Object");
        if (widen) {
            alternatives.emplace_back("int");
            alternatives.emplace_back("bool");
            alternatives.emplace_back("float");
            alternatives.emplace_back("str");
        }
    }

    if (alternatives.size() == 1) {
        return std::move(alternatives.front());
    }
    if (alternatives.size() > 1) {
        return TypeExpr("typing.Union", std::move(alternatives));
    }
    return TypeExpr(type_name, std::move(type_args));
}

// ============================================================================
// Translation
// ============================================================================

/// Bound on recursion through type-variable bounds; only reachable with
/// circular bounds in malformed reflection data.
static constexpr int MAX_DEPTH = 64;

auto TypeTranslator::translate(const JavaTypeRef& type, const std::vector<TypeVariable>& scope,
                               bool is_argument, bool is_array_element) const -> TypeExpr {
    return translate_impl(type, scope, is_argument, is_array_element, 0);
}

auto TypeTranslator::translate_impl(const JavaTypeRef& type,
                                    const std::vector<TypeVariable>& scope, bool is_argument,
                                    bool is_array_element, int depth) const -> TypeExpr {
    if (type == nullptr) {
        return TypeExpr("None");
    }
    if (depth > MAX_DEPTH) {
        JSTUB_LOG_WARN("translator", "type nesting too deep at " << type->type_name()
                                                                  << ", using java.lang.Object");
        return TypeExpr("java.lang.Object");
    }

    switch (type->kind) {
    case JavaTypeKind::Parameterized: {
        std::vector<TypeExpr> args;
        args.reserve(type->args.size());
        for (const auto& arg : type->args) {
            args.push_back(translate_impl(arg, scope, is_argument, is_array_element, depth + 1));
        }
        auto base = translate_type_name(type->name, std::move(args), is_argument, is_array_element);
        if (is_argument && !is_array_element) {
            return with_callable(std::move(base), *type, scope, depth);
        }
        return base;
    }

    case JavaTypeKind::TypeVariable: {
        // Innermost declaration wins; scope lists method variables first
        for (const auto& var : scope) {
            if (var.source_name == type->name) {
                return TypeExpr(var.generated_name);
            }
        }
        auto bounds = type->variable_bounds();
        JavaTypeRef bound =
            bounds.empty() ? JavaType::make_class("java.lang.Object") : bounds.front();
        if (bound->kind == JavaTypeKind::Parameterized) {
            bound = JavaType::make_class(bound->name);
        }
        JSTUB_LOG_TRACE("translator", "type variable " << type->name << " out of scope, using "
                                                       << bound->type_name());
        return translate_impl(bound, scope, false, false, depth + 1);
    }

    case JavaTypeKind::Wildcard: {
        JavaTypeRef bound =
            type->args.empty() ? JavaType::make_class("java.lang.Object") : type->args.front();
        if (bound->kind == JavaTypeKind::Class && bound->name == "java.lang.Object" &&
            !type->lower_bounds.empty()) {
            bound = type->lower_bounds.front();
        }
        return translate_impl(bound, scope, false, false, depth + 1);
    }

    case JavaTypeKind::Array: {
        auto element = translate_impl(type->component(), scope, false, true, depth + 1);
        if (const char* specialized = specialized_array_type(element.name)) {
            return TypeExpr(specialized);
        }
        return TypeExpr("java.chaquopy.JavaArray", {std::move(element)});
    }

    case JavaTypeKind::Class: {
        auto base = translate_type_name(type->name, {}, is_argument, is_array_element);
        if (is_argument && !is_array_element) {
            return with_callable(std::move(base), *type, scope, depth);
        }
        return base;
    }
    }
    return TypeExpr(type->name);
}

auto TypeTranslator::with_callable(TypeExpr base, const JavaType& type,
                                   const std::vector<TypeVariable>& scope, int depth) const
    -> TypeExpr {
    // Mapped names (primitives, String, Object, Class) are never interfaces
    if (provider_ == nullptr || base.name != type.name) {
        return base;
    }

    std::vector<TypeExpr> plain_args;
    for (const auto& arg : type.args) {
        plain_args.push_back(translate_impl(arg, scope, false, false, depth + 1));
    }
    auto callable = functional_callable(type.name, plain_args);
    if (!callable) {
        return base;
    }
    JSTUB_LOG_TRACE("translator", type.name << " accepted as callable");
    return TypeExpr("typing.Union", {std::move(base), std::move(*callable)});
}

auto TypeTranslator::make_type_variable(const reflect::TypeParameter& param,
                                        const std::string& scope_id) const -> TypeVariable {
    TypeVariable var;
    var.source_name = param.name;
    var.generated_name = "_" + scope_id + "__" + param.name;

    JavaTypeRef bound = param.bounds.empty() ? JavaType::make_class("java.lang.Object")
                                             : param.bounds.front();
    if (bound->kind == JavaTypeKind::Parameterized) {
        bound = JavaType::make_class(bound->name);
    }
    auto translated = translate(bound, {});
    if (translated.name != "java.lang.Object") {
        var.bound = std::move(translated);
    }
    return var;
}

// ============================================================================
// Functional Interfaces
// ============================================================================

/// True if `method` overrides one of java.lang.Object's public methods,
/// which do not count towards an interface's single abstract method.
static auto is_object_method(const reflect::MethodInfo& method) -> bool {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> OBJECT_METHODS = {
        {"equals", {"java.lang.Object"}},
        {"hashCode", {}},
        {"toString", {}},
        {"getClass", {}},
        {"notify", {}},
        {"notifyAll", {}},
        {"wait", {}},
        {"wait", {"long"}},
        {"wait", {"long", "int"}},
        {"clone", {}},
        {"finalize", {}},
    };
    std::vector<std::string> erased;
    for (const auto& param : method.parameters) {
        erased.push_back(param.type->erasure());
    }
    return std::any_of(OBJECT_METHODS.begin(), OBJECT_METHODS.end(), [&](const auto& entry) {
        return entry.first == method.name && entry.second == erased;
    });
}

auto TypeTranslator::find_functional_method(const std::string& class_name) const
    -> std::optional<FunctionalMethod> {
    if (provider_ == nullptr) {
        return std::nullopt;
    }
    if (auto it = functional_cache_.find(class_name); it != functional_cache_.end()) {
        return it->second;
    }

    std::optional<FunctionalMethod> found;
    auto loaded = provider_->load_class(class_name);
    if (is_err(loaded)) {
        JSTUB_LOG_TRACE("translator", "no functional check for " << class_name << ": "
                                                                 << unwrap_err(loaded).to_string());
    } else if (const auto& cls = unwrap(loaded); cls->is_interface) {
        const reflect::MethodInfo* candidate = nullptr;
        size_t count = 0;
        for (const auto& method : cls->declared_methods) {
            if (method.is_public() && method.is_abstract() && !method.is_static() &&
                !method.synthetic && !method.bridge && !is_object_method(method)) {
                candidate = &method;
                ++count;
            }
        }
        if (count == 1) {
            found = FunctionalMethod{cls, candidate};
        }
    }
    functional_cache_[class_name] = found;
    return found;
}

auto TypeTranslator::functional_callable(const std::string& class_name,
                                         const std::vector<TypeExpr>& type_args) const
    -> std::optional<TypeExpr> {
    auto functional = find_functional_method(class_name);
    if (!functional) {
        return std::nullopt;
    }
    const auto& cls = *functional->cls;
    const auto& method = *functional->method;

    auto resolve = [&](const JavaTypeRef& type) -> TypeExpr {
        if (type != nullptr && type->kind == JavaTypeKind::TypeVariable) {
            auto decl = type->declaration.lock();
            for (size_t i = 0; i < cls.type_parameters.size(); ++i) {
                const auto& param = cls.type_parameters[i];
                bool same = decl ? decl == param : param->name == type->name;
                if (same && i < type_args.size()) {
                    return type_args[i];
                }
            }
        }
        return translate(type, {});
    };

    std::vector<TypeExpr> params;
    for (const auto& param : method.parameters) {
        params.push_back(resolve(param.type));
    }
    auto ret = resolve(method.return_type);
    return TypeExpr("typing.Callable", {TypeExpr("", std::move(params)), std::move(ret)});
}

} // namespace jstub::stubgen

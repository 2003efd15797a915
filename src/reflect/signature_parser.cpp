//! # JVM Generic Signature Parser Implementation
//!
//! Recursive descent over the signature string. Each production returns
//! `Result<JavaTypeRef, SignatureError>`; the first error aborts the parse.

#include "reflect/signature_parser.hpp"

namespace jstub::reflect {

// ============================================================================
// TypeScope
// ============================================================================

auto TypeScope::declare(const std::string& name) -> Rc<TypeParameter> {
    for (const auto& param : params_) {
        if (param->name == name) {
            return param;
        }
    }
    auto param = make_rc<TypeParameter>();
    param->name = name;
    params_.push_back(param);
    return param;
}

auto TypeScope::lookup(std::string_view name) const -> Rc<TypeParameter> {
    for (const TypeScope* scope = this; scope != nullptr; scope = scope->parent_) {
        for (const auto& param : scope->params_) {
            if (param->name == name) {
                return param;
            }
        }
    }
    return nullptr;
}

auto primitive_name(char descriptor) -> const char* {
    switch (descriptor) {
    case 'B':
        return "byte";
    case 'C':
        return "char";
    case 'D':
        return "double";
    case 'F':
        return "float";
    case 'I':
        return "int";
    case 'J':
        return "long";
    case 'S':
        return "short";
    case 'Z':
        return "boolean";
    case 'V':
        return "void";
    default:
        return nullptr;
    }
}

// ============================================================================
// Parser
// ============================================================================

namespace {

using TypeResult = Result<JavaTypeRef, SignatureError>;

class SignatureParser {
public:
    SignatureParser(std::string_view text, const TypeScope* scope) : text_(text), scope_(scope) {}

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= text_.size();
    }

    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : text_[pos_];
    }

    [[nodiscard]] auto error(const std::string& msg) const -> SignatureError {
        return SignatureError{msg + " in '" + std::string(text_) + "'", pos_};
    }

    auto expect(char c) -> bool {
        if (peek() != c) {
            return false;
        }
        ++pos_;
        return true;
    }

    /// Identifier up to the next signature delimiter.
    auto identifier() -> std::string {
        size_t start = pos_;
        while (!at_end()) {
            char c = text_[pos_];
            if (c == '.' || c == ';' || c == '[' || c == '/' || c == '<' || c == '>' || c == ':') {
                break;
            }
            ++pos_;
        }
        return std::string(text_.substr(start, pos_ - start));
    }

    /// FormalTypeParameters. Names are declared in a first pass so that
    /// bounds may refer to parameters declared later in the same list.
    auto formal_type_parameters(TypeScope& scope) -> Result<std::vector<TypeParameterRef>, SignatureError> {
        std::vector<TypeParameterRef> result;
        if (peek() != '<') {
            return result;
        }

        size_t list_start = pos_;
        const TypeScope* saved_scope = scope_;
        scope_ = &scope;

        for (int pass = 0; pass < 2; ++pass) {
            pos_ = list_start + 1;
            while (peek() != '>') {
                if (at_end()) {
                    scope_ = saved_scope;
                    return error("unterminated type parameter list");
                }
                std::string name = identifier();
                if (name.empty() || peek() != ':') {
                    scope_ = saved_scope;
                    return error("expected type parameter name");
                }
                auto param = scope.declare(name);

                std::vector<JavaTypeRef> bounds;
                while (expect(':')) {
                    // The class bound may be empty ("T::Ljava/lang/Runnable;")
                    if (peek() == ':') {
                        continue;
                    }
                    auto bound = reference_type();
                    if (is_err(bound)) {
                        scope_ = saved_scope;
                        return unwrap_err(bound);
                    }
                    bounds.push_back(unwrap(bound));
                }
                if (pass == 1) {
                    if (bounds.empty()) {
                        bounds.push_back(JavaType::make_class("java.lang.Object"));
                    }
                    param->bounds = std::move(bounds);
                    result.push_back(param);
                }
            }
        }
        ++pos_; // '>'
        scope_ = saved_scope;
        return result;
    }

    /// JavaTypeSignature, or `V` when `allow_void` is set.
    auto java_type(bool allow_void = false) -> TypeResult {
        char c = peek();
        if (const char* prim = primitive_name(c)) {
            if (c == 'V' && !allow_void) {
                return error("void is not a value type");
            }
            ++pos_;
            return JavaType::make_class(prim);
        }
        return reference_type();
    }

    /// ReferenceTypeSignature: class type, type variable or array.
    auto reference_type() -> TypeResult {
        switch (peek()) {
        case 'L':
            return class_type();
        case 'T':
            return type_variable();
        case '[': {
            ++pos_;
            auto component = java_type();
            if (is_err(component)) {
                return component;
            }
            return JavaType::make_array(unwrap(component));
        }
        default:
            return error(at_end() ? "unexpected end of signature"
                                  : std::string("unexpected '") + peek() + "'");
        }
    }

    auto type_variable() -> TypeResult {
        ++pos_; // 'T'
        std::string name = identifier();
        if (name.empty() || !expect(';')) {
            return error("malformed type variable");
        }
        std::weak_ptr<const TypeParameter> decl;
        if (scope_ != nullptr) {
            decl = scope_->lookup(name);
        }
        return JavaType::make_type_variable(std::move(name), std::move(decl));
    }

    /// ClassTypeSignature including inner-class suffixes.
    auto class_type() -> TypeResult {
        ++pos_; // 'L'
        std::string name;
        while (true) {
            std::string part = identifier();
            if (part.empty()) {
                return error("expected class name");
            }
            name += part;
            if (!expect('/')) {
                break;
            }
            name += '.';
        }

        auto args = type_arguments();
        if (is_err(args)) {
            return unwrap_err(args);
        }
        std::vector<JavaTypeRef> current_args = std::move(unwrap(args));

        // Inner class of a parameterized outer: only the innermost
        // arguments are kept, as ParameterizedType.getActualTypeArguments does.
        while (expect('.')) {
            std::string inner = identifier();
            if (inner.empty()) {
                return error("expected inner class name");
            }
            name += '$';
            name += inner;
            auto inner_args = type_arguments();
            if (is_err(inner_args)) {
                return unwrap_err(inner_args);
            }
            current_args = std::move(unwrap(inner_args));
        }

        if (!expect(';')) {
            return error("expected ';' after class type");
        }
        if (current_args.empty()) {
            return JavaType::make_class(std::move(name));
        }
        return JavaType::make_parameterized(std::move(name), std::move(current_args));
    }

    auto type_arguments() -> Result<std::vector<JavaTypeRef>, SignatureError> {
        std::vector<JavaTypeRef> args;
        if (!expect('<')) {
            return args;
        }
        while (!expect('>')) {
            if (at_end()) {
                return error("unterminated type argument list");
            }
            char c = peek();
            if (c == '*') {
                ++pos_;
                args.push_back(JavaType::make_wildcard({}, {}));
                continue;
            }
            if (c == '+' || c == '-') {
                ++pos_;
                auto bound = reference_type();
                if (is_err(bound)) {
                    return unwrap_err(bound);
                }
                if (c == '+') {
                    args.push_back(JavaType::make_wildcard({unwrap(bound)}, {}));
                } else {
                    args.push_back(JavaType::make_wildcard({}, {unwrap(bound)}));
                }
                continue;
            }
            auto arg = reference_type();
            if (is_err(arg)) {
                return unwrap_err(arg);
            }
            args.push_back(unwrap(arg));
        }
        if (args.empty()) {
            return error("empty type argument list");
        }
        return args;
    }

private:
    std::string_view text_;
    size_t pos_ = 0;
    const TypeScope* scope_;
};

} // namespace

// ============================================================================
// Entry Points
// ============================================================================

auto parse_class_signature(std::string_view signature, TypeScope& scope)
    -> Result<ClassSignature, SignatureError> {
    SignatureParser parser(signature, &scope);
    ClassSignature result;

    auto params = parser.formal_type_parameters(scope);
    if (is_err(params)) {
        return unwrap_err(params);
    }
    result.type_parameters = std::move(unwrap(params));

    auto superclass = parser.reference_type();
    if (is_err(superclass)) {
        return unwrap_err(superclass);
    }
    result.superclass = unwrap(superclass);

    while (!parser.at_end()) {
        auto iface = parser.reference_type();
        if (is_err(iface)) {
            return unwrap_err(iface);
        }
        result.interfaces.push_back(unwrap(iface));
    }
    return result;
}

auto parse_method_signature(std::string_view signature, const TypeScope* enclosing)
    -> Result<MethodSignature, SignatureError> {
    TypeScope method_scope(enclosing);
    SignatureParser parser(signature, &method_scope);
    MethodSignature result;

    auto params = parser.formal_type_parameters(method_scope);
    if (is_err(params)) {
        return unwrap_err(params);
    }
    result.type_parameters = std::move(unwrap(params));

    if (!parser.expect('(')) {
        return parser.error("expected '('");
    }
    while (!parser.expect(')')) {
        if (parser.at_end()) {
            return parser.error("unterminated parameter list");
        }
        auto param = parser.java_type();
        if (is_err(param)) {
            return unwrap_err(param);
        }
        result.parameters.push_back(unwrap(param));
    }

    auto ret = parser.java_type(true);
    if (is_err(ret)) {
        return unwrap_err(ret);
    }
    result.return_type = unwrap(ret);

    while (parser.expect('^')) {
        auto thrown = parser.reference_type();
        if (is_err(thrown)) {
            return unwrap_err(thrown);
        }
        result.exceptions.push_back(unwrap(thrown));
    }
    if (!parser.at_end()) {
        return parser.error("unexpected trailing characters");
    }
    return result;
}

auto parse_field_signature(std::string_view signature, const TypeScope* scope)
    -> Result<JavaTypeRef, SignatureError> {
    SignatureParser parser(signature, scope);
    auto type = parser.java_type();
    if (is_err(type)) {
        return type;
    }
    if (!parser.at_end()) {
        return parser.error("unexpected trailing characters");
    }
    return type;
}

} // namespace jstub::reflect

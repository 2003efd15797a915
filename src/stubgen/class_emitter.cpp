//! # Class Emitter Implementation

#include "stubgen/class_emitter.hpp"

#include "log/log.hpp"
#include "stubgen/identifiers.hpp"
#include "stubgen/javadoc_splitter.hpp"
#include "stubgen/render.hpp"

#include <algorithm>
#include <map>

namespace jstub::stubgen {

using reflect::ClassInfo;
using reflect::ClassRef;
using reflect::JavaTypeKind;
using reflect::JavaTypeRef;
using reflect::MethodInfo;

auto is_declarable_class(const ClassInfo& cls) -> bool {
    return !cls.is_anonymous && !cls.is_local && !cls.is_synthetic;
}

ClassEmitter::ClassEmitter(const reflect::ReflectionProvider& provider,
                           const TypeTranslator& translator, std::string package,
                           bool include_javadoc, EmissionState& state)
    : provider_(provider), translator_(translator), package_(std::move(package)),
      include_javadoc_(include_javadoc), state_(state) {}

auto ClassEmitter::class_scope_id(const ClassInfo& cls) -> std::string {
    std::string id;
    for (char c : cls.local_name()) {
        if (c == '.') {
            id += '_';
        } else if (c == '$') {
            id += "__";
        } else {
            id += c;
        }
    }
    return id;
}

auto ClassEmitter::source_type_name(const JavaTypeRef& type) -> std::string {
    if (type == nullptr) {
        return "";
    }
    switch (type->kind) {
    case JavaTypeKind::Array:
        return source_type_name(type->component()) + "[]";
    case JavaTypeKind::TypeVariable:
        return type->name;
    case JavaTypeKind::Wildcard:
        return "?";
    case JavaTypeKind::Class:
    case JavaTypeKind::Parameterized:
        break;
    }
    std::string name = type->name;
    if (auto dot = name.rfind('.'); dot != std::string::npos) {
        name = name.substr(dot + 1);
    }
    if (auto dollar = name.rfind('$'); dollar != std::string::npos) {
        name = name.substr(dollar + 1);
    }
    return name;
}

// ============================================================================
// Classes
// ============================================================================

void ClassEmitter::emit_top_level(const ClassInfo& cls, std::vector<std::string>& out) {
    std::vector<std::string> body;
    std::vector<std::string> type_vars;
    emit_class(cls, body, type_vars, nullptr);

    out.emplace_back("");
    out.insert(out.end(), type_vars.begin(), type_vars.end());
    out.insert(out.end(), body.begin(), body.end());
}

void ClassEmitter::emit_placeholder(const std::string& local_name, std::vector<std::string>& out) {
    state_.emitted.insert(local_name);
    ++state_.placeholders;
    auto simple = local_name.substr(local_name.rfind('$') + 1);
    out.push_back("class " + simple + ": ...");
}

void ClassEmitter::emit_class(const ClassInfo& cls, std::vector<std::string>& out,
                              std::vector<std::string>& type_var_out,
                              const std::vector<TypeVariable>* enclosing_scope) {
    JSTUB_LOG_DEBUG("emitter", "emitting " << cls.name);
    auto doc = extract_class_doc(provider_, cls, include_javadoc_);

    auto scope_id = class_scope_id(cls);
    std::vector<TypeVariable> own_vars;
    for (const auto& param : cls.type_parameters) {
        own_vars.push_back(translator_.make_type_variable(*param, scope_id));
    }
    // Own variables first so they shadow the enclosing class's
    std::vector<TypeVariable> scope = own_vars;
    if (enclosing_scope != nullptr && !cls.is_static()) {
        scope.insert(scope.end(), enclosing_scope->begin(), enclosing_scope->end());
    }

    std::vector<std::string> constructors_out;
    std::vector<const MethodInfo*> constructors;
    for (const auto& ctor : cls.constructors) {
        constructors.push_back(&ctor);
    }
    emit_functions("__init__", "__init__", constructors, doc.constructors, cls.simple_name(), scope,
                   constructors_out);

    // Grouped by target name; `print` and `print_` would share one group
    std::map<std::string, std::pair<std::string, std::vector<const MethodInfo*>>> groups;
    for (const auto& method : cls.methods) {
        if (method.synthetic) {
            continue;
        }
        auto safe = pysafe(method.name);
        if (!safe) {
            JSTUB_LOG_TRACE("emitter", "dropping " << cls.name << "." << method.name);
            continue;
        }
        auto& group = groups[*safe];
        if (group.first.empty()) {
            group.first = method.name;
        }
        group.second.push_back(&method);
    }
    std::vector<std::string> methods_out;
    for (const auto& [python_name, group] : groups) {
        const auto& [java_name, overloads] = group;
        std::string method_doc;
        if (auto it = doc.methods.find(java_name); it != doc.methods.end()) {
            method_doc = it->second;
        }
        emit_functions(python_name, java_name, overloads, method_doc, "", scope, methods_out);
    }

    std::vector<std::string> fields_out;
    for (const auto& field : cls.declared_fields) {
        emit_field(field, doc, scope, fields_out);
    }

    std::vector<std::string> nested_out;
    emit_nested_classes(cls, scope, nested_out, type_var_out);
    repair_nested_references(cls, scope, nested_out, type_var_out);

    auto supers = super_types(cls, scope, own_vars);
    for (const auto& var : own_vars) {
        type_var_out.push_back(render_type_var_declaration(var, package_, state_));
    }

    std::string header = "class " + cls.simple_name();
    if (!supers.empty()) {
        header += "(";
        for (size_t i = 0; i < supers.size(); ++i) {
            if (i > 0) {
                header += ", ";
            }
            header += supers[i];
        }
        header += ")";
    }

    auto doc_lines = docstring_lines(doc.description);
    if (constructors_out.empty() && methods_out.empty() && fields_out.empty() &&
        nested_out.empty()) {
        if (doc_lines.empty()) {
            out.push_back(header + ": ...");
        } else {
            out.push_back(header + ":");
            out.insert(out.end(), doc_lines.begin(), doc_lines.end());
            out.emplace_back("    ...");
        }
    } else {
        out.push_back(header + ":");
        out.insert(out.end(), doc_lines.begin(), doc_lines.end());
        for (const auto* section : {&constructors_out, &methods_out, &fields_out, &nested_out}) {
            for (const auto& line : *section) {
                out.push_back("    " + line);
            }
        }
    }

    state_.emitted.insert(cls.local_name());
    ++state_.classes_emitted;
}

void ClassEmitter::emit_nested_classes(const ClassInfo& cls, const std::vector<TypeVariable>& scope,
                                       std::vector<std::string>& out,
                                       std::vector<std::string>& type_var_out) {
    std::vector<ClassRef> nested;
    for (const auto& name : cls.member_classes) {
        auto local = reflect::split_package(name).second;
        if (state_.is_failed(local)) {
            continue;
        }
        auto loaded = provider_.load_class(name);
        if (is_err(loaded)) {
            JSTUB_LOG_WARN("emitter", "skipping nested class " << name << ": "
                                                               << unwrap_err(loaded).to_string());
            state_.failed.insert(local);
            continue;
        }
        const auto& member = unwrap(loaded);
        if (member->is_public() && is_declarable_class(*member)) {
            nested.push_back(member);
        }
    }
    std::sort(nested.begin(), nested.end(), [](const ClassRef& a, const ClassRef& b) {
        return a->simple_name() < b->simple_name();
    });
    for (const auto& member : nested) {
        emit_class(*member, out, type_var_out, &scope);
    }
}

void ClassEmitter::repair_nested_references(const ClassInfo& cls,
                                            const std::vector<TypeVariable>& scope,
                                            std::vector<std::string>& out,
                                            std::vector<std::string>& type_var_out) {
    const std::string prefix = pysafe_package_path(cls.name) + "$";
    const std::string outer_local = cls.local_name();
    std::set<std::string> attempted;

    while (true) {
        std::vector<std::string> missing;
        for (const auto& ref : state_.referenced) {
            if (!ref.starts_with(prefix)) {
                continue;
            }
            auto local = ref.substr(ref.rfind('.') + 1);
            if (!state_.is_emitted(local)) {
                missing.push_back(local);
            }
        }
        if (missing.empty()) {
            break;
        }

        for (const auto& local : missing) {
            if (state_.is_emitted(local)) {
                continue;
            }
            // Outer$Hidden$Leaf is reached through Outer$Hidden
            auto rest = local.substr(outer_local.size() + 1);
            auto child_local = outer_local + "$" + rest.substr(0, rest.find('$'));
            auto child_name = cls.name + "$" + rest.substr(0, rest.find('$'));

            if (!state_.is_emitted(child_local) && !state_.is_failed(child_local) &&
                attempted.insert(child_local).second) {
                auto loaded = provider_.load_class(child_name);
                if (is_ok(loaded) && is_declarable_class(*unwrap(loaded))) {
                    emit_class(*unwrap(loaded), out, type_var_out, &scope);
                } else if (is_err(loaded)) {
                    JSTUB_LOG_DEBUG("emitter", "nested class " << child_name << " unavailable: "
                                                               << unwrap_err(loaded).to_string());
                    if (unwrap_err(loaded).kind == reflect::ReflectionError::Kind::TypeLoad) {
                        state_.failed.insert(child_local);
                    }
                }
            }
            if (!state_.is_emitted(local)) {
                JSTUB_LOG_WARN("emitter", "reference to missing inner class "
                                              << local << " - generating empty stub");
                emit_placeholder(local, out);
            }
        }
    }
}

auto ClassEmitter::super_types(const ClassInfo& cls, const std::vector<TypeVariable>& scope,
                               const std::vector<TypeVariable>& own_vars)
    -> std::vector<std::string> {
    std::vector<JavaTypeRef> java_supers;
    if (cls.generic_superclass) {
        java_supers.push_back(*cls.generic_superclass);
    }
    java_supers.insert(java_supers.end(), cls.generic_interfaces.begin(),
                       cls.generic_interfaces.end());

    std::vector<std::string> supers;
    for (const auto& super : java_supers) {
        supers.push_back(render_type(translator_.translate(super, scope), package_, state_, false));
    }
    if (!own_vars.empty()) {
        state_.add_import("import typing");
        std::string generic = "typing.Generic[";
        for (size_t i = 0; i < own_vars.size(); ++i) {
            if (i > 0) {
                generic += ", ";
            }
            generic += own_vars[i].generated_name;
        }
        supers.push_back(generic + "]");
    }
    // Lets Java exceptions be chained as Python exception causes
    if (cls.name == "java.lang.Throwable") {
        supers.emplace_back("builtins.Exception");
        state_.add_import("import builtins");
    }
    return supers;
}

// ============================================================================
// Members
// ============================================================================

void ClassEmitter::emit_functions(const std::string& python_name, const std::string& java_name,
                                  const std::vector<const MethodInfo*>& overloads,
                                  const std::string& doc, const std::string& header_name,
                                  const std::vector<TypeVariable>& class_scope,
                                  std::vector<std::string>& out) {
    bool is_constructor = python_name == "__init__";
    auto sorted = overloads;
    std::sort(sorted.begin(), sorted.end(), [](const MethodInfo* a, const MethodInfo* b) {
        return a->to_string() < b->to_string();
    });
    bool is_overloaded = sorted.size() > 1;

    std::vector<FunctionSig> signatures;
    for (size_t i = 0; i < sorted.size(); ++i) {
        const MethodInfo& method = *sorted[i];
        FunctionSig sig;
        sig.name = java_name;
        sig.is_static = !is_constructor && method.is_static();

        auto scope_id = is_overloaded ? python_name + "_" + std::to_string(i) : python_name;
        for (const auto& param : method.type_parameters) {
            sig.type_vars.push_back(translator_.make_type_variable(*param, scope_id));
        }
        std::vector<TypeVariable> scope = sig.type_vars;
        if (!sig.is_static) {
            scope.insert(scope.end(), class_scope.begin(), class_scope.end());
            sig.args.push_back(ArgumentSig{"self", std::nullopt, false});
        }

        for (size_t j = 0; j < method.parameters.size(); ++j) {
            const auto& param = method.parameters[j];
            bool variadic = method.varargs && j + 1 == method.parameters.size();
            JavaTypeRef type = param.type;
            if (variadic && type->component() != nullptr) {
                type = type->component();
            }
            auto name = param.name ? *param.name : infer_arg_name(type, sig.args);
            sig.args.push_back(ArgumentSig{name, translator_.translate(type, scope, true), variadic});
            sig.source_arg_types.push_back(source_type_name(param.type));
        }
        sig.return_type =
            is_constructor ? TypeExpr("None") : translator_.translate(method.return_type, scope);
        signatures.push_back(std::move(sig));
    }

    // Declarations may not sit between overloads, so all come first
    for (const auto& sig : signatures) {
        for (const auto& var : sig.type_vars) {
            out.push_back(render_type_var_declaration(var, package_, state_));
        }
    }

    std::vector<std::string> docs(signatures.size());
    if (!doc.empty()) {
        docs = split_overload_docs(signatures, doc, header_name);
    }

    for (size_t i = 0; i < signatures.size(); ++i) {
        const auto& sig = signatures[i];
        const auto& overload_doc = docs[i];

        if (is_overloaded) {
            state_.add_import("import typing");
            out.emplace_back("@typing.overload");
        }
        if (sig.is_static) {
            out.emplace_back("@staticmethod");
        }

        std::string args;
        for (size_t j = 0; j < sig.args.size(); ++j) {
            const auto& arg = sig.args[j];
            if (j > 0) {
                args += ", ";
            }
            if (!arg.type) {
                args += arg.name;
                continue;
            }
            auto safe = pysafe(arg.name);
            std::string arg_def = safe && is_valid_identifier(*safe)
                                      ? *safe
                                      : "invalidArgName" + std::to_string(j);
            if (arg.variadic) {
                arg_def = "*" + arg_def;
            }
            args += arg_def + ": " + render_type(*arg.type, package_, state_);
        }

        std::string ret = is_constructor ? "None" : render_type(sig.return_type, package_, state_);
        out.push_back("def " + python_name + "(" + args + ") -> " + ret + ":" +
                      (overload_doc.empty() ? " ..." : ""));
        if (!overload_doc.empty()) {
            auto lines = docstring_lines(overload_doc);
            out.insert(out.end(), lines.begin(), lines.end());
            out.emplace_back("    ...");
        }
    }
}

void ClassEmitter::emit_field(const reflect::FieldInfo& field, const ClassDoc& doc,
                              const std::vector<TypeVariable>& class_scope,
                              std::vector<std::string>& out) {
    if (!field.is_public()) {
        return;
    }
    auto name = pysafe(field.name);
    if (!name) {
        return;
    }

    bool is_static = field.is_static();
    auto type = translator_.translate(field.type, is_static ? std::vector<TypeVariable>{}
                                                            : class_scope);
    auto annotation = render_type(type, package_, state_);
    if (is_static) {
        state_.add_import("import typing");
        annotation = "typing.ClassVar[" + annotation + "]";
    }
    out.push_back(*name + ": " + annotation + " = ...");
    if (auto it = doc.fields.find(field.name); it != doc.fields.end()) {
        auto lines = docstring_lines(it->second, false);
        out.insert(out.end(), lines.begin(), lines.end());
    }
}

} // namespace jstub::stubgen

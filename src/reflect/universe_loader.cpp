//! # Reflection Dump Loader Implementation
//!
//! `finish()` works in two passes over every queued class:
//!
//! 1. Headers, outer classes first (by nesting depth): the class signature
//!    declares the type parameters into a scope chained to the enclosing
//!    class's scope.
//! 2. Members: constructors, methods and fields are parsed once every
//!    header is known, so inherited methods bind to their declaring class.
//!
//! Scopes live in an arena owned by the loader; type parameters are owned
//! by the registered `ClassInfo`.

#include "reflect/universe_loader.hpp"

#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace jstub::reflect {

namespace {

using json::JsonValue;

auto string_member(const JsonValue& obj, const std::string& key, const std::string& fallback = "")
    -> std::string {
    const auto* value = obj.get(key);
    return value != nullptr && value->is_string() ? value->as_string() : fallback;
}

auto int_member(const JsonValue& obj, const std::string& key) -> uint32_t {
    const auto* value = obj.get(key);
    return value != nullptr && value->is_integer() ? static_cast<uint32_t>(value->as_i64()) : 0;
}

auto bool_member(const JsonValue& obj, const std::string& key, bool fallback = false) -> bool {
    const auto* value = obj.get(key);
    return value != nullptr && value->is_bool() ? value->as_bool() : fallback;
}

auto string_map_member(const JsonValue& obj, const std::string& key)
    -> std::map<std::string, std::string> {
    std::map<std::string, std::string> out;
    const auto* value = obj.get(key);
    if (value == nullptr || !value->is_object()) {
        return out;
    }
    for (const auto& [name, text] : value->as_object()) {
        if (text.is_string()) {
            out[name] = text.as_string();
        }
    }
    return out;
}

auto javadoc_of(const JsonValue& doc) -> JavadocInfo {
    JavadocInfo info;
    info.description = string_member(doc, "description");
    info.constructors = string_member(doc, "constructors");
    info.methods = string_map_member(doc, "methods");
    info.fields = string_map_member(doc, "fields");
    return info;
}

auto nesting_depth(const std::string& binary_name) -> size_t {
    return static_cast<size_t>(std::count(binary_name.begin(), binary_name.end(), '$'));
}

} // namespace

// ============================================================================
// Reading Dumps
// ============================================================================

auto UniverseLoader::add_dump(std::string_view json, const std::string& source)
    -> Result<size_t, ReflectionError> {
    auto parsed = json::parse_json(json);
    if (is_err(parsed)) {
        return ReflectionError::malformed(source, unwrap_err(parsed).to_string());
    }
    auto root = make_box<JsonValue>(std::move(unwrap(parsed)));
    if (!root->is_object()) {
        return ReflectionError::malformed(source, "dump root is not an object");
    }
    auto format = string_member(*root, "format");
    if (format != DUMP_FORMAT) {
        return ReflectionError::malformed(source, "unsupported dump format '" + format + "'");
    }

    const auto* classes = root->get("classes");
    if (classes != nullptr && !classes->is_array()) {
        return ReflectionError::malformed(source, "'classes' is not an array");
    }
    std::vector<Pending> entries;
    if (classes != nullptr) {
        for (const auto& entry : classes->as_array()) {
            auto name = entry.is_object() ? string_member(entry, "name") : std::string();
            if (name.empty()) {
                return ReflectionError::malformed(source, "class entry without a name");
            }
            entries.push_back(Pending{&entry, std::move(name), source});
        }
    }

    if (const auto* packages = root->get("packages"); packages && packages->is_array()) {
        for (const auto& pkg : packages->as_array()) {
            if (pkg.is_string()) {
                universe_.add_package(pkg.as_string());
            }
        }
    }
    if (const auto* docs = root->get("javadoc"); docs && docs->is_object()) {
        for (const auto& [name, doc] : docs->as_object()) {
            if (doc.is_object()) {
                universe_.add_documentation(name, javadoc_of(doc));
            }
        }
    }

    size_t count = entries.size();
    pending_.insert(pending_.end(), std::make_move_iterator(entries.begin()),
                    std::make_move_iterator(entries.end()));
    documents_.push_back(std::move(root));
    JSTUB_LOG_DEBUG("reflect", "read " << count << " class entries from " << source);
    return count;
}

auto UniverseLoader::add_dump_file(const std::string& path) -> Result<size_t, ReflectionError> {
    std::ifstream file(path);
    if (!file) {
        return ReflectionError::not_found(path);
    }
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return add_dump(content, path);
}

// ============================================================================
// Binding
// ============================================================================

auto UniverseLoader::finish() -> LoadSummary {
    LoadSummary summary;

    // Later entries of the same name replace earlier ones
    std::map<std::string, size_t> latest;
    for (size_t i = 0; i < pending_.size(); ++i) {
        latest[pending_[i].name] = i;
    }
    std::vector<const Pending*> queue;
    for (size_t i = 0; i < pending_.size(); ++i) {
        if (latest[pending_[i].name] == i) {
            queue.push_back(&pending_[i]);
        }
    }
    std::stable_sort(queue.begin(), queue.end(), [](const Pending* a, const Pending* b) {
        return nesting_depth(a->name) < nesting_depth(b->name);
    });

    std::vector<Header> headers;
    for (const auto* pending : queue) {
        if (const auto* error = pending->entry->get("error"); error && error->is_string()) {
            universe_.add_failure(pending->name, error->as_string());
            scopes_.erase(pending->name);
            ++summary.failures;
            continue;
        }
        auto header = read_header(*pending);
        if (is_err(header)) {
            JSTUB_LOG_WARN("reflect", pending->name << " in " << pending->source << ": "
                                                    << unwrap_err(header));
            universe_.add_failure(pending->name, unwrap_err(header));
            scopes_.erase(pending->name);
            ++summary.failures;
            continue;
        }
        headers.push_back(std::move(unwrap(header)));
    }

    for (const auto& header : headers) {
        auto members = read_members(header);
        if (is_err(members)) {
            JSTUB_LOG_WARN("reflect", header.cls->name << ": " << unwrap_err(members));
            universe_.add_failure(header.cls->name, unwrap_err(members));
            ++summary.failures;
            continue;
        }
        universe_.add_class(header.cls);
        ++summary.classes;
    }

    pending_.clear();
    JSTUB_LOG_DEBUG("reflect", "bound " << summary.classes << " classes, " << summary.failures
                                        << " load failures");
    return summary;
}

auto UniverseLoader::read_header(const Pending& pending) -> Result<Header, std::string> {
    const auto& entry = *pending.entry;
    auto cls = make_rc<ClassInfo>();
    cls->name = pending.name;
    cls->modifiers = int_member(entry, "modifiers");
    auto kind = string_member(entry, "kind", "class");
    cls->is_interface = kind == "interface" || kind == "annotation" ||
                        (cls->modifiers & modifier::INTERFACE) != 0;
    cls->is_anonymous = bool_member(entry, "anonymous");
    cls->is_local = bool_member(entry, "local");
    cls->is_synthetic = bool_member(entry, "synthetic");

    // Scope chain: non-static inner classes see the enclosing class's variables
    auto& scope = scope_arena_.emplace_back();
    auto outer = cls->enclosing_class();
    if (!outer.empty() && !cls->is_static() && !cls->is_interface) {
        if (auto it = scopes_.find(outer); it != scopes_.end()) {
            scope.set_parent(it->second);
        }
    }

    auto signature = string_member(entry, "signature");
    if (!signature.empty()) {
        auto parsed = parse_class_signature(signature, scope);
        if (is_err(parsed)) {
            return "class signature: " + unwrap_err(parsed).to_string();
        }
        auto& sig = unwrap(parsed);
        cls->type_parameters = std::move(sig.type_parameters);
        cls->generic_superclass = sig.superclass;
        cls->generic_interfaces = std::move(sig.interfaces);
    } else {
        cls->generic_superclass = JavaType::make_class("java.lang.Object");
    }
    // getGenericSuperclass() is null for interfaces and Object itself
    if (cls->is_interface || cls->name == "java.lang.Object") {
        cls->generic_superclass.reset();
    }

    scopes_[cls->name] = &scope;
    return Header{std::move(cls), pending.entry, &scope};
}

auto UniverseLoader::read_members(const Header& header) -> Result<bool, std::string> {
    const auto& entry = *header.entry;
    auto& cls = *header.cls;

    if (const auto* members = entry.get("member_classes"); members && members->is_array()) {
        for (const auto& member : members->as_array()) {
            if (member.is_string()) {
                cls.member_classes.push_back(member.as_string());
            }
        }
    }

    if (const auto* ctors = entry.get("constructors"); ctors && ctors->is_array()) {
        for (const auto& ctor : ctors->as_array()) {
            auto method = read_method(ctor, cls, *header.scope, true);
            if (is_err(method)) {
                return unwrap_err(method);
            }
            if (unwrap(method).is_public()) {
                cls.constructors.push_back(std::move(unwrap(method)));
            }
        }
    }

    if (const auto* methods = entry.get("methods"); methods && methods->is_array()) {
        for (const auto& json_method : methods->as_array()) {
            auto method = read_method(json_method, cls, *header.scope, false);
            if (is_err(method)) {
                return unwrap_err(method);
            }
            auto& info = unwrap(method);
            bool declared = bool_member(json_method, "declared", info.declaring_class == cls.name);
            if (declared) {
                cls.declared_methods.push_back(info);
            }
            if (info.is_public()) {
                cls.methods.push_back(std::move(info));
            }
        }
    }

    if (const auto* fields = entry.get("fields"); fields && fields->is_array()) {
        for (const auto& json_field : fields->as_array()) {
            FieldInfo field;
            field.name = string_member(json_field, "name");
            field.modifiers = int_member(json_field, "modifiers");
            const TypeScope* field_scope =
                (field.modifiers & modifier::STATIC) != 0 ? nullptr : header.scope;
            auto type = parse_field_signature(string_member(json_field, "signature"), field_scope);
            if (is_err(type)) {
                return "field " + field.name + ": " + unwrap_err(type).to_string();
            }
            field.type = unwrap(type);
            cls.declared_fields.push_back(std::move(field));
        }
    }

    if (const auto* doc = entry.get("javadoc"); doc && doc->is_object()) {
        cls.javadoc = javadoc_of(*doc);
    }
    return true;
}

auto UniverseLoader::read_method(const JsonValue& entry, const ClassInfo& cls,
                                 const TypeScope& scope, bool is_constructor)
    -> Result<MethodInfo, std::string> {
    MethodInfo method;
    method.name = is_constructor ? "<init>" : string_member(entry, "name");
    method.declaring_class =
        is_constructor ? cls.name : string_member(entry, "declaring_class", cls.name);
    method.modifiers = int_member(entry, "modifiers");
    method.varargs = bool_member(entry, "varargs");
    method.synthetic = bool_member(entry, "synthetic");
    method.bridge = bool_member(entry, "bridge");

    // Inherited methods resolve type variables against their declaring class
    const TypeScope* method_scope = &scope;
    if (method.declaring_class != cls.name) {
        auto it = scopes_.find(method.declaring_class);
        method_scope = it != scopes_.end() ? it->second : nullptr;
        if (method_scope == nullptr) {
            JSTUB_LOG_TRACE("reflect", cls.name << "." << method.name << ": declaring class "
                                                << method.declaring_class << " is not loaded");
        }
    }
    if ((method.modifiers & modifier::STATIC) != 0) {
        method_scope = nullptr;
    }

    auto parsed = parse_method_signature(string_member(entry, "signature"), method_scope);
    if (is_err(parsed)) {
        return "method " + method.name + ": " + unwrap_err(parsed).to_string();
    }
    auto& sig = unwrap(parsed);
    method.type_parameters = std::move(sig.type_parameters);
    method.exceptions = std::move(sig.exceptions);
    if (!is_constructor) {
        method.return_type = sig.return_type;
    }

    std::vector<std::optional<std::string>> names(sig.parameters.size());
    if (const auto* params = entry.get("parameters"); params && params->is_array()) {
        const auto& list = params->as_array();
        if (list.size() == sig.parameters.size()) {
            for (size_t i = 0; i < list.size(); ++i) {
                if (list[i].is_string()) {
                    names[i] = list[i].as_string();
                }
            }
        } else if (!list.empty()) {
            JSTUB_LOG_WARN("reflect", cls.name << "." << method.name << ": " << list.size()
                                               << " parameter names for "
                                               << sig.parameters.size()
                                               << " parameters, ignoring names");
        }
    }
    for (size_t i = 0; i < sig.parameters.size(); ++i) {
        method.parameters.push_back(ParameterInfo{names[i], sig.parameters[i]});
    }
    return method;
}

// ============================================================================
// Single Dumps
// ============================================================================

auto load_universe(std::string_view json, ClassUniverse& universe, const std::string& source)
    -> Result<size_t, ReflectionError> {
    UniverseLoader loader(universe);
    auto read = loader.add_dump(json, source);
    if (is_err(read)) {
        return read;
    }
    loader.finish();
    return read;
}

auto load_universe_file(const std::string& path, ClassUniverse& universe)
    -> Result<size_t, ReflectionError> {
    UniverseLoader loader(universe);
    auto read = loader.add_dump_file(path);
    if (is_err(read)) {
        return read;
    }
    loader.finish();
    return read;
}

} // namespace jstub::reflect

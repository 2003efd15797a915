#include "stubgen/render.hpp"

#include "stubgen/identifiers.hpp"

namespace jstub::stubgen {

static void replace_all(std::string& text, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

// ============================================================================
// Types
// ============================================================================

auto render_type(const TypeExpr& type, const std::string& package, EmissionState& state,
                 bool deferrable) -> std::string {
    std::string name = type.name;

    if (name.find('.') != std::string::npos) {
        name = pysafe_package_path(name);
        state.referenced.insert(name);

        auto dot = name.rfind('.');
        std::string parent = name.substr(0, dot);
        std::string local = name.substr(dot + 1);

        if (parent == "builtins") {
            name = local;
        } else if (parent == pysafe_package_path(package)) {
            if (state.is_emitted(local) || deferrable) {
                name = local;
            } else {
                // Fully qualified through the top-level package import
                state.add_import("import " + name.substr(0, name.find('.')));
            }
        } else {
            state.add_import("import " + parent);
        }
    }

    replace_all(name, "$", ".");

    if (type.type_args.empty() && !name.empty()) {
        return name;
    }
    std::string out = name + "[";
    for (size_t i = 0; i < type.type_args.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += render_type(type.type_args[i], package, state);
    }
    out += "]";
    return out;
}

auto render_type_var_declaration(const TypeVariable& var, const std::string& package,
                                 EmissionState& state) -> std::string {
    state.add_import("import typing");
    std::string out = var.generated_name + " = typing.TypeVar('" + var.generated_name + "'";
    if (var.bound) {
        out += ", bound=" + render_type(*var.bound, package, state);
    }
    out += ")  # <" + var.source_name + ">";
    return out;
}

// ============================================================================
// Documentation
// ============================================================================

auto sanitize_javadoc_html(const std::string& html) -> std::string {
    std::string text = html;
    replace_all(text, "\xe2\x80\x8b", " "); // U+200B zero width space
    replace_all(text, "\xc2\xa0", " ");     // U+00A0 no-break space
    replace_all(text, "&nbsp;", " ");
    replace_all(text, "&lt;", "<");
    replace_all(text, "&gt;", ">");
    return text;
}

static auto strip(const std::string& text) -> std::string {
    const char* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

auto docstring_lines(const std::string& doc, bool indent) -> std::vector<std::string> {
    std::vector<std::string> lines;
    if (doc.empty()) {
        return lines;
    }
    std::string escaped = doc;
    replace_all(escaped, "\\", "\\\\");
    replace_all(escaped, "\"\"\"", "\\\"\\\"\\\"");

    std::string prefix = indent ? "    " : "";
    lines.push_back(prefix + "\"\"\"");
    size_t start = 0;
    while (true) {
        auto newline = escaped.find('\n', start);
        lines.push_back(prefix + escaped.substr(start, newline == std::string::npos
                                                           ? std::string::npos
                                                           : newline - start));
        if (newline == std::string::npos) {
            break;
        }
        start = newline + 1;
    }
    lines.push_back(prefix + "\"\"\"");
    return lines;
}

auto extract_class_doc(const reflect::ReflectionProvider& provider, const reflect::ClassInfo& cls,
                       bool include_javadoc) -> ClassDoc {
    ClassDoc doc;
    if (!include_javadoc) {
        return doc;
    }
    auto javadoc = provider.documentation(cls);
    if (!javadoc) {
        return doc;
    }
    doc.description = strip(sanitize_javadoc_html(javadoc->description));
    doc.constructors = sanitize_javadoc_html(javadoc->constructors);
    for (const auto& [name, text] : javadoc->methods) {
        doc.methods[name] = sanitize_javadoc_html(text);
    }
    for (const auto& [name, text] : javadoc->fields) {
        doc.fields[name] = sanitize_javadoc_html(text);
    }
    return doc;
}

} // namespace jstub::stubgen

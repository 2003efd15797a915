#include "stubgen/identifiers.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace jstub::stubgen {

auto is_reserved_word(std::string_view word) -> bool {
    static const std::set<std::string_view> RESERVED = {
        "False",  "None",   "True",    "and",      "as",     "assert", "async",
        "await",  "break",  "class",   "continue", "def",    "del",    "elif",
        "else",   "except", "finally", "for",      "from",   "global", "if",
        "import", "in",     "is",      "lambda",   "nonlocal", "not",  "or",
        "pass",   "raise",  "return",  "try",      "while",  "with",   "yield",
        // Python 2 statements
        "exec",   "print",
    };
    return RESERVED.count(word) > 0;
}

auto pysafe(std::string_view name) -> std::optional<std::string> {
    if (name.size() >= 4 && name.starts_with("__") && name.ends_with("__")) {
        return std::nullopt;
    }
    if (is_reserved_word(name)) {
        return std::string(name) + "_";
    }
    return std::string(name);
}

auto pysafe_package_path(std::string_view path) -> std::string {
    std::string out;
    size_t start = 0;
    while (true) {
        auto dot = path.find('.', start);
        auto segment = path.substr(start, dot == std::string_view::npos ? dot : dot - start);
        out += pysafe(segment).value_or("");
        if (dot == std::string_view::npos) {
            break;
        }
        out += '.';
        start = dot + 1;
    }
    return out;
}

auto is_valid_identifier(std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

/// True if `name` is `base` optionally followed by digits.
static auto is_numbered_variant(const std::string& name, const std::string& base) -> bool {
    if (!name.starts_with(base)) {
        return false;
    }
    return std::all_of(name.begin() + static_cast<std::ptrdiff_t>(base.size()), name.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
}

auto infer_arg_name(const reflect::JavaTypeRef& type, const std::vector<ArgumentSig>& previous)
    -> std::string {
    auto fallback = "arg" + std::to_string(previous.size());
    if (type == nullptr) {
        return fallback;
    }

    std::string type_name = type->type_name();
    bool is_array = type_name.ends_with("[]");

    // java.util.Map$Entry<K, V>[] -> Entry
    std::string base = type_name.substr(0, type_name.find('<'));
    if (auto dollar = base.rfind('$'); dollar != std::string::npos) {
        base = base.substr(dollar + 1);
    }
    if (auto dot = base.rfind('.'); dot != std::string::npos) {
        base = base.substr(dot + 1);
    }
    for (auto pos = base.find("[]"); pos != std::string::npos; pos = base.find("[]")) {
        base.erase(pos, 2);
    }
    if (!base.empty()) {
        base[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(base[0])));
    }
    if (is_array) {
        base += "Array";
    }
    if (!is_valid_identifier(base)) {
        return fallback;
    }

    auto same_type = std::count_if(previous.begin(), previous.end(), [&](const ArgumentSig& arg) {
        return is_numbered_variant(arg.name, base);
    });
    if (same_type == 0) {
        return base;
    }
    return base + std::to_string(same_type + 1);
}

} // namespace jstub::stubgen

//! # Javadoc Overload Splitter Implementation
//!
//! Header patterns are built per overload with `std::regex`. The patterns
//! backtrack heavily on long non-matching input, so only short lines that
//! end in `)` and mention the name followed by `(` are tried.

#include "stubgen/javadoc_splitter.hpp"

#include "log/log.hpp"

#include <optional>
#include <regex>

namespace jstub::stubgen {

namespace {

const std::string IDENTIFIER = R"([a-zA-Z0-9_?]+)";
const std::string TYPE = R"([a-zA-Z0-9_?.,:`~\s]+(<[a-zA-Z0-9_?.,:~\s<>\[\]/=-]+>)?`?(\[\])*\s?)";
const std::string GENERIC_ARG = IDENTIFIER + "( (super " + TYPE + ")| (extends " + TYPE + "))?";
const std::string ARG_SEPARATOR = R"(,\s?)";

constexpr size_t MAX_HEADER_LENGTH = 512;

auto escape_regex(const std::string& text) -> std::string {
    static const std::string SPECIAL = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : text) {
        if (SPECIAL.find(c) != std::string::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

auto repeat_joined(const std::string& item, size_t count) -> std::string {
    std::string out;
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) {
            out += ARG_SEPARATOR;
        }
        out += item;
    }
    return out;
}

auto trim(const std::string& text) -> std::string {
    const char* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    return text.substr(begin, text.find_last_not_of(ws) - begin + 1);
}

/// Header pattern for one overload.
auto header_pattern(const FunctionSig& sig, const std::string& name, bool is_constructor)
    -> std::string {
    std::string pattern = R"((default\s)?(public|protected|private)?\s?)";
    if (sig.is_static) {
        pattern += R"(static\s)";
    }
    if (!sig.type_vars.empty()) {
        pattern += "<" + repeat_joined(GENERIC_ARG, sig.type_vars.size()) + R"(>\s)";
    }
    // Constructor headers carry no return type
    pattern += is_constructor ? "(" + TYPE + ")?" : TYPE;
    pattern += R"(\s?)" + escape_regex(name);

    size_t arg_count = 0;
    for (const auto& arg : sig.args) {
        if (arg.type) {
            ++arg_count;
        }
    }
    pattern += R"(\s?\()" + repeat_joined(TYPE + " " + IDENTIFIER, arg_count) + R"(\))";
    return pattern;
}

/// Simple erased type names written in a header's argument list:
/// `(java.util.List<T> items, String... rest)` -> `List`, `String[]`.
auto header_argument_types(const std::string& line, const std::string& name)
    -> std::vector<std::string> {
    std::vector<std::string> types;
    auto open = line.find('(', line.find(name));
    auto close = line.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close <= open) {
        return types;
    }
    std::string args = line.substr(open + 1, close - open - 1);

    std::vector<std::string> pieces;
    int depth = 0;
    std::string current;
    for (char c : args) {
        if (c == '<') {
            ++depth;
        } else if (c == '>') {
            --depth;
        } else if (c == ',' && depth == 0) {
            pieces.push_back(current);
            current.clear();
            continue;
        }
        current += c;
    }
    if (!trim(current).empty()) {
        pieces.push_back(current);
    }

    for (const auto& piece : pieces) {
        std::string text = trim(piece);
        // Drop the parameter name
        if (auto space = text.find_last_of(" \t"); space != std::string::npos) {
            text = text.substr(0, space);
        }
        std::string type;
        int generic_depth = 0;
        for (char c : text) {
            if (c == '<') {
                ++generic_depth;
            } else if (c == '>') {
                --generic_depth;
            } else if (generic_depth == 0 && c != '`' && c != ' ' && c != '\t') {
                type += c;
            }
        }
        if (auto ellipsis = type.find("..."); ellipsis != std::string::npos) {
            type.replace(ellipsis, 3, "[]");
        }
        if (auto dot = type.rfind('.'); dot != std::string::npos) {
            type = type.substr(dot + 1);
        }
        types.push_back(type);
    }
    return types;
}

auto may_be_header(const std::string& line, const std::string& name) -> bool {
    if (line.size() > MAX_HEADER_LENGTH || line.empty() || line.back() != ')') {
        return false;
    }
    auto pos = line.find(name);
    while (pos != std::string::npos) {
        auto after = line.find_first_not_of(' ', pos + name.size());
        if (after != std::string::npos && line[after] == '(') {
            return true;
        }
        pos = line.find(name, pos + 1);
    }
    return false;
}

} // namespace

auto split_overload_docs(const std::vector<FunctionSig>& signatures, const std::string& doc,
                         const std::string& header_name) -> std::vector<std::string> {
    bool is_constructor = !header_name.empty();

    std::vector<std::optional<std::regex>> patterns;
    for (const auto& sig : signatures) {
        const std::string& name = is_constructor ? header_name : sig.name;
        try {
            patterns.emplace_back(std::regex(header_pattern(sig, name, is_constructor)));
        } catch (const std::regex_error& e) {
            JSTUB_LOG_DEBUG("emitter", "no documentation header pattern for " << name << ": "
                                                                             << e.what());
            patterns.emplace_back(std::nullopt);
        }
    }

    // Index of the overload a header line introduces; an inner nullopt
    // means the header is ambiguous and claims nothing.
    auto match_header = [&](const std::string& line) -> std::optional<std::optional<size_t>> {
        std::vector<size_t> candidates;
        for (size_t i = 0; i < signatures.size(); ++i) {
            const std::string& name = is_constructor ? header_name : signatures[i].name;
            if (!patterns[i] || !may_be_header(line, name)) {
                continue;
            }
            try {
                if (std::regex_match(line, *patterns[i])) {
                    candidates.push_back(i);
                }
            } catch (const std::regex_error& e) {
                JSTUB_LOG_TRACE("emitter", "header match abandoned: " << e.what());
            }
        }
        if (candidates.empty()) {
            return std::nullopt;
        }
        if (candidates.size() == 1) {
            return std::optional<size_t>(candidates.front());
        }

        std::optional<size_t> chosen;
        size_t exact = 0;
        for (size_t index : candidates) {
            const std::string& name = is_constructor ? header_name : signatures[index].name;
            if (header_argument_types(line, name) == signatures[index].source_arg_types) {
                chosen = index;
                ++exact;
            }
        }
        if (exact != 1) {
            JSTUB_LOG_TRACE("emitter", "ambiguous documentation header: " << line);
            return std::optional<size_t>(std::nullopt);
        }
        return chosen;
    };

    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        auto newline = doc.find('\n', start);
        lines.push_back(
            doc.substr(start, newline == std::string::npos ? std::string::npos : newline - start));
        if (newline == std::string::npos) {
            break;
        }
        start = newline + 1;
    }

    std::vector<std::vector<std::string>> buckets(signatures.size());
    std::optional<size_t> current;
    size_t line = 0;
    while (line < lines.size()) {
        if (auto header = match_header(lines[line])) {
            current = *header;
            // The line after a header separates it from the text
            line += 2;
        }
        if (current && line < lines.size()) {
            buckets[*current].push_back(lines[line]);
        }
        ++line;
    }

    std::vector<std::string> result;
    result.reserve(buckets.size());
    for (const auto& bucket : buckets) {
        std::string text;
        for (size_t i = 0; i < bucket.size(); ++i) {
            if (i > 0) {
                text += '\n';
            }
            text += bucket[i];
        }
        result.push_back(std::move(text));
    }
    return result;
}

} // namespace jstub::stubgen

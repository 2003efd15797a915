//! # JSON Parser Implementation
//!
//! Two stages: `JsonLexer` turns the input into tokens, `JsonParser`
//! builds the `JsonValue` tree with a depth limit.

#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace jstub::json {

// ============================================================================
// JsonLexer Implementation
// ============================================================================

JsonLexer::JsonLexer(std::string_view input) : input_(input) {}

auto JsonLexer::peek() const -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    return input_[pos_];
}

auto JsonLexer::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonLexer::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else {
            break;
        }
    }
}

auto JsonLexer::make_token(JsonTokenKind kind, size_t start_pos, size_t start_line,
                           size_t start_col) -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.line = start_line;
    tok.column = start_col;
    tok.offset = start_pos;
    return tok;
}

auto JsonLexer::make_error(std::string msg, size_t start_pos, size_t start_line, size_t start_col)
    -> JsonToken {
    JsonToken tok = make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
    tok.error = std::move(msg);
    return tok;
}

auto JsonLexer::scan_hex4(unsigned int& out) -> bool {
    if (pos_ + 4 > input_.size()) {
        return false;
    }
    std::string_view hex = input_.substr(pos_, 4);
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, out, 16);
    if (ec != std::errc{} || ptr != hex.data() + 4) {
        return false;
    }
    pos_ += 4;
    column_ += 4;
    return true;
}

/// Appends a code point as UTF-8.
static void append_utf8(std::string& out, unsigned int cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto JsonLexer::scan_string() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    advance(); // opening quote

    std::string value;
    while (pos_ < input_.size()) {
        char c = peek();

        if (c == '"') {
            advance();
            JsonToken tok = make_token(JsonTokenKind::String, start_pos, start_line, start_col);
            tok.string_value = std::move(value);
            return tok;
        }

        if (static_cast<unsigned char>(c) < 0x20) {
            return make_error("Control character in string", start_pos, line_, column_);
        }

        if (c != '\\') {
            value += c;
            advance();
            continue;
        }

        advance(); // backslash
        char escaped = advance();
        switch (escaped) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case '/':
            value += '/';
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u': {
            unsigned int cp = 0;
            if (!scan_hex4(cp)) {
                return make_error("Invalid unicode escape sequence", start_pos, line_, column_);
            }
            // Combine UTF-16 surrogate pairs
            if (cp >= 0xD800 && cp <= 0xDBFF && peek() == '\\' && pos_ + 1 < input_.size() &&
                input_[pos_ + 1] == 'u') {
                advance();
                advance();
                unsigned int low = 0;
                if (!scan_hex4(low) || low < 0xDC00 || low > 0xDFFF) {
                    return make_error("Invalid surrogate pair", start_pos, line_, column_);
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            }
            append_utf8(value, cp);
            break;
        }
        default:
            return make_error("Invalid escape sequence: \\" + std::string(1, escaped), start_pos,
                              line_, column_);
        }
    }

    return make_error("Unterminated string", start_pos, start_line, start_col);
}

auto JsonLexer::scan_number() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    bool is_float = false;
    auto is_digit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };

    if (peek() == '-') {
        advance();
    }

    if (peek() == '0') {
        advance();
    } else if (is_digit(peek())) {
        while (is_digit(peek())) {
            advance();
        }
    } else {
        return make_error("Invalid number", start_pos, start_line, start_col);
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!is_digit(peek())) {
            return make_error("Expected digit after decimal point", start_pos, line_, column_);
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!is_digit(peek())) {
            return make_error("Expected digit in exponent", start_pos, line_, column_);
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    std::string num_str(input_.substr(start_pos, pos_ - start_pos));
    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.size(), value);
        if (ec == std::errc{}) {
            JsonToken tok = make_token(JsonTokenKind::IntNumber, start_pos, start_line, start_col);
            tok.int_value = value;
            return tok;
        }
        // Out of int64 range: fall back to double
    }

    JsonToken tok = make_token(JsonTokenKind::FloatNumber, start_pos, start_line, start_col);
    tok.float_value = std::strtod(num_str.c_str(), nullptr);
    return tok;
}

auto JsonLexer::scan_keyword() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    while (std::isalpha(static_cast<unsigned char>(peek()))) {
        advance();
    }

    std::string_view word = input_.substr(start_pos, pos_ - start_pos);
    if (word == "true") {
        return make_token(JsonTokenKind::True, start_pos, start_line, start_col);
    }
    if (word == "false") {
        return make_token(JsonTokenKind::False, start_pos, start_line, start_col);
    }
    if (word == "null") {
        return make_token(JsonTokenKind::Null, start_pos, start_line, start_col);
    }
    return make_error("Unknown keyword: " + std::string(word), start_pos, start_line, start_col);
}

auto JsonLexer::next_token() -> JsonToken {
    skip_whitespace();

    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    if (pos_ >= input_.size()) {
        return make_token(JsonTokenKind::Eof, start_pos, start_line, start_col);
    }

    char c = peek();
    switch (c) {
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace, start_pos, start_line, start_col);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace, start_pos, start_line, start_col);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket, start_pos, start_line, start_col);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket, start_pos, start_line, start_col);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon, start_pos, start_line, start_col);
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma, start_pos, start_line, start_col);
    case '"':
        return scan_string();
    case 't':
    case 'f':
    case 'n':
        return scan_keyword();
    default:
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return scan_number();
        }
        advance();
        return make_error("Unexpected character: " + std::string(1, c), start_pos, start_line,
                          start_col);
    }
}

// ============================================================================
// JsonParser Implementation
// ============================================================================

JsonParser::JsonParser(std::string_view input) : lexer_(input) {
    advance();
}

void JsonParser::advance() {
    current_ = lexer_.next_token();
}

auto JsonParser::check(JsonTokenKind kind) const -> bool {
    return current_.kind == kind;
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, current_.line, current_.column, current_.offset);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }
    if (!check(JsonTokenKind::Eof)) {
        return make_error("Unexpected content after JSON value");
    }
    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    if (depth_ >= MAX_DEPTH) {
        return make_error("Maximum nesting depth exceeded");
    }

    switch (current_.kind) {
    case JsonTokenKind::Null:
        advance();
        return JsonValue();
    case JsonTokenKind::True:
        advance();
        return JsonValue(true);
    case JsonTokenKind::False:
        advance();
        return JsonValue(false);
    case JsonTokenKind::IntNumber: {
        int64_t value = current_.int_value;
        advance();
        return JsonValue(value);
    }
    case JsonTokenKind::FloatNumber: {
        double value = current_.float_value;
        advance();
        return JsonValue(value);
    }
    case JsonTokenKind::String: {
        std::string str = std::move(current_.string_value);
        advance();
        return JsonValue(std::move(str));
    }
    case JsonTokenKind::LBrace:
        return parse_object();
    case JsonTokenKind::LBracket:
        return parse_array();
    case JsonTokenKind::Error:
        return make_error(current_.error);
    case JsonTokenKind::Eof:
        return make_error("Unexpected end of input");
    default:
        return make_error("Unexpected token");
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '{'

    JsonObject obj;
    if (check(JsonTokenKind::RBrace)) {
        advance();
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        if (!check(JsonTokenKind::String)) {
            return make_error(check(JsonTokenKind::Error) ? current_.error
                                                          : "Expected string key in object");
        }
        std::string key = std::move(current_.string_value);
        advance();

        if (!check(JsonTokenKind::Colon)) {
            return make_error("Expected ':' after object key");
        }
        advance();

        auto value_result = parse_value();
        if (is_err(value_result)) {
            return value_result;
        }
        obj[std::move(key)] = std::move(unwrap(value_result));

        if (check(JsonTokenKind::Comma)) {
            advance();
            if (check(JsonTokenKind::RBrace)) {
                return make_error("Trailing comma in object");
            }
        } else if (check(JsonTokenKind::RBrace)) {
            advance();
            --depth_;
            return JsonValue(std::move(obj));
        } else {
            return make_error("Expected ',' or '}' in object");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '['

    JsonArray arr;
    if (check(JsonTokenKind::RBracket)) {
        advance();
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value_result = parse_value();
        if (is_err(value_result)) {
            return value_result;
        }
        arr.push_back(std::move(unwrap(value_result)));

        if (check(JsonTokenKind::Comma)) {
            advance();
            if (check(JsonTokenKind::RBracket)) {
                return make_error("Trailing comma in array");
            }
        } else if (check(JsonTokenKind::RBracket)) {
            advance();
            --depth_;
            return JsonValue(std::move(arr));
        } else {
            return make_error("Expected ',' or ']' in array");
        }
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace jstub::json

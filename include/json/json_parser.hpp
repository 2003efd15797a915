//! # JSON Parser
//!
//! Lexer and recursive descent parser producing `JsonValue` trees from
//! reflection dump files.
//!
//! ## Features
//!
//! - **Integer detection**: numbers without decimals/exponents stay integers
//! - **Precise errors**: every error reports line and column
//! - **Depth limiting**: deeply nested input cannot overflow the stack
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"name": "java.util.List", "modifiers": 1537})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     json.get("modifiers")->as_i64(); // 1537
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace jstub::json {

// ============================================================================
// Lexer
// ============================================================================

/// Token types for the JSON lexer (RFC 8259).
enum class JsonTokenKind : uint8_t {
    LBrace,      ///< `{`
    RBrace,      ///< `}`
    LBracket,    ///< `[`
    RBracket,    ///< `]`
    Colon,       ///< `:`
    Comma,       ///< `,`
    String,      ///< `"..."`
    IntNumber,   ///< `123`, `-456`
    FloatNumber, ///< `1.5`, `1e10`
    True,        ///< `true`
    False,       ///< `false`
    Null,        ///< `null`
    Eof,         ///< End of input
    Error        ///< Lexer error; see `error`
};

/// A token produced by the JSON lexer.
struct JsonToken {
    JsonTokenKind kind = JsonTokenKind::Eof;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;
    std::string string_value; ///< Unescaped content of `String` tokens
    int64_t int_value = 0;    ///< Value of `IntNumber` tokens
    double float_value = 0;   ///< Value of `FloatNumber` tokens
    std::string error;        ///< Message of `Error` tokens
};

/// JSON lexer over a string view. The input must outlive the lexer.
class JsonLexer {
public:
    explicit JsonLexer(std::string_view input);

    /// Returns the next token; `Eof` once the input is exhausted.
    auto next_token() -> JsonToken;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    auto make_token(JsonTokenKind kind, size_t start_pos, size_t start_line, size_t start_col)
        -> JsonToken;
    auto make_error(std::string msg, size_t start_pos, size_t start_line, size_t start_col)
        -> JsonToken;
    auto scan_string() -> JsonToken;
    auto scan_number() -> JsonToken;
    auto scan_keyword() -> JsonToken;
    auto scan_hex4(unsigned int& out) -> bool;
};

// ============================================================================
// Parser
// ============================================================================

/// Recursive descent JSON parser.
class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    /// Parses exactly one JSON value followed by end of input.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    JsonLexer lexer_;
    JsonToken current_;
    static constexpr size_t MAX_DEPTH = 512;
    size_t depth_ = 0;

    void advance();
    [[nodiscard]] auto check(JsonTokenKind kind) const -> bool;
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;
    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
};

/// Parses a JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace jstub::json

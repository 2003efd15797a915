//! # JSON Error Types
//!
//! Error type for parsing reflection dumps. Errors carry the source
//! location so a malformed dump can be fixed by hand.
//!
//! ## Example
//!
//! ```cpp
//! auto error = JsonError::make("Unexpected token", 5, 12);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "line 5, column 12: Unexpected token"
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace jstub::json {

/// An error encountered while parsing JSON.
///
/// Location fields are 1-based; 0 means unknown.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats the error as `"line X, column Y: message"`, omitting unknown parts.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace jstub::json

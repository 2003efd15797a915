//! # Generation Errors
//!
//! Errors that abort a generation run: root package enumeration failures
//! and output I/O failures. Everything else is recoverable and only logged.

#ifndef JSTUB_STUBGEN_GENERATE_ERROR_HPP
#define JSTUB_STUBGEN_GENERATE_ERROR_HPP

#include <string>

namespace jstub::stubgen {

struct GenerateError {
    std::string message;
    std::string path; ///< Output path or package the error is about; may be empty

    [[nodiscard]] auto to_string() const -> std::string {
        return path.empty() ? message : path + ": " + message;
    }
};

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_GENERATE_ERROR_HPP

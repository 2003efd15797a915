//! # JSON Value Types
//!
//! `JsonValue` is the variant type for every JSON value read from a
//! reflection dump. Integers without a decimal point or exponent keep
//! full `int64_t` precision (modifier bit sets are stored this way).
//!
//! ## Example
//!
//! ```cpp
//! JsonValue obj(JsonObject{});
//! obj.set("name", JsonValue("java.util.List"));
//! if (const auto* name = obj.get("name"); name && name->is_string()) {
//!     std::cout << name->as_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jstub::json {

struct JsonValue;

/// A JSON array containing ordered values.
using JsonArray = std::vector<JsonValue>;

/// A JSON object containing key-value pairs (ordered by key).
using JsonObject = std::map<std::string, JsonValue>;

/// JSON value variant type.
///
/// | JSON Type | C++ Storage | Query | Accessor |
/// |-----------|-------------|-------|----------|
/// | `null` | `std::monostate` | `is_null()` | - |
/// | `true/false` | `bool` | `is_bool()` | `as_bool()` |
/// | integer | `int64_t` | `is_integer()` | `as_i64()` |
/// | float | `double` | `is_number()` | `as_f64()` |
/// | string | `std::string` | `is_string()` | `as_string()` |
/// | array | `Box<JsonArray>` | `is_array()` | `as_array()` |
/// | object | `Box<JsonObject>` | `is_object()` | `as_object()`, `get()` |
///
/// Arrays and objects are boxed to allow recursive structures, which makes
/// `JsonValue` move-only.
struct JsonValue {
    using Null = std::monostate;

    using ValueVariant = std::variant<Null,             // null
                                      bool,             // boolean
                                      int64_t,          // integer
                                      double,           // float
                                      std::string,      // string
                                      Box<JsonArray>,   // array (boxed)
                                      Box<JsonObject>>; // object (boxed)

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(static_cast<int64_t>(value)) {}
    explicit JsonValue(int64_t value) : data(value) {}
    explicit JsonValue(double value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }

    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }

    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(data);
    }

    /// Returns `true` for integers and floats.
    [[nodiscard]] auto is_number() const -> bool {
        return is_integer() || std::holds_alternative<double>(data);
    }

    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }

    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // ========================================================================
    // Accessors
    // ========================================================================
    // All accessors throw std::bad_variant_access on a type mismatch; check
    // with the matching is_*() first.

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }

    [[nodiscard]] auto as_i64() const -> int64_t {
        return std::get<int64_t>(data);
    }

    /// Integers are widened to double.
    [[nodiscard]] auto as_f64() const -> double {
        if (is_integer()) {
            return static_cast<double>(std::get<int64_t>(data));
        }
        return std::get<double>(data);
    }

    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }

    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }

    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Looks up a key in an object. Returns nullptr if this is not an object
    /// or the key is absent.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (const auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Number of elements (array) or members (object); 0 otherwise.
    [[nodiscard]] auto size() const -> size_t;

    /// Inserts or replaces a member. This value must be an object.
    void set(const std::string& key, JsonValue value) {
        (*std::get<Box<JsonObject>>(data))[key] = std::move(value);
    }

    /// Appends an element. This value must be an array.
    void push(JsonValue value) {
        std::get<Box<JsonArray>>(data)->push_back(std::move(value));
    }

    /// Human-readable name of the stored JSON type ("string", "object", ...).
    [[nodiscard]] auto type_name() const -> const char*;
};

} // namespace jstub::json

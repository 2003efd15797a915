//! # JSON Value Implementation

#include "json/json_value.hpp"

namespace jstub::json {

auto JsonValue::size() const -> size_t {
    if (is_array()) {
        return as_array().size();
    }
    if (is_object()) {
        return as_object().size();
    }
    return 0;
}

auto JsonValue::type_name() const -> const char* {
    if (is_null()) {
        return "null";
    }
    if (is_bool()) {
        return "boolean";
    }
    if (is_number()) {
        return "number";
    }
    if (is_string()) {
        return "string";
    }
    if (is_array()) {
        return "array";
    }
    return "object";
}

} // namespace jstub::json

/**
 * @file Value.hpp
 * @brief Value type for configuration documents
 *
 * Uses nlohmann::ordered_json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion order preserved)
 */

#ifndef STRATA_VALUE_HPP
#define STRATA_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace strata {

/**
 * @brief JSON-like value type for configuration documents
 *
 * Alias for nlohmann::ordered_json. The ordered variant keeps object keys
 * in insertion order, so a merged document lists keys in the order they
 * were first seen across the layers. Equality of two objects is sensitive
 * to that order.
 *
 * See nlohmann::json documentation for the complete API.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief The six kinds a document node can have
 *
 * Integer, unsigned and floating point numbers are all Number. Two values
 * of the same kind are "same-shape" for the merge engine.
 */
enum class ValueKind {
    Null,
    Boolean,
    Number,
    String,
    Sequence,
    Mapping
};

/**
 * @brief Classify a value into its ValueKind
 *
 * The library's binary tag is never produced by the loaders and is treated
 * as an opaque String-kind scalar.
 */
inline ValueKind kind_of(const Value& val) {
    switch (val.type()) {
        case Value::value_t::null:
        case Value::value_t::discarded:
            return ValueKind::Null;
        case Value::value_t::boolean:
            return ValueKind::Boolean;
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float:
            return ValueKind::Number;
        case Value::value_t::string:
        case Value::value_t::binary:
            return ValueKind::String;
        case Value::value_t::array:
            return ValueKind::Sequence;
        case Value::value_t::object:
            return ValueKind::Mapping;
    }
    return ValueKind::Null;
}

/**
 * @brief Name of a ValueKind ("null", "boolean", "number", "string",
 *        "sequence", "mapping")
 */
inline const char* kind_name(ValueKind kind) {
    switch (kind) {
        case ValueKind::Null: return "null";
        case ValueKind::Boolean: return "boolean";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Mapping: return "mapping";
    }
    return "unknown";
}

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string ("null", "boolean", "integer", "float",
 *         "string", "sequence", "mapping")
 *
 * Finer than kind_name(): integers and floats are told apart, which is
 * what an operator wants to read in a diagnostic.
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "sequence";
    if (val.is_object()) return "mapping";
    return "binary";
}

/**
 * @brief Check if value is a container (sequence or mapping)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace strata

#endif // STRATA_VALUE_HPP

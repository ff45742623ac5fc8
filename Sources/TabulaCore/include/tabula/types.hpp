#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tabula {

// Timestamp type (microsecond resolution on the wire)
using timestamp_t = std::chrono::system_clock::time_point;

// Duration type, stored as a microsecond count
using duration_t = std::chrono::microseconds;

// Raw binary payload
using blob_t = std::vector<uint8_t>;

// Row identifier returned by a store on insert
using row_id_t = int64_t;

// Values a store accepts and hands back
using wire_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string,
    blob_t
>;

// Scalar element held by scalar members and scalar lists
using scalar_t = std::variant<
    int64_t,
    double,
    std::string
>;

// A flat record: column name -> wire value
using row_t = std::unordered_map<std::string, wire_value_t>;

// Storage type tag used when describing a table
enum class column_type {
    integer,
    real,
    text,
    blob,
    bigint
};

inline const char* column_type_name(column_type type) {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
        case column_type::blob: return "BLOB";
        case column_type::bigint: return "BIGINT";
    }
    return "TEXT";
}

// Human readable name of the alternative held by a wire value (for error messages)
inline const char* wire_type_name(const wire_value_t& value) {
    switch (value.index()) {
        case 0: return "null";
        case 1: return "integer";
        case 2: return "real";
        case 3: return "text";
        case 4: return "blob";
        default: return "unknown";
    }
}

inline wire_value_t to_wire_value(const scalar_t& value) {
    return std::visit([](const auto& v) -> wire_value_t { return v; }, value);
}

} // namespace tabula

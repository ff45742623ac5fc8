#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

// ============================================================================
// nlohmann::json bridge for wire values
//
// List and nested-object members are stored as JSON text. Nested maps carry
// wire values, so the variants get adl_serializer specializations here.
// ============================================================================

namespace nlohmann {

template<>
struct adl_serializer<tabula::wire_value_t> {
    static void to_json(json& j, const tabula::wire_value_t& value);
    static void from_json(const json& j, tabula::wire_value_t& value);
};

template<>
struct adl_serializer<tabula::scalar_t> {
    static void to_json(json& j, const tabula::scalar_t& value);
    static void from_json(const json& j, tabula::scalar_t& value);
};

} // namespace nlohmann

namespace tabula {
namespace detail {

    // Parse JSON text stored under `key`; malformed text raises decode_error.
    nlohmann::json parse_json(const std::string& text, const std::string& key);

    // Serialize JSON for member `key`; text that is not valid UTF-8 raises encode_error.
    std::string dump_json(const nlohmann::json& j, const std::string& key);

    // Non-finite reals have no JSON form and raise encode_error.
    nlohmann::json row_to_json(const row_t& row, const std::string& key);

    // Expects a JSON object; anything else raises decode_error.
    row_t json_to_row(const nlohmann::json& j, const std::string& key);

} // namespace detail
} // namespace tabula

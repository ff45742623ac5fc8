#include "tabula/json.hpp"
#include "tabula/errors.hpp"
#include "tabula/log.hpp"
#include <cmath>

namespace nlohmann {

void adl_serializer<tabula::wire_value_t>::to_json(json& j, const tabula::wire_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            j = nullptr;
        } else if constexpr (std::is_same_v<T, tabula::blob_t>) {
            // Blobs nest as an array of byte values
            j = json::array();
            for (auto byte : v) {
                j.push_back(static_cast<unsigned>(byte));
            }
        } else {
            j = v;
        }
    }, value);
}

void adl_serializer<tabula::wire_value_t>::from_json(const json& j, tabula::wire_value_t& value) {
    switch (j.type()) {
        case json::value_t::null:
            value = nullptr;
            break;
        case json::value_t::boolean:
            value = static_cast<int64_t>(j.get<bool>() ? 1 : 0);
            break;
        case json::value_t::number_integer:
            value = j.get<int64_t>();
            break;
        case json::value_t::number_unsigned:
            value = static_cast<int64_t>(j.get<uint64_t>());
            break;
        case json::value_t::number_float:
            value = j.get<double>();
            break;
        case json::value_t::string:
            value = j.get<std::string>();
            break;
        case json::value_t::binary:
            value = tabula::blob_t(j.get_binary().begin(), j.get_binary().end());
            break;
        case json::value_t::array: {
            tabula::blob_t bytes;
            bytes.reserve(j.size());
            for (const auto& element : j) {
                if (!element.is_number_integer()) {
                    throw tabula::decode_error("Nested array is not a byte sequence: " + j.dump());
                }
                auto byte = element.get<int64_t>();
                if (byte < 0 || byte > 255) {
                    throw tabula::decode_error("Nested array is not a byte sequence: " + j.dump());
                }
                bytes.push_back(static_cast<uint8_t>(byte));
            }
            value = std::move(bytes);
            break;
        }
        default:
            throw tabula::decode_error("Unsupported nested JSON value: " + j.dump());
    }
}

void adl_serializer<tabula::scalar_t>::to_json(json& j, const tabula::scalar_t& value) {
    std::visit([&](auto&& v) { j = v; }, value);
}

void adl_serializer<tabula::scalar_t>::from_json(const json& j, tabula::scalar_t& value) {
    if (j.is_number_integer()) {
        value = j.get<int64_t>();
    } else if (j.is_number_float()) {
        value = j.get<double>();
    } else if (j.is_string()) {
        value = j.get<std::string>();
    } else {
        throw tabula::decode_error("List element is not a scalar: " + j.dump());
    }
}

} // namespace nlohmann

namespace tabula {
namespace detail {

nlohmann::json parse_json(const std::string& text, const std::string& key) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_ERROR("json", "Malformed JSON in '%s': %s", key.c_str(), e.what());
        throw decode_error("Malformed JSON in '" + key + "': " + e.what());
    }
}

std::string dump_json(const nlohmann::json& j, const std::string& key) {
    try {
        return j.dump();
    } catch (const nlohmann::json::type_error& e) {
        LOG_ERROR("json", "Cannot write JSON for '%s': %s", key.c_str(), e.what());
        throw encode_error("Cannot write JSON for '" + key + "': " + e.what());
    }
}

nlohmann::json row_to_json(const row_t& row, const std::string& key) {
    auto j = nlohmann::json::object();
    for (const auto& [column, value] : row) {
        if (auto* d = std::get_if<double>(&value); d && !std::isfinite(*d)) {
            LOG_ERROR("json", "Non-finite real in '%s.%s'", key.c_str(), column.c_str());
            throw encode_error("Non-finite real in '" + key + "." + column + "' has no JSON form");
        }
        j[column] = value;
    }
    return j;
}

row_t json_to_row(const nlohmann::json& j, const std::string& key) {
    if (!j.is_object()) {
        LOG_ERROR("json", "Expected a JSON object in '%s', got %s", key.c_str(), j.type_name());
        throw decode_error("Expected a JSON object in '" + key + "'");
    }
    row_t row;
    for (const auto& [column, value] : j.items()) {
        row[column] = value.get<wire_value_t>();
    }
    return row;
}

} // namespace detail
} // namespace tabula

#include "tabula/members.hpp"
#include "tabula/json.hpp"
#include "tabula/log.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <string_view>
#include <typeinfo>

namespace tabula {

// ============================================================================
// ISO-8601 helpers
// ============================================================================

namespace detail {

std::string format_iso8601(timestamp_t value) {
    using namespace std::chrono;
    auto micros = time_point_cast<microseconds>(value);
    auto midnight = floor<days>(micros);
    year_month_day ymd{midnight};
    hh_mm_ss<microseconds> tod{micros - midnight};

    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02d.%06lldZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()),
                  static_cast<long long>(tod.subseconds().count()));
    return buffer;
}

namespace {

// Reads exactly `width` digits starting at pos
bool read_digits(std::string_view text, std::size_t& pos, std::size_t width, int& out) {
    if (pos + width > text.size()) return false;
    int value = 0;
    for (std::size_t i = 0; i < width; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += width;
    out = value;
    return true;
}

bool expect(std::string_view text, std::size_t& pos, char c) {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

} // namespace

std::optional<timestamp_t> parse_iso8601(const std::string& input) {
    using namespace std::chrono;
    std::string_view text(input);
    std::size_t pos = 0;

    int y = 0, mo = 0, d = 0;
    if (!read_digits(text, pos, 4, y) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, mo) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, d)) {
        return std::nullopt;
    }

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;

    int h = 0, mi = 0, s = 0;
    int64_t fraction_us = 0;
    minutes offset{0};

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' ')) {
        ++pos;
        if (!read_digits(text, pos, 2, h) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, mi)) {
            return std::nullopt;
        }
        if (expect(text, pos, ':')) {
            if (!read_digits(text, pos, 2, s)) return std::nullopt;
            if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
                ++pos;
                std::size_t digits = 0;
                while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                    if (digits < 6) {
                        fraction_us = fraction_us * 10 + (text[pos] - '0');
                    }
                    ++digits;
                    ++pos;
                }
                if (digits == 0) return std::nullopt;
                for (std::size_t i = digits; i < 6; ++i) {
                    fraction_us *= 10;
                }
            }
        }
        if (h > 23 || mi > 59 || s > 59) return std::nullopt;

        if (pos < text.size()) {
            char zone = text[pos];
            if (zone == 'Z' || zone == 'z') {
                ++pos;
            } else if (zone == '+' || zone == '-') {
                ++pos;
                int oh = 0, om = 0;
                if (!read_digits(text, pos, 2, oh)) return std::nullopt;
                if (expect(text, pos, ':')) {
                    if (!read_digits(text, pos, 2, om)) return std::nullopt;
                } else if (pos < text.size()) {
                    if (!read_digits(text, pos, 2, om)) return std::nullopt;
                }
                if (oh > 23 || om > 59) return std::nullopt;
                offset = hours{oh} + minutes{om};
                if (zone == '-') offset = -offset;
            }
        }
    }

    if (pos != text.size()) return std::nullopt;

    sys_days date{ymd};
    auto local = time_point_cast<microseconds>(date) + hours{h} + minutes{mi} + seconds{s} +
                 microseconds{fraction_us};
    return time_point_cast<system_clock::duration>(local - offset);
}

std::string wire_to_text(const wire_value_t& value) {
    return std::visit([](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + v + "'";
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return "<blob " + std::to_string(v.size()) + " bytes>";
        } else {
            return std::to_string(v);
        }
    }, value);
}

std::size_t hash_wire(const wire_value_t& value) {
    auto seed = std::hash<std::size_t>{}(value.index());
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return;
        } else if constexpr (std::is_same_v<T, blob_t>) {
            std::string_view view(reinterpret_cast<const char*>(v.data()), v.size());
            hash_combine(seed, std::hash<std::string_view>{}(view));
        } else {
            hash_combine(seed, std::hash<T>{}(v));
        }
    }, value);
    return seed;
}

} // namespace detail

// ============================================================================
// serializable
// ============================================================================

bool serializable::equals(const serializable& other) const {
    if (this == &other) return true;
    return typeid(*this) == typeid(other) && to_row() == other.to_row();
}

std::size_t serializable::hash_value() const {
    std::size_t seed = std::hash<std::string>{}(typeid(*this).name());
    // row_t is unordered; combine entries order-independently
    std::size_t entries = 0;
    for (const auto& [column, value] : to_row()) {
        auto entry = std::hash<std::string>{}(column);
        detail::hash_combine(entry, detail::hash_wire(value));
        entries += entry;
    }
    detail::hash_combine(seed, entries);
    return seed;
}

// ============================================================================
// scalar_member
// ============================================================================

void scalar_member::from_wire(const wire_value_t& wire) {
    switch (value_.index()) {
        case 0:
            if (auto* i = std::get_if<int64_t>(&wire)) {
                value_ = *i;
                return;
            }
            reject(wire, "integer");
        case 1:
            if (auto* d = std::get_if<double>(&wire)) {
                value_ = *d;
                return;
            }
            // SQLite hands whole REAL values back as integers when the column affinity allows it
            if (auto* i = std::get_if<int64_t>(&wire)) {
                value_ = static_cast<double>(*i);
                return;
            }
            reject(wire, "real");
        default:
            if (auto* s = std::get_if<std::string>(&wire)) {
                value_ = *s;
                return;
            }
            reject(wire, "text");
    }
}

column_type scalar_member::type() const noexcept {
    switch (value_.index()) {
        case 0: return column_type::integer;
        case 1: return column_type::real;
        default: return column_type::text;
    }
}

std::size_t scalar_member::hash() const {
    auto seed = header_hash();
    detail::hash_combine(seed, std::hash<scalar_t>{}(value_));
    return seed;
}

// ============================================================================
// enum_member
// ============================================================================

int64_t enum_member::ordinal_of(int64_t underlying) const {
    auto it = std::find(values_.begin(), values_.end(), underlying);
    if (it == values_.end()) {
        LOG_ERROR("member", "Enum value %lld is not in the value list of '%s'",
                  static_cast<long long>(underlying), key_.c_str());
        throw type_mismatch_error("Enum member '" + key_ + "' value is not in its value list");
    }
    return static_cast<int64_t>(it - values_.begin());
}

void enum_member::set_value(int64_t ordinal) {
    if (ordinal < 0 || (!values_.empty() && ordinal >= static_cast<int64_t>(values_.size()))) {
        LOG_ERROR("member", "Enum ordinal %lld out of range for '%s'",
                  static_cast<long long>(ordinal), key_.c_str());
        throw type_mismatch_error("Enum ordinal " + std::to_string(ordinal) +
                                  " out of range for '" + key_ + "'");
    }
    value_ = ordinal;
}

void enum_member::from_wire(const wire_value_t& wire) {
    auto* ordinal = std::get_if<int64_t>(&wire);
    if (!ordinal) reject(wire, "integer ordinal");

    if (*ordinal < 0 ||
        (!values_.empty() && *ordinal >= static_cast<int64_t>(values_.size()))) {
        LOG_ERROR("member", "Enum ordinal %lld out of range for '%s'",
                  static_cast<long long>(*ordinal), key_.c_str());
        throw decode_error("Enum ordinal " + std::to_string(*ordinal) +
                           " out of range for '" + key_ + "'");
    }
    value_ = *ordinal;
}

std::size_t enum_member::hash() const {
    auto seed = header_hash();
    detail::hash_combine(seed, std::hash<int64_t>{}(value_));
    return seed;
}

// ============================================================================
// bool_member
// ============================================================================

void bool_member::from_wire(const wire_value_t& wire) {
    auto* i = std::get_if<int64_t>(&wire);
    if (!i) reject(wire, "integer");
    value_ = *i != 0;
}

std::size_t bool_member::hash() const {
    auto seed = header_hash();
    detail::hash_combine(seed, std::hash<bool>{}(value_));
    return seed;
}

// ============================================================================
// binary_member
// ============================================================================

void binary_member::from_wire(const wire_value_t& wire) {
    auto* bytes = std::get_if<blob_t>(&wire);
    if (!bytes) reject(wire, "blob");
    value_ = *bytes;
}

std::size_t binary_member::hash() const {
    auto seed = header_hash();
    std::string_view view(reinterpret_cast<const char*>(value_.data()), value_.size());
    detail::hash_combine(seed, std::hash<std::string_view>{}(view));
    return seed;
}

// ============================================================================
// timestamp_member
// ============================================================================

void timestamp_member::from_wire(const wire_value_t& wire) {
    auto* text = std::get_if<std::string>(&wire);
    if (!text) reject(wire, "ISO-8601 text");

    auto parsed = detail::parse_iso8601(*text);
    if (!parsed) {
        LOG_ERROR("member", "Invalid date '%s' for '%s'", text->c_str(), key_.c_str());
        throw decode_error("Invalid date format for '" + key_ + "': " + *text);
    }
    value_ = detail::floor_to_micros(*parsed);
}

std::size_t timestamp_member::hash() const {
    auto seed = header_hash();
    detail::hash_combine(seed, std::hash<int64_t>{}(
        std::chrono::duration_cast<std::chrono::microseconds>(value_.time_since_epoch()).count()));
    return seed;
}

// ============================================================================
// duration_member
// ============================================================================

void duration_member::from_wire(const wire_value_t& wire) {
    auto* micros = std::get_if<int64_t>(&wire);
    if (!micros) reject(wire, "integer microseconds");
    value_ = duration_t{*micros};
}

std::size_t duration_member::hash() const {
    auto seed = header_hash();
    detail::hash_combine(seed, std::hash<int64_t>{}(value_.count()));
    return seed;
}

// ============================================================================
// scalar_list_member
// ============================================================================

wire_value_t scalar_list_member::to_wire() const {
    for (const auto& element : value_) {
        if (auto* d = std::get_if<double>(&element); d && !std::isfinite(*d)) {
            LOG_ERROR("member", "Non-finite real in list '%s'", key_.c_str());
            throw encode_error("List member '" + key_ + "' holds a non-finite real, which has no JSON form");
        }
    }
    return detail::dump_json(nlohmann::json(value_), key_);
}

void scalar_list_member::from_wire(const wire_value_t& wire) {
    auto* text = std::get_if<std::string>(&wire);
    if (!text) reject(wire, "JSON text");

    auto j = detail::parse_json(*text, key_);
    if (!j.is_array()) {
        throw decode_error("Member '" + key_ + "' expected a JSON array: " + *text);
    }
    std::vector<scalar_t> list;
    list.reserve(j.size());
    for (const auto& element : j) {
        list.push_back(element.get<scalar_t>());
    }
    value_ = std::move(list);
}

std::size_t scalar_list_member::hash() const {
    auto seed = header_hash();
    for (const auto& element : value_) {
        detail::hash_combine(seed, std::hash<scalar_t>{}(element));
    }
    return seed;
}

// ============================================================================
// object_member
// ============================================================================

wire_value_t object_member::to_wire() const {
    if (!value_) {
        return nlohmann::json(nullptr).dump();
    }
    return detail::dump_json(detail::row_to_json(value_->to_row(), key_), key_);
}

void object_member::from_wire(const wire_value_t& wire) {
    auto* text = std::get_if<std::string>(&wire);
    if (!text) reject(wire, "JSON text");

    auto j = detail::parse_json(*text, key_);
    if (j.is_null()) {
        value_.reset();
        return;
    }
    auto object = factory_();
    object->from_row(detail::json_to_row(j, key_));
    value_ = std::move(object);
}

bool object_member::operator==(const object_member& other) const {
    if (key_ != other.key_ || primary_ != other.primary_) return false;
    if (!value_ || !other.value_) return !value_ && !other.value_;
    return value_->equals(*other.value_);
}

std::size_t object_member::hash() const {
    auto seed = header_hash();
    detail::hash_combine(seed, value_ ? value_->hash_value() : 0);
    return seed;
}

// ============================================================================
// object_list_member
// ============================================================================

wire_value_t object_list_member::to_wire() const {
    auto j = nlohmann::json::array();
    for (const auto& element : value_) {
        j.push_back(element ? detail::row_to_json(element->to_row(), key_) : nlohmann::json(nullptr));
    }
    return detail::dump_json(j, key_);
}

void object_list_member::from_wire(const wire_value_t& wire) {
    auto* text = std::get_if<std::string>(&wire);
    if (!text) reject(wire, "JSON text");

    auto j = detail::parse_json(*text, key_);
    if (!j.is_array()) {
        throw decode_error("Member '" + key_ + "' expected a JSON array: " + *text);
    }
    std::vector<serializable_ptr> list;
    list.reserve(j.size());
    for (const auto& element : j) {
        auto object = factory_();
        object->from_row(detail::json_to_row(element, key_));
        list.push_back(std::move(object));
    }
    value_ = std::move(list);
}

bool object_list_member::operator==(const object_list_member& other) const {
    if (key_ != other.key_ || primary_ != other.primary_ || value_.size() != other.value_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < value_.size(); ++i) {
        const auto& a = value_[i];
        const auto& b = other.value_[i];
        if (!a || !b) {
            if (a || b) return false;
        } else if (!a->equals(*b)) {
            return false;
        }
    }
    return true;
}

std::size_t object_list_member::hash() const {
    auto seed = header_hash();
    for (const auto& element : value_) {
        detail::hash_combine(seed, element ? element->hash_value() : 0);
    }
    return seed;
}

// ============================================================================
// db_member
// ============================================================================

const std::string& db_member::key() const noexcept {
    return std::visit([](const auto& m) -> const std::string& { return m.key(); }, kind_);
}

bool db_member::primary() const noexcept {
    return std::visit([](const auto& m) { return m.primary(); }, kind_);
}

column_type db_member::type() const noexcept {
    return std::visit([](const auto& m) { return m.type(); }, kind_);
}

wire_value_t db_member::to_wire() const {
    return std::visit([](const auto& m) -> wire_value_t { return m.to_wire(); }, kind_);
}

void db_member::from_wire(const wire_value_t& wire) {
    std::visit([&](auto& m) { m.from_wire(wire); }, kind_);
}

std::size_t db_member::hash() const {
    auto seed = std::hash<std::size_t>{}(kind_.index());
    detail::hash_combine(seed, std::visit([](const auto& m) { return m.hash(); }, kind_));
    return seed;
}

} // namespace tabula

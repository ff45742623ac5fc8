#pragma once

#include "types.hpp"
#include "errors.hpp"
#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace tabula {

// ============================================================================
// serializable - anything that can live inside an object / object-list member
// ============================================================================

class serializable {
public:
    virtual ~serializable() = default;

    /// Convert an object into a map of name/value pairs.
    virtual row_t to_row() const = 0;

    /// Populate this object from a map of name/value pairs.
    virtual void from_row(const row_t& row) = 0;

    /// Same dynamic type and equal rows. Records compare member by member.
    virtual bool equals(const serializable& other) const;
    virtual std::size_t hash_value() const;
};

using serializable_ptr = std::shared_ptr<const serializable>;

// Zero-argument factory for a nested type
using serializable_factory = std::function<std::shared_ptr<serializable>()>;

namespace detail {

    inline void hash_combine(std::size_t& seed, std::size_t value) {
        seed ^= value + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }

    // ISO-8601 text, UTC, microsecond precision: 2024-05-01T12:30:00.000000Z
    std::string format_iso8601(timestamp_t value);

    // Accepts date, date + time, optional fraction and zone. nullopt on bad input.
    std::optional<timestamp_t> parse_iso8601(const std::string& text);

    inline timestamp_t floor_to_micros(timestamp_t value) {
        return std::chrono::time_point_cast<std::chrono::microseconds>(value);
    }

    template<typename V>
    scalar_t to_scalar(V value) {
        using U = std::decay_t<V>;
        if constexpr (std::is_same_v<U, scalar_t>) {
            return value;
        } else if constexpr (std::is_integral_v<U> && !std::is_same_v<U, bool>) {
            return static_cast<int64_t>(value);
        } else if constexpr (std::is_floating_point_v<U>) {
            return static_cast<double>(value);
        } else {
            static_assert(std::is_convertible_v<U, std::string>, "scalar members hold integers, reals or text");
            return std::string(std::move(value));
        }
    }

    std::string wire_to_text(const wire_value_t& value);

    std::size_t hash_wire(const wire_value_t& value);

} // namespace detail

// ============================================================================
// basic_member - attributes shared by every field kind
// ============================================================================

template<typename V>
class basic_member {
public:
    using value_type = V;

    const std::string& key() const noexcept { return key_; }
    bool primary() const noexcept { return primary_; }
    const V& value() const noexcept { return value_; }
    void set_value(V value) { value_ = std::move(value); }

protected:
    basic_member(std::string key, V value, bool primary)
        : key_(std::move(key)), value_(std::move(value)), primary_(primary) {}

    [[noreturn]] void reject(const wire_value_t& wire, const char* expected) const {
        throw decode_error("Member '" + key_ + "' expected " + expected +
                           " but the store returned " + wire_type_name(wire));
    }

    std::size_t header_hash() const {
        std::size_t seed = std::hash<std::string>{}(key_);
        detail::hash_combine(seed, std::hash<bool>{}(primary_));
        return seed;
    }

    std::string key_;
    V value_;
    bool primary_;
};

// ============================================================================
// Field kinds
// ============================================================================

/// int, double, or string
class scalar_member : public basic_member<scalar_t> {
public:
    template<typename V>
    scalar_member(std::string key, V value, bool primary = false)
        : basic_member(std::move(key), detail::to_scalar(std::move(value)), primary) {}

    wire_value_t to_wire() const { return to_wire_value(value_); }
    void from_wire(const wire_value_t& wire);
    column_type type() const noexcept;

    bool operator==(const scalar_member& other) const {
        return key_ == other.key_ && primary_ == other.primary_ && value_ == other.value_;
    }
    std::size_t hash() const;
};

/// An enumeration stored as its position in a caller-supplied ordered value list
class enum_member : public basic_member<int64_t> {
public:
    template<typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
    enum_member(std::string key, E value, const std::vector<E>& values, bool primary = false)
        : basic_member(std::move(key), 0, primary) {
        values_.reserve(values.size());
        for (auto v : values) {
            values_.push_back(static_cast<int64_t>(v));
        }
        value_ = ordinal_of(static_cast<int64_t>(value));
    }

    /// Without a value list only the raw ordinal round-trips.
    enum_member(std::string key, int64_t ordinal, bool primary = false)
        : basic_member(std::move(key), ordinal, primary) {}

    int64_t ordinal() const noexcept { return value_; }
    bool has_values() const noexcept { return !values_.empty(); }

    /// Set the raw ordinal; it must index the value list when there is one.
    void set_value(int64_t ordinal);

    template<typename E>
    E as() const {
        static_assert(std::is_enum_v<E>, "as<E>() requires an enum type");
        if (values_.empty()) {
            throw type_mismatch_error("Enum member '" + key_ + "' has no value list");
        }
        if (value_ < 0 || value_ >= static_cast<int64_t>(values_.size())) {
            throw type_mismatch_error("Enum member '" + key_ + "' ordinal " +
                                      std::to_string(value_) + " is outside its value list");
        }
        return static_cast<E>(values_[static_cast<std::size_t>(value_)]);
    }

    template<typename E>
    void assign(E value) {
        static_assert(std::is_enum_v<E>, "assign() requires an enum type");
        value_ = ordinal_of(static_cast<int64_t>(value));
    }

    wire_value_t to_wire() const { return value_; }
    void from_wire(const wire_value_t& wire);
    column_type type() const noexcept { return column_type::integer; }

    bool operator==(const enum_member& other) const {
        return key_ == other.key_ && primary_ == other.primary_ &&
               value_ == other.value_ && values_ == other.values_;
    }
    std::size_t hash() const;

private:
    int64_t ordinal_of(int64_t underlying) const;

    std::vector<int64_t> values_;
};

/// Stored as 0 / 1; any nonzero integer reads back as true
class bool_member : public basic_member<bool> {
public:
    bool_member(std::string key, bool value, bool primary = false)
        : basic_member(std::move(key), value, primary) {}

    wire_value_t to_wire() const { return static_cast<int64_t>(value_ ? 1 : 0); }
    void from_wire(const wire_value_t& wire);
    column_type type() const noexcept { return column_type::integer; }

    bool operator==(const bool_member& other) const {
        return key_ == other.key_ && primary_ == other.primary_ && value_ == other.value_;
    }
    std::size_t hash() const;
};

class binary_member : public basic_member<blob_t> {
public:
    explicit binary_member(std::string key, blob_t value = {}, bool primary = false)
        : basic_member(std::move(key), std::move(value), primary) {}

    wire_value_t to_wire() const { return value_; }
    void from_wire(const wire_value_t& wire);
    column_type type() const noexcept { return column_type::blob; }

    bool operator==(const binary_member& other) const {
        return key_ == other.key_ && primary_ == other.primary_ && value_ == other.value_;
    }
    std::size_t hash() const;
};

/// Point in time, ISO-8601 text on the wire. Held at microsecond precision.
class timestamp_member : public basic_member<timestamp_t> {
public:
    timestamp_member(std::string key, timestamp_t value, bool primary = false)
        : basic_member(std::move(key), detail::floor_to_micros(value), primary) {}

    void set_value(timestamp_t value) { value_ = detail::floor_to_micros(value); }

    wire_value_t to_wire() const { return detail::format_iso8601(value_); }
    void from_wire(const wire_value_t& wire);
    column_type type() const noexcept { return column_type::text; }

    bool operator==(const timestamp_member& other) const {
        return key_ == other.key_ && primary_ == other.primary_ && value_ == other.value_;
    }
    std::size_t hash() const;
};

/// Time span, microsecond count on the wire
class duration_member : public basic_member<duration_t> {
public:
    template<typename Rep, typename Period>
    duration_member(std::string key, std::chrono::duration<Rep, Period> value, bool primary = false)
        : basic_member(std::move(key), std::chrono::duration_cast<duration_t>(value), primary) {}

    wire_value_t to_wire() const { return static_cast<int64_t>(value_.count()); }
    void from_wire(const wire_value_t& wire);
    column_type type() const noexcept { return column_type::bigint; }

    bool operator==(const duration_member& other) const {
        return key_ == other.key_ && primary_ == other.primary_ && value_ == other.value_;
    }
    std::size_t hash() const;
};

/// List of ints, doubles, or strings, JSON array on the wire
class scalar_list_member : public basic_member<std::vector<scalar_t>> {
public:
    template<typename E>
    scalar_list_member(std::string key, const std::vector<E>& values, bool primary = false)
        : basic_member(std::move(key), {}, primary) {
        value_.reserve(values.size());
        for (const auto& v : values) {
            value_.push_back(detail::to_scalar(v));
        }
    }

    explicit scalar_list_member(std::string key, bool primary = false)
        : basic_member(std::move(key), {}, primary) {}

    wire_value_t to_wire() const;
    void from_wire(const wire_value_t& wire);
    column_type type() const noexcept { return column_type::text; }

    bool operator==(const scalar_list_member& other) const {
        return key_ == other.key_ && primary_ == other.primary_ && value_ == other.value_;
    }
    std::size_t hash() const;
};

/// A single nested serializable, JSON map on the wire
class object_member : public basic_member<serializable_ptr> {
public:
    object_member(std::string key, serializable_factory factory,
                  serializable_ptr value, bool primary = false)
        : basic_member(std::move(key), std::move(value), primary), factory_(std::move(factory)) {}

    template<typename N, typename = std::enable_if_t<std::is_base_of_v<serializable, N>>>
    object_member(std::string key, N value, bool primary = false)
        : basic_member(std::move(key), std::make_shared<const N>(std::move(value)), primary),
          factory_([] { return std::make_shared<N>(); }) {}

    wire_value_t to_wire() const;
    void from_wire(const wire_value_t& wire);
    column_type type() const noexcept { return column_type::text; }

    bool operator==(const object_member& other) const;
    std::size_t hash() const;

private:
    serializable_factory factory_;
};

/// A list of nested serializables, JSON array of maps on the wire
class object_list_member : public basic_member<std::vector<serializable_ptr>> {
public:
    object_list_member(std::string key, serializable_factory factory,
                       std::vector<serializable_ptr> values, bool primary = false)
        : basic_member(std::move(key), std::move(values), primary), factory_(std::move(factory)) {}

    template<typename N, typename = std::enable_if_t<std::is_base_of_v<serializable, N>>>
    object_list_member(std::string key, const std::vector<N>& values, bool primary = false)
        : basic_member(std::move(key), {}, primary),
          factory_([] { return std::make_shared<N>(); }) {
        value_.reserve(values.size());
        for (const auto& v : values) {
            value_.push_back(std::make_shared<const N>(v));
        }
    }

    wire_value_t to_wire() const;
    void from_wire(const wire_value_t& wire);
    column_type type() const noexcept { return column_type::text; }

    bool operator==(const object_list_member& other) const;
    std::size_t hash() const;

private:
    serializable_factory factory_;
};

// ============================================================================
// member_traits - maps a C++ value type onto the field kind that stores it
// ============================================================================

template<typename T> struct is_std_duration : std::false_type {};
template<typename R, typename P> struct is_std_duration<std::chrono::duration<R, P>> : std::true_type {};

template<typename T> struct is_shared_ptr : std::false_type {};
template<typename T> struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template<typename T>
inline constexpr bool is_scalar_value_v =
    (std::is_integral_v<T> && !std::is_same_v<T, bool>) ||
    std::is_floating_point_v<T> ||
    std::is_same_v<T, std::string>;

template<typename T, typename = void>
struct member_traits;  // unsupported value types fail here

template<typename T>
struct member_traits<T, std::enable_if_t<is_scalar_value_v<T>>> {
    using member_type = scalar_member;

    static T get(const scalar_member& m) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto* s = std::get_if<std::string>(&m.value())) return *s;
        } else if constexpr (std::is_floating_point_v<T>) {
            if (auto* d = std::get_if<double>(&m.value())) return static_cast<T>(*d);
        } else {
            if (auto* i = std::get_if<int64_t>(&m.value())) return static_cast<T>(*i);
        }
        throw type_mismatch_error("Scalar member '" + m.key() + "' holds a different scalar type");
    }

    static void set(scalar_member& m, T value) {
        if (m.value().index() != detail::to_scalar(value).index()) {
            throw type_mismatch_error("Scalar member '" + m.key() + "' holds a different scalar type");
        }
        m.set_value(detail::to_scalar(std::move(value)));
    }
};

template<>
struct member_traits<bool> {
    using member_type = bool_member;
    static bool get(const bool_member& m) { return m.value(); }
    static void set(bool_member& m, bool value) { m.set_value(value); }
};

template<typename E>
struct member_traits<E, std::enable_if_t<std::is_enum_v<E>>> {
    using member_type = enum_member;
    static E get(const enum_member& m) { return m.as<E>(); }
    static void set(enum_member& m, E value) { m.assign(value); }
};

template<>
struct member_traits<blob_t> {
    using member_type = binary_member;
    static blob_t get(const binary_member& m) { return m.value(); }
    static void set(binary_member& m, blob_t value) { m.set_value(std::move(value)); }
};

template<>
struct member_traits<timestamp_t> {
    using member_type = timestamp_member;
    static timestamp_t get(const timestamp_member& m) { return m.value(); }
    static void set(timestamp_member& m, timestamp_t value) { m.set_value(value); }
};

template<typename D>
struct member_traits<D, std::enable_if_t<is_std_duration<D>::value>> {
    using member_type = duration_member;
    static D get(const duration_member& m) { return std::chrono::duration_cast<D>(m.value()); }
    static void set(duration_member& m, D value) {
        m.set_value(std::chrono::duration_cast<duration_t>(value));
    }
};

template<typename E>
struct member_traits<std::vector<E>,
                     std::enable_if_t<is_scalar_value_v<E> && !std::is_same_v<E, uint8_t>>> {
    using member_type = scalar_list_member;

    static std::vector<E> get(const scalar_list_member& m) {
        std::vector<E> out;
        out.reserve(m.value().size());
        for (const auto& element : m.value()) {
            if constexpr (std::is_same_v<E, std::string>) {
                auto* s = std::get_if<std::string>(&element);
                if (!s) throw type_mismatch_error("List member '" + m.key() + "' holds non-text elements");
                out.push_back(*s);
            } else if constexpr (std::is_floating_point_v<E>) {
                if (auto* d = std::get_if<double>(&element)) {
                    out.push_back(static_cast<E>(*d));
                } else if (auto* i = std::get_if<int64_t>(&element)) {
                    out.push_back(static_cast<E>(*i));
                } else {
                    throw type_mismatch_error("List member '" + m.key() + "' holds non-numeric elements");
                }
            } else {
                auto* i = std::get_if<int64_t>(&element);
                if (!i) throw type_mismatch_error("List member '" + m.key() + "' holds non-integer elements");
                out.push_back(static_cast<E>(*i));
            }
        }
        return out;
    }

    static void set(scalar_list_member& m, const std::vector<E>& values) {
        std::vector<scalar_t> converted;
        converted.reserve(values.size());
        for (const auto& v : values) {
            converted.push_back(detail::to_scalar(v));
        }
        m.set_value(std::move(converted));
    }
};

template<typename N>
struct member_traits<N, std::enable_if_t<std::is_base_of_v<serializable, N>>> {
    using member_type = object_member;

    static N get(const object_member& m) {
        auto typed = std::dynamic_pointer_cast<const N>(m.value());
        if (!typed) {
            throw type_mismatch_error("Object member '" + m.key() + "' does not hold the requested type");
        }
        return *typed;
    }

    static void set(object_member& m, N value) {
        m.set_value(std::make_shared<const N>(std::move(value)));
    }
};

template<typename N>
struct member_traits<std::vector<N>, std::enable_if_t<std::is_base_of_v<serializable, N>>> {
    using member_type = object_list_member;

    static std::vector<N> get(const object_list_member& m) {
        std::vector<N> out;
        out.reserve(m.value().size());
        for (const auto& element : m.value()) {
            auto typed = std::dynamic_pointer_cast<const N>(element);
            if (!typed) {
                throw type_mismatch_error("Object list member '" + m.key() + "' does not hold the requested type");
            }
            out.push_back(*typed);
        }
        return out;
    }

    static void set(object_list_member& m, const std::vector<N>& values) {
        std::vector<serializable_ptr> converted;
        converted.reserve(values.size());
        for (const auto& v : values) {
            converted.push_back(std::make_shared<const N>(v));
        }
        m.set_value(std::move(converted));
    }
};

// ============================================================================
// db_member - one named field of a record; a closed sum over the field kinds
// ============================================================================

class db_member {
public:
    using kind_t = std::variant<
        scalar_member,
        enum_member,
        bool_member,
        binary_member,
        timestamp_member,
        duration_member,
        scalar_list_member,
        object_list_member,
        object_member
    >;

    template<typename M, typename = std::enable_if_t<std::is_constructible_v<kind_t, M&&>>>
    db_member(M&& member) : kind_(std::forward<M>(member)) {}

    const std::string& key() const noexcept;
    bool primary() const noexcept;

    /// Storage type used when describing the table
    column_type type() const noexcept;

    /// Value as sent to the store
    wire_value_t to_wire() const;

    /// Replace the value with one read from the store
    void from_wire(const wire_value_t& wire);

    template<typename T>
    T get() const {
        using M = typename member_traits<T>::member_type;
        return member_traits<T>::get(as<M>());
    }

    template<typename T>
    void set(T value) {
        using M = typename member_traits<T>::member_type;
        member_traits<T>::set(as<M>(), std::move(value));
    }

    template<typename M>
    const M& as() const {
        if (auto* m = std::get_if<M>(&kind_)) return *m;
        throw type_mismatch_error("Member '" + key() + "' is not of the requested kind");
    }

    template<typename M>
    M& as() {
        if (auto* m = std::get_if<M>(&kind_)) return *m;
        throw type_mismatch_error("Member '" + key() + "' is not of the requested kind");
    }

    const kind_t& kind() const noexcept { return kind_; }

    bool operator==(const db_member& other) const { return kind_ == other.kind_; }
    bool operator!=(const db_member& other) const { return !(*this == other); }

    std::size_t hash() const;

private:
    kind_t kind_;
};

} // namespace tabula

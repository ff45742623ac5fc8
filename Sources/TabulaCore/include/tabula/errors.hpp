#pragma once

#include <stdexcept>
#include <string>

namespace tabula {

class tabula_error : public std::runtime_error {
public:
    explicit tabula_error(const std::string& msg) : std::runtime_error(msg) {}
};

// A stored value could not be turned back into its typed representation
class decode_error : public tabula_error {
public:
    explicit decode_error(const std::string& msg) : tabula_error(msg) {}
};

// A member value has no stored representation (non-finite real, invalid UTF-8 in JSON text)
class encode_error : public tabula_error {
public:
    explicit encode_error(const std::string& msg) : tabula_error(msg) {}
};

// A retrieved row is missing a column the record expects
class unknown_field_error : public tabula_error {
public:
    explicit unknown_field_error(const std::string& key)
        : tabula_error("Unknown data member key: " + key), key_(key) {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

// update / targeted remove matched nothing
class no_rows_affected_error : public tabula_error {
public:
    no_rows_affected_error(const std::string& operation, const std::string& table)
        : tabula_error(operation + " on " + table + " affected no rows"),
          operation_(operation), table_(table) {}

    const std::string& operation() const noexcept { return operation_; }
    const std::string& table() const noexcept { return table_; }

private:
    std::string operation_;
    std::string table_;
};

// A typed accessor was used against a member of a different kind
class type_mismatch_error : public tabula_error {
public:
    explicit type_mismatch_error(const std::string& msg) : tabula_error(msg) {}
};

// Publish attempted on a disposed channel
class channel_closed_error : public tabula_error {
public:
    explicit channel_closed_error(const std::string& msg) : tabula_error(msg) {}
};

} // namespace tabula

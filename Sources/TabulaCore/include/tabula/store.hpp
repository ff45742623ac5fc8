#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tabula {

// ============================================================================
// store - the persistence backend the access layer talks to
//
// All calls are synchronous. `where` is a SQL predicate with `?` placeholders
// bound to `args` in order. Backends report failures by throwing; the core
// never catches them.
// ============================================================================

class store {
public:
    virtual ~store() = default;

    /// Insert a row; returns the backend's row id for it.
    virtual int64_t insert(const std::string& table, const row_t& row) = 0;

    /// All rows of `table` in the backend's order. With `columns`, only those
    /// keys are present in each returned row.
    virtual std::vector<row_t> query(const std::string& table,
                                     const std::optional<std::vector<std::string>>& columns = std::nullopt) = 0;

    /// Update rows matching `where`; returns the number of affected rows.
    virtual int64_t update(const std::string& table,
                           const row_t& row,
                           const std::string& where,
                           const std::vector<wire_value_t>& args) = 0;

    /// Delete rows matching `where` (all rows when absent); returns the
    /// number of affected rows.
    virtual int64_t remove(const std::string& table,
                           const std::optional<std::string>& where = std::nullopt,
                           const std::vector<wire_value_t>& args = {}) = 0;
};

} // namespace tabula

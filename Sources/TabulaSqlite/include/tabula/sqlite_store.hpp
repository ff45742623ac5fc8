#pragma once

#include "tabula/configuration.hpp"
#include "tabula/db.hpp"
#include "tabula/record.hpp"
#include "tabula/schema.hpp"
#include "tabula/store.hpp"
#include <memory>

namespace tabula {

// ============================================================================
// sqlite_store - store backed by a single SQLite connection
//
//   auto backend = std::make_shared<tabula::sqlite_store>();   // in-memory
//   backend->ensure_table(Band{});
//   tabula::dao<Band> bands(backend);
// ============================================================================

class sqlite_store : public store {
public:
    explicit sqlite_store(const configuration& config = {});
    explicit sqlite_store(std::unique_ptr<database> db);

    int64_t insert(const std::string& table, const row_t& row) override;

    std::vector<row_t> query(const std::string& table,
                             const std::optional<std::vector<std::string>>& columns = std::nullopt) override;

    int64_t update(const std::string& table,
                   const row_t& row,
                   const std::string& where,
                   const std::vector<wire_value_t>& args) override;

    int64_t remove(const std::string& table,
                   const std::optional<std::string>& where = std::nullopt,
                   const std::vector<wire_value_t>& args = {}) override;

    /// CREATE TABLE IF NOT EXISTS <r.describe_table()>
    void ensure_table(const record& r);
    void ensure_table(const table_schema& schema);

    /// Create every registered table in one transaction.
    void ensure_tables(const schema_registry& registry = schema_registry::instance());

    database& db() noexcept { return *db_; }
    const database& db() const noexcept { return *db_; }

private:
    std::unique_ptr<database> db_;
};

} // namespace tabula

#include "tabula/sqlite_store.hpp"
#include "tabula/log.hpp"
#include <stdexcept>

namespace tabula {

sqlite_store::sqlite_store(const configuration& config)
    : db_(std::make_unique<database>(config)) {}

sqlite_store::sqlite_store(std::unique_ptr<database> db) : db_(std::move(db)) {
    if (!db_) {
        throw std::invalid_argument("sqlite_store requires a database");
    }
}

int64_t sqlite_store::insert(const std::string& table, const row_t& row) {
    return db_->insert(table, row);
}

std::vector<row_t> sqlite_store::query(const std::string& table,
                                       const std::optional<std::vector<std::string>>& columns) {
    std::string projection = "*";
    if (columns) {
        projection.clear();
        for (const auto& col : *columns) {
            if (!projection.empty()) projection += ", ";
            projection += col;
        }
        if (projection.empty()) {
            LOG_WARN("sqlite_store", "Empty column list for %s", table.c_str());
            throw db_error("Empty column list for " + table);
        }
    }
    // Tables are rowid tables; rowid order is insertion order
    return db_->query("SELECT " + projection + " FROM " + table + " ORDER BY rowid");
}

int64_t sqlite_store::update(const std::string& table,
                             const row_t& row,
                             const std::string& where,
                             const std::vector<wire_value_t>& args) {
    return db_->update(table, row, where, args);
}

int64_t sqlite_store::remove(const std::string& table,
                             const std::optional<std::string>& where,
                             const std::vector<wire_value_t>& args) {
    return db_->remove(table, where, args);
}

void sqlite_store::ensure_table(const record& r) {
    db_->execute("CREATE TABLE IF NOT EXISTS " + r.describe_table());
}

void sqlite_store::ensure_table(const table_schema& schema) {
    db_->ensure_table(schema);
}

void sqlite_store::ensure_tables(const schema_registry& registry) {
    transaction tx(*db_);
    for (const auto* schema : registry.all_schemas()) {
        db_->ensure_table(*schema);
    }
    tx.commit();
}

} // namespace tabula

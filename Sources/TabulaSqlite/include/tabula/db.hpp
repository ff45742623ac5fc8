#pragma once

#include "tabula/configuration.hpp"
#include "tabula/errors.hpp"
#include "tabula/schema.hpp"
#include "tabula/types.hpp"
#include <sqlite3.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tabula {

// Any failure reported by SQLite
class db_error : public tabula_error {
public:
    explicit db_error(const std::string& msg) : tabula_error(msg) {}
};

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access (for concurrent readers)
    };

    explicit database(const std::string& path,
                      open_mode mode = open_mode::read_write,
                      int busy_timeout_ms = 5000);
    explicit database(const configuration& config);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    // Schema management
    void create_table(const table_schema& schema);
    void ensure_table(const table_schema& schema);
    bool table_exists(const std::string& name) const;

    // Existing column names and their declared SQL types (uppercase)
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table) const;

    // CRUD operations
    row_id_t insert(const std::string& table, const row_t& values);

    // Returns the number of rows changed
    int64_t update(const std::string& table,
                   const row_t& values,
                   const std::string& where,
                   const std::vector<wire_value_t>& args);

    // Deletes every row when `where` is absent; returns the number of rows deleted
    int64_t remove(const std::string& table,
                   const std::optional<std::string>& where = std::nullopt,
                   const std::vector<wire_value_t>& args = {});

    // Query - returns rows as column maps, in result order
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<wire_value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    // Execute SQL with optional params; returns the number of rows changed
    int64_t execute(const std::string& sql,
                    const std::vector<wire_value_t>& params = {});

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;

    void open(int busy_timeout_ms);
    sqlite3_stmt* prepare(const std::string& sql, const char* what);
    void bind_value(sqlite3_stmt* stmt, int index, const wire_value_t& value);
    wire_value_t extract_column(sqlite3_stmt* stmt, int index);
};

// RAII transaction guard; rolls back unless committed
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace tabula

#include "tabula/db.hpp"
#include "tabula/log.hpp"
#include <cctype>
#include <sstream>
#include <type_traits>

namespace tabula {

namespace {

bool is_memory_path(const std::string& path) {
    return path.empty() || path == ":memory:" || path.rfind("file::memory:", 0) == 0;
}

} // namespace

database::database(const std::string& path, open_mode mode, int busy_timeout_ms)
    : path_(path), mode_(mode) {
    open(busy_timeout_ms);
}

database::database(const configuration& config)
    : path_(config.path),
      mode_(config.read_only ? open_mode::read_only : open_mode::read_write) {
    if (config.log) {
        set_log_level(*config.log);
    }
    open(config.busy_timeout_ms);
}

void database::open(int busy_timeout_ms) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode_ == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path_.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    // Set before anything that might contend with other connections
    sqlite3_busy_timeout(db_, busy_timeout_ms);

    execute("PRAGMA foreign_keys = ON");

    // WAL only makes sense for a writable file database
    if (mode_ == open_mode::read_write && !is_memory_path(path_)) {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");

    LOG_INFO("db", "Opened %s (%s)", path_.c_str(),
             mode_ == open_mode::read_only ? "read-only" : "read-write");
}

database::~database() {
    if (db_) {
        if (mode_ == open_mode::read_write && !is_memory_path(path_)) {
            sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_TRUNCATE, nullptr, nullptr);
        }
        sqlite3_close(db_);
    }
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), mode_(other.mode_) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        other.db_ = nullptr;
    }
    return *this;
}

sqlite3_stmt* database::prepare(const std::string& sql, const char* what) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Failed to prepare %s: %s (SQL: %s)", what, error.c_str(), sql.c_str());
        throw db_error(std::string("Failed to prepare ") + what + ": " + error);
    }
    return stmt;
}

int64_t database::execute(const std::string& sql, const std::vector<wire_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
        return sqlite3_changes(db_);
    }

    sqlite3_stmt* stmt = prepare(sql, "statement");

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Execution failed: " + error);
    }
    return sqlite3_changes(db_);
}

bool database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare table_exists statement: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare statement");
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool exists = (sqlite3_step(stmt) == SQLITE_ROW);
    sqlite3_finalize(stmt);

    return exists;
}

std::unordered_map<std::string, std::string> database::get_table_info(const std::string& table) const {
    std::unordered_map<std::string, std::string> columns;

    std::string sql = "PRAGMA table_info(" + table + ")";
    sqlite3_stmt* stmt = nullptr;

    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        LOG_ERROR("db", "Failed to prepare table_info statement: %s", sqlite3_errmsg(db_));
        throw db_error("Failed to prepare table_info statement");
    }

    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        const char* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));

        if (name && type) {
            std::string type_str(type);
            for (char& c : type_str) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            columns[name] = type_str;
        }
    }

    sqlite3_finalize(stmt);
    return columns;
}

void database::create_table(const table_schema& schema) {
    if (schema.columns.empty()) {
        LOG_ERROR("db", "Refusing to create %s without columns", schema.name.c_str());
        throw db_error("Cannot create table " + schema.name + " without columns");
    }
    execute("CREATE TABLE IF NOT EXISTS " + schema.describe());
}

void database::ensure_table(const table_schema& schema) {
    if (!table_exists(schema.name)) {
        LOG_DEBUG("db", "Creating table %s", schema.name.c_str());
        create_table(schema);
    }
}

void database::bind_value(sqlite3_stmt* stmt, int index, const wire_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, blob_t>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

wire_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return text ? std::string(text, static_cast<std::size_t>(size)) : std::string();
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return bytes ? blob_t(bytes, bytes + size) : blob_t();
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

row_id_t database::insert(const std::string& table, const row_t& values) {
    std::ostringstream sql;
    sql << "INSERT INTO " << table << " (";

    std::vector<wire_value_t> params;
    params.reserve(values.size());
    bool first = true;
    for (const auto& [col, val] : values) {
        if (!first) sql << ", ";
        sql << col;
        params.push_back(val);
        first = false;
    }

    sql << ") VALUES (";
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << "?";
    }
    sql << ")";

    sqlite3_stmt* stmt = prepare(sql.str(), "insert");

    int index = 1;
    for (const auto& val : params) {
        bind_value(stmt, index++, val);
    }

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto err = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Insert into %s failed: %s", table.c_str(), err.c_str());
        throw db_error("Insert failed: " + err);
    }

    return sqlite3_last_insert_rowid(db_);
}

int64_t database::update(const std::string& table,
                         const row_t& values,
                         const std::string& where,
                         const std::vector<wire_value_t>& args) {
    if (values.empty()) return 0;

    std::ostringstream sql;
    sql << "UPDATE " << table << " SET ";

    std::vector<wire_value_t> params;
    params.reserve(values.size() + args.size());
    bool first = true;
    for (const auto& [col, val] : values) {
        if (!first) sql << ", ";
        sql << col << " = ?";
        params.push_back(val);
        first = false;
    }
    sql << " WHERE " << where;
    params.insert(params.end(), args.begin(), args.end());

    return execute(sql.str(), params);
}

int64_t database::remove(const std::string& table,
                         const std::optional<std::string>& where,
                         const std::vector<wire_value_t>& args) {
    std::string sql = "DELETE FROM " + table;
    if (where) {
        sql += " WHERE " + *where;
    }
    return execute(sql, args);
}

std::vector<row_t> database::query(const std::string& sql,
                                   const std::vector<wire_value_t>& params) {
    sqlite3_stmt* stmt = prepare(sql, "query");

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        row.reserve(static_cast<std::size_t>(col_count));
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Query failed: %s", error.c_str());
        throw db_error("Query failed: " + error);
    }

    return results;
}

void database::begin_transaction() {
    execute("BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 while a transaction is active
    return sqlite3_get_autocommit(db_) == 0;
}

// Transaction RAII guard
transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_WARN("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace tabula

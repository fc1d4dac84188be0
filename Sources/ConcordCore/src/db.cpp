#include "concord/db.hpp"
#include "concord/log.hpp"
#include <sstream>
#include <thread>
#include <chrono>
#include <algorithm>

namespace concord {

std::string quote_identifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

database::database(const std::string& path, open_mode mode) : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error, rc);
    }
    sqlite3_extended_result_codes(db_, 1);

    // Set busy timeout to handle lock contention (5 seconds)
    sqlite3_busy_timeout(db_, 5000);

    if (mode == open_mode::read_write) {
        // Synced files are copied whole; keep everything in the main file (no -wal sidecar)
        try {
            execute("PRAGMA journal_mode = DELETE");
        } catch (const db_error&) {
            LOG_WARN("db", "journal_mode change skipped for %s", path.c_str());
        }
    }
    execute("PRAGMA foreign_keys = ON");
}

database::~database() {
    if (db_) {
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

void database::fail(const std::string& what, const std::string& sql) const {
    int code = sqlite3_extended_errcode(db_);
    std::string error = sqlite3_errmsg(db_);
    if (sql.empty()) {
        LOG_ERROR("db", "%s: %s", what.c_str(), error.c_str());
        throw db_error(what + ": " + error, code);
    }
    LOG_ERROR("db", "%s: %s (SQL: %s)", what.c_str(), error.c_str(), sql.c_str());
    throw db_error(what + ": " + error + " (SQL: " + sql + ")", code);
}

void database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless queries
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")",
                           sqlite3_extended_errcode(db_));
        }
        return;
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare statement", sql);
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        fail("Execution failed", sql);
    }
}

bool database::table_exists(const std::string& name) const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name=?";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare table_exists statement");
    }

    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        fail("table_exists failed");
    }
    return rc == SQLITE_ROW;
}

std::vector<std::string> database::table_names() const {
    const char* sql = "SELECT name FROM sqlite_master WHERE type='table' AND name NOT LIKE 'sqlite_%' ORDER BY name";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare table_names statement");
    }

    std::vector<std::string> names;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const char* name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        if (name) names.emplace_back(name);
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        fail("table_names failed");
    }
    return names;
}

std::vector<foreign_key> database::foreign_keys(const std::string& table) const {
    std::vector<foreign_key> keys;

    std::string sql = "PRAGMA foreign_key_list(" + quote_identifier(table) + ")";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare foreign_key_list statement");
    }

    // PRAGMA foreign_key_list returns: id, seq, table, from, to, on_update, on_delete, match
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        const char* target = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        const char* from = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 3));
        const char* to = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 4));
        if (target && from) {
            // A NULL "to" means the parent's primary key
            keys.push_back({from, target, to ? to : "id"});
        }
    }

    sqlite3_finalize(stmt);
    return keys;
}

bool database::integrity_ok() const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, "PRAGMA quick_check", -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_WARN("db", "quick_check could not run on %s: %s", path_.c_str(), sqlite3_errmsg(db_));
        return false;
    }

    bool ok = false;
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        const char* result = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        ok = result && std::string(result) == "ok";
    } else {
        LOG_WARN("db", "quick_check failed on %s: %s", path_.c_str(), sqlite3_errmsg(db_));
    }
    sqlite3_finalize(stmt);
    return ok;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), -1, SQLITE_TRANSIENT);
        } else if constexpr (std::is_same_v<T, std::vector<uint8_t>>) {
            if (v.empty()) {
                sqlite3_bind_zeroblob(stmt, index, 0);
            } else {
                sqlite3_bind_blob(stmt, index, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
            }
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return sqlite3_column_int64(stmt, index);
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            return std::string(text ? text : "");
        }
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, index);
            int size = sqlite3_column_bytes(stmt, index);
            const uint8_t* bytes = static_cast<const uint8_t*>(data);
            return std::vector<uint8_t>(bytes, bytes + size);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

primary_key_t database::insert(const std::string& table, const record_t& values) {
    std::ostringstream sql;
    sql << "INSERT INTO " << quote_identifier(table);

    if (values.empty()) {
        sql << " DEFAULT VALUES";
    } else {
        sql << " (";
        bool first = true;
        for (const auto& [col, _] : values) {
            if (!first) sql << ", ";
            sql << quote_identifier(col);
            first = false;
        }
        sql << ") VALUES (";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) sql << ", ";
            sql << "?";
        }
        sql << ")";
    }

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.str().c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare insert", sql.str());
    }

    int index = 1;
    for (const auto& [_, val] : values) {
        bind_value(stmt, index++, val);
    }

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        fail("Insert failed", sql.str());
    }

    return sqlite3_last_insert_rowid(db_);
}

int database::update(const std::string& table,
                     const std::string& key_column,
                     primary_key_t key,
                     const record_t& values) {
    if (values.empty()) return 0;

    std::ostringstream sql;
    sql << "UPDATE " << quote_identifier(table) << " SET ";

    bool first = true;
    for (const auto& [col, _] : values) {
        if (!first) sql << ", ";
        sql << quote_identifier(col) << " = ?";
        first = false;
    }

    sql << " WHERE " << quote_identifier(key_column) << " = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.str().c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare update", sql.str());
    }

    int index = 1;
    for (const auto& [_, val] : values) {
        bind_value(stmt, index++, val);
    }
    sqlite3_bind_int64(stmt, index, key);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        fail("Update failed", sql.str());
    }
    return sqlite3_changes(db_);
}

int database::remove(const std::string& table, const std::string& key_column, primary_key_t key) {
    std::string sql = "DELETE FROM " + quote_identifier(table) + " WHERE " + quote_identifier(key_column) + " = ?";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare delete", sql);
    }

    sqlite3_bind_int64(stmt, 1, key);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        fail("Delete failed", sql);
    }
    return sqlite3_changes(db_);
}

bool database::row_exists(const std::string& table, const std::string& key_column, primary_key_t key) {
    auto rows = query("SELECT 1 FROM " + quote_identifier(table) + " WHERE " +
                      quote_identifier(key_column) + " = ? LIMIT 1", {key});
    return !rows.empty();
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("Failed to prepare query", sql);
    }

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        fail("Query failed", sql);
    }

    return results;
}

void database::begin_transaction() {
    const char* sql = "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);

    // Retry with exponential backoff while another connection holds the write lock
    int backoff_ms = 1;
    const int max_backoff_ms = 1000;
    const int max_total_wait_ms = 30000;
    int total_waited_ms = 0;

    while ((rc & 0xff) == SQLITE_BUSY || (rc & 0xff) == SQLITE_LOCKED) {
        if (total_waited_ms >= max_total_wait_ms) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        total_waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
        rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        fail("Failed to begin transaction");
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

// Runs an online backup from `source` into `dest` in one step.
static void copy_database(sqlite3* source, sqlite3* dest, const std::string& description) {
    sqlite3_backup* backup = sqlite3_backup_init(dest, "main", source, "main");
    if (!backup) {
        std::string error = sqlite3_errmsg(dest);
        LOG_ERROR("db", "Failed to start backup %s: %s", description.c_str(), error.c_str());
        throw db_error("Failed to start backup " + description + ": " + error, sqlite3_extended_errcode(dest));
    }

    int rc;
    int busy_retries = 0;
    while ((rc = sqlite3_backup_step(backup, -1)) == SQLITE_BUSY || rc == SQLITE_LOCKED) {
        if (++busy_retries > 100) break;
        sqlite3_sleep(50);
    }
    sqlite3_backup_finish(backup);

    if (rc != SQLITE_DONE) {
        std::string error = sqlite3_errstr(rc);
        LOG_ERROR("db", "Backup %s failed: %s", description.c_str(), error.c_str());
        throw db_error("Backup " + description + " failed: " + error, rc);
    }
}

void database::backup_to(const std::string& dest_path) {
    sqlite3* dest = nullptr;
    int rc = sqlite3_open_v2(dest_path.c_str(), &dest, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = dest ? sqlite3_errmsg(dest) : sqlite3_errstr(rc);
        sqlite3_close(dest);
        LOG_ERROR("db", "Failed to open backup target %s: %s", dest_path.c_str(), error.c_str());
        throw db_error("Failed to open backup target: " + error, rc);
    }

    try {
        copy_database(db_, dest, path_ + " -> " + dest_path);
    } catch (...) {
        sqlite3_close(dest);
        throw;
    }
    sqlite3_close(dest);
}

void database::restore_from(const std::string& source_path) {
    sqlite3* source = nullptr;
    int rc = sqlite3_open_v2(source_path.c_str(), &source, SQLITE_OPEN_READONLY, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = source ? sqlite3_errmsg(source) : sqlite3_errstr(rc);
        sqlite3_close(source);
        LOG_ERROR("db", "Failed to open restore source %s: %s", source_path.c_str(), error.c_str());
        throw db_error("Failed to open restore source: " + error, rc);
    }

    try {
        copy_database(source, db_, source_path + " -> " + path_);
    } catch (...) {
        sqlite3_close(source);
        throw;
    }
    sqlite3_close(source);
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
            LOG_ERROR("db", "Rollback in transaction guard failed: %s", e.what());
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

} // namespace concord

#pragma once

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <unordered_map>

namespace concord {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg, int code = SQLITE_ERROR)
        : std::runtime_error(msg), code_(code) {}

    /// Extended SQLite result code of the failing call.
    int code() const noexcept { return code_; }

    bool is_constraint() const noexcept { return (code_ & 0xff) == SQLITE_CONSTRAINT; }

private:
    int code_;
};

/// Foreign key declared on a table column (PRAGMA foreign_key_list).
struct foreign_key {
    std::string from_column;
    std::string target_table;
    std::string target_column;
};

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access, creates the file if missing (default)
        read_only    ///< Read-only access, fails if the file does not exist
    };

    explicit database(const std::string& path, open_mode mode = open_mode::read_write);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    const std::string& path() const { return path_; }

    // Schema inspection
    bool table_exists(const std::string& name) const;
    std::vector<std::string> table_names() const;

    std::vector<foreign_key> foreign_keys(const std::string& table) const;

    /// Runs PRAGMA quick_check. False when the file is not a database or is damaged.
    bool integrity_ok() const;

    // Row access addressed by a key column
    primary_key_t insert(const std::string& table, const record_t& values);

    /// Returns the number of rows changed.
    int update(const std::string& table,
               const std::string& key_column,
               primary_key_t key,
               const record_t& values);

    /// Returns the number of rows removed.
    int remove(const std::string& table, const std::string& key_column, primary_key_t key);

    bool row_exists(const std::string& table, const std::string& key_column, primary_key_t key);

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();

    // Execute SQL with optional params (for INSERT/UPDATE/DELETE without return)
    void execute(const std::string& sql,
                 const std::vector<column_value_t>& params = {});

    /// Copy the whole database into the file at dest_path (SQLite online backup).
    void backup_to(const std::string& dest_path);

    /// Replace this database's content with the database at source_path.
    void restore_from(const std::string& source_path);

    // Bind a value to a prepared statement
    void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;
    column_value_t extract_column(sqlite3_stmt* stmt, int index);
    [[noreturn]] void fail(const std::string& what, const std::string& sql = {}) const;
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

/// Double quote an identifier for use in generated SQL.
std::string quote_identifier(const std::string& name);

} // namespace concord

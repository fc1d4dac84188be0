#pragma once

#include "types.hpp"
#include <mutex>
#include <string>
#include <vector>
#include <optional>

namespace concord {

// ============================================================================
// Operation - one recorded local mutation
// ============================================================================

enum class operation_type {
    insert,
    update,
    remove
};

/// "INSERT" / "UPDATE" / "DELETE"
std::string to_string(operation_type type);

/// Case-insensitive; accepts "delete" and "remove" for operation_type::remove.
std::optional<operation_type> operation_type_from_string(const std::string& name);

struct operation {
    int64_t id = 0;
    operation_type type = operation_type::insert;
    std::string table_name;
    record_t record_data;              // New/changed row (empty for deletes)
    std::optional<record_t> old_data;  // Row before deletion (deletes only)
    timestamp_t timestamp{};

    // Serialize to a single-line JSON object
    std::string to_json() const;

    // Deserialize from JSON. Returns nullopt for malformed input.
    static std::optional<operation> from_json(const std::string& json);
};

// JSON encoding of a row snapshot. Blobs are hex encoded as {"blob": "..."}.
std::string record_to_json(const record_t& record);
std::optional<record_t> record_from_json(const std::string& json);

// ============================================================================
// Operation log - durable journal of mutations since the last successful sync
// ============================================================================
//
// Stored as JSON lines, one operation per line, appended and fsync'd on every
// track() so a crash between the local commit and the next sync cannot lose
// the change. All members are safe to call from several threads.

class operation_log {
public:
    explicit operation_log(std::string journal_path);

    // Non-copyable
    operation_log(const operation_log&) = delete;
    operation_log& operator=(const operation_log&) = delete;

    /// Record a mutation. Never throws; returns false (and logs) if the entry
    /// could not be made durable.
    bool track(operation_type type, const std::string& table, const record_t& data) noexcept;

    bool track_insert(const std::string& table, const record_t& row) noexcept {
        return track(operation_type::insert, table, row);
    }
    bool track_update(const std::string& table, const record_t& row) noexcept {
        return track(operation_type::update, table, row);
    }
    bool track_delete(const std::string& table, const record_t& old_row) noexcept {
        return track(operation_type::remove, table, old_row);
    }

    /// Pending operations in recording order.
    std::vector<operation> pending() const;

    size_t size() const;
    bool empty() const { return size() == 0; }

    /// Drop every pending operation.
    void clear();

    /// Drop operations with id <= up_to_id, keeping anything recorded later.
    void acknowledge(int64_t up_to_id);

    /// Swap in new contents for pending entries with the same ids. Entries
    /// no longer pending are ignored.
    void replace(const std::vector<operation>& updated);

    const std::string& journal_path() const { return journal_path_; }

private:
    std::string journal_path_;
    mutable std::mutex mutex_;
    std::vector<operation> operations_;
    int64_t next_id_ = 1;

    void load();
    void append_line(const std::string& line);
    void rewrite(const std::vector<operation>& operations);
};

} // namespace concord

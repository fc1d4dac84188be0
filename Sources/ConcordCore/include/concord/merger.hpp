#pragma once

#include "db.hpp"
#include "operation_log.hpp"
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace concord {

class merge_error : public std::runtime_error {
public:
    explicit merge_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Validation of a downloaded copy
// ============================================================================

enum class validation_result {
    absent,   // Missing or zero-length file
    invalid,  // Not a database, damaged, or missing required tables
    valid
};

const char* to_string(validation_result result);

class schema_validator {
public:
    /// With no required tables, any database holding at least one table passes.
    explicit schema_validator(std::vector<std::string> required_tables = {});

    validation_result validate(const std::string& path) const noexcept;

    const std::vector<std::string>& required_tables() const { return required_tables_; }

private:
    std::vector<std::string> required_tables_;
};

// ============================================================================
// Database merger
// ============================================================================
//
// Replays logged operations onto a copy of the authoritative database, in
// log order, inside one transaction. Rows are addressed by key_column.
//
//   INSERT  key already taken by another row: inserted under a fresh key.
//           Later operations and foreign key columns referring to the old
//           key are rewritten to the fresh one.
//   UPDATE  target row missing: skipped.
//   DELETE  target row missing or still referenced: skipped.
//
// Operations recorded against the local cache keep the keys the cache gave
// them, so once a batch is re-keyed the operations logged after it must be
// be replayed with the batch's remap and kept in their landed form.

/// (table, key as logged) -> key the row has in the merged database.
using key_remap = std::map<std::pair<std::string, primary_key_t>, primary_key_t>;

struct merge_stats {
    size_t applied = 0;
    size_t skipped = 0;
    size_t remapped = 0;
    key_remap remap;
    /// Each replayed operation with its key and foreign keys rewritten to
    /// where the rows are in the merged database. Same order as the input.
    std::vector<operation> landed;
};

class database_merger {
public:
    explicit database_merger(std::string key_column = "id");

    /// Returns base_db_path untouched when there is nothing to replay,
    /// otherwise the path of a new merged file next to it. The base file is
    /// never modified. Throws merge_error or db_error; no merged file is
    /// left behind on failure.
    std::string merge(const std::string& base_db_path, const std::vector<operation>& operations,
                      merge_stats* stats = nullptr);

    /// Replay onto an open database in place, all or nothing. Keys found in
    /// initial are read as already moved; the returned remap includes them.
    merge_stats apply(database& db, const std::vector<operation>& operations,
                      const key_remap& initial = {});

    /// Name of the file merge() writes for a given base.
    static std::string merged_path_for(const std::string& base_db_path);

private:
    std::string key_column_;
};

} // namespace concord

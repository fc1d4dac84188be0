#include "concord/merger.hpp"
#include "concord/log.hpp"
#include <filesystem>
#include <map>
#include <system_error>

namespace concord {

namespace fs = std::filesystem;

// ============================================================================
// schema_validator
// ============================================================================

const char* to_string(validation_result result) {
    switch (result) {
        case validation_result::absent: return "absent";
        case validation_result::invalid: return "invalid";
        case validation_result::valid: return "valid";
    }
    return "unknown";
}

schema_validator::schema_validator(std::vector<std::string> required_tables)
    : required_tables_(std::move(required_tables)) {}

validation_result schema_validator::validate(const std::string& path) const noexcept {
    std::error_code ec;
    if (!fs::exists(path, ec) || fs::file_size(path, ec) == 0 || ec) {
        return validation_result::absent;
    }

    try {
        database db(path, database::open_mode::read_only);
        if (!db.integrity_ok()) {
            LOG_WARN("merge", "Integrity check failed for %s", path.c_str());
            return validation_result::invalid;
        }
        if (required_tables_.empty()) {
            if (db.table_names().empty()) {
                LOG_WARN("merge", "%s holds no tables", path.c_str());
                return validation_result::invalid;
            }
        }
        for (const auto& table : required_tables_) {
            if (!db.table_exists(table)) {
                LOG_WARN("merge", "%s is missing required table %s", path.c_str(), table.c_str());
                return validation_result::invalid;
            }
        }
        return validation_result::valid;
    } catch (const db_error& e) {
        LOG_WARN("merge", "Cannot open %s as a database: %s", path.c_str(), e.what());
        return validation_result::invalid;
    } catch (const std::exception& e) {
        LOG_WARN("merge", "Validation of %s failed: %s", path.c_str(), e.what());
        return validation_result::invalid;
    }
}

// ============================================================================
// database_merger
// ============================================================================

database_merger::database_merger(std::string key_column) : key_column_(std::move(key_column)) {}

std::string database_merger::merged_path_for(const std::string& base_db_path) {
    fs::path base(base_db_path);
    fs::path merged = base.parent_path() / (base.stem().string() + ".merged" + base.extension().string());
    return merged.string();
}

namespace {

using fk_cache_t = std::map<std::string, std::vector<foreign_key>>;

primary_key_t resolve(const key_remap& remap, const std::string& table, primary_key_t key) {
    auto it = remap.find({table, key});
    return it == remap.end() ? key : it->second;
}

// Point foreign key columns that reference key_column at the moved rows
void rewrite_references(const database& db, fk_cache_t& fk_cache, const std::string& key_column,
                        const key_remap& remap, const std::string& table, record_t& record) {
    auto fk_it = fk_cache.find(table);
    if (fk_it == fk_cache.end()) {
        fk_it = fk_cache.emplace(table, db.foreign_keys(table)).first;
    }
    for (const auto& fk : fk_it->second) {
        if (fk.target_column != key_column) continue;
        auto col = record.find(fk.from_column);
        if (col == record.end()) continue;
        if (auto value = detail::as_integer(col->second)) {
            col->second = resolve(remap, fk.target_table, *value);
        }
    }
}

} // namespace

std::string database_merger::merge(const std::string& base_db_path, const std::vector<operation>& operations,
                                   merge_stats* stats) {
    if (operations.empty()) {
        LOG_DEBUG("merge", "No local operations to merge");
        return base_db_path;
    }
    if (!fs::exists(base_db_path)) {
        throw merge_error("Base database not found: " + base_db_path);
    }

    std::string merged_path = merged_path_for(base_db_path);
    std::error_code ec;
    fs::remove(merged_path, ec);
    fs::copy_file(base_db_path, merged_path, fs::copy_options::overwrite_existing);

    try {
        database db(merged_path);
        auto result = apply(db, operations);
        LOG_INFO("merge", "Merged %zu operations (%zu skipped, %zu re-keyed)",
                 result.applied, result.skipped, result.remapped);
        if (stats) *stats = std::move(result);
    } catch (const std::exception&) {
        fs::remove(merged_path, ec);
        fs::remove(merged_path + "-journal", ec);
        throw;
    }
    return merged_path;
}

merge_stats database_merger::apply(database& db, const std::vector<operation>& operations,
                                   const key_remap& initial) {
    merge_stats stats;
    stats.remap = initial;
    key_remap& remapped = stats.remap;
    fk_cache_t fk_cache;
    std::map<std::string, bool> table_cache;

    transaction txn(db);

    for (const auto& op : operations) {
        auto known = table_cache.find(op.table_name);
        if (known == table_cache.end()) {
            known = table_cache.emplace(op.table_name, db.table_exists(op.table_name)).first;
        }
        if (!known->second) {
            LOG_WARN("merge", "Skipping %s on unknown table %s (op %lld)",
                     to_string(op.type).c_str(), op.table_name.c_str(), static_cast<long long>(op.id));
            ++stats.skipped;
            stats.landed.push_back(op);
            continue;
        }

        const record_t& source = (op.type == operation_type::remove && op.old_data) ? *op.old_data : op.record_data;
        record_t record = source;
        rewrite_references(db, fk_cache, key_column_, remapped, op.table_name, record);

        std::optional<primary_key_t> key;
        if (auto it = record.find(key_column_); it != record.end()) {
            key = detail::as_integer(it->second);
        }
        record_t landed_record = record;
        std::optional<primary_key_t> landed_key = key;

        switch (op.type) {
            case operation_type::insert: {
                if (key && db.row_exists(op.table_name, key_column_, *key)) {
                    record.erase(key_column_);
                    primary_key_t fresh = db.insert(op.table_name, record);
                    remapped[{op.table_name, *key}] = fresh;
                    landed_key = fresh;
                    ++stats.remapped;
                    LOG_DEBUG("merge", "%s key %lld taken - inserted as %lld", op.table_name.c_str(),
                              static_cast<long long>(*key), static_cast<long long>(fresh));
                } else {
                    if (key) remapped.erase({op.table_name, *key});
                    db.insert(op.table_name, record);
                }
                ++stats.applied;
                break;
            }
            case operation_type::update: {
                if (!key) {
                    LOG_WARN("merge", "UPDATE on %s without %s - skipped", op.table_name.c_str(), key_column_.c_str());
                    ++stats.skipped;
                    break;
                }
                primary_key_t target = resolve(remapped, op.table_name, *key);
                landed_key = target;
                record.erase(key_column_);
                if (record.empty() || db.update(op.table_name, key_column_, target, record) == 0) {
                    LOG_DEBUG("merge", "UPDATE on missing %s row %lld - skipped", op.table_name.c_str(),
                              static_cast<long long>(target));
                    ++stats.skipped;
                } else {
                    ++stats.applied;
                }
                break;
            }
            case operation_type::remove: {
                if (!key) {
                    LOG_WARN("merge", "DELETE on %s without %s - skipped", op.table_name.c_str(), key_column_.c_str());
                    ++stats.skipped;
                    break;
                }
                primary_key_t target = resolve(remapped, op.table_name, *key);
                landed_key = target;
                try {
                    if (db.remove(op.table_name, key_column_, target) == 0) {
                        ++stats.skipped;
                    } else {
                        ++stats.applied;
                    }
                } catch (const db_error& e) {
                    if (!e.is_constraint()) throw;
                    LOG_INFO("merge", "%s row %lld still referenced - delete skipped", op.table_name.c_str(),
                             static_cast<long long>(target));
                    ++stats.skipped;
                }
                break;
            }
        }

        if (landed_key) landed_record[key_column_] = *landed_key;
        operation landed = op;
        if (op.type == operation_type::remove && op.old_data) {
            landed.old_data = std::move(landed_record);
        } else {
            landed.record_data = std::move(landed_record);
        }
        stats.landed.push_back(std::move(landed));
    }

    txn.commit();
    return stats;
}

} // namespace concord

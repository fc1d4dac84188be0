#pragma once

#include "coordination.hpp"
#include "log.hpp"
#include "sync_manager.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace concord {

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

enum class sync_strategy {
    local_only,
    leader_election
};

enum class backend_type {
    shared_directory,
    cloud_store
};

struct shared_directory_config {
    std::string path;
};

struct cloud_store_config {
    std::string credentials_ref;        // rclone config file
    std::string remote;                 // rclone remote name
    std::string container_name = "ConcordSync";
    std::string rclone_path = "rclone";
    int command_timeout_seconds = 120;  // Per rclone call
};

struct backend_config {
    backend_type type = backend_type::shared_directory;
    shared_directory_config shared_directory;
    cloud_store_config cloud_store;
};

struct timeouts_config {
    int manual_seconds = 300;
    int auto_seconds = 30;
    int idle_seconds = 60;
    int shutdown_seconds = 10;
    int poll_interval_ms = 250;
    int stale_marker_minutes = 60;
    int auto_interval_minutes = 5;
    int stale_leader_seconds = 0;  // Cloud leader markers; 0 derives it, see stale_leader_age()
};

struct concord_config {
    sync_strategy strategy = sync_strategy::local_only;
    std::string local_cache_db_path;
    std::string database_name;          // Empty: file name of local_cache_db_path
    std::vector<std::string> required_tables;
    log_level level = log_level::off;
    backend_config backend;
    timeouts_config timeouts;

    /// database_name, or the cache file name when unset.
    std::string authoritative_name() const;
    std::string metadata_path() const;
    std::string journal_path() const;

    trigger_timeouts to_trigger_timeouts() const;

    /// Age past which a contender deletes a cloud leader marker. Unless set,
    /// the manual election timeout plus the worst case of the store calls a
    /// leader makes before releasing.
    std::chrono::seconds stale_leader_age() const;
};

/// "$XDG_DATA_HOME/concord/concord.db", falling back to ~/.local/share.
std::string default_cache_path();

/// Parse configuration JSON. Throws config_error.
concord_config parse_config(const std::string& json_text);

/// Read a configuration file. A missing file yields defaults (local_only).
concord_config load_config(const std::string& path);

/// Backend for the configured medium, or nullptr for local_only.
std::unique_ptr<coordination_backend> make_backend(const concord_config& config);

// ============================================================================
// Sync session - everything one host process needs, built from a config
// ============================================================================

class sync_session {
public:
    explicit sync_session(concord_config config);
    ~sync_session();

    sync_session(const sync_session&) = delete;
    sync_session& operator=(const sync_session&) = delete;

    const concord_config& config() const { return config_; }
    operation_log& log() { return *log_; }
    sync_metadata_store& metadata() { return *metadata_; }

    /// Null in local_only mode.
    sync_manager* manager() { return manager_.get(); }
    sync_scheduler* scheduler() { return scheduler_.get(); }

    bool track(operation_type type, const std::string& table, const record_t& data) noexcept;

    // In local_only mode every trigger succeeds without doing anything
    bool trigger_manual_sync();
    bool trigger_auto_sync();
    bool trigger_idle_sync();
    bool trigger_shutdown_sync();
    bool is_sync_needed();

    std::string status_json();

private:
    concord_config config_;
    std::unique_ptr<operation_log> log_;
    std::unique_ptr<sync_metadata_store> metadata_;
    std::unique_ptr<coordination_backend> backend_;
    std::unique_ptr<sync_manager> manager_;
    std::unique_ptr<sync_scheduler> scheduler_;
};

} // namespace concord

#pragma once

#include "coordination.hpp"
#include "merger.hpp"
#include "operation_log.hpp"
#include "sync_metadata.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace concord {

// ============================================================================
// Sync cycle states, reasons and errors
// ============================================================================

enum class sync_state {
    idle,
    checking_needed,
    electing,
    downloading,
    validating,
    merging,
    uploading,
    releasing_leadership
};

enum class sync_reason {
    manual,
    periodic,
    idle,
    shutdown
};

enum class sync_error {
    none,
    unavailable,        // Backend unreachable or intent could not be posted
    election_timeout,
    transfer_failure,   // Download or upload failed
    corrupt_remote,     // Authoritative copy failed validation (cycle still recovers)
    metadata_corrupt,   // Saved metadata unreadable (treated as first sync)
    duplicate_remote,
    local_failure       // Local cache, merge or filesystem failure
};

const char* to_string(sync_state state);
const char* to_string(sync_reason reason);
const char* to_string(sync_error error);

struct sync_options {
    std::string local_cache_path;
    std::string identity;                       // Empty: make_instance_identity()
    std::vector<std::string> required_tables;
    std::string key_column = "id";
    std::string work_directory;                 // Empty: "<cache dir>/.sync_tmp"
};

struct sync_status {
    std::optional<timestamp_t> last_sync_time;
    uint64_t sync_count = 0;
    uint64_t error_count = 0;
    size_t pending_operations = 0;
    bool local_cache_exists = false;
    int64_t local_cache_size = 0;
    sync_state state = sync_state::idle;
    sync_error last_error = sync_error::none;
    std::string last_error_message;
    std::string identity;
    coordination_status coordination;

    std::string to_json() const;
};

// ============================================================================
// Sync manager - runs leader-elected sync cycles
// ============================================================================
//
// One cycle runs at a time per process. A trigger arriving while a cycle is
// in flight waits for it and returns its result instead of starting another.
// Leadership, once acquired, is released on every exit path.

class sync_manager {
public:
    sync_manager(coordination_backend& backend,
                 operation_log& log,
                 sync_metadata_store& metadata,
                 sync_options options);

    ~sync_manager() = default;

    // Non-copyable
    sync_manager(const sync_manager&) = delete;
    sync_manager& operator=(const sync_manager&) = delete;

    /// Pending local operations, a changed authoritative copy, or no record
    /// of a previous sync. Backend failures count as "unchanged".
    bool is_sync_needed() noexcept;

    /// Run one cycle. With force the "needed" check is skipped.
    bool sync(sync_reason reason, std::chrono::milliseconds election_timeout, bool force) noexcept;

    void cleanup_stale_coordination_files(std::chrono::seconds max_age) noexcept;

    sync_status get_sync_status();

    size_t pending_operations_count() const;
    sync_state state() const { return state_.load(); }
    sync_error last_error() const;
    std::string last_error_message() const;
    const std::string& identity() const { return identity_; }
    const sync_options& options() const { return options_; }

    /// Called on every state transition (from the syncing thread).
    void set_state_callback(std::function<void(sync_state)> callback);

private:
    coordination_backend& backend_;
    operation_log& log_;
    sync_metadata_store& metadata_;
    sync_options options_;
    std::string identity_;
    schema_validator validator_;
    database_merger merger_;

    // Cycle coalescing
    std::mutex cycle_mutex_;
    std::condition_variable cycle_done_;
    bool cycle_running_ = false;
    uint64_t cycle_generation_ = 0;
    bool last_cycle_result_ = false;

    std::atomic<sync_state> state_{sync_state::idle};

    mutable std::mutex status_mutex_;
    sync_error last_error_ = sync_error::none;
    std::string last_error_message_;
    std::optional<timestamp_t> last_sync_time_;
    uint64_t sync_count_ = 0;
    uint64_t error_count_ = 0;
    std::function<void(sync_state)> state_callback_;

    bool run_cycle(sync_reason reason, std::chrono::milliseconds election_timeout, bool force);
    bool perform_leader_sync();
    std::string snapshot_local_cache(const std::string& work_dir);
    void refresh_local_cache(const std::string& source, int64_t last_merged_id, const key_remap& batch_remap);
    std::string work_directory() const;

    void set_state(sync_state state);
    void record_failure(sync_error error, const std::string& message);
    void record_success();
};

// ============================================================================
// Sync scheduler - maps host events onto sync cycles
// ============================================================================

struct trigger_timeouts {
    std::chrono::seconds manual{300};
    std::chrono::seconds automatic{30};
    std::chrono::seconds idle{60};
    std::chrono::seconds shutdown{10};
    std::chrono::seconds stale_marker_age{60 * 60};
    std::chrono::seconds auto_interval{5 * 60};
};

class sync_scheduler {
public:
    explicit sync_scheduler(sync_manager& manager, trigger_timeouts timeouts = {});
    ~sync_scheduler();

    sync_scheduler(const sync_scheduler&) = delete;
    sync_scheduler& operator=(const sync_scheduler&) = delete;

    /// User requested; always runs a cycle.
    bool trigger_manual_sync();

    /// Runs only when a sync is needed and the auto interval has elapsed.
    /// Returns true when nothing had to be done.
    bool trigger_auto_sync();

    bool trigger_idle_sync();

    /// Short-timeout sync before exit. A false return means local changes
    /// remain only in the operation log.
    bool trigger_shutdown_sync();

    /// Periodic background auto sync.
    void start(std::chrono::milliseconds tick);
    void stop();
    bool running() const { return running_.load(); }

    void set_auto_sync_enabled(bool enabled) { auto_sync_enabled_ = enabled; }

private:
    sync_manager& manager_;
    trigger_timeouts timeouts_;
    std::atomic<bool> auto_sync_enabled_{true};

    std::mutex mutex_;
    std::optional<std::chrono::steady_clock::time_point> last_auto_sync_;

    std::thread worker_;
    std::condition_variable wake_;
    std::atomic<bool> running_{false};
    bool stop_requested_ = false;
};

} // namespace concord

#include "concord/sync_manager.hpp"
#include "concord/db.hpp"
#include "concord/log.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <system_error>

namespace concord {

using json = nlohmann::json;
namespace fs = std::filesystem;

// ============================================================================
// Names
// ============================================================================

const char* to_string(sync_state state) {
    switch (state) {
        case sync_state::idle: return "idle";
        case sync_state::checking_needed: return "checking_needed";
        case sync_state::electing: return "electing";
        case sync_state::downloading: return "downloading";
        case sync_state::validating: return "validating";
        case sync_state::merging: return "merging";
        case sync_state::uploading: return "uploading";
        case sync_state::releasing_leadership: return "releasing_leadership";
    }
    return "unknown";
}

const char* to_string(sync_reason reason) {
    switch (reason) {
        case sync_reason::manual: return "manual";
        case sync_reason::periodic: return "periodic";
        case sync_reason::idle: return "idle";
        case sync_reason::shutdown: return "shutdown";
    }
    return "unknown";
}

const char* to_string(sync_error error) {
    switch (error) {
        case sync_error::none: return "none";
        case sync_error::unavailable: return "unavailable";
        case sync_error::election_timeout: return "election_timeout";
        case sync_error::transfer_failure: return "transfer_failure";
        case sync_error::corrupt_remote: return "corrupt_remote";
        case sync_error::metadata_corrupt: return "metadata_corrupt";
        case sync_error::duplicate_remote: return "duplicate_remote";
        case sync_error::local_failure: return "local_failure";
    }
    return "unknown";
}

std::string sync_status::to_json() const {
    json j;
    j["identity"] = identity;
    j["state"] = concord::to_string(state);
    j["last_sync_time_ms"] = last_sync_time ? json(to_epoch_millis(*last_sync_time)) : json(nullptr);
    j["sync_count"] = sync_count;
    j["error_count"] = error_count;
    j["pending_operations"] = pending_operations;
    j["local_cache"] = {{"exists", local_cache_exists}, {"size_bytes", local_cache_size}};
    j["last_error"] = concord::to_string(last_error);
    if (!last_error_message.empty()) j["last_error_message"] = last_error_message;
    j["coordination"] = json::parse(coordination.to_json());
    return j.dump(2);
}

// ============================================================================
// sync_manager
// ============================================================================

namespace {

// Resets the coalescing flag and wakes waiters however the cycle ends
class cycle_completion {
public:
    cycle_completion(std::mutex& mutex, std::condition_variable& done, bool& running,
                     uint64_t& generation, bool& result)
        : mutex_(mutex), done_(done), running_(running), generation_(generation), result_(result) {}

    ~cycle_completion() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
            ++generation_;
            result_ = outcome;
        }
        done_.notify_all();
    }

    bool outcome = false;

private:
    std::mutex& mutex_;
    std::condition_variable& done_;
    bool& running_;
    uint64_t& generation_;
    bool& result_;
};

// Releases leadership on every exit path once elected
class leadership_guard {
public:
    leadership_guard(coordination_backend& backend, const std::string& identity,
                     std::function<void()> on_release)
        : backend_(backend), identity_(identity), on_release_(std::move(on_release)) {}

    ~leadership_guard() {
        on_release_();
        backend_.release_leadership(identity_);
    }

private:
    coordination_backend& backend_;
    const std::string& identity_;
    std::function<void()> on_release_;
};

void remove_quietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    fs::remove(fs::path(path.string() + "-journal"), ec);
}

} // namespace

sync_manager::sync_manager(coordination_backend& backend,
                           operation_log& log,
                           sync_metadata_store& metadata,
                           sync_options options)
    : backend_(backend)
    , log_(log)
    , metadata_(metadata)
    , options_(std::move(options))
    , identity_(options_.identity.empty() ? make_instance_identity() : options_.identity)
    , validator_(options_.required_tables)
    , merger_(options_.key_column) {
    LOG_DEBUG("sync", "Sync manager ready as %s (cache %s)", identity_.c_str(), options_.local_cache_path.c_str());
}

void sync_manager::set_state(sync_state state) {
    state_.store(state);
    std::function<void(sync_state)> callback;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        callback = state_callback_;
    }
    if (callback) callback(state);
}

void sync_manager::set_state_callback(std::function<void(sync_state)> callback) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    state_callback_ = std::move(callback);
}

void sync_manager::record_failure(sync_error error, const std::string& message) {
    LOG_ERROR("sync", "Sync failed (%s): %s", concord::to_string(error), message.c_str());
    std::lock_guard<std::mutex> lock(status_mutex_);
    last_error_ = error;
    last_error_message_ = message;
    ++error_count_;
}

void sync_manager::record_success() {
    std::lock_guard<std::mutex> lock(status_mutex_);
    last_sync_time_ = std::chrono::system_clock::now();
    ++sync_count_;
}

sync_error sync_manager::last_error() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return last_error_;
}

std::string sync_manager::last_error_message() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return last_error_message_;
}

size_t sync_manager::pending_operations_count() const {
    return log_.size();
}

std::string sync_manager::work_directory() const {
    if (!options_.work_directory.empty()) return options_.work_directory;
    return (fs::path(options_.local_cache_path).parent_path() / ".sync_tmp").string();
}

// ============================================================================
// Change detection
// ============================================================================

bool sync_manager::is_sync_needed() noexcept {
    bool has_pending = false;
    try {
        has_pending = log_.size() > 0;
    } catch (const std::exception& e) {
        LOG_WARN("sync", "Cannot read operation log: %s", e.what());
    }

    auto saved = metadata_.load();
    if (!saved && metadata_.exists()) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        last_error_ = sync_error::metadata_corrupt;
        last_error_message_ = "Unreadable sync metadata at " + metadata_.path();
    }

    bool remote_changed = false;
    try {
        if (backend_.is_available()) {
            remote_changed = backend_.has_database_changed(saved).first;
        } else {
            LOG_DEBUG("sync", "Backend unavailable - treating remote as unchanged");
        }
    } catch (const std::exception& e) {
        LOG_WARN("sync", "Remote change check failed, treating as unchanged: %s", e.what());
    }

    bool first_sync = !saved.has_value();
    bool needed = has_pending || remote_changed || first_sync;
    LOG_DEBUG("sync", "Sync needed: %s (pending=%d remote_changed=%d first=%d)",
              needed ? "yes" : "no", has_pending, remote_changed, first_sync);
    return needed;
}

// ============================================================================
// Cycle entry point
// ============================================================================

bool sync_manager::sync(sync_reason reason, std::chrono::milliseconds election_timeout, bool force) noexcept {
    std::unique_lock<std::mutex> lock(cycle_mutex_);
    if (cycle_running_) {
        LOG_INFO("sync", "Sync already in progress - waiting for it (%s trigger)", concord::to_string(reason));
        uint64_t generation = cycle_generation_;
        cycle_done_.wait(lock, [&] { return cycle_generation_ != generation; });
        return last_cycle_result_;
    }
    cycle_running_ = true;
    lock.unlock();

    cycle_completion completion(cycle_mutex_, cycle_done_, cycle_running_, cycle_generation_, last_cycle_result_);
    try {
        completion.outcome = run_cycle(reason, election_timeout, force);
    } catch (const std::exception& e) {
        record_failure(sync_error::local_failure, e.what());
        completion.outcome = false;
    }
    set_state(sync_state::idle);
    return completion.outcome;
}

bool sync_manager::run_cycle(sync_reason reason, std::chrono::milliseconds election_timeout, bool force) {
    LOG_INFO("sync", "Starting %s sync as %s", concord::to_string(reason), identity_.c_str());

    set_state(sync_state::checking_needed);
    if (!force && !is_sync_needed()) {
        LOG_DEBUG("sync", "No sync needed");
        return true;
    }

    if (!backend_.is_available()) {
        record_failure(sync_error::unavailable, "Coordination backend unavailable");
        return false;
    }

    set_state(sync_state::electing);
    if (!backend_.register_sync_intent(identity_)) {
        backend_.release_leadership(identity_);
        record_failure(sync_error::unavailable, "Could not register sync intent");
        return false;
    }
    if (!backend_.attempt_leader_election(identity_, election_timeout)) {
        backend_.release_leadership(identity_);
        record_failure(sync_error::election_timeout, "Another instance holds leadership");
        return false;
    }

    leadership_guard guard(backend_, identity_, [this] { set_state(sync_state::releasing_leadership); });
    return perform_leader_sync();
}

// ============================================================================
// Leader work
// ============================================================================

std::string sync_manager::snapshot_local_cache(const std::string& work_dir) {
    fs::path snapshot = fs::path(work_dir) / ("local_" + identity_ + ".db");
    remove_quietly(snapshot);

    if (!fs::exists(options_.local_cache_path)) {
        throw merge_error("Local cache missing: " + options_.local_cache_path);
    }
    database cache(options_.local_cache_path);
    cache.backup_to(snapshot.string());
    return snapshot.string();
}

void sync_manager::refresh_local_cache(const std::string& source, int64_t last_merged_id,
                                       const key_remap& batch_remap) {
    // Operations recorded while this cycle ran are not in source yet. Their
    // keys are the ones the cache gave them, which the batch may have moved.
    std::vector<operation> late;
    for (auto& op : log_.pending()) {
        if (op.id > last_merged_id) late.push_back(std::move(op));
    }

    if (!late.empty()) {
        database merged(source);
        auto stats = merger_.apply(merged, late, batch_remap);
        if (!stats.remap.empty()) {
            log_.replace(stats.landed);
        }
        LOG_INFO("sync", "Re-applied %zu operations recorded during sync", late.size());
    }

    database cache(options_.local_cache_path);
    cache.restore_from(source);
}

bool sync_manager::perform_leader_sync() {
    const std::string work_dir = work_directory();
    std::error_code ec;
    fs::create_directories(work_dir, ec);
    if (ec) {
        record_failure(sync_error::local_failure, "Cannot create " + work_dir + ": " + ec.message());
        return false;
    }

    const auto batch = log_.pending();
    const int64_t last_merged_id = batch.empty() ? 0 : batch.back().id;

    const fs::path download_path = fs::path(work_dir) / ("download_" + identity_ + ".db");
    remove_quietly(download_path);

    set_state(sync_state::downloading);
    if (!backend_.download_database(download_path.string())) {
        record_failure(sync_error::transfer_failure, "Download of authoritative database failed");
        remove_quietly(download_path);
        return false;
    }
    bool duplicates_found = backend_.duplicates_in_last_download() > 0;

    set_state(sync_state::validating);
    std::string candidate;
    bool candidate_is_local = false;
    bool remote_corrupt = false;
    merge_stats batch_stats;

    try {
        switch (validator_.validate(download_path.string())) {
            case validation_result::absent:
                LOG_INFO("sync", "No authoritative database - publishing local cache");
                candidate = snapshot_local_cache(work_dir);
                candidate_is_local = true;
                break;
            case validation_result::invalid:
                LOG_WARN("sync", "Authoritative database failed validation - publishing local cache instead");
                remote_corrupt = true;
                candidate = snapshot_local_cache(work_dir);
                candidate_is_local = true;
                break;
            case validation_result::valid:
                set_state(sync_state::merging);
                candidate = merger_.merge(download_path.string(), batch, &batch_stats);
                break;
        }
    } catch (const std::exception& e) {
        record_failure(sync_error::local_failure, std::string("Preparing upload failed: ") + e.what());
        remove_quietly(download_path);
        remove_quietly(database_merger::merged_path_for(download_path.string()));
        return false;
    }

    set_state(sync_state::uploading);
    if (!backend_.upload_database(candidate)) {
        record_failure(sync_error::transfer_failure, "Upload of merged database failed");
        remove_quietly(download_path);
        remove_quietly(candidate);
        return false;
    }

    bool local_ok = true;
    if (!candidate_is_local) {
        try {
            refresh_local_cache(candidate, last_merged_id, batch_stats.remap);
        } catch (const std::exception& e) {
            LOG_ERROR("sync", "Failed to refresh local cache: %s", e.what());
            local_ok = false;
        }
    }

    // Without fresh metadata the next check sees a changed remote and
    // retries the cache refresh.
    if (local_ok) {
        try {
            if (auto fresh = backend_.observe_database()) {
                metadata_.save(*fresh);
            } else {
                LOG_WARN("sync", "Uploaded database not visible yet - metadata not updated");
            }
        } catch (const std::exception& e) {
            LOG_WARN("sync", "Could not record sync metadata: %s", e.what());
        }
    } else {
        metadata_.reset();
    }

    // The uploaded copy holds the batch now, whatever happened locally
    if (!batch.empty()) {
        try {
            log_.acknowledge(last_merged_id);
        } catch (const std::exception& e) {
            LOG_ERROR("sync", "Failed to clear synced operations: %s", e.what());
        }
    }

    remove_quietly(download_path);
    if (candidate != download_path.string()) remove_quietly(candidate);

    if (!local_ok) {
        record_failure(sync_error::local_failure, "Uploaded, but the local cache could not be refreshed");
        return false;
    }

    record_success();
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (remote_corrupt) {
            last_error_ = sync_error::corrupt_remote;
            last_error_message_ = "Replaced a corrupt authoritative database with the local cache";
        } else if (duplicates_found) {
            last_error_ = sync_error::duplicate_remote;
            last_error_message_ = "Resolved duplicate authoritative copies by recency";
        } else {
            last_error_ = sync_error::none;
            last_error_message_.clear();
        }
    }
    LOG_INFO("sync", "Sync complete (%zu operations merged)", batch.size());
    return true;
}

// ============================================================================
// Maintenance and status
// ============================================================================

void sync_manager::cleanup_stale_coordination_files(std::chrono::seconds max_age) noexcept {
    backend_.cleanup_stale_coordination_files(max_age);
}

sync_status sync_manager::get_sync_status() {
    sync_status status;
    status.identity = identity_;
    status.state = state_.load();
    status.pending_operations = log_.size();

    std::error_code ec;
    status.local_cache_exists = fs::exists(options_.local_cache_path, ec);
    if (status.local_cache_exists) {
        auto size = fs::file_size(options_.local_cache_path, ec);
        status.local_cache_size = ec ? 0 : static_cast<int64_t>(size);
    }

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status.last_sync_time = last_sync_time_;
        status.sync_count = sync_count_;
        status.error_count = error_count_;
        status.last_error = last_error_;
        status.last_error_message = last_error_message_;
    }

    try {
        status.coordination = backend_.get_coordination_status();
    } catch (const std::exception& e) {
        status.coordination.error = e.what();
    }
    return status;
}

// ============================================================================
// sync_scheduler
// ============================================================================

sync_scheduler::sync_scheduler(sync_manager& manager, trigger_timeouts timeouts)
    : manager_(manager), timeouts_(timeouts) {}

sync_scheduler::~sync_scheduler() {
    stop();
}

bool sync_scheduler::trigger_manual_sync() {
    LOG_INFO("sync", "Manual sync requested");
    return manager_.sync(sync_reason::manual, timeouts_.manual, true);
}

bool sync_scheduler::trigger_auto_sync() {
    if (!auto_sync_enabled_.load()) return true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        if (last_auto_sync_ && now - *last_auto_sync_ < timeouts_.auto_interval) {
            return true;
        }
    }

    manager_.cleanup_stale_coordination_files(timeouts_.stale_marker_age);
    if (!manager_.is_sync_needed()) {
        return true;
    }

    bool ok = manager_.sync(sync_reason::periodic, timeouts_.automatic, false);
    if (ok) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_auto_sync_ = std::chrono::steady_clock::now();
    }
    return ok;
}

bool sync_scheduler::trigger_idle_sync() {
    if (!manager_.is_sync_needed()) return true;
    return manager_.sync(sync_reason::idle, timeouts_.idle, false);
}

bool sync_scheduler::trigger_shutdown_sync() {
    if (!manager_.is_sync_needed()) return true;

    LOG_INFO("sync", "Syncing before shutdown");
    bool ok = manager_.sync(sync_reason::shutdown, timeouts_.shutdown, false);
    if (!ok) {
        LOG_ERROR("sync", "Shutdown sync failed - %zu changes remain queued for the next start",
                 manager_.pending_operations_count());
    }
    return ok;
}

void sync_scheduler::start(std::chrono::milliseconds tick) {
    if (running_.exchange(true)) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    worker_ = std::thread([this, tick] {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_requested_) {
            if (wake_.wait_for(lock, tick, [this] { return stop_requested_; })) break;
            lock.unlock();
            trigger_auto_sync();
            lock.lock();
        }
    });
    LOG_DEBUG("sync", "Background sync started");
}

void sync_scheduler::stop() {
    if (!running_.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
    LOG_DEBUG("sync", "Background sync stopped");
}

} // namespace concord

#include "concord/cloud_store_backend.hpp"
#include "concord/log.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>
#include <unistd.h>

namespace concord {

namespace fs = std::filesystem;

namespace {

constexpr const char* leader_pattern = "leader_*.json";
constexpr const char* intent_pattern = "intent_*.json";

bool newer_first(const object_info& a, const object_info& b) {
    if (a.modified_time != b.modified_time) return a.modified_time > b.modified_time;
    return a.id < b.id;
}

bool older_first(const object_info& a, const object_info& b) {
    if (a.modified_time != b.modified_time) return a.modified_time < b.modified_time;
    return a.name < b.name;
}

std::string identity_from_marker(const std::string& name) {
    const std::string prefix = "leader_";
    const std::string suffix = ".json";
    if (name.size() <= prefix.size() + suffix.size()) return name;
    return name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
}

} // namespace

cloud_store_backend::cloud_store_backend(std::shared_ptr<object_store> store)
    : cloud_store_backend(std::move(store), options{}) {}

cloud_store_backend::cloud_store_backend(std::shared_ptr<object_store> store, options opts)
    : store_(std::move(store)), options_(std::move(opts)) {
    if (!store_) {
        throw coordination_error("cloud_store_backend requires an object store");
    }
    fs::path name(options_.database_name);
    stem_ = name.stem().string();
    extension_ = name.extension().string();
}

std::string cloud_store_backend::staging_name(const std::string& tag) const {
    return stem_ + "_sync_" + tag + extension_;
}

// ============================================================================
// Helpers
// ============================================================================

std::vector<object_info> cloud_store_backend::database_copies() {
    auto copies = store_->list(options_.database_name);
    std::sort(copies.begin(), copies.end(), newer_first);
    return copies;
}

void cloud_store_backend::put_marker(const std::string& name, const marker_payload& payload) {
    fs::path temp = fs::temp_directory_path() / ("concord_marker_" + random_hex(12) + ".json");
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            throw store_error("Cannot stage marker at " + temp.string());
        }
        out << payload.to_json();
    }

    try {
        store_->put(temp.string(), name);
    } catch (const store_error&) {
        std::error_code ec;
        fs::remove(temp, ec);
        throw;
    }
    std::error_code ec;
    fs::remove(temp, ec);
}

void cloud_store_backend::remove_named(const std::string& name) noexcept {
    try {
        for (const auto& object : store_->list(name)) {
            store_->remove(object);
        }
    } catch (const std::exception& e) {
        LOG_WARN("cloud", "Failed to remove %s: %s", name.c_str(), e.what());
    }
}

std::vector<object_info> cloud_store_backend::live_leader_markers() {
    auto markers = store_->list(leader_pattern);
    auto now = std::chrono::system_clock::now();

    std::vector<object_info> live;
    for (auto& marker : markers) {
        if (now - marker.modified_time > options_.stale_leader_age) {
            LOG_INFO("cloud", "Removing stale leader marker %s", marker.name.c_str());
            try {
                store_->remove(marker);
            } catch (const store_error& e) {
                LOG_WARN("cloud", "Failed to remove stale marker %s: %s", marker.name.c_str(), e.what());
            }
            continue;
        }
        live.push_back(std::move(marker));
    }
    std::sort(live.begin(), live.end(), older_first);
    return live;
}

// ============================================================================
// Availability and intent
// ============================================================================

bool cloud_store_backend::is_available() {
    try {
        return store_->is_available();
    } catch (const store_error& e) {
        LOG_WARN("cloud", "Cloud store unavailable: %s", e.what());
        return false;
    }
}

bool cloud_store_backend::register_sync_intent(const std::string& identity) {
    try {
        marker_payload payload{identity, marker_kind::intent, std::chrono::system_clock::now(),
                               static_cast<int64_t>(::getpid()), local_host_name()};
        put_marker(intent_marker_name(identity), payload);
        LOG_DEBUG("cloud", "Registered sync intent for %s", identity.c_str());
        return true;
    } catch (const store_error& e) {
        LOG_ERROR("cloud", "Failed to register sync intent: %s", e.what());
        return false;
    }
}

// ============================================================================
// Leader election
// ============================================================================

bool cloud_store_backend::attempt_leader_election(const std::string& identity,
                                                   std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const std::string own_marker = leader_marker_name(identity);
    bool posted = false;

    for (;;) {
        try {
            auto leaders = live_leader_markers();
            bool contested = std::any_of(leaders.begin(), leaders.end(),
                                         [&](const object_info& m) { return m.name != own_marker; });

            if (!contested || posted) {
                if (!posted) {
                    marker_payload payload{identity, marker_kind::leader, std::chrono::system_clock::now(),
                                           static_cast<int64_t>(::getpid()), local_host_name()};
                    put_marker(own_marker, payload);
                    posted = true;

                    // Let markers written concurrently by other instances become visible
                    std::this_thread::sleep_for(options_.settle_delay);
                    leaders = live_leader_markers();
                }

                if (!leaders.empty() && leaders.front().name == own_marker) {
                    std::lock_guard<std::mutex> lock(mutex_);
                    leader_identity_ = identity;
                    LOG_INFO("cloud", "Acquired leadership as %s", identity.c_str());
                    return true;
                }

                LOG_INFO("cloud", "Lost leader race to %s",
                         leaders.empty() ? "unknown" : identity_from_marker(leaders.front().name).c_str());
                remove_named(own_marker);
                posted = false;
            } else {
                LOG_DEBUG("cloud", "Leadership held by %s - waiting",
                          identity_from_marker(leaders.front().name).c_str());
            }
        } catch (const store_error& e) {
            LOG_WARN("cloud", "Leader election attempt failed: %s", e.what());
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        auto wait = std::min<std::chrono::steady_clock::duration>(options_.poll_interval, deadline - now);
        std::this_thread::sleep_for(wait);
    }

    if (posted) remove_named(own_marker);
    LOG_WARN("cloud", "Leader election timed out for %s", identity.c_str());
    return false;
}

void cloud_store_backend::release_leadership(const std::string& identity) noexcept {
    remove_named(leader_marker_name(identity));
    remove_named(intent_marker_name(identity));

    std::lock_guard<std::mutex> lock(mutex_);
    if (leader_identity_ == identity) {
        leader_identity_.reset();
        LOG_INFO("cloud", "Released leadership for %s", identity.c_str());
    }
}

// ============================================================================
// Transfer
// ============================================================================

bool cloud_store_backend::download_database(const std::string& local_path) {
    last_duplicates_ = 0;
    try {
        auto copies = database_copies();
        last_duplicates_ = copies.empty() ? 0 : copies.size() - 1;
        if (copies.empty()) {
            LOG_INFO("cloud", "No %s in %s yet", options_.database_name.c_str(), store_->describe().c_str());
            return true;
        }

        const object_info selected = copies.front();
        auto parent = fs::path(local_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        store_->get(selected, local_path);
        if (!fs::exists(local_path)) {
            LOG_ERROR("cloud", "Download of %s produced no file", selected.name.c_str());
            return false;
        }
        LOG_INFO("cloud", "Downloaded %s (%ju bytes)", selected.name.c_str(),
                 static_cast<uintmax_t>(fs::file_size(local_path)));

        if (copies.size() > 1) {
            LOG_WARN("cloud", "Found %zu copies of %s - keeping the most recent",
                     copies.size(), options_.database_name.c_str());
            std::vector<object_info> others;
            for (size_t i = 1; i < copies.size(); ++i) {
                if (copies[i].id == selected.id) {
                    LOG_WARN("cloud", "Duplicate %s shares its id with the selected copy - cannot remove it individually",
                             copies[i].name.c_str());
                    continue;
                }
                others.push_back(copies[i]);
            }
            try {
                store_->remove_duplicates(selected, others);
            } catch (const store_error& e) {
                LOG_WARN("cloud", "Duplicates of %s left in place: %s", options_.database_name.c_str(), e.what());
            }
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("cloud", "Download failed: %s", e.what());
        return false;
    }
}

bool cloud_store_backend::upload_database(const std::string& local_path) {
    if (!fs::exists(local_path)) {
        LOG_ERROR("cloud", "Nothing to upload at %s", local_path.c_str());
        return false;
    }

    try {
        // Staging copies left behind by interrupted uploads
        for (const auto& orphan : store_->list(stem_ + "_sync_*" + extension_)) {
            try {
                store_->remove(orphan);
                LOG_DEBUG("cloud", "Removed orphaned staging object %s", orphan.name.c_str());
            } catch (const store_error& e) {
                LOG_WARN("cloud", "Failed to remove orphaned %s: %s", orphan.name.c_str(), e.what());
            }
        }

        std::string tag;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            tag = leader_identity_.value_or(random_hex(8));
        }
        auto staged = store_->put(local_path, staging_name(tag));
        store_->move(staged, options_.database_name);

        LOG_INFO("cloud", "Uploaded %s to %s (%lld bytes)", options_.database_name.c_str(),
                 store_->describe().c_str(), static_cast<long long>(staged.size));
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("cloud", "Upload failed: %s", e.what());
        return false;
    }
}

std::optional<sync_metadata> cloud_store_backend::observe_database() {
    std::vector<object_info> copies;
    try {
        copies = database_copies();
    } catch (const store_error& e) {
        throw coordination_error(std::string("Cannot list cloud store: ") + e.what());
    }
    if (copies.empty()) return std::nullopt;

    const auto& newest = copies.front();
    sync_metadata metadata;
    metadata.modified_time = newest.modified_time;
    metadata.size = newest.size;
    metadata.fingerprint = newest.checksum.empty() ? newest.id : newest.checksum;
    return metadata;
}

// ============================================================================
// Cleanup and status
// ============================================================================

void cloud_store_backend::cleanup_stale_coordination_files(std::chrono::seconds max_age) noexcept {
    size_t removed = 0;
    auto now = std::chrono::system_clock::now();

    for (const std::string pattern : {std::string(intent_pattern), std::string(leader_pattern),
                                      stem_ + "_sync_*" + extension_}) {
        try {
            for (const auto& object : store_->list(pattern)) {
                if (now - object.modified_time <= max_age) continue;
                try {
                    store_->remove(object);
                    ++removed;
                    LOG_DEBUG("cloud", "Removed stale %s", object.name.c_str());
                } catch (const store_error& e) {
                    LOG_WARN("cloud", "Failed to remove stale %s: %s", object.name.c_str(), e.what());
                }
            }
        } catch (const std::exception& e) {
            LOG_WARN("cloud", "Cleanup of %s skipped: %s", pattern.c_str(), e.what());
        }
    }

    // Backup objects are never read back, so any age qualifies
    try {
        for (const auto& object : store_->list(stem_ + "_backup_*" + extension_)) {
            try {
                store_->remove(object);
                ++removed;
            } catch (const store_error& e) {
                LOG_WARN("cloud", "Failed to remove backup %s: %s", object.name.c_str(), e.what());
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("cloud", "Backup cleanup skipped: %s", e.what());
    }

    if (removed > 0) {
        LOG_INFO("cloud", "Cleaned up %zu stale coordination objects", removed);
    }
}

coordination_status cloud_store_backend::get_coordination_status() {
    coordination_status status;
    status.backend_type = "cloud_store";
    status.location = store_->describe();

    try {
        status.available = store_->is_available();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status.is_leader = leader_identity_.has_value();
        }

        auto leaders = store_->list(leader_pattern);
        if (!leaders.empty()) {
            auto oldest = std::min_element(leaders.begin(), leaders.end(), older_first);
            status.current_leader = identity_from_marker(oldest->name);
        }
        status.active_intents = store_->list(intent_pattern).size();

        auto copies = database_copies();
        if (!copies.empty()) {
            status.remote_database = sync_metadata{copies.front().modified_time, copies.front().size,
                                                   copies.front().checksum.empty() ? copies.front().id
                                                                                   : copies.front().checksum};
            status.duplicate_count = copies.size() - 1;
        }
    } catch (const std::exception& e) {
        status.error = e.what();
    }
    return status;
}

} // namespace concord

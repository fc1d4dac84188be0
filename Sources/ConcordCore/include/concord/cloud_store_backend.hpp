#pragma once

#include "coordination.hpp"
#include "object_store.hpp"
#include <atomic>
#include <memory>
#include <mutex>

namespace concord {

// ============================================================================
// Cloud store backend
// ============================================================================
//
// Coordinates through an object_store container. The store offers no atomic
// create-if-absent, so election is optimistic: post a leader marker, wait for
// concurrent writers to become visible, and let the oldest marker win.
//
// Several objects may carry the database name after concurrent uploads. The
// most recently modified one is authoritative and the rest are pruned.

class cloud_store_backend : public coordination_backend {
public:
    struct options {
        std::string database_name = "concord.db";
        std::chrono::milliseconds poll_interval{2000};
        std::chrono::milliseconds settle_delay{1000};
        // A live leader's marker must never reach this age
        std::chrono::seconds stale_leader_age{25 * 60};
    };

    explicit cloud_store_backend(std::shared_ptr<object_store> store);
    cloud_store_backend(std::shared_ptr<object_store> store, options opts);

    bool is_available() override;
    bool register_sync_intent(const std::string& identity) override;
    bool attempt_leader_election(const std::string& identity,
                                 std::chrono::milliseconds timeout) override;
    void release_leadership(const std::string& identity) noexcept override;
    bool download_database(const std::string& local_path) override;
    bool upload_database(const std::string& local_path) override;
    std::optional<sync_metadata> observe_database() override;
    void cleanup_stale_coordination_files(std::chrono::seconds max_age) noexcept override;
    coordination_status get_coordination_status() override;
    size_t duplicates_in_last_download() const noexcept override { return last_duplicates_.load(); }

    /// Name given to an upload before it is moved over the database name.
    std::string staging_name(const std::string& tag) const;

    object_store& store() { return *store_; }
    std::chrono::seconds stale_leader_age() const { return options_.stale_leader_age; }

private:
    std::shared_ptr<object_store> store_;
    options options_;
    std::string stem_;
    std::string extension_;

    std::mutex mutex_;
    std::optional<std::string> leader_identity_;
    std::atomic<size_t> last_duplicates_{0};

    /// Copies of the database, most recently modified first (ties by id).
    std::vector<object_info> database_copies();
    void put_marker(const std::string& name, const marker_payload& payload);
    void remove_named(const std::string& name) noexcept;
    std::vector<object_info> live_leader_markers();
};

} // namespace concord

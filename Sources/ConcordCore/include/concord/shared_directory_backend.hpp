#pragma once

#include "coordination.hpp"
#include <filesystem>
#include <mutex>

namespace concord {

// ============================================================================
// Shared directory backend
// ============================================================================
//
// Coordinates through a directory every instance can reach (network share,
// synced folder). Layout:
//
//   <dir>/<database_name>                      authoritative copy
//   <dir>/<database_name>.backup_<epoch>       copy replaced by the last uploads
//   <dir>/.concord_sync/sync_leader.lock       hard link to the leader's marker
//   <dir>/.concord_sync/leader_<identity>.json
//   <dir>/.concord_sync/intent_<identity>.json
//
// The lock is claimed with link(2), which fails with EEXIST when another
// instance already holds it, so exactly one claim succeeds.

class shared_directory_backend : public coordination_backend {
public:
    struct options {
        std::string database_name = "concord.db";
        std::chrono::milliseconds poll_interval{250};
        bool keep_backups = true;
        std::chrono::seconds backup_retention{24 * 60 * 60};
    };

    explicit shared_directory_backend(std::string directory);
    shared_directory_backend(std::string directory, options opts);

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

    const std::filesystem::path& directory() const { return directory_; }
    const std::filesystem::path& database_path() const { return database_path_; }
    const std::filesystem::path& coordination_directory() const { return coordination_dir_; }
    const std::filesystem::path& lock_path() const { return lock_path_; }

private:
    std::filesystem::path directory_;
    std::filesystem::path database_path_;
    std::filesystem::path coordination_dir_;
    std::filesystem::path lock_path_;
    options options_;

    std::mutex mutex_;
    std::optional<std::string> leader_identity_;

    void ensure_directories();
    void write_marker(const std::filesystem::path& path, const marker_payload& payload);
    std::optional<marker_payload> read_marker(const std::filesystem::path& path) const;
    bool marker_is_orphaned(const std::filesystem::path& path, std::chrono::seconds max_age) const;
    void prune_backups() noexcept;
};

} // namespace concord

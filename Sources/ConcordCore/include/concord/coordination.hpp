#pragma once

#include "types.hpp"
#include "sync_metadata.hpp"
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace concord {

class coordination_error : public std::runtime_error {
public:
    explicit coordination_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Coordination markers
// ============================================================================
//
// Markers live in the shared medium as "leader_<identity>.json" and
// "intent_<identity>.json". The payload carries the claim time so orphans
// left by crashed instances can be pruned by age.

enum class marker_kind {
    leader,
    intent
};

struct marker_payload {
    std::string identity;
    marker_kind kind = marker_kind::intent;
    timestamp_t timestamp{};
    int64_t pid = 0;
    std::string host;

    std::string to_json() const;
    static std::optional<marker_payload> from_json(const std::string& json);
};

std::string leader_marker_name(const std::string& identity);
std::string intent_marker_name(const std::string& identity);

/// "<pid>_<8 hex>_<YYYYmmdd_HHMMSS>", unique per process start.
std::string make_instance_identity();

/// Host name of this machine, used to decide whether a marker's pid can be probed.
std::string local_host_name();

/// Shell-style match supporting '*' and '?'.
bool glob_match(const std::string& pattern, const std::string& name);

// ============================================================================
// Coordination status (diagnostics only)
// ============================================================================

struct coordination_status {
    std::string backend_type;
    std::string location;
    bool available = false;
    bool is_leader = false;
    std::optional<std::string> current_leader;
    size_t active_intents = 0;
    std::optional<sync_metadata> remote_database;  // nullopt when no authoritative copy exists
    size_t duplicate_count = 0;
    std::string error;

    std::string to_json() const;
};

// ============================================================================
// Coordination backend - abstraction over the shared medium
// ============================================================================

class coordination_backend {
public:
    virtual ~coordination_backend() = default;

    virtual bool is_available() = 0;

    virtual bool register_sync_intent(const std::string& identity) = 0;

    /// Poll the medium until this identity holds the only leader claim or the
    /// timeout elapses. At least one claim attempt is made even for a zero timeout.
    virtual bool attempt_leader_election(const std::string& identity,
                                         std::chrono::milliseconds timeout) = 0;

    /// Remove this identity's leader and intent markers. Idempotent; never throws.
    virtual void release_leadership(const std::string& identity) noexcept = 0;

    /// Fetch the authoritative copy into local_path. Returns true without
    /// creating local_path when no authoritative copy exists yet.
    virtual bool download_database(const std::string& local_path) = 0;

    /// Publish local_path as the new authoritative copy.
    virtual bool upload_database(const std::string& local_path) = 0;

    /// Fingerprint of the current authoritative copy, nullopt if there is none.
    /// Throws coordination_error when the medium cannot be inspected.
    virtual std::optional<sync_metadata> observe_database() = 0;

    /// {changed, fresh}. Reports a change when the copy is new, modified or
    /// resized, when nothing was observed before, and {true, nullopt} when no
    /// authoritative copy exists. Throws coordination_error like observe_database().
    virtual std::pair<bool, std::optional<sync_metadata>> has_database_changed(
        const std::optional<sync_metadata>& last_metadata);

    /// Best-effort pruning of orphaned markers and temporary artifacts.
    virtual void cleanup_stale_coordination_files(std::chrono::seconds max_age) noexcept = 0;

    virtual coordination_status get_coordination_status() = 0;

    /// Extra authoritative copies found by the last download_database().
    virtual size_t duplicates_in_last_download() const noexcept { return 0; }
};

} // namespace concord

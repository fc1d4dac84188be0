#pragma once

#include "types.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace concord {

/// Fingerprint of the authoritative copy as last observed by this instance.
struct sync_metadata {
    timestamp_t modified_time{};
    int64_t size = 0;
    std::string fingerprint;  // Content checksum or remote object id; empty when the medium has none

    bool operator==(const sync_metadata& other) const {
        return modified_time == other.modified_time &&
               size == other.size &&
               fingerprint == other.fingerprint;
    }
    bool operator!=(const sync_metadata& other) const { return !(*this == other); }

    std::string to_json() const;
    static std::optional<sync_metadata> from_json(const std::string& json);
};

/// Persists sync_metadata next to the local cache database.
class sync_metadata_store {
public:
    explicit sync_metadata_store(std::string path);

    /// Write atomically, creating missing parent directories. Throws std::system_error on I/O failure.
    void save(const sync_metadata& metadata);

    /// Absent when nothing was saved yet or the file cannot be parsed.
    std::optional<sync_metadata> load() const;

    /// Remove the saved metadata so the next check behaves like a first sync.
    void reset();

    /// True when a metadata file is present, readable or not.
    bool exists() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace concord

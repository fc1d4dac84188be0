#pragma once

#include "types.hpp"
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace concord {

class store_error : public std::runtime_error {
public:
    explicit store_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// One object in a cloud container. Several objects may share a name;
/// the id tells them apart where the store supports it.
struct object_info {
    std::string id;
    std::string name;
    int64_t size = 0;
    timestamp_t modified_time{};
    std::string checksum;  // Empty when the store reports none
};

// ============================================================================
// Object store - flat container of named objects
// ============================================================================

class object_store {
public:
    virtual ~object_store() = default;

    /// Credentials resolve and the container is reachable (created if missing).
    virtual bool is_available() = 0;

    /// Objects whose name matches a '*' / '?' glob.
    virtual std::vector<object_info> list(const std::string& pattern) = 0;

    /// Upload a local file as an object called name.
    virtual object_info put(const std::string& local_path, const std::string& name) = 0;

    virtual void get(const object_info& object, const std::string& local_path) = 0;

    /// Rename an object, replacing what the store replaces for that name.
    virtual void move(const object_info& object, const std::string& new_name) = 0;

    virtual void remove(const object_info& object) = 0;

    /// Delete the objects in others, all sharing keep's name, leaving keep.
    /// Throws store_error when any of them is left behind.
    virtual void remove_duplicates(const object_info& keep, const std::vector<object_info>& others);

    /// Human readable location, e.g. "gdrive:ConcordSync".
    virtual std::string describe() const = 0;
};

// ============================================================================
// rclone-backed store
// ============================================================================
//
// Drives the rclone CLI. credentials_ref names an rclone config file holding
// the remote's credentials; every command runs under a wall-clock timeout.
//
// rclone addresses objects by path. When several objects share a path, an
// object is fetched by its remote id (`backend copyid`), never deleted by
// path, and duplicates are collapsed with `dedupe --dedupe-mode newest`.

class rclone_object_store : public object_store {
public:
    struct options {
        std::string rclone_path = "rclone";
        std::string config_path;      // --config; empty uses rclone's default
        std::string remote;           // configured remote name, without ':'
        std::string container;        // folder within the remote
        int timeout_seconds = 120;
    };

    explicit rclone_object_store(options opts);

    bool is_available() override;
    std::vector<object_info> list(const std::string& pattern) override;
    object_info put(const std::string& local_path, const std::string& name) override;
    void get(const object_info& object, const std::string& local_path) override;
    void move(const object_info& object, const std::string& new_name) override;
    void remove(const object_info& object) override;
    void remove_duplicates(const object_info& keep, const std::vector<object_info>& others) override;
    std::string describe() const override;

private:
    options options_;

    struct command_result {
        int exit_code = -1;
        std::string output;
    };

    command_result run(const std::string& args, bool capture_stderr) const;
    void run_checked(const std::string& what, const std::string& args) const;
    std::string root_path() const;
    std::string object_path(const std::string& name) const;

    /// Every object currently stored under object's name.
    std::vector<object_info> objects_named(const object_info& object);
};

/// Parse `rclone lsjson --hash` output. Directories are skipped. Throws store_error.
std::vector<object_info> parse_rclone_listing(const std::string& json);

/// "2024-05-01T10:20:30.123456789Z" or with a "+02:00" style offset.
std::optional<timestamp_t> parse_rfc3339(const std::string& text);

/// Single-quote an argument for /bin/sh.
std::string shell_escape(const std::string& arg);

} // namespace concord

#include "concord/shared_directory_backend.hpp"
#include "concord/log.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace concord {

namespace fs = std::filesystem;

namespace {

constexpr const char* coordination_subdir = ".concord_sync";
constexpr const char* lock_file_name = "sync_leader.lock";
constexpr const char* backup_infix = ".backup_";
constexpr const char* upload_prefix = ".concord_upload_";

void fsync_path(const fs::path& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "open " + path.string());
    }
    int rc = ::fsync(fd);
    int err = errno;
    ::close(fd);
    if (rc != 0) {
        throw std::system_error(err, std::generic_category(), "fsync " + path.string());
    }
}

std::optional<timestamp_t> file_mtime(const fs::path& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return from_epoch_nanos(static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec);
}

bool process_alive(int64_t pid) {
    if (pid <= 0) return false;
    if (::kill(static_cast<pid_t>(pid), 0) == 0) return true;
    return errno == EPERM;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

shared_directory_backend::shared_directory_backend(std::string directory)
    : shared_directory_backend(std::move(directory), options{}) {}

shared_directory_backend::shared_directory_backend(std::string directory, options opts)
    : directory_(std::move(directory)), options_(std::move(opts)) {
    database_path_ = directory_ / options_.database_name;
    coordination_dir_ = directory_ / coordination_subdir;
    lock_path_ = coordination_dir_ / lock_file_name;

    std::error_code ec;
    if (fs::exists(directory_, ec) && !fs::is_directory(directory_, ec)) {
        throw coordination_error("Shared path is not a directory: " + directory_.string());
    }
}

void shared_directory_backend::ensure_directories() {
    fs::create_directories(coordination_dir_);
}

// ============================================================================
// Markers
// ============================================================================

void shared_directory_backend::write_marker(const fs::path& path, const marker_payload& payload) {
    fs::path temp = path;
    temp += ".tmp_" + random_hex(8);
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            throw std::system_error(errno, std::generic_category(), "open " + temp.string());
        }
        out << payload.to_json();
        out.flush();
        if (!out) {
            throw std::system_error(EIO, std::generic_category(), "write " + temp.string());
        }
    }
    fsync_path(temp);
    fs::rename(temp, path);
}

std::optional<marker_payload> shared_directory_backend::read_marker(const fs::path& path) const {
    std::ifstream in(path);
    if (!in) return std::nullopt;
    std::stringstream buffer;
    buffer << in.rdbuf();
    return marker_payload::from_json(buffer.str());
}

bool shared_directory_backend::marker_is_orphaned(const fs::path& path, std::chrono::seconds max_age) const {
    auto payload = read_marker(path);
    std::optional<timestamp_t> claimed = payload ? std::optional<timestamp_t>(payload->timestamp) : file_mtime(path);
    if (!claimed) return false;  // Already gone

    auto age = std::chrono::system_clock::now() - *claimed;
    if (age <= max_age) return false;

    // An old marker from a process that is still running on this host stays
    if (payload && payload->host == local_host_name() && process_alive(payload->pid)) {
        return false;
    }
    return true;
}

// ============================================================================
// Availability and intent
// ============================================================================

bool shared_directory_backend::is_available() {
    try {
        ensure_directories();
        fs::path probe = coordination_dir_ / (".probe_" + random_hex(8));
        {
            std::ofstream out(probe, std::ios::trunc);
            if (!out) {
                LOG_WARN("shared_dir", "Shared directory %s is not writable", directory_.c_str());
                return false;
            }
            out << "ok";
        }
        fs::remove(probe);
        return true;
    } catch (const std::exception& e) {
        LOG_WARN("shared_dir", "Shared directory %s unavailable: %s", directory_.c_str(), e.what());
        return false;
    }
}

bool shared_directory_backend::register_sync_intent(const std::string& identity) {
    try {
        ensure_directories();
        marker_payload payload{identity, marker_kind::intent, std::chrono::system_clock::now(),
                               static_cast<int64_t>(::getpid()), local_host_name()};
        write_marker(coordination_dir_ / intent_marker_name(identity), payload);
        LOG_DEBUG("shared_dir", "Registered sync intent for %s", identity.c_str());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("shared_dir", "Failed to register sync intent: %s", e.what());
        return false;
    }
}

// ============================================================================
// Leader election
// ============================================================================

bool shared_directory_backend::attempt_leader_election(const std::string& identity,
                                                        std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const fs::path marker = coordination_dir_ / leader_marker_name(identity);

    try {
        ensure_directories();
        marker_payload payload{identity, marker_kind::leader, std::chrono::system_clock::now(),
                               static_cast<int64_t>(::getpid()), local_host_name()};
        write_marker(marker, payload);
    } catch (const std::exception& e) {
        LOG_ERROR("shared_dir", "Failed to write leader marker: %s", e.what());
        return false;
    }

    for (;;) {
        if (::link(marker.c_str(), lock_path_.c_str()) == 0) {
            std::lock_guard<std::mutex> lock(mutex_);
            leader_identity_ = identity;
            LOG_INFO("shared_dir", "Acquired leadership as %s", identity.c_str());
            return true;
        }

        int err = errno;
        if (err != EEXIST) {
            LOG_ERROR("shared_dir", "Cannot claim %s: %s", lock_path_.c_str(), std::strerror(err));
            break;
        }

        auto holder = read_marker(lock_path_);
        if (holder && holder->identity == identity) {
            std::lock_guard<std::mutex> lock(mutex_);
            leader_identity_ = identity;
            return true;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        auto wait = std::min<std::chrono::steady_clock::duration>(options_.poll_interval, deadline - now);
        LOG_DEBUG("shared_dir", "Leadership held by %s - waiting",
                  holder ? holder->identity.c_str() : "unknown");
        std::this_thread::sleep_for(wait);
    }

    std::error_code ec;
    fs::remove(marker, ec);
    LOG_WARN("shared_dir", "Leader election timed out for %s", identity.c_str());
    return false;
}

void shared_directory_backend::release_leadership(const std::string& identity) noexcept {
    std::error_code ec;

    auto holder = read_marker(lock_path_);
    if (holder && holder->identity == identity) {
        fs::remove(lock_path_, ec);
        if (ec) {
            LOG_WARN("shared_dir", "Failed to remove %s: %s", lock_path_.c_str(), ec.message().c_str());
        }
    }

    fs::remove(coordination_dir_ / leader_marker_name(identity), ec);
    fs::remove(coordination_dir_ / intent_marker_name(identity), ec);

    std::lock_guard<std::mutex> lock(mutex_);
    if (leader_identity_ == identity) {
        leader_identity_.reset();
        LOG_INFO("shared_dir", "Released leadership for %s", identity.c_str());
    }
}

// ============================================================================
// Transfer
// ============================================================================

bool shared_directory_backend::download_database(const std::string& local_path) {
    try {
        if (!fs::exists(database_path_)) {
            LOG_INFO("shared_dir", "No shared database at %s yet", database_path_.c_str());
            return true;
        }

        auto parent = fs::path(local_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        fs::copy_file(database_path_, local_path, fs::copy_options::overwrite_existing);

        auto expected = fs::file_size(database_path_);
        auto copied = fs::file_size(local_path);
        if (copied != expected) {
            LOG_ERROR("shared_dir", "Downloaded %ju bytes, expected %ju",
                      static_cast<uintmax_t>(copied), static_cast<uintmax_t>(expected));
            return false;
        }
        LOG_INFO("shared_dir", "Downloaded shared database (%ju bytes)", static_cast<uintmax_t>(copied));
        return true;
    } catch (const fs::filesystem_error& e) {
        LOG_ERROR("shared_dir", "Download failed: %s", e.what());
        return false;
    }
}

bool shared_directory_backend::upload_database(const std::string& local_path) {
    fs::path temp = directory_ / (upload_prefix + random_hex(8));
    try {
        if (!fs::exists(local_path)) {
            LOG_ERROR("shared_dir", "Nothing to upload at %s", local_path.c_str());
            return false;
        }
        fs::create_directories(directory_);

        if (options_.keep_backups && fs::exists(database_path_)) {
            fs::path backup = database_path_;
            backup += backup_infix + std::to_string(
                std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count());
            fs::copy_file(database_path_, backup, fs::copy_options::overwrite_existing);
            LOG_DEBUG("shared_dir", "Kept previous shared database as %s", backup.filename().c_str());
        }

        fs::copy_file(local_path, temp, fs::copy_options::overwrite_existing);
        fsync_path(temp);
        fs::rename(temp, database_path_);

        auto size = fs::file_size(database_path_);
        LOG_INFO("shared_dir", "Uploaded database to %s (%ju bytes)",
                 database_path_.c_str(), static_cast<uintmax_t>(size));
    } catch (const std::exception& e) {
        LOG_ERROR("shared_dir", "Upload failed: %s", e.what());
        std::error_code ec;
        fs::remove(temp, ec);
        return false;
    }

    if (options_.keep_backups) prune_backups();
    return true;
}

std::optional<sync_metadata> shared_directory_backend::observe_database() {
    struct stat st{};
    if (::stat(database_path_.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return std::nullopt;
        throw coordination_error("stat " + database_path_.string() + ": " + std::strerror(errno));
    }

    sync_metadata metadata;
    metadata.modified_time = from_epoch_nanos(static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec);
    metadata.size = static_cast<int64_t>(st.st_size);
    return metadata;
}

// ============================================================================
// Cleanup
// ============================================================================

void shared_directory_backend::prune_backups() noexcept {
    std::error_code ec;
    const std::string prefix = options_.database_name + backup_infix;
    auto now = std::chrono::system_clock::now();

    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (!starts_with(name, prefix)) continue;

        auto mtime = file_mtime(it->path());
        if (mtime && now - *mtime > options_.backup_retention) {
            std::error_code remove_ec;
            fs::remove(it->path(), remove_ec);
            if (!remove_ec) LOG_DEBUG("shared_dir", "Removed old backup %s", name.c_str());
        }
    }
}

void shared_directory_backend::cleanup_stale_coordination_files(std::chrono::seconds max_age) noexcept {
    std::error_code ec;
    size_t removed = 0;

    for (fs::directory_iterator it(coordination_dir_, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path path = it->path();
        const std::string name = path.filename().string();

        bool candidate = starts_with(name, "intent_") || starts_with(name, "leader_") || name == lock_file_name;
        if (!candidate) continue;

        if (marker_is_orphaned(path, max_age)) {
            std::error_code remove_ec;
            fs::remove(path, remove_ec);
            if (remove_ec) {
                LOG_WARN("shared_dir", "Failed to remove stale %s: %s", name.c_str(), remove_ec.message().c_str());
            } else {
                LOG_INFO("shared_dir", "Removed stale coordination file %s", name.c_str());
                ++removed;
            }
        }
    }

    // Temp files of uploads interrupted by a crash
    auto now = std::chrono::system_clock::now();
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (!starts_with(name, upload_prefix)) continue;
        auto mtime = file_mtime(it->path());
        if (mtime && now - *mtime > max_age) {
            std::error_code remove_ec;
            fs::remove(it->path(), remove_ec);
            if (!remove_ec) ++removed;
        }
    }

    if (options_.keep_backups) prune_backups();

    if (removed > 0) {
        LOG_INFO("shared_dir", "Cleaned up %zu stale coordination files", removed);
    }
}

coordination_status shared_directory_backend::get_coordination_status() {
    coordination_status status;
    status.backend_type = "shared_directory";
    status.location = directory_.string();

    try {
        status.available = is_available();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            status.is_leader = leader_identity_.has_value();
        }
        if (auto holder = read_marker(lock_path_)) {
            status.current_leader = holder->identity;
        }

        std::error_code ec;
        for (fs::directory_iterator it(coordination_dir_, ec), end; !ec && it != end; it.increment(ec)) {
            const std::string name = it->path().filename().string();
            if (starts_with(name, "intent_") && name.size() > 5 && name.substr(name.size() - 5) == ".json") {
                ++status.active_intents;
            }
        }
        status.remote_database = observe_database();
    } catch (const std::exception& e) {
        status.error = e.what();
    }
    return status;
}

} // namespace concord

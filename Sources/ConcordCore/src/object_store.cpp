#include "concord/object_store.hpp"
#include "concord/coordination.hpp"
#include "concord/log.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <sys/wait.h>

namespace concord {

using json = nlohmann::json;
namespace fs = std::filesystem;

// rclone exit code for "directory not found"
static constexpr int rclone_dir_not_found = 3;
// timeout(1) exit code when the command ran out of time
static constexpr int timeout_expired = 124;

// ============================================================================
// Helpers
// ============================================================================

std::string shell_escape(const std::string& arg) {
    std::string escaped = "'";
    for (char c : arg) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped += c;
        }
    }
    escaped += "'";
    return escaped;
}

std::optional<timestamp_t> parse_rfc3339(const std::string& text) {
    int year, month, day, hour, minute, second;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return std::nullopt;
    }

    size_t pos = static_cast<size_t>(consumed);
    int64_t nanos = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        for (; digits < 9; ++digits) nanos *= 10;
    }

    int offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        int off_h = 0, off_m = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &off_h, &off_m) != 2) {
            return std::nullopt;
        }
        offset_seconds = sign * (off_h * 3600 + off_m * 60);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    int64_t epoch = static_cast<int64_t>(::timegm(&tm)) - offset_seconds;

    return from_epoch_nanos(epoch * 1000000000LL + nanos);
}

std::vector<object_info> parse_rclone_listing(const std::string& text) {
    json listing;
    try {
        listing = json::parse(text);
    } catch (const json::exception& e) {
        throw store_error(std::string("Unreadable rclone listing: ") + e.what());
    }
    if (!listing.is_array()) {
        throw store_error("Unexpected rclone listing: not an array");
    }

    std::vector<object_info> objects;
    for (const auto& entry : listing) {
        if (!entry.is_object() || entry.value("IsDir", false)) continue;

        object_info info;
        info.name = entry.value("Name", std::string{});
        std::string path = entry.value("Path", info.name);
        info.id = entry.value("ID", path);
        info.size = entry.value("Size", int64_t{0});

        auto modified = parse_rfc3339(entry.value("ModTime", std::string{}));
        if (!modified) {
            LOG_WARN("rclone", "Unparseable ModTime for %s", info.name.c_str());
        } else {
            info.modified_time = *modified;
        }

        if (entry.contains("Hashes") && entry["Hashes"].is_object()) {
            const auto& hashes = entry["Hashes"];
            if (hashes.contains("md5")) {
                info.checksum = hashes["md5"].get<std::string>();
            } else if (hashes.contains("sha1")) {
                info.checksum = hashes["sha1"].get<std::string>();
            } else if (!hashes.empty() && hashes.begin()->is_string()) {
                info.checksum = hashes.begin()->get<std::string>();
            }
        }
        objects.push_back(std::move(info));
    }
    return objects;
}

// ============================================================================
// object_store
// ============================================================================

void object_store::remove_duplicates(const object_info& keep, const std::vector<object_info>& others) {
    size_t failed = 0;
    std::string last_error;
    for (const auto& other : others) {
        if (other.id == keep.id) continue;
        try {
            remove(other);
        } catch (const store_error& e) {
            ++failed;
            last_error = e.what();
        }
    }
    if (failed > 0) {
        throw store_error(std::to_string(failed) + " duplicate(s) of " + keep.name + " not removed: " + last_error);
    }
}

// ============================================================================
// rclone_object_store
// ============================================================================

// Without an ID in the listing the id falls back to the path
static bool has_remote_id(const object_info& object) {
    return !object.id.empty() && object.id != object.name;
}

rclone_object_store::rclone_object_store(options opts) : options_(std::move(opts)) {
    if (options_.remote.empty()) {
        throw store_error("rclone remote name is required");
    }
}

std::string rclone_object_store::describe() const {
    return root_path();
}

std::string rclone_object_store::root_path() const {
    return options_.remote + ":" + options_.container;
}

std::string rclone_object_store::object_path(const std::string& name) const {
    if (options_.container.empty()) return options_.remote + ":" + name;
    return options_.remote + ":" + options_.container + "/" + name;
}

rclone_object_store::command_result rclone_object_store::run(const std::string& args, bool capture_stderr) const {
    std::string cmd = "timeout " + std::to_string(options_.timeout_seconds) + " " +
                      shell_escape(options_.rclone_path);
    if (!options_.config_path.empty()) {
        cmd += " --config " + shell_escape(options_.config_path);
    }
    cmd += " " + args + (capture_stderr ? " 2>&1" : " 2>/dev/null");
    LOG_DEBUG("rclone", "Executing: %s", cmd.c_str());

    command_result result;
    std::array<char, 4096> buffer;
    std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(cmd.c_str(), "r"), pclose);
    if (!pipe) {
        throw store_error("Failed to execute rclone");
    }
    while (fgets(buffer.data(), buffer.size(), pipe.get()) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe.release());
    result.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    if (result.exit_code == timeout_expired) {
        throw store_error("rclone timed out after " + std::to_string(options_.timeout_seconds) + "s");
    }
    return result;
}

void rclone_object_store::run_checked(const std::string& what, const std::string& args) const {
    auto result = run(args, true);
    if (result.exit_code != 0) {
        throw store_error("rclone " + what + " failed (exit " + std::to_string(result.exit_code) + "): " + result.output);
    }
}

bool rclone_object_store::is_available() {
    if (!options_.config_path.empty() && !fs::exists(options_.config_path)) {
        LOG_WARN("rclone", "Credentials file %s not found", options_.config_path.c_str());
        return false;
    }
    try {
        auto result = run("mkdir " + shell_escape(root_path()), true);
        if (result.exit_code != 0) {
            LOG_WARN("rclone", "Remote %s unreachable: %s", describe().c_str(), result.output.c_str());
            return false;
        }
        return true;
    } catch (const store_error& e) {
        LOG_WARN("rclone", "Remote %s unreachable: %s", describe().c_str(), e.what());
        return false;
    }
}

std::vector<object_info> rclone_object_store::list(const std::string& pattern) {
    auto result = run("lsjson --hash --files-only --no-mimetype --include " + shell_escape(pattern) +
                      " " + shell_escape(root_path()), false);
    if (result.exit_code == rclone_dir_not_found) {
        return {};
    }
    if (result.exit_code != 0) {
        throw store_error("rclone lsjson failed (exit " + std::to_string(result.exit_code) + ")");
    }

    auto objects = parse_rclone_listing(result.output);
    objects.erase(std::remove_if(objects.begin(), objects.end(),
                                 [&](const object_info& o) { return !glob_match(pattern, o.name); }),
                  objects.end());
    return objects;
}

object_info rclone_object_store::put(const std::string& local_path, const std::string& name) {
    run_checked("copyto", "copyto " + shell_escape(local_path) + " " + shell_escape(object_path(name)));

    auto objects = list(name);
    if (objects.empty()) {
        throw store_error("Uploaded object " + name + " not visible in " + describe());
    }
    return *std::max_element(objects.begin(), objects.end(), [](const object_info& a, const object_info& b) {
        return a.modified_time < b.modified_time;
    });
}

std::vector<object_info> rclone_object_store::objects_named(const object_info& object) {
    auto objects = list(object.name);
    objects.erase(std::remove_if(objects.begin(), objects.end(),
                                 [&](const object_info& o) { return o.name != object.name; }),
                  objects.end());
    return objects;
}

void rclone_object_store::get(const object_info& object, const std::string& local_path) {
    auto copies = objects_named(object);
    bool present = std::any_of(copies.begin(), copies.end(),
                               [&](const object_info& o) { return o.id == object.id; });
    if (!present) {
        throw store_error(object.name + " (" + object.id + ") is no longer in " + describe());
    }

    if (copies.size() == 1) {
        run_checked("copyto", "copyto " + shell_escape(object_path(object.name)) + " " + shell_escape(local_path));
        return;
    }
    if (!has_remote_id(object)) {
        throw store_error(std::to_string(copies.size()) + " objects named " + object.name +
                          " and the remote reports no ids to tell them apart");
    }
    LOG_DEBUG("rclone", "%zu objects named %s - fetching %s by id", copies.size(),
              object.name.c_str(), object.id.c_str());
    run_checked("backend copyid", "backend copyid " + shell_escape(options_.remote + ":") + " " +
                                  shell_escape(object.id) + " " + shell_escape(local_path));
}

void rclone_object_store::move(const object_info& object, const std::string& new_name) {
    run_checked("moveto", "moveto " + shell_escape(object_path(object.name)) + " " + shell_escape(object_path(new_name)));
}

void rclone_object_store::remove(const object_info& object) {
    auto copies = objects_named(object);
    if (copies.size() > 1) {
        throw store_error(std::to_string(copies.size()) + " objects share " + object_path(object.name) +
                          " - deleting by path could remove another copy");
    }
    if (copies.empty() || copies.front().id != object.id) {
        LOG_DEBUG("rclone", "%s (%s) already gone", object.name.c_str(), object.id.c_str());
        return;
    }
    run_checked("deletefile", "deletefile " + shell_escape(object_path(object.name)));
}

void rclone_object_store::remove_duplicates(const object_info& keep, const std::vector<object_info>& others) {
    if (others.empty()) return;
    if (!has_remote_id(keep)) {
        throw store_error("The remote reports no ids for " + keep.name + " - duplicates cannot be told apart");
    }

    run_checked("dedupe", "dedupe --dedupe-mode newest --include " + shell_escape(keep.name) + " " +
                          shell_escape(root_path()));

    auto remaining = objects_named(keep);
    if (remaining.size() != 1 || remaining.front().id != keep.id) {
        throw store_error("dedupe left " + std::to_string(remaining.size()) + " object(s) named " + keep.name +
                          (remaining.size() == 1 ? " but not the selected copy" : ""));
    }
}

} // namespace concord

#include "concord/sync_metadata.hpp"
#include "concord/log.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <cerrno>

namespace concord {

using json = nlohmann::json;
namespace fs = std::filesystem;

std::string sync_metadata::to_json() const {
    json j;
    j["modified_time_ns"] = to_epoch_nanos(modified_time);
    j["size"] = size;
    j["fingerprint"] = fingerprint;
    return j.dump(2);
}

std::optional<sync_metadata> sync_metadata::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) return std::nullopt;

        sync_metadata metadata;
        metadata.modified_time = from_epoch_nanos(j.at("modified_time_ns").get<int64_t>());
        metadata.size = j.at("size").get<int64_t>();
        metadata.fingerprint = j.value("fingerprint", std::string{});
        return metadata;
    } catch (const json::exception& e) {
        LOG_WARN("metadata", "Malformed sync metadata: %s", e.what());
        return std::nullopt;
    }
}

sync_metadata_store::sync_metadata_store(std::string path) : path_(std::move(path)) {}

void sync_metadata_store::save(const sync_metadata& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }

    std::string temp_path = path_ + ".tmp";
    {
        std::ofstream out(temp_path, std::ios::trunc);
        if (!out) {
            throw std::system_error(errno, std::generic_category(), "open " + temp_path);
        }
        out << metadata.to_json();
        out.flush();
        if (!out) {
            throw std::system_error(EIO, std::generic_category(), "write " + temp_path);
        }
    }
    fs::rename(temp_path, path_);
    LOG_DEBUG("metadata", "Saved sync metadata (size=%lld) to %s",
              static_cast<long long>(metadata.size), path_.c_str());
}

std::optional<sync_metadata> sync_metadata_store::load() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::ifstream in(path_);
    if (!in) {
        LOG_DEBUG("metadata", "No sync metadata at %s", path_.c_str());
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto metadata = sync_metadata::from_json(buffer.str());
    if (!metadata) {
        LOG_WARN("metadata", "Ignoring unreadable sync metadata %s - treating as first sync", path_.c_str());
    }
    return metadata;
}

void sync_metadata_store::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        LOG_WARN("metadata", "Failed to remove %s: %s", path_.c_str(), ec.message().c_str());
    }
}

bool sync_metadata_store::exists() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    return fs::exists(path_, ec);
}

} // namespace concord

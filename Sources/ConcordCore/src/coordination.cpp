#include "concord/coordination.hpp"
#include "concord/log.hpp"
#include <nlohmann/json.hpp>
#include <ctime>
#include <unistd.h>
#include <limits.h>

namespace concord {

using json = nlohmann::json;

// ============================================================================
// Markers
// ============================================================================

std::string leader_marker_name(const std::string& identity) {
    return "leader_" + identity + ".json";
}

std::string intent_marker_name(const std::string& identity) {
    return "intent_" + identity + ".json";
}

std::string marker_payload::to_json() const {
    json j;
    j["identity"] = identity;
    j["kind"] = kind == marker_kind::leader ? "leader" : "intent";
    j["timestamp"] = to_epoch_millis(timestamp);
    j["pid"] = pid;
    j["host"] = host;
    return j.dump(2);
}

std::optional<marker_payload> marker_payload::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) return std::nullopt;

        marker_payload payload;
        payload.identity = j.at("identity").get<std::string>();
        payload.kind = j.value("kind", std::string{"intent"}) == "leader" ? marker_kind::leader : marker_kind::intent;
        payload.timestamp = from_epoch_millis(j.at("timestamp").get<int64_t>());
        payload.pid = j.value("pid", int64_t{0});
        payload.host = j.value("host", std::string{});
        return payload;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

std::string make_instance_identity() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
    return std::to_string(::getpid()) + "_" + random_hex(8) + "_" + stamp;
}

std::string local_host_name() {
    char name[HOST_NAME_MAX + 1] = {};
    if (::gethostname(name, sizeof(name) - 1) != 0) {
        return "unknown";
    }
    return name;
}

bool glob_match(const std::string& pattern, const std::string& name) {
    size_t p = 0, n = 0;
    size_t star = std::string::npos, resume = 0;

    while (n < name.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == name[n])) {
            ++p;
            ++n;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = n;
        } else if (star != std::string::npos) {
            p = star + 1;
            n = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

// ============================================================================
// Status
// ============================================================================

std::string coordination_status::to_json() const {
    json j;
    j["backend_type"] = backend_type;
    j["location"] = location;
    j["available"] = available;
    j["is_leader"] = is_leader;
    j["current_leader"] = current_leader ? json(*current_leader) : json(nullptr);
    j["active_intents"] = active_intents;
    if (remote_database) {
        j["remote_database"] = {
            {"exists", true},
            {"size_bytes", remote_database->size},
            {"modified_time_ms", to_epoch_millis(remote_database->modified_time)},
            {"fingerprint", remote_database->fingerprint}
        };
    } else {
        j["remote_database"] = {{"exists", false}};
    }
    j["duplicate_count"] = duplicate_count;
    if (!error.empty()) j["error"] = error;
    return j.dump(2);
}

// ============================================================================
// Default change detection
// ============================================================================

std::pair<bool, std::optional<sync_metadata>> coordination_backend::has_database_changed(
        const std::optional<sync_metadata>& last_metadata) {
    auto current = observe_database();
    if (!current) {
        LOG_DEBUG("sync", "No authoritative database - considering as changed");
        return {true, std::nullopt};
    }
    if (!last_metadata) {
        LOG_DEBUG("sync", "No previous sync metadata - considering as changed");
        return {true, current};
    }
    if (*current != *last_metadata) {
        LOG_DEBUG("sync", "Authoritative database changed: size=%lld",
                  static_cast<long long>(current->size));
        return {true, current};
    }
    LOG_DEBUG("sync", "Authoritative database unchanged since last sync");
    return {false, current};
}

} // namespace concord

#include "concord/config.hpp"
#include "concord/cloud_store_backend.hpp"
#include "concord/object_store.hpp"
#include "concord/shared_directory_backend.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace concord {

using json = nlohmann::json;
namespace fs = std::filesystem;

// ============================================================================
// concord_config
// ============================================================================

std::string concord_config::authoritative_name() const {
    if (!database_name.empty()) return database_name;
    return fs::path(local_cache_db_path).filename().string();
}

std::string concord_config::metadata_path() const {
    return (fs::path(local_cache_db_path).parent_path() / "last_sync_metadata.json").string();
}

std::string concord_config::journal_path() const {
    return (fs::path(local_cache_db_path).parent_path() / "pending_operations.jsonl").string();
}

trigger_timeouts concord_config::to_trigger_timeouts() const {
    trigger_timeouts t;
    t.manual = std::chrono::seconds(timeouts.manual_seconds);
    t.automatic = std::chrono::seconds(timeouts.auto_seconds);
    t.idle = std::chrono::seconds(timeouts.idle_seconds);
    t.shutdown = std::chrono::seconds(timeouts.shutdown_seconds);
    t.stale_marker_age = std::chrono::minutes(timeouts.stale_marker_minutes);
    t.auto_interval = std::chrono::minutes(timeouts.auto_interval_minutes);
    return t;
}

// Store calls between winning a cloud election and releasing it
static constexpr int leader_cycle_store_calls = 10;

std::chrono::seconds concord_config::stale_leader_age() const {
    if (timeouts.stale_leader_seconds > 0) {
        return std::chrono::seconds(timeouts.stale_leader_seconds);
    }
    return std::chrono::seconds(timeouts.manual_seconds +
                                leader_cycle_store_calls * backend.cloud_store.command_timeout_seconds);
}

std::string default_cache_path() {
    fs::path base;
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = fs::path(home) / ".local" / "share";
    } else {
        base = fs::temp_directory_path();
    }
    return (base / "concord" / "concord.db").string();
}

// ============================================================================
// Parsing
// ============================================================================

concord_config parse_config(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw config_error(std::string("Malformed configuration: ") + e.what());
    }
    if (!j.is_object()) {
        throw config_error("Configuration must be a JSON object");
    }

    concord_config config;
    try {
        std::string strategy = j.value("sync_strategy", std::string{"local_only"});
        if (strategy == "leader_election") {
            config.strategy = sync_strategy::leader_election;
        } else if (strategy == "local_only") {
            config.strategy = sync_strategy::local_only;
        } else {
            throw config_error("Unknown sync_strategy: " + strategy);
        }

        config.local_cache_db_path = j.value("local_cache_db_path", default_cache_path());
        config.database_name = j.value("database_name", std::string{});
        config.required_tables = j.value("required_tables", std::vector<std::string>{});
        config.level = log_level_from_string(j.value("log_level", std::string{"off"}));

        if (j.contains("coordination_backend")) {
            const auto& b = j["coordination_backend"];
            std::string type = b.value("type", std::string{"shared_directory"});
            if (type == "shared_directory") {
                config.backend.type = backend_type::shared_directory;
            } else if (type == "cloud_store") {
                config.backend.type = backend_type::cloud_store;
            } else {
                throw config_error("Unknown coordination backend type: " + type);
            }

            if (b.contains("shared_directory")) {
                config.backend.shared_directory.path = b["shared_directory"].value("path", std::string{});
            }
            if (b.contains("cloud_store")) {
                const auto& c = b["cloud_store"];
                auto& cloud = config.backend.cloud_store;
                cloud.credentials_ref = c.value("credentials_ref", cloud.credentials_ref);
                cloud.remote = c.value("remote", cloud.remote);
                cloud.container_name = c.value("container_name", cloud.container_name);
                cloud.rclone_path = c.value("rclone_path", cloud.rclone_path);
                cloud.command_timeout_seconds = c.value("command_timeout_seconds", cloud.command_timeout_seconds);
            }
        }

        if (j.contains("timeouts")) {
            const auto& t = j["timeouts"];
            auto& out = config.timeouts;
            out.manual_seconds = t.value("manual_seconds", out.manual_seconds);
            out.auto_seconds = t.value("auto_seconds", out.auto_seconds);
            out.idle_seconds = t.value("idle_seconds", out.idle_seconds);
            out.shutdown_seconds = t.value("shutdown_seconds", out.shutdown_seconds);
            out.poll_interval_ms = t.value("poll_interval_ms", out.poll_interval_ms);
            out.stale_marker_minutes = t.value("stale_marker_minutes", out.stale_marker_minutes);
            out.auto_interval_minutes = t.value("auto_interval_minutes", out.auto_interval_minutes);
            out.stale_leader_seconds = t.value("stale_leader_seconds", out.stale_leader_seconds);
        }
    } catch (const json::exception& e) {
        throw config_error(std::string("Invalid configuration value: ") + e.what());
    }

    if (config.strategy == sync_strategy::leader_election) {
        if (config.backend.type == backend_type::shared_directory && config.backend.shared_directory.path.empty()) {
            throw config_error("shared_directory.path is required for the shared_directory backend");
        }
        if (config.backend.type == backend_type::cloud_store && config.backend.cloud_store.remote.empty()) {
            throw config_error("cloud_store.remote is required for the cloud_store backend");
        }
        if (config.backend.cloud_store.command_timeout_seconds <= 0 || config.timeouts.stale_leader_seconds < 0) {
            throw config_error("command_timeout_seconds must be positive and stale_leader_seconds not negative");
        }
    }
    return config;
}

concord_config load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        LOG_INFO("config", "No configuration at %s - using local_only defaults", path.c_str());
        concord_config config;
        config.local_cache_db_path = default_cache_path();
        return config;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
}

std::unique_ptr<coordination_backend> make_backend(const concord_config& config) {
    if (config.strategy == sync_strategy::local_only) {
        return nullptr;
    }

    const auto poll = std::chrono::milliseconds(config.timeouts.poll_interval_ms);

    switch (config.backend.type) {
        case backend_type::shared_directory: {
            shared_directory_backend::options opts;
            opts.database_name = config.authoritative_name();
            opts.poll_interval = poll;
            return std::make_unique<shared_directory_backend>(config.backend.shared_directory.path, opts);
        }
        case backend_type::cloud_store: {
            const auto& cloud = config.backend.cloud_store;
            rclone_object_store::options store_opts;
            store_opts.rclone_path = cloud.rclone_path;
            store_opts.config_path = cloud.credentials_ref;
            store_opts.remote = cloud.remote;
            store_opts.container = cloud.container_name;
            store_opts.timeout_seconds = cloud.command_timeout_seconds;

            cloud_store_backend::options opts;
            opts.database_name = config.authoritative_name();
            opts.poll_interval = poll;
            opts.stale_leader_age = config.stale_leader_age();
            return std::make_unique<cloud_store_backend>(std::make_shared<rclone_object_store>(store_opts), opts);
        }
    }
    throw config_error("Unsupported coordination backend");
}

// ============================================================================
// sync_session
// ============================================================================

sync_session::sync_session(concord_config config) : config_(std::move(config)) {
    set_log_level(config_.level);

    log_ = std::make_unique<operation_log>(config_.journal_path());
    metadata_ = std::make_unique<sync_metadata_store>(config_.metadata_path());
    backend_ = make_backend(config_);

    if (backend_) {
        sync_options options;
        options.local_cache_path = config_.local_cache_db_path;
        options.required_tables = config_.required_tables;
        manager_ = std::make_unique<sync_manager>(*backend_, *log_, *metadata_, options);
        scheduler_ = std::make_unique<sync_scheduler>(*manager_, config_.to_trigger_timeouts());
        LOG_INFO("config", "Leader-election sync enabled as %s", manager_->identity().c_str());
    } else {
        LOG_INFO("config", "Local-only mode - sync disabled");
    }
}

sync_session::~sync_session() {
    if (scheduler_) scheduler_->stop();
}

bool sync_session::track(operation_type type, const std::string& table, const record_t& data) noexcept {
    // Nothing to replay in local_only mode
    if (!manager_) return true;
    return log_->track(type, table, data);
}

bool sync_session::trigger_manual_sync() {
    return scheduler_ ? scheduler_->trigger_manual_sync() : true;
}

bool sync_session::trigger_auto_sync() {
    return scheduler_ ? scheduler_->trigger_auto_sync() : true;
}

bool sync_session::trigger_idle_sync() {
    return scheduler_ ? scheduler_->trigger_idle_sync() : true;
}

bool sync_session::trigger_shutdown_sync() {
    return scheduler_ ? scheduler_->trigger_shutdown_sync() : true;
}

bool sync_session::is_sync_needed() {
    return manager_ ? manager_->is_sync_needed() : false;
}

std::string sync_session::status_json() {
    if (!manager_) {
        json j;
        j["sync_strategy"] = "local_only";
        j["pending_operations"] = log_->size();
        return j.dump(2);
    }
    return manager_->get_sync_status().to_json();
}

} // namespace concord

#pragma once

#include "TestSupport.hpp"
#include "concord.h"
#include <nlohmann/json.hpp>
#include <cstring>
#include <iostream>

namespace capi_tests {

using json = nlohmann::json;
using test_support::temp_dir;

inline std::string session_json(const temp_dir& dir, const temp_dir& shared) {
    json j = {
        {"sync_strategy", "leader_election"},
        {"local_cache_db_path", dir.file("concord.db")},
        {"required_tables", json::array({"projects", "tasks"})},
        {"coordination_backend", {
            {"type", "shared_directory"},
            {"shared_directory", {{"path", shared.path().string()}}},
        }},
        {"timeouts", {{"manual_seconds", 2}, {"shutdown_seconds", 1}, {"poll_interval_ms", 10}}},
    };
    return j.dump();
}

void test_track_and_sync() {
    std::cout << "  test_track_and_sync..." << std::flush;

    temp_dir dir("capi_sync");
    temp_dir shared("capi_sync_medium");
    test_support::create_sample_db(dir.file("concord.db"));

    concord_session_t* session = concord_session_open_json(session_json(dir, shared).c_str());
    assert(session != nullptr);
    assert(concord_last_error() == nullptr);

    {
        concord::database cache(dir.file("concord.db"));
        cache.insert("projects", test_support::project(1, "Atlas"));
    }
    assert(concord_track(session, CONCORD_OP_INSERT, "projects", R"({"id": 1, "name": "Atlas"})") == CONCORD_OK);
    assert(concord_pending_operations(session) == 1);
    assert(concord_is_sync_needed(session));

    assert(concord_trigger_manual_sync(session) == CONCORD_OK);
    assert(concord_pending_operations(session) == 0);
    assert(!concord_is_sync_needed(session));
    assert(concord_trigger_idle_sync(session) == CONCORD_OK);
    assert(concord_trigger_shutdown_sync(session) == CONCORD_OK);

    char* status = concord_status_json(session);
    assert(status != nullptr);
    auto parsed = json::parse(status);
    concord_string_free(status);
    assert(parsed["pending_operations"] == 0);
    assert(parsed["sync_count"] == 1);

    assert(concord_start_background_sync(session, 0) == CONCORD_ERROR_INVALID_ARGUMENT);
    assert(concord_start_background_sync(session, 50) == CONCORD_OK);
    concord_stop_background_sync(session);

    concord_session_close(session);

    assert(test_support::count_rows((shared.path() / "concord.db").string(), "projects") == 1);

    std::cout << " OK" << std::endl;
}

void test_invalid_arguments() {
    std::cout << "  test_invalid_arguments..." << std::flush;

    assert(concord_session_open_json("{\"sync_strategy\": ") == nullptr);
    assert(concord_last_error() != nullptr);
    assert(concord_session_open_json(nullptr) == nullptr);
    assert(concord_session_open(nullptr) == nullptr);

    assert(concord_track(nullptr, CONCORD_OP_INSERT, "projects", "{}") == CONCORD_ERROR_NULL_POINTER);
    assert(concord_trigger_manual_sync(nullptr) == CONCORD_ERROR_NULL_POINTER);
    assert(concord_pending_operations(nullptr) == 0);
    assert(concord_status_json(nullptr) == nullptr);
    concord_session_close(nullptr);

    temp_dir dir("capi_invalid");
    temp_dir shared("capi_invalid_medium");
    test_support::create_sample_db(dir.file("concord.db"));
    concord_session_t* session = concord_session_open_json(session_json(dir, shared).c_str());
    assert(session != nullptr);

    assert(concord_track(session, CONCORD_OP_UPDATE, "projects", "[1, 2]") == CONCORD_ERROR_INVALID_ARGUMENT);
    assert(std::strstr(concord_last_error(), "JSON object") != nullptr);
    assert(concord_track(session, CONCORD_OP_INSERT, "files", R"({"id": 1, "data": {"blob": "zz"}})") ==
           CONCORD_ERROR_INVALID_ARGUMENT);
    assert(concord_last_error() != nullptr);
    assert(concord_track(session, static_cast<concord_operation_type_t>(9), "projects", "{}") ==
           CONCORD_ERROR_INVALID_ARGUMENT);
    assert(concord_pending_operations(session) == 0);

    concord_session_close(session);

    std::cout << " OK" << std::endl;
}

void test_sync_failure_reported() {
    std::cout << "  test_sync_failure_reported..." << std::flush;

    temp_dir dir("capi_failure");
    temp_dir shared("capi_failure_medium");

    // No local cache to publish on the first sync
    concord_session_t* session = concord_session_open_json(session_json(dir, shared).c_str());
    assert(session != nullptr);
    assert(concord_track(session, CONCORD_OP_INSERT, "projects", R"({"id": 1, "name": "Atlas"})") == CONCORD_OK);

    assert(concord_trigger_manual_sync(session) == CONCORD_ERROR_SYNC_FAILED);
    assert(concord_last_error() != nullptr);
    assert(concord_pending_operations(session) == 1);

    // The shutdown trigger reports the failure through its return code too
    assert(concord_trigger_shutdown_sync(session) == CONCORD_ERROR_SYNC_FAILED);
    assert(concord_last_error() != nullptr);
    assert(concord_pending_operations(session) == 1);

    concord_session_close(session);

    std::cout << " OK" << std::endl;
}

void test_file_config_and_local_only() {
    std::cout << "  test_file_config_and_local_only..." << std::flush;

    temp_dir dir("capi_file");
    std::string config_path = dir.file("concord.json");
    json j = {{"sync_strategy", "local_only"}, {"local_cache_db_path", dir.file("concord.db")}};
    test_support::write_file(config_path, j.dump());

    concord_session_t* session = concord_session_open(config_path.c_str());
    assert(session != nullptr);
    assert(concord_track(session, CONCORD_OP_DELETE, "projects", R"({"id": 1})") == CONCORD_OK);
    assert(concord_pending_operations(session) == 0);
    assert(concord_trigger_manual_sync(session) == CONCORD_OK);
    assert(!concord_is_sync_needed(session));
    assert(concord_start_background_sync(session, 100) == CONCORD_OK);
    concord_stop_background_sync(session);
    concord_session_close(session);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- C API Tests ---" << std::endl;

    test_track_and_sync();
    test_invalid_arguments();
    test_sync_failure_reported();
    test_file_config_and_local_only();

    std::cout << "--- C API Tests: All passed ---" << std::endl;
}

} // namespace capi_tests

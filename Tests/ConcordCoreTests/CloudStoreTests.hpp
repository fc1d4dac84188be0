#pragma once

#include "TestSupport.hpp"
#include "MemoryObjectStore.hpp"
#include <atomic>
#include <iostream>
#include <thread>

namespace cloud_store_tests {

using namespace concord;
namespace fs = std::filesystem;
using namespace std::chrono_literals;
using test_support::temp_dir;
using test_support::memory_object_store;

inline cloud_store_backend::options fast_options() {
    cloud_store_backend::options opts;
    opts.database_name = "concord.db";
    opts.poll_interval = 10ms;
    opts.settle_delay = 50ms;
    return opts;
}

// ============================================================================
// rclone listing and helpers
// ============================================================================

void test_parse_rclone_listing() {
    std::cout << "  test_parse_rclone_listing..." << std::flush;

    const std::string listing = R"([
        {"Path":"concord.db","Name":"concord.db","Size":8192,"MimeType":"application/octet-stream",
         "ModTime":"2024-05-01T10:20:30.123456789Z","IsDir":false,
         "Hashes":{"md5":"9e107d9d372bb6826bd81d3542a419d6"},"ID":"1AbC"},
        {"Path":"archive","Name":"archive","Size":-1,"ModTime":"2024-05-01T10:20:30Z","IsDir":true},
        {"Path":"leader_x.json","Name":"leader_x.json","Size":120,
         "ModTime":"2024-05-01T12:20:30+02:00","IsDir":false,"Hashes":{"sha1":"abc"}}
    ])";

    auto objects = parse_rclone_listing(listing);
    assert(objects.size() == 2);

    assert(objects[0].id == "1AbC");
    assert(objects[0].name == "concord.db");
    assert(objects[0].size == 8192);
    assert(objects[0].checksum == "9e107d9d372bb6826bd81d3542a419d6");
    assert(to_epoch_nanos(objects[0].modified_time) == 1714558830123456789LL);

    // No ID: the path identifies the object
    assert(objects[1].id == "leader_x.json");
    assert(objects[1].checksum == "abc");
    assert(to_epoch_millis(objects[1].modified_time) == 1714558830000LL);

    bool threw = false;
    try {
        parse_rclone_listing("{\"not\": \"a list\"}");
    } catch (const store_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// rclone command lines, recorded by a stand-in executable
// ============================================================================

inline std::string database_entry(const std::string& id, const std::string& mod_time) {
    return R"({"Path":"concord.db","Name":"concord.db","Size":4096,"ModTime":")" + mod_time +
           R"(","IsDir":false,"ID":")" + id + R"("})";
}

// Lists before.json until a dedupe has run, after.json afterwards
inline std::string write_recording_rclone(const temp_dir& dir) {
    std::string script = dir.file("rclone");
    test_support::write_file(script,
        "#!/bin/sh\n"
        "dir=$(dirname \"$0\")\n"
        "echo \"$*\" >> \"$dir/calls.log\"\n"
        "case \"$1\" in\n"
        "  lsjson) if [ -f \"$dir/deduped\" ]; then cat \"$dir/after.json\"; else cat \"$dir/before.json\"; fi ;;\n"
        "  backend) printf 'copy %s' \"$4\" > \"$5\" ;;\n"
        "  copyto) printf 'path copy' > \"$3\" ;;\n"
        "  dedupe) : > \"$dir/deduped\" ;;\n"
        "esac\n"
        "exit 0\n");
    fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);

    test_support::write_file(dir.file("before.json"),
        "[" + database_entry("T1", "2024-05-01T10:00:00Z") + "," +
              database_entry("T3", "2024-05-01T12:00:00Z") + "," +
              database_entry("T2", "2024-05-01T11:00:00Z") + "]");
    test_support::write_file(dir.file("after.json"),
        "[" + database_entry("T3", "2024-05-01T12:00:00Z") + "]");
    return script;
}

void test_rclone_duplicates_addressed_by_id() {
    std::cout << "  test_rclone_duplicates_addressed_by_id..." << std::flush;

    temp_dir dir("cloud_rclone_ids");
    rclone_object_store::options opts;
    opts.rclone_path = write_recording_rclone(dir);
    opts.remote = "gdrive";
    opts.container = "Sync";
    opts.timeout_seconds = 10;
    auto store = std::make_shared<rclone_object_store>(opts);
    cloud_store_backend backend(store, fast_options());

    std::string target = dir.file("download.db");
    assert(backend.download_database(target));
    assert(backend.duplicates_in_last_download() == 2);

    // The newest copy is fetched by id and the others go through dedupe
    assert(test_support::read_file(target) == "copy T3");
    std::string calls = test_support::read_file(dir.file("calls.log"));
    assert(calls.find("backend copyid gdrive: T3 " + target) != std::string::npos);
    assert(calls.find("dedupe --dedupe-mode newest --include concord.db gdrive:Sync") != std::string::npos);
    assert(calls.find("copyto gdrive:Sync/concord.db") == std::string::npos);
    assert(calls.find("deletefile") == std::string::npos);

    // Deleting by path is refused while the path is shared
    fs::remove(dir.file("deduped"));
    auto copies = store->list("concord.db");
    assert(copies.size() == 3);
    bool refused = false;
    try {
        store->remove(copies.front());
    } catch (const store_error&) {
        refused = true;
    }
    assert(refused);
    assert(test_support::read_file(dir.file("calls.log")).find("deletefile") == std::string::npos);

    // A single object is fetched and deleted by path
    test_support::write_file(dir.file("deduped"), "");
    auto single = store->list("concord.db");
    assert(single.size() == 1 && single[0].id == "T3");
    store->get(single[0], target);
    assert(test_support::read_file(target) == "path copy");
    store->remove(single[0]);

    calls = test_support::read_file(dir.file("calls.log"));
    assert(calls.find("copyto gdrive:Sync/concord.db " + target) != std::string::npos);
    assert(calls.find("deletefile gdrive:Sync/concord.db") != std::string::npos);

    std::cout << " OK" << std::endl;
}

void test_time_and_pattern_helpers() {
    std::cout << "  test_time_and_pattern_helpers..." << std::flush;

    assert(parse_rfc3339("1970-01-01T00:00:01Z").has_value());
    assert(to_epoch_millis(*parse_rfc3339("1970-01-01T00:00:01.5Z")) == 1500);
    assert(to_epoch_millis(*parse_rfc3339("1970-01-01T01:00:00+01:00")) == 0);
    assert(!parse_rfc3339("yesterday").has_value());
    assert(!parse_rfc3339("2024-05-01T10:20:30").has_value());

    assert(glob_match("leader_*.json", "leader_123_abc.json"));
    assert(!glob_match("leader_*.json", "intent_123.json"));
    assert(glob_match("concord_sync_*.db", "concord_sync_.db"));
    assert(glob_match("concord.db", "concord.db"));
    assert(!glob_match("concord.db", "concord.db.backup_1"));
    assert(glob_match("a?c", "abc"));

    assert(shell_escape("it's") == "'it'\\''s'");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Transfer
// ============================================================================

void test_download_missing_and_upload() {
    std::cout << "  test_download_missing_and_upload..." << std::flush;

    temp_dir local("cloud_upload");
    auto store = std::make_shared<memory_object_store>();
    cloud_store_backend backend(store, fast_options());

    std::string target = local.file("download.db");
    assert(backend.download_database(target));
    assert(!fs::exists(target));
    assert(!backend.observe_database().has_value());

    // Orphan from an interrupted upload
    store->add_object("concord_sync_deadbeef.db", "partial", std::chrono::system_clock::now() - 1h);

    std::string source = local.file("cache.db");
    test_support::create_sample_db(source);
    assert(backend.upload_database(source));

    assert(store->count("concord.db") == 1);
    assert(store->count("concord_sync_*.db") == 0);
    assert(store->objects_named("concord.db")[0].content == test_support::read_file(source));

    auto observed = backend.observe_database();
    assert(observed.has_value());
    assert(observed->size == static_cast<int64_t>(fs::file_size(source)));
    assert(!observed->fingerprint.empty());
    assert(!backend.has_database_changed(observed).first);

    // Another upload replaces the object and changes the fingerprint
    {
        database db(source);
        db.insert("projects", test_support::project(1, "Atlas"));
    }
    assert(backend.upload_database(source));
    assert(store->count("concord.db") == 1);
    assert(backend.has_database_changed(observed).first);

    assert(backend.download_database(target));
    assert(test_support::read_file(target) == test_support::read_file(source));

    std::cout << " OK" << std::endl;
}

void test_duplicates_resolved_by_recency() {
    std::cout << "  test_duplicates_resolved_by_recency..." << std::flush;

    temp_dir local("cloud_duplicates");
    auto store = std::make_shared<memory_object_store>();
    cloud_store_backend backend(store, fast_options());

    auto now = std::chrono::system_clock::now();
    auto oldest = store->add_object("concord.db", "oldest", now - 3min);
    store->add_object("concord.db", "newest", now - 1min);
    store->add_object("concord.db", "middle", now - 2min);
    store->fail_removal_of(oldest.id);

    auto observed = backend.observe_database();
    assert(observed.has_value() && observed->size == 6);  // "newest"
    assert(backend.get_coordination_status().duplicate_count == 2);

    std::string target = local.file("download.db");
    assert(backend.download_database(target));
    assert(test_support::read_file(target) == "newest");
    assert(backend.duplicates_in_last_download() == 2);

    // The failing delete is logged and left behind, the rest is pruned
    auto remaining = store->objects_named("concord.db");
    assert(remaining.size() == 2);
    for (const auto& object : remaining) {
        assert(object.content == "newest" || object.content == "oldest");
    }

    // Still downloads the most recent copy
    assert(backend.download_database(target));
    assert(test_support::read_file(target) == "newest");

    std::cout << " OK" << std::endl;
}

void test_transfer_failures() {
    std::cout << "  test_transfer_failures..." << std::flush;

    temp_dir local("cloud_failures");
    auto store = std::make_shared<memory_object_store>();
    cloud_store_backend backend(store, fast_options());

    std::string source = local.file("cache.db");
    test_support::create_sample_db(source);

    store->set_fail_put(true);
    assert(!backend.upload_database(source));
    assert(store->count("concord.db") == 0);
    store->set_fail_put(false);

    assert(backend.upload_database(source));
    store->set_fail_get(true);
    assert(!backend.download_database(local.file("download.db")));
    store->set_fail_get(false);

    store->set_fail_list(true);
    bool threw = false;
    try {
        backend.observe_database();
    } catch (const coordination_error&) {
        threw = true;
    }
    assert(threw);
    store->set_fail_list(false);

    store->set_fail_put(true);
    assert(!backend.register_sync_intent("someone"));
    store->set_fail_put(false);

    store->set_available(false);
    assert(!backend.is_available());
    assert(!backend.get_coordination_status().available);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Election
// ============================================================================

void test_election_single_winner() {
    std::cout << "  test_election_single_winner..." << std::flush;

    auto store = std::make_shared<memory_object_store>();
    constexpr int instances = 6;

    std::vector<std::unique_ptr<cloud_store_backend>> backends;
    for (int i = 0; i < instances; ++i) {
        backends.push_back(std::make_unique<cloud_store_backend>(store, fast_options()));
    }

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    std::vector<std::string> identities(instances);
    for (int i = 0; i < instances; ++i) {
        identities[i] = "instance_" + std::to_string(i);
        threads.emplace_back([&, i] {
            if (backends[i]->attempt_leader_election(identities[i], 0ms)) ++winners;
        });
    }
    for (auto& t : threads) t.join();

    assert(winners.load() == 1);
    assert(store->count("leader_*.json") == 1);

    std::string leader = *backends[0]->get_coordination_status().current_leader;
    int winner = std::stoi(leader.substr(std::string("instance_").size()));
    assert(backends[winner]->get_coordination_status().is_leader);

    backends[winner]->release_leadership(leader);
    assert(store->count("leader_*.json") == 0);

    std::cout << " OK" << std::endl;
}

void test_election_waits_and_prunes_stale_leader() {
    std::cout << "  test_election_waits_and_prunes_stale_leader..." << std::flush;

    auto store = std::make_shared<memory_object_store>();
    cloud_store_backend first(store, fast_options());
    cloud_store_backend second(store, fast_options());

    // A marker older than the stale threshold does not block anyone
    store->add_object(leader_marker_name("ghost"), "{}", std::chrono::system_clock::now() - 30min);
    assert(first.attempt_leader_election("first", 0ms));
    assert(store->count(leader_marker_name("ghost")) == 0);

    // A live leader does until it releases
    assert(!second.attempt_leader_election("second", 50ms));
    assert(store->count(leader_marker_name("second")) == 0);

    std::atomic<bool> acquired{false};
    std::thread waiter([&] { acquired = second.attempt_leader_election("second", 5000ms); });
    std::this_thread::sleep_for(100ms);
    first.release_leadership("first");
    waiter.join();
    assert(acquired.load());
    second.release_leadership("second");

    std::cout << " OK" << std::endl;
}

void test_cleanup_and_status() {
    std::cout << "  test_cleanup_and_status..." << std::flush;

    auto store = std::make_shared<memory_object_store>();
    cloud_store_backend backend(store, fast_options());
    auto now = std::chrono::system_clock::now();

    store->add_object(intent_marker_name("old"), "{}", now - 3h);
    store->add_object(leader_marker_name("old"), "{}", now - 3h);
    store->add_object("concord_sync_old.db", "x", now - 3h);
    store->add_object("concord_backup_20240101.db", "x", now - 1min);
    assert(backend.register_sync_intent("current"));

    auto status = backend.get_coordination_status();
    assert(status.backend_type == "cloud_store");
    assert(status.active_intents == 2);
    assert(status.current_leader == std::string("old"));

    backend.cleanup_stale_coordination_files(std::chrono::minutes(60));

    assert(store->count("intent_*.json") == 1);
    assert(store->count(intent_marker_name("current")) == 1);
    assert(store->count("leader_*.json") == 0);
    assert(store->count("concord_sync_*.db") == 0);
    assert(store->count("concord_backup_*.db") == 0);

    backend.release_leadership("current");
    assert(store->count("intent_*.json") == 0);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Cloud Store Backend Tests ---" << std::endl;

    test_parse_rclone_listing();
    test_time_and_pattern_helpers();
    test_rclone_duplicates_addressed_by_id();
    test_download_missing_and_upload();
    test_duplicates_resolved_by_recency();
    test_transfer_failures();
    test_election_single_winner();
    test_election_waits_and_prunes_stale_leader();
    test_cleanup_and_status();

    std::cout << "--- Cloud Store Backend Tests: All passed ---" << std::endl;
}

} // namespace cloud_store_tests

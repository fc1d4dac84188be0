#pragma once

#include "TestSupport.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace shared_directory_tests {

using namespace concord;
namespace fs = std::filesystem;
using namespace std::chrono_literals;
using test_support::temp_dir;

inline shared_directory_backend::options fast_options() {
    shared_directory_backend::options opts;
    opts.database_name = "concord.db";
    opts.poll_interval = 10ms;
    return opts;
}

// ============================================================================
// test_download_without_authoritative_copy
// ============================================================================

void test_download_without_authoritative_copy() {
    std::cout << "  test_download_without_authoritative_copy..." << std::flush;

    temp_dir shared("sd_empty");
    temp_dir local("sd_empty_local");
    shared_directory_backend backend(shared.path().string(), fast_options());

    assert(backend.is_available());
    std::string target = local.file("download.db");
    assert(backend.download_database(target));
    assert(!fs::exists(target));

    assert(!backend.observe_database().has_value());
    auto [changed, fresh] = backend.has_database_changed(std::nullopt);
    assert(changed);
    assert(!fresh.has_value());

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_upload_and_change_detection
// ============================================================================

void test_upload_and_change_detection() {
    std::cout << "  test_upload_and_change_detection..." << std::flush;

    temp_dir shared("sd_upload");
    temp_dir local("sd_upload_local");
    shared_directory_backend backend(shared.path().string(), fast_options());

    std::string source = local.file("cache.db");
    test_support::create_sample_db(source);
    assert(backend.upload_database(source));
    assert(fs::exists(backend.database_path()));

    auto first = backend.observe_database();
    assert(first.has_value());
    assert(first->size == static_cast<int64_t>(fs::file_size(source)));

    auto [changed, fresh] = backend.has_database_changed(std::nullopt);
    assert(changed);
    assert(fresh.has_value() && *fresh == *first);

    auto unchanged = backend.has_database_changed(first);
    assert(!unchanged.first);

    // Round trip through download
    std::string copy = local.file("copy.db");
    assert(backend.download_database(copy));
    assert(test_support::read_file(copy) == test_support::read_file(source));

    // A second upload keeps the previous copy as a backup and is detected
    {
        database db(source);
        for (int64_t i = 1; i <= 200; ++i) db.insert("projects", test_support::project(i, std::string(64, 'x')));
    }
    assert(backend.upload_database(source));
    assert(backend.has_database_changed(first).first);

    size_t backups = 0;
    for (const auto& entry : fs::directory_iterator(shared.path())) {
        if (entry.path().filename().string().rfind("concord.db.backup_", 0) == 0) ++backups;
    }
    assert(backups == 1);

    // Missing source fails without touching the shared copy
    auto before = backend.observe_database();
    assert(!backend.upload_database(local.file("missing.db")));
    assert(*backend.observe_database() == *before);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_election_is_exclusive - concurrent instances, one winner
// ============================================================================

void test_election_is_exclusive() {
    std::cout << "  test_election_is_exclusive..." << std::flush;

    temp_dir shared("sd_election");
    constexpr int instances = 8;

    std::vector<std::unique_ptr<shared_directory_backend>> backends;
    for (int i = 0; i < instances; ++i) {
        backends.push_back(std::make_unique<shared_directory_backend>(shared.path().string(), fast_options()));
    }

    std::atomic<int> winners{0};
    std::vector<std::string> identities(instances);
    std::vector<char> won(instances, 0);
    std::vector<std::thread> threads;
    for (int i = 0; i < instances; ++i) {
        identities[i] = make_instance_identity();
        threads.emplace_back([&, i] {
            assert(backends[i]->register_sync_intent(identities[i]));
            if (backends[i]->attempt_leader_election(identities[i], 0ms)) {
                won[i] = 1;
                ++winners;
            }
        });
    }
    for (auto& t : threads) t.join();
    assert(winners.load() == 1);

    int winner = static_cast<int>(std::find(won.begin(), won.end(), 1) - won.begin());
    auto status = backends[winner]->get_coordination_status();
    assert(status.is_leader);
    assert(status.current_leader == identities[winner]);
    assert(status.active_intents == instances);  // Losers keep their intent until released

    // A loser cannot take over until the winner releases
    int loser = (winner + 1) % instances;
    assert(!backends[loser]->attempt_leader_election(identities[loser], 30ms));
    backends[winner]->release_leadership(identities[winner]);
    assert(!fs::exists(backends[winner]->lock_path()));
    assert(backends[loser]->attempt_leader_election(identities[loser], 0ms));
    backends[loser]->release_leadership(identities[loser]);

    // Release is idempotent
    backends[loser]->release_leadership(identities[loser]);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_election_waits_for_release
// ============================================================================

void test_election_waits_for_release() {
    std::cout << "  test_election_waits_for_release..." << std::flush;

    temp_dir shared("sd_wait");
    shared_directory_backend holder(shared.path().string(), fast_options());
    shared_directory_backend waiter(shared.path().string(), fast_options());

    assert(holder.attempt_leader_election("holder", 0ms));

    std::atomic<bool> acquired{false};
    std::thread thread([&] { acquired = waiter.attempt_leader_election("waiter", 5000ms); });

    std::this_thread::sleep_for(100ms);
    assert(!acquired.load());
    holder.release_leadership("holder");
    thread.join();
    assert(acquired.load());

    // Releasing someone else's identity leaves the lock alone
    holder.release_leadership("holder");
    assert(fs::exists(waiter.lock_path()));
    waiter.release_leadership("waiter");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_cleanup_stale_coordination_files
// ============================================================================

void test_cleanup_stale_coordination_files() {
    std::cout << "  test_cleanup_stale_coordination_files..." << std::flush;

    temp_dir shared("sd_cleanup");
    shared_directory_backend backend(shared.path().string(), fast_options());
    assert(backend.is_available());

    auto old_time = std::chrono::system_clock::now() - 2h;
    const auto& coord = backend.coordination_directory();

    // Crashed instance on another machine, two hours old
    marker_payload ghost{"ghost", marker_kind::intent, old_time, 999999, "other-host"};
    test_support::write_file((coord / intent_marker_name("ghost")).string(), ghost.to_json());

    // Abandoned lock from the same crash
    marker_payload ghost_leader{"ghost", marker_kind::leader, old_time, 999999, "other-host"};
    test_support::write_file(backend.lock_path().string(), ghost_leader.to_json());

    // Old marker of a process still running here
    marker_payload alive{"alive", marker_kind::intent, old_time, static_cast<int64_t>(::getpid()), local_host_name()};
    test_support::write_file((coord / intent_marker_name("alive")).string(), alive.to_json());

    // Fresh marker
    assert(backend.register_sync_intent("fresh"));

    // Unreadable marker with an old mtime
    std::string garbage = (coord / intent_marker_name("garbage")).string();
    test_support::write_file(garbage, "{{{");
    fs::last_write_time(garbage, fs::file_time_type::clock::now() - 2h);

    // Backups: one expired, one recent
    std::string expired_backup = (shared.path() / "concord.db.backup_1").string();
    std::string recent_backup = (shared.path() / "concord.db.backup_2").string();
    test_support::write_file(expired_backup, "old");
    test_support::write_file(recent_backup, "new");
    fs::last_write_time(expired_backup, fs::file_time_type::clock::now() - 48h);

    backend.cleanup_stale_coordination_files(std::chrono::minutes(60));

    assert(!fs::exists(coord / intent_marker_name("ghost")));
    assert(!fs::exists(backend.lock_path()));
    assert(!fs::exists(garbage));
    assert(fs::exists(coord / intent_marker_name("alive")));
    assert(fs::exists(coord / intent_marker_name("fresh")));
    assert(!fs::exists(expired_backup));
    assert(fs::exists(recent_backup));

    // The abandoned lock no longer blocks election
    assert(backend.attempt_leader_election("fresh", 0ms));
    backend.release_leadership("fresh");

    std::cout << " OK" << std::endl;
}

void test_rejects_file_as_directory() {
    std::cout << "  test_rejects_file_as_directory..." << std::flush;

    temp_dir dir("sd_file");
    std::string file = dir.file("not_a_dir");
    test_support::write_file(file, "x");

    bool threw = false;
    try {
        shared_directory_backend backend(file);
    } catch (const coordination_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Shared Directory Backend Tests ---" << std::endl;

    test_download_without_authoritative_copy();
    test_upload_and_change_detection();
    test_election_is_exclusive();
    test_election_waits_for_release();
    test_cleanup_stale_coordination_files();
    test_rejects_file_as_directory();

    std::cout << "--- Shared Directory Backend Tests: All passed ---" << std::endl;
}

} // namespace shared_directory_tests

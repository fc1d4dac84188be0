#pragma once

#include "TestSupport.hpp"
#include <iostream>

namespace merger_tests {

using namespace concord;
namespace fs = std::filesystem;
using test_support::temp_dir;

inline operation make_op(int64_t id, operation_type type, const std::string& table, const record_t& row) {
    operation op;
    op.id = id;
    op.type = type;
    op.table_name = table;
    if (type == operation_type::remove) {
        op.old_data = row;
    } else {
        op.record_data = row;
    }
    op.timestamp = std::chrono::system_clock::now();
    return op;
}

// ============================================================================
// Validation
// ============================================================================

void test_validation() {
    std::cout << "  test_validation..." << std::flush;

    temp_dir dir("merge_validate");
    schema_validator any;
    schema_validator strict({"projects", "tasks", "labels"});

    assert(any.validate(dir.file("missing.db")) == validation_result::absent);

    std::string empty = dir.file("empty.db");
    test_support::write_file(empty, "");
    assert(any.validate(empty) == validation_result::absent);

    std::string garbage = dir.file("garbage.db");
    test_support::write_file(garbage, std::string(4096, 'z'));
    assert(any.validate(garbage) == validation_result::invalid);

    std::string sample = dir.file("sample.db");
    test_support::create_sample_db(sample);
    assert(any.validate(sample) == validation_result::valid);
    assert(schema_validator({"projects", "tasks"}).validate(sample) == validation_result::valid);
    assert(strict.validate(sample) == validation_result::invalid);

    std::string tableless = dir.file("tableless.db");
    {
        database db(tableless);
        db.execute("CREATE TABLE scratch (id INTEGER PRIMARY KEY)");
        db.execute("DROP TABLE scratch");
    }
    assert(any.validate(tableless) == validation_result::invalid);

    assert(std::string(to_string(validation_result::absent)) == "absent");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// Merge
// ============================================================================

void test_empty_operations_return_base() {
    std::cout << "  test_empty_operations_return_base..." << std::flush;

    temp_dir dir("merge_empty");
    std::string base = dir.file("remote.db");
    test_support::create_sample_db(base);

    database_merger merger;
    assert(merger.merge(base, {}) == base);
    assert(!fs::exists(database_merger::merged_path_for(base)));
    assert(database_merger::merged_path_for(base) == dir.file("remote.merged.db"));

    std::cout << " OK" << std::endl;
}

void test_replay_in_order() {
    std::cout << "  test_replay_in_order..." << std::flush;

    temp_dir dir("merge_replay");
    std::string base = dir.file("remote.db");
    test_support::create_sample_db(base);
    {
        database db(base);
        db.insert("projects", test_support::project(1, "Atlas"));
        db.insert("projects", test_support::project(2, "Borealis"));
    }

    std::vector<operation> ops = {
        make_op(1, operation_type::insert, "projects", test_support::project(3, "Cirrus")),
        make_op(2, operation_type::update, "projects", test_support::project(1, "Atlas v2")),
        make_op(3, operation_type::remove, "projects", test_support::project(2, "Borealis")),
        make_op(4, operation_type::insert, "tasks", test_support::task(1, 3, "launch")),
    };

    database_merger merger;
    std::string merged = merger.merge(base, ops);
    assert(merged == database_merger::merged_path_for(base));

    assert(test_support::count_rows(merged, "projects") == 2);
    assert(test_support::text_value(merged, "projects", 1, "name") == std::string("Atlas v2"));
    assert(!test_support::text_value(merged, "projects", 2, "name").has_value());
    assert(test_support::int_value(merged, "tasks", 1, "project_id") == int64_t{3});

    // The base is left as downloaded
    assert(test_support::count_rows(base, "projects") == 2);
    assert(test_support::text_value(base, "projects", 1, "name") == std::string("Atlas"));

    std::cout << " OK" << std::endl;
}

void test_key_conflict_is_rekeyed() {
    std::cout << "  test_key_conflict_is_rekeyed..." << std::flush;

    temp_dir dir("merge_conflict");
    std::string path = dir.file("remote.db");
    test_support::create_sample_db(path);
    {
        database db(path);
        db.insert("projects", test_support::project(1, "Remote"));
    }

    // Another instance already used id 1 for a different project
    std::vector<operation> ops = {
        make_op(1, operation_type::insert, "projects", test_support::project(1, "Local")),
        make_op(2, operation_type::insert, "tasks", test_support::task(10, 1, "local task")),
        make_op(3, operation_type::update, "projects", test_support::project(1, "Local v2")),
    };

    database db(path);
    database_merger merger;
    auto stats = merger.apply(db, ops);
    assert(stats.applied == 3);
    assert(stats.remapped == 1);
    assert(stats.skipped == 0);

    auto remote = db.query("SELECT name FROM projects WHERE id = 1");
    assert(std::get<std::string>(remote.at(0).at("name")) == "Remote");

    auto local = db.query("SELECT id, name FROM projects WHERE id <> 1");
    assert(local.size() == 1);
    int64_t fresh = std::get<int64_t>(local[0].at("id"));
    assert(std::get<std::string>(local[0].at("name")) == "Local v2");

    auto task = db.query("SELECT project_id FROM tasks WHERE id = 10");
    assert(std::get<int64_t>(task.at(0).at("project_id")) == fresh);

    // The remap and the landed operations report the new key
    assert(stats.remap.size() == 1);
    assert(stats.remap.at({"projects", 1}) == fresh);
    assert(stats.landed.size() == 3);
    assert(std::get<int64_t>(stats.landed[0].record_data.at("id")) == fresh);
    assert(std::get<int64_t>(stats.landed[1].record_data.at("project_id")) == fresh);
    assert(std::get<int64_t>(stats.landed[2].record_data.at("id")) == fresh);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_replay_through_earlier_remap - operations logged after a re-keyed batch
// ============================================================================

void test_replay_through_earlier_remap() {
    std::cout << "  test_replay_through_earlier_remap..." << std::flush;

    temp_dir dir("merge_earlier_remap");
    std::string path = dir.file("merged.db");
    test_support::create_sample_db(path);
    {
        // Remote row at 1, the batch's row moved from 1 to 2
        database db(path);
        db.insert("projects", test_support::project(1, "Remote"));
        db.insert("projects", test_support::project(2, "Local"));
    }
    key_remap batch_remap = {{{"projects", 1}, 2}};

    // Logged against the local cache, where "Local" still had key 1 and 2 was free
    std::vector<operation> late = {
        make_op(4, operation_type::update, "projects", test_support::project(1, "Local v2")),
        make_op(5, operation_type::insert, "projects", test_support::project(2, "Newer")),
        make_op(6, operation_type::insert, "tasks", test_support::task(10, 1, "for local")),
        make_op(7, operation_type::insert, "tasks", test_support::task(11, 2, "for newer")),
    };

    database db(path);
    database_merger merger;
    auto stats = merger.apply(db, late, batch_remap);
    assert(stats.applied == 4);
    assert(stats.remapped == 1);

    auto names = db.query("SELECT id, name FROM projects ORDER BY id");
    assert(names.size() == 3);
    assert(std::get<std::string>(names[0].at("name")) == "Remote");
    assert(std::get<std::string>(names[1].at("name")) == "Local v2");
    assert(std::get<std::string>(names[2].at("name")) == "Newer");
    int64_t newer = std::get<int64_t>(names[2].at("id"));
    assert(newer == 3);

    auto tasks = db.query("SELECT id, project_id FROM tasks ORDER BY id");
    assert(std::get<int64_t>(tasks.at(0).at("project_id")) == 2);
    assert(std::get<int64_t>(tasks.at(1).at("project_id")) == newer);

    // Landed keys are the merged database's keys
    assert(stats.landed.size() == 4);
    assert(stats.landed[0].id == 4);
    assert(std::get<int64_t>(stats.landed[0].record_data.at("id")) == 2);
    assert(std::get<int64_t>(stats.landed[1].record_data.at("id")) == newer);
    assert(std::get<int64_t>(stats.landed[2].record_data.at("project_id")) == 2);
    assert(std::get<int64_t>(stats.landed[3].record_data.at("project_id")) == newer);

    std::cout << " OK" << std::endl;
}

void test_missing_and_referenced_rows_skipped() {
    std::cout << "  test_missing_and_referenced_rows_skipped..." << std::flush;

    temp_dir dir("merge_skip");
    std::string path = dir.file("remote.db");
    test_support::create_sample_db(path);
    {
        database db(path);
        db.insert("projects", test_support::project(1, "Atlas"));
        db.insert("tasks", test_support::task(5, 1, "still here"));
    }

    std::vector<operation> ops = {
        make_op(1, operation_type::update, "projects", test_support::project(99, "gone")),
        make_op(2, operation_type::remove, "projects", test_support::project(1, "Atlas")),
        make_op(3, operation_type::remove, "tasks", test_support::task(77, 1, "never existed")),
        make_op(4, operation_type::insert, "labels", {{"id", int64_t{1}}, {"name", std::string("urgent")}}),
        make_op(5, operation_type::insert, "projects", test_support::project(2, "Borealis")),
    };

    database db(path);
    auto stats = database_merger().apply(db, ops);
    assert(stats.applied == 1);
    assert(stats.skipped == 4);

    assert(db.row_exists("projects", "id", 1));
    assert(db.row_exists("tasks", "id", 5));
    assert(db.row_exists("projects", "id", 2));
    assert(!db.row_exists("projects", "id", 99));

    std::cout << " OK" << std::endl;
}

void test_failure_leaves_no_merged_file() {
    std::cout << "  test_failure_leaves_no_merged_file..." << std::flush;

    temp_dir dir("merge_failure");
    std::string base = dir.file("remote.db");
    test_support::create_sample_db(base);

    // name is NOT NULL
    std::vector<operation> ops = {
        make_op(1, operation_type::insert, "projects", test_support::project(1, "Atlas")),
        make_op(2, operation_type::insert, "projects", {{"id", int64_t{2}}, {"name", nullptr}}),
    };

    bool threw = false;
    try {
        database_merger().merge(base, ops);
    } catch (const db_error&) {
        threw = true;
    }
    assert(threw);
    assert(!fs::exists(database_merger::merged_path_for(base)));
    assert(test_support::count_rows(base, "projects") == 0);

    threw = false;
    try {
        database_merger().merge(dir.file("absent.db"), ops);
    } catch (const merge_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << std::endl;
    std::cout << "--- Database Merger Tests ---" << std::endl;

    test_validation();
    test_empty_operations_return_base();
    test_replay_in_order();
    test_key_conflict_is_rekeyed();
    test_replay_through_earlier_remap();
    test_missing_and_referenced_rows_skipped();
    test_failure_leaves_no_merged_file();

    std::cout << "--- Database Merger Tests: All passed ---" << std::endl;
}

} // namespace merger_tests

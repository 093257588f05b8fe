/**
 * @file test_retention.cpp
 * @brief Tests for session file listing, statistics and rotation.
 */

#include "test_framework.hpp"
#include "test_support.hpp"
#include <activity-log/retention.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

using namespace activity;
using test_support::TempDir;

namespace {

/// Create session files with modification times one minute apart, oldest first.
void make_sessions(const TempDir& dir, const std::vector<std::string>& names) {
    auto t = std::filesystem::file_time_type::clock::now() - std::chrono::hours(2);
    for (const auto& name : names) {
        dir.write_file(name, "{}\n");
        std::filesystem::last_write_time(dir.file(name), t);
        t += std::chrono::minutes(1);
    }
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

TEST(list_filters_non_session_files) {
    TempDir dir("list_filter");
    make_sessions(dir, {"session_20250101_000000.jsonl", "session_20250102_000000.jsonl.gz"});
    dir.write_file("session_invalid.jsonl", "");
    dir.write_file("notes.txt", "");
    dir.write_file("session_20250103_000000.json", "");
    std::filesystem::create_directories(dir.file("session_20250104_000000.jsonl"));

    std::vector<LogFileInfo> files = list_log_files(dir.str());
    TEST_ASSERT_EQ(files.size(), (size_t)2, "only session files");
    TEST_ASSERT_EQ(files[0].session_id, std::string("session_20250102_000000"), "newest first");
    TEST_ASSERT(files[0].compressed, "gz detected");
    TEST_ASSERT(!files[1].compressed, "plain detected");
    TEST_ASSERT_EQ(files[1].size_bytes, (uint64_t)3, "size read");
}

TEST(list_missing_directory_is_empty) {
    TEST_ASSERT(list_log_files("/nonexistent/activity/logs").empty(), "no files, no error");
}

TEST(list_ties_broken_by_session_id) {
    TempDir dir("list_ties");
    auto t = std::filesystem::file_time_type::clock::now() - std::chrono::hours(1);
    for (const char* name : {"session_20250101_000001.jsonl", "session_20250101_000003.jsonl",
                             "session_20250101_000002.jsonl"}) {
        dir.write_file(name, "");
        std::filesystem::last_write_time(dir.file(name), t);
    }
    std::vector<LogFileInfo> files = list_log_files(dir.str());
    TEST_ASSERT_EQ(files.size(), (size_t)3, "three files");
    TEST_ASSERT_EQ(files[0].session_id, std::string("session_20250101_000003"), "highest id first");
    TEST_ASSERT_EQ(files[2].session_id, std::string("session_20250101_000001"), "lowest id last");
}

TEST(stats_summarize_directory) {
    TempDir dir("stats");
    make_sessions(dir, {"session_20250101_000000.jsonl", "session_20250102_000000.jsonl",
                        "session_20250103_000000.jsonl"});
    LogFileStats s = log_file_stats(dir.str(), std::string("session_20250103_000000"));
    TEST_ASSERT_EQ(s.total_files, (size_t)3, "count");
    TEST_ASSERT_EQ(s.total_size_bytes, (uint64_t)9, "bytes");
    TEST_ASSERT_EQ(*s.oldest_session, std::string("session_20250101_000000"), "oldest");
    TEST_ASSERT_EQ(*s.newest_session, std::string("session_20250103_000000"), "newest");
    TEST_ASSERT_EQ(*s.current_session, std::string("session_20250103_000000"), "current echoed");

    TempDir empty("stats_empty");
    LogFileStats e = log_file_stats(empty.str());
    TEST_ASSERT_EQ(e.total_files, (size_t)0, "empty");
    TEST_ASSERT(!e.oldest_session && !e.newest_session && !e.current_session, "no sessions");
}

TEST(rotate_keeps_current_plus_previous) {
    TempDir dir("rotate_current");
    make_sessions(dir, {"session_20250101_000000.jsonl", "session_20250102_000000.jsonl",
                        "session_20250103_000000.jsonl", "session_20250104_000000.jsonl"});

    // The current session is the oldest file here; it survives regardless.
    RotationResult r = rotate_logs(dir.str(), 2, "session_20250101_000000");
    TEST_ASSERT_EQ(r.files_deleted, (size_t)2, "two deleted");
    TEST_ASSERT_EQ(r.files_kept, (size_t)2, "current plus one");
    TEST_ASSERT_EQ(r.bytes_freed, (uint64_t)6, "bytes freed");
    TEST_ASSERT(contains(r.sessions_deleted, "session_20250102_000000"), "older deleted");
    TEST_ASSERT(contains(r.sessions_deleted, "session_20250103_000000"), "older deleted");
    TEST_ASSERT(r.errors.empty(), "no errors");

    TEST_ASSERT(std::filesystem::exists(dir.file("session_20250101_000000.jsonl")), "current kept");
    TEST_ASSERT(std::filesystem::exists(dir.file("session_20250104_000000.jsonl")), "newest kept");
}

TEST(rotate_without_current_keeps_n) {
    TempDir dir("rotate_plain");
    make_sessions(dir, {"session_20250101_000000.jsonl", "session_20250102_000000.jsonl.gz",
                        "session_20250103_000000.jsonl"});
    RotationResult r = rotate_logs(dir.str(), 2);
    TEST_ASSERT_EQ(r.files_deleted, (size_t)1, "one deleted");
    TEST_ASSERT_EQ(r.files_kept, (size_t)2, "two kept");
    TEST_ASSERT_EQ(r.sessions_deleted[0], std::string("session_20250101_000000"), "oldest deleted");

    RotationResult again = rotate_logs(dir.str(), 2);
    TEST_ASSERT_EQ(again.files_deleted, (size_t)0, "nothing more to delete");
}

TEST(rotate_counts_both_formats_of_current_session) {
    TempDir dir("rotate_both");
    make_sessions(dir, {"session_20250101_000000.jsonl", "session_20250102_000000.jsonl",
                        "session_20250102_000000.jsonl.gz"});
    RotationResult r = rotate_logs(dir.str(), 1, "session_20250102_000000");
    TEST_ASSERT_EQ(r.files_deleted, (size_t)1, "only the other session");
    TEST_ASSERT_EQ(r.files_kept, (size_t)2, "both files of the current session");
}

TEST(rotate_empty_directory) {
    TempDir dir("rotate_empty");
    RotationResult r = rotate_logs(dir.str(), 3, "session_20250101_000000");
    TEST_ASSERT_EQ(r.files_deleted + r.files_kept, (size_t)0, "nothing to do");
}

int main(int argc, char** argv) {
    return run_tests(argc, argv);
}

#pragma once
/**
 * @file retention.hpp
 * @brief Listing and rotation of session files in a log directory.
 */

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace activity {

/** @brief One session file found in the log directory. */
struct LogFileInfo {
    std::string path;
    std::string session_id;
    uint64_t size_bytes = 0;
    std::filesystem::file_time_type modified{};
    bool compressed = false;
};

/** @brief Totals over a log directory. */
struct LogFileStats {
    size_t total_files = 0;
    uint64_t total_size_bytes = 0;
    std::optional<std::string> oldest_session;
    std::optional<std::string> newest_session;
    std::optional<std::string> current_session;
};

/** @brief What rotate_logs() did. */
struct RotationResult {
    size_t files_deleted = 0;
    size_t files_kept = 0;
    uint64_t bytes_freed = 0;
    std::vector<std::string> sessions_deleted;
    std::vector<std::string> errors;
};

namespace detail {

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/**
 * @brief Session id of a log file name, if it is one.
 *
 * Accepts session_<suffix>.jsonl and session_<suffix>.jsonl.gz where the
 * suffix contains at least one digit ("session_invalid.jsonl" is skipped).
 */
inline std::optional<std::string> session_from_filename(const std::string& name, bool& compressed) {
    std::string stem;
    if (ends_with(name, ".jsonl.gz")) {
        compressed = true;
        stem = name.substr(0, name.size() - 9);
    } else if (ends_with(name, ".jsonl")) {
        compressed = false;
        stem = name.substr(0, name.size() - 6);
    } else {
        return std::nullopt;
    }

    const std::string prefix = "session_";
    if (stem.compare(0, prefix.size(), prefix) != 0 || stem.size() == prefix.size()) {
        return std::nullopt;
    }
    bool has_digit = std::any_of(stem.begin() + prefix.size(), stem.end(),
                                 [](char c) { return std::isdigit((unsigned char)c) != 0; });
    if (!has_digit) return std::nullopt;
    return stem;
}

} // namespace detail

/**
 * @brief Session files in @p dir, newest first.
 *
 * Ordered by modification time, ties broken by session id descending. A
 * missing directory yields an empty list.
 */
inline std::vector<LogFileInfo> list_log_files(const std::string& dir) {
    namespace fs = std::filesystem;
    std::vector<LogFileInfo> files;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return files;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;

        bool compressed = false;
        auto session = detail::session_from_filename(it->path().filename().string(), compressed);
        if (!session) continue;

        LogFileInfo info;
        info.path = it->path().string();
        info.session_id = *session;
        info.compressed = compressed;
        info.size_bytes = (uint64_t)it->file_size(fec);
        if (fec) info.size_bytes = 0;
        info.modified = it->last_write_time(fec);
        files.push_back(std::move(info));
    }

    std::sort(files.begin(), files.end(), [](const LogFileInfo& a, const LogFileInfo& b) {
        if (a.modified != b.modified) return a.modified > b.modified;
        return a.session_id > b.session_id;
    });
    return files;
}

/**
 * @brief Summarize the session files in @p dir.
 * @param current_session Reported back as-is (the caller's active session)
 */
inline LogFileStats log_file_stats(const std::string& dir,
                                   std::optional<std::string> current_session = std::nullopt) {
    LogFileStats s;
    s.current_session = std::move(current_session);

    std::vector<LogFileInfo> files = list_log_files(dir);
    s.total_files = files.size();
    for (const auto& f : files) s.total_size_bytes += f.size_bytes;
    if (!files.empty()) {
        s.newest_session = files.front().session_id;
        s.oldest_session = files.back().session_id;
    }
    return s;
}

/**
 * @brief Delete old session files, keeping the most recent ones.
 *
 * The current session's file is never deleted. With a current file present
 * it counts toward @p retention_count, so retention_count - 1 previous
 * sessions survive; otherwise retention_count previous sessions do.
 * Deletion failures are collected in RotationResult::errors.
 */
inline RotationResult rotate_logs(const std::string& dir, int retention_count,
                                  const std::string& current_session = std::string()) {
    RotationResult r;
    std::vector<LogFileInfo> files = list_log_files(dir);
    if (files.empty()) return r;

    std::vector<const LogFileInfo*> current;
    std::vector<const LogFileInfo*> others;
    for (const auto& f : files) {
        if (!current_session.empty() && f.session_id == current_session) current.push_back(&f);
        else others.push_back(&f);
    }

    size_t keep = (size_t)std::max(retention_count, 0);
    if (!current.empty() && keep > 0) keep -= 1;

    for (size_t i = 0; i < others.size(); ++i) {
        if (i < keep) {
            ++r.files_kept;
            continue;
        }
        std::error_code ec;
        std::filesystem::remove(others[i]->path, ec);
        if (ec) {
            r.errors.push_back("failed to delete " + others[i]->path + ": " + ec.message());
            ++r.files_kept;
            continue;
        }
        ++r.files_deleted;
        r.bytes_freed += others[i]->size_bytes;
        r.sessions_deleted.push_back(others[i]->session_id);
    }
    r.files_kept += current.size();
    return r;
}

} // namespace activity

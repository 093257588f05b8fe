/**
 * @file test_support.hpp
 * @brief Shared fixtures: scratch directories and in-memory sinks.
 */

#pragma once

#include <activity-log/activity_log.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace test_support {

/**
 * @brief Scratch directory under the system temp dir, removed on destruction.
 */
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        static std::atomic<int> seq{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("activity_log_" + name + "_" + std::to_string(stamp) + "_" + std::to_string(seq++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string str() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

    /// Create @p name with @p content and return its path.
    std::string write_file(const std::string& name, const std::string& content) const {
        std::string p = file(name);
        std::ofstream out(p, std::ios::binary);
        out << content;
        return p;
    }

private:
    std::filesystem::path path_;
};

/**
 * @brief Config for tests: writes into @p dir, quick polling, no exit hook,
 *        no rotation, latency target loose enough for sanitizer builds.
 */
inline activity::Config test_config(const TempDir& dir) {
    activity::Config cfg;
    cfg.log_dir = dir.str();
    cfg.retention_count = 0;
    cfg.register_exit_hook = false;
    cfg.poll_interval_ms = 5;
    cfg.max_latency_ms = 1000.0;
    return cfg;
}

/**
 * @brief Everything a MemorySink saw; outlives the sink itself.
 *
 * The gate lets a test hold the consumer inside write_line() to simulate a
 * slow disk deterministically.
 */
struct SinkRecord {
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<std::string> lines;
    int flushes = 0;
    bool opened = false;
    bool closed = false;
    bool gate_closed = false;
    bool in_write = false;
    std::string fail_marker;        ///< Lines containing this text fail with SinkWriteError

    void close_gate() {
        std::lock_guard<std::mutex> lock(mtx);
        gate_closed = true;
    }

    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(mtx);
            gate_closed = false;
        }
        cv.notify_all();
    }

    /// Wait until the consumer is blocked inside write_line().
    bool wait_in_write(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::unique_lock<std::mutex> lock(mtx);
        return cv.wait_for(lock, timeout, [this]() { return in_write; });
    }

    size_t line_count() {
        std::lock_guard<std::mutex> lock(mtx);
        return lines.size();
    }
};

class MemorySink : public activity::Sink {
public:
    explicit MemorySink(std::shared_ptr<SinkRecord> rec,
                        std::chrono::microseconds delay = std::chrono::microseconds(0))
        : rec_(std::move(rec)), delay_(delay) {}

    void open() override {
        std::lock_guard<std::mutex> lock(rec_->mtx);
        rec_->opened = true;
    }

    void write_line(const std::string& line) override {
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        std::unique_lock<std::mutex> lock(rec_->mtx);
        rec_->in_write = true;
        rec_->cv.notify_all();
        rec_->cv.wait(lock, [this]() { return !rec_->gate_closed; });
        rec_->in_write = false;
        if (!rec_->fail_marker.empty() && line.find(rec_->fail_marker) != std::string::npos) {
            throw activity::SinkWriteError("simulated write failure");
        }
        rec_->lines.push_back(line);
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(rec_->mtx);
        ++rec_->flushes;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(rec_->mtx);
        rec_->closed = true;
    }

    const std::string& path() const override { return path_; }

private:
    std::shared_ptr<SinkRecord> rec_;
    std::chrono::microseconds delay_;
    std::string path_ = "memory";
};

inline activity::QueueEntry entry(uint64_t seq, const std::string& marker = std::string()) {
    activity::QueueEntry e;
    e.event_id = activity::format_event_id(seq);
    e.record = {{"event_id", e.event_id}};
    if (!marker.empty()) e.record["marker"] = marker;
    return e;
}

/// Read a FILE* opened with std::tmpfile() back into a string.
inline std::string slurp(FILE* f) {
    std::string out;
    std::fflush(f);
    std::rewind(f);
    char buf[512];
    size_t n;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    return out;
}

} // namespace test_support

#pragma once
/**
 * @file writer.hpp
 * @brief Bounded MPSC queue drained by one background consumer into a Sink.
 */

#include <activity-log/config.hpp>
#include <activity-log/diag.hpp>
#include <activity-log/errors.hpp>
#include <activity-log/sink.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace activity {

enum class WriterState {
    Uninitialized,
    Running,
    Draining,
    Stopped
};

inline const char* to_string(WriterState s) {
    switch (s) {
        case WriterState::Uninitialized: return "uninitialized";
        case WriterState::Running:       return "running";
        case WriterState::Draining:      return "draining";
        case WriterState::Stopped:       return "stopped";
    }
    return "unknown";
}

/** @brief Outcome of AsyncWriter::submit(). */
enum class SubmitResult {
    Accepted,   ///< Queued; will be written unless shutdown times out
    Dropped,    ///< Queue full under the overflow policy; counted in dropped
    Stopped     ///< Writer is not running; nothing queued
};

/**
 * @brief A validated event between producer and consumer.
 *
 * After submit() the writer owns it exclusively.
 */
struct QueueEntry {
    std::string event_id;
    nlohmann::json record;
    std::chrono::steady_clock::time_point enqueued_at = std::chrono::steady_clock::now();
};

/** @brief Writer settings, normally taken from Config. */
struct WriterOptions {
    size_t         queue_capacity = 8192;
    OverflowPolicy overflow_policy = OverflowPolicy::Block;
    int            enqueue_timeout_ms = 5;
    int            poll_interval_ms = 100;
    size_t         batch_size = 256;
    FILE*          diag_out = stderr;

    static WriterOptions from(const Config& cfg) {
        WriterOptions o;
        o.queue_capacity = cfg.queue_capacity;
        o.overflow_policy = cfg.overflow_policy;
        o.enqueue_timeout_ms = cfg.enqueue_timeout_ms;
        o.poll_interval_ms = cfg.poll_interval_ms;
        o.batch_size = cfg.batch_size;
        o.diag_out = cfg.diag_out;
        return o;
    }
};

/** @brief Snapshot of writer counters. */
struct WriterStats {
    WriterState state = WriterState::Uninitialized;
    uint64_t enqueued = 0;          ///< Accepted by submit()
    uint64_t written = 0;           ///< Lines appended to the sink
    uint64_t dropped = 0;           ///< Rejected because the queue was full
    uint64_t lost = 0;              ///< Still queued when shutdown hit its deadline
    uint64_t write_errors = 0;      ///< Lines the sink failed to take
    size_t   depth = 0;             ///< Current queue length
    size_t   peak_depth = 0;        ///< Highest queue length seen
    double   max_queue_wait_ms = 0; ///< Longest time an entry waited before being written
};

/**
 * @brief Asynchronous durable writer.
 *
 * Producers call submit() from any thread; one consumer thread started by
 * start() owns the sink, takes entries in FIFO order in batches of at most
 * batch_size, writes one JSON line per entry and flushes after each batch.
 * While idle it wakes every poll_interval_ms so it notices shutdown
 * promptly.
 *
 * When the queue holds queue_capacity entries, submit() applies the overflow
 * policy: Block waits up to enqueue_timeout_ms for room, then drops;
 * DropNewest drops at once. Either way the drop is counted and the first
 * drop of a burst is reported on the diagnostics channel. Memory never grows
 * past queue_capacity entries.
 *
 * Sink failures are reported and counted; the consumer moves on to the next
 * entry.
 *
 * State: Uninitialized -> Running -> Draining -> Stopped. A writer runs once;
 * a new session uses a new writer.
 */
class AsyncWriter {
public:
    explicit AsyncWriter(WriterOptions opts = WriterOptions()) : opts_(opts) {
        if (opts_.queue_capacity == 0) opts_.queue_capacity = 1;
        if (opts_.batch_size == 0) opts_.batch_size = 1;
        if (opts_.poll_interval_ms < 1) opts_.poll_interval_ms = 1;
    }

    /**
     * @brief Destructor: drains with a 5 second deadline if still running.
     */
    ~AsyncWriter() {
        if (state() == WriterState::Running || state() == WriterState::Draining) {
            shutdown(std::chrono::milliseconds(5000));
        }
    }

    AsyncWriter(const AsyncWriter&) = delete;
    AsyncWriter& operator=(const AsyncWriter&) = delete;

    /**
     * @brief Open @p sink and start the consumer thread.
     * @throws SinkWriteError if the sink cannot be opened
     * @throws Error if the writer was already started
     */
    void start(std::unique_ptr<Sink> sink) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (state_ != WriterState::Uninitialized) {
            throw Error(std::string("writer already ") + to_string(state_));
        }
        sink->open();
        sink_ = std::move(sink);
        state_ = WriterState::Running;
        consumer_ = std::thread([this]() { consumer_loop(); });
    }

    /**
     * @brief Enqueue an entry.
     *
     * Never blocks longer than enqueue_timeout_ms, and only under
     * OverflowPolicy::Block with a full queue.
     */
    SubmitResult submit(QueueEntry entry) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (state_ != WriterState::Running) return SubmitResult::Stopped;

        if (queue_.size() >= opts_.queue_capacity) {
            if (opts_.overflow_policy == OverflowPolicy::Block && opts_.enqueue_timeout_ms > 0) {
                not_full_.wait_for(lock, std::chrono::milliseconds(opts_.enqueue_timeout_ms), [this]() {
                    return queue_.size() < opts_.queue_capacity || state_ != WriterState::Running;
                });
                if (state_ != WriterState::Running) return SubmitResult::Stopped;
            }
            if (queue_.size() >= opts_.queue_capacity) {
                dropped_.fetch_add(1, std::memory_order_relaxed);
                if (!in_drop_burst_) {
                    in_drop_burst_ = true;
                    diag::warn(opts_.diag_out, "event queue full (%zu entries), dropping %s",
                               opts_.queue_capacity, entry.event_id.c_str());
                }
                return SubmitResult::Dropped;
            }
        }

        in_drop_burst_ = false;
        queue_.push_back(std::move(entry));
        ++enqueued_;
        if (queue_.size() > peak_depth_) peak_depth_ = queue_.size();
        lock.unlock();
        not_empty_.notify_one();
        return SubmitResult::Accepted;
    }

    /**
     * @brief Block until everything accepted so far is written or accounted for.
     *
     * Used when synchronous semantics are needed (tests, checkpoints before
     * a risky operation).
     * @return false on timeout
     */
    bool flush_now(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) {
        std::unique_lock<std::mutex> lock(mtx_);
        uint64_t target = enqueued_;
        not_empty_.notify_one();
        bool done = processed_cv_.wait_for(lock, timeout, [this, target]() {
            return processed_ + lost_.load(std::memory_order_relaxed) >= target ||
                   state_ == WriterState::Stopped || state_ == WriterState::Uninitialized;
        });
        if (!done) {
            diag::warn(opts_.diag_out, "flush_now() timeout after %lld ms (%llu of %llu written)",
                       (long long)timeout.count(), (unsigned long long)processed_,
                       (unsigned long long)target);
        }
        return done;
    }

    /**
     * @brief Drain and stop.
     *
     * Running -> Draining: the consumer keeps writing until the queue is
     * empty or @p timeout elapses; whatever is left is counted as lost. The
     * sink is then flushed and closed and the state becomes Stopped. Safe to
     * call from several threads; all of them wait for the consumer.
     *
     * @return Number of events that were accepted but never written
     */
    uint64_t shutdown(std::chrono::milliseconds timeout) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (state_ == WriterState::Uninitialized) {
                state_ = WriterState::Stopped;
                return 0;
            }
            if (state_ == WriterState::Running) {
                auto deadline = std::chrono::steady_clock::now() + timeout;
                deadline_ns_.store(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                       deadline.time_since_epoch()).count(),
                                   std::memory_order_relaxed);
                state_ = WriterState::Draining;
            }
        }
        not_empty_.notify_all();
        not_full_.notify_all();

        {
            std::lock_guard<std::mutex> join_lock(join_mtx_);
            if (consumer_.joinable()) consumer_.join();
        }
        return lost_.load(std::memory_order_relaxed);
    }

    WriterState state() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return state_;
    }

    WriterStats stats() const {
        WriterStats s;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            s.state = state_;
            s.enqueued = enqueued_;
            s.depth = queue_.size();
            s.peak_depth = peak_depth_;
        }
        s.written = written_.load(std::memory_order_relaxed);
        s.dropped = dropped_.load(std::memory_order_relaxed);
        s.lost = lost_.load(std::memory_order_relaxed);
        s.write_errors = write_errors_.load(std::memory_order_relaxed);
        s.max_queue_wait_ms = max_wait_us_.load(std::memory_order_relaxed) / 1000.0;
        return s;
    }

    uint64_t dropped_count() const { return dropped_.load(std::memory_order_relaxed); }
    uint64_t written_count() const { return written_.load(std::memory_order_relaxed); }
    uint64_t lost_count() const { return lost_.load(std::memory_order_relaxed); }

    /// Path of the sink, empty before start().
    std::string sink_path() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return sink_ ? sink_->path() : std::string();
    }

private:
    bool past_deadline() const {
        int64_t d = deadline_ns_.load(std::memory_order_relaxed);
        if (d == std::numeric_limits<int64_t>::max()) return false;
        int64_t now = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count();
        return now >= d;
    }

    void write_entry(const QueueEntry& e) {
        try {
            sink_->write_line(e.record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
            written_.fetch_add(1, std::memory_order_relaxed);
            if (error_streak_ > 0) {
                diag::warn(opts_.diag_out, "sink %s recovered after %llu failed write(s)",
                           sink_->path().c_str(), (unsigned long long)error_streak_);
                error_streak_ = 0;
            }
        } catch (const std::exception& ex) {
            write_errors_.fetch_add(1, std::memory_order_relaxed);
            if (error_streak_++ == 0) {
                diag::error(opts_.diag_out, "failed to write %s: %s", e.event_id.c_str(), ex.what());
            }
        }

        auto waited = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - e.enqueued_at).count();
        if (waited > max_wait_us_.load(std::memory_order_relaxed)) {
            max_wait_us_.store(waited, std::memory_order_relaxed);
        }
    }

    void flush_sink() {
        try {
            sink_->flush();
        } catch (const std::exception& ex) {
            write_errors_.fetch_add(1, std::memory_order_relaxed);
            diag::error(opts_.diag_out, "%s", ex.what());
        }
    }

    /**
     * @brief Consumer thread body.
     *
     * Waits with a poll_interval_ms timeout, moves up to batch_size entries
     * out of the queue and writes them outside the lock.
     */
    void consumer_loop() {
        std::vector<QueueEntry> batch;
        batch.reserve(opts_.batch_size);

        for (;;) {
            batch.clear();
            {
                std::unique_lock<std::mutex> lock(mtx_);
                not_empty_.wait_for(lock, std::chrono::milliseconds(opts_.poll_interval_ms), [this]() {
                    return !queue_.empty() || state_ != WriterState::Running;
                });

                if (state_ == WriterState::Draining && past_deadline()) {
                    lost_.fetch_add(queue_.size(), std::memory_order_relaxed);
                    queue_.clear();
                    break;
                }
                if (queue_.empty()) {
                    if (state_ != WriterState::Running) break;
                    continue;
                }

                size_t n = std::min(opts_.batch_size, queue_.size());
                for (size_t i = 0; i < n; ++i) {
                    batch.push_back(std::move(queue_.front()));
                    queue_.pop_front();
                }
            }
            not_full_.notify_all();

            size_t done = 0;
            for (; done < batch.size(); ++done) {
                if (past_deadline()) break;
                write_entry(batch[done]);
            }
            flush_sink();

            bool timed_out = done < batch.size();
            {
                std::lock_guard<std::mutex> lock(mtx_);
                processed_ += done;
                if (timed_out) {
                    lost_.fetch_add((batch.size() - done) + queue_.size(), std::memory_order_relaxed);
                    queue_.clear();
                }
            }
            processed_cv_.notify_all();
            if (timed_out) break;
        }

        try {
            sink_->close();
        } catch (const std::exception& ex) {
            write_errors_.fetch_add(1, std::memory_order_relaxed);
            diag::error(opts_.diag_out, "%s", ex.what());
        }

        uint64_t lost = lost_.load(std::memory_order_relaxed);
        if (lost > 0) {
            diag::warn(opts_.diag_out, "shutdown deadline passed, %llu event(s) not written to %s",
                       (unsigned long long)lost, sink_->path().c_str());
        }

        {
            std::lock_guard<std::mutex> lock(mtx_);
            state_ = WriterState::Stopped;
        }
        processed_cv_.notify_all();
        not_full_.notify_all();
    }

    WriterOptions opts_;

    mutable std::mutex mtx_;                    ///< Guards queue_, state_ and the plain counters
    std::condition_variable not_empty_;         ///< Wakes the consumer
    std::condition_variable not_full_;          ///< Wakes producers blocked on a full queue
    std::condition_variable processed_cv_;      ///< Wakes flush_now() waiters
    std::deque<QueueEntry> queue_;
    WriterState state_ = WriterState::Uninitialized;
    uint64_t enqueued_ = 0;
    uint64_t processed_ = 0;                    ///< Entries taken and written or failed
    size_t peak_depth_ = 0;
    bool in_drop_burst_ = false;

    std::unique_ptr<Sink> sink_;                ///< Touched only by the consumer once started
    std::thread consumer_;
    std::mutex join_mtx_;
    uint64_t error_streak_ = 0;                 ///< Consumer-only

    std::atomic<int64_t>  deadline_ns_{std::numeric_limits<int64_t>::max()};
    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> lost_{0};
    std::atomic<uint64_t> write_errors_{0};
    std::atomic<int64_t>  max_wait_us_{0};
};

} // namespace activity

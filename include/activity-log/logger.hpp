#pragma once
/**
 * @file logger.hpp
 * @brief Producer API and session lifecycle.
 */

#include <activity-log/config.hpp>
#include <activity-log/diag.hpp>
#include <activity-log/errors.hpp>
#include <activity-log/event.hpp>
#include <activity-log/hierarchy.hpp>
#include <activity-log/ids.hpp>
#include <activity-log/retention.hpp>
#include <activity-log/schema.hpp>
#include <activity-log/sink.hpp>
#include <activity-log/writer.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace activity {

/** @brief Counters for one Logger, safe to read at any time. */
struct LoggerStats {
    std::string session_id;             ///< Empty before initialize()
    WriterState state = WriterState::Uninitialized;
    uint64_t events_created = 0;        ///< Ids handed out this session
    uint64_t rejected = 0;              ///< Strict-mode schema rejections
    uint64_t annotated = 0;             ///< Lenient-mode events written with validation_warnings
    uint64_t slow_submissions = 0;      ///< Submissions slower than Config::max_latency_ms
    double max_submit_latency_ms = 0;
    WriterStats writer;
};

/**
 * @brief Event id handed out before its event is recorded.
 *
 * Only valid in the session that issued it: log_reserved() refuses it once
 * that session has ended, even if a new one is running.
 */
struct ReservedId {
    std::string event_id;
    std::string session_id;
    uint64_t    generation = 0;     ///< Session counter value at reservation
};

/**
 * @brief One logging session: id allocation, hierarchy, validation and the writer.
 *
 * Producers call the log_* operations from any thread. Each one allocates
 * the next event id, resolves parent_event_id from the calling thread's
 * innermost open scope (unless EventOptions overrides it), stamps the
 * timestamp and session id, validates, and hands the record to the
 * AsyncWriter. The call returns the assigned id.
 *
 * Lifecycle: Uninitialized -> Running -> Draining -> Stopped. The first
 * log_* call starts the session when Config::lazy_initialize is set;
 * otherwise it throws NotInitializedError. After shutdown(), log_* throws
 * StoppedError until initialize() opens a fresh session.
 *
 * @code
 * activity::Logger log(cfg);
 * log.initialize();
 * auto inv = log.log_agent_invocation("planner", "user", "plan sprint");
 * log.log_tool_usage("planner", "Read", "load backlog");
 * log.shutdown(std::chrono::seconds(5));
 * @endcode
 */
class Logger {
public:
    explicit Logger(Config cfg = Config()) : cfg_(std::move(cfg)), counter_(cfg_.event_id_width) {}

    /**
     * @brief Drains with Config::exit_shutdown_timeout_ms; never throws.
     */
    ~Logger() {
        shutdown_quietly(std::chrono::milliseconds(cfg_.exit_shutdown_timeout_ms));
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    /**
     * @brief Start a session, or return the running one.
     *
     * Idempotent and thread-safe: while Running it returns the current id
     * and does nothing else. From Uninitialized or Stopped it opens a fresh
     * session (new id, counter back to 1), opens the sink and rotates old
     * session files.
     *
     * @param session_id Explicit id; generated from Config::session_id_format when absent,
     *                   with a numeric suffix if that id is already taken
     * @throws Error on an invalid configuration
     * @throws SinkWriteError if the sink cannot be opened
     * @throws StoppedError while a shutdown is still draining
     */
    std::string initialize(const std::optional<std::string>& session_id = std::nullopt) {
        std::lock_guard<std::mutex> lock(life_mtx_);
        if (state_ == WriterState::Running) return session_id_;
        if (state_ == WriterState::Draining) throw StoppedError("initialize");
        start_locked(session_id, false);
        return session_id_;
    }

    /**
     * @brief Drain the queue and close the session.
     *
     * Blocks until every queued event is written or @p timeout elapses.
     * Calling it before initialize() or twice is a no-op.
     *
     * @throws ShutdownTimeoutError with the unflushed count when the deadline passed
     */
    void shutdown(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        std::shared_ptr<AsyncWriter> writer;
        uint64_t generation = 0;
        {
            std::lock_guard<std::mutex> lock(life_mtx_);
            if (state_ != WriterState::Running && state_ != WriterState::Draining) return;
            state_ = WriterState::Draining;
            writer = writer_;
            generation = generation_;
        }

        uint64_t unflushed = writer ? writer->shutdown(timeout) : 0;

        {
            // Another caller may already have finished and a new session started.
            std::lock_guard<std::mutex> lock(life_mtx_);
            if (generation_ == generation) state_ = WriterState::Stopped;
        }
        if (unflushed > 0) throw ShutdownTimeoutError(unflushed);
    }

    /**
     * @brief shutdown() for destructors and exit hooks.
     * @return Unflushed events (0 on a clean drain)
     */
    uint64_t shutdown_quietly(std::chrono::milliseconds timeout) noexcept {
        try {
            shutdown(timeout);
        } catch (const ShutdownTimeoutError& e) {
            diag::warn(cfg_.diag_out, "%s", e.what());
            return e.unflushed();
        } catch (const std::exception& e) {
            diag::error(cfg_.diag_out, "shutdown failed: %s", e.what());
        }
        return 0;
    }

    /**
     * @brief Wait until everything logged so far is on disk.
     * @return false on timeout; true when nothing is running
     */
    bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) {
        std::shared_ptr<AsyncWriter> writer;
        {
            std::lock_guard<std::mutex> lock(life_mtx_);
            writer = writer_;
        }
        return writer ? writer->flush_now(timeout) : true;
    }

    /**
     * @brief Replace the configuration used by the next session.
     * @throws Error while a session is running or draining
     */
    void configure(Config cfg) {
        std::lock_guard<std::mutex> lock(life_mtx_);
        if (state_ == WriterState::Running || state_ == WriterState::Draining) {
            throw Error("configure: session " + session_id_ + " is active");
        }
        cfg_ = std::move(cfg);
    }

    Config config() const {
        std::lock_guard<std::mutex> lock(life_mtx_);
        return cfg_;
    }

    /// Current session id, empty before the first initialize().
    std::string session_id() const {
        std::lock_guard<std::mutex> lock(life_mtx_);
        return session_id_;
    }

    /// Ids allocated in the current session.
    uint64_t event_count() const { return counter_.count(); }

    WriterState state() const {
        std::lock_guard<std::mutex> lock(life_mtx_);
        return state_;
    }

    bool is_running() const { return state() == WriterState::Running; }

    /// Sink file of the current session, empty when nothing is written.
    std::string sink_path() const {
        std::lock_guard<std::mutex> lock(life_mtx_);
        return writer_ ? writer_->sink_path() : std::string();
    }

    LoggerStats stats() const {
        LoggerStats s;
        std::shared_ptr<AsyncWriter> writer;
        {
            std::lock_guard<std::mutex> lock(life_mtx_);
            s.session_id = session_id_;
            s.state = state_;
            writer = writer_;
        }
        s.events_created = counter_.count();
        s.rejected = rejected_.load(std::memory_order_relaxed);
        s.annotated = annotated_.load(std::memory_order_relaxed);
        s.slow_submissions = slow_submissions_.load(std::memory_order_relaxed);
        s.max_submit_latency_ms = max_submit_ns_.load(std::memory_order_relaxed) / 1e6;
        if (writer) s.writer = writer->stats();
        return s;
    }

    HierarchyTracker& hierarchy() { return tracker_; }

    /// Diagnostics stream of the active configuration.
    FILE* diag_out() const {
        std::lock_guard<std::mutex> lock(life_mtx_);
        return cfg_.diag_out;
    }

    // ------------------------------------------------------------------
    // Producer API
    // ------------------------------------------------------------------

    std::string log_agent_invocation(AgentInvocation p, const EventOptions& opts = EventOptions()) {
        return record(Payload(std::move(p)), opts, nullptr, "log_agent_invocation");
    }

    std::string log_agent_invocation(const std::string& agent, const std::string& invoked_by,
                                     const std::string& reason) {
        AgentInvocation p;
        p.agent = agent;
        p.invoked_by = invoked_by;
        p.reason = reason;
        return log_agent_invocation(std::move(p));
    }

    std::string log_tool_usage(ToolUsage p, const EventOptions& opts = EventOptions()) {
        return record(Payload(std::move(p)), opts, nullptr, "log_tool_usage");
    }

    std::string log_tool_usage(const std::string& agent, const std::string& tool,
                               const std::string& description) {
        ToolUsage p;
        p.agent = agent;
        p.tool = tool;
        p.operation = description;
        return log_tool_usage(std::move(p));
    }

    std::string log_file_operation(FileOperation p, const EventOptions& opts = EventOptions()) {
        return record(Payload(std::move(p)), opts, nullptr, "log_file_operation");
    }

    std::string log_file_operation(const std::string& agent, FileOperationType op,
                                   const std::string& file_path) {
        FileOperation p;
        p.agent = agent;
        p.operation = op;
        p.file_path = file_path;
        return log_file_operation(std::move(p));
    }

    std::string log_decision(Decision p, const EventOptions& opts = EventOptions()) {
        return record(Payload(std::move(p)), opts, nullptr, "log_decision");
    }

    std::string log_decision(const std::string& agent, const std::string& question,
                             std::vector<std::string> options, const std::string& selected,
                             const std::string& rationale = std::string()) {
        Decision p;
        p.agent = agent;
        p.question = question;
        p.options = std::move(options);
        p.selected = selected;
        p.rationale = rationale;
        return log_decision(std::move(p));
    }

    std::string log_error(ErrorReport p, const EventOptions& opts = EventOptions()) {
        return record(Payload(std::move(p)), opts, nullptr, "log_error");
    }

    std::string log_error(const std::string& agent, const std::string& error_type,
                          const std::string& message, ErrorSeverity severity = ErrorSeverity::Medium) {
        ErrorReport p;
        p.agent = agent;
        p.error_type = error_type;
        p.error_message = message;
        p.severity = severity;
        return log_error(std::move(p));
    }

    /**
     * @brief Record a context snapshot.
     *
     * Snapshots are top-level: they get no parent unless
     * EventOptions::parent_event_id names one. Missing token numbers are
     * derived (see ContextSnapshot::resolve()).
     */
    std::string log_context_snapshot(ContextSnapshot p, const EventOptions& opts = EventOptions()) {
        return record(Payload(std::move(p)), opts, nullptr, "log_context_snapshot");
    }

    std::string log_context_snapshot(const std::string& trigger) {
        ContextSnapshot p;
        p.trigger = trigger;
        return log_context_snapshot(std::move(p));
    }

    std::string log_validation(ValidationReport p, const EventOptions& opts = EventOptions()) {
        return record(Payload(std::move(p)), opts, nullptr, "log_validation");
    }

    std::string log_validation(const std::string& agent, const std::string& validation_type,
                               const std::string& result) {
        ValidationReport p;
        p.agent = agent;
        p.validation_type = validation_type;
        p.result = result;
        return log_validation(std::move(p));
    }

    /**
     * @brief Allocate an id now for an event recorded later with log_reserved().
     *
     * ToolScope uses this so its children can point at the tool event
     * before that event exists.
     */
    ReservedId reserve_event_id() {
        std::lock_guard<std::mutex> lock(life_mtx_);
        Active active = ensure_running_locked("reserve_event_id");
        return ReservedId{counter_.next(), active.session_id, active.generation};
    }

    /**
     * @brief Record @p payload under an id obtained from reserve_event_id().
     * @throws StoppedError if the reserving session has ended
     */
    std::string log_reserved(const ReservedId& reserved, Payload payload,
                             const EventOptions& opts = EventOptions()) {
        return record(std::move(payload), opts, &reserved, "log_reserved");
    }

private:
    struct Active {
        std::string session_id;
        std::shared_ptr<AsyncWriter> writer;
        std::shared_ptr<const Config> cfg;
        uint64_t generation = 0;
    };

    /**
     * @brief Session id that does not reuse the previous one or an existing file.
     *
     * Second-resolution formats repeat when a session restarts quickly;
     * "_2", "_3", ... are appended until the id is free.
     */
    std::string unique_session_id_locked() const {
        std::string base = generate_session_id(cfg_.session_id_format);
        std::string sid = base;
        for (int n = 2; sid == session_id_ || session_file_exists(sid); ++n) {
            sid = base + "_" + std::to_string(n);
        }
        return sid;
    }

    bool session_file_exists(const std::string& sid) const {
        std::error_code ec;
        return std::filesystem::exists(session_file_path(cfg_.log_dir, sid, false), ec) ||
               std::filesystem::exists(session_file_path(cfg_.log_dir, sid, true), ec);
    }

    /**
     * @brief Problem with an explicit parent, or std::nullopt when it is valid.
     *
     * A parent must be an earlier event of the same session, so its sequence
     * lies in [1, seq(child)).
     */
    static std::optional<std::string> check_parent(const std::string& parent, const std::string& child) {
        std::optional<uint64_t> p = parse_event_sequence(parent);
        std::optional<uint64_t> c = parse_event_sequence(child);
        if (p && c && *p >= 1 && *p < *c) return std::nullopt;
        return "parent_event_id '" + parent + "' is not an earlier event of this session";
    }

    /**
     * @brief Open a session. Caller holds life_mtx_.
     *
     * A lazy start must not take the producer down, so a sink that cannot
     * be opened only disables writing for the session. An explicit
     * initialize() throws instead.
     */
    void start_locked(const std::optional<std::string>& session_id, bool lazy) {
        std::vector<std::string> problems = cfg_.validate();
        if (!problems.empty()) {
            std::string msg = "invalid configuration";
            for (size_t i = 0; i < problems.size(); ++i) msg += (i == 0 ? ": " : "; ") + problems[i];
            throw Error(msg);
        }

        std::string sid = (session_id && !session_id->empty())
                              ? *session_id
                              : unique_session_id_locked();

        std::shared_ptr<AsyncWriter> writer;
        if (cfg_.enabled) {
            writer = std::make_shared<AsyncWriter>(WriterOptions::from(cfg_));
            try {
                writer->start(make_session_sink(cfg_.log_dir, sid, cfg_.compression));
            } catch (const SinkWriteError& e) {
                if (!lazy) throw;
                diag::error(cfg_.diag_out, "%s; session %s will not be written", e.what(), sid.c_str());
                writer.reset();
            }
        }

        session_id_ = sid;
        writer_ = writer;
        active_cfg_ = std::make_shared<const Config>(cfg_);
        counter_.reset(cfg_.event_id_width);
        tracker_.clear();
        warned_slow_.store(false, std::memory_order_relaxed);
        ++generation_;
        state_ = WriterState::Running;

        if (writer_ && cfg_.retention_count > 0) {
            RotationResult r = rotate_logs(cfg_.log_dir, cfg_.retention_count, session_id_);
            for (const auto& err : r.errors) {
                diag::warn(cfg_.diag_out, "log rotation: %s", err.c_str());
            }
        }
    }

    Active ensure_running(const char* op) {
        std::lock_guard<std::mutex> lock(life_mtx_);
        return ensure_running_locked(op);
    }

    Active ensure_running_locked(const char* op) {
        switch (state_) {
            case WriterState::Running:
                break;
            case WriterState::Uninitialized:
                if (!cfg_.lazy_initialize) throw NotInitializedError(op);
                start_locked(std::nullopt, true);
                break;
            case WriterState::Draining:
            case WriterState::Stopped:
                throw StoppedError(op);
        }
        return Active{session_id_, writer_, active_cfg_, generation_};
    }

    std::string record(Payload payload, const EventOptions& opts,
                       const ReservedId* reserved, const char* op) {
        auto t0 = std::chrono::steady_clock::now();
        Active active = ensure_running(op);
        const Config& cfg = *active.cfg;

        if (reserved && reserved->generation != active.generation) {
            throw StoppedError(std::string(op) + " " + reserved->event_id + " (session " +
                               reserved->session_id + " has ended)");
        }

        if (auto* snap = std::get_if<ContextSnapshot>(&payload)) {
            snap->resolve(cfg.default_token_budget);
        }

        Event e;
        e.event_id = reserved ? reserved->event_id : counter_.next();
        e.session_id = active.session_id;
        e.timestamp = iso_timestamp();
        std::optional<std::string> parent_problem;
        if (opts.detach) {
            e.parent_event_id = std::nullopt;
        } else if (opts.parent_event_id) {
            e.parent_event_id = opts.parent_event_id;
            parent_problem = check_parent(*opts.parent_event_id, e.event_id);
        } else if (!std::holds_alternative<ContextSnapshot>(payload)) {
            e.parent_event_id = tracker_.current_parent();
        }
        e.payload = std::move(payload);
        e.metadata = opts.metadata;

        if (!cfg.enabled || !active.writer) return e.event_id;

        nlohmann::json rec = e.to_json();
        if (cfg.validate_schemas) {
            ValidationResult vr = validate(rec);
            if (parent_problem) vr.problems.push_back(*parent_problem);
            if (!vr.ok()) {
                if (cfg.validation_mode == ValidationMode::Strict) {
                    rejected_.fetch_add(1, std::memory_order_relaxed);
                    throw SchemaError(to_string(e.type()), std::move(vr.problems));
                }
                annotated_.fetch_add(1, std::memory_order_relaxed);
                diag::warn(cfg.diag_out, "%s (%s) written with %zu validation warning(s): %s",
                           e.event_id.c_str(), to_string(e.type()), vr.problems.size(),
                           vr.problems.front().c_str());
                rec["validation_warnings"] = vr.problems;
            }
        }

        SubmitResult res = active.writer->submit(QueueEntry{e.event_id, std::move(rec)});
        note_latency(cfg, std::chrono::steady_clock::now() - t0);

        if (res == SubmitResult::Stopped) throw StoppedError(op);
        if (res == SubmitResult::Dropped && cfg.throw_on_overflow) {
            throw QueueSaturationError(e.event_id);
        }
        return e.event_id;
    }

    void note_latency(const Config& cfg, std::chrono::steady_clock::duration elapsed) {
        int64_t ns = std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed).count();
        int64_t prev = max_submit_ns_.load(std::memory_order_relaxed);
        while (ns > prev && !max_submit_ns_.compare_exchange_weak(prev, ns, std::memory_order_relaxed)) {
        }

        double ms = ns / 1e6;
        if (ms > cfg.max_latency_ms) {
            slow_submissions_.fetch_add(1, std::memory_order_relaxed);
            if (!warned_slow_.exchange(true, std::memory_order_relaxed)) {
                diag::warn(cfg.diag_out, "submission took %.3f ms (target %.3f ms)", ms, cfg.max_latency_ms);
            }
        }
    }

    mutable std::mutex life_mtx_;           ///< Guards cfg_, state_, session_id_, writer_
    Config cfg_;
    std::shared_ptr<const Config> active_cfg_;  ///< Snapshot taken when the session started
    WriterState state_ = WriterState::Uninitialized;
    std::string session_id_;
    std::shared_ptr<AsyncWriter> writer_;
    uint64_t generation_ = 0;               ///< Bumped by every session start

    EventCounter counter_;
    HierarchyTracker tracker_;

    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> annotated_{0};
    std::atomic<uint64_t> slow_submissions_{0};
    std::atomic<int64_t>  max_submit_ns_{0};
    std::atomic<bool>     warned_slow_{false};
};

} // namespace activity

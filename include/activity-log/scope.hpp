#pragma once
/**
 * @file scope.hpp
 * @brief RAII guards for scoped tool usage and agent invocations.
 */

#include <activity-log/diag.hpp>
#include <activity-log/event.hpp>
#include <activity-log/hierarchy.hpp>
#include <activity-log/logger.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>
#include <optional>
#include <string>

namespace activity {

/**
 * @brief Scoped tool usage with automatic duration.
 *
 * Construction reserves the tool event's id and opens a hierarchy scope
 * with it, so events logged while the tool runs are its children.
 * Destruction closes the scope and records the tool_usage event with
 * duration_ms measured from entry to exit. success is false when the scope
 * is left by an exception or after fail(). If the session that reserved the
 * id ends first, nothing is recorded and the loss is reported on the
 * diagnostics channel.
 *
 * @code
 * {
 *     activity::ToolScope tool(log, "coder", "Edit", "patch parser");
 *     log.log_file_operation("coder", activity::FileOperationType::Modify, "src/parser.cpp");
 * }   // tool_usage written here, parent of the file_operation above
 * @endcode
 */
class ToolScope {
public:
    ToolScope(Logger& logger, const std::string& agent, const std::string& tool,
              const std::string& description = std::string(),
              nlohmann::json parameters = nlohmann::json())
        : logger_(&logger),
          parent_(logger.hierarchy().current_parent()),
          start_(std::chrono::steady_clock::now()),
          uncaught_(std::uncaught_exceptions()) {
        usage_.agent = agent;
        usage_.tool = tool;
        usage_.operation = description;
        usage_.parameters = std::move(parameters);
        reserved_ = logger.reserve_event_id();
        scope_.emplace(logger.hierarchy(), reserved_.event_id, logger.diag_out());
    }

    ~ToolScope() {
        scope_.reset();

        auto elapsed = std::chrono::steady_clock::now() - start_;
        usage_.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

        bool unwinding = std::uncaught_exceptions() > uncaught_;
        usage_.success = !failed_ && !unwinding;
        if (unwinding && usage_.error_message.empty()) {
            usage_.error_message = "scope exited by exception";
        }

        EventOptions opts;
        if (parent_) opts.parent_event_id = parent_;
        else opts.detach = true;

        try {
            logger_->log_reserved(reserved_, Payload(std::move(usage_)), opts);
        } catch (const std::exception& e) {
            diag::error(logger_->diag_out(), "tool scope %s not recorded: %s",
                        reserved_.event_id.c_str(), e.what());
        }
    }

    ToolScope(const ToolScope&) = delete;
    ToolScope& operator=(const ToolScope&) = delete;

    /// Mark the tool use as failed; recorded with success = false.
    void fail(const std::string& message) {
        failed_ = true;
        usage_.error_message = message;
    }

    void set_result_summary(const std::string& summary) { usage_.result_summary = summary; }

    /// Id the tool_usage event will carry.
    const std::string& event_id() const { return reserved_.event_id; }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }

private:
    Logger* logger_;
    ToolUsage usage_;
    std::optional<std::string> parent_;
    ReservedId reserved_;
    std::chrono::steady_clock::time_point start_;
    int uncaught_;
    bool failed_ = false;
    std::optional<HierarchyScope> scope_;
};

/**
 * @brief Scoped agent invocation.
 *
 * The agent_invocation event is recorded on construction and its id opens
 * a hierarchy scope for the guard's lifetime. With
 * Config::emit_agent_completion set, destruction also records a completed
 * (or failed, when unwinding) invocation carrying duration_ms, parented to
 * the opening event. Without it no duration is persisted; duration_ms()
 * still reports the elapsed time to the caller.
 */
class AgentScope {
public:
    AgentScope(Logger& logger, AgentInvocation invocation, const EventOptions& opts = EventOptions())
        : logger_(&logger),
          invocation_(std::move(invocation)),
          start_(std::chrono::steady_clock::now()),
          uncaught_(std::uncaught_exceptions()) {
        event_id_ = logger.log_agent_invocation(invocation_, opts);
        scope_.emplace(logger.hierarchy(), event_id_, logger.diag_out());
    }

    AgentScope(Logger& logger, const std::string& agent, const std::string& invoked_by,
               const std::string& reason)
        : AgentScope(logger, make_invocation(agent, invoked_by, reason)) {}

    ~AgentScope() {
        scope_.reset();
        if (!logger_->config().emit_agent_completion) return;

        bool unwinding = std::uncaught_exceptions() > uncaught_;
        AgentInvocation done = invocation_;
        done.status = (failed_ || unwinding) ? AgentStatus::Failed : AgentStatus::Completed;
        done.duration_ms = (int64_t)duration_ms();
        if (!result_.empty()) done.result = result_;

        EventOptions opts;
        opts.parent_event_id = event_id_;
        try {
            logger_->log_agent_invocation(std::move(done), opts);
        } catch (const std::exception& e) {
            diag::error(logger_->diag_out(), "agent scope %s completion not recorded: %s",
                        event_id_.c_str(), e.what());
        }
    }

    AgentScope(const AgentScope&) = delete;
    AgentScope& operator=(const AgentScope&) = delete;

    const std::string& event_id() const { return event_id_; }

    /// Milliseconds since the invocation was recorded.
    double duration_ms() const {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
    }

    void fail() { failed_ = true; }
    void set_result(const std::string& result) { result_ = result; }

private:
    static AgentInvocation make_invocation(const std::string& agent, const std::string& invoked_by,
                                           const std::string& reason) {
        AgentInvocation p;
        p.agent = agent;
        p.invoked_by = invoked_by;
        p.reason = reason;
        return p;
    }

    Logger* logger_;
    AgentInvocation invocation_;
    std::string event_id_;
    std::string result_;
    std::chrono::steady_clock::time_point start_;
    int uncaught_;
    bool failed_ = false;
    std::optional<HierarchyScope> scope_;
};

} // namespace activity

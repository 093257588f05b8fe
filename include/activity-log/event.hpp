#pragma once
/**
 * @file event.hpp
 * @brief Event kinds, typed payloads and their JSON form.
 *
 * Each of the seven event kinds has a payload struct whose required fields
 * come first. Optional fields are empty strings, empty containers, null JSON
 * or disengaged std::optional when absent, and are then left out of the
 * serialized record.
 */

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace activity {

/**
 * @brief The seven event kinds.
 *
 * Order matches the alternatives of Payload, so type() is payload.index().
 */
enum class EventType : uint8_t {
    AgentInvocation = 0,
    ToolUsage,
    FileOperation,
    Decision,
    Error,
    ContextSnapshot,
    Validation
};

constexpr size_t kEventTypeCount = 7;

inline const char* to_string(EventType t) {
    switch (t) {
        case EventType::AgentInvocation: return "agent_invocation";
        case EventType::ToolUsage:       return "tool_usage";
        case EventType::FileOperation:   return "file_operation";
        case EventType::Decision:        return "decision";
        case EventType::Error:           return "error";
        case EventType::ContextSnapshot: return "context_snapshot";
        case EventType::Validation:      return "validation";
    }
    return "unknown";
}

/** @return The kind named @p name, or std::nullopt for anything else. */
inline std::optional<EventType> parse_event_type(const std::string& name) {
    for (size_t i = 0; i < kEventTypeCount; ++i) {
        EventType t = static_cast<EventType>(i);
        if (name == to_string(t)) return t;
    }
    return std::nullopt;
}

enum class AgentStatus { Started, Completed, Failed };

inline const char* to_string(AgentStatus s) {
    switch (s) {
        case AgentStatus::Started:   return "started";
        case AgentStatus::Completed: return "completed";
        case AgentStatus::Failed:    return "failed";
    }
    return "started";
}

enum class FileOperationType { Create, Modify, Delete, Rename, Read };

inline const char* to_string(FileOperationType op) {
    switch (op) {
        case FileOperationType::Create: return "create";
        case FileOperationType::Modify: return "modify";
        case FileOperationType::Delete: return "delete";
        case FileOperationType::Rename: return "rename";
        case FileOperationType::Read:   return "read";
    }
    return "modify";
}

enum class ErrorSeverity { Low, Medium, High, Critical };

inline const char* to_string(ErrorSeverity s) {
    switch (s) {
        case ErrorSeverity::Low:      return "low";
        case ErrorSeverity::Medium:   return "medium";
        case ErrorSeverity::High:     return "high";
        case ErrorSeverity::Critical: return "critical";
    }
    return "medium";
}

enum class ValidationStatus { Pass, Fail, Warning, Skipped };

inline const char* to_string(ValidationStatus s) {
    switch (s) {
        case ValidationStatus::Pass:    return "pass";
        case ValidationStatus::Fail:    return "fail";
        case ValidationStatus::Warning: return "warning";
        case ValidationStatus::Skipped: return "skipped";
    }
    return "skipped";
}

/**
 * @brief Map a free-form status word onto ValidationStatus.
 *
 * Case-insensitive and whitespace-tolerant. "PASSED", "ok", "1" become Pass;
 * "error", "false", "no" become Fail; "warn", "caution" become Warning.
 * Anything unrecognized is Skipped.
 */
inline ValidationStatus normalize_validation_status(const std::string& raw) {
    std::string s;
    s.reserve(raw.size());
    for (char c : raw) {
        if (!std::isspace((unsigned char)c)) s += (char)std::tolower((unsigned char)c);
    }

    static const char* const pass[] = {"pass", "passed", "success", "successful", "ok", "true", "1", "yes"};
    static const char* const fail[] = {"fail", "failed", "failure", "error", "false", "0", "no"};
    static const char* const warn[] = {"warn", "warning", "warnings", "alert", "caution"};

    auto in = [&s](const char* const* first, const char* const* last) {
        return std::find_if(first, last, [&s](const char* w) { return s == w; }) != last;
    };
    if (in(std::begin(pass), std::end(pass))) return ValidationStatus::Pass;
    if (in(std::begin(fail), std::end(fail))) return ValidationStatus::Fail;
    if (in(std::begin(warn), std::end(warn))) return ValidationStatus::Warning;
    return ValidationStatus::Skipped;
}

// ---------------------------------------------------------------------------
// Payloads
// ---------------------------------------------------------------------------

/** @brief An agent was started (or finished) by another agent or the user. */
struct AgentInvocation {
    std::string agent;                          ///< Agent being invoked
    std::string invoked_by;                     ///< Caller: another agent or "user"
    std::string reason;                         ///< Why it was invoked
    AgentStatus status = AgentStatus::Started;

    nlohmann::json context;                     ///< Optional object
    std::string result;
    std::optional<int64_t> duration_ms;
    std::optional<int64_t> tokens_consumed;
};

/** @brief One use of a tool by an agent. */
struct ToolUsage {
    std::string agent;
    std::string tool;
    bool success = true;

    std::string operation;                      ///< What the tool was used for
    nlohmann::json parameters;                  ///< Optional object
    std::optional<int64_t> duration_ms;
    std::string error_message;
    std::string result_summary;
};

struct FileOperation {
    std::string agent;
    FileOperationType operation = FileOperationType::Modify;
    std::string file_path;

    std::optional<int64_t> lines_changed;
    std::optional<int64_t> file_size_bytes;
    std::string diff;
    std::string language;
    std::string git_hash_before;
    std::string git_hash_after;
};

/** @brief A choice between options; rationale may be empty. */
struct Decision {
    std::string agent;
    std::string question;
    std::vector<std::string> options;
    std::string selected;
    std::string rationale;

    std::optional<double> confidence;           ///< 0..1
    std::string alternative_considered;
};

/** @brief A failure observed by an agent. */
struct ErrorReport {
    std::string agent;
    std::string error_type;
    std::string error_message;
    ErrorSeverity severity = ErrorSeverity::Medium;
    nlohmann::json context = nlohmann::json::object();

    std::optional<bool> recoverable;
    std::string stack_trace;
    std::string attempted_fix;
    std::optional<bool> fix_successful;
    std::optional<int64_t> recovery_time_ms;
};

/**
 * @brief Periodic checkpoint of token usage and files in context.
 *
 * All token numbers are optional on input. The Logger fills the gaps:
 * tokens_after = before + consumed, remaining = max(budget - after, 0),
 * budget = Config::default_token_budget.
 */
struct ContextSnapshot {
    std::optional<int64_t> tokens_before;
    std::optional<int64_t> tokens_after;
    std::optional<int64_t> tokens_consumed;
    std::optional<int64_t> tokens_remaining;
    std::optional<int64_t> tokens_total_budget;
    std::vector<std::string> files_in_context;

    std::string trigger;
    nlohmann::json snapshot;                    ///< Free-form state, optional
    std::string agent;
    std::optional<double> memory_mb;

    /** Fill every missing token number, using @p default_budget when no budget was given. */
    void resolve(int64_t default_budget) {
        if (!tokens_total_budget) tokens_total_budget = default_budget;
        if (!tokens_before) tokens_before = 0;
        if (!tokens_consumed) tokens_consumed = 0;
        if (!tokens_after) tokens_after = *tokens_before + *tokens_consumed;
        if (!tokens_remaining) tokens_remaining = std::max<int64_t>(*tokens_total_budget - *tokens_after, 0);
    }
};

/**
 * @brief Outcome of a validation run.
 *
 * Check statuses and the overall result are free-form on input and
 * normalized with normalize_validation_status() when serialized.
 */
struct ValidationReport {
    std::string agent;
    std::string task;
    std::string validation_type;
    std::map<std::string, std::string> checks;
    std::string result;

    std::vector<std::string> failures;
    std::vector<std::string> warnings;
    nlohmann::json metrics;
};

using Payload = std::variant<AgentInvocation, ToolUsage, FileOperation, Decision,
                             ErrorReport, ContextSnapshot, ValidationReport>;

// ---------------------------------------------------------------------------
// Serialization
// ---------------------------------------------------------------------------

namespace detail {

inline void put_if(nlohmann::json& j, const char* key, const std::string& v) {
    if (!v.empty()) j[key] = v;
}

template <typename T>
inline void put_if(nlohmann::json& j, const char* key, const std::optional<T>& v) {
    if (v) j[key] = *v;
}

inline void put_if(nlohmann::json& j, const char* key, const nlohmann::json& v) {
    if (!v.is_null() && !v.empty()) j[key] = v;
}

inline void put_if(nlohmann::json& j, const char* key, const std::vector<std::string>& v) {
    if (!v.empty()) j[key] = v;
}

inline void write_payload(nlohmann::json& j, const AgentInvocation& p) {
    j["agent"] = p.agent;
    j["invoked_by"] = p.invoked_by;
    j["reason"] = p.reason;
    j["status"] = to_string(p.status);
    put_if(j, "context", p.context);
    put_if(j, "result", p.result);
    put_if(j, "duration_ms", p.duration_ms);
    put_if(j, "tokens_consumed", p.tokens_consumed);
}

inline void write_payload(nlohmann::json& j, const ToolUsage& p) {
    j["agent"] = p.agent;
    j["tool"] = p.tool;
    j["success"] = p.success;
    put_if(j, "operation", p.operation);
    put_if(j, "parameters", p.parameters);
    put_if(j, "duration_ms", p.duration_ms);
    put_if(j, "error_message", p.error_message);
    put_if(j, "result_summary", p.result_summary);
}

inline void write_payload(nlohmann::json& j, const FileOperation& p) {
    j["agent"] = p.agent;
    j["operation"] = to_string(p.operation);
    j["file_path"] = p.file_path;
    put_if(j, "lines_changed", p.lines_changed);
    put_if(j, "file_size_bytes", p.file_size_bytes);
    put_if(j, "diff", p.diff);
    put_if(j, "language", p.language);
    put_if(j, "git_hash_before", p.git_hash_before);
    put_if(j, "git_hash_after", p.git_hash_after);
}

inline void write_payload(nlohmann::json& j, const Decision& p) {
    j["agent"] = p.agent;
    j["question"] = p.question;
    j["options"] = p.options;
    j["selected"] = p.selected;
    j["rationale"] = p.rationale;
    put_if(j, "confidence", p.confidence);
    put_if(j, "alternative_considered", p.alternative_considered);
}

inline void write_payload(nlohmann::json& j, const ErrorReport& p) {
    j["agent"] = p.agent;
    j["error_type"] = p.error_type;
    j["error_message"] = p.error_message;
    j["severity"] = to_string(p.severity);
    j["context"] = p.context.is_object() ? p.context : nlohmann::json::object();
    put_if(j, "recoverable", p.recoverable);
    put_if(j, "stack_trace", p.stack_trace);
    put_if(j, "attempted_fix", p.attempted_fix);
    put_if(j, "fix_successful", p.fix_successful);
    put_if(j, "recovery_time_ms", p.recovery_time_ms);
}

// Token numbers are written as given; Logger resolves them before this runs.
inline void write_payload(nlohmann::json& j, const ContextSnapshot& p) {
    j["tokens_before"] = p.tokens_before.value_or(0);
    j["tokens_after"] = p.tokens_after.value_or(0);
    j["tokens_consumed"] = p.tokens_consumed.value_or(0);
    j["tokens_remaining"] = p.tokens_remaining.value_or(0);
    j["tokens_total_budget"] = p.tokens_total_budget.value_or(0);
    j["files_in_context"] = p.files_in_context;
    j["files_in_context_count"] = p.files_in_context.size();
    put_if(j, "trigger", p.trigger);
    put_if(j, "snapshot", p.snapshot);
    put_if(j, "agent", p.agent);
    put_if(j, "memory_mb", p.memory_mb);
}

inline void write_payload(nlohmann::json& j, const ValidationReport& p) {
    j["agent"] = p.agent;
    j["task"] = p.task;
    j["validation_type"] = p.validation_type;
    nlohmann::json checks = nlohmann::json::object();
    for (const auto& [name, status] : p.checks) {
        checks[name] = to_string(normalize_validation_status(status));
    }
    j["checks"] = checks;
    j["result"] = to_string(normalize_validation_status(p.result));
    put_if(j, "failures", p.failures);
    put_if(j, "warnings", p.warnings);
    put_if(j, "metrics", p.metrics);
}

} // namespace detail

/**
 * @brief One structured, immutable record of an observed action.
 *
 * Built by Logger: identifiers and timestamp are stamped before validation,
 * and the Event is not touched again once it has been submitted.
 */
struct Event {
    std::string event_id;
    std::string session_id;
    std::string timestamp;                          ///< UTC, YYYY-MM-DDTHH:MM:SS.mmmZ
    std::optional<std::string> parent_event_id;     ///< Serialized as null when absent
    Payload payload;
    nlohmann::json metadata;                        ///< Caller-supplied object, optional

    EventType type() const { return static_cast<EventType>(payload.index()); }

    /**
     * @brief Serialize to the flat JSON object written as one sink line.
     *
     * Kind fields sit beside the common fields; caller data goes under
     * "metadata" so it can never shadow either.
     */
    nlohmann::json to_json() const {
        nlohmann::json j;
        j["event_type"] = to_string(type());
        j["timestamp"] = timestamp;
        j["session_id"] = session_id;
        j["event_id"] = event_id;
        j["parent_event_id"] = parent_event_id ? nlohmann::json(*parent_event_id) : nlohmann::json(nullptr);
        std::visit([&j](const auto& p) { detail::write_payload(j, p); }, payload);
        if (metadata.is_object() && !metadata.empty()) j["metadata"] = metadata;
        return j;
    }
};

/**
 * @brief Per-call options shared by every producer operation.
 */
struct EventOptions {
    std::optional<std::string> parent_event_id;     ///< Overrides the tracker's current parent
    bool detach = false;                            ///< Record with no parent at all
    nlohmann::json metadata;                        ///< Copied into the event's "metadata" object
};

} // namespace activity

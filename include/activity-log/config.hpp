#pragma once
/**
 * @file config.hpp
 * @brief Logger configuration with INI file and environment loading.
 */

#include <activity-log/diag.hpp>

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

namespace activity {

/**
 * @brief INI file parser utilities for configuration loading.
 *
 * Simple, dependency-free INI parser supporting:
 * - Comments (# and ;)
 * - Sections [section_name]
 * - Key-value pairs (key = value)
 * - Boolean, integer, float, and string values
 * - Quoted and unquoted strings
 */
namespace ini_parser {

/**
 * @brief Trim whitespace from both ends of a string.
 */
inline std::string trim(const std::string& str) {
    size_t start = 0;
    size_t end = str.length();

    while (start < end && std::isspace((unsigned char)str[start])) ++start;
    while (end > start && std::isspace((unsigned char)str[end - 1])) --end;

    return str.substr(start, end - start);
}

inline std::string to_lower(std::string s) {
    for (char& c : s) {
        c = (char)std::tolower((unsigned char)c);
    }
    return s;
}

/**
 * @brief Parse boolean value from string.
 *
 * Accepts: true/false, 1/0, on/off, yes/no (case-insensitive).
 * Anything else yields @p fallback.
 */
inline bool parse_bool(const std::string& value, bool fallback = false) {
    std::string v = to_lower(trim(value));

    if (v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "off" || v == "no") return false;

    return fallback;
}

/**
 * @brief Parse integer value from string, @p fallback on error.
 */
inline long long parse_int(const std::string& value, long long fallback = 0) {
    try {
        size_t used = 0;
        std::string v = trim(value);
        long long n = std::stoll(v, &used);
        return used == v.size() ? n : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

/**
 * @brief Parse floating point value from string, @p fallback on error.
 */
inline double parse_double(const std::string& value, double fallback = 0.0) {
    try {
        return std::stod(trim(value));
    } catch (const std::exception&) {
        return fallback;
    }
}

/**
 * @brief Remove quotes from string if present.
 */
inline std::string unquote(const std::string& str) {
    std::string s = trim(str);
    if (s.length() >= 2 && s[0] == '"' && s[s.length()-1] == '"') {
        return s.substr(1, s.length() - 2);
    }
    return s;
}

} // namespace ini_parser

/** @brief What to do with an event whose schema check fails. */
enum class ValidationMode {
    Lenient,  ///< Write the event anyway, annotated with validation_warnings
    Strict    ///< Reject the event and throw SchemaError to the caller
};

/** @brief What submit() does when the bounded queue is full. */
enum class OverflowPolicy {
    Block,      ///< Wait up to enqueue_timeout_ms for space, then drop and count
    DropNewest  ///< Drop the new event immediately and count it
};

/**
 * @brief Configuration for one Logger.
 *
 * A Logger copies its Config when a session starts; later changes to the
 * source object do not affect a running session.
 */
struct Config {
    // Output
    bool        enabled = true;                  ///< Master switch; when off ids are still allocated but nothing is written
    std::string log_dir = ".activity/logs";      ///< Directory holding one file per session
    bool        compression = false;             ///< Write <session>.jsonl.gz through zlib instead of plain .jsonl
    FILE*       diag_out = stderr;               ///< Fallback channel for internal warnings and errors

    // Validation
    bool           validate_schemas = true;                  ///< Run the schema registry on every event
    ValidationMode validation_mode = ValidationMode::Lenient;

    // Session and identifiers
    std::string session_id_format = "session_%Y%m%d_%H%M%S";  ///< strftime format, evaluated in UTC
    int         event_id_width = 3;                           ///< Zero padding of evt_NNN below 1000
    long long   default_token_budget = 200000;                ///< Used by context snapshots without a budget

    // Writer
    size_t         queue_capacity = 8192;                     ///< Maximum queued events before the overflow policy applies
    OverflowPolicy overflow_policy = OverflowPolicy::Block;
    int            enqueue_timeout_ms = 5;                    ///< Longest a producer blocks under OverflowPolicy::Block
    bool           throw_on_overflow = false;                 ///< Raise QueueSaturationError for dropped events
    int            poll_interval_ms = 100;                    ///< Consumer wake-up interval while idle
    size_t         batch_size = 256;                          ///< Max events written between sink flushes

    // Self-monitoring
    double max_latency_ms = 1.0;  ///< Submission latency above this is counted as slow (not enforced)

    // Lifecycle
    bool lazy_initialize = true;             ///< First log call starts the session
    bool register_exit_hook = true;          ///< Process-wide logger shuts down from std::atexit
    int  exit_shutdown_timeout_ms = 5000;    ///< Drain deadline used by the exit hook
    bool emit_agent_completion = false;      ///< AgentScope emits a completed/failed event on exit

    // Retention
    int retention_count = 2;  ///< Sessions kept on disk including the current one (0 = never rotate)

    /**
     * @brief Load configuration from INI file.
     *
     * Supports sections: [output], [validation], [session], [writer],
     * [performance], [lifecycle], [retention]. Unknown keys are ignored,
     * malformed lines are reported and skipped.
     *
     * @param path Path to INI file (relative or absolute)
     * @return true on success, false if the file could not be opened
     *
     * Example INI format:
     * @code
     * [output]
     * log_dir = .activity/logs
     * compression = true
     *
     * [validation]
     * mode = strict
     *
     * [writer]
     * queue_capacity = 4096
     * overflow = drop
     * @endcode
     */
    inline bool load_from_file(const char* path);

    /**
     * @brief Override settings from ACTIVITY_LOG_* environment variables.
     *
     * Recognized: ACTIVITY_LOG_ENABLED, ACTIVITY_LOG_DIR,
     * ACTIVITY_LOG_COMPRESSION, ACTIVITY_LOG_VALIDATE, ACTIVITY_LOG_STRICT,
     * ACTIVITY_LOG_SESSION_FORMAT, ACTIVITY_LOG_LATENCY_MS,
     * ACTIVITY_LOG_QUEUE_CAPACITY, ACTIVITY_LOG_RETENTION,
     * ACTIVITY_LOG_TOKEN_BUDGET.
     *
     * @return Number of variables applied
     */
    inline int load_from_env();

    /**
     * @brief Check settings for values the pipeline cannot run with.
     * @return Human-readable problems, empty when the config is usable
     */
    inline std::vector<std::string> validate() const;
};

inline bool Config::load_from_file(const char* path) {
    FILE* f = std::fopen(path, "r");
    if (!f) {
        diag::warn(diag_out, "Could not open config file: %s", path);
        return false;
    }

    std::string current_section;
    char line_buf[512];
    int line_num = 0;

    while (std::fgets(line_buf, sizeof(line_buf), f)) {
        ++line_num;
        std::string line = ini_parser::trim(line_buf);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[' && line[line.length()-1] == ']') {
            current_section = ini_parser::trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            diag::warn(diag_out, "Invalid line in %s:%d (no '=')", path, line_num);
            continue;
        }

        std::string key = ini_parser::trim(line.substr(0, eq_pos));
        std::string value = ini_parser::trim(line.substr(eq_pos + 1));

        // Inline comments; a quoted value keeps its content intact
        if (value.empty() || value[0] != '"') {
            size_t comment_pos = value.find_first_of("#;");
            if (comment_pos != std::string::npos) {
                value = ini_parser::trim(value.substr(0, comment_pos));
            }
        }

        if (current_section == "output") {
            if (key == "enabled") enabled = ini_parser::parse_bool(value, enabled);
            else if (key == "log_dir") log_dir = ini_parser::unquote(value);
            else if (key == "compression") compression = ini_parser::parse_bool(value, compression);
        }
        else if (current_section == "validation") {
            if (key == "enabled") validate_schemas = ini_parser::parse_bool(value, validate_schemas);
            else if (key == "mode") {
                std::string m = ini_parser::to_lower(ini_parser::unquote(value));
                if (m == "strict") validation_mode = ValidationMode::Strict;
                else if (m == "lenient") validation_mode = ValidationMode::Lenient;
                else {
                    diag::warn(diag_out, "Unknown validation mode '%s' in %s:%d",
                               value.c_str(), path, line_num);
                }
            }
        }
        else if (current_section == "session") {
            if (key == "id_format") session_id_format = ini_parser::unquote(value);
            else if (key == "event_id_width") event_id_width = (int)ini_parser::parse_int(value, event_id_width);
            else if (key == "token_budget") default_token_budget = ini_parser::parse_int(value, default_token_budget);
        }
        else if (current_section == "writer") {
            if (key == "queue_capacity") queue_capacity = (size_t)ini_parser::parse_int(value, (long long)queue_capacity);
            else if (key == "enqueue_timeout_ms") enqueue_timeout_ms = (int)ini_parser::parse_int(value, enqueue_timeout_ms);
            else if (key == "poll_interval_ms") poll_interval_ms = (int)ini_parser::parse_int(value, poll_interval_ms);
            else if (key == "batch_size") batch_size = (size_t)ini_parser::parse_int(value, (long long)batch_size);
            else if (key == "throw_on_overflow") throw_on_overflow = ini_parser::parse_bool(value, throw_on_overflow);
            else if (key == "overflow") {
                std::string p = ini_parser::to_lower(ini_parser::unquote(value));
                if (p == "block") overflow_policy = OverflowPolicy::Block;
                else if (p == "drop" || p == "drop_newest") overflow_policy = OverflowPolicy::DropNewest;
                else {
                    diag::warn(diag_out, "Unknown overflow policy '%s' in %s:%d",
                               value.c_str(), path, line_num);
                }
            }
        }
        else if (current_section == "performance") {
            if (key == "max_latency_ms") max_latency_ms = ini_parser::parse_double(value, max_latency_ms);
        }
        else if (current_section == "lifecycle") {
            if (key == "exit_timeout_ms") exit_shutdown_timeout_ms = (int)ini_parser::parse_int(value, exit_shutdown_timeout_ms);
            else if (key == "exit_hook") register_exit_hook = ini_parser::parse_bool(value, register_exit_hook);
            else if (key == "lazy_initialize") lazy_initialize = ini_parser::parse_bool(value, lazy_initialize);
            else if (key == "agent_completion") emit_agent_completion = ini_parser::parse_bool(value, emit_agent_completion);
        }
        else if (current_section == "retention") {
            if (key == "count") retention_count = (int)ini_parser::parse_int(value, retention_count);
        }
    }

    std::fclose(f);
    return true;
}

inline int Config::load_from_env() {
    int applied = 0;
    auto env = [](const char* name) -> const char* {
        const char* v = std::getenv(name);
        return (v && v[0]) ? v : nullptr;
    };

    if (const char* v = env("ACTIVITY_LOG_ENABLED")) { enabled = ini_parser::parse_bool(v, enabled); ++applied; }
    if (const char* v = env("ACTIVITY_LOG_DIR")) { log_dir = v; ++applied; }
    if (const char* v = env("ACTIVITY_LOG_COMPRESSION")) { compression = ini_parser::parse_bool(v, compression); ++applied; }
    if (const char* v = env("ACTIVITY_LOG_VALIDATE")) { validate_schemas = ini_parser::parse_bool(v, validate_schemas); ++applied; }
    if (const char* v = env("ACTIVITY_LOG_STRICT")) {
        validation_mode = ini_parser::parse_bool(v) ? ValidationMode::Strict : ValidationMode::Lenient;
        ++applied;
    }
    if (const char* v = env("ACTIVITY_LOG_SESSION_FORMAT")) { session_id_format = v; ++applied; }
    if (const char* v = env("ACTIVITY_LOG_LATENCY_MS")) { max_latency_ms = ini_parser::parse_double(v, max_latency_ms); ++applied; }
    if (const char* v = env("ACTIVITY_LOG_QUEUE_CAPACITY")) {
        queue_capacity = (size_t)ini_parser::parse_int(v, (long long)queue_capacity);
        ++applied;
    }
    if (const char* v = env("ACTIVITY_LOG_RETENTION")) { retention_count = (int)ini_parser::parse_int(v, retention_count); ++applied; }
    if (const char* v = env("ACTIVITY_LOG_TOKEN_BUDGET")) {
        default_token_budget = ini_parser::parse_int(v, default_token_budget);
        ++applied;
    }
    return applied;
}

inline std::vector<std::string> Config::validate() const {
    std::vector<std::string> errors;
    if (queue_capacity == 0) errors.push_back("queue_capacity must be >= 1");
    if (batch_size == 0) errors.push_back("batch_size must be >= 1");
    if (poll_interval_ms < 1) errors.push_back("poll_interval_ms must be >= 1");
    if (enqueue_timeout_ms < 0) errors.push_back("enqueue_timeout_ms must be >= 0");
    if (event_id_width < 1 || event_id_width > 18) errors.push_back("event_id_width must be in [1, 18]");
    if (max_latency_ms < 0.1) errors.push_back("max_latency_ms must be >= 0.1");
    if (retention_count < 0) errors.push_back("retention_count must be >= 0");
    if (exit_shutdown_timeout_ms < 0) errors.push_back("exit_shutdown_timeout_ms must be >= 0");
    if (session_id_format.empty()) errors.push_back("session_id_format must not be empty");
    if (enabled && log_dir.empty()) errors.push_back("log_dir must not be empty when logging is enabled");
    return errors;
}

} // namespace activity

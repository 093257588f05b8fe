#pragma once
/**
 * @file activity_log.hpp
 * @brief Structured activity logging for multi-agent workflows.
 *
 * Features:
 *  - Seven typed event kinds (agent invocation, tool usage, file operation,
 *    decision, error, context snapshot, validation) with runtime schema checks.
 *  - Session-scoped sequential event ids and per-thread parent tracking.
 *  - Bounded asynchronous writer to newline-delimited JSON, optionally gzip.
 *  - Explicit Logger objects, plus one process-wide default_logger() with
 *    an optional exit hook.
 *
 * Shared library support:
 *   By default this is a header-only library and each shared library or
 *   executable gets its own default_logger().
 *
 *   To share one default logger across library boundaries:
 *   1. Compile src/activity_log_impl.cpp (which defines
 *      ACTIVITY_LOG_IMPLEMENTATION) into exactly one module.
 *   2. Define ACTIVITY_LOG_SHARED for every translation unit that includes
 *      this header, that one included.
 */

#include <activity-log/config.hpp>
#include <activity-log/errors.hpp>
#include <activity-log/event.hpp>
#include <activity-log/hierarchy.hpp>
#include <activity-log/ids.hpp>
#include <activity-log/logger.hpp>
#include <activity-log/reader.hpp>
#include <activity-log/retention.hpp>
#include <activity-log/schema.hpp>
#include <activity-log/scope.hpp>
#include <activity-log/sink.hpp>
#include <activity-log/writer.hpp>

#include <chrono>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

// Export/import macros for sharing default_logger() across shared libraries
#ifndef ACTIVITY_LOG_API
  #if defined(ACTIVITY_LOG_SHARED)
    #if defined(_WIN32) || defined(__CYGWIN__)
      #if defined(ACTIVITY_LOG_IMPLEMENTATION)
        #define ACTIVITY_LOG_API __declspec(dllexport)
      #else
        #define ACTIVITY_LOG_API __declspec(dllimport)
      #endif
    #elif defined(__GNUC__) && __GNUC__ >= 4
      #define ACTIVITY_LOG_API __attribute__((visibility("default")))
    #else
      #define ACTIVITY_LOG_API
    #endif
  #else
    #define ACTIVITY_LOG_API
  #endif
#endif

// Version information - keep in sync with project() in CMakeLists.txt
#define ACTIVITY_LOG_VERSION "1.0.0"
#define ACTIVITY_LOG_VERSION_MAJOR 1
#define ACTIVITY_LOG_VERSION_MINOR 0
#define ACTIVITY_LOG_VERSION_PATCH 0

namespace activity {

#if defined(ACTIVITY_LOG_SHARED)
ACTIVITY_LOG_API Logger& default_logger();
#if defined(ACTIVITY_LOG_IMPLEMENTATION)
/**
 * @brief The process-wide logger (shared-library version).
 */
Logger& default_logger() {
    static Logger instance;
    return instance;
}
#endif
#else
/**
 * @brief The process-wide logger (header-only version).
 *
 * Constructed on first use with a default Config; call configure() before
 * the first event to change it. Destroyed at static destruction, which
 * drains it like the exit hook would.
 */
inline Logger& default_logger() {
    static Logger instance;
    return instance;
}
#endif

namespace detail {

/**
 * @brief Exit hook body: drains the default logger with
 *        Config::exit_shutdown_timeout_ms; never throws.
 *
 * Config::register_exit_hook is read when the hook runs, so a configure()
 * made after the first use still decides. Nothing depends on it running: an
 * explicit shutdown() first makes it a no-op.
 */
inline void exit_hook() {
    Logger& log = default_logger();
    Config cfg = log.config();
    if (!cfg.register_exit_hook) return;
    log.shutdown_quietly(std::chrono::milliseconds(cfg.exit_shutdown_timeout_ms));
}

/// Register exit_hook() with std::atexit on first use of the default logger.
inline void ensure_exit_hook() {
    static std::once_flag hook_flag;
    std::call_once(hook_flag, []() { std::atexit(exit_hook); });
}

inline Logger& hooked_logger() {
    ensure_exit_hook();
    return default_logger();
}

} // namespace detail

// ----------------------------------------------------------------------------
// Process-wide convenience API, delegating to default_logger()
// ----------------------------------------------------------------------------

/**
 * @brief Replace the default logger's configuration.
 * @throws Error while its session is running
 */
inline void configure(Config cfg) {
    default_logger().configure(std::move(cfg));
}

inline std::string initialize(const std::optional<std::string>& session_id = std::nullopt) {
    return detail::hooked_logger().initialize(session_id);
}

inline void shutdown(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    default_logger().shutdown(timeout);
}

inline bool flush(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) {
    return default_logger().flush(timeout);
}

inline std::string session_id() { return default_logger().session_id(); }
inline uint64_t event_count() { return default_logger().event_count(); }

template <typename... Args>
inline std::string log_agent_invocation(Args&&... args) {
    return detail::hooked_logger().log_agent_invocation(std::forward<Args>(args)...);
}

template <typename... Args>
inline std::string log_tool_usage(Args&&... args) {
    return detail::hooked_logger().log_tool_usage(std::forward<Args>(args)...);
}

template <typename... Args>
inline std::string log_file_operation(Args&&... args) {
    return detail::hooked_logger().log_file_operation(std::forward<Args>(args)...);
}

template <typename... Args>
inline std::string log_decision(Args&&... args) {
    return detail::hooked_logger().log_decision(std::forward<Args>(args)...);
}

template <typename... Args>
inline std::string log_error(Args&&... args) {
    return detail::hooked_logger().log_error(std::forward<Args>(args)...);
}

template <typename... Args>
inline std::string log_context_snapshot(Args&&... args) {
    return detail::hooked_logger().log_context_snapshot(std::forward<Args>(args)...);
}

template <typename... Args>
inline std::string log_validation(Args&&... args) {
    return detail::hooked_logger().log_validation(std::forward<Args>(args)...);
}

} // namespace activity

#define ACTIVITY_LOG_CONCAT_INNER(a, b) a##b
#define ACTIVITY_LOG_CONCAT(a, b) ACTIVITY_LOG_CONCAT_INNER(a, b)

/**
 * @brief Scoped agent invocation on the default logger.
 *
 * ACTIVITY_AGENT_SCOPE("coder", "orchestrator", "implement parser");
 */
#define ACTIVITY_AGENT_SCOPE(...) \
    ::activity::AgentScope ACTIVITY_LOG_CONCAT(_activity_agent_scope_, __LINE__)( \
        ::activity::detail::hooked_logger(), __VA_ARGS__)

/**
 * @brief Scoped tool usage on the default logger.
 *
 * ACTIVITY_TOOL_SCOPE("coder", "Edit", "patch parser");
 */
#define ACTIVITY_TOOL_SCOPE(...) \
    ::activity::ToolScope ACTIVITY_LOG_CONCAT(_activity_tool_scope_, __LINE__)( \
        ::activity::detail::hooked_logger(), __VA_ARGS__)

#pragma once
/**
 * @file errors.hpp
 * @brief Exception hierarchy for activity-log.
 *
 * Everything thrown by the library derives from activity::Error, so callers
 * that only want "did logging fail" can catch a single type.
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace activity {

/**
 * @brief Base class of all activity-log exceptions.
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief An event failed schema validation in strict mode.
 *
 * problems() lists every failed check, e.g. "missing required field 'tool'".
 */
class SchemaError : public Error {
public:
    SchemaError(const std::string& event_type, std::vector<std::string> problems)
        : Error(build_message(event_type, problems)), problems_(std::move(problems)) {}

    const std::vector<std::string>& problems() const { return problems_; }

private:
    static std::string build_message(const std::string& event_type,
                                     const std::vector<std::string>& problems) {
        std::string msg = "schema validation failed for '" + event_type + "'";
        for (size_t i = 0; i < problems.size(); ++i) {
            msg += (i == 0) ? ": " : "; ";
            msg += problems[i];
        }
        return msg;
    }

    std::vector<std::string> problems_;
};

/** @brief The bounded queue was full and the event was dropped. */
class QueueSaturationError : public Error {
public:
    explicit QueueSaturationError(const std::string& event_id)
        : Error("event queue saturated, dropped " + event_id) {}
};

/** @brief A sink could not open, write or flush its file. */
class SinkWriteError : public Error {
public:
    explicit SinkWriteError(const std::string& msg) : Error(msg) {}
};

/**
 * @brief Shutdown reached its deadline before the queue was drained.
 */
class ShutdownTimeoutError : public Error {
public:
    explicit ShutdownTimeoutError(uint64_t unflushed)
        : Error("shutdown timed out with " + std::to_string(unflushed) + " event(s) not flushed"),
          unflushed_(unflushed) {}

    /// Number of queued events that were discarded instead of written.
    uint64_t unflushed() const { return unflushed_; }

private:
    uint64_t unflushed_;
};

/** @brief Operation needs a running session but none was started. */
class NotInitializedError : public Error {
public:
    explicit NotInitializedError(const std::string& what_op)
        : Error(what_op + ": logger not initialized") {}
};

/** @brief Operation attempted after the logger was shut down. */
class StoppedError : public Error {
public:
    explicit StoppedError(const std::string& what_op)
        : Error(what_op + ": logger is stopped") {}
};

/** @brief Hierarchy scopes were closed out of LIFO order. */
class ScopeOrderError : public Error {
public:
    explicit ScopeOrderError(const std::string& msg) : Error(msg) {}
};

} // namespace activity

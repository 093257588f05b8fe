#pragma once
/**
 * @file ids.hpp
 * @brief Session identifiers, event identifiers and timestamps.
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <optional>
#include <string>

namespace activity {

namespace detail {

inline std::tm utc_tm(std::time_t t) {
    std::tm tm_utc{};
#if defined(_WIN32)
    gmtime_s(&tm_utc, &t);
#else
    gmtime_r(&t, &tm_utc);
#endif
    return tm_utc;
}

} // namespace detail

/**
 * @brief Build a session id from the current UTC time.
 *
 * @param format strftime format, e.g. "session_%Y%m%d_%H%M%S"
 * @return Formatted id; falls back to the default format when @p format
 *         produces an empty string
 */
inline std::string generate_session_id(const std::string& format = "session_%Y%m%d_%H%M%S") {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_utc = detail::utc_tm(now);

    char buf[256];
    size_t n = std::strftime(buf, sizeof(buf), format.c_str(), &tm_utc);
    if (n == 0) {
        n = std::strftime(buf, sizeof(buf), "session_%Y%m%d_%H%M%S", &tm_utc);
    }
    return std::string(buf, n);
}

/**
 * @brief Format a time point as "YYYY-MM-DDTHH:MM:SS.mmmZ".
 */
inline std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = (std::time_t)(ms / 1000);
    int millis = (int)(ms % 1000);
    if (millis < 0) {
        millis += 1000;
        --secs;
    }
    std::tm tm_utc = detail::utc_tm(secs);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm_utc.tm_year + 1900, tm_utc.tm_mon + 1, tm_utc.tm_mday,
                  tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, millis);
    return buf;
}

inline std::string iso_timestamp() {
    return iso_timestamp(std::chrono::system_clock::now());
}

/**
 * @brief Format sequence number @p seq as an event id.
 *
 * Below 1000 the number is padded to @p width digits ("evt_007"). From 1000
 * on the pad is max(width, 6, digits) so ids keep a stable shape as the
 * session grows ("evt_001000").
 */
inline std::string format_event_id(uint64_t seq, int width = 3) {
    int digits = (int)std::to_string(seq).size();
    int pad = width;
    if (seq >= 1000) {
        if (pad < 6) pad = 6;
        if (pad < digits) pad = digits;
    }
    char buf[48];
    std::snprintf(buf, sizeof(buf), "evt_%0*llu", pad, (unsigned long long)seq);
    return buf;
}

/**
 * @brief Parse the sequence number out of an event id.
 *
 * Consumers must order events by this number, never by comparing id text.
 * @return Sequence, or std::nullopt when @p id is not "evt_" + digits
 */
inline std::optional<uint64_t> parse_event_sequence(const std::string& id) {
    if (id.size() <= 4 || id.compare(0, 4, "evt_") != 0) return std::nullopt;
    uint64_t v = 0;
    for (size_t i = 4; i < id.size(); ++i) {
        char c = id[i];
        if (c < '0' || c > '9') return std::nullopt;
        v = v * 10 + (uint64_t)(c - '0');
    }
    return v;
}

/**
 * @brief Thread-safe sequential event id allocator.
 *
 * next() hands out 1, 2, 3, ... formatted with format_event_id(). Ids follow
 * the order in which calls acquired the lock.
 */
class EventCounter {
public:
    explicit EventCounter(int width = 3) : width_(width) {}

    std::string next() {
        std::lock_guard<std::mutex> lock(mtx_);
        ++counter_;
        return format_event_id(counter_, width_);
    }

    uint64_t count() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return counter_;
    }

    /// Start over at 1 for a new session, optionally with a new pad width.
    void reset(int width) {
        std::lock_guard<std::mutex> lock(mtx_);
        counter_ = 0;
        width_ = width;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mtx_);
        counter_ = 0;
    }

private:
    mutable std::mutex mtx_;
    uint64_t counter_ = 0;
    int width_;
};

} // namespace activity
